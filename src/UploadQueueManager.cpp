// Copyright © 2021 Michael Thornburgh
// SPDX-License-Identifier: MIT

#include <algorithm>
#include <cstdio>

#include "../include/rupload/Random.hpp"
#include "../include/rupload/UploadQueueManager.hpp"

namespace rupload {

UploadQueueManager::UploadQueueManager(RunLoop *runloop, std::shared_ptr<http::IHttpClient> client, const UploadConfig &config) :
	m_runloop(runloop),
	m_client(client),
	m_config(config),
	m_policy(config.maxRetries, config.retryBaseDelay, config.autoRetry, config.retryMaxDelay),
	m_direct(std::make_shared<DirectTransport>(client, config)),
	m_chunked(std::make_shared<ChunkedTransport>(client, config)),
	m_nextSequence(0),
	m_closed(false)
{
}

UploadQueueManager::~UploadQueueManager()
{
	close();
}

std::string UploadQueueManager::add(std::shared_ptr<ByteSource> source, const std::string &name, const std::string &mimeType)
{
	if(m_closed or not source)
		return "";

	std::string id = makeTransferID();
	auto record = std::make_shared<TransferRecord>(id, source, name, mimeType.empty() ? mimeTypeForName(name) : mimeType,
		modeForSize(source->size()), m_config.chunkSize, m_config.maxRetries, now());
	record->sequence = m_nextSequence++;
	m_records[id] = record;

	if(m_config.debugLevel)
		printf("UploadQueueManager add %s \"%s\" %llu bytes %s (%lu chunks)\n", id.c_str(), name.c_str(),
			(unsigned long long)record->size, modeName(record->mode), (unsigned long)record->chunks->size());

	if(hasFreeSlot())
		startUpload(record);
	else
		notify();

	return id;
}

std::string UploadQueueManager::add(const UploadFile &file)
{
	return add(file.source, file.name, file.mimeType);
}

std::vector<std::string> UploadQueueManager::addFiles(const std::vector<UploadFile> &files)
{
	std::vector<std::string> rv;
	for(auto it = files.begin(); it != files.end(); it++)
		rv.push_back(add(*it));
	return rv;
}

bool UploadQueueManager::pause(const std::string &id)
{
	auto record = find(id);
	if((not record) or (not m_config.pauseResumeSupported) or (TS_UPLOADING != record->status))
		return false;

	abortInFlight(record);
	transition(record, TS_PAUSED);
	notify();
	startWaiting();

	return true;
}

bool UploadQueueManager::resume(const std::string &id)
{
	auto record = find(id);
	if(m_closed or (not record) or (TS_PAUSED != record->status))
		return false;

	if(hasFreeSlot())
		startUpload(record);
	else
	{
		transition(record, TS_PENDING);
		notify();
	}

	return true;
}

bool UploadQueueManager::cancel(const std::string &id)
{
	auto record = find(id);
	if(not record)
		return false;
	if(TS_CANCELLED == record->status)
		return true;
	if(TS_SUCCESS == record->status)
		return false;

	abortInFlight(record);
	cancelRetryTimer(record);
	transition(record, TS_CANCELLED);
	notify();
	startWaiting();

	return true;
}

bool UploadQueueManager::retry(const std::string &id)
{
	auto record = find(id);
	if(m_closed or (not record) or (TS_FAILED != record->status))
		return false;

	record->retryCount = 0;
	record->lastError = UploadError();
	if(TM_DIRECT == record->mode)
		record->resetProgress();

	transition(record, TS_PENDING);
	scheduleRestart(record, m_policy.backoffDelay(record->retryCount));
	notify();

	return true;
}

bool UploadQueueManager::remove(const std::string &id)
{
	auto record = find(id);
	if(not record)
		return false;

	abortInFlight(record);
	cancelRetryTimer(record);
	m_records.erase(id);

	if(m_config.debugLevel)
		printf("UploadQueueManager remove %s\n", id.c_str());

	notify();
	startWaiting();

	return true;
}

size_t UploadQueueManager::retryAll()
{
	size_t rv = 0;
	auto snap = snapshot();
	for(auto it = snap.begin(); it != snap.end(); it++)
		if((TS_FAILED == it->status) and retry(it->id))
			rv++;
	return rv;
}

size_t UploadQueueManager::clearCompleted()
{
	size_t rv = 0;
	for(auto it = m_records.begin(); it != m_records.end(); )
	{
		if(it->second->isTerminal())
		{
			cancelRetryTimer(it->second);
			it = m_records.erase(it);
			rv++;
		}
		else
			it++;
	}

	if(rv)
		notify();

	return rv;
}

bool UploadQueueManager::getSnapshot(const std::string &id, TransferSnapshot &dst) const
{
	auto record = find(id);
	if(not record)
		return false;
	dst = record->snapshot();
	return true;
}

std::vector<TransferSnapshot> UploadQueueManager::snapshot() const
{
	std::vector<std::shared_ptr<TransferRecord> > records;
	for(auto it = m_records.begin(); it != m_records.end(); it++)
		records.push_back(it->second);
	std::sort(records.begin(), records.end(), [] (const std::shared_ptr<TransferRecord> &l, const std::shared_ptr<TransferRecord> &r) {
		return l->sequence < r->sequence;
	});

	std::vector<TransferSnapshot> rv;
	for(auto it = records.begin(); it != records.end(); it++)
		rv.push_back((*it)->snapshot());
	return rv;
}

size_t UploadQueueManager::size() const
{
	return m_records.size();
}

size_t UploadQueueManager::countWithStatus(TransferStatus status) const
{
	size_t rv = 0;
	for(auto it = m_records.begin(); it != m_records.end(); it++)
		if(status == it->second->status)
			rv++;
	return rv;
}

bool UploadQueueManager::isSettled() const
{
	return 0 == countWithStatus(TS_PENDING) + countWithStatus(TS_UPLOADING);
}

void UploadQueueManager::close()
{
	m_closed = true;

	for(auto it = m_records.begin(); it != m_records.end(); it++)
	{
		auto record = it->second;
		auto token = record->cancellationToken;
		record->cancellationToken.reset();
		if(token)
			token->cancel();
		cancelRetryTimer(record);
	}
}

TransferMode UploadQueueManager::modeForSize(uint64_t size) const
{
	if(m_config.chunkedUploads and m_config.chunkSize and (size > m_config.chunkThreshold))
		return TM_CHUNKED;
	return TM_DIRECT;
}

const UploadConfig & UploadQueueManager::getConfig() const
{
	return m_config;
}

const RetryPolicy & UploadQueueManager::getRetryPolicy() const
{
	return m_policy;
}

// ---

std::shared_ptr<TransferRecord> UploadQueueManager::find(const std::string &id) const
{
	auto it = m_records.find(id);
	if(it != m_records.end())
		return it->second;
	return std::shared_ptr<TransferRecord>();
}

std::string UploadQueueManager::makeTransferID() const
{
	std::string rv;
	do {
		std::string tag = randomHex(8);
		if(tag.empty())
		{
			char buf[32];
			snprintf(buf, sizeof(buf), "%016lx", m_nextSequence);
			tag = buf;
		}
		rv = "upload_" + tag;
	} while(m_records.count(rv));
	return rv;
}

Time UploadQueueManager::now() const
{
	return m_runloop->getCurrentTime();
}

size_t UploadQueueManager::numUploading() const
{
	return countWithStatus(TS_UPLOADING);
}

bool UploadQueueManager::hasFreeSlot() const
{
	return (0 == m_config.maxConcurrentUploads) or (numUploading() < m_config.maxConcurrentUploads);
}

void UploadQueueManager::startUpload(std::shared_ptr<TransferRecord> record)
{
	cancelRetryTimer(record);
	if(m_closed)
		return;

	// progress restarts where the bytes restart
	if(TM_DIRECT == record->mode)
		record->resetProgress();
	else if(record->size)
		record->setProgress(100.0 * Chunker::bytesBefore(*record->chunks, record->currentChunkIndex) / record->size);

	if(not transition(record, TS_UPLOADING))
		return;

	auto token = std::make_shared<CancelToken>();
	record->cancellationToken = token;
	notify();

	if(token->isFinished())
		return; // paused, canceled or removed by an observer

	std::string id = record->id;
	TransportAdapter::Callbacks callbacks;
	callbacks.onProgress = [this, id, token] (double percent) { onTransportProgress(id, token, percent); };
	callbacks.onChunkAcknowledged = [this, id, token] (size_t chunkIndex) { onTransportChunkAcknowledged(id, token, chunkIndex); };
	callbacks.onSuccess = [this, id, token] (const nlohmann::json &result) { onTransportSuccess(id, token, result); };
	callbacks.onError = [this, id, token] (const UploadError &error) { onTransportError(id, token, error); };

	auto adapter = (TM_CHUNKED == record->mode) ? m_chunked : m_direct;
	adapter->start(*record, token, callbacks);
}

void UploadQueueManager::startWaiting()
{
	if(m_closed)
		return;

	std::vector<std::shared_ptr<TransferRecord> > waiting;
	for(auto it = m_records.begin(); it != m_records.end(); it++)
		if((TS_PENDING == it->second->status) and not it->second->retryTimer)
			waiting.push_back(it->second);
	std::sort(waiting.begin(), waiting.end(), [] (const std::shared_ptr<TransferRecord> &l, const std::shared_ptr<TransferRecord> &r) {
		return l->sequence < r->sequence;
	});

	for(auto it = waiting.begin(); (it != waiting.end()) and hasFreeSlot(); it++)
	{
		// an observer may have changed or removed it since
		auto record = *it;
		if((record == find(record->id)) and (TS_PENDING == record->status) and not record->retryTimer)
			startUpload(record);
	}
}

void UploadQueueManager::scheduleRestart(std::shared_ptr<TransferRecord> record, Duration delay)
{
	cancelRetryTimer(record);
	if(m_closed)
		return;

	std::string id = record->id;
	record->retryTimer = m_runloop->scheduleRel(Timer::makeAction([this, id] { onRestartTimer(id); }), delay);
}

void UploadQueueManager::onRestartTimer(const std::string &id)
{
	auto record = find(id);
	if(not record)
		return;
	record->retryTimer.reset();

	if(TS_PENDING != record->status)
		return;

	if(hasFreeSlot())
		startUpload(record);
	else
		notify(); // no longer scheduled, waiting for a slot
}

void UploadQueueManager::abortInFlight(std::shared_ptr<TransferRecord> record)
{
	auto token = record->cancellationToken;
	record->cancellationToken.reset();

	if(token and not token->isFinished())
	{
		token->cancel();
		record->recordAttempt(RetryPolicy::cancelledError(), now());
	}
}

void UploadQueueManager::cancelRetryTimer(std::shared_ptr<TransferRecord> record)
{
	if(record->retryTimer)
	{
		record->retryTimer->cancel();
		record->retryTimer.reset();
	}
}

bool UploadQueueManager::isCurrent(const std::string &id, const std::shared_ptr<CancelToken> &token, std::shared_ptr<TransferRecord> &record) const
{
	record = find(id);
	return record and (record->cancellationToken == token) and (not token->isCanceled()) and (TS_UPLOADING == record->status);
}

void UploadQueueManager::onTransportProgress(const std::string &id, std::shared_ptr<CancelToken> token, double percent)
{
	std::shared_ptr<TransferRecord> record;
	if(not isCurrent(id, token, record))
		return;

	double before = record->progress;
	record->setProgress(percent);
	if(record->progress != before)
		notify();
}

void UploadQueueManager::onTransportChunkAcknowledged(const std::string &id, std::shared_ptr<CancelToken> token, size_t chunkIndex)
{
	std::shared_ptr<TransferRecord> record;
	if(not isCurrent(id, token, record))
		return;

	if(not record->acknowledgeChunk(chunkIndex))
	{
		if(m_config.debugLevel)
			printf("UploadQueueManager %s out of order ack %lu (expected %lu)\n", id.c_str(), (unsigned long)chunkIndex, (unsigned long)record->currentChunkIndex);
		return;
	}

	if(record->size)
		record->setProgress(100.0 * Chunker::bytesBefore(*record->chunks, record->currentChunkIndex) / record->size);

	if(m_config.debugLevel > 1)
		printf("UploadQueueManager %s chunk %lu/%lu acknowledged\n", id.c_str(), (unsigned long)chunkIndex + 1, (unsigned long)record->chunks->size());

	notify();
}

void UploadQueueManager::onTransportSuccess(const std::string &id, std::shared_ptr<CancelToken> token, const nlohmann::json &result)
{
	std::shared_ptr<TransferRecord> record;
	if(not isCurrent(id, token, record))
		return;

	record->cancellationToken.reset();
	record->result = result;
	record->lastError = UploadError();
	record->setProgress(100);
	transition(record, TS_SUCCESS);

	notify();
	startWaiting();
}

void UploadQueueManager::onTransportError(const std::string &id, std::shared_ptr<CancelToken> token, const UploadError &error)
{
	std::shared_ptr<TransferRecord> record;
	if(not isCurrent(id, token, record))
		return;

	record->cancellationToken.reset();
	record->recordAttempt(error, now());

	if(m_policy.shouldAutoRetry(error, record->retryCount))
	{
		record->retryCount++;
		Duration delay = m_policy.backoffDelay(record->retryCount);

		if(m_config.debugLevel)
			printf("UploadQueueManager %s %s, retry %d/%d in %.3Lf s\n", id.c_str(), error.describe().c_str(), record->retryCount, record->maxRetries, delay);

		transition(record, TS_PENDING);
		scheduleRestart(record, delay);
	}
	else
	{
		if(m_config.debugLevel)
			printf("UploadQueueManager %s %s, giving up\n", id.c_str(), error.describe().c_str());

		transition(record, TS_FAILED);
	}

	notify();
	startWaiting();
}

bool UploadQueueManager::transition(std::shared_ptr<TransferRecord> record, TransferStatus status)
{
	TransferStatus from = record->status;

	if(not record->transitionTo(status, now()))
	{
		if(m_config.debugLevel)
			printf("UploadQueueManager %s illegal transition %s -> %s\n", record->id.c_str(), statusName(from), statusName(status));
		return false;
	}

	if(m_config.debugLevel > 1)
		printf("UploadQueueManager %s %s -> %s\n", record->id.c_str(), statusName(from), statusName(status));

	return true;
}

void UploadQueueManager::notify()
{
	if(onStateChange)
		onStateChange(snapshot());
}

} // namespace rupload
