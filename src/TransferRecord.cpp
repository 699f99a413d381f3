// Copyright © 2021 Michael Thornburgh
// SPDX-License-Identifier: MIT

#include <algorithm>

#include "../include/rupload/TransferRecord.hpp"

namespace rupload {

const char * statusName(TransferStatus status)
{
	switch(status)
	{
	case TS_PENDING:   return "pending";
	case TS_UPLOADING: return "uploading";
	case TS_PAUSED:    return "paused";
	case TS_FAILED:    return "failed";
	case TS_CANCELLED: return "cancelled";
	case TS_SUCCESS:   return "success";
	}
	return "unknown";
}

const char * modeName(TransferMode mode)
{
	return TM_CHUNKED == mode ? "chunked" : "direct";
}

nlohmann::json TransferSnapshot::toJSON() const
{
	nlohmann::json rv = {
		{ "id", id },
		{ "name", name },
		{ "size", size },
		{ "mimeType", mimeType },
		{ "mode", modeName(mode) },
		{ "status", statusName(status) },
		{ "progress", progress },
		{ "currentChunkIndex", currentChunkIndex },
		{ "totalChunks", totalChunks },
		{ "retryCount", retryCount },
		{ "maxRetries", maxRetries },
		{ "retryScheduled", retryScheduled }
	};

	nlohmann::json attemptList = nlohmann::json::array();
	for(auto it = attempts.begin(); it != attempts.end(); it++)
		attemptList.push_back({
			{ "timestamp", (double)it->timestamp },
			{ "errorKind", errorKindName(it->kind) },
			{ "retryable", it->retryable },
			{ "httpStatus", it->httpStatus },
			{ "chunkIndex", it->chunkIndex },
			{ "message", it->message }
		});
	rv["attempts"] = attemptList;

	if(lastError.isError())
		rv["error"] = { { "kind", errorKindName(lastError.kind) }, { "message", lastError.message }, { "retryable", lastError.retryable } };
	if(not result.is_null())
		rv["result"] = result;

	return rv;
}

// --- TransferRecord

TransferRecord::TransferRecord(const std::string &id_, std::shared_ptr<ByteSource> source_, const std::string &name_,
		const std::string &mimeType_, TransferMode mode_, uint64_t chunkSize, int maxRetries_, Time now) :
	id(id_),
	source(source_),
	name(name_),
	size(source_ ? source_->size() : 0),
	mimeType(mimeType_),
	mode(mode_),
	chunks(std::make_shared<ChunkList>(TM_CHUNKED == mode_ ? Chunker::makeChunks(size, chunkSize) : ChunkList())),
	status(TS_PENDING),
	progress(0),
	currentChunkIndex(0),
	retryCount(0),
	maxRetries(maxRetries_),
	createdAt(now),
	startedAt(0),
	finishedAt(0),
	sequence(0)
{
}

bool TransferRecord::isValidTransition(TransferStatus from, TransferStatus to)
{
	switch(from)
	{
	case TS_PENDING:
		return (TS_UPLOADING == to) or (TS_CANCELLED == to);
	case TS_UPLOADING:
		return (TS_SUCCESS == to) or (TS_FAILED == to) or (TS_PAUSED == to) or (TS_CANCELLED == to)
			or (TS_PENDING == to); // automatic retry waiting for its backoff
	case TS_PAUSED:
		return (TS_UPLOADING == to) or (TS_CANCELLED == to)
			or (TS_PENDING == to); // resumed while no upload slot is free
	case TS_FAILED:
		return (TS_PENDING == to) or (TS_CANCELLED == to);
	case TS_CANCELLED:
	case TS_SUCCESS:
		return false;
	}
	return false;
}

bool TransferRecord::isTerminal(TransferStatus status)
{
	return (TS_SUCCESS == status) or (TS_CANCELLED == status);
}

bool TransferRecord::transitionTo(TransferStatus status_, Time now)
{
	if(not isValidTransition(status, status_))
		return false;

	if(TS_UPLOADING == status_ and not startedAt)
		startedAt = now;
	if(isTerminal(status_) or (TS_FAILED == status_))
		finishedAt = now;
	else
		finishedAt = 0;

	status = status_;
	return true;
}

void TransferRecord::setProgress(double percent)
{
	percent = std::max(0.0, std::min(100.0, percent));
	if(TS_UPLOADING == status)
		progress = std::max(progress, percent);
	else
		progress = percent;
}

void TransferRecord::resetProgress()
{
	if(TS_UPLOADING != status)
		progress = 0;
}

bool TransferRecord::acknowledgeChunk(size_t index)
{
	if((index != currentChunkIndex) or (index >= chunks->size()))
		return false;
	currentChunkIndex = index + 1;
	return true;
}

void TransferRecord::recordAttempt(const UploadError &error, Time now)
{
	TransferAttempt attempt;
	attempt.timestamp = now;
	attempt.kind = error.kind;
	attempt.retryable = error.retryable;
	attempt.httpStatus = error.httpStatus;
	attempt.chunkIndex = error.chunkIndex;
	attempt.message = error.message;
	attempts.push_back(attempt);
	lastError = error;
}

bool TransferRecord::isTerminal() const
{
	return isTerminal(status);
}

bool TransferRecord::isActive() const
{
	return cancellationToken and not cancellationToken->isFinished();
}

TransferSnapshot TransferRecord::snapshot() const
{
	TransferSnapshot rv;
	rv.id = id;
	rv.name = name;
	rv.size = size;
	rv.mimeType = mimeType;
	rv.mode = mode;
	rv.status = status;
	rv.progress = progress;
	rv.currentChunkIndex = currentChunkIndex;
	rv.totalChunks = chunks->size();
	rv.retryCount = retryCount;
	rv.maxRetries = maxRetries;
	rv.retryScheduled = retryTimer and not retryTimer->isCanceled();
	rv.attempts = attempts;
	rv.lastError = lastError;
	rv.result = result;
	rv.createdAt = createdAt;
	rv.startedAt = startedAt;
	rv.finishedAt = finishedAt;
	return rv;
}

} // namespace rupload
