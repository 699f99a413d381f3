#pragma once

// Copyright © 2021 Michael Thornburgh
// SPDX-License-Identifier: MIT

#include <map>

#include "RunLoop.hpp"
#include "TransportAdapter.hpp"

namespace rupload {

struct UploadFile {
	std::shared_ptr<ByteSource> source;
	std::string name;
	std::string mimeType; // guessed from name if empty
};

// Registry and orchestrator of transfers. Owns every TransferRecord, drives
// the transport adapters, applies the retry policy, and tells onStateChange
// after every mutation. Runs entirely on runloop's thread.
class UploadQueueManager {
public:
	using onstatechange_f = std::function<void(const std::vector<TransferSnapshot> &snapshot)>;

	UploadQueueManager(RunLoop *runloop, std::shared_ptr<http::IHttpClient> client, const UploadConfig &config = UploadConfig());
	UploadQueueManager() = delete;
	UploadQueueManager(const UploadQueueManager&) = delete;
	~UploadQueueManager();

	// Add a transfer and start it (or queue it for a free slot). Answers the
	// new id, or an empty string if source is empty or the manager is closed.
	std::string add(std::shared_ptr<ByteSource> source, const std::string &name, const std::string &mimeType = "");
	std::string add(const UploadFile &file);
	std::vector<std::string> addFiles(const std::vector<UploadFile> &files);

	bool pause(const std::string &id);  // uploading only
	bool resume(const std::string &id); // paused only
	bool cancel(const std::string &id); // any non-terminal status. true if already cancelled
	bool retry(const std::string &id);  // failed only
	bool remove(const std::string &id); // cancels anything in flight first

	size_t retryAll();       // answers how many failed transfers were retried
	size_t clearCompleted(); // answers how many success/cancelled transfers were removed

	bool getSnapshot(const std::string &id, TransferSnapshot &dst) const;
	std::vector<TransferSnapshot> snapshot() const; // insertion order
	size_t size() const;
	size_t countWithStatus(TransferStatus status) const;

	// True if nothing is uploading or waiting to upload.
	bool isSettled() const;

	// Cancel every in-flight operation and timer. The manager accepts no new
	// transfers afterward. Statuses are left as they are.
	void close();

	TransferMode modeForSize(uint64_t size) const;
	const UploadConfig & getConfig() const;
	const RetryPolicy & getRetryPolicy() const;

	onstatechange_f onStateChange;

protected:
	std::shared_ptr<TransferRecord> find(const std::string &id) const;
	std::string makeTransferID() const;
	Time now() const;

	size_t numUploading() const;
	bool hasFreeSlot() const;

	void startUpload(std::shared_ptr<TransferRecord> record);
	void startWaiting();
	void scheduleRestart(std::shared_ptr<TransferRecord> record, Duration delay);
	void onRestartTimer(const std::string &id);
	void abortInFlight(std::shared_ptr<TransferRecord> record);
	void cancelRetryTimer(std::shared_ptr<TransferRecord> record);

	bool isCurrent(const std::string &id, const std::shared_ptr<CancelToken> &token, std::shared_ptr<TransferRecord> &record) const;
	void onTransportProgress(const std::string &id, std::shared_ptr<CancelToken> token, double percent);
	void onTransportChunkAcknowledged(const std::string &id, std::shared_ptr<CancelToken> token, size_t chunkIndex);
	void onTransportSuccess(const std::string &id, std::shared_ptr<CancelToken> token, const nlohmann::json &result);
	void onTransportError(const std::string &id, std::shared_ptr<CancelToken> token, const UploadError &error);

	bool transition(std::shared_ptr<TransferRecord> record, TransferStatus status);
	void notify();

	RunLoop                           *m_runloop;
	std::shared_ptr<http::IHttpClient> m_client;
	UploadConfig                       m_config;
	RetryPolicy                        m_policy;
	std::shared_ptr<TransportAdapter>  m_direct;
	std::shared_ptr<TransportAdapter>  m_chunked;
	std::map<std::string, std::shared_ptr<TransferRecord> > m_records;
	unsigned long                      m_nextSequence;
	bool                               m_closed;
};

} // namespace rupload
