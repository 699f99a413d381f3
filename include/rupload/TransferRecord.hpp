#pragma once

// Copyright © 2021 Michael Thornburgh
// SPDX-License-Identifier: MIT

#include <nlohmann/json.hpp>

#include "ByteSource.hpp"
#include "CancelToken.hpp"
#include "Chunker.hpp"
#include "RetryPolicy.hpp"

namespace rupload {

enum TransferStatus {
	TS_PENDING,
	TS_UPLOADING,
	TS_PAUSED,
	TS_FAILED,
	TS_CANCELLED, // terminal
	TS_SUCCESS    // terminal
};

enum TransferMode { TM_DIRECT, TM_CHUNKED };

const char * statusName(TransferStatus status);
const char * modeName(TransferMode mode);

struct TransferAttempt {
	Time        timestamp;
	ErrorKind   kind;
	bool        retryable;
	int         httpStatus;
	long        chunkIndex;
	std::string message;
};

// Value copy of a record's observable state, for observers and callers.
struct TransferSnapshot {
	std::string    id;
	std::string    name;
	uint64_t       size;
	std::string    mimeType;
	TransferMode   mode;
	TransferStatus status;
	double         progress;
	size_t         currentChunkIndex;
	size_t         totalChunks;
	int            retryCount;
	int            maxRetries;
	bool           retryScheduled;
	std::vector<TransferAttempt> attempts;
	UploadError    lastError;
	nlohmann::json result;
	Time           createdAt;
	Time           startedAt;
	Time           finishedAt;

	nlohmann::json toJSON() const;
};

class TransferRecord {
public:
	TransferRecord(const std::string &id, std::shared_ptr<ByteSource> source, const std::string &name,
		const std::string &mimeType, TransferMode mode, uint64_t chunkSize, int maxRetries, Time now);
	TransferRecord() = delete;
	TransferRecord(const TransferRecord&) = delete;

	static bool isValidTransition(TransferStatus from, TransferStatus to);
	static bool isTerminal(TransferStatus status);

	// Move to status if that's a legal edge. Answer false (and change nothing) otherwise.
	bool transitionTo(TransferStatus status, Time now);

	// Progress never goes down while uploading. Clamped to [0, 100].
	void setProgress(double percent);
	void resetProgress(); // only while not uploading

	// Advance currentChunkIndex past index; chunks are acknowledged strictly in order.
	bool acknowledgeChunk(size_t index);

	void recordAttempt(const UploadError &error, Time now);

	bool isTerminal() const;
	bool isActive() const; // has an operation in flight

	TransferSnapshot snapshot() const;

	const std::string            id;
	const std::shared_ptr<ByteSource> source;
	const std::string            name;
	const uint64_t               size;
	const std::string            mimeType;
	const TransferMode           mode;
	const std::shared_ptr<const ChunkList> chunks; // immutable, shared with in-flight operations

	TransferStatus status;
	double         progress;
	size_t         currentChunkIndex;
	std::vector<TransferAttempt> attempts;
	int            retryCount;
	int            maxRetries;
	UploadError    lastError;
	nlohmann::json result;
	Time           createdAt;
	Time           startedAt;
	Time           finishedAt;
	unsigned long  sequence; // insertion order in the registry

	std::shared_ptr<CancelToken> cancellationToken;
	std::shared_ptr<Timer>       retryTimer;
};

} // namespace rupload
