#pragma once

// Copyright © 2021 Michael Thornburgh
// SPDX-License-Identifier: MIT

#include <cmath>
#include <string>

#include "Timer.hpp"

namespace rupload {

enum ErrorKind {
	EK_NONE = 0,
	EK_NETWORK,        // connect/send/receive failure or timeout. retryable
	EK_SERVER_5XX,     // retryable
	EK_VALIDATION_4XX, // 4xx or other unexpected status. not retryable
	EK_CANCELLED,      // explicit pause/cancel. not retryable, not counted
	EK_FINALIZE,       // finalize handshake rejected. retryable
	EK_SOURCE          // couldn't read the source bytes. not retryable
};

const char * errorKindName(ErrorKind kind);

struct UploadError {
	UploadError();
	UploadError(ErrorKind kind, const std::string &message, int httpStatus = 0);

	ErrorKind   kind;
	int         httpStatus; // 0 if no response
	std::string message;
	bool        retryable;
	long        chunkIndex; // -1 if not a chunk request

	bool isError() const { return EK_NONE != kind; }
	std::string describe() const;
};

class RetryPolicy {
public:
	RetryPolicy(int maxRetries = 3, Duration baseDelay = 1.0, bool autoRetry = true, Duration maxDelay = INFINITY);

	static bool isRetryable(ErrorKind kind);

	// Map a non-2xx response to an error. The response's {"error": "..."}
	// message should be passed as message if present.
	static UploadError classifyStatus(int httpStatus, const std::string &message, bool isFinalize = false);
	static UploadError networkError(const std::string &message);
	static UploadError cancelledError();
	static UploadError sourceError(const std::string &message);

	// True if an automatic retry should be scheduled for error given the
	// number of automatic retries already made.
	bool shouldAutoRetry(const UploadError &error, int retryCount) const;

	// Delay before automatic retry number retryCount (1-based):
	// baseDelay * 2^(retryCount - 1), capped at maxDelay. 0 for retryCount < 1.
	Duration backoffDelay(int retryCount) const;

	int      maxRetries;
	Duration baseDelay;
	bool     autoRetry;
	Duration maxDelay;
};

} // namespace rupload
