// Copyright © 2021 Michael Thornburgh
// SPDX-License-Identifier: MIT

#include <algorithm>

#include "../include/rupload/RetryPolicy.hpp"

namespace rupload {

const char * errorKindName(ErrorKind kind)
{
	switch(kind)
	{
	case EK_NONE:           return "none";
	case EK_NETWORK:        return "NetworkError";
	case EK_SERVER_5XX:     return "ServerError5xx";
	case EK_VALIDATION_4XX: return "ValidationError4xx";
	case EK_CANCELLED:      return "CancelledError";
	case EK_FINALIZE:       return "FinalizeError";
	case EK_SOURCE:         return "SourceError";
	}
	return "unknown";
}

// --- UploadError

UploadError::UploadError() :
	kind(EK_NONE),
	httpStatus(0),
	retryable(false),
	chunkIndex(-1)
{
}

UploadError::UploadError(ErrorKind kind_, const std::string &message_, int httpStatus_) :
	kind(kind_),
	httpStatus(httpStatus_),
	message(message_),
	retryable(RetryPolicy::isRetryable(kind_)),
	chunkIndex(-1)
{
}

std::string UploadError::describe() const
{
	std::string rv = errorKindName(kind);
	if(httpStatus)
		rv += " (" + std::to_string(httpStatus) + ")";
	if(chunkIndex >= 0)
		rv += " chunk " + std::to_string(chunkIndex);
	if(not message.empty())
		rv += ": " + message;
	return rv;
}

// --- RetryPolicy

RetryPolicy::RetryPolicy(int maxRetries_, Duration baseDelay_, bool autoRetry_, Duration maxDelay_) :
	maxRetries(maxRetries_),
	baseDelay(baseDelay_),
	autoRetry(autoRetry_),
	maxDelay(maxDelay_)
{
}

bool RetryPolicy::isRetryable(ErrorKind kind)
{
	switch(kind)
	{
	case EK_NETWORK:
	case EK_SERVER_5XX:
	case EK_FINALIZE:
		return true;
	default:
		return false;
	}
}

UploadError RetryPolicy::classifyStatus(int httpStatus, const std::string &message, bool isFinalize)
{
	ErrorKind kind;

	if(isFinalize)
		kind = EK_FINALIZE;
	else if(httpStatus >= 500)
		kind = EK_SERVER_5XX;
	else
		kind = EK_VALIDATION_4XX;

	std::string msg = message;
	if(msg.empty())
		msg = isFinalize ? "Failed to finalize upload" : "Upload failed";

	return UploadError(kind, msg, httpStatus);
}

UploadError RetryPolicy::networkError(const std::string &message)
{
	return UploadError(EK_NETWORK, message.empty() ? "Upload failed - network error" : message);
}

UploadError RetryPolicy::cancelledError()
{
	return UploadError(EK_CANCELLED, "Upload was cancelled");
}

UploadError RetryPolicy::sourceError(const std::string &message)
{
	return UploadError(EK_SOURCE, message);
}

bool RetryPolicy::shouldAutoRetry(const UploadError &error, int retryCount) const
{
	return autoRetry and error.retryable and (EK_CANCELLED != error.kind) and (retryCount < maxRetries);
}

Duration RetryPolicy::backoffDelay(int retryCount) const
{
	if(retryCount < 1)
		return 0;
	Duration rv = baseDelay * std::pow((Duration)2, (Duration)(retryCount - 1));
	return std::min(rv, maxDelay);
}

} // namespace rupload
