#pragma once

// Copyright © 2021 Michael Thornburgh
// SPDX-License-Identifier: MIT

#include <cmath>
#include <string>
#include <utility>
#include <vector>

#include "Chunker.hpp"
#include "Timer.hpp"

namespace rupload {

struct UploadConfig {
	uint64_t chunkSize            { DEFAULT_CHUNK_SIZE };
	bool     chunkedUploads       { true };
	uint64_t chunkThreshold       { DEFAULT_CHUNK_SIZE }; // files not larger than this go direct
	bool     autoRetry            { true };
	int      maxRetries           { 3 };
	Duration retryBaseDelay       { 1.0 };
	Duration retryMaxDelay        { INFINITY };
	size_t   maxConcurrentUploads { 0 }; // 0 for unbounded
	bool     pauseResumeSupported { true };
	Duration requestTimeout       { 60.0 }; // applied by the HTTP client. 0 for none

	// request targets, resolved against the HTTP client's base URI
	std::string uploadPath   { "/upload" };
	std::string chunkPath    { "/upload-chunk" };
	std::string finalizePath { "/finalize-upload" };

	// added to every request, for example authorization
	std::vector<std::pair<std::string, std::string> > extraHeaders;

	// added to every multipart body (direct and chunk requests)
	std::vector<std::pair<std::string, std::string> > extraFields;

	int debugLevel { 0 };
};

} // namespace rupload
