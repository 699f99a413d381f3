#pragma once

// Copyright © 2021 Michael Thornburgh
// SPDX-License-Identifier: MIT

#include "FormData.hpp"
#include "Http.hpp"
#include "TransferRecord.hpp"
#include "UploadConfig.hpp"

namespace rupload {

// Strategy that moves one transfer's bytes to the server. Adapters keep no
// per-transfer state between operations; everything needed to continue a
// transfer is in its TransferRecord.
class TransportAdapter : public std::enable_shared_from_this<TransportAdapter> {
public:
	struct Callbacks {
		std::function<void(double percent)> onProgress;
		std::function<void(size_t chunkIndex)> onChunkAcknowledged;
		std::function<void(const nlohmann::json &result)> onSuccess;
		std::function<void(const UploadError &error)> onError;
	};

	TransportAdapter(std::shared_ptr<http::IHttpClient> client, const UploadConfig &config);
	virtual ~TransportAdapter() {}

	virtual TransferMode getMode() const = 0;

	// Start sending record, continuing from record.currentChunkIndex where
	// that applies. The operation ends with exactly one onSuccess or onError,
	// and token is finished before that call. No callback is made once token
	// is canceled, and none is made from within start().
	virtual void start(const TransferRecord &record, std::shared_ptr<CancelToken> token, const Callbacks &callbacks) = 0;

	// Convert an exchange that didn't end in a 2xx response to an UploadError.
	static UploadError errorFromResult(const http::Result &result, bool isFinalize);

protected:
	http::Request makeRequest(const std::string &target) const;
	void appendExtraFields(http::FormData &form) const;

	std::shared_ptr<http::IHttpClient> m_client;
	UploadConfig m_config;
};

// One multipart request to the upload path carrying the whole source. Any
// failure restarts from byte 0.
class DirectTransport : public TransportAdapter {
public:
	DirectTransport(std::shared_ptr<http::IHttpClient> client, const UploadConfig &config);

	TransferMode getMode() const override;
	void start(const TransferRecord &record, std::shared_ptr<CancelToken> token, const Callbacks &callbacks) override;
};

// Chunks sent strictly in order, one request at a time, then a finalize
// request once the last chunk is acknowledged.
class ChunkedTransport : public TransportAdapter {
public:
	ChunkedTransport(std::shared_ptr<http::IHttpClient> client, const UploadConfig &config);

	TransferMode getMode() const override;
	void start(const TransferRecord &record, std::shared_ptr<CancelToken> token, const Callbacks &callbacks) override;

protected:
	struct Operation;

	void sendChunk(std::shared_ptr<Operation> op);
	void sendFinalize(std::shared_ptr<Operation> op);
	void onChunkResult(std::shared_ptr<Operation> op, const http::Result &result);
	void onFinalizeResult(std::shared_ptr<Operation> op, const http::Result &result);
	void fail(std::shared_ptr<Operation> op, const UploadError &error);
};

} // namespace rupload
