// Copyright © 2021 Michael Thornburgh
// SPDX-License-Identifier: MIT

#include "../include/rupload/TransportAdapter.hpp"

namespace rupload {

// --- TransportAdapter

TransportAdapter::TransportAdapter(std::shared_ptr<http::IHttpClient> client, const UploadConfig &config) :
	m_client(client),
	m_config(config)
{
}

UploadError TransportAdapter::errorFromResult(const http::Result &result, bool isFinalize)
{
	switch(result.outcome)
	{
	case http::Result::RESPONSE:
		{
			std::string message = result.response.errorMessage();
			if(message.empty())
				message = result.response.reason;
			return RetryPolicy::classifyStatus(result.response.status, message, isFinalize);
		}

	case http::Result::BODY_ERROR:
		return RetryPolicy::sourceError(result.reason.empty() ? std::string("couldn't read source") : result.reason);

	case http::Result::TIMEOUT:
		return RetryPolicy::networkError(result.reason.empty() ? std::string("request timed out") : result.reason);

	case http::Result::NETWORK_ERROR:
	default:
		return RetryPolicy::networkError(result.reason);
	}
}

http::Request TransportAdapter::makeRequest(const std::string &target) const
{
	http::Request rv;
	rv.method = "POST";
	rv.target = target;
	for(auto it = m_config.extraHeaders.begin(); it != m_config.extraHeaders.end(); it++)
		rv.setHeader(it->first, it->second);
	return rv;
}

void TransportAdapter::appendExtraFields(http::FormData &form) const
{
	for(auto it = m_config.extraFields.begin(); it != m_config.extraFields.end(); it++)
		form.append(it->first, it->second);
}

// --- DirectTransport

DirectTransport::DirectTransport(std::shared_ptr<http::IHttpClient> client, const UploadConfig &config) :
	TransportAdapter(client, config)
{
}

TransferMode DirectTransport::getMode() const
{
	return TM_DIRECT;
}

void DirectTransport::start(const TransferRecord &record, std::shared_ptr<CancelToken> token, const Callbacks &callbacks)
{
	if(token->isFinished())
		return;

	http::FormData form;
	form.append("file", record.name, record.mimeType, record.source, 0, record.size);
	form.append("fileId", record.id);
	form.append("fileName", record.name);
	appendExtraFields(form);

	http::Request request = makeRequest(m_config.uploadPath);
	request.setHeader("Content-Type", form.contentType());
	request.body = form.encode();

	Callbacks cb = callbacks;
	m_client->send(request, token->makeChild(),
		[token, cb] (uint64_t bytesSent, uint64_t bodySize) {
			if(token->isFinished() or not bodySize)
				return;
			if(cb.onProgress)
				cb.onProgress(100.0 * bytesSent / bodySize);
		},
		[token, cb] (const http::Result &result) {
			if(token->isFinished())
				return;
			token->finish();

			if(result.hasResponse() and result.response.isSuccess())
			{
				if(cb.onSuccess)
					cb.onSuccess(result.response.bodyJSON());
			}
			else if(cb.onError)
				cb.onError(errorFromResult(result, false));
		});
}

// --- ChunkedTransport

struct ChunkedTransport::Operation {
	std::string                      fileId;
	std::string                      fileName;
	std::string                      mimeType;
	uint64_t                         totalSize;
	std::shared_ptr<ByteSource>      source;
	std::shared_ptr<const ChunkList> chunks;
	size_t                           index;
	std::shared_ptr<CancelToken>     token;
	Callbacks                        callbacks;
};

ChunkedTransport::ChunkedTransport(std::shared_ptr<http::IHttpClient> client, const UploadConfig &config) :
	TransportAdapter(client, config)
{
}

TransferMode ChunkedTransport::getMode() const
{
	return TM_CHUNKED;
}

void ChunkedTransport::start(const TransferRecord &record, std::shared_ptr<CancelToken> token, const Callbacks &callbacks)
{
	if(token->isFinished())
		return;

	auto op = std::make_shared<Operation>();
	op->fileId = record.id;
	op->fileName = record.name;
	op->mimeType = record.mimeType;
	op->totalSize = record.size;
	op->source = record.source;
	op->chunks = record.chunks;
	op->index = record.currentChunkIndex;
	op->token = token;
	op->callbacks = callbacks;

	if(op->index < op->chunks->size())
		sendChunk(op);
	else
		sendFinalize(op); // every chunk already acknowledged, only the finalize is left
}

void ChunkedTransport::sendChunk(std::shared_ptr<Operation> op)
{
	auto myself = std::static_pointer_cast<ChunkedTransport>(shared_from_this());
	const ChunkRange &chunk = op->chunks->at(op->index);
	uint64_t before = Chunker::bytesBefore(*op->chunks, op->index);

	http::FormData form;
	form.append("chunk", op->fileName, "application/octet-stream", op->source, chunk.offset, chunk.length);
	form.append("chunkIndex", std::to_string(op->index));
	form.append("totalChunks", std::to_string(op->chunks->size()));
	form.append("fileName", op->fileName);
	form.append("fileId", op->fileId);
	appendExtraFields(form);

	http::Request request = makeRequest(m_config.chunkPath);
	request.setHeader("Content-Type", form.contentType());
	request.body = form.encode();

	uint64_t chunkLength = chunk.length;
	m_client->send(request, op->token->makeChild(),
		[op, before, chunkLength] (uint64_t bytesSent, uint64_t bodySize) {
			if(op->token->isFinished() or not bodySize or not op->totalSize)
				return;
			double written = (double)chunkLength * bytesSent / bodySize;
			if(op->callbacks.onProgress)
				op->callbacks.onProgress(100.0 * (before + written) / op->totalSize);
		},
		[myself, op] (const http::Result &result) { myself->onChunkResult(op, result); });
}

void ChunkedTransport::onChunkResult(std::shared_ptr<Operation> op, const http::Result &result)
{
	if(op->token->isFinished())
		return;

	if(not (result.hasResponse() and result.response.isSuccess()))
	{
		UploadError error = errorFromResult(result, false);
		error.chunkIndex = op->index;
		fail(op, error);
		return;
	}

	size_t acked = op->index;
	op->index++;
	if(op->callbacks.onChunkAcknowledged)
		op->callbacks.onChunkAcknowledged(acked);

	if(op->token->isFinished())
		return; // paused or canceled from the acknowledgement

	if(op->index < op->chunks->size())
		sendChunk(op);
	else
		sendFinalize(op);
}

void ChunkedTransport::sendFinalize(std::shared_ptr<Operation> op)
{
	auto myself = std::static_pointer_cast<ChunkedTransport>(shared_from_this());

	nlohmann::json body = {
		{ "fileId", op->fileId },
		{ "fileName", op->fileName },
		{ "totalSize", op->totalSize }
	};

	http::Request request = http::Request::json(m_config.finalizePath, body);
	for(auto it = m_config.extraHeaders.begin(); it != m_config.extraHeaders.end(); it++)
		request.setHeader(it->first, it->second);

	m_client->send(request, op->token->makeChild(), nullptr,
		[myself, op] (const http::Result &result) { myself->onFinalizeResult(op, result); });
}

void ChunkedTransport::onFinalizeResult(std::shared_ptr<Operation> op, const http::Result &result)
{
	if(op->token->isFinished())
		return;

	if(not (result.hasResponse() and result.response.isSuccess()))
	{
		fail(op, errorFromResult(result, true));
		return;
	}

	op->token->finish();
	if(op->callbacks.onSuccess)
		op->callbacks.onSuccess(result.response.bodyJSON());
}

void ChunkedTransport::fail(std::shared_ptr<Operation> op, const UploadError &error)
{
	op->token->finish();
	if(op->callbacks.onError)
		op->callbacks.onError(error);
}

} // namespace rupload
