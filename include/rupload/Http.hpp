#pragma once

// Copyright © 2021 Michael Thornburgh
// SPDX-License-Identifier: MIT

// Just enough HTTP/1.1 for the upload protocol: requests with streamed
// bodies, responses, and an incremental message parser used by both the
// client and the reference server.

#include <map>

#include <nlohmann/json.hpp>

#include "ByteSource.hpp"
#include "CancelToken.hpp"

namespace rupload { namespace http {

// One piece of a request body: literal bytes, or a range of a ByteSource
// that's read only as the body is written to the network.
struct BodySegment {
	BodySegment(const Bytes &bytes);
	BodySegment(const std::string &s);
	BodySegment(std::shared_ptr<ByteSource> source, uint64_t offset, uint64_t length);

	uint64_t size() const;

	// Copy len bytes from position pos of this segment into dst. False on
	// source error or if the range is outside the segment.
	bool read(uint64_t pos, size_t len, uint8_t *dst) const;

	Bytes                       bytes;
	std::shared_ptr<ByteSource> source;
	uint64_t                    offset;
	uint64_t                    length;
};

using Body = std::vector<BodySegment>;

uint64_t bodySize(const Body &body);
bool flattenBody(const Body &body, Bytes &dst); // reads every source range

using HeaderList = std::vector<std::pair<std::string, std::string> >;

struct Request {
	std::string method { "POST" };
	std::string target { "/" };
	HeaderList  headers;
	Body        body;

	void setHeader(const std::string &name, const std::string &value); // replaces, case-insensitive
	std::string getHeader(const std::string &name) const;

	// Start line and header block including Host, Content-Length and
	// Connection: close, terminated by an empty line.
	std::string serializeHead(const std::string &host) const;

	static Request json(const std::string &target, const nlohmann::json &body);
};

struct Response {
	int         status { 0 };
	std::string reason;
	std::map<std::string, std::vector<std::string> > headers; // lowercase names
	Bytes       body;

	bool isSuccess() const { return (status >= 200) and (status < 300); }
	std::string getHeader(const std::string &name) const;
	std::string bodyString() const;

	// The body parsed as JSON, or null if it's empty or not JSON.
	nlohmann::json bodyJSON() const;

	// The "error" member of a JSON body, or empty.
	std::string errorMessage() const;

	Bytes serialize() const; // for servers. adds Content-Length and Connection: close
	static Response json(int status, const nlohmann::json &body);
};

const char * reasonPhrase(int status);

// Incremental HTTP/1.1 message parser. Bodies may be delimited by
// Content-Length, chunked transfer coding, or (responses only) the end of
// the connection.
class MessageParser {
public:
	enum State { P_HEADERS, P_BODY, P_CHUNK_SIZE, P_CHUNK_DATA, P_CHUNK_DATA_END, P_TRAILERS, P_UNTIL_CLOSE, P_COMPLETE, P_ERROR };

	MessageParser(bool isResponse = true);

	// Consume bytes and answer how many were used. Parsing stops at the end
	// of a message; bytes after it aren't consumed.
	size_t onBytes(const void *bytes, size_t len);

	// The peer closed. Answer true if that completes the message.
	bool onClose();

	bool isComplete() const;
	bool isError() const;
	bool isHeaderComplete() const;
	State getState() const;
	std::string getErrorReason() const;

	bool hasHeader(const std::string &name) const;
	std::string getHeader(const std::string &name) const; // multiple values joined with ','

	Response response() const;

	size_t maxHeaderBytes;
	size_t maxBodyBytes;

	// request start line
	std::string method;
	std::string target;

	// response start line
	int         status;
	std::string reason;

	std::map<std::string, std::vector<std::string> > headers;
	Bytes body;

protected:
	bool parseHeaderBlock();
	bool parseStartLine(const std::string &line);
	void setError(const std::string &reason);
	bool parseLine(const uint8_t *&cursor, const uint8_t *limit, std::string &dst);

	bool        m_isResponse;
	State       m_state;
	bool        m_gotNewline;
	std::string m_headerBlock;
	std::string m_lineBuffer;
	uint64_t    m_remaining;
	std::string m_errorReason;
};

// One request/response exchange with the upload server.
struct Result {
	enum Outcome {
		RESPONSE,      // a complete response was received (any status)
		NETWORK_ERROR, // couldn't connect, or the connection failed
		TIMEOUT,       // no progress within the request timeout
		BODY_ERROR     // a body source couldn't be read
	};

	Outcome     outcome { NETWORK_ERROR };
	Response    response;
	std::string reason;

	bool hasResponse() const { return RESPONSE == outcome; }
};

class IHttpClient {
public:
	using onprogress_f = std::function<void(uint64_t bytesSent, uint64_t bodySize)>;
	using oncomplete_f = std::function<void(const Result &result)>;

	virtual ~IHttpClient() {}

	// Send request. request.target is resolved against the client's base URI.
	// onprogress is called as body bytes are accepted by the network.
	// oncomplete is called exactly once, never from within send(), unless token
	// is canceled first; after that neither callback is called. The client
	// finishes token when the exchange completes.
	virtual void send(const Request &request, std::shared_ptr<CancelToken> token,
		const onprogress_f &onprogress, const oncomplete_f &oncomplete) = 0;
};

} } // namespace rupload::http
