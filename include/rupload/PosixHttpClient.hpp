#pragma once

// Copyright © 2021 Michael Thornburgh
// SPDX-License-Identifier: MIT

#include "Http.hpp"
#include "RunLoop.hpp"
#include "URIParse.hpp"

namespace rupload { namespace http {

// IHttpClient over non-blocking POSIX TCP sockets on a RunLoop. One
// connection per request (Connection: close). Plain http only.
class PosixHttpClient : public IHttpClient {
public:
	// baseURI is where relative request targets are resolved, for example
	// "http://uploads.example.com:8080/api/".
	PosixHttpClient(RunLoop *runloop, const std::string &baseURI);
	PosixHttpClient() = delete;

	void send(const Request &request, std::shared_ptr<CancelToken> token,
		const onprogress_f &onprogress, const oncomplete_f &oncomplete) override;

	std::string getBaseURI() const;
	std::string resolve(const std::string &target) const;

	Duration requestTimeout;     // seconds without progress before a TIMEOUT result. 0 for none
	size_t   writeSizePerSelect; // bytes of body read from the source per write
	int      debugLevel;

protected:
	class Exchange;

	RunLoop *m_runloop;
	URIParse m_base;
};

} } // namespace rupload::http
