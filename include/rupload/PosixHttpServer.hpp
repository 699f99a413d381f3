#pragma once

// Copyright © 2021 Michael Thornburgh
// SPDX-License-Identifier: MIT

#include <map>

#include "Http.hpp"
#include "RunLoop.hpp"

namespace rupload { namespace http {

// Minimal HTTP/1.1 server over POSIX TCP sockets on a RunLoop, for the
// reference upload server and loopback tests. One request per connection;
// the connection is closed after the response.
class PosixHttpServer {
public:
	// Answer the request. A response with status 0 drops the connection
	// without answering. May be called later, from any run loop callback.
	using respond_f = std::function<void(const Response &response)>;
	using onrequest_f = std::function<void(const Request &request, const respond_f &respond)>;

	PosixHttpServer(RunLoop *runloop);
	PosixHttpServer() = delete;
	PosixHttpServer(const PosixHttpServer&) = delete;
	~PosixHttpServer();

	// Listen on host:port. Port "0" picks a free port; see getPort().
	bool listen(const std::string &host, const std::string &port);
	int getPort() const;

	// Stop listening and drop every open connection.
	void close();

	size_t numConnections() const;

	onrequest_f onRequest;
	size_t      maxBodyBytes;
	Duration    idleTimeout; // drop a connection with no activity for this long. 0 for never
	int         debugLevel;

protected:
	class Connection;

	void onListenerReadable();
	void onConnectionClosed(long connectionID);

	RunLoop *m_runloop;
	int      m_listenFd;
	int      m_port;
	long     m_nextConnectionID;
	std::map<long, std::shared_ptr<Connection> > m_connections;
};

} } // namespace rupload::http
