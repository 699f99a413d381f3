// Copyright © 2021 Michael Thornburgh
// SPDX-License-Identifier: MIT

#include <cerrno>
#include <cstdio>
#include <cstring>

#include <sys/socket.h>
#include <sys/types.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <unistd.h>
#include <fcntl.h>

#include "../include/rupload/PosixHttpServer.hpp"

namespace rupload { namespace http {

static const size_t INPUT_BUFFER_SIZE = 65536;

class PosixHttpServer::Connection : public std::enable_shared_from_this<PosixHttpServer::Connection> {
public:
	Connection(PosixHttpServer *owner, RunLoop *runloop, long connectionID, int fd);
	~Connection();

	void start();
	void close();

protected:
	void onInterfaceReadable();
	void onInterfaceWritable();
	void onRequestComplete();
	void respond(const Response &response);
	void touch();
	void closeAndForget();

	PosixHttpServer       *m_owner;
	RunLoop               *m_runloop;
	long                   m_connectionID;
	int                    m_fd;
	bool                   m_requestDone;
	bool                   m_responded;
	bool                   m_shutdown;
	MessageParser          m_parser;
	Bytes                  m_inputBuffer;
	Bytes                  m_outputBuffer;
	std::shared_ptr<Timer> m_idleTimer;
};

// --- PosixHttpServer

PosixHttpServer::PosixHttpServer(RunLoop *runloop) :
	maxBodyBytes(64 * 1024 * 1024),
	idleTimeout(120),
	debugLevel(0),
	m_runloop(runloop),
	m_listenFd(-1),
	m_port(0),
	m_nextConnectionID(0)
{
}

PosixHttpServer::~PosixHttpServer()
{
	close();
}

bool PosixHttpServer::listen(const std::string &host, const std::string &port)
{
	if(m_listenFd >= 0)
		return false;

	struct addrinfo hints;
	struct addrinfo *res = nullptr;

	memset(&hints, 0, sizeof(hints));
	hints.ai_family = AF_UNSPEC;
	hints.ai_socktype = SOCK_STREAM;
	hints.ai_flags = AI_PASSIVE;

	int err = getaddrinfo(host.empty() ? nullptr : host.c_str(), port.c_str(), &hints, &res);
	if(err)
	{
		printf("getaddrinfo %s:%s: %s\n", host.c_str(), port.c_str(), gai_strerror(err));
		return false;
	}

	int fd = -1;
	for(struct addrinfo *each = res; each and (fd < 0); each = each->ai_next)
	{
		fd = ::socket(each->ai_family, each->ai_socktype, each->ai_protocol);
		if(fd < 0)
		{
			::perror("socket");
			continue;
		}

		int val = 1;
		if(setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &val, sizeof(val)))
			::perror("SO_REUSEADDR");

		if(::bind(fd, each->ai_addr, each->ai_addrlen) or ::listen(fd, 16))
		{
			::perror("bind/listen");
			::close(fd);
			fd = -1;
		}
	}

	freeaddrinfo(res);

	if(fd < 0)
		return false;

	struct sockaddr_storage boundAddr;
	socklen_t addrLen = sizeof(boundAddr);
	if(0 == getsockname(fd, (struct sockaddr *)&boundAddr, &addrLen))
	{
		if(AF_INET == boundAddr.ss_family)
			m_port = ntohs(((struct sockaddr_in *)&boundAddr)->sin_port);
		else if(AF_INET6 == boundAddr.ss_family)
			m_port = ntohs(((struct sockaddr_in6 *)&boundAddr)->sin6_port);
	}

	{
		int flags = fcntl(fd, F_GETFL);
		flags |= O_NONBLOCK;
		fcntl(fd, F_SETFL, flags);
	}

	m_listenFd = fd;
	m_runloop->registerDescriptor(m_listenFd, RunLoop::READABLE, [this] { onListenerReadable(); });

	if(debugLevel)
		printf("PosixHttpServer listening on %s port %d\n", host.empty() ? "*" : host.c_str(), m_port);

	return true;
}

int PosixHttpServer::getPort() const
{
	return m_port;
}

void PosixHttpServer::close()
{
	if(m_listenFd >= 0)
	{
		m_runloop->unregisterDescriptor(m_listenFd);
		::close(m_listenFd);
		m_listenFd = -1;
	}

	std::map<long, std::shared_ptr<Connection> > connections;
	swap(connections, m_connections);
	for(auto it = connections.begin(); it != connections.end(); it++)
		it->second->close();
}

size_t PosixHttpServer::numConnections() const
{
	return m_connections.size();
}

void PosixHttpServer::onListenerReadable()
{
	struct sockaddr_storage peerAddr;
	socklen_t addrLen = sizeof(peerAddr);
	int newFd = ::accept(m_listenFd, (struct sockaddr *)&peerAddr, &addrLen);
	if(newFd < 0)
	{
		if((EAGAIN != errno) and (EWOULDBLOCK != errno) and (EINTR != errno))
			::perror("accept");
		return;
	}

	long connectionID = m_nextConnectionID++;
	auto connection = std::make_shared<Connection>(this, m_runloop, connectionID, newFd);
	m_connections[connectionID] = connection;

	if(debugLevel > 1)
		printf("PosixHttpServer accept connection %ld\n", connectionID);

	connection->start();
}

void PosixHttpServer::onConnectionClosed(long connectionID)
{
	m_connections.erase(connectionID);
}

// --- Connection

PosixHttpServer::Connection::Connection(PosixHttpServer *owner, RunLoop *runloop, long connectionID, int fd) :
	m_owner(owner),
	m_runloop(runloop),
	m_connectionID(connectionID),
	m_fd(fd),
	m_requestDone(false),
	m_responded(false),
	m_shutdown(false),
	m_parser(false),
	m_inputBuffer(INPUT_BUFFER_SIZE)
{
	m_parser.maxBodyBytes = owner->maxBodyBytes;
}

PosixHttpServer::Connection::~Connection()
{
	close();
}

void PosixHttpServer::Connection::start()
{
	auto myself = shared_from_this();

#ifdef F_SETNOSIGPIPE
	fcntl(m_fd, F_SETNOSIGPIPE, 1);
#endif

	{
		int flags = fcntl(m_fd, F_GETFL);
		flags |= O_NONBLOCK;
		fcntl(m_fd, F_SETFL, flags);
	}

	m_runloop->registerDescriptor(m_fd, RunLoop::READABLE, [myself] { myself->onInterfaceReadable(); });

	if(m_owner->idleTimeout > 0)
		m_idleTimer = m_runloop->scheduleRel(Timer::makeAction([myself] { myself->closeAndForget(); }), m_owner->idleTimeout);
}

void PosixHttpServer::Connection::close()
{
	if(m_fd >= 0)
	{
		m_runloop->unregisterDescriptor(m_fd);
		::close(m_fd);
		m_fd = -1;
	}

	if(m_idleTimer)
	{
		m_idleTimer->cancel();
		m_idleTimer.reset();
	}
}

void PosixHttpServer::Connection::closeAndForget()
{
	if(m_fd < 0)
		return;

	auto myself = shared_from_this();
	close();
	m_owner->onConnectionClosed(m_connectionID);
}

void PosixHttpServer::Connection::touch()
{
	if(m_idleTimer)
		m_idleTimer->setNextFireTime(m_runloop->getCurrentTime() + m_owner->idleTimeout);
}

void PosixHttpServer::Connection::onInterfaceReadable()
{
	auto myself = shared_from_this();

	ssize_t rv = ::recvfrom(m_fd, m_inputBuffer.data(), m_inputBuffer.size(), 0, nullptr, nullptr);
	if(rv < 0)
	{
		if((EAGAIN == errno) or (EINTR == errno))
			return;
		::perror("recvfrom");
		closeAndForget();
		return;
	}

	if(0 == rv)
	{
		closeAndForget(); // the other side is done, or gave up
		return;
	}

	touch();

	if(m_requestDone)
		return; // one request per connection

	m_parser.onBytes(m_inputBuffer.data(), (size_t)rv);

	if(m_parser.isError())
	{
		m_requestDone = true;
		if(m_owner->debugLevel)
			printf("PosixHttpServer connection %ld bad request: %s\n", m_connectionID, m_parser.getErrorReason().c_str());
		respond(Response::json(400, { { "error", m_parser.getErrorReason() } }));
	}
	else if(m_parser.isComplete())
	{
		m_requestDone = true;
		onRequestComplete();
	}
}

void PosixHttpServer::Connection::onRequestComplete()
{
	auto myself = shared_from_this();

	Request request;
	request.method = m_parser.method;
	request.target = m_parser.target;
	for(auto it = m_parser.headers.begin(); it != m_parser.headers.end(); it++)
		for(auto each = it->second.begin(); each != it->second.end(); each++)
			request.headers.push_back(std::make_pair(it->first, *each));
	request.body.push_back(BodySegment(m_parser.body));
	m_parser.body.clear();

	if(m_owner->debugLevel > 1)
		printf("PosixHttpServer connection %ld %s %s (%llu body bytes)\n", m_connectionID,
			request.method.c_str(), request.target.c_str(), (unsigned long long)bodySize(request.body));

	std::weak_ptr<Connection> weakMyself = myself;
	respond_f respondFn = [weakMyself] (const Response &response) {
		auto connection = weakMyself.lock();
		if(connection)
			connection->respond(response);
	};

	if(m_owner->onRequest)
		m_owner->onRequest(request, respondFn);
	else
		respond(Response::json(404, { { "error", "Not Found" } }));
}

void PosixHttpServer::Connection::respond(const Response &response)
{
	if(m_responded or (m_fd < 0))
		return;
	m_responded = true;

	if(0 == response.status)
	{
		closeAndForget();
		return;
	}

	auto myself = shared_from_this();
	m_outputBuffer = response.serialize();
	m_runloop->registerDescriptor(m_fd, RunLoop::WRITABLE, [myself] { myself->onInterfaceWritable(); });
}

void PosixHttpServer::Connection::onInterfaceWritable()
{
	auto myself = shared_from_this();

	if(m_outputBuffer.size())
	{
		int flags = 0;
#ifdef MSG_NOSIGNAL
		flags |= MSG_NOSIGNAL;
#endif

		ssize_t rv = ::sendto(m_fd, m_outputBuffer.data(), m_outputBuffer.size(), flags, nullptr, 0);
		if(rv < 0)
		{
			if((EAGAIN == errno) or (EINTR == errno))
				return;
			::perror("sendto");
			closeAndForget();
			return;
		}
		m_outputBuffer.erase(m_outputBuffer.begin(), m_outputBuffer.begin() + rv);
		touch();
	}

	if(m_outputBuffer.empty())
	{
		m_runloop->unregisterDescriptor(m_fd, RunLoop::WRITABLE);
		if(not m_shutdown)
		{
			// the client closes once it has the whole response
			m_shutdown = true;
			::shutdown(m_fd, SHUT_WR);
		}
	}
}

} } // namespace rupload::http
