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

#include "../include/rupload/PosixHttpClient.hpp"

namespace rupload { namespace http {

static const size_t INPUT_BUFFER_SIZE = 65536;
static const Duration DEFAULT_REQUEST_TIMEOUT = 60.0;

class PosixHttpClient::Exchange : public std::enable_shared_from_this<PosixHttpClient::Exchange> {
public:
	Exchange(RunLoop *runloop, const Request &request, std::shared_ptr<CancelToken> token,
		const onprogress_f &onprogress, const oncomplete_f &oncomplete,
		Duration requestTimeout, size_t writeSizePerSelect, int debugLevel);
	~Exchange();

	void start(const URIParse &uri);

protected:
	bool openSocket(const std::string &host, const std::string &port, std::string &reason);
	void onInterfaceWritable();
	void onInterfaceReadable();
	bool fillOutputBuffer();
	void touch();
	void finish(Result::Outcome outcome, const std::string &reason);
	void finishLater(Result::Outcome outcome, const std::string &reason);
	void abort();
	void close();

	RunLoop                     *m_runloop;
	Request                      m_request;
	std::shared_ptr<CancelToken> m_token;
	onprogress_f                 m_onprogress;
	oncomplete_f                 m_oncomplete;
	Duration                     m_requestTimeout;
	size_t                       m_writeSizePerSelect;
	int                          m_debugLevel;

	int                    m_fd;
	bool                   m_connected;
	bool                   m_done;
	std::string            m_uri;
	Bytes                  m_outputBuffer;
	size_t                 m_outputOffset;
	bool                   m_outputIsBody;
	size_t                 m_segmentIndex;
	uint64_t               m_segmentPos;
	uint64_t               m_bodySize;
	uint64_t               m_bodySent;
	Bytes                  m_inputBuffer;
	MessageParser          m_parser;
	std::shared_ptr<Timer> m_timeoutTimer;
};

// --- PosixHttpClient

PosixHttpClient::PosixHttpClient(RunLoop *runloop, const std::string &baseURI) :
	requestTimeout(DEFAULT_REQUEST_TIMEOUT),
	writeSizePerSelect(INPUT_BUFFER_SIZE),
	debugLevel(0),
	m_runloop(runloop),
	m_base(baseURI)
{
}

void PosixHttpClient::send(const Request &request, std::shared_ptr<CancelToken> token,
		const onprogress_f &onprogress, const oncomplete_f &oncomplete)
{
	if(token->isFinished())
		return;

	auto exchange = std::make_shared<Exchange>(m_runloop, request, token, onprogress, oncomplete,
		requestTimeout, writeSizePerSelect ? writeSizePerSelect : INPUT_BUFFER_SIZE, debugLevel);
	exchange->start(URIParse(resolve(request.target)));
}

std::string PosixHttpClient::getBaseURI() const
{
	return m_base.uri;
}

std::string PosixHttpClient::resolve(const std::string &target) const
{
	return m_base.transformRelativeReference(target);
}

// --- Exchange

PosixHttpClient::Exchange::Exchange(RunLoop *runloop, const Request &request, std::shared_ptr<CancelToken> token,
		const onprogress_f &onprogress, const oncomplete_f &oncomplete,
		Duration requestTimeout, size_t writeSizePerSelect, int debugLevel) :
	m_runloop(runloop),
	m_request(request),
	m_token(token),
	m_onprogress(onprogress),
	m_oncomplete(oncomplete),
	m_requestTimeout(requestTimeout),
	m_writeSizePerSelect(writeSizePerSelect),
	m_debugLevel(debugLevel),
	m_fd(-1),
	m_connected(false),
	m_done(false),
	m_outputOffset(0),
	m_outputIsBody(false),
	m_segmentIndex(0),
	m_segmentPos(0),
	m_bodySize(bodySize(request.body)),
	m_bodySent(0),
	m_inputBuffer(INPUT_BUFFER_SIZE),
	m_parser(true)
{
}

PosixHttpClient::Exchange::~Exchange()
{
	close();
}

void PosixHttpClient::Exchange::start(const URIParse &uri)
{
	auto myself = shared_from_this();
	std::string reason;

	m_uri = uri.uri;
	m_token->onCanceled = [myself] { myself->abort(); };

	if("http" != uri.canonicalScheme)
	{
		finishLater(Result::NETWORK_ERROR, "unsupported scheme: " + uri.scheme);
		return;
	}

	if(uri.host.empty() or not openSocket(uri.host, uri.effectivePort, reason))
	{
		finishLater(Result::NETWORK_ERROR, uri.host.empty() ? std::string("no host") : reason);
		return;
	}

	Request headRequest = m_request;
	headRequest.target = uri.requestTarget();
	std::string head = headRequest.serializeHead(uri.hostinfo);
	m_outputBuffer.assign(head.begin(), head.end());

	if(m_debugLevel > 1)
		printf("PosixHttpClient %s %s (%llu body bytes)\n", m_request.method.c_str(), m_uri.c_str(), (unsigned long long)m_bodySize);

	m_runloop->registerDescriptor(m_fd, RunLoop::WRITABLE, [myself] { myself->onInterfaceWritable(); });
	m_runloop->registerDescriptor(m_fd, RunLoop::READABLE, [myself] { myself->onInterfaceReadable(); });

	if(m_requestTimeout > 0)
		m_timeoutTimer = m_runloop->scheduleRel(Timer::makeAction([myself] {
			myself->finish(Result::TIMEOUT, "request timed out");
		}), m_requestTimeout);
}

bool PosixHttpClient::Exchange::openSocket(const std::string &host, const std::string &port, std::string &reason)
{
	struct addrinfo hints;
	struct addrinfo *res = nullptr;

	memset(&hints, 0, sizeof(hints));
	hints.ai_family = AF_UNSPEC;
	hints.ai_socktype = SOCK_STREAM;

	int err = getaddrinfo(host.c_str(), port.c_str(), &hints, &res);
	if(err)
	{
		reason = std::string("getaddrinfo: ") + gai_strerror(err);
		return false;
	}

	for(struct addrinfo *each = res; each; each = each->ai_next)
	{
		int fd = ::socket(each->ai_family, each->ai_socktype, each->ai_protocol);
		if(fd < 0)
		{
			reason = std::string("socket: ") + strerror(errno);
			continue;
		}

#ifdef TCP_NODELAY
		{
			int val = 1;
			::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &val, sizeof(val));
		}
#endif

#ifdef F_SETNOSIGPIPE
		fcntl(fd, F_SETNOSIGPIPE, 1);
#endif

		{
			int flags = fcntl(fd, F_GETFL);
			flags |= O_NONBLOCK;
			fcntl(fd, F_SETFL, flags);
		}

		if((0 == ::connect(fd, each->ai_addr, each->ai_addrlen)) or (EINPROGRESS == errno))
		{
			m_fd = fd;
			break;
		}

		reason = std::string("connect: ") + strerror(errno);
		::close(fd);
	}

	freeaddrinfo(res);

	return m_fd >= 0;
}

void PosixHttpClient::Exchange::onInterfaceWritable()
{
	auto myself = shared_from_this();

	if(not m_connected)
	{
		int soerr = 0;
		socklen_t len = sizeof(soerr);
		if(::getsockopt(m_fd, SOL_SOCKET, SO_ERROR, &soerr, &len) < 0)
			soerr = errno;
		if(soerr)
		{
			finish(Result::NETWORK_ERROR, std::string("connect: ") + strerror(soerr));
			return;
		}
		m_connected = true;
	}

	if((m_outputOffset >= m_outputBuffer.size()) and not fillOutputBuffer())
		return;

	int flags = 0;
#ifdef MSG_NOSIGNAL
	flags |= MSG_NOSIGNAL;
#endif

	ssize_t rv = ::sendto(m_fd, m_outputBuffer.data() + m_outputOffset, m_outputBuffer.size() - m_outputOffset, flags, nullptr, 0);
	if(rv < 0)
	{
		if((EAGAIN == errno) or (EINTR == errno))
			return;
		finish(Result::NETWORK_ERROR, std::string("sendto: ") + strerror(errno));
		return;
	}

	m_outputOffset += rv;
	touch();

	if(m_outputIsBody)
	{
		m_bodySent += rv;
		if(m_onprogress)
			m_onprogress(m_bodySent, m_bodySize);
	}
}

bool PosixHttpClient::Exchange::fillOutputBuffer()
{
	m_outputBuffer.clear();
	m_outputOffset = 0;

	while((m_segmentIndex < m_request.body.size()) and (m_segmentPos >= m_request.body[m_segmentIndex].size()))
	{
		m_segmentIndex++;
		m_segmentPos = 0;
	}

	if(m_segmentIndex >= m_request.body.size())
	{
		// whole request is written, just wait for the response
		m_runloop->unregisterDescriptor(m_fd, RunLoop::WRITABLE);
		return false;
	}

	const BodySegment &segment = m_request.body[m_segmentIndex];
	uint64_t remaining = segment.size() - m_segmentPos;
	size_t count = (remaining < m_writeSizePerSelect) ? (size_t)remaining : m_writeSizePerSelect;

	m_outputBuffer.resize(count);
	if(not segment.read(m_segmentPos, count, m_outputBuffer.data()))
	{
		m_outputBuffer.clear();
		finish(Result::BODY_ERROR, "couldn't read request body source");
		return false;
	}

	m_segmentPos += count;
	m_outputIsBody = true;
	return true;
}

void PosixHttpClient::Exchange::onInterfaceReadable()
{
	auto myself = shared_from_this();

	ssize_t rv = ::recvfrom(m_fd, m_inputBuffer.data(), m_inputBuffer.size(), 0, nullptr, nullptr);
	if(rv < 0)
	{
		if((EAGAIN == errno) or (EINTR == errno))
			return;
		finish(Result::NETWORK_ERROR, std::string("recvfrom: ") + strerror(errno));
		return;
	}

	if(0 == rv)
	{
		if(m_parser.onClose())
			finish(Result::RESPONSE, "");
		else
			finish(Result::NETWORK_ERROR, m_parser.getErrorReason());
		return;
	}

	touch();
	m_parser.onBytes(m_inputBuffer.data(), (size_t)rv);

	if(m_parser.isError())
		finish(Result::NETWORK_ERROR, "malformed response: " + m_parser.getErrorReason());
	else if(m_parser.isComplete())
		finish(Result::RESPONSE, "");
}

void PosixHttpClient::Exchange::touch()
{
	if(m_timeoutTimer)
		m_timeoutTimer->setNextFireTime(m_runloop->getCurrentTime() + m_requestTimeout);
}

void PosixHttpClient::Exchange::finish(Result::Outcome outcome, const std::string &reason)
{
	if(m_done)
		return;
	m_done = true;

	auto myself = shared_from_this();

	close();
	m_token->finish();

	Result result;
	result.outcome = outcome;
	result.reason = reason;
	if(Result::RESPONSE == outcome)
		result.response = m_parser.response();

	if(m_debugLevel)
	{
		if(result.hasResponse())
			printf("PosixHttpClient %s %s -> %d %s\n", m_request.method.c_str(), m_uri.c_str(), result.response.status, result.response.reason.c_str());
		else
			printf("PosixHttpClient %s %s failed: %s\n", m_request.method.c_str(), m_uri.c_str(), reason.c_str());
	}

	oncomplete_f oncomplete;
	swap(oncomplete, m_oncomplete);
	m_onprogress = nullptr;

	if(oncomplete)
		oncomplete(result);
}

void PosixHttpClient::Exchange::finishLater(Result::Outcome outcome, const std::string &reason)
{
	auto myself = shared_from_this();
	m_runloop->doLater([myself, outcome, reason] { myself->finish(outcome, reason); });
}

void PosixHttpClient::Exchange::abort()
{
	if(m_debugLevel > 1)
		printf("PosixHttpClient %s %s canceled\n", m_request.method.c_str(), m_uri.c_str());

	m_done = true;
	m_onprogress = nullptr;
	m_oncomplete = nullptr;
	close();
}

void PosixHttpClient::Exchange::close()
{
	if(m_fd >= 0)
	{
		m_runloop->unregisterDescriptor(m_fd);
		::close(m_fd);
		m_fd = -1;
	}

	if(m_timeoutTimer)
	{
		m_timeoutTimer->cancel();
		m_timeoutTimer.reset();
	}
}

} } // namespace rupload::http
