// Copyright © 2021 Michael Thornburgh
// SPDX-License-Identifier: MIT

#include <cctype>
#include <cstdlib>
#include <cstring>
#include <regex>

#include "../include/rupload/Http.hpp"
#include "../include/rupload/URIParse.hpp"

namespace {

const size_t MAX_HEADER_BYTES = 65536;
const size_t MAX_BODY_BYTES = 1 << 24; // responses are small JSON; requests are at most one chunk

std::string _replace(const std::string &s, const char *pattern, const char *fmt)
{
	return std::regex_replace(s, std::regex(pattern), fmt);
}

std::string _trim(const std::string &s)
{
	auto left = s.data();
	auto right = left + s.size();

	while((left < right) and std::isspace((unsigned char)*left))
		left++;
	while((right > left) and std::isspace((unsigned char)*(right - 1)))
		right--;
	return std::string(left, right);
}

bool _istchar(int c)
{
	// RFC 7230 §3.2.6
	switch(c)
	{
	case '!':
	case '#':
	case '$':
	case '%':
	case '&':
	case '\'':
	case '*':
	case '+':
	case '-':
	case '.':
	case '^':
	case '_':
	case '`':
	case '|':
	case '~':
		return true;
	default:
		return ::isdigit(c) or ::isalpha(c);
	}
}

bool _isToken(const std::string &s)
{
	for(auto it = s.begin(); it != s.end(); it++)
		if(not _istchar((unsigned char)*it))
			return false;
	return not s.empty();
}

bool _sameName(const std::string &l, const std::string &r)
{
	return rupload::URIParse::lowercase(l) == rupload::URIParse::lowercase(r);
}

std::string _joinValues(const std::vector<std::string> &vals)
{
	std::string rv;
	bool first = true;
	for(auto it = vals.begin(); it != vals.end(); it++)
	{
		if(not first)
			rv.push_back(',');
		rv.append(*it);
		first = false;
	}
	return rv;
}

}

namespace rupload { namespace http {

// --- BodySegment

BodySegment::BodySegment(const Bytes &bytes_) :
	bytes(bytes_),
	offset(0),
	length(bytes_.size())
{
}

BodySegment::BodySegment(const std::string &s) :
	bytes(s.begin(), s.end()),
	offset(0),
	length(s.size())
{
}

BodySegment::BodySegment(std::shared_ptr<ByteSource> source_, uint64_t offset_, uint64_t length_) :
	source(source_),
	offset(offset_),
	length(length_)
{
}

uint64_t BodySegment::size() const
{
	return length;
}

bool BodySegment::read(uint64_t pos, size_t len, uint8_t *dst) const
{
	if((pos > length) or (len > length - pos))
		return false;
	if(0 == len)
		return true;

	if(source)
		return source->read(offset + pos, len, dst);

	memmove(dst, bytes.data() + pos, len);
	return true;
}

uint64_t bodySize(const Body &body)
{
	uint64_t rv = 0;
	for(auto it = body.begin(); it != body.end(); it++)
		rv += it->size();
	return rv;
}

bool flattenBody(const Body &body, Bytes &dst)
{
	dst.clear();
	dst.resize(bodySize(body));
	uint8_t *cursor = dst.data();

	for(auto it = body.begin(); it != body.end(); it++)
	{
		if(not it->read(0, it->size(), cursor))
			return false;
		cursor += it->size();
	}

	return true;
}

// --- Request

void Request::setHeader(const std::string &name, const std::string &value)
{
	for(auto it = headers.begin(); it != headers.end(); it++)
	{
		if(_sameName(it->first, name))
		{
			it->second = value;
			return;
		}
	}
	headers.push_back(std::make_pair(name, value));
}

std::string Request::getHeader(const std::string &name) const
{
	for(auto it = headers.begin(); it != headers.end(); it++)
		if(_sameName(it->first, name))
			return it->second;
	return "";
}

std::string Request::serializeHead(const std::string &host) const
{
	std::string rv = method + " " + target + " HTTP/1.1\r\n";
	rv += "Host: " + host + "\r\n";

	for(auto it = headers.begin(); it != headers.end(); it++)
	{
		if(_sameName(it->first, "Host") or _sameName(it->first, "Content-Length") or _sameName(it->first, "Connection"))
			continue;
		rv += it->first + ": " + it->second + "\r\n";
	}

	rv += "Content-Length: " + std::to_string(bodySize(body)) + "\r\n";
	rv += "Connection: close\r\n\r\n";

	return rv;
}

Request Request::json(const std::string &target, const nlohmann::json &body)
{
	Request rv;
	rv.target = target;
	rv.setHeader("Content-Type", "application/json");
	rv.body.push_back(BodySegment(body.dump()));
	return rv;
}

// --- Response

std::string Response::getHeader(const std::string &name) const
{
	auto it = headers.find(URIParse::lowercase(name));
	if(it != headers.end())
		return _joinValues(it->second);
	return "";
}

std::string Response::bodyString() const
{
	return std::string(body.begin(), body.end());
}

nlohmann::json Response::bodyJSON() const
{
	if(body.empty())
		return nullptr;

	nlohmann::json rv = nlohmann::json::parse(body.begin(), body.end(), nullptr, false);
	if(rv.is_discarded())
		return nullptr;
	return rv;
}

std::string Response::errorMessage() const
{
	nlohmann::json j = bodyJSON();
	if(j.is_object())
	{
		auto it = j.find("error");
		if((it != j.end()) and it->is_string())
			return it->get<std::string>();
	}
	return "";
}

Bytes Response::serialize() const
{
	std::string head = "HTTP/1.1 " + std::to_string(status) + " " + (reason.empty() ? std::string(reasonPhrase(status)) : reason) + "\r\n";

	for(auto it = headers.begin(); it != headers.end(); it++)
	{
		if((it->first == "content-length") or (it->first == "connection"))
			continue;
		for(auto each = it->second.begin(); each != it->second.end(); each++)
			head += it->first + ": " + *each + "\r\n";
	}

	head += "Content-Length: " + std::to_string(body.size()) + "\r\n";
	head += "Connection: close\r\n\r\n";

	Bytes rv(head.begin(), head.end());
	rv.insert(rv.end(), body.begin(), body.end());
	return rv;
}

Response Response::json(int status, const nlohmann::json &body)
{
	Response rv;
	rv.status = status;
	rv.reason = reasonPhrase(status);
	rv.headers["content-type"].push_back("application/json");
	std::string s = body.dump();
	rv.body.assign(s.begin(), s.end());
	return rv;
}

const char * reasonPhrase(int status)
{
	switch(status)
	{
	case 100: return "Continue";
	case 200: return "OK";
	case 201: return "Created";
	case 204: return "No Content";
	case 400: return "Bad Request";
	case 404: return "Not Found";
	case 405: return "Method Not Allowed";
	case 409: return "Conflict";
	case 413: return "Payload Too Large";
	case 422: return "Unprocessable Entity";
	case 500: return "Internal Server Error";
	case 502: return "Bad Gateway";
	case 503: return "Service Unavailable";
	case 504: return "Gateway Timeout";
	default:  return "Unknown";
	}
}

// --- MessageParser

MessageParser::MessageParser(bool isResponse) :
	maxHeaderBytes(MAX_HEADER_BYTES),
	maxBodyBytes(MAX_BODY_BYTES),
	status(0),
	m_isResponse(isResponse),
	m_state(P_HEADERS),
	m_gotNewline(false),
	m_remaining(0)
{
}

size_t MessageParser::onBytes(const void *bytes, size_t len)
{
	const uint8_t *start = (const uint8_t *)bytes;
	const uint8_t *cursor = start;
	const uint8_t *limit = cursor + len;

	while((cursor < limit) and (m_state < P_COMPLETE))
	{
		switch(m_state)
		{
		case P_HEADERS:
			{
				uint8_t c = *cursor++;

				// ignore empty lines before the start line (RFC 7230 §3.5)
				if(m_headerBlock.empty() and (('\r' == c) or ('\n' == c)))
					break;

				m_headerBlock.push_back(c);
				if(m_headerBlock.size() > maxHeaderBytes)
					setError("header block too large");
				else if('\n' == c)
				{
					if(m_gotNewline)
						parseHeaderBlock();
					else
						m_gotNewline = true;
				}
				else if('\r' != c)
					m_gotNewline = false;
			}
			break;

		case P_BODY:
		case P_CHUNK_DATA:
			{
				size_t avail = limit - cursor;
				size_t count = (m_remaining < avail) ? (size_t)m_remaining : avail;
				if(body.size() + count > maxBodyBytes)
				{
					setError("body too large");
					break;
				}
				body.insert(body.end(), cursor, cursor + count);
				cursor += count;
				m_remaining -= count;
				if(0 == m_remaining)
					m_state = (P_BODY == m_state) ? P_COMPLETE : P_CHUNK_DATA_END;
			}
			break;

		case P_CHUNK_SIZE:
			if(parseLine(cursor, limit, m_lineBuffer))
			{
				std::string sizePart = _trim(URIParse::split(m_lineBuffer, ';', 2)[0]);
				m_lineBuffer.clear();
				char *endp = nullptr;
				if(sizePart.empty() or not ::isxdigit((unsigned char)sizePart[0]))
				{
					setError("bad chunk size");
					break;
				}
				m_remaining = strtoull(sizePart.c_str(), &endp, 16);
				if(*endp)
					setError("bad chunk size");
				else
					m_state = m_remaining ? P_CHUNK_DATA : P_TRAILERS;
			}
			break;

		case P_CHUNK_DATA_END:
			if(parseLine(cursor, limit, m_lineBuffer))
			{
				if(not m_lineBuffer.empty())
					setError("missing CRLF after chunk data");
				else
					m_state = P_CHUNK_SIZE;
				m_lineBuffer.clear();
			}
			break;

		case P_TRAILERS:
			if(parseLine(cursor, limit, m_lineBuffer))
			{
				if(m_lineBuffer.empty())
					m_state = P_COMPLETE;
				m_lineBuffer.clear(); // trailer fields are ignored
			}
			break;

		case P_UNTIL_CLOSE:
			if(body.size() + (limit - cursor) > maxBodyBytes)
			{
				setError("body too large");
				break;
			}
			body.insert(body.end(), cursor, limit);
			cursor = limit;
			break;

		default:
			break;
		}
	}

	return cursor - start;
}

bool MessageParser::onClose()
{
	if(P_UNTIL_CLOSE == m_state)
		m_state = P_COMPLETE;
	else if(P_COMPLETE != m_state)
		setError("connection closed before end of message");

	return P_COMPLETE == m_state;
}

bool MessageParser::isComplete() const
{
	return P_COMPLETE == m_state;
}

bool MessageParser::isError() const
{
	return P_ERROR == m_state;
}

bool MessageParser::isHeaderComplete() const
{
	return (m_state > P_HEADERS) and (P_ERROR != m_state);
}

MessageParser::State MessageParser::getState() const
{
	return m_state;
}

std::string MessageParser::getErrorReason() const
{
	return m_errorReason;
}

bool MessageParser::hasHeader(const std::string &name) const
{
	return headers.count(URIParse::lowercase(name)) > 0;
}

std::string MessageParser::getHeader(const std::string &name) const
{
	auto it = headers.find(URIParse::lowercase(name));
	if(it != headers.end())
		return _joinValues(it->second);
	return "";
}

Response MessageParser::response() const
{
	Response rv;
	rv.status = status;
	rv.reason = reason;
	rv.headers = headers;
	rv.body = body;
	return rv;
}

bool MessageParser::parseHeaderBlock()
{
	std::string tmp = _replace(m_headerBlock, "\r\n", "\n");
	tmp = _replace(tmp, "\r", " ");
	tmp = _replace(tmp, "\n[ \t]", " ");
	m_headerBlock.clear();
	m_gotNewline = false;
	headers.clear();

	auto lines = URIParse::split(tmp, '\n');
	bool needStartLine = true;
	for(auto it = lines.begin(); it != lines.end(); it++)
	{
		if(needStartLine)
		{
			if(not parseStartLine(*it))
				return false;
			needStartLine = false;
		}
		else if(it->size())
		{
			auto parts = URIParse::split(*it, ':', 2);
			if((2 != parts.size()) or not _isToken(parts[0]))
			{
				setError("malformed header field");
				return false;
			}

			headers[URIParse::lowercase(parts[0])].push_back(_trim(parts[1]));
		}
	}

	if(m_isResponse and (status >= 100) and (status < 200))
	{
		// interim response, the real one follows
		headers.clear();
		m_state = P_HEADERS;
		return true;
	}

	if(m_isResponse and ((204 == status) or (304 == status)))
	{
		m_state = P_COMPLETE;
		return true;
	}

	if(std::string::npos != URIParse::lowercase(getHeader("Transfer-Encoding")).find("chunked"))
	{
		m_state = P_CHUNK_SIZE;
		return true;
	}

	if(hasHeader("Content-Length"))
	{
		std::string value = _trim(getHeader("Content-Length"));
		char *endp = nullptr;
		if(value.empty() or not ::isdigit((unsigned char)value[0]))
		{
			setError("bad Content-Length");
			return false;
		}
		m_remaining = strtoull(value.c_str(), &endp, 10);
		if(*endp)
		{
			setError("bad Content-Length");
			return false;
		}
		if(m_remaining > maxBodyBytes)
		{
			setError("body too large");
			return false;
		}
		m_state = m_remaining ? P_BODY : P_COMPLETE;
		return true;
	}

	m_state = m_isResponse ? P_UNTIL_CLOSE : P_COMPLETE;
	return true;
}

bool MessageParser::parseStartLine(const std::string &line)
{
	auto parts = URIParse::split(line, ' ', 3);

	if(m_isResponse)
	{
		if((parts.size() < 2) or (0 != parts[0].compare(0, 5, "HTTP/")) or (3 != parts[1].size())
		 or not (::isdigit((unsigned char)parts[1][0]) and ::isdigit((unsigned char)parts[1][1]) and ::isdigit((unsigned char)parts[1][2])))
		{
			setError("malformed status line");
			return false;
		}
		status = atoi(parts[1].c_str());
		reason = (parts.size() > 2) ? parts[2] : std::string();
	}
	else
	{
		if((3 != parts.size()) or not _isToken(parts[0]) or parts[1].empty() or (0 != parts[2].compare(0, 5, "HTTP/")))
		{
			setError("malformed request line");
			return false;
		}
		method = parts[0];
		target = parts[1];
	}

	return true;
}

void MessageParser::setError(const std::string &reason_)
{
	if(P_ERROR != m_state)
		m_errorReason = reason_;
	m_state = P_ERROR;
}

bool MessageParser::parseLine(const uint8_t *&cursor, const uint8_t *limit, std::string &dst)
{
	while(cursor < limit)
	{
		uint8_t c = *cursor++;
		if('\n' == c)
		{
			if((not dst.empty()) and ('\r' == dst.back()))
				dst.pop_back();
			return true;
		}
		dst.push_back(c);
		if(dst.size() > maxHeaderBytes)
		{
			setError("line too long");
			return false;
		}
	}
	return false;
}

} } // namespace rupload::http
