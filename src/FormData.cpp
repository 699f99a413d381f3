// Copyright © 2021 Michael Thornburgh
// SPDX-License-Identifier: MIT

#include <algorithm>
#include <cctype>

#include "../include/rupload/FormData.hpp"
#include "../include/rupload/Random.hpp"
#include "../include/rupload/URIParse.hpp"

namespace {

std::string _trim(const std::string &s)
{
	size_t left = 0;
	size_t right = s.size();

	while((left < right) and std::isspace((unsigned char)s[left]))
		left++;
	while((right > left) and std::isspace((unsigned char)s[right - 1]))
		right--;
	return s.substr(left, right - left);
}

std::string _unquote(const std::string &s)
{
	if((s.size() >= 2) and ('"' == s[0]) and ('"' == s[s.size() - 1]))
		return s.substr(1, s.size() - 2);
	return s;
}

// names and filenames go in quoted-strings; escape what would end one
std::string _escapeName(const std::string &s)
{
	std::string rv;
	for(auto it = s.begin(); it != s.end(); it++)
	{
		switch(*it)
		{
		case '"':  rv.append("%22"); break;
		case '\r': rv.append("%0D"); break;
		case '\n': rv.append("%0A"); break;
		default:   rv.push_back(*it);
		}
	}
	return rv;
}

size_t _find(const rupload::Bytes &haystack, const std::string &needle, size_t from)
{
	if(from > haystack.size())
		return std::string::npos;
	auto it = std::search(haystack.begin() + from, haystack.end(), needle.begin(), needle.end());
	if(it == haystack.end())
		return std::string::npos;
	return it - haystack.begin();
}

bool _startsWith(const rupload::Bytes &bytes, size_t pos, const char *prefix)
{
	for(; *prefix; prefix++, pos++)
		if((pos >= bytes.size()) or (bytes[pos] != (uint8_t)*prefix))
			return false;
	return true;
}

std::string _makeBoundary()
{
	static unsigned long fallbackCounter = 0;
	std::string tag = rupload::randomHex(12);
	if(tag.empty())
		tag = "seq" + std::to_string(++fallbackCounter);
	return "----ruploadFormBoundary" + tag;
}

}

namespace rupload { namespace http {

FormData::FormData() :
	m_boundary(_makeBoundary())
{
}

FormData::FormData(const std::string &boundary) :
	m_boundary(boundary)
{
}

void FormData::append(const std::string &name, const std::string &value)
{
	Field field;
	field.head = "Content-Disposition: form-data; name=\"" + _escapeName(name) + "\"\r\n";
	field.value = value;
	field.offset = 0;
	field.length = value.size();
	m_fields.push_back(field);
}

void FormData::append(const std::string &name, const std::string &filename, const std::string &contentType,
		std::shared_ptr<ByteSource> source, uint64_t offset, uint64_t length)
{
	Field field;
	field.head = "Content-Disposition: form-data; name=\"" + _escapeName(name) + "\"; filename=\"" + _escapeName(filename) + "\"\r\n";
	field.head += "Content-Type: " + (contentType.empty() ? std::string("application/octet-stream") : contentType) + "\r\n";
	field.source = source;
	field.offset = offset;
	field.length = length;
	m_fields.push_back(field);
}

std::string FormData::getBoundary() const
{
	return m_boundary;
}

std::string FormData::contentType() const
{
	return "multipart/form-data; boundary=" + m_boundary;
}

Body FormData::encode() const
{
	Body rv;
	std::string pending;

	for(auto it = m_fields.begin(); it != m_fields.end(); it++)
	{
		pending += "--" + m_boundary + "\r\n" + it->head + "\r\n";
		if(it->source)
		{
			rv.push_back(BodySegment(pending));
			pending.clear();
			rv.push_back(BodySegment(it->source, it->offset, it->length));
		}
		else
			pending += it->value;
		pending += "\r\n";
	}

	pending += "--" + m_boundary + "--\r\n";
	rv.push_back(BodySegment(pending));

	return rv;
}

uint64_t FormData::encodedSize() const
{
	return bodySize(encode());
}

std::string FormData::Part::text() const
{
	return std::string(value.begin(), value.end());
}

bool FormData::Part::isFile() const
{
	return not filename.empty();
}

bool FormData::parse(const Bytes &body, const std::string &boundary, PartList &dst)
{
	dst.clear();
	if(boundary.empty())
		return false;

	std::string dashBoundary = "--" + boundary;
	std::string delimiter = "\r\n" + dashBoundary;

	size_t pos = _find(body, dashBoundary, 0);
	if(std::string::npos == pos)
		return false;
	pos += dashBoundary.size();

	while(true)
	{
		if(_startsWith(body, pos, "--"))
			return true;
		if(not _startsWith(body, pos, "\r\n"))
			return false;
		pos += 2;

		std::string head;
		size_t contentStart;
		if(_startsWith(body, pos, "\r\n"))
			contentStart = pos + 2;
		else
		{
			size_t headEnd = _find(body, "\r\n\r\n", pos);
			if(std::string::npos == headEnd)
				return false;
			head.assign(body.begin() + pos, body.begin() + headEnd);
			contentStart = headEnd + 4;
		}

		size_t contentEnd = _find(body, delimiter, contentStart);
		if(std::string::npos == contentEnd)
			return false;

		Part part;
		auto lines = URIParse::split(head, '\n');
		for(auto it = lines.begin(); it != lines.end(); it++)
		{
			auto field = URIParse::split(_trim(*it), ':', 2);
			if(2 != field.size())
				continue;
			std::string fieldName = URIParse::lowercase(_trim(field[0]));

			if("content-type" == fieldName)
				part.contentType = _trim(field[1]);
			else if("content-disposition" == fieldName)
			{
				auto params = URIParse::split(field[1], ';');
				for(auto param = params.begin(); param != params.end(); param++)
				{
					auto kv = URIParse::split(_trim(*param), '=', 2);
					if(2 != kv.size())
						continue;
					std::string key = URIParse::lowercase(_trim(kv[0]));
					if("name" == key)
						part.name = _unquote(_trim(kv[1]));
					else if("filename" == key)
						part.filename = _unquote(_trim(kv[1]));
				}
			}
		}

		part.value.assign(body.begin() + contentStart, body.begin() + contentEnd);
		dst.push_back(part);

		pos = contentEnd + delimiter.size();
	}
}

std::string FormData::boundaryFromContentType(const std::string &contentType)
{
	auto params = URIParse::split(contentType, ';');
	for(auto it = params.begin(); it != params.end(); it++)
	{
		auto kv = URIParse::split(_trim(*it), '=', 2);
		if((2 == kv.size()) and ("boundary" == URIParse::lowercase(_trim(kv[0]))))
			return _unquote(_trim(kv[1]));
	}
	return "";
}

const FormData::Part * FormData::find(const PartList &parts, const std::string &name)
{
	for(auto it = parts.begin(); it != parts.end(); it++)
		if(it->name == name)
			return &*it;
	return nullptr;
}

} } // namespace rupload::http
