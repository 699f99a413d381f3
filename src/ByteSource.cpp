// Copyright © 2021 Michael Thornburgh
// SPDX-License-Identifier: MIT

#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstring>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include "../include/rupload/ByteSource.hpp"

namespace rupload {

bool ByteSource::readRange(uint64_t offset, size_t len, Bytes &dst)
{
	dst.resize(len);
	return read(offset, len, dst.data()); // bounds are checked even for len 0
}

// --- MemoryByteSource

MemoryByteSource::MemoryByteSource(const Bytes &bytes) :
	m_bytes(bytes)
{
}

MemoryByteSource::MemoryByteSource(Bytes &&bytes) :
	m_bytes(std::move(bytes))
{
}

MemoryByteSource::MemoryByteSource(const std::string &s) :
	m_bytes(s.begin(), s.end())
{
}

uint64_t MemoryByteSource::size() const
{
	return m_bytes.size();
}

bool MemoryByteSource::read(uint64_t offset, size_t len, uint8_t *dst)
{
	if((offset > m_bytes.size()) or (len > m_bytes.size() - offset))
		return false;
	if(len)
		memmove(dst, m_bytes.data() + offset, len);
	return true;
}

const Bytes & MemoryByteSource::bytes() const
{
	return m_bytes;
}

// --- FileByteSource

FileByteSource::FileByteSource(int fd, uint64_t size, const std::string &path) :
	m_fd(fd),
	m_size(size),
	m_path(path)
{
}

FileByteSource::~FileByteSource()
{
	if(m_fd >= 0)
		::close(m_fd);
	m_fd = -1;
}

std::shared_ptr<FileByteSource> FileByteSource::open(const std::string &path)
{
	int fd = ::open(path.c_str(), O_RDONLY);
	if(fd < 0)
		return nullptr;

	struct stat st;
	if((::fstat(fd, &st) < 0) or not S_ISREG(st.st_mode))
	{
		::close(fd);
		return nullptr;
	}

	return std::shared_ptr<FileByteSource>(new FileByteSource(fd, (uint64_t)st.st_size, path));
}

uint64_t FileByteSource::size() const
{
	return m_size;
}

bool FileByteSource::read(uint64_t offset, size_t len, uint8_t *dst)
{
	if((offset > m_size) or (len > m_size - offset))
		return false;

	while(len)
	{
		ssize_t rv = ::pread(m_fd, dst, len, (off_t)offset);
		if(rv < 0)
		{
			if(EINTR == errno)
				continue;
			::perror("pread");
			return false;
		}
		if(0 == rv)
			return false; // file shrank underneath us

		dst += rv;
		offset += rv;
		len -= rv;
	}

	return true;
}

std::string FileByteSource::getPath() const
{
	return m_path;
}

// ---

std::string baseName(const std::string &path)
{
	size_t pos = path.find_last_of('/');
	if(std::string::npos == pos)
		return path;
	return path.substr(pos + 1);
}

std::string mimeTypeForName(const std::string &name)
{
	static const struct { const char *ext; const char *type; } types[] = {
		{ "pdf",  "application/pdf" },
		{ "doc",  "application/msword" },
		{ "docx", "application/vnd.openxmlformats-officedocument.wordprocessingml.document" },
		{ "txt",  "text/plain" },
		{ "json", "application/json" },
		{ "png",  "image/png" },
		{ "jpg",  "image/jpeg" },
		{ "jpeg", "image/jpeg" },
		{ "gif",  "image/gif" },
	};

	std::string base = baseName(name);
	size_t dot = base.find_last_of('.');
	if((std::string::npos == dot) or (0 == dot))
		return "application/octet-stream";

	std::string ext;
	for(size_t i = dot + 1; i < base.size(); i++)
		ext.push_back((char)::tolower((unsigned char)base[i]));

	for(size_t i = 0; i < sizeof(types) / sizeof(types[0]); i++)
		if(ext == types[i].ext)
			return types[i].type;

	return "application/octet-stream";
}

} // namespace rupload
