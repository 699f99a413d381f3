#pragma once

// Copyright © 2021 Michael Thornburgh
// SPDX-License-Identifier: MIT

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace rupload {

using Bytes = std::vector<uint8_t>;

// The original bytes of a transfer. Transfers, chunks and request bodies
// refer to ranges of a source; nothing in the engine copies a whole source.
class ByteSource {
public:
	virtual ~ByteSource() {}

	virtual uint64_t size() const = 0;

	// Copy len bytes starting at offset into dst. Answer false on any error or
	// short read.
	virtual bool read(uint64_t offset, size_t len, uint8_t *dst) = 0;

	bool readRange(uint64_t offset, size_t len, Bytes &dst); // replaces dst's contents
};

class MemoryByteSource : public ByteSource {
public:
	MemoryByteSource(const Bytes &bytes);
	MemoryByteSource(Bytes &&bytes);
	MemoryByteSource(const std::string &s);

	uint64_t size() const override;
	bool read(uint64_t offset, size_t len, uint8_t *dst) override;

	const Bytes & bytes() const;

protected:
	Bytes m_bytes;
};

class FileByteSource : public ByteSource {
public:
	~FileByteSource();

	// Answer an empty pointer if path can't be opened as a regular file.
	static std::shared_ptr<FileByteSource> open(const std::string &path);

	uint64_t size() const override;
	bool read(uint64_t offset, size_t len, uint8_t *dst) override;

	std::string getPath() const;

protected:
	FileByteSource(int fd, uint64_t size, const std::string &path);

	int         m_fd;
	uint64_t    m_size;
	std::string m_path;
};

std::string baseName(const std::string &path);

// Guess a MIME type from the file name's extension, application/octet-stream if unknown.
std::string mimeTypeForName(const std::string &name);

} // namespace rupload
