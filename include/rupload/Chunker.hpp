#pragma once

// Copyright © 2021 Michael Thornburgh
// SPDX-License-Identifier: MIT

#include <cstdint>
#include <memory>
#include <vector>

namespace rupload {

const size_t DEFAULT_CHUNK_SIZE = 1024 * 1024;

// A contiguous byte range of a source. Chunks are index pairs over the
// original source, never copies of its bytes.
struct ChunkRange {
	uint64_t offset;
	uint64_t length;

	uint64_t end() const { return offset + length; }
	bool operator== (const ChunkRange &rhs) const { return (offset == rhs.offset) and (length == rhs.length); }
};

using ChunkList = std::vector<ChunkRange>;

class Chunker {
public:
	// Answer ceil(size / chunkSize) ranges covering [0, size) in order, with
	// offset_i = i * chunkSize. Deterministic, so a transfer can be resumed
	// at any index. Empty for size 0 or chunkSize 0.
	static ChunkList makeChunks(uint64_t size, uint64_t chunkSize = DEFAULT_CHUNK_SIZE);

	static size_t countChunks(uint64_t size, uint64_t chunkSize = DEFAULT_CHUNK_SIZE);

	// True if chunks cover [0, size) contiguously with no gaps or overlaps.
	static bool coversContiguously(const ChunkList &chunks, uint64_t size);

	// Total length of chunks [0, index).
	static uint64_t bytesBefore(const ChunkList &chunks, size_t index);
};

} // namespace rupload
