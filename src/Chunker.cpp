// Copyright © 2021 Michael Thornburgh
// SPDX-License-Identifier: MIT

#include <algorithm>

#include "../include/rupload/Chunker.hpp"

namespace rupload {

ChunkList Chunker::makeChunks(uint64_t size, uint64_t chunkSize)
{
	ChunkList rv;

	if((0 == size) or (0 == chunkSize))
		return rv;

	rv.reserve(countChunks(size, chunkSize));
	for(uint64_t offset = 0; offset < size; offset += chunkSize)
	{
		ChunkRange each;
		each.offset = offset;
		each.length = std::min(chunkSize, size - offset);
		rv.push_back(each);
	}

	return rv;
}

size_t Chunker::countChunks(uint64_t size, uint64_t chunkSize)
{
	if(0 == chunkSize)
		return 0;
	return (size_t)(size / chunkSize + ((size % chunkSize) ? 1 : 0));
}

bool Chunker::coversContiguously(const ChunkList &chunks, uint64_t size)
{
	uint64_t cursor = 0;
	for(auto it = chunks.begin(); it != chunks.end(); it++)
	{
		if((it->offset != cursor) or (0 == it->length))
			return false;
		cursor = it->end();
	}
	return cursor == size;
}

uint64_t Chunker::bytesBefore(const ChunkList &chunks, size_t index)
{
	if(index >= chunks.size())
		return chunks.empty() ? 0 : chunks.back().end();
	return chunks[index].offset;
}

} // namespace rupload
