#pragma once

#include <cstdint>
#include <vector>
#include "core/types.hpp"
#include "core/errors.hpp"

namespace chunkvault {
namespace core {

// Turns a request into a concrete [start, end) range, clamping the end to total_size.
// Throws RangeError if start < 0, start >= total_size or the length is negative.
ByteRange normalize(const RangeRequest& request, int64_t total_size);

// Returns the chunks overlapping the request in index order, each with the
// intra-chunk sub-range to fetch. An empty range maps to no slices; a non-empty
// one that overlaps nothing throws RangeError.
std::vector<ChunkSlice> map_range(const std::vector<Chunk>& chunks, int64_t total_size,
                                  const RangeRequest& request);

// Same as above for an already normalized range
std::vector<ChunkSlice> map_range(const std::vector<Chunk>& chunks, const ByteRange& range);

} // namespace core
} // namespace chunkvault
