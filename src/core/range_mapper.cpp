#include "core/range_mapper.hpp"
#include <algorithm>
#include <limits>
#include <boost/log/trivial.hpp>

namespace chunkvault {
namespace core {

namespace {

// End of the requested range for error reports, saturated at INT64_MAX
int64_t requested_end(const RangeRequest& request) {
  const int64_t length = std::max<int64_t>(request.length, 0);
  if (request.start > 0 && length > std::numeric_limits<int64_t>::max() - request.start) {
    return std::numeric_limits<int64_t>::max();
  }
  return request.start + length;
}

} // namespace

ByteRange normalize(const RangeRequest& request, int64_t total_size) {
  if (request.start < 0) {
    BOOST_LOG_TRIVIAL(error) << "Range mapper: Invalid range start: " << request.start;
    throw RangeError("invalid range start " + std::to_string(request.start),
                     request.start, requested_end(request));
  }
  if (request.start >= total_size) {
    BOOST_LOG_TRIVIAL(error) << "Range mapper: Range start " << request.start
                             << " exceeds file size " << total_size;
    throw RangeError("range start " + std::to_string(request.start) +
                     " exceeds file size " + std::to_string(total_size),
                     request.start, requested_end(request));
  }
  if (request.length < 0 && request.length != TO_END) {
    throw RangeError("invalid range length " + std::to_string(request.length),
                     request.start, request.start);
  }

  ByteRange range;
  range.start = request.start;
  if (request.length == TO_END || request.length > total_size - request.start) {
    range.end = total_size;
  } else {
    range.end = request.start + request.length;
  }
  return range;
}

std::vector<ChunkSlice> map_range(const std::vector<Chunk>& chunks, int64_t total_size,
                                  const RangeRequest& request) {
  return map_range(chunks, normalize(request, total_size));
}

std::vector<ChunkSlice> map_range(const std::vector<Chunk>& chunks, const ByteRange& range) {
  std::vector<ChunkSlice> slices;
  if (range.length() == 0) {
    return slices;
  }

  // Chunks are stored in index order so the overlap set comes out ordered
  for (const auto& chunk : chunks) {
    if (chunk.start_offset < range.end && chunk.end_offset > range.start) {
      const int64_t from = std::max(range.start, chunk.start_offset);
      const int64_t to = std::min(range.end, chunk.end_offset);

      ChunkSlice slice;
      slice.chunk = chunk;
      slice.offset = from - chunk.start_offset;
      slice.length = to - from;
      slices.push_back(slice);
    }
  }

  if (slices.empty()) {
    BOOST_LOG_TRIVIAL(error) << "Range mapper: No chunks found for range " << range.start << "-"
                             << range.end - 1 << " (total chunks: " << chunks.size() << ")";
    throw RangeError("no chunks found for range " + std::to_string(range.start) + "-" +
                     std::to_string(range.end - 1) + " (total chunks: " +
                     std::to_string(chunks.size()) + ")",
                     range.start, range.end);
  }

  BOOST_LOG_TRIVIAL(debug) << "Range mapper: Range " << range.start << "-" << range.end - 1
                           << " spans " << slices.size() << " chunk(s)";
  return slices;
}

} // namespace core
} // namespace chunkvault
