#include "core/chunk_layout.hpp"
#include <algorithm>
#include <boost/log/trivial.hpp>

namespace chunkvault::core {

//==============================================
// LAYOUT PLANNING
//==============================================

int64_t chunk_count(int64_t total_size, int64_t max_chunk_size) {
  if (max_chunk_size <= 0) {
    throw ConfigurationError("chunk size must be positive, got " + std::to_string(max_chunk_size));
  }
  if (total_size < 0) {
    throw ConfigurationError("file size must not be negative, got " + std::to_string(total_size));
  }
  return (total_size + max_chunk_size - 1) / max_chunk_size;
}

std::vector<ChunkBounds> plan(int64_t total_size, int64_t max_chunk_size) {
  const int64_t count = chunk_count(total_size, max_chunk_size);

  std::vector<ChunkBounds> bounds;
  bounds.reserve(static_cast<size_t>(count));

  for (int64_t i = 0; i < count; ++i) {
    ChunkBounds b;
    b.index = static_cast<int>(i);
    b.start = i * max_chunk_size;
    b.end = std::min(b.start + max_chunk_size, total_size);
    bounds.push_back(b);
  }

  BOOST_LOG_TRIVIAL(debug) << "Layout: Planned " << count << " chunks for " << total_size
                           << " bytes (max chunk size " << max_chunk_size << ")";
  return bounds;
}

bool requires_chunking(int64_t total_size, int64_t threshold) {
  return total_size >= threshold;
}


//==============================================
// LAYOUT VALIDATION
//==============================================

void validate_layout(const std::vector<Chunk>& chunks, int64_t total_size, int64_t chunk_size) {
  if (chunks.empty()) {
    if (total_size == 0) {
      return;
    }
    throw LayoutError("no chunks for a file of " + std::to_string(total_size) + " bytes");
  }

  int64_t expected_start = 0;
  for (size_t i = 0; i < chunks.size(); ++i) {
    const Chunk& chunk = chunks[i];
    const std::string where = "chunk " + std::to_string(chunk.index);

    if (chunk.index != static_cast<int>(i)) {
      throw LayoutError(where + " found at position " + std::to_string(i));
    }
    if (chunk.start_offset != expected_start) {
      throw LayoutError(where + " starts at " + std::to_string(chunk.start_offset) +
                        ", expected " + std::to_string(expected_start));
    }
    if (chunk.end_offset <= chunk.start_offset) {
      throw LayoutError(where + " is empty");
    }
    if (chunk.size() > chunk_size) {
      throw LayoutError(where + " holds " + std::to_string(chunk.size()) +
                        " bytes, more than the chunk size " + std::to_string(chunk_size));
    }
    if (i + 1 < chunks.size() && chunk.size() != chunk_size) {
      throw LayoutError(where + " is short but is not the last chunk");
    }
    expected_start = chunk.end_offset;
  }

  if (expected_start != total_size) {
    throw LayoutError("chunks end at " + std::to_string(expected_start) +
                      ", file size is " + std::to_string(total_size));
  }
}

} // namespace chunkvault::core
