#ifndef CHUNKVAULT_CORE_CHUNK_LAYOUT_HPP
#define CHUNKVAULT_CORE_CHUNK_LAYOUT_HPP

#include <cstdint>
#include <vector>
#include "core/types.hpp"
#include "core/errors.hpp"

namespace chunkvault::core {

// ---- LAYOUT PLANNING ----
// Number of chunks needed to hold total_size bytes
int64_t chunk_count(int64_t total_size, int64_t max_chunk_size);
// Splits [0, total_size) into ordered contiguous bounds of at most max_chunk_size bytes.
// An empty file yields no bounds.
std::vector<ChunkBounds> plan(int64_t total_size, int64_t max_chunk_size);
// True when a file of this size cannot be stored as a single object
bool requires_chunking(int64_t total_size, int64_t threshold = CHUNK_THRESHOLD);


// ---- LAYOUT VALIDATION ----
// Throws LayoutError unless the chunks are dense, contiguous, start at 0,
// end at total_size and only the last one is shorter than chunk_size
void validate_layout(const std::vector<Chunk>& chunks, int64_t total_size, int64_t chunk_size);

} // namespace chunkvault::core

#endif // CHUNKVAULT_CORE_CHUNK_LAYOUT_HPP
