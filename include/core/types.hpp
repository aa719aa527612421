#ifndef CHUNKVAULT_CORE_TYPES_HPP
#define CHUNKVAULT_CORE_TYPES_HPP

#include <cstdint>
#include <string>
#include <vector>

namespace chunkvault::core {

constexpr int64_t GiB = 1024LL * 1024 * 1024;

// Per-chunk size, kept below the backend's 5 GiB object ceiling
constexpr int64_t MAX_CHUNK_SIZE = 4 * GiB + GiB / 2;
// Inputs at or above this size must be chunked
constexpr int64_t CHUNK_THRESHOLD = 5 * GiB;

// Range length sentinel meaning "through the end of the file"
constexpr int64_t TO_END = -1;

// User-visible file, possibly larger than the backend's object limit
struct LogicalFile {
  std::string id;
  std::string name;
  int64_t total_size{0};
  int64_t chunk_size{0};
  bool chunked{false};
  // Only used when the file is a single remote object
  std::string remote_ref;
  std::string checksum;
  bool deleted{false};
};

// One remote object holding [start_offset, end_offset) of a logical file
struct Chunk {
  int index{0};
  int64_t start_offset{0};
  int64_t end_offset{0};
  std::string remote_ref;
  std::string checksum;
  bool deleted{false};

  int64_t size() const { return end_offset - start_offset; }
};

// Planned boundaries of a chunk before it is stored
struct ChunkBounds {
  int index{0};
  int64_t start{0};
  int64_t end{0};

  int64_t size() const { return end - start; }
};

struct RangeRequest {
  int64_t start{0};
  int64_t length{TO_END};
};

// Half-open logical byte range
struct ByteRange {
  int64_t start{0};
  int64_t end{0};

  int64_t length() const { return end - start; }
};

// Part of a chunk needed to serve a range request, relative to the chunk start
struct ChunkSlice {
  Chunk chunk;
  int64_t offset{0};
  int64_t length{0};
};

} // namespace chunkvault::core

#endif // CHUNKVAULT_CORE_TYPES_HPP
