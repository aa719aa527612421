#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include "io/byte_source.hpp"

namespace chunkvault {
namespace planner {

// Object written by a chunk store
struct StoredObject {
  std::string remote_ref;
  std::string checksum;
};

// Receives the fraction (0.0 to 1.0) of the current object written so far
using ProgressFn = std::function<void(double)>;

// Backend that persists one bounded byte stream as a single remote object
class ChunkStore {
public:
  virtual ~ChunkStore() = default;

  // Consumes exactly size bytes from source. Any failure throws.
  virtual StoredObject store_chunk(const std::string& name, io::ByteSource& source,
                                   int64_t size, const ProgressFn& progress) = 0;
  // Deletes a stored object, false when there is none for the reference
  virtual bool remove(const std::string& remote_ref) = 0;
};

} // namespace planner
} // namespace chunkvault
