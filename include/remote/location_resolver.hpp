#pragma once

#include <string>

namespace chunkvault {
namespace remote {

// Turns a chunk's opaque remote reference into a short-lived access
// location. Every location is single-use: callers resolve again before
// each transfer.
class LocationResolver {
public:
  virtual ~LocationResolver() = default;

  // Throws ResolutionError on a retryable failure and ChunkMissingError
  // when the backend has no object for the reference
  virtual std::string resolve(const std::string& remote_ref) = 0;
};

} // namespace remote
} // namespace chunkvault
