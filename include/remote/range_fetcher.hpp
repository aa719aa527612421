#ifndef CHUNKVAULT_REMOTE_RANGE_FETCHER_HPP
#define CHUNKVAULT_REMOTE_RANGE_FETCHER_HPP

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include "io/byte_source.hpp"

namespace chunkvault {
namespace remote {

// Opens a bounded read of [offset, offset + length) of the object at a resolved location
class RangeFetcher {
public:
  virtual ~RangeFetcher() = default;

  // Throws TransferError when the read can not be opened
  virtual io::ByteSourcePtr open(const std::string& location, int64_t offset, int64_t length) = 0;
};


// Serves file:// locations from the local filesystem
class FileRangeFetcher : public RangeFetcher {
public:
  io::ByteSourcePtr open(const std::string& location, int64_t offset, int64_t length) override;
};


// Dispatches on the location scheme to the fetcher registered for it
class SchemeRangeFetcher : public RangeFetcher {
public:
  // The fetcher must outlive this object
  void register_scheme(const std::string& scheme, RangeFetcher& fetcher);

  io::ByteSourcePtr open(const std::string& location, int64_t offset, int64_t length) override;

private:
  std::map<std::string, RangeFetcher*> fetchers_;
};

} // namespace remote
} // namespace chunkvault

#endif // CHUNKVAULT_REMOTE_RANGE_FETCHER_HPP
