#ifndef CHUNKVAULT_READER_CHUNKED_RANGE_READER_HPP
#define CHUNKVAULT_READER_CHUNKED_RANGE_READER_HPP

#include <cstdint>
#include <memory>
#include <mutex>
#include <vector>
#include "core/types.hpp"
#include "reader/retry_policy.hpp"
#include "reader/segmented_reader.hpp"

namespace chunkvault::reader {

/**
 * Read handle over one logical file made of ordered chunks.
 *
 * Each range_read() call checks the request against the file size before
 * anything is resolved, maps it to chunk slices and returns a fresh
 * SegmentedReader. Readers are independent of each other and may outlive
 * the handle; only close() ends them early.
 */
class ChunkedRangeReader {
public:
  // The resolver and fetcher must outlive this object and every reader it returns
  ChunkedRangeReader(std::vector<core::Chunk> chunks, int64_t total_size,
                     remote::LocationResolver& resolver, remote::RangeFetcher& fetcher,
                     RetryPolicy retry_policy = RetryPolicy{});

  ChunkedRangeReader(const ChunkedRangeReader&) = delete;
  ChunkedRangeReader& operator=(const ChunkedRangeReader&) = delete;

  // Throws RangeError for a bad request and ChunkVaultError after close()
  std::shared_ptr<SegmentedReader> range_read(const core::RangeRequest& request);

  // Closes every reader still alive and refuses further requests
  void close();

  int64_t total_size() const { return total_size_; }
  const std::vector<core::Chunk>& chunks() const { return chunks_; }

private:
  std::vector<core::Chunk> chunks_;
  int64_t total_size_;
  remote::LocationResolver& resolver_;
  remote::RangeFetcher& fetcher_;
  RetryPolicy retry_policy_;

  std::mutex mutex_;
  std::vector<std::weak_ptr<SegmentedReader>> readers_;
  bool closed_{false};
};

} // namespace chunkvault::reader

#endif // CHUNKVAULT_READER_CHUNKED_RANGE_READER_HPP
