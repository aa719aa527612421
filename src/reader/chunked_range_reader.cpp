#include "reader/chunked_range_reader.hpp"
#include "core/range_mapper.hpp"
#include "core/errors.hpp"
#include <algorithm>
#include <boost/log/trivial.hpp>

namespace chunkvault::reader {

ChunkedRangeReader::ChunkedRangeReader(std::vector<core::Chunk> chunks, int64_t total_size,
                                       remote::LocationResolver& resolver,
                                       remote::RangeFetcher& fetcher,
                                       RetryPolicy retry_policy)
  : chunks_(std::move(chunks))
  , total_size_(total_size)
  , resolver_(resolver)
  , fetcher_(fetcher)
  , retry_policy_(std::move(retry_policy)) {
  if (total_size_ < 0) {
    throw core::ConfigurationError("negative file size " + std::to_string(total_size_));
  }
  std::sort(chunks_.begin(), chunks_.end(),
            [](const core::Chunk& a, const core::Chunk& b) { return a.index < b.index; });
}

std::shared_ptr<SegmentedReader> ChunkedRangeReader::range_read(const core::RangeRequest& request) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
      throw core::ChunkVaultError("Range reader is closed");
    }
  }

  // Bounds are checked here, before any chunk location is resolved
  core::ByteRange range = core::normalize(request, total_size_);
  std::vector<core::ChunkSlice> slices = core::map_range(chunks_, range);

  BOOST_LOG_TRIVIAL(debug) << "Range reader: Range " << range.start << "-" << range.end
                           << " spans " << slices.size() << " of " << chunks_.size() << " chunks";

  auto reader = std::make_shared<SegmentedReader>(std::move(slices), resolver_, fetcher_,
                                                  retry_policy_);

  std::lock_guard<std::mutex> lock(mutex_);
  readers_.erase(std::remove_if(readers_.begin(), readers_.end(),
                                [](const std::weak_ptr<SegmentedReader>& r) { return r.expired(); }),
                 readers_.end());
  readers_.push_back(reader);
  return reader;
}

void ChunkedRangeReader::close() {
  std::vector<std::weak_ptr<SegmentedReader>> readers;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
      return;
    }
    closed_ = true;
    readers.swap(readers_);
  }

  for (auto& weak : readers) {
    if (auto reader = weak.lock()) {
      reader->close();
    }
  }
  BOOST_LOG_TRIVIAL(debug) << "Range reader: Closed";
}

} // namespace chunkvault::reader
