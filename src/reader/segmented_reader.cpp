#include "reader/segmented_reader.hpp"
#include "core/errors.hpp"
#include <algorithm>
#include <boost/log/trivial.hpp>

namespace chunkvault::reader {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

SegmentedReader::SegmentedReader(std::vector<core::ChunkSlice> slices,
                                 remote::LocationResolver& resolver,
                                 remote::RangeFetcher& fetcher,
                                 RetryPolicy retry_policy)
  : slices_(std::move(slices))
  , resolver_(resolver)
  , fetcher_(fetcher)
  , retry_policy_(std::move(retry_policy)) {
  for (const auto& slice : slices_) {
    requested_length_ += slice.length;
  }

  if (slices_.empty()) {
    state_ = State::Exhausted;
  }

  BOOST_LOG_TRIVIAL(debug) << "Segmented reader: Created over " << slices_.size()
                           << " chunks, " << requested_length_ << " bytes";
}

SegmentedReader::~SegmentedReader() {
  release_source();
}


//==============================================
// STREAM OPERATIONS
//==============================================

std::size_t SegmentedReader::read(char* buffer, std::size_t size) {
  if (state_ == State::Failed) {
    std::rethrow_exception(failure_);
  }
  if (state_ == State::Exhausted || size == 0) {
    return 0;
  }

  while (true) {
    if (current_ >= slices_.size()) {
      state_ = State::Exhausted;
      return 0;
    }

    if (state_ == State::NeedNextChunk) {
      open_current();
    }

    const core::ChunkSlice& slice = slices_[current_];
    int64_t left = slice.length - delivered_in_chunk_;
    if (left <= 0) {
      finish_current();
      if (state_ == State::Exhausted) {
        return 0;
      }
      continue;
    }

    auto want = static_cast<std::size_t>(std::min<int64_t>(static_cast<int64_t>(size), left));
    std::size_t count = 0;
    try {
      count = current_source_->read(buffer, want);
    }
    catch (const core::TransientError& e) {
      abandon_current(e.what());
    }
    catch (const std::exception& e) {
      BOOST_LOG_TRIVIAL(error) << "Segmented reader: Chunk " << slice.chunk.index
                               << " read failed: " << e.what();
      release_source();
      fail(std::current_exception());
      throw;
    }

    if (count == 0) {
      // A source that ends before its bounds is an interrupted transfer
      abandon_current("remote read ended " + std::to_string(left) + " bytes early");
    }

    delivered_in_chunk_ += static_cast<int64_t>(count);
    total_delivered_ += static_cast<int64_t>(count);

    if (delivered_in_chunk_ == slice.length) {
      finish_current();
    }
    return count;
  }
}

void SegmentedReader::close() {
  release_source();
  if (state_ != State::Failed) {
    state_ = State::Exhausted;
  }
}


//==============================================
// STATE TRANSITIONS
//==============================================

void SegmentedReader::open_current() {
  const core::ChunkSlice& slice = slices_[current_];
  const int index = slice.chunk.index;
  // Resume after the bytes the caller already has
  const int64_t offset = slice.offset + delivered_in_chunk_;
  const int64_t length = slice.length - delivered_in_chunk_;

  if (transfer_failures_ > 0 && retry_policy_.sleeper) {
    retry_policy_.sleeper(retry_policy_.delay_after(transfer_failures_));
  }

  try {
    current_source_ = retry_policy_.run(index, "resolve and open", [&]() {
      std::string location = resolver_.resolve(slice.chunk.remote_ref);
      return fetcher_.open(location, offset, length);
    });
  }
  catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Segmented reader: Cannot open chunk " << index << ": " << e.what();
    fail(std::current_exception());
    throw;
  }

  state_ = State::StreamingChunk;
  BOOST_LOG_TRIVIAL(debug) << "Segmented reader: Streaming chunk " << index << " bytes "
                           << offset << "+" << length;
}

void SegmentedReader::finish_current() {
  release_source();
  BOOST_LOG_TRIVIAL(trace) << "Segmented reader: Finished chunk " << slices_[current_].chunk.index;

  ++current_;
  delivered_in_chunk_ = 0;
  transfer_failures_ = 0;
  state_ = current_ < slices_.size() ? State::NeedNextChunk : State::Exhausted;
}

void SegmentedReader::abandon_current(const std::string& reason) {
  const int index = slices_[current_].chunk.index;
  release_source();
  state_ = State::NeedNextChunk;
  ++transfer_failures_;

  if (transfer_failures_ >= retry_policy_.max_attempts) {
    BOOST_LOG_TRIVIAL(error) << "Segmented reader: Chunk " << index << " transfer failed "
                             << transfer_failures_ << " times: " << reason;
    fail(std::make_exception_ptr(
      core::RetryExhaustedError(index, transfer_failures_, "transfer", reason)));
    std::rethrow_exception(failure_);
  }

  BOOST_LOG_TRIVIAL(warning) << "Segmented reader: Chunk " << index << " interrupted after "
                             << delivered_in_chunk_ << " bytes (" << transfer_failures_ << "/"
                             << retry_policy_.max_attempts << "): " << reason;
  throw core::TransferError("chunk " + std::to_string(index) + " interrupted after " +
                            std::to_string(delivered_in_chunk_) + " bytes: " + reason);
}

void SegmentedReader::release_source() {
  if (!current_source_) {
    return;
  }
  try {
    current_source_->close();
  }
  catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(warning) << "Segmented reader: Error closing remote read: " << e.what();
  }
  current_source_.reset();
}

void SegmentedReader::fail(std::exception_ptr error) {
  state_ = State::Failed;
  failure_ = std::move(error);
}

const char* to_string(SegmentedReader::State state) {
  switch (state) {
    case SegmentedReader::State::NeedNextChunk: return "NeedNextChunk";
    case SegmentedReader::State::StreamingChunk: return "StreamingChunk";
    case SegmentedReader::State::Exhausted: return "Exhausted";
    case SegmentedReader::State::Failed: return "Failed";
  }
  return "Unknown";
}

} // namespace chunkvault::reader
