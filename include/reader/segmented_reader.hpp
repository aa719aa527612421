#ifndef CHUNKVAULT_READER_SEGMENTED_READER_HPP
#define CHUNKVAULT_READER_SEGMENTED_READER_HPP

#include <cstdint>
#include <exception>
#include <string>
#include <vector>
#include "core/types.hpp"
#include "io/byte_source.hpp"
#include "remote/location_resolver.hpp"
#include "remote/range_fetcher.hpp"
#include "reader/retry_policy.hpp"

namespace chunkvault::reader {

/**
 * Sequential reader over an ordered list of chunk slices, delivering them
 * as one byte stream.
 *
 * A chunk's location is resolved only when the reader reaches it and is
 * used for a single remote read. When an open read fails mid-chunk, the
 * failure is reported to the caller as a TransferError and the next read()
 * resolves the same chunk again, narrowed to the bytes that were not yet
 * delivered. Transfer failures on one chunk are bounded by the retry
 * policy's attempt count, after which the reader fails for good.
 *
 * Not safe for concurrent use.
 */
class SegmentedReader : public io::ByteSource {
public:
  enum class State {
    NeedNextChunk,
    StreamingChunk,
    Exhausted,
    Failed
  };

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // The resolver and fetcher must outlive the reader
  SegmentedReader(std::vector<core::ChunkSlice> slices,
                  remote::LocationResolver& resolver,
                  remote::RangeFetcher& fetcher,
                  RetryPolicy retry_policy = RetryPolicy{});
  ~SegmentedReader() override;

  SegmentedReader(const SegmentedReader&) = delete;
  SegmentedReader& operator=(const SegmentedReader&) = delete;


  // ---- STREAM OPERATIONS ----
  // Delivers up to size bytes, 0 once the requested range is complete
  std::size_t read(char* buffer, std::size_t size) override;
  // Releases the open remote read, if any. Later reads report end of data.
  void close() override;


  // ---- GETTERS ----
  State state() const { return state_; }
  int64_t requested_length() const { return requested_length_; }
  int64_t total_delivered() const { return total_delivered_; }
  // Index into the slice list of the chunk being read
  std::size_t current_slice() const { return current_; }

private:
  // ---- PARAMETERS ----
  std::vector<core::ChunkSlice> slices_;
  remote::LocationResolver& resolver_;
  remote::RangeFetcher& fetcher_;
  RetryPolicy retry_policy_;

  State state_{State::NeedNextChunk};
  std::size_t current_{0};
  io::ByteSourcePtr current_source_;
  int64_t requested_length_{0};
  int64_t total_delivered_{0};
  // Bytes of the current slice already handed to the caller
  int64_t delivered_in_chunk_{0};
  // Interrupted transfers of the current slice
  int transfer_failures_{0};
  std::exception_ptr failure_;


  // ---- STATE TRANSITIONS ----
  // NeedNextChunk -> StreamingChunk for the current slice
  void open_current();
  // Closes the finished slice and moves on, or to Exhausted after the last one
  void finish_current();
  // Drops the broken remote read so the next call reopens the same slice
  void abandon_current(const std::string& reason);
  void release_source();
  void fail(std::exception_ptr error);
};

const char* to_string(SegmentedReader::State state);

} // namespace chunkvault::reader

#endif // CHUNKVAULT_READER_SEGMENTED_READER_HPP
