#pragma once

#include <istream>
#include <streambuf>
#include <vector>
#include <memory>
#include "io/byte_source.hpp"

namespace chunkvault {
namespace io {

// Stream buffer pulling from a ByteSource on demand
class SourceStreamBuf : public std::streambuf {
public:
  explicit SourceStreamBuf(ByteSource& source, std::size_t buffer_size = 64 * 1024);

  SourceStreamBuf(const SourceStreamBuf&) = delete;
  SourceStreamBuf& operator=(const SourceStreamBuf&) = delete;

protected:
  int_type underflow() override;

private:
  ByteSource& source_;
  std::vector<char> buffer_;
};


/**
 * std::istream view over a ByteSource. Errors raised by the source are
 * rethrown to the reader instead of only setting badbit, so a retryable
 * TransferError reaches the caller with its context.
 */
class SourceStream : public std::istream {
public:
  // Keeps the source alive for the lifetime of the stream
  explicit SourceStream(std::shared_ptr<ByteSource> source, std::size_t buffer_size = 64 * 1024);
  ~SourceStream() override;

  SourceStream(const SourceStream&) = delete;
  SourceStream& operator=(const SourceStream&) = delete;

  ByteSource& source() { return *source_; }
  void close() { source_->close(); }

private:
  std::shared_ptr<ByteSource> source_;
  SourceStreamBuf buffer_;
};

} // namespace io
} // namespace chunkvault
