#include "io/source_stream.hpp"
#include <boost/log/trivial.hpp>

namespace chunkvault {
namespace io {

SourceStreamBuf::SourceStreamBuf(ByteSource& source, std::size_t buffer_size)
  : source_(source)
  , buffer_(buffer_size == 0 ? 1 : buffer_size) {
  setg(buffer_.data(), buffer_.data(), buffer_.data());
}

SourceStreamBuf::int_type SourceStreamBuf::underflow() {
  if (gptr() < egptr()) {
    return traits_type::to_int_type(*gptr());
  }

  std::size_t count = source_.read(buffer_.data(), buffer_.size());
  if (count == 0) {
    return traits_type::eof();
  }

  setg(buffer_.data(), buffer_.data(), buffer_.data() + count);
  return traits_type::to_int_type(*gptr());
}


SourceStream::SourceStream(std::shared_ptr<ByteSource> source, std::size_t buffer_size)
  : std::istream(nullptr)
  , source_(std::move(source))
  , buffer_(*source_, buffer_size) {
  rdbuf(&buffer_);
  exceptions(std::ios::badbit);
}

SourceStream::~SourceStream() {
  try {
    source_->close();
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(warning) << "Source stream: Error closing source: " << e.what();
  }
}

} // namespace io
} // namespace chunkvault
