#include "io/byte_source.hpp"
#include "core/errors.hpp"
#include <algorithm>
#include <cstring>
#include <boost/log/trivial.hpp>

namespace chunkvault {
namespace io {

//==============================================
// MEMORY SOURCE
//==============================================

MemorySource::MemorySource(std::string data)
  : data_(std::move(data)) {}

std::size_t MemorySource::read(char* buffer, std::size_t size) {
  if (closed_) {
    throw core::TransferError("Memory source: read after close");
  }

  std::size_t count = std::min(size, data_.size() - position_);
  if (count > 0) {
    std::memcpy(buffer, data_.data() + position_, count);
    position_ += count;
  }
  return count;
}

void MemorySource::close() {
  closed_ = true;
}


//==============================================
// FILE SECTION SOURCE
//==============================================

FileSectionSource::FileSectionSource(const std::filesystem::path& path, int64_t offset, int64_t length)
  : path_(path)
  , remaining_(length) {
  if (offset < 0 || length < 0) {
    throw core::ConfigurationError("File section: invalid section " + std::to_string(offset) +
                                   "+" + std::to_string(length) + " of " + path.string());
  }

  // Open file in binary mode so offsets match the on-disk bytes
  file_.open(path_, std::ios::binary);
  if (!file_) {
    BOOST_LOG_TRIVIAL(error) << "File section: Failed to open file: " << path_.string();
    throw core::TransferError("File section: failed to open " + path_.string());
  }

  file_.seekg(offset);
  if (!file_) {
    throw core::TransferError("File section: failed to seek to " + std::to_string(offset) +
                              " in " + path_.string());
  }

  BOOST_LOG_TRIVIAL(trace) << "File section: Opened " << path_.string() << " at " << offset
                           << " for " << length << " bytes";
}

FileSectionSource::~FileSectionSource() {
  close();
}

std::size_t FileSectionSource::read(char* buffer, std::size_t size) {
  if (remaining_ == 0 || size == 0) {
    return 0;
  }
  if (!file_.is_open()) {
    throw core::TransferError("File section: read after close of " + path_.string());
  }

  std::size_t wanted = static_cast<std::size_t>(std::min<int64_t>(static_cast<int64_t>(size), remaining_));
  file_.read(buffer, static_cast<std::streamsize>(wanted));
  std::size_t count = static_cast<std::size_t>(file_.gcount());

  // The file is shorter than the section it was opened for
  if (count == 0) {
    BOOST_LOG_TRIVIAL(error) << "File section: Unexpected end of file in " << path_.string()
                             << " with " << remaining_ << " bytes outstanding";
    throw core::TransferError("File section: unexpected end of " + path_.string());
  }

  remaining_ -= static_cast<int64_t>(count);
  return count;
}

void FileSectionSource::close() {
  if (file_.is_open()) {
    file_.close();
  }
}

} // namespace io
} // namespace chunkvault
