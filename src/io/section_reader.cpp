#include "io/section_reader.hpp"
#include "core/errors.hpp"
#include <atomic>
#include <chrono>
#include <fstream>
#include <unistd.h>
#include <boost/log/trivial.hpp>

namespace chunkvault {
namespace io {

namespace {

void check_section(int64_t offset, int64_t length, int64_t size) {
  if (offset < 0 || length < 0 || offset + length > size) {
    throw core::ConfigurationError("section " + std::to_string(offset) + "+" +
                                   std::to_string(length) + " is outside a source of " +
                                   std::to_string(size) + " bytes");
  }
}

} // namespace

//==============================================
// LOCAL FILE
//==============================================

LocalFile::LocalFile(const std::filesystem::path& path)
  : path_(path) {
  std::error_code ec;
  auto size = std::filesystem::file_size(path_, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "Local file: Cannot stat " << path_.string() << ": " << ec.message();
    throw core::ConfigurationError("cannot read size of " + path_.string() + ": " + ec.message());
  }
  size_ = static_cast<int64_t>(size);
}

LocalFile::LocalFile(std::filesystem::path path, int64_t size)
  : path_(std::move(path))
  , size_(size) {}

ByteSourcePtr LocalFile::section(int64_t offset, int64_t length) const {
  check_section(offset, length, size_);
  return std::make_unique<FileSectionSource>(path_, offset, length);
}


//==============================================
// STAGING FILE
//==============================================

StagingFile::StagingFile(Token, std::filesystem::path path, int64_t size)
  : LocalFile(std::move(path), size) {}

StagingFile::~StagingFile() {
  std::error_code ec;
  std::filesystem::remove(path_, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(warning) << "Staging: Failed to remove " << path_.string() << ": " << ec.message();
  } else {
    BOOST_LOG_TRIVIAL(debug) << "Staging: Removed " << path_.string();
  }
}

std::filesystem::path StagingFile::unique_path(const std::filesystem::path& directory) {
  static std::atomic<uint64_t> counter{0};
  auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
  return directory / ("chunkvault_staging_" + std::to_string(::getpid()) + "_" +
                      std::to_string(stamp) + "_" + std::to_string(counter++));
}

std::unique_ptr<StagingFile> StagingFile::stage(std::istream& input,
                                                const std::filesystem::path& directory) {
  if (input.bad()) {
    BOOST_LOG_TRIVIAL(error) << "Staging: Invalid input stream";
    throw core::ConfigurationError("Staging: invalid input stream");
  }

  if (!std::filesystem::exists(directory)) {
    std::filesystem::create_directories(directory);
  }

  std::filesystem::path path = unique_path(directory);
  std::ofstream file(path, std::ios::binary);
  if (!file) {
    throw core::ConfigurationError("Staging: failed to create " + path.string());
  }

  // Owns the path from here on so a failed copy does not leak the file
  auto staged = std::make_unique<StagingFile>(Token(), path, 0);

  int64_t bytes_written = 0;
  char buffer[8192];

  // Read input stream in blocks and write to file
  while (input.read(buffer, sizeof(buffer))) {
    file.write(buffer, input.gcount());
    bytes_written += input.gcount();
  }

  // Handle final partial block if present
  if (input.gcount() > 0) {
    file.write(buffer, input.gcount());
    bytes_written += input.gcount();
  }

  if (input.bad()) {
    throw core::ConfigurationError("Staging: input stream failed after " +
                                   std::to_string(bytes_written) + " bytes");
  }

  file.close();
  if (!file) {
    throw core::ConfigurationError("Staging: failed to write " + path.string());
  }

  staged->size_ = bytes_written;
  BOOST_LOG_TRIVIAL(info) << "Staging: Staged " << bytes_written << " bytes at " << path.string();
  return staged;
}


//==============================================
// MEMORY BUFFER
//==============================================

MemoryBuffer::MemoryBuffer(std::string data)
  : data_(std::move(data)) {}

ByteSourcePtr MemoryBuffer::section(int64_t offset, int64_t length) const {
  check_section(offset, length, size());
  return std::make_unique<MemorySource>(data_.substr(static_cast<size_t>(offset),
                                                     static_cast<size_t>(length)));
}

} // namespace io
} // namespace chunkvault
