#ifndef CHUNKVAULT_IO_BYTE_SOURCE_HPP
#define CHUNKVAULT_IO_BYTE_SOURCE_HPP

#include <cstdint>
#include <cstddef>
#include <string>
#include <fstream>
#include <filesystem>
#include <memory>

namespace chunkvault {
namespace io {

// Sequential, bounded producer of bytes. Implemented by file sections,
// remote HTTP bodies and in-memory buffers.
class ByteSource {
public:
  virtual ~ByteSource() = default;

  // Reads up to size bytes into buffer and returns the count.
  // Returns 0 only once the source is exhausted; failures throw.
  virtual std::size_t read(char* buffer, std::size_t size) = 0;
  // Releases the underlying resource, safe to call more than once
  virtual void close() = 0;
};

using ByteSourcePtr = std::unique_ptr<ByteSource>;


class MemorySource : public ByteSource {
public:
  explicit MemorySource(std::string data);

  std::size_t read(char* buffer, std::size_t size) override;
  void close() override;

  std::size_t remaining() const { return data_.size() - position_; }

private:
  std::string data_;
  std::size_t position_{0};
  bool closed_{false};
};


// Reads [offset, offset + length) of a local file
class FileSectionSource : public ByteSource {
public:
  FileSectionSource(const std::filesystem::path& path, int64_t offset, int64_t length);
  ~FileSectionSource() override;

  std::size_t read(char* buffer, std::size_t size) override;
  void close() override;

  int64_t remaining() const { return remaining_; }

private:
  std::filesystem::path path_;
  std::ifstream file_;
  int64_t remaining_;
};

} // namespace io
} // namespace chunkvault

#endif // CHUNKVAULT_IO_BYTE_SOURCE_HPP
