#ifndef CHUNKVAULT_IO_SECTION_READER_HPP
#define CHUNKVAULT_IO_SECTION_READER_HPP

#include <cstdint>
#include <string>
#include <istream>
#include <filesystem>
#include <memory>
#include "io/byte_source.hpp"

namespace chunkvault {
namespace io {

// Random-access input of known size that hands out bounded sub-streams
class SectionReader {
public:
  virtual ~SectionReader() = default;

  virtual int64_t size() const = 0;
  // Returns a source over [offset, offset + length)
  virtual ByteSourcePtr section(int64_t offset, int64_t length) const = 0;
};


// Existing file on local disk, not owned
class LocalFile : public SectionReader {
public:
  explicit LocalFile(const std::filesystem::path& path);

  int64_t size() const override { return size_; }
  ByteSourcePtr section(int64_t offset, int64_t length) const override;

  const std::filesystem::path& path() const { return path_; }

protected:
  LocalFile(std::filesystem::path path, int64_t size);

  std::filesystem::path path_;
  int64_t size_;
};


// Temporary seekable copy of a forward-only stream. The file is removed
// when the object is destroyed.
class StagingFile : public LocalFile {
  // Only stage() can name a Token, so only it constructs staging files
  struct Token {
    explicit Token() = default;
  };

public:
  StagingFile(Token, std::filesystem::path path, int64_t size);
  StagingFile(const StagingFile&) = delete;
  StagingFile& operator=(const StagingFile&) = delete;
  ~StagingFile() override;

  // Copies input to a new file under directory until end of stream
  static std::unique_ptr<StagingFile> stage(std::istream& input,
                                            const std::filesystem::path& directory);

private:
  static std::filesystem::path unique_path(const std::filesystem::path& directory);
};


// In-memory buffer, used for small payloads and tests
class MemoryBuffer : public SectionReader {
public:
  explicit MemoryBuffer(std::string data);

  int64_t size() const override { return static_cast<int64_t>(data_.size()); }
  ByteSourcePtr section(int64_t offset, int64_t length) const override;

private:
  std::string data_;
};

} // namespace io
} // namespace chunkvault

#endif // CHUNKVAULT_IO_SECTION_READER_HPP
