#ifndef CHUNKVAULT_METADATA_METADATA_STORE_HPP
#define CHUNKVAULT_METADATA_METADATA_STORE_HPP

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "core/types.hpp"

namespace chunkvault::metadata {

// Persistence of logical files and their chunk records
class MetadataStore {
public:
  virtual ~MetadataStore() = default;

  // Stores the file record and returns its new id
  virtual std::string create_logical_file(const core::LogicalFile& file) = 0;
  virtual void create_chunk(const std::string& file_id, const core::Chunk& chunk) = 0;
  // Chunks of a file ordered by index, soft-deleted ones only on request
  virtual std::vector<core::Chunk> list_chunks(const std::string& file_id,
                                               bool include_deleted = false) const = 0;
  virtual std::optional<core::LogicalFile> find_file(const std::string& file_id) const = 0;
  virtual std::vector<core::LogicalFile> list_files(bool include_deleted = false) const = 0;
  // Soft delete of the file and all of its chunks
  virtual void mark_deleted(const std::string& file_id) = 0;
  // Drops every record of the file for good
  virtual void erase(const std::string& file_id) = 0;
};


class MemoryMetadataStore : public MetadataStore {
public:
  std::string create_logical_file(const core::LogicalFile& file) override;
  void create_chunk(const std::string& file_id, const core::Chunk& chunk) override;
  std::vector<core::Chunk> list_chunks(const std::string& file_id,
                                       bool include_deleted = false) const override;
  std::optional<core::LogicalFile> find_file(const std::string& file_id) const override;
  std::vector<core::LogicalFile> list_files(bool include_deleted = false) const override;
  void mark_deleted(const std::string& file_id) override;
  void erase(const std::string& file_id) override;

private:
  struct Entry {
    core::LogicalFile file;
    std::map<int, core::Chunk> chunks;
  };

  mutable std::mutex mutex_;
  std::map<std::string, Entry> entries_;

  Entry& entry(const std::string& file_id);
};

} // namespace chunkvault::metadata

#endif // CHUNKVAULT_METADATA_METADATA_STORE_HPP
