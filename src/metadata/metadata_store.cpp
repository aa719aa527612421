#include "metadata/metadata_store.hpp"
#include "core/errors.hpp"
#include "utils/digest.hpp"
#include <boost/log/trivial.hpp>

namespace chunkvault::metadata {

std::string MemoryMetadataStore::create_logical_file(const core::LogicalFile& file) {
  std::lock_guard<std::mutex> lock(mutex_);

  std::string id = utils::random_hex(8);
  while (entries_.count(id) != 0) {
    id = utils::random_hex(8);
  }

  Entry entry;
  entry.file = file;
  entry.file.id = id;
  entries_.emplace(id, std::move(entry));

  BOOST_LOG_TRIVIAL(debug) << "Metadata: Created file " << id << " (" << file.name << ", "
                           << file.total_size << " bytes)";
  return id;
}

void MemoryMetadataStore::create_chunk(const std::string& file_id, const core::Chunk& chunk) {
  std::lock_guard<std::mutex> lock(mutex_);
  Entry& e = entry(file_id);

  if (!e.file.chunked) {
    throw core::MetadataError("file " + file_id + " is stored as a single object");
  }
  if (!e.chunks.emplace(chunk.index, chunk).second) {
    throw core::MetadataError("chunk " + std::to_string(chunk.index) + " of file " + file_id +
                              " already exists");
  }
}

std::vector<core::Chunk> MemoryMetadataStore::list_chunks(const std::string& file_id,
                                                          bool include_deleted) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = entries_.find(file_id);
  if (it == entries_.end()) {
    throw core::MetadataError("unknown file " + file_id);
  }

  // std::map keeps the chunks ordered by index
  std::vector<core::Chunk> chunks;
  for (const auto& [index, chunk] : it->second.chunks) {
    if (include_deleted || !chunk.deleted) {
      chunks.push_back(chunk);
    }
  }
  return chunks;
}

std::optional<core::LogicalFile> MemoryMetadataStore::find_file(const std::string& file_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = entries_.find(file_id);
  if (it == entries_.end()) {
    return std::nullopt;
  }
  return it->second.file;
}

std::vector<core::LogicalFile> MemoryMetadataStore::list_files(bool include_deleted) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<core::LogicalFile> files;
  for (const auto& [id, e] : entries_) {
    if (include_deleted || !e.file.deleted) {
      files.push_back(e.file);
    }
  }
  return files;
}

void MemoryMetadataStore::mark_deleted(const std::string& file_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  Entry& e = entry(file_id);

  e.file.deleted = true;
  for (auto& [index, chunk] : e.chunks) {
    chunk.deleted = true;
  }
  BOOST_LOG_TRIVIAL(debug) << "Metadata: Marked file " << file_id << " and " << e.chunks.size()
                           << " chunks deleted";
}

void MemoryMetadataStore::erase(const std::string& file_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (entries_.erase(file_id) == 0) {
    throw core::MetadataError("unknown file " + file_id);
  }
}

MemoryMetadataStore::Entry& MemoryMetadataStore::entry(const std::string& file_id) {
  auto it = entries_.find(file_id);
  if (it == entries_.end()) {
    throw core::MetadataError("unknown file " + file_id);
  }
  return it->second;
}

} // namespace chunkvault::metadata
