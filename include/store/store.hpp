#pragma once

#include <string>
#include <filesystem>
#include <mutex>
#include <stdexcept>
#include "planner/chunk_store.hpp"
#include "remote/location_resolver.hpp"

namespace chunkvault {
namespace store {

/**
 * Directory-backed object store.
 *
 * Every stored object gets a random reference; its file lives under a
 * path derived from the SHA-256 of that reference. Locations handed out
 * by resolve() are file:// URLs read by the FileRangeFetcher.
 */
class Store : public planner::ChunkStore, public remote::LocationResolver {
public:

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit Store(const std::string& base_path);


  // ---- CORE STORAGE OPERATIONS ----
  // Writes size bytes from source as a new object and returns its reference and SHA-1
  planner::StoredObject store_chunk(const std::string& name, io::ByteSource& source,
                                    int64_t size, const planner::ProgressFn& progress) override;
  // Removes the object with the given reference, false if it does not exist
  bool remove(const std::string& remote_ref) override;
  // Removes all stored objects and resets the store
  void clear();


  // ---- QUERY OPERATIONS ----
  // Checks if an object exists for the reference
  bool has(const std::string& remote_ref) const;
  // Returns the size of the stored object in bytes
  std::uintmax_t object_size(const std::string& remote_ref) const;
  // file:// location of the object, ChunkMissingError if there is none
  std::string resolve(const std::string& remote_ref) override;

  const std::filesystem::path& base_path() const { return base_path_; }

private:
  // ---- PARAMETERS ----
  // Root path for all stored objects
  std::filesystem::path base_path_;
  // Guards directory creation and cleanup
  mutable std::mutex mutex_;


  // ---- CAS STORAGE SUPPORT ----
  // SHA-256 of the reference
  std::string hash_key(const std::string& key) const;
  // {base_path}/{hash[0:2]}/{hash[2:4]}/{hash[4:6]}/{remaining_hash}
  std::filesystem::path get_path_for_hash(const std::string& hash) const;


  // ---- UTILITY METHODS ----
  void check_directory_exists(const std::filesystem::path& path) const;
  std::filesystem::path resolve_key_path(const std::string& key) const;
  void verify_file_exists(const std::filesystem::path& file_path) const;
  // Removes empty directories between file_path and base_path_
  void prune_directories(const std::filesystem::path& file_path) const;
};

class StoreError : public std::runtime_error {
public:
  explicit StoreError(const std::string& message) : std::runtime_error(message) {}
};

} // namespace store
} // namespace chunkvault
