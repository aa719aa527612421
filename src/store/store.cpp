#include "store/store.hpp"
#include "core/errors.hpp"
#include "utils/digest.hpp"
#include <algorithm>
#include <fstream>
#include <vector>
#include <boost/log/trivial.hpp>

namespace chunkvault {
namespace store {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

// Initialize store with base directory path and ensure it exists
Store::Store(const std::string& base_path) : base_path_(std::filesystem::absolute(base_path)) {
  BOOST_LOG_TRIVIAL(info) << "Store: Initializing Store with base path: " << base_path_.string();
  check_directory_exists(base_path_);
}


//==============================================
// CORE STORAGE OPERATIONS
//==============================================

planner::StoredObject Store::store_chunk(const std::string& name, io::ByteSource& source,
                                         int64_t size, const planner::ProgressFn& progress) {
  if (size < 0) {
    throw StoreError("Store: Negative object size for " + name);
  }

  // Fresh reference for every write, never reused
  std::string remote_ref = utils::random_hex(16);
  std::filesystem::path file_path = resolve_key_path(remote_ref);
  {
    std::lock_guard<std::mutex> lock(mutex_);
    check_directory_exists(file_path.parent_path());
  }
  BOOST_LOG_TRIVIAL(info) << "Store: Storing " << name << " (" << size << " bytes) as " << remote_ref;

  // Written under a temporary name so a partial object is never visible
  std::filesystem::path part_path = file_path;
  part_path += ".part";

  utils::Digest digest(utils::Digest::Algorithm::Sha1);
  int64_t written = 0;

  try {
    std::ofstream file(part_path, std::ios::binary);
    if (!file) {
      throw StoreError("Store: Failed to create file: " + part_path.string());
    }

    std::vector<char> buffer(64 * 1024);
    while (written < size) {
      auto want = static_cast<std::size_t>(
        std::min<int64_t>(static_cast<int64_t>(buffer.size()), size - written));
      std::size_t count = source.read(buffer.data(), want);
      if (count == 0) {
        throw StoreError("Store: Source of " + name + " ended after " + std::to_string(written) +
                         " of " + std::to_string(size) + " bytes");
      }

      file.write(buffer.data(), static_cast<std::streamsize>(count));
      if (!file) {
        throw StoreError("Store: Failed to write to " + part_path.string());
      }
      digest.update(buffer.data(), count);
      written += static_cast<int64_t>(count);

      if (progress) {
        progress(static_cast<double>(written) / static_cast<double>(size));
      }
    }

    file.close();
    if (!file) {
      throw StoreError("Store: Failed to flush " + part_path.string());
    }
    std::filesystem::rename(part_path, file_path);
  }
  catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Store: Failed to store " << name << ": " << e.what();
    std::error_code ec;
    std::filesystem::remove(part_path, ec);
    throw;
  }
  source.close();

  if (size == 0 && progress) {
    progress(1.0);
  }

  planner::StoredObject stored{remote_ref, digest.hex_digest()};
  BOOST_LOG_TRIVIAL(info) << "Store: Successfully stored " << written << " bytes of " << name
                          << " (sha1 " << stored.checksum << ")";
  return stored;
}

bool Store::remove(const std::string& remote_ref) {
  BOOST_LOG_TRIVIAL(info) << "Store: Removing object: " << remote_ref;

  std::filesystem::path file_path = resolve_key_path(remote_ref);

  std::lock_guard<std::mutex> lock(mutex_);
  if (!std::filesystem::exists(file_path)) {
    BOOST_LOG_TRIVIAL(debug) << "Store: Nothing stored for " << remote_ref;
    return false;
  }

  std::error_code ec;
  if (!std::filesystem::remove(file_path, ec) || ec) {
    BOOST_LOG_TRIVIAL(error) << "Store: Failed to remove object: " << remote_ref << ": " << ec.message();
    throw StoreError("Store: Failed to remove object " + remote_ref);
  }

  // Clean up empty parent directories up to base_path_
  prune_directories(file_path);
  BOOST_LOG_TRIVIAL(info) << "Store: Successfully removed object: " << remote_ref;
  return true;
}

void Store::clear() {
  BOOST_LOG_TRIVIAL(info) << "Store: Clearing entire store at: " << base_path_.string();
  std::lock_guard<std::mutex> lock(mutex_);
  std::filesystem::remove_all(base_path_);
  check_directory_exists(base_path_);
  BOOST_LOG_TRIVIAL(info) << "Store: Store cleared successfully";
}


//==============================================
// QUERY OPERATIONS
//==============================================

bool Store::has(const std::string& remote_ref) const {
  std::filesystem::path file_path = resolve_key_path(remote_ref);
  bool exists = std::filesystem::exists(file_path);

  BOOST_LOG_TRIVIAL(debug) << "Store: Object " << remote_ref << (exists ? " exists" : " not found")
                           << " at path: " << file_path.string();
  return exists;
}

std::uintmax_t Store::object_size(const std::string& remote_ref) const {
  std::filesystem::path file_path = resolve_key_path(remote_ref);
  verify_file_exists(file_path);
  return std::filesystem::file_size(file_path);
}

std::string Store::resolve(const std::string& remote_ref) {
  std::filesystem::path file_path = resolve_key_path(remote_ref);
  if (!std::filesystem::exists(file_path)) {
    BOOST_LOG_TRIVIAL(error) << "Store: No object for reference " << remote_ref;
    throw core::ChunkMissingError("no object stored for reference " + remote_ref);
  }
  return "file://" + file_path.string();
}


//==============================================
// CAS STORAGE SUPPORT
//==============================================

std::string Store::hash_key(const std::string& key) const {
  try {
    return utils::Digest::hex(utils::Digest::Algorithm::Sha256, key);
  }
  catch (const utils::DigestError& e) {
    throw StoreError("Store: Failed to hash key: " + std::string(e.what()));
  }
}

std::filesystem::path Store::get_path_for_hash(const std::string& hash) const {
  std::filesystem::path path = base_path_;

  for (size_t i = 0; i < 6; i += 2) {
    path /= hash.substr(i, 2);
  }

  path /= hash.substr(6);
  return path;
}


//==============================================
// UTILITY METHODS
//==============================================

void Store::check_directory_exists(const std::filesystem::path& path) const {
  if (!std::filesystem::exists(path)) {
    std::filesystem::create_directories(path);
  }
}

std::filesystem::path Store::resolve_key_path(const std::string& key) const {
  if (key.empty()) {
    throw StoreError("Store: Empty object reference");
  }
  return get_path_for_hash(hash_key(key));
}

void Store::verify_file_exists(const std::filesystem::path& file_path) const {
  if (!std::filesystem::exists(file_path)) {
    BOOST_LOG_TRIVIAL(error) << "Store: File not found: " << file_path.string();
    throw StoreError("Store: File not found");
  }
}

void Store::prune_directories(const std::filesystem::path& file_path) const {
  auto current = file_path.parent_path();
  while (current != base_path_ && std::filesystem::is_empty(current)) {
    std::filesystem::remove(current);
    current = current.parent_path();
  }
}

} // namespace store
} // namespace chunkvault
