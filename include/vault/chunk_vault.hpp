#ifndef CHUNKVAULT_VAULT_CHUNK_VAULT_HPP
#define CHUNKVAULT_VAULT_CHUNK_VAULT_HPP

#include <cstdint>
#include <istream>
#include <memory>
#include <ostream>
#include <string>
#include <vector>
#include "core/types.hpp"
#include "io/source_stream.hpp"
#include "metadata/metadata_store.hpp"
#include "planner/chunk_planner.hpp"
#include "reader/chunked_range_reader.hpp"
#include "reader/retry_policy.hpp"
#include "remote/location_resolver.hpp"
#include "remote/range_fetcher.hpp"

namespace chunkvault::vault {

struct VaultConfig {
  planner::PlannerConfig planner;
  reader::RetryPolicy retry;
};

/**
 * Entry point tying the upload planner, the metadata records and the
 * range readers together. Files are addressed by the id returned from put().
 *
 * Collaborators are not owned and must outlive the vault.
 */
class ChunkVault {
public:
  // ---- CONSTRUCTOR ----
  ChunkVault(planner::ChunkStore& store, remote::LocationResolver& resolver,
             remote::RangeFetcher& fetcher, metadata::MetadataStore& metadata,
             VaultConfig config = VaultConfig{});


  // ---- PROCESSING OF USER REQUESTS ----
  // Uploads size bytes of input and records the file, returns its id
  std::string put(const std::string& name, std::istream& input, int64_t size,
                  const planner::UploadProgressFn& progress = {},
                  const planner::CancellationToken* cancel = nullptr);
  std::vector<core::LogicalFile> list() const;
  // Throws MetadataError for unknown or deleted files
  core::LogicalFile stat(const std::string& file_id) const;
  // Read handle over the file. Single-object files appear as one chunk.
  std::unique_ptr<reader::ChunkedRangeReader> open(const std::string& file_id);
  std::shared_ptr<reader::SegmentedReader> range_read(const std::string& file_id,
                                                      const core::RangeRequest& request);
  // std::istream over the requested range. Interrupted transfers are resumed
  // until the reader gives up; the final failure is thrown from the stream.
  std::unique_ptr<io::SourceStream> open_stream(const std::string& file_id,
                                                const core::RangeRequest& request);
  // Writes the requested range to output and returns the byte count.
  // Interrupted transfers are resumed until the reader gives up.
  int64_t download(const std::string& file_id, const core::RangeRequest& request,
                   std::ostream& output);
  // Soft delete, objects stay until purge()
  void remove(const std::string& file_id);
  // Deletes the objects and records of soft-deleted files, returns how many files were purged
  std::size_t purge();


  // ---- GETTERS ----
  const VaultConfig& config() const { return config_; }

private:
  // ---- PARAMETERS ----
  planner::ChunkStore& store_;
  remote::LocationResolver& resolver_;
  remote::RangeFetcher& fetcher_;
  metadata::MetadataStore& metadata_;
  VaultConfig config_;
  planner::ChunkPlanner planner_;

  std::string record(const planner::UploadResult& result);
  std::vector<core::Chunk> chunks_of(const core::LogicalFile& file) const;
};

} // namespace chunkvault::vault

#endif // CHUNKVAULT_VAULT_CHUNK_VAULT_HPP
