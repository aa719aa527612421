#ifndef CHUNKVAULT_PLANNER_CHUNK_PLANNER_HPP
#define CHUNKVAULT_PLANNER_CHUNK_PLANNER_HPP

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <istream>
#include <string>
#include <vector>
#include "core/types.hpp"
#include "io/section_reader.hpp"
#include "planner/chunk_store.hpp"

namespace chunkvault {
namespace planner {

// Receives overall upload progress as a percentage
using UploadProgressFn = std::function<void(double)>;

// Set from any thread, observed by the planner between chunks
class CancellationToken {
public:
  void cancel() { cancelled_.store(true); }
  bool cancelled() const { return cancelled_.load(); }

private:
  std::atomic<bool> cancelled_{false};
};

struct PlannerConfig {
  int64_t max_chunk_size{core::MAX_CHUNK_SIZE};
  int64_t chunk_threshold{core::CHUNK_THRESHOLD};
  // Where forward-only inputs are staged, system temp directory when empty
  std::filesystem::path staging_dir;
};

struct UploadResult {
  core::LogicalFile file;
  // Empty for single-object uploads
  std::vector<core::Chunk> chunks;
};

/**
 * Splits an input into fixed-size chunks and stores each one as its own
 * remote object, strictly in index order. Inputs below the chunking
 * threshold are stored as a single object.
 *
 * A failed chunk aborts the upload with a StorageError naming the chunk.
 * Chunks stored before the failure are left in place.
 */
class ChunkPlanner {
public:
  // ---- CONSTRUCTOR ----
  // The store must outlive the planner
  ChunkPlanner(ChunkStore& store, PlannerConfig config = PlannerConfig{});


  // ---- UPLOAD OPERATIONS ----
  UploadResult upload_chunked(const std::string& name, const io::SectionReader& source,
                              const UploadProgressFn& progress = {},
                              const CancellationToken* cancel = nullptr);

  UploadResult upload_single(const std::string& name, const io::SectionReader& source,
                             const UploadProgressFn& progress = {},
                             const CancellationToken* cancel = nullptr);

  // Stages a forward-only stream of the declared size to a temporary file,
  // then stores it chunked or whole depending on the threshold
  UploadResult plan_and_upload(const std::string& name, std::istream& input, int64_t size,
                               const UploadProgressFn& progress = {},
                               const CancellationToken* cancel = nullptr);

  const PlannerConfig& config() const { return config_; }

private:
  // ---- PARAMETERS ----
  ChunkStore& store_;
  PlannerConfig config_;

  void check_cancelled(const CancellationToken* cancel, const std::string& name) const;
  std::filesystem::path staging_dir() const;
};

// Remote object name of chunk index of a file
std::string chunk_object_name(const std::string& name, int index);

} // namespace planner
} // namespace chunkvault

#endif // CHUNKVAULT_PLANNER_CHUNK_PLANNER_HPP
