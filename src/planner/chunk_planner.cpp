#include "planner/chunk_planner.hpp"
#include "core/chunk_layout.hpp"
#include "core/errors.hpp"
#include <boost/log/trivial.hpp>

namespace chunkvault {
namespace planner {

std::string chunk_object_name(const std::string& name, int index) {
  return name + ".chunk" + std::to_string(index);
}

//==============================================
// CONSTRUCTOR
//==============================================

ChunkPlanner::ChunkPlanner(ChunkStore& store, PlannerConfig config)
  : store_(store)
  , config_(std::move(config)) {
  if (config_.max_chunk_size <= 0) {
    throw core::ConfigurationError("max chunk size must be positive");
  }
  BOOST_LOG_TRIVIAL(debug) << "Planner: Max chunk size " << config_.max_chunk_size
                           << ", chunking threshold " << config_.chunk_threshold;
}


//==============================================
// UPLOAD OPERATIONS
//==============================================

UploadResult ChunkPlanner::upload_chunked(const std::string& name, const io::SectionReader& source,
                                          const UploadProgressFn& progress,
                                          const CancellationToken* cancel) {
  const int64_t total_size = source.size();
  if (total_size <= 0) {
    throw core::ConfigurationError("cannot chunk empty input " + name);
  }

  std::vector<core::ChunkBounds> bounds = core::plan(total_size, config_.max_chunk_size);
  const double count = static_cast<double>(bounds.size());
  BOOST_LOG_TRIVIAL(info) << "Planner: Uploading " << name << " (" << total_size << " bytes) as "
                          << bounds.size() << " chunks";

  UploadResult result;
  result.file.name = name;
  result.file.total_size = total_size;
  result.file.chunk_size = config_.max_chunk_size;
  result.file.chunked = true;
  result.chunks.reserve(bounds.size());

  for (const auto& bound : bounds) {
    // Chunks already stored stay in place if the upload stops here
    check_cancelled(cancel, name);

    const std::string object_name = chunk_object_name(name, bound.index);
    ProgressFn chunk_progress = [&progress, &bound, count](double fraction) {
      if (progress) {
        progress((bound.index + fraction) / count * 100.0);
      }
    };

    StoredObject stored;
    try {
      io::ByteSourcePtr section = source.section(bound.start, bound.size());
      stored = store_.store_chunk(object_name, *section, bound.size(), chunk_progress);
    }
    catch (const std::exception& e) {
      BOOST_LOG_TRIVIAL(error) << "Planner: Failed to store chunk " << bound.index << " of "
                               << name << ": " << e.what();
      throw core::StorageError(bound.index, e.what());
    }

    core::Chunk chunk;
    chunk.index = bound.index;
    chunk.start_offset = bound.start;
    chunk.end_offset = bound.end;
    chunk.remote_ref = stored.remote_ref;
    chunk.checksum = stored.checksum;
    result.chunks.push_back(chunk);

    BOOST_LOG_TRIVIAL(debug) << "Planner: Stored chunk " << bound.index << " [" << bound.start
                             << ", " << bound.end << ") as " << stored.remote_ref;
  }

  if (progress) {
    progress(100.0);
  }
  BOOST_LOG_TRIVIAL(info) << "Planner: Uploaded " << name << " in " << result.chunks.size() << " chunks";
  return result;
}

UploadResult ChunkPlanner::upload_single(const std::string& name, const io::SectionReader& source,
                                         const UploadProgressFn& progress,
                                         const CancellationToken* cancel) {
  check_cancelled(cancel, name);

  const int64_t total_size = source.size();
  BOOST_LOG_TRIVIAL(info) << "Planner: Uploading " << name << " (" << total_size
                          << " bytes) as a single object";

  ProgressFn object_progress = [&progress](double fraction) {
    if (progress) {
      progress(fraction * 100.0);
    }
  };

  StoredObject stored;
  try {
    io::ByteSourcePtr section = source.section(0, total_size);
    stored = store_.store_chunk(name, *section, total_size, object_progress);
  }
  catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Planner: Failed to store " << name << ": " << e.what();
    throw core::StorageError(0, e.what());
  }

  UploadResult result;
  result.file.name = name;
  result.file.total_size = total_size;
  result.file.chunk_size = total_size;
  result.file.chunked = false;
  result.file.remote_ref = stored.remote_ref;
  result.file.checksum = stored.checksum;

  if (progress) {
    progress(100.0);
  }
  return result;
}

UploadResult ChunkPlanner::plan_and_upload(const std::string& name, std::istream& input, int64_t size,
                                           const UploadProgressFn& progress,
                                           const CancellationToken* cancel) {
  if (size < 0) {
    throw core::ConfigurationError("negative size " + std::to_string(size) + " for " + name);
  }
  check_cancelled(cancel, name);

  // Removed when this function returns, whatever the outcome
  std::unique_ptr<io::StagingFile> staged = io::StagingFile::stage(input, staging_dir());
  if (staged->size() != size) {
    BOOST_LOG_TRIVIAL(error) << "Planner: " << name << " declared " << size
                             << " bytes but the stream held " << staged->size();
    throw core::ConfigurationError("declared size " + std::to_string(size) + " of " + name +
                                   " does not match the " + std::to_string(staged->size()) +
                                   " bytes read");
  }

  if (core::requires_chunking(size, config_.chunk_threshold)) {
    return upload_chunked(name, *staged, progress, cancel);
  }
  return upload_single(name, *staged, progress, cancel);
}


//==============================================
// UTILITY METHODS
//==============================================

void ChunkPlanner::check_cancelled(const CancellationToken* cancel, const std::string& name) const {
  if (cancel && cancel->cancelled()) {
    BOOST_LOG_TRIVIAL(warning) << "Planner: Upload of " << name << " cancelled";
    throw core::CancelledError("upload of " + name);
  }
}

std::filesystem::path ChunkPlanner::staging_dir() const {
  if (config_.staging_dir.empty()) {
    return std::filesystem::temp_directory_path();
  }
  return config_.staging_dir;
}

} // namespace planner
} // namespace chunkvault
