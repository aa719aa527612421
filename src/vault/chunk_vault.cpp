#include "vault/chunk_vault.hpp"
#include "core/chunk_layout.hpp"
#include "core/errors.hpp"
#include <vector>
#include <boost/log/trivial.hpp>

namespace chunkvault::vault {

namespace {

// Reads through a segmented reader, resuming after every transient error
// until the reader delivers the range or fails for good
class ResumingSource : public io::ByteSource {
public:
  ResumingSource(std::shared_ptr<reader::SegmentedReader> reader, std::string name)
    : reader_(std::move(reader)), name_(std::move(name)) {}

  std::size_t read(char* buffer, std::size_t size) override {
    while (true) {
      try {
        return reader_->read(buffer, size);
      }
      catch (const core::TransientError& e) {
        // The reader resumes the chunk on the next call or fails for good
        BOOST_LOG_TRIVIAL(warning) << "Vault: Resuming read of " << name_ << ": " << e.what();
      }
    }
  }

  void close() override { reader_->close(); }

private:
  std::shared_ptr<reader::SegmentedReader> reader_;
  std::string name_;
};

} // namespace

//==============================================
// CONSTRUCTOR
//==============================================

ChunkVault::ChunkVault(planner::ChunkStore& store, remote::LocationResolver& resolver,
                       remote::RangeFetcher& fetcher, metadata::MetadataStore& metadata,
                       VaultConfig config)
  : store_(store)
  , resolver_(resolver)
  , fetcher_(fetcher)
  , metadata_(metadata)
  , config_(std::move(config))
  , planner_(store_, config_.planner) {
  BOOST_LOG_TRIVIAL(info) << "Vault: Initialized with " << config_.retry.max_attempts
                          << " attempts per chunk";
}


//==============================================
// PROCESSING OF USER REQUESTS
//==============================================

std::string ChunkVault::put(const std::string& name, std::istream& input, int64_t size,
                            const planner::UploadProgressFn& progress,
                            const planner::CancellationToken* cancel) {
  if (name.empty()) {
    throw core::ConfigurationError("file name must not be empty");
  }
  BOOST_LOG_TRIVIAL(info) << "Vault: Storing " << name << " (" << size << " bytes)";

  planner::UploadResult result = planner_.plan_and_upload(name, input, size, progress, cancel);
  std::string id = record(result);

  BOOST_LOG_TRIVIAL(info) << "Vault: Stored " << name << " as " << id;
  return id;
}

std::vector<core::LogicalFile> ChunkVault::list() const {
  return metadata_.list_files();
}

core::LogicalFile ChunkVault::stat(const std::string& file_id) const {
  auto file = metadata_.find_file(file_id);
  if (!file || file->deleted) {
    throw core::MetadataError("no such file: " + file_id);
  }
  return *file;
}

std::unique_ptr<reader::ChunkedRangeReader> ChunkVault::open(const std::string& file_id) {
  core::LogicalFile file = stat(file_id);
  return std::make_unique<reader::ChunkedRangeReader>(chunks_of(file), file.total_size,
                                                      resolver_, fetcher_, config_.retry);
}

std::shared_ptr<reader::SegmentedReader> ChunkVault::range_read(const std::string& file_id,
                                                                const core::RangeRequest& request) {
  return open(file_id)->range_read(request);
}

std::unique_ptr<io::SourceStream> ChunkVault::open_stream(const std::string& file_id,
                                                         const core::RangeRequest& request) {
  core::LogicalFile file = stat(file_id);
  if (file.total_size == 0 && request.start == 0) {
    return std::make_unique<io::SourceStream>(std::make_shared<io::MemorySource>(std::string()));
  }
  return std::make_unique<io::SourceStream>(
    std::make_shared<ResumingSource>(range_read(file_id, request), file.name));
}

int64_t ChunkVault::download(const std::string& file_id, const core::RangeRequest& request,
                             std::ostream& output) {
  core::LogicalFile file = stat(file_id);
  if (file.total_size == 0 && request.start == 0) {
    BOOST_LOG_TRIVIAL(debug) << "Vault: " << file.name << " is empty";
    return 0;
  }

  std::shared_ptr<reader::SegmentedReader> reader = range_read(file_id, request);
  BOOST_LOG_TRIVIAL(info) << "Vault: Downloading " << reader->requested_length() << " bytes of "
                          << file.name;

  ResumingSource source(reader, file.name);
  std::vector<char> buffer(64 * 1024);
  while (std::size_t count = source.read(buffer.data(), buffer.size())) {
    output.write(buffer.data(), static_cast<std::streamsize>(count));
    if (!output) {
      source.close();
      throw core::ChunkVaultError("Failed to write download of " + file.name);
    }
  }

  if (reader->total_delivered() != reader->requested_length()) {
    throw core::ChunkVaultError("Download of " + file.name + " delivered " +
                                std::to_string(reader->total_delivered()) + " of " +
                                std::to_string(reader->requested_length()) + " bytes");
  }

  BOOST_LOG_TRIVIAL(info) << "Vault: Downloaded " << reader->total_delivered() << " bytes of "
                          << file.name;
  return reader->total_delivered();
}

void ChunkVault::remove(const std::string& file_id) {
  stat(file_id);
  metadata_.mark_deleted(file_id);
  BOOST_LOG_TRIVIAL(info) << "Vault: Marked " << file_id << " deleted";
}

std::size_t ChunkVault::purge() {
  std::size_t purged = 0;

  for (const auto& file : metadata_.list_files(true)) {
    if (!file.deleted) {
      continue;
    }

    std::vector<std::string> refs;
    if (file.chunked) {
      for (const auto& chunk : metadata_.list_chunks(file.id, true)) {
        refs.push_back(chunk.remote_ref);
      }
    } else {
      refs.push_back(file.remote_ref);
    }

    for (const auto& ref : refs) {
      if (!store_.remove(ref)) {
        BOOST_LOG_TRIVIAL(debug) << "Vault: Object " << ref << " of " << file.name << " already gone";
      }
    }

    metadata_.erase(file.id);
    ++purged;
    BOOST_LOG_TRIVIAL(info) << "Vault: Purged " << file.name << " (" << refs.size() << " objects)";
  }
  return purged;
}


//==============================================
// UTILITY METHODS
//==============================================

std::string ChunkVault::record(const planner::UploadResult& result) {
  if (result.file.chunked) {
    core::validate_layout(result.chunks, result.file.total_size, result.file.chunk_size);
  }

  std::string id = metadata_.create_logical_file(result.file);
  try {
    for (const auto& chunk : result.chunks) {
      metadata_.create_chunk(id, chunk);
    }
  }
  catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Vault: Failed to record chunks of " << result.file.name << ": " << e.what();
    metadata_.erase(id);
    throw;
  }
  return id;
}

std::vector<core::Chunk> ChunkVault::chunks_of(const core::LogicalFile& file) const {
  if (!file.chunked) {
    // One object spanning the whole file
    core::Chunk chunk;
    chunk.index = 0;
    chunk.start_offset = 0;
    chunk.end_offset = file.total_size;
    chunk.remote_ref = file.remote_ref;
    chunk.checksum = file.checksum;
    return {chunk};
  }

  std::vector<core::Chunk> chunks = metadata_.list_chunks(file.id);
  core::validate_layout(chunks, file.total_size, file.chunk_size);
  return chunks;
}

} // namespace chunkvault::vault
