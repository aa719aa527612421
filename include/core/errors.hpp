#ifndef CHUNKVAULT_CORE_ERRORS_HPP
#define CHUNKVAULT_CORE_ERRORS_HPP

#include <cstdint>
#include <stdexcept>
#include <string>

namespace chunkvault::core {

class ChunkVaultError : public std::runtime_error {
public:
  explicit ChunkVaultError(const std::string& message)
    : std::runtime_error(message) {}
};

// Invalid sizes or arguments, never retried
class ConfigurationError : public ChunkVaultError {
public:
  explicit ConfigurationError(const std::string& message)
    : ChunkVaultError("Configuration error: " + message) {}
};

class RangeError : public ChunkVaultError {
public:
  RangeError(const std::string& message, int64_t start, int64_t end)
    : ChunkVaultError("Range error: " + message)
    , start_(start)
    , end_(end) {}

  int64_t start() const { return start_; }
  int64_t end() const { return end_; }

private:
  int64_t start_;
  int64_t end_;
};

// Chunk records that break the contiguity invariants
class LayoutError : public ChunkVaultError {
public:
  explicit LayoutError(const std::string& message)
    : ChunkVaultError("Layout error: " + message) {}
};

// Base of every failure the retry policy may retry
class TransientError : public ChunkVaultError {
public:
  explicit TransientError(const std::string& message)
    : ChunkVaultError(message) {}
};

class ResolutionError : public TransientError {
public:
  explicit ResolutionError(const std::string& message)
    : TransientError("Resolution error: " + message) {}
};

class TransferError : public TransientError {
public:
  explicit TransferError(const std::string& message)
    : TransientError("Transfer error: " + message) {}
};

// The backend has no object behind a chunk reference
class ChunkMissingError : public ChunkVaultError {
public:
  explicit ChunkMissingError(const std::string& message)
    : ChunkVaultError("Chunk missing: " + message) {}
};

class RetryExhaustedError : public ChunkVaultError {
public:
  RetryExhaustedError(int chunk_index, int attempts, const std::string& operation,
                      const std::string& cause)
    : ChunkVaultError("Chunk " + std::to_string(chunk_index) + ": " + operation +
                      " failed after " + std::to_string(attempts) + " attempts: " + cause)
    , chunk_index_(chunk_index)
    , attempts_(attempts) {}

  int chunk_index() const { return chunk_index_; }
  int attempts() const { return attempts_; }

private:
  int chunk_index_;
  int attempts_;
};

// The chunk store rejected a chunk, the whole upload is aborted
class StorageError : public ChunkVaultError {
public:
  StorageError(int chunk_index, const std::string& message)
    : ChunkVaultError("Storage error on chunk " + std::to_string(chunk_index) + ": " + message)
    , chunk_index_(chunk_index) {}

  int chunk_index() const { return chunk_index_; }

private:
  int chunk_index_;
};

class CancelledError : public ChunkVaultError {
public:
  explicit CancelledError(const std::string& message)
    : ChunkVaultError("Cancelled: " + message) {}
};

class MetadataError : public ChunkVaultError {
public:
  explicit MetadataError(const std::string& message)
    : ChunkVaultError("Metadata error: " + message) {}
};

} // namespace chunkvault::core

#endif // CHUNKVAULT_CORE_ERRORS_HPP
