#pragma once

#include <exception>
#include <string>

#include "rag_core/types/ingestion_stage.hpp"

namespace rag_core {

class RagError : public std::exception {
 public:
  explicit RagError(const std::string& message) : message_(message) {}
  const char* what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

// Malformed input. Rejected before anything is written.
class ValidationError : public RagError {
 public:
  using RagError::RagError;
};

class EmbeddingError : public RagError {
 public:
  EmbeddingError(const std::string& message, bool retryable)
      : RagError(message), retryable_(retryable) {}

  // True for transport failures (unreachable, timeout), false for bad responses.
  bool retryable() const noexcept {
    return retryable_;
  }

 private:
  bool retryable_;
};

class IngestionError : public RagError {
 public:
  IngestionError(IngestionStage stage, long long file_id, const std::string& message)
      : RagError("Ingestion of file " + std::to_string(file_id) + " failed during " +
                 to_string(stage) + ": " + message),
        stage_(stage),
        file_id_(file_id) {}

  IngestionStage stage() const noexcept {
    return stage_;
  }
  long long file_id() const noexcept {
    return file_id_;
  }

 private:
  IngestionStage stage_;
  long long file_id_;
};

// Another ingestion or removal of the same file is running.
class IngestionInFlightError : public IngestionError {
 public:
  explicit IngestionInFlightError(long long file_id)
      : IngestionError(IngestionStage::PENDING, file_id, "another operation on this file is in progress") {}
};

class MigrationError : public RagError {
 public:
  using RagError::RagError;
};

// Transient storage failure (busy, locked, I/O, pool closed). Safe to retry.
class StorageUnavailable : public RagError {
 public:
  using RagError::RagError;
};

class ChunkStoreError : public RagError {
 public:
  using RagError::RagError;
};

}  // namespace rag_core
