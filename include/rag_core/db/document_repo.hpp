#pragma once

#include <chrono>
#include <optional>
#include <string>

#include "rag_core/db/database_manager.hpp"
#include "rag_core/types/file_type.hpp"
#include "rag_core/types/ingestion_stage.hpp"

namespace rag_core {

class DocumentRepoError : public std::exception {
 public:
  explicit DocumentRepoError(const std::string& message) : message_(message) {}
  const char* what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

struct DocumentRecord {
  long long file_id = 0;
  std::optional<std::string> subject_code;
  FileType file_type = FileType::Pdf;
  std::string content_hash;
  IngestionStage stage = IngestionStage::PENDING;
  // Stage that was running when the document entered FAILED.
  std::optional<IngestionStage> failed_stage;
  int chunk_count = 0;
  std::optional<std::string> error_message;
  std::chrono::system_clock::time_point created_at;
  std::chrono::system_clock::time_point updated_at;
};

// Per-document ingestion state, one row per file_id.
class DocumentRepo {
 public:
  explicit DocumentRepo(DatabaseManager& db_manager);
  virtual ~DocumentRepo() = default;

  // Upserts the record and resets it to PENDING.
  void begin_ingestion(long long file_id,
                       const std::optional<std::string>& subject_code,
                       FileType file_type,
                       const std::string& content_hash);
  void update_stage(long long file_id, IngestionStage stage);
  void mark_done(long long file_id, int chunk_count);
  void mark_failed(long long file_id, IngestionStage failed_stage, const std::string& error_message);

  std::optional<DocumentRecord> get_document(long long file_id);
  void remove_document(long long file_id);

 private:
  DatabaseManager& db_manager_;
};

}  // namespace rag_core
