#include "rag_core/db/document_repo.hpp"

#include "rag_core/db/pooled_connection.hpp"
#include "rag_core/db/sqlite_error_utils.hpp"
#include "rag_core/db/time_utils.hpp"

namespace rag_core {

DocumentRepo::DocumentRepo(DatabaseManager& db_manager) : db_manager_(db_manager) {}

void DocumentRepo::begin_ingestion(long long file_id,
                                   const std::optional<std::string>& subject_code,
                                   FileType file_type,
                                   const std::string& content_hash) {
  try {
    PooledConnection conn(db_manager_);
    const std::string now = now_string();
    *conn << "INSERT INTO documents (file_id, subject_code, file_type, content_hash, stage, "
             "failed_stage, chunk_count, error_message, created_at, updated_at) "
             "VALUES (?, ?, ?, ?, ?, NULL, 0, NULL, ?, ?) "
             "ON CONFLICT(file_id) DO UPDATE SET subject_code = excluded.subject_code, "
             "file_type = excluded.file_type, content_hash = excluded.content_hash, "
             "stage = excluded.stage, failed_stage = NULL, chunk_count = 0, "
             "error_message = NULL, updated_at = excluded.updated_at"
          << file_id << subject_code << to_string(file_type) << content_hash
          << to_string(IngestionStage::PENDING) << now << now;
  } catch (const sqlite::sqlite_exception& e) {
    throw_db_error<DocumentRepoError>("begin_ingestion", e);
  }
}

void DocumentRepo::update_stage(long long file_id, IngestionStage stage) {
  try {
    PooledConnection conn(db_manager_);
    *conn << "UPDATE documents SET stage = ?, updated_at = ? WHERE file_id = ?"
          << to_string(stage) << now_string() << file_id;
  } catch (const sqlite::sqlite_exception& e) {
    throw_db_error<DocumentRepoError>("update_stage", e);
  }
}

void DocumentRepo::mark_done(long long file_id, int chunk_count) {
  try {
    PooledConnection conn(db_manager_);
    *conn << "UPDATE documents SET stage = ?, chunk_count = ?, failed_stage = NULL, "
             "error_message = NULL, updated_at = ? WHERE file_id = ?"
          << to_string(IngestionStage::DONE) << chunk_count << now_string() << file_id;
  } catch (const sqlite::sqlite_exception& e) {
    throw_db_error<DocumentRepoError>("mark_done", e);
  }
}

void DocumentRepo::mark_failed(long long file_id,
                               IngestionStage failed_stage,
                               const std::string& error_message) {
  try {
    PooledConnection conn(db_manager_);
    *conn << "UPDATE documents SET stage = ?, failed_stage = ?, chunk_count = 0, "
             "error_message = ?, updated_at = ? WHERE file_id = ?"
          << to_string(IngestionStage::FAILED) << to_string(failed_stage) << error_message
          << now_string() << file_id;
  } catch (const sqlite::sqlite_exception& e) {
    throw_db_error<DocumentRepoError>("mark_failed", e);
  }
}

std::optional<DocumentRecord> DocumentRepo::get_document(long long file_id) {
  std::optional<DocumentRecord> result;
  try {
    PooledConnection conn(db_manager_);
    *conn << "SELECT file_id, subject_code, file_type, content_hash, stage, failed_stage, "
             "chunk_count, error_message, created_at, updated_at FROM documents WHERE file_id = ?"
          << file_id >>
        [&](long long id, std::optional<std::string> subject_code, std::string file_type,
            std::string content_hash, std::string stage, std::optional<std::string> failed_stage,
            int chunk_count, std::optional<std::string> error_message, std::string created_at,
            std::string updated_at) {
          DocumentRecord record;
          record.file_id = id;
          record.subject_code = std::move(subject_code);
          record.file_type = file_type_from_string(file_type);
          record.content_hash = std::move(content_hash);
          record.stage = ingestion_stage_from_string(stage);
          if (failed_stage)
            record.failed_stage = ingestion_stage_from_string(*failed_stage);
          record.chunk_count = chunk_count;
          record.error_message = std::move(error_message);
          record.created_at = string_to_time_point(created_at);
          record.updated_at = string_to_time_point(updated_at);
          result = std::move(record);
        };
  } catch (const sqlite::sqlite_exception& e) {
    throw_db_error<DocumentRepoError>("get_document", e);
  }
  return result;
}

void DocumentRepo::remove_document(long long file_id) {
  try {
    PooledConnection conn(db_manager_);
    *conn << "DELETE FROM documents WHERE file_id = ?" << file_id;
  } catch (const sqlite::sqlite_exception& e) {
    throw_db_error<DocumentRepoError>("remove_document", e);
  }
}

}  // namespace rag_core
