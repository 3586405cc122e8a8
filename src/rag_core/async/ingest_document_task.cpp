#include "rag_core/async/ingest_document_task.hpp"

#include "rag_core/async/service_provider.hpp"
#include "rag_core/services/ingestion_pipeline.hpp"

namespace rag_core {

IngestDocumentTask::IngestDocumentTask(long long id,
                                       TaskStatus status,
                                       long long file_id,
                                       std::chrono::system_clock::time_point created_at,
                                       std::chrono::system_clock::time_point updated_at,
                                       std::optional<std::string> subject_code,
                                       FileType file_type,
                                       IngestPayload payload)
    : ITask(id, status, file_id, created_at, updated_at),
      subject_code_(std::move(subject_code)),
      file_type_(file_type),
      payload_(std::move(payload)) {}

void IngestDocumentTask::execute(ServiceProvider& services, const ProgressUpdater& on_progress) {
  ChunkingHints hints;
  hints.max_chunk_chars = payload_.max_chunk_chars;

  IngestionPipeline& pipeline = services.get_ingestion_pipeline();
  if (payload_.text) {
    pipeline.ingest(file_id_, subject_code_, file_type_, *payload_.text, hints, on_progress);
  } else {
    pipeline.ingest_sections(file_id_, subject_code_, file_type_, payload_.sections, hints,
                             on_progress);
  }
}

DeleteDocumentTask::DeleteDocumentTask(long long id,
                                       TaskStatus status,
                                       long long file_id,
                                       std::chrono::system_clock::time_point created_at,
                                       std::chrono::system_clock::time_point updated_at)
    : ITask(id, status, file_id, created_at, updated_at) {}

void DeleteDocumentTask::execute(ServiceProvider& services, const ProgressUpdater& on_progress) {
  on_progress(0.0f, "Removing document...");
  size_t removed = services.get_ingestion_pipeline().remove(file_id_);
  on_progress(1.0f, "Removed " + std::to_string(removed) + " chunks.");
}

}  // namespace rag_core
