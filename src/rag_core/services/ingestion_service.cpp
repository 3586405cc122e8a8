#include "rag_core/services/ingestion_service.hpp"

#include <iostream>
#include <unordered_set>

#include "rag_core/async/ingest_payload.hpp"
#include "rag_core/db/chunk_store.hpp"
#include "rag_core/errors.hpp"
#include "rag_core/utils/content_hash.hpp"

namespace rag_core {

IngestionService::IngestionService(std::shared_ptr<DocumentRepo> document_repo,
                                   std::shared_ptr<TaskQueueRepo> task_queue_repo)
    : document_repo_(std::move(document_repo)), task_queue_repo_(std::move(task_queue_repo)) {}

void IngestionService::validate(const IngestionRequest& request) {
  if (request.text && !request.sections.empty()) {
    throw ValidationError("Provide either text or sections, not both");
  }
  if (!request.text && request.sections.empty()) {
    throw ValidationError("Provide text or sections to ingest");
  }
  if (request.max_chunk_chars && *request.max_chunk_chars == 0) {
    throw ValidationError("max_chunk_chars must be positive");
  }
  ChunkStore::validate_subject_code(request.subject_code);
}

std::string IngestionService::content_hash_of(const IngestionRequest& request) {
  return request.text ? compute_content_hash(*request.text)
                      : compute_sections_hash(request.sections);
}

std::optional<long long> IngestionService::request_ingestion(const IngestionRequest& request) {
  validate(request);

  const std::string content_hash = content_hash_of(request);
  auto existing = document_repo_->get_document(request.file_id);
  // A chunk size hint changes the chunks even when the content does not.
  if (!request.max_chunk_chars && existing && existing->stage == IngestionStage::DONE &&
      existing->content_hash == content_hash && existing->subject_code == request.subject_code &&
      existing->file_type == request.file_type) {
    std::cout << "File " << request.file_id << " is unchanged, skipping ingestion" << std::endl;
    return std::nullopt;
  }

  IngestPayload payload{.text = request.text,
                        .sections = request.sections,
                        .max_chunk_chars = request.max_chunk_chars};
  NewIngestTask task{.task_type = TASK_TYPE_INGEST_DOCUMENT,
                     .file_id = request.file_id,
                     .subject_code = request.subject_code,
                     .file_type = request.file_type,
                     .payload = encode_ingest_payload(payload),
                     .priority = request.priority};
  return task_queue_repo_->create_task(task);
}

std::vector<std::optional<long long>> IngestionService::request_ingestion_batch(
    const std::vector<IngestionRequest>& requests) {
  if (requests.empty()) {
    throw ValidationError("Batch contains no documents");
  }
  std::unordered_set<long long> file_ids;
  for (size_t i = 0; i < requests.size(); ++i) {
    try {
      validate(requests[i]);
    } catch (const ValidationError& e) {
      throw ValidationError("Document " + std::to_string(i) + ": " + e.what());
    }
    if (!file_ids.insert(requests[i].file_id).second) {
      throw ValidationError("Document " + std::to_string(i) + ": file_id " +
                            std::to_string(requests[i].file_id) + " appears more than once");
    }
  }

  std::vector<std::optional<long long>> task_ids;
  task_ids.reserve(requests.size());
  for (const auto& request : requests) {
    task_ids.push_back(request_ingestion(request));
  }
  std::cout << "Batch of " << requests.size() << " documents processed" << std::endl;
  return task_ids;
}

long long IngestionService::request_deletion(long long file_id, int priority) {
  NewIngestTask task{.task_type = TASK_TYPE_DELETE_DOCUMENT,
                     .file_id = file_id,
                     .priority = priority};
  return task_queue_repo_->create_task(task);
}

}  // namespace rag_core
