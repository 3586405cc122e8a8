#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "rag_core/db/document_repo.hpp"
#include "rag_core/db/task_queue_repo.hpp"
#include "rag_core/types/chunk.hpp"

namespace rag_core {

struct IngestionRequest {
  long long file_id = 0;
  std::optional<std::string> subject_code;
  FileType file_type = FileType::Pdf;
  std::optional<std::string> text;
  std::vector<Section> sections;
  std::optional<size_t> max_chunk_chars;
  int priority = 10;
};

class IngestionService {
 public:
  IngestionService(std::shared_ptr<DocumentRepo> document_repo,
                   std::shared_ptr<TaskQueueRepo> task_queue_repo);

  virtual ~IngestionService() = default;

  // Queues an INGEST_DOCUMENT task unless the document is already indexed
  // with identical content, subject and file type and no max_chunk_chars
  // hint is given.
  virtual std::optional<long long> request_ingestion(const IngestionRequest& request);

  // Validates every request before queuing any of them. Returns one entry per
  // request, in order; an empty entry marks an unchanged document.
  virtual std::vector<std::optional<long long>> request_ingestion_batch(
      const std::vector<IngestionRequest>& requests);

  virtual long long request_deletion(long long file_id, int priority = 5);

  // Throws ValidationError for a request that could never succeed.
  static void validate(const IngestionRequest& request);

  static std::string content_hash_of(const IngestionRequest& request);

 private:
  std::shared_ptr<DocumentRepo> document_repo_;
  std::shared_ptr<TaskQueueRepo> task_queue_repo_;
};

}  // namespace rag_core
