#include "rag_core/async/task_factory.hpp"

#include <stdexcept>

#include "rag_core/async/ingest_document_task.hpp"

namespace rag_core {
ITaskPtr TaskFactory::create_task(const IngestTask& record) {
  if (record.task_type == TASK_TYPE_INGEST_DOCUMENT) {
    if (!record.file_type) {
      throw std::runtime_error("INGEST_DOCUMENT task is missing required file_type.");
    }
    return std::make_unique<IngestDocumentTask>(
        record.id, record.status, record.file_id, record.created_at, record.updated_at,
        record.subject_code, *record.file_type, decode_ingest_payload(record.payload));
  }
  if (record.task_type == TASK_TYPE_DELETE_DOCUMENT) {
    return std::make_unique<DeleteDocumentTask>(record.id, record.status, record.file_id,
                                                record.created_at, record.updated_at);
  }

  throw std::runtime_error("Unknown task type: " + record.task_type);
}
}  // namespace rag_core
