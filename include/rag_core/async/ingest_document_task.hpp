#pragma once

#include <optional>
#include <string>

#include "rag_core/async/ITask.hpp"
#include "rag_core/async/ingest_payload.hpp"
#include "rag_core/types/file_type.hpp"

namespace rag_core {
class IngestDocumentTask : public ITask {
 public:
  IngestDocumentTask(long long id,
                     TaskStatus status,
                     long long file_id,
                     std::chrono::system_clock::time_point created_at,
                     std::chrono::system_clock::time_point updated_at,
                     std::optional<std::string> subject_code,
                     FileType file_type,
                     IngestPayload payload);

  void execute(ServiceProvider& services, const ProgressUpdater& on_progress) override;
  const char* get_type() const override {
    return TASK_TYPE_INGEST_DOCUMENT;
  }

  const IngestPayload& get_payload() const {
    return payload_;
  }

 private:
  std::optional<std::string> subject_code_;
  FileType file_type_;
  IngestPayload payload_;
};

class DeleteDocumentTask : public ITask {
 public:
  DeleteDocumentTask(long long id,
                     TaskStatus status,
                     long long file_id,
                     std::chrono::system_clock::time_point created_at,
                     std::chrono::system_clock::time_point updated_at);

  void execute(ServiceProvider& services, const ProgressUpdater& on_progress) override;
  const char* get_type() const override {
    return TASK_TYPE_DELETE_DOCUMENT;
  }
};
}  // namespace rag_core
