#pragma once

#include <chrono>
#include <optional>
#include <stdexcept>
#include <string>

#include "rag_core/types/file_type.hpp"

namespace rag_core {

enum class TaskStatus { PENDING, PROCESSING, COMPLETED, FAILED };

inline std::string to_string(TaskStatus status) {
  switch (status) {
    case TaskStatus::PENDING: return "PENDING";
    case TaskStatus::PROCESSING: return "PROCESSING";
    case TaskStatus::COMPLETED: return "COMPLETED";
    case TaskStatus::FAILED: return "FAILED";
  }
  return "UNKNOWN";
}

inline TaskStatus task_status_from_string(const std::string &str) {
  if (str == "PENDING") return TaskStatus::PENDING;
  if (str == "PROCESSING") return TaskStatus::PROCESSING;
  if (str == "COMPLETED") return TaskStatus::COMPLETED;
  if (str == "FAILED") return TaskStatus::FAILED;
  throw std::invalid_argument("Invalid TaskStatus string: " + str);
}

inline constexpr const char *TASK_TYPE_INGEST_DOCUMENT = "INGEST_DOCUMENT";
inline constexpr const char *TASK_TYPE_DELETE_DOCUMENT = "DELETE_DOCUMENT";

struct IngestTask {
  long long id = 0;
  std::string task_type;
  long long file_id = 0;
  std::optional<std::string> subject_code;
  std::optional<FileType> file_type;
  // JSON document body for INGEST_DOCUMENT, empty for deletions.
  std::string payload;
  TaskStatus status = TaskStatus::PENDING;
  int priority = 10;
  std::string error_message;
  std::chrono::system_clock::time_point created_at;
  std::chrono::system_clock::time_point updated_at;
};

struct NewIngestTask {
  std::string task_type;
  long long file_id = 0;
  std::optional<std::string> subject_code;
  std::optional<FileType> file_type;
  std::string payload;
  int priority = 10;
};

// Latest progress report of a task. progress_percent is a fraction in [0, 1].
struct TaskProgress {
  long long task_id = 0;
  float progress_percent = 0.0f;
  std::string status_message;
  std::string updated_at;
};

}  // namespace rag_core
