#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "rag_core/db/database_manager.hpp"
#include "rag_core/db/task.hpp"

namespace rag_core {

class TaskQueueRepoError : public std::exception {
 public:
  explicit TaskQueueRepoError(const std::string& message) : message_(message) {}
  const char* what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

class TaskQueueRepo {
 public:
  explicit TaskQueueRepo(DatabaseManager& db_manager);
  virtual ~TaskQueueRepo() = default;

  long long create_task(const NewIngestTask& task);

  // Claims the highest priority PENDING task whose file has no task in
  // PROCESSING, so two workers never hold the same file at once.
  std::optional<IngestTask> fetch_and_claim_next_task();

  virtual void update_task_status(long long task_id, TaskStatus new_status);
  virtual void mark_task_as_failed(long long task_id, const std::string& error_message);
  std::vector<IngestTask> get_tasks_by_status(TaskStatus status);
  std::optional<IngestTask> get_task(long long task_id);
  // Pending or processing tasks for one file.
  std::vector<IngestTask> get_open_tasks_for_file(long long file_id);
  int clear_completed_tasks(int older_than_days = 7);
  // percent is clamped to [0, 1].
  void upsert_task_progress(long long task_id, float percent, const std::string& message);
  std::optional<TaskProgress> get_task_progress(long long task_id);

  // Tasks left PROCESSING by a previous run go back to PENDING.
  int requeue_interrupted_tasks();

  static std::string time_point_to_string(const std::chrono::system_clock::time_point& tp);
  static std::chrono::system_clock::time_point string_to_time_point(const std::string& time_str);

 private:
  DatabaseManager& db_manager_;
};

}  // namespace rag_core
