#include "rag_core/db/task_queue_repo.hpp"

#include <sqlite_modern_cpp.h>

#include <algorithm>

#include "rag_core/db/pooled_connection.hpp"
#include "rag_core/db/sqlite_error_utils.hpp"
#include "rag_core/db/time_utils.hpp"
#include "rag_core/db/transaction.hpp"

namespace rag_core {

namespace {

const char* const TASK_COLUMNS =
    "id, task_type, file_id, subject_code, file_type, payload, status, priority, error_message, "
    "created_at, updated_at";

IngestTask make_task(long long id,
                     std::string task_type,
                     long long file_id,
                     std::optional<std::string> subject_code,
                     std::optional<std::string> file_type,
                     std::optional<std::string> payload,
                     const std::string& status,
                     int priority,
                     std::optional<std::string> error_message,
                     const std::string& created_at,
                     const std::string& updated_at) {
  IngestTask task;
  task.id = id;
  task.task_type = std::move(task_type);
  task.file_id = file_id;
  task.subject_code = std::move(subject_code);
  if (file_type)
    task.file_type = file_type_from_string(*file_type);
  if (payload)
    task.payload = std::move(*payload);
  task.status = task_status_from_string(status);
  task.priority = priority;
  if (error_message)
    task.error_message = *error_message;
  task.created_at = rag_core::string_to_time_point(created_at);
  task.updated_at = rag_core::string_to_time_point(updated_at);
  return task;
}

}  // namespace

TaskQueueRepo::TaskQueueRepo(DatabaseManager& db_manager) : db_manager_(db_manager) {}

std::string TaskQueueRepo::time_point_to_string(const std::chrono::system_clock::time_point& tp) {
  return rag_core::time_point_to_string(tp);
}

std::chrono::system_clock::time_point TaskQueueRepo::string_to_time_point(
    const std::string& time_str) {
  return rag_core::string_to_time_point(time_str);
}

long long TaskQueueRepo::create_task(const NewIngestTask& task) {
  try {
    PooledConnection conn(db_manager_);
    std::string created_at_str = now_string();
    std::optional<std::string> file_type;
    if (task.file_type)
      file_type = to_string(*task.file_type);
    *conn << "INSERT INTO ingest_tasks (task_type, file_id, subject_code, file_type, payload, "
             "priority, created_at, updated_at) VALUES (?,?,?,?,?,?,?,?)"
          << task.task_type << task.file_id << task.subject_code << file_type << task.payload
          << task.priority << created_at_str << created_at_str;
    return static_cast<long long>(conn->last_insert_rowid());
  } catch (const sqlite::sqlite_exception& e) {
    throw_db_error<TaskQueueRepoError>("create_task", e);
  }
}

std::optional<IngestTask> TaskQueueRepo::fetch_and_claim_next_task() {
  std::optional<IngestTask> result;
  try {
    PooledConnection conn(db_manager_);
    Transaction tx(*conn, TransactionMode::Immediate);
    std::string pending_status = to_string(TaskStatus::PENDING);
    std::string processing_status = to_string(TaskStatus::PROCESSING);
    *conn << std::string("SELECT ") + TASK_COLUMNS +
                 " FROM ingest_tasks t WHERE status = ? AND NOT EXISTS ("
                 "SELECT 1 FROM ingest_tasks p WHERE p.file_id = t.file_id AND p.status = ?) "
                 "ORDER BY priority ASC, created_at ASC, id ASC LIMIT 1"
          << pending_status << processing_status >>
        [&](long long id, std::string task_type, long long file_id,
            std::optional<std::string> subject_code, std::optional<std::string> file_type,
            std::optional<std::string> payload, std::string status_db, int priority,
            std::optional<std::string> error_message, std::string created_at,
            std::string updated_at) {
          result = make_task(id, std::move(task_type), file_id, std::move(subject_code),
                             std::move(file_type), std::move(payload), status_db, priority,
                             std::move(error_message), created_at, updated_at);
        };

    if (result) {
      auto now = std::chrono::system_clock::now();
      *conn << "UPDATE ingest_tasks SET status = ?, updated_at = ? WHERE id = ?"
            << processing_status << time_point_to_string(now) << result->id;
      result->status = TaskStatus::PROCESSING;
      result->updated_at = now;
    }
    tx.commit();
    return result;
  } catch (const sqlite::sqlite_exception& e) {
    throw_db_error<TaskQueueRepoError>("fetch_and_claim_next_task", e);
  }
}

void TaskQueueRepo::update_task_status(long long task_id, TaskStatus new_status) {
  try {
    PooledConnection conn(db_manager_);
    *conn << "UPDATE ingest_tasks SET status = ?, updated_at = ? WHERE id = ?"
          << to_string(new_status) << now_string() << task_id;
  } catch (const sqlite::sqlite_exception& e) {
    throw_db_error<TaskQueueRepoError>("update_task_status", e);
  }
}

void TaskQueueRepo::mark_task_as_failed(long long task_id, const std::string& error_message) {
  try {
    PooledConnection conn(db_manager_);
    *conn << "UPDATE ingest_tasks SET status = ?, error_message = ?, updated_at = ? WHERE id = ?"
          << to_string(TaskStatus::FAILED) << error_message << now_string() << task_id;
  } catch (const sqlite::sqlite_exception& e) {
    throw_db_error<TaskQueueRepoError>("mark_task_as_failed", e);
  }
}

std::vector<IngestTask> TaskQueueRepo::get_tasks_by_status(TaskStatus status) {
  try {
    PooledConnection conn(db_manager_);
    std::vector<IngestTask> tasks;
    *conn << std::string("SELECT ") + TASK_COLUMNS +
                 " FROM ingest_tasks WHERE status = ? ORDER BY priority ASC, created_at ASC, id ASC"
          << to_string(status) >>
        [&](long long id, std::string task_type, long long file_id,
            std::optional<std::string> subject_code, std::optional<std::string> file_type,
            std::optional<std::string> payload, std::string status_db, int priority,
            std::optional<std::string> error_message, std::string created_at,
            std::string updated_at) {
          tasks.push_back(make_task(id, std::move(task_type), file_id, std::move(subject_code),
                                    std::move(file_type), std::move(payload), status_db, priority,
                                    std::move(error_message), created_at, updated_at));
        };
    return tasks;
  } catch (const sqlite::sqlite_exception& e) {
    throw_db_error<TaskQueueRepoError>("get_tasks_by_status", e);
  }
}

std::optional<IngestTask> TaskQueueRepo::get_task(long long task_id) {
  std::optional<IngestTask> result;
  try {
    PooledConnection conn(db_manager_);
    *conn << std::string("SELECT ") + TASK_COLUMNS + " FROM ingest_tasks WHERE id = ?"
          << task_id >>
        [&](long long id, std::string task_type, long long file_id,
            std::optional<std::string> subject_code, std::optional<std::string> file_type,
            std::optional<std::string> payload, std::string status_db, int priority,
            std::optional<std::string> error_message, std::string created_at,
            std::string updated_at) {
          result = make_task(id, std::move(task_type), file_id, std::move(subject_code),
                             std::move(file_type), std::move(payload), status_db, priority,
                             std::move(error_message), created_at, updated_at);
        };
  } catch (const sqlite::sqlite_exception& e) {
    throw_db_error<TaskQueueRepoError>("get_task", e);
  }
  return result;
}

std::vector<IngestTask> TaskQueueRepo::get_open_tasks_for_file(long long file_id) {
  try {
    PooledConnection conn(db_manager_);
    std::vector<IngestTask> tasks;
    *conn << std::string("SELECT ") + TASK_COLUMNS +
                 " FROM ingest_tasks WHERE file_id = ? AND status IN (?, ?) ORDER BY id ASC"
          << file_id << to_string(TaskStatus::PENDING) << to_string(TaskStatus::PROCESSING) >>
        [&](long long id, std::string task_type, long long task_file_id,
            std::optional<std::string> subject_code, std::optional<std::string> file_type,
            std::optional<std::string> payload, std::string status_db, int priority,
            std::optional<std::string> error_message, std::string created_at,
            std::string updated_at) {
          tasks.push_back(make_task(id, std::move(task_type), task_file_id,
                                    std::move(subject_code), std::move(file_type),
                                    std::move(payload), status_db, priority,
                                    std::move(error_message), created_at, updated_at));
        };
    return tasks;
  } catch (const sqlite::sqlite_exception& e) {
    throw_db_error<TaskQueueRepoError>("get_open_tasks_for_file", e);
  }
}

int TaskQueueRepo::clear_completed_tasks(int older_than_days) {
  try {
    PooledConnection conn(db_manager_);
    auto cutoff_time = std::chrono::system_clock::now() - std::chrono::hours(24 * older_than_days);
    *conn << "DELETE FROM ingest_tasks WHERE status IN (?, ?) AND updated_at <= ?"
          << to_string(TaskStatus::COMPLETED) << to_string(TaskStatus::FAILED)
          << time_point_to_string(cutoff_time);
    int removed = 0;
    *conn << "SELECT changes()" >> removed;
    return removed;
  } catch (const sqlite::sqlite_exception& e) {
    throw_db_error<TaskQueueRepoError>("clear_completed_tasks", e);
  }
}

void TaskQueueRepo::upsert_task_progress(long long task_id,
                                         float percent,
                                         const std::string& message) {
  const float clamped = std::clamp(percent, 0.0f, 1.0f);
  try {
    PooledConnection conn(db_manager_);
    *conn << "INSERT INTO task_progress (task_id, progress_percent, status_message, updated_at) "
             "VALUES (?, ?, ?, ?) ON CONFLICT(task_id) DO UPDATE SET "
             "progress_percent = excluded.progress_percent, "
             "status_message = excluded.status_message, updated_at = excluded.updated_at"
          << task_id << clamped << message << now_string();
  } catch (const sqlite::sqlite_exception& e) {
    throw_db_error<TaskQueueRepoError>("upsert_task_progress", e);
  }
}

std::optional<TaskProgress> TaskQueueRepo::get_task_progress(long long task_id) {
  std::optional<TaskProgress> result;
  try {
    PooledConnection conn(db_manager_);
    *conn << "SELECT task_id, progress_percent, status_message, updated_at FROM task_progress "
             "WHERE task_id = ?"
          << task_id >>
        [&](long long id, double percent, std::string message, std::string updated_at) {
          result = TaskProgress{.task_id = id,
                                   .progress_percent = static_cast<float>(percent),
                                   .status_message = std::move(message),
                                   .updated_at = std::move(updated_at)};
        };
  } catch (const sqlite::sqlite_exception& e) {
    throw_db_error<TaskQueueRepoError>("get_task_progress", e);
  }
  return result;
}

int TaskQueueRepo::requeue_interrupted_tasks() {
  try {
    PooledConnection conn(db_manager_);
    *conn << "UPDATE ingest_tasks SET status = ?, updated_at = ? WHERE status = ?"
          << to_string(TaskStatus::PENDING) << now_string() << to_string(TaskStatus::PROCESSING);
    int requeued = 0;
    *conn << "SELECT changes()" >> requeued;
    return requeued;
  } catch (const sqlite::sqlite_exception& e) {
    throw_db_error<TaskQueueRepoError>("requeue_interrupted_tasks", e);
  }
}

}  // namespace rag_core
