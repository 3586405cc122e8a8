#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include "rag_core/db/task.hpp"
#include "rag_core/types/progress.hpp"

namespace rag_core {
class ServiceProvider;
}

namespace rag_core {
class ITask {
 public:
  ITask(long long id,
        TaskStatus status,
        long long file_id,
        std::chrono::system_clock::time_point created_at,
        std::chrono::system_clock::time_point updated_at)
      : id_(id), status_(status), file_id_(file_id), created_at_(created_at), updated_at_(updated_at) {}

  virtual ~ITask() = default;

  virtual void execute(ServiceProvider& services, const ProgressUpdater& on_progress) = 0;

  virtual const char* get_type() const = 0;

  long long get_id() const {
    return id_;
  }
  TaskStatus get_status() const {
    return status_;
  }
  long long get_file_id() const {
    return file_id_;
  }

 protected:
  long long id_;
  TaskStatus status_;
  long long file_id_;
  std::chrono::system_clock::time_point created_at_;
  std::chrono::system_clock::time_point updated_at_;
};

using ITaskPtr = std::unique_ptr<ITask>;
}  // namespace rag_core
