#pragma once

#include "rag_core/async/ITask.hpp"
#include "rag_core/db/task.hpp"

namespace rag_core {
class TaskFactory {
 public:
  // Throws std::runtime_error for unknown task types or incomplete rows.
  static ITaskPtr create_task(const IngestTask& record);
};
}  // namespace rag_core
