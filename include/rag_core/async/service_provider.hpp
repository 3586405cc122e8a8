#pragma once

#include <memory>
#include <stdexcept>
#include <utility>

namespace rag_core {
class IngestionPipeline;
class TaskQueueRepo;

// What a task may touch while it runs. Shared by every worker in a pool.
class ServiceProvider {
 public:
  ServiceProvider(std::shared_ptr<IngestionPipeline> pipeline,
                  std::shared_ptr<TaskQueueRepo> task_queue_repo)
      : pipeline_(std::move(pipeline)), task_queue_repo_(std::move(task_queue_repo)) {
    if (!pipeline_ || !task_queue_repo_) {
      throw std::invalid_argument("ServiceProvider requires an ingestion pipeline and a task queue");
    }
  }

  IngestionPipeline& get_ingestion_pipeline() const {
    return *pipeline_;
  }
  TaskQueueRepo& get_task_queue_repo() const {
    return *task_queue_repo_;
  }

 private:
  std::shared_ptr<IngestionPipeline> pipeline_;
  std::shared_ptr<TaskQueueRepo> task_queue_repo_;
};

}  // namespace rag_core
