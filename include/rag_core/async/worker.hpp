#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "rag_core/db/task.hpp"

namespace rag_core {
class ServiceProvider;
}

namespace rag_core {
namespace async {

/**
 * @class Worker
 * @brief A single background thread that drains the ingestion task queue.
 *
 * Claims one task at a time, runs it through the IngestionPipeline and records
 * the outcome. Non-copyable and non-movable so the thread has one owner.
 */
class Worker {
 public:
  /**
   * @param worker_id Identifier used in log lines.
   * @param services Shared pipeline and task queue.
   * @param poll_interval Sleep between polls when the queue is empty.
   */
  Worker(int worker_id,
         std::shared_ptr<ServiceProvider> services,
         std::chrono::milliseconds poll_interval = std::chrono::milliseconds(1000));

  /**
   * @brief Stops the loop and joins the thread.
   */
  ~Worker();

  /**
   * @brief Starts the processing loop in a new thread.
   * @throw std::runtime_error if the worker is already running.
   */
  void start();

  /**
   * @brief Asks the loop to exit after the current task. Does not block.
   */
  void stop();

  /**
   * @brief Claims and runs at most one task on the calling thread.
   *
   * Outcomes that could not be written earlier are retried first, since a
   * task left PROCESSING keeps its file from being claimed again.
   * @return true if a task was claimed, whatever its outcome.
   */
  bool run_one_task();

  /**
   * @brief Number of finished tasks whose final status is not yet stored.
   */
  size_t unrecorded_outcome_count() const {
    return unrecorded_.size();
  }

  // Attempts per terminal status write before it is parked for later.
  static constexpr int OUTCOME_WRITE_ATTEMPTS = 3;

  Worker(const Worker&) = delete;
  Worker& operator=(const Worker&) = delete;
  Worker(Worker&&) = delete;
  Worker& operator=(Worker&&) = delete;

 private:
  struct TaskOutcome {
    long long task_id;
    TaskStatus status;
    std::string error_message;
  };

  void run_loop();
  void execute_task(const IngestTask& record);
  bool record_outcome(const TaskOutcome& outcome, int max_attempts);
  void retry_unrecorded_outcomes();

  int worker_id_;
  std::shared_ptr<ServiceProvider> services_;
  std::chrono::milliseconds poll_interval_;
  std::atomic<bool> should_stop{false};
  std::thread thread;
  // Touched only by the thread running tasks.
  std::vector<TaskOutcome> unrecorded_;
};
}  // namespace async
}  // namespace rag_core
