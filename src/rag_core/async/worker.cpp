#include "rag_core/async/worker.hpp"

#include <iostream>
#include <optional>
#include <utility>

#include "rag_core/async/ITask.hpp"
#include "rag_core/async/service_provider.hpp"
#include "rag_core/async/task_factory.hpp"
#include "rag_core/db/task_queue_repo.hpp"

namespace rag_core {
namespace async {

namespace {
constexpr std::chrono::milliseconds OUTCOME_RETRY_BACKOFF{25};
}

Worker::Worker(int worker_id,
               std::shared_ptr<ServiceProvider> services,
               std::chrono::milliseconds poll_interval)
    : worker_id_(worker_id), services_(std::move(services)), poll_interval_(poll_interval) {
  std::cout << "Worker [" << worker_id_ << "] created." << std::endl;
}

Worker::~Worker() {
  std::cout << "Worker [" << worker_id_ << "] shutting down..." << std::endl;
  stop();
  if (thread.joinable()) {
    thread.join();
  }
  retry_unrecorded_outcomes();
  if (!unrecorded_.empty()) {
    std::cerr << "Worker [" << worker_id_ << "] Warning: " << unrecorded_.size()
              << " task(s) left PROCESSING; they are requeued on next startup." << std::endl;
  }
  std::cout << "Worker [" << worker_id_ << "] joined and shut down." << std::endl;
}

void Worker::start() {
  if (thread.joinable()) {
    throw std::runtime_error("Worker is already running.");
  }
  should_stop.store(false);
  thread = std::thread(&Worker::run_loop, this);
}

void Worker::stop() {
  should_stop.store(true);
}

void Worker::execute_task(const IngestTask& record) {
  TaskQueueRepo& task_repo = services_->get_task_queue_repo();
  TaskOutcome outcome{.task_id = record.id, .status = TaskStatus::COMPLETED, .error_message = ""};
  try {
    ITaskPtr task = TaskFactory::create_task(record);

    ProgressUpdater on_progress = [&](float p, const std::string& msg) {
      try {
        task_repo.upsert_task_progress(record.id, p, msg);
      } catch (const std::exception& e) {
        std::cerr << "Worker [" << worker_id_ << "] Warning: could not record progress for task "
                  << record.id << ": " << e.what() << std::endl;
      }
    };

    task->execute(*services_, on_progress);
    std::cout << "Worker [" << worker_id_ << "] completed " << record.task_type << " task "
              << record.id << " for file " << record.file_id << std::endl;
  } catch (const std::exception& e) {
    std::cerr << "Worker [" << worker_id_ << "] ERROR processing task " << record.id << ": "
              << e.what() << std::endl;
    outcome.status = TaskStatus::FAILED;
    outcome.error_message = e.what();
  }

  if (!record_outcome(outcome, OUTCOME_WRITE_ATTEMPTS)) {
    unrecorded_.push_back(std::move(outcome));
  }
}

bool Worker::record_outcome(const TaskOutcome& outcome, int max_attempts) {
  TaskQueueRepo& task_repo = services_->get_task_queue_repo();
  std::chrono::milliseconds backoff = OUTCOME_RETRY_BACKOFF;
  for (int attempt = 1;; ++attempt) {
    try {
      if (outcome.status == TaskStatus::FAILED) {
        task_repo.mark_task_as_failed(outcome.task_id, outcome.error_message);
      } else {
        task_repo.update_task_status(outcome.task_id, outcome.status);
      }
      return true;
    } catch (const std::exception& e) {
      std::cerr << "Worker [" << worker_id_ << "] Warning: could not mark task "
                << outcome.task_id << " " << to_string(outcome.status) << " (attempt " << attempt
                << "/" << max_attempts << "): " << e.what() << std::endl;
      if (attempt >= max_attempts) {
        return false;
      }
    }
    std::this_thread::sleep_for(backoff);
    backoff *= 2;
  }
}

void Worker::retry_unrecorded_outcomes() {
  std::vector<TaskOutcome> still_unrecorded;
  for (auto& outcome : unrecorded_) {
    if (!record_outcome(outcome, 1)) {
      still_unrecorded.push_back(std::move(outcome));
    }
  }
  unrecorded_ = std::move(still_unrecorded);
}

void Worker::run_loop() {
  std::cout << "Worker [" << worker_id_ << "] starting run loop." << std::endl;
  while (!should_stop.load()) {
    bool worked = false;
    try {
      worked = run_one_task();
    } catch (const std::exception& e) {
      // Queue unavailable; back off and poll again.
      std::cerr << "Worker [" << worker_id_ << "] ERROR polling task queue: " << e.what()
                << std::endl;
    }
    if (!worked) {
      std::this_thread::sleep_for(poll_interval_);
    }
  }
  std::cout << "Worker [" << worker_id_ << "] run loop terminated." << std::endl;
}

bool Worker::run_one_task() {
  if (!unrecorded_.empty()) {
    retry_unrecorded_outcomes();
  }
  std::optional<IngestTask> record = services_->get_task_queue_repo().fetch_and_claim_next_task();
  if (!record) {
    return false;
  }
  std::cout << "Worker [" << worker_id_ << "] claimed " << record->task_type << " task "
            << record->id << " for file " << record->file_id << std::endl;
  execute_task(*record);
  return true;
}
}  // namespace async
}  // namespace rag_core
