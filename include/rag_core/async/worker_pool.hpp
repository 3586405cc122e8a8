#pragma once

#include <chrono>
#include <memory>
#include <vector>

#include "rag_core/async/worker.hpp"

namespace rag_core::async {

/**
 * @class WorkerPool
 * @brief Owns N workers and stops and joins them on destruction.
 */
class WorkerPool {
 public:
  /**
   * @param num_threads Number of workers, at least one.
   * @param services Shared by every worker.
   * @throw std::invalid_argument if num_threads is zero.
   */
  WorkerPool(size_t num_threads,
             std::shared_ptr<ServiceProvider> services,
             std::chrono::milliseconds poll_interval = std::chrono::milliseconds(1000));

  ~WorkerPool();

  void start();

  // Signals every worker to stop; joining happens in the destructor.
  void stop();

  bool is_running() const {
    return m_is_running;
  }
  size_t size() const {
    return m_workers.size();
  }

  WorkerPool(const WorkerPool&) = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;
  WorkerPool(WorkerPool&&) = delete;
  WorkerPool& operator=(WorkerPool&&) = delete;

 private:
  std::vector<std::unique_ptr<Worker>> m_workers;
  bool m_is_running = false;
};

}  // namespace rag_core::async
