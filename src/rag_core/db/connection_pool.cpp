#include "rag_core/db/connection_pool.hpp"

#include <stdexcept>

#include "rag_core/errors.hpp"

namespace rag_core {

namespace {
constexpr int BUSY_TIMEOUT_MS = 5000;
}

void ConnectionPool::configure_connection(sqlite::database& db) {
  db << "PRAGMA foreign_keys = ON;";
  db << "PRAGMA journal_mode = WAL;";
  db << "PRAGMA busy_timeout = " + std::to_string(BUSY_TIMEOUT_MS) + ";";
}

ConnectionPool::ConnectionPool(const std::string& db_path, int pool_size)
    : db_path_(db_path), pool_size_(pool_size) {
  if (pool_size_ <= 0) {
    throw std::invalid_argument("Connection pool size must be greater than 0");
  }
  for (int i = 0; i < pool_size_; ++i) {
    auto db = std::make_unique<sqlite::database>(db_path_);
    if (!db->connection()) {
      throw StorageUnavailable("Could not open pooled connection to " + db_path_);
    }
    configure_connection(*db);
    idle_.push(std::move(db));
  }
}

std::unique_ptr<sqlite::database> ConnectionPool::get_connection() {
  std::unique_lock<std::mutex> lock(mtx_);
  cv_.wait(lock, [this] { return shutting_down_ || !idle_.empty(); });

  if (shutting_down_) {
    throw StorageUnavailable("Connection pool for " + db_path_ + " is shut down");
  }

  std::unique_ptr<sqlite::database> conn = std::move(idle_.front());
  idle_.pop();
  return conn;
}

void ConnectionPool::return_connection(std::unique_ptr<sqlite::database> conn) {
  {
    std::lock_guard<std::mutex> lock(mtx_);
    if (shutting_down_) {
      return;
    }
    idle_.push(std::move(conn));
  }
  cv_.notify_one();
}

void ConnectionPool::shutdown() {
  {
    std::lock_guard<std::mutex> lock(mtx_);
    shutting_down_ = true;
    std::queue<std::unique_ptr<sqlite::database>>().swap(idle_);
  }
  cv_.notify_all();
}

size_t ConnectionPool::available() {
  std::lock_guard<std::mutex> lock(mtx_);
  return idle_.size();
}

}  // namespace rag_core
