#include "rag_core/db/database_manager.hpp"

#include <iostream>
#include <stdexcept>

#include "rag_core/db/sqlite_error_utils.hpp"
#include "rag_core/errors.hpp"

namespace rag_core {

DatabaseManager::~DatabaseManager() {
  shutdown();
}

void DatabaseManager::initialize(const std::filesystem::path& db_path, int pool_size) {
  std::lock_guard<std::mutex> lock(mtx_);
  if (is_initialized_) {
    return;
  }

  if (db_path.has_parent_path()) {
    std::filesystem::create_directories(db_path.parent_path());
  }

  try {
    // 1. Perform one-time schema setup before creating the pool
    setup_schema(db_path);

    // 2. Create the connection pool for workers to use
    pool_ = std::make_shared<ConnectionPool>(db_path.string(), pool_size);
  } catch (const sqlite::sqlite_exception& e) {
    throw StorageUnavailable(format_db_error("initialize", e));
  }

  db_path_ = db_path;
  is_initialized_ = true;
}

void DatabaseManager::shutdown() {
  std::lock_guard<std::mutex> lock(mtx_);
  if (!is_initialized_) {
    return;
  }
  pool_->shutdown();
  is_initialized_ = false;
}

bool DatabaseManager::is_initialized() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return is_initialized_;
}

std::unique_ptr<sqlite::database> DatabaseManager::get_connection() {
  std::shared_ptr<ConnectionPool> pool;
  {
    std::lock_guard<std::mutex> lock(mtx_);
    if (!is_initialized_) {
      throw StorageUnavailable("DatabaseManager has not been initialized.");
    }
    pool = pool_;
  }
  // Waiting happens outside the lock so shutdown() can wake blocked callers.
  return pool->get_connection();
}

void DatabaseManager::return_connection(std::unique_ptr<sqlite::database> conn) {
  std::shared_ptr<ConnectionPool> pool;
  {
    std::lock_guard<std::mutex> lock(mtx_);
    if (!is_initialized_) {
      return;
    }
    pool = pool_;
  }
  pool->return_connection(std::move(conn));
}

void DatabaseManager::setup_schema(const std::filesystem::path& db_path) {
  // Use a temporary, single-use connection just for schema setup.
  sqlite::database db(db_path.string());
  if (!db.connection()) {
    throw StorageUnavailable("Setup: Failed to get native database handle.");
  }
  ConnectionPool::configure_connection(db);

  db << R"(
      CREATE TABLE IF NOT EXISTS documents (
          file_id INTEGER PRIMARY KEY,
          subject_code TEXT,
          file_type TEXT NOT NULL,
          content_hash TEXT NOT NULL,
          stage TEXT NOT NULL DEFAULT 'PENDING',
          failed_stage TEXT,
          chunk_count INTEGER NOT NULL DEFAULT 0,
          error_message TEXT,
          created_at TEXT NOT NULL,
          updated_at TEXT NOT NULL
      )
    )";

  db << R"(
      CREATE TABLE IF NOT EXISTS ingest_tasks (
          id INTEGER PRIMARY KEY AUTOINCREMENT,
          task_type TEXT NOT NULL,
          file_id INTEGER NOT NULL,
          subject_code TEXT,
          file_type TEXT,
          payload TEXT,
          status TEXT NOT NULL DEFAULT 'PENDING',
          priority INTEGER NOT NULL DEFAULT 10,
          error_message TEXT,
          created_at TEXT NOT NULL,
          updated_at TEXT NOT NULL
      )
    )";

  db << R"(
      CREATE TABLE IF NOT EXISTS task_progress (
          task_id INTEGER PRIMARY KEY,
          progress_percent REAL NOT NULL DEFAULT 0.0,
          status_message TEXT NOT NULL DEFAULT 'Initializing...',
          updated_at TEXT NOT NULL,
          FOREIGN KEY (task_id) REFERENCES ingest_tasks(id) ON DELETE CASCADE
      )
    )";

  db << R"(
      CREATE INDEX IF NOT EXISTS idx_ingest_tasks_status_priority
      ON ingest_tasks(status, priority, created_at)
    )";
  db << "CREATE INDEX IF NOT EXISTS idx_ingest_tasks_file_id ON ingest_tasks(file_id)";

  std::cout << "Database schema ready at " << db_path.string() << std::endl;
}

}  // namespace rag_core
