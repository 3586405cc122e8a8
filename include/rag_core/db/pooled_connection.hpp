#pragma once

#include <sqlite_modern_cpp.h>

#include <memory>

#include "rag_core/db/database_manager.hpp"
#include "rag_core/errors.hpp"

namespace rag_core {

// Borrows one connection from the manager's pool for the guard's lifetime.
// Blocks while every connection is out; throws StorageUnavailable once the
// pool has been shut down.
class PooledConnection {
 public:
  explicit PooledConnection(DatabaseManager& manager)
      : manager_(manager), conn_(manager.get_connection()) {
    if (!conn_) {
      throw StorageUnavailable("No database connection available: pool is shutting down");
    }
  }

  ~PooledConnection() {
    if (conn_) {
      manager_.return_connection(std::move(conn_));
    }
  }

  PooledConnection(const PooledConnection&) = delete;
  PooledConnection& operator=(const PooledConnection&) = delete;

  sqlite::database& get() const {
    return *conn_;
  }
  sqlite::database* operator->() const {
    return conn_.get();
  }
  sqlite::database& operator*() const {
    return *conn_;
  }

 private:
  DatabaseManager& manager_;
  std::unique_ptr<sqlite::database> conn_;
};

}  // namespace rag_core
