#pragma once

#include <sqlite_modern_cpp.h>

#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <queue>
#include <string>

namespace rag_core {

// Fixed set of SQLite handles opened up front against one database file.
class ConnectionPool {
 public:
  ConnectionPool(const std::string& db_path, int pool_size);

  // Blocks until a connection is free. Throws StorageUnavailable once shut down.
  std::unique_ptr<sqlite::database> get_connection();

  // Connections returned after shutdown are closed instead of pooled.
  void return_connection(std::unique_ptr<sqlite::database> conn);
  void shutdown();

  int size() const {
    return pool_size_;
  }
  // Connections currently idle in the pool.
  size_t available();

  // Applies the per-connection pragmas every handle needs.
  static void configure_connection(sqlite::database& db);

 private:
  std::string db_path_;
  int pool_size_;
  bool shutting_down_ = false;
  std::queue<std::unique_ptr<sqlite::database>> idle_;
  std::mutex mtx_;
  std::condition_variable cv_;
};

}  // namespace rag_core
