#pragma once

#include "rag_core/db/connection_pool.hpp"
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>

namespace rag_core {

// Owns the connection pool for one database file. Passed explicitly to every
// repository; there is no process-wide instance.
class DatabaseManager {
public:
    DatabaseManager() = default;
    ~DatabaseManager();

    // Creates the ancillary tables and opens the pool. doc_chunks is owned by
    // SchemaMigrator and is not created here.
    void initialize(const std::filesystem::path& db_path, int pool_size);

    // These methods are used by the PooledConnection guard
    std::unique_ptr<sqlite::database> get_connection();
    void return_connection(std::unique_ptr<sqlite::database> conn);

    void shutdown();

    bool is_initialized() const;
    const std::filesystem::path& db_path() const { return db_path_; }

    DatabaseManager(const DatabaseManager&) = delete;
    DatabaseManager& operator=(const DatabaseManager&) = delete;

private:
    void setup_schema(const std::filesystem::path& db_path);

    mutable std::mutex mtx_;
    std::shared_ptr<ConnectionPool> pool_;
    std::filesystem::path db_path_;
    bool is_initialized_ = false;
};

} // namespace rag_core
