#pragma once

#include <sqlite_modern_cpp.h>

#include <iostream>

namespace rag_core {

// DEFERRED takes the write lock on first write; IMMEDIATE takes it at BEGIN,
// so concurrent writers queue on busy_timeout instead of failing mid-way.
enum class TransactionMode { Deferred, Immediate };

// Scoped transaction. Rolls back unless commit() was reached.
class Transaction {
 public:
  explicit Transaction(sqlite::database& db, TransactionMode mode = TransactionMode::Deferred)
      : db_(db) {
    db_ << (mode == TransactionMode::Immediate ? "BEGIN IMMEDIATE;" : "BEGIN DEFERRED;");
    active_ = true;
  }

  Transaction(const Transaction&) = delete;
  Transaction& operator=(const Transaction&) = delete;

  void commit() {
    if (!active_) {
      return;
    }
    db_ << "COMMIT;";
    active_ = false;
  }

  void rollback() {
    if (!active_) {
      return;
    }
    active_ = false;
    db_ << "ROLLBACK;";
  }

  bool is_active() const {
    return active_;
  }

  ~Transaction() noexcept {
    if (!active_) {
      return;
    }
    try {
      db_ << "ROLLBACK;";
    } catch (const std::exception& e) {
      std::cerr << "Warning: transaction rollback failed: " << e.what() << std::endl;
    }
  }

 private:
  sqlite::database& db_;
  bool active_ = false;
};

}  // namespace rag_core
