#pragma once

#include <sqlite3.h>
#include <sqlite_modern_cpp.h>

#include <string>

#include "rag_core/errors.hpp"

namespace rag_core {

// Coarse buckets over SQLite primary result codes.
enum class DbErrorKind { BusyOrLocked, Constraint, Io, CantOpen, Corrupt, Generic };

inline DbErrorKind classify_sqlite_code(int code) {
  switch (code & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return DbErrorKind::BusyOrLocked;
    case SQLITE_CONSTRAINT:
      return DbErrorKind::Constraint;
    case SQLITE_IOERR:
    case SQLITE_FULL:
      return DbErrorKind::Io;
    case SQLITE_CANTOPEN:
      return DbErrorKind::CantOpen;
    case SQLITE_CORRUPT:
    case SQLITE_NOTADB:
      return DbErrorKind::Corrupt;
    default:
      return DbErrorKind::Generic;
  }
}

inline const char* kind_name(DbErrorKind kind) {
  switch (kind) {
    case DbErrorKind::BusyOrLocked: return "busy";
    case DbErrorKind::Constraint: return "constraint";
    case DbErrorKind::Io: return "io";
    case DbErrorKind::CantOpen: return "cantopen";
    case DbErrorKind::Corrupt: return "corrupt";
    case DbErrorKind::Generic: break;
  }
  return "error";
}

// Storage is temporarily out of reach; the same call may succeed later.
inline bool is_transient(DbErrorKind kind) {
  return kind == DbErrorKind::BusyOrLocked || kind == DbErrorKind::Io ||
         kind == DbErrorKind::CantOpen;
}

inline DbErrorKind classify(const sqlite::sqlite_exception& e) {
  return classify_sqlite_code(e.get_code());
}

inline std::string format_db_error(const std::string& operation, const sqlite::sqlite_exception& e) {
  return operation + " failed (" + kind_name(classify(e)) + "): " + e.what() +
         " [code=" + std::to_string(e.get_code()) +
         ", xcode=" + std::to_string(e.get_extended_code()) + "]";
}

// Transient failures surface as StorageUnavailable, everything else as E.
template <typename E>
[[noreturn]] inline void throw_db_error(const std::string& operation,
                                        const sqlite::sqlite_exception& e) {
  if (is_transient(classify(e))) {
    throw StorageUnavailable(format_db_error(operation, e));
  }
  throw E(format_db_error(operation, e));
}

}  // namespace rag_core
