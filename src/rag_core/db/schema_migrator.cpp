#include "rag_core/db/schema_migrator.hpp"

#include <iostream>
#include <regex>
#include <stdexcept>

#include "rag_core/db/pooled_connection.hpp"
#include "rag_core/db/sqlite_error_utils.hpp"
#include "rag_core/db/time_utils.hpp"
#include "rag_core/db/transaction.hpp"
#include "rag_core/errors.hpp"

namespace rag_core {

namespace {

const char* const MIGRATION_CREATE = "create_doc_chunks";
const char* const DIMENSION_KEY = "embedding_dimension";
// ASCII whitespace set used by the content checks.
const char* const WHITESPACE_SQL = "char(32,9,10,11,12,13)";

std::string copy_migration_name(const std::string& table) {
  return "copy_legacy:" + table;
}

std::string drop_migration_name(const std::string& table) {
  return "drop_legacy:" + table;
}

std::string file_type_list_sql() {
  std::string list;
  for (FileType type : all_file_types()) {
    if (!list.empty()) {
      list += ",";
    }
    list += "'" + to_string(type) + "'";
  }
  return list;
}

}  // namespace

SchemaMigrator::SchemaMigrator(DatabaseManager& db_manager, int embedding_dimension)
    : db_manager_(db_manager), dimension_(embedding_dimension) {
  if (embedding_dimension <= 0) {
    throw ValidationError("Embedding dimension must be positive, got " +
                          std::to_string(embedding_dimension));
  }
}

MigrationReport SchemaMigrator::migrate(const MigrationOptions& options) {
  if (options.copy_legacy || options.drop_legacy) {
    validate_identifier(options.legacy_table);
  }

  MigrationReport report;
  try {
    PooledConnection conn(db_manager_);
    Transaction tx(*conn, TransactionMode::Immediate);

    create_bookkeeping_tables(*conn);

    if (table_exists(*conn, CHUNK_TABLE)) {
      check_dimension(*conn);
    } else {
      create_chunk_table(*conn);
      record_migration(*conn, MIGRATION_CREATE);
      report.created_table = true;
    }

    const bool legacy_exists = (options.copy_legacy || options.drop_legacy) &&
                               table_exists(*conn, options.legacy_table);
    report.legacy_found = legacy_exists;

    if (options.copy_legacy) {
      const std::string step = copy_migration_name(options.legacy_table);
      if (!legacy_exists) {
        std::cout << "Legacy table '" << options.legacy_table << "' not found, nothing to copy."
                  << std::endl;
      } else if (migration_recorded(*conn, step)) {
        std::cout << "Legacy table '" << options.legacy_table << "' was already copied."
                  << std::endl;
      } else {
        long long skipped = 0;
        report.rows_copied = copy_legacy_rows(*conn, options, skipped);
        report.rows_skipped = skipped;
        record_migration(*conn, step);
        report.copied = true;
      }
    }

    if (options.drop_legacy && legacy_exists) {
      if (!migration_recorded(*conn, copy_migration_name(options.legacy_table))) {
        throw MigrationError("Refusing to drop legacy table '" + options.legacy_table +
                             "' before its rows have been copied");
      }
      *conn << "DROP TABLE " + options.legacy_table;
      record_migration(*conn, drop_migration_name(options.legacy_table));
      report.legacy_dropped = true;
    }

    tx.commit();
  } catch (const sqlite::sqlite_exception& e) {
    throw MigrationError(format_db_error("migrate", e));
  }

  report.already_migrated = !report.created_table && !report.copied && !report.legacy_dropped;
  std::cout << "Schema migration finished: created_table=" << report.created_table
            << " rows_copied=" << report.rows_copied << " rows_skipped=" << report.rows_skipped
            << " legacy_dropped=" << report.legacy_dropped << std::endl;
  return report;
}

bool SchemaMigrator::is_migrated() {
  try {
    PooledConnection conn(db_manager_);
    return table_exists(*conn, CHUNK_TABLE);
  } catch (const sqlite::sqlite_exception& e) {
    throw_db_error<MigrationError>("is_migrated", e);
  }
}

std::optional<int> SchemaMigrator::stored_dimension() {
  try {
    PooledConnection conn(db_manager_);
    if (!table_exists(*conn, "schema_meta")) {
      return std::nullopt;
    }
    std::optional<int> result;
    *conn << "SELECT value FROM schema_meta WHERE key = ?" << DIMENSION_KEY >>
        [&](std::string value) { result = std::stoi(value); };
    return result;
  } catch (const sqlite::sqlite_exception& e) {
    throw_db_error<MigrationError>("stored_dimension", e);
  }
}

std::vector<AppliedMigration> SchemaMigrator::applied_migrations() {
  std::vector<AppliedMigration> result;
  try {
    PooledConnection conn(db_manager_);
    if (!table_exists(*conn, "schema_migrations")) {
      return result;
    }
    *conn << "SELECT version, name, applied_at FROM schema_migrations ORDER BY version" >>
        [&](long long version, std::string name, std::string applied_at) {
          result.push_back({version, std::move(name), std::move(applied_at)});
        };
  } catch (const sqlite::sqlite_exception& e) {
    throw_db_error<MigrationError>("applied_migrations", e);
  }
  return result;
}

void SchemaMigrator::create_bookkeeping_tables(sqlite::database& db) {
  db << R"(
      CREATE TABLE IF NOT EXISTS schema_migrations (
          version INTEGER PRIMARY KEY AUTOINCREMENT,
          name TEXT UNIQUE NOT NULL,
          applied_at TEXT NOT NULL
      )
    )";
  db << R"(
      CREATE TABLE IF NOT EXISTS schema_meta (
          key TEXT PRIMARY KEY,
          value TEXT NOT NULL
      )
    )";
}

void SchemaMigrator::create_chunk_table(sqlite::database& db) {
  const std::string blob_bytes = std::to_string(static_cast<long long>(dimension_) * 4);
  db << std::string(R"(
      CREATE TABLE doc_chunks (
          id INTEGER PRIMARY KEY AUTOINCREMENT,
          file_id INTEGER NOT NULL,
          subject_code TEXT CHECK (subject_code IS NULL OR length(subject_code) <= 50),
          content TEXT NOT NULL CHECK (length(trim(content, )") +
            WHITESPACE_SQL + R"()) > 0),
          embedding BLOB NOT NULL CHECK (typeof(embedding) = 'blob' AND length(embedding) = )" +
            blob_bytes + R"(),
          chunk_index INTEGER NOT NULL CHECK (chunk_index >= 0),
          file_type TEXT NOT NULL DEFAULT 'pdf' CHECK (file_type IN ()" + file_type_list_sql() +
            R"()),
          section_label TEXT,
          created_at TEXT NOT NULL,
          UNIQUE (file_id, chunk_index)
      )
    )");
  db << "CREATE INDEX IF NOT EXISTS idx_doc_chunks_file_id ON doc_chunks(file_id)";
  db << "CREATE INDEX IF NOT EXISTS idx_doc_chunks_subject_code ON doc_chunks(subject_code)";
  db << "CREATE INDEX IF NOT EXISTS idx_doc_chunks_file_type ON doc_chunks(file_type)";

  db << "INSERT OR REPLACE INTO schema_meta (key, value) VALUES (?, ?)" << DIMENSION_KEY
     << std::to_string(dimension_);
}

void SchemaMigrator::check_dimension(sqlite::database& db) {
  std::optional<int> stored;
  db << "SELECT value FROM schema_meta WHERE key = ?" << DIMENSION_KEY >>
      [&](std::string value) { stored = std::stoi(value); };

  if (!stored) {
    // Table predates dimension bookkeeping; the CHECK constraint cannot be read back,
    // so adopt the configured value.
    db << "INSERT INTO schema_meta (key, value) VALUES (?, ?)" << DIMENSION_KEY
       << std::to_string(dimension_);
    return;
  }
  if (*stored != dimension_) {
    throw MigrationError("doc_chunks stores " + std::to_string(*stored) +
                         "-dimensional embeddings but " + std::to_string(dimension_) +
                         " is configured");
  }
}

SchemaMigrator::LegacyColumns SchemaMigrator::inspect_legacy_table(sqlite::database& db,
                                                                    const std::string& table) {
  LegacyColumns columns;
  bool has_content = false;
  bool has_embedding = false;
  db << "PRAGMA table_info(" + table + ")" >>
      [&](int /*cid*/, std::string name, std::string /*type*/, int /*notnull*/,
          std::optional<std::string> /*dflt_value*/, int /*pk*/) {
        if (name == "content") has_content = true;
        else if (name == "embedding") has_embedding = true;
        else if (name == "file_id") columns.file_id = true;
        else if (name == "subject_code") columns.subject_code = true;
        else if (name == "chunk_index") columns.chunk_index = true;
        else if (name == "file_type") columns.file_type = true;
        else if (name == "section_label") columns.section_label = true;
        else if (name == "created_at") columns.created_at = true;
      };

  if (!has_content || !has_embedding) {
    throw MigrationError("Legacy table '" + table +
                         "' must have 'content' and 'embedding' columns");
  }
  return columns;
}

long long SchemaMigrator::copy_legacy_rows(sqlite::database& db,
                                           const MigrationOptions& options,
                                           long long& skipped) {
  const std::string& table = options.legacy_table;
  const LegacyColumns cols = inspect_legacy_table(db, table);

  const std::string blob_bytes = std::to_string(static_cast<long long>(dimension_) * 4);
  const std::string orphan = std::to_string(options.orphan_file_id);
  const std::string default_type = "'" + to_string(options.legacy_file_type) + "'";
  const std::string now = "'" + now_string() + "'";

  const std::string file_id_expr =
      cols.file_id ? "COALESCE(file_id, " + orphan + ")" : orphan;
  const std::string subject_expr =
      cols.subject_code
          ? "CASE WHEN length(trim(subject_code)) > 0 THEN substr(trim(subject_code), 1, 50) "
            "ELSE NULL END"
          : "NULL";
  const std::string order_expr = cols.chunk_index ? "chunk_index, rowid" : "rowid";
  const std::string type_expr =
      cols.file_type ? "CASE WHEN lower(file_type) IN (" + file_type_list_sql() +
                           ") THEN lower(file_type) ELSE " + default_type + " END"
                     : default_type;
  const std::string label_expr = cols.section_label ? "section_label" : "NULL";
  const std::string created_expr =
      cols.created_at ? "COALESCE(strftime('%Y-%m-%d %H:%M:%S', created_at), " + now + ")" : now;
  const std::string eligible = "typeof(embedding) = 'blob' AND length(embedding) = " +
                               blob_bytes + " AND content IS NOT NULL AND length(trim(CAST(content AS TEXT), " +
                               WHITESPACE_SQL + ")) > 0";

  long long total = 0;
  db << "SELECT count(*) FROM " + table >> total;

  // Legacy rows are appended after any chunks their file already has, keeping
  // their original relative order.
  db << "INSERT INTO doc_chunks (file_id, subject_code, content, embedding, chunk_index, "
        "file_type, section_label, created_at) "
        "SELECT src.fid, src.subject_code, src.content, src.embedding, "
        "COALESCE(base.next_index, 0) + src.rn - 1, src.file_type, src.section_label, "
        "src.created_at FROM ("
        "SELECT " + file_id_expr + " AS fid, " + subject_expr + " AS subject_code, "
        "CAST(content AS TEXT) AS content, embedding, "
        "ROW_NUMBER() OVER (PARTITION BY " + file_id_expr + " ORDER BY " + order_expr + ") AS rn, " +
        type_expr + " AS file_type, " + label_expr + " AS section_label, " + created_expr +
        " AS created_at FROM " + table + " WHERE " + eligible +
        ") AS src LEFT JOIN ("
        "SELECT file_id, MAX(chunk_index) + 1 AS next_index FROM doc_chunks GROUP BY file_id"
        ") AS base ON base.file_id = src.fid";

  long long copied = 0;
  db << "SELECT changes()" >> copied;

  skipped = total - copied;
  std::cout << "Copied " << copied << " rows from " << table << " into doc_chunks" << std::endl;
  if (skipped > 0) {
    std::cerr << "Warning: Skipped " << skipped << " rows from " << table
              << " with empty content or an embedding that is not " << dimension_
              << " float32 values." << std::endl;
  }
  return copied;
}

bool SchemaMigrator::table_exists(sqlite::database& db, const std::string& table) {
  int count = 0;
  db << "SELECT count(*) FROM sqlite_master WHERE type = 'table' AND name = ?" << table >> count;
  return count > 0;
}

bool SchemaMigrator::migration_recorded(sqlite::database& db, const std::string& name) {
  int count = 0;
  db << "SELECT count(*) FROM schema_migrations WHERE name = ?" << name >> count;
  return count > 0;
}

void SchemaMigrator::record_migration(sqlite::database& db, const std::string& name) {
  db << "INSERT INTO schema_migrations (name, applied_at) VALUES (?, ?)" << name << now_string();
}

void SchemaMigrator::validate_identifier(const std::string& name) {
  static const std::regex identifier(R"(^[A-Za-z_][A-Za-z0-9_]*$)");
  if (!std::regex_match(name, identifier)) {
    throw MigrationError("Invalid legacy table name: '" + name + "'");
  }
  if (name == CHUNK_TABLE || name == "schema_migrations" || name == "schema_meta") {
    throw MigrationError("Legacy table name '" + name + "' is reserved");
  }
}

}  // namespace rag_core
