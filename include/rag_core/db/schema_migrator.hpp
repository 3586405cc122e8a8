#pragma once

#include <optional>
#include <string>
#include <vector>

#include "rag_core/db/database_manager.hpp"
#include "rag_core/types/file_type.hpp"

namespace rag_core {

struct MigrationOptions {
  // Copy rows from the legacy single-type table into doc_chunks.
  bool copy_legacy = false;
  // Drop the legacy table. Refused unless its rows have been copied.
  bool drop_legacy = false;
  std::string legacy_table = "pdf_chunks";
  FileType legacy_file_type = FileType::Pdf;
  // Assigned to legacy rows whose file_id is NULL or absent.
  long long orphan_file_id = 0;
};

struct MigrationReport {
  bool created_table = false;
  bool legacy_found = false;
  bool copied = false;
  long long rows_copied = 0;
  long long rows_skipped = 0;
  bool legacy_dropped = false;
  bool already_migrated = false;
};

struct AppliedMigration {
  long long version = 0;
  std::string name;
  std::string applied_at;
};

/**
 * Brings the chunk schema to the generalized doc_chunks layout.
 *
 * Every run is additive and idempotent: steps already recorded in
 * schema_migrations are skipped. The whole run happens in one IMMEDIATE
 * transaction, so a failure leaves the database as it was.
 */
class SchemaMigrator {
 public:
  SchemaMigrator(DatabaseManager& db_manager, int embedding_dimension);

  MigrationReport migrate(const MigrationOptions& options = {});

  bool is_migrated();
  std::optional<int> stored_dimension();
  std::vector<AppliedMigration> applied_migrations();

  static constexpr const char* CHUNK_TABLE = "doc_chunks";

 private:
  struct LegacyColumns {
    bool file_id = false;
    bool subject_code = false;
    bool chunk_index = false;
    bool file_type = false;
    bool section_label = false;
    bool created_at = false;
  };

  void create_bookkeeping_tables(sqlite::database& db);
  void create_chunk_table(sqlite::database& db);
  void check_dimension(sqlite::database& db);
  long long copy_legacy_rows(sqlite::database& db, const MigrationOptions& options,
                             long long& skipped);
  LegacyColumns inspect_legacy_table(sqlite::database& db, const std::string& table);

  static bool table_exists(sqlite::database& db, const std::string& table);
  static bool migration_recorded(sqlite::database& db, const std::string& name);
  static void record_migration(sqlite::database& db, const std::string& name);
  static void validate_identifier(const std::string& name);

  DatabaseManager& db_manager_;
  int dimension_;
};

}  // namespace rag_core
