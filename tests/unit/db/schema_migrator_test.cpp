#include <gtest/gtest.h>

#include "rag_core/db/chunk_store.hpp"
#include "rag_core/db/pooled_connection.hpp"
#include "rag_core/db/schema_migrator.hpp"
#include "rag_core/errors.hpp"
#include "utilities_test.hpp"

namespace rag_tests {

using namespace rag_core;

class SchemaMigratorTest : public DatabaseTestBase {
 protected:
  void create_minimal_legacy_table() {
    PooledConnection conn(*db_manager_);
    *conn << "CREATE TABLE pdf_chunks (id INTEGER PRIMARY KEY, content TEXT, embedding BLOB)";
  }

  void insert_minimal_legacy_row(const std::string& content, const std::vector<float>& embedding) {
    PooledConnection conn(*db_manager_);
    *conn << "INSERT INTO pdf_chunks (content, embedding) VALUES (?, ?)" << content
          << TestUtilities::to_blob(embedding);
  }

  SchemaMigrator migrator() {
    return SchemaMigrator(*db_manager_, TEST_DIMENSION);
  }
};

TEST_F(SchemaMigratorTest, FirstRunCreatesChunkTable) {
  auto m = migrator();
  EXPECT_FALSE(m.is_migrated());

  MigrationReport report = m.migrate();

  EXPECT_TRUE(report.created_table);
  EXPECT_FALSE(report.already_migrated);
  EXPECT_TRUE(m.is_migrated());
  EXPECT_EQ(m.stored_dimension(), std::optional<int>(TEST_DIMENSION));
  auto applied = m.applied_migrations();
  ASSERT_EQ(applied.size(), 1u);
  EXPECT_EQ(applied[0].name, "create_doc_chunks");
}

TEST_F(SchemaMigratorTest, SecondRunChangesNothing) {
  auto m = migrator();
  m.migrate();
  MigrationReport report = m.migrate();

  EXPECT_FALSE(report.created_table);
  EXPECT_TRUE(report.already_migrated);
  EXPECT_EQ(m.applied_migrations().size(), 1u);
}

TEST_F(SchemaMigratorTest, CopiesLegacyRowsWithoutFileId) {
  create_minimal_legacy_table();
  insert_minimal_legacy_row("first legacy chunk", TestUtilities::axis_vector(0));
  insert_minimal_legacy_row("second legacy chunk", TestUtilities::axis_vector(1));

  MigrationOptions options;
  options.copy_legacy = true;
  MigrationReport report = migrator().migrate(options);

  EXPECT_TRUE(report.created_table);
  EXPECT_TRUE(report.legacy_found);
  EXPECT_TRUE(report.copied);
  EXPECT_EQ(report.rows_copied, 2);
  EXPECT_EQ(report.rows_skipped, 0);

  SimilarityIndexOptions index_options;
  index_options.kind = SimilarityIndexKind::Flat;
  ChunkStore store(*db_manager_, TEST_DIMENSION, index_options);
  auto chunks = store.list_by_file(0);
  ASSERT_EQ(chunks.size(), 2u);
  EXPECT_EQ(chunks[0].content, "first legacy chunk");
  EXPECT_EQ(chunks[0].chunk_index, 0);
  EXPECT_EQ(chunks[1].content, "second legacy chunk");
  EXPECT_EQ(chunks[1].chunk_index, 1);
  for (const auto& chunk : chunks) {
    EXPECT_EQ(chunk.file_type, FileType::Pdf);
    EXPECT_FALSE(chunk.subject_code.has_value());
    EXPECT_FALSE(chunk.section_label.has_value());
  }

  // Migrated rows are searchable.
  auto matches = store.query(TestUtilities::axis_vector(1), {}, 1);
  ASSERT_EQ(matches.size(), 1u);
  EXPECT_EQ(matches[0].chunk.content, "second legacy chunk");
}

TEST_F(SchemaMigratorTest, RerunDoesNotCopyTwice) {
  create_minimal_legacy_table();
  insert_minimal_legacy_row("only row", TestUtilities::axis_vector(0));

  MigrationOptions options;
  options.copy_legacy = true;
  migrator().migrate(options);
  MigrationReport second = migrator().migrate(options);

  EXPECT_FALSE(second.copied);
  EXPECT_EQ(second.rows_copied, 0);
  EXPECT_TRUE(second.already_migrated);

  ChunkStore store(*db_manager_, TEST_DIMENSION);
  EXPECT_EQ(store.count_chunks(), 1);
}

TEST_F(SchemaMigratorTest, SkipsInvalidLegacyRows) {
  create_minimal_legacy_table();
  insert_minimal_legacy_row("good row", TestUtilities::axis_vector(0));
  insert_minimal_legacy_row("short vector", std::vector<float>(3, 1.0f));
  insert_minimal_legacy_row("   ", TestUtilities::axis_vector(2));

  MigrationOptions options;
  options.copy_legacy = true;
  MigrationReport report = migrator().migrate(options);

  EXPECT_EQ(report.rows_copied, 1);
  EXPECT_EQ(report.rows_skipped, 2);
}

TEST_F(SchemaMigratorTest, KeepsLegacyFileIdsAndRenumbersIndices) {
  {
    PooledConnection conn(*db_manager_);
    *conn << "CREATE TABLE pdf_chunks (id INTEGER PRIMARY KEY, file_id INTEGER, "
             "subject_code TEXT, chunk_index INTEGER, content TEXT, embedding BLOB)";
    auto insert = [&](std::optional<long long> file_id, std::optional<std::string> subject,
                      int chunk_index, const std::string& content) {
      *conn << "INSERT INTO pdf_chunks (file_id, subject_code, chunk_index, content, embedding) "
               "VALUES (?, ?, ?, ?, ?)"
            << file_id << subject << chunk_index << content
            << TestUtilities::to_blob(TestUtilities::axis_vector(chunk_index));
    };
    insert(5, std::string("CS101"), 3, "file five later");
    insert(5, std::string("CS101"), 1, "file five earlier");
    insert(6, std::string(""), 0, "file six");
    insert(std::nullopt, std::nullopt, 0, "orphan");
  }

  MigrationOptions options;
  options.copy_legacy = true;
  options.orphan_file_id = 99;
  MigrationReport report = migrator().migrate(options);
  EXPECT_EQ(report.rows_copied, 4);

  ChunkStore store(*db_manager_, TEST_DIMENSION);
  auto five = store.list_by_file(5);
  ASSERT_EQ(five.size(), 2u);
  EXPECT_EQ(five[0].content, "file five earlier");
  EXPECT_EQ(five[0].chunk_index, 0);
  EXPECT_EQ(five[1].content, "file five later");
  EXPECT_EQ(five[1].chunk_index, 1);
  EXPECT_EQ(five[0].subject_code, std::optional<std::string>("CS101"));

  auto six = store.list_by_file(6);
  ASSERT_EQ(six.size(), 1u);
  EXPECT_FALSE(six[0].subject_code.has_value());

  EXPECT_EQ(store.list_by_file(99).size(), 1u);
}

TEST_F(SchemaMigratorTest, UsesConfiguredLegacyFileType) {
  create_minimal_legacy_table();
  insert_minimal_legacy_row("a slide", TestUtilities::axis_vector(0));

  MigrationOptions options;
  options.copy_legacy = true;
  options.legacy_file_type = FileType::Slide;
  migrator().migrate(options);

  ChunkStore store(*db_manager_, TEST_DIMENSION);
  auto chunks = store.list_by_file(0);
  ASSERT_EQ(chunks.size(), 1u);
  EXPECT_EQ(chunks[0].file_type, FileType::Slide);
}

TEST_F(SchemaMigratorTest, MissingLegacyTableIsNotAnError) {
  MigrationOptions options;
  options.copy_legacy = true;
  MigrationReport report = migrator().migrate(options);
  EXPECT_FALSE(report.legacy_found);
  EXPECT_FALSE(report.copied);
}

TEST_F(SchemaMigratorTest, RefusesToDropBeforeCopy) {
  create_minimal_legacy_table();
  insert_minimal_legacy_row("keep me", TestUtilities::axis_vector(0));

  MigrationOptions options;
  options.drop_legacy = true;
  EXPECT_THROW(migrator().migrate(options), MigrationError);
  EXPECT_TRUE(table_exists("pdf_chunks"));
  // The failed run rolled back entirely.
  EXPECT_FALSE(table_exists("doc_chunks"));
}

TEST_F(SchemaMigratorTest, DropsLegacyTableAfterCopy) {
  create_minimal_legacy_table();
  insert_minimal_legacy_row("moved", TestUtilities::axis_vector(0));

  MigrationOptions options;
  options.copy_legacy = true;
  options.drop_legacy = true;
  MigrationReport report = migrator().migrate(options);

  EXPECT_TRUE(report.copied);
  EXPECT_TRUE(report.legacy_dropped);
  EXPECT_FALSE(table_exists("pdf_chunks"));
}

TEST_F(SchemaMigratorTest, RejectsLegacyTableWithoutEmbedding) {
  {
    PooledConnection conn(*db_manager_);
    *conn << "CREATE TABLE pdf_chunks (id INTEGER PRIMARY KEY, content TEXT)";
  }
  MigrationOptions options;
  options.copy_legacy = true;
  EXPECT_THROW(migrator().migrate(options), MigrationError);
}

TEST_F(SchemaMigratorTest, RejectsUnsafeLegacyTableNames) {
  MigrationOptions options;
  options.copy_legacy = true;
  options.legacy_table = "pdf_chunks; DROP TABLE documents";
  EXPECT_THROW(migrator().migrate(options), MigrationError);

  options.legacy_table = "doc_chunks";
  EXPECT_THROW(migrator().migrate(options), MigrationError);
}

TEST_F(SchemaMigratorTest, RejectsDimensionChange) {
  migrator().migrate();
  SchemaMigrator wider(*db_manager_, TEST_DIMENSION * 2);
  EXPECT_THROW(wider.migrate(), MigrationError);
}

TEST_F(SchemaMigratorTest, RejectsNonPositiveDimension) {
  EXPECT_THROW({ SchemaMigrator bad(*db_manager_, 0); }, ValidationError);
}

TEST_F(SchemaMigratorTest, ChunkTableEnforcesConstraints) {
  migrator().migrate();
  PooledConnection conn(*db_manager_);
  auto insert = [&](const std::string& content, const std::vector<float>& embedding,
                    int chunk_index, const std::string& file_type) {
    *conn << "INSERT INTO doc_chunks (file_id, content, embedding, chunk_index, file_type, "
             "created_at) VALUES (1, ?, ?, ?, ?, '2024-01-01 00:00:00')"
          << content << TestUtilities::to_blob(embedding) << chunk_index << file_type;
  };

  EXPECT_NO_THROW(insert("valid", TestUtilities::axis_vector(0), 0, "pdf"));
  EXPECT_THROW(insert("duplicate index", TestUtilities::axis_vector(0), 0, "pdf"),
               sqlite::sqlite_exception);
  EXPECT_THROW(insert("bad vector", std::vector<float>(2, 0.0f), 1, "pdf"),
               sqlite::sqlite_exception);
  EXPECT_THROW(insert(" \n ", TestUtilities::axis_vector(0), 2, "pdf"), sqlite::sqlite_exception);
  EXPECT_THROW(insert("bad type", TestUtilities::axis_vector(0), 3, "spreadsheet"),
               sqlite::sqlite_exception);
  EXPECT_THROW(insert("negative", TestUtilities::axis_vector(0), -1, "pdf"),
               sqlite::sqlite_exception);
}

}  // namespace rag_tests
