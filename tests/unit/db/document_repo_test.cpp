#include <gtest/gtest.h>

#include <string>

#include "rag_core/db/document_repo.hpp"
#include "utilities_test.hpp"

namespace rag_tests {

using namespace rag_core;

class DocumentRepoTest : public ChunkStoreTestBase {};

TEST_F(DocumentRepoTest, BeginIngestion_CreatesPendingRecord) {
  document_repo_->begin_ingestion(7, std::string("CS101"), FileType::Pdf, "hash-1");

  auto record = document_repo_->get_document(7);
  ASSERT_TRUE(record.has_value());
  EXPECT_EQ(record->file_id, 7);
  EXPECT_EQ(record->subject_code, std::optional<std::string>("CS101"));
  EXPECT_EQ(record->file_type, FileType::Pdf);
  EXPECT_EQ(record->content_hash, "hash-1");
  EXPECT_EQ(record->stage, IngestionStage::PENDING);
  EXPECT_FALSE(record->failed_stage.has_value());
  EXPECT_EQ(record->chunk_count, 0);
  EXPECT_FALSE(record->error_message.has_value());
}

TEST_F(DocumentRepoTest, GetDocument_MissingReturnsEmpty) {
  EXPECT_FALSE(document_repo_->get_document(404).has_value());
}

TEST_F(DocumentRepoTest, UpdateStage_TracksProgress) {
  document_repo_->begin_ingestion(1, std::nullopt, FileType::Text, "h");
  document_repo_->update_stage(1, IngestionStage::CHUNKING);
  EXPECT_EQ(document_repo_->get_document(1)->stage, IngestionStage::CHUNKING);
  document_repo_->update_stage(1, IngestionStage::EMBEDDING);
  EXPECT_EQ(document_repo_->get_document(1)->stage, IngestionStage::EMBEDDING);
}

TEST_F(DocumentRepoTest, MarkDone_RecordsChunkCount) {
  document_repo_->begin_ingestion(2, std::nullopt, FileType::Slide, "h");
  document_repo_->mark_done(2, 12);

  auto record = document_repo_->get_document(2);
  ASSERT_TRUE(record.has_value());
  EXPECT_EQ(record->stage, IngestionStage::DONE);
  EXPECT_EQ(record->chunk_count, 12);
  EXPECT_FALSE(record->subject_code.has_value());
}

TEST_F(DocumentRepoTest, MarkFailed_KeepsFailingStageAndMessage) {
  document_repo_->begin_ingestion(3, std::nullopt, FileType::Doc, "h");
  document_repo_->update_stage(3, IngestionStage::EMBEDDING);
  document_repo_->mark_failed(3, IngestionStage::EMBEDDING, "embedding service unreachable");

  auto record = document_repo_->get_document(3);
  ASSERT_TRUE(record.has_value());
  EXPECT_EQ(record->stage, IngestionStage::FAILED);
  ASSERT_TRUE(record->failed_stage.has_value());
  EXPECT_EQ(*record->failed_stage, IngestionStage::EMBEDDING);
  EXPECT_EQ(record->error_message, std::optional<std::string>("embedding service unreachable"));
  EXPECT_EQ(record->chunk_count, 0);
}

TEST_F(DocumentRepoTest, BeginIngestion_ResetsFailedRecord) {
  document_repo_->begin_ingestion(4, std::string("MA201"), FileType::Pdf, "old");
  document_repo_->mark_failed(4, IngestionStage::PERSISTING, "disk full");

  document_repo_->begin_ingestion(4, std::string("MA202"), FileType::Csv, "new");

  auto record = document_repo_->get_document(4);
  ASSERT_TRUE(record.has_value());
  EXPECT_EQ(record->stage, IngestionStage::PENDING);
  EXPECT_FALSE(record->failed_stage.has_value());
  EXPECT_FALSE(record->error_message.has_value());
  EXPECT_EQ(record->content_hash, "new");
  EXPECT_EQ(record->file_type, FileType::Csv);
  EXPECT_EQ(record->subject_code, std::optional<std::string>("MA202"));
}

TEST_F(DocumentRepoTest, MarkDone_ClearsPreviousFailure) {
  document_repo_->begin_ingestion(5, std::nullopt, FileType::Pdf, "h");
  document_repo_->mark_failed(5, IngestionStage::CHUNKING, "bad input");
  document_repo_->mark_done(5, 3);

  auto record = document_repo_->get_document(5);
  EXPECT_EQ(record->stage, IngestionStage::DONE);
  EXPECT_FALSE(record->failed_stage.has_value());
  EXPECT_FALSE(record->error_message.has_value());
}

TEST_F(DocumentRepoTest, RemoveDocument_DeletesRecord) {
  document_repo_->begin_ingestion(6, std::nullopt, FileType::Image, "h");
  document_repo_->remove_document(6);
  EXPECT_FALSE(document_repo_->get_document(6).has_value());
  EXPECT_NO_THROW(document_repo_->remove_document(6));
}

TEST_F(DocumentRepoTest, Timestamps_AreSet) {
  auto before = std::chrono::system_clock::now() - std::chrono::seconds(2);
  document_repo_->begin_ingestion(8, std::nullopt, FileType::Pdf, "h");
  auto record = document_repo_->get_document(8);
  ASSERT_TRUE(record.has_value());
  EXPECT_GE(record->created_at, before);
  EXPECT_GE(record->updated_at, record->created_at);
}

}  // namespace rag_tests
