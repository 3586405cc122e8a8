#include <gtest/gtest.h>

#include <stdexcept>
#include <string>

#include "rag_core/async/ingest_document_task.hpp"
#include "rag_core/async/task_factory.hpp"
#include "rag_core/errors.hpp"

namespace rag_tests {

using namespace rag_core;

namespace {

IngestTask make_record(const std::string& task_type) {
  IngestTask record;
  record.id = 42;
  record.task_type = task_type;
  record.file_id = 7;
  record.status = TaskStatus::PROCESSING;
  record.created_at = std::chrono::system_clock::now();
  record.updated_at = record.created_at;
  return record;
}

}  // namespace

TEST(TaskFactoryTest, CreatesIngestDocumentTask) {
  IngestTask record = make_record(TASK_TYPE_INGEST_DOCUMENT);
  record.subject_code = "CS101";
  record.file_type = FileType::Slide;
  record.payload = R"({"text":"slide one\fslide two","max_chunk_chars":250})";

  ITaskPtr task = TaskFactory::create_task(record);
  ASSERT_NE(task, nullptr);
  EXPECT_STREQ(task->get_type(), TASK_TYPE_INGEST_DOCUMENT);
  EXPECT_EQ(task->get_id(), 42);
  EXPECT_EQ(task->get_file_id(), 7);
  EXPECT_EQ(task->get_status(), TaskStatus::PROCESSING);

  auto* ingest = dynamic_cast<IngestDocumentTask*>(task.get());
  ASSERT_NE(ingest, nullptr);
  EXPECT_EQ(ingest->get_payload().text, std::optional<std::string>("slide one\fslide two"));
  EXPECT_EQ(ingest->get_payload().max_chunk_chars, std::optional<size_t>(250));
}

TEST(TaskFactoryTest, CreatesDeleteDocumentTask) {
  ITaskPtr task = TaskFactory::create_task(make_record(TASK_TYPE_DELETE_DOCUMENT));
  ASSERT_NE(task, nullptr);
  EXPECT_STREQ(task->get_type(), TASK_TYPE_DELETE_DOCUMENT);
  EXPECT_NE(dynamic_cast<DeleteDocumentTask*>(task.get()), nullptr);
}

TEST(TaskFactoryTest, ThrowsOnUnknownType) {
  EXPECT_THROW(TaskFactory::create_task(make_record("SUMMARIZE")), std::runtime_error);
}

TEST(TaskFactoryTest, IngestWithoutFileTypeIsRejected) {
  IngestTask record = make_record(TASK_TYPE_INGEST_DOCUMENT);
  record.payload = R"({"text":"x"})";
  EXPECT_THROW(TaskFactory::create_task(record), std::runtime_error);
}

TEST(TaskFactoryTest, IngestWithBrokenPayloadIsRejected) {
  IngestTask record = make_record(TASK_TYPE_INGEST_DOCUMENT);
  record.file_type = FileType::Text;
  record.payload = "{not json";
  EXPECT_THROW(TaskFactory::create_task(record), ValidationError);
}

}  // namespace rag_tests
