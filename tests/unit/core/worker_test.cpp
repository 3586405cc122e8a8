#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <thread>

#include "mocks_test.hpp"
#include "rag_core/async/ingest_payload.hpp"
#include "rag_core/async/service_provider.hpp"
#include "rag_core/async/worker.hpp"
#include "rag_core/errors.hpp"
#include "rag_core/llm/ollama_client.hpp"
#include "rag_core/services/ingestion_pipeline.hpp"
#include "utilities_test.hpp"

namespace rag_tests {

using namespace rag_core;
using namespace rag_core::async;
using ::testing::_;
using ::testing::DoDefault;
using ::testing::HasSubstr;
using ::testing::NiceMock;
using ::testing::Throw;

class WorkerTest : public ChunkStoreTestBase {
 protected:
  void SetUp() override {
    ChunkStoreTestBase::SetUp();
    provider_ = std::make_shared<NiceMock<MockEmbeddingProvider>>();
    auto adapter = std::make_shared<EmbeddingAdapter>(provider_, TEST_DIMENSION);
    RetryPolicy no_retry;
    no_retry.max_attempts = 1;
    pipeline_ = std::make_shared<IngestionPipeline>(chunk_store_, std::make_shared<Chunker>(),
                                                    adapter, document_repo_, no_retry);
    service_provider_ = std::make_shared<ServiceProvider>(pipeline_, task_queue_repo_);
    worker_ = std::make_unique<Worker>(1, service_provider_, std::chrono::milliseconds(10));
  }

  void TearDown() override {
    worker_.reset();
    service_provider_.reset();
    pipeline_.reset();
    ChunkStoreTestBase::TearDown();
  }

  long long queue_ingest(long long file_id, const std::string& text, int priority = 10) {
    IngestPayload payload;
    payload.text = text;
    NewIngestTask task{.task_type = TASK_TYPE_INGEST_DOCUMENT,
                       .file_id = file_id,
                       .subject_code = std::string("CS101"),
                       .file_type = FileType::Pdf,
                       .payload = encode_ingest_payload(payload),
                       .priority = priority};
    return task_queue_repo_->create_task(task);
  }

  long long queue_delete(long long file_id) {
    NewIngestTask task{.task_type = TASK_TYPE_DELETE_DOCUMENT, .file_id = file_id};
    return task_queue_repo_->create_task(task);
  }

  std::shared_ptr<NiceMock<MockEmbeddingProvider>> provider_;
  std::shared_ptr<IngestionPipeline> pipeline_;
  std::shared_ptr<ServiceProvider> service_provider_;
  std::unique_ptr<Worker> worker_;
};

TEST_F(WorkerTest, RunOneTaskWithNoPendingTasks) {
  EXPECT_FALSE(worker_->run_one_task());
}

TEST_F(WorkerTest, RunsIngestTaskToCompletion) {
  long long task_id = queue_ingest(7, "page one\fpage two");

  EXPECT_TRUE(worker_->run_one_task());

  auto task = task_queue_repo_->get_task(task_id);
  ASSERT_TRUE(task.has_value());
  EXPECT_EQ(task->status, TaskStatus::COMPLETED);
  EXPECT_EQ(chunk_store_->list_by_file(7).size(), 2u);

  auto progress = task_queue_repo_->get_task_progress(task_id);
  ASSERT_TRUE(progress.has_value());
  EXPECT_FLOAT_EQ(progress->progress_percent, 1.0f);
}

TEST_F(WorkerTest, RunsDeleteTask) {
  queue_ingest(7, "content");
  worker_->run_one_task();
  long long delete_id = queue_delete(7);

  EXPECT_TRUE(worker_->run_one_task());
  EXPECT_EQ(task_queue_repo_->get_task(delete_id)->status, TaskStatus::COMPLETED);
  EXPECT_TRUE(chunk_store_->list_by_file(7).empty());
  EXPECT_FALSE(document_repo_->get_document(7).has_value());
}

TEST_F(WorkerTest, FailedIngestMarksTaskFailed) {
  ON_CALL(*provider_, get_embedding(_))
      .WillByDefault(Throw(OllamaError("connection refused", true)));
  long long task_id = queue_ingest(8, "doomed");

  EXPECT_TRUE(worker_->run_one_task());

  auto task = task_queue_repo_->get_task(task_id);
  ASSERT_TRUE(task.has_value());
  EXPECT_EQ(task->status, TaskStatus::FAILED);
  EXPECT_THAT(task->error_message, HasSubstr("EMBEDDING"));
  EXPECT_EQ(document_repo_->get_document(8)->stage, IngestionStage::FAILED);
}

TEST_F(WorkerTest, UnknownTaskTypeMarksTaskFailed) {
  NewIngestTask bogus{.task_type = "SUMMARIZE", .file_id = 3};
  long long task_id = task_queue_repo_->create_task(bogus);

  EXPECT_TRUE(worker_->run_one_task());
  auto task = task_queue_repo_->get_task(task_id);
  EXPECT_EQ(task->status, TaskStatus::FAILED);
  EXPECT_THAT(task->error_message, HasSubstr("Unknown task type"));
}

TEST_F(WorkerTest, ProcessesTasksInPriorityOrder) {
  long long low = queue_ingest(1, "low priority", 20);
  long long high = queue_ingest(2, "high priority", 1);

  worker_->run_one_task();
  EXPECT_EQ(task_queue_repo_->get_task(high)->status, TaskStatus::COMPLETED);
  EXPECT_EQ(task_queue_repo_->get_task(low)->status, TaskStatus::PENDING);
}

TEST_F(WorkerTest, BackgroundLoopDrainsQueue) {
  queue_ingest(1, "first");
  queue_ingest(2, "second");
  queue_ingest(3, "third");

  worker_->start();
  auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
  while (task_queue_repo_->get_tasks_by_status(TaskStatus::COMPLETED).size() < 3 &&
         std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  worker_->stop();

  EXPECT_EQ(task_queue_repo_->get_tasks_by_status(TaskStatus::COMPLETED).size(), 3u);
  EXPECT_EQ(chunk_store_->count_chunks(), 3);
}

TEST_F(WorkerTest, StartTwiceThrows) {
  worker_->start();
  EXPECT_THROW(worker_->start(), std::runtime_error);
  worker_->stop();
}

// Same worker over a task queue whose status writes can be made to fail.
class WorkerOutcomeTest : public WorkerTest {
 protected:
  void SetUp() override {
    WorkerTest::SetUp();
    worker_.reset();
    repo_ = std::make_shared<NiceMock<MockTaskQueueRepo>>(*db_manager_);
    task_queue_repo_ = repo_;
    service_provider_ = std::make_shared<ServiceProvider>(pipeline_, task_queue_repo_);
    worker_ = std::make_unique<Worker>(1, service_provider_, std::chrono::milliseconds(10));

    EXPECT_CALL(*repo_, update_task_status(_, _)).WillRepeatedly(DoDefault());
    EXPECT_CALL(*repo_, mark_task_as_failed(_, _)).WillRepeatedly(DoDefault());
  }

  void TearDown() override {
    worker_.reset();
    repo_.reset();
    WorkerTest::TearDown();
  }

  std::shared_ptr<NiceMock<MockTaskQueueRepo>> repo_;
};

TEST_F(WorkerOutcomeTest, CompletedStatusIsRetriedAfterTransientFailure) {
  long long task_id = queue_ingest(7, "page one");
  EXPECT_CALL(*repo_, update_task_status(task_id, TaskStatus::COMPLETED))
      .WillOnce(Throw(StorageUnavailable("database is locked")))
      .RetiresOnSaturation();

  EXPECT_TRUE(worker_->run_one_task());

  EXPECT_EQ(task_queue_repo_->get_task(task_id)->status, TaskStatus::COMPLETED);
  EXPECT_EQ(worker_->unrecorded_outcome_count(), 0u);

  long long next = queue_ingest(7, "page one again");
  EXPECT_TRUE(worker_->run_one_task());
  EXPECT_EQ(task_queue_repo_->get_task(next)->status, TaskStatus::COMPLETED);
}

TEST_F(WorkerOutcomeTest, FailedStatusIsRetriedAfterTransientFailure) {
  ON_CALL(*provider_, get_embedding(_))
      .WillByDefault(Throw(OllamaError("connection refused", true)));
  long long task_id = queue_ingest(8, "doomed");
  EXPECT_CALL(*repo_, mark_task_as_failed(task_id, _))
      .WillOnce(Throw(StorageUnavailable("database is locked")))
      .RetiresOnSaturation();

  EXPECT_TRUE(worker_->run_one_task());

  EXPECT_EQ(task_queue_repo_->get_task(task_id)->status, TaskStatus::FAILED);
  EXPECT_EQ(worker_->unrecorded_outcome_count(), 0u);
}

TEST_F(WorkerOutcomeTest, UnrecordedOutcomeIsSettledBeforeNextClaim) {
  long long first = queue_ingest(7, "first version");
  EXPECT_CALL(*repo_, update_task_status(first, TaskStatus::COMPLETED))
      .Times(Worker::OUTCOME_WRITE_ATTEMPTS)
      .WillRepeatedly(Throw(StorageUnavailable("disk I/O error")))
      .RetiresOnSaturation();

  EXPECT_TRUE(worker_->run_one_task());
  EXPECT_EQ(task_queue_repo_->get_task(first)->status, TaskStatus::PROCESSING);
  EXPECT_EQ(worker_->unrecorded_outcome_count(), 1u);

  // The file stays claimable: the stored outcome is written before claiming.
  long long second = queue_ingest(7, "second version");
  EXPECT_TRUE(worker_->run_one_task());

  EXPECT_EQ(worker_->unrecorded_outcome_count(), 0u);
  EXPECT_EQ(task_queue_repo_->get_task(first)->status, TaskStatus::COMPLETED);
  EXPECT_EQ(task_queue_repo_->get_task(second)->status, TaskStatus::COMPLETED);
  ASSERT_EQ(chunk_store_->list_by_file(7).size(), 1u);
  EXPECT_EQ(chunk_store_->list_by_file(7)[0].content, "second version");
}

}  // namespace rag_tests
