#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

#include "rag_core/chunking/chunker.hpp"
#include "rag_core/db/chunk_store.hpp"
#include "rag_core/db/document_repo.hpp"
#include "rag_core/llm/embedding_adapter.hpp"
#include "rag_core/types/progress.hpp"

namespace rag_core {

// Bounded exponential backoff for retryable embedding failures.
struct RetryPolicy {
  int max_attempts = 3;
  std::chrono::milliseconds initial_backoff{200};
  double multiplier = 2.0;
  std::chrono::milliseconds max_backoff{5000};
};

/**
 * Turns one document into its persisted chunk set.
 *
 * Stages run PENDING -> CHUNKING -> EMBEDDING -> PERSISTING -> DONE and are
 * recorded on the document record. Any failure deletes the document's chunks,
 * records FAILED with the failing stage and throws IngestionError. Work on the
 * same file_id is serialized: a second concurrent call is rejected with
 * IngestionInFlightError.
 */
class IngestionPipeline {
 public:
  using Sleeper = std::function<void(std::chrono::milliseconds)>;

  IngestionPipeline(std::shared_ptr<ChunkStore> chunk_store,
                    std::shared_ptr<Chunker> chunker,
                    std::shared_ptr<EmbeddingAdapter> embedding_adapter,
                    std::shared_ptr<DocumentRepo> document_repo,
                    RetryPolicy retry_policy = {},
                    Sleeper sleeper = {});
  virtual ~IngestionPipeline() = default;

  // Returns the number of chunks written.
  virtual size_t ingest(long long file_id,
                        const std::optional<std::string>& subject_code,
                        FileType file_type,
                        const std::string& document_text,
                        const ChunkingHints& hints = {},
                        const ProgressUpdater& on_progress = {});

  virtual size_t ingest_sections(long long file_id,
                                 const std::optional<std::string>& subject_code,
                                 FileType file_type,
                                 const std::vector<Section>& sections,
                                 const ChunkingHints& hints = {},
                                 const ProgressUpdater& on_progress = {});

  // Deletes the document's chunks and its record. Returns the chunks removed.
  virtual size_t remove(long long file_id);

  bool is_in_flight(long long file_id) const;

 private:
  class InFlightGuard {
   public:
    InFlightGuard(IngestionPipeline& pipeline, long long file_id);
    ~InFlightGuard();
    InFlightGuard(const InFlightGuard&) = delete;
    InFlightGuard& operator=(const InFlightGuard&) = delete;

   private:
    IngestionPipeline& pipeline_;
    long long file_id_;
  };

  size_t run(long long file_id,
             const std::optional<std::string>& subject_code,
             FileType file_type,
             const std::string& content_hash,
             const std::function<std::vector<Segment>()>& produce_segments,
             const ProgressUpdater& on_progress);

  std::vector<float> embed_with_retry(const std::string& text);

  [[noreturn]] void fail(long long file_id, IngestionStage stage, const std::string& message);

  std::shared_ptr<ChunkStore> chunk_store_;
  std::shared_ptr<Chunker> chunker_;
  std::shared_ptr<EmbeddingAdapter> embedding_adapter_;
  std::shared_ptr<DocumentRepo> document_repo_;
  RetryPolicy retry_policy_;
  Sleeper sleeper_;

  mutable std::mutex in_flight_mutex_;
  std::unordered_set<long long> in_flight_;
};

}  // namespace rag_core
