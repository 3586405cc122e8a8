#include "rag_core/services/ingestion_pipeline.hpp"

#include <algorithm>
#include <iostream>
#include <thread>

#include "rag_core/errors.hpp"
#include "rag_core/utils/content_hash.hpp"

namespace rag_core {

IngestionPipeline::InFlightGuard::InFlightGuard(IngestionPipeline& pipeline, long long file_id)
    : pipeline_(pipeline), file_id_(file_id) {
  std::lock_guard<std::mutex> lock(pipeline_.in_flight_mutex_);
  if (!pipeline_.in_flight_.insert(file_id_).second) {
    throw IngestionInFlightError(file_id_);
  }
}

IngestionPipeline::InFlightGuard::~InFlightGuard() {
  std::lock_guard<std::mutex> lock(pipeline_.in_flight_mutex_);
  pipeline_.in_flight_.erase(file_id_);
}

IngestionPipeline::IngestionPipeline(std::shared_ptr<ChunkStore> chunk_store,
                                     std::shared_ptr<Chunker> chunker,
                                     std::shared_ptr<EmbeddingAdapter> embedding_adapter,
                                     std::shared_ptr<DocumentRepo> document_repo,
                                     RetryPolicy retry_policy,
                                     Sleeper sleeper)
    : chunk_store_(std::move(chunk_store)),
      chunker_(std::move(chunker)),
      embedding_adapter_(std::move(embedding_adapter)),
      document_repo_(std::move(document_repo)),
      retry_policy_(retry_policy),
      sleeper_(std::move(sleeper)) {
  if (!sleeper_) {
    sleeper_ = [](std::chrono::milliseconds delay) { std::this_thread::sleep_for(delay); };
  }
  if (retry_policy_.max_attempts < 1) {
    throw ValidationError("RetryPolicy.max_attempts must be at least 1");
  }
}

bool IngestionPipeline::is_in_flight(long long file_id) const {
  std::lock_guard<std::mutex> lock(in_flight_mutex_);
  return in_flight_.count(file_id) > 0;
}

size_t IngestionPipeline::ingest(long long file_id,
                                 const std::optional<std::string>& subject_code,
                                 FileType file_type,
                                 const std::string& document_text,
                                 const ChunkingHints& hints,
                                 const ProgressUpdater& on_progress) {
  // Bad input is rejected before the document record is touched.
  ChunkStore::validate_subject_code(subject_code);
  chunker_->effective_profile(file_type, hints);

  return run(file_id, subject_code, file_type, compute_content_hash(document_text),
             [&]() { return chunker_->chunk(document_text, file_type, hints); }, on_progress);
}

size_t IngestionPipeline::ingest_sections(long long file_id,
                                          const std::optional<std::string>& subject_code,
                                          FileType file_type,
                                          const std::vector<Section>& sections,
                                          const ChunkingHints& hints,
                                          const ProgressUpdater& on_progress) {
  ChunkStore::validate_subject_code(subject_code);
  chunker_->effective_profile(file_type, hints);

  return run(file_id, subject_code, file_type, compute_sections_hash(sections),
             [&]() { return chunker_->chunk_sections(sections, file_type, hints); },
             on_progress);
}

size_t IngestionPipeline::run(long long file_id,
                              const std::optional<std::string>& subject_code,
                              FileType file_type,
                              const std::string& content_hash,
                              const std::function<std::vector<Segment>()>& produce_segments,
                              const ProgressUpdater& on_progress) {
  InFlightGuard guard(*this, file_id);
  auto report = [&](float percent, const std::string& message) {
    if (on_progress) {
      on_progress(percent, message);
    }
  };

  IngestionStage stage = IngestionStage::PENDING;
  try {
    document_repo_->begin_ingestion(file_id, subject_code, file_type, content_hash);
    chunk_store_->bulk_delete_by_file(file_id);
    report(0.0f, "Starting ingestion...");

    stage = IngestionStage::CHUNKING;
    document_repo_->update_stage(file_id, stage);
    std::vector<Segment> segments = produce_segments();
    report(0.1f, "Chunked into " + std::to_string(segments.size()) + " segments.");

    if (segments.empty()) {
      std::cerr << "Warning: file " << file_id << " produced no chunks" << std::endl;
      document_repo_->mark_done(file_id, 0);
      report(1.0f, "No content to index.");
      return 0;
    }

    stage = IngestionStage::EMBEDDING;
    document_repo_->update_stage(file_id, stage);
    std::vector<NewChunk> chunks;
    chunks.reserve(segments.size());
    for (size_t i = 0; i < segments.size(); ++i) {
      NewChunk chunk;
      chunk.file_id = file_id;
      chunk.subject_code = subject_code;
      chunk.content = segments[i].content;
      chunk.embedding = embed_with_retry(segments[i].content);
      chunk.chunk_index = static_cast<int>(i);
      chunk.file_type = file_type;
      chunk.section_label = segments[i].section_label;
      chunks.push_back(std::move(chunk));

      if (i % 10 == 0 || i + 1 == segments.size()) {
        float progress = 0.1f + (0.8f * (static_cast<float>(i + 1) / segments.size()));
        report(progress, "Embedding chunk " + std::to_string(i + 1) + " of " +
                             std::to_string(segments.size()));
      }
    }

    stage = IngestionStage::PERSISTING;
    document_repo_->update_stage(file_id, stage);
    chunk_store_->replace_file_chunks(file_id, chunks);

    document_repo_->mark_done(file_id, static_cast<int>(chunks.size()));
    report(1.0f, "Ingestion complete.");
    std::cout << "Ingested file " << file_id << ": " << chunks.size() << " chunks" << std::endl;
    return chunks.size();
  } catch (const IngestionError&) {
    throw;
  } catch (const std::exception& e) {
    fail(file_id, stage, e.what());
  }
}

std::vector<float> IngestionPipeline::embed_with_retry(const std::string& text) {
  std::chrono::milliseconds backoff = retry_policy_.initial_backoff;
  for (int attempt = 1;; ++attempt) {
    try {
      return embedding_adapter_->embed(text);
    } catch (const EmbeddingError& e) {
      if (!e.retryable() || attempt >= retry_policy_.max_attempts) {
        throw;
      }
      std::cerr << "Warning: embedding attempt " << attempt << " of "
                << retry_policy_.max_attempts << " failed: " << e.what() << ". Retrying in "
                << backoff.count() << "ms" << std::endl;
      sleeper_(backoff);
      auto next = std::chrono::milliseconds(
          static_cast<long long>(backoff.count() * retry_policy_.multiplier));
      backoff = std::min(next, retry_policy_.max_backoff);
    }
  }
}

void IngestionPipeline::fail(long long file_id, IngestionStage stage, const std::string& message) {
  std::cerr << "Ingestion of file " << file_id << " failed during " << to_string(stage) << ": "
            << message << std::endl;
  try {
    chunk_store_->bulk_delete_by_file(file_id);
  } catch (const std::exception& cleanup_error) {
    std::cerr << "Warning: could not delete chunks of failed file " << file_id << ": "
              << cleanup_error.what() << std::endl;
  }
  try {
    document_repo_->mark_failed(file_id, stage, message);
  } catch (const std::exception& record_error) {
    std::cerr << "Warning: could not record failure of file " << file_id << ": "
              << record_error.what() << std::endl;
  }
  throw IngestionError(stage, file_id, message);
}

size_t IngestionPipeline::remove(long long file_id) {
  InFlightGuard guard(*this, file_id);
  size_t removed = chunk_store_->bulk_delete_by_file(file_id);
  document_repo_->remove_document(file_id);
  std::cout << "Removed file " << file_id << ": " << removed << " chunks" << std::endl;
  return removed;
}

}  // namespace rag_core
