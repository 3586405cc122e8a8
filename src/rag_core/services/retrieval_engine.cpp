#include "rag_core/services/retrieval_engine.hpp"

#include <unordered_set>

#include "rag_core/chunking/text_utils.hpp"
#include "rag_core/errors.hpp"

namespace rag_core {

RetrievalEngine::RetrievalEngine(std::shared_ptr<ChunkStore> chunk_store,
                                 std::shared_ptr<EmbeddingAdapter> embedding_adapter)
    : chunk_store_(std::move(chunk_store)), embedding_adapter_(std::move(embedding_adapter)) {}

std::vector<float> RetrievalEngine::embed_query(const std::string& query_text) {
  if (is_blank(query_text)) {
    throw ValidationError("Query text must not be empty");
  }
  return embedding_adapter_->embed(query_text);
}

std::vector<ScoredChunk> RetrievalEngine::retrieve(const std::string& query_text,
                                                   const ChunkFilter& filter,
                                                   int k) {
  if (k <= 0) {
    throw ValidationError("k must be positive, got " + std::to_string(k));
  }
  if (filter.subject_code && is_blank(*filter.subject_code)) {
    throw ValidationError("subject_code filter must not be empty");
  }

  std::vector<float> query_vector = embed_query(query_text);
  std::vector<ChunkMatch> matches = chunk_store_->query(query_vector, filter, k);

  std::vector<ScoredChunk> results;
  results.reserve(matches.size());
  for (auto& match : matches) {
    results.push_back({.chunk = std::move(match.chunk), .score = -match.distance});
  }
  return results;
}

std::vector<ScoredChunk> RetrievalEngine::retrieve(const std::string& query_text,
                                                   const std::optional<std::string>& subject_code,
                                                   const std::optional<FileType>& file_type,
                                                   int k) {
  ChunkFilter filter;
  filter.subject_code = subject_code;
  filter.file_type = file_type;
  return retrieve(query_text, filter, k);
}

std::vector<DocumentHit> RetrievalEngine::search_documents(const std::string& query_text,
                                                           const ChunkFilter& filter,
                                                           int limit) {
  if (limit <= 0) {
    throw ValidationError("limit must be positive, got " + std::to_string(limit));
  }
  std::vector<ScoredChunk> chunks = retrieve(query_text, filter, DOCUMENT_SEARCH_CANDIDATES);

  // Chunks arrive best first, so the first chunk seen per file is its best.
  std::vector<DocumentHit> hits;
  std::unordered_set<long long> seen;
  for (const auto& scored : chunks) {
    if (static_cast<int>(hits.size()) >= limit) {
      break;
    }
    if (!seen.insert(scored.chunk.file_id).second) {
      continue;
    }
    DocumentHit hit;
    hit.file_id = scored.chunk.file_id;
    hit.subject_code = scored.chunk.subject_code;
    hit.file_type = scored.chunk.file_type;
    hit.section_label = scored.chunk.section_label;
    hit.chunk_index = scored.chunk.chunk_index;
    hit.snippet = truncate_code_points(scored.chunk.content, SNIPPET_CHARS);
    hit.score = scored.score;
    hits.push_back(std::move(hit));
  }
  return hits;
}

}  // namespace rag_core
