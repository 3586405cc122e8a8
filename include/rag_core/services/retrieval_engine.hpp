#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "rag_core/db/chunk_store.hpp"
#include "rag_core/llm/embedding_adapter.hpp"

namespace rag_core {

// Best-matching chunk of one document.
struct DocumentHit {
  long long file_id = 0;
  std::optional<std::string> subject_code;
  FileType file_type = FileType::Pdf;
  std::optional<std::string> section_label;
  int chunk_index = 0;
  std::string snippet;
  float score = 0.0f;
};

class RetrievalEngine {
 public:
  static constexpr int DOCUMENT_SEARCH_CANDIDATES = 25;
  static constexpr size_t SNIPPET_CHARS = 200;

  RetrievalEngine(std::shared_ptr<ChunkStore> chunk_store,
                  std::shared_ptr<EmbeddingAdapter> embedding_adapter);
  virtual ~RetrievalEngine() = default;

  // Top k chunks by descending score (negated squared L2 distance). Equal
  // scores order by file_id, then chunk_index.
  virtual std::vector<ScoredChunk> retrieve(const std::string& query_text,
                                            const ChunkFilter& filter,
                                            int k);

  std::vector<ScoredChunk> retrieve(const std::string& query_text,
                                    const std::optional<std::string>& subject_code,
                                    const std::optional<FileType>& file_type,
                                    int k);

  // Groups the nearest chunks by document and keeps each document's best one.
  virtual std::vector<DocumentHit> search_documents(const std::string& query_text,
                                                    const ChunkFilter& filter,
                                                    int limit = 10);

 private:
  std::vector<float> embed_query(const std::string& query_text);

  std::shared_ptr<ChunkStore> chunk_store_;
  std::shared_ptr<EmbeddingAdapter> embedding_adapter_;
};

}  // namespace rag_core
