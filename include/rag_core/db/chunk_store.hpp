#pragma once
#include <faiss/Index.h>
#include <faiss/IndexFlat.h>
#include <faiss/IndexHNSW.h>
#include <faiss/IndexIDMap.h>
#include <faiss/impl/IDSelector.h>
#include <sqlite_modern_cpp.h>

#include <atomic>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

#include "rag_core/db/database_manager.hpp"
#include "rag_core/types/chunk.hpp"

namespace rag_core {

enum class SimilarityIndexKind { Flat, Hnsw };

std::string to_string(SimilarityIndexKind kind);
SimilarityIndexKind similarity_index_kind_from_string(const std::string& str);

struct SimilarityIndexOptions {
  SimilarityIndexKind kind = SimilarityIndexKind::Hnsw;
  int hnsw_m = 32;
  int hnsw_ef_construction = 100;
  int hnsw_ef_search = 64;
};

/**
 * Durable chunk table plus the in-memory similarity index over it.
 *
 * Rows live in doc_chunks (created by SchemaMigrator). The faiss index is keyed
 * by chunk id and rebuilt lazily: committed writes mark it stale and the next
 * query rebuilds it from a single read of the table.
 */
class ChunkStore {
 public:
  ChunkStore(DatabaseManager& db_manager,
             int embedding_dimension,
             SimilarityIndexOptions index_options = {});
  ~ChunkStore();

  ChunkStore(const ChunkStore&) = delete;
  ChunkStore& operator=(const ChunkStore&) = delete;
  ChunkStore(ChunkStore&&) = delete;
  ChunkStore& operator=(ChunkStore&&) = delete;

  int dimension() const {
    return dimension_;
  }

  long long create_chunk(const NewChunk& chunk);

  // All rows or none.
  std::vector<long long> create_chunks(const std::vector<NewChunk>& chunks);

  // Deletes the file's chunks and inserts the new set in one transaction.
  std::vector<long long> replace_file_chunks(long long file_id, const std::vector<NewChunk>& chunks);

  size_t bulk_delete_by_file(long long file_id);

  std::vector<Chunk> list_by_file(long long file_id);

  long long count_chunks(const ChunkFilter& filter = {});

  // Ascending squared L2 distance; equal distances order by (file_id, chunk_index).
  std::vector<ChunkMatch> query(const std::vector<float>& query_vector,
                                const ChunkFilter& filter,
                                int k);

  void rebuild_index();

  // faiss searches run so far; a query runs more than one only when the
  // k-th result ties with candidates beyond it.
  size_t index_search_count() const {
    return index_searches_.load();
  }

  void validate_vector(const std::vector<float>& vector, const std::string& what) const;

  // Absent, or 1 to 50 characters that are not all whitespace.
  static void validate_subject_code(const std::optional<std::string>& subject_code);

 private:
  void verify_schema();
  void validate_new_chunks(const std::vector<NewChunk>& chunks) const;
  std::vector<long long> insert_chunks(sqlite::database& db, const std::vector<NewChunk>& chunks);
  void ensure_index_fresh();
  void rebuild_index_locked();
  std::unique_ptr<faiss::IndexIDMap> create_base_index() const;
  std::vector<long long> candidate_ids(const ChunkFilter& filter);
  std::vector<Chunk> hydrate(const std::vector<long long>& ids);

  static std::vector<char> to_blob(const std::vector<float>& vector);
  static std::string ids_to_comma_string(const std::vector<long long>& ids);

  DatabaseManager& db_manager_;
  const int dimension_;
  const SimilarityIndexOptions index_options_;

  std::shared_mutex index_mutex_;
  std::unique_ptr<faiss::IndexIDMap> faiss_index_;
  std::atomic<bool> index_dirty_{true};
  std::atomic<size_t> index_searches_{0};
};

}  // namespace rag_core
