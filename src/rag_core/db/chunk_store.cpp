#include "rag_core/db/chunk_store.hpp"

#include <algorithm>
#include <cmath>
#include <cstring>
#include <iostream>
#include <sstream>
#include <unordered_map>

#include "rag_core/chunking/text_utils.hpp"
#include "rag_core/db/pooled_connection.hpp"
#include "rag_core/db/schema_migrator.hpp"
#include "rag_core/db/sqlite_error_utils.hpp"
#include "rag_core/db/time_utils.hpp"
#include "rag_core/db/transaction.hpp"
#include "rag_core/errors.hpp"

namespace rag_core {

namespace {

constexpr size_t MAX_SUBJECT_CODE_LENGTH = 50;

bool nearly_equal(float a, float b) {
  const float scale = std::max(1.0f, std::max(std::fabs(a), std::fabs(b)));
  return std::fabs(a - b) <= 1e-6f * scale;
}

bool by_position(const ChunkMatch& a, const ChunkMatch& b) {
  if (a.chunk.file_id != b.chunk.file_id) {
    return a.chunk.file_id < b.chunk.file_id;
  }
  return a.chunk.chunk_index < b.chunk.chunk_index;
}

Chunk make_chunk(long long id, long long file_id, std::optional<std::string> subject_code,
                 std::string content, const std::vector<char>& embedding_blob, int chunk_index,
                 const std::string& file_type, std::optional<std::string> section_label,
                 const std::string& created_at) {
  Chunk chunk;
  chunk.id = id;
  chunk.file_id = file_id;
  chunk.subject_code = std::move(subject_code);
  chunk.content = std::move(content);
  chunk.embedding.resize(embedding_blob.size() / sizeof(float));
  std::memcpy(chunk.embedding.data(), embedding_blob.data(),
              chunk.embedding.size() * sizeof(float));
  chunk.chunk_index = chunk_index;
  chunk.file_type = file_type_from_string(file_type);
  chunk.section_label = std::move(section_label);
  chunk.created_at = string_to_time_point(created_at);
  return chunk;
}

const char* const CHUNK_COLUMNS =
    "id, file_id, subject_code, content, embedding, chunk_index, file_type, section_label, "
    "created_at";

}  // namespace

std::string to_string(SimilarityIndexKind kind) {
  return kind == SimilarityIndexKind::Flat ? "flat" : "hnsw";
}

SimilarityIndexKind similarity_index_kind_from_string(const std::string& str) {
  if (str == "flat") return SimilarityIndexKind::Flat;
  if (str == "hnsw") return SimilarityIndexKind::Hnsw;
  throw ValidationError("Unknown similarity index kind: '" + str + "' (expected flat or hnsw)");
}

ChunkStore::ChunkStore(DatabaseManager& db_manager,
                       int embedding_dimension,
                       SimilarityIndexOptions index_options)
    : db_manager_(db_manager), dimension_(embedding_dimension), index_options_(index_options) {
  if (dimension_ <= 0) {
    throw ValidationError("Embedding dimension must be positive");
  }
  verify_schema();
}

ChunkStore::~ChunkStore() = default;

void ChunkStore::verify_schema() {
  SchemaMigrator migrator(db_manager_, dimension_);
  if (!migrator.is_migrated()) {
    throw MigrationError("Table doc_chunks does not exist; run the schema migration first");
  }
  std::optional<int> stored = migrator.stored_dimension();
  if (!stored) {
    throw MigrationError("doc_chunks has no recorded embedding dimension; run the schema migration");
  }
  if (*stored != dimension_) {
    throw MigrationError("Embedding dimension mismatch: doc_chunks stores " +
                         std::to_string(*stored) + " but " + std::to_string(dimension_) +
                         " is configured");
  }
}

void ChunkStore::validate_vector(const std::vector<float>& vector, const std::string& what) const {
  if (vector.size() != static_cast<size_t>(dimension_)) {
    throw ValidationError(what + " dimension mismatch. Expected " + std::to_string(dimension_) +
                          ", got " + std::to_string(vector.size()));
  }
  for (size_t i = 0; i < vector.size(); ++i) {
    if (!std::isfinite(vector[i])) {
      throw ValidationError(what + " has a non-finite value at position " + std::to_string(i));
    }
  }
}

void ChunkStore::validate_subject_code(const std::optional<std::string>& subject_code) {
  if (!subject_code) {
    return;
  }
  if (is_blank(*subject_code)) {
    throw ValidationError("subject_code must be absent or non-empty");
  }
  if (!is_valid_utf8(*subject_code)) {
    throw ValidationError("subject_code is not valid UTF-8");
  }
  if (count_code_points(*subject_code) > MAX_SUBJECT_CODE_LENGTH) {
    throw ValidationError("subject_code exceeds " + std::to_string(MAX_SUBJECT_CODE_LENGTH) +
                          " characters");
  }
}

void ChunkStore::validate_new_chunks(const std::vector<NewChunk>& chunks) const {
  std::unordered_map<long long, int> last_index;
  for (const auto& chunk : chunks) {
    validate_vector(chunk.embedding, "Embedding for file " + std::to_string(chunk.file_id));
    if (is_blank(chunk.content)) {
      throw ValidationError("Chunk content must not be empty (file " +
                            std::to_string(chunk.file_id) + ", index " +
                            std::to_string(chunk.chunk_index) + ")");
    }
    if (chunk.chunk_index < 0) {
      throw ValidationError("chunk_index must be non-negative, got " +
                            std::to_string(chunk.chunk_index));
    }
    validate_subject_code(chunk.subject_code);
    auto it = last_index.find(chunk.file_id);
    if (it != last_index.end() && chunk.chunk_index <= it->second) {
      throw ValidationError("chunk_index values must increase within file " +
                            std::to_string(chunk.file_id));
    }
    last_index[chunk.file_id] = chunk.chunk_index;
  }
}

std::vector<long long> ChunkStore::insert_chunks(sqlite::database& db,
                                                 const std::vector<NewChunk>& chunks) {
  std::unordered_map<long long, std::optional<int>> max_index;
  std::vector<long long> ids;
  ids.reserve(chunks.size());
  const std::string created_at = now_string();

  for (const auto& chunk : chunks) {
    auto it = max_index.find(chunk.file_id);
    if (it == max_index.end()) {
      std::optional<int> current;
      db << "SELECT MAX(chunk_index) FROM doc_chunks WHERE file_id = ?" << chunk.file_id >>
          [&](std::optional<int> value) { current = value; };
      it = max_index.emplace(chunk.file_id, current).first;
    }
    if (it->second && chunk.chunk_index <= *it->second) {
      throw ValidationError("chunk_index " + std::to_string(chunk.chunk_index) +
                            " must exceed the existing maximum " + std::to_string(*it->second) +
                            " for file " + std::to_string(chunk.file_id));
    }

    db << "INSERT INTO doc_chunks (file_id, subject_code, content, embedding, chunk_index, "
          "file_type, section_label, created_at) VALUES (?, ?, ?, ?, ?, ?, ?, ?)"
       << chunk.file_id << chunk.subject_code << chunk.content << to_blob(chunk.embedding)
       << chunk.chunk_index << to_string(chunk.file_type) << chunk.section_label << created_at;
    ids.push_back(static_cast<long long>(db.last_insert_rowid()));
    it->second = chunk.chunk_index;
  }
  return ids;
}

long long ChunkStore::create_chunk(const NewChunk& chunk) {
  return create_chunks({chunk}).front();
}

std::vector<long long> ChunkStore::create_chunks(const std::vector<NewChunk>& chunks) {
  if (chunks.empty()) {
    return {};
  }
  validate_new_chunks(chunks);

  try {
    PooledConnection conn(db_manager_);
    Transaction tx(*conn, TransactionMode::Immediate);
    std::vector<long long> ids = insert_chunks(*conn, chunks);
    tx.commit();
    index_dirty_.store(true);
    return ids;
  } catch (const sqlite::sqlite_exception& e) {
    if (classify(e) == DbErrorKind::Constraint) {
      throw ValidationError(format_db_error("create_chunks", e));
    }
    throw_db_error<ChunkStoreError>("create_chunks", e);
  }
}

std::vector<long long> ChunkStore::replace_file_chunks(long long file_id,
                                                       const std::vector<NewChunk>& chunks) {
  for (const auto& chunk : chunks) {
    if (chunk.file_id != file_id) {
      throw ValidationError("Chunk for file " + std::to_string(chunk.file_id) +
                            " passed to replace_file_chunks for file " + std::to_string(file_id));
    }
  }
  validate_new_chunks(chunks);

  try {
    PooledConnection conn(db_manager_);
    Transaction tx(*conn, TransactionMode::Immediate);
    *conn << "DELETE FROM doc_chunks WHERE file_id = ?" << file_id;
    std::vector<long long> ids = insert_chunks(*conn, chunks);
    tx.commit();
    index_dirty_.store(true);
    return ids;
  } catch (const sqlite::sqlite_exception& e) {
    if (classify(e) == DbErrorKind::Constraint) {
      throw ValidationError(format_db_error("replace_file_chunks", e));
    }
    throw_db_error<ChunkStoreError>("replace_file_chunks", e);
  }
}

size_t ChunkStore::bulk_delete_by_file(long long file_id) {
  try {
    PooledConnection conn(db_manager_);
    Transaction tx(*conn, TransactionMode::Immediate);
    *conn << "DELETE FROM doc_chunks WHERE file_id = ?" << file_id;
    long long removed = 0;
    *conn << "SELECT changes()" >> removed;
    tx.commit();
    if (removed > 0) {
      index_dirty_.store(true);
    }
    return static_cast<size_t>(removed);
  } catch (const sqlite::sqlite_exception& e) {
    throw_db_error<ChunkStoreError>("bulk_delete_by_file", e);
  }
}

std::vector<Chunk> ChunkStore::list_by_file(long long file_id) {
  std::vector<Chunk> chunks;
  try {
    PooledConnection conn(db_manager_);
    *conn << std::string("SELECT ") + CHUNK_COLUMNS +
                 " FROM doc_chunks WHERE file_id = ? ORDER BY chunk_index"
          << file_id >>
        [&](long long id, long long fid, std::optional<std::string> subject_code,
            std::string content, std::vector<char> embedding, int chunk_index,
            std::string file_type, std::optional<std::string> section_label,
            std::string created_at) {
          chunks.push_back(make_chunk(id, fid, std::move(subject_code), std::move(content),
                                      embedding, chunk_index, file_type,
                                      std::move(section_label), created_at));
        };
  } catch (const sqlite::sqlite_exception& e) {
    throw_db_error<ChunkStoreError>("list_by_file", e);
  }
  return chunks;
}

long long ChunkStore::count_chunks(const ChunkFilter& filter) {
  std::string sql = "SELECT count(*) FROM doc_chunks WHERE 1 = 1";
  if (filter.subject_code) sql += " AND subject_code = ?";
  if (filter.file_type) sql += " AND file_type = ?";
  if (filter.file_id) sql += " AND file_id = ?";

  try {
    PooledConnection conn(db_manager_);
    long long count = 0;
    auto statement = *conn << sql;
    if (filter.subject_code) statement << *filter.subject_code;
    if (filter.file_type) statement << to_string(*filter.file_type);
    if (filter.file_id) statement << *filter.file_id;
    statement >> count;
    return count;
  } catch (const sqlite::sqlite_exception& e) {
    throw_db_error<ChunkStoreError>("count_chunks", e);
  }
}

std::vector<long long> ChunkStore::candidate_ids(const ChunkFilter& filter) {
  std::string sql = "SELECT id FROM doc_chunks WHERE 1 = 1";
  if (filter.subject_code) sql += " AND subject_code = ?";
  if (filter.file_type) sql += " AND file_type = ?";
  if (filter.file_id) sql += " AND file_id = ?";

  std::vector<long long> ids;
  try {
    PooledConnection conn(db_manager_);
    auto statement = *conn << sql;
    if (filter.subject_code) statement << *filter.subject_code;
    if (filter.file_type) statement << to_string(*filter.file_type);
    if (filter.file_id) statement << *filter.file_id;
    statement >> [&](long long id) { ids.push_back(id); };
  } catch (const sqlite::sqlite_exception& e) {
    throw_db_error<ChunkStoreError>("candidate_ids", e);
  }
  return ids;
}

std::vector<Chunk> ChunkStore::hydrate(const std::vector<long long>& ids) {
  std::vector<Chunk> chunks;
  if (ids.empty()) {
    return chunks;
  }
  try {
    PooledConnection conn(db_manager_);
    *conn << std::string("SELECT ") + CHUNK_COLUMNS + " FROM doc_chunks WHERE id IN (" +
                 ids_to_comma_string(ids) + ")" >>
        [&](long long id, long long fid, std::optional<std::string> subject_code,
            std::string content, std::vector<char> embedding, int chunk_index,
            std::string file_type, std::optional<std::string> section_label,
            std::string created_at) {
          chunks.push_back(make_chunk(id, fid, std::move(subject_code), std::move(content),
                                      embedding, chunk_index, file_type,
                                      std::move(section_label), created_at));
        };
  } catch (const sqlite::sqlite_exception& e) {
    throw_db_error<ChunkStoreError>("hydrate", e);
  }
  return chunks;
}

std::vector<ChunkMatch> ChunkStore::query(const std::vector<float>& query_vector,
                                          const ChunkFilter& filter,
                                          int k) {
  if (k <= 0) {
    throw ValidationError("k must be positive, got " + std::to_string(k));
  }
  validate_vector(query_vector, "Query vector");
  if (filter.subject_code && is_blank(*filter.subject_code)) {
    throw ValidationError("subject_code filter must not be empty");
  }

  ensure_index_fresh();

  std::vector<faiss::idx_t> allowed;
  if (!filter.empty()) {
    for (long long id : candidate_ids(filter)) {
      allowed.push_back(static_cast<faiss::idx_t>(id));
    }
    if (allowed.empty()) {
      return {};
    }
  }

  std::vector<float> distances;
  std::vector<faiss::idx_t> labels;
  size_t found = 0;
  {
    std::shared_lock<std::shared_mutex> lock(index_mutex_);
    if (!faiss_index_ || faiss_index_->ntotal == 0) {
      return {};
    }

    const size_t candidates =
        allowed.empty() ? static_cast<size_t>(faiss_index_->ntotal) : allowed.size();
    // One extra result shows whether the k-th distance is tied with what follows.
    size_t fetch = std::min(static_cast<size_t>(k) + 1, candidates);

    std::unique_ptr<faiss::IDSelectorBatch> selector;
    if (!allowed.empty()) {
      selector = std::make_unique<faiss::IDSelectorBatch>(allowed.size(), allowed.data());
    }

    while (true) {
      distances.assign(fetch, 0.0f);
      labels.assign(fetch, -1);

      faiss::SearchParametersHNSW hnsw_params;
      hnsw_params.efSearch = std::max(index_options_.hnsw_ef_search, static_cast<int>(fetch));
      hnsw_params.sel = selector.get();
      faiss::SearchParameters flat_params;
      flat_params.sel = selector.get();
      const faiss::SearchParameters* params =
          index_options_.kind == SimilarityIndexKind::Hnsw
              ? static_cast<const faiss::SearchParameters*>(&hnsw_params)
              : &flat_params;

      faiss_index_->search(1, query_vector.data(), static_cast<faiss::idx_t>(fetch),
                           distances.data(), labels.data(), params);
      index_searches_.fetch_add(1);

      found = 0;
      while (found < fetch && labels[found] != -1) {
        ++found;
      }

      // Widen while the k-th distance ties with the last one returned, so every
      // tied candidate competes in the tie-break.
      const bool exhausted = found < fetch || fetch >= candidates;
      if (exhausted || found <= static_cast<size_t>(k) ||
          !nearly_equal(distances[k - 1], distances[found - 1])) {
        break;
      }
      fetch = std::min(fetch * 2, candidates);
    }
  }

  std::unordered_map<long long, float> distance_by_id;
  std::vector<long long> ids;
  ids.reserve(found);
  for (size_t i = 0; i < found; ++i) {
    const long long id = static_cast<long long>(labels[i]);
    distance_by_id[id] = distances[i];
    ids.push_back(id);
  }

  std::vector<ChunkMatch> matches;
  matches.reserve(ids.size());
  for (auto& chunk : hydrate(ids)) {
    const float distance = distance_by_id.at(chunk.id);
    matches.push_back({std::move(chunk), distance});
  }
  if (matches.size() < ids.size()) {
    std::cerr << "Warning: " << (ids.size() - matches.size())
              << " indexed chunk ids no longer exist in doc_chunks." << std::endl;
  }

  std::sort(matches.begin(), matches.end(), [](const ChunkMatch& a, const ChunkMatch& b) {
    if (a.distance != b.distance) {
      return a.distance < b.distance;
    }
    return by_position(a, b);
  });
  size_t group_start = 0;
  while (group_start < matches.size()) {
    size_t group_end = group_start + 1;
    while (group_end < matches.size() &&
           nearly_equal(matches[group_end].distance, matches[group_start].distance)) {
      ++group_end;
    }
    std::sort(matches.begin() + group_start, matches.begin() + group_end, by_position);
    group_start = group_end;
  }

  if (matches.size() > static_cast<size_t>(k)) {
    matches.resize(k);
  }
  return matches;
}

void ChunkStore::ensure_index_fresh() {
  if (!index_dirty_.load()) {
    return;
  }
  std::unique_lock<std::shared_mutex> lock(index_mutex_);
  if (index_dirty_.load()) {
    rebuild_index_locked();
  }
}

void ChunkStore::rebuild_index() {
  std::unique_lock<std::shared_mutex> lock(index_mutex_);
  rebuild_index_locked();
}

void ChunkStore::rebuild_index_locked() {
  // Cleared before reading so a write committed during the read marks it stale again.
  index_dirty_.store(false);

  auto index = create_base_index();
  std::vector<faiss::idx_t> faiss_ids;
  std::vector<float> all_vectors_flat;
  const size_t expected_bytes = static_cast<size_t>(dimension_) * sizeof(float);

  try {
    PooledConnection conn(db_manager_);
    *conn << "SELECT id, embedding FROM doc_chunks" >>
        [&](long long id, std::vector<char> embedding) {
          if (embedding.size() == expected_bytes) {
            faiss_ids.push_back(static_cast<faiss::idx_t>(id));
            const float* vec_ptr = reinterpret_cast<const float*>(embedding.data());
            all_vectors_flat.insert(all_vectors_flat.end(), vec_ptr, vec_ptr + dimension_);
          } else {
            std::cerr << "Warning: Skipping chunk ID " << id
                      << " during index rebuild due to mismatched vector dimension. Expected "
                      << expected_bytes << " bytes, got " << embedding.size() << " bytes."
                      << std::endl;
          }
        };
  } catch (const sqlite::sqlite_exception& e) {
    index_dirty_.store(true);
    throw_db_error<ChunkStoreError>("rebuild_index", e);
  }

  if (!faiss_ids.empty()) {
    index->add_with_ids(static_cast<faiss::idx_t>(faiss_ids.size()), all_vectors_flat.data(),
                        faiss_ids.data());
  }
  faiss_index_ = std::move(index);
}

std::unique_ptr<faiss::IndexIDMap> ChunkStore::create_base_index() const {
  faiss::Index* base_index = nullptr;
  if (index_options_.kind == SimilarityIndexKind::Hnsw) {
    auto* hnsw = new faiss::IndexHNSWFlat(dimension_, index_options_.hnsw_m);
    hnsw->hnsw.efConstruction = index_options_.hnsw_ef_construction;
    hnsw->hnsw.efSearch = index_options_.hnsw_ef_search;
    base_index = hnsw;
  } else {
    base_index = new faiss::IndexFlatL2(dimension_);
  }
  // Wrap with IDMap to enable add_with_ids; the wrapper owns the base index.
  auto index = std::make_unique<faiss::IndexIDMap>(base_index);
  index->own_fields = true;
  return index;
}

std::vector<char> ChunkStore::to_blob(const std::vector<float>& vector) {
  std::vector<char> blob(vector.size() * sizeof(float));
  std::memcpy(blob.data(), vector.data(), blob.size());
  return blob;
}

std::string ChunkStore::ids_to_comma_string(const std::vector<long long>& ids) {
  std::stringstream ss;
  for (size_t i = 0; i < ids.size(); ++i) {
    ss << ids[i];
    if (i < ids.size() - 1)
      ss << ",";
  }
  return ss.str();
}

}  // namespace rag_core
