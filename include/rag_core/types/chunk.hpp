#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "rag_core/types/file_type.hpp"

namespace rag_core {

// A persisted retrieval unit. Immutable once written.
struct Chunk {
  long long id = 0;
  long long file_id = 0;
  std::optional<std::string> subject_code;
  std::string content;
  std::vector<float> embedding;
  int chunk_index = 0;
  FileType file_type = FileType::Pdf;
  std::optional<std::string> section_label;
  std::chrono::system_clock::time_point created_at;
};

// Fields supplied by the caller when creating a chunk.
struct NewChunk {
  long long file_id = 0;
  std::optional<std::string> subject_code;
  std::string content;
  std::vector<float> embedding;
  int chunk_index = 0;
  FileType file_type = FileType::Pdf;
  std::optional<std::string> section_label;
};

// Chunker output, in chunk_index order.
struct Segment {
  std::string content;
  std::string section_label;
};

// Pre-split input from a document parser (page, slide, heading section).
struct Section {
  std::string label;
  std::string content;
};

struct ChunkFilter {
  std::optional<std::string> subject_code;
  std::optional<FileType> file_type;
  std::optional<long long> file_id;

  bool empty() const {
    return !subject_code && !file_type && !file_id;
  }
};

// Squared L2 distance, lower is closer.
struct ChunkMatch {
  Chunk chunk;
  float distance = 0.0f;
};

// Similarity score, higher is closer.
struct ScoredChunk {
  Chunk chunk;
  float score = 0.0f;
};

}  // namespace rag_core
