#pragma once

#include <optional>
#include <string>
#include <vector>

#include "rag_core/chunking/chunking_strategy.hpp"

namespace rag_core {

/**
 * @class Chunker
 * @brief Splits document text into ordered, labeled segments.
 *
 * Holds one ChunkingStrategy per FileType and picks the first that can
 * handle the requested type. Output order is chunk_index order; no segment
 * is blank and none exceeds the effective window size.
 */
class Chunker {
 public:
  /**
   * @param max_chunk_chars Global cap applied on top of the per-type
   *        profiles. Must be positive when given.
   * @throw ValidationError if max_chunk_chars is zero.
   */
  explicit Chunker(std::optional<size_t> max_chunk_chars = std::nullopt);

  /**
   * @brief Chunks a whole document.
   *
   * Invalid UTF-8 is replaced before splitting. A document without any
   * extractable text yields an empty vector.
   *
   * @throw ValidationError for invalid hints.
   */
  std::vector<Segment> chunk(const std::string& document_text,
                             FileType file_type,
                             const ChunkingHints& hints = {}) const;

  /**
   * @brief Chunks pre-split sections, windowing each one independently.
   *
   * Sections without a label are labeled part_<n> by their position.
   */
  std::vector<Segment> chunk_sections(const std::vector<Section>& sections,
                                      FileType file_type,
                                      const ChunkingHints& hints = {}) const;

  ChunkingProfile effective_profile(FileType file_type, const ChunkingHints& hints) const;

  static ChunkingProfile default_profile(FileType file_type);

  const ChunkingStrategy& get_strategy_for(FileType file_type) const;

  Chunker(const Chunker&) = delete;
  Chunker& operator=(const Chunker&) = delete;
  Chunker(Chunker&&) = delete;
  Chunker& operator=(Chunker&&) = delete;

 private:
  std::optional<size_t> max_chunk_chars_;
  std::vector<ChunkingStrategyPtr> strategies_;
};

}  // namespace rag_core
