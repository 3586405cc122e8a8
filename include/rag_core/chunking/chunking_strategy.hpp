#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "rag_core/types/chunk.hpp"
#include "rag_core/types/file_type.hpp"

namespace rag_core {

// Window size and overlap, both in code points.
struct ChunkingProfile {
  size_t max_chars = 0;
  size_t overlap_chars = 0;
};

// Per-call overrides.
struct ChunkingHints {
  std::optional<size_t> max_chunk_chars;
  std::optional<size_t> overlap_chars;
  std::string page_delimiter = "\f";
};

inline constexpr size_t MAX_SECTION_LABEL_BYTES = 100;

class ChunkingStrategy {
 public:
  virtual ~ChunkingStrategy() = default;

  virtual bool can_handle(FileType file_type) const = 0;

  // Text must already be valid UTF-8.
  virtual std::vector<Segment> chunk(const std::string& text,
                                     const ChunkingProfile& profile,
                                     const ChunkingHints& hints) const = 0;

  // Windows one section into out, every piece carrying the section's label.
  static void append_section(std::vector<Segment>& out,
                             const std::string& label,
                             const std::string& content,
                             const ChunkingProfile& profile);
};

using ChunkingStrategyPtr = std::unique_ptr<ChunkingStrategy>;

// Form-feed separated pages or slides, labeled <prefix>_<n>.
class PagedChunkingStrategy : public ChunkingStrategy {
 public:
  PagedChunkingStrategy(FileType file_type, std::string label_prefix);

  bool can_handle(FileType file_type) const override;
  std::vector<Segment> chunk(const std::string& text,
                             const ChunkingProfile& profile,
                             const ChunkingHints& hints) const override;

 private:
  FileType file_type_;
  std::string label_prefix_;
};

// Markdown ATX headings start sections labeled with the heading text.
class HeadingChunkingStrategy : public ChunkingStrategy {
 public:
  bool can_handle(FileType file_type) const override;
  std::vector<Segment> chunk(const std::string& text,
                             const ChunkingProfile& profile,
                             const ChunkingHints& hints) const override;
};

// Unstructured input: plain windows labeled part_<n>.
class WindowChunkingStrategy : public ChunkingStrategy {
 public:
  bool can_handle(FileType file_type) const override;
  std::vector<Segment> chunk(const std::string& text,
                             const ChunkingProfile& profile,
                             const ChunkingHints& hints) const override;
};

}  // namespace rag_core
