#include "rag_core/chunking/chunker.hpp"

#include <algorithm>

#include "rag_core/chunking/text_utils.hpp"
#include "rag_core/errors.hpp"

namespace rag_core {

Chunker::Chunker(std::optional<size_t> max_chunk_chars) : max_chunk_chars_(max_chunk_chars) {
  if (max_chunk_chars_ && *max_chunk_chars_ == 0) {
    throw ValidationError("max_chunk_chars must be positive");
  }
  strategies_.push_back(std::make_unique<PagedChunkingStrategy>(FileType::Pdf, "page"));
  strategies_.push_back(std::make_unique<PagedChunkingStrategy>(FileType::Slide, "slide"));
  strategies_.push_back(std::make_unique<HeadingChunkingStrategy>());
  strategies_.push_back(std::make_unique<WindowChunkingStrategy>());
}

ChunkingProfile Chunker::default_profile(FileType file_type) {
  switch (file_type) {
    case FileType::Slide:
      return {.max_chars = 800, .overlap_chars = 50};
    case FileType::Text:
    case FileType::Csv:
      return {.max_chars = 1000, .overlap_chars = 150};
    case FileType::Pdf:
    case FileType::Doc:
    case FileType::Image:
      break;
  }
  return {.max_chars = 500, .overlap_chars = 100};
}

ChunkingProfile Chunker::effective_profile(FileType file_type, const ChunkingHints& hints) const {
  const ChunkingProfile base = default_profile(file_type);
  ChunkingProfile profile = base;

  if (hints.max_chunk_chars) {
    if (*hints.max_chunk_chars == 0) {
      throw ValidationError("max_chunk_chars hint must be positive");
    }
    profile.max_chars = *hints.max_chunk_chars;
  }
  if (max_chunk_chars_) {
    profile.max_chars = std::min(profile.max_chars, *max_chunk_chars_);
  }

  if (hints.overlap_chars) {
    if (*hints.overlap_chars >= profile.max_chars) {
      throw ValidationError("overlap_chars (" + std::to_string(*hints.overlap_chars) +
                            ") must be smaller than the chunk size (" +
                            std::to_string(profile.max_chars) + ")");
    }
    profile.overlap_chars = *hints.overlap_chars;
  } else if (profile.max_chars < base.max_chars) {
    // Keep the profile's overlap ratio when the window shrinks.
    profile.overlap_chars = profile.max_chars * base.overlap_chars / base.max_chars;
  }
  return profile;
}

const ChunkingStrategy& Chunker::get_strategy_for(FileType file_type) const {
  for (const auto& strategy : strategies_) {
    if (strategy->can_handle(file_type)) {
      return *strategy;
    }
  }
  throw ValidationError("No chunking strategy for file type " + to_string(file_type));
}

std::vector<Segment> Chunker::chunk(const std::string& document_text,
                                    FileType file_type,
                                    const ChunkingHints& hints) const {
  const ChunkingProfile profile = effective_profile(file_type, hints);
  const std::string text = sanitize_utf8(document_text);
  if (is_blank(text)) {
    return {};
  }
  return get_strategy_for(file_type).chunk(text, profile, hints);
}

std::vector<Segment> Chunker::chunk_sections(const std::vector<Section>& sections,
                                             FileType file_type,
                                             const ChunkingHints& hints) const {
  const ChunkingProfile profile = effective_profile(file_type, hints);
  std::vector<Segment> out;
  for (size_t i = 0; i < sections.size(); ++i) {
    const std::string content = sanitize_utf8(sections[i].content);
    if (is_blank(content)) {
      continue;
    }
    std::string label = trim_ascii(sanitize_utf8(sections[i].label));
    if (label.empty()) {
      label = "part_" + std::to_string(i + 1);
    }
    ChunkingStrategy::append_section(out, label, content, profile);
  }
  return out;
}

}  // namespace rag_core
