#include "rag_core/chunking/chunking_strategy.hpp"

#include <optional>
#include <sstream>

#include "rag_core/chunking/text_utils.hpp"

namespace rag_core {

namespace {

// Parses a Markdown ATX heading: up to 3 spaces, 1-6 '#', a space or tab,
// then the text with any closing '#' run and trailing blanks removed.
// Linear in the line length; lines may be arbitrarily long.
std::optional<std::string> parse_atx_heading(const std::string& line) {
  size_t pos = 0;
  while (pos < line.size() && pos < 3 && line[pos] == ' ') {
    ++pos;
  }
  const size_t hashes_start = pos;
  while (pos < line.size() && line[pos] == '#') {
    ++pos;
  }
  const size_t level = pos - hashes_start;
  if (level == 0 || level > 6 || pos >= line.size() || (line[pos] != ' ' && line[pos] != '\t')) {
    return std::nullopt;
  }

  size_t end = line.size();
  while (end > pos && (line[end - 1] == ' ' || line[end - 1] == '\t' || line[end - 1] == '#' ||
                       line[end - 1] == '\r')) {
    --end;
  }
  std::string title = trim_ascii(line.substr(pos, end - pos));
  if (title.empty()) {
    return std::nullopt;
  }
  return title;
}

}  // namespace

void ChunkingStrategy::append_section(std::vector<Segment>& out,
                                      const std::string& label,
                                      const std::string& content,
                                      const ChunkingProfile& profile) {
  const std::string bounded_label = truncate_utf8(label, MAX_SECTION_LABEL_BYTES);
  for (auto& piece : split_into_windows(content, profile.max_chars, profile.overlap_chars)) {
    out.push_back({.content = std::move(piece), .section_label = bounded_label});
  }
}

PagedChunkingStrategy::PagedChunkingStrategy(FileType file_type, std::string label_prefix)
    : file_type_(file_type), label_prefix_(std::move(label_prefix)) {}

bool PagedChunkingStrategy::can_handle(FileType file_type) const {
  return file_type == file_type_;
}

std::vector<Segment> PagedChunkingStrategy::chunk(const std::string& text,
                                                  const ChunkingProfile& profile,
                                                  const ChunkingHints& hints) const {
  std::vector<Segment> out;
  const auto pages = split_on_delimiter(text, hints.page_delimiter);
  // Blank pages produce nothing but still advance the page number.
  for (size_t i = 0; i < pages.size(); ++i) {
    append_section(out, label_prefix_ + "_" + std::to_string(i + 1), pages[i], profile);
  }
  return out;
}

bool HeadingChunkingStrategy::can_handle(FileType file_type) const {
  return file_type == FileType::Doc;
}

std::vector<Segment> HeadingChunkingStrategy::chunk(const std::string& text,
                                                    const ChunkingProfile& profile,
                                                    const ChunkingHints& /*hints*/) const {
  std::vector<Segment> out;
  std::string current_label = "section_intro";
  std::stringstream current_content;
  bool saw_heading = false;

  std::istringstream lines(text);
  std::string line;
  while (std::getline(lines, line)) {
    if (auto heading = parse_atx_heading(line)) {
      append_section(out, current_label, current_content.str(), profile);
      current_label = std::move(*heading);
      current_content.str("");
      current_content.clear();
      saw_heading = true;
    }
    current_content << line << '\n';
  }

  if (!saw_heading) {
    append_section(out, "full_text", current_content.str(), profile);
  } else {
    append_section(out, current_label, current_content.str(), profile);
  }
  return out;
}

bool WindowChunkingStrategy::can_handle(FileType file_type) const {
  return file_type == FileType::Text || file_type == FileType::Csv ||
         file_type == FileType::Image;
}

std::vector<Segment> WindowChunkingStrategy::chunk(const std::string& text,
                                                   const ChunkingProfile& profile,
                                                   const ChunkingHints& /*hints*/) const {
  std::vector<Segment> out;
  int part = 1;
  for (auto& piece : split_into_windows(text, profile.max_chars, profile.overlap_chars)) {
    out.push_back({.content = std::move(piece), .section_label = "part_" + std::to_string(part++)});
  }
  return out;
}

}  // namespace rag_core
