#include "rag_core/chunking/text_utils.hpp"

#include <utf8.h>

#include <algorithm>
#include <cstdint>
#include <iterator>

namespace rag_core {

namespace {

const char* const ASCII_WHITESPACE = " \t\n\v\f\r";

bool is_ascii_space(uint32_t cp) {
  return cp == ' ' || cp == '\t' || cp == '\n' || cp == '\v' || cp == '\f' || cp == '\r';
}

}  // namespace

std::string sanitize_utf8(const std::string& text) {
  std::string out;
  out.reserve(text.size());
  utf8::replace_invalid(text.begin(), text.end(), std::back_inserter(out));
  return out;
}

bool is_valid_utf8(const std::string& text) {
  return utf8::is_valid(text.begin(), text.end());
}

std::string trim_ascii(const std::string& text) {
  const size_t first = text.find_first_not_of(ASCII_WHITESPACE);
  if (first == std::string::npos) {
    return "";
  }
  const size_t last = text.find_last_not_of(ASCII_WHITESPACE);
  return text.substr(first, last - first + 1);
}

bool is_blank(const std::string& text) {
  return text.find_first_not_of(ASCII_WHITESPACE) == std::string::npos;
}

size_t count_code_points(const std::string& text) {
  return static_cast<size_t>(utf8::distance(text.begin(), text.end()));
}

std::string truncate_code_points(const std::string& text, size_t max_chars) {
  auto it = text.begin();
  for (size_t n = 0; n < max_chars && it != text.end(); ++n) {
    utf8::next(it, text.end());
  }
  return std::string(text.begin(), it);
}

std::string truncate_utf8(const std::string& text, size_t max_bytes) {
  if (text.size() <= max_bytes) {
    return text;
  }
  auto it = text.begin();
  auto cut = it;
  while (it != text.end()) {
    utf8::next(it, text.end());
    if (static_cast<size_t>(it - text.begin()) > max_bytes) {
      break;
    }
    cut = it;
  }
  return std::string(text.begin(), cut);
}

std::vector<std::string> split_into_windows(const std::string& text,
                                            size_t max_chars,
                                            size_t overlap_chars) {
  std::vector<std::string> out;
  if (text.empty() || max_chars == 0) {
    return out;
  }
  if (overlap_chars >= max_chars) {
    overlap_chars = max_chars - 1;
  }

  // Byte offset of every code point, plus one past the end.
  std::vector<size_t> offsets;
  std::vector<bool> space_at;
  for (auto it = text.begin(); it != text.end();) {
    offsets.push_back(static_cast<size_t>(it - text.begin()));
    space_at.push_back(is_ascii_space(utf8::next(it, text.end())));
  }
  const size_t total = offsets.size();
  offsets.push_back(text.size());

  size_t start = 0;
  while (start < total) {
    size_t end = std::min(start + max_chars, total);
    if (end < total && !space_at[end]) {
      for (size_t p = end - 1; p > start + max_chars / 2; --p) {
        if (space_at[p]) {
          end = p + 1;
          break;
        }
      }
    }

    std::string piece = trim_ascii(text.substr(offsets[start], offsets[end] - offsets[start]));
    if (!piece.empty()) {
      out.push_back(std::move(piece));
    }
    if (end >= total) {
      break;
    }
    start = std::max(end > overlap_chars ? end - overlap_chars : 0, start + 1);
  }
  return out;
}

std::vector<std::string> split_on_delimiter(const std::string& text, const std::string& delimiter) {
  std::vector<std::string> parts;
  if (delimiter.empty()) {
    parts.push_back(text);
    return parts;
  }
  size_t pos = 0;
  while (true) {
    const size_t next = text.find(delimiter, pos);
    if (next == std::string::npos) {
      parts.push_back(text.substr(pos));
      break;
    }
    parts.push_back(text.substr(pos, next - pos));
    pos = next + delimiter.size();
  }
  return parts;
}

}  // namespace rag_core
