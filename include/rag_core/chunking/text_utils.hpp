#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace rag_core {

// Replaces invalid UTF-8 sequences with U+FFFD.
std::string sanitize_utf8(const std::string& text);

bool is_valid_utf8(const std::string& text);

// Strips ASCII whitespace (space, \t, \n, \v, \f, \r) from both ends.
std::string trim_ascii(const std::string& text);

bool is_blank(const std::string& text);

size_t count_code_points(const std::string& text);

// First max_chars code points of text.
std::string truncate_code_points(const std::string& text, size_t max_chars);

// Longest prefix of at most max_bytes that ends on a code point boundary.
std::string truncate_utf8(const std::string& text, size_t max_bytes);

/**
 * Splits text into windows of at most max_chars code points, consecutive
 * windows sharing overlap_chars code points. A window that would cut a word
 * ends at the last whitespace in its second half instead. Pieces are trimmed
 * and blank pieces dropped. Input must be valid UTF-8.
 */
std::vector<std::string> split_into_windows(const std::string& text,
                                            size_t max_chars,
                                            size_t overlap_chars);

std::vector<std::string> split_on_delimiter(const std::string& text, const std::string& delimiter);

}  // namespace rag_core
