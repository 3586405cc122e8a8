#pragma once

#include <string>
#include <vector>

#include "rag_core/types/chunk.hpp"

namespace rag_core {

// Lowercase hex SHA-256 of the given bytes.
std::string compute_content_hash(const std::string& content);

// Hash over labels and contents of pre-split sections, in order.
std::string compute_sections_hash(const std::vector<Section>& sections);

}  // namespace rag_core
