#pragma once

#include <optional>
#include <string>
#include <vector>

#include "rag_core/types/chunk.hpp"

namespace rag_core {

// Document body carried by an INGEST_DOCUMENT task. Exactly one of text and
// sections is used.
struct IngestPayload {
  std::optional<std::string> text;
  std::vector<Section> sections;
  std::optional<size_t> max_chunk_chars;
};

// {"text": "..."} or {"sections": [{"section": "...", "content": "..."}]},
// plus an optional "max_chunk_chars".
std::string encode_ingest_payload(const IngestPayload& payload);

// Throws ValidationError when the JSON is malformed or has neither body.
IngestPayload decode_ingest_payload(const std::string& json_text);

}  // namespace rag_core
