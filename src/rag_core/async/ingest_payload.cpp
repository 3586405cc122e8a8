#include "rag_core/async/ingest_payload.hpp"

#include <nlohmann/json.hpp>

#include "rag_core/errors.hpp"

namespace rag_core {

std::string encode_ingest_payload(const IngestPayload& payload) {
  nlohmann::json json;
  if (payload.text) {
    json["text"] = *payload.text;
  } else {
    json["sections"] = nlohmann::json::array();
    for (const auto& section : payload.sections) {
      json["sections"].push_back({{"section", section.label}, {"content", section.content}});
    }
  }
  if (payload.max_chunk_chars) {
    json["max_chunk_chars"] = *payload.max_chunk_chars;
  }
  return json.dump();
}

IngestPayload decode_ingest_payload(const std::string& json_text) {
  try {
    nlohmann::json json = nlohmann::json::parse(json_text);
    IngestPayload payload;
    if (json.contains("text")) {
      payload.text = json["text"].get<std::string>();
    } else if (json.contains("sections")) {
      for (const auto& item : json["sections"]) {
        payload.sections.push_back({.label = item.value("section", ""),
                                    .content = item.at("content").get<std::string>()});
      }
    } else {
      throw ValidationError("Ingest payload has neither text nor sections");
    }
    if (json.contains("max_chunk_chars")) {
      payload.max_chunk_chars = json["max_chunk_chars"].get<size_t>();
    }
    return payload;
  } catch (const nlohmann::json::exception& e) {
    throw ValidationError("Malformed ingest payload: " + std::string(e.what()));
  }
}

}  // namespace rag_core
