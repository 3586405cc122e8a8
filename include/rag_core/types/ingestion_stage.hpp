#pragma once

#include <stdexcept>
#include <string>

namespace rag_core {

enum class IngestionStage { PENDING, CHUNKING, EMBEDDING, PERSISTING, DONE, FAILED };

inline std::string to_string(IngestionStage stage) {
  switch (stage) {
    case IngestionStage::PENDING: return "PENDING";
    case IngestionStage::CHUNKING: return "CHUNKING";
    case IngestionStage::EMBEDDING: return "EMBEDDING";
    case IngestionStage::PERSISTING: return "PERSISTING";
    case IngestionStage::DONE: return "DONE";
    case IngestionStage::FAILED: return "FAILED";
  }
  return "UNKNOWN";
}

inline IngestionStage ingestion_stage_from_string(const std::string& str) {
  if (str == "PENDING") return IngestionStage::PENDING;
  if (str == "CHUNKING") return IngestionStage::CHUNKING;
  if (str == "EMBEDDING") return IngestionStage::EMBEDDING;
  if (str == "PERSISTING") return IngestionStage::PERSISTING;
  if (str == "DONE") return IngestionStage::DONE;
  if (str == "FAILED") return IngestionStage::FAILED;
  throw std::invalid_argument("Invalid IngestionStage string: " + str);
}

}  // namespace rag_core
