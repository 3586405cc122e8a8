#include "rag_api/error_status.hpp"

#include <nlohmann/json.hpp>

#include "rag_core/errors.hpp"

namespace rag_api {

int http_status_for(const std::exception &e) {
  if (dynamic_cast<const rag_core::IngestionInFlightError *>(&e)) {
    return 409;
  }
  if (dynamic_cast<const rag_core::ValidationError *>(&e) ||
      dynamic_cast<const nlohmann::json::exception *>(&e)) {
    return 400;
  }
  if (dynamic_cast<const rag_core::EmbeddingError *>(&e)) {
    return 502;
  }
  if (dynamic_cast<const rag_core::StorageUnavailable *>(&e)) {
    return 503;
  }
  if (const auto *ingestion = dynamic_cast<const rag_core::IngestionError *>(&e)) {
    return ingestion->stage() == rag_core::IngestionStage::EMBEDDING ? 502 : 500;
  }
  return 500;
}

}  // namespace rag_api
