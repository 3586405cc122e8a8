#include <gtest/gtest.h>

#include <nlohmann/json.hpp>
#include <stdexcept>

#include "rag_api/error_status.hpp"
#include "rag_core/errors.hpp"

namespace rag_tests {

using namespace rag_core;

TEST(ErrorStatusTest, ValidationFailuresAreBadRequests) {
  EXPECT_EQ(rag_api::http_status_for(ValidationError("bad k")), 400);

  try {
    (void)nlohmann::json::parse("{broken");
    FAIL() << "Expected parse error";
  } catch (const nlohmann::json::exception& e) {
    EXPECT_EQ(rag_api::http_status_for(e), 400);
  }
}

TEST(ErrorStatusTest, InFlightIsConflict) {
  EXPECT_EQ(rag_api::http_status_for(IngestionInFlightError(7)), 409);
}

TEST(ErrorStatusTest, UpstreamEmbeddingFailuresAreBadGateway) {
  EXPECT_EQ(rag_api::http_status_for(EmbeddingError("down", true)), 502);
  EXPECT_EQ(rag_api::http_status_for(IngestionError(IngestionStage::EMBEDDING, 1, "down")), 502);
}

TEST(ErrorStatusTest, StorageUnavailableIsServiceUnavailable) {
  EXPECT_EQ(rag_api::http_status_for(StorageUnavailable("locked")), 503);
}

TEST(ErrorStatusTest, EverythingElseIsInternalError) {
  EXPECT_EQ(rag_api::http_status_for(IngestionError(IngestionStage::PERSISTING, 1, "disk")), 500);
  EXPECT_EQ(rag_api::http_status_for(MigrationError("mismatch")), 500);
  EXPECT_EQ(rag_api::http_status_for(std::runtime_error("boom")), 500);
}

}  // namespace rag_tests
