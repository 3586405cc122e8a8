#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include "rag_api/routes.hpp"
#include "rag_core/errors.hpp"
#include "rag_core/services/ingestion_service.hpp"

namespace rag_tests {

TEST(RoutesTest, ParsesTextDocument) {
  auto body = nlohmann::json::parse(R"({
    "file_id": 4,
    "subject_code": "CS101",
    "file_type": "slide",
    "text": "page one",
    "max_chunk_chars": 200,
    "priority": 3
  })");

  rag_core::IngestionRequest request = rag_api::parse_ingestion_request(body);
  EXPECT_EQ(request.file_id, 4);
  EXPECT_EQ(request.subject_code, std::optional<std::string>("CS101"));
  EXPECT_EQ(request.file_type, rag_core::FileType::Slide);
  EXPECT_EQ(request.text, std::optional<std::string>("page one"));
  EXPECT_EQ(request.max_chunk_chars, std::optional<size_t>(200));
  EXPECT_EQ(request.priority, 3);
}

TEST(RoutesTest, ParsesSectionsDocument) {
  auto body = nlohmann::json::parse(R"({
    "file_id": 5,
    "file_type": "doc",
    "sections": [{"section": "Intro", "content": "hello"}, {"content": "untitled"}]
  })");

  rag_core::IngestionRequest request = rag_api::parse_ingestion_request(body);
  EXPECT_FALSE(request.subject_code.has_value());
  EXPECT_FALSE(request.text.has_value());
  ASSERT_EQ(request.sections.size(), 2u);
  EXPECT_EQ(request.sections[0].label, "Intro");
  EXPECT_EQ(request.sections[1].label, "");
  EXPECT_EQ(request.priority, 10);
}

TEST(RoutesTest, RejectsDocumentWithoutIdentity) {
  EXPECT_THROW(rag_api::parse_ingestion_request(nlohmann::json::parse(R"({"file_type": "pdf"})")),
               rag_core::ValidationError);
  EXPECT_THROW(rag_api::parse_ingestion_request(nlohmann::json::parse(R"({"file_id": 1})")),
               rag_core::ValidationError);
  EXPECT_THROW(rag_api::parse_ingestion_request(nlohmann::json::parse("[1, 2]")),
               rag_core::ValidationError);
}

}  // namespace rag_tests
