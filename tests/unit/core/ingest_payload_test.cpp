#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include "rag_core/async/ingest_payload.hpp"
#include "rag_core/errors.hpp"

namespace rag_tests {

using namespace rag_core;

TEST(IngestPayloadTest, EncodesTextBody) {
  IngestPayload payload;
  payload.text = "hello";
  payload.max_chunk_chars = 120;

  auto json = nlohmann::json::parse(encode_ingest_payload(payload));
  EXPECT_EQ(json["text"], "hello");
  EXPECT_EQ(json["max_chunk_chars"], 120);
  EXPECT_FALSE(json.contains("sections"));
}

TEST(IngestPayloadTest, EncodesSectionsBody) {
  IngestPayload payload;
  payload.sections = {{.label = "Intro", .content = "a"}, {.label = "Body", .content = "b"}};

  auto json = nlohmann::json::parse(encode_ingest_payload(payload));
  ASSERT_TRUE(json["sections"].is_array());
  ASSERT_EQ(json["sections"].size(), 2u);
  EXPECT_EQ(json["sections"][1]["section"], "Body");
  EXPECT_EQ(json["sections"][1]["content"], "b");
  EXPECT_FALSE(json.contains("max_chunk_chars"));
}

TEST(IngestPayloadTest, DecodesSectionWithoutLabel) {
  IngestPayload payload = decode_ingest_payload(R"({"sections":[{"content":"body only"}]})");
  ASSERT_EQ(payload.sections.size(), 1u);
  EXPECT_EQ(payload.sections[0].label, "");
  EXPECT_EQ(payload.sections[0].content, "body only");
  EXPECT_FALSE(payload.text.has_value());
}

TEST(IngestPayloadTest, RejectsMalformedPayloads) {
  EXPECT_THROW(decode_ingest_payload("not json"), ValidationError);
  EXPECT_THROW(decode_ingest_payload("{}"), ValidationError);
  EXPECT_THROW(decode_ingest_payload(R"({"text": 5})"), ValidationError);
  EXPECT_THROW(decode_ingest_payload(R"({"sections":[{"section":"x"}]})"), ValidationError);
}

}  // namespace rag_tests
