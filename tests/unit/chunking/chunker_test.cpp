#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "rag_core/chunking/chunker.hpp"
#include "rag_core/chunking/text_utils.hpp"
#include "rag_core/errors.hpp"

namespace rag_tests {

using namespace rag_core;

namespace {

std::vector<std::string> labels_of(const std::vector<Segment>& segments) {
  std::vector<std::string> labels;
  for (const auto& segment : segments) {
    labels.push_back(segment.section_label);
  }
  return labels;
}

// n words of the form "wordN ".
std::string long_text(int words) {
  std::string text;
  for (int i = 0; i < words; ++i) {
    text += "word" + std::to_string(i) + " ";
  }
  return text;
}

}  // namespace

class ChunkerTest : public ::testing::Test {
 protected:
  Chunker chunker_;
};

TEST_F(ChunkerTest, DefaultProfiles) {
  EXPECT_EQ(Chunker::default_profile(FileType::Pdf).max_chars, 500u);
  EXPECT_EQ(Chunker::default_profile(FileType::Pdf).overlap_chars, 100u);
  EXPECT_EQ(Chunker::default_profile(FileType::Doc).max_chars, 500u);
  EXPECT_EQ(Chunker::default_profile(FileType::Image).max_chars, 500u);
  EXPECT_EQ(Chunker::default_profile(FileType::Slide).max_chars, 800u);
  EXPECT_EQ(Chunker::default_profile(FileType::Slide).overlap_chars, 50u);
  EXPECT_EQ(Chunker::default_profile(FileType::Text).max_chars, 1000u);
  EXPECT_EQ(Chunker::default_profile(FileType::Csv).overlap_chars, 150u);
}

TEST_F(ChunkerTest, PdfPagesAreLabeledByPageNumber) {
  auto segments = chunker_.chunk("Page one text\fPage two text\f\fPage four", FileType::Pdf);
  std::vector<std::string> expected = {"page_1", "page_2", "page_4"};
  EXPECT_EQ(labels_of(segments), expected);
  EXPECT_EQ(segments[0].content, "Page one text");
  EXPECT_EQ(segments[2].content, "Page four");
}

TEST_F(ChunkerTest, CustomPageDelimiter) {
  ChunkingHints hints;
  hints.page_delimiter = "<PAGE>";
  auto segments = chunker_.chunk("first<PAGE>second", FileType::Pdf, hints);
  std::vector<std::string> expected = {"page_1", "page_2"};
  EXPECT_EQ(labels_of(segments), expected);
}

TEST_F(ChunkerTest, SlidesAreLabeledBySlideNumber) {
  auto segments = chunker_.chunk("Intro\fAgenda", FileType::Slide);
  std::vector<std::string> expected = {"slide_1", "slide_2"};
  EXPECT_EQ(labels_of(segments), expected);
}

TEST_F(ChunkerTest, LongPageIsWindowedUnderOneLabel) {
  auto segments = chunker_.chunk(long_text(200), FileType::Pdf);
  ASSERT_GT(segments.size(), 1u);
  for (const auto& segment : segments) {
    EXPECT_EQ(segment.section_label, "page_1");
    EXPECT_LE(count_code_points(segment.content), 500u);
    EXPECT_FALSE(is_blank(segment.content));
  }
}

TEST_F(ChunkerTest, DocSplitsOnHeadings) {
  const std::string doc =
      "Preamble line\n"
      "# Intro\n"
      "Hello world\n"
      "## Details ##\n"
      "More text\n";
  auto segments = chunker_.chunk(doc, FileType::Doc);
  std::vector<std::string> expected = {"section_intro", "Intro", "Details"};
  ASSERT_EQ(labels_of(segments), expected);
  EXPECT_EQ(segments[0].content, "Preamble line");
  EXPECT_EQ(segments[1].content, "# Intro\nHello world");
  EXPECT_EQ(segments[2].content, "## Details ##\nMore text");
}

TEST_F(ChunkerTest, DocStartingWithHeadingHasNoIntro) {
  auto segments = chunker_.chunk("# Only\nbody", FileType::Doc);
  ASSERT_EQ(segments.size(), 1u);
  EXPECT_EQ(segments[0].section_label, "Only");
}

TEST_F(ChunkerTest, DocHandlesVeryLongHeadingLine) {
  const std::string title_line = "# Title " + std::string(150000, 'a');
  auto segments = chunker_.chunk("intro\n" + title_line + "\nbody", FileType::Doc);

  ASSERT_GT(segments.size(), 2u);
  EXPECT_EQ(segments[0].section_label, "section_intro");
  const std::string expected_label = "Title " + std::string(MAX_SECTION_LABEL_BYTES - 6, 'a');
  for (size_t i = 1; i < segments.size(); ++i) {
    EXPECT_EQ(segments[i].section_label, expected_label);
    EXPECT_LE(count_code_points(segments[i].content), 500u);
  }
  EXPECT_EQ(segments[1].content.rfind("# Title", 0), 0u);
}

TEST_F(ChunkerTest, DocIgnoresLinesThatAreNotHeadings) {
  const std::string doc =
      "#hashtag\n"
      "####### seven hashes\n"
      "    # indented code\n"
      "# \n"
      "plain\n";
  auto segments = chunker_.chunk(doc, FileType::Doc);
  ASSERT_EQ(segments.size(), 1u);
  EXPECT_EQ(segments[0].section_label, "full_text");
}

TEST_F(ChunkerTest, DocHeadingStripsClosingHashesAndCarriageReturn) {
  auto segments = chunker_.chunk("   ###\tSetup ###  \r\nsteps", FileType::Doc);
  ASSERT_EQ(segments.size(), 1u);
  EXPECT_EQ(segments[0].section_label, "Setup");
}

TEST_F(ChunkerTest, DocWithoutHeadingsIsFullText) {
  auto segments = chunker_.chunk("plain paragraph\nsecond line", FileType::Doc);
  ASSERT_EQ(segments.size(), 1u);
  EXPECT_EQ(segments[0].section_label, "full_text");
}

TEST_F(ChunkerTest, TextCsvAndImageUseNumberedParts) {
  for (FileType type : {FileType::Text, FileType::Csv, FileType::Image}) {
    auto segments = chunker_.chunk(long_text(400), type);
    ASSERT_GT(segments.size(), 1u) << to_string(type);
    for (size_t i = 0; i < segments.size(); ++i) {
      EXPECT_EQ(segments[i].section_label, "part_" + std::to_string(i + 1));
      EXPECT_LE(count_code_points(segments[i].content),
                Chunker::default_profile(type).max_chars);
    }
  }
}

TEST_F(ChunkerTest, BlankDocumentYieldsNothing) {
  EXPECT_TRUE(chunker_.chunk("", FileType::Text).empty());
  EXPECT_TRUE(chunker_.chunk(" \n\f ", FileType::Pdf).empty());
}

TEST_F(ChunkerTest, InvalidUtf8IsReplaced) {
  auto segments = chunker_.chunk("caf\xE9 au lait", FileType::Text);
  ASSERT_EQ(segments.size(), 1u);
  EXPECT_TRUE(is_valid_utf8(segments[0].content));
}

TEST_F(ChunkerTest, GlobalCapShrinksWindowAndOverlap) {
  Chunker capped(100);
  ChunkingProfile profile = capped.effective_profile(FileType::Pdf, {});
  EXPECT_EQ(profile.max_chars, 100u);
  EXPECT_EQ(profile.overlap_chars, 20u);

  for (const auto& segment : capped.chunk(long_text(200), FileType::Pdf)) {
    EXPECT_LE(count_code_points(segment.content), 100u);
  }
}

TEST_F(ChunkerTest, HintsOverrideProfile) {
  ChunkingHints hints;
  hints.max_chunk_chars = 200;
  ChunkingProfile profile = chunker_.effective_profile(FileType::Text, hints);
  EXPECT_EQ(profile.max_chars, 200u);
  EXPECT_EQ(profile.overlap_chars, 30u);

  hints.overlap_chars = 0;
  EXPECT_EQ(chunker_.effective_profile(FileType::Text, hints).overlap_chars, 0u);
}

TEST_F(ChunkerTest, GlobalCapWinsOverLargerHint) {
  Chunker capped(100);
  ChunkingHints hints;
  hints.max_chunk_chars = 300;
  EXPECT_EQ(capped.effective_profile(FileType::Text, hints).max_chars, 100u);
}

TEST_F(ChunkerTest, RejectsInvalidSizes) {
  EXPECT_THROW({ Chunker zero(0); }, ValidationError);

  ChunkingHints zero_hint;
  zero_hint.max_chunk_chars = 0;
  EXPECT_THROW(chunker_.chunk("text", FileType::Text, zero_hint), ValidationError);

  ChunkingHints overlap_too_big;
  overlap_too_big.max_chunk_chars = 50;
  overlap_too_big.overlap_chars = 50;
  EXPECT_THROW(chunker_.chunk("text", FileType::Text, overlap_too_big), ValidationError);
}

TEST_F(ChunkerTest, ChunkSections_KeepsLabelsAndNumbersUnlabeled) {
  std::vector<Section> sections = {
      {.label = "Intro", .content = "hello"},
      {.label = "  ", .content = "world"},
      {.label = "Empty", .content = "   "},
  };
  auto segments = chunker_.chunk_sections(sections, FileType::Doc);
  std::vector<std::string> expected = {"Intro", "part_2"};
  ASSERT_EQ(labels_of(segments), expected);
  EXPECT_EQ(segments[0].content, "hello");
  EXPECT_EQ(segments[1].content, "world");
}

TEST_F(ChunkerTest, ChunkSections_TruncatesLongLabels) {
  std::vector<Section> sections = {{.label = std::string(250, 'L'), .content = "body"}};
  auto segments = chunker_.chunk_sections(sections, FileType::Pdf);
  ASSERT_EQ(segments.size(), 1u);
  EXPECT_EQ(segments[0].section_label.size(), MAX_SECTION_LABEL_BYTES);
}

TEST_F(ChunkerTest, StrategySelectionByType) {
  EXPECT_NE(dynamic_cast<const PagedChunkingStrategy*>(&chunker_.get_strategy_for(FileType::Pdf)),
            nullptr);
  EXPECT_NE(dynamic_cast<const HeadingChunkingStrategy*>(&chunker_.get_strategy_for(FileType::Doc)),
            nullptr);
  EXPECT_NE(dynamic_cast<const WindowChunkingStrategy*>(&chunker_.get_strategy_for(FileType::Csv)),
            nullptr);
}

}  // namespace rag_tests
