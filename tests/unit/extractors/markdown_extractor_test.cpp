#include <gtest/gtest.h>

#include <filesystem>
#include <string>
#include <vector>

#include "rag_core/errors.hpp"
#include "rag_core/extractors/markdown_extractor.hpp"
#include "rag_core/utils/hashing.hpp"
#include "common/utilities_test.hpp"

namespace rag_core {

class MarkdownExtractorTest : public rag_tests::TempDirTestBase {
 protected:
  void SetUp() override {
    TempDirTestBase::SetUp();
    extractor_ = std::make_unique<MarkdownExtractor>(ChunkerConfig{.chunk_size = 20, .chunk_overlap = 0});
  }

  std::unique_ptr<MarkdownExtractor> extractor_;
};

// Test can_handle method
TEST_F(MarkdownExtractorTest, CanHandle_MarkdownFiles) {
  EXPECT_TRUE(extractor_->can_handle("/path/to/file.md"));
  EXPECT_TRUE(extractor_->can_handle("/path/to/README.MD"));
  EXPECT_TRUE(extractor_->can_handle("notes.Md"));
  EXPECT_FALSE(extractor_->can_handle("notes.txt"));
  EXPECT_FALSE(extractor_->can_handle("notes.markdown.bak"));
  EXPECT_FALSE(extractor_->can_handle("md"));
}

TEST_F(MarkdownExtractorTest, Preprocess_CollapsesBlankLinesAndTrims) {
  EXPECT_EQ(MarkdownExtractor::preprocess("\n\n  a  \n\n\n\n b\t\n  \n\nc\n\n"), "a\n\n b\n\nc");
  EXPECT_EQ(MarkdownExtractor::preprocess("line\r\nnext\r\n"), "line\nnext");
  EXPECT_EQ(MarkdownExtractor::preprocess(" \n\t\n"), "");
}

TEST_F(MarkdownExtractorTest, LoadDocument_CollectsMetadata) {
  const std::string content =
      "# Install Guide\n\nSome intro.\n\n## Linux\n\n```\nmake install\n```\n\n## macOS\n";
  auto path = write_file("guide.md", content);

  Document document = extractor_->load_document(path);

  EXPECT_EQ(document.content, MarkdownExtractor::preprocess(content));
  const auto& metadata = document.metadata;
  EXPECT_EQ(metadata["file_name"], "guide.md");
  EXPECT_EQ(metadata["source_file"], path.string());
  EXPECT_EQ(metadata["file_path"], std::filesystem::absolute(path).string());
  EXPECT_EQ(metadata["title"], "Install Guide");
  EXPECT_EQ(metadata["header_count"], 3);
  EXPECT_EQ(metadata["code_block_count"], 1);
  EXPECT_EQ(metadata["document_type"], "markdown");
  EXPECT_EQ(metadata["file_size"], content.size());
  EXPECT_EQ(metadata["content_length"], document.content.size());
  EXPECT_EQ(metadata["content_hash"], sha256_hex(document.content));
  EXPECT_EQ(metadata["modified_time"].get<std::string>().size(), 19u);
}

TEST_F(MarkdownExtractorTest, LoadDocument_TitleFallsBackToFileStem) {
  auto path = write_file("release-notes.md", "## Only a subsection\n\nText.\n");

  Document document = extractor_->load_document(path);

  EXPECT_EQ(document.metadata["title"], "release-notes");
}

TEST_F(MarkdownExtractorTest, LoadDocument_CountsCodePoints) {
  auto path = write_file("zh.md", "深度学习");

  Document document = extractor_->load_document(path);

  EXPECT_EQ(document.metadata["content_length"], 4);
}

TEST_F(MarkdownExtractorTest, LoadDocument_RejectsNonMarkdown) {
  auto path = write_file("notes.txt", "plain text");

  EXPECT_THROW(extractor_->load_document(path), DocumentError);
}

TEST_F(MarkdownExtractorTest, LoadDocument_RejectsMissingFile) {
  EXPECT_THROW(extractor_->load_document(temp_dir_ / "missing.md"), DocumentError);
}

TEST_F(MarkdownExtractorTest, LoadDocument_RepairsInvalidUtf8) {
  auto path = write_file("broken.md", std::string("good \xff bad"));

  Document document = extractor_->load_document(path);

  EXPECT_NE(document.content.find("good"), std::string::npos);
  EXPECT_NE(document.content.find("\xEF\xBF\xBD"), std::string::npos);  // U+FFFD
}

TEST_F(MarkdownExtractorTest, Extract_AnnotatesHeadingPath) {
  auto path = write_file("guide.md", "# Guide\n\nIntro text.\n\n## Install\n\nRun the installer.\n");

  auto chunks = extractor_->extract(path);

  ASSERT_GE(chunks.size(), 2u);
  EXPECT_EQ(chunks.front().metadata["heading_path"], "Guide");
  EXPECT_EQ(chunks.back().content, "Run the installer.");
  EXPECT_EQ(chunks.back().metadata["heading_path"], "Guide > Install");
  for (const auto& chunk : chunks) {
    EXPECT_EQ(chunk.source_file, path.string());
    EXPECT_EQ(chunk.metadata["file_name"], "guide.md");
    EXPECT_EQ(chunk.metadata["title"], "Guide");
  }
}

TEST_F(MarkdownExtractorTest, Extract_SiblingHeadingsReplaceEachOther) {
  auto path = write_file("guide.md",
                         "# Guide\n\n## Linux\n\nUse apt to install.\n\n## macOS\n\nUse brew to install.\n");

  auto chunks = extractor_->extract(path);

  ASSERT_FALSE(chunks.empty());
  EXPECT_EQ(chunks.back().content, "Use brew to install.");
  EXPECT_EQ(chunks.back().metadata["heading_path"], "Guide > macOS");
}

TEST_F(MarkdownExtractorTest, Extract_EmptyFileYieldsNoChunks) {
  auto path = write_file("empty.md", "\n\n   \n");

  EXPECT_TRUE(extractor_->extract(path).empty());
}

TEST_F(MarkdownExtractorTest, ListDocuments_SortedFilteredAndCapped) {
  write_file("b.md", "b");
  write_file("a.md", "a");
  write_file("c.MD", "c");
  write_file("ignored.txt", "x");
  std::filesystem::create_directories(temp_dir_ / "sub.md");

  auto all = MarkdownExtractor::list_documents(temp_dir_, 10);
  ASSERT_EQ(all.size(), 3u);
  EXPECT_EQ(all[0].filename().string(), "a.md");
  EXPECT_EQ(all[1].filename().string(), "b.md");
  EXPECT_EQ(all[2].filename().string(), "c.MD");

  auto capped = MarkdownExtractor::list_documents(temp_dir_, 2);
  ASSERT_EQ(capped.size(), 2u);
  EXPECT_EQ(capped[1].filename().string(), "b.md");

  EXPECT_TRUE(MarkdownExtractor::list_documents(temp_dir_ / "missing", 10).empty());
}

}  // namespace rag_core
