#include <gtest/gtest.h>

#include <filesystem>
#include <string>

#include "docqa_core/loaders/document_loader.hpp"
#include "../../common/utilities_test.hpp"

namespace docqa_core {

class DocumentLoaderTest : public ::testing::Test {
 protected:
  void TearDown() override {
    for (const auto &path : created_files_) {
      std::filesystem::remove(path);
    }
  }

  std::filesystem::path create_test_file(const std::string &content) {
    auto path = docqa_tests::TestUtilities::create_temp_file(content);
    created_files_.push_back(path);
    return path;
  }

  std::vector<std::filesystem::path> created_files_;
};

TEST_F(DocumentLoaderTest, LoadsFileContentVerbatim) {
  const std::string content = "First line.\r\nSecond line with UTF-8: caf\xc3\xa9.\n";
  auto path = create_test_file(content);

  Document document = DocumentLoader::load_from_file(path);

  EXPECT_EQ(document.content, content);
  EXPECT_EQ(document.source_name, path.filename().string());
  EXPECT_EQ(document.document_id, DocumentLoader::compute_content_hash(content));
}

TEST_F(DocumentLoaderTest, MissingFileThrows) {
  EXPECT_THROW(DocumentLoader::load_from_file("/nonexistent/docqa/input.txt"), DocumentLoadError);
}

TEST_F(DocumentLoaderTest, EmptyContentIsAccepted) {
  Document document = DocumentLoader::load_from_string("", "empty.txt");
  EXPECT_TRUE(document.content.empty());
  EXPECT_EQ(document.document_id,
            "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST_F(DocumentLoaderTest, InvalidUtf8IsRejectedWithOffset) {
  const std::string content = std::string("valid prefix ") + "\xff\xfe" + " rest";
  try {
    DocumentLoader::load_from_string(content, "binary.bin");
    FAIL() << "Expected DocumentLoadError";
  } catch (const DocumentLoadError &e) {
    EXPECT_NE(std::string(e.what()).find("offset 13"), std::string::npos) << e.what();
  }
}

TEST_F(DocumentLoaderTest, TruncatedMultibyteSequenceIsRejected) {
  EXPECT_THROW(DocumentLoader::load_from_string("caf\xc3", "cut.txt"), DocumentLoadError);
}

TEST_F(DocumentLoaderTest, HashIsKnownSha256) {
  EXPECT_EQ(DocumentLoader::compute_content_hash("abc"),
            "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST_F(DocumentLoaderTest, DifferentContentGivesDifferentIds) {
  EXPECT_NE(DocumentLoader::load_from_string("one", "a").document_id,
            DocumentLoader::load_from_string("two", "a").document_id);
}

}  // namespace docqa_core
