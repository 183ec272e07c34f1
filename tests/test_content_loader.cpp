#include <filesystem>
#include <fstream>
#include <string>

#include <scb/content_loader.hpp>

#include <gtest/gtest.h>

namespace fs = std::filesystem;

class ContentLoaderTest : public ::testing::Test {
protected:
  void SetUp() override {
    tempDir_ = fs::temp_directory_path() /
               (std::string("scb_test_loader_") +
                ::testing::UnitTest::GetInstance()->current_test_info()->name());
    fs::create_directories(tempDir_);
  }

  void TearDown() override { fs::remove_all(tempDir_); }

  fs::path createTestFile(const std::string &name, const std::string &content) {
    fs::path filePath = tempDir_ / name;
    std::ofstream file(filePath, std::ios::binary);
    file.write(content.data(), static_cast<std::streamsize>(content.size()));
    return filePath;
  }

  fs::path tempDir_;
};

TEST(BinaryHeuristicTest, PlainTextIsNotBinary) {
  EXPECT_FALSE(scb::looksBinary("int main() {\n\treturn 0;\r\n}\f\n"));
  EXPECT_FALSE(scb::looksBinary(""));
}

TEST(BinaryHeuristicTest, ControlBytesAreBinary) {
  EXPECT_TRUE(scb::looksBinary(std::string("\x00\x00\x00\x01", 4)));
}

TEST(BinaryHeuristicTest, TenPercentThreshold) {
  // 10 of 100 non-printable is tolerated, 11 of 100 is not
  std::string tolerated = std::string(90, 'a') + std::string(10, '\x01');
  std::string rejected = std::string(89, 'a') + std::string(11, '\x01');
  EXPECT_FALSE(scb::looksBinary(tolerated));
  EXPECT_TRUE(scb::looksBinary(rejected));
}

TEST(BinaryHeuristicTest, OnlyTheSampleIsInspected) {
  // Control characters beyond the first 8192 code points are not seen
  std::string text = std::string(scb::kBinarySampleSize, 'a') + std::string(5000, '\x01');
  EXPECT_FALSE(scb::looksBinary(text));
}

TEST_F(ContentLoaderTest, LoadsUtf8) {
  scb::ContentLoader loader;
  scb::LoadError error;
  auto decoded = loader.load(createTestFile("a.py", "print('h\xC3\xA9')\n"), &error);
  ASSERT_TRUE(decoded.has_value()) << error.message;
  EXPECT_EQ(decoded->encoding, scb::Encoding::Utf8);
  EXPECT_EQ(decoded->text, "print('h\xC3\xA9')\n");
}

TEST_F(ContentLoaderTest, FallsBackToWindows1252) {
  scb::ContentLoader loader;
  auto decoded = loader.load(createTestFile("a.c", "// caf\xE9 \x80\n"));
  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(decoded->encoding, scb::Encoding::Windows1252);
  EXPECT_EQ(decoded->text, "// caf\xC3\xA9 \xE2\x82\xAC\n");
}

TEST_F(ContentLoaderTest, FallsBackToLatin1) {
  // 0x81 is undefined in Windows-1252; one C1 control in 21 characters is tolerated
  scb::ContentLoader loader;
  auto decoded = loader.load(createTestFile("a.c", std::string(20, 'x') + "\x81"));
  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(decoded->encoding, scb::Encoding::Latin1);
  EXPECT_EQ(decoded->text, std::string(20, 'x') + "\xC2\x81");
}

TEST_F(ContentLoaderTest, RejectsBinaryContent) {
  scb::ContentLoader loader;
  scb::LoadError error;
  auto decoded = loader.load(createTestFile("binary.dat", std::string("\x00\x00\x00\x01", 4)),
                             &error);
  EXPECT_FALSE(decoded.has_value());
  EXPECT_EQ(error.kind, scb::LoadErrorKind::Decode);
  EXPECT_EQ(error.message, scb::kDecodeFailureMessage);
}

TEST_F(ContentLoaderTest, ReportsMissingFileAsIoError) {
  scb::ContentLoader loader;
  scb::LoadError error;
  auto decoded = loader.load(tempDir_ / "missing.py", &error);
  EXPECT_FALSE(decoded.has_value());
  EXPECT_EQ(error.kind, scb::LoadErrorKind::Io);
  EXPECT_NE(error.message.find("missing.py"), std::string::npos);
}

TEST_F(ContentLoaderTest, CustomEncodingOrder) {
  scb::ContentLoader loader({scb::Encoding::Utf8});
  EXPECT_FALSE(loader.load(createTestFile("a.c", "caf\xE9\n")).has_value());
}

TEST_F(ContentLoaderTest, LoadIntoComputesStatistics) {
  scb::SourceFile file;
  file.absolutePath = createTestFile("stats.py", std::string(2047, 'x') + "\n");

  scb::ContentLoader loader;
  loader.loadInto(file);

  ASSERT_TRUE(file.loaded());
  EXPECT_DOUBLE_EQ(file.sizeKiB, 2.0);
  EXPECT_EQ(file.lineCount, 2u);
}

TEST_F(ContentLoaderTest, LoadIntoEmptyFile) {
  scb::SourceFile file;
  file.absolutePath = createTestFile("empty.py", "");

  scb::ContentLoader loader;
  loader.loadInto(file);

  ASSERT_TRUE(file.loaded());
  EXPECT_TRUE(file.content.empty());
  EXPECT_EQ(file.lineCount, 1u);
}

TEST_F(ContentLoaderTest, LoadIntoRecordsFailure) {
  scb::SourceFile file;
  file.absolutePath = createTestFile("bin.py", std::string("\x00\x01\x02", 3));

  scb::ContentLoader loader;
  loader.loadInto(file);

  ASSERT_FALSE(file.loaded());
  EXPECT_EQ(file.error->kind, scb::LoadErrorKind::Decode);
  EXPECT_TRUE(file.content.empty());
}
