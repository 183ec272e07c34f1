#include <string>
#include <vector>

#include <scb/bundle_index.hpp>

#include <gtest/gtest.h>

namespace {

std::vector<scb::IndexEntry> sampleEntries() {
  return {
      {"./a.py", "1.5", 10, false},
      {"./long/b.cpp", "12.0", 7, false},
      {"./c.h", "", 0, true},
  };
}

} // namespace

// Test column alignment of the index block
TEST(BundleIndexTest, FormatAlignsColumns) {
  std::string expected = "# [[ SCB ]] FILE INDEX START\n"
                         "# Total Files: 3\n"
                         "# \n"
                         "# ./a.py" + std::string(6, ' ') + " | SIZE:  1.5kb | LINES: 10\n" +
                         "# ./long/b.cpp | SIZE: 12.0kb | LINES:  7\n" +
                         "# ./c.h" + std::string(7, ' ') + " [Error reading file]\n" +
                         "# [[ SCB ]] FILE INDEX END\n"
                         "\n";
  EXPECT_EQ(scb::formatIndex(sampleEntries()), expected);
}

TEST(BundleIndexTest, MakeEntryFromSourceFile) {
  scb::SourceFile file;
  file.displayPath = "./p/x.rs";
  file.sizeKiB = 1.5;
  file.lineCount = 42;

  scb::IndexEntry entry = scb::makeIndexEntry(file);
  EXPECT_EQ(entry.displayPath, "./p/x.rs");
  EXPECT_EQ(entry.sizeText, "1.5");
  EXPECT_EQ(entry.lineCount, 42u);
  EXPECT_FALSE(entry.failed);

  file.error = scb::LoadError{scb::LoadErrorKind::Decode, "binary"};
  entry = scb::makeIndexEntry(file);
  EXPECT_TRUE(entry.failed);
  EXPECT_TRUE(entry.sizeText.empty());
}

TEST(BundleIndexTest, ReadBackFormattedIndex) {
  std::string bundle = scb::formatIndex(sampleEntries()) +
                       "# [[ SCB ]] START FILE: ./a.py\nprint(1)\n# [[ SCB ]] END FILE: ./a.py\n";

  std::string error;
  auto entries = scb::readIndex(bundle, &error);
  ASSERT_TRUE(entries.has_value()) << error;
  EXPECT_EQ(*entries, sampleEntries());
}

TEST(BundleIndexTest, ReadPathsWithSeparatorText) {
  std::vector<scb::IndexEntry> tricky = {{"./odd | SIZE: dir/a.py", "0.1", 3, false}};

  auto entries = scb::readIndex(scb::formatIndex(tricky));
  ASSERT_TRUE(entries.has_value());
  EXPECT_EQ(*entries, tricky);
}

TEST(BundleIndexTest, ReadCrlfIndex) {
  std::string bundle = "# [[ SCB ]] FILE INDEX START\r\n"
                       "# Total Files: 1\r\n"
                       "# \r\n"
                       "# ./a.py | SIZE: 0.0kb | LINES: 1\r\n"
                       "# [[ SCB ]] FILE INDEX END\r\n";
  auto entries = scb::readIndex(bundle);
  ASSERT_TRUE(entries.has_value());
  ASSERT_EQ(entries->size(), 1u);
  EXPECT_EQ((*entries)[0].displayPath, "./a.py");
}

TEST(BundleIndexTest, EmptyBundleHasEmptyIndex) {
  auto entries = scb::readIndex("");
  ASSERT_TRUE(entries.has_value());
  EXPECT_TRUE(entries->empty());
}

TEST(BundleIndexTest, RejectsMissingIndex) {
  std::string error;
  EXPECT_FALSE(scb::readIndex("// [[ SCB ]] START FILE: ./a.c\n", &error).has_value());
  EXPECT_FALSE(error.empty());
}

TEST(BundleIndexTest, RejectsCountMismatch) {
  std::string bundle = "# [[ SCB ]] FILE INDEX START\n"
                       "# Total Files: 2\n"
                       "# \n"
                       "# ./a.py | SIZE: 0.0kb | LINES: 1\n"
                       "# [[ SCB ]] FILE INDEX END\n";
  std::string error;
  EXPECT_FALSE(scb::readIndex(bundle, &error).has_value());
  EXPECT_NE(error.find("declares 2"), std::string::npos);
}

TEST(BundleIndexTest, RejectsMalformedEntries) {
  std::string bundle = "# [[ SCB ]] FILE INDEX START\n"
                       "# Total Files: 1\n"
                       "# \n"
                       "# ./a.py | SIZE: 0.0kb | LINES: many\n"
                       "# [[ SCB ]] FILE INDEX END\n";
  EXPECT_FALSE(scb::readIndex(bundle).has_value());
}

TEST(BundleIndexTest, RejectsUnterminatedIndex) {
  std::string bundle = "# [[ SCB ]] FILE INDEX START\n"
                       "# Total Files: 1\n"
                       "# \n"
                       "# ./a.py | SIZE: 0.0kb | LINES: 1\n";
  std::string error;
  EXPECT_FALSE(scb::readIndex(bundle, &error).has_value());
  EXPECT_NE(error.find("not terminated"), std::string::npos);
}
