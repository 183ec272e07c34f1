#include <filesystem>
#include <fstream>
#include <string>

#include <scb/path_sanitizer.hpp>

#include <gtest/gtest.h>

namespace fs = std::filesystem;

class PathSanitizerTest : public ::testing::Test {
protected:
  void SetUp() override {
    tempDir_ = fs::temp_directory_path() /
               (std::string("scb_test_sanitizer_") +
                ::testing::UnitTest::GetInstance()->current_test_info()->name());
    fs::remove_all(tempDir_);
    outputRoot_ = tempDir_ / "out";
    fs::create_directories(outputRoot_);
  }

  void TearDown() override { fs::remove_all(tempDir_); }

  void touch(const fs::path &path) { std::ofstream(path) << "existing\n"; }

  fs::path tempDir_;
  fs::path outputRoot_;
};

TEST_F(PathSanitizerTest, ResolvesRelativePaths) {
  scb::PathSanitizer sanitizer(outputRoot_);
  EXPECT_EQ(sanitizer.root(), fs::canonical(outputRoot_));

  auto resolved = sanitizer.resolve("./src/main.py");
  ASSERT_TRUE(resolved.has_value());
  EXPECT_EQ(*resolved, sanitizer.root() / "src" / "main.py");
}

TEST_F(PathSanitizerTest, NormalizesInsideRoot) {
  scb::PathSanitizer sanitizer(outputRoot_);
  auto direct = sanitizer.resolve("safe.txt");
  auto roundabout = sanitizer.resolve("safe/../safe.txt");
  ASSERT_TRUE(direct.has_value());
  ASSERT_TRUE(roundabout.has_value());
  EXPECT_EQ(*direct, *roundabout);
}

// Test that traversal outside the root is rejected
TEST_F(PathSanitizerTest, RejectsTraversal) {
  scb::PathSanitizer sanitizer(outputRoot_);
  std::string error;
  EXPECT_FALSE(sanitizer.resolve("../outside.txt", &error).has_value());
  EXPECT_NE(error.find("../outside.txt"), std::string::npos);
  EXPECT_FALSE(sanitizer.resolve("../../etc/passwd").has_value());
  EXPECT_FALSE(sanitizer.resolve("subdir/../../x").has_value());
  EXPECT_FALSE(sanitizer.resolve("./../out2/x.py").has_value());
}

TEST_F(PathSanitizerTest, LeadingSlashIsRootMarker) {
  scb::PathSanitizer sanitizer(outputRoot_);
  auto resolved = sanitizer.resolve("/etc/passwd");
  ASSERT_TRUE(resolved.has_value());
  EXPECT_EQ(*resolved, sanitizer.root() / "etc" / "passwd");
}

TEST_F(PathSanitizerTest, RejectsPathsNamingNoFile) {
  scb::PathSanitizer sanitizer(outputRoot_);
  EXPECT_FALSE(sanitizer.resolve("").has_value());
  EXPECT_FALSE(sanitizer.resolve("/").has_value());
  EXPECT_FALSE(sanitizer.resolve(".").has_value());
  EXPECT_FALSE(sanitizer.resolve("src/..").has_value());
  EXPECT_FALSE(sanitizer.resolve("src/").has_value());
}

TEST_F(PathSanitizerTest, RootNeedNotExist) {
  scb::PathSanitizer sanitizer(tempDir_ / "later" / "out");
  auto resolved = sanitizer.resolve("a/b.c");
  ASSERT_TRUE(resolved.has_value());
  EXPECT_EQ(*resolved, sanitizer.root() / "a" / "b.c");
  EXPECT_FALSE(sanitizer.resolve("../../escape.c").has_value());
}

TEST_F(PathSanitizerTest, RejectsSymlinkEscape) {
  fs::create_directories(tempDir_ / "elsewhere");
  std::error_code ec;
  fs::create_directory_symlink(tempDir_ / "elsewhere", outputRoot_ / "link", ec);
  if (ec) {
    GTEST_SKIP() << "Cannot create symlinks: " << ec.message();
  }

  scb::PathSanitizer sanitizer(outputRoot_);
  EXPECT_FALSE(sanitizer.resolve("link/payload.py").has_value());
}

TEST_F(PathSanitizerTest, SymlinkAtTargetIsNotResolved) {
  touch(outputRoot_ / "real.txt");
  std::error_code ec;
  fs::create_symlink("real.txt", outputRoot_ / "link.txt", ec);
  if (ec) {
    GTEST_SKIP() << "Cannot create symlinks: " << ec.message();
  }

  scb::PathSanitizer sanitizer(outputRoot_);
  auto resolved = sanitizer.resolve("link.txt");
  ASSERT_TRUE(resolved.has_value());
  EXPECT_EQ(*resolved, sanitizer.root() / "link.txt");
  EXPECT_EQ(scb::resolveCollision(*resolved, true, 10), sanitizer.root() / "link_1.txt");

  EXPECT_FALSE(sanitizer.resolve("..").has_value());
  EXPECT_FALSE(sanitizer.resolve("sub/..").has_value());
}

TEST(WithinRootTest, ComparesComponents) {
  EXPECT_TRUE(scb::isWithinRoot("/a/out", "/a/out"));
  EXPECT_TRUE(scb::isWithinRoot("/a/out", "/a/out/x/y.c"));
  EXPECT_FALSE(scb::isWithinRoot("/a/out", "/a/outside/y.c"));
  EXPECT_FALSE(scb::isWithinRoot("/a/out", "/a"));
}

TEST_F(PathSanitizerTest, CollisionFreeTarget) {
  fs::path target = outputRoot_ / "a.py";
  EXPECT_EQ(scb::resolveCollision(target, false), target);
  EXPECT_EQ(scb::resolveCollision(target, true), target);
}

TEST_F(PathSanitizerTest, CollisionRenames) {
  fs::path target = outputRoot_ / "a.py";
  touch(target);
  EXPECT_EQ(scb::resolveCollision(target, false), outputRoot_ / "a_1.py");

  touch(outputRoot_ / "a_1.py");
  EXPECT_EQ(scb::resolveCollision(target, false), outputRoot_ / "a_2.py");
}

TEST_F(PathSanitizerTest, CollisionWithoutExtension) {
  fs::path target = outputRoot_ / "Makefile";
  touch(target);
  EXPECT_EQ(scb::resolveCollision(target, false), outputRoot_ / "Makefile_1");
}

TEST_F(PathSanitizerTest, OverwriteReplacesRegularFilesOnly) {
  fs::path file = outputRoot_ / "a.py";
  touch(file);
  EXPECT_EQ(scb::resolveCollision(file, true), file);

  fs::path dir = outputRoot_ / "pkg.py";
  fs::create_directories(dir);
  EXPECT_EQ(scb::resolveCollision(dir, true), outputRoot_ / "pkg_1.py");
}

TEST_F(PathSanitizerTest, OverwriteDoesNotFollowSymlinks) {
  fs::path outside = tempDir_ / "victim.py";
  touch(outside);
  std::error_code ec;
  fs::create_symlink(outside, outputRoot_ / "a.py", ec);
  if (ec) {
    GTEST_SKIP() << "Cannot create symlinks: " << ec.message();
  }

  EXPECT_EQ(scb::resolveCollision(outputRoot_ / "a.py", true), outputRoot_ / "a_1.py");
}

TEST_F(PathSanitizerTest, CollisionAttemptsAreBounded) {
  fs::path target = outputRoot_ / "a.py";
  touch(target);
  touch(outputRoot_ / "a_1.py");
  touch(outputRoot_ / "a_2.py");

  EXPECT_THROW(scb::resolveCollision(target, false, 2), scb::CollisionError);
  EXPECT_EQ(scb::resolveCollision(target, false, 3), outputRoot_ / "a_3.py");
}
