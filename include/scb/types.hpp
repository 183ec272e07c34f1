#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>

namespace scb {

// Lower-cased, dot-prefixed extensions (".py", ".cpp", ...)
using ExtensionSet = std::set<std::string>;

// Synchronous progress notification (current, total)
using ProgressCallback = std::function<void(size_t, size_t)>;

// Glob exclusion rule, matched against a file name or any path segment
struct FilterRule {
  std::string pattern;
  bool active = true;
};

// Why a file could not be loaded during a merge
enum class LoadErrorKind {
  Decode, // Every encoding failed or was rejected as binary
  Io,     // The file could not be opened or read
};

struct LoadError {
  LoadErrorKind kind = LoadErrorKind::Io;
  std::string message;
};

// One file taking part in a merge
struct SourceFile {
  std::filesystem::path absolutePath;
  std::string displayPath; // "./"-prefixed, forward slashes
  std::string content;     // UTF-8, valid only when !error
  std::optional<LoadError> error;
  double sizeKiB = 0.0;
  size_t lineCount = 0;

  bool loaded() const { return !error.has_value(); }
};

// Summary of a merge
struct MergeStats {
  size_t fileCount = 0;
  size_t errorCount = 0;
  size_t characterCount = 0; // Code points written to the bundle
  size_t tokenEstimate = 0;  // characterCount / 4, a coarse sizing signal
};

// Summary of a split
struct SplitStats {
  size_t lineCount = 0;
  size_t filesWritten = 0;
  size_t filesRenamed = 0;
  size_t entriesSkipped = 0;
  size_t errorBlocks = 0;
  bool truncated = false; // Stream ended while a file was still open
};

// Directory walk failure, fatal to the whole merge
class CollectionError : public std::runtime_error {
public:
  explicit CollectionError(const std::string &msg) : std::runtime_error(msg) {}
};

// Declared bundle path that is unsafe or cannot be resolved
class PathResolutionError : public std::runtime_error {
public:
  explicit PathResolutionError(const std::string &msg) : std::runtime_error(msg) {}
};

// No free "<stem>_<n><ext>" name within the attempt bound
class CollisionError : public std::runtime_error {
public:
  explicit CollisionError(const std::string &msg) : std::runtime_error(msg) {}
};

} // namespace scb
