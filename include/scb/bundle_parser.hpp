#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "logging.hpp"
#include "path_sanitizer.hpp"
#include "types.hpp"

namespace scb {

struct SplitOptions {
  bool overwrite = false; // Replace existing regular files instead of renaming around them
  std::vector<FilterRule> filters;
  ProgressCallback progress;
  size_t progressStride = 100;    // Lines between progress notifications
  size_t maxErrorBlockLines = 64; // Lines searched for END ERROR after START ERROR
  size_t maxRenameAttempts = kMaxRenameAttempts;
  Logger *logger = nullptr; // defaultLogger() when null
};

// Split text into lines, keeping each line's terminator ("\n", "\r\n" or "\r")
std::vector<std::string_view> splitLines(std::string_view text);

// Reconstructs files from bundle text
//
// Single pass over the lines of the bundle. At most one output file is open at a time; it is
// opened by START FILE and closed by the matching END FILE, by the next START FILE, or at the
// end of the input. Malformed input never fails the split: unsafe paths, filtered entries and
// entries whose file cannot be created are skipped and logged.
class BundleParser {
public:
  BundleParser() = default;
  explicit BundleParser(SplitOptions options);

  // Delete copy, enable move
  BundleParser(const BundleParser &) = delete;
  BundleParser &operator=(const BundleParser &) = delete;
  BundleParser(BundleParser &&) noexcept = default;
  BundleParser &operator=(BundleParser &&) noexcept = default;

  // Split bundle text into files below outputRoot (created if missing)
  // Returns std::nullopt only if outputRoot cannot be created, with error message in outError
  // if provided
  std::optional<SplitStats> split(std::string_view bundle, const std::filesystem::path &outputRoot,
                                  std::string *outError = nullptr);

  // Split the bundle stored at bundlePath
  std::optional<SplitStats> splitFile(const std::filesystem::path &bundlePath,
                                      const std::filesystem::path &outputRoot,
                                      std::string *outError = nullptr);

  const SplitOptions &options() const { return options_; }

private:
  SplitOptions options_;
};

} // namespace scb
