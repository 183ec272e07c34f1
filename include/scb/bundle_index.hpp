#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "types.hpp"

namespace scb {

inline constexpr std::string_view kIndexStart = "# [[ SCB ]] FILE INDEX START";
inline constexpr std::string_view kIndexEnd = "# [[ SCB ]] FILE INDEX END";
inline constexpr std::string_view kIndexTotalPrefix = "# Total Files: ";
inline constexpr std::string_view kIndexErrorNote = "[Error reading file]";

// One line of the file index block
struct IndexEntry {
  std::string displayPath;
  std::string sizeText; // KiB with one decimal, e.g. "1.5"
  size_t lineCount = 0;
  bool failed = false; // File could not be loaded

  bool operator==(const IndexEntry &) const = default;
};

IndexEntry makeIndexEntry(const SourceFile &file);

// Render the index block, including the trailing blank line
// Paths are padded to the longest path; sizes and line counts are right-aligned.
std::string formatIndex(const std::vector<IndexEntry> &entries);

// Parse the index block at the head of a bundle
// An empty bundle has an empty index. Returns std::nullopt if the block is missing or
// malformed, with error message in outError if provided.
std::optional<std::vector<IndexEntry>> readIndex(std::string_view bundle,
                                                 std::string *outError = nullptr);

} // namespace scb
