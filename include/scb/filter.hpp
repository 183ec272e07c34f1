#pragma once

#include <filesystem>
#include <string_view>
#include <vector>

#include "types.hpp"

namespace scb {

// Shell-style wildcard match: '*' any run, '?' any single character,
// '[...]' a character class ('!' or '^' negates, ranges with '-')
// Matching is case-sensitive and operates on bytes.
bool globMatch(std::string_view pattern, std::string_view text);

// True if an active rule matches one of the segments of relativePath
// (the file name being its last segment)
bool isFiltered(const std::filesystem::path &relativePath, const std::vector<FilterRule> &rules);

// True if an active rule matches this single name
bool matchesAnyRule(std::string_view name, const std::vector<FilterRule> &rules);

} // namespace scb
