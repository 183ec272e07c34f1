#include <scb/filter.hpp>

namespace scb {

namespace {

// Match a '[...]' class starting at pattern[pos] == '['
// On success sets matched and advances pos past the closing ']'
// Returns false if the class is unterminated (the '[' is then a literal)
bool matchClass(std::string_view pattern, size_t &pos, char c, bool &matched) {
  size_t i = pos + 1;
  bool negate = false;
  if (i < pattern.size() && (pattern[i] == '!' || pattern[i] == '^')) {
    negate = true;
    ++i;
  }

  bool found = false;
  bool first = true;
  while (i < pattern.size() && (first || pattern[i] != ']')) {
    first = false;
    char lo = pattern[i];
    char hi = lo;
    if (i + 2 < pattern.size() && pattern[i + 1] == '-' && pattern[i + 2] != ']') {
      hi = pattern[i + 2];
      i += 3;
    } else {
      ++i;
    }
    if (static_cast<unsigned char>(lo) <= static_cast<unsigned char>(c) &&
        static_cast<unsigned char>(c) <= static_cast<unsigned char>(hi)) {
      found = true;
    }
  }

  if (i >= pattern.size()) {
    return false;
  }

  pos = i + 1;
  matched = found != negate;
  return true;
}

} // namespace

bool globMatch(std::string_view pattern, std::string_view text) {
  size_t p = 0;
  size_t t = 0;
  // Backtrack point for the most recent '*'
  size_t starP = std::string_view::npos;
  size_t starT = 0;

  while (t < text.size()) {
    if (p < pattern.size()) {
      char pc = pattern[p];
      if (pc == '*') {
        starP = p++;
        starT = t;
        continue;
      }
      if (pc == '?') {
        ++p;
        ++t;
        continue;
      }
      if (pc == '[') {
        size_t next = p;
        bool matched = false;
        if (matchClass(pattern, next, text[t], matched)) {
          if (matched) {
            p = next;
            ++t;
            continue;
          }
        } else if (text[t] == '[') {
          ++p;
          ++t;
          continue;
        }
      } else if (pc == text[t]) {
        ++p;
        ++t;
        continue;
      }
    }

    if (starP == std::string_view::npos) {
      return false;
    }
    p = starP + 1;
    t = ++starT;
  }

  while (p < pattern.size() && pattern[p] == '*') {
    ++p;
  }
  return p == pattern.size();
}

bool matchesAnyRule(std::string_view name, const std::vector<FilterRule> &rules) {
  for (const auto &rule : rules) {
    if (rule.active && !rule.pattern.empty() && globMatch(rule.pattern, name)) {
      return true;
    }
  }
  return false;
}

bool isFiltered(const std::filesystem::path &relativePath, const std::vector<FilterRule> &rules) {
  for (const auto &segment : relativePath) {
    std::string name = segment.string();
    if (name.empty() || name == "/" || name == "." || name == "..") {
      continue;
    }
    if (matchesAnyRule(name, rules)) {
      return true;
    }
  }
  return false;
}

} // namespace scb
