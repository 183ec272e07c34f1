#include <algorithm>
#include <cctype>

#include <scb/config.hpp>

namespace scb {

ExtensionSet defaultExtensions() {
  return {".py", ".rs", ".c", ".h", ".cpp", ".hpp", ".css"};
}

std::string normalizeExtension(std::string_view extension) {
  std::string result;
  if (extension.empty()) {
    return result;
  }

  result.reserve(extension.size() + 1);
  if (extension.front() != '.') {
    result += '.';
  }
  for (char c : extension) {
    result += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return result;
}

ExtensionSet parseExtensionList(std::string_view list) {
  ExtensionSet result;
  auto isSeparator = [](char c) {
    return c == ',' || std::isspace(static_cast<unsigned char>(c));
  };

  size_t pos = 0;
  while (pos < list.size()) {
    while (pos < list.size() && isSeparator(list[pos])) {
      ++pos;
    }
    size_t end = pos;
    while (end < list.size() && !isSeparator(list[end])) {
      ++end;
    }
    if (end > pos) {
      result.insert(normalizeExtension(list.substr(pos, end - pos)));
    }
    pos = end;
  }
  return result;
}

FilterRule parseFilterRule(std::string_view text) {
  FilterRule rule;
  if (text.starts_with('!')) {
    rule.active = false;
    text.remove_prefix(1);
  }
  rule.pattern = std::string(text);
  return rule;
}

} // namespace scb
