#include <algorithm>
#include <charconv>

#include <fmt/format.h>

#include <scb/bundle_index.hpp>
#include <scb/encoding.hpp>

namespace scb {

namespace {

constexpr std::string_view kSizeSeparator = " | SIZE: ";
constexpr std::string_view kLinesSeparator = "kb | LINES: ";

std::string_view trimRight(std::string_view text) {
  size_t end = text.find_last_not_of(" \t\r");
  return end == std::string_view::npos ? std::string_view{} : text.substr(0, end + 1);
}

std::string_view trimLeft(std::string_view text) {
  size_t start = text.find_first_not_of(' ');
  return start == std::string_view::npos ? std::string_view{} : text.substr(start);
}

bool parseCount(std::string_view text, size_t &value) {
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  return ec == std::errc() && ptr == text.data() + text.size();
}

// Next '\n'-terminated line without its terminator; false at end of input
bool nextLine(std::string_view text, size_t &pos, std::string_view &line) {
  if (pos >= text.size()) {
    return false;
  }
  size_t end = text.find('\n', pos);
  if (end == std::string_view::npos) {
    end = text.size();
  }
  line = trimRight(text.substr(pos, end - pos));
  pos = end + 1;
  return true;
}

std::optional<IndexEntry> parseEntry(std::string_view line) {
  if (!line.starts_with("# ")) {
    return std::nullopt;
  }
  line.remove_prefix(2);

  IndexEntry entry;
  if (line.ends_with(kIndexErrorNote)) {
    entry.displayPath = std::string(trimRight(line.substr(0, line.size() - kIndexErrorNote.size())));
    entry.failed = true;
    return entry.displayPath.empty() ? std::nullopt : std::optional<IndexEntry>(entry);
  }

  size_t sizePos = line.rfind(kSizeSeparator);
  if (sizePos == std::string_view::npos) {
    return std::nullopt;
  }
  std::string_view stats = line.substr(sizePos + kSizeSeparator.size());
  size_t linesPos = stats.find(kLinesSeparator);
  if (linesPos == std::string_view::npos) {
    return std::nullopt;
  }

  entry.displayPath = std::string(trimRight(line.substr(0, sizePos)));
  entry.sizeText = std::string(trimLeft(stats.substr(0, linesPos)));
  if (entry.displayPath.empty() || entry.sizeText.empty() ||
      !parseCount(trimLeft(stats.substr(linesPos + kLinesSeparator.size())), entry.lineCount)) {
    return std::nullopt;
  }
  return entry;
}

} // namespace

IndexEntry makeIndexEntry(const SourceFile &file) {
  IndexEntry entry;
  entry.displayPath = file.displayPath;
  if (file.loaded()) {
    entry.sizeText = fmt::format("{:.1f}", file.sizeKiB);
    entry.lineCount = file.lineCount;
  } else {
    entry.failed = true;
  }
  return entry;
}

std::string formatIndex(const std::vector<IndexEntry> &entries) {
  size_t pathWidth = 0;
  size_t sizeWidth = 0;
  size_t linesWidth = 0;
  for (const auto &entry : entries) {
    pathWidth = std::max(pathWidth, countCodepoints(entry.displayPath));
    if (!entry.failed) {
      sizeWidth = std::max(sizeWidth, entry.sizeText.size());
      linesWidth = std::max(linesWidth, fmt::formatted_size("{}", entry.lineCount));
    }
  }

  std::string out;
  out += fmt::format("{}\n{}{}\n# \n", kIndexStart, kIndexTotalPrefix, entries.size());

  for (const auto &entry : entries) {
    // Pad by code points, not display columns
    std::string padded = entry.displayPath;
    padded.append(pathWidth - countCodepoints(entry.displayPath), ' ');

    if (entry.failed) {
      out += fmt::format("# {} {}\n", padded, kIndexErrorNote);
    } else {
      out += fmt::format("# {}{}{:>{}}{}{:>{}}\n", padded, kSizeSeparator, entry.sizeText,
                         sizeWidth, kLinesSeparator, entry.lineCount, linesWidth);
    }
  }

  out += fmt::format("{}\n\n", kIndexEnd);
  return out;
}

std::optional<std::vector<IndexEntry>> readIndex(std::string_view bundle, std::string *outError) {
  std::vector<IndexEntry> entries;
  if (bundle.empty()) {
    return entries;
  }

  size_t pos = 0;
  std::string_view line;
  if (!nextLine(bundle, pos, line) || line != kIndexStart) {
    if (outError) {
      *outError = "Bundle does not start with a file index";
    }
    return std::nullopt;
  }

  size_t declared = 0;
  if (!nextLine(bundle, pos, line) || !line.starts_with(kIndexTotalPrefix) ||
      !parseCount(line.substr(kIndexTotalPrefix.size()), declared)) {
    if (outError) {
      *outError = "File index has no valid 'Total Files' line";
    }
    return std::nullopt;
  }

  size_t lineNumber = 2;
  while (nextLine(bundle, pos, line)) {
    ++lineNumber;
    if (line == kIndexEnd) {
      if (entries.size() != declared) {
        if (outError) {
          *outError = fmt::format("File index lists {} files but declares {}", entries.size(),
                                  declared);
        }
        return std::nullopt;
      }
      return entries;
    }
    if (line == "#") {
      continue;
    }

    auto entry = parseEntry(line);
    if (!entry) {
      if (outError) {
        *outError = fmt::format("Malformed file index entry at line {}", lineNumber);
      }
      return std::nullopt;
    }
    entries.push_back(std::move(*entry));
  }

  if (outError) {
    *outError = "File index is not terminated";
  }
  return std::nullopt;
}

} // namespace scb
