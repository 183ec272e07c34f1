#include <algorithm>
#include <array>
#include <cctype>
#include <utility>

#include <fmt/format.h>

#include <scb/marker.hpp>

namespace scb {

namespace {

constexpr CommentSyntax kHashSyntax{"#", false};
constexpr CommentSyntax kDocSlashSyntax{"///", false};
constexpr CommentSyntax kSlashSyntax{"//", false};
constexpr CommentSyntax kBlockSyntax{"/*", true};

constexpr std::array<std::pair<std::string_view, CommentSyntax>, 7> kSyntaxTable = {{
    {".py", kHashSyntax},
    {".rs", kDocSlashSyntax},
    {".c", kSlashSyntax},
    {".h", kSlashSyntax},
    {".cpp", kSlashSyntax},
    {".hpp", kSlashSyntax},
    {".css", kBlockSyntax},
}};

constexpr std::array<MarkerKind, 5> kAllKinds = {
    MarkerKind::StartFile, MarkerKind::EndFile, MarkerKind::StartError, MarkerKind::EndError,
    MarkerKind::ErrorMessage,
};

constexpr std::string_view kClosingSuffix = " */";
constexpr std::string_view kWhitespace = " \t\n\r\f\v";

bool isSpace(char c) {
  return kWhitespace.find(c) != std::string_view::npos;
}

std::string_view trim(std::string_view text) {
  size_t first = text.find_first_not_of(kWhitespace);
  if (first == std::string_view::npos) {
    return {};
  }
  size_t last = text.find_last_not_of(kWhitespace);
  return text.substr(first, last - first + 1);
}

} // namespace

std::string_view keyword(MarkerKind kind) {
  switch (kind) {
  case MarkerKind::StartFile:
    return "START FILE";
  case MarkerKind::EndFile:
    return "END FILE";
  case MarkerKind::StartError:
    return "START ERROR";
  case MarkerKind::ErrorMessage:
    return "ERROR";
  case MarkerKind::EndError:
    return "END ERROR";
  }
  return "START FILE";
}

CommentSyntax commentSyntaxFor(std::string_view extension) {
  std::string lowered(extension);
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  for (const auto &[ext, syntax] : kSyntaxTable) {
    if (ext == lowered) {
      return syntax;
    }
  }
  return kSlashSyntax;
}

CommentSyntax commentSyntaxForPath(const std::filesystem::path &path) {
  return commentSyntaxFor(path.extension().string());
}

std::string formatMarker(MarkerKind kind, std::string_view payload, const CommentSyntax &syntax) {
  return fmt::format("{} {} {}: {}{}", syntax.leader, kSentinel, keyword(kind), payload,
                     syntax.closingSuffix ? kClosingSuffix : std::string_view{});
}

std::optional<Marker> parseMarker(std::string_view line) {
  std::string_view rest = trim(line);

  // <leader><ws>+
  size_t leaderEnd = 0;
  while (leaderEnd < rest.size() && !isSpace(rest[leaderEnd])) {
    ++leaderEnd;
  }
  if (leaderEnd == 0 || leaderEnd == rest.size()) {
    return std::nullopt;
  }
  std::string_view leader = rest.substr(0, leaderEnd);
  rest = trim(rest.substr(leaderEnd));

  // [[ SCB ]]<space>
  if (!rest.starts_with(kSentinel) || rest.size() <= kSentinel.size() ||
      rest[kSentinel.size()] != ' ') {
    return std::nullopt;
  }
  rest.remove_prefix(kSentinel.size() + 1);

  for (MarkerKind kind : kAllKinds) {
    std::string_view word = keyword(kind);
    if (!rest.starts_with(word) || rest.size() <= word.size() || rest[word.size()] != ':') {
      continue;
    }

    // <ws>+<payload>
    std::string_view payload = rest.substr(word.size() + 1);
    if (payload.empty() || !isSpace(payload.front())) {
      return std::nullopt;
    }
    payload = trim(payload);
    if (payload.empty()) {
      return std::nullopt;
    }

    if (payload.ends_with("*/")) {
      std::string_view stripped = trim(payload.substr(0, payload.size() - 2));
      if (!stripped.empty()) {
        payload = stripped;
      }
    }

    Marker marker;
    marker.kind = kind;
    marker.leader = std::string(leader);
    marker.payload = std::string(payload);
    return marker;
  }

  return std::nullopt;
}

} // namespace scb
