#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace scb {

// Token identifying every marker line
inline constexpr std::string_view kSentinel = "[[ SCB ]]";

enum class MarkerKind {
  StartFile,
  EndFile,
  StartError,
  ErrorMessage,
  EndError,
};

// Keyword following the sentinel, without the colon ("START FILE", ...)
std::string_view keyword(MarkerKind kind);

// Comment convention used for the marker lines of one file type
struct CommentSyntax {
  std::string_view leader;
  bool closingSuffix = false; // Block comments get " */" appended

  bool operator==(const CommentSyntax &) const = default;
};

// Syntax for a (case-insensitive) extension such as ".py"; "//" when unknown
CommentSyntax commentSyntaxFor(std::string_view extension);

// Syntax for the extension of a path
CommentSyntax commentSyntaxForPath(const std::filesystem::path &path);

// Build a marker line (without line terminator)
// payload is the display path, or the message for MarkerKind::ErrorMessage
std::string formatMarker(MarkerKind kind, std::string_view payload, const CommentSyntax &syntax);

// A recognized marker line
struct Marker {
  MarkerKind kind = MarkerKind::StartFile;
  std::string leader;
  std::string payload;
};

// Recognize a marker line
// Any non-whitespace token is accepted as the leader, surrounding whitespace and a trailing
// block-comment close are ignored. Returns std::nullopt for ordinary lines.
std::optional<Marker> parseMarker(std::string_view line);

} // namespace scb
