#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "encoding.hpp"
#include "types.hpp"

namespace scb {

// Message written into the bundle for files no encoding could decode
inline constexpr std::string_view kDecodeFailureMessage =
    "Cannot read file (binary or unsupported encoding)";

// Number of decoded code points inspected by the binary heuristic
inline constexpr size_t kBinarySampleSize = 8192;

// Heuristic: more than 10% of the first kBinarySampleSize code points are
// neither printable nor one of TAB, LF, FF, CR
// This can misclassify text rich in unusual code points or admit mostly-printable binary.
bool looksBinary(std::string_view utf8Text);

struct DecodedText {
  std::string text; // UTF-8
  Encoding encoding = Encoding::Utf8;
};

// Decodes file bytes to text with an ordered encoding fallback
class ContentLoader {
public:
  // UTF-8, then Windows-1252, then ISO-8859-1
  ContentLoader();
  explicit ContentLoader(std::vector<Encoding> encodings);

  // Try every encoding in order; an attempt succeeds only if it decodes and does not look binary
  std::optional<DecodedText> decode(std::span<const uint8_t> bytes) const;

  // Read and decode a file
  // Returns std::nullopt on failure, with the cause in outError if provided
  std::optional<DecodedText> load(const std::filesystem::path &path,
                                  LoadError *outError = nullptr) const;

  // Load file.absolutePath and fill content, sizeKiB and lineCount, or error
  void loadInto(SourceFile &file) const;

  const std::vector<Encoding> &encodings() const { return encodings_; }

private:
  std::vector<Encoding> encodings_;
};

} // namespace scb
