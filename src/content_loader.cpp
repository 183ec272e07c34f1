#include <algorithm>
#include <utility>

#include <scb/content_loader.hpp>
#include <scb/mmap.hpp>

namespace scb {

bool looksBinary(std::string_view utf8Text) {
  size_t sampled = 0;
  size_t nonPrintable = 0;
  size_t pos = 0;

  while (pos < utf8Text.size() && sampled < kBinarySampleSize) {
    char32_t cp = nextCodepoint(utf8Text, pos);
    ++sampled;
    if (cp == U'\t' || cp == U'\n' || cp == U'\f' || cp == U'\r') {
      continue;
    }
    if (!isPrintable(cp)) {
      ++nonPrintable;
    }
  }

  // nonPrintable > 10% of the sample, without floating point
  return nonPrintable * 10 > sampled;
}

ContentLoader::ContentLoader()
    : encodings_{Encoding::Utf8, Encoding::Windows1252, Encoding::Latin1} {}

ContentLoader::ContentLoader(std::vector<Encoding> encodings) : encodings_(std::move(encodings)) {}

std::optional<DecodedText> ContentLoader::decode(std::span<const uint8_t> bytes) const {
  for (Encoding encoding : encodings_) {
    DecodedText decoded;
    if (!decodeToUtf8(bytes, encoding, decoded.text)) {
      continue;
    }
    if (looksBinary(decoded.text)) {
      continue;
    }
    decoded.encoding = encoding;
    return decoded;
  }
  return std::nullopt;
}

std::optional<DecodedText> ContentLoader::load(const std::filesystem::path &path,
                                               LoadError *outError) const {
  MappedFile file;
  std::string ioError;
  if (!file.openRead(path, &ioError)) {
    if (outError) {
      *outError = LoadError{LoadErrorKind::Io, std::move(ioError)};
    }
    return std::nullopt;
  }

  auto decoded = decode(file.data());
  if (!decoded) {
    if (outError) {
      *outError = LoadError{LoadErrorKind::Decode, std::string(kDecodeFailureMessage)};
    }
    return std::nullopt;
  }
  return decoded;
}

void ContentLoader::loadInto(SourceFile &file) const {
  LoadError error;
  auto decoded = load(file.absolutePath, &error);
  if (!decoded) {
    file.content.clear();
    file.error = std::move(error);
    file.sizeKiB = 0.0;
    file.lineCount = 0;
    return;
  }

  file.content = std::move(decoded->text);
  file.error.reset();
  file.sizeKiB = static_cast<double>(file.content.size()) / 1024.0;
  file.lineCount = static_cast<size_t>(std::count(file.content.begin(), file.content.end(), '\n')) + 1;
}

} // namespace scb
