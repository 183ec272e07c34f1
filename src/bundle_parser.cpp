#include <algorithm>
#include <fstream>
#include <utility>

#include <fmt/format.h>

#include <scb/bundle_parser.hpp>
#include <scb/filter.hpp>
#include <scb/marker.hpp>
#include <scb/mmap.hpp>

namespace fs = std::filesystem;

namespace scb {

namespace {

bool isBlank(std::string_view line) {
  return line.find_first_not_of(" \t\n\r\f\v") == std::string_view::npos;
}

// Block separator convention: one blank line follows END FILE / END ERROR
size_t skipBlankLine(const std::vector<std::string_view> &lines, size_t pos) {
  if (pos < lines.size() && isBlank(lines[pos])) {
    return pos + 1;
  }
  return pos;
}

// State of one split: Idle when out_ is closed, Writing while it is open
class SplitSession {
public:
  SplitSession(const SplitOptions &options, const fs::path &outputRoot)
      : options_(options), sanitizer_(outputRoot), logger_(loggerOrDefault(options.logger)) {}

  SplitStats run(std::string_view bundle);

private:
  bool writing() const { return out_.is_open(); }

  void openTarget(const std::string &declaredPath);
  void closeTarget();
  void writeLine(std::string_view line);
  size_t skipErrorBlock(const std::vector<std::string_view> &lines, size_t start);
  void reportProgress(size_t current, size_t total);

  const SplitOptions &options_;
  PathSanitizer sanitizer_;
  Logger &logger_;

  std::ofstream out_;
  std::string activePath_; // Declared path of the open target
  SplitStats stats_;
  size_t nextProgress_ = 0;
};

SplitStats SplitSession::run(std::string_view bundle) {
  const std::vector<std::string_view> lines = splitLines(bundle);
  stats_.lineCount = lines.size();

  size_t i = 0;
  while (i < lines.size()) {
    reportProgress(i, lines.size());
    std::string_view line = lines[i];

    if (auto marker = parseMarker(line)) {
      switch (marker->kind) {
      case MarkerKind::StartFile:
        closeTarget();
        openTarget(marker->payload);
        ++i;
        continue;

      case MarkerKind::EndFile:
        if (writing() && marker->payload == activePath_) {
          closeTarget();
          i = skipBlankLine(lines, i + 1);
          continue;
        }
        // Not ours: ordinary content
        break;

      case MarkerKind::StartError:
        i = skipErrorBlock(lines, i);
        continue;

      case MarkerKind::ErrorMessage:
      case MarkerKind::EndError:
        // Stray error lines carry no file content
        ++i;
        continue;
      }
    }

    if (writing()) {
      writeLine(line);
    }
    ++i;
  }

  if (writing()) {
    logger_.warn("Bundle ended before END FILE, keeping partial file", {{"path", activePath_}});
    stats_.truncated = true;
    closeTarget();
  }

  if (options_.progress) {
    options_.progress(lines.size(), lines.size());
  }
  return stats_;
}

void SplitSession::openTarget(const std::string &declaredPath) {
  std::string reason;
  auto target = sanitizer_.resolve(declaredPath, &reason);
  if (!target) {
    logger_.warn("Skipping unsafe path", {{"path", declaredPath}, {"reason", reason}});
    ++stats_.entriesSkipped;
    return;
  }

  if (isFiltered(target->lexically_relative(sanitizer_.root()), options_.filters)) {
    logger_.info("Skipping filtered entry", {{"path", declaredPath}});
    ++stats_.entriesSkipped;
    return;
  }

  try {
    fs::create_directories(target->parent_path());

    fs::path finalPath = resolveCollision(*target, options_.overwrite, options_.maxRenameAttempts);
    if (finalPath != *target) {
      ++stats_.filesRenamed;
      logger_.info("Duplicate filename, renamed",
                   {{"path", declaredPath}, {"renamed_to", finalPath.filename().string()}});
    }

    out_.open(finalPath, std::ios::binary | std::ios::trunc);
    if (!out_.is_open()) {
      logger_.error("Cannot create output file", {{"path", finalPath.string()}});
      ++stats_.entriesSkipped;
      return;
    }
  } catch (const CollisionError &e) {
    logger_.error("Skipping entry", {{"path", declaredPath}, {"reason", e.what()}});
    ++stats_.entriesSkipped;
    return;
  } catch (const fs::filesystem_error &e) {
    logger_.error("Skipping entry", {{"path", declaredPath}, {"reason", e.what()}});
    ++stats_.entriesSkipped;
    return;
  }

  activePath_ = declaredPath;
  ++stats_.filesWritten;
}

void SplitSession::closeTarget() {
  if (out_.is_open()) {
    out_.close();
  }
  activePath_.clear();
}

void SplitSession::writeLine(std::string_view line) {
  out_.write(line.data(), static_cast<std::streamsize>(line.size()));
  if (!out_) {
    logger_.error("Write failed, closing output file", {{"path", activePath_}});
    closeTarget();
  }
}

size_t SplitSession::skipErrorBlock(const std::vector<std::string_view> &lines, size_t start) {
  ++stats_.errorBlocks;

  const size_t limit = std::min(lines.size(), start + 1 + options_.maxErrorBlockLines);
  for (size_t j = start + 1; j < limit; ++j) {
    auto marker = parseMarker(lines[j]);
    if (marker && marker->kind == MarkerKind::EndError) {
      return skipBlankLine(lines, j + 1);
    }
  }

  if (limit == lines.size()) {
    logger_.warn("Bundle ended inside an error block", {{"line", std::to_string(start + 1)}});
    return lines.size();
  }

  logger_.warn("Error block exceeds maximum length, resuming after the scanned lines",
               {{"line", std::to_string(start + 1)}});
  return limit;
}

void SplitSession::reportProgress(size_t current, size_t total) {
  if (!options_.progress || options_.progressStride == 0 || current < nextProgress_) {
    return;
  }
  options_.progress(current, total);
  nextProgress_ = (current / options_.progressStride + 1) * options_.progressStride;
}

} // namespace

std::vector<std::string_view> splitLines(std::string_view text) {
  std::vector<std::string_view> lines;
  size_t start = 0;
  for (size_t i = 0; i < text.size(); ++i) {
    if (text[i] == '\n') {
      lines.push_back(text.substr(start, i + 1 - start));
      start = i + 1;
    } else if (text[i] == '\r') {
      size_t end = (i + 1 < text.size() && text[i + 1] == '\n') ? i + 2 : i + 1;
      lines.push_back(text.substr(start, end - start));
      start = end;
      i = end - 1;
    }
  }
  if (start < text.size()) {
    lines.push_back(text.substr(start));
  }
  return lines;
}

BundleParser::BundleParser(SplitOptions options) : options_(std::move(options)) {}

std::optional<SplitStats> BundleParser::split(std::string_view bundle, const fs::path &outputRoot,
                                              std::string *outError) {
  std::error_code ec;
  fs::create_directories(outputRoot, ec);
  if (ec || !fs::is_directory(outputRoot, ec)) {
    if (outError) {
      *outError = fmt::format("Failed to create output directory: {}{}", outputRoot.string(),
                              ec ? fmt::format(" ({})", ec.message()) : std::string());
    }
    return std::nullopt;
  }

  SplitSession session(options_, outputRoot);
  SplitStats stats = session.run(bundle);

  loggerOrDefault(options_.logger)
      .info("Split completed", {{"output", outputRoot.string()},
                                {"files", std::to_string(stats.filesWritten)},
                                {"skipped", std::to_string(stats.entriesSkipped)}});
  return stats;
}

std::optional<SplitStats> BundleParser::splitFile(const fs::path &bundlePath,
                                                  const fs::path &outputRoot,
                                                  std::string *outError) {
  MappedFile bundle;
  if (!bundle.openRead(bundlePath, outError)) {
    return std::nullopt;
  }
  return split(bundle.view(), outputRoot, outError);
}

} // namespace scb
