#include <algorithm>
#include <fstream>
#include <ostream>
#include <utility>

#include <fmt/format.h>

#include <scb/bundle_writer.hpp>
#include <scb/encoding.hpp>
#include <scb/file_collector.hpp>
#include <scb/marker.hpp>

namespace fs = std::filesystem;

namespace scb {

namespace {

std::string errorMessage(const LoadError &error) {
  if (error.kind == LoadErrorKind::Decode) {
    return std::string(kDecodeFailureMessage);
  }
  return error.message;
}

void appendLine(std::string &out, std::string_view line) {
  out += line;
  out += '\n';
}

} // namespace

BundleWriter::BundleWriter(MergeOptions options) : options_(std::move(options)) {}

std::optional<MergeStats> BundleWriter::render(const fs::path &sourceRoot, std::string &out,
                                               std::string *outError) {
  return renderExcluding(sourceRoot, fs::path(), out, outError);
}

std::optional<MergeStats> BundleWriter::merge(const fs::path &sourceRoot, std::ostream &out,
                                              std::string *outError) {
  std::string text;
  auto stats = render(sourceRoot, text, outError);
  if (!stats) {
    return std::nullopt;
  }

  out.write(text.data(), static_cast<std::streamsize>(text.size()));
  if (!out) {
    if (outError) {
      *outError = "Failed to write bundle to output stream";
    }
    return std::nullopt;
  }
  return stats;
}

std::optional<MergeStats> BundleWriter::write(const fs::path &sourceRoot, const fs::path &destPath,
                                              std::string *outError) {
  std::string text;
  auto stats = renderExcluding(sourceRoot, destPath, text, outError);
  if (!stats) {
    return std::nullopt;
  }

  std::ofstream out(destPath, std::ios::binary | std::ios::trunc);
  if (!out) {
    if (outError) {
      *outError = fmt::format("Failed to create bundle file: {}", destPath.string());
    }
    return std::nullopt;
  }

  out.write(text.data(), static_cast<std::streamsize>(text.size()));
  out.close();
  if (!out) {
    if (outError) {
      *outError = fmt::format("Failed to write bundle file: {}", destPath.string());
    }
    return std::nullopt;
  }

  loggerOrDefault(options_.logger)
      .info("Merge completed", {{"bundle", destPath.string()},
                                {"files", std::to_string(stats->fileCount)},
                                {"errors", std::to_string(stats->errorCount)}});
  return stats;
}

std::vector<SourceFile> BundleWriter::loadFiles(const fs::path &sourceRoot,
                                                const fs::path &excluded) {
  FileCollector collector(options_.extensions, options_.filters);
  std::string error;
  auto paths = collector.collect(sourceRoot, &error);
  if (!paths) {
    throw CollectionError(error);
  }

  // Collected paths sit below the canonical root
  const fs::path root = fs::canonical(sourceRoot);
  std::error_code ec;
  std::vector<SourceFile> files;
  files.reserve(paths->size());
  for (auto &path : *paths) {
    if (!excluded.empty() && fs::equivalent(path, excluded, ec)) {
      continue;
    }
    SourceFile file;
    file.displayPath = displayPath(root, path);
    file.absolutePath = std::move(path);
    files.push_back(std::move(file));
  }

  // Byte-wise order, independent of traversal order
  std::sort(files.begin(), files.end(), [](const SourceFile &a, const SourceFile &b) {
    return a.displayPath < b.displayPath;
  });

  Logger &logger = loggerOrDefault(options_.logger);
  for (auto &file : files) {
    loader_.loadInto(file);
    if (!file.loaded()) {
      logger.warn("Cannot load file", {{"path", file.displayPath}, {"reason", file.error->message}});
    }
  }
  return files;
}

std::optional<MergeStats> BundleWriter::renderExcluding(const fs::path &sourceRoot,
                                                        const fs::path &excluded,
                                                        std::string &out,
                                                        std::string *outError) {
  std::vector<SourceFile> files;
  try {
    files = loadFiles(sourceRoot, excluded);
  } catch (const CollectionError &e) {
    if (outError) {
      *outError = e.what();
    }
    return std::nullopt;
  } catch (const fs::filesystem_error &e) {
    if (outError) {
      *outError = fmt::format("Failed to scan {}: {}", sourceRoot.string(), e.what());
    }
    return std::nullopt;
  }

  entries_.clear();
  entries_.reserve(files.size());
  for (const auto &file : files) {
    entries_.push_back(makeIndexEntry(file));
  }

  out.clear();
  MergeStats stats;
  stats.fileCount = files.size();
  if (!files.empty()) {
    out += formatIndex(entries_);
  }

  for (size_t i = 0; i < files.size(); ++i) {
    const SourceFile &file = files[i];
    const CommentSyntax syntax = commentSyntaxForPath(file.absolutePath);

    if (file.loaded()) {
      appendLine(out, formatMarker(MarkerKind::StartFile, file.displayPath, syntax));
      out += file.content;
      if (!file.content.empty() && file.content.back() != '\n' && file.content.back() != '\r') {
        out += '\n';
      }
      appendLine(out, formatMarker(MarkerKind::EndFile, file.displayPath, syntax));
    } else {
      ++stats.errorCount;
      appendLine(out, formatMarker(MarkerKind::StartError, file.displayPath, syntax));
      appendLine(out, formatMarker(MarkerKind::ErrorMessage, errorMessage(*file.error), syntax));
      appendLine(out, formatMarker(MarkerKind::EndError, file.displayPath, syntax));
    }
    out += '\n';

    if (options_.progress) {
      options_.progress(i + 1, files.size());
    }
  }

  stats.characterCount = countCodepoints(out);
  stats.tokenEstimate = stats.characterCount / 4;
  return stats;
}

} // namespace scb
