#pragma once

#include <filesystem>
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

#include "bundle_index.hpp"
#include "config.hpp"
#include "content_loader.hpp"
#include "logging.hpp"
#include "types.hpp"

namespace scb {

struct MergeOptions {
  ExtensionSet extensions = defaultExtensions();
  std::vector<FilterRule> filters;
  ProgressCallback progress; // Called after every file
  Logger *logger = nullptr;  // defaultLogger() when null
};

// Serializes a source tree into bundle text
//
// Files are collected, sorted by display path and loaded before anything is written, so the
// output only depends on the tree's contents. A file that cannot be loaded becomes an error
// block; it never aborts the merge.
class BundleWriter {
public:
  BundleWriter() = default;
  explicit BundleWriter(MergeOptions options);

  // Delete copy, enable move
  BundleWriter(const BundleWriter &) = delete;
  BundleWriter &operator=(const BundleWriter &) = delete;
  BundleWriter(BundleWriter &&) noexcept = default;
  BundleWriter &operator=(BundleWriter &&) noexcept = default;

  // Render the bundle of sourceRoot into a string
  // Returns std::nullopt if the tree cannot be collected, with error message in outError if
  // provided
  std::optional<MergeStats> render(const std::filesystem::path &sourceRoot, std::string &out,
                                   std::string *outError = nullptr);

  // Write the bundle of sourceRoot to a stream
  std::optional<MergeStats> merge(const std::filesystem::path &sourceRoot, std::ostream &out,
                                  std::string *outError = nullptr);

  // Write the bundle of sourceRoot to destPath (created or truncated)
  // destPath itself is never collected into the bundle
  std::optional<MergeStats> write(const std::filesystem::path &sourceRoot,
                                  const std::filesystem::path &destPath,
                                  std::string *outError = nullptr);

  // Index of the last merge, in bundle order
  const std::vector<IndexEntry> &entries() const { return entries_; }

  const MergeOptions &options() const { return options_; }

private:
  // Collect, sort and load; throws CollectionError
  std::vector<SourceFile> loadFiles(const std::filesystem::path &sourceRoot,
                                    const std::filesystem::path &excluded);

  std::optional<MergeStats> renderExcluding(const std::filesystem::path &sourceRoot,
                                            const std::filesystem::path &excluded,
                                            std::string &out, std::string *outError);

  MergeOptions options_;
  ContentLoader loader_;
  std::vector<IndexEntry> entries_;
};

} // namespace scb
