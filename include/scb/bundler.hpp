#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "bundle_index.hpp"
#include "config.hpp"
#include "logging.hpp"
#include "types.hpp"

namespace scb {

// Everything a caller (GUI, CLI) hands to the codec
struct BundlerConfig {
  ExtensionSet extensions = defaultExtensions();
  std::vector<FilterRule> filters; // Applied to both merge and split
  bool overwrite = false;          // Split only
  ProgressCallback progress;
  Logger *logger = nullptr;
};

// High-level interface combining merge, split and index listing
class Bundler {
public:
  Bundler() = default;
  explicit Bundler(BundlerConfig config);

  // Merge the tree at sourceRoot into the bundle file at bundlePath
  std::optional<MergeStats> merge(const std::filesystem::path &sourceRoot,
                                  const std::filesystem::path &bundlePath,
                                  std::string *outError = nullptr) const;

  // Reconstruct the files of the bundle at bundlePath below outputRoot
  std::optional<SplitStats> split(const std::filesystem::path &bundlePath,
                                  const std::filesystem::path &outputRoot,
                                  std::string *outError = nullptr) const;

  // Read the file index of the bundle at bundlePath
  std::optional<std::vector<IndexEntry>> list(const std::filesystem::path &bundlePath,
                                              std::string *outError = nullptr) const;

  const BundlerConfig &config() const { return config_; }

private:
  BundlerConfig config_;
};

} // namespace scb
