#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "types.hpp"

namespace scb {

// Display path of a file below root: "./<root name>/<relative path>" with forward slashes
// root must be absolute and normalized. When root has no parent (a filesystem root) and
// no name, the result is "./<relative path>".
std::string displayPath(const std::filesystem::path &root, const std::filesystem::path &file);

// Recursively enumerates the files of a source tree
//
// A file is collected when its lower-cased extension is in the extension set, no segment of
// its path below the root starts with '.', and no active filter rule matches one of those
// segments. Directory symlinks are followed unless they point back at the root or at a
// directory already entered on the way down.
class FileCollector {
public:
  FileCollector(ExtensionSet extensions, std::vector<FilterRule> filters);

  // Absolute paths (below the canonical root) of all matching files, in no particular order
  // Returns std::nullopt if the tree cannot be walked, with error message in outError if provided
  std::optional<std::vector<std::filesystem::path>> collect(const std::filesystem::path &root,
                                                            std::string *outError = nullptr) const;

  const ExtensionSet &extensions() const { return extensions_; }
  const std::vector<FilterRule> &filters() const { return filters_; }

private:
  // Throws CollectionError
  std::vector<std::filesystem::path> walk(const std::filesystem::path &root) const;

  bool wantsExtension(const std::filesystem::path &file) const;

  ExtensionSet extensions_;
  std::vector<FilterRule> filters_;
};

} // namespace scb
