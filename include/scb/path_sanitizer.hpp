#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include "types.hpp"

namespace scb {

// Upper bound on "<stem>_<n><ext>" candidates tried for one entry
inline constexpr size_t kMaxRenameAttempts = 10000;

// Maps declared bundle paths to files below an output root
class PathSanitizer {
public:
  // The root is canonicalized once; it does not need to exist yet
  explicit PathSanitizer(const std::filesystem::path &outputRoot);

  // Resolve a declared (POSIX) path to a file below the root
  // Leading '/' are stripped; host-absolute forms (drive letters, UNC) are rejected, as is
  // anything whose normalized form leaves the root or names the root itself.
  // Returns std::nullopt when the path is unsafe or cannot be resolved, with the reason in
  // outError if provided. Never throws.
  std::optional<std::filesystem::path> resolve(std::string_view declaredPath,
                                               std::string *outError = nullptr) const;

  const std::filesystem::path &root() const { return root_; }

private:
  // Throws PathResolutionError or std::filesystem::filesystem_error
  std::filesystem::path resolveOrThrow(std::string_view declaredPath) const;

  std::filesystem::path root_;
};

// True if path is root or lies below it (component-wise)
bool isWithinRoot(const std::filesystem::path &root, const std::filesystem::path &path);

// Pick the file a resolved target is actually written to
// The target itself is used when nothing exists there, or when overwrite is set and the
// existing entry is a regular file (symlinks are not followed). Otherwise the first free
// "<stem>_<n><ext>" sibling, n = 1, 2, ... is returned.
// Throws CollisionError after maxAttempts candidates, std::filesystem::filesystem_error on I/O
// failure.
std::filesystem::path resolveCollision(const std::filesystem::path &target, bool overwrite,
                                       size_t maxAttempts = kMaxRenameAttempts);

} // namespace scb
