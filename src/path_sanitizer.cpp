#include <fmt/format.h>

#include <scb/path_sanitizer.hpp>

namespace fs = std::filesystem;

namespace scb {

namespace {

fs::path canonicalRoot(const fs::path &root) {
  std::error_code ec;
  fs::path absolute = fs::absolute(root, ec);
  if (ec) {
    absolute = root;
  }
  fs::path canonical = fs::weakly_canonical(absolute, ec);
  if (ec) {
    canonical = absolute.lexically_normal();
  }
  // "out/" normalizes to "out/" with an empty last component
  if (!canonical.has_filename() && canonical.has_relative_path()) {
    canonical = canonical.parent_path();
  }
  return canonical;
}

bool existsNoFollow(const fs::path &path) {
  return fs::exists(fs::symlink_status(path));
}

} // namespace

bool isWithinRoot(const fs::path &root, const fs::path &path) {
  auto p = path.begin();
  for (const auto &component : root) {
    if (component.empty()) {
      continue;
    }
    if (p == path.end() || *p != component) {
      return false;
    }
    ++p;
  }
  return true;
}

PathSanitizer::PathSanitizer(const fs::path &outputRoot) : root_(canonicalRoot(outputRoot)) {}

std::optional<fs::path> PathSanitizer::resolve(std::string_view declaredPath,
                                               std::string *outError) const {
  try {
    return resolveOrThrow(declaredPath);
  } catch (const PathResolutionError &e) {
    if (outError) {
      *outError = e.what();
    }
  } catch (const fs::filesystem_error &e) {
    if (outError) {
      *outError = fmt::format("Cannot resolve path {}: {}", declaredPath, e.what());
    }
  }
  return std::nullopt;
}

fs::path PathSanitizer::resolveOrThrow(std::string_view declaredPath) const {
  // POSIX root marker
  std::string_view relative = declaredPath;
  while (relative.starts_with('/')) {
    relative.remove_prefix(1);
  }
  if (relative.empty()) {
    throw PathResolutionError(fmt::format("Empty path: {}", declaredPath));
  }
  if (relative.ends_with('/')) {
    throw PathResolutionError(fmt::format("Path does not name a file: {}", declaredPath));
  }

  fs::path relativePath{std::string(relative)};
  if (relativePath.is_absolute() || relativePath.has_root_name() ||
      relativePath.has_root_directory()) {
    throw PathResolutionError(fmt::format("Absolute path: {}", declaredPath));
  }

  // Only the parent is canonicalized: a symlink at the target itself must stay visible to
  // resolveCollision
  const fs::path normal = relativePath.lexically_normal();
  const fs::path name = normal.filename();
  if (name == "..") {
    throw PathResolutionError(fmt::format("Unsafe path: {}", declaredPath));
  }
  if (name.empty() || name == ".") {
    throw PathResolutionError(fmt::format("Path does not name a file: {}", declaredPath));
  }

  const fs::path parentRelative = normal.parent_path();
  fs::path full =
      (parentRelative.empty() ? root_ : fs::weakly_canonical(root_ / parentRelative)) / name;
  if (!isWithinRoot(root_, full)) {
    throw PathResolutionError(fmt::format("Unsafe path: {}", declaredPath));
  }
  if (full == root_) {
    throw PathResolutionError(fmt::format("Path does not name a file: {}", declaredPath));
  }
  return full;
}

fs::path resolveCollision(const fs::path &target, bool overwrite, size_t maxAttempts) {
  fs::file_status status = fs::symlink_status(target);
  if (!fs::exists(status)) {
    return target;
  }
  if (overwrite && fs::is_regular_file(status)) {
    return target;
  }

  const std::string stem = target.stem().string();
  const std::string extension = target.extension().string();
  for (size_t n = 1; n <= maxAttempts; ++n) {
    fs::path candidate = target.parent_path() / fmt::format("{}_{}{}", stem, n, extension);
    if (!existsNoFollow(candidate)) {
      return candidate;
    }
  }

  throw CollisionError(
      fmt::format("No free name for {} after {} attempts", target.string(), maxAttempts));
}

} // namespace scb
