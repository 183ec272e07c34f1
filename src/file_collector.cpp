#include <algorithm>
#include <cctype>
#include <utility>

#include <fmt/format.h>

#include <scb/file_collector.hpp>
#include <scb/filter.hpp>

namespace fs = std::filesystem;

namespace scb {

namespace {

bool isHidden(const fs::path &name) {
  std::string text = name.string();
  return !text.empty() && text.front() == '.';
}

// True if every component of ancestor is a leading component of path
bool isWithin(const fs::path &ancestor, const fs::path &path) {
  auto p = path.begin();
  for (const auto &component : ancestor) {
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

// A symlinked directory whose target is the root, contains the root, or is one of the
// directories already entered on the way down to it
bool entersCycle(const fs::path &root, const fs::path &dir) {
  std::error_code ec;
  fs::path target = fs::canonical(dir, ec);
  if (ec || isWithin(target, root)) {
    return true;
  }

  for (fs::path ancestor = dir.parent_path(); isWithin(root, ancestor) && ancestor != root;
       ancestor = ancestor.parent_path()) {
    if (fs::canonical(ancestor, ec) == target) {
      return true;
    }
  }
  return false;
}

} // namespace

std::string displayPath(const fs::path &root, const fs::path &file) {
  fs::path parent = root.parent_path();

  std::string result;
  if (parent == root) {
    std::string relative = file.lexically_relative(root).generic_string();
    std::string name = root.filename().generic_string();
    result = name.empty() ? fmt::format("./{}", relative) : fmt::format("./{}/{}", name, relative);
  } else {
    result = fmt::format("./{}", file.lexically_relative(parent).generic_string());
  }

  // generic_string() keeps '\' on POSIX hosts
  std::replace(result.begin(), result.end(), '\\', '/');
  return result;
}

FileCollector::FileCollector(ExtensionSet extensions, std::vector<FilterRule> filters)
    : extensions_(std::move(extensions)), filters_(std::move(filters)) {}

std::optional<std::vector<fs::path>> FileCollector::collect(const fs::path &root,
                                                            std::string *outError) const {
  try {
    return walk(root);
  } catch (const CollectionError &e) {
    if (outError) {
      *outError = e.what();
    }
  } catch (const fs::filesystem_error &e) {
    if (outError) {
      *outError = fmt::format("Failed to scan {}: {}", root.string(), e.what());
    }
  }
  return std::nullopt;
}

std::vector<fs::path> FileCollector::walk(const fs::path &root) const {
  std::error_code ec;
  if (!fs::is_directory(root, ec)) {
    throw CollectionError(fmt::format("Source directory does not exist: {}", root.string()));
  }

  const fs::path canonicalRoot = fs::canonical(root);

  std::vector<fs::path> files;
  const auto options = fs::directory_options::follow_directory_symlink |
                       fs::directory_options::skip_permission_denied;
  fs::recursive_directory_iterator it(canonicalRoot, options, ec);
  for (; !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
    const fs::directory_entry &entry = *it;
    const fs::path name = entry.path().filename();

    if (entry.is_directory(ec)) {
      if (isHidden(name) || matchesAnyRule(name.string(), filters_)) {
        it.disable_recursion_pending();
        continue;
      }
      if (entry.is_symlink(ec) && entersCycle(canonicalRoot, entry.path())) {
        it.disable_recursion_pending();
      }
      ec.clear();
      continue;
    }
    ec.clear();

    if (isHidden(name) || !entry.is_regular_file(ec) || !wantsExtension(name)) {
      ec.clear();
      continue;
    }
    if (matchesAnyRule(name.string(), filters_)) {
      continue;
    }

    files.push_back(entry.path());
  }

  if (ec) {
    throw CollectionError(fmt::format("Failed to scan {}: {}", root.string(), ec.message()));
  }
  return files;
}

bool FileCollector::wantsExtension(const fs::path &file) const {
  std::string extension = file.extension().string();
  std::transform(extension.begin(), extension.end(), extension.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return !extension.empty() && extensions_.contains(extension);
}

} // namespace scb
