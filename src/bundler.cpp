#include <utility>

#include <scb/bundle_parser.hpp>
#include <scb/bundle_writer.hpp>
#include <scb/bundler.hpp>
#include <scb/mmap.hpp>

namespace scb {

Bundler::Bundler(BundlerConfig config) : config_(std::move(config)) {}

std::optional<MergeStats> Bundler::merge(const std::filesystem::path &sourceRoot,
                                         const std::filesystem::path &bundlePath,
                                         std::string *outError) const {
  MergeOptions options;
  options.extensions = config_.extensions;
  options.filters = config_.filters;
  options.progress = config_.progress;
  options.logger = config_.logger;

  BundleWriter writer(std::move(options));
  return writer.write(sourceRoot, bundlePath, outError);
}

std::optional<SplitStats> Bundler::split(const std::filesystem::path &bundlePath,
                                         const std::filesystem::path &outputRoot,
                                         std::string *outError) const {
  SplitOptions options;
  options.overwrite = config_.overwrite;
  options.filters = config_.filters;
  options.progress = config_.progress;
  options.logger = config_.logger;

  BundleParser parser(std::move(options));
  return parser.splitFile(bundlePath, outputRoot, outError);
}

std::optional<std::vector<IndexEntry>> Bundler::list(const std::filesystem::path &bundlePath,
                                                     std::string *outError) const {
  MappedFile bundle;
  if (!bundle.openRead(bundlePath, outError)) {
    return std::nullopt;
  }
  return readIndex(bundle.view(), outError);
}

} // namespace scb
