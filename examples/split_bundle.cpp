#include <filesystem>
#include <iostream>
#include <string_view>

#include <scb/scb.hpp>

int main(int argc, char *argv[]) {
  if (argc < 3) {
    std::cerr << "Usage: " << argv[0]
              << " <bundle> <output_dir> [--overwrite] [--exclude pattern]... [--log-level level]\n";
    return 1;
  }

  scb::Logger logger(scb::LogLevel::kInfo, std::cerr);
  scb::BundlerConfig config;
  config.logger = &logger;

  std::string error;
  for (int i = 3; i < argc; ++i) {
    std::string_view arg = argv[i];
    if (arg == "--overwrite") {
      config.overwrite = true;
      continue;
    }
    if (i + 1 >= argc) {
      std::cerr << "Error: missing value for " << arg << "\n";
      return 1;
    }
    std::string_view value = argv[++i];

    if (arg == "--exclude") {
      config.filters.push_back(scb::parseFilterRule(value));
    } else if (arg == "--log-level") {
      scb::LogLevel level;
      if (!scb::parseLogLevel(value, level, &error)) {
        std::cerr << "Error: " << error << "\n";
        return 1;
      }
      logger.setMinLevel(level);
    } else {
      std::cerr << "Error: unknown option " << arg << "\n";
      return 1;
    }
  }

  config.progress = [](size_t current, size_t total) {
    std::cout << "\rSplitting: " << (total ? current * 100 / total : 100) << "%" << std::flush;
  };

  scb::Bundler bundler(config);
  auto stats = bundler.split(argv[1], argv[2], &error);
  std::cout << "\n";
  if (!stats) {
    std::cerr << "Error: " << error << "\n";
    return 1;
  }

  std::cout << "Restored " << stats->filesWritten << " files to " << argv[2];
  if (stats->filesRenamed > 0) {
    std::cout << " (" << stats->filesRenamed << " renamed)";
  }
  if (stats->entriesSkipped > 0) {
    std::cout << ", skipped " << stats->entriesSkipped;
  }
  std::cout << "\n";
  return 0;
}
