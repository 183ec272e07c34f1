#include <iostream>

#include <scb/scb.hpp>

int main(int argc, char *argv[]) {
  if (argc < 2) {
    std::cerr << "Usage: " << argv[0] << " <bundle>\n";
    return 1;
  }

  std::string error;
  scb::Bundler bundler;
  auto entries = bundler.list(argv[1], &error);

  if (!entries) {
    std::cerr << "Error: " << error << "\n";
    return 1;
  }

  std::cout << "Bundle: " << argv[1] << "\n";
  std::cout << "Files: " << entries->size() << "\n\n";

  for (const auto &entry : *entries) {
    if (entry.failed) {
      std::cout << "  " << entry.displayPath << " (unreadable)\n";
    } else {
      std::cout << "  " << entry.displayPath << " (" << entry.sizeText << " KiB, "
                << entry.lineCount << " lines)\n";
    }
  }

  return 0;
}
