#pragma once

// Source Code Bundler
// A C++20 library that flattens a tree of source files into one marker-delimited text bundle
// and reconstructs the tree from such a bundle.

#include "bundle_index.hpp"
#include "bundle_parser.hpp"
#include "bundle_writer.hpp"
#include "bundler.hpp"
#include "config.hpp"
#include "content_loader.hpp"
#include "encoding.hpp"
#include "file_collector.hpp"
#include "filter.hpp"
#include "logging.hpp"
#include "marker.hpp"
#include "mmap.hpp"
#include "path_sanitizer.hpp"
#include "types.hpp"

// The library provides two levels of abstraction:
//
// 1. Components: FileCollector, ContentLoader, BundleWriter, BundleParser, PathSanitizer and
//    the marker functions, each usable on its own
//
// 2. Bundler
//    - One object configured with extensions, filter rules and overwrite mode
//    - merge() writes a bundle file, split() reconstructs a tree, list() reads the index
//
// Example usage:
//
//   scb::BundlerConfig config;
//   config.extensions = scb::parseExtensionList("py,cpp,hpp");
//   config.filters.push_back(scb::parseFilterRule("build"));
//   scb::Bundler bundler(config);
//
//   std::string error;
//   if (auto stats = bundler.merge("project", "project.txt", &error)) {
//     std::cout << stats->fileCount << " files, ~" << stats->tokenEstimate << " tokens\n";
//   }
//   bundler.split("project.txt", "restored", &error);

namespace scb {}
