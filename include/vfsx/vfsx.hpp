#pragma once

// VFS Extraction Library
// A C++20 library for unpacking the LP1C ".vfs" asset containers
// shipped with Pathologic and its Classic HD release.

#include "endian.hpp"
#include "error.hpp"
#include "extractor.hpp"
#include "reader.hpp"
#include "source.hpp"
#include "types.hpp"

// The library provides two levels of abstraction:
//
// 1. Low-level: Reader
//    - Sequential decoding of the header and the entry table
//    - Use Reader::open() on a file, Reader::fromSource() on any ByteSource
//
// 2. High-level: Extractor
//    - Writes every entry below an output directory
//
// Example usage:
//
//   // Extracting an archive
//   vfsx::Error error;
//   auto reader = vfsx::Reader::open("Sounds.vfs", &error);
//   if (reader) {
//     vfsx::Extractor extractor(*reader, "Sounds");
//     if (!extractor.run(&error)) {
//       std::cerr << error.describe() << std::endl;
//     }
//   }
//
//   // Listing the entries
//   auto header = reader->readHeader();
//   for (uint32_t i = 0; header && i < header->fileCount; ++i) {
//     auto entry = reader->readEntry();
//     if (!entry || !reader->skipFixedSuffix()) {
//       break;
//     }
//     std::cout << entry->name << std::endl;
//   }

namespace vfsx {}
