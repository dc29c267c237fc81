#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

namespace vfsx {

// On-disk layout constants of the LP1C container
namespace format {

inline constexpr std::array<char, 4> magic = {'L', 'P', '1', 'C'};
inline constexpr std::array<uint8_t, 4> version = {0, 0, 0, 0};

// Magic (4) + version (4) + file count (4)
inline constexpr size_t headerSize = 12;

// Everything after an entry's name: size (4) + offset (4) + reserved (8)
inline constexpr size_t entrySuffixSize = 16;
inline constexpr size_t entrySizeFieldSize = 4;
inline constexpr size_t entryOffsetFieldSize = 4;

} // namespace format

// Archive header (12 bytes)
struct ArchiveHeader {
  std::array<char, 4> magic = format::magic;
  std::array<uint8_t, 4> version = format::version;
  uint32_t fileCount = 0; // Little-endian when stored
};

// Decoded directory entry. Not retained past the entry it describes.
struct EntryMetadata {
  std::string name;    // Separators normalized to the platform separator
  uint32_t size = 0;   // Payload size in bytes
  uint32_t offset = 0; // Absolute payload offset from archive start
};

} // namespace vfsx
