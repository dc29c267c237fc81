#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>

#include "error.hpp"
#include "source.hpp"
#include "types.hpp"

namespace vfsx {

// Sequential decoder for LP1C containers.
//
// The reader owns the byte source and its cursor. Entries are decoded one at a
// time in archive order; nothing is cached between entries. The caller drives
// the scan:
//
//   readHeader()
//   repeat fileCount times:
//     readEntry()        cursor lands on the reserved bytes
//     validateRange()
//     ... payload detour through CursorGuard ...
//     skipFixedSuffix()  cursor lands on the next name length byte
class Reader {
public:
  explicit Reader(std::unique_ptr<ByteSource> source);
  ~Reader() = default;

  // Delete copy, enable move
  Reader(const Reader &) = delete;
  Reader &operator=(const Reader &) = delete;
  Reader(Reader &&) noexcept = default;
  Reader &operator=(Reader &&) noexcept = default;

  // Open an archive file and check that it can hold a header
  // Returns std::nullopt on failure (OpenFailed or TooSmall)
  static std::optional<Reader> open(const std::filesystem::path &path, Error *outError = nullptr);

  // Same size check for an already opened source
  static std::optional<Reader> fromSource(std::unique_ptr<ByteSource> source,
                                          Error *outError = nullptr);

  // Total archive size captured at open time
  uint64_t archiveSize() const { return archiveSize_; }

  // Decode the 12-byte header from the start of the archive.
  // The cursor ends at format::headerSize.
  std::optional<ArchiveHeader> readHeader(Error *outError = nullptr);

  // Last header decoded by readHeader()
  const ArchiveHeader &header() const { return header_; }

  // Decode name length, name, size and offset at the cursor.
  // The reserved bytes are left for skipFixedSuffix().
  std::optional<EntryMetadata> readEntry(Error *outError = nullptr);

  // Check that the entry's payload lies inside an archive of totalSize bytes
  static bool validateRange(const EntryMetadata &entry, uint64_t totalSize,
                            Error *outError = nullptr);

  // Skip the reserved bytes that follow the offset field.
  // Fails with Truncated if that would run past the end of the archive.
  bool skipFixedSuffix(Error *outError = nullptr);

  // Cursor access for payload reads
  uint64_t tell() const { return source_->tell(); }
  bool seek(uint64_t pos, Error *outError = nullptr) { return source_->seek(pos, outError); }
  std::optional<size_t> read(std::span<uint8_t> buffer, Error *outError = nullptr) {
    return source_->read(buffer, outError);
  }

  // Replace archive path separators with the platform separator
  static std::string normalizeName(std::string_view rawName);

  // Saves the cursor on construction and puts it back on restore() or destruction
  class CursorGuard {
  public:
    explicit CursorGuard(Reader &reader) : reader_(&reader), resumePos_(reader.tell()) {}
    ~CursorGuard();

    CursorGuard(const CursorGuard &) = delete;
    CursorGuard &operator=(const CursorGuard &) = delete;

    uint64_t resumePos() const { return resumePos_; }

    // Seek back to the saved position. Further calls and the destructor are no-ops.
    bool restore(Error *outError = nullptr);

  private:
    Reader *reader_;
    uint64_t resumePos_;
    bool restored_ = false;
  };

private:
  // Read exactly buffer.size() bytes or fail with Truncated
  bool readExact(std::span<uint8_t> buffer, std::string_view what, Error *outError);

  std::unique_ptr<ByteSource> source_;
  uint64_t archiveSize_ = 0;
  ArchiveHeader header_;
};

} // namespace vfsx
