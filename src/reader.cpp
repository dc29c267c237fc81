#include <algorithm>
#include <cstddef>
#include <format>
#include <string>

#include <vfsx/endian.hpp>
#include <vfsx/reader.hpp>

namespace vfsx {

namespace {

// Magic bytes as text, with anything unprintable escaped
std::string printableMagic(const std::array<char, 4> &magic) {
  std::string result;
  for (char c : magic) {
    auto byte = static_cast<unsigned char>(c);
    if (byte >= 0x20 && byte < 0x7F) {
      result += c;
    } else {
      result += std::format("\\x{:02X}", byte);
    }
  }
  return result;
}

std::string formatVersion(const std::array<uint8_t, 4> &version) {
  return std::format("[{} {} {} {}]", version[0], version[1], version[2], version[3]);
}

} // namespace

Reader::Reader(std::unique_ptr<ByteSource> source)
    : source_(std::move(source)), archiveSize_(source_ ? source_->size() : 0) {}

std::optional<Reader> Reader::open(const std::filesystem::path &path, Error *outError) {
  auto source = std::make_unique<FileSource>();
  if (!source->open(path, outError)) {
    return std::nullopt;
  }
  return fromSource(std::move(source), outError);
}

std::optional<Reader> Reader::fromSource(std::unique_ptr<ByteSource> source, Error *outError) {
  if (!source) {
    detail::setError(outError, ErrorCode::OpenFailed, "no archive source given");
    return std::nullopt;
  }

  Reader reader(std::move(source));

  // Check minimum size (header is 12 bytes)
  if (reader.archiveSize_ < format::headerSize) {
    detail::setError(outError, ErrorCode::TooSmall,
                     std::format("invalid VFS file: size ({} bytes) is too small (minimum {})",
                                 reader.archiveSize_, format::headerSize));
    return std::nullopt;
  }

  if (!reader.seek(0, outError)) {
    return std::nullopt;
  }
  return reader;
}

std::optional<ArchiveHeader> Reader::readHeader(Error *outError) {
  if (!seek(0, outError)) {
    return std::nullopt;
  }

  ArchiveHeader header;

  if (!readExact(std::span(reinterpret_cast<uint8_t *>(header.magic.data()), header.magic.size()),
                 "magic bytes", outError)) {
    return std::nullopt;
  }
  if (header.magic != format::magic) {
    detail::setError(outError, ErrorCode::BadMagic,
                     std::format("invalid magic bytes: got '{}', expected 'LP1C'. Is this a "
                                 "Pathologic VFS file?",
                                 printableMagic(header.magic)),
                     0);
    return std::nullopt;
  }

  if (!readExact(header.version, "version bytes", outError)) {
    return std::nullopt;
  }
  if (header.version != format::version) {
    detail::setError(outError, ErrorCode::UnsupportedVersion,
                     std::format("unsupported VFS format version: got {}, expected {}",
                                 formatVersion(header.version), formatVersion(format::version)),
                     format::magic.size());
    return std::nullopt;
  }

  std::array<uint8_t, 4> count;
  if (!readExact(count, "file count", outError)) {
    return std::nullopt;
  }
  header.fileCount = loadLE32(count.data());

  header_ = header;
  return header;
}

std::optional<EntryMetadata> Reader::readEntry(Error *outError) {
  const uint64_t entryStart = tell();

  uint8_t nameLength = 0;
  if (!readExact(std::span(&nameLength, 1), "name length", outError)) {
    return std::nullopt;
  }
  if (nameLength == 0) {
    detail::setError(outError, ErrorCode::ZeroLengthName,
                     std::format("invalid name length (0) at offset {}", entryStart), entryStart);
    return std::nullopt;
  }

  std::string rawName(nameLength, '\0');
  if (!readExact(std::span(reinterpret_cast<uint8_t *>(rawName.data()), rawName.size()), "name",
                 outError)) {
    return std::nullopt;
  }

  EntryMetadata entry;
  entry.name = normalizeName(rawName);

  std::array<uint8_t, format::entrySizeFieldSize> sizeField;
  std::array<uint8_t, format::entryOffsetFieldSize> offsetField;
  if (!readExact(sizeField, "file size", outError) ||
      !readExact(offsetField, "file offset", outError)) {
    if (outError) {
      outError->entryName = entry.name;
    }
    return std::nullopt;
  }
  entry.size = loadLE32(sizeField.data());
  entry.offset = loadLE32(offsetField.data());

  return entry;
}

bool Reader::validateRange(const EntryMetadata &entry, uint64_t totalSize, Error *outError) {
  if (entry.offset > totalSize) {
    detail::setError(outError, ErrorCode::OffsetOutOfRange,
                     std::format("invalid data offset {} (0x{:X}) - exceeds archive size {}",
                                 entry.offset, entry.offset, totalSize),
                     entry.offset);
    return false;
  }

  // Widened so that two values near UINT32_MAX cannot wrap
  const uint64_t end = static_cast<uint64_t>(entry.offset) + entry.size;
  if (end > totalSize) {
    detail::setError(
        outError, ErrorCode::RangeExceedsArchive,
        std::format("invalid data range - offset {} + size {} ({}) exceeds archive size {}",
                    entry.offset, entry.size, end, totalSize),
        entry.offset);
    return false;
  }

  return true;
}

bool Reader::skipFixedSuffix(Error *outError) {
  constexpr auto bytesToSkip = static_cast<std::ptrdiff_t>(format::entrySuffixSize) -
                               static_cast<std::ptrdiff_t>(format::entrySizeFieldSize) -
                               static_cast<std::ptrdiff_t>(format::entryOffsetFieldSize);
  if (bytesToSkip < 0) {
    detail::setError(outError, ErrorCode::InternalError,
                     std::format("internal error: negative number of bytes to skip ({})",
                                 bytesToSkip));
    return false;
  }

  const uint64_t pos = tell();
  const uint64_t target = pos + static_cast<uint64_t>(bytesToSkip);
  if (target > archiveSize_) {
    detail::setError(outError, ErrorCode::Truncated,
                     std::format("failed to skip {} reserved bytes at offset {}: archive ends at {}",
                                 bytesToSkip, pos, archiveSize_),
                     pos);
    return false;
  }

  return seek(target, outError);
}

std::string Reader::normalizeName(std::string_view rawName) {
  constexpr char separator = static_cast<char>(std::filesystem::path::preferred_separator);

  std::string result(rawName);
  std::replace(result.begin(), result.end(), '\\', separator);
  return result;
}

bool Reader::readExact(std::span<uint8_t> buffer, std::string_view what, Error *outError) {
  const uint64_t start = tell();
  auto bytesRead = read(buffer, outError);
  if (!bytesRead) {
    return false;
  }

  if (*bytesRead != buffer.size()) {
    detail::setError(outError, ErrorCode::Truncated,
                     std::format("unexpected end of archive while reading {} at offset {} "
                                 "(needed {} bytes, got {})",
                                 what, start, buffer.size(), *bytesRead),
                     start);
    return false;
  }

  return true;
}

Reader::CursorGuard::~CursorGuard() {
  if (!restored_) {
    // Best effort on error paths, the caller is already reporting a failure
    reader_->seek(resumePos_);
  }
}

bool Reader::CursorGuard::restore(Error *outError) {
  if (restored_) {
    return true;
  }
  restored_ = true;
  return reader_->seek(resumePos_, outError);
}

} // namespace vfsx
