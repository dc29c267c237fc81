#include <format>
#include <memory>
#include <system_error>
#include <utility>
#include <vector>

#include <vfsx/extractor.hpp>

namespace vfsx {

namespace {

void addEntryContext(Error *outError, uint32_t index, std::string_view name) {
  if (!outError) {
    return;
  }
  outError->entryIndex = index;
  if (!name.empty()) {
    outError->entryName = std::string(name);
  }
}

} // namespace

Extractor::Extractor(Reader &reader, std::filesystem::path outputRoot, ExtractOptions options)
    : reader_(reader), outputRoot_(std::move(outputRoot)), options_(std::move(options)) {}

bool Extractor::run(Error *outError) {
  stats_ = {};

  auto header = reader_.readHeader(outError);
  if (!header) {
    return false;
  }
  log(LogLevel::Info, std::format("Detected VFS format version: {} {} {} {} (Supported)",
                                  header->version[0], header->version[1], header->version[2],
                                  header->version[3]));
  log(LogLevel::Info, std::format("Archive contains {} files.", header->fileCount));

  if (header->fileCount == 0) {
    log(LogLevel::Info, "No files to extract.");
    return true;
  }

  log(LogLevel::Info, std::format("Creating output directory: {}", outputRoot_.string()));
  std::error_code ec;
  std::filesystem::create_directories(outputRoot_, ec);
  if (ec) {
    detail::setError(outError, ErrorCode::CreateDirFailed,
                     std::format("failed to create base output directory '{}': {}",
                                 outputRoot_.string(), ec.message()));
    return false;
  }

  // Entries start immediately after the header
  if (!reader_.seek(format::headerSize, outError)) {
    return false;
  }
  log(LogLevel::Info, std::format("Reading file entries starting at offset {} (0x{:X})",
                                  format::headerSize, format::headerSize));

  for (uint32_t index = 1; index <= header->fileCount; ++index) {
    if (!extractEntry(index, header->fileCount, outError)) {
      return false;
    }
  }

  log(LogLevel::Info, "Unpacking finished successfully.");
  return true;
}

bool Extractor::extractEntry(uint32_t index, uint32_t total, Error *outError) {
  auto entry = reader_.readEntry(outError);
  if (!entry) {
    addEntryContext(outError, index, {});
    return false;
  }

  if (!Reader::validateRange(*entry, reader_.archiveSize(), outError) ||
      !extractPayload(*entry, index, total, outError)) {
    addEntryContext(outError, index, entry->name);
    return false;
  }

  Error skipError;
  if (!reader_.skipFixedSuffix(&skipError)) {
    // The archive may end right after the last entry's metadata
    if (index == total && skipError.code == ErrorCode::Truncated) {
      log(LogLevel::Info, "Reached end of file after processing metadata of the last entry.");
      return true;
    }
    if (outError) {
      *outError = std::move(skipError);
    }
    addEntryContext(outError, index, entry->name);
    return false;
  }

  return true;
}

bool Extractor::extractPayload(const EntryMetadata &entry, uint32_t index, uint32_t total,
                               Error *outError) {
  auto destPath = destinationPath(outputRoot_, entry.name, outError);
  if (!destPath) {
    return false;
  }

  // Sits right after the offset field; the reserved bytes are skipped once we are back
  Reader::CursorGuard cursor(reader_);

  if (!reader_.seek(entry.offset, outError)) {
    return false;
  }

  std::vector<uint8_t> data(entry.size);
  auto bytesRead = reader_.read(data, outError);
  if (!bytesRead) {
    return false;
  }
  if (*bytesRead != data.size()) {
    detail::setError(outError, ErrorCode::UnexpectedEOF,
                     std::format("failed to read full data (started at offset {} [0x{:X}], "
                                 "expected size {}, read {}): unexpected end of file (VFS total "
                                 "size: {}) - archive might be corrupt",
                                 entry.offset, entry.offset, entry.size, *bytesRead,
                                 reader_.archiveSize()),
                     entry.offset + *bytesRead);
    return false;
  }

  std::error_code ec;
  std::filesystem::create_directories(destPath->parent_path(), ec);
  if (ec) {
    detail::setError(outError, ErrorCode::CreateDirFailed,
                     std::format("failed to create output directory '{}': {}",
                                 destPath->parent_path().string(), ec.message()));
    return false;
  }

  if (!writeFile(*destPath, data, outError)) {
    return false;
  }

  if (!cursor.restore(outError)) {
    return false;
  }

  ++stats_.filesExtracted;
  stats_.bytesWritten += data.size();

  if (options_.onProgress) {
    options_.onProgress(ExtractProgress{index, total, &entry, *destPath});
  }

  return true;
}

bool Extractor::writeFile(const std::filesystem::path &destPath, std::span<const uint8_t> data,
                          Error *outError) {
  std::unique_ptr<ByteSink> sink =
      options_.makeSink ? options_.makeSink() : std::make_unique<FileSink>();
  if (!sink) {
    detail::setError(outError, ErrorCode::InternalError,
                     std::format("no output writer for '{}'", destPath.string()));
    return false;
  }

  if (!sink->open(destPath, outError)) {
    return false;
  }

  if (!sink->write(data, outError)) {
    // Release the handle, then remove the partially written file
    sink.reset();
    std::error_code ec;
    std::filesystem::remove(destPath, ec);
    if (ec) {
      log(LogLevel::Warn, std::format("failed to remove partial output file '{}': {}",
                                      destPath.string(), ec.message()));
    }
    return false;
  }

  // The payload is already written; a failing close is only reported
  Error closeError;
  if (!sink->close(&closeError)) {
    log(LogLevel::Warn, closeError.message);
  }

  return true;
}

void Extractor::log(LogLevel level, std::string_view message) const {
  if (options_.log) {
    options_.log(level, message);
  }
}

std::optional<std::filesystem::path>
Extractor::destinationPath(const std::filesystem::path &root, std::string_view entryName,
                           Error *outError) {
  std::filesystem::path result = root;
  for (const auto &part : std::filesystem::path(entryName)) {
    if (part.empty() || part.has_root_name() || part.has_root_directory() ||
        part == std::filesystem::path(".")) {
      continue;
    }
    if (part == std::filesystem::path("..")) {
      detail::setError(outError, ErrorCode::UnsafeName,
                       std::format("entry name '{}' refers to a parent directory", entryName));
      return std::nullopt;
    }
    result /= part;
  }
  return result;
}

std::filesystem::path defaultOutputRoot(const std::filesystem::path &archivePath) {
  return archivePath.filename().stem();
}

} // namespace vfsx
