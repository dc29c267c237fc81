#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string_view>

#include "error.hpp"
#include "reader.hpp"
#include "source.hpp"
#include "types.hpp"

namespace vfsx {

enum class LogLevel {
  Info,
  Warn,
};

using LogSink = std::function<void(LogLevel, std::string_view)>;

struct ExtractProgress {
  uint32_t index = 0; // 1-based
  uint32_t total = 0;
  const EntryMetadata *entry = nullptr;
  std::filesystem::path destination;
};

using ProgressCallback = std::function<void(const ExtractProgress &)>;
using SinkFactory = std::function<std::unique_ptr<ByteSink>()>;

struct ExtractOptions {
  LogSink log;                 // Status messages and warnings, may be empty
  ProgressCallback onProgress; // Called after each file is written, may be empty
  SinkFactory makeSink;        // Output file writer, FileSink when empty
};

struct ExtractStats {
  uint32_t filesExtracted = 0;
  uint64_t bytesWritten = 0;
};

// Extracts every entry of an archive below an output directory
class Extractor {
public:
  Extractor(Reader &reader, std::filesystem::path outputRoot, ExtractOptions options = {});

  // Header check, then every entry in archive order. Stops at the first error.
  // The output root is only created when the archive has at least one entry.
  bool run(Error *outError = nullptr);

  const ExtractStats &stats() const { return stats_; }
  const std::filesystem::path &outputRoot() const { return outputRoot_; }

  // Join a normalized entry name onto root, dropping root and "." components.
  // Names with a ".." component are rejected with UnsafeName.
  static std::optional<std::filesystem::path>
  destinationPath(const std::filesystem::path &root, std::string_view entryName,
                  Error *outError = nullptr);

private:
  bool extractEntry(uint32_t index, uint32_t total, Error *outError);
  bool extractPayload(const EntryMetadata &entry, uint32_t index, uint32_t total,
                      Error *outError);
  bool writeFile(const std::filesystem::path &destPath, std::span<const uint8_t> data,
                 Error *outError);

  void log(LogLevel level, std::string_view message) const;

  Reader &reader_;
  std::filesystem::path outputRoot_;
  ExtractOptions options_;
  ExtractStats stats_;
};

// Output directory used when none is given: archive file name without its extension
std::filesystem::path defaultOutputRoot(const std::filesystem::path &archivePath);

} // namespace vfsx
