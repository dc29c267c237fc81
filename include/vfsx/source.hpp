#pragma once

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <optional>
#include <span>
#include <utility>
#include <vector>

#include "error.hpp"

namespace vfsx {

// Seekable, byte-addressable archive source with a single read cursor
class ByteSource {
public:
  virtual ~ByteSource() = default;

  // Total size in bytes, captured when the source was opened
  virtual uint64_t size() const = 0;

  // Current cursor position
  virtual uint64_t tell() const = 0;

  // Move the cursor to an absolute position. Positions past size() are rejected.
  virtual bool seek(uint64_t pos, Error *outError = nullptr) = 0;

  // Read up to buffer.size() bytes at the cursor and advance it.
  // Returns the number of bytes read (short only at end of source),
  // std::nullopt on an I/O failure.
  virtual std::optional<size_t> read(std::span<uint8_t> buffer, Error *outError = nullptr) = 0;
};

// Archive file on disk, read through a binary std::ifstream
class FileSource : public ByteSource {
public:
  FileSource() = default;

  FileSource(const FileSource &) = delete;
  FileSource &operator=(const FileSource &) = delete;

  bool open(const std::filesystem::path &path, Error *outError = nullptr);
  bool isOpen() const { return stream_.is_open(); }

  uint64_t size() const override { return size_; }
  uint64_t tell() const override { return pos_; }
  bool seek(uint64_t pos, Error *outError = nullptr) override;
  std::optional<size_t> read(std::span<uint8_t> buffer, Error *outError = nullptr) override;

private:
  std::ifstream stream_;
  std::filesystem::path path_;
  uint64_t size_ = 0;
  uint64_t pos_ = 0;
};

// Archive held in memory
class MemorySource : public ByteSource {
public:
  MemorySource() = default;
  explicit MemorySource(std::vector<uint8_t> data) : data_(std::move(data)) {}

  uint64_t size() const override { return data_.size(); }
  uint64_t tell() const override { return pos_; }
  bool seek(uint64_t pos, Error *outError = nullptr) override;
  std::optional<size_t> read(std::span<uint8_t> buffer, Error *outError = nullptr) override;

  const std::vector<uint8_t> &data() const { return data_; }

private:
  std::vector<uint8_t> data_;
  uint64_t pos_ = 0;
};

// Destination for one extracted file
class ByteSink {
public:
  virtual ~ByteSink() = default;

  // Create or truncate the file at path
  virtual bool open(const std::filesystem::path &path, Error *outError = nullptr) = 0;

  // Write all of data. Once this returns true the bytes have left any user-space buffer.
  virtual bool write(std::span<const uint8_t> data, Error *outError = nullptr) = 0;

  virtual bool close(Error *outError = nullptr) = 0;
};

// Output file on disk, written through a binary std::ofstream
class FileSink : public ByteSink {
public:
  FileSink() = default;

  FileSink(const FileSink &) = delete;
  FileSink &operator=(const FileSink &) = delete;

  bool open(const std::filesystem::path &path, Error *outError = nullptr) override;
  bool write(std::span<const uint8_t> data, Error *outError = nullptr) override;
  bool close(Error *outError = nullptr) override;

private:
  std::ofstream stream_;
  std::filesystem::path path_;
};

} // namespace vfsx
