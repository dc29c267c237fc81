#include <algorithm>
#include <cstring>
#include <format>
#include <system_error>

#include <vfsx/source.hpp>

namespace vfsx {

bool FileSource::open(const std::filesystem::path &path, Error *outError) {
  stream_.close();
  stream_.clear();
  size_ = 0;
  pos_ = 0;
  path_ = path;

  std::error_code ec;
  auto fileSize = std::filesystem::file_size(path, ec);
  if (ec) {
    detail::setError(outError, ErrorCode::OpenFailed,
                     std::format("failed to get file size of '{}': {}", path.string(),
                                 ec.message()));
    return false;
  }

  stream_.open(path, std::ios::binary);
  if (!stream_) {
    detail::setError(outError, ErrorCode::OpenFailed,
                     std::format("failed to open file '{}'", path.string()));
    return false;
  }

  size_ = static_cast<uint64_t>(fileSize);
  return true;
}

bool FileSource::seek(uint64_t pos, Error *outError) {
  if (pos > size_) {
    detail::setError(outError, ErrorCode::SeekFailed,
                     std::format("cannot seek to offset {} past end of '{}' (size {})", pos,
                                 path_.string(), size_),
                     pos);
    return false;
  }

  // A previous short read leaves eofbit/failbit set
  stream_.clear();
  stream_.seekg(static_cast<std::streamoff>(pos), std::ios::beg);
  if (!stream_) {
    detail::setError(outError, ErrorCode::SeekFailed,
                     std::format("failed to seek to offset {} in '{}'", pos, path_.string()), pos);
    return false;
  }

  pos_ = pos;
  return true;
}

std::optional<size_t> FileSource::read(std::span<uint8_t> buffer, Error *outError) {
  if (buffer.empty()) {
    return 0;
  }

  stream_.read(reinterpret_cast<char *>(buffer.data()),
               static_cast<std::streamsize>(buffer.size()));
  auto bytesRead = static_cast<size_t>(stream_.gcount());
  pos_ += bytesRead;

  if (stream_.bad() || (!stream_ && !stream_.eof())) {
    detail::setError(outError, ErrorCode::ReadFailed,
                     std::format("failed to read {} bytes at offset {} in '{}'", buffer.size(),
                                 pos_ - bytesRead, path_.string()),
                     pos_ - bytesRead);
    return std::nullopt;
  }

  return bytesRead;
}

bool MemorySource::seek(uint64_t pos, Error *outError) {
  if (pos > data_.size()) {
    detail::setError(outError, ErrorCode::SeekFailed,
                     std::format("cannot seek to offset {} past end of buffer (size {})", pos,
                                 data_.size()),
                     pos);
    return false;
  }
  pos_ = pos;
  return true;
}

std::optional<size_t> MemorySource::read(std::span<uint8_t> buffer, Error * /*outError*/) {
  size_t available = data_.size() - static_cast<size_t>(pos_);
  size_t count = std::min(buffer.size(), available);
  if (count > 0) {
    std::memcpy(buffer.data(), data_.data() + pos_, count);
  }
  pos_ += count;
  return count;
}

bool FileSink::open(const std::filesystem::path &path, Error *outError) {
  path_ = path;
  stream_.open(path, std::ios::binary | std::ios::trunc);
  if (!stream_) {
    detail::setError(outError, ErrorCode::CreateFileFailed,
                     std::format("failed to create output file '{}'", path.string()));
    return false;
  }
  return true;
}

bool FileSink::write(std::span<const uint8_t> data, Error *outError) {
  stream_.write(reinterpret_cast<const char *>(data.data()),
                static_cast<std::streamsize>(data.size()));
  // write() may only fill the stream buffer; a full disk shows up on flush
  stream_.flush();
  if (!stream_) {
    detail::setError(outError, ErrorCode::WriteFailed,
                     std::format("failed to write data to '{}'", path_.string()));
    return false;
  }
  return true;
}

bool FileSink::close(Error *outError) {
  stream_.close();
  if (!stream_) {
    detail::setError(outError, ErrorCode::CloseFailed,
                     std::format("failed to close output file '{}'", path_.string()));
    return false;
  }
  return true;
}

} // namespace vfsx
