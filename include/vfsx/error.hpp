#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace vfsx {

enum class ErrorCategory {
  None,
  Format,
  IO,
  Internal,
};

enum class ErrorCode {
  None,

  // Format
  TooSmall,
  BadMagic,
  UnsupportedVersion,
  ZeroLengthName,
  Truncated,
  OffsetOutOfRange,
  RangeExceedsArchive,
  UnsafeName,

  // IO
  OpenFailed,
  SeekFailed,
  ReadFailed,
  CreateDirFailed,
  CreateFileFailed,
  WriteFailed,
  CloseFailed,
  UnexpectedEOF,

  // Internal
  InternalError,
};

std::string_view toString(ErrorCode code);
ErrorCategory categoryOf(ErrorCode code);

// Error reported through the outError parameter of library calls
struct Error {
  ErrorCode code = ErrorCode::None;
  std::string message;
  std::optional<uint64_t> offset;     // Byte offset in the archive, when one is involved
  std::optional<uint32_t> entryIndex; // 1-based, set by the extractor
  std::string entryName;              // Empty if the name was not decoded yet

  ErrorCategory category() const { return categoryOf(code); }
  explicit operator bool() const { return code != ErrorCode::None; }

  // Single line with entry context prepended, e.g.
  // "entry 3 ('Textures/stone.dds'): invalid data range ..."
  std::string describe() const;
};

namespace detail {

// Fill outError if the caller asked for it
inline void setError(Error *outError, ErrorCode code, std::string message,
                     std::optional<uint64_t> offset = std::nullopt) {
  if (outError) {
    *outError = Error{code, std::move(message), offset, std::nullopt, {}};
  }
}

} // namespace detail

} // namespace vfsx
