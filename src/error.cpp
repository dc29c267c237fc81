#include <format>

#include <vfsx/error.hpp>

namespace vfsx {

std::string_view toString(ErrorCode code) {
  switch (code) {
  case ErrorCode::None:
    return "None";
  case ErrorCode::TooSmall:
    return "TooSmall";
  case ErrorCode::BadMagic:
    return "BadMagic";
  case ErrorCode::UnsupportedVersion:
    return "UnsupportedVersion";
  case ErrorCode::ZeroLengthName:
    return "ZeroLengthName";
  case ErrorCode::Truncated:
    return "Truncated";
  case ErrorCode::OffsetOutOfRange:
    return "OffsetOutOfRange";
  case ErrorCode::RangeExceedsArchive:
    return "RangeExceedsArchive";
  case ErrorCode::UnsafeName:
    return "UnsafeName";
  case ErrorCode::OpenFailed:
    return "OpenFailed";
  case ErrorCode::SeekFailed:
    return "SeekFailed";
  case ErrorCode::ReadFailed:
    return "ReadFailed";
  case ErrorCode::CreateDirFailed:
    return "CreateDirFailed";
  case ErrorCode::CreateFileFailed:
    return "CreateFileFailed";
  case ErrorCode::WriteFailed:
    return "WriteFailed";
  case ErrorCode::CloseFailed:
    return "CloseFailed";
  case ErrorCode::UnexpectedEOF:
    return "UnexpectedEOF";
  case ErrorCode::InternalError:
    return "InternalError";
  }
  return "Unknown";
}

ErrorCategory categoryOf(ErrorCode code) {
  switch (code) {
  case ErrorCode::None:
    return ErrorCategory::None;
  case ErrorCode::TooSmall:
  case ErrorCode::BadMagic:
  case ErrorCode::UnsupportedVersion:
  case ErrorCode::ZeroLengthName:
  case ErrorCode::Truncated:
  case ErrorCode::OffsetOutOfRange:
  case ErrorCode::RangeExceedsArchive:
  case ErrorCode::UnsafeName:
    return ErrorCategory::Format;
  case ErrorCode::OpenFailed:
  case ErrorCode::SeekFailed:
  case ErrorCode::ReadFailed:
  case ErrorCode::CreateDirFailed:
  case ErrorCode::CreateFileFailed:
  case ErrorCode::WriteFailed:
  case ErrorCode::CloseFailed:
  case ErrorCode::UnexpectedEOF:
    return ErrorCategory::IO;
  case ErrorCode::InternalError:
    return ErrorCategory::Internal;
  }
  return ErrorCategory::Internal;
}

std::string Error::describe() const {
  if (!entryIndex) {
    return message;
  }
  if (entryName.empty()) {
    return std::format("entry {}: {}", *entryIndex, message);
  }
  return std::format("entry {} ('{}'): {}", *entryIndex, entryName, message);
}

} // namespace vfsx
