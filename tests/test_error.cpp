#include <vfsx/error.hpp>

#include <gtest/gtest.h>

TEST(ErrorTest, Categories) {
  EXPECT_EQ(vfsx::categoryOf(vfsx::ErrorCode::None), vfsx::ErrorCategory::None);
  EXPECT_EQ(vfsx::categoryOf(vfsx::ErrorCode::BadMagic), vfsx::ErrorCategory::Format);
  EXPECT_EQ(vfsx::categoryOf(vfsx::ErrorCode::RangeExceedsArchive), vfsx::ErrorCategory::Format);
  EXPECT_EQ(vfsx::categoryOf(vfsx::ErrorCode::UnsafeName), vfsx::ErrorCategory::Format);
  EXPECT_EQ(vfsx::categoryOf(vfsx::ErrorCode::UnexpectedEOF), vfsx::ErrorCategory::IO);
  EXPECT_EQ(vfsx::categoryOf(vfsx::ErrorCode::CreateDirFailed), vfsx::ErrorCategory::IO);
  EXPECT_EQ(vfsx::categoryOf(vfsx::ErrorCode::InternalError), vfsx::ErrorCategory::Internal);
}

TEST(ErrorTest, DescribeWithoutEntry) {
  vfsx::Error error;
  EXPECT_FALSE(error);

  error.code = vfsx::ErrorCode::TooSmall;
  error.message = "too small";
  EXPECT_TRUE(error);
  EXPECT_EQ(error.describe(), "too small");
}

TEST(ErrorTest, DescribeWithEntryContext) {
  vfsx::Error error;
  error.code = vfsx::ErrorCode::Truncated;
  error.message = "unexpected end of archive";
  error.entryIndex = 3;
  EXPECT_EQ(error.describe(), "entry 3: unexpected end of archive");

  error.entryName = "sounds/door.wav";
  EXPECT_EQ(error.describe(), "entry 3 ('sounds/door.wav'): unexpected end of archive");
}

TEST(ErrorTest, CodeNames) {
  EXPECT_EQ(vfsx::toString(vfsx::ErrorCode::ZeroLengthName), "ZeroLengthName");
  EXPECT_EQ(vfsx::toString(vfsx::ErrorCode::CloseFailed), "CloseFailed");
}

// Replacing an error must not leave entry context from the previous one behind
TEST(ErrorTest, SetErrorReplacesEntryContext) {
  vfsx::Error error;
  error.entryIndex = 4;
  error.entryName = "old.bin";

  vfsx::detail::setError(&error, vfsx::ErrorCode::WriteFailed, "disk full", 12);
  EXPECT_EQ(error.code, vfsx::ErrorCode::WriteFailed);
  EXPECT_EQ(error.message, "disk full");
  EXPECT_EQ(error.offset.value_or(0), 12u);
  EXPECT_FALSE(error.entryIndex.has_value());
  EXPECT_TRUE(error.entryName.empty());
}
