#include <cstdint>

#include <vfsx/endian.hpp>

#include <gtest/gtest.h>

TEST(EndianTest, LoadLittleEndian) {
  const uint8_t bytes[4] = {0x04, 0x03, 0x02, 0x01};
  EXPECT_EQ(vfsx::loadLE32(bytes), 0x01020304u);
}

TEST(EndianTest, StoreLittleEndian) {
  uint8_t bytes[4] = {};
  vfsx::storeLE32(bytes, 0xDEADBEEFu);
  EXPECT_EQ(bytes[0], 0xEF);
  EXPECT_EQ(bytes[1], 0xBE);
  EXPECT_EQ(bytes[2], 0xAD);
  EXPECT_EQ(bytes[3], 0xDE);
}

TEST(EndianTest, HostConversionMatchesNativeOrder) {
  if constexpr (vfsx::is_little_endian()) {
    EXPECT_EQ(vfsx::letoh32(0x12345678u), 0x12345678u);
  } else {
    EXPECT_EQ(vfsx::letoh32(0x12345678u), 0x78563412u);
  }
  static_assert(vfsx::detail::byteswap(0x11223344u) == 0x44332211u);
}
