#include <gtest/gtest.h>

#include <cstdint>

#include "voice_record_cpp/opus_toc.hpp"

using namespace voice_record_cpp;


TEST(OpusTocTest, FrameDurationPerConfig)
{
  // SILK NB 10 ms / 60 ms
  EXPECT_EQ(opus_frame_duration_us(0 << 3), 10000);
  EXPECT_EQ(opus_frame_duration_us(3 << 3), 60000);
  // Hybrid SWB 10 ms / FB 20 ms
  EXPECT_EQ(opus_frame_duration_us(12 << 3), 10000);
  EXPECT_EQ(opus_frame_duration_us(15 << 3), 20000);
  // CELT 2.5 ms / 20 ms
  EXPECT_EQ(opus_frame_duration_us(16 << 3), 2500);
  EXPECT_EQ(opus_frame_duration_us(31 << 3), 20000);
}

TEST(OpusTocTest, PacketDurationByFrameCountCode)
{
  const uint8_t single[] = {0xFC, 0x00};
  EXPECT_EQ(opus_packet_duration_us(single, sizeof(single)), 20000);

  const uint8_t two_equal[] = {0xFD, 0x00};
  EXPECT_EQ(opus_packet_duration_us(two_equal, sizeof(two_equal)), 40000);

  const uint8_t two_diff[] = {0xFE, 0x00};
  EXPECT_EQ(opus_packet_duration_us(two_diff, sizeof(two_diff)), 40000);

  const uint8_t arbitrary[] = {0xFF, 0x03};
  EXPECT_EQ(opus_packet_duration_us(arbitrary, sizeof(arbitrary)), 60000);
}

TEST(OpusTocTest, UnparseablePackets)
{
  EXPECT_EQ(opus_packet_duration_us(nullptr, 0), -1);

  const uint8_t code3_short[] = {0xFF};
  EXPECT_EQ(opus_packet_duration_us(code3_short, sizeof(code3_short)), -1);

  const uint8_t code3_zero[] = {0xFF, 0x00};
  EXPECT_EQ(opus_packet_duration_us(code3_zero, sizeof(code3_zero)), -1);
}
