#include <gtest/gtest.h>

#include <cstdint>
#include <vector>

#include "voice_record_cpp/ogg_demuxer.hpp"
#include "voice_record_cpp/ogg_muxer.hpp"

using namespace std;
using namespace voice_record_cpp;


namespace
{

class MemorySink : public ByteSink
{
public:
  bool write(const uint8_t * data, size_t size) override
  {
    if (closed || fail) {
      return false;
    }
    bytes.insert(bytes.end(), data, data + size);
    ++writes;
    return true;
  }
  void close() override { closed = true; }

  vector<uint8_t> bytes;
  size_t writes = 0;
  bool closed = false;
  bool fail = false;
};

vector<uint8_t> frame_of(size_t size, uint8_t fill)
{
  vector<uint8_t> frame(size, fill);
  if (!frame.empty()) {
    frame[0] = 0xFC;  // CELT FB 20 ms, code 0
  }
  return frame;
}

}  // namespace

TEST(OggMuxerTest, WritesHeadersOnConstruction)
{
  MemorySink sink;
  OggMuxer muxer(sink, 0x1234, "unit");
  EXPECT_EQ(sink.writes, 2u);
  EXPECT_EQ(muxer.page_sequence(), 2u);
  EXPECT_EQ(muxer.granule_position(), 0u);

  const OggOpusContents contents = read_ogg_opus(sink.bytes);
  ASSERT_TRUE(contents.ok) << contents.error;
  EXPECT_EQ(contents.channels, kOpusChannels);
  EXPECT_EQ(contents.pre_skip, kOpusPreSkip);
  EXPECT_EQ(contents.input_sample_rate, kOpusSampleRate);
  EXPECT_EQ(contents.serial, 0x1234u);
  EXPECT_EQ(contents.vendor, "unit");
  EXPECT_TRUE(contents.packets.empty());
  EXPECT_FALSE(contents.has_eos);
}

TEST(OggMuxerTest, RoundTripPreservesPacketsAndGranule)
{
  MemorySink sink;
  OggMuxer muxer(sink, 7);
  vector<vector<uint8_t>> frames;
  for (int i = 0; i < 50; ++i) {
    frames.push_back(frame_of(40 + i, static_cast<uint8_t>(i)));
    ASSERT_TRUE(muxer.write_frame(frames.back()));
  }
  muxer.finalize();

  EXPECT_EQ(muxer.frames_written(), 50u);
  EXPECT_EQ(muxer.granule_position(), 50u * kOpusSamplesPerFrame);

  const OggOpusContents contents = read_ogg_opus(sink.bytes);
  ASSERT_TRUE(contents.ok) << contents.error;
  EXPECT_FALSE(contents.truncated);
  EXPECT_TRUE(contents.has_eos);
  EXPECT_EQ(contents.pages, 2u + 50u + 1u);
  EXPECT_EQ(contents.last_granule, 50u * kOpusSamplesPerFrame);
  EXPECT_EQ(contents.packets, frames);
}

TEST(OggMuxerTest, LacingHandlesMultiplesOf255)
{
  MemorySink sink;
  OggMuxer muxer(sink, 9);
  const vector<uint8_t> exact = frame_of(510, 0x11);
  const vector<uint8_t> odd = frame_of(600, 0x22);
  const vector<uint8_t> tiny = frame_of(1, 0x33);
  ASSERT_TRUE(muxer.write_frame(exact));
  ASSERT_TRUE(muxer.write_frame(odd));
  ASSERT_TRUE(muxer.write_frame(tiny));

  const OggOpusContents contents = read_ogg_opus(sink.bytes);
  ASSERT_TRUE(contents.ok) << contents.error;
  ASSERT_EQ(contents.packets.size(), 3u);
  EXPECT_EQ(contents.packets[0], exact);
  EXPECT_EQ(contents.packets[1], odd);
  EXPECT_EQ(contents.packets[2], tiny);
}

TEST(OggMuxerTest, RejectsOversizedPacket)
{
  MemorySink sink;
  OggMuxer muxer(sink, 1);
  const vector<uint8_t> big(kOggMaxPacketSize + 1, 0xAA);
  EXPECT_FALSE(muxer.write_frame(big));
  EXPECT_EQ(muxer.frames_written(), 0u);
  EXPECT_EQ(muxer.granule_position(), 0u);
}

TEST(OggMuxerTest, FailedSinkWriteDoesNotAdvanceCounters)
{
  MemorySink sink;
  OggMuxer muxer(sink, 4);
  ASSERT_TRUE(muxer.write_frame(frame_of(20, 1)));
  ASSERT_TRUE(muxer.write_frame(frame_of(20, 2)));

  sink.fail = true;
  EXPECT_FALSE(muxer.write_frame(frame_of(20, 3)));
  EXPECT_EQ(muxer.frames_written(), 2u);
  EXPECT_EQ(muxer.granule_position(), 2u * kOpusSamplesPerFrame);
  EXPECT_EQ(muxer.page_sequence(), 4u);

  sink.fail = false;
  ASSERT_TRUE(muxer.write_frame(frame_of(20, 4)));
  EXPECT_EQ(muxer.frames_written(), 3u);
  EXPECT_EQ(muxer.page_sequence(), 5u);

  const OggOpusContents contents = read_ogg_opus(sink.bytes);
  ASSERT_TRUE(contents.ok) << contents.error;
  ASSERT_EQ(contents.packets.size(), 3u);
  EXPECT_EQ(contents.packets[2], frame_of(20, 4));
  EXPECT_EQ(contents.last_granule, 3u * kOpusSamplesPerFrame);
}

TEST(OggMuxerTest, FinalizeIsIdempotentAndBlocksFurtherFrames)
{
  MemorySink sink;
  OggMuxer muxer(sink, 3);
  ASSERT_TRUE(muxer.write_frame(frame_of(20, 1)));
  muxer.finalize();
  const size_t size_after_first = sink.bytes.size();
  muxer.finalize();
  EXPECT_EQ(sink.bytes.size(), size_after_first);

  EXPECT_FALSE(muxer.write_frame(frame_of(20, 2)));
  EXPECT_EQ(sink.bytes.size(), size_after_first);
  EXPECT_EQ(muxer.frames_written(), 1u);
}

TEST(OggMuxerTest, TruncatedTailKeepsCompletePages)
{
  MemorySink sink;
  OggMuxer muxer(sink, 5);
  for (int i = 0; i < 10; ++i) {
    ASSERT_TRUE(muxer.write_frame(frame_of(80, static_cast<uint8_t>(i))));
  }
  // 크래시 흉내: EOS 없이 마지막 페이지 일부만 남김
  vector<uint8_t> bytes = sink.bytes;
  bytes.resize(bytes.size() - 30);

  const OggOpusContents contents = read_ogg_opus(bytes);
  ASSERT_TRUE(contents.ok) << contents.error;
  EXPECT_TRUE(contents.truncated);
  EXPECT_FALSE(contents.has_eos);
  EXPECT_EQ(contents.packets.size(), 9u);
  EXPECT_EQ(contents.last_granule, 9u * kOpusSamplesPerFrame);
}

TEST(OggMuxerTest, CorruptedPageFailsCrc)
{
  MemorySink sink;
  OggMuxer muxer(sink, 5);
  for (int i = 0; i < 4; ++i) {
    ASSERT_TRUE(muxer.write_frame(frame_of(30, static_cast<uint8_t>(i))));
  }
  vector<uint8_t> bytes = sink.bytes;
  bytes[bytes.size() - 5] ^= 0xFF;

  const OggOpusContents contents = read_ogg_opus(bytes);
  ASSERT_TRUE(contents.ok);
  EXPECT_TRUE(contents.truncated);
  EXPECT_EQ(contents.error, "crc mismatch");
  EXPECT_EQ(contents.packets.size(), 3u);
}

TEST(OggMuxerTest, EmptyInputIsNotOpus)
{
  const OggOpusContents contents = read_ogg_opus(vector<uint8_t>());
  EXPECT_FALSE(contents.ok);
  EXPECT_FALSE(contents.error.empty());
}
