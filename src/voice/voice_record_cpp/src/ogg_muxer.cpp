#include "voice_record_cpp/ogg_muxer.hpp"

#include <array>
#include <random>

using namespace std;


namespace voice_record_cpp
{

namespace
{

array<uint32_t, 256> make_crc_table()
{
  array<uint32_t, 256> table{};
  for (uint32_t i = 0; i < 256; ++i) {
    uint32_t crc = i << 24;
    for (int j = 0; j < 8; ++j) {
      crc = (crc & 0x80000000U) ? ((crc << 1) ^ 0x04C11DB7U) : (crc << 1);
    }
    table[i] = crc;
  }
  return table;
}

void put_u16_le(vector<uint8_t> & out, uint16_t v)
{
  out.push_back(static_cast<uint8_t>(v & 0xFF));
  out.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
}

void put_u32_le(vector<uint8_t> & out, uint32_t v)
{
  for (int i = 0; i < 4; ++i) {
    out.push_back(static_cast<uint8_t>((v >> (8 * i)) & 0xFF));
  }
}

void put_u64_le(vector<uint8_t> & out, uint64_t v)
{
  for (int i = 0; i < 8; ++i) {
    out.push_back(static_cast<uint8_t>((v >> (8 * i)) & 0xFF));
  }
}

}  // namespace

OggMuxer::OggMuxer(ByteSink & sink, uint32_t serial, const string & vendor)
: sink_(sink), serial_(serial)
{
  write_id_header();
  write_comment_header(vendor);
}

OggMuxer::OggMuxer(ByteSink & sink)
: OggMuxer(sink, random_serial())
{
}

uint32_t OggMuxer::crc32(const uint8_t * data, size_t size, uint32_t crc)
{
  static const array<uint32_t, 256> table = make_crc_table();
  for (size_t i = 0; i < size; ++i) {
    crc = table[((crc >> 24) ^ data[i]) & 0xFF] ^ (crc << 8);
  }
  return crc;
}

uint32_t OggMuxer::random_serial()
{
  random_device rd;
  return static_cast<uint32_t>(rd());
}

bool OggMuxer::write_frame(const uint8_t * data, size_t size)
{
  if (finalized_) {
    return false;
  }
  if (size > kOggMaxPacketSize) {
    return false;
  }
  // sink가 받은 페이지만 granule과 프레임 수에 반영한다
  const uint64_t granule = granule_ + kOpusSamplesPerFrame;
  if (!write_page(data, size, 0x00, granule)) {
    return false;
  }
  granule_ = granule;
  ++frames_written_;
  return true;
}

void OggMuxer::finalize()
{
  if (finalized_) {
    return;
  }
  finalized_ = true;
  write_page(nullptr, 0, kOggFlagEos, granule_);
}

void OggMuxer::write_id_header()
{
  // OpusHead (RFC 7845 5.1)
  vector<uint8_t> head;
  head.reserve(19);
  const char magic[] = "OpusHead";
  head.insert(head.end(), magic, magic + 8);
  head.push_back(1);
  head.push_back(kOpusChannels);
  put_u16_le(head, kOpusPreSkip);
  put_u32_le(head, kOpusSampleRate);
  put_u16_le(head, 0);
  head.push_back(0);
  write_page(head.data(), head.size(), kOggFlagBos, 0);
}

void OggMuxer::write_comment_header(const string & vendor)
{
  // OpusTags (RFC 7845 5.2), user comment 0개
  vector<uint8_t> tags;
  const char magic[] = "OpusTags";
  tags.insert(tags.end(), magic, magic + 8);
  put_u32_le(tags, static_cast<uint32_t>(vendor.size()));
  tags.insert(tags.end(), vendor.begin(), vendor.end());
  put_u32_le(tags, 0);
  write_page(tags.data(), tags.size(), 0x00, 0);
}

bool OggMuxer::write_page(const uint8_t * payload, size_t size, uint8_t header_type, uint64_t granule)
{
  const size_t segments = size / 255 + 1;

  page_buf_.clear();
  page_buf_.reserve(27 + segments + size);
  page_buf_.push_back('O');
  page_buf_.push_back('g');
  page_buf_.push_back('g');
  page_buf_.push_back('S');
  page_buf_.push_back(0);
  page_buf_.push_back(header_type);
  put_u64_le(page_buf_, granule);
  put_u32_le(page_buf_, serial_);
  put_u32_le(page_buf_, page_seq_);
  put_u32_le(page_buf_, 0);
  page_buf_.push_back(static_cast<uint8_t>(segments));

  // lacing: 255 * (size / 255) + 나머지. 255의 배수면 마지막에 0이 붙는다
  size_t remaining = size;
  for (size_t i = 0; i < segments; ++i) {
    const size_t lace = remaining >= 255 ? 255 : remaining;
    page_buf_.push_back(static_cast<uint8_t>(lace));
    remaining -= lace;
  }
  if (size > 0) {
    page_buf_.insert(page_buf_.end(), payload, payload + size);
  }

  const uint32_t crc = crc32(page_buf_.data(), page_buf_.size());
  for (int i = 0; i < 4; ++i) {
    page_buf_[22 + i] = static_cast<uint8_t>((crc >> (8 * i)) & 0xFF);
  }
  if (!sink_.write(page_buf_.data(), page_buf_.size())) {
    return false;
  }
  ++page_seq_;
  return true;
}

}  // namespace voice_record_cpp
