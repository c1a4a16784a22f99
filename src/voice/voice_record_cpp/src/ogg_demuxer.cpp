#include "voice_record_cpp/ogg_demuxer.hpp"

#include "voice_record_cpp/ogg_muxer.hpp"

#include <cstring>
#include <fstream>
#include <iterator>

using namespace std;


namespace voice_record_cpp
{

namespace
{

uint16_t read_u16_le(const uint8_t * p)
{
  return static_cast<uint16_t>(p[0] | (p[1] << 8));
}

uint32_t read_u32_le(const uint8_t * p)
{
  return static_cast<uint32_t>(p[0]) |
         (static_cast<uint32_t>(p[1]) << 8) |
         (static_cast<uint32_t>(p[2]) << 16) |
         (static_cast<uint32_t>(p[3]) << 24);
}

uint64_t read_u64_le(const uint8_t * p)
{
  uint64_t v = 0;
  for (int i = 7; i >= 0; --i) {
    v = (v << 8) | p[i];
  }
  return v;
}

bool parse_opus_head(const vector<uint8_t> & packet, OggOpusContents & out)
{
  if (packet.size() < 19 || memcmp(packet.data(), "OpusHead", 8) != 0) {
    return false;
  }
  out.channels = packet[9];
  out.pre_skip = read_u16_le(packet.data() + 10);
  out.input_sample_rate = read_u32_le(packet.data() + 12);
  return true;
}

bool parse_opus_tags(const vector<uint8_t> & packet, OggOpusContents & out)
{
  if (packet.size() < 16 || memcmp(packet.data(), "OpusTags", 8) != 0) {
    return false;
  }
  const uint32_t vendor_len = read_u32_le(packet.data() + 8);
  if (12 + static_cast<size_t>(vendor_len) + 4 > packet.size()) {
    return false;
  }
  out.vendor.assign(
    reinterpret_cast<const char *>(packet.data() + 12), vendor_len);
  return true;
}

}  // namespace

OggOpusContents read_ogg_opus(const uint8_t * data, size_t size)
{
  OggOpusContents out;
  vector<vector<uint8_t>> all_packets;
  vector<uint8_t> partial;
  size_t pos = 0;
  bool first_page = true;

  while (pos < size) {
    if (size - pos < 27) {
      out.truncated = true;
      break;
    }
    const uint8_t * page = data + pos;
    if (memcmp(page, "OggS", 4) != 0 || page[4] != 0) {
      out.truncated = true;
      out.error = "bad capture pattern";
      break;
    }
    const uint8_t header_type = page[5];
    const uint8_t segments = page[26];
    const size_t header_size = 27 + static_cast<size_t>(segments);
    if (size - pos < header_size) {
      out.truncated = true;
      break;
    }
    size_t body_size = 0;
    for (size_t i = 0; i < segments; ++i) {
      body_size += page[27 + i];
    }
    if (size - pos < header_size + body_size) {
      out.truncated = true;
      break;
    }

    vector<uint8_t> check(page, page + header_size + body_size);
    const uint32_t stored_crc = read_u32_le(check.data() + 22);
    memset(check.data() + 22, 0, 4);
    if (OggMuxer::crc32(check.data(), check.size()) != stored_crc) {
      out.truncated = true;
      out.error = "crc mismatch";
      break;
    }

    if (first_page) {
      out.serial = read_u32_le(page + 14);
      first_page = false;
    }
    out.last_granule = read_u64_le(page + 6);
    if (header_type & kOggFlagEos) {
      out.has_eos = true;
    }
    if (!(header_type & kOggFlagContinued)) {
      partial.clear();
    }

    const uint8_t * body = page + header_size;
    size_t offset = 0;
    for (size_t i = 0; i < segments; ++i) {
      const uint8_t lace = page[27 + i];
      partial.insert(partial.end(), body + offset, body + offset + lace);
      offset += lace;
      if (lace < 255) {
        // 빈 EOS 페이지의 0 lacing은 패킷이 아니다
        if (!(partial.empty() && (header_type & kOggFlagEos))) {
          all_packets.push_back(partial);
        }
        partial.clear();
      }
    }

    ++out.pages;
    pos += header_size + body_size;
  }

  if (all_packets.size() < 2 ||
    !parse_opus_head(all_packets[0], out) ||
    !parse_opus_tags(all_packets[1], out))
  {
    if (out.error.empty()) {
      out.error = "missing opus headers";
    }
    return out;
  }

  out.packets.assign(
    make_move_iterator(all_packets.begin() + 2),
    make_move_iterator(all_packets.end()));
  out.ok = true;
  return out;
}

OggOpusContents read_ogg_opus(const vector<uint8_t> & data)
{
  return read_ogg_opus(data.data(), data.size());
}

OggOpusContents read_ogg_opus_file(const string & path)
{
  ifstream in(path, ios::binary);
  if (!in.is_open()) {
    OggOpusContents out;
    out.error = "failed to open " + path;
    return out;
  }
  const vector<uint8_t> data((istreambuf_iterator<char>(in)), istreambuf_iterator<char>());
  return read_ogg_opus(data);
}

}  // namespace voice_record_cpp
