#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "voice_record_cpp/byte_sink.hpp"

namespace voice_record_cpp
{

constexpr uint32_t kOpusSampleRate = 48000;
constexpr uint8_t kOpusChannels = 2;
constexpr uint16_t kOpusPreSkip = 3840;
constexpr uint32_t kOpusSamplesPerFrame = 960;  // 20 ms @ 48 kHz

constexpr uint8_t kOggFlagContinued = 0x01;
constexpr uint8_t kOggFlagBos = 0x02;
constexpr uint8_t kOggFlagEos = 0x04;

/// 한 페이지에 담을 수 있는 최대 패킷 크기 (세그먼트 255개)
constexpr size_t kOggMaxPacketSize = 255 * 254 + 254;

/// Opus 패킷을 패킷당 한 페이지로 Ogg 컨테이너에 기록하는 스트리밍 muxer
/// 생성 시 OpusHead(BOS)와 OpusTags 페이지를 바로 sink에 쓴다.
class OggMuxer
{
public:
  OggMuxer(ByteSink & sink, uint32_t serial, const std::string & vendor = "voice_session_recorder");
  explicit OggMuxer(ByteSink & sink);

  /// 패킷 하나를 페이지 하나로 기록. finalize 이후에는 조용히 무시(false)
  bool write_frame(const uint8_t * data, size_t size);
  bool write_frame(const std::vector<uint8_t> & frame)
  {
    return write_frame(frame.data(), frame.size());
  }

  /// 빈 EOS 페이지를 쓰고 이후 입력을 막는다. 두 번째 호출은 no-op
  void finalize();

  bool finalized() const { return finalized_; }
  uint64_t granule_position() const { return granule_; }
  uint32_t page_sequence() const { return page_seq_; }
  uint32_t serial() const { return serial_; }
  uint64_t frames_written() const { return frames_written_; }

  static uint32_t crc32(const uint8_t * data, size_t size, uint32_t crc = 0);
  static uint32_t random_serial();

private:
  void write_id_header();
  void write_comment_header(const std::string & vendor);
  bool write_page(const uint8_t * payload, size_t size, uint8_t header_type, uint64_t granule);

  ByteSink & sink_;
  uint32_t serial_;
  uint32_t page_seq_ = 0;
  uint64_t granule_ = 0;
  uint64_t frames_written_ = 0;
  bool finalized_ = false;
  std::vector<uint8_t> page_buf_;
};

}  // namespace voice_record_cpp
