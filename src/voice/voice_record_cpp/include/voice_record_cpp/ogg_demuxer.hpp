#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace voice_record_cpp
{

/// Ogg Opus 파일을 읽은 결과
struct OggOpusContents
{
  bool ok = false;             ///< OpusHead를 찾았고 최소 헤더 페이지가 유효하면 true
  bool truncated = false;      ///< 불완전하거나 CRC가 맞지 않는 페이지에서 멈췄으면 true
  bool has_eos = false;
  uint8_t channels = 0;
  uint16_t pre_skip = 0;
  uint32_t input_sample_rate = 0;
  uint32_t serial = 0;
  std::string vendor;
  uint64_t last_granule = 0;
  size_t pages = 0;
  std::vector<std::vector<uint8_t>> packets;  ///< 헤더 두 개를 제외한 오디오 패킷
  std::string error;
};

/// 메모리 버퍼의 Ogg Opus 스트림을 파싱한다.
/// 마지막 완성 페이지까지의 패킷만 돌려주며, 잘린 꼬리는 truncated로 표시한다.
OggOpusContents read_ogg_opus(const uint8_t * data, size_t size);
OggOpusContents read_ogg_opus(const std::vector<uint8_t> & data);
OggOpusContents read_ogg_opus_file(const std::string & path);

}  // namespace voice_record_cpp
