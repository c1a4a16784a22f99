#pragma once

#include <cstddef>
#include <cstdint>

namespace voice_record_cpp
{

/// Opus TOC config 번호(0..31)의 프레임 하나 길이 (마이크로초)
inline int opus_frame_duration_us(uint8_t toc)
{
  const int config = (toc >> 3) & 0x1F;
  if (config < 12) {
    // SILK: 10, 20, 40, 60 ms
    static const int silk[4] = {10000, 20000, 40000, 60000};
    return silk[config % 4];
  }
  if (config < 16) {
    // Hybrid: 10, 20 ms
    return (config % 2 == 0) ? 10000 : 20000;
  }
  // CELT: 2.5, 5, 10, 20 ms
  static const int celt[4] = {2500, 5000, 10000, 20000};
  return celt[config % 4];
}

/// 패킷 전체 재생 길이 (마이크로초). 해석할 수 없으면 -1
/// code 0: 프레임 1개, code 1/2: 2개, code 3: 두 번째 바이트 하위 6비트
inline int opus_packet_duration_us(const uint8_t * packet, size_t size)
{
  if (packet == nullptr || size == 0) {
    return -1;
  }
  const uint8_t toc = packet[0];
  const int frame_us = opus_frame_duration_us(toc);
  int frames = 1;
  switch (toc & 0x03) {
    case 0:
      frames = 1;
      break;
    case 1:
    case 2:
      frames = 2;
      break;
    default:
      if (size < 2) {
        return -1;
      }
      frames = packet[1] & 0x3F;
      if (frames == 0) {
        return -1;
      }
      break;
  }
  return frame_us * frames;
}

}  // namespace voice_record_cpp
