#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "voice_record_cpp/byte_sink.hpp"
#include "voice_record_cpp/recording_store.hpp"

namespace hydrate_cpp
{

// 디코딩 출력 형식: 48 kHz stereo s16le (Ogg muxer의 OpusHead와 같다)
constexpr uint32_t kSampleRate = 48000;
constexpr uint16_t kChannels = 2;
constexpr uint32_t kBytesPerSample = 2;
constexpr uint32_t kFrameSamples = 960;
constexpr uint64_t kBytesPerFrame = kFrameSamples * kChannels * kBytesPerSample;  // 3840
constexpr uint64_t kBytesPerSecond = kSampleRate * kChannels * kBytesPerSample;   // 192000
constexpr size_t kSilenceChunkSize = 65536;

struct HydrateOptions
{
  bool clamp = true;
  double max_gap_seconds = 300.0;  ///< 이보다 긴 무음은 잘라낸다 (타임스탬프 이상치 방지)
};

struct AssemblyReport
{
  uint64_t decoded_frames = 0;
  int bursts_written = 0;
  int bursts_skipped = 0;
  int clamped_gaps = 0;
  int offset_overruns = 0;
  uint64_t silence_bytes = 0;
  uint64_t audio_bytes = 0;
  uint64_t total_bytes = 0;
  std::string error;

  double duration_seconds() const
  {
    return static_cast<double>(total_bytes) / static_cast<double>(kBytesPerSecond);
  }
};

/// 말소리만 담긴 디코딩 PCM을 burst 시각에 맞춰 무음과 함께 다시 배치한다.
/// 각 burst는 (burst_start - first_packet_at) 위치에 놓인다 (앵커 기준, 누적 drift 없음).
/// sink 쓰기 실패 시 false, 데이터 이상(offset 초과 등)은 경고 후 계속한다.
bool assemble_track(
  const std::vector<uint8_t> & decoded, const std::string & first_packet_at,
  std::vector<voice_record_cpp::BurstRow> bursts, const HydrateOptions & options,
  voice_record_cpp::ByteSink & out, AssemblyReport & report);

/// 0으로 채운 바이트를 64 KiB 단위로 나눠 쓴다
bool write_silence(voice_record_cpp::ByteSink & out, uint64_t bytes);

}  // namespace hydrate_cpp
