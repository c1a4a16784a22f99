#pragma once

#include <cstdint>
#include <mutex>
#include <string>

#include "stt_gate_cpp/stt_types.hpp"
#include "voice_record_cpp/recording_store.hpp"

namespace session_recorder_cpp
{

/// 추정 비용에 더하는 여유분 (20%)
constexpr double kCostBufferFactor = 1.2;

/// 세션의 STT 사용량(발화 시간 기준)을 누적하고 세션 종료 시 한 번 기록한다.
class UsageTracker
{
public:
  UsageTracker(
    const std::string & session_id, const stt_gate_cpp::SttConfig & config,
    voice_record_cpp::RecordingStore & store);

  void add_speech_duration(int64_t duration_ms);
  double estimate_cost() const;
  /// 누적 발화가 없으면 아무것도 쓰지 않는다. 두 번째 호출은 no-op
  void flush();

  int64_t total_speech_ms() const;
  int64_t segment_count() const;
  bool warning_emitted() const;

private:
  double estimate_cost_locked() const;

  std::string session_id_;
  std::string engine_;
  double cost_per_minute_;
  double warning_threshold_;
  voice_record_cpp::RecordingStore & store_;

  mutable std::mutex mutex_;
  int64_t total_speech_ms_ = 0;
  int64_t segment_count_ = 0;
  bool warning_emitted_ = false;
  bool flushed_ = false;
};

}  // namespace session_recorder_cpp
