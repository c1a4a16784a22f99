#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "recorder_common/broadcaster.hpp"
#include "recorder_common/scheduler.hpp"
#include "stt_gate_cpp/pcm_source.hpp"
#include "stt_gate_cpp/stt_types.hpp"

namespace stt_gate_cpp
{

/// 화자 한 명의 발화 구간에 맞춰 STT 스트림을 열고 닫는 게이트
/// - 누적 발화가 stream_rotation_minutes를 넘으면 새 스트림으로 교체 (overlap 동안 이전 스트림 유지)
/// - 교체 직후 이전 스트림 결과 중 새 스트림 첫 결과와 ±dedup_window_ms 안의 것은 버림
/// - 무음 silence_timeout_sec 후 스트림 종료, 이후 connection_cooldown_sec 동안 재연결 지연
class VadGate : public std::enable_shared_from_this<VadGate>
{
public:
  using Clock = recorder_common::Scheduler::Clock;

  static std::shared_ptr<VadGate> create(
    const std::string & speaker, std::shared_ptr<SttEngine> engine,
    std::shared_ptr<PcmSource> source, recorder_common::Scheduler & scheduler,
    const SttConfig & config);
  ~VadGate();

  VadGate(const VadGate &) = delete;
  VadGate & operator=(const VadGate &) = delete;

  void on_speaking_start();
  void on_speaking_end();
  /// 남은 발화 시간을 보고하고 타이머/스트림/PCM 구독을 모두 정리한다. 멱등
  void destroy();

  recorder_common::Subscription subscribe_transcripts(TranscriptCallback callback);
  recorder_common::Subscription subscribe_speech_duration(std::function<void(int64_t)> callback);

  const std::string & speaker() const { return speaker_; }
  /// 바인딩된 PCM 공급원 (이미 사라졌으면 nullptr)
  std::shared_ptr<PcmSource> bound_source() const;
  bool destroyed() const;
  bool has_open_stream() const;
  bool is_rotating() const;
  bool speaking() const;
  int stream_sequence() const;
  int64_t cumulative_speech_ms() const;

private:
  VadGate(
    const std::string & speaker, std::shared_ptr<SttEngine> engine,
    std::shared_ptr<PcmSource> source, recorder_common::Scheduler & scheduler,
    const SttConfig & config);

  void bind_source();
  void on_pcm(const std::vector<uint8_t> & pcm);
  void handle_transcript(const TranscriptEvent & event);
  void on_stream_closed(int sequence);
  void on_rotation_check();
  void on_silence_timeout();
  void on_cooldown_expired(bool require_speech);
  void on_overlap_end();

  bool current_open_locked() const;
  SttStreamPtr open_stream_locked();
  void open_new_stream_locked();
  void rotate_locked();
  void schedule_cooldown_reopen_locked(std::chrono::milliseconds delay, bool require_speech);
  int64_t elapsed_ms_locked(Clock::time_point since) const;

  std::string speaker_;
  std::shared_ptr<SttEngine> engine_;
  std::weak_ptr<PcmSource> source_;
  recorder_common::Scheduler & scheduler_;
  SttConfig config_;

  mutable std::mutex mutex_;
  bool destroyed_ = false;
  SttStreamPtr current_;
  SttStreamPtr rotating_;
  int sequence_ = 0;
  int64_t cumulative_ms_ = 0;
  bool speaking_ = false;
  Clock::time_point speech_start_;
  Clock::time_point cooldown_until_;
  std::string new_stream_first_result_;

  recorder_common::TimerPtr silence_timer_;
  recorder_common::TimerPtr rotation_check_timer_;
  recorder_common::TimerPtr cooldown_timer_;
  recorder_common::TimerPtr overlap_timer_;

  recorder_common::Subscription pcm_sub_;
  recorder_common::Broadcaster<const TranscriptEvent &> transcripts_;
  recorder_common::Broadcaster<int64_t> speech_duration_;
};

using VadGatePtr = std::shared_ptr<VadGate>;

}  // namespace stt_gate_cpp
