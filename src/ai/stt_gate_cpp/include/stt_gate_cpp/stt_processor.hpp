#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "recorder_common/broadcaster.hpp"
#include "recorder_common/scheduler.hpp"
#include "recorder_common/speaking_signals.hpp"
#include "stt_gate_cpp/process_registry.hpp"
#include "stt_gate_cpp/stt_types.hpp"
#include "stt_gate_cpp/vad_gate.hpp"

namespace stt_gate_cpp
{

/// 세션 하나의 화자별 VadGate를 관리하고 결과를 한 곳으로 모은다.
class SttProcessor
{
public:
  using DurationCallback = std::function<void(const std::string & speaker, int64_t ms)>;

  SttProcessor(
    const std::string & session_id, std::shared_ptr<SttEngine> engine,
    ProcessRegistry & registry, recorder_common::Scheduler & scheduler,
    recorder_common::SpeakingSignals & signals, const SttConfig & config);
  ~SttProcessor();

  SttProcessor(const SttProcessor &) = delete;
  SttProcessor & operator=(const SttProcessor &) = delete;

  /// 살아 있는 resampler가 있어야 하며 max_concurrent_streams를 넘으면 거부
  bool add_speaker(const std::string & speaker);
  void remove_speaker(const std::string & speaker);

  /// resampler가 죽었거나 교체됐으면 gate를 다시 만든 뒤 전달
  void on_speaking_start(const std::string & speaker);
  void on_speaking_end(const std::string & speaker);

  /// gate를 모두 닫고, 닫힌 스트림의 마지막 결과를 drain_timeout_sec 동안 기다린 뒤 구독을 끊는다. 멱등
  void destroy();

  bool has_gate(const std::string & speaker) const;
  size_t active_gates() const;
  std::shared_ptr<VadGate> gate(const std::string & speaker) const;

  recorder_common::Subscription subscribe_transcripts(TranscriptCallback callback);
  recorder_common::Subscription subscribe_speech_duration(DurationCallback callback);

private:
  struct GateEntry
  {
    VadGatePtr gate;
    recorder_common::Subscription transcript_sub;
    recorder_common::Subscription duration_sub;
  };

  bool add_speaker_locked(const std::string & speaker);
  SessionSpeakerKey key_for(const std::string & speaker) const;
  void teardown(GateEntry & entry);

  std::string session_id_;
  std::shared_ptr<SttEngine> engine_;
  ProcessRegistry & registry_;
  recorder_common::Scheduler & scheduler_;
  SttConfig config_;

  mutable std::mutex mutex_;
  bool destroyed_ = false;
  std::map<std::string, GateEntry> gates_;
  /// 제거된 gate. 닫힌 스트림의 늦은 결과를 받기 위해 destroy까지 결과 구독을 유지한다
  std::vector<GateEntry> retired_;

  recorder_common::Broadcaster<const TranscriptEvent &> transcripts_;
  recorder_common::Broadcaster<const std::string &, int64_t> speech_duration_;
  recorder_common::Subscription start_sub_;
  recorder_common::Subscription end_sub_;
};

}  // namespace stt_gate_cpp
