#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

#include "recorder_common/broadcaster.hpp"
#include "recorder_common/scheduler.hpp"
#include "recorder_common/speaking_signals.hpp"
#include "session_recorder_cpp/transcript_writer.hpp"
#include "session_recorder_cpp/usage_tracker.hpp"
#include "stt_gate_cpp/engine_registry.hpp"
#include "stt_gate_cpp/process_registry.hpp"
#include "stt_gate_cpp/stt_processor.hpp"
#include "voice_record_cpp/burst_tracker.hpp"
#include "voice_record_cpp/recording_store.hpp"
#include "voice_record_cpp/track_recorder.hpp"

namespace session_recorder_cpp
{

struct SessionConfig
{
  voice_record_cpp::RecorderConfig recorder;
  voice_record_cpp::BurstTrackerConfig bursts;
  stt_gate_cpp::SttConfig stt;
};

/// 녹음 세션 하나의 소유자
/// recorder, burst tracker, STT processor, transcript writer, usage tracker를 소유하고
/// process registry는 빌려 쓴다. engine lease는 stop()에서 반납한다.
class RecordingSession
{
public:
  using TranscriptSink = std::function<void(const stt_gate_cpp::TranscriptEvent &, int64_t row_id)>;

  /// 세션 row를 만든다. 저장소 오류는 StoreError로 전파
  RecordingSession(
    const std::string & session_id, voice_record_cpp::RecordingStore & store,
    recorder_common::Scheduler & scheduler, recorder_common::SpeakingSignals & signals,
    stt_gate_cpp::ProcessRegistry & registry, stt_gate_cpp::EngineLease lease,
    const SessionConfig & config);
  ~RecordingSession();

  RecordingSession(const RecordingSession &) = delete;
  RecordingSession & operator=(const RecordingSession &) = delete;

  /// track 열기 -> resampler 생성 -> gate 추가 -> writer에 track 등록
  bool join(const std::string & speaker);
  /// burst 닫기 -> gate 제거 -> resampler 종료 -> track 닫기
  void leave(const std::string & speaker);
  bool on_frame(const std::string & speaker, const uint8_t * data, size_t size);
  /// 멱등. 세션 row를 'stopped'로 마감한다
  void stop();

  recorder_common::Subscription subscribe_transcripts(TranscriptSink sink);

  const std::string & id() const { return session_id_; }
  bool stopped() const;
  bool stt_enabled() const { return static_cast<bool>(processor_); }

  voice_record_cpp::TrackRecorder & recorder() { return *recorder_; }
  voice_record_cpp::BurstTracker & bursts() { return *bursts_; }
  stt_gate_cpp::SttProcessor * processor() { return processor_.get(); }
  TranscriptWriter & writer() { return writer_; }
  UsageTracker & usage() { return usage_; }

private:
  stt_gate_cpp::SessionSpeakerKey key_for(const std::string & speaker) const;
  void on_transcript(const stt_gate_cpp::TranscriptEvent & event);

  std::string session_id_;
  voice_record_cpp::RecordingStore & store_;
  recorder_common::Scheduler & scheduler_;
  stt_gate_cpp::ProcessRegistry & registry_;
  stt_gate_cpp::EngineLease lease_;
  SessionConfig config_;

  mutable std::mutex mutex_;
  bool stopped_ = false;

  TranscriptWriter writer_;
  UsageTracker usage_;
  std::unique_ptr<voice_record_cpp::TrackRecorder> recorder_;
  std::unique_ptr<voice_record_cpp::BurstTracker> bursts_;
  std::unique_ptr<stt_gate_cpp::SttProcessor> processor_;

  recorder_common::Broadcaster<const stt_gate_cpp::TranscriptEvent &, int64_t> transcripts_;
  recorder_common::Subscription transcript_sub_;
  recorder_common::Subscription duration_sub_;
};

}  // namespace session_recorder_cpp
