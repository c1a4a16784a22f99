#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace stt_gate_cpp
{

struct SttConfig
{
  bool enabled = true;
  // "groq" = cloud Whisper, "whisper_server" = 로컬 whisper.cpp 서버
  std::string engine = "groq";
  std::string endpoint;              ///< 비어 있으면 엔진 기본값
  std::string api_key;
  std::string model = "whisper-large-v3-turbo";
  std::string language = "en";
  long timeout_sec = 30;
  double chunk_seconds = 5.0;        ///< HTTP 엔진이 한 번에 보내는 PCM 길이
  double min_chunk_seconds = 0.5;    ///< close 시 남은 PCM이 이보다 짧으면 버린다
  int worker_threads = 2;
  double drain_timeout_sec = 10.0;   ///< 세션 종료 시 마지막 chunk 결과를 기다리는 최대 시간

  // VAD gate
  double silence_timeout_sec = 5.0;
  double connection_cooldown_sec = 2.0;
  double stream_rotation_minutes = 4.0;
  double stream_overlap_sec = 5.0;
  double rotation_check_sec = 30.0;
  int64_t dedup_window_ms = 2000;

  int max_concurrent_streams = 8;

  // 사용량 추정
  double cost_per_minute_usd = 0.024;
  double cost_warning_usd = 5.0;
};

/// STT 결과 하나. 시간은 UTC ISO 8601 문자열
struct TranscriptEvent
{
  std::string speaker_id;
  std::string speaker_label;
  std::string segment_start;
  std::string segment_end;
  std::string text;
  double confidence = 0.0;
  bool has_confidence = false;
  bool is_final = false;
  std::string result_id;
  int stream_sequence = 0;
  std::string engine;
  std::string model;
};

using TranscriptCallback = std::function<void(const TranscriptEvent &)>;
using StreamClosedCallback = std::function<void()>;

/// 백엔드 연결 하나 (speaker, sequence 단위)
/// 16 kHz mono s16le PCM을 받는다.
class SttStream
{
public:
  virtual ~SttStream() = default;
  virtual void write(const uint8_t * pcm, size_t size) = 0;
  virtual void close() = 0;
  virtual bool is_open() const = 0;
};

using SttStreamPtr = std::shared_ptr<SttStream>;

/// 고정된 소수의 인식 엔진 공통 인터페이스
/// 콜백은 open_stream 호출 중에는 불리지 않으며, 엔진 작업 스레드에서 호출될 수 있다.
/// on_unexpected_close는 백엔드 오류로 스트림이 닫혔을 때만 호출된다 (close() 호출 시에는 아님).
class SttEngine
{
public:
  virtual ~SttEngine() = default;
  virtual SttStreamPtr open_stream(
    const std::string & speaker, int sequence,
    TranscriptCallback on_transcript, StreamClosedCallback on_unexpected_close) = 0;
  virtual std::string name() const = 0;
  virtual std::string model() const = 0;
  /// 대기 중이거나 처리 중인 요청이 결과를 모두 돌려줄 때까지 최대 timeout 동안 기다린다.
  /// 다 비웠으면 true. 요청을 비동기로 처리하지 않는 엔진은 그대로 true
  virtual bool drain(std::chrono::milliseconds /*timeout*/) { return true; }
};

}  // namespace stt_gate_cpp
