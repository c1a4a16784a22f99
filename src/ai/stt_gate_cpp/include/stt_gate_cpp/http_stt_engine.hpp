#pragma once

#include <curl/curl.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "stt_gate_cpp/stt_types.hpp"

namespace stt_gate_cpp
{

constexpr uint32_t kSttSampleRate = 16000;
constexpr uint32_t kSttBytesPerSecond = kSttSampleRate * 2;  // mono s16le

struct HttpTranscribeResult
{
  bool ok = false;
  bool stream_fatal = false;   ///< 네트워크 오류, 429, 5xx: 스트림을 끊는다
  long http_code = 0;
  std::string text;
  std::string error;
};

/// Whisper 계열 HTTP API("groq", "whisper_server")를 스트림처럼 쓰는 엔진
/// 스트림마다 PCM을 chunk_seconds 단위로 모아 WAV로 POST하고, 결과를 final 이벤트로 돌려준다.
class HttpSttEngine : public SttEngine
{
public:
  explicit HttpSttEngine(const SttConfig & config);
  ~HttpSttEngine() override;

  SttStreamPtr open_stream(
    const std::string & speaker, int sequence,
    TranscriptCallback on_transcript, StreamClosedCallback on_unexpected_close) override;

  std::string name() const override { return config_.engine; }
  std::string model() const override { return config_.model; }
  bool drain(std::chrono::milliseconds timeout) override;
  const std::string & endpoint() const { return endpoint_; }

  static std::string default_endpoint(const std::string & engine);
  /// 16-bit mono PCM을 RIFF/WAVE 바이트열로 감싼다
  static std::string build_wav(const std::vector<uint8_t> & pcm, uint32_t sample_rate);

  struct StreamState;

private:
  struct Job
  {
    std::shared_ptr<StreamState> state;
    std::vector<uint8_t> pcm;
    uint64_t start_byte = 0;
    int chunk_index = 0;
  };

  friend class HttpSttStream;

  void enqueue(std::vector<Job> jobs);
  void worker_loop();
  void process_job(const Job & job);
  HttpTranscribeResult transcribe_wav(const std::string & wav) const;
  static int abort_on_shutdown(void * self, curl_off_t, curl_off_t, curl_off_t, curl_off_t);

  SttConfig config_;
  std::string endpoint_;

  std::mutex job_mutex_;
  std::condition_variable job_cv_;
  std::condition_variable drained_cv_;
  std::deque<Job> jobs_;
  int active_jobs_ = 0;
  std::vector<std::thread> workers_;
  std::atomic<bool> running_;
};

}  // namespace stt_gate_cpp
