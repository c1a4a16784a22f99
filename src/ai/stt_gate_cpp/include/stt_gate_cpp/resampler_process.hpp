#pragma once

#include <sys/types.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "recorder_common/broadcaster.hpp"
#include "recorder_common/scheduler.hpp"
#include "stt_gate_cpp/pcm_source.hpp"
#include "voice_record_cpp/byte_sink.hpp"
#include "voice_record_cpp/ogg_muxer.hpp"

namespace stt_gate_cpp
{

struct ResamplerConfig
{
  // stdin: Ogg/Opus, stdout: 16 kHz mono s16le
  std::string command =
    "ffmpeg -hide_banner -loglevel warning -f ogg -i pipe:0 -ar 16000 -ac 1 -f s16le pipe:1";
  double idle_timeout_sec = 3600.0;  ///< 이 시간 동안 write가 없으면 강제 종료
  double kill_grace_sec = 2.0;       ///< SIGTERM 후 SIGKILL까지 대기
};

/// 화자 하나의 Opus 프레임을 PCM으로 변환하는 자식 프로세스
/// stdout 읽기 스레드가 자식이 회수될 때까지 객체를 살려 둔다.
class ResamplerProcess
  : public PcmSource, public std::enable_shared_from_this<ResamplerProcess>
{
public:
  using ExitCallback = std::function<void(int status)>;

  /// fork/exec 실패 시 nullptr, error에 원인
  static std::shared_ptr<ResamplerProcess> start(
    const std::string & label, const ResamplerConfig & config,
    recorder_common::Scheduler & scheduler, std::string & error);

  ~ResamplerProcess() override;

  ResamplerProcess(const ResamplerProcess &) = delete;
  ResamplerProcess & operator=(const ResamplerProcess &) = delete;

  /// Opus 패킷 하나를 stdin Ogg 스트림에 쓴다. 파이프가 밀려 있으면 버리고 false
  bool write_frame(const uint8_t * data, size_t size);
  /// EOS + stdin 닫기 + SIGTERM, 유예 후에도 살아 있으면 SIGKILL. 멱등
  void kill();

  bool is_alive() const override;
  recorder_common::Subscription subscribe_pcm(PcmCallback callback) override;
  recorder_common::Subscription subscribe_exit(ExitCallback callback);

  pid_t pid() const { return pid_; }
  const std::string & label() const { return label_; }
  recorder_common::Scheduler::Clock::time_point spawned_at() const { return spawned_at_; }
  bool reaped() const;
  int exit_status() const;
  uint64_t dropped_frames() const;
  uint64_t written_frames() const;

private:
  /// 논블로킹 stdin 파이프. 다 못 쓴 페이지 꼬리는 pending으로 남긴다
  class StdinSink : public voice_record_cpp::ByteSink
  {
public:
    explicit StdinSink(int fd)
    : fd_(fd)
    {
    }
    bool write(const uint8_t * data, size_t size) override;
    void close() override;
    /// pending을 가능한 만큼 밀어 넣는다. 다 비웠으면 true
    bool flush();
    bool backpressured() const { return !pending_.empty(); }
    bool broken() const { return broken_; }
    int fd() const { return fd_; }

private:
    int fd_;
    bool broken_ = false;
    std::vector<uint8_t> pending_;
  };

  ResamplerProcess(
    const std::string & label, const ResamplerConfig & config,
    recorder_common::Scheduler & scheduler);

  bool launch(std::string & error);
  void reader_loop(std::shared_ptr<ResamplerProcess> self);
  void handle_stderr_chunk(const char * data, size_t size);
  void check_idle();
  void force_kill();

  std::string label_;
  ResamplerConfig config_;
  recorder_common::Scheduler & scheduler_;
  recorder_common::Scheduler::Clock::time_point spawned_at_;

  mutable std::mutex mutex_;
  pid_t pid_ = -1;
  int stdout_fd_ = -1;
  int stderr_fd_ = -1;
  std::unique_ptr<StdinSink> stdin_;
  std::unique_ptr<voice_record_cpp::OggMuxer> muxer_;
  bool killed_ = false;
  bool reaped_ = false;
  int exit_status_ = -1;
  uint64_t dropped_frames_ = 0;
  uint64_t written_frames_ = 0;
  recorder_common::Scheduler::Clock::time_point last_write_;
  std::string stderr_line_;

  recorder_common::Broadcaster<const std::vector<uint8_t> &> pcm_;
  recorder_common::Broadcaster<int> exited_;
  recorder_common::TimerPtr idle_timer_;
  recorder_common::TimerPtr kill_timer_;
  std::thread reader_;
};

using ResamplerPtr = std::shared_ptr<ResamplerProcess>;

}  // namespace stt_gate_cpp
