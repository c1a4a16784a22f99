#pragma once

#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <string>

#include "recorder_common/broadcaster.hpp"
#include "recorder_common/scheduler.hpp"
#include "stt_gate_cpp/resampler_process.hpp"

namespace stt_gate_cpp
{

/// 레지스트리 키. 문자열 이어붙이기 대신 구조체로 비교한다
struct SessionSpeakerKey
{
  std::string session_id;
  std::string speaker_id;

  bool operator<(const SessionSpeakerKey & other) const
  {
    if (session_id != other.session_id) {
      return session_id < other.session_id;
    }
    return speaker_id < other.speaker_id;
  }

  bool operator==(const SessionSpeakerKey & other) const
  {
    return session_id == other.session_id && speaker_id == other.speaker_id;
  }

  std::string to_string() const { return session_id + "/" + speaker_id; }
};

struct ProcessRegistryConfig
{
  int breaker_max_failures = 3;
  double breaker_window_sec = 60.0;
  double early_exit_sec = 2.0;   ///< spawn 후 이 시간 안에 종료하면 실패로 센다
  ResamplerConfig resampler;
};

/// (session, speaker)별 resampler 프로세스의 유일한 소유자
/// 짧은 시간 안에 반복해서 죽는 키는 circuit breaker로 spawn을 거부한다.
class ProcessRegistry
{
public:
  ProcessRegistry(recorder_common::Scheduler & scheduler, const ProcessRegistryConfig & config);
  ~ProcessRegistry();

  ProcessRegistry(const ProcessRegistry &) = delete;
  ProcessRegistry & operator=(const ProcessRegistry &) = delete;

  /// 기존 프로세스는 종료하고 새로 띄운다. breaker가 열렸거나 실패하면 nullptr
  ResamplerPtr spawn(const SessionSpeakerKey & key);
  /// 살아 있는 프로세스만 돌려준다 (죽은 항목은 여기서 정리)
  ResamplerPtr get(const SessionSpeakerKey & key);
  void kill(const SessionSpeakerKey & key);
  void kill_session(const std::string & session_id);
  void kill_all();

  bool breaker_open(const SessionSpeakerKey & key);
  int recent_failures(const SessionSpeakerKey & key);
  size_t size() const;
  const ProcessRegistryConfig & config() const { return config_; }

private:
  struct Entry
  {
    ResamplerPtr process;
    recorder_common::Subscription exit_sub;
    bool exit_handled = false;
  };

  struct State
  {
    std::mutex mutex;
    std::map<SessionSpeakerKey, Entry> entries;
    std::map<SessionSpeakerKey, std::deque<recorder_common::Scheduler::Clock::time_point>> failures;
  };

  void on_exit(const SessionSpeakerKey & key, const ResamplerProcess * process, int status);
  void record_exit_locked(const SessionSpeakerKey & key, Entry & entry, int status);
  void prune_failures_locked(const SessionSpeakerKey & key);

  recorder_common::Scheduler & scheduler_;
  ProcessRegistryConfig config_;
  std::shared_ptr<State> state_;
};

}  // namespace stt_gate_cpp
