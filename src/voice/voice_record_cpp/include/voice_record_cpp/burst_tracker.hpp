#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>

#include "recorder_common/broadcaster.hpp"
#include "recorder_common/scheduler.hpp"
#include "recorder_common/speaking_signals.hpp"
#include "voice_record_cpp/recording_store.hpp"
#include "voice_record_cpp/track_recorder.hpp"

namespace voice_record_cpp
{

struct BurstTrackerConfig
{
  double max_burst_minutes = 10.0;
};

/// 발화 시작/종료 신호로 speech burst 레코드를 열고 닫는다.
/// 화자별 상태: Idle -> Open -> Idle. 열린 burst는 자기 watchdog 타이머를 소유한다.
class BurstTracker
{
public:
  BurstTracker(
    TrackRecorder & recorder, RecordingStore & store, recorder_common::Scheduler & scheduler,
    recorder_common::SpeakingSignals & signals, const BurstTrackerConfig & config);
  ~BurstTracker();

  BurstTracker(const BurstTracker &) = delete;
  BurstTracker & operator=(const BurstTracker &) = delete;

  void on_speaking_start(const std::string & speaker);
  void on_speaking_end(const std::string & speaker);

  /// 퇴장/연결 끊김: 다시 열지 않고 닫는다
  void close_user_burst(const std::string & speaker);
  void close_all();
  /// 모든 burst를 닫고 이 tracker의 신호 구독만 해제한다. 이후 신호는 무시
  void destroy();

  bool has_open_burst(const std::string & speaker) const;
  size_t open_burst_count() const;

private:
  struct OpenBurst
  {
    int64_t burst_id = -1;
    int64_t track_id = -1;
    uint64_t start_offset = 0;
    recorder_common::TimerPtr watchdog;
  };

  std::unique_ptr<OpenBurst> open_burst_locked(
    const std::string & speaker, const TrackPosition & pos);
  void close_burst_locked(const std::string & speaker, OpenBurst & burst);
  void on_watchdog(const std::string & speaker, int64_t burst_id);

  TrackRecorder & recorder_;
  RecordingStore & store_;
  recorder_common::Scheduler & scheduler_;
  BurstTrackerConfig config_;

  mutable std::mutex mutex_;
  bool destroyed_ = false;
  std::map<std::string, std::unique_ptr<OpenBurst>> bursts_;

  std::shared_ptr<bool> lifetime_;
  recorder_common::Subscription start_sub_;
  recorder_common::Subscription end_sub_;
};

}  // namespace voice_record_cpp
