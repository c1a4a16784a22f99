#include "voice_record_cpp/burst_tracker.hpp"

#include <recorder_common/time_utils.hpp>

#include <utility>

#include "rclcpp/rclcpp.hpp"

using namespace std;


namespace voice_record_cpp
{

namespace
{
rclcpp::Logger logger()
{
  return rclcpp::get_logger("voice_record_cpp");
}
}  // namespace

BurstTracker::BurstTracker(
  TrackRecorder & recorder, RecordingStore & store, recorder_common::Scheduler & scheduler,
  recorder_common::SpeakingSignals & signals, const BurstTrackerConfig & config)
: recorder_(recorder), store_(store), scheduler_(scheduler), config_(config),
  lifetime_(make_shared<bool>(true))
{
  start_sub_ = signals.speaking_start.subscribe(
    [this](const string & speaker) {on_speaking_start(speaker);});
  end_sub_ = signals.speaking_end.subscribe(
    [this](const string & speaker) {on_speaking_end(speaker);});
}

BurstTracker::~BurstTracker()
{
  try {
    destroy();
  } catch (const StoreError & e) {
    RCLCPP_ERROR(logger(), "failed to close bursts on shutdown: %s", e.what());
  }
}

void BurstTracker::on_speaking_start(const string & speaker)
{
  lock_guard<mutex> lock(mutex_);
  if (destroyed_ || bursts_.count(speaker) != 0) {
    return;
  }
  TrackPosition pos;
  if (!recorder_.position(speaker, pos)) {
    RCLCPP_DEBUG(logger(), "speaking start for %s without open track, ignored", speaker.c_str());
    return;
  }
  bursts_[speaker] = open_burst_locked(speaker, pos);
}

void BurstTracker::on_speaking_end(const string & speaker)
{
  close_user_burst(speaker);
}

void BurstTracker::close_user_burst(const string & speaker)
{
  lock_guard<mutex> lock(mutex_);
  auto it = bursts_.find(speaker);
  if (it == bursts_.end()) {
    return;
  }
  unique_ptr<OpenBurst> burst = move(it->second);
  bursts_.erase(it);
  close_burst_locked(speaker, *burst);
}

void BurstTracker::close_all()
{
  lock_guard<mutex> lock(mutex_);
  map<string, unique_ptr<OpenBurst>> closing;
  closing.swap(bursts_);
  for (auto & kv : closing) {
    close_burst_locked(kv.first, *kv.second);
  }
}

void BurstTracker::destroy()
{
  {
    lock_guard<mutex> lock(mutex_);
    if (destroyed_) {
      return;
    }
    destroyed_ = true;
  }
  start_sub_.reset();
  end_sub_.reset();
  close_all();
  lifetime_.reset();
}

bool BurstTracker::has_open_burst(const string & speaker) const
{
  lock_guard<mutex> lock(mutex_);
  return bursts_.count(speaker) != 0;
}

size_t BurstTracker::open_burst_count() const
{
  lock_guard<mutex> lock(mutex_);
  return bursts_.size();
}

unique_ptr<BurstTracker::OpenBurst> BurstTracker::open_burst_locked(
  const string & speaker, const TrackPosition & pos)
{
  auto burst = make_unique<OpenBurst>();
  burst->track_id = pos.track_id;
  burst->start_offset = pos.frame_count;
  burst->burst_id = store_.insert_burst(
    pos.track_id, recorder_common::to_iso8601(scheduler_.wall_now()),
    static_cast<int64_t>(pos.frame_count));

  weak_ptr<bool> alive = lifetime_;
  const int64_t burst_id = burst->burst_id;
  burst->watchdog = scheduler_.call_after(
    recorder_common::seconds_to_ms(config_.max_burst_minutes * 60.0),
    [this, alive, speaker, burst_id]() {
      if (alive.expired()) {
        return;
      }
      on_watchdog(speaker, burst_id);
    });

  RCLCPP_DEBUG(
    logger(), "burst %ld opened for %s at frame %lu",
    static_cast<long>(burst->burst_id), speaker.c_str(),
    static_cast<unsigned long>(pos.frame_count));
  return burst;
}

void BurstTracker::close_burst_locked(const string & speaker, OpenBurst & burst)
{
  burst.watchdog.reset();

  uint64_t end_offset = burst.start_offset;
  TrackPosition pos;
  if (recorder_.position(speaker, pos) && pos.track_id == burst.track_id) {
    end_offset = pos.frame_count;
  } else {
    RCLCPP_WARN(
      logger(), "burst %ld (%s): track already closed, ending at start offset %lu",
      static_cast<long>(burst.burst_id), speaker.c_str(),
      static_cast<unsigned long>(burst.start_offset));
  }
  store_.close_burst(
    burst.burst_id, recorder_common::to_iso8601(scheduler_.wall_now()),
    static_cast<int64_t>(end_offset));
  RCLCPP_DEBUG(
    logger(), "burst %ld closed for %s: frames [%lu, %lu)",
    static_cast<long>(burst.burst_id), speaker.c_str(),
    static_cast<unsigned long>(burst.start_offset), static_cast<unsigned long>(end_offset));
}

void BurstTracker::on_watchdog(const string & speaker, int64_t burst_id)
{
  lock_guard<mutex> lock(mutex_);
  if (destroyed_) {
    return;
  }
  auto it = bursts_.find(speaker);
  if (it == bursts_.end() || it->second->burst_id != burst_id) {
    return;
  }

  // 같은 position 값으로 닫고 다시 열어 offset 공백이 생기지 않게 한다
  TrackPosition pos;
  const bool has_track = recorder_.position(speaker, pos);
  OpenBurst & old_burst = *it->second;
  if (!has_track || pos.track_id != old_burst.track_id) {
    unique_ptr<OpenBurst> burst = move(it->second);
    bursts_.erase(it);
    close_burst_locked(speaker, *burst);
    return;
  }

  RCLCPP_WARN(
    logger(), "burst %ld for %s exceeded %.1f minutes, splitting at frame %lu",
    static_cast<long>(burst_id), speaker.c_str(), config_.max_burst_minutes,
    static_cast<unsigned long>(pos.frame_count));

  store_.close_burst(
    old_burst.burst_id, recorder_common::to_iso8601(scheduler_.wall_now()),
    static_cast<int64_t>(pos.frame_count));
  it->second = open_burst_locked(speaker, pos);
}

}  // namespace voice_record_cpp
