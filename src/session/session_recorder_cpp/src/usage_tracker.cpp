#include "session_recorder_cpp/usage_tracker.hpp"

#include "rclcpp/rclcpp.hpp"

using namespace std;


namespace session_recorder_cpp
{

namespace
{
rclcpp::Logger logger()
{
  return rclcpp::get_logger("session_recorder_cpp");
}
}  // namespace

UsageTracker::UsageTracker(
  const string & session_id, const stt_gate_cpp::SttConfig & config,
  voice_record_cpp::RecordingStore & store)
: session_id_(session_id), engine_(config.engine), cost_per_minute_(config.cost_per_minute_usd),
  warning_threshold_(config.cost_warning_usd), store_(store)
{
}

void UsageTracker::add_speech_duration(int64_t duration_ms)
{
  lock_guard<mutex> lock(mutex_);
  if (duration_ms < 0) {
    return;
  }
  total_speech_ms_ += duration_ms;
  ++segment_count_;

  if (warning_emitted_) {
    return;
  }
  const double cost = estimate_cost_locked();
  if (cost >= warning_threshold_) {
    RCLCPP_WARN(
      logger(), "stt cost warning for session %s: estimated $%.2f (%.1f speech-minutes, %ld segments)",
      session_id_.c_str(), cost, static_cast<double>(total_speech_ms_) / 60000.0,
      static_cast<long>(segment_count_));
    warning_emitted_ = true;
  }
}

double UsageTracker::estimate_cost() const
{
  lock_guard<mutex> lock(mutex_);
  return estimate_cost_locked();
}

double UsageTracker::estimate_cost_locked() const
{
  const double minutes = static_cast<double>(total_speech_ms_) / 60000.0;
  return minutes * cost_per_minute_ * kCostBufferFactor;
}

void UsageTracker::flush()
{
  voice_record_cpp::UsageRow row;
  {
    lock_guard<mutex> lock(mutex_);
    if (flushed_ || total_speech_ms_ == 0) {
      return;
    }
    flushed_ = true;
    row.session_id = session_id_;
    row.engine = engine_;
    row.audio_duration_ms = total_speech_ms_;
    row.segment_count = segment_count_;
    row.estimated_cost_usd = estimate_cost_locked();
  }
  store_.insert_usage(row);
  RCLCPP_INFO(
    logger(), "stt usage for session %s: %.1f speech-minutes, %ld segments, estimated $%.2f",
    session_id_.c_str(), static_cast<double>(row.audio_duration_ms) / 60000.0,
    static_cast<long>(row.segment_count), row.estimated_cost_usd);
}

int64_t UsageTracker::total_speech_ms() const
{
  lock_guard<mutex> lock(mutex_);
  return total_speech_ms_;
}

int64_t UsageTracker::segment_count() const
{
  lock_guard<mutex> lock(mutex_);
  return segment_count_;
}

bool UsageTracker::warning_emitted() const
{
  lock_guard<mutex> lock(mutex_);
  return warning_emitted_;
}

}  // namespace session_recorder_cpp
