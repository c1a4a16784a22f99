#include "stt_gate_cpp/vad_gate.hpp"

#include <recorder_common/time_utils.hpp>

#include <cstdlib>
#include <utility>

#include "rclcpp/rclcpp.hpp"

using namespace std;


namespace stt_gate_cpp
{

namespace
{
rclcpp::Logger logger()
{
  return rclcpp::get_logger("stt_gate_cpp");
}
}  // namespace

shared_ptr<VadGate> VadGate::create(
  const string & speaker, shared_ptr<SttEngine> engine, shared_ptr<PcmSource> source,
  recorder_common::Scheduler & scheduler, const SttConfig & config)
{
  shared_ptr<VadGate> gate(new VadGate(speaker, move(engine), source, scheduler, config));
  gate->bind_source();
  return gate;
}

VadGate::VadGate(
  const string & speaker, shared_ptr<SttEngine> engine, shared_ptr<PcmSource> source,
  recorder_common::Scheduler & scheduler, const SttConfig & config)
: speaker_(speaker), engine_(move(engine)), source_(source), scheduler_(scheduler),
  config_(config)
{
}

VadGate::~VadGate()
{
  destroy();
}

void VadGate::bind_source()
{
  auto source = source_.lock();
  if (!source) {
    return;
  }
  weak_ptr<VadGate> weak = shared_from_this();
  pcm_sub_ = source->subscribe_pcm(
    [weak](const vector<uint8_t> & pcm) {
      if (auto self = weak.lock()) {
        self->on_pcm(pcm);
      }
    });
}

void VadGate::on_pcm(const vector<uint8_t> & pcm)
{
  lock_guard<mutex> lock(mutex_);
  if (destroyed_) {
    return;
  }
  if (current_ && current_->is_open()) {
    current_->write(pcm.data(), pcm.size());
  }
  if (rotating_ && rotating_->is_open()) {
    rotating_->write(pcm.data(), pcm.size());
  }
}

void VadGate::on_speaking_start()
{
  lock_guard<mutex> lock(mutex_);
  if (destroyed_) {
    return;
  }
  silence_timer_.reset();

  speaking_ = true;
  speech_start_ = scheduler_.now();

  // 말이 끊기지 않고 이어지는 경우를 위해 주기적으로 교체 여부를 본다
  if (!rotation_check_timer_) {
    weak_ptr<VadGate> weak = shared_from_this();
    rotation_check_timer_ = scheduler_.call_every(
      recorder_common::seconds_to_ms(config_.rotation_check_sec), [weak]() {
        if (auto self = weak.lock()) {
          self->on_rotation_check();
        }
      });
  }

  cooldown_timer_.reset();

  if (current_open_locked()) {
    return;
  }
  const auto now = scheduler_.now();
  if (now < cooldown_until_) {
    const auto delay = chrono::duration_cast<chrono::milliseconds>(cooldown_until_ - now);
    RCLCPP_DEBUG(
      logger(), "gate %s: cooldown active, reopening in %ld ms",
      speaker_.c_str(), static_cast<long>(delay.count()));
    schedule_cooldown_reopen_locked(delay, false);
    return;
  }
  open_new_stream_locked();
}

void VadGate::on_speaking_end()
{
  int64_t burst_ms = -1;
  {
    lock_guard<mutex> lock(mutex_);
    if (destroyed_) {
      return;
    }
    rotation_check_timer_.reset();
    cooldown_timer_.reset();

    if (speaking_) {
      burst_ms = elapsed_ms_locked(speech_start_);
      cumulative_ms_ += burst_ms;
      speaking_ = false;
    }

    const int64_t rotation_ms =
      recorder_common::seconds_to_ms(config_.stream_rotation_minutes * 60.0).count();
    if (cumulative_ms_ >= rotation_ms && current_open_locked()) {
      rotate_locked();
    }

    weak_ptr<VadGate> weak = shared_from_this();
    silence_timer_ = scheduler_.call_after(
      recorder_common::seconds_to_ms(config_.silence_timeout_sec), [weak]() {
        if (auto self = weak.lock()) {
          self->on_silence_timeout();
        }
      });
  }
  if (burst_ms >= 0) {
    speech_duration_.emit(burst_ms);
  }
}

void VadGate::on_rotation_check()
{
  int64_t elapsed = -1;
  {
    lock_guard<mutex> lock(mutex_);
    if (destroyed_ || !speaking_) {
      return;
    }
    const int64_t running = cumulative_ms_ + elapsed_ms_locked(speech_start_);
    const int64_t rotation_ms =
      recorder_common::seconds_to_ms(config_.stream_rotation_minutes * 60.0).count();
    if (running < rotation_ms || !current_open_locked()) {
      return;
    }
    // 교체 전 구간의 발화 시간을 먼저 보고하고 측정을 다시 시작한다
    elapsed = elapsed_ms_locked(speech_start_);
    cumulative_ms_ = running;
    speech_start_ = scheduler_.now();
    rotate_locked();
  }
  speech_duration_.emit(elapsed);
}

void VadGate::on_silence_timeout()
{
  lock_guard<mutex> lock(mutex_);
  silence_timer_.reset();
  if (destroyed_) {
    return;
  }
  if (current_open_locked()) {
    current_->close();
    cooldown_until_ = scheduler_.now() +
      recorder_common::seconds_to_ms(config_.connection_cooldown_sec);
    RCLCPP_DEBUG(
      logger(), "gate %s: stream #%d closed after silence", speaker_.c_str(), sequence_);
  }
  current_.reset();
}

void VadGate::on_cooldown_expired(bool require_speech)
{
  lock_guard<mutex> lock(mutex_);
  cooldown_timer_.reset();
  if (destroyed_ || current_open_locked()) {
    return;
  }
  if (require_speech && !speaking_) {
    return;
  }
  open_new_stream_locked();
}

void VadGate::on_overlap_end()
{
  lock_guard<mutex> lock(mutex_);
  overlap_timer_.reset();
  if (rotating_ && rotating_->is_open()) {
    rotating_->close();
  }
  rotating_.reset();
}

void VadGate::on_stream_closed(int sequence)
{
  lock_guard<mutex> lock(mutex_);
  if (destroyed_) {
    return;
  }
  // 교체로 물러난 스트림이나 이미 정리된 스트림이면 무시
  if (sequence != sequence_ || !current_ || current_->is_open()) {
    return;
  }
  if (!speaking_) {
    return;
  }
  RCLCPP_WARN(
    logger(), "gate %s: stream #%d closed unexpectedly mid-speech, reopening after cooldown",
    speaker_.c_str(), sequence);
  current_.reset();
  const auto cooldown = recorder_common::seconds_to_ms(config_.connection_cooldown_sec);
  cooldown_until_ = scheduler_.now() + cooldown;
  schedule_cooldown_reopen_locked(cooldown, true);
}

void VadGate::handle_transcript(const TranscriptEvent & event)
{
  {
    lock_guard<mutex> lock(mutex_);
    // destroy가 닫은 스트림의 마지막 chunk 결과는 중복 제거 없이 그대로 내보낸다
    if (!destroyed_ && rotating_ && event.stream_sequence < sequence_ &&
      !new_stream_first_result_.empty())
    {
      recorder_common::WallClock::time_point event_time;
      recorder_common::WallClock::time_point first_time;
      if (recorder_common::parse_iso8601(event.segment_start, event_time) &&
        recorder_common::parse_iso8601(new_stream_first_result_, first_time))
      {
        const int64_t diff = recorder_common::to_epoch_ms(event_time) -
          recorder_common::to_epoch_ms(first_time);
        if (llabs(diff) <= config_.dedup_window_ms) {
          RCLCPP_DEBUG(
            logger(), "gate %s: dropped overlapping result from stream #%d",
            speaker_.c_str(), event.stream_sequence);
          return;
        }
      }
    }
    if (!destroyed_ && event.stream_sequence == sequence_ && new_stream_first_result_.empty()) {
      new_stream_first_result_ = event.segment_start;
    }
  }
  transcripts_.emit(event);
}

void VadGate::destroy()
{
  int64_t remaining = -1;
  recorder_common::Subscription pcm_sub;
  {
    lock_guard<mutex> lock(mutex_);
    if (destroyed_) {
      return;
    }
    destroyed_ = true;
    if (speaking_) {
      remaining = elapsed_ms_locked(speech_start_);
      speaking_ = false;
    }
    silence_timer_.reset();
    cooldown_timer_.reset();
    rotation_check_timer_.reset();
    overlap_timer_.reset();
    if (current_ && current_->is_open()) {
      current_->close();
    }
    if (rotating_ && rotating_->is_open()) {
      rotating_->close();
    }
    current_.reset();
    rotating_.reset();
    pcm_sub = move(pcm_sub_);
  }
  // on_pcm이 gate 락을 잡으므로 PCM 구독은 락 밖에서 끊는다
  pcm_sub.reset();
  if (remaining >= 0) {
    speech_duration_.emit(remaining);
  }
  RCLCPP_DEBUG(logger(), "gate %s destroyed", speaker_.c_str());
}

recorder_common::Subscription VadGate::subscribe_transcripts(TranscriptCallback callback)
{
  return transcripts_.subscribe(move(callback));
}

recorder_common::Subscription VadGate::subscribe_speech_duration(function<void(int64_t)> callback)
{
  return speech_duration_.subscribe(move(callback));
}

shared_ptr<PcmSource> VadGate::bound_source() const
{
  return source_.lock();
}

bool VadGate::destroyed() const
{
  lock_guard<mutex> lock(mutex_);
  return destroyed_;
}

bool VadGate::has_open_stream() const
{
  lock_guard<mutex> lock(mutex_);
  return current_open_locked();
}

bool VadGate::is_rotating() const
{
  lock_guard<mutex> lock(mutex_);
  return static_cast<bool>(rotating_);
}

bool VadGate::speaking() const
{
  lock_guard<mutex> lock(mutex_);
  return speaking_;
}

int VadGate::stream_sequence() const
{
  lock_guard<mutex> lock(mutex_);
  return sequence_;
}

int64_t VadGate::cumulative_speech_ms() const
{
  lock_guard<mutex> lock(mutex_);
  return cumulative_ms_;
}

bool VadGate::current_open_locked() const
{
  return current_ && current_->is_open();
}

SttStreamPtr VadGate::open_stream_locked()
{
  ++sequence_;
  cumulative_ms_ = 0;
  const int sequence = sequence_;
  weak_ptr<VadGate> weak = shared_from_this();
  return engine_->open_stream(
    speaker_, sequence,
    [weak](const TranscriptEvent & event) {
      if (auto self = weak.lock()) {
        self->handle_transcript(event);
      }
    },
    [weak, sequence]() {
      if (auto self = weak.lock()) {
        self->on_stream_closed(sequence);
      }
    });
}

void VadGate::open_new_stream_locked()
{
  current_ = open_stream_locked();
  RCLCPP_DEBUG(logger(), "gate %s: stream #%d opened", speaker_.c_str(), sequence_);
}

void VadGate::rotate_locked()
{
  RCLCPP_DEBUG(
    logger(), "gate %s: rotating stream #%d after %ld ms of speech",
    speaker_.c_str(), sequence_, static_cast<long>(cumulative_ms_));

  // 이전 교체의 overlap이 아직 남아 있으면 즉시 닫는다
  if (rotating_ && rotating_->is_open()) {
    rotating_->close();
    RCLCPP_DEBUG(logger(), "gate %s: force-closed previous rotating stream", speaker_.c_str());
  }
  overlap_timer_.reset();

  rotating_ = current_;
  new_stream_first_result_.clear();
  current_ = open_stream_locked();

  weak_ptr<VadGate> weak = shared_from_this();
  overlap_timer_ = scheduler_.call_after(
    recorder_common::seconds_to_ms(config_.stream_overlap_sec), [weak]() {
      if (auto self = weak.lock()) {
        self->on_overlap_end();
      }
    });
}

void VadGate::schedule_cooldown_reopen_locked(chrono::milliseconds delay, bool require_speech)
{
  weak_ptr<VadGate> weak = shared_from_this();
  cooldown_timer_ = scheduler_.call_after(
    delay, [weak, require_speech]() {
      if (auto self = weak.lock()) {
        self->on_cooldown_expired(require_speech);
      }
    });
}

int64_t VadGate::elapsed_ms_locked(Clock::time_point since) const
{
  return chrono::duration_cast<chrono::milliseconds>(scheduler_.now() - since).count();
}

}  // namespace stt_gate_cpp
