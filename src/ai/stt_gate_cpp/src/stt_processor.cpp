#include "stt_gate_cpp/stt_processor.hpp"

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

SttProcessor::SttProcessor(
  const string & session_id, shared_ptr<SttEngine> engine, ProcessRegistry & registry,
  recorder_common::Scheduler & scheduler, recorder_common::SpeakingSignals & signals,
  const SttConfig & config)
: session_id_(session_id), engine_(move(engine)), registry_(registry), scheduler_(scheduler),
  config_(config)
{
  start_sub_ = signals.speaking_start.subscribe(
    [this](const string & speaker) {on_speaking_start(speaker);});
  end_sub_ = signals.speaking_end.subscribe(
    [this](const string & speaker) {on_speaking_end(speaker);});
}

SttProcessor::~SttProcessor()
{
  destroy();
}

SessionSpeakerKey SttProcessor::key_for(const string & speaker) const
{
  return SessionSpeakerKey{session_id_, speaker};
}

void SttProcessor::teardown(GateEntry & entry)
{
  // destroy가 남은 발화 시간을 내보내므로 구독은 그 뒤에 끊는다
  if (entry.gate) {
    entry.gate->destroy();
  }
  entry.duration_sub.reset();
  lock_guard<mutex> lock(mutex_);
  retired_.push_back(move(entry));
}

bool SttProcessor::add_speaker(const string & speaker)
{
  lock_guard<mutex> lock(mutex_);
  return add_speaker_locked(speaker);
}

bool SttProcessor::add_speaker_locked(const string & speaker)
{
  if (destroyed_) {
    return false;
  }
  if (gates_.count(speaker) != 0) {
    return true;
  }
  if (config_.max_concurrent_streams > 0 &&
    static_cast<int>(gates_.size()) >= config_.max_concurrent_streams)
  {
    RCLCPP_WARN(
      logger(), "max concurrent streams (%d) reached, not transcribing %s",
      config_.max_concurrent_streams, speaker.c_str());
    return false;
  }
  ResamplerPtr resampler = registry_.get(key_for(speaker));
  if (!resampler) {
    RCLCPP_WARN(logger(), "no resampler for %s, not transcribing", speaker.c_str());
    return false;
  }

  GateEntry entry;
  entry.gate = VadGate::create(speaker, engine_, resampler, scheduler_, config_);
  entry.transcript_sub = entry.gate->subscribe_transcripts(
    [this](const TranscriptEvent & event) {transcripts_.emit(event);});
  entry.duration_sub = entry.gate->subscribe_speech_duration(
    [this, speaker](int64_t ms) {speech_duration_.emit(speaker, ms);});
  gates_[speaker] = move(entry);
  RCLCPP_DEBUG(logger(), "gate added for %s", speaker.c_str());
  return true;
}

void SttProcessor::remove_speaker(const string & speaker)
{
  GateEntry removed;
  {
    lock_guard<mutex> lock(mutex_);
    auto it = gates_.find(speaker);
    if (it == gates_.end()) {
      return;
    }
    removed = move(it->second);
    gates_.erase(it);
  }
  teardown(removed);
  RCLCPP_DEBUG(logger(), "gate removed for %s", speaker.c_str());
}

void SttProcessor::on_speaking_start(const string & speaker)
{
  GateEntry stale;
  VadGatePtr target;
  {
    lock_guard<mutex> lock(mutex_);
    if (destroyed_) {
      return;
    }
    auto it = gates_.find(speaker);
    if (it == gates_.end()) {
      return;
    }
    const SessionSpeakerKey key = key_for(speaker);
    ResamplerPtr resampler = registry_.get(key);
    const shared_ptr<PcmSource> bound = it->second.gate->bound_source();
    if (resampler && static_pointer_cast<PcmSource>(resampler) == bound) {
      target = it->second.gate;
    } else {
      // watchdog 등으로 resampler가 죽었거나 다른 프로세스로 바뀌었다
      stale = move(it->second);
      gates_.erase(it);
      if (!resampler) {
        RCLCPP_WARN(logger(), "resampler for %s is dead, respawning", speaker.c_str());
        resampler = registry_.spawn(key);
      } else {
        RCLCPP_INFO(logger(), "resampler for %s was replaced, rebinding gate", speaker.c_str());
      }
      if (resampler && add_speaker_locked(speaker)) {
        target = gates_[speaker].gate;
      }
    }
  }
  if (stale.gate) {
    teardown(stale);
  }
  if (target) {
    target->on_speaking_start();
  }
}

void SttProcessor::on_speaking_end(const string & speaker)
{
  VadGatePtr target = gate(speaker);
  if (target) {
    target->on_speaking_end();
  }
}

void SttProcessor::destroy()
{
  start_sub_.reset();
  end_sub_.reset();
  map<string, GateEntry> gates;
  {
    lock_guard<mutex> lock(mutex_);
    if (destroyed_) {
      return;
    }
    destroyed_ = true;
    gates.swap(gates_);
  }
  for (auto & kv : gates) {
    teardown(kv.second);
  }

  // 닫힌 스트림이 보낸 마지막 chunk의 결과가 도착할 시간을 준다
  if (!engine_->drain(recorder_common::seconds_to_ms(config_.drain_timeout_sec))) {
    RCLCPP_WARN(
      logger(), "session %s: some final transcripts did not arrive in time", session_id_.c_str());
  }
  vector<GateEntry> retired;
  {
    lock_guard<mutex> lock(mutex_);
    retired.swap(retired_);
  }
  for (auto & entry : retired) {
    entry.transcript_sub.reset();
  }
  RCLCPP_DEBUG(logger(), "stt processor for session %s destroyed", session_id_.c_str());
}

bool SttProcessor::has_gate(const string & speaker) const
{
  lock_guard<mutex> lock(mutex_);
  return gates_.count(speaker) != 0;
}

size_t SttProcessor::active_gates() const
{
  lock_guard<mutex> lock(mutex_);
  return gates_.size();
}

shared_ptr<VadGate> SttProcessor::gate(const string & speaker) const
{
  lock_guard<mutex> lock(mutex_);
  auto it = gates_.find(speaker);
  return it == gates_.end() ? nullptr : it->second.gate;
}

recorder_common::Subscription SttProcessor::subscribe_transcripts(TranscriptCallback callback)
{
  return transcripts_.subscribe(move(callback));
}

recorder_common::Subscription SttProcessor::subscribe_speech_duration(DurationCallback callback)
{
  return speech_duration_.subscribe(move(callback));
}

}  // namespace stt_gate_cpp
