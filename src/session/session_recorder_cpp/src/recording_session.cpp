#include "session_recorder_cpp/recording_session.hpp"

#include <recorder_common/time_utils.hpp>

#include <utility>

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

RecordingSession::RecordingSession(
  const string & session_id, voice_record_cpp::RecordingStore & store,
  recorder_common::Scheduler & scheduler, recorder_common::SpeakingSignals & signals,
  stt_gate_cpp::ProcessRegistry & registry, stt_gate_cpp::EngineLease lease,
  const SessionConfig & config)
: session_id_(session_id), store_(store), scheduler_(scheduler), registry_(registry),
  lease_(move(lease)), config_(config), writer_(session_id, store),
  usage_(session_id, config.stt, store)
{
  store_.create_session(session_id_, recorder_common::to_iso8601(scheduler_.wall_now()));

  recorder_ = make_unique<voice_record_cpp::TrackRecorder>(
    session_id_, store_, scheduler_, config_.recorder);
  bursts_ = make_unique<voice_record_cpp::BurstTracker>(
    *recorder_, store_, scheduler_, signals, config_.bursts);

  if (config_.stt.enabled && lease_) {
    processor_ = make_unique<stt_gate_cpp::SttProcessor>(
      session_id_, lease_.engine(), registry_, scheduler_, signals, config_.stt);
    transcript_sub_ = processor_->subscribe_transcripts(
      [this](const stt_gate_cpp::TranscriptEvent & event) {on_transcript(event);});
    duration_sub_ = processor_->subscribe_speech_duration(
      [this](const string &, int64_t ms) {usage_.add_speech_duration(ms);});

    // 녹음된 프레임 사본을 살아 있는 resampler로 넘긴다
    recorder_->set_frame_forwarder(
      [this](const string & speaker, const uint8_t * data, size_t size) {
        stt_gate_cpp::ResamplerPtr resampler = registry_.get(key_for(speaker));
        if (resampler) {
          resampler->write_frame(data, size);
        }
      });
  }

  RCLCPP_INFO(
    logger(), "session %s started (dir=%s, stt=%s)", session_id_.c_str(),
    recorder_->session_dir().c_str(), processor_ ? config_.stt.engine.c_str() : "off");
}

RecordingSession::~RecordingSession()
{
  try {
    stop();
  } catch (const voice_record_cpp::StoreError & e) {
    RCLCPP_ERROR(logger(), "session %s: failed to stop cleanly: %s", session_id_.c_str(), e.what());
  }
}

stt_gate_cpp::SessionSpeakerKey RecordingSession::key_for(const string & speaker) const
{
  return stt_gate_cpp::SessionSpeakerKey{session_id_, speaker};
}

bool RecordingSession::join(const string & speaker)
{
  {
    lock_guard<mutex> lock(mutex_);
    if (stopped_) {
      return false;
    }
  }
  if (!recorder_->subscribe(speaker)) {
    RCLCPP_ERROR(logger(), "session %s: could not open track for %s", session_id_.c_str(), speaker.c_str());
    return false;
  }

  voice_record_cpp::TrackPosition pos;
  if (recorder_->position(speaker, pos)) {
    writer_.set_track(speaker, pos.track_id);
  }

  if (processor_) {
    const auto key = key_for(speaker);
    if (!registry_.get(key)) {
      registry_.spawn(key);
    }
    processor_->add_speaker(speaker);
  }
  RCLCPP_INFO(logger(), "session %s: %s joined", session_id_.c_str(), speaker.c_str());
  return true;
}

void RecordingSession::leave(const string & speaker)
{
  {
    lock_guard<mutex> lock(mutex_);
    if (stopped_) {
      return;
    }
  }
  bursts_->close_user_burst(speaker);
  if (processor_) {
    processor_->remove_speaker(speaker);
    registry_.kill(key_for(speaker));
  }
  recorder_->close(speaker);
  RCLCPP_INFO(logger(), "session %s: %s left", session_id_.c_str(), speaker.c_str());
}

bool RecordingSession::on_frame(const string & speaker, const uint8_t * data, size_t size)
{
  return recorder_->on_frame(speaker, data, size);
}

void RecordingSession::stop()
{
  {
    lock_guard<mutex> lock(mutex_);
    if (stopped_) {
      return;
    }
    stopped_ = true;
  }

  bursts_->destroy();
  if (processor_) {
    processor_->destroy();
  }
  registry_.kill_session(session_id_);
  recorder_->close_all();
  transcript_sub_.reset();
  duration_sub_.reset();
  usage_.flush();
  store_.end_session(session_id_, recorder_common::to_iso8601(scheduler_.wall_now()), "stopped");
  lease_.release();

  RCLCPP_INFO(
    logger(), "session %s stopped (%zu tracks)", session_id_.c_str(),
    store_.session_tracks(session_id_).size());
}

bool RecordingSession::stopped() const
{
  lock_guard<mutex> lock(mutex_);
  return stopped_;
}

recorder_common::Subscription RecordingSession::subscribe_transcripts(TranscriptSink sink)
{
  return transcripts_.subscribe(move(sink));
}

void RecordingSession::on_transcript(const stt_gate_cpp::TranscriptEvent & event)
{
  // 엔진 작업 스레드에서 불린다. 저장 실패로 스레드를 죽이지 않고 기록만 남긴다
  int64_t row_id = -1;
  try {
    row_id = writer_.write(event);
  } catch (const voice_record_cpp::StoreError & e) {
    RCLCPP_ERROR(
      logger(), "session %s: failed to store transcript for %s: %s",
      session_id_.c_str(), event.speaker_id.c_str(), e.what());
    return;
  }
  if (row_id >= 0) {
    transcripts_.emit(event, row_id);
  }
}

}  // namespace session_recorder_cpp
