#include "voice_record_cpp/track_recorder.hpp"

#include "voice_record_cpp/opus_toc.hpp"

#include <recorder_common/string_utils.hpp>
#include <recorder_common/time_utils.hpp>

#include <filesystem>
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

TrackRecorder::TrackRecorder(
  const string & session_id, RecordingStore & store,
  recorder_common::Scheduler & scheduler, const RecorderConfig & config)
: session_id_(session_id), store_(store), scheduler_(scheduler), config_(config)
{
}

TrackRecorder::~TrackRecorder()
{
  try {
    close_all();
  } catch (const StoreError & e) {
    RCLCPP_ERROR(logger(), "failed to record track end on shutdown: %s", e.what());
  }
}

string TrackRecorder::session_dir() const
{
  return (filesystem::path(config_.data_dir) /
         recorder_common::sanitize_file_component(session_id_)).string();
}

bool TrackRecorder::subscribe(const string & speaker)
{
  lock_guard<mutex> lock(mutex_);
  if (tracks_.count(speaker) != 0) {
    return true;
  }

  const string dir = session_dir();
  error_code ec;
  filesystem::create_directories(dir, ec);
  if (ec) {
    RCLCPP_ERROR(logger(), "failed to create %s: %s", dir.c_str(), ec.message().c_str());
    return false;
  }

  auto track = make_unique<Track>();
  track->sequence = store_.track_count_for_speaker(session_id_, speaker);
  track->path = (filesystem::path(dir) /
    (recorder_common::sanitize_file_component(speaker) + "_" +
    to_string(track->sequence) + ".ogg")).string();

  track->sink = make_unique<FileSink>(track->path);
  if (!track->sink->is_open()) {
    RCLCPP_ERROR(logger(), "track sink open failed: %s", track->sink->last_error().c_str());
    return false;
  }
  track->muxer = make_unique<OggMuxer>(*track->sink);
  track->id = store_.insert_track(
    session_id_, speaker, track->path,
    recorder_common::to_iso8601(scheduler_.wall_now()));

  RCLCPP_INFO(
    logger(), "subscribed speaker %s: track %ld (%s)",
    speaker.c_str(), static_cast<long>(track->id), track->path.c_str());
  tracks_[speaker] = move(track);
  return true;
}

bool TrackRecorder::on_frame(const string & speaker, const uint8_t * data, size_t size)
{
  FrameForwarder forwarder;
  {
    lock_guard<mutex> lock(mutex_);
    auto it = tracks_.find(speaker);
    if (it == tracks_.end()) {
      return false;
    }
    Track & track = *it->second;

    if (!track.first_frame_recorded) {
      track.first_frame_recorded = true;
      store_.set_first_packet_at(
        track.id, recorder_common::to_iso8601(scheduler_.wall_now()));
    }

    // 프레임 길이가 다르면 offset 계산이 어긋나므로 경고만 남기고 그대로 기록
    const int duration_us = opus_packet_duration_us(data, size);
    if (duration_us != config_.expected_frame_ms * 1000) {
      ++track.nonstandard_frames;
      if (track.nonstandard_frames == 1 || track.nonstandard_frames % 500 == 0) {
        RCLCPP_WARN(
          logger(),
          "track %ld (speaker %s): opus packet duration %.1fms != expected %dms (toc 0x%02x, count %lu)",
          static_cast<long>(track.id), speaker.c_str(), duration_us / 1000.0,
          config_.expected_frame_ms, size > 0 ? data[0] : 0,
          static_cast<unsigned long>(track.nonstandard_frames));
      }
    }

    if (!track.muxer->write_frame(data, size)) {
      if (!track.write_error_logged) {
        track.write_error_logged = true;
        RCLCPP_ERROR(
          logger(), "track %ld: frame write failed (%s)",
          static_cast<long>(track.id), track.sink->last_error().c_str());
      }
      return false;
    }
    ++track.frame_count;
    forwarder = forwarder_;
  }

  if (forwarder) {
    forwarder(speaker, data, size);
  }
  return true;
}

void TrackRecorder::close(const string & speaker)
{
  unique_ptr<Track> track;
  {
    lock_guard<mutex> lock(mutex_);
    auto it = tracks_.find(speaker);
    if (it == tracks_.end()) {
      return;
    }
    track = move(it->second);
    tracks_.erase(it);
  }
  finish_track(speaker, move(track));
}

void TrackRecorder::close_all()
{
  map<string, unique_ptr<Track>> closing;
  {
    lock_guard<mutex> lock(mutex_);
    closing.swap(tracks_);
  }
  for (auto & kv : closing) {
    finish_track(kv.first, move(kv.second));
  }
}

void TrackRecorder::finish_track(const string & speaker, unique_ptr<Track> track)
{
  track->muxer->finalize();
  track->sink->close();
  store_.end_track(track->id, recorder_common::to_iso8601(scheduler_.wall_now()));
  RCLCPP_INFO(
    logger(), "closed track %ld for speaker %s: %lu frames (%lu nonstandard)",
    static_cast<long>(track->id), speaker.c_str(),
    static_cast<unsigned long>(track->frame_count),
    static_cast<unsigned long>(track->nonstandard_frames));
}

bool TrackRecorder::position(const string & speaker, TrackPosition & out) const
{
  lock_guard<mutex> lock(mutex_);
  auto it = tracks_.find(speaker);
  if (it == tracks_.end()) {
    return false;
  }
  out.track_id = it->second->id;
  out.frame_count = it->second->frame_count;
  return true;
}

bool TrackRecorder::summary(const string & speaker, TrackSummary & out) const
{
  lock_guard<mutex> lock(mutex_);
  auto it = tracks_.find(speaker);
  if (it == tracks_.end()) {
    return false;
  }
  const Track & t = *it->second;
  out.track_id = t.id;
  out.sequence = t.sequence;
  out.file_path = t.path;
  out.frame_count = t.frame_count;
  out.nonstandard_frames = t.nonstandard_frames;
  out.first_frame_recorded = t.first_frame_recorded;
  return true;
}

bool TrackRecorder::is_open(const string & speaker) const
{
  lock_guard<mutex> lock(mutex_);
  return tracks_.count(speaker) != 0;
}

size_t TrackRecorder::open_track_count() const
{
  lock_guard<mutex> lock(mutex_);
  return tracks_.size();
}

void TrackRecorder::set_frame_forwarder(FrameForwarder forwarder)
{
  lock_guard<mutex> lock(mutex_);
  forwarder_ = move(forwarder);
}

}  // namespace voice_record_cpp
