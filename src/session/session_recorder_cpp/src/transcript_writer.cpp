#include "session_recorder_cpp/transcript_writer.hpp"

#include "rclcpp/rclcpp.hpp"

using namespace std;


namespace session_recorder_cpp
{

TranscriptWriter::TranscriptWriter(
  const string & session_id, voice_record_cpp::RecordingStore & store)
: session_id_(session_id), store_(store)
{
}

void TranscriptWriter::set_track(const string & speaker, int64_t track_id)
{
  lock_guard<mutex> lock(mutex_);
  tracks_[speaker] = track_id;
  burst_cache_.erase(speaker);
}

bool TranscriptWriter::has_track(const string & speaker) const
{
  lock_guard<mutex> lock(mutex_);
  return tracks_.count(speaker) != 0;
}

int64_t TranscriptWriter::write(const stt_gate_cpp::TranscriptEvent & event)
{
  lock_guard<mutex> lock(mutex_);
  auto it = tracks_.find(event.speaker_id);
  if (it == tracks_.end()) {
    RCLCPP_WARN(
      rclcpp::get_logger("session_recorder_cpp"),
      "transcript for %s dropped: no track registered", event.speaker_id.c_str());
    return -1;
  }
  const int64_t track_id = it->second;

  voice_record_cpp::TranscriptRow row;
  row.session_id = session_id_;
  row.track_id = track_id;
  row.burst_id = burst_for(event.speaker_id, track_id, event.segment_start);
  row.speaker_id = event.speaker_id;
  row.speaker_label = event.speaker_label;
  row.segment_start = event.segment_start;
  row.segment_end = event.segment_end;
  row.text = event.text;
  row.confidence = event.confidence;
  row.has_confidence = event.has_confidence;
  row.is_final = event.is_final;
  row.result_id = event.result_id;
  row.stream_sequence = event.stream_sequence;
  row.engine = event.engine;
  row.model = event.model;
  const int64_t row_id = store_.upsert_transcript(row);

  // final 이후에는 burst 범위가 바뀌었을 수 있다
  if (event.is_final) {
    burst_cache_.erase(event.speaker_id);
  }
  return row_id;
}

int64_t TranscriptWriter::burst_for(const string & speaker, int64_t track_id, const string & at)
{
  auto cached = burst_cache_.find(speaker);
  if (cached != burst_cache_.end() && cached->second.found && in_range(at, cached->second)) {
    return cached->second.burst_id;
  }

  CachedBurst entry;
  voice_record_cpp::BurstRow burst;
  if (store_.find_burst_for_timestamp(track_id, at, burst)) {
    entry.found = true;
    entry.burst_id = burst.id;
    entry.start = burst.burst_start;
    entry.end = burst.closed ? burst.burst_end : string();
  }
  burst_cache_[speaker] = entry;
  return entry.burst_id;
}

bool TranscriptWriter::in_range(const string & at, const CachedBurst & burst)
{
  // 같은 형식의 UTC 문자열이라 사전순 비교가 시간순과 같다
  if (at < burst.start) {
    return false;
  }
  return burst.end.empty() || at <= burst.end;
}

}  // namespace session_recorder_cpp
