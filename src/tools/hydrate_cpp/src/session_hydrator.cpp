#include "hydrate_cpp/session_hydrator.hpp"

#include <recorder_common/string_utils.hpp>

#include <filesystem>

#include "rclcpp/rclcpp.hpp"

#include "hydrate_cpp/wav_file_writer.hpp"
#include "voice_record_cpp/ogg_demuxer.hpp"

using namespace std;


namespace hydrate_cpp
{

namespace
{
rclcpp::Logger logger()
{
  return rclcpp::get_logger("hydrate_cpp");
}

/// 컨테이너 패킷 수와 디코딩된 프레임 수를 비교한다 (pre-skip 만큼 디코더가 덜 내보낸다)
void check_container(const voice_record_cpp::TrackRow & track, uint64_t decoded_frames)
{
  const voice_record_cpp::OggOpusContents contents =
    voice_record_cpp::read_ogg_opus_file(track.file_path);
  if (!contents.ok) {
    RCLCPP_DEBUG(
      logger(), "track %ld: container not readable (%s), skipping frame cross-check",
      static_cast<long>(track.id), contents.error.c_str());
    return;
  }
  if (contents.truncated) {
    RCLCPP_WARN(
      logger(), "track %ld: file ends with an incomplete page, recording was likely interrupted",
      static_cast<long>(track.id));
  }
  const uint64_t samples = contents.packets.size() * kFrameSamples;
  const uint64_t expected = samples > contents.pre_skip ?
    (samples - contents.pre_skip) / kFrameSamples : 0;
  const uint64_t diff = expected > decoded_frames ?
    expected - decoded_frames : decoded_frames - expected;
  if (diff > 1) {
    RCLCPP_WARN(
      logger(), "track %ld: container holds %zu packets but %lu frames were decoded",
      static_cast<long>(track.id), contents.packets.size(),
      static_cast<unsigned long>(decoded_frames));
  }
}
}  // namespace

const char * status_name(HydrateStatus status)
{
  switch (status) {
    case HydrateStatus::kOk:
      return "ok";
    case HydrateStatus::kToolMissing:
      return "ffmpeg is required but was not found";
    case HydrateStatus::kSessionNotFound:
      return "session not found";
    case HydrateStatus::kNoTracks:
      return "no audio tracks found for this session";
    case HydrateStatus::kNothingHydrated:
      return "no tracks were hydrated (no bursts or missing files)";
    case HydrateStatus::kMixFailed:
      return "mixdown failed";
  }
  return "unknown";
}

SessionHydrator::SessionHydrator(
  voice_record_cpp::RecordingStore & store, AudioTool & tool, const string & data_dir,
  const HydrateOptions & options)
: store_(store), tool_(tool), data_dir_(data_dir), options_(options)
{
}

HydrateStatus SessionHydrator::hydrate(const string & session_id, bool mix, HydrateSummary & summary)
{
  if (!tool_.available()) {
    return HydrateStatus::kToolMissing;
  }

  voice_record_cpp::SessionRow session;
  if (!store_.get_session(session_id, session)) {
    return HydrateStatus::kSessionNotFound;
  }
  const vector<voice_record_cpp::TrackRow> tracks = store_.session_tracks(session_id);
  if (tracks.empty()) {
    return HydrateStatus::kNoTracks;
  }

  const filesystem::path out_dir = filesystem::path(data_dir_) /
    recorder_common::sanitize_file_component(session_id) / "hydrated";
  error_code ec;
  filesystem::create_directories(out_dir, ec);
  if (ec) {
    summary.error = "cannot create " + out_dir.string() + ": " + ec.message();
    return HydrateStatus::kNothingHydrated;
  }
  summary.output_dir = out_dir.string();

  RCLCPP_INFO(
    logger(), "hydrating session %s: %zu track(s) -> %s",
    session_id.c_str(), tracks.size(), summary.output_dir.c_str());
  if (!options_.clamp) {
    RCLCPP_INFO(logger(), "silence gaps will not be capped, output files may be very large");
  }

  for (const auto & track : tracks) {
    TrackResult result;
    if (hydrate_track(track, summary.output_dir, result)) {
      summary.tracks.push_back(result);
    }
  }

  if (summary.tracks.empty()) {
    return HydrateStatus::kNothingHydrated;
  }
  RCLCPP_INFO(logger(), "hydrated %zu track(s)", summary.tracks.size());

  if (mix) {
    vector<string> inputs;
    for (const auto & t : summary.tracks) {
      inputs.push_back(t.output_path);
    }
    const string mix_path = (out_dir / "session_mix.wav").string();
    RCLCPP_INFO(logger(), "mixing %zu track(s)", inputs.size());
    string error;
    if (!tool_.mix(inputs, mix_path, error)) {
      summary.error = error;
      return HydrateStatus::kMixFailed;
    }
    summary.mix_path = mix_path;
    RCLCPP_INFO(logger(), "mixed output: %s", mix_path.c_str());
  }
  return HydrateStatus::kOk;
}

bool SessionHydrator::hydrate_track(
  const voice_record_cpp::TrackRow & track, const string & output_dir, TrackResult & result)
{
  const long id = static_cast<long>(track.id);
  const vector<voice_record_cpp::BurstRow> bursts = store_.track_bursts(track.id);
  if (bursts.empty()) {
    RCLCPP_INFO(logger(), "track %ld (%s): no bursts, skipping", id, track.speaker_id.c_str());
    return false;
  }
  if (track.first_packet_at.empty()) {
    RCLCPP_INFO(logger(), "track %ld (%s): no first packet time, skipping", id, track.speaker_id.c_str());
    return false;
  }
  error_code ec;
  if (!filesystem::exists(track.file_path, ec)) {
    RCLCPP_ERROR(logger(), "track %ld: file not found: %s", id, track.file_path.c_str());
    return false;
  }

  vector<uint8_t> decoded;
  string error;
  if (!tool_.decode(track.file_path, decoded, error)) {
    RCLCPP_ERROR(logger(), "track %ld: %s", id, error.c_str());
    return false;
  }
  RCLCPP_INFO(
    logger(), "track %ld (%s): decoded %lu frames (%.1f s of speech)", id, track.speaker_id.c_str(),
    static_cast<unsigned long>(decoded.size() / kBytesPerFrame),
    static_cast<double>(decoded.size()) / kBytesPerSecond);
  check_container(track, decoded.size() / kBytesPerFrame);

  const string output_path = (filesystem::path(output_dir) /
    (filesystem::path(track.file_path).stem().string() + ".wav")).string();
  WavFileWriter wav(output_path, kSampleRate, kChannels);
  if (!wav.good()) {
    RCLCPP_ERROR(logger(), "track %ld: cannot write %s", id, output_path.c_str());
    return false;
  }

  result.track_id = track.id;
  result.speaker_id = track.speaker_id;
  result.output_path = output_path;
  if (!assemble_track(decoded, track.first_packet_at, bursts, options_, wav, result.report)) {
    RCLCPP_ERROR(logger(), "track %ld: %s", id, result.report.error.c_str());
    wav.close();
    filesystem::remove(output_path, ec);
    return false;
  }
  wav.close();
  if (!wav.good()) {
    RCLCPP_ERROR(logger(), "track %ld: failed to finalize %s", id, output_path.c_str());
    return false;
  }

  RCLCPP_INFO(
    logger(), "track %ld: %d burst(s), %.1f s total -> %s", id, result.report.bursts_written,
    result.report.duration_seconds(), filesystem::path(output_path).filename().c_str());
  return true;
}

}  // namespace hydrate_cpp
