#pragma once

#include <string>
#include <vector>

#include "hydrate_cpp/audio_tool.hpp"
#include "hydrate_cpp/track_assembler.hpp"
#include "voice_record_cpp/recording_store.hpp"

namespace hydrate_cpp
{

enum class HydrateStatus
{
  kOk,
  kToolMissing,
  kSessionNotFound,
  kNoTracks,
  kNothingHydrated,
  kMixFailed,
};

const char * status_name(HydrateStatus status);

struct TrackResult
{
  int64_t track_id = -1;
  std::string speaker_id;
  std::string output_path;
  AssemblyReport report;
};

struct HydrateSummary
{
  std::string output_dir;
  std::vector<TrackResult> tracks;
  std::string mix_path;
  std::string error;
};

/// 세션의 모든 track을 시간 정렬된 WAV로 복원한다.
/// 출력: <data_dir>/<session>/hydrated/<track 파일명>.wav, --mix 시 session_mix.wav
class SessionHydrator
{
public:
  SessionHydrator(
    voice_record_cpp::RecordingStore & store, AudioTool & tool, const std::string & data_dir,
    const HydrateOptions & options);

  HydrateStatus hydrate(const std::string & session_id, bool mix, HydrateSummary & summary);

private:
  bool hydrate_track(
    const voice_record_cpp::TrackRow & track, const std::string & output_dir, TrackResult & result);

  voice_record_cpp::RecordingStore & store_;
  AudioTool & tool_;
  std::string data_dir_;
  HydrateOptions options_;
};

}  // namespace hydrate_cpp
