#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "recorder_common/scheduler.hpp"
#include "voice_record_cpp/byte_sink.hpp"
#include "voice_record_cpp/ogg_muxer.hpp"
#include "voice_record_cpp/recording_store.hpp"

namespace voice_record_cpp
{

struct RecorderConfig
{
  std::string data_dir = "data/recordings";
  // 모든 프레임이 같은 길이라는 전제로 burst offset을 계산한다
  int expected_frame_ms = 20;
};

/// burst 경계 계산용으로 한 번에 읽는 (track, frame counter) 쌍
struct TrackPosition
{
  int64_t track_id = -1;
  uint64_t frame_count = 0;
};

struct TrackSummary
{
  int64_t track_id = -1;
  int sequence = 0;
  std::string file_path;
  uint64_t frame_count = 0;
  uint64_t nonstandard_frames = 0;
  bool first_frame_recorded = false;
};

/// 화자별 Opus 프레임을 Ogg 파일로 기록하고 track 수명주기를 저장소에 남긴다.
class TrackRecorder
{
public:
  using FrameForwarder = std::function<void(const std::string & speaker, const uint8_t * data, size_t size)>;

  TrackRecorder(
    const std::string & session_id, RecordingStore & store,
    recorder_common::Scheduler & scheduler, const RecorderConfig & config);
  ~TrackRecorder();

  TrackRecorder(const TrackRecorder &) = delete;
  TrackRecorder & operator=(const TrackRecorder &) = delete;

  /// 열린 track이 있으면 그대로 두고, 없으면 새 track을 만든다. track이 열려 있으면 true
  bool subscribe(const std::string & speaker);
  /// 프레임 하나 기록. 열린 track이 없으면 false
  bool on_frame(const std::string & speaker, const uint8_t * data, size_t size);
  bool on_frame(const std::string & speaker, const std::vector<uint8_t> & frame)
  {
    return on_frame(speaker, frame.data(), frame.size());
  }
  void close(const std::string & speaker);
  void close_all();

  bool position(const std::string & speaker, TrackPosition & out) const;
  bool summary(const std::string & speaker, TrackSummary & out) const;
  bool is_open(const std::string & speaker) const;
  size_t open_track_count() const;

  /// 기록된 프레임 사본을 resampler 쪽으로 넘기는 콜백 (락 밖에서 호출)
  void set_frame_forwarder(FrameForwarder forwarder);

  const std::string & session_id() const { return session_id_; }
  std::string session_dir() const;

private:
  struct Track
  {
    int64_t id = -1;
    int sequence = 0;
    std::string path;
    std::unique_ptr<FileSink> sink;
    std::unique_ptr<OggMuxer> muxer;
    uint64_t frame_count = 0;
    uint64_t nonstandard_frames = 0;
    bool first_frame_recorded = false;
    bool write_error_logged = false;
  };

  void finish_track(const std::string & speaker, std::unique_ptr<Track> track);

  std::string session_id_;
  RecordingStore & store_;
  recorder_common::Scheduler & scheduler_;
  RecorderConfig config_;

  mutable std::mutex mutex_;
  std::map<std::string, std::unique_ptr<Track>> tracks_;
  FrameForwarder forwarder_;
};

}  // namespace voice_record_cpp
