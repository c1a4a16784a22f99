#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace voice_record_cpp
{

/// 저장소를 쓸 수 없는 치명적 오류 (녹음 경로를 중단시킨다)
class StoreError : public std::runtime_error
{
public:
  explicit StoreError(const std::string & what)
  : std::runtime_error(what)
  {
  }
};

struct SessionRow
{
  std::string id;
  std::string started_at;
  std::string ended_at;      ///< 비어 있으면 진행 중
  std::string status;        ///< active | stopped | error
};

struct TrackRow
{
  int64_t id = -1;
  std::string session_id;
  std::string speaker_id;
  std::string file_path;
  std::string started_at;
  std::string first_packet_at;  ///< 첫 프레임 수신 전이면 빈 문자열
  std::string ended_at;
};

struct BurstRow
{
  int64_t id = -1;
  int64_t track_id = -1;
  std::string burst_start;
  std::string burst_end;        ///< open burst이면 빈 문자열
  int64_t start_frame_offset = 0;
  int64_t end_frame_offset = 0;
  bool closed = false;
};

struct TranscriptRow
{
  int64_t id = -1;
  std::string session_id;
  int64_t track_id = -1;
  int64_t burst_id = -1;        ///< 매칭되는 burst가 없으면 -1
  std::string speaker_id;
  std::string speaker_label;
  std::string segment_start;
  std::string segment_end;
  std::string text;
  double confidence = 0.0;
  bool has_confidence = false;
  bool is_final = false;
  std::string result_id;        ///< 비어 있으면 upsert 키 없이 insert
  int stream_sequence = 0;
  std::string engine;
  std::string model;
};

struct UsageRow
{
  std::string session_id;
  std::string engine;
  int64_t audio_duration_ms = 0;
  int64_t segment_count = 0;
  double estimated_cost_usd = 0.0;
};

/// 녹음/전사 메타데이터 저장소 인터페이스
/// 구현은 스레드 안전해야 하며 실패 시 StoreError를 던진다.
class RecordingStore
{
public:
  virtual ~RecordingStore() = default;

  virtual void create_session(const std::string & session_id, const std::string & started_at) = 0;
  virtual void end_session(
    const std::string & session_id, const std::string & ended_at, const std::string & status) = 0;
  virtual bool get_session(const std::string & session_id, SessionRow & out) = 0;
  /// 비정상 종료로 active 상태에 남은 세션을 error로 바꾸고 열린 track/burst를 닫는다
  virtual int reconcile_stale_sessions(const std::string & now) = 0;

  virtual int track_count_for_speaker(const std::string & session_id, const std::string & speaker_id) = 0;
  virtual int64_t insert_track(
    const std::string & session_id, const std::string & speaker_id,
    const std::string & file_path, const std::string & started_at) = 0;
  virtual void set_first_packet_at(int64_t track_id, const std::string & at) = 0;
  virtual void end_track(int64_t track_id, const std::string & ended_at) = 0;
  virtual std::vector<TrackRow> session_tracks(const std::string & session_id) = 0;

  virtual int64_t insert_burst(int64_t track_id, const std::string & start, int64_t start_frame_offset) = 0;
  virtual void close_burst(int64_t burst_id, const std::string & end, int64_t end_frame_offset) = 0;
  /// burst_start 순으로 정렬
  virtual std::vector<BurstRow> track_bursts(int64_t track_id) = 0;
  /// 타임스탬프(±1초)를 포함하는 burst 검색
  virtual bool find_burst_for_timestamp(int64_t track_id, const std::string & at, BurstRow & out) = 0;

  /// result_id가 있으면 키 기준 upsert (final은 낮은 finality로 덮어쓰지 않음)
  virtual int64_t upsert_transcript(const TranscriptRow & row) = 0;
  virtual std::vector<TranscriptRow> session_transcripts(const std::string & session_id) = 0;

  virtual void insert_usage(const UsageRow & row) = 0;
};

}  // namespace voice_record_cpp
