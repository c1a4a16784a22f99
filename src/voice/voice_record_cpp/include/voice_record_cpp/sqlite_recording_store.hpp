#pragma once

#include <sqlite3.h>

#include <mutex>
#include <string>
#include <vector>

#include "voice_record_cpp/recording_store.hpp"

namespace voice_record_cpp
{

/// SQLite 기반 RecordingStore. ":memory:" 경로로 테스트에서도 사용한다.
class SqliteRecordingStore : public RecordingStore
{
public:
  /// DB를 열고 스키마를 만든다. 실패 시 StoreError
  explicit SqliteRecordingStore(const std::string & db_path);
  ~SqliteRecordingStore() override;

  SqliteRecordingStore(const SqliteRecordingStore &) = delete;
  SqliteRecordingStore & operator=(const SqliteRecordingStore &) = delete;

  void create_session(const std::string & session_id, const std::string & started_at) override;
  void end_session(
    const std::string & session_id, const std::string & ended_at,
    const std::string & status) override;
  bool get_session(const std::string & session_id, SessionRow & out) override;
  int reconcile_stale_sessions(const std::string & now) override;

  int track_count_for_speaker(const std::string & session_id, const std::string & speaker_id) override;
  int64_t insert_track(
    const std::string & session_id, const std::string & speaker_id,
    const std::string & file_path, const std::string & started_at) override;
  void set_first_packet_at(int64_t track_id, const std::string & at) override;
  void end_track(int64_t track_id, const std::string & ended_at) override;
  std::vector<TrackRow> session_tracks(const std::string & session_id) override;

  int64_t insert_burst(int64_t track_id, const std::string & start, int64_t start_frame_offset) override;
  void close_burst(int64_t burst_id, const std::string & end, int64_t end_frame_offset) override;
  std::vector<BurstRow> track_bursts(int64_t track_id) override;
  bool find_burst_for_timestamp(int64_t track_id, const std::string & at, BurstRow & out) override;

  int64_t upsert_transcript(const TranscriptRow & row) override;
  std::vector<TranscriptRow> session_transcripts(const std::string & session_id) override;

  void insert_usage(const UsageRow & row) override;

  const std::string & path() const { return db_path_; }

private:
  void init_schema();
  void exec(const char * sql);

  std::string db_path_;
  sqlite3 * db_ = nullptr;
  std::mutex mutex_;
};

}  // namespace voice_record_cpp
