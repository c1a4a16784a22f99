#include "voice_record_cpp/sqlite_recording_store.hpp"

#include <recorder_common/time_utils.hpp>

using namespace std;


namespace voice_record_cpp
{

namespace
{

const char * kSchema = R"SQL(
CREATE TABLE IF NOT EXISTS sessions (
    id          TEXT PRIMARY KEY,
    started_at  TEXT NOT NULL,
    ended_at    TEXT,
    status      TEXT NOT NULL DEFAULT 'active'
);

CREATE TABLE IF NOT EXISTS audio_tracks (
    id               INTEGER PRIMARY KEY AUTOINCREMENT,
    session_id       TEXT NOT NULL REFERENCES sessions(id),
    user_id          TEXT NOT NULL,
    file_path        TEXT NOT NULL,
    started_at       TEXT NOT NULL,
    first_packet_at  TEXT,
    ended_at         TEXT,
    codec            TEXT NOT NULL DEFAULT 'opus',
    container        TEXT NOT NULL DEFAULT 'ogg'
);
CREATE INDEX IF NOT EXISTS idx_audio_tracks_session ON audio_tracks(session_id);

CREATE TABLE IF NOT EXISTS audio_speech_bursts (
    id                  INTEGER PRIMARY KEY AUTOINCREMENT,
    track_id            INTEGER NOT NULL REFERENCES audio_tracks(id),
    burst_start         TEXT NOT NULL,
    burst_end           TEXT,
    start_frame_offset  INTEGER NOT NULL,
    end_frame_offset    INTEGER
);
CREATE INDEX IF NOT EXISTS idx_audio_speech_bursts_track ON audio_speech_bursts(track_id);

CREATE TABLE IF NOT EXISTS transcript_segments (
    id               INTEGER PRIMARY KEY AUTOINCREMENT,
    session_id       TEXT NOT NULL REFERENCES sessions(id),
    track_id         INTEGER NOT NULL REFERENCES audio_tracks(id),
    burst_id         INTEGER REFERENCES audio_speech_bursts(id),
    user_id          TEXT NOT NULL,
    speaker_label    TEXT,
    segment_start    TEXT NOT NULL,
    segment_end      TEXT,
    transcript       TEXT NOT NULL,
    confidence       REAL,
    is_final         INTEGER NOT NULL DEFAULT 0,
    stt_result_id    TEXT,
    stream_sequence  INTEGER DEFAULT 0,
    stt_engine       TEXT NOT NULL,
    stt_model        TEXT,
    created_at       TEXT NOT NULL,
    updated_at       TEXT
);
CREATE INDEX IF NOT EXISTS idx_transcript_session_time
    ON transcript_segments(session_id, segment_start);
CREATE UNIQUE INDEX IF NOT EXISTS idx_transcript_stt_result
    ON transcript_segments(session_id, track_id, user_id, stream_sequence, stt_result_id);

CREATE TABLE IF NOT EXISTS stt_usage (
    id                  INTEGER PRIMARY KEY AUTOINCREMENT,
    session_id          TEXT NOT NULL REFERENCES sessions(id),
    engine              TEXT NOT NULL,
    audio_duration_ms   INTEGER NOT NULL,
    segment_count       INTEGER NOT NULL,
    estimated_cost_usd  REAL,
    created_at          TEXT NOT NULL
);
)SQL";

string utc_now_text()
{
  return recorder_common::to_iso8601(chrono::system_clock::now());
}

/// prepared statement RAII 래퍼
class Statement
{
public:
  Statement(sqlite3 * db, const char * sql)
  : db_(db)
  {
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt_, nullptr) != SQLITE_OK) {
      throw StoreError(string("sqlite prepare failed: ") + sqlite3_errmsg(db_));
    }
  }

  ~Statement()
  {
    sqlite3_finalize(stmt_);
  }

  Statement(const Statement &) = delete;
  Statement & operator=(const Statement &) = delete;

  void bind(int idx, const string & value)
  {
    sqlite3_bind_text(stmt_, idx, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
  }

  /// 빈 문자열은 NULL로 저장
  void bind_text_or_null(int idx, const string & value)
  {
    if (value.empty()) {
      sqlite3_bind_null(stmt_, idx);
    } else {
      bind(idx, value);
    }
  }

  void bind(int idx, int64_t value)
  {
    sqlite3_bind_int64(stmt_, idx, value);
  }

  void bind(int idx, double value)
  {
    sqlite3_bind_double(stmt_, idx, value);
  }

  void bind_null(int idx)
  {
    sqlite3_bind_null(stmt_, idx);
  }

  /// 행이 있으면 true, 끝이면 false
  bool step()
  {
    const int rc = sqlite3_step(stmt_);
    if (rc == SQLITE_ROW) {
      return true;
    }
    if (rc == SQLITE_DONE) {
      return false;
    }
    throw StoreError(string("sqlite step failed: ") + sqlite3_errmsg(db_));
  }

  void run()
  {
    while (step()) {
    }
  }

  string text(int col) const
  {
    const unsigned char * v = sqlite3_column_text(stmt_, col);
    return v ? reinterpret_cast<const char *>(v) : string();
  }

  int64_t int64(int col) const
  {
    return sqlite3_column_int64(stmt_, col);
  }

  double real(int col) const
  {
    return sqlite3_column_double(stmt_, col);
  }

  bool is_null(int col) const
  {
    return sqlite3_column_type(stmt_, col) == SQLITE_NULL;
  }

private:
  sqlite3 * db_;
  sqlite3_stmt * stmt_ = nullptr;
};

BurstRow read_burst(const Statement & st)
{
  BurstRow row;
  row.id = st.int64(0);
  row.track_id = st.int64(1);
  row.burst_start = st.text(2);
  row.burst_end = st.text(3);
  row.start_frame_offset = st.int64(4);
  row.closed = !st.is_null(5);
  row.end_frame_offset = row.closed ? st.int64(5) : 0;
  return row;
}

}  // namespace

SqliteRecordingStore::SqliteRecordingStore(const string & db_path)
: db_path_(db_path)
{
  const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
  if (sqlite3_open_v2(db_path_.c_str(), &db_, flags, nullptr) != SQLITE_OK) {
    const string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
    sqlite3_close(db_);
    db_ = nullptr;
    throw StoreError("failed to open database " + db_path_ + ": " + msg);
  }
  sqlite3_busy_timeout(db_, 5000);
  init_schema();
}

SqliteRecordingStore::~SqliteRecordingStore()
{
  if (db_) {
    sqlite3_close(db_);
    db_ = nullptr;
  }
}

void SqliteRecordingStore::exec(const char * sql)
{
  char * err = nullptr;
  if (sqlite3_exec(db_, sql, nullptr, nullptr, &err) != SQLITE_OK) {
    const string msg = err ? err : "unknown";
    sqlite3_free(err);
    throw StoreError("sqlite exec failed: " + msg);
  }
}

void SqliteRecordingStore::init_schema()
{
  if (db_path_ != ":memory:") {
    exec("PRAGMA journal_mode=WAL;");
  }
  exec("PRAGMA foreign_keys=ON;");
  exec(kSchema);
}

void SqliteRecordingStore::create_session(const string & session_id, const string & started_at)
{
  lock_guard<mutex> lock(mutex_);
  Statement st(db_, "INSERT INTO sessions (id, started_at, status) VALUES (?, ?, 'active')");
  st.bind(1, session_id);
  st.bind(2, started_at);
  st.run();
}

void SqliteRecordingStore::end_session(
  const string & session_id, const string & ended_at, const string & status)
{
  lock_guard<mutex> lock(mutex_);
  Statement st(db_, "UPDATE sessions SET ended_at = ?, status = ? WHERE id = ?");
  st.bind(1, ended_at);
  st.bind(2, status);
  st.bind(3, session_id);
  st.run();
}

bool SqliteRecordingStore::get_session(const string & session_id, SessionRow & out)
{
  lock_guard<mutex> lock(mutex_);
  Statement st(db_, "SELECT id, started_at, ended_at, status FROM sessions WHERE id = ?");
  st.bind(1, session_id);
  if (!st.step()) {
    return false;
  }
  out.id = st.text(0);
  out.started_at = st.text(1);
  out.ended_at = st.text(2);
  out.status = st.text(3);
  return true;
}

int SqliteRecordingStore::reconcile_stale_sessions(const string & now)
{
  lock_guard<mutex> lock(mutex_);
  exec("BEGIN IMMEDIATE;");
  try {
    // open burst는 end_frame_offset을 NULL로 남겨 hydrate가 트랙 끝까지 사용하게 한다
    Statement bursts(
      db_,
      "UPDATE audio_speech_bursts SET burst_end = ? "
      "WHERE burst_end IS NULL AND track_id IN ("
      "  SELECT t.id FROM audio_tracks t JOIN sessions s ON s.id = t.session_id "
      "  WHERE s.status = 'active')");
    bursts.bind(1, now);
    bursts.run();

    Statement tracks(
      db_,
      "UPDATE audio_tracks SET ended_at = ? "
      "WHERE ended_at IS NULL AND session_id IN (SELECT id FROM sessions WHERE status = 'active')");
    tracks.bind(1, now);
    tracks.run();

    Statement sessions(
      db_, "UPDATE sessions SET status = 'error', ended_at = ? WHERE status = 'active'");
    sessions.bind(1, now);
    sessions.run();
    const int changed = sqlite3_changes(db_);
    exec("COMMIT;");
    return changed;
  } catch (const StoreError &) {
    sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, nullptr);
    throw;
  }
}

int SqliteRecordingStore::track_count_for_speaker(const string & session_id, const string & speaker_id)
{
  lock_guard<mutex> lock(mutex_);
  Statement st(db_, "SELECT COUNT(*) FROM audio_tracks WHERE session_id = ? AND user_id = ?");
  st.bind(1, session_id);
  st.bind(2, speaker_id);
  return st.step() ? static_cast<int>(st.int64(0)) : 0;
}

int64_t SqliteRecordingStore::insert_track(
  const string & session_id, const string & speaker_id,
  const string & file_path, const string & started_at)
{
  lock_guard<mutex> lock(mutex_);
  Statement st(
    db_,
    "INSERT INTO audio_tracks (session_id, user_id, file_path, started_at) VALUES (?, ?, ?, ?)");
  st.bind(1, session_id);
  st.bind(2, speaker_id);
  st.bind(3, file_path);
  st.bind(4, started_at);
  st.run();
  return sqlite3_last_insert_rowid(db_);
}

void SqliteRecordingStore::set_first_packet_at(int64_t track_id, const string & at)
{
  lock_guard<mutex> lock(mutex_);
  Statement st(
    db_, "UPDATE audio_tracks SET first_packet_at = ? WHERE id = ? AND first_packet_at IS NULL");
  st.bind(1, at);
  st.bind(2, track_id);
  st.run();
}

void SqliteRecordingStore::end_track(int64_t track_id, const string & ended_at)
{
  lock_guard<mutex> lock(mutex_);
  Statement st(db_, "UPDATE audio_tracks SET ended_at = ? WHERE id = ? AND ended_at IS NULL");
  st.bind(1, ended_at);
  st.bind(2, track_id);
  st.run();
}

vector<TrackRow> SqliteRecordingStore::session_tracks(const string & session_id)
{
  lock_guard<mutex> lock(mutex_);
  Statement st(
    db_,
    "SELECT id, session_id, user_id, file_path, started_at, first_packet_at, ended_at "
    "FROM audio_tracks WHERE session_id = ? ORDER BY started_at, id");
  st.bind(1, session_id);
  vector<TrackRow> rows;
  while (st.step()) {
    TrackRow row;
    row.id = st.int64(0);
    row.session_id = st.text(1);
    row.speaker_id = st.text(2);
    row.file_path = st.text(3);
    row.started_at = st.text(4);
    row.first_packet_at = st.text(5);
    row.ended_at = st.text(6);
    rows.push_back(row);
  }
  return rows;
}

int64_t SqliteRecordingStore::insert_burst(int64_t track_id, const string & start, int64_t start_frame_offset)
{
  lock_guard<mutex> lock(mutex_);
  Statement st(
    db_,
    "INSERT INTO audio_speech_bursts (track_id, burst_start, start_frame_offset) VALUES (?, ?, ?)");
  st.bind(1, track_id);
  st.bind(2, start);
  st.bind(3, start_frame_offset);
  st.run();
  return sqlite3_last_insert_rowid(db_);
}

void SqliteRecordingStore::close_burst(int64_t burst_id, const string & end, int64_t end_frame_offset)
{
  lock_guard<mutex> lock(mutex_);
  Statement st(
    db_,
    "UPDATE audio_speech_bursts SET burst_end = ?, end_frame_offset = ? "
    "WHERE id = ? AND end_frame_offset IS NULL");
  st.bind(1, end);
  st.bind(2, end_frame_offset);
  st.bind(3, burst_id);
  st.run();
}

vector<BurstRow> SqliteRecordingStore::track_bursts(int64_t track_id)
{
  lock_guard<mutex> lock(mutex_);
  Statement st(
    db_,
    "SELECT id, track_id, burst_start, burst_end, start_frame_offset, end_frame_offset "
    "FROM audio_speech_bursts WHERE track_id = ? ORDER BY julianday(burst_start), id");
  st.bind(1, track_id);
  vector<BurstRow> rows;
  while (st.step()) {
    rows.push_back(read_burst(st));
  }
  return rows;
}

bool SqliteRecordingStore::find_burst_for_timestamp(int64_t track_id, const string & at, BurstRow & out)
{
  lock_guard<mutex> lock(mutex_);
  Statement st(
    db_,
    "SELECT id, track_id, burst_start, burst_end, start_frame_offset, end_frame_offset "
    "FROM audio_speech_bursts WHERE track_id = ? "
    "  AND julianday(burst_start) <= julianday(?, '+1 second') "
    "  AND (burst_end IS NULL OR julianday(burst_end) >= julianday(?, '-1 second')) "
    "ORDER BY julianday(burst_start) DESC LIMIT 1");
  st.bind(1, track_id);
  st.bind(2, at);
  st.bind(3, at);
  if (!st.step()) {
    return false;
  }
  out = read_burst(st);
  return true;
}

int64_t SqliteRecordingStore::upsert_transcript(const TranscriptRow & row)
{
  lock_guard<mutex> lock(mutex_);
  const string now = utc_now_text();
  const bool keyed = !row.result_id.empty();

  const char * insert_sql =
    "INSERT INTO transcript_segments "
    "(session_id, track_id, burst_id, user_id, speaker_label, segment_start, segment_end, "
    " transcript, confidence, is_final, stt_result_id, stream_sequence, stt_engine, stt_model, "
    " created_at, updated_at) "
    "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)";
  const char * upsert_sql =
    "INSERT INTO transcript_segments "
    "(session_id, track_id, burst_id, user_id, speaker_label, segment_start, segment_end, "
    " transcript, confidence, is_final, stt_result_id, stream_sequence, stt_engine, stt_model, "
    " created_at, updated_at) "
    "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?) "
    "ON CONFLICT(session_id, track_id, user_id, stream_sequence, stt_result_id) DO UPDATE SET "
    "  transcript = CASE WHEN excluded.is_final >= is_final THEN excluded.transcript ELSE transcript END, "
    "  confidence = CASE WHEN excluded.is_final >= is_final THEN excluded.confidence ELSE confidence END, "
    "  segment_end = CASE WHEN excluded.is_final >= is_final THEN excluded.segment_end ELSE segment_end END, "
    "  is_final = MAX(is_final, excluded.is_final), "
    "  burst_id = COALESCE(excluded.burst_id, burst_id), "
    "  speaker_label = COALESCE(excluded.speaker_label, speaker_label), "
    "  updated_at = excluded.updated_at";

  Statement st(db_, keyed ? upsert_sql : insert_sql);
  st.bind(1, row.session_id);
  st.bind(2, row.track_id);
  if (row.burst_id >= 0) {
    st.bind(3, row.burst_id);
  } else {
    st.bind_null(3);
  }
  st.bind(4, row.speaker_id);
  st.bind_text_or_null(5, row.speaker_label);
  st.bind(6, row.segment_start);
  st.bind_text_or_null(7, row.segment_end);
  st.bind(8, row.text);
  if (row.has_confidence) {
    st.bind(9, row.confidence);
  } else {
    st.bind_null(9);
  }
  st.bind(10, static_cast<int64_t>(row.is_final ? 1 : 0));
  st.bind_text_or_null(11, row.result_id);
  st.bind(12, static_cast<int64_t>(row.stream_sequence));
  st.bind(13, row.engine);
  st.bind_text_or_null(14, row.model);
  st.bind(15, now);
  st.bind(16, now);
  st.run();

  if (!keyed) {
    return sqlite3_last_insert_rowid(db_);
  }
  Statement id_st(
    db_,
    "SELECT id FROM transcript_segments WHERE session_id = ? AND track_id = ? AND user_id = ? "
    "AND stream_sequence = ? AND stt_result_id = ?");
  id_st.bind(1, row.session_id);
  id_st.bind(2, row.track_id);
  id_st.bind(3, row.speaker_id);
  id_st.bind(4, static_cast<int64_t>(row.stream_sequence));
  id_st.bind(5, row.result_id);
  return id_st.step() ? id_st.int64(0) : -1;
}

vector<TranscriptRow> SqliteRecordingStore::session_transcripts(const string & session_id)
{
  lock_guard<mutex> lock(mutex_);
  Statement st(
    db_,
    "SELECT id, session_id, track_id, burst_id, user_id, speaker_label, segment_start, "
    "segment_end, transcript, confidence, is_final, stt_result_id, stream_sequence, "
    "stt_engine, stt_model FROM transcript_segments WHERE session_id = ? "
    "ORDER BY julianday(segment_start), id");
  st.bind(1, session_id);
  vector<TranscriptRow> rows;
  while (st.step()) {
    TranscriptRow row;
    row.id = st.int64(0);
    row.session_id = st.text(1);
    row.track_id = st.int64(2);
    row.burst_id = st.is_null(3) ? -1 : st.int64(3);
    row.speaker_id = st.text(4);
    row.speaker_label = st.text(5);
    row.segment_start = st.text(6);
    row.segment_end = st.text(7);
    row.text = st.text(8);
    row.has_confidence = !st.is_null(9);
    row.confidence = row.has_confidence ? st.real(9) : 0.0;
    row.is_final = st.int64(10) != 0;
    row.result_id = st.text(11);
    row.stream_sequence = static_cast<int>(st.int64(12));
    row.engine = st.text(13);
    row.model = st.text(14);
    rows.push_back(row);
  }
  return rows;
}

void SqliteRecordingStore::insert_usage(const UsageRow & row)
{
  lock_guard<mutex> lock(mutex_);
  Statement st(
    db_,
    "INSERT INTO stt_usage (session_id, engine, audio_duration_ms, segment_count, "
    "estimated_cost_usd, created_at) VALUES (?, ?, ?, ?, ?, ?)");
  st.bind(1, row.session_id);
  st.bind(2, row.engine);
  st.bind(3, row.audio_duration_ms);
  st.bind(4, row.segment_count);
  st.bind(5, row.estimated_cost_usd);
  st.bind(6, utc_now_text());
  st.run();
}

}  // namespace voice_record_cpp
