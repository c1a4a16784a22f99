#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "voice_record_cpp/sqlite_recording_store.hpp"

using namespace std;
using namespace voice_record_cpp;


namespace
{

class SqliteRecordingStoreTest : public ::testing::Test
{
protected:
  void SetUp() override
  {
    store.create_session("s1", "2024-05-01T12:00:00.000Z");
    track_id = store.insert_track("s1", "alice", "/tmp/alice_0.ogg", "2024-05-01T12:00:00.000Z");
  }

  TranscriptRow transcript(const string & result_id, const string & text, bool is_final)
  {
    TranscriptRow row;
    row.session_id = "s1";
    row.track_id = track_id;
    row.speaker_id = "alice";
    row.segment_start = "2024-05-01T12:00:05.000Z";
    row.segment_end = "2024-05-01T12:00:07.000Z";
    row.text = text;
    row.is_final = is_final;
    row.result_id = result_id;
    row.stream_sequence = 1;
    row.engine = "groq";
    row.model = "whisper-large-v3-turbo";
    return row;
  }

  SqliteRecordingStore store{":memory:"};
  int64_t track_id = -1;
};

}  // namespace

TEST_F(SqliteRecordingStoreTest, SessionLifecycle)
{
  SessionRow row;
  ASSERT_TRUE(store.get_session("s1", row));
  EXPECT_EQ(row.status, "active");
  EXPECT_TRUE(row.ended_at.empty());

  store.end_session("s1", "2024-05-01T13:00:00.000Z", "stopped");
  ASSERT_TRUE(store.get_session("s1", row));
  EXPECT_EQ(row.status, "stopped");
  EXPECT_EQ(row.ended_at, "2024-05-01T13:00:00.000Z");

  EXPECT_FALSE(store.get_session("missing", row));
}

TEST_F(SqliteRecordingStoreTest, DuplicateSessionThrows)
{
  EXPECT_THROW(store.create_session("s1", "2024-05-01T12:00:00.000Z"), StoreError);
}

TEST_F(SqliteRecordingStoreTest, TrackRowsAndSequence)
{
  EXPECT_EQ(store.track_count_for_speaker("s1", "alice"), 1);
  EXPECT_EQ(store.track_count_for_speaker("s1", "bob"), 0);

  store.set_first_packet_at(track_id, "2024-05-01T12:00:01.000Z");
  // 두 번째 기록은 첫 값을 바꾸지 않는다
  store.set_first_packet_at(track_id, "2024-05-01T12:00:09.000Z");
  store.end_track(track_id, "2024-05-01T12:10:00.000Z");

  const vector<TrackRow> tracks = store.session_tracks("s1");
  ASSERT_EQ(tracks.size(), 1u);
  EXPECT_EQ(tracks[0].speaker_id, "alice");
  EXPECT_EQ(tracks[0].first_packet_at, "2024-05-01T12:00:01.000Z");
  EXPECT_EQ(tracks[0].ended_at, "2024-05-01T12:10:00.000Z");
}

TEST_F(SqliteRecordingStoreTest, TrackForUnknownSessionViolatesForeignKey)
{
  EXPECT_THROW(
    store.insert_track("nope", "alice", "/tmp/x.ogg", "2024-05-01T12:00:00.000Z"), StoreError);
}

TEST_F(SqliteRecordingStoreTest, BurstOpenCloseAndLookup)
{
  const int64_t b1 = store.insert_burst(track_id, "2024-05-01T12:00:05.000Z", 0);
  store.close_burst(b1, "2024-05-01T12:00:07.000Z", 100);
  const int64_t b2 = store.insert_burst(track_id, "2024-05-01T12:00:10.000Z", 100);

  const vector<BurstRow> bursts = store.track_bursts(track_id);
  ASSERT_EQ(bursts.size(), 2u);
  EXPECT_TRUE(bursts[0].closed);
  EXPECT_EQ(bursts[0].end_frame_offset, 100);
  EXPECT_FALSE(bursts[1].closed);
  EXPECT_TRUE(bursts[1].burst_end.empty());

  BurstRow found;
  ASSERT_TRUE(store.find_burst_for_timestamp(track_id, "2024-05-01T12:00:06.000Z", found));
  EXPECT_EQ(found.id, b1);
  // ±1초 허용
  ASSERT_TRUE(store.find_burst_for_timestamp(track_id, "2024-05-01T12:00:07.800Z", found));
  EXPECT_EQ(found.id, b1);
  // open burst는 끝이 없으므로 이후 시각 모두 매칭
  ASSERT_TRUE(store.find_burst_for_timestamp(track_id, "2024-05-01T12:05:00.000Z", found));
  EXPECT_EQ(found.id, b2);
  EXPECT_FALSE(store.find_burst_for_timestamp(track_id, "2024-05-01T11:59:00.000Z", found));
}

TEST_F(SqliteRecordingStoreTest, CloseBurstOnlyOnce)
{
  const int64_t b1 = store.insert_burst(track_id, "2024-05-01T12:00:05.000Z", 10);
  store.close_burst(b1, "2024-05-01T12:00:07.000Z", 50);
  store.close_burst(b1, "2024-05-01T12:00:09.000Z", 90);
  const vector<BurstRow> bursts = store.track_bursts(track_id);
  ASSERT_EQ(bursts.size(), 1u);
  EXPECT_EQ(bursts[0].end_frame_offset, 50);
  EXPECT_EQ(bursts[0].burst_end, "2024-05-01T12:00:07.000Z");
}

TEST_F(SqliteRecordingStoreTest, UpsertNeverDowngradesFinalTranscript)
{
  const int64_t id1 = store.upsert_transcript(transcript("r1", "hel", false));
  const int64_t id2 = store.upsert_transcript(transcript("r1", "hello world", true));
  const int64_t id3 = store.upsert_transcript(transcript("r1", "hello wor", false));
  EXPECT_EQ(id1, id2);
  EXPECT_EQ(id2, id3);

  const vector<TranscriptRow> rows = store.session_transcripts("s1");
  ASSERT_EQ(rows.size(), 1u);
  EXPECT_EQ(rows[0].text, "hello world");
  EXPECT_TRUE(rows[0].is_final);
  EXPECT_EQ(rows[0].burst_id, -1);
}

TEST_F(SqliteRecordingStoreTest, UpsertKeyIncludesStreamSequence)
{
  TranscriptRow a = transcript("chunk_0", "first stream", true);
  TranscriptRow b = transcript("chunk_0", "second stream", true);
  b.stream_sequence = 2;
  store.upsert_transcript(a);
  store.upsert_transcript(b);
  EXPECT_EQ(store.session_transcripts("s1").size(), 2u);
}

TEST_F(SqliteRecordingStoreTest, TranscriptsWithoutResultIdAreAppended)
{
  store.upsert_transcript(transcript("", "one", true));
  store.upsert_transcript(transcript("", "one", true));
  EXPECT_EQ(store.session_transcripts("s1").size(), 2u);
}

TEST_F(SqliteRecordingStoreTest, ReconcileClosesStaleSession)
{
  store.insert_burst(track_id, "2024-05-01T12:00:05.000Z", 0);
  store.create_session("s2", "2024-05-01T12:30:00.000Z");
  store.end_session("s2", "2024-05-01T12:40:00.000Z", "stopped");

  EXPECT_EQ(store.reconcile_stale_sessions("2024-05-02T00:00:00.000Z"), 1);

  SessionRow row;
  ASSERT_TRUE(store.get_session("s1", row));
  EXPECT_EQ(row.status, "error");
  EXPECT_EQ(row.ended_at, "2024-05-02T00:00:00.000Z");
  ASSERT_TRUE(store.get_session("s2", row));
  EXPECT_EQ(row.status, "stopped");

  const vector<TrackRow> tracks = store.session_tracks("s1");
  ASSERT_EQ(tracks.size(), 1u);
  EXPECT_EQ(tracks[0].ended_at, "2024-05-02T00:00:00.000Z");

  // burst 끝 시각만 채우고 offset은 비워 hydrate가 트랙 끝까지 쓰게 한다
  const vector<BurstRow> bursts = store.track_bursts(track_id);
  ASSERT_EQ(bursts.size(), 1u);
  EXPECT_EQ(bursts[0].burst_end, "2024-05-02T00:00:00.000Z");
  EXPECT_FALSE(bursts[0].closed);

  EXPECT_EQ(store.reconcile_stale_sessions("2024-05-03T00:00:00.000Z"), 0);
}

TEST_F(SqliteRecordingStoreTest, UsageRow)
{
  UsageRow usage;
  usage.session_id = "s1";
  usage.engine = "groq";
  usage.audio_duration_ms = 60000;
  usage.segment_count = 3;
  usage.estimated_cost_usd = 0.0288;
  EXPECT_NO_THROW(store.insert_usage(usage));

  usage.session_id = "unknown";
  EXPECT_THROW(store.insert_usage(usage), StoreError);
}
