#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "manual_scheduler.hpp"
#include "temp_dir.hpp"
#include "voice_record_cpp/burst_tracker.hpp"
#include "voice_record_cpp/sqlite_recording_store.hpp"
#include "voice_record_cpp/track_recorder.hpp"

using namespace std;
using namespace voice_record_cpp;


namespace
{

class BurstTrackerTest : public ::testing::Test
{
protected:
  void SetUp() override
  {
    store.create_session("s1", "2024-05-01T12:00:00.000Z");
    RecorderConfig rc;
    rc.data_dir = tmp.str();
    recorder = make_unique<TrackRecorder>("s1", store, scheduler, rc);
    BurstTrackerConfig bc;
    bc.max_burst_minutes = 1.0;
    tracker = make_unique<BurstTracker>(*recorder, store, scheduler, signals, bc);
  }

  void feed(const string & speaker, int frames)
  {
    const vector<uint8_t> frame{0xFC, 0x00, 0x00};
    for (int i = 0; i < frames; ++i) {
      recorder->on_frame(speaker, frame);
    }
  }

  int64_t track_of(const string & speaker)
  {
    TrackPosition pos;
    recorder->position(speaker, pos);
    return pos.track_id;
  }

  recorder_common::TempDir tmp;
  recorder_common::ManualScheduler scheduler;
  recorder_common::SpeakingSignals signals;
  SqliteRecordingStore store{":memory:"};
  unique_ptr<TrackRecorder> recorder;
  unique_ptr<BurstTracker> tracker;
};

}  // namespace

TEST_F(BurstTrackerTest, SpeakingSignalsOpenAndCloseBurst)
{
  recorder->subscribe("alice");
  feed("alice", 10);
  signals.speaking_start.emit("alice");
  EXPECT_TRUE(tracker->has_open_burst("alice"));
  feed("alice", 40);
  scheduler.advance(chrono::milliseconds(800));
  signals.speaking_end.emit("alice");
  EXPECT_FALSE(tracker->has_open_burst("alice"));

  const vector<BurstRow> bursts = store.track_bursts(track_of("alice"));
  ASSERT_EQ(bursts.size(), 1u);
  EXPECT_EQ(bursts[0].start_frame_offset, 10);
  EXPECT_EQ(bursts[0].end_frame_offset, 50);
  EXPECT_TRUE(bursts[0].closed);
  EXPECT_EQ(bursts[0].burst_start, "2024-05-01T12:00:00.000Z");
  EXPECT_EQ(bursts[0].burst_end, "2024-05-01T12:00:00.800Z");
}

TEST_F(BurstTrackerTest, DuplicateStartKeepsSingleBurst)
{
  recorder->subscribe("alice");
  signals.speaking_start.emit("alice");
  feed("alice", 5);
  signals.speaking_start.emit("alice");
  signals.speaking_end.emit("alice");
  signals.speaking_end.emit("alice");

  const vector<BurstRow> bursts = store.track_bursts(track_of("alice"));
  ASSERT_EQ(bursts.size(), 1u);
  EXPECT_EQ(bursts[0].start_frame_offset, 0);
  EXPECT_EQ(bursts[0].end_frame_offset, 5);
}

TEST_F(BurstTrackerTest, StartWithoutTrackIsIgnored)
{
  signals.speaking_start.emit("ghost");
  EXPECT_FALSE(tracker->has_open_burst("ghost"));
  EXPECT_EQ(tracker->open_burst_count(), 0u);
}

TEST_F(BurstTrackerTest, ConsecutiveBurstsDoNotOverlap)
{
  recorder->subscribe("alice");
  for (int i = 0; i < 5; ++i) {
    signals.speaking_start.emit("alice");
    feed("alice", 20);
    signals.speaking_end.emit("alice");
    feed("alice", 7);
  }

  const vector<BurstRow> bursts = store.track_bursts(track_of("alice"));
  ASSERT_EQ(bursts.size(), 5u);
  for (size_t i = 0; i < bursts.size(); ++i) {
    EXPECT_LE(bursts[i].start_frame_offset, bursts[i].end_frame_offset);
    if (i > 0) {
      EXPECT_GE(bursts[i].start_frame_offset, bursts[i - 1].end_frame_offset);
    }
  }
  EXPECT_EQ(bursts[4].start_frame_offset, 4 * 27);
  EXPECT_EQ(bursts[4].end_frame_offset, 4 * 27 + 20);
}

TEST_F(BurstTrackerTest, WatchdogSplitsLongBurstWithoutGap)
{
  recorder->subscribe("alice");
  signals.speaking_start.emit("alice");
  feed("alice", 3000);
  scheduler.advance(chrono::seconds(60));
  feed("alice", 500);
  scheduler.advance(chrono::seconds(10));
  signals.speaking_end.emit("alice");

  const vector<BurstRow> bursts = store.track_bursts(track_of("alice"));
  ASSERT_EQ(bursts.size(), 2u);
  EXPECT_EQ(bursts[0].start_frame_offset, 0);
  EXPECT_EQ(bursts[0].end_frame_offset, 3000);
  EXPECT_EQ(bursts[0].burst_end, "2024-05-01T12:01:00.000Z");
  EXPECT_EQ(bursts[1].start_frame_offset, 3000);
  EXPECT_EQ(bursts[1].end_frame_offset, 3500);
  EXPECT_EQ(bursts[1].burst_start, bursts[0].burst_end);
}

TEST_F(BurstTrackerTest, ClosedBurstCancelsWatchdog)
{
  recorder->subscribe("alice");
  signals.speaking_start.emit("alice");
  signals.speaking_end.emit("alice");
  EXPECT_EQ(scheduler.pending_timers(), 0u);
  scheduler.advance(chrono::minutes(5));
  EXPECT_EQ(store.track_bursts(track_of("alice")).size(), 1u);
}

TEST_F(BurstTrackerTest, CloseUserBurstOnLeave)
{
  recorder->subscribe("alice");
  recorder->subscribe("bob");
  signals.speaking_start.emit("alice");
  signals.speaking_start.emit("bob");
  feed("alice", 12);
  tracker->close_user_burst("alice");
  EXPECT_FALSE(tracker->has_open_burst("alice"));
  EXPECT_TRUE(tracker->has_open_burst("bob"));

  const vector<BurstRow> bursts = store.track_bursts(track_of("alice"));
  ASSERT_EQ(bursts.size(), 1u);
  EXPECT_EQ(bursts[0].end_frame_offset, 12);
}

TEST_F(BurstTrackerTest, BurstClosedAfterTrackEndsAtStartOffset)
{
  recorder->subscribe("alice");
  feed("alice", 8);
  signals.speaking_start.emit("alice");
  const int64_t track_id = track_of("alice");
  feed("alice", 8);
  recorder->close("alice");
  signals.speaking_end.emit("alice");

  const vector<BurstRow> bursts = store.track_bursts(track_id);
  ASSERT_EQ(bursts.size(), 1u);
  EXPECT_EQ(bursts[0].start_frame_offset, 8);
  EXPECT_EQ(bursts[0].end_frame_offset, 8);
}

TEST_F(BurstTrackerTest, DestroyClosesAndIgnoresLaterSignals)
{
  recorder->subscribe("alice");
  signals.speaking_start.emit("alice");
  tracker->destroy();
  EXPECT_EQ(tracker->open_burst_count(), 0u);
  EXPECT_EQ(signals.speaking_start.subscriber_count(), 0u);

  signals.speaking_start.emit("alice");
  EXPECT_FALSE(tracker->has_open_burst("alice"));
  const vector<BurstRow> bursts = store.track_bursts(track_of("alice"));
  ASSERT_EQ(bursts.size(), 1u);
  EXPECT_TRUE(bursts[0].closed);
}
