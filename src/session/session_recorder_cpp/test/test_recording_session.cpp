#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "fake_stt.hpp"
#include "manual_scheduler.hpp"
#include "session_recorder_cpp/recording_session.hpp"
#include "temp_dir.hpp"
#include "voice_record_cpp/ogg_demuxer.hpp"
#include "voice_record_cpp/sqlite_recording_store.hpp"

using namespace std;
using namespace session_recorder_cpp;


namespace
{

class RecordingSessionTest : public ::testing::Test
{
protected:
  RecordingSessionTest()
  : registry(scheduler, registry_config()),
    engines([this](const stt_gate_cpp::SttConfig &) -> shared_ptr<stt_gate_cpp::SttEngine> {
        return engine;
      })
  {
    config.recorder.data_dir = tmp.str();
    config.stt.engine = "fake";
    config.stt.model = "fake-model";
  }

  static stt_gate_cpp::ProcessRegistryConfig registry_config()
  {
    stt_gate_cpp::ProcessRegistryConfig rc;
    rc.resampler.command = "cat > /dev/null";
    return rc;
  }

  unique_ptr<RecordingSession> make_session(const string & id)
  {
    stt_gate_cpp::EngineLease lease;
    if (config.stt.enabled) {
      lease = engines.acquire(config.stt);
    }
    return make_unique<RecordingSession>(
      id, store, scheduler, signals, registry, move(lease), config);
  }

  void feed(RecordingSession & session, const string & speaker, int frames)
  {
    const vector<uint8_t> frame{0xFC, 0x10, 0x20};
    for (int i = 0; i < frames; ++i) {
      session.on_frame(speaker, frame.data(), frame.size());
    }
  }

  recorder_common::TempDir tmp;
  recorder_common::ManualScheduler scheduler;
  recorder_common::SpeakingSignals signals;
  voice_record_cpp::SqliteRecordingStore store{":memory:"};
  shared_ptr<stt_gate_cpp::FakeEngine> engine = make_shared<stt_gate_cpp::FakeEngine>();
  stt_gate_cpp::ProcessRegistry registry;
  stt_gate_cpp::EngineRegistry engines;
  SessionConfig config;
};

}  // namespace

TEST_F(RecordingSessionTest, JoinSpeakLeaveStop)
{
  auto session = make_session("meeting");
  ASSERT_TRUE(session->stt_enabled());
  EXPECT_EQ(engines.ref_count("fake", "fake-model"), 1);

  vector<pair<string, int64_t>> published;
  recorder_common::Subscription sub = session->subscribe_transcripts(
    [&published](const stt_gate_cpp::TranscriptEvent & event, int64_t row_id) {
      published.emplace_back(event.text, row_id);
    });

  ASSERT_TRUE(session->join("alice"));
  EXPECT_TRUE(registry.get({"meeting", "alice"}));
  ASSERT_NE(session->processor(), nullptr);
  EXPECT_TRUE(session->processor()->has_gate("alice"));
  EXPECT_TRUE(session->writer().has_track("alice"));

  feed(*session, "alice", 50);
  signals.speaking_start.emit("alice");
  EXPECT_TRUE(session->bursts().has_open_burst("alice"));
  ASSERT_EQ(engine->stream_count(), 1u);

  feed(*session, "alice", 100);
  engine->stream(0)->deliver("2024-05-01T12:00:01.000Z", "good morning");
  ASSERT_EQ(published.size(), 1u);
  EXPECT_EQ(published[0].first, "good morning");
  EXPECT_GE(published[0].second, 0);

  scheduler.advance(chrono::seconds(2));
  signals.speaking_end.emit("alice");
  EXPECT_EQ(session->usage().total_speech_ms(), 2000);

  session->leave("alice");
  EXPECT_FALSE(session->recorder().is_open("alice"));
  EXPECT_FALSE(session->processor()->has_gate("alice"));
  EXPECT_FALSE(registry.get({"meeting", "alice"}));

  session->stop();
  EXPECT_TRUE(session->stopped());
  EXPECT_EQ(engines.ref_count("fake", "fake-model"), 0);

  voice_record_cpp::SessionRow row;
  ASSERT_TRUE(store.get_session("meeting", row));
  EXPECT_EQ(row.status, "stopped");

  const auto tracks = store.session_tracks("meeting");
  ASSERT_EQ(tracks.size(), 1u);
  EXPECT_FALSE(tracks[0].ended_at.empty());
  EXPECT_EQ(tracks[0].first_packet_at, "2024-05-01T12:00:00.000Z");

  const auto bursts = store.track_bursts(tracks[0].id);
  ASSERT_EQ(bursts.size(), 1u);
  EXPECT_EQ(bursts[0].start_frame_offset, 50);
  EXPECT_EQ(bursts[0].end_frame_offset, 150);

  const auto transcripts = store.session_transcripts("meeting");
  ASSERT_EQ(transcripts.size(), 1u);
  EXPECT_EQ(transcripts[0].burst_id, bursts[0].id);
  EXPECT_EQ(transcripts[0].track_id, tracks[0].id);

  const auto contents = voice_record_cpp::read_ogg_opus_file(tracks[0].file_path);
  ASSERT_TRUE(contents.ok) << contents.error;
  EXPECT_TRUE(contents.has_eos);
  EXPECT_EQ(contents.packets.size(), 150u);
}

TEST_F(RecordingSessionTest, StopStoresFinalTranscriptArrivingDuringDrain)
{
  auto session = make_session("drain");
  vector<string> published;
  recorder_common::Subscription sub = session->subscribe_transcripts(
    [&published](const stt_gate_cpp::TranscriptEvent & event, int64_t) {
      published.push_back(event.text);
    });

  ASSERT_TRUE(session->join("alice"));
  feed(*session, "alice", 10);
  signals.speaking_start.emit("alice");
  ASSERT_EQ(engine->stream_count(), 1u);
  const auto stream = engine->stream(0);
  engine->on_drain = [stream]() {stream->deliver("2024-05-01T12:00:00.500Z", "goodbye");};

  session->stop();
  EXPECT_EQ(engine->drain_calls, 1);
  ASSERT_EQ(published.size(), 1u);
  EXPECT_EQ(published[0], "goodbye");
  const auto transcripts = store.session_transcripts("drain");
  ASSERT_EQ(transcripts.size(), 1u);
  EXPECT_EQ(transcripts[0].text, "goodbye");
}

TEST_F(RecordingSessionTest, StopClosesEverythingStillOpen)
{
  auto session = make_session("meeting");
  ASSERT_TRUE(session->join("alice"));
  ASSERT_TRUE(session->join("bob"));
  signals.speaking_start.emit("alice");
  feed(*session, "alice", 10);
  scheduler.advance(chrono::seconds(1));

  session->stop();
  session->stop();
  EXPECT_EQ(registry.size(), 0u);
  EXPECT_EQ(session->recorder().open_track_count(), 0u);
  EXPECT_EQ(session->bursts().open_burst_count(), 0u);
  EXPECT_EQ(session->usage().total_speech_ms(), 1000);
  EXPECT_FALSE(session->join("carol"));

  for (const auto & track : store.session_tracks("meeting")) {
    EXPECT_FALSE(track.ended_at.empty());
    for (const auto & burst : store.track_bursts(track.id)) {
      EXPECT_TRUE(burst.closed);
    }
  }
}

TEST_F(RecordingSessionTest, RejoinCreatesNextTrack)
{
  auto session = make_session("meeting");
  ASSERT_TRUE(session->join("alice"));
  feed(*session, "alice", 5);
  session->leave("alice");
  ASSERT_TRUE(session->join("alice"));
  feed(*session, "alice", 5);
  session->stop();

  const auto tracks = store.session_tracks("meeting");
  ASSERT_EQ(tracks.size(), 2u);
  EXPECT_NE(tracks[0].file_path, tracks[1].file_path);
}

TEST_F(RecordingSessionTest, RecordsWithoutSpeechToText)
{
  config.stt.enabled = false;
  auto session = make_session("quiet");
  EXPECT_FALSE(session->stt_enabled());
  EXPECT_EQ(session->processor(), nullptr);

  ASSERT_TRUE(session->join("alice"));
  EXPECT_EQ(registry.size(), 0u);
  signals.speaking_start.emit("alice");
  feed(*session, "alice", 20);
  signals.speaking_end.emit("alice");
  session->stop();

  EXPECT_EQ(engine->stream_count(), 0u);
  const auto tracks = store.session_tracks("quiet");
  ASSERT_EQ(tracks.size(), 1u);
  ASSERT_EQ(store.track_bursts(tracks[0].id).size(), 1u);
}

TEST_F(RecordingSessionTest, DuplicateSessionIdFails)
{
  auto first = make_session("meeting");
  EXPECT_THROW(make_session("meeting"), voice_record_cpp::StoreError);
}
