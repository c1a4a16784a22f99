#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <vector>

#include "fake_stt.hpp"
#include "manual_scheduler.hpp"
#include "stt_gate_cpp/vad_gate.hpp"

using namespace std;
using namespace stt_gate_cpp;


namespace
{

class VadGateTest : public ::testing::Test
{
protected:
  void SetUp() override
  {
    config.silence_timeout_sec = 5.0;
    config.connection_cooldown_sec = 2.0;
    config.stream_rotation_minutes = 4.0;
    config.stream_overlap_sec = 5.0;
    config.rotation_check_sec = 30.0;
    config.dedup_window_ms = 2000;
  }

  void make_gate()
  {
    gate = VadGate::create("alice", engine, source, scheduler, config);
    transcript_sub = gate->subscribe_transcripts(
      [this](const TranscriptEvent & event) {transcripts.push_back(event);});
    duration_sub = gate->subscribe_speech_duration(
      [this](int64_t ms) {durations.push_back(ms);});
  }

  void advance(chrono::milliseconds ms)
  {
    scheduler.advance(ms);
  }

  recorder_common::ManualScheduler scheduler;
  shared_ptr<FakeEngine> engine = make_shared<FakeEngine>();
  shared_ptr<FakePcmSource> source = make_shared<FakePcmSource>();
  SttConfig config;
  shared_ptr<VadGate> gate;
  vector<TranscriptEvent> transcripts;
  vector<int64_t> durations;
  recorder_common::Subscription transcript_sub;
  recorder_common::Subscription duration_sub;
};

}  // namespace

TEST_F(VadGateTest, NoStreamBeforeSpeech)
{
  make_gate();
  source->push(640);
  EXPECT_EQ(engine->stream_count(), 0u);
  EXPECT_FALSE(gate->has_open_stream());
  EXPECT_EQ(source->subscribers(), 1u);
}

TEST_F(VadGateTest, SpeechOpensStreamAndForwardsPcm)
{
  make_gate();
  gate->on_speaking_start();
  ASSERT_EQ(engine->stream_count(), 1u);
  EXPECT_TRUE(gate->has_open_stream());
  EXPECT_EQ(gate->stream_sequence(), 1);

  source->push(640);
  source->push(320);
  EXPECT_EQ(engine->stream(0)->bytes_written, 960u);
  EXPECT_EQ(engine->stream(0)->speaker, "alice");
}

TEST_F(VadGateTest, SilenceTimeoutClosesStream)
{
  make_gate();
  gate->on_speaking_start();
  advance(chrono::milliseconds(1200));
  gate->on_speaking_end();
  ASSERT_EQ(durations.size(), 1u);
  EXPECT_EQ(durations[0], 1200);

  advance(chrono::milliseconds(4999));
  EXPECT_TRUE(gate->has_open_stream());
  advance(chrono::milliseconds(1));
  EXPECT_FALSE(gate->has_open_stream());
  EXPECT_FALSE(engine->stream(0)->is_open());

  // 무음 뒤 PCM은 버려진다
  source->push(320);
  EXPECT_EQ(engine->stream(0)->bytes_written, 0u);
}

TEST_F(VadGateTest, SpeechWithinSilenceWindowReusesStream)
{
  make_gate();
  gate->on_speaking_start();
  gate->on_speaking_end();
  advance(chrono::seconds(3));
  gate->on_speaking_start();
  advance(chrono::seconds(10));
  EXPECT_EQ(engine->stream_count(), 1u);
  EXPECT_TRUE(gate->has_open_stream());
}

TEST_F(VadGateTest, CooldownDelaysReconnect)
{
  make_gate();
  gate->on_speaking_start();
  advance(chrono::seconds(1));
  gate->on_speaking_end();
  advance(chrono::seconds(5));
  ASSERT_FALSE(gate->has_open_stream());

  advance(chrono::seconds(1));
  gate->on_speaking_start();
  EXPECT_EQ(engine->stream_count(), 1u);
  EXPECT_FALSE(gate->has_open_stream());

  advance(chrono::seconds(1));
  EXPECT_EQ(engine->stream_count(), 2u);
  EXPECT_TRUE(gate->has_open_stream());
  EXPECT_EQ(gate->stream_sequence(), 2);
}

TEST_F(VadGateTest, SpeechAfterCooldownOpensImmediately)
{
  make_gate();
  gate->on_speaking_start();
  gate->on_speaking_end();
  advance(chrono::seconds(5));
  advance(chrono::seconds(3));
  gate->on_speaking_start();
  EXPECT_EQ(engine->stream_count(), 2u);
  EXPECT_TRUE(gate->has_open_stream());
}

TEST_F(VadGateTest, RotatesAfterCumulativeSpeechAtSpeakingEnd)
{
  config.silence_timeout_sec = 30.0;
  config.rotation_check_sec = 600.0;
  make_gate();
  gate->on_speaking_start();
  advance(chrono::minutes(2));
  gate->on_speaking_end();
  EXPECT_FALSE(gate->is_rotating());

  gate->on_speaking_start();
  advance(chrono::minutes(2));
  gate->on_speaking_end();

  ASSERT_EQ(engine->stream_count(), 2u);
  EXPECT_TRUE(gate->is_rotating());
  EXPECT_EQ(gate->stream_sequence(), 2);
  EXPECT_EQ(gate->cumulative_speech_ms(), 0);

  // overlap 동안에는 두 스트림 모두 PCM을 받는다
  source->push(100);
  EXPECT_EQ(engine->stream(0)->bytes_written, 100u);
  EXPECT_EQ(engine->stream(1)->bytes_written, 100u);

  advance(chrono::seconds(5));
  EXPECT_FALSE(gate->is_rotating());
  EXPECT_FALSE(engine->stream(0)->is_open());
  EXPECT_TRUE(engine->stream(1)->is_open());
}

TEST_F(VadGateTest, RotationCheckDuringContinuousSpeech)
{
  make_gate();
  gate->on_speaking_start();
  advance(chrono::minutes(3));
  EXPECT_EQ(engine->stream_count(), 1u);
  EXPECT_TRUE(durations.empty());

  advance(chrono::minutes(1));
  ASSERT_EQ(engine->stream_count(), 2u);
  EXPECT_TRUE(gate->is_rotating());
  ASSERT_EQ(durations.size(), 1u);
  EXPECT_EQ(durations[0], 240000);

  // 교체 후 구간만 다시 센다
  advance(chrono::seconds(10));
  gate->on_speaking_end();
  ASSERT_EQ(durations.size(), 2u);
  EXPECT_EQ(durations[1], 10000);
}

TEST_F(VadGateTest, SecondRotationDuringOverlapForceClosesOldestStream)
{
  config.silence_timeout_sec = 600.0;
  config.stream_overlap_sec = 300.0;
  make_gate();
  const auto open_streams = [this]() {
      size_t open = 0;
      for (size_t i = 0; i < engine->stream_count(); ++i) {
        open += engine->stream(i)->is_open() ? 1 : 0;
      }
      return open;
    };

  gate->on_speaking_start();
  advance(chrono::minutes(4));
  ASSERT_EQ(engine->stream_count(), 2u);
  EXPECT_EQ(open_streams(), 2u);

  // 첫 교체의 overlap(5분)이 끝나기 전에 다시 4분이 찬다
  advance(chrono::minutes(4));
  ASSERT_EQ(engine->stream_count(), 3u);
  EXPECT_EQ(gate->stream_sequence(), 3);
  EXPECT_FALSE(engine->stream(0)->is_open());
  EXPECT_EQ(engine->stream(0)->close_calls, 1);
  EXPECT_TRUE(engine->stream(1)->is_open());
  EXPECT_TRUE(engine->stream(2)->is_open());
  EXPECT_EQ(open_streams(), 2u);
  EXPECT_TRUE(gate->is_rotating());

  source->push(100);
  EXPECT_EQ(engine->stream(0)->bytes_written, 0u);
  EXPECT_EQ(engine->stream(1)->bytes_written, 100u);
  EXPECT_EQ(engine->stream(2)->bytes_written, 100u);

  // 두 번째 교체의 overlap이 끝나면 최신 스트림만 남는다
  gate->on_speaking_end();
  advance(chrono::seconds(300));
  EXPECT_FALSE(gate->is_rotating());
  EXPECT_FALSE(engine->stream(1)->is_open());
  EXPECT_TRUE(engine->stream(2)->is_open());
  EXPECT_EQ(open_streams(), 1u);
  EXPECT_EQ(engine->stream(0)->close_calls, 1);
}

TEST_F(VadGateTest, DropsOverlappingResultsFromRetiringStream)
{
  config.silence_timeout_sec = 30.0;
  make_gate();
  gate->on_speaking_start();
  advance(chrono::minutes(4));
  ASSERT_TRUE(gate->is_rotating());
  const auto old_stream = engine->stream(0);
  const auto new_stream = engine->stream(1);

  // 새 스트림 첫 결과 전에는 이전 스트림 결과를 그대로 통과
  old_stream->deliver("2024-05-01T12:03:58.000Z", "before");
  new_stream->deliver("2024-05-01T12:04:00.000Z", "new first");
  old_stream->deliver("2024-05-01T12:04:01.500Z", "duplicate");
  old_stream->deliver("2024-05-01T12:03:57.000Z", "older");
  new_stream->deliver("2024-05-01T12:04:01.000Z", "new second");

  ASSERT_EQ(transcripts.size(), 4u);
  EXPECT_EQ(transcripts[0].text, "before");
  EXPECT_EQ(transcripts[1].text, "new first");
  EXPECT_EQ(transcripts[2].text, "older");
  EXPECT_EQ(transcripts[3].text, "new second");
}

TEST_F(VadGateTest, UnexpectedCloseMidSpeechReopensAfterCooldown)
{
  make_gate();
  gate->on_speaking_start();
  engine->stream(0)->fail();
  EXPECT_FALSE(gate->has_open_stream());

  advance(chrono::milliseconds(1999));
  EXPECT_EQ(engine->stream_count(), 1u);
  advance(chrono::milliseconds(1));
  ASSERT_EQ(engine->stream_count(), 2u);
  EXPECT_TRUE(gate->has_open_stream());
}

TEST_F(VadGateTest, UnexpectedCloseAfterSpeechEndsWaitsForSpeech)
{
  make_gate();
  gate->on_speaking_start();
  gate->on_speaking_end();
  engine->stream(0)->fail();
  advance(chrono::seconds(10));
  EXPECT_EQ(engine->stream_count(), 1u);
  EXPECT_FALSE(gate->has_open_stream());
}

TEST_F(VadGateTest, DestroyReportsRemainingSpeechAndReleasesEverything)
{
  make_gate();
  gate->on_speaking_start();
  advance(chrono::seconds(3));
  gate->destroy();
  gate->destroy();

  ASSERT_EQ(durations.size(), 1u);
  EXPECT_EQ(durations[0], 3000);
  EXPECT_TRUE(gate->destroyed());
  EXPECT_FALSE(engine->stream(0)->is_open());
  EXPECT_EQ(source->subscribers(), 0u);
  EXPECT_EQ(scheduler.pending_timers(), 0u);

  gate->on_speaking_start();
  EXPECT_EQ(engine->stream_count(), 1u);
}

TEST_F(VadGateTest, FinalResultAfterDestroyIsStillForwarded)
{
  make_gate();
  gate->on_speaking_start();
  advance(chrono::seconds(3));
  gate->destroy();
  ASSERT_FALSE(engine->stream(0)->is_open());

  // 닫힌 스트림이 마지막 chunk 결과를 늦게 돌려준다
  engine->stream(0)->deliver("2024-05-01T12:00:02.000Z", "last words");
  ASSERT_EQ(transcripts.size(), 1u);
  EXPECT_EQ(transcripts[0].text, "last words");
}
