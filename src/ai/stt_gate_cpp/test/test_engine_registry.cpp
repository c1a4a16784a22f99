#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <utility>

#include "fake_stt.hpp"
#include "stt_gate_cpp/engine_registry.hpp"
#include "stt_gate_cpp/http_stt_engine.hpp"

using namespace std;
using namespace stt_gate_cpp;


namespace
{

class EngineRegistryTest : public ::testing::Test
{
protected:
  EngineRegistry registry{[this](const SttConfig &) -> shared_ptr<SttEngine> {
      ++created;
      auto engine = make_shared<FakeEngine>();
      last = engine;
      return engine;
    }};
  int created = 0;
  weak_ptr<FakeEngine> last;
};

SttConfig config_for(const string & engine, const string & model)
{
  SttConfig config;
  config.engine = engine;
  config.model = model;
  return config;
}

}  // namespace

TEST_F(EngineRegistryTest, SharesEnginePerEngineAndModel)
{
  EngineLease a = registry.acquire(config_for("groq", "m1"));
  EngineLease b = registry.acquire(config_for("groq", "m1"));
  EngineLease c = registry.acquire(config_for("groq", "m2"));

  EXPECT_EQ(created, 2);
  EXPECT_EQ(a.engine(), b.engine());
  EXPECT_NE(a.engine(), c.engine());
  EXPECT_EQ(registry.engine_count(), 2u);
  EXPECT_EQ(registry.ref_count("groq", "m1"), 2);
  EXPECT_EQ(registry.ref_count("groq", "m2"), 1);
}

TEST_F(EngineRegistryTest, LastReleaseDestroysEngine)
{
  EngineLease a = registry.acquire(config_for("groq", "m1"));
  EngineLease b = registry.acquire(config_for("groq", "m1"));
  a.release();
  EXPECT_FALSE(a);
  EXPECT_EQ(registry.ref_count("groq", "m1"), 1);
  EXPECT_FALSE(last.expired());

  a.release();
  EXPECT_EQ(registry.ref_count("groq", "m1"), 1);

  b.release();
  EXPECT_EQ(registry.ref_count("groq", "m1"), 0);
  EXPECT_EQ(registry.engine_count(), 0u);
  EXPECT_TRUE(last.expired());

  EngineLease again = registry.acquire(config_for("groq", "m1"));
  EXPECT_EQ(created, 2);
}

TEST_F(EngineRegistryTest, MovedLeaseReleasesOnce)
{
  EngineLease a = registry.acquire(config_for("groq", "m1"));
  {
    EngineLease moved = move(a);
    EXPECT_TRUE(moved);
    EXPECT_FALSE(a);
    EXPECT_EQ(registry.ref_count("groq", "m1"), 1);
  }
  EXPECT_EQ(registry.ref_count("groq", "m1"), 0);
}

TEST_F(EngineRegistryTest, LeaseOutlivingRegistryIsHarmless)
{
  EngineLease lease;
  {
    EngineRegistry local([](const SttConfig &) {return make_shared<FakeEngine>();});
    lease = local.acquire(config_for("groq", "m1"));
  }
  EXPECT_TRUE(lease);
  lease.release();
  EXPECT_FALSE(lease);
}

TEST(HttpSttEngineTest, DefaultEndpoints)
{
  EXPECT_EQ(HttpSttEngine::default_endpoint("whisper_server"), "http://127.0.0.1:8080/inference");
  EXPECT_NE(HttpSttEngine::default_endpoint("groq").find("groq"), string::npos);
}

TEST(HttpSttEngineTest, BuildWavHeader)
{
  const vector<uint8_t> pcm(3200, 0x01);
  const string wav = HttpSttEngine::build_wav(pcm, kSttSampleRate);
  ASSERT_EQ(wav.size(), 44u + pcm.size());
  EXPECT_EQ(wav.substr(0, 4), "RIFF");
  EXPECT_EQ(wav.substr(8, 4), "WAVE");
  EXPECT_EQ(wav.substr(36, 4), "data");

  auto u32 = [&wav](size_t offset) {
      return static_cast<uint32_t>(static_cast<uint8_t>(wav[offset])) |
             (static_cast<uint32_t>(static_cast<uint8_t>(wav[offset + 1])) << 8) |
             (static_cast<uint32_t>(static_cast<uint8_t>(wav[offset + 2])) << 16) |
             (static_cast<uint32_t>(static_cast<uint8_t>(wav[offset + 3])) << 24);
    };
  EXPECT_EQ(u32(4), 36u + pcm.size());
  EXPECT_EQ(u32(24), kSttSampleRate);
  EXPECT_EQ(u32(28), kSttBytesPerSecond);
  EXPECT_EQ(u32(40), pcm.size());
}

TEST(HttpSttEngineTest, ShortStreamProducesNoRequest)
{
  SttConfig config;
  config.engine = "whisper_server";
  config.endpoint = "http://127.0.0.1:9/inference";
  config.worker_threads = 1;
  HttpSttEngine engine(config);
  EXPECT_EQ(engine.endpoint(), "http://127.0.0.1:9/inference");

  int transcripts = 0;
  int closes = 0;
  SttStreamPtr stream = engine.open_stream(
    "alice", 1,
    [&transcripts](const TranscriptEvent &) {++transcripts;},
    [&closes]() {++closes;});
  ASSERT_TRUE(stream->is_open());
  // min_chunk_seconds(0.5 s) 미만은 버려진다
  const vector<uint8_t> pcm(kSttBytesPerSecond / 10, 0);
  stream->write(pcm.data(), pcm.size());
  stream->close();
  EXPECT_FALSE(stream->is_open());
  EXPECT_EQ(transcripts, 0);
  EXPECT_EQ(closes, 0);
}

TEST(HttpSttEngineTest, DrainWaitsForFailedChunksAndClosesStream)
{
  SttConfig config;
  config.engine = "whisper_server";
  // discard 포트: 연결이 거부되어 요청이 바로 실패한다
  config.endpoint = "http://127.0.0.1:9/inference";
  config.chunk_seconds = 0.5;
  config.worker_threads = 1;
  HttpSttEngine engine(config);

  atomic<int> closes{0};
  SttStreamPtr stream = engine.open_stream(
    "alice", 1, [](const TranscriptEvent &) {}, [&closes]() {++closes;});
  const vector<uint8_t> pcm(kSttBytesPerSecond, 0);
  stream->write(pcm.data(), pcm.size());

  EXPECT_TRUE(engine.drain(chrono::seconds(10)));
  EXPECT_EQ(closes.load(), 1);
  EXPECT_FALSE(stream->is_open());
  EXPECT_TRUE(engine.drain(chrono::milliseconds(0)));
}
