#include "session_recorder_cpp/session_recorder_node.hpp"

#include <recorder_common/json_utils.hpp>
#include <recorder_common/time_utils.hpp>

#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <functional>
#include <random>
#include <sstream>

using namespace std;


namespace session_recorder_cpp
{

SessionRecorderNode::SessionRecorderNode()
: Node("session_recorder_node")
{
  declare_and_get_parameters();

  store_ = make_unique<voice_record_cpp::SqliteRecordingStore>(db_path_);
  scheduler_ = make_unique<recorder_common::RclcppScheduler>(*this);

  // 이전 프로세스가 비정상 종료하며 남긴 active 세션 정리
  const int recovered = store_->reconcile_stale_sessions(
    recorder_common::to_iso8601(scheduler_->wall_now()));
  if (recovered > 0) {
    RCLCPP_WARN(get_logger(), "marked %d stale session(s) as error", recovered);
  }

  registry_ = make_unique<stt_gate_cpp::ProcessRegistry>(*scheduler_, registry_config_);

  stt_gate_cpp::EngineLease lease;
  if (session_config_.stt.enabled) {
    lease = engines_.acquire(session_config_.stt);
  }
  session_ = make_unique<RecordingSession>(
    session_id_, *store_, *scheduler_, signals_, *registry_, move(lease), session_config_);
  transcript_sub_ = session_->subscribe_transcripts(
    [this](const stt_gate_cpp::TranscriptEvent & event, int64_t row_id) {
      publish_transcript(event, row_id);
    });

  const string topic_joined = get_parameter("topic_speaker_joined").as_string();
  const string topic_left = get_parameter("topic_speaker_left").as_string();
  const string topic_start = get_parameter("topic_speaking_start").as_string();
  const string topic_end = get_parameter("topic_speaking_end").as_string();
  const string topic_transcript = get_parameter("topic_transcript").as_string();

  pub_transcript_ = create_publisher<std_msgs::msg::String>(topic_transcript, 10);
  sub_joined_ = create_subscription<std_msgs::msg::String>(
    topic_joined, 10, bind(&SessionRecorderNode::on_speaker_joined, this, placeholders::_1));
  sub_left_ = create_subscription<std_msgs::msg::String>(
    topic_left, 10, bind(&SessionRecorderNode::on_speaker_left, this, placeholders::_1));
  sub_speaking_start_ = create_subscription<std_msgs::msg::String>(
    topic_start, 10, bind(&SessionRecorderNode::on_speaking_start, this, placeholders::_1));
  sub_speaking_end_ = create_subscription<std_msgs::msg::String>(
    topic_end, 10, bind(&SessionRecorderNode::on_speaking_end, this, placeholders::_1));

  RCLCPP_INFO(get_logger(), "session_recorder node started (session %s)", session_id_.c_str());
}

SessionRecorderNode::~SessionRecorderNode()
{
  frame_subs_.clear();
  transcript_sub_.reset();
  if (session_) {
    try {
      session_->stop();
    } catch (const voice_record_cpp::StoreError & e) {
      RCLCPP_ERROR(get_logger(), "failed to stop session %s: %s", session_id_.c_str(), e.what());
    }
  }
  session_.reset();
  if (registry_) {
    registry_->kill_all();
  }
}

void SessionRecorderNode::declare_and_get_parameters()
{
  declare_parameter<string>("data_dir", "data/recordings");
  declare_parameter<string>("db_path", "data/recorder.db");
  // 비어 있으면 시작 시각으로 만든다
  declare_parameter<string>("session_id", "");
  declare_parameter<double>("max_burst_minutes", 10.0);
  declare_parameter<int>("expected_frame_ms", 20);

  declare_parameter<string>("resampler_command", stt_gate_cpp::ResamplerConfig().command);
  declare_parameter<double>("resampler_idle_timeout_sec", 3600.0);

  // "groq" = cloud Whisper, "whisper_server" = 로컬 서버
  declare_parameter<bool>("stt_enabled", true);
  declare_parameter<string>("stt_engine", "groq");
  declare_parameter<string>("stt_endpoint", "");
  declare_parameter<string>("stt_api_key", "");
  declare_parameter<string>("stt_model", "whisper-large-v3-turbo");
  declare_parameter<string>("stt_language", "en");
  declare_parameter<int>("stt_timeout_sec", 30);
  declare_parameter<double>("stt_chunk_seconds", 5.0);
  declare_parameter<int>("stt_worker_threads", 2);
  declare_parameter<double>("stt_drain_timeout_sec", 10.0);

  declare_parameter<double>("silence_timeout_sec", 5.0);
  declare_parameter<double>("connection_cooldown_sec", 2.0);
  declare_parameter<double>("stream_rotation_minutes", 4.0);
  declare_parameter<double>("stream_overlap_sec", 5.0);
  declare_parameter<int>("max_concurrent_streams", 8);
  declare_parameter<double>("cost_per_minute_usd", 0.024);
  declare_parameter<double>("cost_warning_usd", 5.0);

  declare_parameter<string>("topic_speaker_joined", "voice/speaker_joined");
  declare_parameter<string>("topic_speaker_left", "voice/speaker_left");
  declare_parameter<string>("topic_speaking_start", "voice/speaking_start");
  declare_parameter<string>("topic_speaking_end", "voice/speaking_end");
  declare_parameter<string>("topic_frame_prefix", "voice/speaker_");
  declare_parameter<string>("topic_transcript", "session/transcript");

  db_path_ = get_parameter("db_path").as_string();
  session_id_ = get_parameter("session_id").as_string();
  if (session_id_.empty()) {
    session_id_ = make_session_id();
  }
  frame_topic_prefix_ = get_parameter("topic_frame_prefix").as_string();

  auto & rec = session_config_.recorder;
  rec.data_dir = get_parameter("data_dir").as_string();
  rec.expected_frame_ms = static_cast<int>(get_parameter("expected_frame_ms").as_int());
  session_config_.bursts.max_burst_minutes = get_parameter("max_burst_minutes").as_double();

  registry_config_.resampler.command = get_parameter("resampler_command").as_string();
  registry_config_.resampler.idle_timeout_sec =
    get_parameter("resampler_idle_timeout_sec").as_double();

  auto & stt = session_config_.stt;
  stt.enabled = get_parameter("stt_enabled").as_bool();
  stt.engine = get_parameter("stt_engine").as_string();
  stt.endpoint = get_parameter("stt_endpoint").as_string();
  stt.api_key = get_parameter("stt_api_key").as_string();
  stt.model = get_parameter("stt_model").as_string();
  stt.language = get_parameter("stt_language").as_string();
  stt.timeout_sec = get_parameter("stt_timeout_sec").as_int();
  stt.chunk_seconds = get_parameter("stt_chunk_seconds").as_double();
  stt.worker_threads = static_cast<int>(get_parameter("stt_worker_threads").as_int());
  stt.drain_timeout_sec = get_parameter("stt_drain_timeout_sec").as_double();
  stt.silence_timeout_sec = get_parameter("silence_timeout_sec").as_double();
  stt.connection_cooldown_sec = get_parameter("connection_cooldown_sec").as_double();
  stt.stream_rotation_minutes = get_parameter("stream_rotation_minutes").as_double();
  stt.stream_overlap_sec = get_parameter("stream_overlap_sec").as_double();
  stt.max_concurrent_streams = static_cast<int>(get_parameter("max_concurrent_streams").as_int());
  stt.cost_per_minute_usd = get_parameter("cost_per_minute_usd").as_double();
  stt.cost_warning_usd = get_parameter("cost_warning_usd").as_double();

  if (stt.api_key.empty() && stt.engine == "groq") {
    const char * env_key = getenv("GROQ_API_KEY");
    if (env_key) {
      stt.api_key = env_key;
    }
  }
  if (stt.enabled && stt.engine != "groq" && stt.engine != "whisper_server") {
    RCLCPP_WARN(
      get_logger(), "unknown stt_engine '%s', transcription disabled", stt.engine.c_str());
    stt.enabled = false;
  }
  if (stt.enabled && stt.engine == "groq" && stt.api_key.empty()) {
    RCLCPP_WARN(get_logger(), "GROQ_API_KEY is not set, transcription requests will fail");
  }

  RCLCPP_INFO(
    get_logger(), "data_dir=%s db=%s stt=%s", rec.data_dir.c_str(), db_path_.c_str(),
    stt.enabled ? stt.engine.c_str() : "off");
}

string SessionRecorderNode::make_session_id()
{
  const time_t now = time(nullptr);
  tm tm_utc{};
  gmtime_r(&now, &tm_utc);
  char stamp[32];
  strftime(stamp, sizeof(stamp), "%Y%m%d-%H%M%S", &tm_utc);

  random_device rd;
  char suffix[8];
  snprintf(suffix, sizeof(suffix), "%04x", static_cast<unsigned>(rd() & 0xFFFFU));
  return string(stamp) + "-" + suffix;
}

string SessionRecorderNode::frame_topic(const string & speaker) const
{
  // 토픽 이름에는 영숫자와 '_'만 쓸 수 있다
  string token;
  token.reserve(speaker.size());
  for (const char c : speaker) {
    token.push_back(isalnum(static_cast<unsigned char>(c)) ? c : '_');
  }
  return frame_topic_prefix_ + token + "/opus";
}

void SessionRecorderNode::abort_on_store_error(const char * where, const voice_record_cpp::StoreError & e)
{
  RCLCPP_ERROR(get_logger(), "%s: storage failure, stopping recorder: %s", where, e.what());
  rclcpp::shutdown();
}

void SessionRecorderNode::on_speaker_joined(const std_msgs::msg::String::SharedPtr msg)
{
  const string speaker = msg->data;
  if (speaker.empty()) {
    RCLCPP_WARN(get_logger(), "received empty speaker id on join");
    return;
  }
  try {
    if (!session_->join(speaker)) {
      return;
    }
  } catch (const voice_record_cpp::StoreError & e) {
    abort_on_store_error("join", e);
    return;
  }

  if (frame_subs_.count(speaker) == 0) {
    const string topic = frame_topic(speaker);
    frame_subs_[speaker] = create_subscription<std_msgs::msg::UInt8MultiArray>(
      topic, rclcpp::QoS(100),
      [this, speaker](const std_msgs::msg::UInt8MultiArray::SharedPtr frame) {
        on_frame(speaker, frame);
      });
    RCLCPP_INFO(get_logger(), "recording %s from %s", speaker.c_str(), topic.c_str());
  }
}

void SessionRecorderNode::on_speaker_left(const std_msgs::msg::String::SharedPtr msg)
{
  const string speaker = msg->data;
  frame_subs_.erase(speaker);
  try {
    session_->leave(speaker);
  } catch (const voice_record_cpp::StoreError & e) {
    abort_on_store_error("leave", e);
  }
}

void SessionRecorderNode::on_speaking_start(const std_msgs::msg::String::SharedPtr msg)
{
  try {
    signals_.speaking_start.emit(msg->data);
  } catch (const voice_record_cpp::StoreError & e) {
    abort_on_store_error("speaking_start", e);
  }
}

void SessionRecorderNode::on_speaking_end(const std_msgs::msg::String::SharedPtr msg)
{
  try {
    signals_.speaking_end.emit(msg->data);
  } catch (const voice_record_cpp::StoreError & e) {
    abort_on_store_error("speaking_end", e);
  }
}

void SessionRecorderNode::on_frame(
  const string & speaker, const std_msgs::msg::UInt8MultiArray::SharedPtr msg)
{
  if (msg->data.empty()) {
    return;
  }
  try {
    session_->on_frame(speaker, msg->data.data(), msg->data.size());
  } catch (const voice_record_cpp::StoreError & e) {
    abort_on_store_error("frame", e);
  }
}

void SessionRecorderNode::publish_transcript(
  const stt_gate_cpp::TranscriptEvent & event, int64_t row_id)
{
  ostringstream json;
  json << "{\"id\":" << row_id
       << ",\"session_id\":\"" << recorder_common::json_escape(session_id_) << "\""
       << ",\"speaker_id\":\"" << recorder_common::json_escape(event.speaker_id) << "\""
       << ",\"segment_start\":\"" << event.segment_start << "\""
       << ",\"segment_end\":\"" << event.segment_end << "\""
       << ",\"text\":\"" << recorder_common::json_escape(event.text) << "\""
       << ",\"is_final\":" << (event.is_final ? "true" : "false")
       << ",\"stream_sequence\":" << event.stream_sequence
       << ",\"engine\":\"" << recorder_common::json_escape(event.engine) << "\"}";

  std_msgs::msg::String out;
  out.data = json.str();
  pub_transcript_->publish(out);
  RCLCPP_DEBUG(get_logger(), "transcript(%s): %s", event.speaker_id.c_str(), event.text.c_str());
}

}  // namespace session_recorder_cpp

int main(int argc, char ** argv)
{
  rclcpp::init(argc, argv);
  shared_ptr<session_recorder_cpp::SessionRecorderNode> node;
  try {
    node = make_shared<session_recorder_cpp::SessionRecorderNode>();
  } catch (const voice_record_cpp::StoreError & e) {
    RCLCPP_FATAL(rclcpp::get_logger("session_recorder_node"), "cannot open store: %s", e.what());
    rclcpp::shutdown();
    return 1;
  }
  rclcpp::spin(node);
  node.reset();
  rclcpp::shutdown();
  return 0;
}
