#pragma once

#include <map>
#include <memory>
#include <string>

#include "rclcpp/rclcpp.hpp"
#include "std_msgs/msg/string.hpp"
#include "std_msgs/msg/u_int8_multi_array.hpp"

#include "recorder_common/rclcpp_scheduler.hpp"
#include "recorder_common/speaking_signals.hpp"
#include "session_recorder_cpp/recording_session.hpp"
#include "stt_gate_cpp/engine_registry.hpp"
#include "stt_gate_cpp/process_registry.hpp"
#include "voice_record_cpp/sqlite_recording_store.hpp"

namespace session_recorder_cpp
{

/// 음성 전송 토픽을 받아 세션 하나를 녹음/전사하는 노드
class SessionRecorderNode : public rclcpp::Node
{
public:
  SessionRecorderNode();
  ~SessionRecorderNode() override;

private:
  void declare_and_get_parameters();
  void on_speaker_joined(const std_msgs::msg::String::SharedPtr msg);
  void on_speaker_left(const std_msgs::msg::String::SharedPtr msg);
  void on_speaking_start(const std_msgs::msg::String::SharedPtr msg);
  void on_speaking_end(const std_msgs::msg::String::SharedPtr msg);
  void on_frame(const std::string & speaker, const std_msgs::msg::UInt8MultiArray::SharedPtr msg);
  void publish_transcript(const stt_gate_cpp::TranscriptEvent & event, int64_t row_id);
  /// 저장소 오류는 녹음 경로를 멈춘다
  void abort_on_store_error(const char * where, const voice_record_cpp::StoreError & e);

  std::string frame_topic(const std::string & speaker) const;
  static std::string make_session_id();

  std::string db_path_;
  std::string session_id_;
  std::string frame_topic_prefix_;
  SessionConfig session_config_;
  stt_gate_cpp::ProcessRegistryConfig registry_config_;

  std::unique_ptr<voice_record_cpp::SqliteRecordingStore> store_;
  std::unique_ptr<recorder_common::RclcppScheduler> scheduler_;
  recorder_common::SpeakingSignals signals_;
  std::unique_ptr<stt_gate_cpp::ProcessRegistry> registry_;
  stt_gate_cpp::EngineRegistry engines_;
  std::unique_ptr<RecordingSession> session_;
  recorder_common::Subscription transcript_sub_;

  std::map<std::string, rclcpp::Subscription<std_msgs::msg::UInt8MultiArray>::SharedPtr> frame_subs_;
  rclcpp::Subscription<std_msgs::msg::String>::SharedPtr sub_joined_;
  rclcpp::Subscription<std_msgs::msg::String>::SharedPtr sub_left_;
  rclcpp::Subscription<std_msgs::msg::String>::SharedPtr sub_speaking_start_;
  rclcpp::Subscription<std_msgs::msg::String>::SharedPtr sub_speaking_end_;
  rclcpp::Publisher<std_msgs::msg::String>::SharedPtr pub_transcript_;
};

}  // namespace session_recorder_cpp
