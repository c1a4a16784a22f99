#include <memory>
#include <string>
#include <vector>

#include "rclcpp/rclcpp.hpp"

#include "hydrate_cpp/audio_tool.hpp"
#include "hydrate_cpp/session_hydrator.hpp"
#include "voice_record_cpp/sqlite_recording_store.hpp"

using namespace std;


int main(int argc, char ** argv)
{
  // --ros-args 는 rclcpp가 가져가고 나머지가 도구 인자로 남는다
  const vector<string> args = rclcpp::init_and_remove_ros_arguments(argc, argv);
  auto node = make_shared<rclcpp::Node>("hydrate_audio");
  const auto log = node->get_logger();

  node->declare_parameter<string>("db_path", "data/recorder.db");
  node->declare_parameter<string>("data_dir", "data/recordings");
  node->declare_parameter<double>("max_gap_seconds", 300.0);

  string session_id;
  bool mix = false;
  hydrate_cpp::HydrateOptions options;
  options.max_gap_seconds = node->get_parameter("max_gap_seconds").as_double();
  for (size_t i = 1; i < args.size(); ++i) {
    if (args[i] == "--mix") {
      mix = true;
    } else if (args[i] == "--no-clamp") {
      options.clamp = false;
    } else if (!args[i].empty() && args[i][0] != '-' && session_id.empty()) {
      session_id = args[i];
    } else {
      RCLCPP_WARN(log, "ignoring unknown argument: %s", args[i].c_str());
    }
  }
  if (session_id.empty()) {
    RCLCPP_ERROR(log, "usage: hydrate_audio <session-id> [--mix] [--no-clamp]");
    rclcpp::shutdown();
    return 1;
  }

  int exit_code = 0;
  try {
    voice_record_cpp::SqliteRecordingStore store(node->get_parameter("db_path").as_string());
    hydrate_cpp::FfmpegTool ffmpeg;
    hydrate_cpp::SessionHydrator hydrator(
      store, ffmpeg, node->get_parameter("data_dir").as_string(), options);

    hydrate_cpp::HydrateSummary summary;
    const hydrate_cpp::HydrateStatus status = hydrator.hydrate(session_id, mix, summary);
    if (status != hydrate_cpp::HydrateStatus::kOk) {
      RCLCPP_ERROR(
        log, "%s: %s%s%s", session_id.c_str(), hydrate_cpp::status_name(status),
        summary.error.empty() ? "" : ": ", summary.error.c_str());
      exit_code = 1;
    } else {
      RCLCPP_INFO(log, "done: %zu track(s) in %s", summary.tracks.size(), summary.output_dir.c_str());
    }
  } catch (const voice_record_cpp::StoreError & e) {
    RCLCPP_ERROR(log, "database error: %s", e.what());
    exit_code = 1;
  }

  rclcpp::shutdown();
  return exit_code;
}
