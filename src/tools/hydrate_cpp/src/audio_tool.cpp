#include "hydrate_cpp/audio_tool.hpp"

#include <recorder_common/shell_utils.hpp>
#include <recorder_common/string_utils.hpp>

#include <sstream>

#include "hydrate_cpp/track_assembler.hpp"

using namespace std;


namespace hydrate_cpp
{

FfmpegTool::FfmpegTool()
: use_nice_(recorder_common::command_exists("nice"))
{
}

bool FfmpegTool::available()
{
  return recorder_common::run_shell_command("ffmpeg -version >/dev/null 2>&1").ok;
}

string FfmpegTool::command_prefix() const
{
  return string(use_nice_ ? "nice -n 19 " : "") + "ffmpeg -hide_banner -loglevel warning";
}

bool FfmpegTool::decode(const string & path, vector<uint8_t> & pcm, string & error)
{
  ostringstream cmd;
  cmd << command_prefix()
      << " -i " << recorder_common::shell_escape_single_quote(path)
      << " -f s16le -ar " << kSampleRate << " -ac " << kChannels << " pipe:1";

  const recorder_common::ShellResult r = recorder_common::run_shell_command(cmd.str());
  if (!r.ok) {
    error = "ffmpeg decode failed (exit " + to_string(r.exit_code) + ")";
    return false;
  }
  pcm.assign(r.output.begin(), r.output.end());
  return true;
}

string FfmpegTool::mix_filter(size_t input_count)
{
  if (input_count > 1) {
    return "amix=inputs=" + to_string(input_count) + ":duration=longest,loudnorm";
  }
  return "loudnorm";
}

bool FfmpegTool::mix(const vector<string> & inputs, const string & output, string & error)
{
  if (inputs.empty()) {
    error = "no inputs to mix";
    return false;
  }
  ostringstream cmd;
  cmd << command_prefix();
  for (const auto & in : inputs) {
    cmd << " -i " << recorder_common::shell_escape_single_quote(in);
  }
  cmd << " -filter_complex " << recorder_common::shell_escape_single_quote(mix_filter(inputs.size()))
      << " -y " << recorder_common::shell_escape_single_quote(output);

  const recorder_common::ShellResult r = recorder_common::run_shell_command(cmd.str());
  if (!r.ok) {
    error = "ffmpeg mix failed (exit " + to_string(r.exit_code) + ")";
    return false;
  }
  return true;
}

}  // namespace hydrate_cpp
