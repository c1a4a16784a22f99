#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace hydrate_cpp
{

/// 외부 오디오 도구 (디코딩, 믹스다운)
class AudioTool
{
public:
  virtual ~AudioTool() = default;
  virtual bool available() = 0;
  /// Ogg/Opus 파일을 48 kHz stereo s16le로 디코딩
  virtual bool decode(const std::string & path, std::vector<uint8_t> & pcm, std::string & error) = 0;
  virtual bool mix(
    const std::vector<std::string> & inputs, const std::string & output, std::string & error) = 0;
};

/// ffmpeg CLI 구현. 가능하면 nice -n 19로 낮은 우선순위에서 실행한다.
class FfmpegTool : public AudioTool
{
public:
  FfmpegTool();

  bool available() override;
  bool decode(const std::string & path, std::vector<uint8_t> & pcm, std::string & error) override;
  bool mix(
    const std::vector<std::string> & inputs, const std::string & output,
    std::string & error) override;

  /// amix(duration=longest) + loudnorm, 입력이 하나면 loudnorm만
  static std::string mix_filter(size_t input_count);

private:
  std::string command_prefix() const;

  bool use_nice_;
};

}  // namespace hydrate_cpp
