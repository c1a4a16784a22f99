#pragma once

#include <cstdint>
#include <fstream>
#include <string>

#include "voice_record_cpp/byte_sink.hpp"

namespace hydrate_cpp
{

/// PCM16 스트림을 WAV 파일로 기록하는 sink
/// 헤더는 크기 0으로 먼저 쓰고 close()에서 RIFF/data 크기를 채운다.
class WavFileWriter : public voice_record_cpp::ByteSink
{
public:
  WavFileWriter(const std::string & path, uint32_t sample_rate, uint16_t channels);
  ~WavFileWriter() override;

  bool write(const uint8_t * data, size_t size) override;
  void close() override;

  bool is_open() const { return out_.is_open(); }
  bool good() const { return ok_; }
  uint64_t data_bytes() const { return data_bytes_; }
  const std::string & path() const { return path_; }

private:
  void write_header(uint32_t data_size);

  std::string path_;
  uint32_t sample_rate_;
  uint16_t channels_;
  std::ofstream out_;
  uint64_t data_bytes_ = 0;
  bool ok_ = false;
};

}  // namespace hydrate_cpp
