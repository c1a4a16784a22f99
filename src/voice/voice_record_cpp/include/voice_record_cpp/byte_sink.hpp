#pragma once

#include <cstddef>
#include <cstdint>
#include <fstream>
#include <string>

namespace voice_record_cpp
{

/// 바이트 출력 대상 (파일, 파이프, 메모리)
class ByteSink
{
public:
  virtual ~ByteSink() = default;
  /// data 전체를 받아들였으면 true
  virtual bool write(const uint8_t * data, size_t size) = 0;
  virtual void close() = 0;
};

/// 매 write마다 flush하는 파일 sink (크래시 후에도 마지막 완성 페이지까지 남도록)
class FileSink : public ByteSink
{
public:
  explicit FileSink(const std::string & path);
  ~FileSink() override;

  bool write(const uint8_t * data, size_t size) override;
  void close() override;

  bool is_open() const { return out_.is_open(); }
  uint64_t bytes_written() const { return bytes_written_; }
  const std::string & path() const { return path_; }
  const std::string & last_error() const { return last_error_; }

private:
  std::string path_;
  std::ofstream out_;
  uint64_t bytes_written_ = 0;
  std::string last_error_;
};

}  // namespace voice_record_cpp
