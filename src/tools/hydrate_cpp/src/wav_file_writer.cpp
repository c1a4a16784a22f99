#include "hydrate_cpp/wav_file_writer.hpp"

#include <limits>

using namespace std;


namespace hydrate_cpp
{

namespace
{
void write_u16_le(ofstream & out, uint16_t v)
{
  out.put(static_cast<char>(v & 0xFF));
  out.put(static_cast<char>((v >> 8) & 0xFF));
}

void write_u32_le(ofstream & out, uint32_t v)
{
  out.put(static_cast<char>(v & 0xFF));
  out.put(static_cast<char>((v >> 8) & 0xFF));
  out.put(static_cast<char>((v >> 16) & 0xFF));
  out.put(static_cast<char>((v >> 24) & 0xFF));
}
}  // namespace

WavFileWriter::WavFileWriter(const string & path, uint32_t sample_rate, uint16_t channels)
: path_(path), sample_rate_(sample_rate), channels_(channels),
  out_(path, ios::binary | ios::trunc)
{
  if (out_.is_open()) {
    write_header(0);
    ok_ = out_.good();
  }
}

WavFileWriter::~WavFileWriter()
{
  close();
}

void WavFileWriter::write_header(uint32_t data_size)
{
  constexpr uint16_t kBitsPerSample = 16;
  const uint16_t block_align = static_cast<uint16_t>(channels_ * (kBitsPerSample / 8));
  const uint32_t byte_rate = sample_rate_ * block_align;

  out_.write("RIFF", 4);
  write_u32_le(out_, 36 + data_size);
  out_.write("WAVE", 4);

  out_.write("fmt ", 4);
  write_u32_le(out_, 16);
  write_u16_le(out_, 1);
  write_u16_le(out_, channels_);
  write_u32_le(out_, sample_rate_);
  write_u32_le(out_, byte_rate);
  write_u16_le(out_, block_align);
  write_u16_le(out_, kBitsPerSample);

  out_.write("data", 4);
  write_u32_le(out_, data_size);
}

bool WavFileWriter::write(const uint8_t * data, size_t size)
{
  if (!out_.is_open() || !ok_) {
    return false;
  }
  out_.write(reinterpret_cast<const char *>(data), static_cast<streamsize>(size));
  ok_ = out_.good();
  if (ok_) {
    data_bytes_ += size;
  }
  return ok_;
}

void WavFileWriter::close()
{
  if (!out_.is_open()) {
    return;
  }
  // RIFF 크기 필드는 32비트라 4 GiB를 넘으면 최대값으로 남긴다
  const uint64_t max_data = numeric_limits<uint32_t>::max() - 36;
  const uint32_t data_size = static_cast<uint32_t>(data_bytes_ > max_data ? max_data : data_bytes_);
  out_.seekp(0, ios::beg);
  write_header(data_size);
  ok_ = ok_ && out_.good();
  out_.close();
}

}  // namespace hydrate_cpp
