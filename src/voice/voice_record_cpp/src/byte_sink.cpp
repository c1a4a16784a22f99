#include "voice_record_cpp/byte_sink.hpp"

using namespace std;


namespace voice_record_cpp
{

FileSink::FileSink(const string & path)
: path_(path)
{
  out_.open(path_, ios::binary | ios::out | ios::trunc);
  if (!out_.is_open()) {
    last_error_ = "failed to open " + path_;
  }
}

FileSink::~FileSink()
{
  close();
}

bool FileSink::write(const uint8_t * data, size_t size)
{
  if (!out_.is_open()) {
    return false;
  }
  out_.write(reinterpret_cast<const char *>(data), static_cast<streamsize>(size));
  out_.flush();
  if (!out_.good()) {
    last_error_ = "write failed: " + path_;
    return false;
  }
  bytes_written_ += size;
  return true;
}

void FileSink::close()
{
  if (out_.is_open()) {
    out_.flush();
    out_.close();
  }
}

}  // namespace voice_record_cpp
