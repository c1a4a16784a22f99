#include "stt_gate_cpp/http_stt_engine.hpp"

#include <recorder_common/curl_utils.hpp>
#include <recorder_common/json_utils.hpp>
#include <recorder_common/string_utils.hpp>
#include <recorder_common/time_utils.hpp>

#include <curl/curl.h>

#include <chrono>
#include <sstream>
#include <utility>

#include "rclcpp/rclcpp.hpp"

using namespace std;


namespace stt_gate_cpp
{

namespace
{

static const recorder_common::CurlGlobalGuard curl_guard;

rclcpp::Logger logger()
{
  return rclcpp::get_logger("stt_gate_cpp");
}

}  // namespace

/// 스트림 하나의 공유 상태 (작업 스레드와 스트림 핸들이 함께 참조)
struct HttpSttEngine::StreamState
{
  std::mutex mutex;
  std::string speaker;
  int sequence = 0;
  bool open = true;
  bool anchored = false;
  chrono::system_clock::time_point anchor;
  vector<uint8_t> buffer;
  uint64_t bytes_total = 0;
  int next_chunk = 0;
  TranscriptCallback on_transcript;
  StreamClosedCallback on_unexpected_close;
};

class HttpSttStream : public SttStream
{
public:
  HttpSttStream(HttpSttEngine & engine, shared_ptr<HttpSttEngine::StreamState> state)
  : engine_(engine), state_(move(state))
  {
  }

  ~HttpSttStream() override
  {
    close();
  }

  void write(const uint8_t * pcm, size_t size) override
  {
    vector<HttpSttEngine::Job> jobs;
    {
      lock_guard<mutex> lock(state_->mutex);
      if (!state_->open || size == 0) {
        return;
      }
      // 첫 오디오 바이트 시각을 결과 시간의 기준으로 삼는다
      if (!state_->anchored) {
        state_->anchored = true;
        state_->anchor = chrono::system_clock::now();
      }
      state_->buffer.insert(state_->buffer.end(), pcm, pcm + size);
      state_->bytes_total += size;

      const size_t chunk_bytes = chunk_size(engine_.config_.chunk_seconds);
      while (state_->buffer.size() >= chunk_bytes) {
        HttpSttEngine::Job job;
        job.state = state_;
        job.start_byte = state_->bytes_total - state_->buffer.size();
        job.pcm.assign(state_->buffer.begin(), state_->buffer.begin() + chunk_bytes);
        job.chunk_index = state_->next_chunk++;
        state_->buffer.erase(state_->buffer.begin(), state_->buffer.begin() + chunk_bytes);
        jobs.push_back(move(job));
      }
    }
    if (!jobs.empty()) {
      engine_.enqueue(move(jobs));
    }
  }

  void close() override
  {
    vector<HttpSttEngine::Job> jobs;
    {
      lock_guard<mutex> lock(state_->mutex);
      if (!state_->open) {
        return;
      }
      state_->open = false;
      if (state_->buffer.size() >= chunk_size(engine_.config_.min_chunk_seconds)) {
        HttpSttEngine::Job job;
        job.state = state_;
        job.start_byte = state_->bytes_total - state_->buffer.size();
        job.pcm.swap(state_->buffer);
        job.chunk_index = state_->next_chunk++;
        jobs.push_back(move(job));
      }
      state_->buffer.clear();
    }
    if (!jobs.empty()) {
      engine_.enqueue(move(jobs));
    }
  }

  bool is_open() const override
  {
    lock_guard<mutex> lock(state_->mutex);
    return state_->open;
  }

private:
  static size_t chunk_size(double seconds)
  {
    size_t bytes = static_cast<size_t>(seconds * kSttBytesPerSecond);
    bytes -= bytes % 2;
    return bytes > 0 ? bytes : 2;
  }

  HttpSttEngine & engine_;
  shared_ptr<HttpSttEngine::StreamState> state_;
};

HttpSttEngine::HttpSttEngine(const SttConfig & config)
: config_(config), running_(true)
{
  endpoint_ = config_.endpoint.empty() ? default_endpoint(config_.engine) : config_.endpoint;
  const int threads = config_.worker_threads > 0 ? config_.worker_threads : 1;
  for (int i = 0; i < threads; ++i) {
    workers_.emplace_back(&HttpSttEngine::worker_loop, this);
  }
  RCLCPP_INFO(
    logger(), "stt engine %s ready (model=%s, endpoint=%s)",
    config_.engine.c_str(), config_.model.c_str(), endpoint_.c_str());
}

HttpSttEngine::~HttpSttEngine()
{
  size_t discarded = 0;
  {
    lock_guard<mutex> lock(job_mutex_);
    discarded = jobs_.size();
  }
  if (discarded > 0) {
    RCLCPP_WARN(logger(), "stt engine %s: discarding %zu queued chunk(s)", config_.engine.c_str(), discarded);
  }
  // 진행 중인 요청은 progress 콜백이 running_을 보고 중단한다
  running_.store(false);
  job_cv_.notify_all();
  for (auto & t : workers_) {
    if (!t.joinable()) {
      continue;
    }
    if (t.get_id() == this_thread::get_id()) {
      t.detach();
    } else {
      t.join();
    }
  }
}

string HttpSttEngine::default_endpoint(const string & engine)
{
  if (engine == "whisper_server") {
    return "http://127.0.0.1:8080/inference";
  }
  return "https://api.groq.com/openai/v1/audio/transcriptions";
}

SttStreamPtr HttpSttEngine::open_stream(
  const string & speaker, int sequence,
  TranscriptCallback on_transcript, StreamClosedCallback on_unexpected_close)
{
  auto state = make_shared<StreamState>();
  state->speaker = speaker;
  state->sequence = sequence;
  state->on_transcript = move(on_transcript);
  state->on_unexpected_close = move(on_unexpected_close);
  RCLCPP_DEBUG(logger(), "stream %s#%d opened", speaker.c_str(), sequence);
  return make_shared<HttpSttStream>(*this, state);
}

void HttpSttEngine::enqueue(vector<Job> jobs)
{
  {
    lock_guard<mutex> lock(job_mutex_);
    for (auto & job : jobs) {
      jobs_.push_back(move(job));
    }
  }
  job_cv_.notify_all();
}

bool HttpSttEngine::drain(chrono::milliseconds timeout)
{
  unique_lock<mutex> lock(job_mutex_);
  const bool drained = drained_cv_.wait_for(lock, timeout, [this]() {
      return jobs_.empty() && active_jobs_ == 0;
    });
  if (!drained) {
    RCLCPP_WARN(
      logger(), "stt engine %s: %zu queued and %d running chunk(s) still pending after %ld ms",
      config_.engine.c_str(), jobs_.size(), active_jobs_, static_cast<long>(timeout.count()));
  }
  return drained;
}

void HttpSttEngine::worker_loop()
{
  while (running_.load()) {
    Job job;
    {
      unique_lock<mutex> lock(job_mutex_);
      job_cv_.wait_for(lock, chrono::milliseconds(100), [this]() {
          return !jobs_.empty() || !running_.load();
        });
      if (!running_.load()) {
        break;
      }
      if (jobs_.empty()) {
        continue;
      }
      job = move(jobs_.front());
      jobs_.pop_front();
      ++active_jobs_;
    }
    process_job(job);
    {
      lock_guard<mutex> lock(job_mutex_);
      --active_jobs_;
    }
    drained_cv_.notify_all();
  }
}

void HttpSttEngine::process_job(const Job & job)
{
  const HttpTranscribeResult result = transcribe_wav(build_wav(job.pcm, kSttSampleRate));
  StreamState & state = *job.state;

  if (!result.ok) {
    if (!running_.load()) {
      return;
    }
    RCLCPP_WARN(
      logger(), "stt chunk %d for %s#%d failed: %s",
      job.chunk_index, state.speaker.c_str(), state.sequence, result.error.c_str());
    if (!result.stream_fatal) {
      return;
    }
    StreamClosedCallback notify;
    {
      lock_guard<mutex> lock(state.mutex);
      if (state.open) {
        state.open = false;
        state.buffer.clear();
        notify = state.on_unexpected_close;
      }
    }
    if (notify) {
      notify();
    }
    return;
  }

  if (result.text.empty()) {
    return;
  }

  TranscriptEvent event;
  TranscriptCallback callback;
  {
    lock_guard<mutex> lock(state.mutex);
    const auto start_ms = chrono::milliseconds(job.start_byte * 1000 / kSttBytesPerSecond);
    const auto end_ms = chrono::milliseconds(
      (job.start_byte + job.pcm.size()) * 1000 / kSttBytesPerSecond);
    event.speaker_id = state.speaker;
    event.stream_sequence = state.sequence;
    event.segment_start = recorder_common::to_iso8601(state.anchor + start_ms);
    event.segment_end = recorder_common::to_iso8601(state.anchor + end_ms);
    callback = state.on_transcript;
  }
  event.text = result.text;
  event.is_final = true;
  event.result_id = "chunk_" + to_string(job.chunk_index);
  event.engine = config_.engine;
  event.model = config_.model;
  if (callback) {
    callback(event);
  }
}

HttpTranscribeResult HttpSttEngine::transcribe_wav(const string & wav) const
{
  HttpTranscribeResult out;

  CURL * curl = curl_easy_init();
  if (!curl) {
    out.error = "curl_init_failed";
    return out;
  }

  string response_body;
  struct curl_slist * headers = nullptr;
  if (!config_.api_key.empty()) {
    const string auth = "Authorization: Bearer " + config_.api_key;
    headers = curl_slist_append(headers, auth.c_str());
  }

  curl_mime * mime = curl_mime_init(curl);
  curl_mimepart * part = nullptr;

  part = curl_mime_addpart(mime);
  curl_mime_name(part, "file");
  curl_mime_data(part, wav.data(), wav.size());
  curl_mime_filename(part, "chunk.wav");
  curl_mime_type(part, "audio/wav");

  part = curl_mime_addpart(mime);
  curl_mime_name(part, "model");
  curl_mime_data(part, config_.model.c_str(), CURL_ZERO_TERMINATED);

  if (!config_.language.empty()) {
    part = curl_mime_addpart(mime);
    curl_mime_name(part, "language");
    curl_mime_data(part, config_.language.c_str(), CURL_ZERO_TERMINATED);
  }

  part = curl_mime_addpart(mime);
  curl_mime_name(part, "response_format");
  curl_mime_data(part, "json", CURL_ZERO_TERMINATED);

  curl_easy_setopt(curl, CURLOPT_URL, endpoint_.c_str());
  if (headers) {
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
  }
  curl_easy_setopt(curl, CURLOPT_MIMEPOST, mime);
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, recorder_common::curl_write_callback);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_body);
  curl_easy_setopt(curl, CURLOPT_TIMEOUT, config_.timeout_sec);
  curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 5L);
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
  curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, &HttpSttEngine::abort_on_shutdown);
  curl_easy_setopt(curl, CURLOPT_XFERINFODATA, const_cast<HttpSttEngine *>(this));

  const CURLcode rc = curl_easy_perform(curl);
  curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &out.http_code);

  if (rc != CURLE_OK) {
    out.error = "curl_error:" + string(curl_easy_strerror(rc));
    out.stream_fatal = recorder_common::is_network_error_code(rc);
  } else if (out.http_code != 200) {
    ostringstream oss;
    oss << "http_" << out.http_code;
    if (!response_body.empty()) {
      oss << ":" << recorder_common::trim(response_body);
    }
    out.error = oss.str();
    out.stream_fatal = recorder_common::is_retryable_http_code(out.http_code);
  } else {
    string text;
    if (recorder_common::extract_json_string_field(response_body, "text", text)) {
      out.ok = true;
      out.text = recorder_common::trim(text);
    } else {
      out.error = "invalid_json_response:" + recorder_common::trim(response_body);
    }
  }

  curl_mime_free(mime);
  curl_slist_free_all(headers);
  curl_easy_cleanup(curl);
  return out;
}

int HttpSttEngine::abort_on_shutdown(void * self, curl_off_t, curl_off_t, curl_off_t, curl_off_t)
{
  // 0이 아니면 libcurl이 CURLE_ABORTED_BY_CALLBACK으로 전송을 끊는다
  return static_cast<HttpSttEngine *>(self)->running_.load() ? 0 : 1;
}

string HttpSttEngine::build_wav(const vector<uint8_t> & pcm, uint32_t sample_rate)
{
  const uint16_t channels = 1;
  const uint16_t bits_per_sample = 16;
  const uint16_t block_align = channels * (bits_per_sample / 8U);
  const uint32_t byte_rate = sample_rate * block_align;
  const uint32_t data_size = static_cast<uint32_t>(pcm.size());

  string out;
  out.reserve(44 + pcm.size());
  auto write_le16 = [&out](uint16_t v) {
      out.push_back(static_cast<char>(v & 0xFFU));
      out.push_back(static_cast<char>((v >> 8U) & 0xFFU));
    };
  auto write_le32 = [&out](uint32_t v) {
      out.push_back(static_cast<char>(v & 0xFFU));
      out.push_back(static_cast<char>((v >> 8U) & 0xFFU));
      out.push_back(static_cast<char>((v >> 16U) & 0xFFU));
      out.push_back(static_cast<char>((v >> 24U) & 0xFFU));
    };

  out.append("RIFF", 4);
  write_le32(36U + data_size);
  out.append("WAVE", 4);
  out.append("fmt ", 4);
  write_le32(16U);
  write_le16(1U);
  write_le16(channels);
  write_le32(sample_rate);
  write_le32(byte_rate);
  write_le16(block_align);
  write_le16(bits_per_sample);
  out.append("data", 4);
  write_le32(data_size);
  out.append(reinterpret_cast<const char *>(pcm.data()), pcm.size());
  return out;
}

}  // namespace stt_gate_cpp
