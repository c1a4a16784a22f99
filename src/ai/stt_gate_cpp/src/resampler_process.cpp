#include "stt_gate_cpp/resampler_process.hpp"

#include <recorder_common/string_utils.hpp>

#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <utility>

#include "rclcpp/rclcpp.hpp"

using namespace std;


namespace stt_gate_cpp
{

namespace
{

rclcpp::Logger logger()
{
  return rclcpp::get_logger("stt_gate_cpp");
}

void ignore_sigpipe_once()
{
  static once_flag flag;
  call_once(flag, []() {signal(SIGPIPE, SIG_IGN);});
}

void close_fd(int & fd)
{
  if (fd >= 0) {
    ::close(fd);
    fd = -1;
  }
}

}  // namespace

bool ResamplerProcess::StdinSink::write(const uint8_t * data, size_t size)
{
  if (fd_ < 0 || broken_) {
    return false;
  }
  if (!pending_.empty()) {
    return false;
  }
  size_t offset = 0;
  while (offset < size) {
    const ssize_t n = ::write(fd_, data + offset, size - offset);
    if (n > 0) {
      offset += static_cast<size_t>(n);
      continue;
    }
    if (n < 0 && errno == EINTR) {
      continue;
    }
    if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
      pending_.assign(data + offset, data + size);
      return true;
    }
    broken_ = true;
    return false;
  }
  return true;
}

bool ResamplerProcess::StdinSink::flush()
{
  while (!pending_.empty() && fd_ >= 0 && !broken_) {
    const ssize_t n = ::write(fd_, pending_.data(), pending_.size());
    if (n > 0) {
      pending_.erase(pending_.begin(), pending_.begin() + n);
      continue;
    }
    if (n < 0 && errno == EINTR) {
      continue;
    }
    if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
      return false;
    }
    broken_ = true;
  }
  return pending_.empty();
}

void ResamplerProcess::StdinSink::close()
{
  pending_.clear();
  close_fd(fd_);
}

ResamplerProcess::ResamplerProcess(
  const string & label, const ResamplerConfig & config, recorder_common::Scheduler & scheduler)
: label_(label), config_(config), scheduler_(scheduler)
{
}

shared_ptr<ResamplerProcess> ResamplerProcess::start(
  const string & label, const ResamplerConfig & config,
  recorder_common::Scheduler & scheduler, string & error)
{
  ignore_sigpipe_once();
  shared_ptr<ResamplerProcess> proc(new ResamplerProcess(label, config, scheduler));
  if (!proc->launch(error)) {
    return nullptr;
  }
  proc->reader_ = thread(&ResamplerProcess::reader_loop, proc.get(), proc);

  weak_ptr<ResamplerProcess> weak = proc;
  const auto idle = recorder_common::seconds_to_ms(config.idle_timeout_sec);
  const auto period = min(idle, chrono::milliseconds(60000));
  proc->idle_timer_ = scheduler.call_every(
    period, [weak]() {
      if (auto self = weak.lock()) {
        self->check_idle();
      }
    });
  return proc;
}

bool ResamplerProcess::launch(string & error)
{
  int in_pipe[2] = {-1, -1};
  int out_pipe[2] = {-1, -1};
  int err_pipe[2] = {-1, -1};
  if (pipe2(in_pipe, O_CLOEXEC) != 0 || pipe2(out_pipe, O_CLOEXEC) != 0 ||
    pipe2(err_pipe, O_CLOEXEC) != 0)
  {
    error = string("pipe failed: ") + strerror(errno);
    for (int * p : {in_pipe, out_pipe, err_pipe}) {
      close_fd(p[0]);
      close_fd(p[1]);
    }
    return false;
  }

  // fork 이후 자식에서는 async-signal-safe 호출만 한다
  const string shell_command = "exec " + config_.command;

  const pid_t pid = fork();
  if (pid < 0) {
    error = string("fork failed: ") + strerror(errno);
    for (int * p : {in_pipe, out_pipe, err_pipe}) {
      close_fd(p[0]);
      close_fd(p[1]);
    }
    return false;
  }

  if (pid == 0) {
    dup2(in_pipe[0], STDIN_FILENO);
    dup2(out_pipe[1], STDOUT_FILENO);
    dup2(err_pipe[1], STDERR_FILENO);
    execl("/bin/sh", "sh", "-c", shell_command.c_str(), nullptr);
    _exit(127);
  }

  close_fd(in_pipe[0]);
  close_fd(out_pipe[1]);
  close_fd(err_pipe[1]);
  fcntl(in_pipe[1], F_SETFL, fcntl(in_pipe[1], F_GETFL) | O_NONBLOCK);

  lock_guard<mutex> lock(mutex_);
  pid_ = pid;
  stdout_fd_ = out_pipe[0];
  stderr_fd_ = err_pipe[0];
  spawned_at_ = scheduler_.now();
  last_write_ = spawned_at_;
  stdin_ = make_unique<StdinSink>(in_pipe[1]);
  muxer_ = make_unique<voice_record_cpp::OggMuxer>(*stdin_);

  RCLCPP_INFO(logger(), "resampler %s started (pid %d)", label_.c_str(), static_cast<int>(pid));
  return true;
}

ResamplerProcess::~ResamplerProcess()
{
  idle_timer_.reset();
  kill_timer_.reset();
  if (reader_.joinable()) {
    if (reader_.get_id() == this_thread::get_id()) {
      reader_.detach();
    } else {
      reader_.join();
    }
  }
  if (stdin_) {
    stdin_->close();
  }
  close_fd(stdout_fd_);
  close_fd(stderr_fd_);
}

bool ResamplerProcess::write_frame(const uint8_t * data, size_t size)
{
  lock_guard<mutex> lock(mutex_);
  if (killed_ || reaped_ || !muxer_) {
    return false;
  }
  last_write_ = scheduler_.now();
  if (stdin_->backpressured() && !stdin_->flush()) {
    ++dropped_frames_;
    if (dropped_frames_ == 1 || dropped_frames_ % 500 == 0) {
      RCLCPP_WARN(
        logger(), "resampler %s backpressured, %lu frames dropped",
        label_.c_str(), static_cast<unsigned long>(dropped_frames_));
    }
    return false;
  }
  if (!muxer_->write_frame(data, size)) {
    if (stdin_->broken()) {
      RCLCPP_DEBUG(logger(), "resampler %s stdin closed", label_.c_str());
    }
    return false;
  }
  ++written_frames_;
  return true;
}

void ResamplerProcess::kill()
{
  weak_ptr<ResamplerProcess> weak = weak_from_this();
  lock_guard<mutex> lock(mutex_);
  if (killed_) {
    return;
  }
  killed_ = true;

  if (muxer_ && !stdin_->backpressured()) {
    muxer_->finalize();
  }
  if (stdin_) {
    stdin_->close();
  }
  if (reaped_ || pid_ <= 0) {
    return;
  }

  if (::kill(pid_, SIGTERM) != 0 && errno != ESRCH) {
    RCLCPP_WARN(logger(), "resampler %s: SIGTERM failed: %s", label_.c_str(), strerror(errno));
  }
  kill_timer_ = scheduler_.call_after(
    recorder_common::seconds_to_ms(config_.kill_grace_sec), [weak]() {
      if (auto self = weak.lock()) {
        self->force_kill();
      }
    });
}

void ResamplerProcess::force_kill()
{
  lock_guard<mutex> lock(mutex_);
  if (reaped_ || pid_ <= 0) {
    return;
  }
  RCLCPP_WARN(
    logger(), "resampler %s did not exit after SIGTERM, sending SIGKILL", label_.c_str());
  if (::kill(pid_, SIGKILL) != 0 && errno != ESRCH) {
    RCLCPP_ERROR(logger(), "resampler %s: SIGKILL failed: %s", label_.c_str(), strerror(errno));
  }
}

void ResamplerProcess::check_idle()
{
  {
    lock_guard<mutex> lock(mutex_);
    if (killed_ || reaped_) {
      return;
    }
    const auto idle = scheduler_.now() - last_write_;
    if (idle < recorder_common::seconds_to_ms(config_.idle_timeout_sec)) {
      return;
    }
  }
  RCLCPP_WARN(
    logger(), "resampler %s idle for %.0f s, killing", label_.c_str(), config_.idle_timeout_sec);
  kill();
}

bool ResamplerProcess::is_alive() const
{
  lock_guard<mutex> lock(mutex_);
  return !killed_ && !reaped_;
}

bool ResamplerProcess::reaped() const
{
  lock_guard<mutex> lock(mutex_);
  return reaped_;
}

int ResamplerProcess::exit_status() const
{
  lock_guard<mutex> lock(mutex_);
  return exit_status_;
}

uint64_t ResamplerProcess::dropped_frames() const
{
  lock_guard<mutex> lock(mutex_);
  return dropped_frames_;
}

uint64_t ResamplerProcess::written_frames() const
{
  lock_guard<mutex> lock(mutex_);
  return written_frames_;
}

recorder_common::Subscription ResamplerProcess::subscribe_pcm(PcmCallback callback)
{
  return pcm_.subscribe(move(callback));
}

recorder_common::Subscription ResamplerProcess::subscribe_exit(ExitCallback callback)
{
  return exited_.subscribe(move(callback));
}

void ResamplerProcess::handle_stderr_chunk(const char * data, size_t size)
{
  stderr_line_.append(data, size);
  size_t pos = 0;
  while ((pos = stderr_line_.find('\n')) != string::npos) {
    const string line = recorder_common::trim(stderr_line_.substr(0, pos));
    stderr_line_.erase(0, pos + 1);
    if (line.empty()) {
      continue;
    }
    if (recorder_common::contains_any(line, {"Error", "error", "Warning", "warning"})) {
      RCLCPP_WARN(logger(), "resampler %s: %s", label_.c_str(), line.c_str());
    } else {
      RCLCPP_DEBUG(logger(), "resampler %s: %s", label_.c_str(), line.c_str());
    }
  }
}

void ResamplerProcess::reader_loop(shared_ptr<ResamplerProcess> self)
{
  vector<uint8_t> buffer(16384);
  bool stdout_open = true;
  bool stderr_open = true;

  while (stdout_open || stderr_open) {
    pollfd fds[3];
    nfds_t count = 0;
    int out_index = -1;
    int err_index = -1;
    int in_index = -1;
    if (stdout_open) {
      out_index = static_cast<int>(count);
      fds[count++] = {stdout_fd_, POLLIN, 0};
    }
    if (stderr_open) {
      err_index = static_cast<int>(count);
      fds[count++] = {stderr_fd_, POLLIN, 0};
    }
    {
      lock_guard<mutex> lock(mutex_);
      if (stdin_ && stdin_->fd() >= 0 && stdin_->backpressured()) {
        in_index = static_cast<int>(count);
        fds[count++] = {stdin_->fd(), POLLOUT, 0};
      }
    }

    const int rc = poll(fds, count, 100);
    if (rc < 0) {
      if (errno == EINTR) {
        continue;
      }
      RCLCPP_ERROR(logger(), "resampler %s: poll failed: %s", label_.c_str(), strerror(errno));
      break;
    }
    if (rc == 0) {
      continue;
    }

    if (in_index >= 0 && (fds[in_index].revents & (POLLOUT | POLLERR | POLLHUP)) != 0) {
      lock_guard<mutex> lock(mutex_);
      if (stdin_) {
        stdin_->flush();
      }
    }

    if (out_index >= 0 && (fds[out_index].revents & (POLLIN | POLLHUP | POLLERR)) != 0) {
      const ssize_t n = ::read(stdout_fd_, buffer.data(), buffer.size());
      if (n > 0) {
        const vector<uint8_t> pcm(buffer.begin(), buffer.begin() + n);
        pcm_.emit(pcm);
      } else if (n == 0 || (errno != EINTR && errno != EAGAIN)) {
        stdout_open = false;
      }
    }

    if (err_index >= 0 && (fds[err_index].revents & (POLLIN | POLLHUP | POLLERR)) != 0) {
      char text[1024];
      const ssize_t n = ::read(stderr_fd_, text, sizeof(text));
      if (n > 0) {
        handle_stderr_chunk(text, static_cast<size_t>(n));
      } else if (n == 0 || (errno != EINTR && errno != EAGAIN)) {
        stderr_open = false;
      }
    }
  }

  // 파이프가 모두 닫혔다. 자식을 회수한다
  int status = 0;
  while (true) {
    const pid_t waited = waitpid(pid_, &status, WNOHANG);
    if (waited == pid_) {
      break;
    }
    if (waited < 0 && errno != EINTR) {
      status = -1;
      break;
    }
    this_thread::sleep_for(chrono::milliseconds(50));
  }

  int exit_code = status;
  if (status >= 0 && WIFEXITED(status)) {
    exit_code = WEXITSTATUS(status);
  } else if (status >= 0 && WIFSIGNALED(status)) {
    exit_code = 128 + WTERMSIG(status);
  }

  bool intentional = false;
  {
    lock_guard<mutex> lock(mutex_);
    reaped_ = true;
    exit_status_ = exit_code;
    intentional = killed_;
    if (stdin_) {
      stdin_->close();
    }
  }
  if (intentional) {
    RCLCPP_INFO(logger(), "resampler %s exited (%d)", label_.c_str(), exit_code);
  } else {
    RCLCPP_WARN(logger(), "resampler %s exited unexpectedly (%d)", label_.c_str(), exit_code);
  }
  exited_.emit(exit_code);
  self.reset();
}

}  // namespace stt_gate_cpp
