#include "stt_gate_cpp/process_registry.hpp"

#include <utility>
#include <vector>

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
}  // namespace

ProcessRegistry::ProcessRegistry(
  recorder_common::Scheduler & scheduler, const ProcessRegistryConfig & config)
: scheduler_(scheduler), config_(config), state_(make_shared<State>())
{
}

ProcessRegistry::~ProcessRegistry()
{
  kill_all();
}

ResamplerPtr ProcessRegistry::spawn(const SessionSpeakerKey & key)
{
  ResamplerPtr previous;
  recorder_common::Subscription previous_exit_sub;
  {
    lock_guard<mutex> lock(state_->mutex);
    prune_failures_locked(key);
    const auto & failures = state_->failures[key];
    if (static_cast<int>(failures.size()) >= config_.breaker_max_failures) {
      RCLCPP_WARN(
        logger(), "resampler %s: circuit breaker open (%zu failures in %.0f s), not spawning",
        key.to_string().c_str(), failures.size(), config_.breaker_window_sec);
      return nullptr;
    }
    auto it = state_->entries.find(key);
    if (it != state_->entries.end()) {
      previous_exit_sub = move(it->second.exit_sub);
      previous = move(it->second.process);
      state_->entries.erase(it);
    }
  }
  // 의도적인 종료가 breaker를 건드리지 않도록 exit 구독부터 끊는다 (exit 슬롯이 같은 락을 잡으므로 락 밖에서)
  previous_exit_sub.reset();
  if (previous) {
    RCLCPP_INFO(logger(), "resampler %s: replacing pid %d", key.to_string().c_str(), previous->pid());
    previous->kill();
    previous.reset();
  }

  string error;
  ResamplerPtr process = ResamplerProcess::start(key.to_string(), config_.resampler, scheduler_, error);
  if (!process) {
    RCLCPP_ERROR(logger(), "resampler %s: spawn failed: %s", key.to_string().c_str(), error.c_str());
    lock_guard<mutex> lock(state_->mutex);
    state_->failures[key].push_back(scheduler_.now());
    return nullptr;
  }

  weak_ptr<State> weak_state = state_;
  const ResamplerProcess * raw = process.get();
  recorder_common::Subscription exit_sub = process->subscribe_exit(
    [this, weak_state, key, raw](int status) {
      if (weak_state.expired()) {
        return;
      }
      on_exit(key, raw, status);
    });

  bool exited_already = false;
  Entry raced;
  {
    lock_guard<mutex> lock(state_->mutex);
    Entry & entry = state_->entries[key];
    // 동시에 다른 spawn이 먼저 등록했으면 그 항목을 밀어낸다
    raced = move(entry);
    entry = Entry();
    entry.process = process;
    entry.exit_sub = move(exit_sub);
    exited_already = process->reaped();
  }
  raced.exit_sub.reset();
  if (raced.process) {
    raced.process->kill();
  }
  // 구독 전에 이미 죽었으면 exit 이벤트를 놓쳤으므로 직접 처리
  if (exited_already) {
    on_exit(key, raw, process->exit_status());
  }
  return process;
}

void ProcessRegistry::on_exit(const SessionSpeakerKey & key, const ResamplerProcess * process, int status)
{
  lock_guard<mutex> lock(state_->mutex);
  auto it = state_->entries.find(key);
  if (it == state_->entries.end() || it->second.process.get() != process) {
    return;
  }
  record_exit_locked(key, it->second, status);
}

void ProcessRegistry::record_exit_locked(const SessionSpeakerKey & key, Entry & entry, int status)
{
  if (entry.exit_handled) {
    return;
  }
  entry.exit_handled = true;
  const auto lifetime = scheduler_.now() - entry.process->spawned_at();
  if (lifetime >= recorder_common::seconds_to_ms(config_.early_exit_sec)) {
    return;
  }
  state_->failures[key].push_back(scheduler_.now());
  prune_failures_locked(key);
  RCLCPP_WARN(
    logger(), "resampler %s exited early (status %d), %zu recent failures",
    key.to_string().c_str(), status, state_->failures[key].size());
}

void ProcessRegistry::prune_failures_locked(const SessionSpeakerKey & key)
{
  auto it = state_->failures.find(key);
  if (it == state_->failures.end()) {
    return;
  }
  const auto cutoff = scheduler_.now() - recorder_common::seconds_to_ms(config_.breaker_window_sec);
  while (!it->second.empty() && it->second.front() < cutoff) {
    it->second.pop_front();
  }
  if (it->second.empty()) {
    state_->failures.erase(it);
  }
}

ResamplerPtr ProcessRegistry::get(const SessionSpeakerKey & key)
{
  Entry dead;
  {
    lock_guard<mutex> lock(state_->mutex);
    auto it = state_->entries.find(key);
    if (it == state_->entries.end()) {
      return nullptr;
    }
    if (it->second.process->is_alive()) {
      return it->second.process;
    }
    // 회수 직후 exit 이벤트가 오기 전에 지우면 구독이 끊기므로 여기서 실패를 센다
    if (it->second.process->reaped()) {
      record_exit_locked(key, it->second, it->second.process->exit_status());
    }
    dead = move(it->second);
    state_->entries.erase(it);
  }
  // 구독 해제와 프로세스 해제는 락 밖에서
  dead.exit_sub.reset();
  RCLCPP_DEBUG(logger(), "resampler %s: evicted dead entry", key.to_string().c_str());
  return nullptr;
}

void ProcessRegistry::kill(const SessionSpeakerKey & key)
{
  Entry victim;
  {
    lock_guard<mutex> lock(state_->mutex);
    auto it = state_->entries.find(key);
    if (it == state_->entries.end()) {
      return;
    }
    victim = move(it->second);
    state_->entries.erase(it);
  }
  victim.exit_sub.reset();
  victim.process->kill();
}

void ProcessRegistry::kill_session(const string & session_id)
{
  vector<Entry> victims;
  {
    lock_guard<mutex> lock(state_->mutex);
    for (auto it = state_->entries.begin(); it != state_->entries.end(); ) {
      if (it->first.session_id == session_id) {
        victims.push_back(move(it->second));
        it = state_->entries.erase(it);
      } else {
        ++it;
      }
    }
  }
  for (auto & v : victims) {
    v.exit_sub.reset();
    v.process->kill();
  }
}

void ProcessRegistry::kill_all()
{
  vector<Entry> victims;
  {
    lock_guard<mutex> lock(state_->mutex);
    for (auto & kv : state_->entries) {
      victims.push_back(move(kv.second));
    }
    state_->entries.clear();
  }
  if (!victims.empty()) {
    RCLCPP_INFO(logger(), "killing %zu resampler(s)", victims.size());
  }
  for (auto & v : victims) {
    v.exit_sub.reset();
    v.process->kill();
  }
}

bool ProcessRegistry::breaker_open(const SessionSpeakerKey & key)
{
  return recent_failures(key) >= config_.breaker_max_failures;
}

int ProcessRegistry::recent_failures(const SessionSpeakerKey & key)
{
  lock_guard<mutex> lock(state_->mutex);
  prune_failures_locked(key);
  auto it = state_->failures.find(key);
  return it == state_->failures.end() ? 0 : static_cast<int>(it->second.size());
}

size_t ProcessRegistry::size() const
{
  lock_guard<mutex> lock(state_->mutex);
  return state_->entries.size();
}

}  // namespace stt_gate_cpp
