#pragma once

#include <algorithm>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <thread>
#include <utility>
#include <vector>

namespace recorder_common
{

/// Broadcaster 구독을 해제하는 RAII 핸들
/// 소멸되거나 reset() 되면 자신이 등록한 슬롯 하나만 제거한다.
class Subscription
{
public:
  Subscription() = default;
  explicit Subscription(std::function<void()> disconnect)
  : disconnect_(std::move(disconnect))
  {
  }

  ~Subscription()
  {
    reset();
  }

  Subscription(const Subscription &) = delete;
  Subscription & operator=(const Subscription &) = delete;

  Subscription(Subscription && other) noexcept
  : disconnect_(std::move(other.disconnect_))
  {
    other.disconnect_ = nullptr;
  }

  Subscription & operator=(Subscription && other) noexcept
  {
    if (this != &other) {
      reset();
      disconnect_ = std::move(other.disconnect_);
      other.disconnect_ = nullptr;
    }
    return *this;
  }

  void reset()
  {
    if (disconnect_) {
      auto fn = std::move(disconnect_);
      disconnect_ = nullptr;
      fn();
    }
  }

  bool active() const { return static_cast<bool>(disconnect_); }

private:
  std::function<void()> disconnect_;
};

/// 여러 구독자에게 같은 이벤트를 전달하는 스레드 안전 fan-out
/// emit은 슬롯 목록을 복사한 뒤 락 밖에서 호출한다.
/// 구독 해제는 다른 스레드에서 실행 중인 같은 슬롯 호출이 끝날 때까지 기다리므로,
/// 해제가 돌아온 뒤에는 슬롯이 캡처한 객체를 안전하게 파괴할 수 있다.
/// 슬롯 안에서 자기 자신을 해제하는 것은 허용되지만, 슬롯이 잡으려는 락을 쥔 채 해제하면 안 된다.
template<typename ... Args>
class Broadcaster
{
public:
  using Slot = std::function<void(Args...)>;

  Broadcaster()
  : core_(std::make_shared<Core>())
  {
  }

  Broadcaster(const Broadcaster &) = delete;
  Broadcaster & operator=(const Broadcaster &) = delete;

  Subscription subscribe(Slot slot)
  {
    auto record = std::make_shared<Record>();
    record->slot = std::move(slot);
    uint64_t id = 0;
    {
      std::lock_guard<std::mutex> lock(core_->mutex);
      id = core_->next_id++;
      core_->slots.emplace(id, record);
    }
    std::weak_ptr<Core> weak = core_;
    return Subscription([weak, id, record]() {
        auto core = weak.lock();
        if (!core) {
          return;
        }
        std::unique_lock<std::mutex> lock(core->mutex);
        core->slots.erase(id);
        record->removed = true;
        const std::thread::id self = std::this_thread::get_id();
        core->idle.wait(lock, [&record, self]() {
            for (const auto & caller : record->callers) {
              if (caller != self) {
                return false;
              }
            }
            return true;
          });
      });
  }

  void emit(Args... args) const
  {
    std::vector<std::shared_ptr<Record>> targets;
    {
      std::lock_guard<std::mutex> lock(core_->mutex);
      targets.reserve(core_->slots.size());
      for (const auto & kv : core_->slots) {
        targets.push_back(kv.second);
      }
    }
    const std::thread::id self = std::this_thread::get_id();
    for (const auto & record : targets) {
      {
        std::lock_guard<std::mutex> lock(core_->mutex);
        if (record->removed) {
          continue;
        }
        record->callers.push_back(self);
      }
      InFlight guard(*core_, *record, self);
      record->slot(args ...);
    }
  }

  size_t subscriber_count() const
  {
    std::lock_guard<std::mutex> lock(core_->mutex);
    return core_->slots.size();
  }

private:
  struct Record
  {
    Slot slot;
    bool removed = false;
    std::vector<std::thread::id> callers;  ///< 지금 이 슬롯을 실행 중인 스레드
  };

  struct Core
  {
    std::mutex mutex;
    std::condition_variable idle;
    uint64_t next_id = 1;
    std::map<uint64_t, std::shared_ptr<Record>> slots;
  };

  /// 슬롯이 예외로 빠져나가도 호출 기록을 지운다
  class InFlight
  {
public:
    InFlight(Core & core, Record & record, std::thread::id caller)
    : core_(core), record_(record), caller_(caller)
    {
    }

    ~InFlight()
    {
      {
        std::lock_guard<std::mutex> lock(core_.mutex);
        auto it = std::find(record_.callers.begin(), record_.callers.end(), caller_);
        if (it != record_.callers.end()) {
          record_.callers.erase(it);
        }
      }
      core_.idle.notify_all();
    }

    InFlight(const InFlight &) = delete;
    InFlight & operator=(const InFlight &) = delete;

private:
    Core & core_;
    Record & record_;
    std::thread::id caller_;
  };

  std::shared_ptr<Core> core_;
};

}  // namespace recorder_common
