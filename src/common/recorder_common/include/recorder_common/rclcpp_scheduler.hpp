#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <utility>

#include "rclcpp/rclcpp.hpp"

#include "recorder_common/scheduler.hpp"

namespace recorder_common
{

/// rclcpp wall timer 기반 Scheduler. 콜백은 노드 executor 스레드에서 실행된다.
class RclcppScheduler : public Scheduler
{
public:
  explicit RclcppScheduler(rclcpp::Node & node)
  : node_(node)
  {
  }

  Clock::time_point now() const override
  {
    return Clock::now();
  }

  std::chrono::system_clock::time_point wall_now() const override
  {
    return std::chrono::system_clock::now();
  }

  TimerPtr call_after(std::chrono::milliseconds delay, std::function<void()> callback) override
  {
    auto fired = std::make_shared<std::atomic<bool>>(false);
    auto self_timer = std::make_shared<std::weak_ptr<rclcpp::TimerBase>>();
    auto timer = node_.create_wall_timer(
      std::max(delay, std::chrono::milliseconds(1)),
      [fired, self_timer, callback]() {
        if (fired->exchange(true)) {
          return;
        }
        if (auto t = self_timer->lock()) {
          t->cancel();
        }
        callback();
      });
    *self_timer = timer;
    return TimerPtr(new WallTimerHandle(timer));
  }

  TimerPtr call_every(std::chrono::milliseconds period, std::function<void()> callback) override
  {
    auto timer = node_.create_wall_timer(
      std::max(period, std::chrono::milliseconds(1)), std::move(callback));
    return TimerPtr(new WallTimerHandle(timer));
  }

private:
  class WallTimerHandle : public TimerHandle
  {
public:
    explicit WallTimerHandle(rclcpp::TimerBase::SharedPtr timer)
    : timer_(std::move(timer))
    {
    }

    ~WallTimerHandle() override
    {
      cancel();
    }

    void cancel() override
    {
      if (timer_) {
        timer_->cancel();
        timer_.reset();
      }
    }

private:
    rclcpp::TimerBase::SharedPtr timer_;
  };

  rclcpp::Node & node_;
};

}  // namespace recorder_common
