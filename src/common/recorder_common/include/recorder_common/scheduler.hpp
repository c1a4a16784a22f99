#pragma once

#include <chrono>
#include <functional>
#include <memory>

namespace recorder_common
{

/// 예약된 타이머 하나. 핸들이 소멸하면 타이머도 취소된다.
class TimerHandle
{
public:
  virtual ~TimerHandle() = default;
  virtual void cancel() = 0;
};

using TimerPtr = std::unique_ptr<TimerHandle>;

/// 시간 소스 + 타이머 팩토리
/// 노드에서는 rclcpp wall timer, 테스트에서는 수동으로 진행하는 가짜 시계를 쓴다.
class Scheduler
{
public:
  using Clock = std::chrono::steady_clock;

  virtual ~Scheduler() = default;

  virtual Clock::time_point now() const = 0;
  virtual std::chrono::system_clock::time_point wall_now() const = 0;

  /// delay 후 한 번 호출
  virtual TimerPtr call_after(std::chrono::milliseconds delay, std::function<void()> callback) = 0;
  /// period마다 반복 호출
  virtual TimerPtr call_every(std::chrono::milliseconds period, std::function<void()> callback) = 0;
};

/// 초 단위 설정값을 타이머 주기로 변환
inline std::chrono::milliseconds seconds_to_ms(double seconds)
{
  return std::chrono::milliseconds(static_cast<long long>(seconds * 1000.0));
}

}  // namespace recorder_common
