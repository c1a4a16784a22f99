#pragma once

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>

#include "stt_gate_cpp/stt_types.hpp"

namespace stt_gate_cpp
{

using EngineFactory = std::function<std::shared_ptr<SttEngine>(const SttConfig &)>;

class EngineRegistry;

/// 엔진 참조 하나. 소멸하거나 release() 하면 참조 카운트를 돌려준다.
class EngineLease
{
public:
  EngineLease() = default;
  ~EngineLease();

  EngineLease(const EngineLease &) = delete;
  EngineLease & operator=(const EngineLease &) = delete;
  EngineLease(EngineLease && other) noexcept;
  EngineLease & operator=(EngineLease && other) noexcept;

  const std::shared_ptr<SttEngine> & engine() const { return engine_; }
  explicit operator bool() const { return static_cast<bool>(engine_); }
  void release();

private:
  friend class EngineRegistry;
  using Releaser = std::function<void()>;

  EngineLease(std::shared_ptr<SttEngine> engine, Releaser releaser);

  std::shared_ptr<SttEngine> engine_;
  Releaser releaser_;
};

/// (engine, model)마다 엔진 하나를 세션들이 나눠 쓰도록 참조 카운트로 관리
class EngineRegistry
{
public:
  /// factory가 비어 있으면 HttpSttEngine을 만든다
  explicit EngineRegistry(EngineFactory factory = EngineFactory());

  EngineLease acquire(const SttConfig & config);

  size_t engine_count() const;
  int ref_count(const std::string & engine, const std::string & model) const;

private:
  struct Entry
  {
    std::shared_ptr<SttEngine> engine;
    int refs = 0;
  };

  struct Core
  {
    std::mutex mutex;
    std::map<std::string, Entry> entries;
  };

  static std::string make_key(const std::string & engine, const std::string & model);

  EngineFactory factory_;
  std::shared_ptr<Core> core_;
};

}  // namespace stt_gate_cpp
