#include "stt_gate_cpp/engine_registry.hpp"

#include <utility>

#include "rclcpp/rclcpp.hpp"

#include "stt_gate_cpp/http_stt_engine.hpp"

using namespace std;


namespace stt_gate_cpp
{

EngineLease::EngineLease(shared_ptr<SttEngine> engine, Releaser releaser)
: engine_(move(engine)), releaser_(move(releaser))
{
}

EngineLease::~EngineLease()
{
  release();
}

EngineLease::EngineLease(EngineLease && other) noexcept
: engine_(move(other.engine_)), releaser_(move(other.releaser_))
{
  other.releaser_ = nullptr;
}

EngineLease & EngineLease::operator=(EngineLease && other) noexcept
{
  if (this != &other) {
    release();
    engine_ = move(other.engine_);
    releaser_ = move(other.releaser_);
    other.releaser_ = nullptr;
  }
  return *this;
}

void EngineLease::release()
{
  // 엔진 참조를 먼저 놓아야 마지막 lease에서 엔진이 실제로 소멸한다
  engine_.reset();
  if (releaser_) {
    auto fn = move(releaser_);
    releaser_ = nullptr;
    fn();
  }
}

EngineRegistry::EngineRegistry(EngineFactory factory)
: factory_(move(factory)), core_(make_shared<Core>())
{
  if (!factory_) {
    factory_ = [](const SttConfig & config) -> shared_ptr<SttEngine> {
        return make_shared<HttpSttEngine>(config);
      };
  }
}

string EngineRegistry::make_key(const string & engine, const string & model)
{
  return engine + "/" + model;
}

EngineLease EngineRegistry::acquire(const SttConfig & config)
{
  const string key = make_key(config.engine, config.model);
  shared_ptr<SttEngine> engine;
  {
    lock_guard<mutex> lock(core_->mutex);
    Entry & entry = core_->entries[key];
    if (!entry.engine) {
      entry.engine = factory_(config);
      RCLCPP_INFO(rclcpp::get_logger("stt_gate_cpp"), "engine %s created", key.c_str());
    }
    ++entry.refs;
    engine = entry.engine;
  }

  weak_ptr<Core> weak = core_;
  return EngineLease(
    engine, [weak, key]() {
      auto core = weak.lock();
      if (!core) {
        return;
      }
      shared_ptr<SttEngine> last;
      {
        lock_guard<mutex> lock(core->mutex);
        auto it = core->entries.find(key);
        if (it == core->entries.end()) {
          return;
        }
        if (--it->second.refs <= 0) {
          last = move(it->second.engine);
          core->entries.erase(it);
        }
      }
      if (last) {
        RCLCPP_INFO(rclcpp::get_logger("stt_gate_cpp"), "engine %s released", key.c_str());
      }
    });
}

size_t EngineRegistry::engine_count() const
{
  lock_guard<mutex> lock(core_->mutex);
  return core_->entries.size();
}

int EngineRegistry::ref_count(const string & engine, const string & model) const
{
  lock_guard<mutex> lock(core_->mutex);
  auto it = core_->entries.find(make_key(engine, model));
  return it == core_->entries.end() ? 0 : it->second.refs;
}

}  // namespace stt_gate_cpp
