#pragma once

#include <cstdint>
#include <functional>
#include <vector>

#include "recorder_common/broadcaster.hpp"

namespace stt_gate_cpp
{

/// 16 kHz mono s16le PCM 공급원 (resampler 프로세스, 테스트용 가짜)
class PcmSource
{
public:
  using PcmCallback = std::function<void(const std::vector<uint8_t> &)>;

  virtual ~PcmSource() = default;
  virtual recorder_common::Subscription subscribe_pcm(PcmCallback callback) = 0;
  virtual bool is_alive() const = 0;
};

}  // namespace stt_gate_cpp
