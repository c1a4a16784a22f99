#pragma once

#include <string>

#include "recorder_common/broadcaster.hpp"

namespace recorder_common
{

/// 화자별 발화 시작/종료 이벤트 공용 소스
/// burst tracker와 STT processor가 각자 구독하며, 구독 해제는 자신의 슬롯에만 영향을 준다.
struct SpeakingSignals
{
  Broadcaster<const std::string &> speaking_start;
  Broadcaster<const std::string &> speaking_end;
};

}  // namespace recorder_common
