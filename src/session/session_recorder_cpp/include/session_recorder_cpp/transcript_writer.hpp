#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <string>

#include "stt_gate_cpp/stt_types.hpp"
#include "voice_record_cpp/recording_store.hpp"

namespace session_recorder_cpp
{

/// STT 결과를 저장소에 기록한다. interim -> final 갱신은 upsert 키로 처리
/// 화자별로 현재 burst를 캐시해 interim마다 DB를 조회하지 않는다.
class TranscriptWriter
{
public:
  TranscriptWriter(const std::string & session_id, voice_record_cpp::RecordingStore & store);

  /// 재입장으로 track이 바뀌면 burst 캐시도 버린다
  void set_track(const std::string & speaker, int64_t track_id);
  /// 저장된 row id, 등록되지 않은 화자면 -1
  int64_t write(const stt_gate_cpp::TranscriptEvent & event);

  bool has_track(const std::string & speaker) const;

private:
  struct CachedBurst
  {
    bool found = false;
    int64_t burst_id = -1;
    std::string start;
    std::string end;   ///< open burst이면 빈 문자열
  };

  int64_t burst_for(const std::string & speaker, int64_t track_id, const std::string & at);
  static bool in_range(const std::string & at, const CachedBurst & burst);

  std::string session_id_;
  voice_record_cpp::RecordingStore & store_;

  mutable std::mutex mutex_;
  std::map<std::string, int64_t> tracks_;
  std::map<std::string, CachedBurst> burst_cache_;
};

}  // namespace session_recorder_cpp
