#include "hydrate_cpp/track_assembler.hpp"

#include <recorder_common/time_utils.hpp>

#include <algorithm>

#include "rclcpp/rclcpp.hpp"

using namespace std;


namespace hydrate_cpp
{

namespace
{

rclcpp::Logger logger()
{
  return rclcpp::get_logger("hydrate_cpp");
}

int64_t to_ms(const string & iso)
{
  recorder_common::WallClock::time_point tp;
  if (!recorder_common::parse_iso8601(iso, tp)) {
    return -1;
  }
  return recorder_common::to_epoch_ms(tp);
}

}  // namespace

bool write_silence(voice_record_cpp::ByteSink & out, uint64_t bytes)
{
  static const vector<uint8_t> chunk(kSilenceChunkSize, 0);
  uint64_t remaining = bytes;
  while (remaining > 0) {
    const size_t n = static_cast<size_t>(min<uint64_t>(remaining, kSilenceChunkSize));
    if (!out.write(chunk.data(), n)) {
      return false;
    }
    remaining -= n;
  }
  return true;
}

bool assemble_track(
  const vector<uint8_t> & decoded, const string & first_packet_at,
  vector<voice_record_cpp::BurstRow> bursts, const HydrateOptions & options,
  voice_record_cpp::ByteSink & out, AssemblyReport & report)
{
  const int64_t anchor_ms = to_ms(first_packet_at);
  if (anchor_ms < 0) {
    report.error = "invalid first_packet_at: " + first_packet_at;
    return false;
  }

  const uint64_t decoded_size = decoded.size();
  report.decoded_frames = decoded_size / kBytesPerFrame;
  const uint64_t max_silence = static_cast<uint64_t>(options.max_gap_seconds * kBytesPerSecond);

  // 저장소가 정렬해 주지만 시각 기준으로 한 번 더 정렬
  stable_sort(
    bursts.begin(), bursts.end(),
    [](const voice_record_cpp::BurstRow & a, const voice_record_cpp::BurstRow & b) {
      return to_ms(a.burst_start) < to_ms(b.burst_start);
    });

  uint64_t written = 0;
  for (const auto & burst : bursts) {
    const int64_t start_ms = to_ms(burst.burst_start);
    if (start_ms < 0) {
      RCLCPP_WARN(logger(), "burst %ld: unparsable start '%s', skipping",
        static_cast<long>(burst.id), burst.burst_start.c_str());
      ++report.bursts_skipped;
      continue;
    }

    const int64_t offset_ms = start_ms - anchor_ms;
    int64_t target = offset_ms * static_cast<int64_t>(kBytesPerSecond) / 1000;
    if (target < 0) {
      target = 0;
    }
    const uint64_t aligned = static_cast<uint64_t>(target) - static_cast<uint64_t>(target) % kBytesPerFrame;

    if (aligned > written) {
      uint64_t silence = aligned - written;
      if (options.clamp && silence > max_silence) {
        RCLCPP_WARN(
          logger(), "burst %ld: silence gap %.1f s exceeds %.0f s cap, clamping",
          static_cast<long>(burst.id), static_cast<double>(silence) / kBytesPerSecond,
          options.max_gap_seconds);
        silence = max_silence;
        ++report.clamped_gaps;
      }
      if (!write_silence(out, silence)) {
        report.error = "write failed while inserting silence";
        return false;
      }
      written += silence;
      report.silence_bytes += silence;
    }

    // 닫히지 않은 burst(크래시 복구)는 디코딩 끝까지 사용
    const uint64_t start_frame = static_cast<uint64_t>(max<int64_t>(0, burst.start_frame_offset));
    const uint64_t end_frame = burst.closed ?
      static_cast<uint64_t>(max<int64_t>(0, burst.end_frame_offset)) : report.decoded_frames;

    if (end_frame > report.decoded_frames) {
      RCLCPP_WARN(
        logger(), "burst %ld: end frame %lu exceeds decoded frames %lu, possible tracking drift",
        static_cast<long>(burst.id), static_cast<unsigned long>(end_frame),
        static_cast<unsigned long>(report.decoded_frames));
      ++report.offset_overruns;
    }
    if (start_frame > report.decoded_frames) {
      RCLCPP_WARN(
        logger(), "burst %ld: start frame %lu exceeds decoded frames %lu, skipping",
        static_cast<long>(burst.id), static_cast<unsigned long>(start_frame),
        static_cast<unsigned long>(report.decoded_frames));
      ++report.bursts_skipped;
      continue;
    }

    const uint64_t begin = min(start_frame * kBytesPerFrame, decoded_size);
    const uint64_t end = min(end_frame * kBytesPerFrame, decoded_size);
    if (begin >= end) {
      continue;
    }
    if (!out.write(decoded.data() + begin, static_cast<size_t>(end - begin))) {
      report.error = "write failed while copying burst audio";
      return false;
    }
    written += end - begin;
    report.audio_bytes += end - begin;
    ++report.bursts_written;
  }

  report.total_bytes = written;
  return true;
}

}  // namespace hydrate_cpp
