/**
 * @file subtitles.cpp
 * @brief SRT generation
 */

#include "engine/subtitles.hpp"

#include <cmath>
#include <cstdio>
#include <sstream>

namespace LectureEngine {

std::string format_srt_time(double seconds) {
  const long long total_ms =
      seconds > 0.0 ? std::llround(seconds * 1000.0) : 0LL;
  const long long ms = total_ms % 1000;
  const long long s = (total_ms / 1000) % 60;
  const long long m = (total_ms / 60000) % 60;
  const long long h = total_ms / 3600000;

  char buf[32];
  std::snprintf(buf, sizeof(buf), "%02lld:%02lld:%02lld,%03lld", h, m, s, ms);
  return buf;
}

std::string build_srt(const std::vector<NarrationCue> &narration,
                      std::span<const AudioSegment> segments) {
  std::ostringstream out;
  for (size_t i = 0; i < segments.size(); ++i) {
    const auto &seg = segments[i];
    out << (i + 1) << "\n"
        << format_srt_time(seg.start_time) << " --> "
        << format_srt_time(seg.end_time) << "\n"
        << (i < narration.size() ? narration[i].text : std::string()) << "\n\n";
  }
  return out.str();
}

} // namespace LectureEngine
