#pragma once
/**
 * @file subtitles.hpp
 * @brief SRT subtitle text from narration and measured audio timing
 */

#include "engine/script.hpp"

#include <span>
#include <string>
#include <vector>

namespace LectureEngine {

/// Seconds as an SRT timestamp, HH:MM:SS,mmm (negative clamps to zero)
[[nodiscard]] std::string format_srt_time(double seconds);

/**
 * @brief Build SRT subtitles
 *
 * One entry per measured segment, timed by the segment and captioned with
 * the narration text at the same index (empty when there is none).
 */
[[nodiscard]] std::string build_srt(const std::vector<NarrationCue> &narration,
                                    std::span<const AudioSegment> segments);

} // namespace LectureEngine
