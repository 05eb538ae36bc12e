#pragma once
/**
 * @file synchronizer.hpp
 * @brief Duration synchronizer: reconcile scripted step timing with measured
 * narration audio
 *
 * Every measured audio segment is distributed across the steps its narration
 * cue overlaps on the *original* timeline (built from nominal durations), in
 * proportion to the overlap. The revised duration of a step is the audio it
 * accumulated, floored at EngineConfig::min_step_duration. Element animation
 * durations are rescaled by revised / nominal so animations keep their pace.
 *
 * Must run for all steps before any layout or rendering begins.
 */

#include "core/result.hpp"
#include "engine/config.hpp"
#include "engine/script.hpp"

#include <cstddef>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace LectureEngine {

/// Fallbacks taken for individual narration cues
enum class CueFallback {
  ZeroLength,            ///< cue has no extent; audio dropped
  Unmapped,              ///< cue overlaps no step; audio dropped
  AssignedToLastStep,    ///< final zero-length/unmapped cue credited to last step
  AssignedToNearestStep  ///< unmapped cue credited to nearest step midpoint
};

const char *cue_fallback_name(CueFallback fallback);

/// One fallback applied while distributing audio
struct CueDiagnostic {
  size_t cue_index = 0;
  CueFallback kind = CueFallback::Unmapped;
  double seconds = 0.0;          ///< measured audio affected
  std::optional<int> step_id;    ///< receiving step, when reassigned
};

/// Revised total strayed from the measured total beyond tolerance
struct DriftWarning {
  double revised_total = 0.0;
  double actual_total = 0.0;
  double tolerance = 0.0;
};

/// Per-step comparison of nominal and revised timing
struct StepTiming {
  int step_id = 0;
  std::string title;
  double original = 0.0;
  double revised = 0.0;
  double difference = 0.0;
  double difference_percent = 0.0;
};

/// Timing comparison for the whole script
struct TimingAnalysis {
  std::vector<StepTiming> steps;
  double original_total = 0.0;
  double revised_total = 0.0;
  double actual_total = 0.0;
  double difference = 0.0;          ///< revised_total - original_total
  double difference_percent = 0.0;
};

/// Everything the synchronizer decided, for logging and tests
struct SyncReport {
  std::map<int, double> revised;     ///< step id -> revised seconds
  std::vector<CueDiagnostic> cues;
  std::optional<DriftWarning> drift;
  bool length_mismatch = false;      ///< cue and segment counts differ
  size_t cue_count = 0;
  size_t segment_count = 0;
  TimingAnalysis analysis;
};

/// Synchronized script plus the report describing it
struct SyncOutcome {
  Script script;
  SyncReport report;
};

/**
 * @brief Revise step durations from measured narration audio
 *
 * Pure: the input script is not modified. Fails with NoSteps / NoNarration
 * when timing cannot be established, and with StrictFallback when
 * config.strict is set and any fallback or drift warning fires.
 */
[[nodiscard]] Result<SyncOutcome>
synchronize(const Script &script, std::span<const AudioSegment> segments,
            const EngineConfig &config);

/// Build the per-step and total timing comparison; actual_total sums the
/// given segments, so pass only those matched to narration cues
[[nodiscard]] TimingAnalysis analyze_timing(const Script &synchronized,
                                            std::span<const AudioSegment> segments);

} // namespace LectureEngine
