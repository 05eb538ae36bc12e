/**
 * @file synchronizer.cpp
 * @brief Overlap-weighted redistribution of measured audio across steps
 */

#include "engine/synchronizer.hpp"
#include "core/math.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>

namespace LectureEngine {

namespace {

struct StepRange {
  double start;
  double end;

  [[nodiscard]] double midpoint() const { return 0.5 * (start + end); }
};

// Cumulative ranges under nominal durations only
std::vector<StepRange> original_timeline(const std::vector<Step> &steps) {
  std::vector<StepRange> ranges;
  ranges.reserve(steps.size());
  double cursor = 0.0;
  for (const auto &step : steps) {
    ranges.push_back({cursor, cursor + step.nominal_duration});
    cursor += step.nominal_duration;
  }
  return ranges;
}

size_t nearest_step(const std::vector<StepRange> &ranges,
                    const NarrationCue &cue) {
  const double mid = 0.5 * (cue.start + cue.end);
  size_t best = 0;
  double best_distance = std::numeric_limits<double>::infinity();
  for (size_t i = 0; i < ranges.size(); ++i) {
    const double d = std::fabs(ranges[i].midpoint() - mid);
    if (d < best_distance) {
      best_distance = d;
      best = i;
    }
  }
  return best;
}

double percent(double part, double whole) {
  return whole > 0.0 ? Math::round_to(part / whole * 100.0, 2) : 0.0;
}

void rescale_animations(Step &step, double revised, int decimals) {
  if (!(step.nominal_duration > 0.0)) {
    return;
  }
  const double factor = revised / step.nominal_duration;
  for (auto &element : step.elements) {
    if (element.animation) {
      element.animation->duration =
          Math::round_to(element.animation->nominal_duration * factor, decimals);
    }
  }
}

} // anonymous namespace

const char *cue_fallback_name(CueFallback fallback) {
  switch (fallback) {
  case CueFallback::ZeroLength:
    return "zero_length";
  case CueFallback::Unmapped:
    return "unmapped";
  case CueFallback::AssignedToLastStep:
    return "assigned_to_last_step";
  case CueFallback::AssignedToNearestStep:
    return "assigned_to_nearest_step";
  }
  return "unknown";
}

Result<SyncOutcome> synchronize(const Script &script,
                                std::span<const AudioSegment> segments,
                                const EngineConfig &config) {
  if (script.steps.empty()) {
    return Error{"script has no steps", ErrorCode::NoSteps};
  }
  if (script.narration.empty() || segments.empty()) {
    return Error{"no narration cues or measured audio segments",
                 ErrorCode::NoNarration};
  }

  SyncReport report;
  report.cue_count = script.narration.size();
  report.segment_count = segments.size();
  report.length_mismatch = report.cue_count != report.segment_count;

  const auto ranges = original_timeline(script.steps);
  std::vector<double> accumulated(script.steps.size(), 0.0);
  std::vector<double> overlaps(script.steps.size(), 0.0);

  const size_t count = std::min(report.cue_count, report.segment_count);
  double actual_total = 0.0;

  for (size_t i = 0; i < count; ++i) {
    const NarrationCue &cue = script.narration[i];
    const double audio = Math::max(0.0, segments[i].duration);
    actual_total += audio;

    CueFallback kind = CueFallback::ZeroLength;
    if (cue.length() > 0.0) {
      double total_overlap = 0.0;
      for (size_t s = 0; s < ranges.size(); ++s) {
        overlaps[s] =
            Math::overlap(cue.start, cue.end, ranges[s].start, ranges[s].end);
        total_overlap += overlaps[s];
      }

      if (total_overlap > 0.0) {
        for (size_t s = 0; s < ranges.size(); ++s) {
          accumulated[s] += audio * (overlaps[s] / total_overlap);
        }
        continue;
      }
      kind = CueFallback::Unmapped;
    }

    // Zero-length or unmapped from here on
    const bool final_cue = i + 1 == count;
    if (final_cue) {
      accumulated.back() += audio;
      report.cues.push_back({i, CueFallback::AssignedToLastStep, audio,
                             script.steps.back().id});
    } else if (kind == CueFallback::Unmapped &&
               config.unmapped_cue_policy == UnmappedCuePolicy::NearestStep) {
      const size_t target = nearest_step(ranges, cue);
      accumulated[target] += audio;
      report.cues.push_back({i, CueFallback::AssignedToNearestStep, audio,
                             script.steps[target].id});
    } else {
      report.cues.push_back({i, kind, audio, std::nullopt});
    }
  }

  SyncOutcome outcome{script, {}};
  double revised_total = 0.0;
  for (size_t s = 0; s < outcome.script.steps.size(); ++s) {
    Step &step = outcome.script.steps[s];
    const double revised =
        Math::round_to(Math::max(config.min_step_duration, accumulated[s]),
                       config.duration_decimals);
    step.duration = revised;
    rescale_animations(step, revised, config.duration_decimals);
    report.revised[step.id] = revised;
    revised_total += revised;
  }

  const double tolerance = config.drift_tolerance(actual_total);
  if (std::fabs(revised_total - actual_total) > tolerance) {
    report.drift = DriftWarning{revised_total, actual_total, tolerance};
  }

  if (config.strict) {
    if (!report.cues.empty()) {
      const auto &first = report.cues.front();
      return Error{"cue " + std::to_string(first.cue_index) + " needed fallback " +
                       cue_fallback_name(first.kind),
                   ErrorCode::StrictFallback};
    }
    if (report.length_mismatch) {
      return Error{"narration cue count " + std::to_string(report.cue_count) +
                       " differs from audio segment count " +
                       std::to_string(report.segment_count),
                   ErrorCode::StrictFallback};
    }
    if (report.drift) {
      return Error{"revised total " + std::to_string(revised_total) +
                       "s drifts from measured audio " +
                       std::to_string(actual_total) + "s",
                   ErrorCode::StrictFallback};
    }
  }

  // Segments past the last cue were never credited, so they stay out of the
  // measured total just as they stay out of the drift check
  report.analysis = analyze_timing(outcome.script, segments.first(count));
  outcome.report = std::move(report);
  return outcome;
}

TimingAnalysis analyze_timing(const Script &synchronized,
                              std::span<const AudioSegment> segments) {
  TimingAnalysis analysis;
  for (const auto &step : synchronized.steps) {
    StepTiming timing;
    timing.step_id = step.id;
    timing.title = step.title;
    timing.original = step.nominal_duration;
    timing.revised = step.duration;
    timing.difference = Math::round_to(step.duration - step.nominal_duration, 3);
    timing.difference_percent =
        percent(step.duration - step.nominal_duration, step.nominal_duration);
    analysis.original_total += timing.original;
    analysis.revised_total += timing.revised;
    analysis.steps.push_back(std::move(timing));
  }

  analysis.actual_total = std::accumulate(
      segments.begin(), segments.end(), 0.0,
      [](double acc, const AudioSegment &s) {
        return acc + Math::max(0.0, s.duration);
      });
  analysis.difference =
      Math::round_to(analysis.revised_total - analysis.original_total, 3);
  analysis.difference_percent =
      percent(analysis.revised_total - analysis.original_total,
              analysis.original_total);
  return analysis;
}

} // namespace LectureEngine
