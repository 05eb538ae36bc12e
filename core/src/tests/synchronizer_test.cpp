/**
 * @file synchronizer_test.cpp
 * @brief Duration synchronizer: overlap weighting, floors, fallbacks, drift
 */

#include "engine/synchronizer.hpp"
#include "testing/test_support.hpp"

#include <vector>

using namespace LectureEngine;
using LectureEngine::Testing::TestSuite;
using LectureEngine::Testing::make_step;

namespace {

Script make_script(std::vector<double> durations,
                   std::vector<NarrationCue> narration) {
  Script script;
  int id = 1;
  for (double d : durations) {
    script.steps.push_back(make_step(id++, d));
  }
  script.narration = std::move(narration);
  return script;
}

AudioSegment segment(double start, double duration) {
  return {start, start + duration, duration};
}

EngineConfig quiet_config() {
  EngineConfig config;
  config.verbose = false;
  return config;
}

void test_two_step_redistribution(TestSuite &suite) {
  // One cue over [1, 4): 2s in step 1, 1s in step 2
  Script script = make_script({3.0, 2.0}, {{"spans both", 1.0, 4.0}});
  const std::vector<AudioSegment> audio{segment(0.0, 6.0)};

  auto outcome = synchronize(script, audio, quiet_config());
  suite.check("synchronizes", outcome.has_value());
  if (!outcome)
    return;

  suite.check_near("step 1 gets two thirds", outcome->script.steps[0].duration, 4.0);
  suite.check_near("step 2 gets one third", outcome->script.steps[1].duration, 2.0);
  suite.check_near("revised map", outcome->report.revised.at(2), 2.0);
  suite.check("no drift when every step is covered", !outcome->report.drift);
  suite.check("no cue fallbacks", outcome->report.cues.empty());
  suite.check_near("total conserved", outcome->script.total_duration(), 6.0);
  suite.check("input left untouched", script.steps[0].duration == 3.0);
  suite.check_near("nominal kept", outcome->script.steps[0].nominal_duration, 3.0);

  // Re-run against the synchronized script: boundaries come from nominal
  auto again = synchronize(outcome->script, audio, quiet_config());
  suite.check("second pass succeeds", again.has_value());
  if (again) {
    suite.check("second pass is identical",
                again->script.steps[0].duration == 4.0 &&
                    again->script.steps[1].duration == 2.0);
  }
}

void test_timing_analysis(TestSuite &suite) {
  Script script = make_script({3.0, 2.0}, {{"spans both", 1.0, 4.0}});
  script.steps[0].title = "Setup";
  const std::vector<AudioSegment> audio{segment(0.0, 6.0)};

  auto outcome = synchronize(script, audio, quiet_config());
  if (!outcome) {
    suite.check("analysis run", false, outcome.error().message);
    return;
  }

  const TimingAnalysis &a = outcome->report.analysis;
  suite.check("one row per step", a.steps.size() == 2);
  suite.check("row carries title", a.steps[0].title == "Setup");
  suite.check_near("step difference", a.steps[0].difference, 1.0);
  suite.check_near("step percent", a.steps[0].difference_percent, 33.33);
  suite.check_near("original total", a.original_total, 5.0);
  suite.check_near("revised total", a.revised_total, 6.0);
  suite.check_near("actual total", a.actual_total, 6.0);
  suite.check_near("total percent", a.difference_percent, 20.0);
}

void test_floor(TestSuite &suite) {
  // Step 2 receives no narration at all
  Script script = make_script({2.0, 2.0}, {{"first only", 0.0, 2.0}});
  const std::vector<AudioSegment> audio{segment(0.0, 3.0)};

  EngineConfig config = quiet_config();
  auto outcome = synchronize(script, audio, config);
  suite.check("floor run", outcome.has_value());
  if (!outcome)
    return;
  suite.check_near("covered step", outcome->script.steps[0].duration, 3.0);
  suite.check_near("uncovered step floored", outcome->script.steps[1].duration,
                   config.min_step_duration);

  config.min_step_duration = 0.5;
  auto raised = synchronize(script, audio, config);
  suite.check("configurable floor",
              raised && raised->script.steps[1].duration == 0.5);
}

void test_animation_rescale(TestSuite &suite) {
  Script script = make_script({3.0, 2.0}, {{"spans both", 1.0, 4.0}});
  Element element =
      Testing::make_element("x", 10, 10, script.canvas);
  element.animation = Animation{};
  element.animation->enter = EnterKind::FadeIn;
  element.animation->duration = 1.5;
  element.animation->nominal_duration = 1.5;
  script.steps[0].elements.push_back(element);

  const std::vector<AudioSegment> audio{segment(0.0, 6.0)};
  auto outcome = synchronize(script, audio, quiet_config());
  suite.check("rescale run", outcome.has_value());
  if (!outcome)
    return;
  const auto &anim = outcome->script.steps[0].elements[0].animation;
  suite.check_near("animation keeps its pace", anim->duration, 2.0);
  suite.check_near("animation nominal kept", anim->nominal_duration, 1.5);

  auto again = synchronize(outcome->script, audio, quiet_config());
  suite.check("rescale is not compounded",
              again && again->script.steps[0].elements[0].animation->duration ==
                           2.0);
}

void test_terminal_failures(TestSuite &suite) {
  const std::vector<AudioSegment> audio{segment(0.0, 1.0)};

  Script empty = make_script({}, {{"orphan", 0.0, 1.0}});
  auto no_steps = synchronize(empty, audio, quiet_config());
  suite.check("no steps is terminal",
              !no_steps && no_steps.error().code == ErrorCode::NoSteps);

  Script silent = make_script({1.0}, {});
  auto no_cues = synchronize(silent, audio, quiet_config());
  suite.check("no narration is terminal",
              !no_cues && no_cues.error().code == ErrorCode::NoNarration);

  Script spoken = make_script({1.0}, {{"hello", 0.0, 1.0}});
  auto no_audio = synchronize(spoken, {}, quiet_config());
  suite.check("no audio is terminal",
              !no_audio && no_audio.error().code == ErrorCode::NoNarration);
}

void test_unmapped_cue(TestSuite &suite) {
  // Cue 0 lies beyond the script; cue 1 covers the only step
  Script script = make_script({2.0}, {{"too late", 10.0, 12.0},
                                      {"on time", 0.0, 2.0}});
  const std::vector<AudioSegment> audio{segment(0.0, 5.0), segment(5.0, 1.0)};

  auto dropped = synchronize(script, audio, quiet_config());
  suite.check("drop run", dropped.has_value());
  if (dropped) {
    suite.check("unmapped cue reported",
                dropped->report.cues.size() == 1 &&
                    dropped->report.cues[0].kind == CueFallback::Unmapped &&
                    dropped->report.cues[0].cue_index == 0 &&
                    !dropped->report.cues[0].step_id);
    suite.check_near("dropped audio not credited",
                     dropped->script.steps[0].duration, 1.0);
    suite.check("drift detected", dropped->report.drift.has_value());
    if (dropped->report.drift) {
      suite.check_near("drift actual total", dropped->report.drift->actual_total,
                       6.0);
      suite.check_near("drift tolerance", dropped->report.drift->tolerance, 1.0);
    }
  }

  EngineConfig nearest = quiet_config();
  nearest.unmapped_cue_policy = UnmappedCuePolicy::NearestStep;
  auto assigned = synchronize(script, audio, nearest);
  suite.check("nearest-step run", assigned.has_value());
  if (assigned) {
    suite.check("cue reassigned",
                assigned->report.cues.size() == 1 &&
                    assigned->report.cues[0].kind ==
                        CueFallback::AssignedToNearestStep &&
                    assigned->report.cues[0].step_id == std::optional<int>(1));
    suite.check_near("all audio credited", assigned->script.steps[0].duration,
                     6.0);
    suite.check("no drift after reassignment", !assigned->report.drift);
  }

  EngineConfig strict = quiet_config();
  strict.strict = true;
  auto rejected = synchronize(script, audio, strict);
  suite.check("strict mode rejects the fallback",
              !rejected && rejected.error().code == ErrorCode::StrictFallback);
}

void test_nearest_midpoint(TestSuite &suite) {
  // Steps [0,2) and [2,6); cue [7,8) sits closest to step 2's midpoint
  Script script = make_script({2.0, 4.0}, {{"after", 7.0, 8.0},
                                           {"first", 0.0, 2.0},
                                           {"second", 2.0, 6.0}});
  const std::vector<AudioSegment> audio{segment(0.0, 1.0), segment(1.0, 2.0),
                                        segment(3.0, 4.0)};
  EngineConfig config = quiet_config();
  config.unmapped_cue_policy = UnmappedCuePolicy::NearestStep;

  auto outcome = synchronize(script, audio, config);
  suite.check("midpoint run", outcome.has_value());
  if (outcome) {
    suite.check("nearest midpoint wins",
                outcome->report.cues.size() == 1 &&
                    outcome->report.cues[0].step_id == std::optional<int>(2));
    suite.check_near("step 2 accumulates", outcome->script.steps[1].duration, 5.0);
  }
}

void test_final_cue(TestSuite &suite) {
  // The last cue has no extent; its audio goes to the last step
  Script script = make_script({2.0, 2.0}, {{"intro", 0.0, 2.0},
                                           {"closing", 3.0, 3.0}});
  const std::vector<AudioSegment> audio{segment(0.0, 2.0), segment(2.0, 1.5)};

  auto outcome = synchronize(script, audio, quiet_config());
  suite.check("final cue run", outcome.has_value());
  if (!outcome)
    return;
  suite.check("assigned to last step",
              outcome->report.cues.size() == 1 &&
                  outcome->report.cues[0].kind ==
                      CueFallback::AssignedToLastStep &&
                  outcome->report.cues[0].step_id == std::optional<int>(2));
  suite.check_near("last step credited", outcome->script.steps[1].duration, 1.5);

  // A zero-length cue elsewhere is dropped
  Script middle = make_script({2.0, 2.0}, {{"blip", 1.0, 1.0},
                                           {"rest", 0.0, 4.0}});
  auto dropped = synchronize(middle, audio, quiet_config());
  suite.check("zero-length cue dropped",
              dropped && dropped->report.cues.size() == 1 &&
                  dropped->report.cues[0].kind == CueFallback::ZeroLength);
}

void test_length_mismatch(TestSuite &suite) {
  Script script = make_script({2.0, 2.0}, {{"a", 0.0, 2.0}, {"b", 2.0, 4.0}});
  const std::vector<AudioSegment> audio{segment(0.0, 2.5)};

  auto outcome = synchronize(script, audio, quiet_config());
  suite.check("mismatch run", outcome.has_value());
  if (outcome) {
    suite.check("mismatch flagged", outcome->report.length_mismatch &&
                                        outcome->report.cue_count == 2 &&
                                        outcome->report.segment_count == 1);
    suite.check_near("aligned prefix used", outcome->script.steps[0].duration,
                     2.5);
    suite.check_near("unmatched cue contributes nothing",
                     outcome->script.steps[1].duration, 0.1);
  }

  EngineConfig strict = quiet_config();
  strict.strict = true;
  auto rejected = synchronize(script, audio, strict);
  suite.check("strict mode rejects mismatch",
              !rejected && rejected.error().code == ErrorCode::StrictFallback);

  // A trailing segment with no cue is left out of every measured total
  Script single = make_script({2.0}, {{"a", 0.0, 2.0}});
  const std::vector<AudioSegment> extra{segment(0.0, 2.5), segment(2.5, 4.0)};
  auto surplus = synchronize(single, extra, quiet_config());
  suite.check("surplus segment run", surplus.has_value());
  if (surplus) {
    suite.check("surplus segment flagged", surplus->report.length_mismatch);
    suite.check_near("analysis total matches credited audio",
                     surplus->report.analysis.actual_total, 2.5);
    suite.check("no drift against credited audio", !surplus->report.drift);
  }
}

void test_rounding(TestSuite &suite) {
  // Three equal steps share 1s of audio
  Script script = make_script({1.0, 1.0, 1.0}, {{"all", 0.0, 3.0}});
  const std::vector<AudioSegment> audio{segment(0.0, 1.0)};

  auto outcome = synchronize(script, audio, quiet_config());
  suite.check("rounding run", outcome.has_value());
  if (outcome) {
    suite.check_near("rounded to milliseconds",
                     outcome->script.steps[0].duration, 0.333);
  }
}

} // anonymous namespace

int main() {
  TestSuite suite("Duration Synchronizer Tests");

  suite.run("redistribution", [&] { test_two_step_redistribution(suite); });
  suite.run("timing analysis", [&] { test_timing_analysis(suite); });
  suite.run("floor", [&] { test_floor(suite); });
  suite.run("animation rescale", [&] { test_animation_rescale(suite); });
  suite.run("terminal failures", [&] { test_terminal_failures(suite); });
  suite.run("unmapped cue", [&] { test_unmapped_cue(suite); });
  suite.run("nearest midpoint", [&] { test_nearest_midpoint(suite); });
  suite.run("final cue", [&] { test_final_cue(suite); });
  suite.run("length mismatch", [&] { test_length_mismatch(suite); });
  suite.run("rounding", [&] { test_rounding(suite); });

  return suite.finish();
}
