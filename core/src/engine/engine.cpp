/**
 * @file engine.cpp
 * @brief Core engine implementation
 */

#include "engine/engine.hpp"
#include "engine/compositor.hpp"
#include "engine/subtitles.hpp"
#include "graphics/blackboard.hpp"

#include <algorithm>
#include <atomic>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>
#include <thread>

namespace LectureEngine {

namespace {

std::string seconds(double s) {
  std::ostringstream oss;
  oss << std::fixed << std::setprecision(3) << s << "s";
  return oss.str();
}

} // anonymous namespace

// Engine implementation
struct Engine::Impl {
  EngineConfig config;
  Script script;
  bool synchronized = false;
  bool prepared = false;
  std::shared_ptr<const ImageBuffer> background;

  explicit Impl(const EngineConfig &cfg) : config(cfg) {}

  /// Config with the script's canvas and frame rate applied
  [[nodiscard]] EngineConfig stage_config() const {
    EngineConfig cfg = config;
    cfg.canvas = script.canvas;
    cfg.fps = script.fps.value_or(config.fps);
    return cfg;
  }

  const std::shared_ptr<const ImageBuffer> &ensure_background() {
    const Canvas &canvas = script.canvas;
    if (!background || background->width != canvas.width ||
        background->height != canvas.height) {
      background = std::make_shared<const ImageBuffer>(
          Graphics::generate_blackboard(canvas, config.background));
    }
    return background;
  }

  void adopt(Script parsed) {
    script = std::move(parsed);
    synchronized = false;
    prepared = false;

    if (!config.verbose)
      return;
    std::cout << "📜 Script loaded: " << script.steps.size() << " steps, "
              << script.narration.size() << " narration cues, "
              << script.canvas.width << "x" << script.canvas.height
              << std::endl;
    for (const auto &issue : script.issues) {
      std::cerr << "⚠️  " << issue.location << ": " << issue.message
                << std::endl;
    }
  }

  void log_sync(const SyncReport &report) const {
    if (!config.verbose)
      return;

    for (const auto &t : report.analysis.steps) {
      std::cout << "⏱️  Step " << t.step_id << ": " << seconds(t.original)
                << " -> " << seconds(t.revised) << " (" << std::showpos
                << t.difference_percent << std::noshowpos << "%)" << std::endl;
    }
    for (const auto &cue : report.cues) {
      std::cerr << "⚠️  Narration cue " << cue.cue_index << " "
                << cue_fallback_name(cue.kind) << " (" << seconds(cue.seconds)
                << " of audio";
      if (cue.step_id)
        std::cerr << " -> step " << *cue.step_id;
      std::cerr << ")" << std::endl;
    }
    if (report.length_mismatch) {
      std::cerr << "⚠️  " << report.cue_count << " narration cues but "
                << report.segment_count << " audio segments" << std::endl;
    }
    if (report.drift) {
      std::cerr << "⚠️  Revised total " << seconds(report.drift->revised_total)
                << " drifts from measured audio "
                << seconds(report.drift->actual_total) << " (tolerance "
                << seconds(report.drift->tolerance) << ")" << std::endl;
    }
    std::cout << "✅ Synchronized: " << seconds(report.analysis.original_total)
              << " -> " << seconds(report.analysis.revised_total) << std::endl;
  }

  void log_layout(const Step &step, const LayoutReport &report) const {
    if (!config.verbose)
      return;
    for (auto f : report.fallbacks) {
      auto &stream = f == LayoutFallback::ScaledDown ? std::cout : std::cerr;
      stream << (f == LayoutFallback::ScaledDown ? "📐 " : "⚠️  ") << "Step "
             << step.id << ": " << layout_fallback_name(f);
      if (f == LayoutFallback::ScaledDown)
        stream << " x" << std::setprecision(3) << report.scale;
      stream << std::endl;
    }
  }
};

Engine::Engine() : Engine(EngineConfig{}) {}

Engine::Engine(const EngineConfig &config)
    : pimpl_(std::make_unique<Impl>(config)) {}

Engine::~Engine() = default;

Engine::Engine(Engine &&) noexcept = default;
Engine &Engine::operator=(Engine &&) noexcept = default;

Result<bool> Engine::load_script(const std::string &script_json) {
  try {
    Script parsed = Script::from_json(script_json);
    if (!parsed.canvas_declared) {
      parsed.canvas = pimpl_->config.canvas;
    }
    pimpl_->adopt(std::move(parsed));
  } catch (const ScriptError &e) {
    if (pimpl_->config.verbose)
      std::cerr << "❌ " << e.what() << std::endl;
    return Error{e.what(), ErrorCode::InvalidDocument};
  }
  return true;
}

Result<bool> Engine::load_script_file(const std::string &path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    return Error{"cannot open script file: " + path, ErrorCode::IoError};
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  return load_script(buffer.str());
}

void Engine::set_script(Script script) { pimpl_->adopt(std::move(script)); }

const Script &Engine::script() const { return pimpl_->script; }

const EngineConfig &Engine::config() const { return pimpl_->config; }

Result<SyncReport> Engine::synchronize(std::span<const AudioSegment> segments) {
  auto outcome =
      LectureEngine::synchronize(pimpl_->script, segments, pimpl_->stage_config());
  if (!outcome) {
    if (pimpl_->config.verbose) {
      std::cerr << "❌ Synchronization failed ("
                << error_code_name(outcome.error().code)
                << "): " << outcome.error().message << std::endl;
    }
    return outcome.error();
  }

  pimpl_->script = std::move(outcome->script);
  pimpl_->synchronized = true;
  pimpl_->prepared = false;
  pimpl_->log_sync(outcome->report);
  return std::move(outcome->report);
}

Result<PrepareReport> Engine::prepare(BitmapSource &source) {
  if (pimpl_->script.steps.empty()) {
    return Error{"script has no steps", ErrorCode::NoSteps};
  }
  if (!pimpl_->synchronized && pimpl_->config.verbose) {
    std::cout << "ℹ️  Preparing without synchronization; scripted durations "
                 "are used"
              << std::endl;
  }

  const EngineConfig cfg = pimpl_->stage_config();
  Script working = pimpl_->script;

  PrepareReport report;
  report.bitmap_failures = attach_bitmaps(working, source);
  for (const auto &f : report.bitmap_failures) {
    if (pimpl_->config.verbose) {
      std::cerr << "⚠️  Step " << f.step_id << " element " << f.element
                << ": " << f.error.message << std::endl;
    }
  }

  for (auto &step : working.steps) {
    auto laid_out = layout_step(step, cfg);
    if (!laid_out) {
      if (pimpl_->config.verbose)
        std::cerr << "❌ Layout failed: " << laid_out.error().message
                  << std::endl;
      return laid_out.error();
    }
    pimpl_->log_layout(step, laid_out->report);
    step = std::move(laid_out->step);
    report.layouts.push_back(std::move(laid_out->report));
  }

  pimpl_->script = std::move(working);
  pimpl_->prepared = true;
  pimpl_->ensure_background();
  if (pimpl_->config.verbose) {
    std::cout << "✅ Prepared " << pimpl_->script.steps.size() << " steps"
              << std::endl;
  }
  return report;
}

Result<int64_t> Engine::render_step(size_t index, FrameSink &sink) {
  if (!pimpl_->prepared) {
    return Error{"prepare() must run before rendering", ErrorCode::NotPrepared};
  }
  if (index >= pimpl_->script.steps.size()) {
    return Error{"step index " + std::to_string(index) + " out of range",
                 ErrorCode::OutOfRange};
  }

  const EngineConfig cfg = pimpl_->stage_config();
  auto frames = LectureEngine::render_step(pimpl_->script.steps[index], index,
                                           pimpl_->ensure_background(),
                                           cfg.canvas, cfg.fps, sink);
  if (pimpl_->config.verbose) {
    if (frames) {
      std::cout << "🎞️  Step " << pimpl_->script.steps[index].id << ": "
                << *frames << " frames" << std::endl;
    } else {
      std::cerr << "❌ Step " << pimpl_->script.steps[index].id << ": "
                << frames.error().message << std::endl;
    }
  }
  return frames;
}

Result<int64_t> Engine::render_all(FrameSink &sink) {
  int64_t total = 0;
  for (size_t i = 0; i < pimpl_->script.steps.size(); ++i) {
    auto frames = render_step(i, sink);
    if (!frames) {
      return frames.error();
    }
    total += *frames;
  }
  return total;
}

std::vector<Result<int64_t>>
Engine::render_all_parallel(const SinkFactory &factory, unsigned threads) {
  const size_t count = pimpl_->script.steps.size();
  std::vector<std::optional<Result<int64_t>>> slots(count);

  if (!pimpl_->prepared) {
    std::vector<Result<int64_t>> results;
    for (size_t i = 0; i < count; ++i)
      results.emplace_back(
          Error{"prepare() must run before rendering", ErrorCode::NotPrepared});
    return results;
  }

  if (threads == 0)
    threads = std::max(1u, std::thread::hardware_concurrency());
  threads = static_cast<unsigned>(std::min<size_t>(threads, count));

  // Shared read-only state for the workers
  const EngineConfig cfg = pimpl_->stage_config();
  const auto background = pimpl_->ensure_background();
  const Script &script = pimpl_->script;
  std::atomic<size_t> next{0};

  auto worker = [&]() {
    for (size_t i = next.fetch_add(1); i < count; i = next.fetch_add(1)) {
      try {
        auto sink = factory(i);
        if (!sink) {
          slots[i].emplace(
              Error{"no sink for step " + std::to_string(i),
                    ErrorCode::SinkRejected});
          continue;
        }
        slots[i].emplace(LectureEngine::render_step(
            script.steps[i], i, background, cfg.canvas, cfg.fps, *sink));
      } catch (const std::exception &e) {
        slots[i].emplace(Error{std::string("step ") + std::to_string(i) +
                                   " failed: " + e.what(),
                               ErrorCode::SinkRejected});
      }
    }
  };

  std::vector<std::thread> pool;
  pool.reserve(threads);
  for (unsigned t = 0; t < threads; ++t)
    pool.emplace_back(worker);
  for (auto &thread : pool)
    thread.join();

  std::vector<Result<int64_t>> results;
  results.reserve(count);
  for (size_t i = 0; i < count; ++i) {
    results.push_back(std::move(*slots[i]));
    if (pimpl_->config.verbose && !results.back()) {
      std::cerr << "❌ Step " << script.steps[i].id << ": "
                << results.back().error().message << std::endl;
    }
  }
  if (pimpl_->config.verbose) {
    std::cout << "✅ Rendered " << count << " steps on " << threads
              << " threads" << std::endl;
  }
  return results;
}

nlohmann::json Engine::script_json() const { return pimpl_->script.to_json(); }

Result<bool> Engine::save_script(const std::string &path) const {
  std::ofstream file(path);
  if (!file.is_open()) {
    return Error{"cannot open " + path + " for writing", ErrorCode::IoError};
  }
  file << script_json().dump(2);
  if (!file) {
    return Error{"failed writing " + path, ErrorCode::IoError};
  }
  return true;
}

std::string Engine::subtitles(std::span<const AudioSegment> segments) const {
  return build_srt(pimpl_->script.narration, segments);
}

const ImageBuffer &Engine::background() const {
  return *pimpl_->ensure_background();
}

} // namespace LectureEngine
