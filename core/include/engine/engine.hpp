#pragma once
/**
 * @file engine.hpp
 * @brief Core Lecture Engine interface
 *
 * Drives one lecture through the stages in order: load the script,
 * synchronize every step against measured narration audio, attach bitmaps
 * and lay out each step, then render steps into frame sinks. Stage reports
 * are logged here; the stages themselves never print.
 */

#include "core/result.hpp"
#include "engine/bitmap_source.hpp"
#include "engine/config.hpp"
#include "engine/layout.hpp"
#include "engine/script.hpp"
#include "engine/synchronizer.hpp"
#include "graphics/image_buffer.hpp"
#include "output/frame_sink.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <functional>
#include <memory>
#include <span>
#include <string>
#include <vector>

namespace LectureEngine {

/// Outcome of attaching bitmaps and laying out every step
struct PrepareReport {
  std::vector<BitmapFailure> bitmap_failures;
  std::vector<LayoutReport> layouts; ///< one per step, script order
};

/// Creates the sink a worker renders one step into
using SinkFactory = std::function<std::unique_ptr<FrameSink>(size_t step_index)>;

/**
 * @brief Main Lecture Engine
 */
class Engine {
public:
  /// Create engine with default configuration
  Engine();

  /// Create engine with custom configuration
  explicit Engine(const EngineConfig &config);

  /// Destructor
  ~Engine();

  // Move-only semantics
  Engine(Engine &&) noexcept;
  Engine &operator=(Engine &&) noexcept;
  Engine(const Engine &) = delete;
  Engine &operator=(const Engine &) = delete;

  /**
   * @brief Parse a lecture script document
   * @return InvalidDocument error when the document cannot be read
   */
  Result<bool> load_script(const std::string &script_json);
  Result<bool> load_script_file(const std::string &path);

  /// Replace the current script
  void set_script(Script script);

  [[nodiscard]] const Script &script() const;
  [[nodiscard]] const EngineConfig &config() const;

  /**
   * @brief Revise every step's duration from measured audio
   *
   * Runs before prepare(); preparing an unsynchronized script keeps the
   * scripted durations. On failure the script is left unchanged.
   */
  Result<SyncReport> synchronize(std::span<const AudioSegment> segments);

  /**
   * @brief Rasterize elements and lay out every step
   * @param source Bitmap source queried once per element
   */
  Result<PrepareReport> prepare(BitmapSource &source);

  /// Render one laid-out step; returns frames written
  Result<int64_t> render_step(size_t index, FrameSink &sink);

  /// Render all steps in order into one sink; returns total frames
  Result<int64_t> render_all(FrameSink &sink);

  /**
   * @brief Render steps concurrently, each into its own sink
   * @param factory Called once per step (from worker threads)
   * @param threads Worker count; 0 uses hardware concurrency
   * @return Frames written per step, in step order
   */
  std::vector<Result<int64_t>> render_all_parallel(const SinkFactory &factory,
                                                   unsigned threads);

  /// Script document with revised timing and geometry written back
  [[nodiscard]] nlohmann::json script_json() const;
  Result<bool> save_script(const std::string &path) const;

  /// SRT subtitles from narration text and measured segment timing
  [[nodiscard]] std::string
  subtitles(std::span<const AudioSegment> segments) const;

  /// Immutable background shared by every frame
  [[nodiscard]] const ImageBuffer &background() const;

private:
  struct Impl;
  std::unique_ptr<Impl> pimpl_;
};

} // namespace LectureEngine
