#pragma once
/**
 * @file frame_sink.hpp
 * @brief Frame consumers on the encoder side of the compositor
 *
 * The compositor pushes each finished frame to a FrameSink as soon as it is
 * blended; a sink never receives frames out of order within a step.
 */

#include "core/result.hpp"
#include "graphics/image_buffer.hpp"

#include <cstdint>
#include <filesystem>
#include <ostream>
#include <string>
#include <vector>

namespace LectureEngine {

/// Step metadata announced before its frames
struct StepInfo {
  size_t index = 0;          ///< position in the script
  int step_id = 0;
  std::string title;
  uint32_t width = 0;
  uint32_t height = 0;
  double fps = 30.0;
  int64_t frame_count = 0;
};

/**
 * @brief Frame consumer interface
 */
class FrameSink {
public:
  virtual ~FrameSink() = default;

  virtual Result<bool> begin_step(const StepInfo &info) = 0;

  /// Called once per frame in increasing index order
  virtual Result<bool> write_frame(const ImageBuffer &frame, int64_t index) = 0;

  virtual Result<bool> end_step() = 0;
};

/**
 * @brief Packed RGB24 stream for an external encoder
 *
 * Frames are written back to back with no headers, e.g. into the stdin of
 * `ffmpeg -f rawvideo -pix_fmt rgb24`.
 */
class RawVideoSink : public FrameSink {
public:
  explicit RawVideoSink(std::ostream &out) : out_(out) {}

  Result<bool> begin_step(const StepInfo &info) override;
  Result<bool> write_frame(const ImageBuffer &frame, int64_t index) override;
  Result<bool> end_step() override;

  [[nodiscard]] uint64_t bytes_written() const { return bytes_written_; }

private:
  std::ostream &out_;
  StepInfo current_;
  std::vector<uint8_t> row_;
  uint64_t bytes_written_ = 0;
};

/**
 * @brief One PNG file per frame
 *
 * Files are named step_<id>_frame_<index>.png with zero padding, inside
 * the output directory (created if missing).
 */
class PngSequenceSink : public FrameSink {
public:
  explicit PngSequenceSink(std::filesystem::path directory)
      : directory_(std::move(directory)) {}

  Result<bool> begin_step(const StepInfo &info) override;
  Result<bool> write_frame(const ImageBuffer &frame, int64_t index) override;
  Result<bool> end_step() override;

  [[nodiscard]] const std::vector<std::filesystem::path> &files() const {
    return files_;
  }

  /// File name used for a frame of a step
  [[nodiscard]] static std::string frame_file_name(int step_id, int64_t index);

private:
  std::filesystem::path directory_;
  StepInfo current_;
  std::vector<std::filesystem::path> files_;
};

/// Hashes recorded for one step
struct StepHashes {
  StepInfo info;
  std::vector<uint64_t> frames;  ///< FNV-1a per frame
  uint64_t combined = 0;         ///< all frame hashes folded in order
};

/**
 * @brief Records FNV-1a hashes instead of pixels
 *
 * Used for golden-reference validation and for checking that concurrent
 * rendering produces the same frames as sequential rendering.
 */
class HashingSink : public FrameSink {
public:
  Result<bool> begin_step(const StepInfo &info) override;
  Result<bool> write_frame(const ImageBuffer &frame, int64_t index) override;
  Result<bool> end_step() override;

  [[nodiscard]] const std::vector<StepHashes> &steps() const { return steps_; }
  [[nodiscard]] size_t total_frames() const;

  /// Combined hash over all steps, in the order they ended
  [[nodiscard]] uint64_t combined() const;

private:
  std::vector<StepHashes> steps_;
  bool open_ = false;
};

/// Encode an RGB or RGBA buffer as PNG bytes (stb_image_write)
[[nodiscard]] std::vector<uint8_t> encode_png(const ImageBuffer &image);

} // namespace LectureEngine
