/**
 * @file frame_sink.cpp
 * @brief Raw, PNG-sequence and hashing frame sinks
 */

#include "output/frame_sink.hpp"
#include "core/deterministic.hpp"

#define STB_IMAGE_WRITE_IMPLEMENTATION
#include <stb/stb_image_write.h>

#include <cstdio>
#include <fstream>
#include <system_error>

namespace LectureEngine {

namespace {

Error sink_error(const std::string &message) {
  return Error{message, ErrorCode::SinkRejected};
}

bool matches(const StepInfo &info, const ImageBuffer &frame) {
  return frame.width == info.width && frame.height == info.height;
}

void append_png_bytes(void *context, void *data, int size) {
  auto *out = static_cast<std::vector<uint8_t> *>(context);
  const auto *bytes = static_cast<const uint8_t *>(data);
  out->insert(out->end(), bytes, bytes + size);
}

} // anonymous namespace

std::vector<uint8_t> encode_png(const ImageBuffer &image) {
  std::vector<uint8_t> png;
  if (image.empty()) {
    return png;
  }
  const int ok = stbi_write_png_to_func(
      append_png_bytes, &png, static_cast<int>(image.width),
      static_cast<int>(image.height), static_cast<int>(image.channels),
      image.data.data(), static_cast<int>(image.stride()));
  if (!ok) {
    png.clear();
  }
  return png;
}

// ============================================================================
// RawVideoSink
// ============================================================================

Result<bool> RawVideoSink::begin_step(const StepInfo &info) {
  current_ = info;
  row_.resize(static_cast<size_t>(info.width) * 3);
  return true;
}

Result<bool> RawVideoSink::write_frame(const ImageBuffer &frame,
                                       int64_t index) {
  if (!matches(current_, frame)) {
    return sink_error("frame " + std::to_string(index) +
                      " does not match announced step size");
  }

  if (frame.channels == 3) {
    out_.write(reinterpret_cast<const char *>(frame.data.data()),
               static_cast<std::streamsize>(frame.data.size()));
  } else {
    // Drop alpha row by row
    for (uint32_t y = 0; y < frame.height; ++y) {
      for (uint32_t x = 0; x < frame.width; ++x) {
        const uint8_t *p = frame.pixel(x, y);
        row_[x * 3 + 0] = p[0];
        row_[x * 3 + 1] = p[1];
        row_[x * 3 + 2] = p[2];
      }
      out_.write(reinterpret_cast<const char *>(row_.data()),
                 static_cast<std::streamsize>(row_.size()));
    }
  }

  if (!out_) {
    return sink_error("raw video stream rejected frame " +
                      std::to_string(index));
  }
  bytes_written_ += static_cast<uint64_t>(frame.width) * frame.height * 3;
  return true;
}

Result<bool> RawVideoSink::end_step() {
  out_.flush();
  if (!out_) {
    return sink_error("raw video stream failed to flush");
  }
  return true;
}

// ============================================================================
// PngSequenceSink
// ============================================================================

std::string PngSequenceSink::frame_file_name(int step_id, int64_t index) {
  char name[64];
  std::snprintf(name, sizeof(name), "step_%03d_frame_%05lld.png", step_id,
                static_cast<long long>(index));
  return name;
}

Result<bool> PngSequenceSink::begin_step(const StepInfo &info) {
  current_ = info;
  std::error_code ec;
  std::filesystem::create_directories(directory_, ec);
  if (ec) {
    return Error{"cannot create " + directory_.string() + ": " + ec.message(),
                 ErrorCode::IoError};
  }
  return true;
}

Result<bool> PngSequenceSink::write_frame(const ImageBuffer &frame,
                                          int64_t index) {
  if (!matches(current_, frame)) {
    return sink_error("frame " + std::to_string(index) +
                      " does not match announced step size");
  }

  const auto png = encode_png(frame);
  if (png.empty()) {
    return sink_error("PNG encoding failed for frame " + std::to_string(index));
  }

  const auto path = directory_ / frame_file_name(current_.step_id, index);
  std::ofstream file(path, std::ios::binary);
  if (!file.is_open()) {
    return Error{"cannot open " + path.string(), ErrorCode::IoError};
  }
  file.write(reinterpret_cast<const char *>(png.data()),
             static_cast<std::streamsize>(png.size()));
  if (!file) {
    return Error{"failed writing " + path.string(), ErrorCode::IoError};
  }
  files_.push_back(path);
  return true;
}

Result<bool> PngSequenceSink::end_step() { return true; }

// ============================================================================
// HashingSink
// ============================================================================

Result<bool> HashingSink::begin_step(const StepInfo &info) {
  if (open_) {
    return sink_error("step " + std::to_string(info.step_id) +
                      " began before the previous one ended");
  }
  StepHashes hashes;
  hashes.info = info;
  hashes.combined = Deterministic::FNV_OFFSET;
  steps_.push_back(std::move(hashes));
  open_ = true;
  return true;
}

Result<bool> HashingSink::write_frame(const ImageBuffer &frame, int64_t index) {
  if (!open_) {
    return sink_error("frame " + std::to_string(index) + " outside a step");
  }
  StepHashes &step = steps_.back();
  if (index != static_cast<int64_t>(step.frames.size())) {
    return sink_error("frame " + std::to_string(index) + " out of order");
  }
  const uint64_t hash = Deterministic::compute_pixel_hash(frame.bytes());
  step.frames.push_back(hash);
  step.combined = Deterministic::combine_hashes(step.combined, hash);
  return true;
}

Result<bool> HashingSink::end_step() {
  open_ = false;
  return true;
}

size_t HashingSink::total_frames() const {
  size_t total = 0;
  for (const auto &s : steps_)
    total += s.frames.size();
  return total;
}

uint64_t HashingSink::combined() const {
  uint64_t hash = Deterministic::FNV_OFFSET;
  for (const auto &s : steps_)
    hash = Deterministic::combine_hashes(hash, s.combined);
  return hash;
}

} // namespace LectureEngine
