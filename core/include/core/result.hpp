#pragma once
/**
 * @file result.hpp
 * @brief Value-or-error result type for stage entry points
 *
 * Stages that can fail terminally (synchronization without steps or
 * narration, unreadable configuration, strict-mode fallbacks) return a
 * Result<T> instead of throwing, so the orchestrator decides how to abort.
 */

#include <string>
#include <utility>
#include <variant>

namespace LectureEngine {

/// Error codes reported by the stages
enum class ErrorCode {
  None = 0,
  NoSteps,          ///< Script has no steps; timing cannot be established
  NoNarration,      ///< No narration cues or no measured audio segments
  InvalidDocument,  ///< Script / metadata / config document is malformed
  StrictFallback,   ///< A fallback fired while strict mode was enabled
  IoError,          ///< File could not be read or written
  SinkRejected,     ///< Frame sink refused a frame
  OutOfRange,       ///< Step index outside the script
  NotPrepared       ///< Rendering requested before layout
};

/// Human-readable error code name for logging
inline const char *error_code_name(ErrorCode code) {
  switch (code) {
  case ErrorCode::None:
    return "none";
  case ErrorCode::NoSteps:
    return "no_steps";
  case ErrorCode::NoNarration:
    return "no_narration";
  case ErrorCode::InvalidDocument:
    return "invalid_document";
  case ErrorCode::StrictFallback:
    return "strict_fallback";
  case ErrorCode::IoError:
    return "io_error";
  case ErrorCode::SinkRejected:
    return "sink_rejected";
  case ErrorCode::OutOfRange:
    return "out_of_range";
  case ErrorCode::NotPrepared:
    return "not_prepared";
  }
  return "unknown";
}

/// Error type for stage operations
struct Error {
  std::string message;
  ErrorCode code = ErrorCode::None;
};

template <typename T> class Result {
public:
  // Success constructor
  Result(T value) : storage_(std::in_place_index<0>, std::move(value)) {}

  // Error constructor
  Result(Error error) : storage_(std::in_place_index<1>, std::move(error)) {}

  [[nodiscard]] bool has_value() const { return storage_.index() == 0; }
  explicit operator bool() const { return has_value(); }

  T &value() { return std::get<0>(storage_); }
  const T &value() const { return std::get<0>(storage_); }
  T &operator*() { return value(); }
  const T &operator*() const { return value(); }
  T *operator->() { return &value(); }
  const T *operator->() const { return &value(); }

  Error &error() { return std::get<1>(storage_); }
  const Error &error() const { return std::get<1>(storage_); }

private:
  std::variant<T, Error> storage_;
};

} // namespace LectureEngine
