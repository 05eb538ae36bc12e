#pragma once
/**
 * @file consistency_test.hpp
 * @brief Golden-hash consistency testing for rendered lectures
 *
 * Renders built-in lecture scripts end to end (synchronize, lay out,
 * composite) and compares per-frame FNV-1a hashes against a stored golden
 * reference, so any change in timing, placement or blending shows up as a
 * hash mismatch on a specific step and frame.
 */

#include "core/result.hpp"
#include "output/frame_sink.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace LectureEngine {
namespace Testing {

// ============================================================================
// Test Case Definitions
// ============================================================================

/**
 * @brief Test case definition for consistency testing
 */
struct TestCase {
  std::string name;        ///< Unique test name
  std::string script_json; ///< Lecture document to render
  std::string audio_json;  ///< Measured narration segments ("" = no sync)

  TestCase() = default;

  TestCase(std::string name_, std::string script_, std::string audio_)
      : name(std::move(name_)), script_json(std::move(script_)),
        audio_json(std::move(audio_)) {}
};

/**
 * @brief Result for a single step comparison
 */
struct StepResult {
  int step_id = 0;
  uint64_t expected_hash = 0;
  uint64_t actual_hash = 0;
  int64_t expected_frames = 0;
  int64_t actual_frames = 0;
  std::optional<int64_t> first_mismatch; ///< first differing frame index
  bool passed = false;
};

/**
 * @brief Result for a full test case
 */
struct ConsistencyResult {
  std::string test_name;
  bool passed = false;
  size_t total_frames = 0;
  size_t matched_frames = 0;
  std::vector<StepResult> step_results;
  std::vector<std::string> failures;

  explicit operator bool() const noexcept { return passed; }
};

// ============================================================================
// Golden Reference Data Structures
// ============================================================================

/**
 * @brief Frame hashes recorded for one step
 */
struct GoldenStep {
  int step_id = 0;
  uint32_t width = 0;
  uint32_t height = 0;
  uint64_t combined_hash = 0;
  std::vector<uint64_t> frame_hashes;
};

/**
 * @brief Test data in golden reference
 */
struct GoldenTest {
  std::string name;
  std::string script_hash; ///< Hash of script + audio JSON for validation
  std::vector<GoldenStep> steps;
};

/**
 * @brief Complete golden reference file
 */
struct GoldenReference {
  std::string version = "1.0";
  std::string generated_at;
  std::string platform;
  std::string engine_version;
  std::vector<GoldenTest> tests;

  /// Load from JSON file
  static Result<GoldenReference> load(const std::string &path);

  /// Save to JSON file
  Result<bool> save(const std::string &path) const;
};

// ============================================================================
// Test Runner
// ============================================================================

/**
 * @brief Renders a test case and returns the hashes of every step
 */
using RenderCallback =
    std::function<Result<std::vector<StepHashes>>(const TestCase &test)>;

/**
 * @brief Progress callback during test execution
 */
using ProgressCallback =
    std::function<void(size_t current, size_t total, const std::string &test)>;

/**
 * @brief Main consistency test runner
 *
 * Manages test execution, golden reference generation, and validation.
 */
class ConsistencyTestRunner {
public:
  /// Runner using the full engine pipeline with in-memory bitmaps
  ConsistencyTestRunner();

  /// Runner with a custom render callback
  explicit ConsistencyTestRunner(RenderCallback render_fn);

  ~ConsistencyTestRunner();

  // --- Test Management ---

  void add_test(const TestCase &test);
  void add_tests(const std::vector<TestCase> &tests);
  void clear_tests();
  [[nodiscard]] const std::vector<TestCase> &tests() const;

  // --- Golden Reference Generation ---

  /**
   * @brief Generate golden reference from the current build
   * @param output_path Path to save golden reference JSON
   * @return Results of generation (all should pass)
   */
  std::vector<ConsistencyResult>
  generate_golden(const std::string &output_path);

  // --- Validation ---

  /**
   * @brief Validate against golden reference
   * @param golden_path Path to golden reference JSON
   * @return Validation results for each test
   */
  std::vector<ConsistencyResult> validate(const std::string &golden_path);

  /**
   * @brief Render every test twice and compare the hashes
   *
   * Needs no golden file; catches nondeterminism in the pipeline.
   */
  std::vector<ConsistencyResult> self_check();

  // --- Progress Reporting ---

  void set_progress_callback(ProgressCallback callback);

  // --- Built-in Test Cases ---

  /**
   * @brief Standard built-in lecture scripts
   *
   * Small canvases and low frame rates keep a full run fast.
   */
  static std::vector<TestCase> builtin_tests();

private:
  struct Impl;
  std::unique_ptr<Impl> pimpl_;
};

// ============================================================================
// Utility Functions
// ============================================================================

/**
 * @brief Render a test case through the engine
 *
 * Loads the script, synchronizes against the audio metadata when present,
 * prepares with SolidBitmapSource and renders into a HashingSink.
 */
[[nodiscard]] Result<std::vector<StepHashes>> render_hashes(const TestCase &test);

/// Hash a string (for script validation)
[[nodiscard]] uint64_t hash_string(const std::string &str);

/// Hash as lowercase hex
[[nodiscard]] std::string hex_hash(uint64_t hash);

/// Get current timestamp as ISO 8601 string
[[nodiscard]] std::string current_timestamp();

/// Get platform identifier string
[[nodiscard]] std::string platform_string();

} // namespace Testing
} // namespace LectureEngine
