/**
 * @file consistency_test_main.cpp
 * @brief CLI entry point for consistency testing
 *
 * Usage:
 *   consistency_test --generate [output_path]
 *   consistency_test --validate <golden_path>
 *   consistency_test --self-check
 *   consistency_test --list
 *   consistency_test --help
 */

#include "engine/script.hpp"
#include "testing/consistency_test.hpp"

#include <iostream>
#include <string>

using namespace LectureEngine;
using namespace LectureEngine::Testing;

constexpr const char *COLOR_RESET = "\033[0m";
constexpr const char *COLOR_GREEN = "\033[32m";
constexpr const char *COLOR_RED = "\033[31m";
constexpr const char *COLOR_YELLOW = "\033[33m";
constexpr const char *COLOR_CYAN = "\033[36m";
constexpr const char *COLOR_BOLD = "\033[1m";

void print_header() {
  std::cout << COLOR_BOLD << COLOR_CYAN;
  std::cout << R"(
╔═══════════════════════════════════════════════════════════════╗
║            LectureEngine Consistency Test Runner              ║
║               Golden Frame Hash Validation                    ║
╚═══════════════════════════════════════════════════════════════╝
)" << COLOR_RESET
            << std::endl;
}

void print_usage() {
  std::cout << COLOR_BOLD << "Usage:" << COLOR_RESET << std::endl;
  std::cout << "  consistency_test --generate [output.json]" << std::endl;
  std::cout << "      Generate golden reference from the current build\n"
            << std::endl;
  std::cout << "  consistency_test --validate <golden.json>" << std::endl;
  std::cout << "      Validate current build against golden reference\n"
            << std::endl;
  std::cout << "  consistency_test --self-check" << std::endl;
  std::cout << "      Render every test twice and compare\n" << std::endl;
  std::cout << "  consistency_test --list" << std::endl;
  std::cout << "      List all built-in test cases\n" << std::endl;
  std::cout << "  consistency_test --help" << std::endl;
  std::cout << "      Show this help message\n" << std::endl;
}

void print_test_list() {
  auto tests = ConsistencyTestRunner::builtin_tests();

  std::cout << COLOR_BOLD << "Built-in Test Cases:" << COLOR_RESET << std::endl;
  std::cout << std::string(60, '-') << std::endl;

  for (const auto &test : tests) {
    std::cout << COLOR_CYAN << "  • " << test.name << COLOR_RESET << std::endl;
    try {
      const Script script = Script::from_json(test.script_json);
      std::cout << "    Resolution: " << script.canvas.width << "x"
                << script.canvas.height << std::endl;
      std::cout << "    Steps: " << script.steps.size() << " ("
                << script.total_duration() << "s scripted)" << std::endl;
    } catch (const ScriptError &e) {
      std::cout << COLOR_RED << "    Unreadable: " << e.what() << COLOR_RESET
                << std::endl;
    }
    std::cout << "    Audio: "
              << (test.audio_json.empty() ? "none (scripted timing)"
                                          : "measured segments")
              << std::endl;
    std::cout << std::endl;
  }
}

void print_result(const ConsistencyResult &result) {
  if (result.passed) {
    std::cout << COLOR_GREEN << "  ✓ " << COLOR_RESET;
  } else {
    std::cout << COLOR_RED << "  ✗ " << COLOR_RESET;
  }

  std::cout << COLOR_BOLD << result.test_name << COLOR_RESET;
  std::cout << " [" << result.matched_frames << "/" << result.total_frames
            << " frames, " << result.step_results.size() << " steps]";

  if (result.passed) {
    std::cout << COLOR_GREEN << " PASSED" << COLOR_RESET;
  } else {
    std::cout << COLOR_RED << " FAILED" << COLOR_RESET;
  }
  std::cout << std::endl;

  for (const auto &failure : result.failures) {
    std::cout << COLOR_YELLOW << "      → " << failure << COLOR_RESET
              << std::endl;
  }
}

void print_percent(size_t part, size_t whole) {
  if (part == whole) {
    std::cout << COLOR_GREEN << " (100%)" << COLOR_RESET;
  } else {
    std::cout << COLOR_RED << " (" << (whole ? part * 100 / whole : 0) << "%)"
              << COLOR_RESET;
  }
  std::cout << std::endl;
}

bool print_summary(const std::vector<ConsistencyResult> &results) {
  size_t passed = 0;
  size_t total_frames = 0;
  size_t matched_frames = 0;

  for (const auto &r : results) {
    if (r.passed)
      ++passed;
    total_frames += r.total_frames;
    matched_frames += r.matched_frames;
  }

  std::cout << std::endl;
  std::cout << std::string(60, '=') << std::endl;
  std::cout << COLOR_BOLD << "Summary:" << COLOR_RESET << std::endl;
  std::cout << "  Tests:  " << passed << "/" << results.size();
  print_percent(passed, results.size());
  std::cout << "  Frames: " << matched_frames << "/" << total_frames;
  print_percent(matched_frames, total_frames);
  std::cout << std::string(60, '=') << std::endl;

  const bool all_passed = !results.empty() && passed == results.size();
  if (all_passed) {
    std::cout << COLOR_GREEN << COLOR_BOLD
              << "✓ All tests passed! Consistency verified." << COLOR_RESET
              << std::endl;
  } else {
    std::cout << COLOR_RED << COLOR_BOLD
              << "✗ Some tests failed. See failures above." << COLOR_RESET
              << std::endl;
  }
  return all_passed;
}

bool report(const std::vector<ConsistencyResult> &results) {
  std::cout << "\r" << std::string(60, ' ') << "\r"; // Clear progress line

  std::cout << COLOR_BOLD << "Results:" << COLOR_RESET << std::endl;
  for (const auto &result : results) {
    print_result(result);
  }
  return print_summary(results);
}

int main(int argc, char *argv[]) {
  print_header();

  if (argc < 2) {
    print_usage();
    return 1;
  }

  std::string mode = argv[1];

  if (mode == "--help" || mode == "-h") {
    print_usage();
    return 0;
  }

  if (mode == "--list" || mode == "-l") {
    print_test_list();
    return 0;
  }

  ConsistencyTestRunner runner;
  runner.add_tests(ConsistencyTestRunner::builtin_tests());

  runner.set_progress_callback(
      [](size_t current, size_t total, const std::string &test) {
        std::cout << "\r" << COLOR_CYAN << "[" << current << "/" << total << "]"
                  << COLOR_RESET << " Testing: " << test << "...          "
                  << std::flush;
      });

  if (mode == "--generate" || mode == "-g") {
    std::string output_path = "golden_reference.json";
    if (argc >= 3) {
      output_path = argv[2];
    }

    std::cout << "Generating golden reference..." << std::endl;
    std::cout << "Platform: " << platform_string() << std::endl;
    std::cout << "Output:   " << output_path << std::endl;
    std::cout << std::endl;

    const bool all_passed = report(runner.generate_golden(output_path));
    if (all_passed) {
      std::cout << std::endl;
      std::cout << "Golden reference saved to: " << COLOR_CYAN << output_path
                << COLOR_RESET << std::endl;
    }
    return all_passed ? 0 : 1;
  }

  if (mode == "--validate" || mode == "-v") {
    if (argc < 3) {
      std::cerr << COLOR_RED
                << "Error: --validate requires golden reference path"
                << COLOR_RESET << std::endl;
      print_usage();
      return 1;
    }

    std::string golden_path = argv[2];

    std::cout << "Validating against golden reference..." << std::endl;
    std::cout << "Platform: " << platform_string() << std::endl;
    std::cout << "Golden:   " << golden_path << std::endl;
    std::cout << std::endl;

    return report(runner.validate(golden_path)) ? 0 : 1;
  }

  if (mode == "--self-check" || mode == "-s") {
    std::cout << "Rendering every test twice..." << std::endl;
    std::cout << std::endl;
    return report(runner.self_check()) ? 0 : 1;
  }

  std::cerr << COLOR_RED << "Unknown mode: " << mode << COLOR_RESET
            << std::endl;
  print_usage();
  return 1;
}
