#pragma once
/**
 * @file script.hpp
 * @brief Lecture script data model: steps, elements, narration cues
 *
 * A Script is parsed once from the lecture document and then flows through
 * the stages as a value: synchronize() returns a new Script with revised
 * durations, layout_step() returns a new Step with resolved geometry. The
 * parsed document tree is kept so to_json() can write the revised fields
 * back without disturbing anything else the document carries.
 */

#include "graphics/image_buffer.hpp"

#include <glm/glm.hpp>
#include <nlohmann/json.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace LectureEngine {

/// Raised when the script or audio metadata document cannot be parsed
class ScriptError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/// Canvas dimensions
struct Canvas {
  uint32_t width = 1920;
  uint32_t height = 1080;
};

/// Accepted ranges for document and configuration values
constexpr int64_t kMaxCanvasSide = 16384;
constexpr double kMaxFps = 240.0;

/// Canvas-fraction margins reserved as non-content
struct SafeZone {
  double top = 0.05;
  double bottom = 0.15;
  double left = 0.05;
  double right = 0.05;

  [[nodiscard]] double available_width() const { return 1.0 - left - right; }
  [[nodiscard]] double available_height() const { return 1.0 - top - bottom; }
};

/// How a step places its elements
enum class LayoutMode {
  Explicit,  ///< declared positions inside the safe area
  AutoStack  ///< top-to-bottom vertical stack from the safe-area top
};

/// Entry animation kinds; every declared kind ramps opacity in
enum class EnterKind { None, FadeIn, SlideInLeft, DrawPath, WriteText };

/// Exit animation kinds
enum class ExitKind { None, FadeOut };

const char *enter_kind_name(EnterKind kind);
EnterKind parse_enter_kind(const std::string &name);

/// Element animation
struct Animation {
  EnterKind enter = EnterKind::None;
  ExitKind exit = ExitKind::None;
  double duration = 1.0;          ///< fade length in seconds
  double nominal_duration = 1.0;  ///< fade length before synchronization
  std::optional<double> start;    ///< visible sub-range start (seconds)
  std::optional<double> end;      ///< visible sub-range end (seconds)
};

/// Plain text line
struct TextContent {
  std::string text;
  std::optional<float> font_size;
  std::string color = "#FFFFFF";
};

/// Formula source (LaTeX or mixed text)
struct FormulaContent {
  std::string source;
  std::optional<float> font_size;
  std::string color = "#FFFFFF";
};

/// One stroked SVG path of a geometry figure
struct GeometryShape {
  std::string name;                   ///< document key ("circle", "line", ...)
  std::string path;                   ///< SVG path data
  std::optional<std::string> color;   ///< stroke color override
  std::optional<float> stroke_width;  ///< stroke width override
};

/// Text drawn centered on a point in the figure's path coordinates
struct GeometryLabel {
  std::string text;
  glm::dvec2 position{0.0, 0.0};
  float font_size = 24.0f;
};

/**
 * @brief Geometry figure: a set of shapes plus their labels
 *
 * Documents give either a single path string or an object of named shapes
 * ({"circle": {"path", "style"}, "line": [{"path", "style"}],
 * "label": [{"text", "position"}]}). All shapes share one coordinate frame.
 */
struct GeometryContent {
  std::vector<GeometryShape> shapes;
  std::vector<GeometryLabel> labels;
  double scale = 1.0;
  float stroke_width = 3.0f;
  std::string color = "#FFFFFF";
};

/// Closed set of element kinds
using ElementContent = std::variant<TextContent, FormulaContent, GeometryContent>;

/// Element type tag as written in the document ("text", "formula", ...)
const char *element_type_name(const ElementContent &content);

/// Paint order for an element that declares no z_index: text 1, formula 2,
/// geometry 3, so figures paint over their captions
int default_z_index(const ElementContent &content);

/// Shared envelope around an element's content
struct Element {
  ElementContent content;
  std::optional<glm::dvec2> declared_position; ///< author intent, [0,1]^2
  std::optional<glm::dvec2> position;          ///< resolved canvas fraction
  glm::dvec2 size{0.0, 0.0};                   ///< canvas-fraction extent
  std::optional<Animation> animation;
  int z_index = 0;

  /// Immutable rasterized content; shared between Script copies
  std::shared_ptr<const ImageBuffer> bitmap;

  /// Index in the document's element array (absent when built in code)
  std::optional<size_t> source_index;
};

/// One titled phase of the lecture
struct Step {
  int id = 0;
  std::string title;
  double duration = 0.0;          ///< current (possibly revised) seconds
  double nominal_duration = 0.0;  ///< scripted seconds, never revised
  std::vector<Element> elements;
  std::optional<SafeZone> safe_zone;       ///< config default when absent
  std::optional<double> vertical_spacing;  ///< config default when absent
  LayoutMode layout_mode = LayoutMode::Explicit;
};

/// One spoken utterance with its scripted time span
struct NarrationCue {
  std::string text;
  double start = 0.0;
  double end = 0.0;

  [[nodiscard]] double length() const { return end - start; }
};

/// Measured audio for one narration cue
struct AudioSegment {
  double start_time = 0.0;
  double end_time = 0.0;
  double duration = 0.0;
};

/// Non-fatal problem found while reading the document
struct DocumentIssue {
  std::string location; ///< e.g. "steps[2].elements[0].position"
  std::string message;
};

/// Root lecture script
struct Script {
  Canvas canvas;
  bool canvas_declared = false;  ///< resolution read from the document
  std::optional<double> fps;
  std::vector<Step> steps;
  std::vector<NarrationCue> narration;

  /// Parsed document the script was read from (empty when built in code)
  nlohmann::json document;

  /// Defaults substituted while parsing
  std::vector<DocumentIssue> issues;

  /// Index of the step with the given id, if any
  [[nodiscard]] std::optional<size_t> find_step(int step_id) const;

  /// Sum of current step durations
  [[nodiscard]] double total_duration() const;

  /// Parse from the lecture document
  /// @throws ScriptError on malformed JSON or wrongly typed fields
  static Script from_json(const std::string &json_text);
  static Script from_document(const nlohmann::json &document);

  /// Document with revised durations and geometry written back
  [[nodiscard]] nlohmann::json to_json() const;
};

/// Parse the measured audio metadata document (array of segments)
/// @throws ScriptError on malformed JSON
std::vector<AudioSegment> parse_audio_segments(const std::string &json_text);
std::vector<AudioSegment>
audio_segments_from_document(const nlohmann::json &document);

} // namespace LectureEngine
