/**
 * @file script.cpp
 * @brief Script document parsing and write-back
 */

#include "engine/script.hpp"
#include "core/math.hpp"

#include <numeric>

using json = nlohmann::json;

namespace LectureEngine {

namespace {

constexpr double kDefaultStepDuration = 1.0;
constexpr double kDefaultAnimationDuration = 1.0;

struct ParseContext {
  std::vector<DocumentIssue> &issues;

  void note(std::string location, std::string message) {
    issues.push_back({std::move(location), std::move(message)});
  }
};

std::optional<double> number_field(const json &j, const char *key) {
  auto it = j.find(key);
  if (it == j.end() || !it->is_number())
    return std::nullopt;
  return it->get<double>();
}

// Accepts [x, y] or {"x": .., "y": ..}; out-of-range values are clamped
std::optional<glm::dvec2> parse_position(const json &j, ParseContext &ctx,
                                         const std::string &where) {
  glm::dvec2 pos;
  if (j.is_array() && j.size() >= 2 && j[0].is_number() && j[1].is_number()) {
    pos = {j[0].get<double>(), j[1].get<double>()};
  } else if (j.is_object() && j.contains("x") && j.contains("y") &&
             j["x"].is_number() && j["y"].is_number()) {
    pos = {j["x"].get<double>(), j["y"].get<double>()};
  } else {
    ctx.note(where, "unreadable position, using safe-area center");
    return std::nullopt;
  }

  if (pos.x < 0.0 || pos.x > 1.0 || pos.y < 0.0 || pos.y > 1.0) {
    ctx.note(where, "position outside [0,1], clamped");
    pos.x = Math::saturate(pos.x);
    pos.y = Math::saturate(pos.y);
  }
  return pos;
}

std::optional<Animation> parse_animation(const json &j, ParseContext &ctx,
                                         const std::string &where) {
  if (j.is_null()) {
    return std::nullopt;
  }
  if (!j.is_object()) {
    ctx.note(where, "animation is not an object, ignored");
    return std::nullopt;
  }

  Animation anim;
  anim.enter = parse_enter_kind(j.value("enter", ""));
  anim.exit = j.value("exit", "") == "fade_out" ? ExitKind::FadeOut
                                                : ExitKind::None;

  const auto duration = number_field(j, "duration");
  if (!duration || *duration < 0.0) {
    ctx.note(where + ".duration", "missing or negative, using 1s");
  }
  anim.duration = duration && *duration >= 0.0 ? *duration
                                               : kDefaultAnimationDuration;
  anim.nominal_duration =
      number_field(j, "original_duration").value_or(anim.duration);
  anim.start = number_field(j, "start");
  anim.end = number_field(j, "end");
  return anim;
}

std::optional<float> font_size_field(const json &j) {
  if (auto v = number_field(j, "font_size")) {
    return static_cast<float>(*v);
  }
  return std::nullopt;
}

// Stroke colors appear as hex or as a few CSS names
std::optional<std::string> stroke_color(const json &style, ParseContext &ctx,
                                        const std::string &where) {
  auto it = style.find("stroke");
  if (it == style.end() || !it->is_string()) {
    return std::nullopt;
  }
  const std::string name = it->get<std::string>();
  if (!name.empty() && name[0] == '#') {
    return name;
  }
  static const std::pair<const char *, const char *> kNamed[] = {
      {"white", "#FFFFFF"}, {"yellow", "#FFFF00"}, {"red", "#FF0000"},
      {"green", "#00FF00"}, {"blue", "#0000FF"},   {"cyan", "#00FFFF"},
      {"black", "#000000"}};
  for (const auto &[key, hex] : kNamed) {
    if (name == key)
      return std::string(hex);
  }
  ctx.note(where + ".style.stroke", "unknown color '" + name + "', ignored");
  return std::nullopt;
}

GeometryShape parse_shape(const std::string &name, const json &j,
                          ParseContext &ctx, const std::string &where) {
  GeometryShape shape;
  shape.name = name;
  shape.path = j.value("path", "");
  const json style = j.value("style", json::object());
  if (style.is_object()) {
    shape.color = stroke_color(style, ctx, where);
    const auto width = number_field(style, "stroke-width")
                           ? number_field(style, "stroke-width")
                           : number_field(style, "stroke_width");
    if (width && *width > 0.0)
      shape.stroke_width = static_cast<float>(*width);
  }
  return shape;
}

void parse_labels(const json &labels, GeometryContent &geometry,
                  ParseContext &ctx, const std::string &where) {
  if (!labels.is_array()) {
    ctx.note(where, "labels must be an array, ignored");
    return;
  }
  for (size_t i = 0; i < labels.size(); ++i) {
    const json &l = labels[i];
    const std::string lwhere = where + "[" + std::to_string(i) + "]";
    const json pos = l.is_object() ? l.value("position", json()) : json();
    if (!l.is_object() || !l.contains("text") || !pos.is_array() ||
        pos.size() < 2 || !pos[0].is_number() || !pos[1].is_number()) {
      ctx.note(lwhere, "label needs text and a position, skipped");
      continue;
    }
    GeometryLabel label;
    label.text = l["text"].is_string() ? l["text"].get<std::string>()
                                       : l["text"].dump();
    label.position = {pos[0].get<double>(), pos[1].get<double>()};
    label.font_size = l.value("font_size", label.font_size);
    geometry.labels.push_back(std::move(label));
  }
}

// A path string, or an object of named shapes, shape arrays and labels
void parse_geometry(const json &content, GeometryContent &geometry,
                    ParseContext &ctx, const std::string &where) {
  if (content.is_string()) {
    geometry.shapes.push_back({"path", content.get<std::string>(), {}, {}});
    return;
  }
  if (!content.is_object()) {
    ctx.note(where, "geometry content is neither a path nor an object");
    return;
  }

  for (const auto &[key, value] : content.items()) {
    const std::string swhere = where + "." + key;
    if (key == "label") {
      parse_labels(value, geometry, ctx, swhere);
    } else if ((key == "path" || key == "d") && value.is_string()) {
      geometry.shapes.push_back({key, value.get<std::string>(), {}, {}});
    } else if (value.is_object() && value.contains("path")) {
      geometry.shapes.push_back(parse_shape(key, value, ctx, swhere));
    } else if (value.is_array()) {
      for (size_t i = 0; i < value.size(); ++i) {
        const std::string iwhere = swhere + "[" + std::to_string(i) + "]";
        if (value[i].is_object() && value[i].contains("path")) {
          geometry.shapes.push_back(parse_shape(
              key + "_" + std::to_string(i), value[i], ctx, iwhere));
        } else {
          ctx.note(iwhere, "shape without a path, skipped");
        }
      }
    } else {
      ctx.note(swhere, "unrecognized geometry entry, skipped");
    }
  }
}

std::optional<ElementContent> parse_content(const json &j, ParseContext &ctx,
                                            const std::string &where) {
  const std::string type = j.value("type", "text");
  const json content = j.value("content", json());

  if (type == "text" || type == "formula") {
    std::string text;
    if (content.is_string()) {
      text = content.get<std::string>();
    } else {
      ctx.note(where + ".content", "not a string, using empty text");
    }
    if (type == "text") {
      return TextContent{text, font_size_field(j), j.value("color", "#FFFFFF")};
    }
    return FormulaContent{text, font_size_field(j), j.value("color", "#FFFFFF")};
  }

  if (type == "geometry") {
    GeometryContent geometry;
    parse_geometry(content, geometry, ctx, where + ".content");
    geometry.scale = j.value("scale", 1.0);
    geometry.stroke_width = j.value("stroke_width", 3.0f);
    geometry.color = j.value("color", "#FFFFFF");
    return geometry;
  }

  ctx.note(where, "unknown element type '" + type + "', element skipped");
  return std::nullopt;
}

std::optional<SafeZone> parse_safe_zone(const json &j) {
  if (!j.is_object()) {
    return std::nullopt;
  }
  SafeZone zone;
  zone.top = j.value("top", zone.top);
  zone.bottom = j.value("bottom", zone.bottom);
  zone.left = j.value("left", zone.left);
  zone.right = j.value("right", zone.right);
  return zone;
}

LayoutMode parse_layout_mode(const json &step) {
  if (step.value("auto_stack", false)) {
    return LayoutMode::AutoStack;
  }
  const std::string layout = step.value("layout", "explicit");
  if (layout == "auto_stack" || layout == "stack" || layout == "vertical") {
    return LayoutMode::AutoStack;
  }
  return LayoutMode::Explicit;
}

std::optional<Canvas> parse_resolution(const json &j) {
  if (!j.is_array() || j.size() < 2 || !j[0].is_number_integer() ||
      !j[1].is_number_integer()) {
    return std::nullopt;
  }
  const auto width = j[0].get<int64_t>();
  const auto height = j[1].get<int64_t>();
  if (width <= 0 || height <= 0 || width > kMaxCanvasSide ||
      height > kMaxCanvasSide) {
    return std::nullopt;
  }
  return Canvas{static_cast<uint32_t>(width), static_cast<uint32_t>(height)};
}

Step parse_step(const json &j, size_t index, ParseContext &ctx) {
  const std::string where = "steps[" + std::to_string(index) + "]";

  Step step;
  step.id = j.value("step_id", static_cast<int>(index) + 1);
  step.title = j.value("title", "");

  const auto duration = number_field(j, "duration");
  if (!duration || *duration <= 0.0) {
    ctx.note(where + ".duration", "missing or non-positive, using 1s");
  }
  step.duration = duration && *duration > 0.0 ? *duration
                                              : kDefaultStepDuration;
  step.nominal_duration =
      number_field(j, "original_duration").value_or(step.duration);

  step.safe_zone = parse_safe_zone(j.value("safe_zone", json()));
  step.vertical_spacing = number_field(j, "vertical_spacing");
  step.layout_mode = parse_layout_mode(j);

  const json elements = j.value("elements", json::array());
  for (size_t i = 0; i < elements.size(); ++i) {
    const json &e = elements[i];
    const std::string ewhere = where + ".elements[" + std::to_string(i) + "]";

    auto content = parse_content(e, ctx, ewhere);
    if (!content) {
      continue;
    }

    Element element;
    element.content = std::move(*content);
    element.source_index = i;
    element.z_index = e.value("z_index", default_z_index(element.content));

    // A previously written document keeps author intent separately
    const char *pos_key = e.contains("declared_position") ? "declared_position"
                                                          : "position";
    if (e.contains(pos_key) && !e[pos_key].is_null()) {
      element.declared_position =
          parse_position(e[pos_key], ctx, ewhere + ".position");
    }
    element.animation =
        parse_animation(e.value("animation", json()), ctx, ewhere + ".animation");
    step.elements.push_back(std::move(element));
  }
  return step;
}

json position_to_json(const glm::dvec2 &p) { return json::array({p.x, p.y}); }

json geometry_to_json(const GeometryContent &g) {
  if (g.labels.empty() && g.shapes.size() == 1 && !g.shapes[0].color &&
      !g.shapes[0].stroke_width) {
    return g.shapes[0].path;
  }
  json out = json::object();
  for (const auto &shape : g.shapes) {
    json style = json::object();
    if (shape.color)
      style["stroke"] = *shape.color;
    if (shape.stroke_width)
      style["stroke-width"] = *shape.stroke_width;
    out[shape.name] = {{"path", shape.path}, {"style", style}};
  }
  if (!g.labels.empty()) {
    json labels = json::array();
    for (const auto &label : g.labels) {
      labels.push_back({{"text", label.text},
                        {"position", position_to_json(label.position)},
                        {"font_size", label.font_size}});
    }
    out["label"] = labels;
  }
  return out;
}

json element_to_json(const Element &element) {
  json j;
  j["type"] = element_type_name(element.content);
  std::visit(
      [&j](const auto &c) {
        using T = std::decay_t<decltype(c)>;
        if constexpr (std::is_same_v<T, TextContent>) {
          j["content"] = c.text;
          if (c.font_size)
            j["font_size"] = *c.font_size;
          j["color"] = c.color;
        } else if constexpr (std::is_same_v<T, FormulaContent>) {
          j["content"] = c.source;
          if (c.font_size)
            j["font_size"] = *c.font_size;
          j["color"] = c.color;
        } else {
          j["content"] = geometry_to_json(c);
          j["scale"] = c.scale;
          j["stroke_width"] = c.stroke_width;
          j["color"] = c.color;
        }
      },
      element.content);
  j["z_index"] = element.z_index;
  if (element.animation) {
    json anim;
    if (element.animation->enter != EnterKind::None)
      anim["enter"] = enter_kind_name(element.animation->enter);
    if (element.animation->exit == ExitKind::FadeOut)
      anim["exit"] = "fade_out";
    if (element.animation->start)
      anim["start"] = *element.animation->start;
    if (element.animation->end)
      anim["end"] = *element.animation->end;
    j["animation"] = anim;
  }
  return j;
}

json step_to_json(const Step &step) {
  json j;
  j["step_id"] = step.id;
  j["title"] = step.title;
  j["layout"] =
      step.layout_mode == LayoutMode::AutoStack ? "auto_stack" : "explicit";
  if (step.safe_zone) {
    j["safe_zone"] = {{"top", step.safe_zone->top},
                      {"bottom", step.safe_zone->bottom},
                      {"left", step.safe_zone->left},
                      {"right", step.safe_zone->right}};
  }
  if (step.vertical_spacing) {
    j["vertical_spacing"] = *step.vertical_spacing;
  }
  // Elements are appended by the caller, which also writes their geometry
  j["elements"] = json::array();
  return j;
}

// Overlay the fields the stages revise onto one element of the document
void write_back_element(json &target, const Element &element) {
  if (element.declared_position && !target.contains("declared_position")) {
    target["declared_position"] = position_to_json(*element.declared_position);
  }
  if (element.position) {
    target["position"] = position_to_json(*element.position);
  }
  if (element.bitmap) {
    target["size"] = json::array({element.size.x, element.size.y});
  }
  if (element.animation) {
    json &anim = target["animation"];
    anim["duration"] = element.animation->duration;
    anim["original_duration"] = element.animation->nominal_duration;
  }
}

} // anonymous namespace

const char *enter_kind_name(EnterKind kind) {
  switch (kind) {
  case EnterKind::None:
    return "none";
  case EnterKind::FadeIn:
    return "fade_in";
  case EnterKind::SlideInLeft:
    return "slide_in_left";
  case EnterKind::DrawPath:
    return "draw_path";
  case EnterKind::WriteText:
    return "write_text";
  }
  return "none";
}

EnterKind parse_enter_kind(const std::string &name) {
  if (name == "fade_in")
    return EnterKind::FadeIn;
  if (name == "slide_in_left")
    return EnterKind::SlideInLeft;
  if (name == "draw_path")
    return EnterKind::DrawPath;
  if (name == "write_text")
    return EnterKind::WriteText;
  return EnterKind::None;
}

const char *element_type_name(const ElementContent &content) {
  switch (content.index()) {
  case 0:
    return "text";
  case 1:
    return "formula";
  default:
    return "geometry";
  }
}

int default_z_index(const ElementContent &content) {
  switch (content.index()) {
  case 0:
    return 1;
  case 1:
    return 2;
  default:
    return 3;
  }
}

std::optional<size_t> Script::find_step(int step_id) const {
  for (size_t i = 0; i < steps.size(); ++i) {
    if (steps[i].id == step_id)
      return i;
  }
  return std::nullopt;
}

double Script::total_duration() const {
  return std::accumulate(
      steps.begin(), steps.end(), 0.0,
      [](double acc, const Step &s) { return acc + s.duration; });
}

Script Script::from_json(const std::string &json_text) {
  json document;
  try {
    document = json::parse(json_text);
  } catch (const json::parse_error &e) {
    throw ScriptError(std::string("script is not valid JSON: ") + e.what());
  }
  return from_document(document);
}

Script Script::from_document(const json &document) {
  if (!document.is_object()) {
    throw ScriptError("script document must be a JSON object");
  }

  Script script;
  script.document = document;
  ParseContext ctx{script.issues};

  try {
    const json &board =
        document.contains("blackboard") ? document["blackboard"] : document;

    if (board.contains("resolution")) {
      if (auto canvas = parse_resolution(board["resolution"])) {
        script.canvas = *canvas;
        script.canvas_declared = true;
      } else {
        ctx.note("resolution", "expected [width, height] in [1, " +
                                   std::to_string(kMaxCanvasSide) +
                                   "], using the configured canvas");
      }
    }
    if (board.contains("fps")) {
      const auto fps = number_field(board, "fps");
      if (fps && *fps > 0.0 && *fps <= kMaxFps) {
        script.fps = fps;
      } else {
        ctx.note("fps", "expected a rate in (0, " +
                            std::to_string(static_cast<int>(kMaxFps)) +
                            "], using the configured fps");
      }
    }

    const json steps = board.value("steps", json::array());
    for (size_t i = 0; i < steps.size(); ++i) {
      script.steps.push_back(parse_step(steps[i], i, ctx));
    }

    if (document.contains("audio")) {
      const json narration =
          document["audio"].value("narration", json::array());
      for (const auto &n : narration) {
        NarrationCue cue;
        cue.text = n.value("text", "");
        cue.start = n.value("start_time", 0.0);
        cue.end = n.value("end_time", cue.start);
        script.narration.push_back(std::move(cue));
      }
    }
  } catch (const json::exception &e) {
    throw ScriptError(std::string("malformed script document: ") + e.what());
  }

  return script;
}

json Script::to_json() const {
  json out = document;
  if (!out.is_object()) {
    out = json::object();
  }

  json &board = out.contains("blackboard") || out.empty()
                    ? out["blackboard"]
                    : out;
  board["resolution"] = json::array({canvas.width, canvas.height});
  if (fps) {
    board["fps"] = *fps;
  }

  json &steps_json = board["steps"];
  if (!steps_json.is_array()) {
    steps_json = json::array();
  }

  for (size_t i = 0; i < steps.size(); ++i) {
    const Step &step = steps[i];
    if (i >= steps_json.size()) {
      steps_json.push_back(step_to_json(step));
    }
    json &sj = steps_json[i];
    sj["duration"] = step.duration;
    sj["original_duration"] = step.nominal_duration;

    json &elements_json = sj["elements"];
    if (!elements_json.is_array()) {
      elements_json = json::array();
    }
    for (size_t e = 0; e < step.elements.size(); ++e) {
      const Element &element = step.elements[e];
      size_t slot = element.source_index.value_or(elements_json.size());
      if (slot >= elements_json.size()) {
        elements_json.push_back(element_to_json(element));
        slot = elements_json.size() - 1;
      }
      write_back_element(elements_json[slot], element);
    }
  }

  if (!narration.empty() && !out.contains("audio")) {
    json cues = json::array();
    for (const auto &cue : narration) {
      cues.push_back(
          {{"text", cue.text}, {"start_time", cue.start}, {"end_time", cue.end}});
    }
    out["audio"] = {{"narration", cues}};
  }
  return out;
}

std::vector<AudioSegment> parse_audio_segments(const std::string &json_text) {
  json document;
  try {
    document = json::parse(json_text);
  } catch (const json::parse_error &e) {
    throw ScriptError(std::string("audio metadata is not valid JSON: ") +
                      e.what());
  }
  return audio_segments_from_document(document);
}

std::vector<AudioSegment> audio_segments_from_document(const json &document) {
  // Accept a bare array or {"segments": [...]}
  const json &list = document.is_object()
                         ? document.value("segments", json::array())
                         : document;
  if (!list.is_array()) {
    throw ScriptError("audio metadata must be an array of segments");
  }

  std::vector<AudioSegment> segments;
  segments.reserve(list.size());
  try {
    for (const auto &s : list) {
      AudioSegment seg;
      seg.start_time = s.value("start_time", 0.0);
      seg.end_time = s.value("end_time", seg.start_time);
      seg.duration = s.value("duration", seg.end_time - seg.start_time);
      segments.push_back(seg);
    }
  } catch (const json::exception &e) {
    throw ScriptError(std::string("malformed audio metadata: ") + e.what());
  }
  return segments;
}

} // namespace LectureEngine
