#include "flowart/core/config_json.h"

#include <cmath>

#include "flowart/core/errors.h"
#include "flowart/util/file_io.h"

namespace flowart {
namespace {

using json::Value;

[[noreturn]] void bad_field(const std::string& field, const Value& v, const std::string& expected) {
  throw ConfigurationError(field, json::stringify(v, 0), "config field '" + field + "' must be " + expected);
}

const Value& required(const Value& root, const std::string& key) {
  const Value* v = root.find(key);
  if (!v || v->is_null()) {
    throw ConfigurationError(key, "<missing>", "config is missing required field '" + key + "'");
  }
  return *v;
}

const Value* optional(const Value& root, const std::string& key) {
  const Value* v = root.find(key);
  if (!v || v->is_null()) return nullptr;
  return v;
}

double as_number(const Value& v, const std::string& field) {
  const double* d = v.as_number();
  if (!d) bad_field(field, v, "a number");
  return *d;
}

int as_int(const Value& v, const std::string& field) {
  const double d = as_number(v, field);
  if (!std::isfinite(d) || std::fabs(d) > 2.0e9) bad_field(field, v, "an integer");
  return static_cast<int>(d);
}

std::string as_string(const Value& v, const std::string& field) {
  const std::string* s = v.as_string();
  if (!s) bad_field(field, v, "a string");
  return *s;
}

} // namespace

json::Value rgb_to_json(const Rgb& c) {
  return json::array({static_cast<double>(c.r), static_cast<double>(c.g), static_cast<double>(c.b)});
}

Rgb rgb_from_json(const Value& v, const std::string& field) {
  const json::Array* a = v.as_array();
  if (!a || a->size() != 3) bad_field(field, v, "an [r, g, b] array");
  std::uint8_t ch[3] = {0, 0, 0};
  for (std::size_t k = 0; k < 3; ++k) {
    const double* d = (*a)[k].as_number();
    if (!d || !(*d >= 0.0 && *d <= 255.0)) bad_field(field, v, "an [r, g, b] array of integers in 0..255");
    ch[k] = static_cast<std::uint8_t>(*d);
  }
  return Rgb{ch[0], ch[1], ch[2]};
}

Configuration config_from_json(const Value& root) {
  if (!root.is_object()) throw ConfigurationError("<root>", json::stringify(root, 0), "config must be a JSON object");

  Configuration cfg;
  cfg.width = as_int(required(root, "width"), "width");
  cfg.height = as_int(required(root, "height"), "height");
  cfg.cell_size = as_int(required(root, "cell_size"), "cell_size");
  cfg.margin_factor = as_number(required(root, "margin_factor"), "margin_factor");
  cfg.seeding = parse_seeding_mode(as_string(required(root, "seeding"), "seeding"), "seeding");
  cfg.density = as_number(required(root, "density"), "density");
  cfg.max_length = as_int(required(root, "max_length"), "max_length");
  cfg.step_size = as_number(required(root, "step_size"), "step_size");
  cfg.angle_gain = as_number(required(root, "angle_gain"), "angle_gain");
  cfg.jitter = as_number(required(root, "jitter"), "jitter");
  cfg.width_start = as_number(required(root, "width_start"), "width_start");
  cfg.width_end = as_number(required(root, "width_end"), "width_end");
  cfg.background = rgb_from_json(required(root, "background"), "background");

  const Value& lut = required(root, "color_lut");
  const json::Array* entries = lut.as_array();
  if (!entries) bad_field("color_lut", lut, "an array of [r, g, b] colors");
  cfg.color_lut.reserve(entries->size());
  for (std::size_t k = 0; k < entries->size(); ++k) {
    cfg.color_lut.push_back(rgb_from_json((*entries)[k], "color_lut[" + std::to_string(k) + "]"));
  }

  if (const Value* v = optional(root, "noise_scale")) cfg.noise_scale = as_number(*v, "noise_scale");
  if (const Value* v = optional(root, "octaves")) cfg.octaves = as_int(*v, "octaves");
  if (const Value* v = optional(root, "seed")) {
    const double d = as_number(*v, "seed");
    if (!std::isfinite(d) || std::fabs(d) > 9.0e15) bad_field("seed", *v, "an integer");
    cfg.seed = static_cast<std::int64_t>(d);
  }
  if (const Value* v = optional(root, "swirl")) cfg.swirl = as_number(*v, "swirl");
  if (const Value* v = optional(root, "quantize_steps")) cfg.quantize_steps = as_int(*v, "quantize_steps");
  if (const Value* v = optional(root, "palette_axis")) {
    cfg.palette_axis = parse_palette_axis(as_string(*v, "palette_axis"), "palette_axis");
  }
  if (const Value* v = optional(root, "palette_within_stroke")) {
    cfg.palette_within_stroke = as_number(*v, "palette_within_stroke");
  }
  if (const Value* v = optional(root, "color_start")) cfg.color_start = rgb_from_json(*v, "color_start");
  if (const Value* v = optional(root, "color_end")) cfg.color_end = rgb_from_json(*v, "color_end");
  if (const Value* v = optional(root, "palette_name")) cfg.palette_name = as_string(*v, "palette_name");

  return cfg;
}

json::Value config_to_json(const Configuration& cfg) {
  json::Object o;
  o["width"] = static_cast<double>(cfg.width);
  o["height"] = static_cast<double>(cfg.height);
  o["cell_size"] = static_cast<double>(cfg.cell_size);
  o["margin_factor"] = cfg.margin_factor;
  o["noise_scale"] = cfg.noise_scale;
  o["octaves"] = static_cast<double>(cfg.octaves);
  o["seed"] = cfg.seed ? Value(static_cast<double>(*cfg.seed)) : Value(nullptr);
  o["swirl"] = cfg.swirl;
  o["quantize_steps"] = static_cast<double>(cfg.quantize_steps);
  o["seeding"] = std::string(seeding_mode_name(cfg.seeding));
  o["density"] = cfg.density;
  o["max_length"] = static_cast<double>(cfg.max_length);
  o["step_size"] = cfg.step_size;
  o["angle_gain"] = cfg.angle_gain;
  o["jitter"] = cfg.jitter;
  o["palette_axis"] = std::string(palette_axis_name(cfg.palette_axis));
  o["palette_within_stroke"] = cfg.palette_within_stroke;
  o["width_start"] = cfg.width_start;
  o["width_end"] = cfg.width_end;
  o["background"] = rgb_to_json(cfg.background);
  if (cfg.color_start) o["color_start"] = rgb_to_json(*cfg.color_start);
  if (cfg.color_end) o["color_end"] = rgb_to_json(*cfg.color_end);
  if (!cfg.palette_name.empty()) o["palette_name"] = cfg.palette_name;

  json::Array lut;
  lut.reserve(cfg.color_lut.size());
  for (const Rgb& c : cfg.color_lut) lut.push_back(rgb_to_json(c));
  o["color_lut"] = json::array(std::move(lut));

  return json::object(std::move(o));
}

Configuration load_config_file(const std::string& path) {
  return config_from_json(json::parse(read_text_file(path)));
}

void save_config_file(const std::string& path, const Configuration& cfg) {
  write_file_atomic(path, json::stringify(config_to_json(cfg), 2) + "\n");
}

} // namespace flowart
