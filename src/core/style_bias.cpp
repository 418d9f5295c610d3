#include "flowart/core/style_bias.h"

#include <algorithm>
#include <cmath>

#include "flowart/core/errors.h"
#include "flowart/util/strings.h"

namespace flowart {
namespace {

Rgb shift(const Rgb& c, int delta) {
  auto ch = [delta](std::uint8_t v) { return static_cast<std::uint8_t>(std::clamp(int(v) + delta, 0, 255)); };
  return Rgb{ch(c.r), ch(c.g), ch(c.b)};
}

} // namespace

const char* style_name(Style s) {
  switch (s) {
    case Style::Natural: return "natural";
    case Style::Sharp: return "sharp";
  }
  return "natural";
}

Style parse_style(const std::string& name) {
  const std::string n = to_lower(trim_copy(name));
  if (n.empty() || n == "natural") return Style::Natural;
  if (n == "sharp" || n == "preferred") return Style::Sharp;
  throw ConfigurationError("style", name, "unknown style '" + name + "' (expected sharp|preferred|natural)");
}

Configuration apply_style_bias(const Configuration& cfg, Style style) {
  if (style == Style::Natural) return cfg;

  Configuration out = cfg;

  // Stronger noise and more detail.
  out.noise_scale = std::trunc(std::max(3.0, cfg.noise_scale * 1.6));
  out.octaves = cfg.octaves + 2;

  out.quantize_steps = std::max(12, cfg.quantize_steps > 0 ? cfg.quantize_steps : 16);

  // Crisper strokes: less jitter, tighter field following.
  out.jitter = std::max(0.001, cfg.jitter * 0.35);
  out.angle_gain = std::min(0.99, cfg.angle_gain + 0.25);

  out.cell_size = std::max(2, static_cast<int>(cfg.cell_size * 0.6));
  out.density = std::min(0.02, cfg.density * 2.0);

  out.color_start = shift(cfg.color_start.value_or(Rgb{20, 20, 20}), -40);
  out.color_end = shift(cfg.color_end.value_or(Rgb{200, 200, 200}), 40);

  out.width_start = cfg.width_start * 1.4;
  out.width_end = std::max(0.6, cfg.width_end * 0.9);
  return out;
}

} // namespace flowart
