#include "flowart/core/colorizer.h"

#include <algorithm>
#include <cmath>

namespace flowart {
namespace {

constexpr double kTwoPi = 6.283185307179586476925286766559;

long long round_half_away(double v) { return std::llround(v); }

} // namespace

std::size_t StrokePalette::index_at(double t) const {
  if (lut_size == 0) return 0;
  const long long last = static_cast<long long>(lut_size) - 1;
  const long long idx = static_cast<long long>(base_index) + round_half_away(t * static_cast<double>(span));
  return static_cast<std::size_t>(std::clamp(idx, 0LL, last));
}

double palette_base(PaletteAxis axis, const Vec2& start, const ScalarGrid& angles, const FieldLayout& layout,
                    util::HashRng& rng) {
  const SpatialBounds& b = layout.bounds;
  double base = 0.0;
  switch (axis) {
    case PaletteAxis::X: base = (start.x - b.x0) / std::max(1.0, b.width()); break;
    case PaletteAxis::Y: base = (start.y - b.y0) / std::max(1.0, b.height()); break;
    case PaletteAxis::Field: {
      double a = std::fmod(sample_angle(angles, layout, start), kTwoPi);
      if (a < 0.0) a += kTwoPi;
      base = a / kTwoPi;
      break;
    }
    case PaletteAxis::Random: base = rng.next_u01(); break;
  }
  return std::clamp(base, 0.0, 1.0);
}

StrokePalette make_stroke_palette(double base, std::size_t lut_size, double within_stroke) {
  StrokePalette p;
  p.lut_size = lut_size;
  if (lut_size <= 1) return p;

  const long long last = static_cast<long long>(lut_size) - 1;
  const long long span = std::clamp(round_half_away(static_cast<double>(last) * within_stroke), 0LL, last);
  const double b = std::clamp(base, 0.0, 1.0);
  p.span = static_cast<std::size_t>(span);
  p.base_index = static_cast<std::size_t>(round_half_away(b * static_cast<double>(last - span)));
  return p;
}

Rgb lookup_color(const Configuration& cfg, const StrokePalette& palette, double t) {
  if (cfg.color_lut.empty()) return cfg.color_start.value_or(Rgb{});
  return cfg.color_lut[palette.index_at(t)];
}

} // namespace flowart
