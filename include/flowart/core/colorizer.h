#pragma once

#include <cstddef>

#include "flowart/core/angle_grid.h"
#include "flowart/core/config.h"
#include "flowart/core/grid.h"
#include "flowart/core/vec2.h"
#include "flowart/util/hash_rng.h"

namespace flowart {

// Where one stroke sits in the color LUT.
//
// A stroke covers LUT indices [base_index, base_index + span]. span grows with
// palette_within_stroke (0 = one flat color per stroke, 1 = the whole ramp);
// base_index moves the window along the ramp according to the palette axis
// metric.
//
// All rounding is half away from zero (std::lround): with 256 entries and
// palette_within_stroke = 0.5 the span is 128.
struct StrokePalette {
  std::size_t lut_size{0};
  std::size_t span{0};
  std::size_t base_index{0};

  // LUT index for progress t in [0, 1] along the stroke, clamped to the LUT.
  std::size_t index_at(double t) const;
};

// Base metric in [0, 1] for a stroke starting at `start`.
//
// X / Y: start position normalized by the bounds extent (at least 1 pixel).
// Field: angle under the start point, wrapped into [0, 2pi), divided by 2pi.
// Random: one draw from the render RNG; the draw happens only for this axis.
double palette_base(PaletteAxis axis, const Vec2& start, const ScalarGrid& angles, const FieldLayout& layout,
                    util::HashRng& rng);

StrokePalette make_stroke_palette(double base, std::size_t lut_size, double within_stroke);

// Segment color for a validated configuration. An empty LUT yields the
// configuration's fallback color (color_start); validate_config() guarantees
// one exists.
Rgb lookup_color(const Configuration& cfg, const StrokePalette& palette, double t);

} // namespace flowart
