#pragma once

#include "flowart/core/config.h"
#include "flowart/core/grid.h"
#include "flowart/core/vec2.h"
#include "flowart/util/hash_rng.h"

namespace flowart {

// Drawable rectangle: the canvas minus the margin on every side.
struct SpatialBounds {
  double x0{0.0};
  double y0{0.0};
  double x1{0.0};
  double y1{0.0};

  double width() const { return x1 - x0; }
  double height() const { return y1 - y0; }
  double area() const { return width() * height(); }

  // Closed rectangle: points on the edge are inside.
  bool contains(const Vec2& p) const { return p.x >= x0 && p.x <= x1 && p.y >= y0 && p.y <= y1; }
};

// Spatial layout of one render, derived from width/height/margin/cell_size.
struct FieldLayout {
  double margin{0.0};
  SpatialBounds bounds;
  int cell_size{1};
  // Angle grid columns/rows: floor((extent - 2 * margin) / cell_size).
  int nx{0};
  int ny{0};
};

// Throws ConfigurationError for non-positive sizes or an empty grid and
// BoundsError when the margin eats half of the smaller canvas dimension.
FieldLayout compute_field_layout(const Configuration& cfg);

// Converts noise in [-1, 1] to radians (noise * 2pi), then optionally adds a
// swirl term atan2(y - cy, x - cx) * swirl around the grid center and snaps to
// quantize_steps directions. The order is fixed: quantization runs last and
// erases part of the swirl contribution.
ScalarGrid build_angle_grid(const ScalarGrid& noise, double swirl, int quantize_steps);

// Noise + angle conversion for a validated configuration. The noise lattice
// resolution is the configuration's noise_scale truncated to an integer.
ScalarGrid fill_angle_field(const FieldLayout& layout, const Configuration& cfg, util::HashRng& rng);

// Field angle under a canvas position: the grid cell is found by truncating
// (p - bounds origin) / cell_size. Positions outside the grid read as 0.
double sample_angle(const ScalarGrid& angles, const FieldLayout& layout, const Vec2& p);

} // namespace flowart
