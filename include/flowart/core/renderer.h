#pragma once

#include <cstddef>

#include "flowart/core/canvas.h"
#include "flowart/core/config.h"

namespace flowart {

// Counters describing one finished render.
struct RenderStats {
  int grid_cols{0};
  int grid_rows{0};
  std::size_t seeds{0};
  std::size_t strokes_drawn{0};
  // Seeds whose stroke left the bounds (or ran out of budget) before a second
  // position; they are skipped, never an error.
  std::size_t strokes_skipped{0};
  std::size_t segments_drawn{0};
};

// Renders one configuration.
//
// Validates the configuration first (throwing ConfigurationError,
// ColorLookupError or BoundsError before any drawing), then builds the angle
// field, seeds strokes, traces and draws them in seed order and returns the
// finished raster.
//
// The call is synchronous and self-contained: it owns its canvas and a
// private RNG (seeded from cfg.seed, or from fresh entropy when unset), so
// independent renders may run concurrently on different threads and a seeded
// configuration always yields byte-identical output.
Canvas render(const Configuration& cfg, RenderStats* stats = nullptr);

} // namespace flowart
