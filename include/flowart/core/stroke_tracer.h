#pragma once

#include <vector>

#include "flowart/core/angle_grid.h"
#include "flowart/core/canvas.h"
#include "flowart/core/colorizer.h"
#include "flowart/core/config.h"
#include "flowart/core/grid.h"
#include "flowart/core/vec2.h"
#include "flowart/util/hash_rng.h"

namespace flowart {

using Stroke = std::vector<Vec2>;

struct TraceParams {
  int max_length{0};
  double step_size{0.0};
  double angle_gain{0.0};
  double jitter{0.0};
};

// Follows the angle field from `start`.
//
// The heading starts at the field angle under the start point. Each of up to
// max_length steps blends the heading toward the field angle at the current
// position (heading * (1 - gain) + field * gain), adds a uniform jitter draw in
// [-jitter, jitter] (drawn even when jitter is 0), and advances step_size
// pixels. The stroke ends before the first position that leaves the closed
// bounds; that position is not recorded.
//
// The returned stroke always holds at least the start point. max_length <= 0 or
// step_size <= 0 returns exactly the start point and consumes no randomness.
Stroke trace_stroke(const Vec2& start, const ScalarGrid& angles, const FieldLayout& layout, const TraceParams& params,
                    util::HashRng& rng);

// Width of segment `index` out of `segments`: linear from width_start to
// width_end with t = index / (segments - 1), truncated to whole pixels and at
// least 1.
int segment_width(double width_start, double width_end, std::size_t index, std::size_t segments);

// Draws a traced stroke as connected segments. Strokes with fewer than two
// positions are skipped.
void draw_stroke(Canvas& canvas, const Stroke& stroke, const Configuration& cfg, const StrokePalette& palette);

} // namespace flowart
