#include "flowart/core/stroke_tracer.h"

#include <algorithm>
#include <cmath>

namespace flowart {
namespace {

double segment_t(std::size_t index, std::size_t segments) {
  if (segments <= 1) return 0.0;
  return static_cast<double>(index) / static_cast<double>(segments - 1);
}

} // namespace

Stroke trace_stroke(const Vec2& start, const ScalarGrid& angles, const FieldLayout& layout, const TraceParams& params,
                    util::HashRng& rng) {
  Stroke positions{start};
  if (params.max_length <= 0 || !(params.step_size > 0.0)) return positions;

  positions.reserve(static_cast<std::size_t>(std::min(params.max_length, 4096)) + 1);

  Vec2 p = start;
  double heading = sample_angle(angles, layout, p);
  for (int step = 0; step < params.max_length; ++step) {
    const double field = sample_angle(angles, layout, p);
    heading = heading * (1.0 - params.angle_gain) + field * params.angle_gain;
    heading += rng.range(-params.jitter, params.jitter);

    const Vec2 next{p.x + std::cos(heading) * params.step_size, p.y + std::sin(heading) * params.step_size};
    if (!layout.bounds.contains(next)) break;

    positions.push_back(next);
    p = next;
  }
  return positions;
}

int segment_width(double width_start, double width_end, std::size_t index, std::size_t segments) {
  const double w = width_start + (width_end - width_start) * segment_t(index, segments);
  if (!std::isfinite(w) || w < 1.0) return 1;
  return static_cast<int>(std::min(w, 4096.0));
}

void draw_stroke(Canvas& canvas, const Stroke& stroke, const Configuration& cfg, const StrokePalette& palette) {
  if (stroke.size() < 2) return;
  const std::size_t segments = stroke.size() - 1;
  for (std::size_t i = 0; i < segments; ++i) {
    const double t = segment_t(i, segments);
    const Rgb color = lookup_color(cfg, palette, t);
    canvas.draw_segment(stroke[i], stroke[i + 1], segment_width(cfg.width_start, cfg.width_end, i, segments), color);
  }
}

} // namespace flowart
