#include "flowart/core/renderer.h"

#include <sstream>

#include "flowart/core/angle_grid.h"
#include "flowart/core/colorizer.h"
#include "flowart/core/stroke_seeder.h"
#include "flowart/core/stroke_tracer.h"
#include "flowart/util/hash_rng.h"
#include "flowart/util/log.h"

namespace flowart {
namespace {

// Separates the stroke stream from the noise stream derived from the same seed.
constexpr std::uint64_t kStrokeStream = 0x7374726F6B65ULL;

util::HashRng make_render_rng(const Configuration& cfg) {
  if (cfg.seed) return util::HashRng(util::hash_combine(static_cast<std::uint64_t>(*cfg.seed), kStrokeStream));
  return util::HashRng::from_entropy();
}

} // namespace

Canvas render(const Configuration& input, RenderStats* stats) {
  const Configuration cfg = validate_config(input);
  const FieldLayout layout = compute_field_layout(cfg);

  util::HashRng rng = make_render_rng(cfg);
  const ScalarGrid angles = fill_angle_field(layout, cfg, rng);
  const std::vector<Vec2> seeds = seed_points(layout.bounds, cfg.seeding, cfg.density, rng);

  TraceParams trace;
  trace.max_length = cfg.max_length;
  trace.step_size = cfg.step_size;
  trace.angle_gain = cfg.angle_gain;
  trace.jitter = cfg.jitter;

  Canvas canvas(cfg.width, cfg.height, cfg.background);
  RenderStats local;
  local.grid_cols = layout.nx;
  local.grid_rows = layout.ny;
  local.seeds = seeds.size();

  for (const Vec2& start : seeds) {
    const Stroke stroke = trace_stroke(start, angles, layout, trace, rng);
    if (stroke.size() < 2) {
      ++local.strokes_skipped;
      continue;
    }
    const double base = palette_base(cfg.palette_axis, start, angles, layout, rng);
    const StrokePalette palette = make_stroke_palette(base, cfg.color_lut.size(), cfg.palette_within_stroke);
    draw_stroke(canvas, stroke, cfg, palette);
    ++local.strokes_drawn;
    local.segments_drawn += stroke.size() - 1;
  }

  if (log::level() <= log::Level::Debug) {
    std::ostringstream ss;
    ss << "render " << cfg.width << "x" << cfg.height << ": grid " << layout.nx << "x" << layout.ny << ", "
       << local.seeds << " seeds, " << local.strokes_drawn << " strokes drawn, " << local.strokes_skipped
       << " skipped";
    log::debug(ss.str());
  }

  if (stats) *stats = local;
  return canvas;
}

} // namespace flowart
