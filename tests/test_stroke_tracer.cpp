#include <iostream>

#include "flowart/core/stroke_tracer.h"

#define FLOWART_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

namespace {

flowart::FieldLayout open_layout() {
  flowart::Configuration cfg;
  cfg.width = 100;
  cfg.height = 100;
  cfg.cell_size = 10;
  cfg.margin_factor = 0.0;
  return flowart::compute_field_layout(cfg);
}

} // namespace

int test_stroke_tracer() {
  const flowart::FieldLayout layout = open_layout();
  const flowart::ScalarGrid flat(layout.ny, layout.nx, 0.0);

  // Degenerate parameters keep just the start point and leave the RNG alone.
  {
    flowart::util::HashRng rng(4);
    const std::uint64_t before = rng.s;
    flowart::TraceParams p;
    p.max_length = 0;
    p.step_size = 2.0;
    FLOWART_ASSERT(flowart::trace_stroke(flowart::Vec2(50.0, 50.0), flat, layout, p, rng).size() == 1);
    p.max_length = 10;
    p.step_size = 0.0;
    FLOWART_ASSERT(flowart::trace_stroke(flowart::Vec2(50.0, 50.0), flat, layout, p, rng).size() == 1);
    p.step_size = -1.0;
    FLOWART_ASSERT(flowart::trace_stroke(flowart::Vec2(50.0, 50.0), flat, layout, p, rng).size() == 1);
    FLOWART_ASSERT(rng.s == before);
  }

  // A zero field walks straight along +x.
  {
    flowart::util::HashRng rng(4);
    flowart::TraceParams p;
    p.max_length = 10;
    p.step_size = 2.0;
    p.angle_gain = 1.0;
    p.jitter = 0.0;
    const flowart::Stroke s = flowart::trace_stroke(flowart::Vec2(10.0, 50.0), flat, layout, p, rng);
    FLOWART_ASSERT(s.size() == 11);
    FLOWART_ASSERT(s.front() == flowart::Vec2(10.0, 50.0));
    FLOWART_ASSERT(s.back() == flowart::Vec2(30.0, 50.0));

    // One jitter draw per step, even with zero jitter.
    flowart::util::HashRng replay(4);
    for (int k = 0; k < 10; ++k) replay.next_u64();
    FLOWART_ASSERT(replay.s == rng.s);
  }

  // Leaving the bounds ends the stroke; the outside position is not kept.
  {
    flowart::util::HashRng rng(4);
    flowart::TraceParams p;
    p.max_length = 10;
    p.step_size = 2.0;
    p.angle_gain = 1.0;
    const flowart::Stroke s = flowart::trace_stroke(flowart::Vec2(95.0, 50.0), flat, layout, p, rng);
    FLOWART_ASSERT(s.size() == 3);
    FLOWART_ASSERT(s.back() == flowart::Vec2(99.0, 50.0));
    for (const auto& q : s) FLOWART_ASSERT(layout.bounds.contains(q));
  }

  // Zero gain keeps the initial heading.
  {
    flowart::ScalarGrid field(layout.ny, layout.nx, 0.0);
    for (int c = 0; c < field.cols; ++c) field.at(5, c) = 1.0;
    flowart::util::HashRng rng(4);
    flowart::TraceParams p;
    p.max_length = 5;
    p.step_size = 2.0;
    p.angle_gain = 0.0;
    const flowart::Stroke s = flowart::trace_stroke(flowart::Vec2(10.0, 40.0), field, layout, p, rng);
    FLOWART_ASSERT(s.size() == 6);
    for (const auto& q : s) FLOWART_ASSERT(q.y == 40.0);
  }

  // Jittered strokes stay in bounds and replay identically.
  {
    flowart::TraceParams p;
    p.max_length = 200;
    p.step_size = 1.5;
    p.angle_gain = 0.5;
    p.jitter = 0.4;
    flowart::util::HashRng a(11);
    flowart::util::HashRng b(11);
    const flowart::Stroke sa = flowart::trace_stroke(flowart::Vec2(50.0, 50.0), flat, layout, p, a);
    const flowart::Stroke sb = flowart::trace_stroke(flowart::Vec2(50.0, 50.0), flat, layout, p, b);
    FLOWART_ASSERT(sa == sb);
    FLOWART_ASSERT(sa.size() >= 1 && sa.size() <= 201);
    for (const auto& q : sa) FLOWART_ASSERT(layout.bounds.contains(q));
  }

  // Width taper.
  FLOWART_ASSERT(flowart::segment_width(6.0, 0.8, 0, 1) == 6);
  FLOWART_ASSERT(flowart::segment_width(6.0, 0.8, 0, 5) == 6);
  FLOWART_ASSERT(flowart::segment_width(6.0, 0.8, 4, 5) == 1);
  FLOWART_ASSERT(flowart::segment_width(6.0, 2.0, 2, 5) == 4);
  FLOWART_ASSERT(flowart::segment_width(3.7, 3.7, 0, 2) == 3);
  FLOWART_ASSERT(flowart::segment_width(0.0, 0.0, 0, 2) == 1);

  // Single-point strokes draw nothing.
  {
    flowart::Canvas canvas(10, 10, flowart::Rgb{255, 255, 255});
    const flowart::Canvas blank = canvas;
    flowart::Configuration cfg;
    cfg.color_start = flowart::Rgb{0, 0, 0};
    cfg.width_start = 3.0;
    cfg.width_end = 1.0;
    flowart::draw_stroke(canvas, flowart::Stroke{flowart::Vec2(5.0, 5.0)}, cfg,
                         flowart::make_stroke_palette(0.0, 0, 0.0));
    FLOWART_ASSERT(canvas == blank);

    flowart::draw_stroke(canvas, flowart::Stroke{flowart::Vec2(1.0, 5.0), flowart::Vec2(8.0, 5.0)}, cfg,
                         flowart::make_stroke_palette(0.0, 0, 0.0));
    FLOWART_ASSERT(canvas != blank);
    FLOWART_ASSERT((canvas.pixel(4, 5) == flowart::Rgb{0, 0, 0}));
  }

  return 0;
}
