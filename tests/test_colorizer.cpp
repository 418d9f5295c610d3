#include <iostream>

#include "flowart/core/colorizer.h"

#define FLOWART_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

namespace {

flowart::ColorLut ramp(std::size_t n) {
  flowart::ColorLut lut(n);
  for (std::size_t i = 0; i < n; ++i) {
    const auto v = static_cast<std::uint8_t>(i % 256);
    lut[i] = flowart::Rgb{v, v, v};
  }
  return lut;
}

} // namespace

int test_colorizer() {
  // 256 entries, half the ramp per stroke.
  {
    const flowart::StrokePalette p = flowart::make_stroke_palette(0.0, 256, 0.5);
    FLOWART_ASSERT(p.span == 128);
    FLOWART_ASSERT(p.base_index == 0);
    FLOWART_ASSERT(p.index_at(0.0) == 0);
    FLOWART_ASSERT(p.index_at(1.0) == 128);
    FLOWART_ASSERT(p.index_at(0.5) == 64);
  }
  {
    const flowart::StrokePalette p = flowart::make_stroke_palette(1.0, 256, 0.5);
    FLOWART_ASSERT(p.base_index == 127);
    FLOWART_ASSERT(p.index_at(1.0) == 255);
  }

  // Flat strokes: every t maps to the base index.
  {
    const flowart::StrokePalette p = flowart::make_stroke_palette(0.5, 256, 0.0);
    FLOWART_ASSERT(p.span == 0);
    FLOWART_ASSERT(p.base_index == 128);
    FLOWART_ASSERT(p.index_at(0.0) == p.index_at(1.0));
  }

  // Whole ramp: base has no room to move.
  {
    const flowart::StrokePalette p = flowart::make_stroke_palette(0.9, 256, 1.0);
    FLOWART_ASSERT(p.span == 255);
    FLOWART_ASSERT(p.base_index == 0);
    FLOWART_ASSERT(p.index_at(1.0) == 255);
  }

  // Indices never leave the LUT.
  {
    const flowart::StrokePalette p = flowart::make_stroke_palette(1.0, 4, 1.0);
    FLOWART_ASSERT(p.index_at(2.0) == 3);
    FLOWART_ASSERT(p.index_at(-1.0) == 0);
    const flowart::StrokePalette one = flowart::make_stroke_palette(0.7, 1, 0.5);
    FLOWART_ASSERT(one.index_at(1.0) == 0);
  }

  // lookup_color reads the LUT, or the fallback color when it is empty.
  {
    flowart::Configuration cfg;
    cfg.color_lut = ramp(256);
    const flowart::StrokePalette p = flowart::make_stroke_palette(0.0, cfg.color_lut.size(), 0.5);
    FLOWART_ASSERT((flowart::lookup_color(cfg, p, 1.0) == flowart::Rgb{128, 128, 128}));

    cfg.color_lut.clear();
    cfg.color_start = flowart::Rgb{12, 34, 56};
    const flowart::StrokePalette empty = flowart::make_stroke_palette(0.0, 0, 0.5);
    FLOWART_ASSERT((flowart::lookup_color(cfg, empty, 0.3) == flowart::Rgb{12, 34, 56}));
  }

  // Axis metrics.
  {
    flowart::Configuration cfg;
    cfg.width = 100;
    cfg.height = 100;
    cfg.cell_size = 10;
    cfg.margin_factor = 0.1;
    const flowart::FieldLayout layout = flowart::compute_field_layout(cfg);
    flowart::ScalarGrid angles(layout.ny, layout.nx, 0.0);
    angles.at(0, 0) = -3.14159265358979323846 / 2.0;

    flowart::util::HashRng rng(3);
    const std::uint64_t before = rng.s;
    const flowart::Vec2 start(30.0, 70.0);
    FLOWART_ASSERT(flowart::palette_base(flowart::PaletteAxis::X, start, angles, layout, rng) == 0.25);
    FLOWART_ASSERT(flowart::palette_base(flowart::PaletteAxis::Y, start, angles, layout, rng) == 0.75);
    FLOWART_ASSERT(rng.s == before);

    const double field = flowart::palette_base(flowart::PaletteAxis::Field, flowart::Vec2(12.0, 12.0), angles, layout, rng);
    FLOWART_ASSERT(field > 0.7499 && field < 0.7501);
    FLOWART_ASSERT(rng.s == before);

    flowart::util::HashRng replay(3);
    const double expected = replay.next_u01();
    FLOWART_ASSERT(flowart::palette_base(flowart::PaletteAxis::Random, start, angles, layout, rng) == expected);
    FLOWART_ASSERT(rng.s == replay.s);
  }

  return 0;
}
