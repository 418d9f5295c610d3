#include <iostream>
#include <string>

#include "flowart/core/errors.h"
#include "flowart/core/renderer.h"

#define FLOWART_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

namespace {

const flowart::Rgb kWhite{255, 255, 255};
const flowart::Rgb kGray{128, 128, 128};

flowart::Configuration small_config() {
  flowart::Configuration cfg;
  cfg.width = 200;
  cfg.height = 200;
  cfg.cell_size = 10;
  cfg.margin_factor = 0.1;
  cfg.noise_scale = 4.0;
  cfg.octaves = 2;
  cfg.seed = 1;
  cfg.seeding = flowart::SeedingMode::Grid;
  cfg.density = 0.002;
  cfg.max_length = 50;
  cfg.step_size = 2.0;
  cfg.angle_gain = 0.5;
  cfg.jitter = 0.05;
  cfg.color_lut = {kGray};
  cfg.palette_axis = flowart::PaletteAxis::X;
  cfg.palette_within_stroke = 0.0;
  cfg.width_start = 3.0;
  cfg.width_end = 1.0;
  cfg.background = kWhite;
  return cfg;
}

bool only_colors(const flowart::Canvas& c, flowart::Rgb a, flowart::Rgb b) {
  for (int y = 0; y < c.height(); ++y) {
    for (int x = 0; x < c.width(); ++x) {
      const flowart::Rgb p = c.pixel(x, y);
      if (p != a && p != b) return false;
    }
  }
  return true;
}

bool has_color(const flowart::Canvas& c, flowart::Rgb a) {
  for (int y = 0; y < c.height(); ++y) {
    for (int x = 0; x < c.width(); ++x) {
      if (c.pixel(x, y) == a) return true;
    }
  }
  return false;
}

template <typename E>
std::string error_field(const flowart::Configuration& cfg) {
  try {
    (void)flowart::render(cfg);
  } catch (const E& e) {
    return e.field();
  }
  return "<none>";
}

} // namespace

int test_renderer() {
  // Seeded render: repeatable, correctly sized, only background and stroke color.
  {
    const flowart::Configuration cfg = small_config();
    flowart::RenderStats stats;
    const flowart::Canvas a = flowart::render(cfg, &stats);
    const flowart::Canvas b = flowart::render(cfg);
    FLOWART_ASSERT(a.width() == 200 && a.height() == 200);
    FLOWART_ASSERT(a.pixels().size() == 200u * 200u * 3u);
    FLOWART_ASSERT(a == b);
    FLOWART_ASSERT(only_colors(a, kWhite, kGray));
    FLOWART_ASSERT(stats.grid_cols == 16 && stats.grid_rows == 16);
    FLOWART_ASSERT(stats.seeds == 1);
    FLOWART_ASSERT(stats.strokes_drawn + stats.strokes_skipped == stats.seeds);

    // Nothing is drawn inside the margin band except stroke width overhang.
    for (int y = 0; y < 15; ++y) {
      for (int x = 0; x < 200; ++x) FLOWART_ASSERT(a.pixel(x, y) == kWhite);
    }
  }

  // Reference scene: one octave, cell 20, step 3, no jitter, constant width 2.
  {
    flowart::Configuration cfg;
    cfg.width = 200;
    cfg.height = 200;
    cfg.cell_size = 20;
    cfg.margin_factor = 0.1;
    cfg.noise_scale = 4.0;
    cfg.octaves = 1;
    cfg.seed = 1;
    cfg.seeding = flowart::SeedingMode::Grid;
    cfg.density = 0.002;
    cfg.max_length = 50;
    cfg.step_size = 3.0;
    cfg.angle_gain = 0.5;
    cfg.jitter = 0.0;
    cfg.color_lut = {kGray};
    cfg.width_start = 2.0;
    cfg.width_end = 2.0;
    cfg.background = kWhite;

    flowart::RenderStats stats;
    const flowart::Canvas a = flowart::render(cfg, &stats);
    const flowart::Canvas b = flowart::render(cfg);
    FLOWART_ASSERT(a.width() == 200 && a.height() == 200);
    FLOWART_ASSERT(a == b);
    FLOWART_ASSERT(only_colors(a, kWhite, kGray));
    FLOWART_ASSERT(stats.grid_cols == 8 && stats.grid_rows == 8);
    FLOWART_ASSERT(stats.seeds == 1);
  }

  // Random seeding: round(160 * 160 * 0.01) = 256 seeds, strokes visible.
  {
    flowart::Configuration cfg = small_config();
    cfg.seeding = flowart::SeedingMode::Random;
    cfg.density = 0.01;
    flowart::RenderStats stats;
    const flowart::Canvas c = flowart::render(cfg, &stats);
    FLOWART_ASSERT(stats.seeds == 256);
    FLOWART_ASSERT(stats.strokes_drawn > 0);
    FLOWART_ASSERT(stats.segments_drawn >= stats.strokes_drawn);
    FLOWART_ASSERT(has_color(c, kGray));
    FLOWART_ASSERT(only_colors(c, kWhite, kGray));
  }

  // An empty LUT falls back to color_start.
  {
    flowart::Configuration cfg = small_config();
    cfg.seeding = flowart::SeedingMode::Random;
    cfg.density = 0.01;
    cfg.color_lut.clear();
    cfg.color_start = flowart::Rgb{200, 0, 0};
    const flowart::Canvas c = flowart::render(cfg);
    FLOWART_ASSERT(has_color(c, flowart::Rgb{200, 0, 0}));
    FLOWART_ASSERT(only_colors(c, kWhite, flowart::Rgb{200, 0, 0}));
  }

  // Zero max_length: every stroke is skipped and the canvas stays blank.
  {
    flowart::Configuration cfg = small_config();
    cfg.seeding = flowart::SeedingMode::Random;
    cfg.density = 0.01;
    cfg.max_length = 0;
    flowart::RenderStats stats;
    const flowart::Canvas c = flowart::render(cfg, &stats);
    FLOWART_ASSERT(stats.strokes_drawn == 0);
    FLOWART_ASSERT(stats.strokes_skipped == 256);
    FLOWART_ASSERT(only_colors(c, kWhite, kWhite));
  }

  // Invalid configurations are rejected before drawing, naming the field.
  {
    flowart::Configuration cfg = small_config();
    cfg.width = 0;
    FLOWART_ASSERT(error_field<flowart::ConfigurationError>(cfg) == "width");
  }
  {
    flowart::Configuration cfg = small_config();
    cfg.cell_size = 0;
    FLOWART_ASSERT(error_field<flowart::ConfigurationError>(cfg) == "cell_size");
  }
  {
    flowart::Configuration cfg = small_config();
    cfg.density = 0.0;
    FLOWART_ASSERT(error_field<flowart::ConfigurationError>(cfg) == "density");
  }
  {
    flowart::Configuration cfg = small_config();
    cfg.margin_factor = 0.5;
    FLOWART_ASSERT(error_field<flowart::BoundsError>(cfg) == "margin_factor");
  }
  {
    flowart::Configuration cfg = small_config();
    cfg.color_lut.clear();
    cfg.color_start.reset();
    FLOWART_ASSERT(error_field<flowart::ColorLookupError>(cfg) == "color_lut");
  }
  {
    flowart::Configuration cfg = small_config();
    cfg.step_size = 0.0;
    FLOWART_ASSERT(error_field<flowart::RenderError>(cfg) == "step_size");
  }

  return 0;
}
