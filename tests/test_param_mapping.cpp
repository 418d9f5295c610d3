#include <cmath>
#include <iostream>

#include "flowart/core/colormap.h"
#include "flowart/core/errors.h"
#include "flowart/core/param_mapping.h"

#define FLOWART_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

namespace {

bool near(double a, double b) { return std::fabs(a - b) < 1e-9; }

} // namespace

int test_param_mapping() {
  const flowart::FeatureVector v = {0.5, 0.5, 2.0, 0.5, 0.25, 0.5, 0.5, 0.5, 0.25, 0.5, 10.0, 0.5, 0.5, 0.55};

  // Feature -> parameter formulas.
  {
    const flowart::Configuration cfg = flowart::map_features_to_config(v, "expressive");
    FLOWART_ASSERT(cfg.width == 3000 && cfg.height == 3000);
    FLOWART_ASSERT(cfg.cell_size == 8);
    FLOWART_ASSERT(cfg.margin_factor == 0.08);
    FLOWART_ASSERT(cfg.noise_scale == 2.0);
    FLOWART_ASSERT(cfg.octaves == 5);
    FLOWART_ASSERT(cfg.seed && *cfg.seed == 500);
    FLOWART_ASSERT(cfg.quantize_steps == 6);
    FLOWART_ASSERT(near(cfg.swirl, 0.15));
    FLOWART_ASSERT(cfg.seeding == flowart::SeedingMode::Random);
    FLOWART_ASSERT(near(cfg.density, 0.004));
    FLOWART_ASSERT(cfg.max_length == 600);
    FLOWART_ASSERT(cfg.step_size == 3.0);
    FLOWART_ASSERT(near(cfg.angle_gain, 0.75));
    FLOWART_ASSERT(near(cfg.jitter, 0.075));
    FLOWART_ASSERT(near(cfg.width_start, 6.15));
    FLOWART_ASSERT(cfg.width_end == 0.8);
    FLOWART_ASSERT((cfg.background == flowart::Rgb{250, 250, 245}));

    // v13 = 0.55 is joy, which the expressive scheme paints with rainbow.
    FLOWART_ASSERT(cfg.palette_name == "rainbow");
    FLOWART_ASSERT(cfg.color_lut.size() == 256);
    FLOWART_ASSERT(cfg.color_start && (*cfg.color_start == flowart::Rgb{127, 0, 255}));
    FLOWART_ASSERT(cfg.color_lut.front() == *cfg.color_start);
    FLOWART_ASSERT(cfg.color_lut.back() == *cfg.color_end);
    FLOWART_ASSERT(cfg.palette_axis == flowart::PaletteAxis::Y);
    FLOWART_ASSERT(cfg.palette_within_stroke == 0.5);
  }

  // Density is clamped into [0.001, 0.006] and noise_scale kept >= 2.
  {
    flowart::FeatureVector w = v;
    w[2] = 50.0;
    w[4] = 0.0;
    const flowart::Configuration hi = flowart::map_features_to_config(w, "wild");
    FLOWART_ASSERT(near(hi.density, 0.006));
    FLOWART_ASSERT(hi.noise_scale == 2.0);
    FLOWART_ASSERT(hi.palette_axis == flowart::PaletteAxis::Field);
    w[2] = 0.0;
    FLOWART_ASSERT(near(flowart::map_features_to_config(w).density, 0.001));
  }

  // The scheme picks the range inside the colormap.
  {
    flowart::FeatureVector sad = v;
    sad[13] = 0.35;
    const flowart::Configuration cfg = flowart::map_features_to_config(sad, "expressive");
    FLOWART_ASSERT(cfg.palette_name == "PuBu");
    FLOWART_ASSERT(*cfg.color_start == flowart::to_rgb8(flowart::evaluate_colormap("PuBu", 0.2)));
  }

  // Genre thresholds on v13.
  {
    flowart::FeatureVector g = v;
    const std::pair<double, flowart::Genre> cases[] = {
        {0.1, flowart::Genre::Fear},     {0.2, flowart::Genre::Anger},  {0.25, flowart::Genre::Anger},
        {0.35, flowart::Genre::Sadness}, {0.45, flowart::Genre::Love},  {0.55, flowart::Genre::Joy},
        {0.65, flowart::Genre::Surprise}, {0.7, flowart::Genre::Neutral}, {0.75, flowart::Genre::Neutral},
    };
    for (const auto& c : cases) {
      g[13] = c.first;
      FLOWART_ASSERT(flowart::genre_from_features(g) == c.second);
    }
  }

  // Vector parsing.
  {
    const flowart::FeatureVector p =
        flowart::parse_feature_vector("[0.1, 1.0, 0.2, 2.2, 2.267, 1.0, 0.25, 0.264, 0.287, 0.814, 22.0, 0.4, 0.75, 0.1]");
    FLOWART_ASSERT(p[0] == 0.1);
    FLOWART_ASSERT(p[10] == 22.0);
    FLOWART_ASSERT(p[13] == 0.1);

    for (const char* bad : {"[1, 2, 3]", "not json", "{\"a\": 1}", "[0,0,0,0,0,0,0,0,0,0,0,0,0,\"x\"]"}) {
      bool threw = false;
      try {
        (void)flowart::parse_feature_vector(bad);
      } catch (const flowart::ConfigurationError& e) {
        threw = true;
        FLOWART_ASSERT(e.field() == "vector");
      }
      FLOWART_ASSERT(threw);
    }

    bool threw = false;
    try {
      (void)flowart::to_feature_vector(std::vector<double>(13, 0.5));
    } catch (const flowart::ConfigurationError& e) {
      threw = true;
      FLOWART_ASSERT(e.value() == "length 13");
    }
    FLOWART_ASSERT(threw);
  }

  return 0;
}
