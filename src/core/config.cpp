#include "flowart/core/config.h"

#include <algorithm>
#include <cmath>
#include <sstream>

#include "flowart/core/angle_grid.h"
#include "flowart/core/errors.h"
#include "flowart/core/noise_field.h"
#include "flowart/util/strings.h"

namespace flowart {
namespace {

// Keeps res * 2^(kMaxOctaves - 1) inside int range.
constexpr double kMaxNoiseScale = 1.0e6;

std::string num(double v) {
  std::ostringstream ss;
  ss << v;
  return ss.str();
}

void require_finite(const char* field, double v) {
  if (std::isfinite(v)) return;
  throw ConfigurationError(field, num(v), std::string(field) + " must be finite (got " + num(v) + ")");
}

} // namespace

const char* seeding_mode_name(SeedingMode m) {
  switch (m) {
    case SeedingMode::Grid: return "grid";
    case SeedingMode::Random: return "random";
  }
  return "random";
}

const char* palette_axis_name(PaletteAxis a) {
  switch (a) {
    case PaletteAxis::X: return "x";
    case PaletteAxis::Y: return "y";
    case PaletteAxis::Field: return "field";
    case PaletteAxis::Random: return "random";
  }
  return "x";
}

SeedingMode parse_seeding_mode(const std::string& s, const std::string& field) {
  const std::string v = to_lower(trim_copy(s));
  if (v == "grid") return SeedingMode::Grid;
  if (v == "random") return SeedingMode::Random;
  throw ConfigurationError(field, s, "unknown seeding mode '" + s + "' (expected grid|random)");
}

PaletteAxis parse_palette_axis(const std::string& s, const std::string& field) {
  const std::string v = to_lower(trim_copy(s));
  if (v == "x") return PaletteAxis::X;
  if (v == "y") return PaletteAxis::Y;
  if (v == "field") return PaletteAxis::Field;
  if (v == "random") return PaletteAxis::Random;
  throw ConfigurationError(field, s, "unknown palette axis '" + s + "' (expected x|y|field|random)");
}

Configuration validate_config(const Configuration& cfg) {
  Configuration out = cfg;

  require_finite("margin_factor", cfg.margin_factor);
  require_finite("noise_scale", cfg.noise_scale);
  require_finite("swirl", cfg.swirl);
  require_finite("density", cfg.density);
  require_finite("step_size", cfg.step_size);
  require_finite("angle_gain", cfg.angle_gain);
  require_finite("jitter", cfg.jitter);
  require_finite("palette_within_stroke", cfg.palette_within_stroke);
  require_finite("width_start", cfg.width_start);
  require_finite("width_end", cfg.width_end);

  // Sizes, margin and grid emptiness.
  (void)compute_field_layout(cfg);

  if (cfg.density <= 0.0) {
    throw ConfigurationError("density", num(cfg.density), "density must be > 0 (got " + num(cfg.density) + ")");
  }
  if (cfg.step_size <= 0.0) {
    throw ConfigurationError("step_size", num(cfg.step_size),
                             "step_size must be > 0 (got " + num(cfg.step_size) + ")");
  }
  if (cfg.max_length < 0) {
    throw ConfigurationError("max_length", std::to_string(cfg.max_length), "max_length must be >= 0");
  }
  if (cfg.jitter < 0.0) {
    throw ConfigurationError("jitter", num(cfg.jitter), "jitter must be >= 0 (got " + num(cfg.jitter) + ")");
  }
  if (cfg.angle_gain < 0.0 || cfg.angle_gain > 1.0) {
    throw ConfigurationError("angle_gain", num(cfg.angle_gain),
                             "angle_gain must lie in [0, 1] (got " + num(cfg.angle_gain) + ")");
  }
  if (cfg.noise_scale > kMaxNoiseScale) {
    throw ConfigurationError("noise_scale", num(cfg.noise_scale),
                             "noise_scale must be <= " + num(kMaxNoiseScale) + " (got " + num(cfg.noise_scale) + ")");
  }
  if (cfg.color_lut.empty() && !cfg.color_start) {
    throw ColorLookupError("color_lut", "[]", "color_lut is empty and no color_start fallback is set");
  }

  out.noise_scale = std::max(2.0, cfg.noise_scale);
  out.octaves = std::clamp(cfg.octaves, kMinOctaves, kMaxOctaves);
  out.swirl = std::max(0.0, cfg.swirl);
  out.quantize_steps = std::max(0, cfg.quantize_steps);
  out.palette_within_stroke = std::clamp(cfg.palette_within_stroke, 0.0, 1.0);
  return out;
}

} // namespace flowart
