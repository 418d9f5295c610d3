#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace flowart {

struct Rgb {
  std::uint8_t r{0};
  std::uint8_t g{0};
  std::uint8_t b{0};

  bool operator==(const Rgb& o) const { return r == o.r && g == o.g && b == o.b; }
  bool operator!=(const Rgb& o) const { return !(*this == o); }
};

using ColorLut = std::vector<Rgb>;

enum class SeedingMode { Grid, Random };

// Metric used to pick a stroke's base position in the color LUT.
enum class PaletteAxis { X, Y, Field, Random };

const char* seeding_mode_name(SeedingMode m);
const char* palette_axis_name(PaletteAxis a);

// Case-insensitive; throws ConfigurationError naming `field` on unknown input.
SeedingMode parse_seeding_mode(const std::string& s, const std::string& field = "seeding");
PaletteAxis parse_palette_axis(const std::string& s, const std::string& field = "palette_axis");

// Everything one render call needs.
//
// The record is plain data: upstream collaborators (feature mapping, style bias,
// JSON loading, the preview window) build or rewrite it freely, and render()
// validates it once on entry. Fields without an initializer comment are
// required; the others document their default.
struct Configuration {
  // Canvas size in pixels.
  int width{0};
  int height{0};

  // Flow field cell edge in pixels.
  int cell_size{0};

  // Border, as a fraction of min(width, height), kept free of strokes.
  double margin_factor{0.0};

  // Base lattice resolution of the noise (truncated to an integer, at least 2).
  double noise_scale{4.0};
  // Noise layers, clamped to [1, 10].
  int octaves{1};
  // Bootstraps every random draw of the render. Unset: fresh entropy per render.
  std::optional<std::int64_t> seed;

  // Strength of the circular bias added around the grid center (0 = off).
  double swirl{0.0};
  // Number of snapped directions around a full turn (0 = off).
  int quantize_steps{0};

  SeedingMode seeding{SeedingMode::Random};
  // Random mode: points per square pixel. Grid mode: spacing = sqrt(area/density).
  double density{0.0};

  // Maximum number of steps per stroke.
  int max_length{0};
  // Pixels advanced per step.
  double step_size{0.0};
  // 0 keeps the current heading, 1 snaps to the field angle every step.
  double angle_gain{0.0};
  // Uniform per-step heading noise half-range, radians.
  double jitter{0.0};

  ColorLut color_lut;
  PaletteAxis palette_axis{PaletteAxis::X};
  // Fraction of the LUT one stroke sweeps across (0 = flat color per stroke).
  double palette_within_stroke{0.0};

  // Gradient endpoints. color_start doubles as the fallback color when the LUT
  // is empty.
  std::optional<Rgb> color_start;
  std::optional<Rgb> color_end;

  // Opaque label chosen upstream; used for output file names.
  std::string palette_name;

  // Stroke width at the first and last segment, pixels.
  double width_start{0.0};
  double width_end{0.0};

  Rgb background{255, 255, 255};
};

// Checks a configuration and returns a normalized copy.
//
// Clamps the documented optional fields (octaves to [1,10], noise_scale to >= 2,
// palette_within_stroke to [0,1], negative swirl/quantize_steps to 0) and throws
// ConfigurationError, ColorLookupError or BoundsError for values that cannot be
// rendered. Never partially applies: either the whole record is accepted or an
// exception is thrown.
Configuration validate_config(const Configuration& cfg);

} // namespace flowart
