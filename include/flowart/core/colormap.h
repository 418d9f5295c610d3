#pragma once

#include <string>
#include <vector>

#include "flowart/core/config.h"

namespace flowart {

// Continuous color in [0, 1] per channel.
struct ColorF {
  double r{0.0};
  double g{0.0};
  double b{0.0};
};

// Names accepted by evaluate_colormap/sample_lut:
// bone, hot, PuBu, RdPu, rainbow, cividis, grey (alias gray).
// Lookup is case-insensitive.
const std::vector<std::string>& colormap_names();
bool is_known_colormap(const std::string& name);

// Evaluates a named colormap at x (clamped to [0, 1]).
// Throws ConfigurationError (field "colormap") for unknown names.
ColorF evaluate_colormap(const std::string& name, double x);

// Channel conversion used throughout: int(c * 255), i.e. truncation.
Rgb to_rgb8(const ColorF& c);

// Samples n evenly spaced positions from start to end (both inclusive).
// n == 1 samples start only; n <= 0 yields an empty LUT.
ColorLut sample_lut(const std::string& name, double start, double end, int n);

} // namespace flowart
