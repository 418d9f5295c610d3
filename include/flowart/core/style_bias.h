#pragma once

#include <string>

#include "flowart/core/config.h"

namespace flowart {

enum class Style {
  // Leaves the configuration untouched.
  Natural,
  // Higher contrast, sharper angles, finer grain.
  Sharp,
};

const char* style_name(Style s);

// "sharp" and "preferred" -> Sharp; "natural" and "" -> Natural.
// Case-insensitive. Throws ConfigurationError (field "style") otherwise.
Style parse_style(const std::string& name);

// Post-processes a mapped configuration. Sharp rewrites noise_scale, octaves,
// quantize_steps, jitter, angle_gain, cell_size, density, the gradient
// endpoints and the stroke widths; the LUT is left alone.
Configuration apply_style_bias(const Configuration& cfg, Style style);

} // namespace flowart
