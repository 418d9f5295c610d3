#pragma once

#include <string>
#include <vector>

#include "flowart/core/config.h"

namespace flowart {

// Emotional genre carried by feature v13.
enum class Genre { Fear, Anger, Sadness, Love, Joy, Surprise, Neutral };

const char* genre_name(Genre g);

// Colormap and the [start, end] range of it a scheme samples for one genre.
struct PaletteRange {
  std::string colormap;
  double start{0.0};
  double end{1.0};
};

// Named bundle of genre palettes plus the per-stroke palette behavior.
struct ColorScheme {
  std::string name;
  std::string description;
  PaletteAxis palette_axis{PaletteAxis::Y};
  double palette_within_stroke{0.5};

  PaletteRange fear;
  PaletteRange anger;
  PaletteRange sadness;
  PaletteRange love;
  PaletteRange joy;
  PaletteRange surprise;
  PaletteRange neutral;

  const PaletteRange& palette_for(Genre g) const;
};

// very_smooth, expressive, wild.
const std::vector<std::string>& color_scheme_names();

// Unknown names fall back to "expressive".
const ColorScheme& get_scheme(const std::string& name);

} // namespace flowart
