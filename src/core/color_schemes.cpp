#include "flowart/core/color_schemes.h"

#include "flowart/util/strings.h"

namespace flowart {
namespace {

std::vector<ColorScheme> build_schemes() {
  std::vector<ColorScheme> out;

  {
    ColorScheme s;
    s.name = "very_smooth";
    s.description = "Smooth gradients with subtle within-stroke color transitions";
    s.palette_axis = PaletteAxis::X;
    s.palette_within_stroke = 0.2;
    s.fear = {"bone", 0.2, 0.9};
    s.anger = {"hot", 0.1, 0.95};
    s.sadness = {"PuBu", 0.4, 0.95};
    s.love = {"RdPu", 0.2, 0.9};
    s.joy = {"rainbow", 0.0, 1.0};
    s.surprise = {"cividis", 0.1, 0.9};
    s.neutral = {"grey", 0.2, 0.9};
    out.push_back(s);
  }
  {
    ColorScheme s;
    s.name = "expressive";
    s.description = "Bold color shifts with vertical gradients and per-stroke variation";
    s.palette_axis = PaletteAxis::Y;
    s.palette_within_stroke = 0.5;
    s.fear = {"bone", 0.0, 1.0};
    s.anger = {"hot", 0.0, 1.0};
    s.sadness = {"PuBu", 0.2, 1.0};
    s.love = {"RdPu", 0.0, 1.0};
    s.joy = {"rainbow", 0.0, 1.0};
    s.surprise = {"cividis", 0.0, 1.0};
    s.neutral = {"grey", 0.0, 1.0};
    out.push_back(s);
  }
  {
    ColorScheme s;
    s.name = "wild";
    s.description = "Flow-driven color with strokes following the field direction";
    s.palette_axis = PaletteAxis::Field;
    s.palette_within_stroke = 0.7;
    s.fear = {"bone", 0.0, 1.0};
    s.anger = {"hot", 0.0, 1.0};
    s.sadness = {"PuBu", 0.0, 1.0};
    s.love = {"RdPu", 0.0, 1.0};
    s.joy = {"rainbow", 0.0, 1.0};
    s.surprise = {"cividis", 0.0, 1.0};
    s.neutral = {"grey", 0.0, 1.0};
    out.push_back(s);
  }

  return out;
}

const std::vector<ColorScheme>& schemes() {
  static const std::vector<ColorScheme> all = build_schemes();
  return all;
}

} // namespace

const char* genre_name(Genre g) {
  switch (g) {
    case Genre::Fear: return "fear";
    case Genre::Anger: return "anger";
    case Genre::Sadness: return "sadness";
    case Genre::Love: return "love";
    case Genre::Joy: return "joy";
    case Genre::Surprise: return "surprise";
    case Genre::Neutral: return "neutral";
  }
  return "neutral";
}

const PaletteRange& ColorScheme::palette_for(Genre g) const {
  switch (g) {
    case Genre::Fear: return fear;
    case Genre::Anger: return anger;
    case Genre::Sadness: return sadness;
    case Genre::Love: return love;
    case Genre::Joy: return joy;
    case Genre::Surprise: return surprise;
    case Genre::Neutral: return neutral;
  }
  return neutral;
}

const std::vector<std::string>& color_scheme_names() {
  static const std::vector<std::string> names = {"very_smooth", "expressive", "wild"};
  return names;
}

const ColorScheme& get_scheme(const std::string& name) {
  const std::string n = to_lower(trim_copy(name));
  for (const ColorScheme& s : schemes()) {
    if (s.name == n) return s;
  }
  return schemes()[1];
}

} // namespace flowart
