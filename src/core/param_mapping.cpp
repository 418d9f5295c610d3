#include "flowart/core/param_mapping.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

#include "flowart/core/colormap.h"
#include "flowart/core/errors.h"
#include "flowart/util/json.h"

namespace flowart {
namespace {

constexpr int kMappedCanvasSize = 3000;
constexpr int kLutSize = 256;

// int(x) with the result pinned to the int range; NaN maps to 0.
int trunc_int(double x) {
  if (!std::isfinite(x)) {
    if (std::isnan(x)) return 0;
    return x > 0 ? std::numeric_limits<int>::max() : std::numeric_limits<int>::min();
  }
  const double lo = static_cast<double>(std::numeric_limits<int>::min());
  const double hi = static_cast<double>(std::numeric_limits<int>::max());
  return static_cast<int>(std::clamp(std::trunc(x), lo, hi));
}

std::int64_t trunc_i64(double x) {
  if (std::isnan(x)) return 0;
  const double lim = 9.0e18;
  return static_cast<std::int64_t>(std::clamp(std::trunc(x), -lim, lim));
}

} // namespace

FeatureVector to_feature_vector(const std::vector<double>& values) {
  if (values.size() != kFeatureCount) {
    throw ConfigurationError("vector", "length " + std::to_string(values.size()),
                             "feature vector must have 14 dimensions (got " + std::to_string(values.size()) + ")");
  }
  FeatureVector v{};
  std::copy(values.begin(), values.end(), v.begin());
  return v;
}

FeatureVector parse_feature_vector(const std::string& text) {
  json::Value doc;
  try {
    doc = json::parse(text);
  } catch (const std::runtime_error& e) {
    throw ConfigurationError("vector", text, std::string("invalid vector format: ") + e.what());
  }
  const json::Array* arr = doc.as_array();
  if (!arr) throw ConfigurationError("vector", text, "invalid vector format: expected a JSON array");

  std::vector<double> values;
  values.reserve(arr->size());
  for (const json::Value& e : *arr) {
    const double* d = e.as_number();
    if (!d) throw ConfigurationError("vector", text, "invalid vector format: entries must be numbers");
    values.push_back(*d);
  }
  return to_feature_vector(values);
}

Genre genre_from_features(const FeatureVector& v) {
  const double g = v[13];
  if (g < 0.2) return Genre::Fear;
  if (g < 0.3) return Genre::Anger;
  if (g < 0.4) return Genre::Sadness;
  if (g < 0.5) return Genre::Love;
  if (g < 0.6) return Genre::Joy;
  if (g < 0.7) return Genre::Surprise;
  return Genre::Neutral;
}

Configuration map_features_to_config(const FeatureVector& v, const std::string& scheme_name) {
  const ColorScheme& scheme = get_scheme(scheme_name);
  const PaletteRange& range = scheme.palette_for(genre_from_features(v));

  Configuration cfg;
  cfg.width = kMappedCanvasSize;
  cfg.height = kMappedCanvasSize;
  cfg.cell_size = trunc_int(4.0 + v[3] * 8.0);
  cfg.margin_factor = 0.08;

  cfg.noise_scale = std::max(2.0, v[4] * 8.0);
  cfg.octaves = trunc_int(3.0 + v[7] * 4.0);
  cfg.seed = trunc_i64(v[9] * 1000.0);
  cfg.quantize_steps = trunc_int(v[5] * 12.0);
  cfg.swirl = v[6] * 0.3;

  cfg.seeding = SeedingMode::Random;
  cfg.density = std::clamp(v[2] * 0.002, 0.001, 0.006);
  cfg.max_length = trunc_int(400.0 + v[10] * 20.0);
  cfg.step_size = 2.0 + v[8] * 4.0;
  cfg.angle_gain = 0.6 + v[1] * 0.3;
  cfg.jitter = v[0] * 0.15;

  cfg.color_lut = sample_lut(range.colormap, range.start, range.end, kLutSize);
  cfg.color_start = to_rgb8(evaluate_colormap(range.colormap, range.start));
  cfg.color_end = to_rgb8(evaluate_colormap(range.colormap, range.end));
  cfg.palette_axis = scheme.palette_axis;
  cfg.palette_within_stroke = scheme.palette_within_stroke;
  cfg.palette_name = range.colormap;

  cfg.width_start = 6.0 + v[11] * 0.3;
  cfg.width_end = 0.8;
  cfg.background = Rgb{250, 250, 245};
  return cfg;
}

} // namespace flowart
