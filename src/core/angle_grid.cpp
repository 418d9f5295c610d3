#include "flowart/core/angle_grid.h"

#include <algorithm>
#include <cmath>
#include <sstream>

#include "flowart/core/errors.h"
#include "flowart/core/noise_field.h"

namespace flowart {
namespace {

constexpr double kTwoPi = 6.283185307179586476925286766559;

std::string num(double v) {
  std::ostringstream ss;
  ss << v;
  return ss.str();
}

} // namespace

FieldLayout compute_field_layout(const Configuration& cfg) {
  if (cfg.width <= 0) throw ConfigurationError("width", std::to_string(cfg.width), "width must be positive");
  if (cfg.height <= 0) throw ConfigurationError("height", std::to_string(cfg.height), "height must be positive");
  if (cfg.cell_size <= 0) {
    throw ConfigurationError("cell_size", std::to_string(cfg.cell_size), "cell_size must be positive");
  }
  if (!std::isfinite(cfg.margin_factor) || cfg.margin_factor < 0.0) {
    throw ConfigurationError("margin_factor", num(cfg.margin_factor), "margin_factor must be a finite value >= 0");
  }

  FieldLayout layout;
  const double min_dim = static_cast<double>(std::min(cfg.width, cfg.height));
  layout.margin = min_dim * cfg.margin_factor;
  if (2.0 * layout.margin >= min_dim) {
    throw BoundsError("margin_factor", num(cfg.margin_factor),
                      "margin " + num(layout.margin) + " leaves no drawable area on a " + std::to_string(cfg.width) +
                          "x" + std::to_string(cfg.height) + " canvas");
  }

  layout.bounds = SpatialBounds{layout.margin, layout.margin, cfg.width - layout.margin, cfg.height - layout.margin};
  layout.cell_size = cfg.cell_size;
  layout.nx = static_cast<int>((cfg.width - 2.0 * layout.margin) / cfg.cell_size);
  layout.ny = static_cast<int>((cfg.height - 2.0 * layout.margin) / cfg.cell_size);
  if (layout.nx < 1 || layout.ny < 1) {
    throw ConfigurationError("cell_size", std::to_string(cfg.cell_size),
                             "cell_size " + std::to_string(cfg.cell_size) + " leaves an empty " +
                                 std::to_string(layout.ny) + "x" + std::to_string(layout.nx) + " angle grid");
  }
  return layout;
}

ScalarGrid build_angle_grid(const ScalarGrid& noise, double swirl, int quantize_steps) {
  ScalarGrid angles(noise.rows, noise.cols);
  for (std::size_t k = 0; k < noise.values.size(); ++k) angles.values[k] = noise.values[k] * kTwoPi;

  if (swirl > 0.0) {
    const double cy = noise.rows / 2.0;
    const double cx = noise.cols / 2.0;
    for (int y = 0; y < angles.rows; ++y) {
      for (int x = 0; x < angles.cols; ++x) {
        angles.at(y, x) += std::atan2(y - cy, x - cx) * swirl;
      }
    }
  }

  if (quantize_steps > 0) {
    const double n = static_cast<double>(quantize_steps);
    for (double& a : angles.values) a = std::round(a / kTwoPi * n) * kTwoPi / n;
  }
  return angles;
}

ScalarGrid fill_angle_field(const FieldLayout& layout, const Configuration& cfg, util::HashRng& rng) {
  NoiseParams np;
  np.rows = layout.ny;
  np.cols = layout.nx;
  np.res_y = static_cast<int>(std::max(2.0, cfg.noise_scale));
  np.res_x = np.res_y;
  np.octaves = cfg.octaves;
  np.seed = cfg.seed;

  const ScalarGrid noise = generate_gradient_noise(np, rng);
  return build_angle_grid(noise, cfg.swirl, cfg.quantize_steps);
}

double sample_angle(const ScalarGrid& angles, const FieldLayout& layout, const Vec2& p) {
  const double fx = (p.x - layout.bounds.x0) / layout.cell_size;
  const double fy = (p.y - layout.bounds.y0) / layout.cell_size;
  // Truncation toward zero: a point just left of the grid still maps to column 0.
  if (!std::isfinite(fx) || !std::isfinite(fy) || std::fabs(fx) > 1e9 || std::fabs(fy) > 1e9) return 0.0;
  const int gx = static_cast<int>(fx);
  const int gy = static_cast<int>(fy);
  if (!angles.contains(gy, gx)) return 0.0;
  return angles.at(gy, gx);
}

} // namespace flowart
