#include "flowart/core/stroke_seeder.h"

#include <cmath>
#include <limits>
#include <sstream>
#include <string>

#include "flowart/core/errors.h"

namespace flowart {
namespace {

// Number of lattice coordinates start + k * step strictly below stop, as a double
// so oversized counts can be rejected before any integer conversion.
double lattice_count(double start, double stop, double step) {
  if (!(stop > start)) return 0.0;
  return std::ceil((stop - start) / step);
}

std::string density_text(double density) {
  std::ostringstream v;
  v << density;
  return v.str();
}

void check_point_count(double count, double density) {
  if (!(count <= static_cast<double>(kMaxSeedPoints))) {
    const std::string v = density_text(density);
    std::ostringstream msg;
    msg << "density " << v << " asks for " << count << " seed points (limit " << kMaxSeedPoints << ")";
    throw ConfigurationError("density", v, msg.str());
  }
}

} // namespace

std::vector<Vec2> seed_points(const SpatialBounds& bounds, SeedingMode mode, double density, util::HashRng& rng) {
  if (!std::isfinite(density) || density <= 0.0) {
    const std::string v = density_text(density);
    throw ConfigurationError("density", v, "density must be a finite value > 0 (got " + v + ")");
  }

  std::vector<Vec2> points;
  const double area = bounds.area();

  if (mode == SeedingMode::Random) {
    const double count = std::round(area * density);
    check_point_count(count, density);
    if (!(count > 0.0)) return points;
    const std::size_t n = static_cast<std::size_t>(count);
    points.reserve(n);
    for (std::size_t k = 0; k < n; ++k) {
      const double x = rng.range(bounds.x0, bounds.x1);
      const double y = rng.range(bounds.y0, bounds.y1);
      points.emplace_back(x, y);
    }
    return points;
  }

  const double spacing = std::sqrt(area / density);
  if (!(spacing > 0.0)) check_point_count(std::numeric_limits<double>::infinity(), density);
  const double fy = lattice_count(bounds.y0, bounds.y1, spacing);
  const double fx = lattice_count(bounds.x0, bounds.x1, spacing);
  check_point_count(fx * fy, density);
  const std::size_t ny = static_cast<std::size_t>(fy);
  const std::size_t nx = static_cast<std::size_t>(fx);
  points.reserve(nx * ny);
  for (std::size_t j = 0; j < ny; ++j) {
    const double y = bounds.y0 + static_cast<double>(j) * spacing;
    for (std::size_t i = 0; i < nx; ++i) {
      points.emplace_back(bounds.x0 + static_cast<double>(i) * spacing, y);
    }
  }
  return points;
}

} // namespace flowart
