#pragma once

#include <cstddef>
#include <vector>

#include "flowart/core/angle_grid.h"
#include "flowart/core/config.h"
#include "flowart/core/vec2.h"
#include "flowart/util/hash_rng.h"

namespace flowart {

// Stroke start points over `bounds`.
//
// Random mode draws round(area * density) points uniformly (x then y per point)
// from the render RNG. Grid mode places points every sqrt(area / density) pixels
// starting at the lower bound edge and stopping before the upper edge, in
// row-major order, without touching the RNG.
//
// Upper bound on the number of seed points a single render may request.
constexpr std::size_t kMaxSeedPoints = 4000000;

// Throws ConfigurationError (field "density") when density is not a finite
// positive number or when it asks for more than kMaxSeedPoints points.
std::vector<Vec2> seed_points(const SpatialBounds& bounds, SeedingMode mode, double density, util::HashRng& rng);

} // namespace flowart
