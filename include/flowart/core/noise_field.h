#pragma once

// Multi-octave 2D gradient ("Perlin") noise sampled onto a regular grid.
//
// For octave o the gradient lattice has (res_y * 2^o + 1) x (res_x * 2^o + 1)
// points, each holding a unit vector at a pseudo-random angle hashed from the
// octave seed and the lattice coordinate (only the lattice points a sample
// touches are ever evaluated, so high octaves stay cheap). Output sample (i, j)
// sits at lattice coordinate (j * res_x / cols, i * res_y / rows) of that octave
// and blends the four surrounding corner dot products with the quintic fade
// t^3 (t (6t - 15) + 10). Octaves are summed with persistence 0.5 and divided by
// the amplitude sum, so every value lies in [-1, 1].
//
// Determinism: with a seed, octave o hashes its gradients from (seed + o)
// alone, so identical (shape, res, octaves, seed) reproduce the field
// bit-for-bit. Without a seed each octave seed is one draw from the caller's
// render RNG.

#include <cstdint>
#include <optional>

#include "flowart/core/grid.h"
#include "flowart/core/vec2.h"
#include "flowart/util/hash_rng.h"

namespace flowart {

inline constexpr int kMinOctaves = 1;
inline constexpr int kMaxOctaves = 10;

struct NoiseParams {
  int rows{0};
  int cols{0};
  int res_y{4};
  int res_x{4};
  // Clamped to [kMinOctaves, kMaxOctaves].
  int octaves{1};
  double persistence{0.5};
  std::optional<std::int64_t> seed;
};

// Throws ConfigurationError when rows, cols, res_y or res_x is not positive.
ScalarGrid generate_gradient_noise(const NoiseParams& params, util::HashRng& rng);

// Single octave on an explicit lattice; exposed for tests.
ScalarGrid gradient_noise_octave(int rows, int cols, int res_y, int res_x, std::uint64_t octave_seed);

// Unit gradient at lattice point (ix, iy) for an octave seed.
Vec2 lattice_gradient(std::uint64_t octave_seed, int ix, int iy);

// The quintic interpolation weight.
inline double fade(double t) { return t * t * t * (t * (t * 6.0 - 15.0) + 10.0); }

} // namespace flowart
