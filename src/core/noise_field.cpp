#include "flowart/core/noise_field.h"

#include <algorithm>
#include <cmath>
#include <string>

#include "flowart/core/errors.h"

namespace flowart {
namespace {

constexpr double kTwoPi = 6.283185307179586476925286766559;

// Keeps noise draws independent of the stroke stream that shares the seed.
constexpr std::uint64_t kNoiseStream = 0x6E6F697365ULL;

void require_positive(const char* field, int v) {
  if (v > 0) return;
  throw ConfigurationError(field, std::to_string(v),
                           std::string("noise ") + field + " must be positive (got " + std::to_string(v) + ")");
}

} // namespace

Vec2 lattice_gradient(std::uint64_t octave_seed, int ix, int iy) {
  std::uint64_t h = octave_seed;
  h = util::hash_combine(h, static_cast<std::uint64_t>(static_cast<std::uint32_t>(iy)));
  h = util::hash_combine(h, static_cast<std::uint64_t>(static_cast<std::uint32_t>(ix)));
  const double angle = kTwoPi * util::u01_from_u64(util::splitmix64(h));
  return Vec2{std::cos(angle), std::sin(angle)};
}

ScalarGrid gradient_noise_octave(int rows, int cols, int res_y, int res_x, std::uint64_t octave_seed) {
  ScalarGrid out(rows, cols);

  const double step_x = static_cast<double>(res_x) / static_cast<double>(cols);
  const double step_y = static_cast<double>(res_y) / static_cast<double>(rows);

  for (int i = 0; i < rows; ++i) {
    const double ly = static_cast<double>(i) * step_y;
    const int yi = static_cast<int>(ly);
    const double yf = ly - static_cast<double>(yi);
    const double v = fade(yf);

    for (int j = 0; j < cols; ++j) {
      const double lx = static_cast<double>(j) * step_x;
      const int xi = static_cast<int>(lx);
      const double xf = lx - static_cast<double>(xi);

      const Vec2 g00 = lattice_gradient(octave_seed, xi, yi);
      const Vec2 g10 = lattice_gradient(octave_seed, xi + 1, yi);
      const Vec2 g01 = lattice_gradient(octave_seed, xi, yi + 1);
      const Vec2 g11 = lattice_gradient(octave_seed, xi + 1, yi + 1);

      const double dot00 = g00.x * xf + g00.y * yf;
      const double dot10 = g10.x * (xf - 1.0) + g10.y * yf;
      const double dot01 = g01.x * xf + g01.y * (yf - 1.0);
      const double dot11 = g11.x * (xf - 1.0) + g11.y * (yf - 1.0);

      const double u = fade(xf);
      const double nx0 = dot00 * (1.0 - u) + u * dot10;
      const double nx1 = dot01 * (1.0 - u) + u * dot11;
      out.at(i, j) = nx0 * (1.0 - v) + v * nx1;
    }
  }
  return out;
}

ScalarGrid generate_gradient_noise(const NoiseParams& params, util::HashRng& rng) {
  require_positive("rows", params.rows);
  require_positive("cols", params.cols);
  require_positive("res_y", params.res_y);
  require_positive("res_x", params.res_x);

  const int octaves = std::clamp(params.octaves, kMinOctaves, kMaxOctaves);

  ScalarGrid total(params.rows, params.cols);
  double amplitude = 1.0;
  double amplitude_sum = 0.0;

  for (int o = 0; o < octaves; ++o) {
    const int freq = 1 << o;
    const std::uint64_t octave_seed =
        params.seed ? util::hash_combine(static_cast<std::uint64_t>(*params.seed) + static_cast<std::uint64_t>(o),
                                         kNoiseStream)
                    : rng.next_u64();

    const ScalarGrid layer =
        gradient_noise_octave(params.rows, params.cols, params.res_y * freq, params.res_x * freq, octave_seed);
    for (std::size_t k = 0; k < total.values.size(); ++k) total.values[k] += amplitude * layer.values[k];

    amplitude_sum += amplitude;
    amplitude *= params.persistence;
  }

  if (amplitude_sum != 0.0) {
    for (double& v : total.values) v /= amplitude_sum;
  }
  return total;
}

} // namespace flowart
