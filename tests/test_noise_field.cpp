#include <cmath>
#include <iostream>

#include "flowart/core/errors.h"
#include "flowart/core/noise_field.h"

#define FLOWART_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

int test_noise_field() {
  using flowart::NoiseParams;
  using flowart::ScalarGrid;
  using flowart::util::HashRng;

  // Values stay inside [-1, 1] for a range of shapes, resolutions and octave counts.
  for (int octaves = 1; octaves <= 10; octaves += 3) {
    for (std::int64_t seed : {0, 1, 42, -7}) {
      NoiseParams p;
      p.rows = 37;
      p.cols = 53;
      p.res_y = 3;
      p.res_x = 5;
      p.octaves = octaves;
      p.seed = seed;
      HashRng rng(123);
      const ScalarGrid g = flowart::generate_gradient_noise(p, rng);
      FLOWART_ASSERT(g.rows == 37 && g.cols == 53);
      FLOWART_ASSERT(g.values.size() == 37u * 53u);
      for (double v : g.values) {
        FLOWART_ASSERT(std::isfinite(v));
        FLOWART_ASSERT(v >= -1.0 && v <= 1.0);
      }
    }
  }

  // Same seed and shape: identical field, regardless of the caller's RNG state.
  {
    NoiseParams p;
    p.rows = 20;
    p.cols = 30;
    p.octaves = 4;
    p.seed = 99;
    HashRng a(1);
    HashRng b(2);
    const ScalarGrid ga = flowart::generate_gradient_noise(p, a);
    const ScalarGrid gb = flowart::generate_gradient_noise(p, b);
    FLOWART_ASSERT(ga.values == gb.values);

    p.seed = 100;
    HashRng c(1);
    const ScalarGrid gc = flowart::generate_gradient_noise(p, c);
    FLOWART_ASSERT(ga.values != gc.values);
  }

  // Unseeded noise draws its octave seeds from the render RNG.
  {
    NoiseParams p;
    p.rows = 16;
    p.cols = 16;
    p.octaves = 2;
    HashRng a(5);
    HashRng b(5);
    FLOWART_ASSERT(flowart::generate_gradient_noise(p, a).values == flowart::generate_gradient_noise(p, b).values);
    FLOWART_ASSERT(a.s == b.s);
    FLOWART_ASSERT(a.s != HashRng(5).s);
  }

  // Octave counts outside [1, 10] are clamped.
  {
    NoiseParams p;
    p.rows = 12;
    p.cols = 12;
    p.seed = 3;
    HashRng rng(0);
    p.octaves = 10;
    const ScalarGrid ten = flowart::generate_gradient_noise(p, rng);
    p.octaves = 50;
    const ScalarGrid fifty = flowart::generate_gradient_noise(p, rng);
    FLOWART_ASSERT(ten.values == fifty.values);
    p.octaves = 1;
    const ScalarGrid one = flowart::generate_gradient_noise(p, rng);
    p.octaves = -4;
    const ScalarGrid neg = flowart::generate_gradient_noise(p, rng);
    FLOWART_ASSERT(one.values == neg.values);
  }

  // Lattice samples at integer coordinates are zero (the dot with a zero offset).
  {
    const ScalarGrid g = flowart::gradient_noise_octave(8, 8, 2, 2, 77);
    FLOWART_ASSERT(std::fabs(g.at(0, 0)) < 1e-12);
    FLOWART_ASSERT(std::fabs(g.at(4, 4)) < 1e-12);
  }

  // Gradients are unit vectors and depend on the lattice coordinate.
  {
    const flowart::Vec2 g0 = flowart::lattice_gradient(11, 3, 4);
    const flowart::Vec2 g1 = flowart::lattice_gradient(11, 4, 3);
    FLOWART_ASSERT(std::fabs(g0.length() - 1.0) < 1e-12);
    FLOWART_ASSERT(g0 != g1);
    FLOWART_ASSERT(g0 == flowart::lattice_gradient(11, 3, 4));
  }

  FLOWART_ASSERT(flowart::fade(0.0) == 0.0);
  FLOWART_ASSERT(flowart::fade(1.0) == 1.0);
  FLOWART_ASSERT(std::fabs(flowart::fade(0.5) - 0.5) < 1e-12);

  // Non-positive shapes are rejected.
  {
    NoiseParams p;
    p.rows = 0;
    p.cols = 10;
    HashRng rng(0);
    bool threw = false;
    try {
      (void)flowart::generate_gradient_noise(p, rng);
    } catch (const flowart::ConfigurationError& e) {
      threw = true;
      FLOWART_ASSERT(e.field() == "rows");
    }
    FLOWART_ASSERT(threw);
  }

  return 0;
}
