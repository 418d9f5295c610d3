#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <random>

namespace flowart::util {

// splitmix64: fast deterministic mixing / RNG step.
//
// Small 64-bit mixer by Sebastiano Vigna. Every pseudo-random draw made by a
// render (noise gradients, seed points, jitter, random palette positions) goes
// through this generator, so a fixed seed reproduces a raster bit-for-bit on
// every platform.
//
// IMPORTANT: This is *not* a cryptographically secure RNG.
inline std::uint64_t splitmix64(std::uint64_t x) {
  x += 0x9e3779b97f4a7c15ULL;
  x = (x ^ (x >> 30)) * 0xbf58476d1ce4e5b9ULL;
  x = (x ^ (x >> 27)) * 0x94d049bb133111ebULL;
  return x ^ (x >> 31);
}

inline std::uint64_t hash_combine(std::uint64_t a, std::uint64_t b) {
  return splitmix64(a ^ (b + 0x9e3779b97f4a7c15ULL + (a << 6) + (a >> 2)));
}

// Convert a 64-bit word into a double in [0,1) using the top 53 bits
// (IEEE-754 double precision mantissa).
inline double u01_from_u64(std::uint64_t x) {
  const std::uint64_t v = x >> 11; // keep top 53 bits
  return static_cast<double>(v) * (1.0 / 9007199254740992.0); // 2^53
}

// Step a splitmix64 state and return the new state.
inline std::uint64_t next_splitmix64(std::uint64_t& state) {
  state = splitmix64(state);
  return state;
}

// Unbiased bounded random integer in [0, bound_exclusive).
inline std::uint64_t bounded_u64(std::uint64_t& state, std::uint64_t bound_exclusive) {
  if (bound_exclusive <= 1) return 0;
  const std::uint64_t threshold = (std::uint64_t(0) - bound_exclusive) % bound_exclusive;
  for (;;) {
    const std::uint64_t r = next_splitmix64(state);
    if (r >= threshold) return r % bound_exclusive;
  }
}

// A value-type generator. Renders own one of these each; it is never shared
// between threads.
struct HashRng {
  std::uint64_t s{0};

  explicit HashRng(std::uint64_t seed) : s(seed) {}

  // Seeds from std::random_device. Used when a render has no explicit seed.
  static HashRng from_entropy() {
    std::random_device rd;
    const std::uint64_t hi = static_cast<std::uint64_t>(rd());
    const std::uint64_t lo = static_cast<std::uint64_t>(rd());
    return HashRng((hi << 32) ^ lo);
  }

  std::uint64_t next_u64() { return next_splitmix64(s); }

  double next_u01() { return u01_from_u64(next_u64()); }

  std::size_t index(std::size_t n) {
    if (n <= 1) return 0;
    return static_cast<std::size_t>(bounded_u64(s, static_cast<std::uint64_t>(n)));
  }

  double range(double lo_incl, double hi_incl) {
    double lo = lo_incl;
    double hi = hi_incl;
    if (hi < lo) std::swap(lo, hi);
    return lo + (hi - lo) * next_u01();
  }
};

} // namespace flowart::util
