#pragma once

#include <cstdint>
#include <string>

#include "flowart/core/canvas.h"
#include "flowart/core/config.h"

namespace flowart {

// Stable 64-bit digest (FNV-1a) of a finished raster: its dimensions followed by
// every pixel byte. Two renders produced identical images iff their digests
// match (modulo hash collisions), which keeps regression tests and --digest
// output short.
std::uint64_t digest_canvas64(const Canvas& canvas);

// Stable 64-bit digest of every field of a configuration, in declaration order.
// Doubles are hashed bit-exactly (with -0.0 and NaN canonicalized).
std::uint64_t digest_config64(const Configuration& cfg);

// Format a 64-bit digest as a fixed-width lowercase hex string.
std::string digest64_to_hex(std::uint64_t v);

} // namespace flowart
