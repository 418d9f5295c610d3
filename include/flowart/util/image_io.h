#pragma once

#include <string>

#include "flowart/core/canvas.h"

namespace flowart {

// PNG encoding of a raster (8-bit RGB, no alpha) through stb_image_write.
// Throws std::runtime_error for empty canvases or when the encoder fails.
std::string encode_png(const Canvas& canvas);

// Encodes and writes a raster atomically (see write_file_atomic).
// Throws std::runtime_error for empty canvases and I/O failures.
void write_png(const std::string& path, const Canvas& canvas);

} // namespace flowart
