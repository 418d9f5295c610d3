#include "flowart/util/image_io.h"

#include <stdexcept>

#include "flowart/util/file_io.h"

#define STB_IMAGE_WRITE_IMPLEMENTATION
#include <stb_image_write.h>

namespace flowart {
namespace {

void append_bytes(void* context, void* data, int size) {
  auto* out = static_cast<std::string*>(context);
  out->append(static_cast<const char*>(data), static_cast<std::size_t>(size));
}

} // namespace

std::string encode_png(const Canvas& canvas) {
  if (canvas.empty()) throw std::runtime_error("Refusing to encode empty image");
  std::string out;
  const int stride = canvas.width() * 3;
  const int ok = stbi_write_png_to_func(&append_bytes, &out, canvas.width(), canvas.height(), 3,
                                        canvas.pixels().data(), stride);
  if (ok == 0) {
    throw std::runtime_error("PNG encoding failed (" + std::to_string(canvas.width()) + "x" +
                             std::to_string(canvas.height()) + ")");
  }
  return out;
}

void write_png(const std::string& path, const Canvas& canvas) {
  if (canvas.empty()) throw std::runtime_error("Refusing to write empty image: " + path);
  write_file_atomic(path, encode_png(canvas));
}

} // namespace flowart
