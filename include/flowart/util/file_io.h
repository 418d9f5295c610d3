#pragma once

#include <string>

namespace flowart {

// Reads entire file into a string. Throws std::runtime_error on failure.
//
// Relative paths that do not exist under the working directory are also looked
// up under the source tree (FLOWART_SOURCE_DIR) and the working directory's
// ancestors, so tests and tools can name "data/..." files from any build dir.
std::string read_text_file(const std::string& path);

// Writes bytes to file, creating parent directories if needed.
//
// The data is written to a temporary sibling file and renamed into place, so a
// crash mid-write never leaves a truncated image or config behind.
void write_file_atomic(const std::string& path, const std::string& bytes);

// Creates directory (and parents) if needed; no-op if exists.
void ensure_dir(const std::string& path);

} // namespace flowart
