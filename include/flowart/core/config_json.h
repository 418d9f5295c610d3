#pragma once

#include <string>

#include "flowart/core/config.h"
#include "flowart/util/json.h"

namespace flowart {

// Configuration <-> JSON.
//
// Keys match the Configuration field names; the seeding mode is stored under
// "seeding". Colors are [r, g, b] arrays of integers in 0..255 and color_lut is
// an array of those. Optional fields may be omitted (or null) and take their
// documented defaults.
//
// Reading throws ConfigurationError naming the missing or malformed key. The
// values themselves are not range-checked here; render() validates them.
Configuration config_from_json(const json::Value& v);
json::Value config_to_json(const Configuration& cfg);

// Convenience wrappers; file errors surface as std::runtime_error.
Configuration load_config_file(const std::string& path);
void save_config_file(const std::string& path, const Configuration& cfg);

json::Value rgb_to_json(const Rgb& c);
Rgb rgb_from_json(const json::Value& v, const std::string& field);

} // namespace flowart
