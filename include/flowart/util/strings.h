#pragma once

#include <string>
#include <vector>

namespace flowart {

std::string to_lower(std::string s);

// Strips leading and trailing whitespace.
std::string trim_copy(const std::string& s);

// Splits on any run of whitespace; empty tokens are never produced.
std::vector<std::string> split_whitespace(const std::string& s);

// Lowercases, replaces every run of non [a-z0-9] characters with a single '_',
// strips leading/trailing '_' and truncates to max_length characters.
//
// Used to turn titles into file-system safe output names.
std::string slugify(const std::string& text, std::size_t max_length = 50);

// Escapes a string for safe inclusion in a CSV cell.
//
// If the string contains a comma, semicolon, quote, or newline, the result will
// be wrapped in double-quotes and any internal quotes will be doubled.
std::string csv_escape(const std::string& s);

} // namespace flowart
