#pragma once

#include <string>
#include <vector>

#include "flowart/core/param_mapping.h"

namespace flowart {

// Vowel groups over "aeiouy" after dropping non-letters; at least 1 for a word
// with any letters, 0 otherwise.
int count_syllables(const std::string& word);

// Splits a poem into verses.
//
// Newlines first; when that yields at most one verse, runs of three or more
// spaces; when that still yields at most one, '.' or ';' followed by
// whitespace. Verses are trimmed and empty ones dropped.
std::vector<std::string> split_verses(const std::string& poem);

// fear 0.1, anger 0.25, sadness 0.35, love 0.45, joy 0.55, surprise 0.65,
// anything else 0.75. Case-insensitive.
double genre_id(const std::string& genre);

// Computes the 14 poem features described on FeatureVector.
FeatureVector text_to_features(const std::string& title, const std::string& poem, const std::string& poet,
                               const std::string& genre);

} // namespace flowart
