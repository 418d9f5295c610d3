#pragma once

#include <array>
#include <cstddef>
#include <string>
#include <vector>

#include "flowart/core/color_schemes.h"
#include "flowart/core/config.h"

namespace flowart {

inline constexpr std::size_t kFeatureCount = 14;

// Poem descriptor consumed by map_features_to_config.
//
//  v0  title length / 10              -> jitter
//  v1  title lexical complexity       -> angle_gain
//  v2  verse count / 20               -> density
//  v3  avg words per verse / 10       -> cell_size
//  v4  verse length std / 5           -> noise_scale
//  v5  rhyme diversity                -> quantize_steps
//  v6  dominant rhyme frequency       -> swirl
//  v7  alliteration                   -> octaves
//  v8  vowel dominance                -> step_size
//  v9  vowel entropy / 3              -> seed
//  v10 raw words per verse            -> max_length
//  v11 poet name words / 5            -> width_start
//  v12 poet letter diversity          (unused by the mapping)
//  v13 genre id                       -> palette
using FeatureVector = std::array<double, kFeatureCount>;

// Throws ConfigurationError (field "vector") unless values.size() == 14.
FeatureVector to_feature_vector(const std::vector<double>& values);

// Parses a JSON array literal such as "[0.1, 1.0, ...]" into a feature vector.
// Throws ConfigurationError for malformed text, non-numeric entries or a
// length other than 14.
FeatureVector parse_feature_vector(const std::string& text);

// Thresholds on v13: <0.2 fear, <0.3 anger, <0.4 sadness, <0.5 love,
// <0.6 joy, <0.7 surprise, otherwise neutral.
Genre genre_from_features(const FeatureVector& v);

// Builds a full 3000x3000 configuration from a feature vector and a named color
// scheme (unknown scheme names fall back to "expressive").
Configuration map_features_to_config(const FeatureVector& v, const std::string& scheme = "expressive");

} // namespace flowart
