#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "flowart/core/param_mapping.h"
#include "flowart/util/hash_rng.h"

namespace flowart {

// One renderable dataset row.
struct DatasetItem {
  // 0-based position among the accepted rows.
  std::size_t index{0};
  std::string title;
  std::string poet;
  // Empty for pre-computed vectors; the genre is then derived from v13.
  std::string genre;
  FeatureVector features{};
};

// Parses a poem dataset held in memory.
//
// Two shapes are accepted (header names are matched case-insensitively, the
// delimiter may be ',' or ';'):
//  - title,vector_14d   where vector_14d is a JSON array literal of 14 numbers
//                       (title is optional; missing titles become "Poem_<n>")
//  - Title,Poem,Poet,Genre   raw poems, run through text_to_features
//
// Rows that cannot be turned into a feature vector are logged and skipped.
// Throws std::runtime_error when the header matches neither shape or the CSV
// itself is malformed. `source` only labels log lines.
std::vector<DatasetItem> parse_dataset(const std::string& text, const std::string& source = "<memory>");

// Reads and parses a dataset file (see read_text_file for path lookup).
std::vector<DatasetItem> load_dataset(const std::string& path);

// Picks n items without replacement, in draw order (partial Fisher-Yates over
// rng.index). Returns every item, in dataset order and without drawing, when
// n >= items.size().
std::vector<DatasetItem> pick_random(const std::vector<DatasetItem>& items, std::size_t n, util::HashRng& rng);

// For each search text, the first item whose title contains it
// (case-insensitive). Searches without a match are logged and, when `missing`
// is non-null, appended to it.
std::vector<DatasetItem> find_by_titles(const std::vector<DatasetItem>& items,
                                        const std::vector<std::string>& searches,
                                        std::vector<std::string>* missing = nullptr);

} // namespace flowart
