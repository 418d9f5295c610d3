#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "flowart/core/style_bias.h"
#include "flowart/util/dataset.h"

namespace flowart {

struct BatchOptions {
  std::string color_scheme{"expressive"};
  Style style{Style::Natural};

  std::string output_dir{"out"};
  // Write into <output_dir>/<genre>/ instead of a flat directory.
  bool organize_by_genre{false};

  // Maximum number of items to render (unset = all).
  std::optional<std::size_t> limit;

  // 0-based number of the first output file; item k is numbered
  // start_index + k + 1 in its file name.
  std::size_t start_index{0};

  // Worker threads; values below 1 are treated as 1.
  int jobs{1};

  // Optional overrides applied after mapping and style bias.
  std::optional<int> size;
  std::optional<std::int64_t> seed;

  // Also write <output_dir>/manifest.csv listing every item's outcome.
  bool write_manifest{true};
};

struct BatchItemResult {
  std::size_t index{0};
  std::string title;
  std::string genre;
  std::string palette;

  bool ok{false};
  std::string path;
  std::uint64_t digest{0};

  // Filled on failure. error_field/error_value are set for render errors.
  std::string error;
  std::string error_field;
  std::string error_value;
};

struct BatchReport {
  std::vector<BatchItemResult> items;
  std::size_t rendered{0};
  std::size_t failed{0};
};

// Output file name for the item at 0-based position `index`:
// NNNN_<slug of title>_<palette>_<style>.png with NNNN = index + 1, zero padded.
std::string batch_file_name(std::size_t index, const std::string& title, const std::string& palette, Style style);

// What an output directory already holds, read back from batch file names.
struct ExistingOutputs {
  // 0-based index to pass as BatchOptions::start_index so numbering resumes
  // after the highest existing number.
  std::size_t next_index{0};
  // Title slugs of the files found.
  std::set<std::string> slugs;
};

// Scans the top level of `dir` for files named like batch_file_name output.
// Other files are ignored; a missing directory yields an empty result.
ExistingOutputs scan_existing_outputs(const std::string& dir);

// Random sample for a resumed output directory: picks n items (pick_random)
// from those whose title slug is not in `rendered_slugs` when at least n of
// them remain, otherwise from all items.
std::vector<DatasetItem> pick_unrendered(const std::vector<DatasetItem>& items, std::size_t n,
                                         const std::set<std::string>& rendered_slugs, util::HashRng& rng);

// Maps, renders and saves each item in order.
//
// A failing item (typed render error or I/O failure) is logged with its field
// and value and recorded in the report; the batch carries on with the next
// one. With jobs > 1 items are distributed over worker threads; every render
// owns its canvas and RNG, so the files written are identical for any job
// count.
BatchReport render_batch(const std::vector<DatasetItem>& items, const BatchOptions& opt);

// index,title,genre,palette,status,file,digest,error
std::string batch_report_to_csv(const BatchReport& report);

} // namespace flowart
