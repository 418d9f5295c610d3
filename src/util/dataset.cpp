#include "flowart/util/dataset.h"

#include <numeric>
#include <stdexcept>
#include <utility>

#include "flowart/core/errors.h"
#include "flowart/core/text_features.h"
#include "flowart/util/csv.h"
#include "flowart/util/file_io.h"
#include "flowart/util/log.h"
#include "flowart/util/strings.h"

namespace flowart {
namespace {

std::string cell(const CsvRow& row, int col) {
  if (col < 0 || static_cast<std::size_t>(col) >= row.size()) return {};
  return row[static_cast<std::size_t>(col)];
}

void warn_row(const std::string& source, int line, const std::string& what) {
  log::warn(source + ":" + std::to_string(line) + ": skipping row: " + what);
}

} // namespace

std::vector<DatasetItem> parse_dataset(const std::string& text, const std::string& source) {
  const CsvTable table = parse_csv(text);

  const int col_vector = table.column("vector_14d");
  const int col_title = table.column("title");
  const int col_poem = table.column("poem");
  const int col_poet = table.column("poet");
  const int col_genre = table.column("genre");

  const bool vector_mode = col_vector >= 0;
  const bool text_mode = !vector_mode && col_title >= 0 && col_poem >= 0 && col_poet >= 0 && col_genre >= 0;
  if (!vector_mode && !text_mode) {
    throw std::runtime_error(source +
                             ": dataset is missing required columns (need 'vector_14d' or 'Title,Poem,Poet,Genre')");
  }

  std::vector<DatasetItem> items;
  items.reserve(table.rows.size());
  for (std::size_t r = 0; r < table.rows.size(); ++r) {
    const CsvRow& row = table.rows[r];
    const int line = table.row_lines[r];

    DatasetItem item;
    item.index = items.size();
    try {
      if (vector_mode) {
        const std::string vec = trim_copy(cell(row, col_vector));
        if (vec.empty()) {
          warn_row(source, line, "empty vector_14d");
          continue;
        }
        item.features = parse_feature_vector(vec);
        item.title = trim_copy(cell(row, col_title));
        if (item.title.empty()) item.title = "Poem_" + std::to_string(r);
        if (col_poet >= 0) item.poet = trim_copy(cell(row, col_poet));
      } else {
        if (row.size() < table.header.size()) {
          warn_row(source, line,
                   "expected " + std::to_string(table.header.size()) + " cells, got " + std::to_string(row.size()));
          continue;
        }
        item.title = trim_copy(cell(row, col_title));
        item.poet = trim_copy(cell(row, col_poet));
        item.genre = to_lower(trim_copy(cell(row, col_genre)));
        item.features = text_to_features(item.title, cell(row, col_poem), item.poet, item.genre);
      }
    } catch (const RenderError& e) {
      warn_row(source, line, e.what());
      continue;
    }
    items.push_back(std::move(item));
  }

  log::info(source + ": " + std::to_string(items.size()) + " of " + std::to_string(table.rows.size()) +
            " rows loaded (" + (vector_mode ? "pre-computed vectors" : "raw poems") + ")");
  return items;
}

std::vector<DatasetItem> load_dataset(const std::string& path) {
  return parse_dataset(read_text_file(path), path);
}

std::vector<DatasetItem> pick_random(const std::vector<DatasetItem>& items, std::size_t n, util::HashRng& rng) {
  if (n >= items.size()) return items;

  std::vector<std::size_t> order(items.size());
  std::iota(order.begin(), order.end(), std::size_t{0});

  std::vector<DatasetItem> out;
  out.reserve(n);
  for (std::size_t k = 0; k < n; ++k) {
    const std::size_t j = k + rng.index(order.size() - k);
    std::swap(order[k], order[j]);
    out.push_back(items[order[k]]);
  }
  return out;
}

std::vector<DatasetItem> find_by_titles(const std::vector<DatasetItem>& items,
                                        const std::vector<std::string>& searches,
                                        std::vector<std::string>* missing) {
  std::vector<DatasetItem> out;
  for (const std::string& search : searches) {
    const std::string needle = to_lower(search);
    bool found = false;
    for (const DatasetItem& item : items) {
      if (to_lower(item.title).find(needle) != std::string::npos) {
        out.push_back(item);
        found = true;
        break;
      }
    }
    if (!found) {
      log::warn("no dataset title contains '" + search + "'");
      if (missing) missing->push_back(search);
    }
  }
  return out;
}

} // namespace flowart
