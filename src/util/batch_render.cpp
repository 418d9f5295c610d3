#include "flowart/util/batch_render.h"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstdio>
#include <exception>
#include <filesystem>
#include <sstream>
#include <thread>

#include "flowart/core/errors.h"
#include "flowart/core/param_mapping.h"
#include "flowart/core/renderer.h"
#include "flowart/util/digest.h"
#include "flowart/util/file_io.h"
#include "flowart/util/image_io.h"
#include "flowart/util/log.h"
#include "flowart/util/strings.h"

namespace flowart {
namespace {

std::string item_genre(const DatasetItem& item) {
  const std::string g = slugify(item.genre);
  if (!g.empty()) return g;
  return genre_name(genre_from_features(item.features));
}

void render_one(const DatasetItem& item, std::size_t pos, std::size_t total, const BatchOptions& opt,
                BatchItemResult& out) {
  out.index = pos;
  out.title = item.title;
  out.genre = item_genre(item);

  try {
    Configuration cfg = map_features_to_config(item.features, opt.color_scheme);
    cfg = apply_style_bias(cfg, opt.style);
    if (opt.size) {
      cfg.width = *opt.size;
      cfg.height = *opt.size;
    }
    if (opt.seed) cfg.seed = *opt.seed;
    out.palette = cfg.palette_name.empty() ? "unknown" : cfg.palette_name;

    std::filesystem::path dir(opt.output_dir);
    if (opt.organize_by_genre) dir /= out.genre;
    const std::string name = batch_file_name(opt.start_index + pos, item.title, out.palette, opt.style);
    const std::string path = (dir / name).string();

    log::info("[" + std::to_string(pos + 1) + "/" + std::to_string(total) + "] rendering '" +
              item.title.substr(0, 40) + "' (genre: " + out.genre + ", palette: " + out.palette + ")");

    const Canvas canvas = render(cfg);
    write_png(path, canvas);

    out.ok = true;
    out.path = path;
    out.digest = digest_canvas64(canvas);
  } catch (const RenderError& e) {
    out.error = e.what();
    out.error_field = e.field();
    out.error_value = e.value();
    log::error("item " + std::to_string(pos + 1) + " ('" + item.title + "') failed: " + e.what() +
               " [field=" + e.field() + ", value=" + e.value() + "]");
  } catch (const std::exception& e) {
    out.error = e.what();
    log::error("item " + std::to_string(pos + 1) + " ('" + item.title + "') failed: " + e.what());
  }
}

} // namespace

std::string batch_file_name(std::size_t index, const std::string& title, const std::string& palette, Style style) {
  char num[32];
  std::snprintf(num, sizeof(num), "%04zu", index + 1);
  return std::string(num) + "_" + slugify(title) + "_" + palette + "_" + style_name(style) + ".png";
}

ExistingOutputs scan_existing_outputs(const std::string& dir) {
  namespace fs = std::filesystem;
  ExistingOutputs out;

  std::error_code ec;
  if (!fs::is_directory(dir, ec)) return out;

  std::size_t max_number = 0;
  for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
    if (!it->is_regular_file(ec) || it->path().extension() != ".png") continue;
    const std::string stem = it->path().stem().string();

    // NNNN_<slug>_<palette>_<style>; the slug may itself contain '_'.
    std::size_t digits = 0;
    while (digits < stem.size() && std::isdigit(static_cast<unsigned char>(stem[digits]))) ++digits;
    if (digits == 0 || digits > 9 || digits >= stem.size() || stem[digits] != '_') continue;

    const std::size_t style_sep = stem.rfind('_');
    if (style_sep == std::string::npos || style_sep <= digits) continue;
    const std::string style = stem.substr(style_sep + 1);
    if (style != style_name(Style::Natural) && style != style_name(Style::Sharp)) continue;

    const std::size_t palette_sep = stem.rfind('_', style_sep - 1);
    if (palette_sep == std::string::npos || palette_sep < digits) continue;
    const std::string palette = stem.substr(palette_sep + 1, style_sep - palette_sep - 1);
    if (palette.empty()) continue;

    const std::size_t number = static_cast<std::size_t>(std::stoull(stem.substr(0, digits)));
    max_number = std::max(max_number, number);
    if (palette_sep > digits) out.slugs.insert(stem.substr(digits + 1, palette_sep - digits - 1));
  }
  if (ec) log::warn("scanning " + dir + ": " + ec.message());

  out.next_index = max_number;
  return out;
}

std::vector<DatasetItem> pick_unrendered(const std::vector<DatasetItem>& items, std::size_t n,
                                         const std::set<std::string>& rendered_slugs, util::HashRng& rng) {
  std::vector<DatasetItem> remaining;
  for (const DatasetItem& item : items) {
    if (rendered_slugs.count(slugify(item.title)) == 0) remaining.push_back(item);
  }
  const std::vector<DatasetItem>& source = remaining.size() >= n ? remaining : items;
  log::info("sampling " + std::to_string(std::min(n, source.size())) + " of " + std::to_string(source.size()) +
            " candidates (" + std::to_string(items.size()) + " total)");
  return pick_random(source, n, rng);
}

BatchReport render_batch(const std::vector<DatasetItem>& items, const BatchOptions& opt) {
  const std::size_t total = opt.limit ? std::min(*opt.limit, items.size()) : items.size();

  ensure_dir(opt.output_dir);

  std::ostringstream hdr;
  hdr << "batch: " << total << " items, scheme " << opt.color_scheme << ", style " << style_name(opt.style)
      << ", output " << opt.output_dir << (opt.organize_by_genre ? " (by genre)" : "");
  log::info(hdr.str());

  BatchReport report;
  report.items.resize(total);

  const std::size_t jobs = std::min<std::size_t>(static_cast<std::size_t>(std::max(1, opt.jobs)),
                                                 std::max<std::size_t>(total, 1));
  if (jobs <= 1) {
    for (std::size_t i = 0; i < total; ++i) render_one(items[i], i, total, opt, report.items[i]);
  } else {
    std::atomic<std::size_t> next{0};
    auto worker = [&]() {
      while (true) {
        const std::size_t i = next.fetch_add(1);
        if (i >= total) return;
        render_one(items[i], i, total, opt, report.items[i]);
      }
    };
    std::vector<std::thread> pool;
    pool.reserve(jobs);
    for (std::size_t t = 0; t < jobs; ++t) pool.emplace_back(worker);
    for (std::thread& th : pool) th.join();
  }

  for (const BatchItemResult& r : report.items) {
    if (r.ok) {
      ++report.rendered;
    } else {
      ++report.failed;
    }
  }

  if (opt.write_manifest) {
    const std::string manifest = (std::filesystem::path(opt.output_dir) / "manifest.csv").string();
    write_file_atomic(manifest, batch_report_to_csv(report));
  }

  log::info("batch complete: " + std::to_string(report.rendered) + " rendered, " + std::to_string(report.failed) +
            " failed");
  return report;
}

std::string batch_report_to_csv(const BatchReport& report) {
  std::ostringstream out;
  out << "index,title,genre,palette,status,file,digest,error\n";
  for (const BatchItemResult& r : report.items) {
    out << (r.index + 1) << ',' << csv_escape(r.title) << ',' << csv_escape(r.genre) << ','
        << csv_escape(r.palette) << ',' << (r.ok ? "ok" : "failed") << ',' << csv_escape(r.path) << ','
        << (r.ok ? digest64_to_hex(r.digest) : std::string()) << ',' << csv_escape(r.error) << '\n';
  }
  return out.str();
}

} // namespace flowart
