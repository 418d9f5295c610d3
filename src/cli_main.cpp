#include <algorithm>
#include <cstdint>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "flowart/core/config_json.h"
#include "flowart/core/errors.h"
#include "flowart/core/param_mapping.h"
#include "flowart/core/renderer.h"
#include "flowart/core/style_bias.h"
#include "flowart/util/batch_render.h"
#include "flowart/util/dataset.h"
#include "flowart/util/digest.h"
#include "flowart/util/image_io.h"
#include "flowart/util/json.h"
#include "flowart/util/log.h"

namespace {

#ifndef FLOWART_VERSION
#define FLOWART_VERSION "unknown"
#endif

// Rendered when neither --config, --vector nor --dataset is given.
const flowart::FeatureVector kDefaultVector = {0.1, 1.0, 0.2, 2.2, 2.267, 1.0, 0.25,
                                               0.264, 0.287, 0.814, 22.0, 0.4, 0.75, 0.1};

// Bad option values; reported with exit code 2.
class UsageError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

int get_int_arg(int argc, char** argv, const std::string& key, int def) {
  for (int i = 1; i < argc - 1; ++i) {
    if (argv[i] != key) continue;
    try {
      return std::stoi(argv[i + 1]);
    } catch (const std::logic_error&) {
      throw UsageError(key + " expects an integer (got '" + argv[i + 1] + "')");
    }
  }
  return def;
}

std::int64_t get_i64_arg(int argc, char** argv, const std::string& key, std::int64_t def) {
  for (int i = 1; i < argc - 1; ++i) {
    if (argv[i] != key) continue;
    try {
      return std::stoll(argv[i + 1]);
    } catch (const std::logic_error&) {
      throw UsageError(key + " expects an integer (got '" + argv[i + 1] + "')");
    }
  }
  return def;
}

std::string get_str_arg(int argc, char** argv, const std::string& key, const std::string& def) {
  for (int i = 1; i < argc - 1; ++i) {
    if (argv[i] == key) return argv[i + 1];
  }
  return def;
}

// Every value given for a repeatable option, in command-line order.
std::vector<std::string> get_all_str_args(int argc, char** argv, const std::string& key) {
  std::vector<std::string> out;
  for (int i = 1; i < argc - 1; ++i) {
    if (argv[i] == key) out.emplace_back(argv[++i]);
  }
  return out;
}

bool has_kv_arg(int argc, char** argv, const std::string& key) {
  for (int i = 1; i < argc - 1; ++i) {
    if (argv[i] == key) return true;
  }
  return false;
}

bool has_flag(int argc, char** argv, const std::string& flag) {
  for (int i = 1; i < argc; ++i) {
    if (argv[i] == flag) return true;
  }
  return false;
}

void print_usage(const char* exe) {
  std::cout << "flowart CLI v" << FLOWART_VERSION << "\n\n";
  std::cout << "Usage: " << (exe ? exe : "flowart_cli") << " [mode] [options]\n\n";
  std::cout << "Modes (default: render a built-in feature vector):\n";
  std::cout << "  --config PATH       Render a JSON configuration\n";
  std::cout << "  --vector \"[...]\"    Render a 14-D feature vector through the mapper\n";
  std::cout << "  --dataset PATH      Render every row of a CSV dataset\n";
  std::cout << "                      (columns title,vector_14d or Title,Poem,Poet,Genre)\n";
  std::cout << "    --sample N        Render N random rows; numbering resumes after existing outputs\n";
  std::cout << "                      and rows already rendered there are preferred out\n";
  std::cout << "    --sample-seed S   Seed for --sample (default: nondeterministic)\n";
  std::cout << "    --title TEXT      Render the first row whose title contains TEXT (repeatable)\n\n";
  std::cout << "Options:\n";
  std::cout << "  --color-scheme NAME Color scheme for mapped vectors (very_smooth|expressive|wild, default: expressive)\n";
  std::cout << "  --style NAME        Style bias (sharp|preferred|natural, default: natural)\n";
  std::cout << "  --out PATH          Output image (single render, default: out/flowart.png)\n";
  std::cout << "                      or output directory (--dataset, default: out)\n";
  std::cout << "  --organize-by-genre Write dataset renders into per-genre subdirectories\n";
  std::cout << "  --limit N           Render at most N dataset rows\n";
  std::cout << "  --jobs N            Worker threads for --dataset (default: 1)\n";
  std::cout << "  --seed N            Override the configuration seed\n";
  std::cout << "  --size N            Override width and height (quick previews)\n";
  std::cout << "  --dump-config       Print the final configuration JSON and exit without rendering\n";
  std::cout << "  --digest            Print the 64-bit digest of each rendered image\n";
  std::cout << "  --quiet             Only log warnings and errors\n";
  std::cout << "  --verbose           Log debug details\n";
  std::cout << "  --log-level LEVEL   debug|info|warn|error|off\n";
  std::cout << "  -h, --help          Show this help\n";
  std::cout << "  --version           Print version and exit\n";
}

void apply_overrides(int argc, char** argv, flowart::Configuration& cfg) {
  if (has_kv_arg(argc, argv, "--size")) {
    const int size = get_int_arg(argc, argv, "--size", 0);
    if (size <= 0) throw UsageError("--size must be positive");
    cfg.width = size;
    cfg.height = size;
  }
  if (has_kv_arg(argc, argv, "--seed")) cfg.seed = get_i64_arg(argc, argv, "--seed", 0);
}

int run_dataset(int argc, char** argv, const std::string& dataset_path, flowart::Style style, bool quiet) {
  flowart::BatchOptions opt;
  opt.color_scheme = get_str_arg(argc, argv, "--color-scheme", "expressive");
  opt.style = style;
  opt.output_dir = get_str_arg(argc, argv, "--out", "out");
  opt.organize_by_genre = has_flag(argc, argv, "--organize-by-genre");
  opt.jobs = get_int_arg(argc, argv, "--jobs", 1);
  if (has_kv_arg(argc, argv, "--limit")) {
    const int limit = get_int_arg(argc, argv, "--limit", 0);
    if (limit < 0) throw UsageError("--limit must be >= 0");
    opt.limit = static_cast<std::size_t>(limit);
  }
  if (has_kv_arg(argc, argv, "--size")) {
    const int size = get_int_arg(argc, argv, "--size", 0);
    if (size <= 0) throw UsageError("--size must be positive");
    opt.size = size;
  }
  if (has_kv_arg(argc, argv, "--seed")) opt.seed = get_i64_arg(argc, argv, "--seed", 0);

  std::vector<flowart::DatasetItem> items = flowart::load_dataset(dataset_path);

  const std::vector<std::string> titles = get_all_str_args(argc, argv, "--title");
  const bool sample = has_kv_arg(argc, argv, "--sample");
  if (sample && !titles.empty()) throw UsageError("--sample and --title are mutually exclusive");

  if (sample) {
    const int n = get_int_arg(argc, argv, "--sample", 0);
    if (n <= 0) throw UsageError("--sample must be positive");
    flowart::util::HashRng rng = has_kv_arg(argc, argv, "--sample-seed")
                                     ? flowart::util::HashRng(static_cast<std::uint64_t>(
                                           get_i64_arg(argc, argv, "--sample-seed", 0)))
                                     : flowart::util::HashRng::from_entropy();
    const flowart::ExistingOutputs existing = flowart::scan_existing_outputs(opt.output_dir);
    opt.start_index = existing.next_index;
    items = flowart::pick_unrendered(items, static_cast<std::size_t>(n), existing.slugs, rng);
  } else if (!titles.empty()) {
    std::vector<std::string> missing;
    items = flowart::find_by_titles(items, titles, &missing);
    if (!quiet) {
      std::cout << "Matched " << items.size() << " of " << titles.size() << " titles\n";
      for (const std::string& m : missing) std::cout << "  not found: " << m << "\n";
    }
    if (items.empty()) return 1;
  }

  if (has_flag(argc, argv, "--dump-config")) {
    flowart::json::Array out;
    const std::size_t n = opt.limit ? std::min(*opt.limit, items.size()) : items.size();
    for (std::size_t i = 0; i < n; ++i) {
      flowart::Configuration cfg = flowart::map_features_to_config(items[i].features, opt.color_scheme);
      cfg = flowart::apply_style_bias(cfg, opt.style);
      apply_overrides(argc, argv, cfg);
      out.push_back(flowart::config_to_json(cfg));
    }
    std::cout << flowart::json::stringify(flowart::json::array(std::move(out)), 2) << "\n";
    return 0;
  }

  const flowart::BatchReport report = flowart::render_batch(items, opt);

  if (has_flag(argc, argv, "--digest")) {
    for (const flowart::BatchItemResult& r : report.items) {
      if (r.ok) std::cout << flowart::digest64_to_hex(r.digest) << "  " << r.path << "\n";
    }
  }
  if (!quiet) {
    std::cout << "Rendered " << report.rendered << " of " << report.items.size() << " items into "
              << opt.output_dir << "\n";
    if (report.failed > 0) std::cout << report.failed << " items failed (see manifest.csv)\n";
  }
  return (!report.items.empty() && report.rendered == 0) ? 1 : 0;
}

} // namespace

int main(int argc, char** argv) {
  try {
    if (has_flag(argc, argv, "--version")) {
      std::cout << FLOWART_VERSION << "\n";
      return 0;
    }
    if (has_flag(argc, argv, "--help") || has_flag(argc, argv, "-h")) {
      print_usage(argv[0]);
      return 0;
    }

    const bool quiet = has_flag(argc, argv, "--quiet");
    if (quiet) flowart::log::set_level(flowart::log::Level::Warn);
    if (has_flag(argc, argv, "--verbose")) flowart::log::set_level(flowart::log::Level::Debug);
    if (has_kv_arg(argc, argv, "--log-level")) {
      flowart::log::Level lvl = flowart::log::Level::Info;
      const std::string name = get_str_arg(argc, argv, "--log-level", "info");
      if (!flowart::log::parse_level(name, lvl)) throw UsageError("unknown log level '" + name + "'");
      flowart::log::set_level(lvl);
    }

    const std::string config_path = get_str_arg(argc, argv, "--config", "");
    const std::string vector_text = get_str_arg(argc, argv, "--vector", "");
    const std::string dataset_path = get_str_arg(argc, argv, "--dataset", "");
    const int modes = (config_path.empty() ? 0 : 1) + (vector_text.empty() ? 0 : 1) + (dataset_path.empty() ? 0 : 1);
    if (modes > 1) throw UsageError("--config, --vector and --dataset are mutually exclusive");

    flowart::Style style = flowart::Style::Natural;
    try {
      style = flowart::parse_style(get_str_arg(argc, argv, "--style", ""));
    } catch (const flowart::ConfigurationError& e) {
      throw UsageError(e.what());
    }

    if (!dataset_path.empty()) return run_dataset(argc, argv, dataset_path, style, quiet);

    flowart::Configuration cfg;
    if (!config_path.empty()) {
      cfg = flowart::load_config_file(config_path);
      cfg = flowart::apply_style_bias(cfg, style);
    } else {
      flowart::FeatureVector v = kDefaultVector;
      if (!vector_text.empty()) {
        try {
          v = flowart::parse_feature_vector(vector_text);
        } catch (const flowart::ConfigurationError& e) {
          throw UsageError(e.what());
        }
      }
      cfg = flowart::map_features_to_config(v, get_str_arg(argc, argv, "--color-scheme", "expressive"));
      cfg = flowart::apply_style_bias(cfg, style);
    }
    apply_overrides(argc, argv, cfg);

    if (has_flag(argc, argv, "--dump-config")) {
      std::cout << flowart::json::stringify(flowart::config_to_json(cfg), 2) << "\n";
      return 0;
    }

    flowart::RenderStats stats;
    const flowart::Canvas canvas = flowart::render(cfg, &stats);
    const std::string out_path = get_str_arg(argc, argv, "--out", "out/flowart.png");
    flowart::write_png(out_path, canvas);

    if (has_flag(argc, argv, "--digest")) {
      std::cout << flowart::digest64_to_hex(flowart::digest_canvas64(canvas)) << "\n";
    }
    if (!quiet) {
      std::cout << "Rendered " << canvas.width() << "x" << canvas.height() << " (" << stats.strokes_drawn
                << " strokes, " << stats.strokes_skipped << " skipped)\n";
      std::cout << "Saved to " << out_path << "\n";
    }
    return 0;
  } catch (const UsageError& e) {
    std::cerr << "Usage error: " << e.what() << "\n\n";
    print_usage(argv[0]);
    return 2;
  } catch (const flowart::RenderError& e) {
    flowart::log::error(std::string("Fatal: ") + e.what() + " [field=" + e.field() + ", value=" + e.value() + "]");
    return 1;
  } catch (const std::exception& e) {
    flowart::log::error(std::string("Fatal: ") + e.what());
    return 1;
  }
}
