#include <iostream>
#include <stdexcept>
#include <string>

#include "flowart/core/text_features.h"
#include "flowart/util/dataset.h"
#include "flowart/util/log.h"

#define FLOWART_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

int test_dataset() {
  const flowart::log::Level saved = flowart::log::level();
  flowart::log::set_level(flowart::log::Level::Off);

  // Pre-computed vectors; a malformed row is skipped, missing titles get a default.
  {
    const std::string text =
        "title,vector_14d\n"
        "First,\"[0.1, 1.0, 0.2, 2.2, 2.267, 1.0, 0.25, 0.264, 0.287, 0.814, 22.0, 0.4, 0.75, 0.1]\"\n"
        "Broken,\"[1, 2, 3]\"\n"
        ",\"[0.5, 0.5, 0.5, 0.5, 0.5, 0.5, 0.5, 0.5, 0.5, 0.5, 0.5, 0.5, 0.5, 0.55]\"\n";
    const std::vector<flowart::DatasetItem> items = flowart::parse_dataset(text);
    FLOWART_ASSERT(items.size() == 2);
    FLOWART_ASSERT(items[0].index == 0);
    FLOWART_ASSERT(items[0].title == "First");
    FLOWART_ASSERT(items[0].features[10] == 22.0);
    FLOWART_ASSERT(items[0].genre.empty());
    FLOWART_ASSERT(items[1].index == 1);
    FLOWART_ASSERT(items[1].title == "Poem_2");
    FLOWART_ASSERT(items[1].features[13] == 0.55);
  }

  // Raw poems, semicolon separated.
  {
    const std::string text =
        "Title;Poem;Poet;Genre\n"
        "The Rose;\"I see the rose\nIt grows and glows\nThe wind blows\";Jane Doe;Love\n"
        "Short;\"One line only\";Anon;FEAR\n";
    const std::vector<flowart::DatasetItem> items = flowart::parse_dataset(text);
    FLOWART_ASSERT(items.size() == 2);
    FLOWART_ASSERT(items[0].title == "The Rose");
    FLOWART_ASSERT(items[0].poet == "Jane Doe");
    FLOWART_ASSERT(items[0].genre == "love");
    FLOWART_ASSERT(items[0].features ==
                   flowart::text_to_features("The Rose", "I see the rose\nIt grows and glows\nThe wind blows",
                                             "Jane Doe", "love"));
    FLOWART_ASSERT(items[1].genre == "fear");
    FLOWART_ASSERT(items[1].features[13] == 0.1);
  }

  // Neither shape: the whole dataset is rejected.
  {
    bool threw = false;
    try {
      (void)flowart::parse_dataset("name,value\na,1\n", "bad.csv");
    } catch (const std::runtime_error& e) {
      threw = true;
      FLOWART_ASSERT(std::string(e.what()).find("bad.csv") != std::string::npos);
    }
    FLOWART_ASSERT(threw);
  }

  // Fixture files.
  {
    const std::vector<flowart::DatasetItem> vectors = flowart::load_dataset("tests/data/sample_vectors.csv");
    FLOWART_ASSERT(vectors.size() == 3);
    const std::vector<flowart::DatasetItem> poems = flowart::load_dataset("tests/data/sample_poems.csv");
    FLOWART_ASSERT(poems.size() == 2);
    FLOWART_ASSERT(!poems[0].genre.empty());
  }

  flowart::log::set_level(saved);
  return 0;
}
