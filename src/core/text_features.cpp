#include "flowart/core/text_features.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <map>
#include <set>

#include "flowart/util/strings.h"

namespace flowart {
namespace {

bool is_vowel(char c) {
  switch (c) {
    case 'a':
    case 'e':
    case 'i':
    case 'o':
    case 'u':
    case 'y':
      return true;
    default:
      return false;
  }
}

bool is_consonant(char c) { return c >= 'a' && c <= 'z' && !is_vowel(c); }

// Lowercase a-z letters only.
std::string letters_only(const std::string& s) {
  std::string out;
  out.reserve(s.size());
  for (char c : s) {
    const char l = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (l >= 'a' && l <= 'z') out.push_back(l);
  }
  return out;
}

bool is_space(char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; }

void push_trimmed(std::vector<std::string>& out, const std::string& piece) {
  std::string t = trim_copy(piece);
  if (!t.empty()) out.push_back(std::move(t));
}

std::vector<std::string> split_lines(const std::string& text) {
  std::vector<std::string> out;
  std::size_t start = 0;
  for (std::size_t i = 0; i <= text.size(); ++i) {
    if (i == text.size() || text[i] == '\n') {
      push_trimmed(out, text.substr(start, i - start));
      start = i + 1;
    }
  }
  return out;
}

std::vector<std::string> split_space_runs(const std::string& text) {
  std::vector<std::string> out;
  std::size_t start = 0;
  std::size_t i = 0;
  while (i < text.size()) {
    if (text[i] == ' ') {
      std::size_t j = i;
      while (j < text.size() && text[j] == ' ') ++j;
      if (j - i >= 3) {
        push_trimmed(out, text.substr(start, i - start));
        start = j;
      }
      i = j;
    } else {
      ++i;
    }
  }
  push_trimmed(out, text.substr(start));
  return out;
}

std::vector<std::string> split_sentences(const std::string& text) {
  std::vector<std::string> out;
  std::size_t start = 0;
  std::size_t i = 0;
  while (i < text.size()) {
    if ((text[i] == '.' || text[i] == ';') && i + 1 < text.size() && is_space(text[i + 1])) {
      std::size_t j = i + 1;
      while (j < text.size() && is_space(text[j])) ++j;
      push_trimmed(out, text.substr(start, i - start));
      start = j;
      i = j;
    } else {
      ++i;
    }
  }
  push_trimmed(out, text.substr(start));
  return out;
}

std::string replace_punct(std::string s) {
  for (char& c : s) {
    if (c == ',' || c == '.') c = ' ';
  }
  return s;
}

} // namespace

int count_syllables(const std::string& word) {
  const std::string w = letters_only(word);
  if (w.empty()) return 0;
  int count = 0;
  bool prev_vowel = false;
  for (char c : w) {
    const bool v = is_vowel(c);
    if (v && !prev_vowel) ++count;
    prev_vowel = v;
  }
  return std::max(1, count);
}

std::vector<std::string> split_verses(const std::string& poem) {
  std::vector<std::string> verses = split_lines(poem);
  if (verses.size() <= 1) verses = split_space_runs(poem);
  if (verses.size() <= 1) verses = split_sentences(poem);
  return verses;
}

double genre_id(const std::string& genre) {
  static const std::map<std::string, double> ids = {
      {"fear", 0.1}, {"anger", 0.25}, {"sadness", 0.35}, {"love", 0.45}, {"joy", 0.55}, {"surprise", 0.65},
  };
  const auto it = ids.find(to_lower(trim_copy(genre)));
  return it == ids.end() ? 0.75 : it->second;
}

FeatureVector text_to_features(const std::string& title, const std::string& poem, const std::string& poet,
                               const std::string& genre) {
  FeatureVector v{};

  // Title.
  const std::vector<std::string> title_words = split_whitespace(to_lower(title));
  const std::set<std::string> title_unique(title_words.begin(), title_words.end());
  v[0] = static_cast<double>(title_words.size()) / 10.0;
  v[1] = static_cast<double>(title_unique.size()) / static_cast<double>(std::max<std::size_t>(title_words.size(), 1));

  // Verse structure.
  const std::vector<std::string> verses = split_verses(poem);
  const double verse_count = static_cast<double>(verses.size());
  double avg_words = 0.0;
  double std_words = 0.0;
  if (!verses.empty()) {
    std::vector<double> wpv;
    wpv.reserve(verses.size());
    for (const std::string& verse : verses) wpv.push_back(static_cast<double>(split_whitespace(verse).size()));
    for (double w : wpv) avg_words += w;
    avg_words /= verse_count;
    if (verses.size() > 1) {
      double var = 0.0;
      for (double w : wpv) var += (w - avg_words) * (w - avg_words);
      std_words = std::sqrt(var / verse_count);
    }
  }

  // Rhymes: last two letters of each verse's final word.
  std::vector<std::string> endings;
  for (const std::string& verse : verses) {
    const std::vector<std::string> words = split_whitespace(verse);
    if (words.empty()) continue;
    const std::string last = letters_only(words.back());
    if (last.size() >= 2) endings.push_back(last.substr(last.size() - 2));
  }
  double rhyme_diversity = 0.0;
  double dominant_rhyme = 0.0;
  if (!endings.empty()) {
    std::map<std::string, int> counts;
    for (const std::string& e : endings) ++counts[e];
    int best = 0;
    for (const auto& [ending, n] : counts) best = std::max(best, n);
    rhyme_diversity = static_cast<double>(counts.size()) / static_cast<double>(endings.size());
    dominant_rhyme = static_cast<double>(best) / static_cast<double>(endings.size());
  }

  // Alliteration: consonant bigrams inside words that start with a consonant.
  const std::vector<std::string> poem_words = split_whitespace(replace_punct(to_lower(poem)));
  std::map<std::string, int> bigrams;
  int bigram_total = 0;
  for (const std::string& word : poem_words) {
    const std::string w = letters_only(word);
    if (w.size() < 2 || !is_consonant(w[0])) continue;
    for (std::size_t i = 0; i + 1 < w.size(); ++i) {
      if (is_consonant(w[i]) && is_consonant(w[i + 1])) {
        ++bigrams[w.substr(i, 2)];
        ++bigram_total;
      }
    }
  }
  double alliteration = 0.0;
  if (bigram_total > 0) {
    int repeated = 0;
    for (const auto& [pair, n] : bigrams) {
      if (n > 1) ++repeated;
    }
    alliteration = static_cast<double>(repeated) / static_cast<double>(bigram_total);
  }

  // Assonance.
  std::map<char, int> vowel_counts;
  int total_vowels = 0;
  for (const std::string& verse : verses) {
    for (char c : letters_only(verse)) {
      if (!is_vowel(c)) continue;
      ++vowel_counts[c];
      ++total_vowels;
    }
  }
  double dominant_vowel = 0.0;
  double vowel_entropy = 0.0;
  if (total_vowels > 0) {
    int best = 0;
    for (const auto& [c, n] : vowel_counts) {
      best = std::max(best, n);
      const double p = static_cast<double>(n) / static_cast<double>(total_vowels);
      vowel_entropy -= p * std::log2(p + 1e-10);
    }
    dominant_vowel = static_cast<double>(best) / static_cast<double>(total_vowels);
  }

  v[2] = verse_count / 20.0;
  v[3] = avg_words / 10.0;
  v[4] = std_words / 5.0;
  v[5] = rhyme_diversity;
  v[6] = dominant_rhyme;
  v[7] = alliteration;
  v[8] = dominant_vowel;
  v[9] = vowel_entropy / 3.0;
  v[10] = avg_words;

  // Poet.
  const std::vector<std::string> poet_words = split_whitespace(to_lower(poet));
  std::string joined;
  for (const std::string& w : poet_words) joined += w;
  const std::set<char> letters(joined.begin(), joined.end());
  v[11] = static_cast<double>(poet_words.size()) / 5.0;
  v[12] = static_cast<double>(letters.size()) / static_cast<double>(std::max<std::size_t>(joined.size(), 1));

  v[13] = genre_id(genre);
  return v;
}

} // namespace flowart
