#include "flowart/util/strings.h"

#include <algorithm>
#include <cctype>

namespace flowart {

std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return s;
}

std::string trim_copy(const std::string& s) {
  const auto not_space = [](unsigned char c) { return !std::isspace(c); };
  auto b = std::find_if(s.begin(), s.end(), not_space);
  auto e = std::find_if(s.rbegin(), s.rend(), not_space).base();
  if (b >= e) return {};
  return std::string(b, e);
}

std::vector<std::string> split_whitespace(const std::string& s) {
  std::vector<std::string> out;
  std::string cur;
  for (char ch : s) {
    if (std::isspace(static_cast<unsigned char>(ch))) {
      if (!cur.empty()) {
        out.push_back(cur);
        cur.clear();
      }
    } else {
      cur.push_back(ch);
    }
  }
  if (!cur.empty()) out.push_back(cur);
  return out;
}

std::string slugify(const std::string& text, std::size_t max_length) {
  std::string out;
  bool pending_sep = false;
  for (unsigned char c : text) {
    const char lc = static_cast<char>(std::tolower(c));
    const bool keep = (lc >= 'a' && lc <= 'z') || (lc >= '0' && lc <= '9');
    if (!keep) {
      pending_sep = true;
      continue;
    }
    if (pending_sep && !out.empty()) out.push_back('_');
    pending_sep = false;
    out.push_back(lc);
  }
  if (out.size() > max_length) out.resize(max_length);
  return out;
}

std::string csv_escape(const std::string& s) {
  const bool needs_quotes = s.find_first_of(",;\"\n\r") != std::string::npos;
  if (!needs_quotes) return s;
  std::string out;
  out.reserve(s.size() + 2);
  out.push_back('"');
  for (char c : s) {
    if (c == '"') out.push_back('"');
    out.push_back(c);
  }
  out.push_back('"');
  return out;
}

} // namespace flowart
