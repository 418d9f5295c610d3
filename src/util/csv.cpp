#include "flowart/util/csv.h"

#include <stdexcept>

#include "flowart/util/strings.h"

namespace flowart {
namespace {

std::size_t skip_bom(const std::string& s) {
  if (s.size() >= 3 && static_cast<unsigned char>(s[0]) == 0xEF && static_cast<unsigned char>(s[1]) == 0xBB &&
      static_cast<unsigned char>(s[2]) == 0xBF) {
    return 3;
  }
  return 0;
}

struct Reader {
  const std::string& s;
  char delim;
  std::size_t i{0};
  int line{1};

  bool done() const { return i >= s.size(); }

  // Consumes one line break (LF, CR or CRLF) if present.
  bool eat_newline() {
    if (i < s.size() && s[i] == '\r') {
      ++i;
      if (i < s.size() && s[i] == '\n') ++i;
      ++line;
      return true;
    }
    if (i < s.size() && s[i] == '\n') {
      ++i;
      ++line;
      return true;
    }
    return false;
  }

  std::string quoted_cell() {
    const int start_line = line;
    ++i;  // opening quote
    std::string out;
    while (true) {
      if (i >= s.size()) {
        throw std::runtime_error("CSV parse error: unterminated quoted cell starting on line " +
                                 std::to_string(start_line));
      }
      const char c = s[i];
      if (c == '"') {
        if (i + 1 < s.size() && s[i + 1] == '"') {
          out.push_back('"');
          i += 2;
          continue;
        }
        ++i;
        break;
      }
      if (c == '\n') ++line;
      if (c == '\r' && !(i + 1 < s.size() && s[i + 1] == '\n')) ++line;
      out.push_back(c);
      ++i;
    }
    // Tolerate stray characters between the closing quote and the delimiter.
    while (i < s.size() && s[i] != delim && s[i] != '\n' && s[i] != '\r') out.push_back(s[i++]);
    return out;
  }

  std::string plain_cell() {
    std::string out;
    while (i < s.size() && s[i] != delim && s[i] != '\n' && s[i] != '\r') out.push_back(s[i++]);
    return out;
  }

  CsvRow record() {
    CsvRow row;
    while (true) {
      if (i < s.size() && s[i] == '"') {
        row.push_back(quoted_cell());
      } else {
        row.push_back(plain_cell());
      }
      if (i < s.size() && s[i] == delim) {
        ++i;
        continue;
      }
      eat_newline();
      return row;
    }
  }
};

bool blank(const CsvRow& row) {
  for (const std::string& cell : row) {
    if (!trim_copy(cell).empty()) return false;
  }
  return true;
}

} // namespace

int CsvTable::column(const std::string& name) const {
  const std::string want = to_lower(trim_copy(name));
  for (std::size_t k = 0; k < header.size(); ++k) {
    if (to_lower(trim_copy(header[k])) == want) return static_cast<int>(k);
  }
  return -1;
}

char detect_csv_delimiter(const std::string& text) {
  int commas = 0;
  int semis = 0;
  bool in_quotes = false;
  for (std::size_t i = skip_bom(text); i < text.size(); ++i) {
    const char c = text[i];
    if (c == '"') {
      in_quotes = !in_quotes;
      continue;
    }
    if (in_quotes) continue;
    if (c == '\n' || c == '\r') break;
    if (c == ',') ++commas;
    if (c == ';') ++semis;
  }
  return semis > commas ? ';' : ',';
}

CsvTable parse_csv(const std::string& text, char delimiter) {
  CsvTable table;
  table.delimiter = delimiter ? delimiter : detect_csv_delimiter(text);

  Reader r{text, table.delimiter};
  r.i = skip_bom(text);

  bool have_header = false;
  while (!r.done()) {
    if (r.eat_newline()) continue;
    const int start_line = r.line;
    CsvRow row = r.record();
    if (blank(row)) continue;
    if (!have_header) {
      table.header = std::move(row);
      have_header = true;
      continue;
    }
    table.rows.push_back(std::move(row));
    table.row_lines.push_back(start_line);
  }
  return table;
}

} // namespace flowart
