#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace flowart {

using CsvRow = std::vector<std::string>;

struct CsvTable {
  char delimiter{','};
  CsvRow header;
  std::vector<CsvRow> rows;
  // 1-based source line on which each row starts (parallel to rows).
  std::vector<int> row_lines;

  // Index of a header cell (trimmed, case-insensitive) or -1.
  int column(const std::string& name) const;
};

// Picks ';' when the first record has more unquoted semicolons than commas,
// ',' otherwise.
char detect_csv_delimiter(const std::string& text);

// RFC 4180 style parser: quoted cells may contain delimiters, doubled quotes
// and newlines; CRLF and a UTF-8 BOM are accepted; blank lines are skipped.
// The first record becomes the header. delimiter == '\0' auto-detects.
//
// Throws std::runtime_error (with the line number) on an unterminated quote.
CsvTable parse_csv(const std::string& text, char delimiter = '\0');

} // namespace flowart
