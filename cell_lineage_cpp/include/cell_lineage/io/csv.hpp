#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace cell_lineage::io {

namespace fs = std::filesystem;

using CsvRow = std::vector<std::string>;

struct CsvTable {
  CsvRow header;
  std::vector<CsvRow> rows;

  // Column position by exact header name, empty if absent.
  std::optional<size_t> column(const std::string &name) const;

  // Throws InputTableError naming `table` when the column is absent.
  size_t require_column(const std::string &name, const std::string &table) const;
};

// RFC 4180 style: quoted fields, doubled quotes, CRLF or LF line endings,
// optional UTF-8 byte-order mark. Blank lines are skipped.
CsvTable parse_csv(const std::string &text, char delimiter = ',');

CsvTable read_csv(const fs::path &path, char delimiter = ',');

// Quotes the field when it contains the delimiter, a quote or a line break.
std::string csv_escape(const std::string &field, char delimiter);

std::string format_csv_row(const CsvRow &row, char delimiter);

} // namespace cell_lineage::io
