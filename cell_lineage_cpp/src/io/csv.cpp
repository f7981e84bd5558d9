#include "cell_lineage/io/csv.hpp"
#include "cell_lineage/core/errors.hpp"
#include "cell_lineage/core/utils.hpp"

namespace cell_lineage::io {

std::optional<size_t> CsvTable::column(const std::string &name) const {
  for (size_t i = 0; i < header.size(); ++i) {
    if (header[i] == name)
      return i;
  }
  return std::nullopt;
}

size_t CsvTable::require_column(const std::string &name,
                                const std::string &table) const {
  auto c = column(name);
  if (!c) {
    throw InputTableError(table + ": missing required column '" + name + "'");
  }
  return *c;
}

namespace {

bool row_is_blank(const CsvRow &row) {
  for (const auto &f : row) {
    if (!core::trim(f).empty())
      return false;
  }
  return true;
}

} // namespace

CsvTable parse_csv(const std::string &text, char delimiter) {
  CsvTable table;
  std::vector<CsvRow> records;

  size_t pos = 0;
  if (text.size() >= 3 && static_cast<unsigned char>(text[0]) == 0xEF &&
      static_cast<unsigned char>(text[1]) == 0xBB &&
      static_cast<unsigned char>(text[2]) == 0xBF) {
    pos = 3;
  }

  CsvRow row;
  std::string field;
  bool in_quotes = false;
  bool field_started = false;

  auto end_field = [&]() {
    row.push_back(field);
    field.clear();
    field_started = false;
  };
  auto end_row = [&]() {
    end_field();
    if (!row_is_blank(row)) {
      records.push_back(std::move(row));
    }
    row = CsvRow();
  };

  for (; pos < text.size(); ++pos) {
    const char c = text[pos];
    if (in_quotes) {
      if (c == '"') {
        if (pos + 1 < text.size() && text[pos + 1] == '"') {
          field.push_back('"');
          ++pos;
        } else {
          in_quotes = false;
        }
      } else {
        field.push_back(c);
      }
      continue;
    }

    if (c == '"' && !field_started && field.empty()) {
      in_quotes = true;
      field_started = true;
    } else if (c == delimiter) {
      end_field();
    } else if (c == '\r') {
      if (pos + 1 < text.size() && text[pos + 1] == '\n')
        ++pos;
      end_row();
    } else if (c == '\n') {
      end_row();
    } else {
      field.push_back(c);
      field_started = true;
    }
  }

  if (in_quotes) {
    throw InputTableError("unterminated quoted field");
  }
  if (field_started || !field.empty() || !row.empty()) {
    end_row();
  }

  if (records.empty()) {
    return table;
  }

  table.header = std::move(records.front());
  for (auto &h : table.header) {
    h = core::trim(h);
  }
  for (size_t i = 1; i < records.size(); ++i) {
    records[i].resize(table.header.size());
    table.rows.push_back(std::move(records[i]));
  }
  return table;
}

CsvTable read_csv(const fs::path &path, char delimiter) {
  if (!fs::exists(path)) {
    throw InputTableError("file not found: " + path.string());
  }
  return parse_csv(core::read_text(path), delimiter);
}

std::string csv_escape(const std::string &field, char delimiter) {
  const bool needs_quotes =
      field.find(delimiter) != std::string::npos ||
      field.find('"') != std::string::npos ||
      field.find('\n') != std::string::npos ||
      field.find('\r') != std::string::npos;
  if (!needs_quotes)
    return field;

  std::string out;
  out.reserve(field.size() + 2);
  out.push_back('"');
  for (char c : field) {
    if (c == '"')
      out.push_back('"');
    out.push_back(c);
  }
  out.push_back('"');
  return out;
}

std::string format_csv_row(const CsvRow &row, char delimiter) {
  std::string line;
  for (size_t i = 0; i < row.size(); ++i) {
    if (i > 0)
      line.push_back(delimiter);
    line += csv_escape(row[i], delimiter);
  }
  line.push_back('\n');
  return line;
}

} // namespace cell_lineage::io
