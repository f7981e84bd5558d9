#pragma once

#include "cell_lineage/config/configuration.hpp"
#include "cell_lineage/core/types.hpp"
#include "cell_lineage/io/csv.hpp"
#include "cell_lineage/metrics/kinematics.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace cell_lineage::io {

namespace fs = std::filesystem;

struct TableFormat {
  char delimiter = ',';
  std::string missing_value;
  int precision = 10; // significant digits
};

TableFormat table_format_from_config(const config::OutputConfig &cfg);

// The three output relations of one location, already rendered to cells.
struct LineageTables {
  CsvTable statistics;
  CsvTable edges;
  CsvTable lineage;
};

CsvRow statistics_header(const std::vector<std::string> &channels);
CsvRow edges_header();
CsvRow lineage_header();

// Headers only.
LineageTables make_lineage_tables(const std::vector<std::string> &channels);

// Shortest decimal text at the given precision; missing marker for an empty
// or non-finite value.
std::string format_number(std::optional<double> value, const TableFormat &fmt);

/**
 * Append the rows of one decomposed track. `stats` must be in subtrack index
 * order, as returned by compute_lineage_statistics.
 */
void append_track_rows(LineageTables &tables, const LineageTree &tree,
                       const std::vector<metrics::SubtrackStatistics> &stats,
                       const std::vector<std::string> &channels,
                       const TableFormat &fmt);

// Row-wise concatenation; headers of `dst` are kept.
void append_tables(LineageTables &dst, const LineageTables &src);

struct LineageTablePaths {
  fs::path statistics;
  fs::path edges;
  fs::path lineage;
};

LineageTablePaths lineage_table_paths(const fs::path &out_dir,
                                      const std::string &base_name);

std::string render_table(const CsvTable &table, char delimiter);

// Creates out_dir if needed. Throws IOError on write failure.
LineageTablePaths write_lineage_tables(const LineageTables &tables,
                                       const fs::path &out_dir,
                                       const std::string &base_name,
                                       char delimiter);

} // namespace cell_lineage::io
