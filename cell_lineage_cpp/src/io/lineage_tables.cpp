#include "cell_lineage/io/lineage_tables.hpp"
#include "cell_lineage/core/errors.hpp"
#include "cell_lineage/core/utils.hpp"

#include <cmath>
#include <iomanip>
#include <locale>
#include <sstream>

namespace cell_lineage::io {

namespace {

std::string parent_id(const LineageTree &tree, const std::optional<int> &parent) {
  return parent ? subtrack_id(tree.track_id, *parent) : std::string();
}

std::string int_or_missing(const std::optional<int> &v, const TableFormat &fmt) {
  return v ? std::to_string(*v) : fmt.missing_value;
}

std::string path_string(const std::vector<int> &path) {
  std::vector<std::string> parts;
  parts.reserve(path.size());
  for (int idx : path)
    parts.push_back(std::to_string(idx));
  return core::join(parts, "/");
}

} // namespace

TableFormat table_format_from_config(const config::OutputConfig &cfg) {
  TableFormat fmt;
  fmt.delimiter = cfg.delimiter.empty() ? ',' : cfg.delimiter.front();
  fmt.missing_value = cfg.missing_value;
  fmt.precision = cfg.precision;
  return fmt;
}

CsvRow statistics_header(const std::vector<std::string> &channels) {
  CsvRow h = {"SUBTRACK_ID",
              "TRACK_ID",
              "SUBTRACK_INDEX",
              "GENERATION",
              "PARENT_SUBTRACK_ID",
              "START_FRAME",
              "END_FRAME",
              "SUBTRACK_DURATION",
              "SUBTRACK_START",
              "SUBTRACK_STOP",
              "NUMBER_SPOTS",
              "NUMBER_EDGES",
              "SUBTRACK_DISPLACEMENT",
              "TOTAL_DISTANCE_TRAVELED",
              "MAX_DISTANCE_TRAVELED",
              "SUBTRACK_MEAN_SPEED",
              "SUBTRACK_MAX_SPEED",
              "SUBTRACK_MIN_SPEED",
              "SUBTRACK_MEDIAN_SPEED",
              "SUBTRACK_STD_SPEED",
              "CONFINEMENT_RATIO",
              "LINEARITY_OF_FORWARD_PROGRESSION",
              "MEAN_STRAIGHT_LINE_SPEED",
              "MEAN_DIRECTIONAL_CHANGE_RATE",
              "OUTREACH_RATIO",
              "TORTUOSITY",
              "SUBTRACK_X_LOCATION",
              "SUBTRACK_Y_LOCATION",
              "SUBTRACK_Z_LOCATION",
              "START_X",
              "START_Y",
              "START_Z",
              "END_X",
              "END_Y",
              "END_Z",
              "SUBTRACK_MEAN_QUALITY"};
  for (const auto &ch : channels) {
    h.push_back("SUBTRACK_MEAN_INTENSITY_" + ch);
  }
  return h;
}

CsvRow edges_header() {
  return {"SUBTRACK_ID",   "TRACK_ID",       "SPOT_SOURCE_ID",
          "SPOT_TARGET_ID", "SOURCE_FRAME",  "TARGET_FRAME",
          "DISPLACEMENT",  "SPEED",          "DIRECTIONAL_CHANGE_RATE",
          "IS_DIVISION_EDGE"};
}

CsvRow lineage_header() {
  return {"SUBTRACK_ID", "TRACK_ID",     "SUBTRACK_INDEX",  "GENERATION",
          "PARENT_SUBTRACK_ID", "SPLIT_FRAME", "START_FRAME", "END_FRAME",
          "DURATION",    "NUMBER_SPOTS", "NUMBER_CHILDREN", "PATH_FROM_ROOT"};
}

LineageTables make_lineage_tables(const std::vector<std::string> &channels) {
  LineageTables t;
  t.statistics.header = statistics_header(channels);
  t.edges.header = edges_header();
  t.lineage.header = lineage_header();
  return t;
}

std::string format_number(std::optional<double> value, const TableFormat &fmt) {
  if (!value || !std::isfinite(*value)) {
    return fmt.missing_value;
  }
  double v = *value;
  if (v == 0.0) {
    v = 0.0; // drop the sign of -0
  }
  std::ostringstream ss;
  ss.imbue(std::locale::classic());
  ss << std::setprecision(fmt.precision) << v;
  return ss.str();
}

void append_track_rows(LineageTables &tables, const LineageTree &tree,
                       const std::vector<metrics::SubtrackStatistics> &stats,
                       const std::vector<std::string> &channels,
                       const TableFormat &fmt) {
  auto num = [&fmt](std::optional<double> v) { return format_number(v, fmt); };
  const std::string track = std::to_string(tree.track_id);

  for (const auto &st : stats) {
    const auto &k = st.kinematics;
    CsvRow row = {subtrack_id(st.track_id, st.index),
                  track,
                  std::to_string(st.index),
                  std::to_string(st.generation),
                  parent_id(tree, st.parent_index),
                  std::to_string(st.start_frame),
                  std::to_string(st.end_frame),
                  std::to_string(k.duration),
                  std::to_string(st.start_frame),
                  std::to_string(st.end_frame),
                  std::to_string(k.n_spots),
                  std::to_string(k.n_edges),
                  num(k.net_displacement),
                  num(k.total_distance),
                  num(k.max_distance),
                  num(k.speed_mean),
                  num(k.speed_max),
                  num(k.speed_min),
                  num(k.speed_median),
                  num(k.speed_std),
                  num(k.confinement_ratio),
                  num(k.linearity_of_forward_progression),
                  num(k.mean_straight_line_speed),
                  num(k.mean_directional_change_rate),
                  num(k.outreach_ratio),
                  num(k.tortuosity),
                  num(k.mean_position.x()),
                  num(k.mean_position.y()),
                  num(k.mean_position.z()),
                  num(k.start_position.x()),
                  num(k.start_position.y()),
                  num(k.start_position.z()),
                  num(k.end_position.x()),
                  num(k.end_position.y()),
                  num(k.end_position.z()),
                  num(k.mean_quality)};
    for (const auto &ch : channels) {
      auto it = k.mean_intensity.find(ch);
      row.push_back(it != k.mean_intensity.end() ? num(it->second)
                                                 : fmt.missing_value);
    }
    tables.statistics.rows.push_back(std::move(row));
  }

  for (const auto &a : tree.edges) {
    tables.edges.rows.push_back(
        {subtrack_id(tree.track_id, a.subtrack_index), track,
         std::to_string(a.edge.source), std::to_string(a.edge.target),
         std::to_string(a.source_frame), std::to_string(a.target_frame),
         num(a.edge.displacement), num(a.edge.speed),
         num(a.edge.directional_change), a.division ? "1" : "0"});
  }

  for (const auto &seg : tree.subtracks) {
    tables.lineage.rows.push_back(
        {subtrack_id(tree.track_id, seg.index), track, std::to_string(seg.index),
         std::to_string(seg.generation), parent_id(tree, seg.parent_index),
         int_or_missing(seg.split_frame, fmt), std::to_string(seg.start_frame),
         std::to_string(seg.end_frame), std::to_string(seg.duration()),
         std::to_string(seg.spots.size()), std::to_string(seg.children.size()),
         path_string(seg.path_from_root)});
  }
}

void append_tables(LineageTables &dst, const LineageTables &src) {
  dst.statistics.rows.insert(dst.statistics.rows.end(),
                             src.statistics.rows.begin(),
                             src.statistics.rows.end());
  dst.edges.rows.insert(dst.edges.rows.end(), src.edges.rows.begin(),
                        src.edges.rows.end());
  dst.lineage.rows.insert(dst.lineage.rows.end(), src.lineage.rows.begin(),
                          src.lineage.rows.end());
}

LineageTablePaths lineage_table_paths(const fs::path &out_dir,
                                      const std::string &base_name) {
  LineageTablePaths p;
  p.statistics = out_dir / (base_name + "-subtrack_statistics.csv");
  p.edges = out_dir / (base_name + "-subtrack_edges.csv");
  p.lineage = out_dir / (base_name + "-subtrack_lineage.csv");
  return p;
}

std::string render_table(const CsvTable &table, char delimiter) {
  std::string out = format_csv_row(table.header, delimiter);
  for (const auto &row : table.rows) {
    out += format_csv_row(row, delimiter);
  }
  return out;
}

LineageTablePaths write_lineage_tables(const LineageTables &tables,
                                       const fs::path &out_dir,
                                       const std::string &base_name,
                                       char delimiter) {
  std::error_code ec;
  fs::create_directories(out_dir, ec);
  if (ec) {
    throw IOError("cannot create " + out_dir.string() + ": " + ec.message());
  }

  const LineageTablePaths paths = lineage_table_paths(out_dir, base_name);
  core::write_text(paths.statistics, render_table(tables.statistics, delimiter));
  core::write_text(paths.edges, render_table(tables.edges, delimiter));
  core::write_text(paths.lineage, render_table(tables.lineage, delimiter));
  return paths;
}

} // namespace cell_lineage::io
