#pragma once

#include <filesystem>
#include <string>
#include <yaml-cpp/yaml.h>

namespace cell_lineage::config {

namespace fs = std::filesystem;

struct QcConfig {
  int max_splits_allowed = 3;
  int min_track_duration_frames = 20;
};

struct InputConfig {
  std::string tracking_result_dir = "Tracking Result";
  std::string location_suffix = "_cropped"; // stripped from location names
};

struct OutputConfig {
  std::string dir = "secondary_analysis"; // relative to the Tracking Result folder
  std::string delimiter = ",";
  std::string missing_value = "";         // written for undefined metrics
  int precision = 10;                     // significant digits
  bool write_summary = true;
};

struct RuntimeConfig {
  int parallel_workers = 4;
};

struct Config {
  QcConfig qc;
  InputConfig input;
  OutputConfig output;
  RuntimeConfig runtime;

  static Config load(const fs::path &path);
  static Config from_yaml(const YAML::Node &node);

  void save(const fs::path &path) const;
  YAML::Node to_yaml() const;

  void validate() const;
};

std::string get_schema_json();

} // namespace cell_lineage::config
