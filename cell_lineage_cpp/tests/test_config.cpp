#include "cell_lineage/config/configuration.hpp"
#include "cell_lineage/core/errors.hpp"
#include "cell_lineage/core/utils.hpp"

#include <catch2/catch_test_macros.hpp>
#include <nlohmann/json.hpp>

#include <filesystem>

namespace fs = std::filesystem;

using cell_lineage::ConfigError;
using cell_lineage::ValidationError;
using cell_lineage::config::Config;

TEST_CASE("config_defaults_are_valid") {
  Config cfg;
  REQUIRE_NOTHROW(cfg.validate());
  REQUIRE(cfg.qc.max_splits_allowed == 3);
  REQUIRE(cfg.qc.min_track_duration_frames == 20);
  REQUIRE(cfg.input.tracking_result_dir == "Tracking Result");
  REQUIRE(cfg.output.dir == "secondary_analysis");
  REQUIRE(cfg.runtime.parallel_workers == 4);
}

TEST_CASE("config_from_yaml_overrides_given_keys_only") {
  auto cfg = Config::from_yaml(YAML::Load("qc:\n"
                                          "  max_splits_allowed: 1\n"
                                          "output:\n"
                                          "  delimiter: \";\"\n"
                                          "  missing_value: NA\n"));
  REQUIRE(cfg.qc.max_splits_allowed == 1);
  REQUIRE(cfg.qc.min_track_duration_frames == 20);
  REQUIRE(cfg.output.delimiter == ";");
  REQUIRE(cfg.output.missing_value == "NA");
  REQUIRE(cfg.output.precision == 10);
}

TEST_CASE("config_empty_document_gives_defaults") {
  auto cfg = Config::from_yaml(YAML::Load(""));
  REQUIRE(cfg.qc.max_splits_allowed == 3);
}

TEST_CASE("config_wrong_type_raises_config_error") {
  REQUIRE_THROWS_AS(Config::from_yaml(YAML::Load("qc:\n  max_splits_allowed: many\n")),
                    ConfigError);
  REQUIRE_THROWS_AS(Config::from_yaml(YAML::Load("- 1\n- 2\n")), ConfigError);
}

TEST_CASE("config_validation_rejects_out_of_range_values") {
  Config cfg;
  cfg.qc.max_splits_allowed = -1;
  REQUIRE_THROWS_AS(cfg.validate(), ValidationError);

  cfg = Config();
  cfg.qc.min_track_duration_frames = 0;
  REQUIRE_THROWS_AS(cfg.validate(), ValidationError);

  cfg = Config();
  cfg.output.delimiter = ";;";
  REQUIRE_THROWS_AS(cfg.validate(), ValidationError);

  cfg = Config();
  cfg.output.missing_value = "a,b";
  REQUIRE_THROWS_AS(cfg.validate(), ValidationError);

  cfg = Config();
  cfg.output.precision = 18;
  REQUIRE_THROWS_AS(cfg.validate(), ValidationError);

  cfg = Config();
  cfg.runtime.parallel_workers = 0;
  REQUIRE_THROWS_AS(cfg.validate(), ValidationError);
}

TEST_CASE("config_save_and_load_preserve_values") {
  fs::path dir = fs::temp_directory_path() /
                 ("cell_lineage_config_" + cell_lineage::core::get_run_id());
  fs::create_directories(dir);

  Config cfg;
  cfg.qc.max_splits_allowed = 5;
  cfg.input.location_suffix = "_crop";
  cfg.output.write_summary = false;
  cfg.save(dir / "config.yaml");

  auto loaded = Config::load(dir / "config.yaml");
  REQUIRE(loaded.qc.max_splits_allowed == 5);
  REQUIRE(loaded.input.location_suffix == "_crop");
  REQUIRE_FALSE(loaded.output.write_summary);

  fs::remove_all(dir);
}

TEST_CASE("config_load_missing_file_raises_config_error") {
  REQUIRE_THROWS_AS(Config::load("/nonexistent/cell_lineage.yaml"), ConfigError);
}

TEST_CASE("config_schema_is_json") {
  auto schema = nlohmann::json::parse(cell_lineage::config::get_schema_json());
  REQUIRE(schema["properties"].contains("qc"));
  REQUIRE(schema["properties"]["runtime"]["properties"].contains("parallel_workers"));
}
