#include "cell_lineage/config/configuration.hpp"
#include "cell_lineage/core/errors.hpp"
#include "cell_lineage/core/events.hpp"
#include "cell_lineage/core/utils.hpp"
#include "cell_lineage/pipeline/location_analyzer.hpp"

#include <CLI/CLI.hpp>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <streambuf>
#include <string>

namespace fs = std::filesystem;

using namespace cell_lineage;

namespace {

class TeeBuf : public std::streambuf {
public:
  TeeBuf(std::streambuf *a, std::streambuf *b) : a_(a), b_(b) {}

protected:
  int overflow(int c) override {
    if (c == EOF)
      return EOF;
    const int ra = a_ ? a_->sputc(static_cast<char>(c)) : c;
    const int rb = b_ ? b_->sputc(static_cast<char>(c)) : c;
    return (ra == EOF || rb == EOF) ? EOF : c;
  }

  int sync() override {
    int ra = a_ ? a_->pubsync() : 0;
    int rb = b_ ? b_->pubsync() : 0;
    return (ra == 0 && rb == 0) ? 0 : -1;
  }

private:
  std::streambuf *a_;
  std::streambuf *b_;
};

struct RunOptions {
  std::string folder;
  std::string batch_root;
  std::string config_path;
  std::string events_log;
  int max_splits = -1;
  int min_duration = -1;
  int workers = -1;
};

int run_command(const RunOptions &opts) {
  config::Config cfg;
  try {
    if (!opts.config_path.empty()) {
      cfg = config::Config::load(opts.config_path);
    }
    if (opts.max_splits >= 0)
      cfg.qc.max_splits_allowed = opts.max_splits;
    if (opts.min_duration >= 0)
      cfg.qc.min_track_duration_frames = opts.min_duration;
    if (opts.workers >= 0)
      cfg.runtime.parallel_workers = opts.workers;
    cfg.validate();
  } catch (const CellLineageError &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  std::ofstream event_log_file;
  if (!opts.events_log.empty()) {
    const fs::path log_path(opts.events_log);
    if (log_path.has_parent_path()) {
      std::error_code ec;
      fs::create_directories(log_path.parent_path(), ec);
      if (ec) {
        std::cerr << "Error: Cannot create " << log_path.parent_path().string()
                  << ": " << ec.message() << std::endl;
        return 1;
      }
    }
    event_log_file.open(log_path, std::ios::out | std::ios::app);
    if (!event_log_file) {
      std::cerr << "Error: Cannot open events log: " << opts.events_log
                << std::endl;
      return 1;
    }
  }
  TeeBuf tee_buf(std::cout.rdbuf(),
                 event_log_file.is_open() ? event_log_file.rdbuf() : nullptr);
  std::ostream log_file(&tee_buf);

  const std::string run_id = core::get_run_id();
  const bool batch = !opts.batch_root.empty();

  core::EventEmitter emitter;
  emitter.run_start(
      run_id,
      {{"mode", batch ? "batch" : "folder"},
       {"input", batch ? opts.batch_root : opts.folder},
       {"config_path", opts.config_path},
       {"config_hash", core::sha256_text(YAML::Dump(cfg.to_yaml()))},
       {"max_splits_allowed", cfg.qc.max_splits_allowed},
       {"min_track_duration_frames", cfg.qc.min_track_duration_frames},
       {"parallel_workers", cfg.runtime.parallel_workers}},
      log_file);

  std::cout << "Run ID: " << run_id << std::endl;

  int n_succeeded = 0;
  int n_failed = 0;
  if (batch) {
    const pipeline::BatchResult result =
        pipeline::run_batch(opts.batch_root, cfg, emitter, run_id, log_file);
    n_succeeded = result.n_succeeded;
    n_failed = result.n_failed;
    if (result.locations.empty()) {
      emitter.error(run_id,
                    "no '" + cfg.input.tracking_result_dir + "' folders under " +
                        opts.batch_root,
                    log_file);
      std::cerr << "Error: No '" << cfg.input.tracking_result_dir
                << "' folders found under " << opts.batch_root << std::endl;
      emitter.run_end(run_id, false, "error",
                      {{"locations", 0}, {"succeeded", 0}, {"failed", 0}},
                      log_file);
      return 1;
    }
  } else {
    const pipeline::LocationResult result =
        pipeline::run_location(opts.folder, cfg, emitter, run_id, log_file);
    if (result.success) {
      n_succeeded = 1;
    } else {
      n_failed = 1;
    }
  }

  const bool ok = n_failed == 0;
  emitter.run_end(run_id, ok, ok ? "ok" : "error",
                  {{"locations", n_succeeded + n_failed},
                   {"succeeded", n_succeeded},
                   {"failed", n_failed}},
                  log_file);
  std::cout << "Locations: " << n_succeeded << " succeeded, " << n_failed
            << " failed" << std::endl;
  return ok ? 0 : 1;
}

int validate_config_command(const std::string &path) {
  core::json result;
  result["path"] = path;
  result["valid"] = false;
  result["errors"] = core::json::array();

  try {
    config::Config cfg = config::Config::load(path);
    cfg.validate();
    result["valid"] = true;
  } catch (const CellLineageError &e) {
    result["errors"].push_back(e.what());
  }

  std::cout << result.dump(2) << std::endl;
  return result["valid"].get<bool>() ? 0 : 1;
}

} // namespace

int main(int argc, char *argv[]) {
  CLI::App app{"Cell lineage subtrack analysis"};
  app.require_subcommand(1);

  RunOptions run_opts;
  auto run_cmd = app.add_subcommand(
      "run", "Decompose tracks of one location or of every location in a tree");
  auto folder_opt = run_cmd->add_option("--folder", run_opts.folder,
                                        "A 'Tracking Result' folder");
  auto batch_opt = run_cmd->add_option(
      "--batch", run_opts.batch_root,
      "Root directory searched recursively for 'Tracking Result' folders");
  folder_opt->excludes(batch_opt);
  batch_opt->excludes(folder_opt);
  run_cmd->add_option("--config", run_opts.config_path, "Path to config.yaml");
  run_cmd->add_option("--max-splits", run_opts.max_splits,
                      "Reject tracks with more splits than this")
      ->check(CLI::NonNegativeNumber);
  run_cmd->add_option("--min-duration", run_opts.min_duration,
                      "Reject tracks shorter than this many frames")
      ->check(CLI::PositiveNumber);
  run_cmd->add_option("--workers", run_opts.workers,
                      "Parallel workers per location")
      ->check(CLI::PositiveNumber);
  run_cmd->add_option("--events-log", run_opts.events_log,
                      "Append JSON-lines events to this file");

  std::string validate_path;
  auto validate_cmd =
      app.add_subcommand("validate-config", "Validate a config file");
  validate_cmd->add_option("--config", validate_path, "Path to config.yaml")
      ->required();

  auto schema_cmd =
      app.add_subcommand("schema", "Print the JSON schema of the config");

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError &e) {
    // --help exits 0; every usage error maps to 1
    return app.exit(e) == 0 ? 0 : 1;
  }

  if (run_cmd->parsed()) {
    if (run_opts.folder.empty() && run_opts.batch_root.empty()) {
      std::cerr << "Error: run requires --folder or --batch" << std::endl;
      return 1;
    }
    return run_command(run_opts);
  }

  if (validate_cmd->parsed()) {
    return validate_config_command(validate_path);
  }

  if (schema_cmd->parsed()) {
    std::cout << config::get_schema_json() << std::endl;
    return 0;
  }

  std::cerr << app.help() << std::endl;
  return 1;
}
