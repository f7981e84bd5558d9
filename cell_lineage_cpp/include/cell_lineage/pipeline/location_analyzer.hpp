#pragma once

#include "cell_lineage/config/configuration.hpp"
#include "cell_lineage/core/events.hpp"
#include "cell_lineage/core/types.hpp"
#include "cell_lineage/io/lineage_tables.hpp"
#include "cell_lineage/io/trackmate_tables.hpp"
#include "cell_lineage/qc/track_filter.hpp"

#include <filesystem>
#include <ostream>
#include <string>
#include <vector>

namespace cell_lineage::pipeline {

namespace fs = std::filesystem;

enum class TrackStatus {
  Accepted,
  Rejected,
  Failed,
};

std::string track_status_to_string(TrackStatus status);

struct TrackOutcome {
  TrackId track_id = 0;
  TrackStatus status = TrackStatus::Accepted;
  TrackSummary summary;   // zeroed when the graph could not be built
  qc::QcVerdict verdict = qc::QcVerdict::Accepted;
  std::string reason;     // QC reason or failure cause
  std::string error_kind; // set for failed tracks
  int n_subtracks = 0;
  io::LineageTables rows; // empty unless accepted
};

// Graph -> QC -> decomposition -> statistics -> rows for one track.
// Structural errors are reported in the outcome, never thrown.
TrackOutcome process_track(TrackId track_id, std::vector<Spot> spots,
                           std::vector<Edge> edges,
                           const std::vector<std::string> &channels,
                           const qc::QcThresholds &thresholds,
                           const io::TableFormat &fmt);

struct LocationAnalysis {
  io::LineageTables tables;
  std::vector<TrackOutcome> tracks; // by track id, rows moved into `tables`
  int n_accepted = 0;
  int n_rejected = 0;
  int n_failed = 0;
  int n_subtracks = 0;
  int untracked_spots = 0;
  int unassigned_edges = 0;
};

/**
 * Run every track of a location through process_track on
 * runtime.parallel_workers threads, then merge the rows in track id order.
 * Output does not depend on the worker count.
 */
LocationAnalysis analyze_location(const io::LocationTables &tables,
                                  const config::Config &cfg);

struct LocationResult {
  std::string location;
  fs::path folder;
  fs::path out_dir;
  bool success = false;
  std::string error;
  LocationAnalysis analysis;
  io::LineageTablePaths paths;
  fs::path summary_path;
};

// "<parent>/Tracking Result" -> parent name without the location suffix.
std::string location_name(const fs::path &tracking_result_folder,
                          const config::Config &cfg);

/**
 * Discover, load, analyze and write one "Tracking Result" folder. Input and
 * write errors fail the location; they are reported in the result and as an
 * error event.
 */
LocationResult run_location(const fs::path &folder, const config::Config &cfg,
                            core::EventEmitter &emitter,
                            const std::string &run_id, std::ostream &out);

std::vector<fs::path> find_tracking_results(const fs::path &root,
                                            const config::Config &cfg);

struct BatchResult {
  std::vector<LocationResult> locations;
  int n_succeeded = 0;
  int n_failed = 0;
};

BatchResult run_batch(const fs::path &root, const config::Config &cfg,
                      core::EventEmitter &emitter, const std::string &run_id,
                      std::ostream &out);

} // namespace cell_lineage::pipeline
