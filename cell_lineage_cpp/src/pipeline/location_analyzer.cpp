#include "cell_lineage/pipeline/location_analyzer.hpp"
#include "cell_lineage/core/errors.hpp"
#include "cell_lineage/core/utils.hpp"
#include "cell_lineage/graph/track_graph.hpp"
#include "cell_lineage/lineage/decomposer.hpp"
#include "cell_lineage/metrics/kinematics.hpp"

#include <algorithm>
#include <atomic>
#include <iostream>
#include <map>
#include <mutex>
#include <thread>
#include <utility>

namespace cell_lineage::pipeline {

namespace {

struct TrackJob {
  TrackId track_id = 0;
  std::vector<Spot> spots;
  std::vector<Edge> edges;
};

std::vector<TrackJob> group_by_track(const io::LocationTables &tables) {
  std::map<TrackId, TrackJob> jobs;
  for (const auto &[id, spot] : tables.spots) {
    TrackJob &job = jobs[spot.track_id];
    job.track_id = spot.track_id;
    job.spots.push_back(spot);
  }
  for (const auto &e : tables.edges) {
    TrackJob &job = jobs[e.track_id];
    job.track_id = e.track_id;
    job.edges.push_back(e);
  }

  std::vector<TrackJob> out;
  out.reserve(jobs.size());
  for (auto &[id, job] : jobs) {
    out.push_back(std::move(job));
  }
  return out;
}

int resolve_workers(int requested, size_t n_jobs) {
  int workers = std::max(1, requested);
  const int cpu_cores = static_cast<int>(std::thread::hardware_concurrency());
  if (cpu_cores > 0) {
    workers = std::min(workers, cpu_cores);
  }
  workers = std::min(workers, static_cast<int>(std::max<size_t>(1, n_jobs)));
  return std::max(1, workers);
}

core::json table_entry(const fs::path &path, size_t rows) {
  return {{"file", path.filename().string()},
          {"rows", rows},
          {"sha256", core::sha256_file(path)}};
}

core::json location_summary(const LocationResult &r, const std::string &base_name,
                            const config::Config &cfg, const std::string &run_id) {
  const LocationAnalysis &a = r.analysis;

  core::json summary;
  summary["run_id"] = run_id;
  summary["created_at"] = core::get_iso_timestamp();
  summary["location"] = r.location;
  summary["folder"] = r.folder.string();
  summary["base_name"] = base_name;
  summary["thresholds"] = {
      {"max_splits_allowed", cfg.qc.max_splits_allowed},
      {"min_track_duration_frames", cfg.qc.min_track_duration_frames}};
  summary["counts"] = {{"tracks", a.tracks.size()},
                       {"accepted", a.n_accepted},
                       {"rejected", a.n_rejected},
                       {"failed", a.n_failed},
                       {"subtracks", a.n_subtracks},
                       {"edges", a.tables.edges.rows.size()},
                       {"untracked_spots", a.untracked_spots},
                       {"unassigned_edges", a.unassigned_edges}};
  summary["tables"] = {
      {"statistics", table_entry(r.paths.statistics, a.tables.statistics.rows.size())},
      {"edges", table_entry(r.paths.edges, a.tables.edges.rows.size())},
      {"lineage", table_entry(r.paths.lineage, a.tables.lineage.rows.size())}};

  core::json tracks = core::json::array();
  core::json rejected = core::json::array();
  core::json failed = core::json::array();
  for (const auto &t : a.tracks) {
    tracks.push_back({{"track_id", t.track_id},
                      {"status", track_status_to_string(t.status)},
                      {"n_subtracks", t.n_subtracks}});
    if (t.status == TrackStatus::Rejected) {
      rejected.push_back({{"track_id", t.track_id},
                          {"verdict", qc::qc_verdict_to_string(t.verdict)},
                          {"reason", t.reason}});
    } else if (t.status == TrackStatus::Failed) {
      failed.push_back({{"track_id", t.track_id},
                        {"error", t.error_kind},
                        {"cause", t.reason}});
    }
  }
  summary["tracks"] = tracks;
  summary["rejected_tracks"] = rejected;
  summary["failed_tracks"] = failed;
  return summary;
}

} // namespace

std::string track_status_to_string(TrackStatus status) {
  switch (status) {
  case TrackStatus::Accepted:
    return "accepted";
  case TrackStatus::Rejected:
    return "rejected";
  case TrackStatus::Failed:
    return "failed";
  default:
    return "unknown";
  }
}

TrackOutcome process_track(TrackId track_id, std::vector<Spot> spots,
                           std::vector<Edge> edges,
                           const std::vector<std::string> &channels,
                           const qc::QcThresholds &thresholds,
                           const io::TableFormat &fmt) {
  TrackOutcome out;
  out.track_id = track_id;
  try {
    const graph::TrackGraph track_graph =
        graph::TrackGraph::build(track_id, std::move(spots), std::move(edges));
    out.summary = track_graph.summary();

    const qc::QcDecision decision = qc::evaluate_track_qc(out.summary, thresholds);
    out.verdict = decision.verdict;
    if (!decision.accepted) {
      out.status = TrackStatus::Rejected;
      out.reason = decision.reason;
      return out;
    }

    const LineageTree tree = lineage::decompose_track(track_graph);
    const auto stats =
        metrics::compute_lineage_statistics(track_graph, tree, channels);
    io::append_track_rows(out.rows, tree, stats, channels, fmt);
    out.n_subtracks = static_cast<int>(tree.subtracks.size());
    out.status = TrackStatus::Accepted;
  } catch (const TrackError &e) {
    out.status = TrackStatus::Failed;
    out.error_kind = e.kind();
    out.reason = e.cause();
    out.n_subtracks = 0;
    out.rows = io::LineageTables{};
  }
  return out;
}

LocationAnalysis analyze_location(const io::LocationTables &tables,
                                  const config::Config &cfg) {
  std::vector<TrackJob> jobs = group_by_track(tables);

  qc::QcThresholds thresholds;
  thresholds.max_splits_allowed = cfg.qc.max_splits_allowed;
  thresholds.min_track_duration_frames = cfg.qc.min_track_duration_frames;
  const io::TableFormat fmt = io::table_format_from_config(cfg.output);

  // One slot per track; workers never touch another track's slot.
  std::vector<TrackOutcome> slots(jobs.size());

  std::atomic<size_t> next{0};
  std::atomic<bool> failed{false};
  std::mutex error_mutex;
  std::string error;

  auto worker = [&]() {
    while (true) {
      const size_t i = next.fetch_add(1);
      if (i >= jobs.size()) {
        break;
      }
      try {
        slots[i] = process_track(jobs[i].track_id, std::move(jobs[i].spots),
                                 std::move(jobs[i].edges), tables.channels,
                                 thresholds, fmt);
      } catch (const std::exception &e) {
        failed.store(true, std::memory_order_relaxed);
        std::lock_guard<std::mutex> lock(error_mutex);
        if (error.empty()) {
          error = "track " + std::to_string(jobs[i].track_id) + ": " + e.what();
        }
      }
    }
  };

  const int n_workers = resolve_workers(cfg.runtime.parallel_workers, jobs.size());
  if (n_workers > 1) {
    std::vector<std::thread> workers;
    workers.reserve(static_cast<size_t>(n_workers));
    for (int w = 0; w < n_workers; ++w) {
      workers.emplace_back(worker);
    }
    for (auto &t : workers) {
      if (t.joinable()) {
        t.join();
      }
    }
  } else {
    worker();
  }

  if (failed.load(std::memory_order_relaxed)) {
    throw CellLineageError("track analysis failed: " + error);
  }

  LocationAnalysis out;
  out.tables = io::make_lineage_tables(tables.channels);
  out.untracked_spots = tables.untracked_spots;
  out.unassigned_edges = tables.unassigned_edges;
  for (auto &slot : slots) {
    switch (slot.status) {
    case TrackStatus::Accepted:
      ++out.n_accepted;
      out.n_subtracks += slot.n_subtracks;
      io::append_tables(out.tables, slot.rows);
      break;
    case TrackStatus::Rejected:
      ++out.n_rejected;
      break;
    case TrackStatus::Failed:
      ++out.n_failed;
      break;
    }
    slot.rows = io::LineageTables{};
    out.tracks.push_back(std::move(slot));
  }
  return out;
}

std::string location_name(const fs::path &tracking_result_folder,
                          const config::Config &cfg) {
  fs::path p = tracking_result_folder;
  if (p.filename().empty()) {
    p = p.parent_path();
  }
  std::string name = p.parent_path().filename().string();
  if (name.empty()) {
    name = p.filename().string();
  }
  return core::clean_location_name(name, cfg.input.location_suffix);
}

LocationResult run_location(const fs::path &folder, const config::Config &cfg,
                            core::EventEmitter &emitter,
                            const std::string &run_id, std::ostream &out) {
  LocationResult r;
  r.folder = folder;
  r.location = location_name(folder, cfg);
  r.out_dir = folder / cfg.output.dir;

  emitter.location_start(run_id, r.location, folder.string(), out);
  std::cout << "[" << r.location << "] " << folder.string() << std::endl;

  Phase phase = Phase::LOAD_TABLES;
  try {
    emitter.phase_start(run_id, phase, r.location, out);
    const io::TrackmateFiles files = io::discover_trackmate_files(folder);
    const io::LocationTables tables = io::load_location_tables(files);
    emitter.phase_end(run_id, phase, r.location, "ok",
                      {{"base_name", files.base_name},
                       {"spots", tables.spots.size()},
                       {"edges", tables.edges.size()},
                       {"channels", tables.channels},
                       {"untracked_spots", tables.untracked_spots},
                       {"unassigned_edges", tables.unassigned_edges}},
                      out);
    if (tables.unassigned_edges > 0) {
      emitter.warning(run_id,
                      r.location + ": " + std::to_string(tables.unassigned_edges) +
                          " edges reference unknown spots and carry no TRACK_ID",
                      out);
    }

    phase = Phase::ANALYZE_TRACKS;
    emitter.phase_start(run_id, phase, r.location, out);
    r.analysis = analyze_location(tables, cfg);
    for (const auto &t : r.analysis.tracks) {
      if (t.status == TrackStatus::Rejected) {
        emitter.track_rejected(run_id, r.location, t.track_id,
                               qc::qc_verdict_to_string(t.verdict) + ": " + t.reason,
                               out);
      } else if (t.status == TrackStatus::Failed) {
        emitter.track_failed(run_id, r.location, t.track_id, t.error_kind,
                             t.reason, out);
      }
    }
    emitter.phase_end(run_id, phase, r.location, "ok",
                      {{"tracks", r.analysis.tracks.size()},
                       {"accepted", r.analysis.n_accepted},
                       {"rejected", r.analysis.n_rejected},
                       {"failed", r.analysis.n_failed},
                       {"subtracks", r.analysis.n_subtracks}},
                      out);
    std::cout << "[" << r.location << "] tracks=" << r.analysis.tracks.size()
              << " accepted=" << r.analysis.n_accepted
              << " rejected=" << r.analysis.n_rejected
              << " failed=" << r.analysis.n_failed
              << " subtracks=" << r.analysis.n_subtracks << std::endl;

    phase = Phase::WRITE_TABLES;
    emitter.phase_start(run_id, phase, r.location, out);
    const io::TableFormat fmt = io::table_format_from_config(cfg.output);
    r.paths = io::write_lineage_tables(r.analysis.tables, r.out_dir,
                                       files.base_name, fmt.delimiter);
    if (cfg.output.write_summary) {
      r.summary_path = r.out_dir / (files.base_name + "-subtrack_summary.json");
      core::write_text(r.summary_path,
                       location_summary(r, files.base_name, cfg, run_id).dump(2) +
                           "\n");
    }
    emitter.phase_end(run_id, phase, r.location, "ok",
                      {{"out_dir", r.out_dir.string()}}, out);

    r.success = true;
    emitter.location_end(run_id, r.location, "ok",
                         {{"accepted", r.analysis.n_accepted},
                          {"rejected", r.analysis.n_rejected},
                          {"failed", r.analysis.n_failed}},
                         out);
  } catch (const std::exception &e) {
    r.success = false;
    r.error = e.what();
    emitter.phase_end(run_id, phase, r.location, "error", {{"error", r.error}}, out);
    emitter.error(run_id, r.location + ": " + r.error, out);
    emitter.location_end(run_id, r.location, "error", {{"error", r.error}}, out);
    std::cerr << "Error in location " << r.location << ": " << r.error
              << std::endl;
  }
  return r;
}

std::vector<fs::path> find_tracking_results(const fs::path &root,
                                            const config::Config &cfg) {
  return core::find_directories_named(root, cfg.input.tracking_result_dir);
}

BatchResult run_batch(const fs::path &root, const config::Config &cfg,
                      core::EventEmitter &emitter, const std::string &run_id,
                      std::ostream &out) {
  BatchResult batch;
  const std::vector<fs::path> folders = find_tracking_results(root, cfg);
  std::cout << "Found " << folders.size() << " '"
            << cfg.input.tracking_result_dir << "' folders under "
            << root.string() << std::endl;

  for (const auto &folder : folders) {
    LocationResult r = run_location(folder, cfg, emitter, run_id, out);
    if (r.success) {
      ++batch.n_succeeded;
    } else {
      ++batch.n_failed;
    }
    batch.locations.push_back(std::move(r));
  }
  return batch;
}

} // namespace cell_lineage::pipeline
