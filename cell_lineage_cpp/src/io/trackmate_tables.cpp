#include "cell_lineage/io/trackmate_tables.hpp"
#include "cell_lineage/core/errors.hpp"
#include "cell_lineage/core/utils.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <optional>
#include <utility>

namespace cell_lineage::io {

namespace {

constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

const std::string kAllSpotsSuffix = "-all-spots.csv";
const std::string kSpotsSuffix = "-spots.csv";
const std::string kIntensityPrefix = "MEAN_INTENSITY_CH";

std::vector<fs::path> files_with_suffix(const fs::path& folder, const std::string& suffix) {
    std::vector<fs::path> out;
    for (const auto& entry : fs::directory_iterator(folder)) {
        if (!entry.is_regular_file()) continue;
        const std::string name = entry.path().filename().string();
        if (name.size() > suffix.size() && core::ends_with(name, suffix)) {
            out.push_back(entry.path());
        }
    }
    std::sort(out.begin(), out.end());
    return out;
}

double optional_cell(const CsvRow& row, const std::optional<size_t>& col) {
    if (!col) return kNaN;
    auto v = core::parse_double(row[*col]);
    return v ? *v : kNaN;
}

std::string row_context(const std::string& table, size_t row_idx) {
    // +2: one for the header line, one for 1-based numbering
    return table + " line " + std::to_string(row_idx + 2);
}

} // namespace

TrackmateFiles discover_trackmate_files(const fs::path& folder) {
    if (!fs::exists(folder) || !fs::is_directory(folder)) {
        throw InputTableError("folder not found: " + folder.string());
    }

    TrackmateFiles files;
    files.folder = folder;

    auto candidates = files_with_suffix(folder, kAllSpotsSuffix);
    std::string suffix = kAllSpotsSuffix;
    if (candidates.empty()) {
        candidates = files_with_suffix(folder, kSpotsSuffix);
        suffix = kSpotsSuffix;
    }
    if (candidates.empty()) {
        throw InputTableError("no spots table (*" + kSpotsSuffix + ") in " + folder.string());
    }

    const std::string name = candidates.front().filename().string();
    files.base_name = name.substr(0, name.size() - suffix.size());
    files.spots = candidates.front();
    files.edges = folder / (files.base_name + "-edges.csv");
    if (!fs::exists(files.edges)) {
        throw InputTableError("edges table not found: " + files.edges.string());
    }

    fs::path tracks = folder / (files.base_name + "-tracks.csv");
    if (fs::exists(tracks)) {
        files.tracks = tracks;
    }
    return files;
}

std::map<SpotId, Spot> parse_spots(const CsvTable& table, std::vector<std::string>& channels,
                                   int& untracked) {
    const std::string name = "spots table";
    const size_t c_id = table.require_column("ID", name);
    const size_t c_track = table.require_column("TRACK_ID", name);
    const size_t c_frame = table.require_column("FRAME", name);
    const size_t c_x = table.require_column("POSITION_X", name);
    const size_t c_y = table.require_column("POSITION_Y", name);
    const auto c_z = table.column("POSITION_Z");
    const auto c_t = table.column("POSITION_T");
    const auto c_quality = table.column("QUALITY");

    std::vector<std::pair<int, size_t>> channel_cols;
    for (size_t i = 0; i < table.header.size(); ++i) {
        const std::string& h = table.header[i];
        if (!core::starts_with(h, kIntensityPrefix)) continue;
        auto n = core::parse_int(h.substr(kIntensityPrefix.size()));
        if (n && *n > 0) {
            channel_cols.emplace_back(static_cast<int>(*n), i);
        }
    }
    std::sort(channel_cols.begin(), channel_cols.end());
    channels.clear();
    for (const auto& [n, col] : channel_cols) {
        channels.push_back("CH" + std::to_string(n));
    }

    std::map<SpotId, Spot> spots;
    untracked = 0;
    for (size_t r = 0; r < table.rows.size(); ++r) {
        const CsvRow& row = table.rows[r];

        // TrackMate writes feature names, short names and units below the header.
        auto id = core::parse_int(row[c_id]);
        if (!id) continue;

        auto track = core::parse_int(row[c_track]);
        if (!track) {
            ++untracked;
            continue;
        }

        auto frame = core::parse_int(row[c_frame]);
        auto x = core::parse_double(row[c_x]);
        auto y = core::parse_double(row[c_y]);
        if (!frame || !x || !y) {
            throw InputTableError(row_context(name, r) + ": spot " + std::to_string(*id) +
                                  " has no numeric FRAME/POSITION_X/POSITION_Y");
        }
        if (*frame < std::numeric_limits<int>::min() || *frame > std::numeric_limits<int>::max()) {
            throw InputTableError(row_context(name, r) + ": spot " + std::to_string(*id) +
                                  " has FRAME " + std::to_string(*frame) + " out of range");
        }

        Spot s;
        s.id = *id;
        s.track_id = *track;
        s.frame = static_cast<int>(*frame);
        const double z = optional_cell(row, c_z);
        s.position = Position(*x, *y, std::isfinite(z) ? z : 0.0);
        const double t = optional_cell(row, c_t);
        s.t = std::isfinite(t) ? t : static_cast<double>(s.frame);
        s.quality = optional_cell(row, c_quality);
        for (size_t k = 0; k < channel_cols.size(); ++k) {
            s.channel_mean[channels[k]] = optional_cell(row, channel_cols[k].second);
        }

        if (!spots.emplace(s.id, std::move(s)).second) {
            throw InputTableError(row_context(name, r) + ": duplicate spot ID " +
                                  std::to_string(*id));
        }
    }
    return spots;
}

std::vector<Edge> parse_edges(const CsvTable& table, const std::map<SpotId, Spot>& spots,
                              int& unassigned) {
    const std::string name = "edges table";
    const size_t c_source = table.require_column("SPOT_SOURCE_ID", name);
    const size_t c_target = table.require_column("SPOT_TARGET_ID", name);
    const auto c_track = table.column("TRACK_ID");
    const auto c_disp = table.column("DISPLACEMENT");
    const auto c_speed = table.column("SPEED");
    const auto c_dir = table.column("DIRECTIONAL_CHANGE_RATE");

    std::vector<Edge> edges;
    unassigned = 0;
    for (size_t r = 0; r < table.rows.size(); ++r) {
        const CsvRow& row = table.rows[r];

        auto source = core::parse_int(row[c_source]);
        if (!source) continue;
        auto target = core::parse_int(row[c_target]);
        if (!target) {
            throw InputTableError(row_context(name, r) + ": non-numeric SPOT_TARGET_ID");
        }

        std::optional<int64_t> track;
        if (c_track) {
            track = core::parse_int(row[*c_track]);
        }
        if (!track) {
            auto it = spots.find(*source);
            if (it == spots.end()) it = spots.find(*target);
            if (it != spots.end()) track = it->second.track_id;
        }
        if (!track) {
            ++unassigned;
            continue;
        }

        Edge e;
        e.source = *source;
        e.target = *target;
        e.track_id = *track;
        e.displacement = optional_cell(row, c_disp);
        e.speed = optional_cell(row, c_speed);
        const double dir = optional_cell(row, c_dir);
        if (std::isfinite(dir)) {
            e.directional_change = dir;
        }
        edges.push_back(e);
    }
    return edges;
}

LocationTables tables_from_csv(const CsvTable& spots, const CsvTable& edges) {
    LocationTables out;
    out.spots = parse_spots(spots, out.channels, out.untracked_spots);
    out.edges = parse_edges(edges, out.spots, out.unassigned_edges);
    return out;
}

LocationTables load_location_tables(const TrackmateFiles& files) {
    return tables_from_csv(read_csv(files.spots), read_csv(files.edges));
}

} // namespace cell_lineage::io
