#pragma once

#include <Eigen/Dense>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace cell_lineage {

using SpotId = int64_t;
using TrackId = int64_t;

// Positions are 3D; 2D data carries z = 0.
using Position = Eigen::Vector3d;

// Detected object at one timepoint
struct Spot {
    SpotId id = 0;
    TrackId track_id = 0;
    int frame = 0;
    double t = 0.0;                      // POSITION_T, frame index when absent
    Position position = Position::Zero();
    double quality = 0.0;                // NaN when absent
    std::map<std::string, double> channel_mean;  // "CH1" -> MEAN_INTENSITY_CH1
};

// Temporal link between two spots
struct Edge {
    SpotId source = 0;
    SpotId target = 0;
    TrackId track_id = 0;
    double displacement = 0.0;  // NaN in the input table means "derive from positions"
    double speed = 0.0;         // NaN in the input table means "derive from positions"
    std::optional<double> directional_change;  // undefined for the first edge of a chain
};

// Per-track summary used by the QC filter
struct TrackSummary {
    TrackId track_id = 0;
    int n_spots = 0;
    int n_edges = 0;
    int n_splits = 0;
    int n_merges = 0;
    int start_frame = 0;
    int stop_frame = 0;

    int duration() const { return stop_frame - start_frame + 1; }
};

// Maximal non-branching segment of a track
struct Subtrack {
    TrackId track_id = 0;
    int index = 0;                     // 1-based, pre-order within the track
    int generation = 0;
    std::optional<int> parent_index;   // empty for the root segment
    std::optional<int> split_frame;    // closing frame of the parent segment
    std::vector<SpotId> spots;         // ordered by frame
    std::vector<int> path_from_root;   // indices from the root segment to this one
    std::vector<int> children;
    int start_frame = 0;
    int end_frame = 0;

    int duration() const { return end_frame - start_frame + 1; }
    int n_edges() const { return spots.empty() ? 0 : static_cast<int>(spots.size()) - 1; }
};

// Edge with the subtrack it was assigned to
struct EdgeAssignment {
    Edge edge;
    int subtrack_index = 0;
    int source_frame = 0;
    int target_frame = 0;
    bool division = false;  // split spot -> first spot of a daughter segment
};

struct LineageTree {
    TrackId track_id = 0;
    std::vector<Subtrack> subtracks;       // ordered by index
    std::vector<EdgeAssignment> edges;     // ordered by (subtrack index, source frame)
};

// Processing stages, in data-flow order
enum class Phase {
    LOAD_TABLES = 0,
    ANALYZE_TRACKS = 1,   // graph, QC, decomposition and statistics per track
    WRITE_TABLES = 2,
    DONE = 3
};

inline std::string phase_to_string(Phase phase) {
    switch (phase) {
        case Phase::LOAD_TABLES: return "LOAD_TABLES";
        case Phase::ANALYZE_TRACKS: return "ANALYZE_TRACKS";
        case Phase::WRITE_TABLES: return "WRITE_TABLES";
        case Phase::DONE: return "DONE";
        default: return "UNKNOWN";
    }
}

inline int phase_to_int(Phase phase) {
    return static_cast<int>(phase);
}

// Subtrack identifier as it appears in the output tables
inline std::string subtrack_id(TrackId track_id, int index) {
    return "Track_" + std::to_string(track_id) + "_Sub_" + std::to_string(index);
}

} // namespace cell_lineage
