#pragma once

#include "cell_lineage/core/types.hpp"
#include "cell_lineage/graph/track_graph.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace cell_lineage::metrics {

// Motility descriptors of one subtrack. An empty optional is an undefined
// value and is written as the configured missing marker.
struct KinematicStats {
    int n_spots = 0;
    int n_edges = 0;
    int duration = 0;                    // end_frame - start_frame + 1

    double net_displacement = 0.0;
    double total_distance = 0.0;
    double max_distance = 0.0;

    std::optional<double> speed_mean;
    std::optional<double> speed_max;
    std::optional<double> speed_min;
    std::optional<double> speed_median;
    std::optional<double> speed_std;     // population

    double confinement_ratio = 0.0;
    double linearity_of_forward_progression = 0.0;
    double mean_straight_line_speed = 0.0;
    std::optional<double> mean_directional_change_rate;
    double outreach_ratio = 0.0;
    std::optional<double> tortuosity;

    Position mean_position = Position::Zero();
    Position start_position = Position::Zero();
    Position end_position = Position::Zero();

    std::optional<double> mean_quality;
    std::map<std::string, std::optional<double>> mean_intensity;  // per channel
};

struct SubtrackStatistics {
    TrackId track_id = 0;
    int index = 0;
    int generation = 0;
    std::optional<int> parent_index;
    int start_frame = 0;
    int end_frame = 0;
    KinematicStats kinematics;
};

/**
 * Kinematics of one segment from its spots (in frame order) and its internal
 * edges. The division edge leading into a daughter segment must not be
 * passed. Non-finite edge values are ignored; zero denominators give 0 for
 * the ratios and an undefined tortuosity.
 */
KinematicStats compute_kinematics(const std::vector<Spot>& spots,
                                  const std::vector<Edge>& edges,
                                  const std::vector<std::string>& channels);

// Statistics for every subtrack of a decomposed track, in index order.
std::vector<SubtrackStatistics> compute_lineage_statistics(
    const graph::TrackGraph& graph, const LineageTree& tree,
    const std::vector<std::string>& channels);

} // namespace cell_lineage::metrics
