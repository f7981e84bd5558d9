#include "cell_lineage/metrics/kinematics.hpp"
#include "cell_lineage/core/utils.hpp"

#include <algorithm>
#include <cmath>

namespace cell_lineage::metrics {

namespace {

std::optional<double> finite_mean(const std::vector<double>& values) {
    std::vector<double> finite;
    finite.reserve(values.size());
    for (double v : values) {
        if (std::isfinite(v)) finite.push_back(v);
    }
    if (finite.empty()) return std::nullopt;
    return core::mean_of(finite);
}

} // namespace

KinematicStats compute_kinematics(const std::vector<Spot>& spots,
                                  const std::vector<Edge>& edges,
                                  const std::vector<std::string>& channels) {
    KinematicStats k;
    k.n_spots = static_cast<int>(spots.size());
    k.n_edges = static_cast<int>(edges.size());
    if (spots.empty()) return k;

    k.duration = spots.back().frame - spots.front().frame + 1;
    k.start_position = spots.front().position;
    k.end_position = spots.back().position;

    Position sum = Position::Zero();
    for (const auto& s : spots) {
        sum += s.position;
        k.max_distance = std::max(k.max_distance, (s.position - k.start_position).norm());
    }
    k.mean_position = sum / static_cast<double>(spots.size());
    k.net_displacement = (k.end_position - k.start_position).norm();

    std::vector<double> speeds;
    std::vector<double> turns;
    for (const auto& e : edges) {
        if (std::isfinite(e.displacement)) k.total_distance += e.displacement;
        if (std::isfinite(e.speed)) speeds.push_back(e.speed);
        if (e.directional_change && std::isfinite(*e.directional_change)) {
            turns.push_back(*e.directional_change);
        }
    }

    if (!speeds.empty()) {
        k.speed_mean = core::mean_of(speeds);
        k.speed_max = *std::max_element(speeds.begin(), speeds.end());
        k.speed_min = *std::min_element(speeds.begin(), speeds.end());
        k.speed_median = core::median_of(speeds);
        k.speed_std = core::stddev_of(speeds);
    }

    if (k.total_distance > 0.0) {
        k.confinement_ratio = k.net_displacement / k.total_distance;
        k.outreach_ratio = k.max_distance / k.total_distance;
    }
    k.linearity_of_forward_progression = k.confinement_ratio;
    k.mean_straight_line_speed = k.net_displacement / static_cast<double>(k.duration);

    if (k.net_displacement > 0.0) {
        k.tortuosity = k.total_distance / k.net_displacement;
    }

    // A single edge has no preceding direction to turn from.
    if (edges.size() >= 2 && !turns.empty()) {
        k.mean_directional_change_rate = core::mean_of(turns);
    }

    std::vector<double> quality;
    quality.reserve(spots.size());
    for (const auto& s : spots) quality.push_back(s.quality);
    k.mean_quality = finite_mean(quality);

    for (const auto& ch : channels) {
        std::vector<double> values;
        values.reserve(spots.size());
        for (const auto& s : spots) {
            auto it = s.channel_mean.find(ch);
            if (it != s.channel_mean.end()) values.push_back(it->second);
        }
        k.mean_intensity[ch] = finite_mean(values);
    }

    return k;
}

std::vector<SubtrackStatistics> compute_lineage_statistics(
    const graph::TrackGraph& graph, const LineageTree& tree,
    const std::vector<std::string>& channels) {
    std::vector<std::vector<Edge>> internal(tree.subtracks.size());
    for (const auto& a : tree.edges) {
        if (a.division) continue;
        internal[static_cast<size_t>(a.subtrack_index - 1)].push_back(a.edge);
    }

    std::vector<SubtrackStatistics> out;
    out.reserve(tree.subtracks.size());
    for (size_t i = 0; i < tree.subtracks.size(); ++i) {
        const Subtrack& seg = tree.subtracks[i];

        std::vector<Spot> spots;
        spots.reserve(seg.spots.size());
        for (SpotId id : seg.spots) spots.push_back(graph.spot(id));

        SubtrackStatistics st;
        st.track_id = seg.track_id;
        st.index = seg.index;
        st.generation = seg.generation;
        st.parent_index = seg.parent_index;
        st.start_frame = seg.start_frame;
        st.end_frame = seg.end_frame;
        st.kinematics = compute_kinematics(spots, internal[i], channels);
        out.push_back(std::move(st));
    }
    return out;
}

} // namespace cell_lineage::metrics
