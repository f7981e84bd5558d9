#pragma once

#include "cell_lineage/core/types.hpp"

#include <unordered_map>
#include <vector>

namespace cell_lineage::graph {

/**
 * Directed temporal graph of one track.
 *
 * Children of every node are ordered by target frame, then target spot id.
 * Edges whose displacement or speed is NaN get them derived from the spot
 * positions and times. An edge without a directional change whose source has
 * a single incoming edge gets the turning angle (radians, [0, pi]) between
 * the two steps.
 */
class TrackGraph {
public:
    // Throws MalformedTrackError on dangling references, duplicate spots or
    // edges, and edges that do not advance in frame (which also rules out
    // cycles).
    static TrackGraph build(TrackId track_id, std::vector<Spot> spots, std::vector<Edge> edges);

    TrackId track_id() const { return track_id_; }
    size_t size() const { return nodes_.size(); }
    const std::vector<Edge>& edges() const { return edges_; }

    // Spot ids ordered by (frame, id)
    const std::vector<SpotId>& spot_ids() const { return order_; }

    const Spot& spot(SpotId id) const;
    const std::vector<SpotId>& children(SpotId id) const;
    int in_degree(SpotId id) const;

    // The edge source -> target; throws MalformedTrackError if absent.
    const Edge& edge(SpotId source, SpotId target) const;

    // Nodes without an incoming edge, in (frame, id) order
    std::vector<SpotId> roots() const;

    TrackSummary summary() const;

private:
    struct Node {
        Spot spot;
        std::vector<SpotId> children;
        std::vector<size_t> child_edges;  // index into edges_, parallel to children
        int in_degree = 0;
    };

    const Node& node(SpotId id) const;

    TrackId track_id_ = 0;
    std::unordered_map<SpotId, Node> nodes_;
    std::vector<SpotId> order_;
    std::vector<Edge> edges_;
};

} // namespace cell_lineage::graph
