#include "cell_lineage/graph/track_graph.hpp"
#include "cell_lineage/core/errors.hpp"

#include <algorithm>
#include <cmath>
#include <set>
#include <string>
#include <utility>

namespace cell_lineage::graph {

namespace {

std::string edge_label(const Edge& e) {
    return std::to_string(e.source) + " -> " + std::to_string(e.target);
}

// Absolute change of heading in the xy plane, in [0, pi].
double turning_angle(const Position& a, const Position& b, const Position& c) {
    const double h1 = std::atan2(b.y() - a.y(), b.x() - a.x());
    const double h2 = std::atan2(c.y() - b.y(), c.x() - b.x());
    double d = std::fabs(h2 - h1);
    if (d > M_PI) d = 2.0 * M_PI - d;
    return d;
}

} // namespace

TrackGraph TrackGraph::build(TrackId track_id, std::vector<Spot> spots, std::vector<Edge> edges) {
    if (spots.empty()) {
        throw MalformedTrackError(track_id, "track has no spots");
    }

    TrackGraph g;
    g.track_id_ = track_id;
    g.nodes_.reserve(spots.size());

    for (auto& s : spots) {
        const SpotId id = s.id;
        Node n;
        n.spot = std::move(s);
        if (!g.nodes_.emplace(id, std::move(n)).second) {
            throw MalformedTrackError(track_id, "duplicate spot " + std::to_string(id));
        }
    }

    std::set<std::pair<SpotId, SpotId>> seen;
    for (auto& e : edges) {
        auto src = g.nodes_.find(e.source);
        if (src == g.nodes_.end()) {
            throw MalformedTrackError(track_id, "edge " + edge_label(e) + " references spot " +
                                                    std::to_string(e.source) +
                                                    " absent from the spot table");
        }
        auto dst = g.nodes_.find(e.target);
        if (dst == g.nodes_.end()) {
            throw MalformedTrackError(track_id, "edge " + edge_label(e) + " references spot " +
                                                    std::to_string(e.target) +
                                                    " absent from the spot table");
        }
        if (!seen.emplace(e.source, e.target).second) {
            throw MalformedTrackError(track_id, "duplicate edge " + edge_label(e));
        }

        const Spot& a = src->second.spot;
        const Spot& b = dst->second.spot;
        if (b.frame <= a.frame) {
            throw MalformedTrackError(track_id, "edge " + edge_label(e) +
                                                    " does not advance in time (frame " +
                                                    std::to_string(a.frame) + " -> " +
                                                    std::to_string(b.frame) + ")");
        }

        if (!std::isfinite(e.displacement)) {
            e.displacement = (b.position - a.position).norm();
        }
        if (!std::isfinite(e.speed)) {
            double dt = b.t - a.t;
            if (!(dt > 0.0)) {
                dt = static_cast<double>(b.frame - a.frame);
            }
            e.speed = e.displacement / dt;
        }
        e.track_id = track_id;
    }
    g.edges_ = std::move(edges);

    for (size_t i = 0; i < g.edges_.size(); ++i) {
        const Edge& e = g.edges_[i];
        g.nodes_.at(e.source).child_edges.push_back(i);
        g.nodes_.at(e.target).in_degree += 1;
    }

    for (auto& [id, n] : g.nodes_) {
        auto key = [&g](size_t edge_idx) {
            const Spot& t = g.nodes_.at(g.edges_[edge_idx].target).spot;
            return std::make_pair(t.frame, t.id);
        };
        std::sort(n.child_edges.begin(), n.child_edges.end(),
                  [&key](size_t a, size_t b) { return key(a) < key(b); });
        n.children.clear();
        for (size_t idx : n.child_edges) {
            n.children.push_back(g.edges_[idx].target);
        }
    }

    g.order_.reserve(g.nodes_.size());
    for (const auto& [id, n] : g.nodes_) {
        g.order_.push_back(id);
    }
    std::sort(g.order_.begin(), g.order_.end(), [&g](SpotId a, SpotId b) {
        const Spot& sa = g.nodes_.at(a).spot;
        const Spot& sb = g.nodes_.at(b).spot;
        return std::make_pair(sa.frame, sa.id) < std::make_pair(sb.frame, sb.id);
    });

    // Edges leaving a spot with exactly one predecessor get their turning
    // angle from that predecessor when the table gave none.
    std::unordered_map<SpotId, size_t> incoming;
    for (size_t i = 0; i < g.edges_.size(); ++i) {
        incoming[g.edges_[i].target] = i;
    }
    for (auto& e : g.edges_) {
        if (e.directional_change) continue;
        if (g.nodes_.at(e.source).in_degree != 1) continue;
        const Edge& prev = g.edges_[incoming.at(e.source)];
        e.directional_change = turning_angle(g.nodes_.at(prev.source).spot.position,
                                             g.nodes_.at(e.source).spot.position,
                                             g.nodes_.at(e.target).spot.position);
    }

    return g;
}

const TrackGraph::Node& TrackGraph::node(SpotId id) const {
    auto it = nodes_.find(id);
    if (it == nodes_.end()) {
        throw MalformedTrackError(track_id_, "unknown spot " + std::to_string(id));
    }
    return it->second;
}

const Spot& TrackGraph::spot(SpotId id) const {
    return node(id).spot;
}

const std::vector<SpotId>& TrackGraph::children(SpotId id) const {
    return node(id).children;
}

int TrackGraph::in_degree(SpotId id) const {
    return node(id).in_degree;
}

const Edge& TrackGraph::edge(SpotId source, SpotId target) const {
    const Node& n = node(source);
    for (size_t i = 0; i < n.children.size(); ++i) {
        if (n.children[i] == target) {
            return edges_[n.child_edges[i]];
        }
    }
    throw MalformedTrackError(track_id_, "no edge " + std::to_string(source) + " -> " +
                                             std::to_string(target));
}

std::vector<SpotId> TrackGraph::roots() const {
    std::vector<SpotId> out;
    for (SpotId id : order_) {
        if (nodes_.at(id).in_degree == 0) out.push_back(id);
    }
    return out;
}

TrackSummary TrackGraph::summary() const {
    TrackSummary s;
    s.track_id = track_id_;
    s.n_spots = static_cast<int>(nodes_.size());
    s.n_edges = static_cast<int>(edges_.size());
    for (const auto& [id, n] : nodes_) {
        if (n.children.size() >= 2) ++s.n_splits;
        if (n.in_degree >= 2) ++s.n_merges;
    }
    if (!order_.empty()) {
        s.start_frame = nodes_.at(order_.front()).spot.frame;
        s.stop_frame = nodes_.at(order_.back()).spot.frame;
    }
    return s;
}

} // namespace cell_lineage::graph
