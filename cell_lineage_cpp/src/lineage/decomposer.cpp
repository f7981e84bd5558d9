#include "cell_lineage/lineage/decomposer.hpp"
#include "cell_lineage/core/errors.hpp"

#include <optional>
#include <string>
#include <vector>

namespace cell_lineage::lineage {

namespace {

struct PendingSegment {
  SpotId start = 0;
  std::optional<int> parent_index;
  std::optional<int> split_frame;
  int generation = 0;
};

EdgeAssignment assign(const graph::TrackGraph &graph, SpotId source,
                      SpotId target, int subtrack_index, bool division) {
  EdgeAssignment a;
  a.edge = graph.edge(source, target);
  a.subtrack_index = subtrack_index;
  a.source_frame = graph.spot(source).frame;
  a.target_frame = graph.spot(target).frame;
  a.division = division;
  return a;
}

} // namespace

LineageTree decompose_track(const graph::TrackGraph &graph) {
  const TrackId track_id = graph.track_id();

  const std::vector<SpotId> roots = graph.roots();
  if (roots.empty()) {
    throw MalformedTrackError(track_id, "track has no root spot");
  }
  if (roots.size() > 1) {
    std::string ids;
    for (size_t i = 0; i < roots.size(); ++i) {
      if (i > 0)
        ids += ", ";
      ids += std::to_string(roots[i]);
    }
    throw MultipleRootsError(track_id, std::to_string(roots.size()) +
                                           " spots without predecessor (" +
                                           ids + ")");
  }

  LineageTree tree;
  tree.track_id = track_id;

  std::vector<PendingSegment> work;
  work.push_back(PendingSegment{roots.front(), std::nullopt, std::nullopt, 0});

  while (!work.empty()) {
    const PendingSegment pending = work.back();
    work.pop_back();

    Subtrack seg;
    seg.track_id = track_id;
    seg.index = static_cast<int>(tree.subtracks.size()) + 1;
    seg.generation = pending.generation;
    seg.parent_index = pending.parent_index;
    seg.split_frame = pending.split_frame;

    SpotId cur = pending.start;
    for (;;) {
      if (graph.in_degree(cur) >= 2) {
        throw UnsupportedMergeError(
            track_id, "spot " + std::to_string(cur) + " at frame " +
                          std::to_string(graph.spot(cur).frame) + " has " +
                          std::to_string(graph.in_degree(cur)) +
                          " incoming edges");
      }
      seg.spots.push_back(cur);
      const auto &kids = graph.children(cur);
      if (kids.size() != 1)
        break;
      cur = kids.front();
    }

    seg.start_frame = graph.spot(seg.spots.front()).frame;
    seg.end_frame = graph.spot(seg.spots.back()).frame;

    if (seg.parent_index) {
      Subtrack &parent = tree.subtracks[*seg.parent_index - 1];
      parent.children.push_back(seg.index);
      seg.path_from_root = parent.path_from_root;
      tree.edges.push_back(assign(graph, parent.spots.back(), seg.spots.front(),
                                  seg.index, true));
    }
    seg.path_from_root.push_back(seg.index);

    for (size_t i = 1; i < seg.spots.size(); ++i) {
      tree.edges.push_back(
          assign(graph, seg.spots[i - 1], seg.spots[i], seg.index, false));
    }

    // Reverse push so the first daughter is popped, and numbered, first.
    const auto &kids = graph.children(seg.spots.back());
    for (auto it = kids.rbegin(); it != kids.rend(); ++it) {
      work.push_back(PendingSegment{*it, seg.index, seg.end_frame,
                                    seg.generation + 1});
    }

    tree.subtracks.push_back(std::move(seg));
  }

  if (tree.edges.size() != graph.edges().size()) {
    throw MalformedTrackError(
        track_id, std::to_string(graph.edges().size() - tree.edges.size()) +
                      " edges not reachable from the root");
  }

  return tree;
}

} // namespace cell_lineage::lineage
