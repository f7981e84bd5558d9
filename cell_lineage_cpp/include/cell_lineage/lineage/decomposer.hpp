#pragma once

#include "cell_lineage/core/types.hpp"
#include "cell_lineage/graph/track_graph.hpp"

namespace cell_lineage::lineage {

/**
 * Partition a track into maximal non-branching subtracks.
 *
 * Segments are numbered 1..n in pre-order: a segment gets its index before
 * any of its daughters, and daughters are visited in the graph's child order.
 * The split spot closes the mother segment; each daughter starts at the spot
 * following the split. The edge crossing the split is assigned to the
 * daughter with division = true.
 *
 * Throws MalformedTrackError when the track has no root, MultipleRootsError
 * when it has more than one, UnsupportedMergeError when a spot with two or
 * more incoming edges is reached.
 */
LineageTree decompose_track(const graph::TrackGraph &graph);

} // namespace cell_lineage::lineage
