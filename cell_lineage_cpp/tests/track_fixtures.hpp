#pragma once

#include "cell_lineage/core/types.hpp"

#include <limits>
#include <vector>

namespace cell_lineage::test {

inline Spot make_spot(SpotId id, int frame, double x, double y = 0.0,
                      TrackId track = 1) {
  Spot s;
  s.id = id;
  s.track_id = track;
  s.frame = frame;
  s.t = static_cast<double>(frame);
  s.position = Position(x, y, 0.0);
  s.quality = 1.0;
  return s;
}

// Displacement and speed left undefined so the graph derives them.
inline Edge make_edge(SpotId source, SpotId target, TrackId track = 1) {
  Edge e;
  e.source = source;
  e.target = target;
  e.track_id = track;
  e.displacement = std::numeric_limits<double>::quiet_NaN();
  e.speed = std::numeric_limits<double>::quiet_NaN();
  return e;
}

struct TrackData {
  std::vector<Spot> spots;
  std::vector<Edge> edges;
};

// Appends `n` spots with ids first_id.. at frames first_frame.., moving one
// unit along x per frame, chained by edges. Links the first new spot to
// `from` when from >= 0.
inline void add_chain(TrackData &d, SpotId first_id, int first_frame, int n,
                      SpotId from = -1, TrackId track = 1) {
  for (int i = 0; i < n; ++i) {
    const SpotId id = first_id + i;
    d.spots.push_back(make_spot(id, first_frame + i,
                                static_cast<double>(first_frame + i), 0.0, track));
    if (i == 0) {
      if (from >= 0)
        d.edges.push_back(make_edge(from, id, track));
    } else {
      d.edges.push_back(make_edge(id - 1, id, track));
    }
  }
}

// Two divisions:
//   Sub_1 spots 1..11    frames 0-10  (splits at spot 11)
//   Sub_2 spots 100..182 frames 11-93
//   Sub_3 spots 200..203 frames 11-14 (splits at spot 203)
//   Sub_4 spots 300..305 frames 15-20
//   Sub_5 spots 400..403 frames 15-18
inline TrackData two_division_track(TrackId track = 1) {
  TrackData d;
  add_chain(d, 1, 0, 11, -1, track);
  add_chain(d, 100, 11, 83, 11, track);
  add_chain(d, 200, 11, 4, 11, track);
  add_chain(d, 300, 15, 6, 203, track);
  add_chain(d, 400, 15, 4, 203, track);
  return d;
}

} // namespace cell_lineage::test
