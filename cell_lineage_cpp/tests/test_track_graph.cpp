#include "cell_lineage/core/errors.hpp"
#include "cell_lineage/graph/track_graph.hpp"
#include "cell_lineage/io/csv.hpp"
#include "cell_lineage/io/trackmate_tables.hpp"
#include "cell_lineage/lineage/decomposer.hpp"
#include "cell_lineage/metrics/kinematics.hpp"
#include "track_fixtures.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <cmath>

using cell_lineage::MalformedTrackError;
using cell_lineage::SpotId;
using cell_lineage::graph::TrackGraph;
using cell_lineage::test::add_chain;
using cell_lineage::test::make_edge;
using cell_lineage::test::make_spot;
using cell_lineage::test::TrackData;
using cell_lineage::test::two_division_track;

TEST_CASE("graph_orders_children_by_frame_then_id") {
  TrackData d;
  d.spots = {make_spot(1, 0, 0.0), make_spot(5, 2, 1.0), make_spot(3, 1, 1.0),
             make_spot(4, 1, 2.0)};
  d.edges = {make_edge(1, 5), make_edge(1, 4), make_edge(1, 3)};

  auto g = TrackGraph::build(1, d.spots, d.edges);
  REQUIRE(g.children(1) == std::vector<SpotId>{3, 4, 5});
  REQUIRE(g.in_degree(1) == 0);
  REQUIRE(g.in_degree(4) == 1);
  REQUIRE(g.roots() == std::vector<SpotId>{1});
  REQUIRE(g.spot_ids() == std::vector<SpotId>{1, 3, 4, 5});
}

TEST_CASE("graph_derives_missing_displacement_and_speed") {
  TrackData d;
  d.spots = {make_spot(1, 0, 0.0, 0.0), make_spot(2, 2, 3.0, 4.0)};
  d.spots[1].t = 10.0;
  d.edges = {make_edge(1, 2)};

  auto g = TrackGraph::build(1, d.spots, d.edges);
  const auto &e = g.edge(1, 2);
  REQUIRE(e.displacement == Catch::Approx(5.0));
  REQUIRE(e.speed == Catch::Approx(0.5));
}

TEST_CASE("graph_speed_falls_back_to_frame_difference") {
  TrackData d;
  d.spots = {make_spot(1, 0, 0.0), make_spot(2, 4, 8.0)};
  d.spots[0].t = 0.0;
  d.spots[1].t = 0.0;
  d.edges = {make_edge(1, 2)};

  auto g = TrackGraph::build(1, d.spots, d.edges);
  REQUIRE(g.edge(1, 2).speed == Catch::Approx(2.0));
}

TEST_CASE("graph_keeps_given_edge_values") {
  TrackData d;
  d.spots = {make_spot(1, 0, 0.0), make_spot(2, 1, 1.0)};
  d.edges = {make_edge(1, 2)};
  d.edges[0].displacement = 7.0;
  d.edges[0].speed = 3.5;

  auto g = TrackGraph::build(1, d.spots, d.edges);
  REQUIRE(g.edge(1, 2).displacement == Catch::Approx(7.0));
  REQUIRE(g.edge(1, 2).speed == Catch::Approx(3.5));
}

TEST_CASE("graph_summary_counts_splits_and_frames") {
  auto d = two_division_track();
  auto g = TrackGraph::build(1, d.spots, d.edges);
  auto s = g.summary();
  REQUIRE(s.n_spots == 108);
  REQUIRE(s.n_edges == 107);
  REQUIRE(s.n_splits == 2);
  REQUIRE(s.n_merges == 0);
  REQUIRE(s.start_frame == 0);
  REQUIRE(s.stop_frame == 93);
  REQUIRE(s.duration() == 94);
}

TEST_CASE("graph_summary_counts_merges") {
  TrackData d;
  d.spots = {make_spot(1, 0, 0.0), make_spot(2, 0, 5.0), make_spot(3, 1, 2.0)};
  d.edges = {make_edge(1, 3), make_edge(2, 3)};

  auto g = TrackGraph::build(1, d.spots, d.edges);
  REQUIRE(g.summary().n_merges == 1);
  REQUIRE(g.roots().size() == 2);
}

TEST_CASE("graph_rejects_dangling_spot_reference") {
  TrackData d;
  add_chain(d, 1, 0, 3);
  d.edges.push_back(make_edge(3, 99));
  REQUIRE_THROWS_AS(TrackGraph::build(1, d.spots, d.edges), MalformedTrackError);
}

TEST_CASE("graph_rejects_edge_that_does_not_advance") {
  TrackData d;
  d.spots = {make_spot(1, 3, 0.0), make_spot(2, 3, 1.0)};
  d.edges = {make_edge(1, 2)};
  REQUIRE_THROWS_AS(TrackGraph::build(1, d.spots, d.edges), MalformedTrackError);

  d.spots[1].frame = 2;
  REQUIRE_THROWS_AS(TrackGraph::build(1, d.spots, d.edges), MalformedTrackError);
}

TEST_CASE("graph_rejects_duplicate_edge") {
  TrackData d;
  add_chain(d, 1, 0, 2);
  d.edges.push_back(make_edge(1, 2));
  REQUIRE_THROWS_AS(TrackGraph::build(1, d.spots, d.edges), MalformedTrackError);
}

TEST_CASE("graph_rejects_empty_track") {
  REQUIRE_THROWS_AS(TrackGraph::build(7, {}, {}), MalformedTrackError);
}

TEST_CASE("graph_error_carries_track_id") {
  TrackData d;
  add_chain(d, 1, 0, 2);
  d.edges.push_back(make_edge(2, 1));
  try {
    TrackGraph::build(42, d.spots, d.edges);
    FAIL("expected MalformedTrackError");
  } catch (const MalformedTrackError &e) {
    REQUIRE(e.track_id() == 42);
    REQUIRE(e.kind() == "MalformedTrackError");
  }
}

TEST_CASE("graph_rejects_two_spot_cycle") {
  TrackData d;
  d.spots = {make_spot(1, 0, 0.0), make_spot(2, 1, 1.0)};
  d.edges = {make_edge(1, 2), make_edge(2, 1)};
  REQUIRE_THROWS_AS(TrackGraph::build(1, d.spots, d.edges), MalformedTrackError);
}

TEST_CASE("graph_derives_turning_angle_from_predecessor_edge") {
  TrackData d;
  d.spots = {make_spot(1, 0, 0.0, 0.0), make_spot(2, 1, 1.0, 0.0),
             make_spot(3, 2, 1.0, 1.0), make_spot(4, 3, 2.0, 1.0),
             make_spot(5, 4, 1.0, 1.0)};
  d.edges = {make_edge(1, 2), make_edge(2, 3), make_edge(3, 4), make_edge(4, 5)};
  d.edges[3].directional_change = 0.25;

  auto g = TrackGraph::build(1, d.spots, d.edges);
  REQUIRE_FALSE(g.edge(1, 2).directional_change.has_value());
  REQUIRE(g.edge(2, 3).directional_change.value() == Catch::Approx(M_PI / 2.0));
  REQUIRE(g.edge(3, 4).directional_change.value() == Catch::Approx(M_PI / 2.0));
  REQUIRE(g.edge(4, 5).directional_change.value() == Catch::Approx(0.25));
}

TEST_CASE("graph_turning_angle_wraps_across_negative_x_axis") {
  // heading 170 degrees then -170 degrees is a 20 degree turn
  const double a = 170.0 * M_PI / 180.0;
  TrackData d;
  d.spots = {make_spot(1, 0, 0.0, 0.0),
             make_spot(2, 1, std::cos(a), std::sin(a)),
             make_spot(3, 2, 2.0 * std::cos(a), 0.0)};
  d.edges = {make_edge(1, 2), make_edge(2, 3)};

  auto g = TrackGraph::build(1, d.spots, d.edges);
  REQUIRE(g.edge(2, 3).directional_change.value() ==
          Catch::Approx(20.0 * M_PI / 180.0));
}

TEST_CASE("graph_daughter_turning_angle_follows_division_edge") {
  TrackData d;
  d.spots = {make_spot(1, 0, 0.0, 0.0), make_spot(2, 1, 1.0, 0.0),
             make_spot(3, 2, 2.0, 0.0), make_spot(4, 2, 1.0, 1.0),
             make_spot(5, 3, 1.0, 2.0)};
  d.edges = {make_edge(1, 2), make_edge(2, 3), make_edge(2, 4), make_edge(4, 5)};

  auto g = TrackGraph::build(1, d.spots, d.edges);
  REQUIRE(g.edge(2, 3).directional_change.value() == Catch::Approx(0.0));
  REQUIRE(g.edge(2, 4).directional_change.value() == Catch::Approx(M_PI / 2.0));
  REQUIRE(g.edge(4, 5).directional_change.value() == Catch::Approx(0.0));
}

TEST_CASE("curved_track_without_directional_column_has_mean_turn") {
  const std::string spots = "ID,TRACK_ID,FRAME,POSITION_X,POSITION_Y\n"
                            "1,0,0,0,0\n"
                            "2,0,1,1,0\n"
                            "3,0,2,1,1\n"
                            "4,0,3,0,1\n";
  const std::string edges = "TRACK_ID,SPOT_SOURCE_ID,SPOT_TARGET_ID\n"
                            "0,1,2\n"
                            "0,2,3\n"
                            "0,3,4\n";
  auto tables = cell_lineage::io::tables_from_csv(cell_lineage::io::parse_csv(spots),
                                                  cell_lineage::io::parse_csv(edges));
  std::vector<cell_lineage::Spot> track_spots;
  for (const auto &[id, s] : tables.spots)
    track_spots.push_back(s);
  REQUIRE_FALSE(tables.edges.front().directional_change.has_value());

  auto g = TrackGraph::build(0, track_spots, tables.edges);
  auto tree = cell_lineage::lineage::decompose_track(g);
  auto stats = cell_lineage::metrics::compute_lineage_statistics(g, tree, {});
  REQUIRE(stats.size() == 1);
  REQUIRE(stats[0].kinematics.mean_directional_change_rate.value() ==
          Catch::Approx(M_PI / 2.0));
}
