#include "cell_lineage/core/errors.hpp"
#include "cell_lineage/graph/track_graph.hpp"
#include "cell_lineage/lineage/decomposer.hpp"
#include "track_fixtures.hpp"

#include <catch2/catch_test_macros.hpp>

#include <set>

using cell_lineage::LineageTree;
using cell_lineage::MalformedTrackError;
using cell_lineage::MultipleRootsError;
using cell_lineage::SpotId;
using cell_lineage::UnsupportedMergeError;
using cell_lineage::graph::TrackGraph;
using cell_lineage::lineage::decompose_track;
using cell_lineage::test::add_chain;
using cell_lineage::test::make_edge;
using cell_lineage::test::make_spot;
using cell_lineage::test::TrackData;
using cell_lineage::test::two_division_track;

namespace {

LineageTree decompose(const TrackData &d, cell_lineage::TrackId track = 1) {
  return decompose_track(TrackGraph::build(track, d.spots, d.edges));
}

} // namespace

TEST_CASE("zero_split_track_is_one_root_subtrack") {
  TrackData d;
  add_chain(d, 1, 0, 25);
  auto tree = decompose(d);

  REQUIRE(tree.subtracks.size() == 1);
  const auto &s = tree.subtracks[0];
  REQUIRE(s.index == 1);
  REQUIRE(s.generation == 0);
  REQUIRE_FALSE(s.parent_index.has_value());
  REQUIRE_FALSE(s.split_frame.has_value());
  REQUIRE(s.spots.size() == 25);
  REQUIRE(s.spots.front() == 1);
  REQUIRE(s.spots.back() == 25);
  REQUIRE(s.path_from_root == std::vector<int>{1});
  REQUIRE(tree.edges.size() == 24);
}

TEST_CASE("single_spot_track_is_zero_edge_subtrack") {
  TrackData d;
  d.spots = {make_spot(5, 3, 0.0)};
  auto tree = decompose(d);

  REQUIRE(tree.subtracks.size() == 1);
  REQUIRE(tree.subtracks[0].n_edges() == 0);
  REQUIRE(tree.subtracks[0].start_frame == 3);
  REQUIRE(tree.subtracks[0].end_frame == 3);
  REQUIRE(tree.subtracks[0].duration() == 1);
  REQUIRE(tree.edges.empty());
}

TEST_CASE("two_divisions_yield_five_subtracks_in_preorder") {
  auto tree = decompose(two_division_track());
  REQUIRE(tree.subtracks.size() == 5);

  const auto &s1 = tree.subtracks[0];
  REQUIRE(s1.start_frame == 0);
  REQUIRE(s1.end_frame == 10);
  REQUIRE(s1.generation == 0);
  REQUIRE(s1.children == std::vector<int>{2, 3});

  const auto &s2 = tree.subtracks[1];
  REQUIRE(s2.start_frame == 11);
  REQUIRE(s2.end_frame == 93);
  REQUIRE(s2.generation == 1);
  REQUIRE(s2.parent_index.value() == 1);
  REQUIRE(s2.split_frame.value() == 10);
  REQUIRE(s2.children.empty());

  const auto &s3 = tree.subtracks[2];
  REQUIRE(s3.start_frame == 11);
  REQUIRE(s3.end_frame == 14);
  REQUIRE(s3.generation == 1);
  REQUIRE(s3.children == std::vector<int>{4, 5});

  const auto &s4 = tree.subtracks[3];
  const auto &s5 = tree.subtracks[4];
  REQUIRE(s4.start_frame == 15);
  REQUIRE(s5.start_frame == 15);
  REQUIRE(s4.end_frame == 20);
  REQUIRE(s5.end_frame == 18);
  REQUIRE(s4.generation == 2);
  REQUIRE(s5.generation == 2);
  REQUIRE(s4.parent_index.value() == 3);
  REQUIRE(s4.split_frame.value() == 14);
  REQUIRE(s5.path_from_root == std::vector<int>{1, 3, 5});
}

TEST_CASE("split_spot_stays_in_mother_subtrack") {
  auto tree = decompose(two_division_track());
  REQUIRE(tree.subtracks[0].spots.back() == 11);
  REQUIRE(tree.subtracks[1].spots.front() == 100);
  REQUIRE(tree.subtracks[2].spots.front() == 200);
}

TEST_CASE("every_spot_belongs_to_exactly_one_subtrack") {
  auto d = two_division_track();
  auto tree = decompose(d);

  std::multiset<SpotId> seen;
  for (const auto &s : tree.subtracks) {
    seen.insert(s.spots.begin(), s.spots.end());
  }
  REQUIRE(seen.size() == d.spots.size());
  for (const auto &spot : d.spots) {
    REQUIRE(seen.count(spot.id) == 1);
  }
}

TEST_CASE("division_edges_are_assigned_to_daughters") {
  auto d = two_division_track();
  auto tree = decompose(d);
  REQUIRE(tree.edges.size() == d.edges.size());

  int divisions = 0;
  for (const auto &a : tree.edges) {
    if (!a.division)
      continue;
    ++divisions;
    const auto &daughter = tree.subtracks[a.subtrack_index - 1];
    const auto &mother = tree.subtracks[*daughter.parent_index - 1];
    REQUIRE(a.edge.source == mother.spots.back());
    REQUIRE(a.edge.target == daughter.spots.front());
  }
  REQUIRE(divisions == 4);

  // Ordered by subtrack, then source frame.
  for (size_t i = 1; i < tree.edges.size(); ++i) {
    const auto &p = tree.edges[i - 1];
    const auto &c = tree.edges[i];
    REQUIRE((p.subtrack_index < c.subtrack_index ||
             (p.subtrack_index == c.subtrack_index &&
              p.source_frame < c.source_frame)));
  }
}

TEST_CASE("split_at_track_start_gives_zero_edge_root") {
  TrackData d;
  d.spots = {make_spot(1, 0, 0.0)};
  add_chain(d, 10, 1, 3, 1);
  add_chain(d, 20, 1, 3, 1);
  auto tree = decompose(d);

  REQUIRE(tree.subtracks.size() == 3);
  REQUIRE(tree.subtracks[0].n_edges() == 0);
  REQUIRE(tree.subtracks[1].spots.front() == 10);
  REQUIRE(tree.subtracks[2].spots.front() == 20);
}

TEST_CASE("three_way_split_keeps_child_order") {
  TrackData d;
  d.spots = {make_spot(1, 0, 0.0)};
  add_chain(d, 30, 2, 1, 1);
  add_chain(d, 20, 1, 1, 1);
  add_chain(d, 10, 1, 1, 1);
  auto tree = decompose(d);

  REQUIRE(tree.subtracks.size() == 4);
  REQUIRE(tree.subtracks[1].spots.front() == 10);
  REQUIRE(tree.subtracks[2].spots.front() == 20);
  REQUIRE(tree.subtracks[3].spots.front() == 30);
}

TEST_CASE("two_roots_raise_multiple_roots_error") {
  TrackData d;
  d.spots = {make_spot(1, 0, 0.0), make_spot(2, 0, 5.0), make_spot(3, 1, 1.0)};
  d.edges = {make_edge(1, 3)};
  REQUIRE_THROWS_AS(decompose(d), MultipleRootsError);
}

TEST_CASE("merge_raises_unsupported_merge_error") {
  // Single root that splits and rejoins.
  TrackData d;
  d.spots = {make_spot(1, 0, 0.0), make_spot(2, 1, 1.0), make_spot(3, 1, 2.0),
             make_spot(4, 2, 3.0)};
  d.edges = {make_edge(1, 2), make_edge(1, 3), make_edge(2, 4), make_edge(3, 4)};
  try {
    decompose(d, 9);
    FAIL("expected UnsupportedMergeError");
  } catch (const UnsupportedMergeError &e) {
    REQUIRE(e.track_id() == 9);
    REQUIRE(e.kind() == "UnsupportedMergeError");
  }
}

TEST_CASE("merging_roots_are_reported_as_multiple_roots") {
  TrackData d;
  d.spots = {make_spot(1, 0, 0.0), make_spot(2, 0, 5.0), make_spot(3, 1, 1.0)};
  d.edges = {make_edge(1, 3), make_edge(2, 3)};
  REQUIRE_THROWS_AS(decompose(d), MultipleRootsError);
}

TEST_CASE("malformed_track_never_reaches_decomposition") {
  TrackData d;
  add_chain(d, 1, 0, 3);
  d.edges.push_back(make_edge(1, 3));
  d.spots.push_back(make_spot(1, 5, 0.0));
  REQUIRE_THROWS_AS(decompose(d), MalformedTrackError);
}
