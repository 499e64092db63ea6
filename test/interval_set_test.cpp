#include "catch2/catch.hpp"

#include "mm/interval_set.hpp"

#include <algorithm>
#include <vector>

using namespace TRAILCOV::MM;

TEST_CASE("interval set", "[mm]")
{
  IntervalSet set;
  SECTION("disjoint_test")
  {
    set.insert(5, 6);
    set.insert(1, 2);
    REQUIRE(set.size() == 2);
    CHECK(set.get_intervals()[0] == Interval{1, 2});
    CHECK(set.get_intervals()[1] == Interval{5, 6});
    CHECK(set.covered_length() == Approx(2));
  }
  SECTION("overlap_merged_test")
  {
    set.insert(0, 6);
    set.insert(4, 10);
    REQUIRE(set.size() == 1);
    CHECK(set.covered_length() == Approx(10));
  }
  SECTION("reversed_bounds_test")
  {
    set.insert(3, 1);
    REQUIRE(set.get_intervals()[0] == Interval{1, 3});
  }
  SECTION("touching_intervals_test")
  {
    set.insert(0, 1);
    set.insert(1 + IntervalSet::MERGE_SLACK / 2, 2);
    set.insert(3, 4);
    REQUIRE(set.size() == 2);
    CHECK(set.get_intervals()[0].end == 2);
  }
  SECTION("bridge_test")
  {
    set.insert(0, 1);
    set.insert(2, 3);
    set.insert(4, 5);
    set.insert(0.5, 4.5);
    REQUIRE(set.size() == 1);
    CHECK(set.get_intervals()[0] == Interval{0, 5});
  }
  SECTION("nested_test")
  {
    set.insert(0, 10);
    set.insert(2, 3);
    REQUIRE(set.size() == 1);
    CHECK(set.covered_length() == Approx(10));
  }
  SECTION("clamp_test")
  {
    set.insert(-1, 2);
    set.insert(8, 12);
    set.insert(15, 16);
    set.clamp(0, 10);
    REQUIRE(set.size() == 2);
    CHECK(set.get_intervals()[0] == Interval{0, 2});
    CHECK(set.get_intervals()[1] == Interval{8, 10});
  }
}

TEST_CASE("interval set is independent of insertion order", "[mm]")
{
  std::vector<Interval> input{{7, 9}, {0, 2}, {1.5, 3}, {9, 9.5}, {5, 6}};
  IntervalSet reference;
  for (const Interval &iv : input)
    reference.insert(iv.start, iv.end);
  std::sort(input.begin(), input.end(),
            [](const Interval &a, const Interval &b)
            { return a.start < b.start; });
  do
  {
    IntervalSet set;
    for (const Interval &iv : input)
      set.insert(iv.start, iv.end);
    REQUIRE(set == reference);
  } while (std::next_permutation(input.begin(), input.end(),
                                 [](const Interval &a, const Interval &b)
                                 { return a.start < b.start; }));
  REQUIRE(reference.size() == 3);
  CHECK(reference.covered_length() == Approx(3 + 2.5 + 1));

  SECTION("merge_test")
  {
    IntervalSet a, b;
    a.insert(0, 2);
    a.insert(5, 6);
    b.insert(1.5, 3);
    b.insert(7, 9.5);
    a.merge(b);
    IntervalSet c;
    c.merge(b);
    c.insert(5, 6);
    c.insert(0, 2);
    REQUIRE(a == c);
    REQUIRE(a == reference);
  }
}
