#include "catch2/catch.hpp"

#include "coverage/coverage_aggregator.hpp"

#include <stdexcept>

using namespace TRAILCOV;
using namespace TRAILCOV::NETWORK;
using namespace TRAILCOV::MM;
using namespace TRAILCOV::COVERAGE;

namespace
{
  PathContributions contribution(PathIndex index, double start, double end)
  {
    IntervalSet set;
    set.insert(start, end);
    return {PathContribution{index, set, set.covered_length()}};
  }
}

TEST_CASE("coverage aggregation", "[coverage]")
{
  CoverageAggregator aggregator;
  aggregator.reset({10.0, 4.0});
  REQUIRE(aggregator.get_path_count() == 2);
  CHECK_FALSE(aggregator.get_coverage(0).is_ridden);

  SECTION("overlapping_rides_test")
  {
    auto changed = aggregator.add_contributions(1, {100.0, 1}, contribution(0, 0, 6));
    REQUIRE(changed == std::vector<PathIndex>{0});
    aggregator.add_contributions(2, {200.0, 2}, contribution(0, 4, 10));
    const PathCoverage &coverage = aggregator.get_coverage(0);
    CHECK(coverage.coverage_fraction == Approx(1.0));
    CHECK(coverage.is_ridden);
    CHECK(coverage.ridden_length == Approx(10));
    CHECK(aggregator.get_covered_intervals(0).size() == 1);
    CHECK_FALSE(aggregator.get_coverage(1).is_ridden);
  }
  SECTION("removal_rederives_union_test")
  {
    aggregator.add_contributions(1, {100.0, 1}, contribution(0, 0, 6));
    aggregator.add_contributions(2, {200.0, 2}, contribution(0, 4, 10));
    auto changed = aggregator.remove_ride(2);
    REQUIRE(changed == std::vector<PathIndex>{0});
    CHECK(aggregator.get_coverage(0).coverage_fraction == Approx(0.6));
    CHECK(aggregator.get_coverage(0).last_ridden_ride == 1);
    CHECK_FALSE(aggregator.has_ride(2));

    CoverageAggregator fresh;
    fresh.reset({10.0, 4.0});
    fresh.add_contributions(1, {100.0, 1}, contribution(0, 0, 6));
    CHECK(fresh.get_coverage(0) == aggregator.get_coverage(0));
    CHECK(fresh.get_covered_intervals(0) == aggregator.get_covered_intervals(0));

    aggregator.remove_ride(1);
    CHECK(aggregator.get_coverage(0) == PathCoverage());
    CHECK(aggregator.remove_ride(1).empty());
  }
  SECTION("ride_without_contribution_test")
  {
    auto changed = aggregator.add_contributions(3, {std::nullopt, 1}, {});
    CHECK(changed.empty());
    CHECK(aggregator.has_ride(3));
    CHECK(aggregator.get_ride_paths(3).empty());
    CHECK(aggregator.get_ride_count() == 1);
  }
  SECTION("covered_twice_unchanged_test")
  {
    aggregator.add_contributions(1, {std::nullopt, 1}, contribution(1, 0, 4));
    auto changed = aggregator.add_contributions(2, {std::nullopt, 2}, contribution(1, 1, 3));
    CHECK(changed.empty());
    CHECK(aggregator.get_ride_paths(2) == std::vector<PathIndex>{1});
  }
  SECTION("unknown_path_test")
  {
    CHECK_THROWS_AS(aggregator.add_contributions(1, {std::nullopt, 1}, contribution(2, 0, 1)),
                    std::out_of_range);
  }
  SECTION("extend_test")
  {
    aggregator.add_contributions(1, {std::nullopt, 1}, contribution(0, 0, 5));
    aggregator.extend({2.0});
    REQUIRE(aggregator.get_path_count() == 3);
    CHECK(aggregator.get_coverage(0).coverage_fraction == Approx(0.5));
    aggregator.add_contributions(1, {std::nullopt, 1}, contribution(2, 0, 1));
    CHECK(aggregator.get_coverage(2).coverage_fraction == Approx(0.5));
    CHECK(aggregator.get_ride_paths(1) == std::vector<PathIndex>{0, 2});
  }
}

TEST_CASE("last ridden date", "[coverage]")
{
  CoverageAggregator aggregator;
  aggregator.reset({10.0});
  SECTION("latest_date_test")
  {
    aggregator.add_contributions(1, {300.0, 1}, contribution(0, 0, 1));
    aggregator.add_contributions(2, {100.0, 2}, contribution(0, 2, 3));
    CHECK(aggregator.get_coverage(0).last_ridden_date == 300.0);
    CHECK(aggregator.get_coverage(0).last_ridden_ride == 1);
  }
  SECTION("equal_dates_latest_upload_test")
  {
    aggregator.add_contributions(4, {200.0, 2}, contribution(0, 0, 1));
    aggregator.add_contributions(3, {200.0, 1}, contribution(0, 2, 3));
    CHECK(aggregator.get_coverage(0).last_ridden_ride == 4);
  }
  SECTION("unknown_dates_excluded_test")
  {
    aggregator.add_contributions(1, {std::nullopt, 1}, contribution(0, 0, 1));
    CHECK(aggregator.get_coverage(0).is_ridden);
    CHECK_FALSE(aggregator.get_coverage(0).last_ridden_date.has_value());
    aggregator.add_contributions(2, {50.0, 2}, contribution(0, 5, 6));
    CHECK(aggregator.get_coverage(0).last_ridden_date == 50.0);
    CHECK(aggregator.get_coverage(0).last_ridden_ride == 2);
  }
}
