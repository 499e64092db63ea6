#include "catch2/catch.hpp"

#include "coverage/statistics.hpp"

using namespace TRAILCOV;
using namespace TRAILCOV::COVERAGE;

namespace
{
  PathState make_state(const std::string &id, const std::string &type,
                       const std::string &area, double length, double fraction)
  {
    PathState state;
    state.id = id;
    state.path_type = type;
    state.area = area;
    state.length = length;
    state.coverage.coverage_fraction = fraction;
    state.coverage.is_ridden = fraction > 0;
    state.coverage.ridden_length = fraction * length;
    return state;
  }
}

TEST_CASE("coverage statistics", "[coverage]")
{
  std::vector<PathState> states{
      make_state("a", "trail", "North", 10, 1.0),
      make_state("b", "trail", "South", 4, 0.5),
      make_state("c", "road", "North", 6, 0),
      make_state("d", "", "", 2, 0)};
  StatsSummary summary = compute_statistics(states);

  SECTION("totals_test")
  {
    const GroupStats &totals = summary.totals;
    CHECK(totals.path_count == 4);
    CHECK(totals.length == Approx(22));
    CHECK(totals.ridden_count == 2);
    CHECK(totals.ridden_length == Approx(12));
    CHECK(totals.unridden_count == 2);
    // Remainder of the partially ridden path included
    CHECK(totals.unridden_length == Approx(10));
    CHECK(totals.fully_ridden_count == 1);
    CHECK(totals.coverage_ratio() == Approx(12.0 / 22));
  }
  SECTION("groups_test")
  {
    REQUIRE(summary.by_type.size() == 3);
    CHECK(summary.by_type.at("trail").path_count == 2);
    CHECK(summary.by_type.at("trail").ridden_length == Approx(12));
    CHECK(summary.by_type.at("road").unridden_count == 1);
    CHECK(summary.by_type.at(UNKNOWN_GROUP).length == Approx(2));
    REQUIRE(summary.by_area.size() == 3);
    CHECK(summary.by_area.at("North").path_count == 2);
    CHECK(summary.by_area.at("North").coverage_ratio() == Approx(10.0 / 16));
    CHECK(summary.by_area.at("Unknown").path_count == 1);
  }
  SECTION("distinct_values_test")
  {
    CHECK(distinct_areas(states) == std::vector<std::string>{"North", "South"});
    CHECK(distinct_path_types(states) == std::vector<std::string>{"road", "trail"});
  }
  SECTION("empty_network_test")
  {
    StatsSummary empty = compute_statistics({});
    CHECK(empty.totals.path_count == 0);
    CHECK(empty.totals.coverage_ratio() == 0);
    CHECK(empty.by_type.empty());
  }
}
