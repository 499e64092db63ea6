#include "catch2/catch.hpp"

#include "coverage/coverage_engine.hpp"

#include <cmath>
#include <stdexcept>

using namespace TRAILCOV;
using namespace TRAILCOV::CORE;
using namespace TRAILCOV::NETWORK;
using namespace TRAILCOV::ALGORITHM;
using namespace TRAILCOV::MM;
using namespace TRAILCOV::COVERAGE;

namespace
{
  // Trace sampled every 100 m along y = const, from x0 to x1 (km)
  Trace straight_trace(double x0, double x1, double y = 0)
  {
    LineString line;
    int n = static_cast<int>(std::round(std::fabs(x1 - x0) / 0.1));
    for (int i = 0; i < n; ++i)
    {
      line.add_point(x0 + (x1 - x0) * i / n, y);
    }
    line.add_point(x1, y);
    return Trace(line);
  }

  PathRecord make_record(const std::string &id, const std::string &wkt,
                         const std::string &type, const std::string &area)
  {
    PathRecord record;
    record.id = id;
    record.path_type = type;
    record.area = area;
    record.geom = wkt2linestring(wkt);
    return record;
  }

  std::vector<PathRecord> test_network()
  {
    return {make_record("p1", "LINESTRING(0 0,10 0)", "trail", "North"),
            make_record("p2", "LINESTRING(0 5,4 5)", "road", "South"),
            make_record("p3", "LINESTRING(0 10,2 10)", "", "")};
  }

  RideMetadata metadata(const std::string &filename,
                        std::optional<double> date = std::nullopt)
  {
    RideMetadata meta;
    meta.filename = filename;
    meta.date_recorded = date;
    return meta;
  }

  CoverageConfig planar_config()
  {
    return CoverageConfig(0.025, 0.5, 0, CoordinateSystem::PLANAR, 1.0);
  }

  double fraction(const CoverageEngine &engine, const PathID &id)
  {
    return engine.get_path(id).coverage.coverage_fraction;
  }

  std::vector<PathCoverage> all_coverage(const CoverageEngine &engine)
  {
    std::vector<PathCoverage> result;
    for (const PathState &state : engine.get_path_state())
      result.push_back(state.coverage);
    return result;
  }
}

TEST_CASE("ride coverage", "[engine]")
{
  CoverageEngine engine(planar_config());
  engine.import_network(test_network());
  REQUIRE(engine.get_path_count() == 3);

  SECTION("full_retrace_test")
  {
    RideResult result = engine.add_ride(straight_trace(0, 10), metadata("a.gpx"));
    REQUIRE(result.status == RideStatus::CREATED);
    CHECK(result.ride_id == 1);
    CHECK(result.filename == "a.gpx");
    CHECK(result.changed_paths == std::vector<PathID>{"p1"});
    PathState state = engine.get_path("p1");
    CHECK(state.coverage.coverage_fraction == Approx(1.0));
    CHECK(state.coverage.is_ridden);
    CHECK(state.coverage.ridden_length == Approx(10));
    CHECK(state.geom.get_num_points() == 2);
  }
  SECTION("partial_ride_test")
  {
    engine.add_ride(straight_trace(0, 4), metadata("b.gpx"));
    CHECK(fraction(engine, "p1") == Approx(0.4));
    CHECK(engine.get_path("p1").coverage.ridden_length == Approx(4));
  }
  SECTION("two_halves_test")
  {
    RideResult first = engine.add_ride(straight_trace(0, 5), metadata("c1.gpx"));
    RideResult second = engine.add_ride(straight_trace(5, 10), metadata("c2.gpx"));
    CHECK(second.ride_id == 2);
    CHECK(fraction(engine, "p1") == Approx(1.0));
    RideDeleteResult deleted = engine.delete_ride(first.ride_id);
    REQUIRE(deleted.status == DeleteStatus::OK);
    CHECK(deleted.changed_paths == std::vector<PathID>{"p1"});
    CHECK(fraction(engine, "p1") == Approx(0.5));
    CHECK(engine.get_ride_count() == 1);
  }
  SECTION("duplicate_upload_test")
  {
    RideResult first = engine.add_ride(straight_trace(0, 4), metadata("d.gpx"));
    auto before = all_coverage(engine);
    RideResult second = engine.add_ride(straight_trace(0, 4), metadata("copy of d.gpx"));
    REQUIRE(second.status == RideStatus::DUPLICATE);
    CHECK(second.ride_id == first.ride_id);
    CHECK(second.error_code == ErrorCode::DUPLICATE_RIDE);
    CHECK(second.changed_paths.empty());
    CHECK(engine.get_ride_count() == 1);
    CHECK(all_coverage(engine) == before);

    // A deleted ride can be uploaded again
    engine.delete_ride(first.ride_id);
    RideResult third = engine.add_ride(straight_trace(0, 4), metadata("d.gpx"));
    CHECK(third.status == RideStatus::CREATED);
    CHECK(third.ride_id == 2);
  }
}

TEST_CASE("ride triggers", "[engine]")
{
  CoverageEngine engine(planar_config());
  engine.import_network(test_network());

  SECTION("delete_restores_state_test")
  {
    engine.add_ride(straight_trace(0, 6), metadata("a.gpx", 100));
    auto before = all_coverage(engine);
    RideResult result = engine.add_ride(straight_trace(3, 10), metadata("b.gpx", 200));
    CHECK(engine.get_path("p1").coverage.last_ridden_ride == result.ride_id);
    engine.delete_ride(result.ride_id);
    CHECK(all_coverage(engine) == before);
    CHECK(engine.get_path("p1").coverage.last_ridden_date == 100.0);
  }
  SECTION("delete_unknown_test")
  {
    CHECK(engine.delete_ride(42).status == DeleteStatus::NOT_FOUND);
  }
  SECTION("malformed_ride_test")
  {
    RideResult result = engine.add_ride(Trace(), metadata("empty.gpx"));
    CHECK(result.status == RideStatus::REJECTED);
    CHECK(result.error_code == ErrorCode::MALFORMED_GEOMETRY);
    CHECK(engine.get_ride_count() == 0);
    Trace nan = straight_trace(0, 1);
    nan.geom.add_point(std::nan(""), 0);
    CHECK(engine.add_ride(nan, metadata("nan.gpx")).status == RideStatus::REJECTED);
  }
  SECTION("single_point_ride_test")
  {
    RideResult result = engine.add_ride(Trace(wkt2linestring("LINESTRING(1 0)")),
                                        metadata("one.gpx"));
    CHECK(result.status == RideStatus::CREATED);
    CHECK(result.changed_paths.empty());
    CHECK(engine.get_ride_paths(result.ride_id).empty());
  }
  SECTION("batch_upload_test")
  {
    std::vector<RideUpload> uploads{{straight_trace(0, 2), metadata("a.gpx")},
                                    {Trace(), metadata("b.gpx")},
                                    {straight_trace(0, 2), metadata("c.gpx")},
                                    {straight_trace(0, 4, 5), metadata("d.gpx")}};
    std::vector<RideResult> results = engine.add_rides(uploads);
    REQUIRE(results.size() == 4);
    CHECK(results[0].status == RideStatus::CREATED);
    CHECK(results[1].status == RideStatus::REJECTED);
    CHECK(results[1].filename == "b.gpx");
    CHECK(results[2].status == RideStatus::DUPLICATE);
    CHECK(results[2].ride_id == results[0].ride_id);
    CHECK(results[3].status == RideStatus::CREATED);
    CHECK(results[3].changed_paths == std::vector<PathID>{"p2"});
    CHECK(engine.get_ride_count() == 2);
  }
  SECTION("ride_dates_test")
  {
    RideResult dated = engine.add_ride(straight_trace(0, 1), metadata("a.gpx", 500));
    CHECK(engine.get_ride(dated.ride_id).date == 500.0);
    LineString line = straight_trace(0, 4, 5).geom;
    std::vector<double> timestamps;
    for (int i = 0; i < line.get_num_points(); ++i)
      timestamps.push_back(1000 + 20 * i);
    RideResult timed = engine.add_ride(Trace(line, timestamps), metadata("b.gpx"));
    CHECK(engine.get_ride(timed.ride_id).date == 1000.0);
    CHECK(engine.get_path("p2").coverage.last_ridden_date == 1000.0);
    RideResult undated = engine.add_ride(straight_trace(0, 2, 10), metadata("c.gpx"));
    CHECK_FALSE(engine.get_ride(undated.ride_id).date.has_value());
    CHECK(engine.get_path("p3").coverage.is_ridden);
    CHECK_FALSE(engine.get_path("p3").coverage.last_ridden_date.has_value());
  }
  SECTION("ride_queries_test")
  {
    RideResult result = engine.add_ride(straight_trace(0, 10), metadata("a.gpx"));
    Ride ride = engine.get_ride(result.ride_id);
    CHECK(ride.metadata.filename == "a.gpx");
    CHECK(ride.distance == Approx(10));
    CHECK(ride.fingerprint == CoverageEngine::compute_fingerprint(ride.trace));
    CHECK(engine.get_ride_paths(result.ride_id) == std::vector<PathID>{"p1"});
    CHECK(engine.get_rides().size() == 1);
    try
    {
      engine.get_ride(99);
      FAIL("unknown ride returned");
    }
    catch (const CoverageError &e)
    {
      CHECK(e.code() == ErrorCode::UNKNOWN_RIDE);
    }
    CHECK_THROWS_AS(engine.get_ride_paths(99), CoverageError);
  }
  SECTION("restore_ride_test")
  {
    RideResult restored = engine.restore_ride(7, straight_trace(0, 3), metadata("a.gpx"));
    REQUIRE(restored.status == RideStatus::CREATED);
    CHECK(restored.ride_id == 7);
    CHECK(fraction(engine, "p1") == Approx(0.3));
    CHECK(engine.add_ride(straight_trace(0, 1), metadata("b.gpx")).ride_id == 8);
    RideResult again = engine.restore_ride(7, straight_trace(5, 6), metadata("c.gpx"));
    CHECK(again.status == RideStatus::REJECTED);
    CHECK(again.error_code == ErrorCode::DUPLICATE_RIDE);
    CHECK_THROWS_AS(engine.restore_ride(0, straight_trace(5, 6), metadata("d.gpx")),
                    std::invalid_argument);
  }
  SECTION("recompute_consistent_test")
  {
    engine.add_ride(straight_trace(0, 6), metadata("a.gpx", 10));
    RideResult b = engine.add_ride(straight_trace(2, 10), metadata("b.gpx", 20));
    engine.add_ride(straight_trace(0, 4, 5), metadata("c.gpx"));
    engine.delete_ride(b.ride_id);
    auto before = all_coverage(engine);
    CHECK(engine.recompute_all().empty());
    CHECK(all_coverage(engine) == before);
  }
}

TEST_CASE("network import", "[engine]")
{
  CoverageEngine engine(planar_config());

  SECTION("queries_before_import_test")
  {
    CHECK_FALSE(engine.is_network_loaded());
    CHECK(engine.get_network_hash().empty());
    CHECK(engine.get_path_count() == 0);
    try
    {
      engine.get_statistics();
      FAIL("statistics without network");
    }
    catch (const CoverageError &e)
    {
      CHECK(e.code() == ErrorCode::NETWORK_NOT_LOADED);
      CHECK(std::string(error_code_name(e.code())) == "NETWORK_NOT_LOADED");
    }
    CHECK_THROWS_AS(engine.get_path_state(), CoverageError);
    CHECK_THROWS_AS(engine.get_path("p1"), CoverageError);
    CHECK_THROWS_AS(engine.get_areas(), CoverageError);
    CHECK(engine.recompute_all().empty());
  }
  SECTION("rides_before_import_test")
  {
    RideResult result = engine.add_ride(straight_trace(0, 10), metadata("early.gpx"));
    REQUIRE(result.status == RideStatus::CREATED);
    CHECK(result.changed_paths.empty());
    ImportResult imported = engine.import_network(test_network());
    CHECK(imported.imported == 3);
    CHECK(imported.changed_paths == std::vector<PathID>{"p1"});
    CHECK(fraction(engine, "p1") == Approx(1.0));
  }
  SECTION("identical_import_test")
  {
    engine.import_network(test_network());
    engine.add_ride(straight_trace(0, 5), metadata("a.gpx"));
    std::string hash = engine.get_network_hash();
    auto before = all_coverage(engine);
    ImportResult again = engine.import_network(test_network());
    CHECK(again.unchanged);
    CHECK(again.changed_paths.empty());
    CHECK(engine.get_network_hash() == hash);
    CHECK(all_coverage(engine) == before);
  }
  SECTION("rejected_records_test")
  {
    std::vector<PathRecord> records = test_network();
    records.push_back(make_record("p1", "LINESTRING(0 20,1 20)", "trail", "North"));
    PathRecord broken = make_record("p4", "LINESTRING(0 30,1 30)", "trail", "North");
    broken.geom.add_point(std::nan(""), 30);
    records.push_back(broken);
    ImportResult result = engine.import_network(records);
    CHECK(result.imported == 3);
    CHECK(result.rejected == 2);
    REQUIRE(result.outcomes.size() == 5);
    CHECK(result.outcomes[0].status == PathImportStatus::IMPORTED);
    CHECK(result.outcomes[3].error_code == ErrorCode::DUPLICATE_PATH);
    CHECK(result.outcomes[4].id == "p4");
    CHECK(result.outcomes[4].error_code == ErrorCode::MALFORMED_GEOMETRY);
    CHECK(engine.get_path_count() == 3);
  }
  SECTION("replace_import_test")
  {
    engine.import_network(test_network());
    engine.add_ride(straight_trace(0, 10), metadata("a.gpx"));
    ImportResult result = engine.import_network(
        {make_record("p1", "LINESTRING(0 0,5 0)", "trail", "North"),
         make_record("p5", "LINESTRING(5 0,20 0)", "trail", "East")});
    CHECK_THAT(result.changed_paths, Catch::VectorContains(PathID("p5")));
    CHECK(engine.get_path_count() == 2);
    CHECK(fraction(engine, "p1") == Approx(1.0));
    CHECK(fraction(engine, "p5") == Approx(5.0 / 15));
    try
    {
      engine.get_path("p2");
      FAIL("removed path returned");
    }
    catch (const CoverageError &e)
    {
      CHECK(e.code() == ErrorCode::UNKNOWN_PATH);
    }
  }
  SECTION("extend_import_test")
  {
    engine.import_network({test_network()[0]});
    engine.add_ride(straight_trace(0, 4, 5), metadata("a.gpx"));
    engine.add_ride(straight_trace(0, 5), metadata("b.gpx"));
    ImportResult result = engine.import_network({test_network()[1], test_network()[0]},
                                                ImportMode::EXTEND);
    CHECK(result.imported == 1);
    CHECK(result.rejected == 1);
    CHECK(result.changed_paths == std::vector<PathID>{"p2"});
    CHECK(engine.get_path_count() == 2);
    CHECK(fraction(engine, "p1") == Approx(0.5));
    CHECK(fraction(engine, "p2") == Approx(1.0));
    CHECK(engine.recompute_all().empty());
  }
}

TEST_CASE("path queries", "[engine]")
{
  CoverageEngine engine(planar_config());
  engine.import_network(test_network());
  engine.add_ride(straight_trace(0, 10), metadata("a.gpx"));
  engine.add_ride(straight_trace(0, 1, 5), metadata("b.gpx"));

  SECTION("filter_test")
  {
    PathFilter filter;
    CHECK(engine.get_path_state(filter).size() == 3);
    filter.areas = {"North", "South"};
    CHECK(engine.get_path_state(filter).size() == 2);
    filter.path_types = {"road"};
    auto states = engine.get_path_state(filter);
    REQUIRE(states.size() == 1);
    CHECK(states[0].id == "p2");
    CHECK(states[0].geom.get_num_points() == 2);

    PathFilter unridden;
    unridden.ridden = false;
    auto remaining = engine.get_path_state(unridden);
    REQUIRE(remaining.size() == 1);
    CHECK(remaining[0].id == "p3");

    PathFilter complete;
    complete.min_coverage = 0.9;
    REQUIRE(engine.get_path_state(complete).size() == 1);
  }
  SECTION("statistics_test")
  {
    StatsSummary summary = engine.get_statistics();
    CHECK(summary.totals.path_count == 3);
    CHECK(summary.totals.length == Approx(16));
    CHECK(summary.totals.ridden_length == Approx(11));
    CHECK(summary.totals.unridden_length == Approx(5));
    CHECK(summary.totals.fully_ridden_count == 1);
    CHECK(summary.by_type.at("trail").coverage_ratio() == Approx(1.0));
    CHECK(summary.by_type.at(UNKNOWN_GROUP).ridden_count == 0);
    CHECK(summary.by_area.at("South").ridden_length == Approx(1));
  }
  SECTION("distinct_values_test")
  {
    CHECK(engine.get_areas() == std::vector<std::string>{"North", "South"});
    CHECK(engine.get_path_types() == std::vector<std::string>{"road", "trail"});
  }
}

TEST_CASE("ride fingerprint", "[engine]")
{
  Trace trace = straight_trace(0, 1);
  std::string fingerprint = CoverageEngine::compute_fingerprint(trace);
  REQUIRE(fingerprint.size() == 40);
  SECTION("below_precision_test")
  {
    Trace moved = trace;
    moved.geom = LineString();
    for (int i = 0; i < trace.geom.get_num_points(); ++i)
      moved.geom.add_point(trace.geom.get_x(i) + 1e-9, trace.geom.get_y(i));
    CHECK(CoverageEngine::compute_fingerprint(moved) == fingerprint);
  }
  SECTION("geometry_change_test")
  {
    Trace longer = trace;
    longer.geom.add_point(1.1, 0);
    CHECK(CoverageEngine::compute_fingerprint(longer) != fingerprint);
  }
  SECTION("start_time_test")
  {
    std::vector<double> t1, t2;
    for (int i = 0; i < trace.size(); ++i)
    {
      t1.push_back(100 + i);
      t2.push_back(200 + i);
    }
    std::string f1 = CoverageEngine::compute_fingerprint(Trace(trace.geom, t1));
    CHECK(f1 != fingerprint);
    CHECK(f1 != CoverageEngine::compute_fingerprint(Trace(trace.geom, t2)));
  }
}

TEST_CASE("engine configuration", "[engine]")
{
  CHECK_THROWS_AS(CoverageEngine(CoverageConfig(-1)), std::invalid_argument);
  CoverageEngine engine(planar_config());
  CHECK(engine.get_config().coordinate_system == CoordinateSystem::PLANAR);
}
