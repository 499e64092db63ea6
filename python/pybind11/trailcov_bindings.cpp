// trailcov_bindings.cpp: pybind11 bindings for TRAILCOV
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include "core/geometry.hpp"
#include "core/gps.hpp"
#include "network/type.hpp"
#include "mm/coverage_matcher.hpp"
#include "coverage/coverage_type.hpp"
#include "coverage/coverage_engine.hpp"
#include "coverage/statistics.hpp"
#include "util/debug.hpp"

namespace py = pybind11;
using namespace TRAILCOV;
using namespace TRAILCOV::CORE;
using namespace TRAILCOV::NETWORK;
using namespace TRAILCOV::ALGORITHM;
using namespace TRAILCOV::MM;
using namespace TRAILCOV::COVERAGE;

namespace
{
    LineString geometry_from_list(const py::list &coords)
    {
        LineString geom;
        for (auto item : coords)
        {
            if (py::isinstance<py::tuple>(item) && py::len(item) == 2)
            {
                py::tuple tup = item.cast<py::tuple>();
                geom.add_point(py::float_(tup[0]), py::float_(tup[1]));
            }
            else
            {
                throw std::runtime_error("Each coordinate must be a tuple (x, y)");
            }
        }
        return geom;
    }

    py::list geometry_to_list(const LineString &geom)
    {
        py::list tuples;
        for (int i = 0; i < geom.get_num_points(); ++i)
        {
            tuples.append(py::make_tuple(geom.get_x(i), geom.get_y(i)));
        }
        return tuples;
    }
}

PYBIND11_MODULE(trailcov, m)
{
    m.doc() = "Trail coverage (TRAILCOV) Python bindings via pybind11";

    py::register_exception<CoverageError>(m, "CoverageError", PyExc_RuntimeError);

    m.def("set_log_level", [](int level)
          { spdlog::set_level(static_cast<spdlog::level::level_enum>(level)); },
          py::arg("level"),
          "Set the log level, 0 (trace) to 6 (off)");

    py::enum_<CoordinateSystem>(m, "CoordinateSystem")
        .value("GEOGRAPHIC", CoordinateSystem::GEOGRAPHIC, "lon/lat degrees, haversine distances")
        .value("PLANAR", CoordinateSystem::PLANAR, "projected coordinates, euclidean distances")
        .export_values();

    py::enum_<ErrorCode>(m, "ErrorCode")
        .value("SUCCESS", ErrorCode::SUCCESS)
        .value("MALFORMED_GEOMETRY", ErrorCode::MALFORMED_GEOMETRY, "Empty geometry or invalid coordinates")
        .value("DUPLICATE_RIDE", ErrorCode::DUPLICATE_RIDE, "A live ride has the same fingerprint or id")
        .value("DUPLICATE_PATH", ErrorCode::DUPLICATE_PATH, "A path with the same id already exists")
        .value("UNKNOWN_PATH", ErrorCode::UNKNOWN_PATH)
        .value("UNKNOWN_RIDE", ErrorCode::UNKNOWN_RIDE)
        .value("NETWORK_NOT_LOADED", ErrorCode::NETWORK_NOT_LOADED, "No network imported yet")
        .export_values();

    py::enum_<RideStatus>(m, "RideStatus")
        .value("CREATED", RideStatus::CREATED)
        .value("DUPLICATE", RideStatus::DUPLICATE)
        .value("REJECTED", RideStatus::REJECTED)
        .export_values();

    py::enum_<DeleteStatus>(m, "DeleteStatus")
        .value("OK", DeleteStatus::OK)
        .value("NOT_FOUND", DeleteStatus::NOT_FOUND)
        .export_values();

    py::enum_<ImportMode>(m, "ImportMode")
        .value("REPLACE", ImportMode::REPLACE, "Replace the network and re-match all rides")
        .value("EXTEND", ImportMode::EXTEND, "Add paths to the current network")
        .export_values();

    py::enum_<PathImportStatus>(m, "PathImportStatus")
        .value("IMPORTED", PathImportStatus::IMPORTED)
        .value("REJECTED", PathImportStatus::REJECTED)
        .export_values();

    // CoverageConfig class
    py::class_<CoverageConfig>(m, "CoverageConfig", R"pbdoc(
        Configuration of coverage matching.

        Distances are in km whatever the coordinate system.
    )pbdoc")
        .def(py::init<double, double, double, CoordinateSystem, double>(),
             py::arg("tolerance") = 0.025,
             py::arg("max_gap") = 0.5,
             py::arg("max_step") = 0.0,
             py::arg("coordinate_system") = CoordinateSystem::GEOGRAPHIC,
             py::arg("planar_unit_km") = 1.0,
             R"pbdoc(
            Create a coverage configuration.

            Args:
                tolerance: Maximum distance from a trace point to a path for the
                   path to be credited. Default: 0.025 (25 m).
                max_gap: Trace segments longer than this are treated as a
                   recording break and credit nothing. Default: 0.5.
                max_step: Densification step along trace segments, 0 to use
                   the tolerance. Default: 0.
                coordinate_system: GEOGRAPHIC (lon/lat) or PLANAR.
                planar_unit_km: Length of one planar coordinate unit in km,
                   e.g. 0.001 for meters. Default: 1.
        )pbdoc")
        .def_readwrite("tolerance", &CoverageConfig::tolerance)
        .def_readwrite("max_gap", &CoverageConfig::max_gap)
        .def_readwrite("max_step", &CoverageConfig::max_step)
        .def_readwrite("coordinate_system", &CoverageConfig::coordinate_system)
        .def_readwrite("planar_unit_km", &CoverageConfig::planar_unit_km)
        .def("validate", &CoverageConfig::validate)
        .def_static("load_from_file", &CoverageConfig::load_from_file, py::arg("filename"),
                    R"pbdoc(
            Read a configuration from an xml or json file, keys under
            config.parameters.
        )pbdoc");

    // Trace struct
    py::class_<Trace>(m, "Trace", R"pbdoc(
        A GPS recording, (x, y) points with optional timestamps in seconds.
    )pbdoc")
        .def("__len__", &Trace::size, "Number of GPS points in the trace")
        .def("to_xy_tuples", [](const Trace &self)
             { return geometry_to_list(self.geom); },
             "Export trace as a list of (x, y) tuples")
        .def_readonly("timestamps", &Trace::timestamps)
        .def_static("from_xy_tuples", [](py::list tuples)
                    { return Trace(geometry_from_list(tuples)); },
                    py::arg("tuples"),
                    "Create a Trace from (x, y) tuples, without timestamps")
        .def_static("from_xyt_tuples", [](py::list tuples)
                    {
                std::vector<std::tuple<double, double, double>> data;
                for (auto item : tuples) {
                    if (py::isinstance<py::tuple>(item) && py::len(item) == 3) {
                        py::tuple tup = item.cast<py::tuple>();
                        double x = py::float_(tup[0]);
                        double y = py::float_(tup[1]);
                        double t = py::float_(tup[2]);
                        data.emplace_back(x, y, t);
                    } else {
                        throw std::runtime_error("Each item must be a tuple (x, y, t)");
                    }
                }
                return Trace::from_xyt_tuples(data); }, py::arg("tuples"), R"pbdoc(
            Create a Trace from (x, y, t) tuples.

            Raises:
                ValueError: If timestamps are decreasing
        )pbdoc");

    // PathRecord struct
    py::class_<PathRecord>(m, "PathRecord", "A path to import into the network")
        .def(py::init([](const PathID &id, py::list geom, const std::string &path_type,
                         const std::string &area, std::optional<std::string> route_code,
                         std::optional<std::string> name)
                      { return PathRecord{id, route_code, name, path_type, area,
                                          geometry_from_list(geom)}; }),
             py::arg("id"), py::arg("geom"), py::arg("path_type") = "",
             py::arg("area") = "", py::arg("route_code") = std::nullopt,
             py::arg("name") = std::nullopt)
        .def_readonly("id", &PathRecord::id)
        .def_readonly("route_code", &PathRecord::route_code)
        .def_readonly("name", &PathRecord::name)
        .def_readonly("path_type", &PathRecord::path_type)
        .def_readonly("area", &PathRecord::area);

    py::class_<RideMetadata>(m, "RideMetadata", "Metadata of an uploaded recording")
        .def(py::init<>())
        .def_readwrite("filename", &RideMetadata::filename)
        .def_readwrite("name", &RideMetadata::name)
        .def_readwrite("activity_type", &RideMetadata::activity_type)
        .def_readwrite("date_recorded", &RideMetadata::date_recorded,
                       "Recording date in seconds since epoch")
        .def_readwrite("elevation_gain", &RideMetadata::elevation_gain);

    py::class_<Ride>(m, "Ride", "A live ride")
        .def_readonly("id", &Ride::id)
        .def_readonly("fingerprint", &Ride::fingerprint)
        .def_readonly("metadata", &Ride::metadata)
        .def_readonly("date", &Ride::date,
                      "Recording date, or the first timestamp, None if unknown")
        .def_readonly("distance", &Ride::distance, "Trace length in km")
        .def_readonly("trace", &Ride::trace)
        .def("__repr__", [](const Ride &r)
             { return "<Ride id=" + std::to_string(r.id) + " " + r.metadata.filename +
                      " distance=" + fmt::format("{:.2f}", r.distance) + ">"; });

    py::class_<PathCoverage>(m, "PathCoverage")
        .def_readonly("coverage_fraction", &PathCoverage::coverage_fraction)
        .def_readonly("is_ridden", &PathCoverage::is_ridden)
        .def_readonly("ridden_length", &PathCoverage::ridden_length)
        .def_readonly("last_ridden_date", &PathCoverage::last_ridden_date)
        .def_readonly("last_ridden_ride", &PathCoverage::last_ridden_ride);

    py::class_<PathState>(m, "PathState", "A path with its attributes and coverage")
        .def_readonly("id", &PathState::id)
        .def_readonly("route_code", &PathState::route_code)
        .def_readonly("name", &PathState::name)
        .def_readonly("path_type", &PathState::path_type)
        .def_readonly("area", &PathState::area)
        .def_readonly("length", &PathState::length, "Length in km")
        .def_readonly("coverage", &PathState::coverage)
        .def_property_readonly("geom", [](const PathState &self)
                               { return geometry_to_list(self.geom); })
        .def("__repr__", [](const PathState &s)
             { return "<Path id=" + s.id +
                      " length=" + fmt::format("{:.3f}", s.length) +
                      " coverage=" + fmt::format("{:.3f}", s.coverage.coverage_fraction) + ">"; });

    py::class_<PathFilter>(m, "PathFilter", R"pbdoc(
        Filter on path listing. Empty lists and None values match all paths.
    )pbdoc")
        .def(py::init<>())
        .def_readwrite("areas", &PathFilter::areas)
        .def_readwrite("path_types", &PathFilter::path_types)
        .def_readwrite("ridden", &PathFilter::ridden)
        .def_readwrite("min_coverage", &PathFilter::min_coverage);

    py::class_<RideResult>(m, "RideResult")
        .def_readonly("status", &RideResult::status)
        .def_readonly("ride_id", &RideResult::ride_id)
        .def_readonly("error_code", &RideResult::error_code)
        .def_readonly("message", &RideResult::message)
        .def_readonly("filename", &RideResult::filename)
        .def_readonly("changed_paths", &RideResult::changed_paths);

    py::class_<RideDeleteResult>(m, "RideDeleteResult")
        .def_readonly("status", &RideDeleteResult::status)
        .def_readonly("changed_paths", &RideDeleteResult::changed_paths);

    py::class_<PathImportOutcome>(m, "PathImportOutcome")
        .def_readonly("id", &PathImportOutcome::id)
        .def_readonly("status", &PathImportOutcome::status)
        .def_readonly("error_code", &PathImportOutcome::error_code)
        .def_readonly("message", &PathImportOutcome::message);

    py::class_<ImportResult>(m, "ImportResult")
        .def_readonly("imported", &ImportResult::imported)
        .def_readonly("rejected", &ImportResult::rejected)
        .def_readonly("unchanged", &ImportResult::unchanged)
        .def_readonly("outcomes", &ImportResult::outcomes)
        .def_readonly("changed_paths", &ImportResult::changed_paths);

    py::class_<GroupStats>(m, "GroupStats", "Totals over a group of paths, lengths in km")
        .def_readonly("path_count", &GroupStats::path_count)
        .def_readonly("length", &GroupStats::length)
        .def_readonly("ridden_count", &GroupStats::ridden_count)
        .def_readonly("ridden_length", &GroupStats::ridden_length)
        .def_readonly("unridden_count", &GroupStats::unridden_count)
        .def_readonly("unridden_length", &GroupStats::unridden_length)
        .def_readonly("fully_ridden_count", &GroupStats::fully_ridden_count)
        .def_property_readonly("coverage_ratio", &GroupStats::coverage_ratio);

    py::class_<StatsSummary>(m, "StatsSummary")
        .def_readonly("totals", &StatsSummary::totals)
        .def_readonly("by_type", &StatsSummary::by_type)
        .def_readonly("by_area", &StatsSummary::by_area);

    // CoverageEngine class
    py::class_<CoverageEngine>(m, "CoverageEngine", R"pbdoc(
        Coverage of a path network by uploaded rides.

        Example:
            >>> engine = trailcov.CoverageEngine()
            >>> engine.import_network([trailcov.PathRecord("p1", [(174.76, -36.85), (174.77, -36.86)], "trail", "North")])
            >>> engine.add_ride(trailcov.Trace.from_xy_tuples(points), metadata)
    )pbdoc")
        .def(py::init<const CoverageConfig &>(), py::arg("config") = CoverageConfig(),
             R"pbdoc(
            Raises:
                ValueError: If the configuration is invalid
        )pbdoc")
        .def("import_network", &CoverageEngine::import_network,
             py::arg("records"), py::arg("mode") = ImportMode::REPLACE,
             R"pbdoc(
            Import paths. Malformed paths and duplicate ids are reported one by
            one in the result. Re-importing an identical network changes nothing.
        )pbdoc")
        .def("add_ride", &CoverageEngine::add_ride, py::arg("trace"), py::arg("metadata"),
             R"pbdoc(
            Upload a ride. Returns CREATED, DUPLICATE with the id of the live
            ride having the same fingerprint, or REJECTED.
        )pbdoc")
        .def("add_rides", [](CoverageEngine &self, py::list items)
             {
            std::vector<RideUpload> uploads;
            for (auto item : items) {
                py::tuple tup = item.cast<py::tuple>();
                uploads.push_back({tup[0].cast<Trace>(), tup[1].cast<RideMetadata>()});
            }
            return self.add_rides(uploads); }, py::arg("uploads"),
             "Upload a list of (trace, metadata) tuples, one result per item")
        .def("restore_ride", &CoverageEngine::restore_ride,
             py::arg("ride_id"), py::arg("trace"), py::arg("metadata"))
        .def("delete_ride", &CoverageEngine::delete_ride, py::arg("ride_id"))
        .def("recompute_all", &CoverageEngine::recompute_all,
             "Rebuild all coverage, returns the paths whose coverage changed")
        .def("get_path_state", &CoverageEngine::get_path_state,
             py::arg("filter") = PathFilter())
        .def("get_path", &CoverageEngine::get_path, py::arg("path_id"))
        .def("get_statistics", &CoverageEngine::get_statistics)
        .def("get_areas", &CoverageEngine::get_areas)
        .def("get_path_types", &CoverageEngine::get_path_types)
        .def("get_ride", &CoverageEngine::get_ride, py::arg("ride_id"))
        .def("get_rides", &CoverageEngine::get_rides)
        .def("get_ride_paths", &CoverageEngine::get_ride_paths, py::arg("ride_id"))
        .def("get_ride_count", &CoverageEngine::get_ride_count)
        .def("get_path_count", &CoverageEngine::get_path_count)
        .def("is_network_loaded", &CoverageEngine::is_network_loaded)
        .def("get_network_hash", &CoverageEngine::get_network_hash)
        .def_static("compute_fingerprint", &CoverageEngine::compute_fingerprint, py::arg("trace"));
}
