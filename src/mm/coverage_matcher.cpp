#include "mm/coverage_matcher.hpp"
#include "algorithm/geom_algorithm.hpp"
#include "util/debug.hpp"
#include "util/util.hpp"

#include <algorithm>
#include <cfloat>
#include <cmath>
#include <stdexcept>
#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/xml_parser.hpp>

using namespace TRAILCOV;
using namespace TRAILCOV::CORE;
using namespace TRAILCOV::NETWORK;
using namespace TRAILCOV::MM;

CoverageConfig::CoverageConfig(double tolerance_arg, double max_gap_arg,
                               double max_step_arg,
                               ALGORITHM::CoordinateSystem crs_arg,
                               double planar_unit_km_arg) : tolerance(tolerance_arg),
                                                            max_gap(max_gap_arg),
                                                            max_step(max_step_arg),
                                                            coordinate_system(crs_arg),
                                                            planar_unit_km(planar_unit_km_arg) {
                                                            };

double CoverageConfig::get_step() const
{
  return max_step > 0 ? max_step : tolerance;
}

ALGORITHM::DistanceMetric CoverageConfig::get_metric() const
{
  return ALGORITHM::DistanceMetric(coordinate_system, planar_unit_km);
}

bool CoverageConfig::validate() const
{
  bool valid = true;
  if (!(tolerance > 0))
  {
    SPDLOG_CRITICAL("Tolerance {} should be positive", tolerance);
    valid = false;
  }
  if (!(max_gap > 0))
  {
    SPDLOG_CRITICAL("Max gap {} should be positive", max_gap);
    valid = false;
  }
  if (!std::isfinite(max_step))
  {
    SPDLOG_CRITICAL("Max step {} should be finite", max_step);
    valid = false;
  }
  if (coordinate_system == ALGORITHM::CoordinateSystem::PLANAR && !(planar_unit_km > 0))
  {
    SPDLOG_CRITICAL("Planar unit {} km should be positive", planar_unit_km);
    valid = false;
  }
  return valid;
}

void CoverageConfig::print() const
{
  SPDLOG_INFO("CoverageConfig");
  SPDLOG_INFO("Tolerance {} km", tolerance);
  SPDLOG_INFO("Max gap {} km", max_gap);
  SPDLOG_INFO("Step {} km", get_step());
  SPDLOG_INFO("Coordinate system {}",
              coordinate_system == ALGORITHM::CoordinateSystem::GEOGRAPHIC ? "geographic" : "planar");
  if (coordinate_system == ALGORITHM::CoordinateSystem::PLANAR)
  {
    SPDLOG_INFO("Planar unit {} km", planar_unit_km);
  }
}

ALGORITHM::CoordinateSystem TRAILCOV::MM::parse_coordinate_system(const std::string &name)
{
  if (name == "geographic")
    return ALGORITHM::CoordinateSystem::GEOGRAPHIC;
  if (name == "planar")
    return ALGORITHM::CoordinateSystem::PLANAR;
  throw std::invalid_argument("Unknown coordinate system " + name);
}

CoverageConfig CoverageConfig::load_from_ptree(const boost::property_tree::ptree &data)
{
  CoverageConfig config;
  config.tolerance = data.get("config.parameters.tolerance", config.tolerance);
  config.max_gap = data.get("config.parameters.max_gap", config.max_gap);
  config.max_step = data.get("config.parameters.max_step", config.max_step);
  config.planar_unit_km = data.get("config.parameters.planar_unit_km", config.planar_unit_km);
  if (auto crs = data.get_optional<std::string>("config.parameters.coordinate_system"))
  {
    config.coordinate_system = parse_coordinate_system(crs.get());
  }
  return config;
}

CoverageConfig CoverageConfig::load_from_file(const std::string &filename)
{
  SPDLOG_INFO("Read configuration from {}", filename);
  if (!UTIL::file_exists(filename))
  {
    throw std::runtime_error("Configuration file " + filename + " not found");
  }
  boost::property_tree::ptree tree;
  if (UTIL::check_file_extension(filename, "xml"))
  {
    boost::property_tree::read_xml(filename, tree);
  }
  else if (UTIL::check_file_extension(filename, "json"))
  {
    boost::property_tree::read_json(filename, tree);
  }
  else
  {
    throw std::invalid_argument("Configuration file " + filename + " should be xml or json");
  }
  return load_from_ptree(tree);
}

MatchResult CoverageMatcher::match_trace(const Trace &trace) const
{
  MatchResult result;
  if (!network_.is_finalized())
  {
    SPDLOG_WARN("Spatial index not built, trace cannot be matched");
    result.error_code = MatchErrorCode::NETWORK_NOT_READY;
    return result;
  }
  const ALGORITHM::DistanceMetric &metric = network_.get_metric();
  std::string reason;
  if (!ALGORITHM::validate_geometry(trace.geom, metric.crs, &reason))
  {
    SPDLOG_WARN("Trace rejected: {}", reason);
    result.error_code = MatchErrorCode::MALFORMED_GEOMETRY;
    return result;
  }
  int N = trace.geom.get_num_points();
  SPDLOG_DEBUG("Count of points in trace {}", N);
  if (N < 2)
  {
    result.error_code = MatchErrorCode::SUCCESS;
    return result;
  }
  double step = config_.get_step();
  std::map<PathIndex, IntervalSet> hits;
  for (int i = 0; i < N - 1; ++i)
  {
    double x1 = trace.geom.get_x(i);
    double y1 = trace.geom.get_y(i);
    double x2 = trace.geom.get_x(i + 1);
    double y2 = trace.geom.get_y(i + 1);
    double seg_length = metric.distance(x1, y1, x2, y2);
    if (seg_length > config_.max_gap)
    {
      // No interpolation across a recording break
      SPDLOG_DEBUG("Skip gap of {} km after trace point {}", seg_length, i);
      ++result.skipped_gaps;
      continue;
    }
    int k = std::max(1, static_cast<int>(std::ceil(seg_length / step)));
    double ux = x1, uy = y1;
    for (int j = 1; j <= k; ++j)
    {
      double vx = x2, vy = y2;
      if (j < k)
      {
        ALGORITHM::interpolate_segment(x1, y1, x2, y2,
                                       static_cast<double>(j) / k, &vx, &vy);
      }
      if (credit_step(ux, uy, vx, vy, seg_length / k, &hits) > 0)
      {
        ++result.credited_steps;
      }
      ux = vx;
      uy = vy;
    }
  }
  for (auto &item : hits)
  {
    const Path &path = network_.get_path(item.first);
    item.second.clamp(0, path.length);
    double covered = item.second.covered_length();
    if (covered > 0)
    {
      result.contributions.push_back({item.first, std::move(item.second), covered});
    }
  }
  SPDLOG_DEBUG("Trace matched to {} paths, {} steps credited, {} gaps skipped",
               result.contributions.size(), result.credited_steps, result.skipped_gaps);
  result.error_code = MatchErrorCode::SUCCESS;
  return result;
}

int CoverageMatcher::credit_step(double ux, double uy, double vx, double vy,
                                 double step_length,
                                 std::map<PathIndex, IntervalSet> *hits) const
{
  const ALGORITHM::DistanceMetric &metric = network_.get_metric();
  double tolerance = config_.tolerance;
  double dx, dy;
  metric.buffer_extent(tolerance, std::fabs(uy) > std::fabs(vy) ? uy : vy, &dx, &dy);
  std::vector<PathSegment> candidates = network_.search_segments(
      std::min(ux, vx) - dx, std::min(uy, vy) - dy,
      std::max(ux, vx) + dx, std::max(uy, vy) + dy);
  int credited = 0;
  std::size_t i = 0;
  while (i < candidates.size())
  {
    // Candidates are sorted by path, handle one path at a time
    const Path &path = network_.get_path(candidates[i].path);
    double u_dist = DBL_MAX, u_offset = 0;
    double v_dist = DBL_MAX, v_offset = 0;
    for (; i < candidates.size() && candidates[i].path == path.index; ++i)
    {
      int s = candidates[i].segment;
      double x1 = path.geom.get_x(s);
      double y1 = path.geom.get_y(s);
      double x2 = path.geom.get_x(s + 1);
      double y2 = path.geom.get_y(s + 1);
      double dist, offset;
      ALGORITHM::closest_point_on_segment(metric, ux, uy, x1, y1, x2, y2, &dist, &offset);
      if (dist < u_dist)
      {
        u_dist = dist;
        u_offset = path.vertex_offsets[s] + offset;
      }
      ALGORITHM::closest_point_on_segment(metric, vx, vy, x1, y1, x2, y2, &dist, &offset);
      if (dist < v_dist)
      {
        v_dist = dist;
        v_offset = path.vertex_offsets[s] + offset;
      }
    }
    if (u_dist > tolerance || v_dist > tolerance)
      continue;
    // Projections far apart along the path mean the step jumps between
    // two distant parts of the path (e.g. a loop), not a ride along it
    if (std::fabs(v_offset - u_offset) > step_length + 2 * tolerance + IntervalSet::MERGE_SLACK)
    {
      SPDLOG_TRACE("Path {} step rejected, offsets {} {}", path.id, u_offset, v_offset);
      continue;
    }
    if (u_offset != v_offset)
    {
      (*hits)[path.index].insert(u_offset, v_offset);
      ++credited;
    }
  }
  return credited;
}
