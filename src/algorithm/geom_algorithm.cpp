#include "algorithm/geom_algorithm.hpp"

#include <algorithm>
#include <cfloat>
#include <cmath>

namespace
{
  constexpr double DEG_TO_RAD = 3.14159265358979323846 / 180.0;
}

double TRAILCOV::ALGORITHM::haversine_distance(double lon1, double lat1,
                                               double lon2, double lat2)
{
  double dlat = (lat2 - lat1) * DEG_TO_RAD;
  double dlon = (lon2 - lon1) * DEG_TO_RAD;
  double s_dlat = std::sin(dlat / 2);
  double s_dlon = std::sin(dlon / 2);
  double h = s_dlat * s_dlat +
             std::cos(lat1 * DEG_TO_RAD) * std::cos(lat2 * DEG_TO_RAD) * s_dlon * s_dlon;
  h = std::min(1.0, h);
  return 2.0 * EARTH_RADIUS_KM * std::asin(std::sqrt(h));
}

double TRAILCOV::ALGORITHM::DistanceMetric::distance(double x1, double y1,
                                                     double x2, double y2) const
{
  if (crs == CoordinateSystem::GEOGRAPHIC)
  {
    return haversine_distance(x1, y1, x2, y2);
  }
  double dx = x2 - x1;
  double dy = y2 - y1;
  return std::sqrt(dx * dx + dy * dy) * planar_unit_km;
}

double TRAILCOV::ALGORITHM::DistanceMetric::length(
    const TRAILCOV::CORE::LineString &line) const
{
  int N = line.get_num_points();
  double result = 0;
  for (int i = 1; i < N; ++i)
  {
    result += distance(line.get_x(i - 1), line.get_y(i - 1),
                       line.get_x(i), line.get_y(i));
  }
  return result;
}

void TRAILCOV::ALGORITHM::DistanceMetric::buffer_extent(double radius_km, double y,
                                                        double *dx, double *dy) const
{
  if (crs == CoordinateSystem::PLANAR)
  {
    *dx = radius_km / planar_unit_km;
    *dy = *dx;
    return;
  }
  *dy = radius_km / (EARTH_RADIUS_KM * DEG_TO_RAD);
  // Widest longitude span is at the latitude furthest from the equator
  double lat_max = std::min(89.9, std::fabs(y) + *dy);
  *dx = std::min(360.0, *dy / std::cos(lat_max * DEG_TO_RAD));
}

bool TRAILCOV::ALGORITHM::is_valid_coordinate(double x, double y,
                                              CoordinateSystem crs)
{
  if (!std::isfinite(x) || !std::isfinite(y))
    return false;
  if (crs == CoordinateSystem::GEOGRAPHIC)
  {
    return x >= -180.0 && x <= 180.0 && y >= -90.0 && y <= 90.0;
  }
  return true;
}

bool TRAILCOV::ALGORITHM::validate_geometry(const TRAILCOV::CORE::LineString &geom,
                                            CoordinateSystem crs,
                                            std::string *reason)
{
  if (geom.is_empty())
  {
    *reason = "geometry is empty";
    return false;
  }
  int N = geom.get_num_points();
  for (int i = 0; i < N; ++i)
  {
    if (!is_valid_coordinate(geom.get_x(i), geom.get_y(i), crs))
    {
      *reason = "invalid coordinate at point " + std::to_string(i);
      return false;
    }
  }
  return true;
}

TRAILCOV::CORE::LineString TRAILCOV::ALGORITHM::reverse_geometry(
    const TRAILCOV::CORE::LineString &rhs)
{
  TRAILCOV::CORE::LineString line;
  int Npoints = rhs.get_num_points();
  for (int i = Npoints - 1; i >= 0; --i)
  {
    line.add_point(rhs.get_x(i), rhs.get_y(i));
  }
  return line;
}

std::vector<double> TRAILCOV::ALGORITHM::cumulative_lengths(
    const TRAILCOV::CORE::LineString &geom, const DistanceMetric &metric)
{
  int N = geom.get_num_points();
  std::vector<double> result;
  if (N == 0)
    return result;
  result.reserve(N);
  result.push_back(0);
  for (int i = 1; i < N; ++i)
  {
    result.push_back(result.back() +
                     metric.distance(geom.get_x(i - 1), geom.get_y(i - 1),
                                     geom.get_x(i), geom.get_y(i)));
  }
  return result;
}

void TRAILCOV::ALGORITHM::closest_point_on_segment(
    const DistanceMetric &metric,
    double x, double y, double x1, double y1, double x2, double y2,
    double *dist, double *offset)
{
  double closest_x, closest_y;
  closest_point_on_segment(metric, x, y, x1, y1, x2, y2, dist, offset,
                           &closest_x, &closest_y);
} // closest_point_on_segment

void TRAILCOV::ALGORITHM::closest_point_on_segment(
    const DistanceMetric &metric,
    double x, double y, double x1, double y1,
    double x2, double y2, double *dist,
    double *offset, double *closest_x,
    double *closest_y)
{
  // Local frame scaled so that both axes share a unit
  double kx = 1.0;
  if (metric.crs == CoordinateSystem::GEOGRAPHIC)
  {
    kx = std::cos((y1 + y2) * 0.5 * DEG_TO_RAD);
  }
  double x1_x2 = (x2 - x1) * kx;
  double y1_y2 = y2 - y1;
  double L2 = x1_x2 * x1_x2 + y1_y2 * y1_y2;
  if (L2 == 0.0)
  {
    *dist = metric.distance(x, y, x1, y1);
    *offset = 0.0;
    *closest_x = x1;
    *closest_y = y1;
    return;
  }
  double x1_x = (x - x1) * kx;
  double y1_y = y - y1;
  double ratio = (x1_x * x1_x2 + y1_y * y1_y2) / L2;
  ratio = (ratio > 1) ? 1 : ratio;
  ratio = (ratio < 0) ? 0 : ratio;
  double prj_x = x1 + ratio * (x2 - x1);
  double prj_y = y1 + ratio * (y2 - y1);
  *offset = ratio * metric.distance(x1, y1, x2, y2);
  *dist = metric.distance(x, y, prj_x, prj_y);
  *closest_x = prj_x;
  *closest_y = prj_y;
} // closest_point_on_segment

void TRAILCOV::ALGORITHM::linear_referencing(
    const DistanceMetric &metric, double px, double py,
    const TRAILCOV::CORE::LineString &linestring,
    double *result_dist, double *result_offset)
{
  int Npoints = linestring.get_num_points();
  double min_dist = DBL_MAX;
  double final_offset = DBL_MAX;
  double length_parsed = 0;
  int i = 0;
  while (i < Npoints - 1)
  {
    double x1 = linestring.get_x(i);
    double y1 = linestring.get_y(i);
    double x2 = linestring.get_x(i + 1);
    double y2 = linestring.get_y(i + 1);
    double temp_min_dist;
    double temp_min_offset;
    closest_point_on_segment(metric, px, py, x1, y1, x2, y2,
                             &temp_min_dist, &temp_min_offset);
    if (temp_min_dist < min_dist)
    {
      min_dist = temp_min_dist;
      final_offset = length_parsed + temp_min_offset;
    }
    length_parsed += metric.distance(x1, y1, x2, y2);
    ++i;
  }
  *result_dist = min_dist;
  *result_offset = final_offset;
} // linear_referencing

void TRAILCOV::ALGORITHM::interpolate_segment(double x1, double y1,
                                              double x2, double y2,
                                              double ratio, double *x, double *y)
{
  *x = x1 + ratio * (x2 - x1);
  *y = y1 + ratio * (y2 - y1);
}
