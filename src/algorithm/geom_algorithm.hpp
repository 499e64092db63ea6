/**
 * Trail coverage.
 *
 * Distance and linear referencing algorithms on points and linestrings.
 * All distances returned are in kilometers.
 *
 * @version: 2026.10.19
 */

#ifndef TRAILCOV_GEOM_ALGORITHM_HPP
#define TRAILCOV_GEOM_ALGORITHM_HPP

#include "core/geometry.hpp"

#include <string>
#include <vector>

namespace TRAILCOV
{
  /**
   * Geometry algorithms
   */
  namespace ALGORITHM
  {

    /**
     * Coordinate system of the network and trace coordinates
     */
    enum class CoordinateSystem
    {
      GEOGRAPHIC, /**< x = longitude, y = latitude in degrees, great-circle distances */
      PLANAR      /**< projected coordinates, euclidean distances */
    };

    /**
     * Mean earth radius in kilometers
     */
    constexpr double EARTH_RADIUS_KM = 6371.0088;

    /**
     * Distance metric used consistently by the network, the matcher and
     * ride distances.
     */
    struct DistanceMetric
    {
      /**
       * @param crs_arg coordinate system of the input coordinates
       * @param planar_unit_km_arg kilometers per coordinate unit, only used
       * in PLANAR mode (1.0 for km, 0.001 for meters)
       */
      DistanceMetric(CoordinateSystem crs_arg = CoordinateSystem::GEOGRAPHIC,
                     double planar_unit_km_arg = 1.0)
          : crs(crs_arg), planar_unit_km(planar_unit_km_arg) {};
      CoordinateSystem crs;  /**< coordinate system */
      double planar_unit_km; /**< km per planar coordinate unit */

      /**
       * Distance between two coordinates in km
       */
      double distance(double x1, double y1, double x2, double y2) const;
      /**
       * Length of a polyline in km, sum of the distances between
       * consecutive points
       */
      double length(const CORE::LineString &line) const;
      /**
       * Convert a radius in km into half extents in coordinate units
       * around a location with the given y coordinate, so that a box of
       * (x +- dx, y +- dy) contains every point within the radius.
       */
      void buffer_extent(double radius_km, double y, double *dx, double *dy) const;
    };

    /**
     * Great circle distance between two lon/lat coordinates in km
     */
    double haversine_distance(double lon1, double lat1, double lon2, double lat2);

    /**
     * Check a single coordinate, rejecting NaN, infinity and (in
     * GEOGRAPHIC mode) longitudes or latitudes out of range.
     */
    bool is_valid_coordinate(double x, double y, CoordinateSystem crs);

    /**
     * Validate a geometry before it is used by the network or the matcher
     * @param geom geometry to check
     * @param crs coordinate system
     * @param reason updated with a description of the problem
     * @return true if geometry is non empty and all coordinates are valid
     */
    bool validate_geometry(const CORE::LineString &geom, CoordinateSystem crs,
                           std::string *reason);

    /**
     * Reverse a linestring
     */
    CORE::LineString reverse_geometry(const CORE::LineString &rhs);

    /**
     * Arc length from the start of a linestring to each of its vertices.
     * The first element is 0 and the last is the length of the line.
     */
    std::vector<double> cumulative_lengths(const CORE::LineString &geom,
                                           const DistanceMetric &metric);

    /**
     * Computes the closest point on a finite segment (x1,y1)-(x2,y2) to a
     * point (x,y).
     *
     * In GEOGRAPHIC mode the projection ratio is computed in a local
     * equirectangular frame and the distances with the haversine formula.
     *
     * @param dist distance in km from the point to the segment
     * @param offset distance in km from (x1,y1) to the closest point
     */
    void closest_point_on_segment(const DistanceMetric &metric,
                                  double x, double y, double x1, double y1,
                                  double x2, double y2, double *dist,
                                  double *offset);

    /**
     * Same as above, also returns the closest point
     */
    void closest_point_on_segment(const DistanceMetric &metric,
                                  double x, double y, double x1, double y1,
                                  double x2, double y2, double *dist,
                                  double *offset, double *closest_x,
                                  double *closest_y);

    /**
     * Linear referencing of a point onto a whole linestring
     * @param dist distance from the point to the line
     * @param offset arc length from the start of the line to the
     * projected point
     */
    void linear_referencing(const DistanceMetric &metric,
                            double px, double py,
                            const CORE::LineString &linestring,
                            double *dist, double *offset);

    /**
     * Point at a ratio in [0,1] along the segment (x1,y1)-(x2,y2)
     */
    void interpolate_segment(double x1, double y1, double x2, double y2,
                             double ratio, double *x, double *y);

  } // ALGORITHM
} // TRAILCOV

#endif // TRAILCOV_GEOM_ALGORITHM_HPP
