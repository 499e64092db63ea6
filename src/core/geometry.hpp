/**
 * Trail coverage.
 *
 * Definition of geometry types, a thin wrapper over boost geometry
 *
 * @version: 2026.10.19
 */

#ifndef TRAILCOV_GEOMETRY_HPP
#define TRAILCOV_GEOMETRY_HPP

#include <ostream>
#include <string>
#include <boost/geometry.hpp>
#include <boost/geometry/geometries/point_xy.hpp>
#include <boost/geometry/geometries/linestring.hpp>

namespace TRAILCOV
{
  /**
   * Core data types
   */
  namespace CORE
  {

    /**
     *  Point class. x is the longitude (or easting), y the latitude
     *  (or northing).
     */
    typedef boost::geometry::model::point<double, 2,
                                          boost::geometry::cs::cartesian>
        Point;

    /**
     * Boost linestring type
     */
    typedef boost::geometry::model::linestring<Point> BoostLineString;

    /**
     *  Linestring geometry class
     *
     *  This class wraps a boost linestring geometry.
     */
    class LineString
    {
    public:
      /**
       * Get the x coordinate of i-th point in the line
       * @param i point index starting from 0 to N-1, where N is the
       * number of points in the line
       * @return x coordinate of i-th point
       */
      inline double get_x(int i) const
      {
        return boost::geometry::get<0>(line.at(i));
      };
      /**
       * Get the y coordinate of i-th point in the line
       * @param i point index starting from 0 to N-1
       * @return y coordinate of i-th point
       */
      inline double get_y(int i) const
      {
        return boost::geometry::get<1>(line.at(i));
      };
      /**
       * Add a point to the end of the current line
       * @param x x coordinate of the point to add
       * @param y y coordinate of the point to add
       */
      inline void add_point(double x, double y)
      {
        boost::geometry::append(line, Point(x, y));
      };
      /**
       * Get the number of points in a line
       */
      inline int get_num_points() const
      {
        return static_cast<int>(boost::geometry::num_points(line));
      };
      /**
       * Check if the line is empty or not
       */
      inline bool is_empty() const
      {
        return boost::geometry::num_points(line) == 0;
      };
      /**
       * Remove all points in the current line.
       */
      inline void clear()
      {
        boost::geometry::clear(line);
      };
      /**
       * Get a reference to the inner boost geometry linestring
       */
      inline BoostLineString &get_geometry()
      {
        return line;
      };
      /**
       * Compare if two linestring are identical, point by point
       */
      inline bool operator==(const LineString &rhs) const
      {
        int N = get_num_points();
        if (rhs.get_num_points() != N)
          return false;
        for (int i = 0; i < N; ++i)
        {
          if (get_x(i) != rhs.get_x(i) || get_y(i) != rhs.get_y(i))
            return false;
        }
        return true;
      };
      /**
       * Overwrite the operator of << of linestring
       */
      friend std::ostream &operator<<(std::ostream &os, const LineString &rhs);

    private:
      BoostLineString line;
    }; // LineString

    std::ostream &operator<<(std::ostream &os, const LineString &rhs);

    /**
     * Convert a WKT linestring to a LineString
     * @param wkt WKT string, e.g. "LINESTRING(0 0,1 1)"
     * @return a linestring object
     */
    LineString wkt2linestring(const std::string &wkt);

  } // CORE
} // TRAILCOV

#endif // TRAILCOV_GEOMETRY_HPP
