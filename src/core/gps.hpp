/**
 * Trail coverage.
 *
 * Definition of input GPS trace format
 *
 * @version: 2026.10.19
 */

#ifndef TRAILCOV_GPS_HPP
#define TRAILCOV_GPS_HPP

#include "core/geometry.hpp"

#include <optional>
#include <stdexcept>
#include <tuple>
#include <vector>

namespace TRAILCOV
{

  namespace CORE
  {

    /**
     * %Trace class
     *
     * A decoded GPS recording represented with its geometry and optional
     * timestamps (seconds since the epoch). A trace without timestamps has
     * an empty timestamp vector.
     */
    struct Trace
    {
      Trace() {};
      explicit Trace(const LineString &geom_arg) : geom(geom_arg) {};
      Trace(const LineString &geom_arg, const std::vector<double> &timestamps_arg)
          : geom(geom_arg), timestamps(timestamps_arg)
      {
        if (!timestamps.empty() &&
            geom.get_num_points() != static_cast<int>(timestamps.size()))
        {
          throw std::invalid_argument("Trace: timestamps and geometry must have the same length");
        }
        for (size_t i = 1; i < timestamps.size(); ++i)
        {
          if (timestamps[i] < timestamps[i - 1])
          {
            throw std::invalid_argument("Trace: timestamps must be non-decreasing");
          }
        }
      }
      LineString geom;                /**< Geometry of the trace */
      std::vector<double> timestamps; /**< Timestamps of the trace, empty if not recorded */

      // Return the number of points in the trace
      int size() const
      {
        return geom.get_num_points();
      }

      bool has_timestamps() const
      {
        return !timestamps.empty();
      }

      // Timestamp of the first point, if the trace is timed
      std::optional<double> start_time() const
      {
        if (timestamps.empty())
          return std::nullopt;
        return timestamps.front();
      }

      // Create a Trace from a vector of (x, y) tuples
      static Trace from_xy_tuples(const std::vector<std::tuple<double, double>> &data)
      {
        LineString geom;
        for (const auto &item : data)
        {
          geom.add_point(std::get<0>(item), std::get<1>(item));
        }
        return Trace(geom);
      }

      // Create a Trace from a vector of (x, y, t) tuples
      static Trace from_xyt_tuples(const std::vector<std::tuple<double, double, double>> &data)
      {
        LineString geom;
        std::vector<double> timestamps;
        for (const auto &item : data)
        {
          geom.add_point(std::get<0>(item), std::get<1>(item));
          timestamps.push_back(std::get<2>(item));
        }
        return Trace(geom, timestamps);
      }

      // Return as a vector of (x, y) tuples
      std::vector<std::tuple<double, double>> to_xy_tuples() const
      {
        std::vector<std::tuple<double, double>> data;
        int n = geom.get_num_points();
        for (int i = 0; i < n; ++i)
        {
          data.emplace_back(geom.get_x(i), geom.get_y(i));
        }
        return data;
      }
    };

  }

}
#endif /* TRAILCOV_GPS_HPP */
