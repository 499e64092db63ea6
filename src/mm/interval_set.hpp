/**
 * Trail coverage.
 *
 * Set of covered arc-length intervals along a path
 *
 * @version: 2026.10.19
 */

#ifndef TRAILCOV_INTERVAL_SET_HPP
#define TRAILCOV_INTERVAL_SET_HPP

#include <vector>

namespace TRAILCOV
{
  namespace MM
  {

    /**
     * Closed interval [start, end] of arc length along a path, in km
     */
    struct Interval
    {
      double start; /**< arc length of the start of the interval */
      double end;   /**< arc length of the end of the interval */
      double length() const
      {
        return end - start;
      }
      bool operator==(const Interval &rhs) const
      {
        return start == rhs.start && end == rhs.end;
      }
    };

    /**
     * Union of intervals, stored sorted and disjoint.
     *
     * Overlapping intervals and intervals separated by no more than
     * MERGE_SLACK are merged, so the content only depends on the set of
     * intervals inserted, not on the order of insertion.
     */
    class IntervalSet
    {
    public:
      /**
       * Gap in km below which two intervals are considered touching
       */
      static constexpr double MERGE_SLACK = 1e-9;

      /**
       * Insert an interval, the bounds may be given in any order
       */
      void insert(double a, double b);
      /**
       * Insert all intervals of another set
       */
      void merge(const IntervalSet &other);
      /**
       * Clip all intervals to [lower, upper], dropping empty ones
       */
      void clamp(double lower, double upper);
      /**
       * Total length covered by the set
       */
      double covered_length() const;
      const std::vector<Interval> &get_intervals() const;
      bool empty() const;
      int size() const;
      void clear();
      bool operator==(const IntervalSet &rhs) const;
      bool operator!=(const IntervalSet &rhs) const;

    private:
      std::vector<Interval> intervals;
    };

  } // MM
} // TRAILCOV

#endif // TRAILCOV_INTERVAL_SET_HPP
