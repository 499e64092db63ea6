/**
 * Trail coverage.
 *
 * Network wide and grouped statistics derived from path coverage
 *
 * @version: 2026.10.19
 */

#ifndef TRAILCOV_STATISTICS_HPP
#define TRAILCOV_STATISTICS_HPP

#include "coverage/coverage_type.hpp"

#include <map>
#include <string>
#include <vector>

namespace TRAILCOV
{
  namespace COVERAGE
  {

    /**
     * Group label used for paths without type or area
     */
    extern const char *const UNKNOWN_GROUP;

    /**
     * Totals over a group of paths. Lengths are in km.
     */
    struct GroupStats
    {
      int path_count = 0;         /**< number of paths */
      double length = 0;          /**< total length */
      int ridden_count = 0;       /**< paths with some coverage */
      double ridden_length = 0;   /**< total covered length */
      int unridden_count = 0;     /**< paths without coverage */
      double unridden_length = 0; /**< total length not covered, including the
                                       remainder of partially ridden paths */
      int fully_ridden_count = 0; /**< paths covered end to end */
      /**
       * Fraction of the group length covered, 0 for an empty group
       */
      double coverage_ratio() const;
      void add(const PathState &state);
    };

    /**
     * Statistics of a network
     */
    struct StatsSummary
    {
      GroupStats totals;                         /**< all paths */
      std::map<std::string, GroupStats> by_type; /**< grouped by path type */
      std::map<std::string, GroupStats> by_area; /**< grouped by area */
    };

    /**
     * Compute statistics from the current path states. The result only
     * depends on the states given.
     */
    StatsSummary compute_statistics(const std::vector<PathState> &states);

    /**
     * Sorted distinct non empty areas
     */
    std::vector<std::string> distinct_areas(const std::vector<PathState> &states);

    /**
     * Sorted distinct non empty path types
     */
    std::vector<std::string> distinct_path_types(const std::vector<PathState> &states);

  } // COVERAGE
} // TRAILCOV

#endif // TRAILCOV_STATISTICS_HPP
