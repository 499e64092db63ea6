/**
 * Trail coverage.
 *
 * Coverage aggregator, merges the contributions of all live rides into the
 * coverage of every path
 *
 * @version: 2026.10.19
 */

#ifndef TRAILCOV_COVERAGE_AGGREGATOR_HPP
#define TRAILCOV_COVERAGE_AGGREGATOR_HPP

#include "coverage/coverage_type.hpp"
#include "mm/mm_type.hpp"

#include <map>
#include <unordered_map>
#include <vector>

namespace TRAILCOV
{
  namespace COVERAGE
  {

    /**
     * Date and upload order of a ride, used to pick the last ridden date
     */
    struct RideStamp
    {
      std::optional<double> date; /**< recording date, unknown if unset */
      long long sequence;         /**< upload order */
    };

    /**
     * Coverage state of one path
     */
    struct PathCoverageState
    {
      double length = 0;                             /**< path length in km */
      std::map<RideID, MM::IntervalSet> contributions; /**< covered intervals per live ride */
      MM::IntervalSet covered;                       /**< union of all contributions */
      PathCoverage coverage;                         /**< derived coverage fields */
    };

    /**
     * Per path coverage derived from the contributions of live rides.
     *
     * Contributions are cached per (ride, path) so that removing a ride
     * re-derives the union from the remaining rides for the touched paths
     * only. The state after any sequence of additions and removals equals
     * the state obtained by adding the live rides to an empty aggregator.
     */
    class CoverageAggregator
    {
    public:
      /**
       * Drop all coverage and size the aggregator for a network
       * @param path_lengths length of every path, by path index
       */
      void reset(const std::vector<double> &path_lengths);
      /**
       * Append paths, keeping the coverage of existing ones
       * @param path_lengths length of the new paths, in index order
       */
      void extend(const std::vector<double> &path_lengths);
      /**
       * Merge the contributions of a ride. The ride is registered even
       * when it has no contribution; a ride already registered gets the new
       * contributions merged with its cached ones.
       * @return indices of the paths whose coverage changed
       */
      std::vector<NETWORK::PathIndex> add_contributions(
          RideID ride, const RideStamp &stamp,
          const MM::PathContributions &contributions);
      /**
       * Remove a ride and re-derive the coverage of the paths it touched
       * @return indices of the paths whose coverage changed
       */
      std::vector<NETWORK::PathIndex> remove_ride(RideID ride);
      bool has_ride(RideID ride) const;
      /**
       * Paths a ride contributes to, in increasing index order
       */
      std::vector<NETWORK::PathIndex> get_ride_paths(RideID ride) const;
      const PathCoverage &get_coverage(NETWORK::PathIndex index) const;
      const MM::IntervalSet &get_covered_intervals(NETWORK::PathIndex index) const;
      int get_path_count() const;
      int get_ride_count() const;

    private:
      /**
       * Recompute the derived fields of a path from its union and
       * contributions
       * @return true if the coverage changed
       */
      bool refresh(PathCoverageState *state);
      std::vector<PathCoverageState> paths;
      std::unordered_map<RideID, RideStamp> rides;
      std::unordered_map<RideID, std::vector<NETWORK::PathIndex>> ride_paths;
    };

  } // COVERAGE
} // TRAILCOV

#endif // TRAILCOV_COVERAGE_AGGREGATOR_HPP
