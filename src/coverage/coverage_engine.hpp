/**
 * Trail coverage.
 *
 * Coverage engine: owns the path network, the live rides and their
 * coverage, and recomputes coverage when rides are added or deleted or the
 * network is imported.
 *
 * @version: 2026.10.19
 */

#ifndef TRAILCOV_COVERAGE_ENGINE_HPP
#define TRAILCOV_COVERAGE_ENGINE_HPP

#include "coverage/coverage_aggregator.hpp"
#include "coverage/coverage_type.hpp"
#include "coverage/statistics.hpp"
#include "mm/coverage_matcher.hpp"
#include "network/network.hpp"

#include <map>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace TRAILCOV
{
  namespace COVERAGE
  {

    /**
     * Coverage engine of one path network.
     *
     * Triggers (import, add, delete, recompute) are serialized and run to
     * completion under an exclusive lock; queries take a shared lock and
     * see the last committed state. Different engine instances share no
     * state.
     */
    class CoverageEngine
    {
    public:
      /**
       * @param config matching configuration
       * @throw std::invalid_argument if the configuration is invalid
       */
      explicit CoverageEngine(const MM::CoverageConfig &config = MM::CoverageConfig());
      CoverageEngine(const CoverageEngine &) = delete;
      CoverageEngine &operator=(const CoverageEngine &) = delete;

      /**
       * Import paths into the network.
       *
       * Malformed paths and duplicate ids are rejected one by one. In
       * REPLACE mode all coverage is dropped and every live ride is matched
       * again; an import identical to the current network changes nothing.
       * In EXTEND mode the live rides are matched against the new paths
       * only.
       */
      ImportResult import_network(const std::vector<NETWORK::PathRecord> &records,
                                  ImportMode mode = ImportMode::REPLACE);
      /**
       * Upload a ride
       * @return CREATED with the new id and changed paths, DUPLICATE with
       * the id of the live ride having the same fingerprint, or REJECTED
       */
      RideResult add_ride(const CORE::Trace &trace, const RideMetadata &metadata);
      /**
       * Upload several rides, one outcome per ride in input order
       */
      std::vector<RideResult> add_rides(const std::vector<RideUpload> &uploads);
      /**
       * Reload a ride persisted earlier, keeping its id. Used to rebuild
       * the engine state on restart.
       * @throw std::invalid_argument if the id is not positive
       */
      RideResult restore_ride(RideID id, const CORE::Trace &trace,
                              const RideMetadata &metadata);
      /**
       * Delete a ride and recompute the coverage of the paths it touched
       */
      RideDeleteResult delete_ride(RideID id);
      /**
       * Rebuild all coverage from the live rides
       * @return paths whose coverage changed, empty when the incremental
       * state was consistent
       */
      std::vector<NETWORK::PathID> recompute_all();

      /**
       * Paths matching a filter, in network order
       * @throw CoverageError NETWORK_NOT_LOADED before any import
       */
      std::vector<PathState> get_path_state(const PathFilter &filter = PathFilter()) const;
      /**
       * @throw CoverageError NETWORK_NOT_LOADED or UNKNOWN_PATH
       */
      PathState get_path(const NETWORK::PathID &id) const;
      /**
       * @throw CoverageError NETWORK_NOT_LOADED before any import
       */
      StatsSummary get_statistics() const;
      std::vector<std::string> get_areas() const;
      std::vector<std::string> get_path_types() const;
      /**
       * @throw CoverageError UNKNOWN_RIDE
       */
      Ride get_ride(RideID id) const;
      /**
       * Live rides ordered by id
       */
      std::vector<Ride> get_rides() const;
      /**
       * Paths covered by a live ride
       * @throw CoverageError UNKNOWN_RIDE
       */
      std::vector<NETWORK::PathID> get_ride_paths(RideID id) const;
      int get_ride_count() const;
      int get_path_count() const;
      bool is_network_loaded() const;
      /**
       * Hash of the current network, empty before any import
       */
      std::string get_network_hash() const;
      const MM::CoverageConfig &get_config() const;

      /**
       * Fingerprint of a trace: sha1 over the point count, coordinates
       * rounded to 1e-7 and the first timestamp rounded to the
       * millisecond when the trace is timed.
       */
      static std::string compute_fingerprint(const CORE::Trace &trace);

    private:
      RideResult insert_ride(RideID id, const CORE::Trace &trace,
                             const RideMetadata &metadata);
      /**
       * Match every live ride and merge the contributions to paths with
       * index >= first_path
       */
      void match_all_rides(NETWORK::PathIndex first_path);
      void check_loaded() const;
      PathState make_state(NETWORK::PathIndex index, bool with_geometry) const;
      std::vector<PathState> all_states(bool with_geometry) const;
      std::vector<NETWORK::PathID> to_path_ids(const std::vector<NETWORK::PathIndex> &indices) const;
      std::vector<double> path_lengths(NETWORK::PathIndex first_path) const;
      /**
       * Coverage of every path by id, to detect changes across a rebuild
       */
      std::unordered_map<NETWORK::PathID, PathCoverage> snapshot_coverage() const;
      std::vector<NETWORK::PathID> diff_coverage(
          const std::unordered_map<NETWORK::PathID, PathCoverage> &before) const;

      const MM::CoverageConfig config_;
      std::unique_ptr<NETWORK::Network> network_;
      std::string network_hash_;
      CoverageAggregator aggregator_;
      std::map<RideID, Ride> rides_;
      std::unordered_map<std::string, RideID> fingerprints_;
      RideID next_ride_id_ = 1;
      long long next_sequence_ = 1;
      mutable std::shared_mutex mutex_;
    };

  } // COVERAGE
} // TRAILCOV

#endif // TRAILCOV_COVERAGE_ENGINE_HPP
