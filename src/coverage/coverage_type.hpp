/**
 * Trail coverage.
 *
 * Definition of rides, path coverage records, results and errors exposed
 * by the coverage engine
 *
 * @version: 2026.10.19
 */

#ifndef TRAILCOV_COVERAGE_TYPE_HPP
#define TRAILCOV_COVERAGE_TYPE_HPP

#include "core/gps.hpp"
#include "network/type.hpp"

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace TRAILCOV
{
  /**
   * Coverage aggregation, statistics and recomputation
   */
  namespace COVERAGE
  {

    typedef long long RideID; /**< Ride ID, generated by the engine, starting from 1 */

    /**
     * Error codes reported by the coverage engine
     */
    enum class ErrorCode : int
    {
      SUCCESS = 0,            /**< No error */
      MALFORMED_GEOMETRY = 1, /**< Empty geometry, NaN or out of range coordinates */
      DUPLICATE_RIDE = 2,     /**< A live ride has the same fingerprint or id */
      DUPLICATE_PATH = 3,     /**< A path with the same id is already in the network */
      UNKNOWN_PATH = 4,       /**< No path with this id */
      UNKNOWN_RIDE = 5,       /**< No live ride with this id */
      NETWORK_NOT_LOADED = 6  /**< Query before any network import */
    };

    /**
     * Name of an error code, e.g. "MALFORMED_GEOMETRY"
     */
    const char *error_code_name(ErrorCode code);

    /**
     * Exception thrown by engine queries on unknown entities or before a
     * network has been imported
     */
    class CoverageError : public std::runtime_error
    {
    public:
      CoverageError(ErrorCode code, const std::string &message)
          : std::runtime_error(message), code_(code) {};
      ErrorCode code() const
      {
        return code_;
      }

    private:
      ErrorCode code_;
    };

    /**
     * Metadata of an uploaded GPS recording
     */
    struct RideMetadata
    {
      std::string filename;                     /**< uploaded file name */
      std::optional<std::string> name;          /**< activity name */
      std::optional<std::string> activity_type; /**< activity type, e.g. "Ride" */
      std::optional<double> date_recorded;      /**< recording date, seconds since epoch */
      std::optional<double> elevation_gain;     /**< elevation gain in meters */
    };

    /**
     * A live ride
     */
    struct Ride
    {
      RideID id;                 /**< ride id */
      std::string fingerprint;   /**< content fingerprint used for duplicate detection */
      RideMetadata metadata;     /**< metadata given at upload */
      std::optional<double> date; /**< recording date, from metadata or first trace timestamp */
      double distance;           /**< trace length in km */
      long long upload_sequence; /**< upload order, increasing */
      CORE::Trace trace;         /**< trace geometry */
    };

    /**
     * Coverage fields of a path, owned by the coverage engine
     */
    struct PathCoverage
    {
      double coverage_fraction = 0;           /**< covered length / path length, in [0,1] */
      bool is_ridden = false;                 /**< coverage_fraction > 0 */
      double ridden_length = 0;               /**< coverage_fraction * length, km */
      std::optional<double> last_ridden_date; /**< latest known ride date */
      std::optional<RideID> last_ridden_ride; /**< ride providing last_ridden_date */
      bool operator==(const PathCoverage &rhs) const
      {
        return coverage_fraction == rhs.coverage_fraction &&
               is_ridden == rhs.is_ridden &&
               last_ridden_date == rhs.last_ridden_date &&
               last_ridden_ride == rhs.last_ridden_ride;
      }
      bool operator!=(const PathCoverage &rhs) const
      {
        return !(*this == rhs);
      }
    };

    /**
     * A path with its static attributes and its coverage
     */
    struct PathState
    {
      NETWORK::PathID id;
      std::optional<std::string> route_code;
      std::optional<std::string> name;
      std::string path_type;
      std::string area;
      CORE::LineString geom;
      double length; /**< km */
      PathCoverage coverage;
    };

    /**
     * Filter on path listing. Empty lists and unset values match all paths.
     */
    struct PathFilter
    {
      std::vector<std::string> areas;      /**< keep paths in any of these areas */
      std::vector<std::string> path_types; /**< keep paths of any of these types */
      std::optional<bool> ridden;          /**< keep ridden (true) or unridden (false) paths */
      std::optional<double> min_coverage;  /**< keep paths with coverage_fraction >= value */
      bool matches(const PathState &state) const;
    };

    /**
     * Outcome of an upload
     */
    enum class RideStatus
    {
      CREATED,   /**< ride persisted and matched */
      DUPLICATE, /**< a live ride has the same fingerprint, nothing changed */
      REJECTED   /**< ride rejected, see error code */
    };

    struct RideResult
    {
      RideStatus status = RideStatus::REJECTED;
      RideID ride_id = -1;                      /**< new ride id, or the existing ride for a duplicate */
      ErrorCode error_code = ErrorCode::SUCCESS;
      std::string message;
      std::string filename;
      std::vector<NETWORK::PathID> changed_paths; /**< paths whose coverage changed */
    };

    /**
     * Outcome of a ride deletion
     */
    enum class DeleteStatus
    {
      OK,
      NOT_FOUND
    };

    struct RideDeleteResult
    {
      DeleteStatus status = DeleteStatus::NOT_FOUND;
      std::vector<NETWORK::PathID> changed_paths;
    };

    /**
     * How an import combines with the current network
     */
    enum class ImportMode
    {
      REPLACE, /**< clear the network and coverage, then re-match all rides */
      EXTEND   /**< add paths to the current network */
    };

    enum class PathImportStatus
    {
      IMPORTED,
      REJECTED
    };

    struct PathImportOutcome
    {
      NETWORK::PathID id;
      PathImportStatus status;
      ErrorCode error_code;
      std::string message;
    };

    struct ImportResult
    {
      int imported = 0;
      int rejected = 0;
      bool unchanged = false;                     /**< identical re-import, nothing recomputed */
      std::vector<PathImportOutcome> outcomes;    /**< one per input record */
      std::vector<NETWORK::PathID> changed_paths; /**< paths whose coverage changed */
    };

    /**
     * A trace and its metadata, for batch uploads
     */
    struct RideUpload
    {
      CORE::Trace trace;
      RideMetadata metadata;
    };

  } // COVERAGE
} // TRAILCOV

#endif // TRAILCOV_COVERAGE_TYPE_HPP
