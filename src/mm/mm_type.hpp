/**
 * Trail coverage.
 *
 * Definition of trace matching types
 *
 * @version: 2026.10.19
 */

#ifndef TRAILCOV_MM_TYPE_HPP
#define TRAILCOV_MM_TYPE_HPP

#include "network/type.hpp"
#include "mm/interval_set.hpp"

#include <vector>

namespace TRAILCOV
{

  /**
   * Classes related with matching traces to the path network
   */
  namespace MM
  {

    /**
     * Error codes for trace matching results
     */
    enum class MatchErrorCode : int
    {
      SUCCESS = 0,            /**< Matching succeeded, possibly with no contribution */
      MALFORMED_GEOMETRY = 1, /**< Trace geometry is empty or has invalid coordinates */
      NETWORK_NOT_READY = 2,  /**< Network spatial index has not been built */
      UNKNOWN_ERROR = 255     /**< Unknown error occurred */
    };

    /**
     * Portion of one path covered by one trace
     */
    struct PathContribution
    {
      NETWORK::PathIndex path_index; /**< index of the path in the network */
      IntervalSet intervals;         /**< merged covered arc-length intervals */
      double covered_length;         /**< total covered length in km */
    };

    typedef std::vector<PathContribution> PathContributions;

    /**
     * Result of matching one trace against the network
     */
    struct MatchResult
    {
      MatchErrorCode error_code = MatchErrorCode::UNKNOWN_ERROR; /**< SUCCESS or reason for failure */
      PathContributions contributions;                          /**< sorted by path index */
      int credited_steps = 0;                                   /**< number of densified steps credited to a path */
      int skipped_gaps = 0;                                     /**< trace segments skipped as recording breaks */
    };

  };

};

#endif // TRAILCOV_MM_TYPE_HPP
