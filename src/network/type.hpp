/**
 * Trail coverage.
 *
 * Definition of data types of the path network
 *
 * @version: 2026.10.19
 */

#ifndef TRAILCOV_NETWORK_TYPE_HPP
#define TRAILCOV_NETWORK_TYPE_HPP

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "core/geometry.hpp"

namespace TRAILCOV
{
  namespace NETWORK
  {

    typedef std::string PathID;     /**< Path ID, derived from the source feature id */
    typedef unsigned int PathIndex; /**< Path Index in the network, range
                                     from [0,num_paths-1 ]*/

    /**
     * Map of path index
     */
    typedef std::unordered_map<PathID, PathIndex> PathIndexMap;

    /**
     * Static attributes of a path as handed over by the import layer
     */
    struct PathRecord
    {
      PathID id;                             /**< stable identifier, unique in the network */
      std::optional<std::string> route_code; /**< route code, e.g. "BW 12" */
      std::optional<std::string> name;       /**< path name */
      std::string path_type;                 /**< Footpath, Bridleway, Restricted Byway, BOAT, ... */
      std::string area;                      /**< grouping label */
      CORE::LineString geom;                 /**< path geometry */
    };

    /**
     * Path of the reference network
     */
    struct Path
    {
      PathIndex index;                       /**< Index of a path, which is continuous [0,N-1] */
      PathID id;                             /**< Path ID */
      std::optional<std::string> route_code; /**< route code */
      std::optional<std::string> name;       /**< name */
      std::string path_type;                 /**< type of path */
      std::string area;                      /**< area label */
      CORE::LineString geom;                 /**< the path geometry */
      double length;                         /**< length of the path polyline in km */
      std::vector<double> vertex_offsets;    /**< arc length from the start of the path to each vertex */
    };

    /**
     * Reference to one segment (pair of consecutive vertices) of a path
     */
    struct PathSegment
    {
      PathIndex path;  /**< index of the path */
      int segment;     /**< segment index, from vertex segment to segment+1 */
      bool operator==(const PathSegment &rhs) const
      {
        return path == rhs.path && segment == rhs.segment;
      }
    };

  } // NETWORK
} // TRAILCOV
#endif /* TRAILCOV_NETWORK_TYPE_HPP */
