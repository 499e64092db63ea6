/**
 * Trail coverage.
 *
 * Network class, the reference path network and its spatial index
 *
 * @version: 2026.10.19
 */

#ifndef TRAILCOV_NETWORK_HPP
#define TRAILCOV_NETWORK_HPP

#include "network/type.hpp"
#include "algorithm/geom_algorithm.hpp"

#include <string>
#include <vector>

// Data structures for Rtree
#include <boost/geometry/geometries/box.hpp>
#include <boost/geometry/index/rtree.hpp>

namespace TRAILCOV
{
  /**
   * Classes related with the path network
   */
  namespace NETWORK
  {
    /**
     * Path network class
     */
    class Network
    {
    public:
      /**
       * Box of a path segment
       */
      typedef boost::geometry::model::box<CORE::Point> boost_box;
      /**
       * Item stored in a node of Rtree
       */
      typedef std::pair<boost_box, PathSegment> Item;
      /**
       * Rtree of path segments
       */
      typedef boost::geometry::index::rtree<
          Item, boost::geometry::index::quadratic<16>>
          Rtree;
      /**
       *  Creates an empty network that can be populated using add_path.
       *  After adding all paths, call finalize() to build the spatial index.
       *
       *  @param metric distance metric used to compute path lengths
       */
      explicit Network(const ALGORITHM::DistanceMetric &metric = ALGORITHM::DistanceMetric());
      /**
       * Add a path to the network
       * @param record static attributes and geometry of the path
       * @return index of the new path
       * @throw std::invalid_argument if the id is already used or the
       * geometry is malformed (invalid coordinates, fewer than two points
       * or zero length)
       * @throw std::runtime_error if the network is finalized
       */
      PathIndex add_path(const PathRecord &record);
      /**
       * Build rtree spatial index for the network
       *
       * This must be called after all paths have been added to the network
       * and before performing any spatial queries.
       */
      void finalize();
      bool is_finalized() const;
      /**
       * Get number of paths in the network
       */
      int get_path_count() const;
      /**
       * Get number of segments indexed in the rtree
       */
      int get_segment_count() const;
      const Path &get_path(PathIndex index) const;
      const Path &get_path_by_id(const PathID &id) const;
      bool has_path(const PathID &id) const;
      /**
       * Get path index from ID
       * @throw std::out_of_range if the id is unknown
       */
      PathIndex get_path_index(const PathID &id) const;
      /**
       * Get paths in the network
       * @return a constant reference to the paths
       */
      const std::vector<Path> &get_paths() const;
      const ALGORITHM::DistanceMetric &get_metric() const;
      /**
       * Search path segments whose bounding box intersects a box.
       * The result is sorted by path index then segment index.
       */
      std::vector<PathSegment> search_segments(double minx, double miny,
                                               double maxx, double maxy) const;
      /**
       * Search path segments that may lie within radius of a point.
       * This only prunes candidates, exact distances are not checked.
       * @param x x coordinate of the point
       * @param y y coordinate of the point
       * @param radius radius in km
       */
      std::vector<PathSegment> search_segments(double x, double y,
                                               double radius) const;
      /**
       * Compute a hash of the network content (ids, attributes and
       * geometry) to detect identical re-imports
       *
       * @return 40-character hex hash string
       */
      std::string compute_hash() const;

    private:
      Rtree rtree;             // Network rtree structure
      bool finalized = false;  // Flag to prevent modifications after finalization
      std::vector<Path> paths; // all paths in the network
      PathIndexMap path_map;
      ALGORITHM::DistanceMetric metric;
    };
  }
}
#endif
