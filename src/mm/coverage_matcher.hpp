/**
 * Trail coverage.
 *
 * Trace to network coverage matching algorithm and its configuration
 *
 * @version: 2026.10.19
 */

#ifndef TRAILCOV_COVERAGE_MATCHER_HPP
#define TRAILCOV_COVERAGE_MATCHER_HPP

#include "network/network.hpp"
#include "core/gps.hpp"
#include "mm/mm_type.hpp"

#include <map>
#include <string>
#include <boost/property_tree/ptree.hpp>

namespace TRAILCOV
{
  namespace MM
  {
    /**
     * Configuration of the coverage matching algorithm
     */
    struct CoverageConfig
    {
      /**
       * Constructor of coverage matching configuration
       * @param tolerance_arg maximum distance in km between a trace and a
       * path for the path to be considered ridden
       * @param max_gap_arg trace segments longer than this (km) are treated
       * as recording breaks and never credited
       * @param max_step_arg densification step in km, a value <= 0 means
       * the tolerance is used
       * @param crs_arg coordinate system of network and trace coordinates
       * @param planar_unit_km_arg km per coordinate unit in PLANAR mode
       */
      CoverageConfig(double tolerance_arg = 0.025, double max_gap_arg = 0.5,
                     double max_step_arg = 0,
                     ALGORITHM::CoordinateSystem crs_arg = ALGORITHM::CoordinateSystem::GEOGRAPHIC,
                     double planar_unit_km_arg = 1.0);
      double tolerance;                              /**< matching tolerance, km */
      double max_gap;                                /**< longest interpolated trace segment, km */
      double max_step;                               /**< densification step, km */
      ALGORITHM::CoordinateSystem coordinate_system; /**< coordinate system */
      double planar_unit_km;                         /**< km per planar unit */

      /**
       * Densification step actually used by the matcher
       */
      double get_step() const;
      /**
       * Distance metric for the configured coordinate system
       */
      ALGORITHM::DistanceMetric get_metric() const;
      /**
       * Check the validity of the configuration
       */
      bool validate() const;
      /**
       * Print information about this configuration
       */
      void print() const;
      /**
       * Load configuration from a property tree, with keys under
       * config.parameters
       * @param data property tree read from xml or json
       */
      static CoverageConfig load_from_ptree(const boost::property_tree::ptree &data);
      /**
       * Load configuration from a xml or json file
       * @param filename configuration file name
       */
      static CoverageConfig load_from_file(const std::string &filename);
    };

    /**
     * Parse a coordinate system name, "geographic" or "planar"
     * @throw std::invalid_argument for any other name
     */
    ALGORITHM::CoordinateSystem parse_coordinate_system(const std::string &name);

    /**
     * Coverage matcher: finds the stretches of paths ridden by one trace.
     *
     * The matcher only reads the network, so a single instance can be
     * shared by several threads.
     */
    class CoverageMatcher
    {
    public:
      /**
       * @param network finalized path network
       * @param config matching configuration
       */
      CoverageMatcher(const NETWORK::Network &network, const CoverageConfig &config)
          : network_(network), config_(config) {};
      /**
       * Match a trace to the path network
       * @param trace input trace
       * @return per path covered intervals, sorted by path index
       */
      MatchResult match_trace(const CORE::Trace &trace) const;

    protected:
      /**
       * Credit the path stretches within tolerance of both ends of one
       * densified step of a trace
       * @param ux,uy start of the step
       * @param vx,vy end of the step
       * @param step_length length of the step in km
       * @param hits covered intervals per path, updated
       * @return number of paths credited
       */
      int credit_step(double ux, double uy, double vx, double vy,
                      double step_length,
                      std::map<NETWORK::PathIndex, IntervalSet> *hits) const;

    private:
      const NETWORK::Network &network_;
      const CoverageConfig config_;
    }; // CoverageMatcher
  }
} // TRAILCOV

#endif // TRAILCOV_COVERAGE_MATCHER_HPP
