/**
 * Trail coverage.
 *
 * Utility functions
 *
 * @version: 2026.10.19
 */

#ifndef TRAILCOV_UTIL_HPP
#define TRAILCOV_UTIL_HPP

#include <chrono>
#include <string>
#include <vector>

#include <boost/uuid/detail/sha1.hpp>

namespace TRAILCOV
{
  /**
   * Utility functions
   */
  namespace UTIL
  {
    /**
     * Type of time stamp
     */
    typedef std::chrono::steady_clock::time_point TimePoint;

    /**
     * Get current time
     * @return current time
     */
    TimePoint get_current_time();

    /**
     * Calculate the duration between two timepoints
     * @param t1 start time
     * @param t2 end time
     * @return duration in seconds
     */
    double get_duration(const TimePoint &t1, const TimePoint &t2);

    /**
     * Check if a file exists
     * @param filename file name
     * @return true if the file exists
     */
    bool file_exists(const std::string &filename);

    /**
     * Split a string with comma as delimiter
     */
    std::vector<std::string> split_string(const std::string &str);

    /**
     * Check if the extension of a file is in a list of extensions
     * @param filename file name
     * @param extension_list_str a list of extensions separated by comma,
     * e.g. "xml,json"
     * @return true if the extension is found
     */
    bool check_file_extension(const std::string &filename,
                              const std::string &extension_list_str);

    /**
     * Finish a sha1 computation and format the digest as 40 lower case
     * hex characters
     * @param sha1 sha1 state, consumed by this call
     * @return hex digest
     */
    std::string sha1_hexdigest(boost::uuids::detail::sha1 *sha1);

  } // UTIL
} // TRAILCOV

#endif // TRAILCOV_UTIL_HPP
