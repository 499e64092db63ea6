/**
 * Trail coverage.
 *
 * Logging setup shared by all modules
 *
 * @version: 2026.10.19
 */

#ifndef TRAILCOV_DEBUG_HPP
#define TRAILCOV_DEBUG_HPP

#ifndef SPDLOG_ACTIVE_LEVEL
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_TRACE
#endif

#include "spdlog/spdlog.h"
#include "spdlog/fmt/ranges.h"

#endif // TRAILCOV_DEBUG_HPP
