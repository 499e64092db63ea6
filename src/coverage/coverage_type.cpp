#include "coverage/coverage_type.hpp"

#include <algorithm>

using namespace TRAILCOV::COVERAGE;

const char *TRAILCOV::COVERAGE::error_code_name(ErrorCode code)
{
  switch (code)
  {
  case ErrorCode::SUCCESS:
    return "SUCCESS";
  case ErrorCode::MALFORMED_GEOMETRY:
    return "MALFORMED_GEOMETRY";
  case ErrorCode::DUPLICATE_RIDE:
    return "DUPLICATE_RIDE";
  case ErrorCode::DUPLICATE_PATH:
    return "DUPLICATE_PATH";
  case ErrorCode::UNKNOWN_PATH:
    return "UNKNOWN_PATH";
  case ErrorCode::UNKNOWN_RIDE:
    return "UNKNOWN_RIDE";
  case ErrorCode::NETWORK_NOT_LOADED:
    return "NETWORK_NOT_LOADED";
  }
  return "UNKNOWN";
}

bool PathFilter::matches(const PathState &state) const
{
  if (!areas.empty() &&
      std::find(areas.begin(), areas.end(), state.area) == areas.end())
    return false;
  if (!path_types.empty() &&
      std::find(path_types.begin(), path_types.end(), state.path_type) == path_types.end())
    return false;
  if (ridden.has_value() && state.coverage.is_ridden != ridden.value())
    return false;
  if (min_coverage.has_value() && state.coverage.coverage_fraction < min_coverage.value())
    return false;
  return true;
}
