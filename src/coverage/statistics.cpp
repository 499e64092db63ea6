#include "coverage/statistics.hpp"

#include <set>

using namespace TRAILCOV::COVERAGE;

const char *const TRAILCOV::COVERAGE::UNKNOWN_GROUP = "Unknown";

namespace
{
  // Paths covered up to this fraction are counted as fully ridden
  constexpr double FULL_COVERAGE = 1.0 - 1e-9;

  const std::string &group_label(const std::string &value)
  {
    static const std::string unknown(UNKNOWN_GROUP);
    return value.empty() ? unknown : value;
  }
}

double GroupStats::coverage_ratio() const
{
  return length > 0 ? ridden_length / length : 0;
}

void GroupStats::add(const PathState &state)
{
  ++path_count;
  length += state.length;
  ridden_length += state.coverage.ridden_length;
  unridden_length += state.length - state.coverage.ridden_length;
  if (state.coverage.is_ridden)
  {
    ++ridden_count;
  }
  else
  {
    ++unridden_count;
  }
  if (state.coverage.coverage_fraction >= FULL_COVERAGE)
  {
    ++fully_ridden_count;
  }
}

StatsSummary TRAILCOV::COVERAGE::compute_statistics(const std::vector<PathState> &states)
{
  StatsSummary summary;
  for (const PathState &state : states)
  {
    summary.totals.add(state);
    summary.by_type[group_label(state.path_type)].add(state);
    summary.by_area[group_label(state.area)].add(state);
  }
  return summary;
}

std::vector<std::string> TRAILCOV::COVERAGE::distinct_areas(const std::vector<PathState> &states)
{
  std::set<std::string> values;
  for (const PathState &state : states)
  {
    if (!state.area.empty())
      values.insert(state.area);
  }
  return std::vector<std::string>(values.begin(), values.end());
}

std::vector<std::string> TRAILCOV::COVERAGE::distinct_path_types(const std::vector<PathState> &states)
{
  std::set<std::string> values;
  for (const PathState &state : states)
  {
    if (!state.path_type.empty())
      values.insert(state.path_type);
  }
  return std::vector<std::string>(values.begin(), values.end());
}
