#include "coverage/coverage_aggregator.hpp"
#include "util/debug.hpp"

#include <algorithm>
#include <stdexcept>

using namespace TRAILCOV;
using namespace TRAILCOV::NETWORK;
using namespace TRAILCOV::MM;
using namespace TRAILCOV::COVERAGE;

void CoverageAggregator::reset(const std::vector<double> &path_lengths)
{
  paths.clear();
  rides.clear();
  ride_paths.clear();
  extend(path_lengths);
}

void CoverageAggregator::extend(const std::vector<double> &path_lengths)
{
  paths.reserve(paths.size() + path_lengths.size());
  for (double length : path_lengths)
  {
    PathCoverageState state;
    state.length = length;
    paths.push_back(std::move(state));
  }
}

std::vector<PathIndex> CoverageAggregator::add_contributions(
    RideID ride, const RideStamp &stamp, const PathContributions &contributions)
{
  rides[ride] = stamp;
  std::vector<PathIndex> &touched = ride_paths[ride];
  std::vector<PathIndex> changed;
  for (const PathContribution &c : contributions)
  {
    if (c.path_index >= paths.size())
    {
      throw std::out_of_range("Contribution to unknown path index " +
                              std::to_string(c.path_index));
    }
    if (c.intervals.empty())
      continue;
    PathCoverageState &state = paths[c.path_index];
    auto iter = state.contributions.find(ride);
    if (iter == state.contributions.end())
    {
      state.contributions.emplace(ride, c.intervals);
      touched.insert(std::upper_bound(touched.begin(), touched.end(), c.path_index),
                     c.path_index);
    }
    else
    {
      iter->second.merge(c.intervals);
    }
    state.covered.merge(c.intervals);
    if (refresh(&state))
    {
      changed.push_back(c.path_index);
    }
  }
  SPDLOG_DEBUG("Ride {} contributes to {} paths, {} changed",
               ride, touched.size(), changed.size());
  return changed;
}

std::vector<PathIndex> CoverageAggregator::remove_ride(RideID ride)
{
  std::vector<PathIndex> changed;
  auto iter = ride_paths.find(ride);
  if (iter == ride_paths.end())
  {
    return changed;
  }
  // Subtracting intervals is unsafe when another ride covers the same
  // stretch, so the union is rebuilt from the remaining rides.
  for (PathIndex index : iter->second)
  {
    PathCoverageState &state = paths[index];
    state.contributions.erase(ride);
    state.covered.clear();
    for (const auto &item : state.contributions)
    {
      state.covered.merge(item.second);
    }
    if (refresh(&state))
    {
      changed.push_back(index);
    }
  }
  ride_paths.erase(iter);
  rides.erase(ride);
  return changed;
}

bool CoverageAggregator::refresh(PathCoverageState *state)
{
  PathCoverage updated;
  double covered_length = state->covered.covered_length();
  double fraction = state->length > 0 ? covered_length / state->length : 0;
  if (fraction > 1 + IntervalSet::MERGE_SLACK || fraction < 0)
  {
    SPDLOG_ERROR("Coverage fraction {} out of range, covered {} km of {} km",
                 fraction, covered_length, state->length);
  }
  fraction = std::min(1.0, std::max(0.0, fraction));
  updated.coverage_fraction = fraction;
  updated.is_ridden = fraction > 0;
  updated.ridden_length = fraction * state->length;
  // Latest known date, equal dates resolved by the latest upload
  long long best_sequence = -1;
  for (const auto &item : state->contributions)
  {
    const RideStamp &stamp = rides.at(item.first);
    if (!stamp.date.has_value())
      continue;
    if (!updated.last_ridden_date.has_value() ||
        stamp.date.value() > updated.last_ridden_date.value() ||
        (stamp.date.value() == updated.last_ridden_date.value() &&
         stamp.sequence > best_sequence))
    {
      updated.last_ridden_date = stamp.date;
      updated.last_ridden_ride = item.first;
      best_sequence = stamp.sequence;
    }
  }
  bool changed = updated != state->coverage;
  state->coverage = updated;
  return changed;
}

bool CoverageAggregator::has_ride(RideID ride) const
{
  return rides.find(ride) != rides.end();
}

std::vector<PathIndex> CoverageAggregator::get_ride_paths(RideID ride) const
{
  auto iter = ride_paths.find(ride);
  if (iter == ride_paths.end())
    return {};
  return iter->second;
}

const PathCoverage &CoverageAggregator::get_coverage(PathIndex index) const
{
  return paths.at(index).coverage;
}

const IntervalSet &CoverageAggregator::get_covered_intervals(PathIndex index) const
{
  return paths.at(index).covered;
}

int CoverageAggregator::get_path_count() const
{
  return paths.size();
}

int CoverageAggregator::get_ride_count() const
{
  return rides.size();
}
