#include "coverage/coverage_engine.hpp"
#include "algorithm/geom_algorithm.hpp"
#include "util/debug.hpp"
#include "util/util.hpp"

#include <algorithm>
#include <cmath>
#include <mutex>
#include <stdexcept>

#include <boost/uuid/detail/sha1.hpp>

using namespace TRAILCOV;
using namespace TRAILCOV::CORE;
using namespace TRAILCOV::NETWORK;
using namespace TRAILCOV::MM;
using namespace TRAILCOV::COVERAGE;

CoverageEngine::CoverageEngine(const CoverageConfig &config) : config_(config)
{
  if (!config_.validate())
  {
    throw std::invalid_argument("Invalid coverage configuration");
  }
}

ImportResult CoverageEngine::import_network(const std::vector<PathRecord> &records,
                                            ImportMode mode)
{
  std::unique_lock<std::shared_mutex> lock(mutex_);
  UTIL::TimePoint begin = UTIL::get_current_time();
  bool extend = (mode == ImportMode::EXTEND && network_ != nullptr);
  SPDLOG_INFO("Import {} paths, mode {}", records.size(), extend ? "extend" : "replace");
  ImportResult result;
  auto network = std::make_unique<Network>(config_.get_metric());
  PathIndex first_new = 0;
  if (extend)
  {
    for (const Path &path : network_->get_paths())
    {
      network->add_path({path.id, path.route_code, path.name,
                         path.path_type, path.area, path.geom});
    }
    first_new = network->get_path_count();
  }
  for (const PathRecord &record : records)
  {
    if (network->has_path(record.id))
    {
      SPDLOG_WARN("Path {} rejected: duplicate id", record.id);
      result.outcomes.push_back({record.id, PathImportStatus::REJECTED,
                                 ErrorCode::DUPLICATE_PATH, "duplicate path id"});
      ++result.rejected;
      continue;
    }
    try
    {
      network->add_path(record);
      result.outcomes.push_back({record.id, PathImportStatus::IMPORTED,
                                 ErrorCode::SUCCESS, ""});
      ++result.imported;
    }
    catch (const std::invalid_argument &e)
    {
      SPDLOG_WARN("Path {} rejected: {}", record.id, e.what());
      result.outcomes.push_back({record.id, PathImportStatus::REJECTED,
                                 ErrorCode::MALFORMED_GEOMETRY, e.what()});
      ++result.rejected;
    }
  }
  network->finalize();
  std::string hash = network->compute_hash();
  if (network_ != nullptr && hash == network_hash_)
  {
    SPDLOG_INFO("Imported network is identical to the current one, coverage unchanged");
    result.unchanged = true;
    return result;
  }
  auto before = snapshot_coverage();
  network_ = std::move(network);
  network_hash_ = hash;
  if (extend)
  {
    aggregator_.extend(path_lengths(first_new));
  }
  else
  {
    aggregator_.reset(path_lengths(0));
  }
  match_all_rides(first_new);
  result.changed_paths = diff_coverage(before);
  UTIL::TimePoint end = UTIL::get_current_time();
  SPDLOG_INFO("Import done: {} imported, {} rejected, {} paths changed, {} rides matched in {} seconds",
              result.imported, result.rejected, result.changed_paths.size(),
              rides_.size(), UTIL::get_duration(begin, end));
  return result;
}

RideResult CoverageEngine::add_ride(const Trace &trace, const RideMetadata &metadata)
{
  std::unique_lock<std::shared_mutex> lock(mutex_);
  RideResult result = insert_ride(next_ride_id_, trace, metadata);
  if (result.status == RideStatus::CREATED)
  {
    ++next_ride_id_;
  }
  return result;
}

std::vector<RideResult> CoverageEngine::add_rides(const std::vector<RideUpload> &uploads)
{
  std::vector<RideResult> results;
  results.reserve(uploads.size());
  int created = 0, duplicates = 0, rejected = 0;
  for (const RideUpload &upload : uploads)
  {
    results.push_back(add_ride(upload.trace, upload.metadata));
    switch (results.back().status)
    {
    case RideStatus::CREATED:
      ++created;
      break;
    case RideStatus::DUPLICATE:
      ++duplicates;
      break;
    case RideStatus::REJECTED:
      ++rejected;
      break;
    }
  }
  SPDLOG_INFO("Batch upload of {} rides: {} created, {} duplicates, {} rejected",
              uploads.size(), created, duplicates, rejected);
  return results;
}

RideResult CoverageEngine::restore_ride(RideID id, const Trace &trace,
                                        const RideMetadata &metadata)
{
  if (id < 1)
  {
    throw std::invalid_argument("Ride id should be positive");
  }
  std::unique_lock<std::shared_mutex> lock(mutex_);
  if (rides_.find(id) != rides_.end())
  {
    SPDLOG_WARN("Ride {} not restored: id already in use", id);
    RideResult result;
    result.status = RideStatus::REJECTED;
    result.ride_id = id;
    result.error_code = ErrorCode::DUPLICATE_RIDE;
    result.message = "ride id already in use";
    result.filename = metadata.filename;
    return result;
  }
  RideResult result = insert_ride(id, trace, metadata);
  if (result.status == RideStatus::CREATED)
  {
    next_ride_id_ = std::max(next_ride_id_, id + 1);
  }
  return result;
}

RideResult CoverageEngine::insert_ride(RideID id, const Trace &trace,
                                       const RideMetadata &metadata)
{
  RideResult result;
  result.filename = metadata.filename;
  std::string reason;
  if (!ALGORITHM::validate_geometry(trace.geom, config_.coordinate_system, &reason))
  {
    SPDLOG_WARN("Ride {} rejected: {}", metadata.filename, reason);
    result.status = RideStatus::REJECTED;
    result.error_code = ErrorCode::MALFORMED_GEOMETRY;
    result.message = reason;
    return result;
  }
  std::string fingerprint = compute_fingerprint(trace);
  auto duplicate = fingerprints_.find(fingerprint);
  if (duplicate != fingerprints_.end())
  {
    SPDLOG_INFO("Ride {} is a duplicate of ride {}", metadata.filename, duplicate->second);
    result.status = RideStatus::DUPLICATE;
    result.ride_id = duplicate->second;
    result.error_code = ErrorCode::DUPLICATE_RIDE;
    result.message = "duplicate of ride " + std::to_string(duplicate->second);
    return result;
  }
  Ride ride{id, fingerprint, metadata,
            metadata.date_recorded.has_value() ? metadata.date_recorded : trace.start_time(),
            config_.get_metric().length(trace.geom), next_sequence_, trace};
  MatchResult match;
  if (network_ != nullptr)
  {
    CoverageMatcher matcher(*network_, config_);
    match = matcher.match_trace(trace);
    if (match.error_code != MatchErrorCode::SUCCESS)
    {
      SPDLOG_WARN("Ride {} rejected: matching failed with code {}",
                  metadata.filename, static_cast<int>(match.error_code));
      result.status = RideStatus::REJECTED;
      result.error_code = ErrorCode::MALFORMED_GEOMETRY;
      result.message = "trace could not be matched";
      return result;
    }
  }
  ++next_sequence_;
  rides_.emplace(id, std::move(ride));
  fingerprints_.emplace(fingerprint, id);
  if (network_ != nullptr)
  {
    const Ride &stored = rides_.at(id);
    std::vector<PathIndex> changed = aggregator_.add_contributions(
        id, RideStamp{stored.date, stored.upload_sequence}, match.contributions);
    result.changed_paths = to_path_ids(changed);
  }
  result.status = RideStatus::CREATED;
  result.ride_id = id;
  SPDLOG_INFO("Ride {} created from {}, {} points, {} paths changed",
              id, metadata.filename, trace.size(), result.changed_paths.size());
  return result;
}

RideDeleteResult CoverageEngine::delete_ride(RideID id)
{
  std::unique_lock<std::shared_mutex> lock(mutex_);
  RideDeleteResult result;
  auto iter = rides_.find(id);
  if (iter == rides_.end())
  {
    SPDLOG_WARN("Ride {} not found", id);
    result.status = DeleteStatus::NOT_FOUND;
    return result;
  }
  if (network_ != nullptr)
  {
    result.changed_paths = to_path_ids(aggregator_.remove_ride(id));
  }
  fingerprints_.erase(iter->second.fingerprint);
  rides_.erase(iter);
  result.status = DeleteStatus::OK;
  SPDLOG_INFO("Ride {} deleted, {} paths changed", id, result.changed_paths.size());
  return result;
}

std::vector<PathID> CoverageEngine::recompute_all()
{
  std::unique_lock<std::shared_mutex> lock(mutex_);
  if (network_ == nullptr)
  {
    return {};
  }
  auto before = snapshot_coverage();
  aggregator_.reset(path_lengths(0));
  match_all_rides(0);
  std::vector<PathID> changed = diff_coverage(before);
  if (!changed.empty())
  {
    SPDLOG_WARN("Full recompute changed {} paths: {}", changed.size(), changed);
  }
  else
  {
    SPDLOG_INFO("Full recompute of {} rides, coverage unchanged", rides_.size());
  }
  return changed;
}

void CoverageEngine::match_all_rides(PathIndex first_path)
{
  std::vector<const Ride *> live;
  live.reserve(rides_.size());
  for (const auto &item : rides_)
  {
    live.push_back(&item.second);
  }
  int n = live.size();
  std::vector<MatchResult> results(n);
  CoverageMatcher matcher(*network_, config_);
  // The index is read only, rides are matched independently
#pragma omp parallel for schedule(dynamic)
  for (int i = 0; i < n; ++i)
  {
    results[i] = matcher.match_trace(live[i]->trace);
  }
  for (int i = 0; i < n; ++i)
  {
    const Ride &ride = *live[i];
    if (results[i].error_code != MatchErrorCode::SUCCESS)
    {
      SPDLOG_ERROR("Ride {} could not be matched, error {}",
                   ride.id, static_cast<int>(results[i].error_code));
    }
    PathContributions contributions;
    for (PathContribution &c : results[i].contributions)
    {
      if (c.path_index >= first_path)
      {
        contributions.push_back(std::move(c));
      }
    }
    aggregator_.add_contributions(ride.id, RideStamp{ride.date, ride.upload_sequence},
                                  contributions);
  }
}

void CoverageEngine::check_loaded() const
{
  if (network_ == nullptr)
  {
    throw CoverageError(ErrorCode::NETWORK_NOT_LOADED, "No path network imported");
  }
}

PathState CoverageEngine::make_state(PathIndex index, bool with_geometry) const
{
  const Path &path = network_->get_path(index);
  PathState state;
  state.id = path.id;
  state.route_code = path.route_code;
  state.name = path.name;
  state.path_type = path.path_type;
  state.area = path.area;
  if (with_geometry)
  {
    state.geom = path.geom;
  }
  state.length = path.length;
  state.coverage = aggregator_.get_coverage(index);
  return state;
}

std::vector<PathState> CoverageEngine::all_states(bool with_geometry) const
{
  std::vector<PathState> states;
  int n = network_->get_path_count();
  states.reserve(n);
  for (int i = 0; i < n; ++i)
  {
    states.push_back(make_state(i, with_geometry));
  }
  return states;
}

std::vector<PathState> CoverageEngine::get_path_state(const PathFilter &filter) const
{
  std::shared_lock<std::shared_mutex> lock(mutex_);
  check_loaded();
  std::vector<PathState> states;
  int n = network_->get_path_count();
  for (int i = 0; i < n; ++i)
  {
    PathState state = make_state(i, false);
    if (filter.matches(state))
    {
      state.geom = network_->get_path(i).geom;
      states.push_back(std::move(state));
    }
  }
  return states;
}

PathState CoverageEngine::get_path(const PathID &id) const
{
  std::shared_lock<std::shared_mutex> lock(mutex_);
  check_loaded();
  if (!network_->has_path(id))
  {
    throw CoverageError(ErrorCode::UNKNOWN_PATH, "Unknown path " + id);
  }
  return make_state(network_->get_path_index(id), true);
}

StatsSummary CoverageEngine::get_statistics() const
{
  std::shared_lock<std::shared_mutex> lock(mutex_);
  check_loaded();
  return compute_statistics(all_states(false));
}

std::vector<std::string> CoverageEngine::get_areas() const
{
  std::shared_lock<std::shared_mutex> lock(mutex_);
  check_loaded();
  return distinct_areas(all_states(false));
}

std::vector<std::string> CoverageEngine::get_path_types() const
{
  std::shared_lock<std::shared_mutex> lock(mutex_);
  check_loaded();
  return distinct_path_types(all_states(false));
}

Ride CoverageEngine::get_ride(RideID id) const
{
  std::shared_lock<std::shared_mutex> lock(mutex_);
  auto iter = rides_.find(id);
  if (iter == rides_.end())
  {
    throw CoverageError(ErrorCode::UNKNOWN_RIDE, "Unknown ride " + std::to_string(id));
  }
  return iter->second;
}

std::vector<Ride> CoverageEngine::get_rides() const
{
  std::shared_lock<std::shared_mutex> lock(mutex_);
  std::vector<Ride> result;
  result.reserve(rides_.size());
  for (const auto &item : rides_)
  {
    result.push_back(item.second);
  }
  return result;
}

std::vector<PathID> CoverageEngine::get_ride_paths(RideID id) const
{
  std::shared_lock<std::shared_mutex> lock(mutex_);
  if (rides_.find(id) == rides_.end())
  {
    throw CoverageError(ErrorCode::UNKNOWN_RIDE, "Unknown ride " + std::to_string(id));
  }
  if (network_ == nullptr)
  {
    return {};
  }
  return to_path_ids(aggregator_.get_ride_paths(id));
}

int CoverageEngine::get_ride_count() const
{
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return rides_.size();
}

int CoverageEngine::get_path_count() const
{
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return network_ == nullptr ? 0 : network_->get_path_count();
}

bool CoverageEngine::is_network_loaded() const
{
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return network_ != nullptr;
}

std::string CoverageEngine::get_network_hash() const
{
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return network_hash_;
}

const CoverageConfig &CoverageEngine::get_config() const
{
  return config_;
}

std::vector<PathID> CoverageEngine::to_path_ids(const std::vector<PathIndex> &indices) const
{
  std::vector<PathID> ids;
  ids.reserve(indices.size());
  for (PathIndex index : indices)
  {
    ids.push_back(network_->get_path(index).id);
  }
  return ids;
}

std::vector<double> CoverageEngine::path_lengths(PathIndex first_path) const
{
  std::vector<double> lengths;
  const std::vector<Path> &paths = network_->get_paths();
  for (std::size_t i = first_path; i < paths.size(); ++i)
  {
    lengths.push_back(paths[i].length);
  }
  return lengths;
}

std::unordered_map<PathID, PathCoverage> CoverageEngine::snapshot_coverage() const
{
  std::unordered_map<PathID, PathCoverage> snapshot;
  if (network_ == nullptr)
    return snapshot;
  for (const Path &path : network_->get_paths())
  {
    snapshot.emplace(path.id, aggregator_.get_coverage(path.index));
  }
  return snapshot;
}

std::vector<PathID> CoverageEngine::diff_coverage(
    const std::unordered_map<PathID, PathCoverage> &before) const
{
  std::vector<PathID> changed;
  const PathCoverage empty;
  for (const Path &path : network_->get_paths())
  {
    auto iter = before.find(path.id);
    const PathCoverage &old = iter == before.end() ? empty : iter->second;
    if (aggregator_.get_coverage(path.index) != old)
    {
      changed.push_back(path.id);
    }
  }
  return changed;
}

std::string CoverageEngine::compute_fingerprint(const Trace &trace)
{
  boost::uuids::detail::sha1 sha1;
  int num_points = trace.geom.get_num_points();
  sha1.process_bytes(&num_points, sizeof(num_points));
  for (int i = 0; i < num_points; ++i)
  {
    // GPX files store 7 decimals
    long long x = std::llround(trace.geom.get_x(i) * 1e7);
    long long y = std::llround(trace.geom.get_y(i) * 1e7);
    sha1.process_bytes(&x, sizeof(x));
    sha1.process_bytes(&y, sizeof(y));
  }
  std::optional<double> start = trace.start_time();
  char timed = start.has_value() ? 1 : 0;
  sha1.process_bytes(&timed, sizeof(timed));
  if (start.has_value())
  {
    long long t = std::llround(start.value() * 1000);
    sha1.process_bytes(&t, sizeof(t));
  }
  return UTIL::sha1_hexdigest(&sha1);
}
