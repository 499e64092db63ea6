#include "network/network.hpp"
#include "util/debug.hpp"
#include "util/util.hpp"

#include <algorithm>
#include <iterator>
#include <stdexcept>

#include <boost/uuid/detail/sha1.hpp>

using namespace TRAILCOV;
using namespace TRAILCOV::CORE;
using namespace TRAILCOV::NETWORK;

namespace
{
  void hash_string(boost::uuids::detail::sha1 *sha1, const std::string &str)
  {
    std::size_t size = str.size();
    sha1->process_bytes(&size, sizeof(size));
    sha1->process_bytes(str.data(), size);
  }

  void hash_optional(boost::uuids::detail::sha1 *sha1,
                     const std::optional<std::string> &str)
  {
    char flag = str.has_value() ? 1 : 0;
    sha1->process_bytes(&flag, sizeof(flag));
    if (str.has_value())
      hash_string(sha1, str.value());
  }
}

Network::Network(const ALGORITHM::DistanceMetric &metric_arg) : metric(metric_arg)
{
  SPDLOG_DEBUG("Created empty network");
}

PathIndex Network::add_path(const PathRecord &record)
{
  if (finalized)
  {
    throw std::runtime_error("Cannot add path to finalized network. Network is frozen after finalize().");
  }
  if (path_map.find(record.id) != path_map.end())
  {
    throw std::invalid_argument("Duplicate path id " + record.id);
  }
  std::string reason;
  if (!ALGORITHM::validate_geometry(record.geom, metric.crs, &reason))
  {
    throw std::invalid_argument("Path " + record.id + ": " + reason);
  }
  if (record.geom.get_num_points() < 2)
  {
    throw std::invalid_argument("Path " + record.id + ": geometry must have at least 2 points");
  }
  std::vector<double> offsets = ALGORITHM::cumulative_lengths(record.geom, metric);
  double length = offsets.back();
  if (!(length > 0))
  {
    throw std::invalid_argument("Path " + record.id + ": geometry has zero length");
  }
  PathIndex index = paths.size();
  paths.push_back({index, record.id, record.route_code, record.name,
                   record.path_type, record.area, record.geom, length,
                   std::move(offsets)});
  path_map.insert({record.id, index});
  return index;
}

int Network::get_path_count() const
{
  return paths.size();
}

int Network::get_segment_count() const
{
  return rtree.size();
}

const std::vector<Path> &Network::get_paths() const
{
  return paths;
}

const Path &Network::get_path(PathIndex index) const
{
  return paths.at(index);
}

const Path &Network::get_path_by_id(const PathID &id) const
{
  return paths[get_path_index(id)];
}

bool Network::has_path(const PathID &id) const
{
  return path_map.find(id) != path_map.end();
}

PathIndex Network::get_path_index(const PathID &id) const
{
  return path_map.at(id);
}

const ALGORITHM::DistanceMetric &Network::get_metric() const
{
  return metric;
}

bool Network::is_finalized() const
{
  return finalized;
}

// Construct a Rtree using the segments of every path
void Network::finalize()
{
  if (paths.empty())
  {
    SPDLOG_WARN("Building rtree index on an empty network");
  }
  SPDLOG_DEBUG("Create boost rtree");
  std::vector<Item> items;
  for (const Path &path : paths)
  {
    int Npoints = path.geom.get_num_points();
    for (int i = 0; i < Npoints - 1; ++i)
    {
      double x1 = path.geom.get_x(i);
      double y1 = path.geom.get_y(i);
      double x2 = path.geom.get_x(i + 1);
      double y2 = path.geom.get_y(i + 1);
      boost_box b(Point(std::min(x1, x2), std::min(y1, y2)),
                  Point(std::max(x1, x2), std::max(y1, y2)));
      items.push_back(std::make_pair(b, PathSegment{path.index, i}));
    }
  }
  // Packing constructor, bulk loading is faster than repeated insert
  rtree = Rtree(items.begin(), items.end());
  finalized = true;
  SPDLOG_DEBUG("Create boost rtree done");
  SPDLOG_INFO("Network finalized with {} paths and {} segments",
              paths.size(), rtree.size());
}

std::vector<PathSegment> Network::search_segments(double minx, double miny,
                                                  double maxx, double maxy) const
{
  if (!finalized)
  {
    throw std::runtime_error("Spatial index not built. Call finalize() after adding all paths to the network.");
  }
  boost_box b(Point(minx, miny), Point(maxx, maxy));
  std::vector<Item> temp;
  // Rtree can only detect intersect with the bounding box of
  // the segment stored.
  rtree.query(boost::geometry::index::intersects(b), std::back_inserter(temp));
  std::vector<PathSegment> result;
  result.reserve(temp.size());
  for (const Item &item : temp)
  {
    result.push_back(item.second);
  }
  std::sort(result.begin(), result.end(),
            [](const PathSegment &a, const PathSegment &b)
            {
              return a.path != b.path ? a.path < b.path : a.segment < b.segment;
            });
  return result;
}

std::vector<PathSegment> Network::search_segments(double x, double y,
                                                  double radius) const
{
  double dx, dy;
  metric.buffer_extent(radius, y, &dx, &dy);
  return search_segments(x - dx, y - dy, x + dx, y + dy);
}

std::string Network::compute_hash() const
{
  boost::uuids::detail::sha1 sha1;

  int path_count = paths.size();
  sha1.process_bytes(&path_count, sizeof(path_count));
  int crs = static_cast<int>(metric.crs);
  sha1.process_bytes(&crs, sizeof(crs));
  sha1.process_bytes(&metric.planar_unit_km, sizeof(metric.planar_unit_km));

  for (const Path &path : paths)
  {
    hash_string(&sha1, path.id);
    hash_optional(&sha1, path.route_code);
    hash_optional(&sha1, path.name);
    hash_string(&sha1, path.path_type);
    hash_string(&sha1, path.area);
    int num_points = path.geom.get_num_points();
    sha1.process_bytes(&num_points, sizeof(num_points));
    for (int j = 0; j < num_points; ++j)
    {
      double x = path.geom.get_x(j);
      double y = path.geom.get_y(j);
      sha1.process_bytes(&x, sizeof(x));
      sha1.process_bytes(&y, sizeof(y));
    }
  }
  return UTIL::sha1_hexdigest(&sha1);
}
