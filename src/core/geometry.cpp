#include "core/geometry.hpp"

#include <boost/geometry.hpp>
#include <boost/geometry/geometries/geometries.hpp>
#include <iomanip>

std::ostream &TRAILCOV::CORE::operator<<(std::ostream &os,
                                         const TRAILCOV::CORE::LineString &rhs)
{
  os << std::setprecision(12) << boost::geometry::wkt(rhs.line);
  return os;
};

TRAILCOV::CORE::LineString TRAILCOV::CORE::wkt2linestring(const std::string &wkt)
{
  TRAILCOV::CORE::LineString line;
  boost::geometry::read_wkt(wkt, line.get_geometry());
  return line;
};
