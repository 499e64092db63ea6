#include "mm/interval_set.hpp"

#include <algorithm>
#include <iterator>

using namespace TRAILCOV::MM;

void IntervalSet::insert(double a, double b)
{
  Interval in{std::min(a, b), std::max(a, b)};
  // First stored interval that may touch the new one
  auto first = std::lower_bound(
      intervals.begin(), intervals.end(), in.start,
      [](const Interval &iv, double value)
      { return iv.end + MERGE_SLACK < value; });
  auto last = first;
  while (last != intervals.end() && last->start <= in.end + MERGE_SLACK)
  {
    in.start = std::min(in.start, last->start);
    in.end = std::max(in.end, last->end);
    ++last;
  }
  first = intervals.erase(first, last);
  intervals.insert(first, in);
}

void IntervalSet::merge(const IntervalSet &other)
{
  for (const Interval &iv : other.intervals)
  {
    insert(iv.start, iv.end);
  }
}

void IntervalSet::clamp(double lower, double upper)
{
  std::vector<Interval> result;
  for (const Interval &iv : intervals)
  {
    double s = std::max(iv.start, lower);
    double e = std::min(iv.end, upper);
    if (s < e)
      result.push_back({s, e});
  }
  intervals.swap(result);
}

double IntervalSet::covered_length() const
{
  double total = 0;
  for (const Interval &iv : intervals)
  {
    total += iv.length();
  }
  return total;
}

const std::vector<Interval> &IntervalSet::get_intervals() const
{
  return intervals;
}

bool IntervalSet::empty() const
{
  return intervals.empty();
}

int IntervalSet::size() const
{
  return intervals.size();
}

void IntervalSet::clear()
{
  intervals.clear();
}

bool IntervalSet::operator==(const IntervalSet &rhs) const
{
  return intervals == rhs.intervals;
}

bool IntervalSet::operator!=(const IntervalSet &rhs) const
{
  return !(*this == rhs);
}
