#include <charge_monitor/interval_adapter.hpp>

#include <cstdlib>

namespace charge_monitor
{

IntervalAdaptation adaptInterval(
  const int interval, const int threshold, const int capacity, const int floor)
{
  IntervalAdaptation result;
  result.previous = interval;
  result.adapted = interval;
  result.gap = std::abs(capacity - threshold);

  if (threshold <= 0 || interval <= floor) {
    return result;
  }

  const int unit = interval / threshold;
  const int shortened = interval - unit * result.gap;
  if (shortened < floor) {
    result.adapted = floor;
    result.clamped = true;
  } else {
    result.adapted = shortened;
  }
  return result;
}

}  // namespace charge_monitor
