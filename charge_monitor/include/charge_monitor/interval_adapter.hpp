#pragma once

namespace charge_monitor
{

struct IntervalAdaptation
{
  int previous{0};
  int adapted{0};
  int gap{0};
  bool clamped{false};

  bool changed() const { return adapted != previous; }
};

/**
 * @brief Shortens a poll interval in proportion to the distance from a threshold.
 *
 * unit = interval / threshold (whole seconds per percentage point),
 * adapted = interval - unit * |capacity - threshold|, never below floor.
 * An interval already at or below the floor is returned unchanged, and so is
 * any interval when threshold <= 0.
 */
IntervalAdaptation adaptInterval(int interval, int threshold, int capacity, int floor);

}  // namespace charge_monitor
