#pragma once

#include <string>

namespace charge_monitor
{

/**
 * @struct BatterySnapshot
 * @brief One reading of the power source, produced once per poll.
 *
 * Capacities are in mAh, voltage in mV, current in mA (negative while
 * discharging) and the two time estimates in minutes, -1 when the source
 * cannot tell.
 */
struct BatterySnapshot
{
  int capacityPercent{0};
  bool charging{false};
  bool plugged{false};
  int cycleCount{0};
  int designCapacity{0};
  int maxCapacity{0};
  int voltage{0};
  int current{0};
  int timeToFull{-1};
  int timeToEmpty{-1};
  int healthPercent{0};
};

/// maxCapacity * 100 / designCapacity, or 0 when the design capacity is unknown.
int computeHealthPercent(int maxCapacity, int designCapacity);

/// Fills healthPercent from the capacities and returns the completed snapshot.
BatterySnapshot finalizeSnapshot(BatterySnapshot snapshot);

/// Empty when the snapshot is plausible, otherwise the rejection reason.
std::string snapshotRejectionReason(const BatterySnapshot & snapshot);

}  // namespace charge_monitor
