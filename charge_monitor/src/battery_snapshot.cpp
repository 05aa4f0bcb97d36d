#include <charge_monitor/battery_snapshot.hpp>

#include <limits>
#include <sstream>

namespace charge_monitor
{

int computeHealthPercent(const int maxCapacity, const int designCapacity)
{
  if (designCapacity <= 0) {
    return 0;
  }
  const double health = static_cast<double>(maxCapacity) * 100.0 / designCapacity;
  if (health < 0.0 || health > static_cast<double>(std::numeric_limits<int>::max())) {
    return 0;
  }
  return static_cast<int>(health);
}

BatterySnapshot finalizeSnapshot(BatterySnapshot snapshot)
{
  snapshot.healthPercent = computeHealthPercent(snapshot.maxCapacity, snapshot.designCapacity);
  return snapshot;
}

std::string snapshotRejectionReason(const BatterySnapshot & snapshot)
{
  std::ostringstream oss;
  if (snapshot.capacityPercent < 0 || snapshot.capacityPercent > 100) {
    oss << "capacity=" << snapshot.capacityPercent << "% outside [0,100]";
    return oss.str();
  }
  if (snapshot.maxCapacity <= 0) {
    oss << "max_capacity=" << snapshot.maxCapacity << " must be > 0";
    return oss.str();
  }
  return {};
}

}  // namespace charge_monitor
