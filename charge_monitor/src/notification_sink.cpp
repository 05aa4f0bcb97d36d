#include <charge_monitor/notification_sink.hpp>

#include <sstream>

namespace charge_monitor
{

std::string lowBatteryTitle()
{
  return "Battery low";
}

std::string highBatteryTitle()
{
  return "Battery charged";
}

std::string lowBatteryMessage(const int level, const int threshold, const int remaining)
{
  std::ostringstream oss;
  oss << "Battery is at " << level << "% (limit " << threshold << "%). Connect the charger."
      << " Reminders left: " << remaining;
  return oss.str();
}

std::string highBatteryMessage(const int level, const int threshold, const int remaining)
{
  std::ostringstream oss;
  oss << "Battery is at " << level << "% (limit " << threshold << "%). You can unplug the charger."
      << " Reminders left: " << remaining;
  return oss.str();
}

}  // namespace charge_monitor
