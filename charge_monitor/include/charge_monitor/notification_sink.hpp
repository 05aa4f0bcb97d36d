#pragma once

#include <charge_monitor/operation_result.hpp>

#include <string>

namespace charge_monitor
{

/**
 * @class NotificationSink
 * @brief Delivers threshold alerts to the user.
 *
 * A failed delivery is reported back but never aborts the monitor.
 */
class NotificationSink
{
public:
  virtual ~NotificationSink() = default;

  virtual OperationResult notifyLow(int level, int threshold, int remaining) = 0;
  virtual OperationResult notifyHigh(int level, int threshold, int remaining) = 0;
  virtual std::string name() const = 0;
};

/// Title and body shared by the concrete sinks.
std::string lowBatteryTitle();
std::string highBatteryTitle();
std::string lowBatteryMessage(int level, int threshold, int remaining);
std::string highBatteryMessage(int level, int threshold, int remaining);

}  // namespace charge_monitor
