#include <charge_monitor/log_notification_sink.hpp>

#include <rclcpp/logging.hpp>

namespace charge_monitor
{

LogNotificationSink::LogNotificationSink(rclcpp::Logger logger)
: logger_(logger)
{
}

OperationResult LogNotificationSink::notifyLow(
  const int level, const int threshold, const int remaining)
{
  RCLCPP_WARN(logger_, "%s: %s", lowBatteryTitle().c_str(),
    lowBatteryMessage(level, threshold, remaining).c_str());
  return OperationResult::success();
}

OperationResult LogNotificationSink::notifyHigh(
  const int level, const int threshold, const int remaining)
{
  RCLCPP_WARN(logger_, "%s: %s", highBatteryTitle().c_str(),
    highBatteryMessage(level, threshold, remaining).c_str());
  return OperationResult::success();
}

std::string LogNotificationSink::name() const
{
  return "log";
}

}  // namespace charge_monitor
