#pragma once

#include <charge_monitor/notification_sink.hpp>

#include <rclcpp/logger.hpp>

namespace charge_monitor
{

class LogNotificationSink : public NotificationSink
{
public:
  explicit LogNotificationSink(rclcpp::Logger logger);

  OperationResult notifyLow(int level, int threshold, int remaining) override;
  OperationResult notifyHigh(int level, int threshold, int remaining) override;
  std::string name() const override;

private:
  rclcpp::Logger logger_;
};

}  // namespace charge_monitor
