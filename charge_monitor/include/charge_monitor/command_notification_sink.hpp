#pragma once

#include <charge_monitor/notification_sink.hpp>

#include <rclcpp/logger.hpp>

#include <chrono>
#include <string>
#include <vector>

namespace charge_monitor
{

/**
 * @class CommandNotificationSink
 * @brief Delivers alerts by running an external notifier (notify-send by default).
 *
 * The command is invoked as `<command> <title> <message>` without a shell.
 * It must exit with status 0 within the timeout, otherwise it is killed and
 * the delivery is reported as failed.
 */
class CommandNotificationSink : public NotificationSink
{
public:
  CommandNotificationSink(
    std::string command,
    std::chrono::milliseconds timeout,
    rclcpp::Logger logger);

  OperationResult notifyLow(int level, int threshold, int remaining) override;
  OperationResult notifyHigh(int level, int threshold, int remaining) override;
  std::string name() const override;

  OperationResult run(const std::vector<std::string> & args) const;

private:
  std::string command_;
  std::chrono::milliseconds timeout_;
  rclcpp::Logger logger_;
};

}  // namespace charge_monitor
