#include <charge_monitor/simulated_battery_source.hpp>

#include <rclcpp/logging.hpp>

#include <utility>

namespace charge_monitor
{

SimulatedBatterySource::SimulatedBatterySource(
  SimulatorConfig config,
  std::function<int()> notificationCount,
  rclcpp::Logger logger)
: simulator_(config)
, notificationCount_(std::move(notificationCount))
, logger_(logger)
{
}

PollResult SimulatedBatterySource::poll()
{
  const int shown = notificationCount_ ? notificationCount_() : 0;
  const auto before = simulator_.phase();
  const auto snapshot = simulator_.next(shown);

  if (simulator_.phase() != before) {
    RCLCPP_INFO(logger_, "Simulator phase %s -> %s at %d%%",
      BatterySimulator::toString(before), BatterySimulator::toString(simulator_.phase()),
      snapshot.capacityPercent);
  }
  RCLCPP_DEBUG(logger_, "Simulated reading %d%% charging=%s (monitor shown=%d)",
    snapshot.capacityPercent, snapshot.charging ? "true" : "false", shown);
  return PollResult::success(snapshot);
}

std::string SimulatedBatterySource::name() const
{
  return "simulator";
}

void SimulatedBatterySource::reconfigure(const MonitorConfig & config)
{
  simulator_.setLimits(config.min_threshold, config.max_threshold, config.max_notifications);
}

SimulatorConfig simulatorConfigFrom(const MonitorConfig & config)
{
  SimulatorConfig sim;
  sim.minThreshold = config.min_threshold;
  sim.maxThreshold = config.max_threshold;
  sim.maxNotifications = config.max_notifications;
  return sim;
}

}  // namespace charge_monitor
