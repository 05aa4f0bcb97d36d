#pragma once

#include <charge_monitor/battery_simulator.hpp>
#include <charge_monitor/battery_source.hpp>

#include <rclcpp/logger.hpp>

#include <functional>

namespace charge_monitor
{

/**
 * @class SimulatedBatterySource
 * @brief BatterySource backed by BatterySimulator.
 *
 * The notification count is read through a callback on every poll so the
 * simulator always sees the monitor's live throttle state.
 */
class SimulatedBatterySource : public BatterySource
{
public:
  SimulatedBatterySource(
    SimulatorConfig config,
    std::function<int()> notificationCount,
    rclcpp::Logger logger);

  PollResult poll() override;
  std::string name() const override;
  void reconfigure(const MonitorConfig & config) override;

  const BatterySimulator & simulator() const { return simulator_; }

private:
  BatterySimulator simulator_;
  std::function<int()> notificationCount_;
  rclcpp::Logger logger_;
};

/// Simulator settings derived from the monitor policy.
SimulatorConfig simulatorConfigFrom(const MonitorConfig & config);

}  // namespace charge_monitor
