#pragma once

#include <charge_monitor/battery_source.hpp>

#include <rclcpp/logger.hpp>

#include <filesystem>
#include <optional>
#include <string>

namespace charge_monitor
{

/**
 * @class SysfsBatterySource
 * @brief Reads the Linux power_supply class (/sys/class/power_supply).
 *
 * Capacities are reported in mAh, or in mWh for batteries that only expose
 * energy_* attributes; health stays correct since both come from the same family.
 */
class SysfsBatterySource : public BatterySource
{
public:
  SysfsBatterySource(
    std::filesystem::path root,
    std::string batteryName,
    rclcpp::Logger logger);

  PollResult poll() override;
  std::string name() const override;

  /// Directory of the monitored battery, if one can be found.
  std::optional<std::filesystem::path> batteryPath() const;

private:
  std::optional<bool> mainsOnline() const;

  std::filesystem::path root_;
  std::string batteryName_;
  rclcpp::Logger logger_;
};

}  // namespace charge_monitor
