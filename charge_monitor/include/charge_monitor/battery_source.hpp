#pragma once

#include <charge_monitor/battery_snapshot.hpp>
#include <charge_monitor/monitor_config.hpp>

#include <optional>
#include <string>
#include <utility>

namespace charge_monitor
{

struct PollResult
{
  std::optional<BatterySnapshot> snapshot;
  std::string reason;

  bool ok() const { return snapshot.has_value(); }

  static PollResult success(const BatterySnapshot & s) { return PollResult{s, {}}; }
  static PollResult failure(std::string why) { return PollResult{std::nullopt, std::move(why)}; }
};

/**
 * @class BatterySource
 * @brief Produces a BatterySnapshot on demand.
 *
 * poll() must be safe to call repeatedly. A failed poll is an acquisition
 * failure: the caller logs it and skips the cycle.
 */
class BatterySource
{
public:
  virtual ~BatterySource() = default;

  virtual PollResult poll() = 0;
  virtual std::string name() const = 0;

  /// Called whenever a new configuration has been applied.
  virtual void reconfigure(const MonitorConfig &) {}
};

}  // namespace charge_monitor
