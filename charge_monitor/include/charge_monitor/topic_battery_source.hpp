#pragma once

#include <charge_monitor/battery_source.hpp>

#include <sensor_msgs/msg/battery_state.hpp>

#include <chrono>
#include <mutex>
#include <optional>

namespace charge_monitor
{

/**
 * @class TopicBatterySource
 * @brief BatterySource fed by sensor_msgs/BatteryState messages.
 *
 * The owning node forwards each received message to onBatteryState(); poll()
 * returns the newest one unless it is older than the freshness timeout.
 */
class TopicBatterySource : public BatterySource
{
public:
  explicit TopicBatterySource(std::chrono::milliseconds freshnessTimeout);

  void onBatteryState(
    const sensor_msgs::msg::BatteryState & msg,
    std::chrono::steady_clock::time_point receivedAt);

  PollResult poll() override;
  std::string name() const override;

  /// Same as poll() but with an explicit clock, for freshness checks.
  PollResult pollAt(std::chrono::steady_clock::time_point now);

private:
  std::chrono::milliseconds freshnessTimeout_;

  mutable std::mutex mutex_;
  std::optional<BatterySnapshot> latest_;
  std::chrono::steady_clock::time_point receivedAt_;
};

/// Message to snapshot conversion used by the topic source.
BatterySnapshot snapshotFromMessage(const sensor_msgs::msg::BatteryState & msg);

/// Snapshot to message conversion used for status publication.
sensor_msgs::msg::BatteryState messageFromSnapshot(const BatterySnapshot & snapshot);

}  // namespace charge_monitor
