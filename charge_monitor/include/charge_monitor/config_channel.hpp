#pragma once

#include <charge_monitor/monitor_config.hpp>

#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

namespace charge_monitor
{

/**
 * @class ConfigChannel
 * @brief Bounded hand-off of configuration updates to the control loop.
 *
 * push() never blocks; when full the oldest pending update is dropped, since
 * only the newest configuration matters to the consumer.
 */
class ConfigChannel
{
public:
  explicit ConfigChannel(std::size_t capacity = 8);

  void push(const MonitorConfig & config);
  std::optional<MonitorConfig> tryPop();
  /// Drains the channel and returns only the newest entry.
  std::optional<MonitorConfig> takeLatest();

  std::size_t size() const;
  std::size_t dropped() const;

private:
  std::size_t capacity_{8};
  mutable std::mutex mutex_;
  std::deque<MonitorConfig> pending_;
  std::size_t dropped_{0};
};

}  // namespace charge_monitor
