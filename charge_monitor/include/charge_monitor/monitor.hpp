/**
 * @file monitor.hpp
 * @brief Threshold monitoring engine with notification throttling.
 *
 * The monitor consumes one BatterySnapshot per poll and decides whether it
 * produces a notification:
 *
 *   reading ──(same level and charging flag)──> skipped
 *      │
 *      ├──(first reading)──> initialized, nothing evaluated
 *      │
 *      ├──(charging flag flipped)──> phase reset: count = 0, timestamp and level cleared
 *      │
 *      v
 *   discharging: capacity <= min_threshold ──┐
 *   charging:    capacity >= max_threshold ──┴──> throttle gate ──> sink
 *                                                                    │
 *                                    count++, timestamp = now, interval adapted
 *
 * Delivery is fire-and-forget: a failed sink call still consumes quota, so a
 * broken sink cannot cause a retry storm.
 *
 * The class holds no locks. It is meant to be driven from a single control
 * loop, which is the only place its state is ever touched.
 */

#pragma once

#include <charge_monitor/battery_snapshot.hpp>
#include <charge_monitor/config_store.hpp>
#include <charge_monitor/monitor_config.hpp>
#include <charge_monitor/notification_sink.hpp>
#include <charge_monitor/notification_throttle.hpp>

#include <rclcpp/logger.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace charge_monitor
{

/**
 * @struct MonitorState
 * @brief Bookkeeping mutated only by Monitor::check().
 */
struct MonitorState
{
  bool initialized{false};
  /// -1 until the first reading has been accepted, and again after a phase reset.
  int lastLevel{-1};
  bool lastCharging{false};
  /// Notifications delivered since the last charging-flag flip.
  int notificationsShown{0};
  /// Default-constructed while no notification has been shown in this phase.
  std::chrono::steady_clock::time_point lastNotificationTime{};
};

enum class CheckAction : uint8_t
{
  Skipped,
  Initialized,
  NoTrigger,
  Throttled,
  NotifiedLow,
  NotifiedHigh
};

/**
 * @struct CheckOutcome
 * @brief What a single check() call did, for logging and tests.
 */
struct CheckOutcome
{
  CheckAction action{CheckAction::Skipped};
  bool phaseReset{false};
  bool deliveryFailed{false};
  bool intervalChanged{false};
  std::string reasonCode{"UNCHANGED_READING"};

  bool notified() const
  {
    return action == CheckAction::NotifiedLow || action == CheckAction::NotifiedHigh;
  }
};

class Monitor
{
public:
  /**
   * @param config  initial policy, assumed valid
   * @param sink    receives threshold alerts, required
   * @param store   receives adapted intervals; may be null to skip persistence
   * @param logger  logger used for every decision trace
   */
  Monitor(
    MonitorConfig config,
    std::shared_ptr<NotificationSink> sink,
    std::shared_ptr<ConfigStore> store,
    rclcpp::Logger logger);

  /**
   * @brief Evaluates one reading taken at `now`.
   *
   * Identical consecutive readings after initialization return immediately
   * without touching any state. The reading after a phase reset is always
   * evaluated.
   */
  CheckOutcome check(std::chrono::steady_clock::time_point now, const BatterySnapshot & snapshot);

  /// Replaces the whole configuration. Monitoring state is kept.
  void applyConfig(const MonitorConfig & config);

  /// Poll period in seconds for the currently recorded charging direction.
  int checkIntervalS() const;

  const MonitorState & state() const { return state_; }
  const MonitorConfig & config() const { return config_; }

  static const char * toString(CheckAction action);

private:
  void resetPhase(bool charging);
  CheckOutcome evaluateDischarging(
    std::chrono::steady_clock::time_point now, const BatterySnapshot & snapshot);
  CheckOutcome evaluateCharging(
    std::chrono::steady_clock::time_point now, const BatterySnapshot & snapshot);
  /// Shared tail of both evaluators once a threshold has been crossed.
  CheckOutcome deliver(
    std::chrono::steady_clock::time_point now, const BatterySnapshot & snapshot, bool low);
  bool adaptActiveInterval(const BatterySnapshot & snapshot, bool low);

  MonitorConfig config_;
  NotificationThrottle throttle_;
  std::shared_ptr<NotificationSink> sink_;
  std::shared_ptr<ConfigStore> store_;
  rclcpp::Logger logger_;
  MonitorState state_;
};

}  // namespace charge_monitor
