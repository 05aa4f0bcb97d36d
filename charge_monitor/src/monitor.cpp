#include <charge_monitor/monitor.hpp>

#include <charge_monitor/interval_adapter.hpp>

#include <rclcpp/logging.hpp>

#include <utility>

namespace charge_monitor
{
namespace
{

ThrottlePolicy policyFrom(const MonitorConfig & config)
{
  ThrottlePolicy policy;
  policy.maxNotifications = config.max_notifications;
  policy.minSpacing = std::chrono::seconds(config.notification_interval);
  return policy;
}

}  // namespace

Monitor::Monitor(
  MonitorConfig config,
  std::shared_ptr<NotificationSink> sink,
  std::shared_ptr<ConfigStore> store,
  rclcpp::Logger logger)
: config_(config)
, throttle_(policyFrom(config))
, sink_(std::move(sink))
, store_(std::move(store))
, logger_(logger)
{
}

CheckOutcome Monitor::check(
  const std::chrono::steady_clock::time_point now,
  const BatterySnapshot & snapshot)
{
  if (state_.initialized &&
    snapshot.capacityPercent == state_.lastLevel &&
    snapshot.charging == state_.lastCharging)
  {
    RCLCPP_DEBUG(logger_, "Reading unchanged (%d%%, charging=%s), skipping",
      snapshot.capacityPercent, snapshot.charging ? "true" : "false");
    return CheckOutcome{};
  }

  RCLCPP_DEBUG(logger_, "Checking reading: level=%d%% charging=%s",
    snapshot.capacityPercent, snapshot.charging ? "true" : "false");

  state_.lastLevel = snapshot.capacityPercent;

  if (!state_.initialized) {
    state_.initialized = true;
    state_.lastCharging = snapshot.charging;
    CheckOutcome outcome;
    outcome.action = CheckAction::Initialized;
    outcome.reasonCode = "FIRST_READING";
    RCLCPP_INFO(logger_, "First reading: level=%d%% charging=%s",
      snapshot.capacityPercent, snapshot.charging ? "true" : "false");
    return outcome;
  }

  bool phaseReset = false;
  if (state_.lastCharging != snapshot.charging) {
    RCLCPP_INFO(logger_, "Charging state changed to %s, notification quota reset",
      snapshot.charging ? "charging" : "discharging");
    resetPhase(snapshot.charging);
    phaseReset = true;
  }

  CheckOutcome outcome = snapshot.charging ?
    evaluateCharging(now, snapshot) :
    evaluateDischarging(now, snapshot);
  outcome.phaseReset = phaseReset;
  return outcome;
}

void Monitor::applyConfig(const MonitorConfig & config)
{
  config_ = config;
  throttle_ = NotificationThrottle(policyFrom(config_));
  RCLCPP_INFO(logger_, "Applied configuration: %s", describe(config_).c_str());
}

int Monitor::checkIntervalS() const
{
  return state_.lastCharging ? config_.check_interval_charging : config_.check_interval_discharging;
}

const char * Monitor::toString(const CheckAction action)
{
  switch (action) {
    case CheckAction::Skipped:
      return "Skipped";
    case CheckAction::Initialized:
      return "Initialized";
    case CheckAction::NoTrigger:
      return "NoTrigger";
    case CheckAction::Throttled:
      return "Throttled";
    case CheckAction::NotifiedLow:
      return "NotifiedLow";
    case CheckAction::NotifiedHigh:
      return "NotifiedHigh";
    default:
      return "Unknown";
  }
}

void Monitor::resetPhase(const bool charging)
{
  state_.notificationsShown = 0;
  state_.lastNotificationTime = {};
  state_.lastCharging = charging;
  // Forget the level so the next reading is evaluated even if it repeats this one.
  state_.lastLevel = -1;
}

CheckOutcome Monitor::evaluateDischarging(
  const std::chrono::steady_clock::time_point now,
  const BatterySnapshot & snapshot)
{
  if (snapshot.capacityPercent > config_.min_threshold) {
    CheckOutcome outcome;
    outcome.action = CheckAction::NoTrigger;
    outcome.reasonCode = "ABOVE_MIN_THRESHOLD";
    return outcome;
  }
  return deliver(now, snapshot, true);
}

CheckOutcome Monitor::evaluateCharging(
  const std::chrono::steady_clock::time_point now,
  const BatterySnapshot & snapshot)
{
  if (snapshot.capacityPercent < config_.max_threshold) {
    CheckOutcome outcome;
    outcome.action = CheckAction::NoTrigger;
    outcome.reasonCode = "BELOW_MAX_THRESHOLD";
    return outcome;
  }
  return deliver(now, snapshot, false);
}

CheckOutcome Monitor::deliver(
  const std::chrono::steady_clock::time_point now,
  const BatterySnapshot & snapshot,
  const bool low)
{
  CheckOutcome outcome;

  const auto verdict = throttle_.evaluate(
    state_.notificationsShown, state_.lastNotificationTime, now);
  if (verdict != ThrottleVerdict::Allowed) {
    outcome.action = CheckAction::Throttled;
    outcome.reasonCode = NotificationThrottle::toString(verdict);
    RCLCPP_DEBUG(logger_, "%s trigger at %d%% throttled: %s (shown=%d/%d)",
      low ? "Low" : "High", snapshot.capacityPercent, outcome.reasonCode.c_str(),
      state_.notificationsShown, config_.max_notifications);
    return outcome;
  }

  const int threshold = low ? config_.min_threshold : config_.max_threshold;
  const int remaining = config_.max_notifications - state_.notificationsShown - 1;

  const auto delivery = low ?
    sink_->notifyLow(snapshot.capacityPercent, threshold, remaining) :
    sink_->notifyHigh(snapshot.capacityPercent, threshold, remaining);
  if (!delivery.ok) {
    outcome.deliveryFailed = true;
    RCLCPP_ERROR(logger_, "Notification via %s failed: %s",
      sink_->name().c_str(), delivery.reason.c_str());
  }

  // Quota and spacing advance even when delivery failed.
  state_.notificationsShown++;
  state_.lastNotificationTime = now;

  outcome.action = low ? CheckAction::NotifiedLow : CheckAction::NotifiedHigh;
  outcome.reasonCode = low ? "LOW_NOTIFIED" : "HIGH_NOTIFIED";
  outcome.intervalChanged = adaptActiveInterval(snapshot, low);

  RCLCPP_INFO(logger_, "%s battery notification %d/%d at %d%% (threshold %d%%)",
    low ? "Low" : "High", state_.notificationsShown, config_.max_notifications,
    snapshot.capacityPercent, threshold);
  return outcome;
}

bool Monitor::adaptActiveInterval(const BatterySnapshot & snapshot, const bool low)
{
  int & interval = low ? config_.check_interval_discharging : config_.check_interval_charging;
  const int threshold = low ? config_.min_threshold : config_.max_threshold;

  const auto adaptation = charge_monitor::adaptInterval(
    interval, threshold, snapshot.capacityPercent, config_.min_check_interval);
  if (!adaptation.changed()) {
    return false;
  }

  interval = adaptation.adapted;
  RCLCPP_INFO(logger_, "%s poll interval %ds -> %ds (gap=%d%s)",
    low ? "Discharging" : "Charging", adaptation.previous, adaptation.adapted,
    adaptation.gap, adaptation.clamped ? ", clamped" : "");

  if (store_) {
    const auto saved = store_->save(config_);
    if (!saved.ok) {
      RCLCPP_WARN(logger_, "Could not persist adapted interval: %s", saved.reason.c_str());
    }
  }
  return true;
}

}  // namespace charge_monitor
