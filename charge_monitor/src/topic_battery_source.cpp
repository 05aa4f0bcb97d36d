#include <charge_monitor/topic_battery_source.hpp>

#include <cmath>
#include <limits>
#include <sstream>

namespace charge_monitor
{
namespace
{

using sensor_msgs::msg::BatteryState;

/// Rounds `value` to int, or returns `fallback` when it is NaN, infinite or out of int range.
int roundedOr(const double value, const int fallback)
{
  if (!std::isfinite(value)) {
    return fallback;
  }
  const double rounded = std::round(value);
  if (rounded < static_cast<double>(std::numeric_limits<int>::min()) ||
    rounded > static_cast<double>(std::numeric_limits<int>::max()))
  {
    return fallback;
  }
  return static_cast<int>(rounded);
}

int toMilli(const float value)
{
  return roundedOr(static_cast<double>(value) * 1000.0, 0);
}

float fromMilli(const int value)
{
  return static_cast<float>(value) / 1000.0f;
}

}  // namespace

TopicBatterySource::TopicBatterySource(const std::chrono::milliseconds freshnessTimeout)
: freshnessTimeout_(freshnessTimeout)
{
}

void TopicBatterySource::onBatteryState(
  const sensor_msgs::msg::BatteryState & msg,
  const std::chrono::steady_clock::time_point receivedAt)
{
  std::scoped_lock lock(mutex_);
  latest_ = snapshotFromMessage(msg);
  receivedAt_ = receivedAt;
}

PollResult TopicBatterySource::poll()
{
  return pollAt(std::chrono::steady_clock::now());
}

PollResult TopicBatterySource::pollAt(const std::chrono::steady_clock::time_point now)
{
  std::scoped_lock lock(mutex_);
  if (!latest_.has_value()) {
    return PollResult::failure("no battery message received yet");
  }

  const auto age = std::chrono::duration_cast<std::chrono::milliseconds>(now - receivedAt_);
  if (age > freshnessTimeout_) {
    std::ostringstream oss;
    oss << "battery message stale (age=" << age.count() << "ms > " << freshnessTimeout_.count()
        << "ms)";
    return PollResult::failure(oss.str());
  }

  if (latest_->capacityPercent < 0 || latest_->capacityPercent > 100) {
    return PollResult::failure("battery percentage outside [0,1]");
  }
  return PollResult::success(*latest_);
}

std::string TopicBatterySource::name() const
{
  return "topic";
}

BatterySnapshot snapshotFromMessage(const sensor_msgs::msg::BatteryState & msg)
{
  BatterySnapshot snapshot;
  snapshot.capacityPercent = roundedOr(static_cast<double>(msg.percentage) * 100.0, -1);
  snapshot.charging = msg.power_supply_status == BatteryState::POWER_SUPPLY_STATUS_CHARGING;
  snapshot.plugged = snapshot.charging ||
    msg.power_supply_status == BatteryState::POWER_SUPPLY_STATUS_FULL ||
    msg.power_supply_status == BatteryState::POWER_SUPPLY_STATUS_NOT_CHARGING;
  snapshot.designCapacity = toMilli(msg.design_capacity);
  snapshot.maxCapacity = toMilli(msg.capacity);
  snapshot.voltage = toMilli(msg.voltage);
  snapshot.current = toMilli(msg.current);

  // Estimates in minutes; -1 when they do not fit an int (e.g. a near-zero current).
  if (std::isfinite(msg.charge) && std::isfinite(msg.current) && msg.current != 0.0f) {
    const double rate = std::fabs(static_cast<double>(msg.current));
    const double charge = msg.charge;
    if (snapshot.charging && std::isfinite(msg.capacity)) {
      snapshot.timeToFull = roundedOr(std::trunc((msg.capacity - charge) / rate * 60.0), -1);
    } else if (msg.power_supply_status == BatteryState::POWER_SUPPLY_STATUS_DISCHARGING) {
      snapshot.timeToEmpty = roundedOr(std::trunc(charge / rate * 60.0), -1);
    }
  }
  return finalizeSnapshot(snapshot);
}

sensor_msgs::msg::BatteryState messageFromSnapshot(const BatterySnapshot & snapshot)
{
  BatteryState msg;
  msg.percentage = static_cast<float>(snapshot.capacityPercent) / 100.0f;
  msg.voltage = fromMilli(snapshot.voltage);
  msg.current = fromMilli(snapshot.current);
  msg.capacity = fromMilli(snapshot.maxCapacity);
  msg.design_capacity = fromMilli(snapshot.designCapacity);
  msg.charge = msg.capacity * msg.percentage;
  msg.temperature = std::numeric_limits<float>::quiet_NaN();
  msg.present = true;
  msg.power_supply_technology = BatteryState::POWER_SUPPLY_TECHNOLOGY_LION;

  if (snapshot.charging) {
    msg.power_supply_status = BatteryState::POWER_SUPPLY_STATUS_CHARGING;
  } else if (snapshot.plugged) {
    msg.power_supply_status = snapshot.capacityPercent >= 100 ?
      BatteryState::POWER_SUPPLY_STATUS_FULL :
      BatteryState::POWER_SUPPLY_STATUS_NOT_CHARGING;
  } else {
    msg.power_supply_status = BatteryState::POWER_SUPPLY_STATUS_DISCHARGING;
  }

  msg.power_supply_health = snapshot.healthPercent > 0 ?
    BatteryState::POWER_SUPPLY_HEALTH_GOOD :
    BatteryState::POWER_SUPPLY_HEALTH_UNKNOWN;
  return msg;
}

}  // namespace charge_monitor
