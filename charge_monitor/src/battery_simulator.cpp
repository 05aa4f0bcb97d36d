#include <charge_monitor/battery_simulator.hpp>

#include <algorithm>

namespace charge_monitor
{
namespace
{

constexpr int kDesignCapacityMah = 5000;
constexpr int kMaxCapacityMah = 4600;
constexpr int kCycleCount = 120;
constexpr int kChargeCurrentMa = 1500;
constexpr int kDischargeCurrentMa = -900;

}  // namespace

BatterySimulator::BatterySimulator(SimulatorConfig config)
: config_(config)
, capacity_(std::clamp(config.startCapacity, 0, 100))
, charging_(config.startCharging)
, phase_(config.startCharging ? SimulatorPhase::RampingUp : SimulatorPhase::RampingDown)
{
}

BatterySnapshot BatterySimulator::next(const int notificationsShown)
{
  const int step = config_.step;

  switch (phase_) {
    case SimulatorPhase::RampingDown:
      capacity_ -= step;
      if (capacity_ <= config_.minThreshold) {
        phase_ = SimulatorPhase::HoldingAtMin;
      }
      break;

    case SimulatorPhase::HoldingAtMin:
      if (notificationsShown >= config_.maxNotifications) {
        charging_ = true;
        capacity_ = config_.maxThreshold - step;
        phase_ = SimulatorPhase::RampingUp;
        break;
      }
      // Alternate so consecutive readings differ and re-arm the evaluator.
      capacity_ = capacity_ <= config_.minThreshold - step ?
        config_.minThreshold :
        config_.minThreshold - step;
      break;

    case SimulatorPhase::RampingUp:
      capacity_ += step;
      if (capacity_ >= config_.maxThreshold) {
        phase_ = SimulatorPhase::HoldingAtMax;
      }
      break;

    case SimulatorPhase::HoldingAtMax:
      if (notificationsShown >= config_.maxNotifications) {
        charging_ = false;
        capacity_ = config_.minThreshold + step;
        phase_ = SimulatorPhase::RampingDown;
        break;
      }
      capacity_ = capacity_ >= config_.maxThreshold + step ?
        config_.maxThreshold :
        config_.maxThreshold + step;
      break;
  }

  capacity_ = std::clamp(capacity_, 0, 100);
  return makeSnapshot();
}

void BatterySimulator::setLimits(
  const int minThreshold, const int maxThreshold, const int maxNotifications)
{
  config_.minThreshold = minThreshold;
  config_.maxThreshold = maxThreshold;
  config_.maxNotifications = maxNotifications;
}

const char * BatterySimulator::toString(const SimulatorPhase phase)
{
  switch (phase) {
    case SimulatorPhase::RampingDown:
      return "RampingDown";
    case SimulatorPhase::HoldingAtMin:
      return "HoldingAtMin";
    case SimulatorPhase::RampingUp:
      return "RampingUp";
    case SimulatorPhase::HoldingAtMax:
      return "HoldingAtMax";
    default:
      return "Unknown";
  }
}

BatterySnapshot BatterySimulator::makeSnapshot() const
{
  BatterySnapshot snapshot;
  snapshot.capacityPercent = capacity_;
  snapshot.charging = charging_;
  snapshot.plugged = charging_;
  snapshot.cycleCount = kCycleCount;
  snapshot.designCapacity = kDesignCapacityMah;
  snapshot.maxCapacity = kMaxCapacityMah;
  // Rough Li-ion curve for a 3S pack: 9.9V empty, 12.6V full.
  snapshot.voltage = 9900 + capacity_ * 27;
  snapshot.current = charging_ ? kChargeCurrentMa : kDischargeCurrentMa;

  const int chargeMah = kMaxCapacityMah * capacity_ / 100;
  if (charging_) {
    snapshot.timeToFull = (kMaxCapacityMah - chargeMah) * 60 / kChargeCurrentMa;
  } else {
    snapshot.timeToEmpty = chargeMah * 60 / -kDischargeCurrentMa;
  }
  return finalizeSnapshot(snapshot);
}

}  // namespace charge_monitor
