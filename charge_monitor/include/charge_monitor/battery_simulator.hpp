/**
 * @file battery_simulator.hpp
 * @brief Deterministic synthetic battery trace for exercising the monitor.
 *
 * The simulator walks a four-phase cycle built to hit both threshold
 * evaluators as often as possible:
 *
 *   RampingDown ──(capacity <= min)──> HoldingAtMin
 *        ^                                 │ alternates min, min - step
 *        │                                 │
 *  (quota observed,                 (quota observed,
 *   capacity = min + step)           capacity = max - step, charging)
 *        │                                 v
 *   HoldingAtMax <──(capacity >= max)── RampingUp
 *   alternates max, max + step
 *
 * A holding phase ends only once the caller reports that the monitor has
 * delivered maxNotifications in the current phase, so the trace depends on
 * the monitor's throttle state and both must be tested together.
 */

#pragma once

#include <charge_monitor/battery_snapshot.hpp>

#include <cstdint>

namespace charge_monitor
{

enum class SimulatorPhase : uint8_t
{
  RampingDown,
  HoldingAtMin,
  RampingUp,
  HoldingAtMax
};

struct SimulatorConfig
{
  int startCapacity{23};
  bool startCharging{false};
  int minThreshold{21};
  int maxThreshold{81};
  int maxNotifications{3};
  int step{2};
};

class BatterySimulator
{
public:
  explicit BatterySimulator(SimulatorConfig config);

  /**
   * @brief Advances one step and returns the new synthetic reading.
   * @param notificationsShown the monitor's live count for the current phase
   */
  BatterySnapshot next(int notificationsShown);

  /// Updates thresholds and quota without disturbing the current phase.
  void setLimits(int minThreshold, int maxThreshold, int maxNotifications);

  SimulatorPhase phase() const { return phase_; }
  int capacity() const { return capacity_; }
  bool charging() const { return charging_; }
  const SimulatorConfig & config() const { return config_; }

  static const char * toString(SimulatorPhase phase);

private:
  BatterySnapshot makeSnapshot() const;

  SimulatorConfig config_;
  int capacity_{0};
  bool charging_{false};
  SimulatorPhase phase_{SimulatorPhase::RampingDown};
};

}  // namespace charge_monitor
