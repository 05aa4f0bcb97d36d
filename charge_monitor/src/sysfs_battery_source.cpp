#include <charge_monitor/sysfs_battery_source.hpp>

#include <rclcpp/logging.hpp>

#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <system_error>
#include <utility>

namespace charge_monitor
{
namespace
{

std::optional<std::string> readAttribute(const std::filesystem::path & path)
{
  std::ifstream in(path);
  if (!in) {
    return std::nullopt;
  }
  std::string value;
  std::getline(in, value);
  while (!value.empty() && (value.back() == '\n' || value.back() == '\r' || value.back() == ' ')) {
    value.pop_back();
  }
  return value;
}

std::optional<int64_t> readInteger(const std::filesystem::path & path)
{
  const auto text = readAttribute(path);
  if (!text || text->empty()) {
    return std::nullopt;
  }
  char * end = nullptr;
  const long long value = std::strtoll(text->c_str(), &end, 10);
  if (end == text->c_str()) {
    return std::nullopt;
  }
  return static_cast<int64_t>(value);
}

/// Attribute names of one measurement family; a battery reports either one consistently.
struct AttributeFamily
{
  const char * fullDesign;
  const char * full;
  const char * now;
};

constexpr AttributeFamily kChargeFamily{"charge_full_design", "charge_full", "charge_now"};
constexpr AttributeFamily kEnergyFamily{"energy_full_design", "energy_full", "energy_now"};

/// Charge (µAh) when the battery exposes it, energy (µWh) otherwise.
const AttributeFamily & familyOf(const std::filesystem::path & dir)
{
  std::error_code ec;
  if (std::filesystem::exists(dir / kChargeFamily.full, ec) ||
    std::filesystem::exists(dir / kChargeFamily.now, ec))
  {
    return kChargeFamily;
  }
  return kEnergyFamily;
}

}  // namespace

SysfsBatterySource::SysfsBatterySource(
  std::filesystem::path root,
  std::string batteryName,
  rclcpp::Logger logger)
: root_(std::move(root))
, batteryName_(std::move(batteryName))
, logger_(logger)
{
}

std::optional<std::filesystem::path> SysfsBatterySource::batteryPath() const
{
  std::error_code ec;
  if (!batteryName_.empty()) {
    const auto dir = root_ / batteryName_;
    if (std::filesystem::is_directory(dir, ec)) {
      return dir;
    }
    return std::nullopt;
  }

  for (const auto & entry : std::filesystem::directory_iterator(root_, ec)) {
    if (readAttribute(entry.path() / "type").value_or("") == "Battery") {
      return entry.path();
    }
  }
  return std::nullopt;
}

std::optional<bool> SysfsBatterySource::mainsOnline() const
{
  std::error_code ec;
  std::optional<bool> online;
  for (const auto & entry : std::filesystem::directory_iterator(root_, ec)) {
    if (readAttribute(entry.path() / "type").value_or("") != "Mains") {
      continue;
    }
    const auto value = readInteger(entry.path() / "online");
    if (value.has_value()) {
      online = online.value_or(false) || *value == 1;
    }
  }
  return online;
}

PollResult SysfsBatterySource::poll()
{
  const auto dir = batteryPath();
  if (!dir) {
    return PollResult::failure("no battery found under " + root_.string());
  }

  const auto capacity = readInteger(*dir / "capacity");
  if (!capacity) {
    return PollResult::failure("cannot read " + (*dir / "capacity").string());
  }
  const std::string status = readAttribute(*dir / "status").value_or("Unknown");

  BatterySnapshot snapshot;
  snapshot.capacityPercent = static_cast<int>(*capacity);
  snapshot.charging = status == "Charging";
  snapshot.plugged = mainsOnline().value_or(
    status == "Charging" || status == "Full" || status == "Not charging");
  snapshot.cycleCount = static_cast<int>(readInteger(*dir / "cycle_count").value_or(0));

  // power_supply reports micro-units. Capacities and the time estimates come
  // from one family; current is converted from power when only power is known.
  const auto & family = familyOf(*dir);
  const bool chargeBased = &family == &kChargeFamily;
  const auto design = readInteger(*dir / family.fullDesign);
  const auto full = readInteger(*dir / family.full);
  const auto now = readInteger(*dir / family.now);
  const auto voltage = readInteger(*dir / "voltage_now");
  snapshot.designCapacity = static_cast<int>(design.value_or(0) / 1000);
  snapshot.maxCapacity = static_cast<int>(full.value_or(0) / 1000);
  snapshot.voltage = static_cast<int>(voltage.value_or(0) / 1000);

  const auto currentNow = readInteger(*dir / "current_now");
  const auto powerNow = readInteger(*dir / "power_now");
  const bool haveVoltage = voltage && *voltage > 0;
  int64_t currentUa = 0;
  if (currentNow) {
    currentUa = std::llabs(*currentNow);
  } else if (powerNow && haveVoltage) {
    currentUa = std::llabs(*powerNow) * 1000000 / *voltage;
  }
  int64_t powerUw = 0;
  if (powerNow) {
    powerUw = std::llabs(*powerNow);
  } else if (currentNow && haveVoltage) {
    powerUw = std::llabs(*currentNow) * *voltage / 1000000;
  }
  snapshot.current = static_cast<int>(currentUa / 1000) * (status == "Discharging" ? -1 : 1);

  const int64_t rate = chargeBased ? currentUa : powerUw;
  if (now && full && rate > 0) {
    if (snapshot.charging) {
      snapshot.timeToFull = static_cast<int>((*full - *now) * 60 / rate);
    } else if (status == "Discharging") {
      snapshot.timeToEmpty = static_cast<int>(*now * 60 / rate);
    }
  }

  snapshot = finalizeSnapshot(snapshot);
  const auto rejection = snapshotRejectionReason(snapshot);
  if (!rejection.empty()) {
    return PollResult::failure("implausible reading from " + dir->string() + ": " + rejection);
  }

  RCLCPP_DEBUG(logger_, "%s: %d%% status=%s plugged=%s health=%d%%",
    dir->filename().c_str(), snapshot.capacityPercent, status.c_str(),
    snapshot.plugged ? "true" : "false", snapshot.healthPercent);
  return PollResult::success(snapshot);
}

std::string SysfsBatterySource::name() const
{
  return "sysfs";
}

}  // namespace charge_monitor
