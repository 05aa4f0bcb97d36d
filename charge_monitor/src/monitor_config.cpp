#include <charge_monitor/monitor_config.hpp>

#include <limits>
#include <sstream>

namespace charge_monitor
{

bool MonitorConfig::operator==(const MonitorConfig & other) const
{
  return min_threshold == other.min_threshold &&
         max_threshold == other.max_threshold &&
         check_interval_charging == other.check_interval_charging &&
         check_interval_discharging == other.check_interval_discharging &&
         notification_interval == other.notification_interval &&
         max_notifications == other.max_notifications &&
         min_check_interval == other.min_check_interval &&
         use_simulator == other.use_simulator &&
         debug_enabled == other.debug_enabled;
}

int checkedInt(const std::string & key, const int64_t value)
{
  if (value < std::numeric_limits<int>::min() || value > std::numeric_limits<int>::max()) {
    throw ConfigError("'" + key + "' is out of range: " + std::to_string(value));
  }
  return static_cast<int>(value);
}

std::optional<std::string> validationError(const MonitorConfig & config)
{
  std::ostringstream oss;
  if (config.min_threshold <= 0) {
    oss << "min_threshold=" << config.min_threshold << " must be > 0";
    return oss.str();
  }
  if (config.max_threshold <= config.min_threshold) {
    oss << "max_threshold=" << config.max_threshold << " must be > min_threshold="
        << config.min_threshold;
    return oss.str();
  }
  if (config.max_threshold >= 100) {
    oss << "max_threshold=" << config.max_threshold << " must be < 100";
    return oss.str();
  }
  if (config.check_interval_charging <= 0 || config.check_interval_discharging <= 0) {
    return std::string("check_interval_charging and check_interval_discharging must be > 0");
  }
  if (config.notification_interval <= 0) {
    return std::string("notification_interval must be > 0");
  }
  if (config.max_notifications <= 0) {
    return std::string("max_notifications must be > 0");
  }
  if (config.min_check_interval <= 0) {
    return std::string("min_check_interval must be > 0");
  }
  return std::nullopt;
}

const std::vector<std::string> & configKeys()
{
  static const std::vector<std::string> kKeys = {
    "min_threshold",
    "max_threshold",
    "check_interval_charging",
    "check_interval_discharging",
    "notification_interval",
    "max_notifications",
    "min_check_interval",
    "use_simulator",
    "debug_enabled",
  };
  return kKeys;
}

std::string describe(const MonitorConfig & config)
{
  std::ostringstream oss;
  oss << "thresholds=[" << config.min_threshold << "," << config.max_threshold << "]"
      << " interval_charging=" << config.check_interval_charging << "s"
      << " interval_discharging=" << config.check_interval_discharging << "s"
      << " notification_interval=" << config.notification_interval << "s"
      << " max_notifications=" << config.max_notifications
      << " min_check_interval=" << config.min_check_interval << "s"
      << " simulator=" << (config.use_simulator ? "true" : "false")
      << " debug=" << (config.debug_enabled ? "true" : "false");
  return oss.str();
}

}  // namespace charge_monitor
