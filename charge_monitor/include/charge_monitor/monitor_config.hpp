#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace charge_monitor
{

/**
 * @struct MonitorConfig
 * @brief Policy parameters of the monitor. All intervals are in seconds.
 *
 * Field names match the persisted keys.
 */
struct MonitorConfig
{
  int min_threshold{21};
  int max_threshold{81};
  int check_interval_charging{30};
  int check_interval_discharging{1800};
  int notification_interval{1800};
  int max_notifications{3};
  int min_check_interval{10};
  bool use_simulator{false};
  bool debug_enabled{false};

  bool operator==(const MonitorConfig & other) const;
  bool operator!=(const MonitorConfig & other) const { return !(*this == other); }
};

/// Raised by the config store for unreadable, mistyped or invalid configuration.
class ConfigError : public std::runtime_error
{
public:
  using std::runtime_error::runtime_error;
};

/// Narrows a 64-bit parameter value for `key`; throws ConfigError when it does not fit an int.
int checkedInt(const std::string & key, int64_t value);

/// Empty when the config satisfies every invariant, otherwise the first violation.
std::optional<std::string> validationError(const MonitorConfig & config);

/// Persisted key names, in file order.
const std::vector<std::string> & configKeys();

std::string describe(const MonitorConfig & config);

}  // namespace charge_monitor
