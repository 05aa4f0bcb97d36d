#pragma once

#include <charge_monitor/config_channel.hpp>
#include <charge_monitor/monitor_config.hpp>
#include <charge_monitor/operation_result.hpp>

#include <memory>

namespace charge_monitor
{

/**
 * @class ConfigStore
 * @brief Persistence collaborator for MonitorConfig.
 *
 * Contract:
 *  - load() returns a complete, valid config or throws ConfigError
 *  - save() refuses invalid configs and reports failures by value
 *  - watch() returns the channel on which externally edited configs arrive;
 *    every config pushed there has already been validated
 */
class ConfigStore
{
public:
  virtual ~ConfigStore() = default;

  virtual MonitorConfig load() = 0;
  virtual OperationResult save(const MonitorConfig & config) = 0;
  virtual std::shared_ptr<ConfigChannel> watch() = 0;
};

}  // namespace charge_monitor
