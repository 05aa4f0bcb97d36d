#pragma once

#include <charge_monitor/config_file_watcher.hpp>
#include <charge_monitor/config_store.hpp>

#include <rclcpp/logger.hpp>
#include <rclcpp/parameter.hpp>

#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace charge_monitor
{

/**
 * @class ParamsFileConfigStore
 * @brief ConfigStore persisted as a ROS 2 parameters file.
 *
 * The file has the usual layout and can be handed to the node with
 * --params-file as well:
 *
 *   charge_monitor:
 *     ros__parameters:
 *       min_threshold: 21
 *       ...
 *
 * Keys missing from the file are filled with defaults and written back.
 * Parameters this store does not own are preserved across saves.
 */
class ParamsFileConfigStore : public ConfigStore
{
public:
  ParamsFileConfigStore(
    std::filesystem::path path,
    std::string nodeName,
    rclcpp::Logger logger,
    MonitorConfig defaults = MonitorConfig{});
  ~ParamsFileConfigStore() override;

  MonitorConfig load() override;
  OperationResult save(const MonitorConfig & config) override;
  std::shared_ptr<ConfigChannel> watch() override;

  /// Stops the file watcher; the channel stays valid.
  void stopWatching();

  const std::filesystem::path & path() const { return path_; }

private:
  void onFileChanged();
  OperationResult write(const MonitorConfig & config);

  std::filesystem::path path_;
  std::string nodeName_;
  rclcpp::Logger logger_;
  MonitorConfig defaults_;

  std::mutex mutex_;
  /// Newest config read from or written to the file.
  std::optional<MonitorConfig> lastKnown_;
  std::vector<rclcpp::Parameter> foreignParameters_;

  std::shared_ptr<ConfigChannel> channel_;
  std::unique_ptr<ConfigFileWatcher> watcher_;
};

/// $XDG_CONFIG_HOME/charge_monitor/config.yaml, else under $HOME/.config.
std::filesystem::path defaultConfigPath();

}  // namespace charge_monitor
