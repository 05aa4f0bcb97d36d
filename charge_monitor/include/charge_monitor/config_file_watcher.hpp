#pragma once

#include <charge_monitor/operation_result.hpp>

#include <rclcpp/logger.hpp>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <thread>

namespace charge_monitor
{

/**
 * @class ConfigFileWatcher
 * @brief Calls back when a file is rewritten, using inotify on its directory.
 *
 * The directory is watched rather than the file so that editors which save
 * by rename are seen too. Bursts of events are coalesced: after the first
 * event the watcher waits `debounce` and swallows whatever arrived meanwhile.
 * The callback runs on the watcher thread.
 */
class ConfigFileWatcher
{
public:
  ConfigFileWatcher(
    std::filesystem::path file,
    std::function<void()> onChange,
    rclcpp::Logger logger,
    std::chrono::milliseconds debounce = std::chrono::milliseconds(100));
  ~ConfigFileWatcher();

  ConfigFileWatcher(const ConfigFileWatcher &) = delete;
  ConfigFileWatcher & operator=(const ConfigFileWatcher &) = delete;

  OperationResult start();
  void stop();
  bool running() const { return running_.load(); }

private:
  void run();
  /// True when any queued event names the watched file.
  bool drainEvents();

  std::filesystem::path file_;
  std::function<void()> onChange_;
  rclcpp::Logger logger_;
  std::chrono::milliseconds debounce_;

  int fd_{-1};
  int watch_{-1};
  std::atomic<bool> running_{false};
  std::atomic<bool> stopRequested_{false};
  std::thread thread_;
};

}  // namespace charge_monitor
