/**
 * @file monitor_node.hpp
 * @brief Lifecycle node running the battery monitoring loop.
 *
 * The node is the single control loop around Monitor. On a single-threaded
 * executor three things are serviced:
 *   - the poll timer: poll the source, check the reading, re-arm the timer
 *     if the interval for the current direction changed
 *   - the config drain timer: apply the newest configuration delivered by the
 *     file watcher or by a parameter update, then restart the poll period
 *   - lifecycle transitions: activate starts both timers, deactivate cancels
 *     them (an in-flight poll always completes first)
 *
 * Monitor state is only ever touched from these callbacks.
 */

#pragma once

#include <charge_monitor/battery_source.hpp>
#include <charge_monitor/config_channel.hpp>
#include <charge_monitor/monitor.hpp>
#include <charge_monitor/notification_sink.hpp>
#include <charge_monitor/params_file_config_store.hpp>
#include <charge_monitor/topic_battery_source.hpp>

#include <rclcpp_lifecycle/lifecycle_node.hpp>
#include <rclcpp_lifecycle/lifecycle_publisher.hpp>
#include <sensor_msgs/msg/battery_state.hpp>

#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace charge_monitor
{

class MonitorNode : public rclcpp_lifecycle::LifecycleNode
{
public:
  explicit MonitorNode(const rclcpp::NodeOptions & options = rclcpp::NodeOptions());

  /// Read-only access for tests and diagnostics; null until configured.
  const Monitor * monitor() const { return monitor_.get(); }
  const BatterySource * source() const { return source_.get(); }
  int activeIntervalS() const { return activeIntervalS_; }
  /// Time left in the running poll period; max() while the poll timer is stopped.
  std::chrono::nanoseconds timeUntilNextPoll() const;

private:
  using CallbackReturn = rclcpp_lifecycle::node_interfaces::LifecycleNodeInterface::CallbackReturn;

  CallbackReturn on_configure(const rclcpp_lifecycle::State & state) override;
  CallbackReturn on_activate(const rclcpp_lifecycle::State & state) override;
  CallbackReturn on_deactivate(const rclcpp_lifecycle::State & state) override;
  CallbackReturn on_cleanup(const rclcpp_lifecycle::State & state) override;
  CallbackReturn on_shutdown(const rclcpp_lifecycle::State & state) override;
  CallbackReturn on_error(const rclcpp_lifecycle::State & state) override;

  void onPollTick();
  void onDrainTick();
  void onBattery(const sensor_msgs::msg::BatteryState::SharedPtr msg);

  rcl_interfaces::msg::SetParametersResult onSetParameters(
    const std::vector<rclcpp::Parameter> & parameters);

  std::unique_ptr<BatterySource> makeSource(const MonitorConfig & config);
  /// Replaces the battery source and its topic subscription, if any.
  void installSource(const MonitorConfig & config);
  std::shared_ptr<NotificationSink> makeSink();
  void applyConfig(const MonitorConfig & config);
  void applyLogLevel(const MonitorConfig & config);
  /// Recreates the poll timer when `restart` is set or the period differs from the running one.
  void armPollTimer(bool restart);
  /// Copies a config into the node's parameters without re-entering the channel.
  void syncParameters(const MonitorConfig & config);
  MonitorConfig configFromParameters() const;

  // Node-only parameters.
  std::string configPath_;
  std::string sourceMode_{"auto"};
  std::string sysfsRoot_{"/sys/class/power_supply"};
  std::string sysfsBattery_;
  std::string batteryTopic_{"battery"};
  double batteryFreshnessTimeoutS_{30.0};
  std::string notificationBackend_{"log"};
  std::string notifyCommand_{"notify-send"};
  double notifyTimeoutS_{5.0};
  int configDrainPeriodMs_{200};
  bool autoStart_{true};

  std::shared_ptr<ParamsFileConfigStore> store_;
  std::shared_ptr<ConfigChannel> channel_;
  std::shared_ptr<NotificationSink> sink_;
  std::unique_ptr<Monitor> monitor_;
  std::unique_ptr<BatterySource> source_;
  TopicBatterySource * topicSource_{nullptr};
  bool publishStatus_{true};

  rclcpp::Subscription<sensor_msgs::msg::BatteryState>::SharedPtr batterySub_;
  rclcpp_lifecycle::LifecyclePublisher<sensor_msgs::msg::BatteryState>::SharedPtr statusPub_;
  rclcpp::TimerBase::SharedPtr pollTimer_;
  rclcpp::TimerBase::SharedPtr drainTimer_;
  rclcpp::TimerBase::SharedPtr startupTimer_;
  OnSetParametersCallbackHandle::SharedPtr parameterCallback_;

  int activeIntervalS_{0};
  bool syncingParameters_{false};
};

}  // namespace charge_monitor
