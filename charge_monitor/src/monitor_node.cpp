#include <charge_monitor/monitor_node.hpp>

#include <charge_monitor/command_notification_sink.hpp>
#include <charge_monitor/log_notification_sink.hpp>
#include <charge_monitor/simulated_battery_source.hpp>
#include <charge_monitor/sysfs_battery_source.hpp>

#include <lifecycle_msgs/msg/state.hpp>
#include <lifecycle_msgs/msg/transition.hpp>
#include <rclcpp_components/register_node_macro.hpp>

#include <chrono>
#include <cstdint>
#include <string>

namespace charge_monitor
{
namespace
{

constexpr char kNodeName[] = "charge_monitor";

/// Copies one parameter into the matching config field. False for foreign names.
/// Throws ConfigError for integers outside int range.
bool assignConfigField(MonitorConfig & config, const rclcpp::Parameter & param)
{
  const auto & name = param.get_name();
  if (name == "min_threshold") {
    config.min_threshold = checkedInt(name, param.as_int());
  } else if (name == "max_threshold") {
    config.max_threshold = checkedInt(name, param.as_int());
  } else if (name == "check_interval_charging") {
    config.check_interval_charging = checkedInt(name, param.as_int());
  } else if (name == "check_interval_discharging") {
    config.check_interval_discharging = checkedInt(name, param.as_int());
  } else if (name == "notification_interval") {
    config.notification_interval = checkedInt(name, param.as_int());
  } else if (name == "max_notifications") {
    config.max_notifications = checkedInt(name, param.as_int());
  } else if (name == "min_check_interval") {
    config.min_check_interval = checkedInt(name, param.as_int());
  } else if (name == "use_simulator") {
    config.use_simulator = param.as_bool();
  } else if (name == "debug_enabled") {
    config.debug_enabled = param.as_bool();
  } else {
    return false;
  }
  return true;
}

std::vector<rclcpp::Parameter> parametersFrom(const MonitorConfig & config)
{
  return {
    rclcpp::Parameter("min_threshold", config.min_threshold),
    rclcpp::Parameter("max_threshold", config.max_threshold),
    rclcpp::Parameter("check_interval_charging", config.check_interval_charging),
    rclcpp::Parameter("check_interval_discharging", config.check_interval_discharging),
    rclcpp::Parameter("notification_interval", config.notification_interval),
    rclcpp::Parameter("max_notifications", config.max_notifications),
    rclcpp::Parameter("min_check_interval", config.min_check_interval),
    rclcpp::Parameter("use_simulator", config.use_simulator),
    rclcpp::Parameter("debug_enabled", config.debug_enabled),
  };
}

}  // namespace

MonitorNode::MonitorNode(const rclcpp::NodeOptions & options)
: rclcpp_lifecycle::LifecycleNode(kNodeName, options)
{
  configPath_ = this->declare_parameter<std::string>("config_path", "");
  sourceMode_ = this->declare_parameter<std::string>("source", "auto");
  sysfsRoot_ = this->declare_parameter<std::string>("sysfs_root", "/sys/class/power_supply");
  sysfsBattery_ = this->declare_parameter<std::string>("sysfs_battery", "");
  batteryTopic_ = this->declare_parameter<std::string>("battery_topic", "battery");
  batteryFreshnessTimeoutS_ = this->declare_parameter<double>("battery_freshness_timeout_s", 30.0);
  notificationBackend_ = this->declare_parameter<std::string>("notification_backend", "log");
  notifyCommand_ = this->declare_parameter<std::string>("notify_command", "notify-send");
  notifyTimeoutS_ = this->declare_parameter<double>("notify_timeout_s", 5.0);
  configDrainPeriodMs_ = this->declare_parameter<int>("config_drain_period_ms", 200);
  autoStart_ = this->declare_parameter<bool>("auto_start", true);

  // Monitor policy. These only seed a config file that does not exist yet;
  // once configured the file is authoritative and the values are mirrored here.
  const MonitorConfig defaults;
  this->declare_parameter<int>("min_threshold", defaults.min_threshold);
  this->declare_parameter<int>("max_threshold", defaults.max_threshold);
  this->declare_parameter<int>("check_interval_charging", defaults.check_interval_charging);
  this->declare_parameter<int>("check_interval_discharging", defaults.check_interval_discharging);
  this->declare_parameter<int>("notification_interval", defaults.notification_interval);
  this->declare_parameter<int>("max_notifications", defaults.max_notifications);
  this->declare_parameter<int>("min_check_interval", defaults.min_check_interval);
  this->declare_parameter<bool>("use_simulator", defaults.use_simulator);
  this->declare_parameter<bool>("debug_enabled", defaults.debug_enabled);

  parameterCallback_ = this->add_on_set_parameters_callback(
    std::bind(&MonitorNode::onSetParameters, this, std::placeholders::_1));

  if (autoStart_) {
    startupTimer_ = this->create_wall_timer(
      std::chrono::milliseconds(200),
      [this]() {
        startupTimer_->cancel();
        RCLCPP_INFO(get_logger(), "Auto-start: triggering configure");
        auto configResult = this->trigger_transition(
          lifecycle_msgs::msg::Transition::TRANSITION_CONFIGURE);
        if (configResult.id() != lifecycle_msgs::msg::State::PRIMARY_STATE_INACTIVE) {
          RCLCPP_ERROR(get_logger(), "Auto-configure failed (state=%s)",
            configResult.label().c_str());
          return;
        }
        auto activateResult = this->trigger_transition(
          lifecycle_msgs::msg::Transition::TRANSITION_ACTIVATE);
        if (activateResult.id() != lifecycle_msgs::msg::State::PRIMARY_STATE_ACTIVE) {
          RCLCPP_ERROR(get_logger(), "Auto-activate failed (state=%s)",
            activateResult.label().c_str());
          return;
        }
        RCLCPP_INFO(get_logger(), "Auto-start complete: ACTIVE");
      });
  }
}

MonitorNode::CallbackReturn MonitorNode::on_configure(const rclcpp_lifecycle::State &)
{
  if (sourceMode_ != "auto" && sourceMode_ != "sysfs" && sourceMode_ != "topic" &&
    sourceMode_ != "simulator")
  {
    RCLCPP_ERROR(get_logger(), "source must be one of auto|sysfs|topic|simulator, got '%s'",
      sourceMode_.c_str());
    return CallbackReturn::FAILURE;
  }
  if (notificationBackend_ != "log" && notificationBackend_ != "command") {
    RCLCPP_ERROR(get_logger(), "notification_backend must be log or command, got '%s'",
      notificationBackend_.c_str());
    return CallbackReturn::FAILURE;
  }
  if (configDrainPeriodMs_ <= 0 || notifyTimeoutS_ <= 0.0 || batteryFreshnessTimeoutS_ <= 0.0) {
    RCLCPP_ERROR(get_logger(),
      "config_drain_period_ms, notify_timeout_s and battery_freshness_timeout_s must be > 0");
    return CallbackReturn::FAILURE;
  }

  MonitorConfig seed;
  try {
    seed = configFromParameters();
  } catch (const ConfigError & e) {
    RCLCPP_ERROR(get_logger(), "Invalid monitor parameters: %s", e.what());
    return CallbackReturn::FAILURE;
  }
  if (const auto error = validationError(seed)) {
    RCLCPP_ERROR(get_logger(), "Invalid monitor parameters: %s", error->c_str());
    return CallbackReturn::FAILURE;
  }

  const std::filesystem::path path =
    configPath_.empty() ? defaultConfigPath() : std::filesystem::path(configPath_);
  store_ = std::make_shared<ParamsFileConfigStore>(
    path, this->get_name(), get_logger().get_child("config"), seed);

  MonitorConfig config;
  try {
    config = store_->load();
  } catch (const ConfigError & e) {
    RCLCPP_ERROR(get_logger(), "Cannot load configuration: %s", e.what());
    store_.reset();
    return CallbackReturn::FAILURE;
  }

  applyLogLevel(config);
  syncParameters(config);

  sink_ = makeSink();
  monitor_ = std::make_unique<Monitor>(config, sink_, store_, get_logger().get_child("monitor"));

  statusPub_ = this->create_publisher<sensor_msgs::msg::BatteryState>(
    "~/battery_state", rclcpp::QoS(10).reliable());
  installSource(config);

  channel_ = store_->watch();

  // Timers are created cancelled and only run while active.
  armPollTimer(true);
  pollTimer_->cancel();
  drainTimer_ = this->create_wall_timer(
    std::chrono::milliseconds(configDrainPeriodMs_),
    std::bind(&MonitorNode::onDrainTick, this));
  drainTimer_->cancel();

  RCLCPP_INFO(
    get_logger(),
    "Configured charge_monitor (config=%s, source=%s, notify=%s, %s)",
    store_->path().c_str(), source_->name().c_str(), sink_->name().c_str(),
    describe(config).c_str());
  return CallbackReturn::SUCCESS;
}

MonitorNode::CallbackReturn MonitorNode::on_activate(const rclcpp_lifecycle::State &)
{
  if (!monitor_ || !statusPub_ || !drainTimer_) {
    return CallbackReturn::FAILURE;
  }
  statusPub_->on_activate();
  armPollTimer(true);
  drainTimer_->reset();
  RCLCPP_INFO(get_logger(), "Activated charge_monitor (check every %ds)", activeIntervalS_);
  return CallbackReturn::SUCCESS;
}

MonitorNode::CallbackReturn MonitorNode::on_deactivate(const rclcpp_lifecycle::State &)
{
  if (pollTimer_) {
    pollTimer_->cancel();
  }
  if (drainTimer_) {
    drainTimer_->cancel();
  }
  if (statusPub_) {
    statusPub_->on_deactivate();
  }
  RCLCPP_INFO(get_logger(), "Deactivated charge_monitor");
  return CallbackReturn::SUCCESS;
}

MonitorNode::CallbackReturn MonitorNode::on_cleanup(const rclcpp_lifecycle::State &)
{
  pollTimer_.reset();
  drainTimer_.reset();
  batterySub_.reset();
  statusPub_.reset();
  topicSource_ = nullptr;
  source_.reset();
  monitor_.reset();
  sink_.reset();
  channel_.reset();
  if (store_) {
    store_->stopWatching();
    store_.reset();
  }
  activeIntervalS_ = 0;

  RCLCPP_INFO(get_logger(), "Cleaned up charge_monitor");
  return CallbackReturn::SUCCESS;
}

MonitorNode::CallbackReturn MonitorNode::on_shutdown(const rclcpp_lifecycle::State &)
{
  (void)on_cleanup(this->get_current_state());
  return CallbackReturn::SUCCESS;
}

MonitorNode::CallbackReturn MonitorNode::on_error(const rclcpp_lifecycle::State &)
{
  if (pollTimer_) {
    pollTimer_->cancel();
  }
  if (drainTimer_) {
    drainTimer_->cancel();
  }
  if (statusPub_ && statusPub_->is_activated()) {
    statusPub_->on_deactivate();
  }
  return CallbackReturn::SUCCESS;
}

void MonitorNode::onPollTick()
{
  if (!monitor_ || !source_) {
    return;
  }

  const auto result = source_->poll();
  if (!result.ok()) {
    RCLCPP_WARN_THROTTLE(get_logger(), *get_clock(), 60000, "Battery poll via %s failed: %s",
      source_->name().c_str(), result.reason.c_str());
    return;
  }
  const auto & snapshot = *result.snapshot;

  if (publishStatus_ && statusPub_ && statusPub_->is_activated()) {
    auto msg = messageFromSnapshot(snapshot);
    msg.header.stamp = this->now();
    statusPub_->publish(msg);
  }

  const auto outcome = monitor_->check(std::chrono::steady_clock::now(), snapshot);
  RCLCPP_DEBUG(get_logger(), "Check %d%% %s: %s (%s)",
    snapshot.capacityPercent, snapshot.charging ? "charging" : "discharging",
    Monitor::toString(outcome.action), outcome.reasonCode.c_str());

  if (outcome.intervalChanged) {
    syncParameters(monitor_->config());
  }
  armPollTimer(false);
}

void MonitorNode::onDrainTick()
{
  if (!channel_) {
    return;
  }
  if (const auto config = channel_->takeLatest()) {
    applyConfig(*config);
  }
}

void MonitorNode::onBattery(const sensor_msgs::msg::BatteryState::SharedPtr msg)
{
  if (topicSource_ != nullptr) {
    topicSource_->onBatteryState(*msg, std::chrono::steady_clock::now());
  }
}

rcl_interfaces::msg::SetParametersResult MonitorNode::onSetParameters(
  const std::vector<rclcpp::Parameter> & parameters)
{
  rcl_interfaces::msg::SetParametersResult result;
  result.successful = true;
  // Before configure the values only seed the file; mirrored values are already applied.
  if (syncingParameters_ || !monitor_ || !store_ || !channel_) {
    return result;
  }

  MonitorConfig candidate = monitor_->config();
  bool touched = false;
  try {
    for (const auto & param : parameters) {
      touched = assignConfigField(candidate, param) || touched;
    }
  } catch (const rclcpp::ParameterTypeException & e) {
    result.successful = false;
    result.reason = e.what();
    return result;
  } catch (const ConfigError & e) {
    result.successful = false;
    result.reason = e.what();
    RCLCPP_WARN(get_logger(), "Rejected parameter update: %s", e.what());
    return result;
  }
  if (!touched || candidate == monitor_->config()) {
    return result;
  }

  if (const auto error = validationError(candidate)) {
    result.successful = false;
    result.reason = *error;
    RCLCPP_WARN(get_logger(), "Rejected parameter update: %s", error->c_str());
    return result;
  }

  const auto saved = store_->save(candidate);
  if (!saved.ok) {
    result.successful = false;
    result.reason = saved.reason;
    RCLCPP_ERROR(get_logger(), "Could not persist parameter update: %s", saved.reason.c_str());
    return result;
  }
  channel_->push(candidate);
  return result;
}

std::unique_ptr<BatterySource> MonitorNode::makeSource(const MonitorConfig & config)
{
  const auto logger = get_logger().get_child("source");
  const auto simulated = [this, &config, &logger]() {
      return std::make_unique<SimulatedBatterySource>(
        simulatorConfigFrom(config),
        [this]() {return monitor_ ? monitor_->state().notificationsShown : 0;},
        logger);
    };

  if (config.use_simulator || sourceMode_ == "simulator") {
    return simulated();
  }
  if (sourceMode_ == "topic") {
    return std::make_unique<TopicBatterySource>(
      std::chrono::milliseconds(static_cast<int64_t>(batteryFreshnessTimeoutS_ * 1000.0)));
  }

  auto sysfs = std::make_unique<SysfsBatterySource>(sysfsRoot_, sysfsBattery_, logger);
  if (sourceMode_ == "auto" && !sysfs->batteryPath().has_value()) {
    RCLCPP_WARN(get_logger(), "No battery under %s, falling back to the simulator",
      sysfsRoot_.c_str());
    return simulated();
  }
  return sysfs;
}

void MonitorNode::installSource(const MonitorConfig & config)
{
  batterySub_.reset();
  topicSource_ = nullptr;
  source_ = makeSource(config);
  publishStatus_ = true;

  topicSource_ = dynamic_cast<TopicBatterySource *>(source_.get());
  if (topicSource_ != nullptr) {
    batterySub_ = this->create_subscription<sensor_msgs::msg::BatteryState>(
      batteryTopic_, rclcpp::QoS(20).reliable(),
      std::bind(&MonitorNode::onBattery, this, std::placeholders::_1));
    // Republishing onto the topic we read from would feed back into ourselves.
    publishStatus_ =
      std::string(batterySub_->get_topic_name()) != std::string(statusPub_->get_topic_name());
  }
  RCLCPP_INFO(get_logger(), "Battery source: %s", source_->name().c_str());
}

std::shared_ptr<NotificationSink> MonitorNode::makeSink()
{
  const auto logger = get_logger().get_child("notify");
  if (notificationBackend_ == "command") {
    return std::make_shared<CommandNotificationSink>(
      notifyCommand_,
      std::chrono::milliseconds(static_cast<int64_t>(notifyTimeoutS_ * 1000.0)),
      logger);
  }
  return std::make_shared<LogNotificationSink>(logger);
}

void MonitorNode::applyConfig(const MonitorConfig & config)
{
  const MonitorConfig previous = monitor_->config();
  monitor_->applyConfig(config);

  if (previous.use_simulator != config.use_simulator) {
    installSource(config);
  } else {
    source_->reconfigure(config);
  }
  applyLogLevel(config);
  // Every applied config restarts the poll period, even when its length is unchanged.
  armPollTimer(true);
  syncParameters(config);
}

void MonitorNode::applyLogLevel(const MonitorConfig & config)
{
  const auto level =
    config.debug_enabled ? rclcpp::Logger::Level::Debug : rclcpp::Logger::Level::Info;
  try {
    get_logger().set_level(level);
  } catch (const rclcpp::exceptions::RCLError & e) {
    RCLCPP_WARN(get_logger(), "Could not change log level: %s", e.what());
  }
}

void MonitorNode::armPollTimer(const bool restart)
{
  const int interval = monitor_->checkIntervalS();
  if (!restart && pollTimer_ && interval == activeIntervalS_) {
    return;
  }
  if (pollTimer_) {
    pollTimer_->cancel();
  }
  pollTimer_ = this->create_wall_timer(
    std::chrono::seconds(interval), std::bind(&MonitorNode::onPollTick, this));
  if (activeIntervalS_ != 0 && interval != activeIntervalS_) {
    RCLCPP_INFO(get_logger(), "Check interval changed: %ds -> %ds", activeIntervalS_, interval);
  }
  activeIntervalS_ = interval;
}

std::chrono::nanoseconds MonitorNode::timeUntilNextPoll() const
{
  if (!pollTimer_ || pollTimer_->is_canceled()) {
    return std::chrono::nanoseconds::max();
  }
  return pollTimer_->time_until_trigger();
}

void MonitorNode::syncParameters(const MonitorConfig & config)
{
  syncingParameters_ = true;
  const auto results = this->set_parameters(parametersFrom(config));
  syncingParameters_ = false;
  for (const auto & r : results) {
    if (!r.successful) {
      RCLCPP_WARN(get_logger(), "Could not mirror configuration into parameters: %s",
        r.reason.c_str());
    }
  }
}

MonitorConfig MonitorNode::configFromParameters() const
{
  MonitorConfig config;
  for (const auto & param : this->get_parameters(configKeys())) {
    assignConfigField(config, param);
  }
  return config;
}

}  // namespace charge_monitor

RCLCPP_COMPONENTS_REGISTER_NODE(charge_monitor::MonitorNode)
