#include <charge_monitor/params_file_config_store.hpp>

#include <rclcpp/logging.hpp>
#include <rclcpp/parameter_map.hpp>

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <set>
#include <sstream>
#include <system_error>
#include <utility>

namespace charge_monitor
{
namespace
{

struct FieldBinding
{
  const char * key;
  int MonitorConfig::* intField;
  bool MonitorConfig::* boolField;
};

const std::vector<FieldBinding> & bindings()
{
  static const std::vector<FieldBinding> kBindings = {
    {"min_threshold", &MonitorConfig::min_threshold, nullptr},
    {"max_threshold", &MonitorConfig::max_threshold, nullptr},
    {"check_interval_charging", &MonitorConfig::check_interval_charging, nullptr},
    {"check_interval_discharging", &MonitorConfig::check_interval_discharging, nullptr},
    {"notification_interval", &MonitorConfig::notification_interval, nullptr},
    {"max_notifications", &MonitorConfig::max_notifications, nullptr},
    {"min_check_interval", &MonitorConfig::min_check_interval, nullptr},
    {"use_simulator", nullptr, &MonitorConfig::use_simulator},
    {"debug_enabled", nullptr, &MonitorConfig::debug_enabled},
  };
  return kBindings;
}

const FieldBinding * findBinding(const std::string & key)
{
  for (const auto & binding : bindings()) {
    if (key == binding.key) {
      return &binding;
    }
  }
  return nullptr;
}

int integerValue(const rclcpp::Parameter & param)
{
  if (param.get_type() == rclcpp::ParameterType::PARAMETER_INTEGER) {
    return checkedInt(param.get_name(), param.as_int());
  }
  if (param.get_type() == rclcpp::ParameterType::PARAMETER_DOUBLE) {
    const double value = param.as_double();
    if (std::isfinite(value) && std::floor(value) == value &&
      std::fabs(value) <= static_cast<double>(std::numeric_limits<int>::max()))
    {
      return static_cast<int>(value);
    }
  }
  throw ConfigError("'" + param.get_name() + "' must be an integer, got " + param.value_to_string());
}

bool boolValue(const rclcpp::Parameter & param)
{
  if (param.get_type() != rclcpp::ParameterType::PARAMETER_BOOL) {
    throw ConfigError("'" + param.get_name() + "' must be a boolean, got " + param.value_to_string());
  }
  return param.as_bool();
}

std::string quoted(const std::string & text)
{
  std::string out = "\"";
  for (const char c : text) {
    if (c == '"' || c == '\\') {
      out += '\\';
    }
    out += c;
  }
  out += '"';
  return out;
}

std::string yamlValue(const rclcpp::ParameterValue & value)
{
  switch (value.get_type()) {
    case rclcpp::ParameterType::PARAMETER_BOOL:
      return value.get<bool>() ? "true" : "false";
    case rclcpp::ParameterType::PARAMETER_STRING:
      return quoted(value.get<std::string>());
    case rclcpp::ParameterType::PARAMETER_STRING_ARRAY:
      {
        std::string out = "[";
        const auto & items = value.get<std::vector<std::string>>();
        for (std::size_t i = 0; i < items.size(); ++i) {
          out += (i == 0 ? "" : ", ") + quoted(items[i]);
        }
        return out + "]";
      }
    default:
      return rclcpp::to_string(value);
  }
}

}  // namespace

ParamsFileConfigStore::ParamsFileConfigStore(
  std::filesystem::path path,
  std::string nodeName,
  rclcpp::Logger logger,
  MonitorConfig defaults)
: path_(std::move(path))
, nodeName_(std::move(nodeName))
, logger_(logger)
, defaults_(defaults)
{
}

ParamsFileConfigStore::~ParamsFileConfigStore()
{
  stopWatching();
}

MonitorConfig ParamsFileConfigStore::load()
{
  std::error_code ec;
  if (!std::filesystem::exists(path_, ec)) {
    RCLCPP_INFO(logger_, "No configuration at %s, creating it with defaults", path_.c_str());
    const auto written = write(defaults_);
    if (!written.ok) {
      throw ConfigError("cannot create default configuration: " + written.reason);
    }
    return defaults_;
  }

  rclcpp::ParameterMap parameterMap;
  try {
    parameterMap = rclcpp::parameter_map_from_yaml_file(path_.string());
  } catch (const std::exception & e) {
    throw ConfigError("cannot parse " + path_.string() + ": " + e.what());
  }

  MonitorConfig config = defaults_;
  std::set<std::string> present;
  std::vector<rclcpp::Parameter> foreign;

  // Node-specific entries override the wildcard section.
  for (const auto & section : {std::string("/**"), "/" + nodeName_}) {
    const auto it = parameterMap.find(section);
    if (it == parameterMap.end()) {
      continue;
    }
    for (const auto & param : it->second) {
      const auto * binding = findBinding(param.get_name());
      if (binding == nullptr) {
        RCLCPP_DEBUG(logger_, "Keeping unmanaged parameter '%s'", param.get_name().c_str());
        const auto existing = std::find_if(
          foreign.begin(), foreign.end(),
          [&param](const rclcpp::Parameter & kept) {return kept.get_name() == param.get_name();});
        if (existing != foreign.end()) {
          *existing = param;
        } else {
          foreign.push_back(param);
        }
        continue;
      }
      if (binding->intField != nullptr) {
        config.*(binding->intField) = integerValue(param);
      } else {
        config.*(binding->boolField) = boolValue(param);
      }
      present.insert(param.get_name());
    }
  }

  if (const auto error = validationError(config)) {
    throw ConfigError("invalid configuration in " + path_.string() + ": " + *error);
  }

  {
    std::scoped_lock lock(mutex_);
    foreignParameters_ = std::move(foreign);
    lastKnown_ = config;
  }

  bool completed = false;
  for (const auto & binding : bindings()) {
    if (present.count(binding.key) == 0) {
      RCLCPP_INFO(logger_, "Key '%s' missing, using default", binding.key);
      completed = true;
    }
  }
  if (completed) {
    const auto written = write(config);
    if (!written.ok) {
      RCLCPP_WARN(logger_, "Could not write completed configuration: %s", written.reason.c_str());
    }
  }

  RCLCPP_DEBUG(logger_, "Loaded %s: %s", path_.c_str(), describe(config).c_str());
  return config;
}

OperationResult ParamsFileConfigStore::save(const MonitorConfig & config)
{
  if (const auto error = validationError(config)) {
    return OperationResult::failure("refusing to save invalid configuration: " + *error);
  }
  return write(config);
}

std::shared_ptr<ConfigChannel> ParamsFileConfigStore::watch()
{
  if (!channel_) {
    channel_ = std::make_shared<ConfigChannel>();
  }
  if (!watcher_) {
    watcher_ = std::make_unique<ConfigFileWatcher>(
      path_, [this]() {onFileChanged();}, logger_);
    const auto started = watcher_->start();
    if (!started.ok) {
      RCLCPP_ERROR(logger_, "Configuration hot reload disabled: %s", started.reason.c_str());
      watcher_.reset();
    }
  }
  return channel_;
}

void ParamsFileConfigStore::stopWatching()
{
  if (watcher_) {
    watcher_->stop();
    watcher_.reset();
  }
}

void ParamsFileConfigStore::onFileChanged()
{
  std::optional<MonitorConfig> previous;
  {
    std::scoped_lock lock(mutex_);
    previous = lastKnown_;
  }

  MonitorConfig config;
  try {
    config = load();
  } catch (const ConfigError & e) {
    RCLCPP_ERROR(logger_, "Ignoring edited configuration: %s", e.what());
    return;
  }

  // Our own saves come back through inotify as well.
  if (previous.has_value() && *previous == config) {
    RCLCPP_DEBUG(logger_, "Configuration unchanged since last load or save");
    return;
  }
  channel_->push(config);
}

OperationResult ParamsFileConfigStore::write(const MonitorConfig & config)
{
  std::error_code ec;
  if (path_.has_parent_path()) {
    std::filesystem::create_directories(path_.parent_path(), ec);
    if (ec) {
      return OperationResult::failure(
        "cannot create " + path_.parent_path().string() + ": " + ec.message());
    }
  }

  std::ostringstream out;
  out << nodeName_ << ":\n";
  out << "  ros__parameters:\n";
  for (const auto & binding : bindings()) {
    out << "    " << binding.key << ": ";
    if (binding.intField != nullptr) {
      out << config.*(binding.intField);
    } else {
      out << (config.*(binding.boolField) ? "true" : "false");
    }
    out << "\n";
  }

  std::scoped_lock lock(mutex_);
  for (const auto & param : foreignParameters_) {
    out << "    " << param.get_name() << ": " << yamlValue(param.get_parameter_value()) << "\n";
  }

  const auto tmp = path_.string() + ".tmp";
  {
    std::ofstream file(tmp, std::ios::trunc);
    if (!file) {
      return OperationResult::failure("cannot open " + tmp + " for writing");
    }
    file << out.str();
    file.flush();
    if (!file) {
      std::remove(tmp.c_str());
      return OperationResult::failure("write to " + tmp + " failed");
    }
  }

  std::filesystem::rename(tmp, path_, ec);
  if (ec) {
    std::remove(tmp.c_str());
    return OperationResult::failure("cannot replace " + path_.string() + ": " + ec.message());
  }

  lastKnown_ = config;
  RCLCPP_DEBUG(logger_, "Saved configuration to %s", path_.c_str());
  return OperationResult::success();
}

std::filesystem::path defaultConfigPath()
{
  std::filesystem::path base;
  if (const char * xdg = std::getenv("XDG_CONFIG_HOME"); xdg != nullptr && *xdg != '\0') {
    base = xdg;
  } else if (const char * home = std::getenv("HOME"); home != nullptr && *home != '\0') {
    base = std::filesystem::path(home) / ".config";
  } else {
    base = std::filesystem::temp_directory_path();
  }
  return base / "charge_monitor" / "config.yaml";
}

}  // namespace charge_monitor
