#include <charge_monitor/config_channel.hpp>

namespace charge_monitor
{

ConfigChannel::ConfigChannel(const std::size_t capacity)
: capacity_(capacity == 0 ? 1 : capacity)
{
}

void ConfigChannel::push(const MonitorConfig & config)
{
  std::scoped_lock lock(mutex_);

  pending_.push_back(config);
  while (pending_.size() > capacity_) {
    pending_.pop_front();
    ++dropped_;
  }
}

std::optional<MonitorConfig> ConfigChannel::tryPop()
{
  std::scoped_lock lock(mutex_);
  if (pending_.empty()) {
    return std::nullopt;
  }
  MonitorConfig front = pending_.front();
  pending_.pop_front();
  return front;
}

std::optional<MonitorConfig> ConfigChannel::takeLatest()
{
  std::scoped_lock lock(mutex_);
  if (pending_.empty()) {
    return std::nullopt;
  }
  MonitorConfig latest = pending_.back();
  pending_.clear();
  return latest;
}

std::size_t ConfigChannel::size() const
{
  std::scoped_lock lock(mutex_);
  return pending_.size();
}

std::size_t ConfigChannel::dropped() const
{
  std::scoped_lock lock(mutex_);
  return dropped_;
}

}  // namespace charge_monitor
