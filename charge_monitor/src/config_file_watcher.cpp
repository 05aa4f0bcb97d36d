#include <charge_monitor/config_file_watcher.hpp>

#include <rclcpp/logging.hpp>

#include <poll.h>
#include <sys/inotify.h>
#include <unistd.h>

#include <cerrno>
#include <cstdint>
#include <cstring>
#include <utility>

namespace charge_monitor
{
namespace
{

constexpr int kPollTimeoutMs = 200;
constexpr uint32_t kWatchMask = IN_CLOSE_WRITE | IN_MOVED_TO | IN_CREATE;

}  // namespace

ConfigFileWatcher::ConfigFileWatcher(
  std::filesystem::path file,
  std::function<void()> onChange,
  rclcpp::Logger logger,
  const std::chrono::milliseconds debounce)
: file_(std::move(file))
, onChange_(std::move(onChange))
, logger_(logger)
, debounce_(debounce)
{
}

ConfigFileWatcher::~ConfigFileWatcher()
{
  stop();
}

OperationResult ConfigFileWatcher::start()
{
  if (running_) {
    return OperationResult::success();
  }

  fd_ = ::inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
  if (fd_ < 0) {
    return OperationResult::failure(std::string("inotify_init1 failed: ") + std::strerror(errno));
  }

  const auto dir = file_.has_parent_path() ? file_.parent_path() : std::filesystem::path(".");
  watch_ = ::inotify_add_watch(fd_, dir.c_str(), kWatchMask);
  if (watch_ < 0) {
    const std::string why = std::strerror(errno);
    ::close(fd_);
    fd_ = -1;
    return OperationResult::failure("cannot watch " + dir.string() + ": " + why);
  }

  stopRequested_ = false;
  running_ = true;
  thread_ = std::thread(&ConfigFileWatcher::run, this);
  RCLCPP_INFO(logger_, "Watching %s for changes", file_.c_str());
  return OperationResult::success();
}

void ConfigFileWatcher::stop()
{
  stopRequested_ = true;
  if (thread_.joinable()) {
    thread_.join();
  }
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
    watch_ = -1;
  }
  running_ = false;
}

void ConfigFileWatcher::run()
{
  pollfd pfd{};
  pfd.fd = fd_;
  pfd.events = POLLIN;

  while (!stopRequested_) {
    const int ready = ::poll(&pfd, 1, kPollTimeoutMs);
    if (ready < 0) {
      if (errno == EINTR) {
        continue;
      }
      RCLCPP_ERROR(logger_, "poll on inotify failed: %s", std::strerror(errno));
      break;
    }
    if (ready == 0 || !drainEvents()) {
      continue;
    }

    std::this_thread::sleep_for(debounce_);
    drainEvents();
    if (stopRequested_) {
      break;
    }
    RCLCPP_INFO(logger_, "Detected change in %s, reloading", file_.c_str());
    onChange_();
  }
  running_ = false;
}

bool ConfigFileWatcher::drainEvents()
{
  alignas(inotify_event) char buffer[4096];
  bool matched = false;
  const std::string name = file_.filename().string();

  while (true) {
    const ssize_t len = ::read(fd_, buffer, sizeof(buffer));
    if (len <= 0) {
      break;
    }
    for (char * ptr = buffer; ptr < buffer + len; ) {
      const auto * event = reinterpret_cast<const inotify_event *>(ptr);
      if (event->len > 0 && name == event->name) {
        matched = true;
      }
      ptr += sizeof(inotify_event) + event->len;
    }
  }
  return matched;
}

}  // namespace charge_monitor
