#include <charge_monitor/command_notification_sink.hpp>

#include <rclcpp/logging.hpp>

#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <csignal>
#include <cstring>
#include <sstream>
#include <thread>
#include <utility>

namespace charge_monitor
{
namespace
{

constexpr auto kWaitPollPeriod = std::chrono::milliseconds(20);
constexpr int kExecFailedStatus = 127;

}  // namespace

CommandNotificationSink::CommandNotificationSink(
  std::string command,
  std::chrono::milliseconds timeout,
  rclcpp::Logger logger)
: command_(std::move(command))
, timeout_(timeout)
, logger_(logger)
{
}

OperationResult CommandNotificationSink::notifyLow(
  const int level, const int threshold, const int remaining)
{
  RCLCPP_WARN(logger_, "Low battery: %d%% (threshold %d%%)", level, threshold);
  return run({lowBatteryTitle(), lowBatteryMessage(level, threshold, remaining)});
}

OperationResult CommandNotificationSink::notifyHigh(
  const int level, const int threshold, const int remaining)
{
  RCLCPP_WARN(logger_, "High battery: %d%% (threshold %d%%)", level, threshold);
  return run({highBatteryTitle(), highBatteryMessage(level, threshold, remaining)});
}

std::string CommandNotificationSink::name() const
{
  return "command:" + command_;
}

OperationResult CommandNotificationSink::run(const std::vector<std::string> & args) const
{
  if (command_.empty()) {
    return OperationResult::failure("notify command is empty");
  }

  std::vector<char *> argv;
  argv.reserve(args.size() + 2);
  argv.push_back(const_cast<char *>(command_.c_str()));
  for (const auto & arg : args) {
    argv.push_back(const_cast<char *>(arg.c_str()));
  }
  argv.push_back(nullptr);

  const pid_t pid = ::fork();
  if (pid < 0) {
    return OperationResult::failure(std::string("fork failed: ") + std::strerror(errno));
  }
  if (pid == 0) {
    ::execvp(argv[0], argv.data());
    ::_exit(kExecFailedStatus);
  }

  const auto deadline = std::chrono::steady_clock::now() + timeout_;
  int status = 0;
  while (true) {
    const pid_t done = ::waitpid(pid, &status, WNOHANG);
    if (done == pid) {
      break;
    }
    if (done < 0 && errno != EINTR) {
      return OperationResult::failure(std::string("waitpid failed: ") + std::strerror(errno));
    }
    if (std::chrono::steady_clock::now() >= deadline) {
      ::kill(pid, SIGKILL);
      ::waitpid(pid, &status, 0);
      std::ostringstream oss;
      oss << command_ << " timed out after " << timeout_.count() << "ms";
      return OperationResult::failure(oss.str());
    }
    std::this_thread::sleep_for(kWaitPollPeriod);
  }

  if (WIFEXITED(status) && WEXITSTATUS(status) == 0) {
    RCLCPP_DEBUG(logger_, "%s delivered notification", command_.c_str());
    return OperationResult::success();
  }

  std::ostringstream oss;
  if (WIFEXITED(status)) {
    oss << command_ << " exited with status " << WEXITSTATUS(status);
    if (WEXITSTATUS(status) == kExecFailedStatus) {
      oss << " (command not found?)";
    }
  } else if (WIFSIGNALED(status)) {
    oss << command_ << " killed by signal " << WTERMSIG(status);
  } else {
    oss << command_ << " ended abnormally";
  }
  return OperationResult::failure(oss.str());
}

}  // namespace charge_monitor
