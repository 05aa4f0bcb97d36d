#include <charge_monitor/notification_throttle.hpp>

namespace charge_monitor
{

NotificationThrottle::NotificationThrottle(ThrottlePolicy policy)
: policy_(policy)
{
}

ThrottleVerdict NotificationThrottle::evaluate(
  const int notificationsShown,
  const std::chrono::steady_clock::time_point lastNotificationTime,
  const std::chrono::steady_clock::time_point now) const
{
  if (notificationsShown >= policy_.maxNotifications) {
    return ThrottleVerdict::QuotaExhausted;
  }

  if (lastNotificationTime == std::chrono::steady_clock::time_point{}) {
    return ThrottleVerdict::Allowed;
  }

  if (now - lastNotificationTime < policy_.minSpacing) {
    return ThrottleVerdict::SpacingNotElapsed;
  }
  return ThrottleVerdict::Allowed;
}

const char * NotificationThrottle::toString(const ThrottleVerdict verdict)
{
  switch (verdict) {
    case ThrottleVerdict::Allowed:
      return "ALLOWED";
    case ThrottleVerdict::QuotaExhausted:
      return "QUOTA_EXHAUSTED";
    case ThrottleVerdict::SpacingNotElapsed:
      return "SPACING_NOT_ELAPSED";
    default:
      return "UNKNOWN";
  }
}

}  // namespace charge_monitor
