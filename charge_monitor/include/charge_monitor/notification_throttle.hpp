/**
 * @file notification_throttle.hpp
 * @brief Gate deciding whether a threshold trigger becomes a notification.
 *
 * A trigger candidate passes only when both hold:
 *   1. fewer than maxNotifications have been shown in the current phase
 *   2. at least minSpacing has elapsed since the last one
 *
 * The default-constructed time point means "nothing shown yet in this phase"
 * and always satisfies the spacing rule. It is tested explicitly because a
 * steady_clock epoch is not guaranteed to lie further back than minSpacing.
 */

#pragma once

#include <chrono>
#include <cstdint>

namespace charge_monitor
{

enum class ThrottleVerdict : uint8_t
{
  Allowed,
  QuotaExhausted,
  SpacingNotElapsed
};

struct ThrottlePolicy
{
  int maxNotifications{3};
  std::chrono::seconds minSpacing{1800};
};

class NotificationThrottle
{
public:
  explicit NotificationThrottle(ThrottlePolicy policy);

  ThrottleVerdict evaluate(
    int notificationsShown,
    std::chrono::steady_clock::time_point lastNotificationTime,
    std::chrono::steady_clock::time_point now) const;

  const ThrottlePolicy & policy() const { return policy_; }

  static const char * toString(ThrottleVerdict verdict);

private:
  ThrottlePolicy policy_;
};

}  // namespace charge_monitor
