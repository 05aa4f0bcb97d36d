/**
 * @file test_notification_throttle.cpp
 * @brief Unit tests for the quota and spacing gate.
 */

#include <gtest/gtest.h>

#include <charge_monitor/notification_throttle.hpp>

#include <chrono>
#include <string>

using charge_monitor::NotificationThrottle;
using charge_monitor::ThrottlePolicy;
using charge_monitor::ThrottleVerdict;
using Clock = std::chrono::steady_clock;

namespace
{

NotificationThrottle makeThrottle(int maxNotifications, std::chrono::seconds spacing)
{
  ThrottlePolicy policy;
  policy.maxNotifications = maxNotifications;
  policy.minSpacing = spacing;
  return NotificationThrottle(policy);
}

}  // namespace

// The unset timestamp always passes the spacing rule, even right after boot.
TEST(NotificationThrottleTest, FirstNotificationOfPhaseIsAllowed)
{
  const auto throttle = makeThrottle(3, std::chrono::hours(24));
  EXPECT_EQ(throttle.evaluate(0, Clock::time_point{}, Clock::now()), ThrottleVerdict::Allowed);
}

TEST(NotificationThrottleTest, SpacingIsInclusive)
{
  const auto throttle = makeThrottle(3, std::chrono::seconds(60));
  const auto last = Clock::now();

  EXPECT_EQ(throttle.evaluate(1, last, last + std::chrono::seconds(59)),
    ThrottleVerdict::SpacingNotElapsed);
  EXPECT_EQ(throttle.evaluate(1, last, last + std::chrono::seconds(60)),
    ThrottleVerdict::Allowed);
}

// Quota wins over spacing.
TEST(NotificationThrottleTest, QuotaExhaustedBlocksRegardlessOfSpacing)
{
  const auto throttle = makeThrottle(2, std::chrono::seconds(1));
  const auto last = Clock::now();

  EXPECT_EQ(throttle.evaluate(2, last, last + std::chrono::hours(10)),
    ThrottleVerdict::QuotaExhausted);
  EXPECT_EQ(throttle.evaluate(2, Clock::time_point{}, last), ThrottleVerdict::QuotaExhausted);
  EXPECT_EQ(throttle.evaluate(1, last, last + std::chrono::seconds(1)), ThrottleVerdict::Allowed);
}

TEST(NotificationThrottleTest, VerdictNames)
{
  EXPECT_EQ(std::string(NotificationThrottle::toString(ThrottleVerdict::Allowed)), "ALLOWED");
  EXPECT_EQ(std::string(NotificationThrottle::toString(ThrottleVerdict::QuotaExhausted)),
    "QUOTA_EXHAUSTED");
  EXPECT_EQ(std::string(NotificationThrottle::toString(ThrottleVerdict::SpacingNotElapsed)),
    "SPACING_NOT_ELAPSED");
}
