/**
 * @file test_monitor.cpp
 * @brief Unit tests for Monitor threshold evaluation, throttling and phase resets.
 *
 * The monitor is driven with explicit steady_clock time points and in-test
 * fakes for the notification sink and the config store, so no ROS context is
 * needed (rclcpp::get_logger works without rclcpp::init).
 */

#include <gtest/gtest.h>

#include <charge_monitor/monitor.hpp>

#include <rclcpp/logger.hpp>

#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace
{

using charge_monitor::BatterySnapshot;
using charge_monitor::CheckAction;
using charge_monitor::Monitor;
using charge_monitor::MonitorConfig;
using charge_monitor::OperationResult;
using Clock = std::chrono::steady_clock;

struct SentNotification
{
  bool low{false};
  int level{0};
  int threshold{0};
  int remaining{0};
};

class FakeSink : public charge_monitor::NotificationSink
{
public:
  OperationResult notifyLow(int level, int threshold, int remaining) override
  {
    sent.push_back({true, level, threshold, remaining});
    return fail ? OperationResult::failure("sink offline") : OperationResult::success();
  }

  OperationResult notifyHigh(int level, int threshold, int remaining) override
  {
    sent.push_back({false, level, threshold, remaining});
    return fail ? OperationResult::failure("sink offline") : OperationResult::success();
  }

  std::string name() const override { return "fake"; }

  std::vector<SentNotification> sent;
  bool fail{false};
};

class FakeStore : public charge_monitor::ConfigStore
{
public:
  MonitorConfig load() override { return MonitorConfig{}; }

  OperationResult save(const MonitorConfig & config) override
  {
    saved.push_back(config);
    return OperationResult::success();
  }

  std::shared_ptr<charge_monitor::ConfigChannel> watch() override { return nullptr; }

  std::vector<MonitorConfig> saved;
};

BatterySnapshot reading(int capacity, bool charging)
{
  BatterySnapshot snapshot;
  snapshot.capacityPercent = capacity;
  snapshot.charging = charging;
  snapshot.plugged = charging;
  return snapshot;
}

MonitorConfig config2080()
{
  MonitorConfig config;
  config.min_threshold = 20;
  config.max_threshold = 80;
  return config;
}

class MonitorTest : public ::testing::Test
{
protected:
  void SetUp() override
  {
    sink_ = std::make_shared<FakeSink>();
    store_ = std::make_shared<FakeStore>();
  }

  std::unique_ptr<Monitor> makeMonitor(const MonitorConfig & config)
  {
    return std::make_unique<Monitor>(config, sink_, store_, rclcpp::get_logger("test_monitor"));
  }

  std::shared_ptr<FakeSink> sink_;
  std::shared_ptr<FakeStore> store_;
  const Clock::time_point t0_ = Clock::now();
};

}  // namespace

// The very first reading only records state, even when it is below the threshold.
TEST_F(MonitorTest, FirstReadingInitializesWithoutNotifying)
{
  auto monitor = makeMonitor(config2080());

  const auto outcome = monitor->check(t0_, reading(5, false));

  EXPECT_EQ(outcome.action, CheckAction::Initialized);
  EXPECT_EQ(outcome.reasonCode, "FIRST_READING");
  EXPECT_TRUE(monitor->state().initialized);
  EXPECT_EQ(monitor->state().lastLevel, 5);
  EXPECT_FALSE(monitor->state().lastCharging);
  EXPECT_TRUE(sink_->sent.empty());
}

// Discharging to 15% with a 20% limit delivers one low notification.
TEST_F(MonitorTest, LowReadingDeliversLowNotification)
{
  auto monitor = makeMonitor(config2080());
  monitor->check(t0_, reading(50, false));

  const auto outcome = monitor->check(t0_ + std::chrono::seconds(1), reading(15, false));

  EXPECT_EQ(outcome.action, CheckAction::NotifiedLow);
  EXPECT_EQ(outcome.reasonCode, "LOW_NOTIFIED");
  EXPECT_EQ(monitor->state().notificationsShown, 1);
  EXPECT_EQ(monitor->state().lastNotificationTime, t0_ + std::chrono::seconds(1));
  ASSERT_EQ(sink_->sent.size(), 1u);
  EXPECT_TRUE(sink_->sent[0].low);
  EXPECT_EQ(sink_->sent[0].level, 15);
  EXPECT_EQ(sink_->sent[0].threshold, 20);
  EXPECT_EQ(sink_->sent[0].remaining, 2);
}

// A repeated identical reading is a no-op even after the spacing has elapsed.
TEST_F(MonitorTest, IdenticalReadingIsNoOp)
{
  auto monitor = makeMonitor(config2080());
  monitor->check(t0_, reading(50, false));
  monitor->check(t0_ + std::chrono::seconds(1), reading(15, false));

  const auto outcome = monitor->check(t0_ + std::chrono::hours(5), reading(15, false));

  EXPECT_EQ(outcome.action, CheckAction::Skipped);
  EXPECT_EQ(outcome.reasonCode, "UNCHANGED_READING");
  EXPECT_EQ(monitor->state().notificationsShown, 1);
  EXPECT_EQ(monitor->state().lastNotificationTime, t0_ + std::chrono::seconds(1));
  EXPECT_EQ(sink_->sent.size(), 1u);
}

// Plugging in after a low alert resets the phase; 15% is below the high limit.
TEST_F(MonitorTest, ChargingFlipResetsPhaseAndUsesHighEvaluator)
{
  auto monitor = makeMonitor(config2080());
  monitor->check(t0_, reading(50, false));
  monitor->check(t0_ + std::chrono::seconds(1), reading(15, false));

  const auto outcome = monitor->check(t0_ + std::chrono::seconds(2), reading(15, true));

  EXPECT_TRUE(outcome.phaseReset);
  EXPECT_EQ(outcome.action, CheckAction::NoTrigger);
  EXPECT_EQ(outcome.reasonCode, "BELOW_MAX_THRESHOLD");
  EXPECT_EQ(monitor->state().notificationsShown, 0);
  EXPECT_EQ(monitor->state().lastNotificationTime, Clock::time_point{});
  EXPECT_EQ(monitor->state().lastLevel, -1);
  EXPECT_TRUE(monitor->state().lastCharging);
  EXPECT_EQ(sink_->sent.size(), 1u);
}

// The reading after a flip is evaluated even when it repeats the flip reading.
TEST_F(MonitorTest, RepeatedReadingAfterFlipIsEvaluatedAgain)
{
  auto config = config2080();
  config.notification_interval = 60;
  auto monitor = makeMonitor(config);
  monitor->check(t0_, reading(50, false));

  const auto flip = monitor->check(t0_ + std::chrono::seconds(1), reading(85, true));
  EXPECT_TRUE(flip.phaseReset);
  EXPECT_EQ(flip.action, CheckAction::NotifiedHigh);

  const auto repeat = monitor->check(t0_ + std::chrono::seconds(61), reading(85, true));

  EXPECT_EQ(repeat.action, CheckAction::NotifiedHigh);
  EXPECT_FALSE(repeat.phaseReset);
  EXPECT_EQ(monitor->state().lastLevel, 85);
  EXPECT_EQ(monitor->state().notificationsShown, 2);
  EXPECT_EQ(sink_->sent.size(), 2u);

  // Once evaluated, the same reading is skipped again.
  EXPECT_EQ(monitor->check(t0_ + std::chrono::seconds(200), reading(85, true)).action,
    CheckAction::Skipped);
}

// Reaching the high limit while charging alerts once until the spacing elapses.
TEST_F(MonitorTest, HighReadingRespectsSpacing)
{
  auto config = config2080();
  config.notification_interval = 600;
  auto monitor = makeMonitor(config);
  monitor->check(t0_, reading(70, true));

  EXPECT_EQ(monitor->check(t0_ + std::chrono::seconds(10), reading(80, true)).action,
    CheckAction::NotifiedHigh);
  EXPECT_EQ(monitor->check(t0_ + std::chrono::seconds(20), reading(80, true)).action,
    CheckAction::Skipped);

  const auto throttled = monitor->check(t0_ + std::chrono::seconds(30), reading(81, true));
  EXPECT_EQ(throttled.action, CheckAction::Throttled);
  EXPECT_EQ(throttled.reasonCode, "SPACING_NOT_ELAPSED");

  EXPECT_EQ(monitor->check(t0_ + std::chrono::seconds(610), reading(80, true)).action,
    CheckAction::NotifiedHigh);

  ASSERT_EQ(sink_->sent.size(), 2u);
  EXPECT_FALSE(sink_->sent[0].low);
  EXPECT_EQ(sink_->sent[0].threshold, 80);
  EXPECT_EQ(monitor->state().notificationsShown, 2);
}

// Both thresholds are inclusive.
TEST_F(MonitorTest, ThresholdBoundaries)
{
  auto monitor = makeMonitor(config2080());
  monitor->check(t0_, reading(50, false));

  EXPECT_EQ(monitor->check(t0_ + std::chrono::seconds(1), reading(21, false)).action,
    CheckAction::NoTrigger);
  EXPECT_EQ(monitor->check(t0_ + std::chrono::seconds(2), reading(20, false)).action,
    CheckAction::NotifiedLow);

  auto charging = makeMonitor(config2080());
  charging->check(t0_, reading(50, true));
  EXPECT_EQ(charging->check(t0_ + std::chrono::seconds(1), reading(79, true)).action,
    CheckAction::NoTrigger);
  EXPECT_EQ(charging->check(t0_ + std::chrono::seconds(2), reading(80, true)).action,
    CheckAction::NotifiedHigh);
}

// Readings hovering around the limit never push the count past the quota.
TEST_F(MonitorTest, QuotaCapsNotificationsPerPhase)
{
  auto config = config2080();
  config.notification_interval = 1;
  config.max_notifications = 3;
  auto monitor = makeMonitor(config);
  monitor->check(t0_, reading(30, false));

  auto now = t0_;
  for (int i = 0; i < 20; ++i) {
    now += std::chrono::minutes(1);
    monitor->check(now, reading(i % 2 == 0 ? 19 : 18, false));
    EXPECT_LE(monitor->state().notificationsShown, config.max_notifications);
  }

  EXPECT_EQ(sink_->sent.size(), 3u);
  EXPECT_EQ(sink_->sent.back().remaining, 0);
  const auto outcome = monitor->check(now + std::chrono::minutes(1), reading(17, false));
  EXPECT_EQ(outcome.action, CheckAction::Throttled);
  EXPECT_EQ(outcome.reasonCode, "QUOTA_EXHAUSTED");
}

// An exhausted quota is restored by a direction change, which may itself alert.
TEST_F(MonitorTest, FlipReadingCanNotifyInNewPhase)
{
  auto config = config2080();
  config.max_notifications = 1;
  auto monitor = makeMonitor(config);
  monitor->check(t0_, reading(85, true));
  monitor->check(t0_ + std::chrono::seconds(1), reading(86, true));
  EXPECT_EQ(monitor->state().notificationsShown, 1);

  const auto outcome = monitor->check(t0_ + std::chrono::seconds(2), reading(19, false));

  EXPECT_TRUE(outcome.phaseReset);
  EXPECT_EQ(outcome.action, CheckAction::NotifiedLow);
  EXPECT_EQ(monitor->state().notificationsShown, 1);
  EXPECT_EQ(sink_->sent.size(), 2u);
}

// A discharging reading at 95% is never a high alert; a charging 5% is never a low one.
TEST_F(MonitorTest, ThresholdPolarity)
{
  auto monitor = makeMonitor(config2080());
  monitor->check(t0_, reading(50, false));

  EXPECT_EQ(monitor->check(t0_ + std::chrono::seconds(1), reading(95, false)).action,
    CheckAction::NoTrigger);
  EXPECT_EQ(monitor->check(t0_ + std::chrono::seconds(2), reading(5, true)).action,
    CheckAction::NoTrigger);
  EXPECT_TRUE(sink_->sent.empty());
}

// A failing sink still consumes quota and spacing.
TEST_F(MonitorTest, DeliveryFailureStillConsumesQuota)
{
  sink_->fail = true;
  auto monitor = makeMonitor(config2080());
  monitor->check(t0_, reading(50, false));

  const auto outcome = monitor->check(t0_ + std::chrono::seconds(1), reading(10, false));

  EXPECT_EQ(outcome.action, CheckAction::NotifiedLow);
  EXPECT_TRUE(outcome.deliveryFailed);
  EXPECT_EQ(monitor->state().notificationsShown, 1);
  EXPECT_EQ(monitor->state().lastNotificationTime, t0_ + std::chrono::seconds(1));
}

// 1800s / 20 = 90s per point; 5 points below the limit gives 1350s, which is persisted.
TEST_F(MonitorTest, DeliveredNotificationShortensAndPersistsInterval)
{
  auto monitor = makeMonitor(config2080());
  monitor->check(t0_, reading(50, false));
  EXPECT_EQ(monitor->checkIntervalS(), 1800);

  const auto outcome = monitor->check(t0_ + std::chrono::seconds(1), reading(15, false));

  EXPECT_TRUE(outcome.intervalChanged);
  EXPECT_EQ(monitor->config().check_interval_discharging, 1350);
  EXPECT_EQ(monitor->config().check_interval_charging, 30);
  EXPECT_EQ(monitor->checkIntervalS(), 1350);
  ASSERT_EQ(store_->saved.size(), 1u);
  EXPECT_EQ(store_->saved[0].check_interval_discharging, 1350);
}

// Without a store the adaptation still applies in memory.
TEST_F(MonitorTest, AdaptationWorksWithoutStore)
{
  Monitor monitor(config2080(), sink_, nullptr, rclcpp::get_logger("test_monitor"));
  monitor.check(t0_, reading(90, true));

  const auto outcome = monitor.check(t0_ + std::chrono::seconds(1), reading(81, true));

  EXPECT_EQ(outcome.action, CheckAction::NotifiedHigh);
  // 30 / 80 = 0 seconds per point, so nothing changes.
  EXPECT_FALSE(outcome.intervalChanged);
  EXPECT_EQ(monitor.checkIntervalS(), 30);
}

// A hot-reloaded config replaces the policy but keeps the phase bookkeeping.
TEST_F(MonitorTest, ApplyConfigKeepsState)
{
  auto monitor = makeMonitor(config2080());
  monitor->check(t0_, reading(50, false));
  monitor->check(t0_ + std::chrono::seconds(1), reading(15, false));

  MonitorConfig updated = config2080();
  updated.min_threshold = 10;
  updated.check_interval_discharging = 600;
  monitor->applyConfig(updated);

  EXPECT_EQ(monitor->config(), updated);
  EXPECT_EQ(monitor->checkIntervalS(), 600);
  EXPECT_EQ(monitor->state().notificationsShown, 1);
  EXPECT_EQ(monitor->check(t0_ + std::chrono::hours(1), reading(14, false)).action,
    CheckAction::NoTrigger);
}
