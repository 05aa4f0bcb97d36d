#include <gtest/gtest.h>

#include <charge_monitor/interval_adapter.hpp>

using charge_monitor::adaptInterval;

// 1800 / 21 = 85s per point, two points away: 1800 - 170.
TEST(IntervalAdapterTest, ShortensProportionallyToGap)
{
  const auto result = adaptInterval(1800, 21, 19, 10);
  EXPECT_EQ(result.previous, 1800);
  EXPECT_EQ(result.gap, 2);
  EXPECT_EQ(result.adapted, 1630);
  EXPECT_FALSE(result.clamped);
  EXPECT_TRUE(result.changed());
}

// Gap is symmetric: overshooting the high limit shortens too.
TEST(IntervalAdapterTest, GapIsAbsolute)
{
  EXPECT_EQ(adaptInterval(1600, 80, 85, 10).adapted, 1500);
  EXPECT_EQ(adaptInterval(1600, 80, 75, 10).adapted, 1500);
}

TEST(IntervalAdapterTest, ReadingAtThresholdKeepsInterval)
{
  const auto result = adaptInterval(1800, 20, 20, 10);
  EXPECT_EQ(result.adapted, 1800);
  EXPECT_FALSE(result.changed());
}

TEST(IntervalAdapterTest, ClampsAtFloor)
{
  // 100 / 20 = 5s per point, 19 points away would give 5s.
  const auto result = adaptInterval(100, 20, 1, 10);
  EXPECT_EQ(result.adapted, 10);
  EXPECT_TRUE(result.clamped);
}

// Repeated adaptation converges on the floor instead of reaching zero.
TEST(IntervalAdapterTest, RepeatedAdaptationNeverGoesBelowFloor)
{
  int interval = 1800;
  for (int i = 0; i < 100; ++i) {
    interval = adaptInterval(interval, 20, 0, 10).adapted;
    ASSERT_GE(interval, 10);
  }
  EXPECT_EQ(interval, 10);
}

TEST(IntervalAdapterTest, IntervalAtOrBelowFloorIsUntouched)
{
  EXPECT_EQ(adaptInterval(10, 20, 0, 10).adapted, 10);
  EXPECT_EQ(adaptInterval(5, 20, 0, 10).adapted, 5);
}

TEST(IntervalAdapterTest, NonPositiveThresholdIsIgnored)
{
  EXPECT_FALSE(adaptInterval(1800, 0, 50, 10).changed());
  EXPECT_FALSE(adaptInterval(1800, -5, 50, 10).changed());
}

// Short intervals with large thresholds have a zero unit.
TEST(IntervalAdapterTest, ZeroUnitKeepsInterval)
{
  EXPECT_EQ(adaptInterval(30, 81, 90, 10).adapted, 30);
}
