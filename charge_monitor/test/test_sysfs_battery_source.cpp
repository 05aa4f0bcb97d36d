/**
 * @file test_sysfs_battery_source.cpp
 * @brief Tests for reading batteries from a power_supply class tree.
 *
 * Each test builds a fake /sys/class/power_supply under a temporary directory.
 */

#include <gtest/gtest.h>

#include <charge_monitor/sysfs_battery_source.hpp>

#include <rclcpp/logger.hpp>

#include <unistd.h>

#include <filesystem>
#include <fstream>
#include <string>

namespace fs = std::filesystem;
using charge_monitor::SysfsBatterySource;

namespace
{

class SysfsBatterySourceTest : public ::testing::Test
{
protected:
  void SetUp() override
  {
    root_ = fs::temp_directory_path() /
      ("charge_monitor_sysfs_" + std::to_string(::getpid()) + "_" +
      ::testing::UnitTest::GetInstance()->current_test_info()->name());
    fs::remove_all(root_);
    fs::create_directories(root_);
  }

  void TearDown() override
  {
    std::error_code ec;
    fs::remove_all(root_, ec);
  }

  void write(const std::string & supply, const std::string & attribute, const std::string & value)
  {
    fs::create_directories(root_ / supply);
    std::ofstream(root_ / supply / attribute) << value << "\n";
  }

  void makeMains(bool online)
  {
    write("AC", "type", "Mains");
    write("AC", "online", online ? "1" : "0");
  }

  SysfsBatterySource makeSource(const std::string & name = "")
  {
    return SysfsBatterySource(root_, name, rclcpp::get_logger("test_sysfs"));
  }

  fs::path root_;
};

}  // namespace

TEST_F(SysfsBatterySourceTest, ReadsChargingBatteryInMicroAmpHours)
{
  makeMains(true);
  write("BAT0", "type", "Battery");
  write("BAT0", "status", "Charging");
  write("BAT0", "capacity", "55");
  write("BAT0", "cycle_count", "42");
  write("BAT0", "charge_full_design", "5000000");
  write("BAT0", "charge_full", "4500000");
  write("BAT0", "charge_now", "2475000");
  write("BAT0", "current_now", "1500000");
  write("BAT0", "voltage_now", "12000000");

  auto source = makeSource();
  const auto result = source.poll();

  ASSERT_TRUE(result.ok()) << result.reason;
  const auto & s = *result.snapshot;
  EXPECT_EQ(s.capacityPercent, 55);
  EXPECT_TRUE(s.charging);
  EXPECT_TRUE(s.plugged);
  EXPECT_EQ(s.cycleCount, 42);
  EXPECT_EQ(s.designCapacity, 5000);
  EXPECT_EQ(s.maxCapacity, 4500);
  EXPECT_EQ(s.healthPercent, 90);
  EXPECT_EQ(s.voltage, 12000);
  EXPECT_EQ(s.current, 1500);
  EXPECT_EQ(s.timeToFull, 81);
  EXPECT_EQ(s.timeToEmpty, -1);
  EXPECT_EQ(source.name(), "sysfs");
}

// Energy-based batteries report energy_* and power_now; current is derived from power.
TEST_F(SysfsBatterySourceTest, ReadsDischargingEnergyBattery)
{
  makeMains(false);
  write("BAT1", "type", "Battery");
  write("BAT1", "status", "Discharging");
  write("BAT1", "capacity", "50");
  write("BAT1", "energy_full_design", "60000000");
  write("BAT1", "energy_full", "50000000");
  write("BAT1", "energy_now", "25000000");
  write("BAT1", "power_now", "10000000");
  write("BAT1", "voltage_now", "12500000");

  const auto result = makeSource().poll();

  ASSERT_TRUE(result.ok()) << result.reason;
  EXPECT_FALSE(result.snapshot->charging);
  EXPECT_FALSE(result.snapshot->plugged);
  EXPECT_EQ(result.snapshot->maxCapacity, 50000);
  EXPECT_EQ(result.snapshot->healthPercent, 83);
  EXPECT_EQ(result.snapshot->current, -800);
  EXPECT_EQ(result.snapshot->timeToEmpty, 150);
  EXPECT_EQ(result.snapshot->timeToFull, -1);
}

// A charge-based battery that also exposes energy_* and power_now never mixes the two.
TEST_F(SysfsBatterySourceTest, ChargeAttributesAreNotMixedWithEnergyAttributes)
{
  makeMains(false);
  write("BAT0", "type", "Battery");
  write("BAT0", "status", "Discharging");
  write("BAT0", "capacity", "40");
  write("BAT0", "charge_full", "4000000");
  write("BAT0", "charge_now", "1600000");
  write("BAT0", "energy_full_design", "99000000");
  write("BAT0", "energy_now", "99000000");
  write("BAT0", "power_now", "24000000");
  write("BAT0", "voltage_now", "12000000");

  const auto result = makeSource().poll();

  ASSERT_TRUE(result.ok()) << result.reason;
  const auto & s = *result.snapshot;
  EXPECT_EQ(s.maxCapacity, 4000);
  EXPECT_EQ(s.designCapacity, 0);
  EXPECT_EQ(s.healthPercent, 0);
  // 24 W at 12 V is 2 A; 1600 mAh / 2000 mA = 48 minutes.
  EXPECT_EQ(s.current, -2000);
  EXPECT_EQ(s.timeToEmpty, 48);
}

// Without a mains supply the plugged flag follows the battery status.
TEST_F(SysfsBatterySourceTest, PluggedFallsBackToStatus)
{
  write("BAT0", "type", "Battery");
  write("BAT0", "status", "Full");
  write("BAT0", "capacity", "100");
  write("BAT0", "charge_full", "4000000");

  const auto result = makeSource().poll();

  ASSERT_TRUE(result.ok()) << result.reason;
  EXPECT_FALSE(result.snapshot->charging);
  EXPECT_TRUE(result.snapshot->plugged);
  EXPECT_EQ(result.snapshot->healthPercent, 0);
}

TEST_F(SysfsBatterySourceTest, SkipsNonBatterySupplies)
{
  makeMains(true);
  write("hidpp_battery_0", "type", "USB");
  EXPECT_FALSE(makeSource().batteryPath().has_value());

  const auto result = makeSource().poll();
  EXPECT_FALSE(result.ok());
  EXPECT_NE(result.reason.find("no battery found"), std::string::npos);
}

TEST_F(SysfsBatterySourceTest, NamedBatteryMustExist)
{
  write("BAT0", "type", "Battery");
  EXPECT_TRUE(makeSource("BAT0").batteryPath().has_value());
  EXPECT_FALSE(makeSource("BAT9").batteryPath().has_value());
  EXPECT_FALSE(makeSource("BAT9").poll().ok());
}

TEST_F(SysfsBatterySourceTest, MissingCapacityIsAcquisitionFailure)
{
  write("BAT0", "type", "Battery");
  write("BAT0", "status", "Discharging");

  const auto result = makeSource().poll();
  EXPECT_FALSE(result.ok());
  EXPECT_NE(result.reason.find("cannot read"), std::string::npos);
}

TEST_F(SysfsBatterySourceTest, ImplausibleReadingIsRejected)
{
  write("BAT0", "type", "Battery");
  write("BAT0", "status", "Discharging");
  write("BAT0", "capacity", "150");
  write("BAT0", "charge_full", "4000000");

  auto result = makeSource().poll();
  EXPECT_FALSE(result.ok());
  EXPECT_NE(result.reason.find("implausible"), std::string::npos);

  // A battery that reports no full capacity is rejected as well.
  write("BAT0", "capacity", "50");
  fs::remove(root_ / "BAT0" / "charge_full");
  result = makeSource().poll();
  EXPECT_FALSE(result.ok());
}

TEST_F(SysfsBatterySourceTest, MissingRootIsFailureNotCrash)
{
  SysfsBatterySource source(root_ / "does_not_exist", "", rclcpp::get_logger("test_sysfs"));
  EXPECT_FALSE(source.poll().ok());
}
