#include "RegulatorConfig.hpp"
#include <gtest/gtest.h>

using namespace DC_Speed_Regulator_Firmware::Control;

TEST(RegulatorConfig, DefaultsPassUnchanged) {
    RegulatorConfig raw;
    raw.kp = 256;
    raw.ki = 3;
    raw.kd = 10;
    RegulatorConfig cfg = loadRegulatorConfig(raw);

    EXPECT_EQ(cfg.controlPeriodUs, raw.controlPeriodUs);
    EXPECT_EQ(cfg.speedWindowPeriods, raw.speedWindowPeriods);
    EXPECT_EQ(cfg.fractionalBits, raw.fractionalBits);
    EXPECT_EQ(cfg.kp, 256);
    EXPECT_EQ(cfg.ki, 3);
    EXPECT_EQ(cfg.kd, 10);
    EXPECT_EQ(cfg.outputMin, -1000);
    EXPECT_EQ(cfg.outputMax, 1000);
    EXPECT_EQ(cfg.deadZone, 50u);
    EXPECT_EQ(cfg.stallPeriods, 500u);
    EXPECT_EQ(cfg.mode, ControlMode::VELOCITY);
}

TEST(RegulatorConfig, OutOfRangeFieldsAreClamped) {
    RegulatorConfig raw;
    raw.fractionalBits = 40;
    raw.controlPeriodUs = 10;
    raw.speedWindowPeriods = 0;
    raw.countsPerRevolution = 0;
    raw.outputMin = 200;
    raw.outputMax = -200;
    raw.integralLimit = -5;
    raw.dutyMax = 0;
    raw.deadZone = 5000;
    raw.nearZeroSpeedRpm = 0;
    raw.stallPeriods = 0;
    raw.maxPlausibleDelta = -1;
    raw.kp = -1;
    raw.ki = -2;
    raw.kd = -3;

    RegulatorConfig cfg = loadRegulatorConfig(raw);

    EXPECT_EQ(cfg.fractionalBits, 30);
    EXPECT_EQ(cfg.controlPeriodUs, 100u);
    EXPECT_EQ(cfg.speedWindowPeriods, 1);
    EXPECT_EQ(cfg.countsPerRevolution, 1u);
    EXPECT_EQ(cfg.outputMin, 0);
    EXPECT_EQ(cfg.outputMax, 0);
    EXPECT_EQ(cfg.integralLimit, 0);
    EXPECT_EQ(cfg.dutyMax, 1u);
    EXPECT_EQ(cfg.deadZone, 1u);
    EXPECT_EQ(cfg.nearZeroSpeedRpm, 1);
    EXPECT_EQ(cfg.stallPeriods, 1u);
    EXPECT_EQ(cfg.maxPlausibleDelta, 0);
    EXPECT_EQ(cfg.kp, 0);
    EXPECT_EQ(cfg.ki, 0);
    EXPECT_EQ(cfg.kd, 0);
}

TEST(RegulatorConfig, DeadZoneIsBoundedByDutyMax) {
    RegulatorConfig raw;
    raw.dutyMax = 255;
    raw.deadZone = 300;

    EXPECT_EQ(loadRegulatorConfig(raw).deadZone, 255u);
}

TEST(RegulatorConfig, SubConfigsCarryTheirFields) {
    RegulatorConfig raw;
    raw.controlPeriodUs = 500;
    raw.speedWindowPeriods = 20;
    raw.countsPerRevolution = 4096;
    raw.maxPlausibleDelta = 900;
    raw.kp = 11;
    raw.ki = 12;
    raw.kd = 13;
    raw.fractionalBits = 12;
    raw.integralLimit = 7000;
    raw.outputMin = -800;
    raw.outputMax = 900;
    raw.dutyMax = 900;
    raw.deadZone = 70;
    raw.nearZeroSpeedRpm = 3;
    raw.stallPeriods = 250;
    RegulatorConfig cfg = loadRegulatorConfig(raw);

    DC_Speed_Regulator_Firmware::Encoder::SpeedEstimatorConfig est = toSpeedEstimatorConfig(cfg);
    EXPECT_EQ(est.controlPeriodUs, 500u);
    EXPECT_EQ(est.windowPeriods, 20);
    EXPECT_EQ(est.countsPerRevolution, 4096u);
    EXPECT_EQ(est.maxPlausibleDelta, 900);

    DC_Speed_Regulator_Firmware::PID::PidConfig pid = toPidConfig(cfg);
    EXPECT_EQ(pid.kp, 11);
    EXPECT_EQ(pid.ki, 12);
    EXPECT_EQ(pid.kd, 13);
    EXPECT_EQ(pid.fractionalBits, 12);
    EXPECT_EQ(pid.integralLimit, 7000);
    EXPECT_EQ(pid.outputMin, -800);
    EXPECT_EQ(pid.outputMax, 900);

    ActuationMapperConfig mapper = toMapperConfig(cfg);
    EXPECT_EQ(mapper.deadZone, 70u);
    EXPECT_EQ(mapper.dutyMax, 900u);

    SupervisorConfig supervisor = toSupervisorConfig(cfg);
    EXPECT_EQ(supervisor.nearZeroSpeedRpm, 3);
    EXPECT_EQ(supervisor.deadZone, 70u);
    EXPECT_EQ(supervisor.stallPeriods, 250u);
}
