#include "FixedPoint.hpp"
#include "QuadratureDecoder.hpp"
#include "QuadratureSignal.hpp"
#include "SpeedRegulator.hpp"
#include <gtest/gtest.h>

using namespace DC_Speed_Regulator_Firmware;
using namespace DC_Speed_Regulator_Firmware::Control;

namespace {

class SpeedRegulatorTest : public ::testing::Test {
  protected:
    // 1 kHz, 10-period window, 600 steps/rev: 1 step per period = 100 RPM.
    static RegulatorConfig baseConfig() {
        RegulatorConfig cfg;
        cfg.controlPeriodUs = 1000;
        cfg.speedWindowPeriods = 10;
        cfg.countsPerRevolution = 600;
        cfg.fractionalBits = 8;
        cfg.kp = FixedPoint::toFixed(1.0, 8);
        cfg.ki = 0;
        cfg.kd = 0;
        cfg.outputMin = -1000;
        cfg.outputMax = 1000;
        cfg.dutyMax = 1000;
        cfg.deadZone = 50;
        cfg.nearZeroSpeedRpm = 5;
        cfg.stallPeriods = 10;
        return loadRegulatorConfig(cfg);
    }

    RegulatorOutputs step(SpeedRegulator& regulator, bool enable, int32_t setpoint) {
        RegulatorInputs inputs;
        inputs.enable = enable;
        inputs.setpoint = setpoint;
        return regulator.step(inputs);
    }

    Encoder::QuadratureDecoder decoder;
    DC_Speed_Regulator_Firmware::Test::QuadratureSignal signal{decoder};
};

}  // namespace

TEST_F(SpeedRegulatorTest, IdleOutputsAreOff) {
    SpeedRegulator regulator(decoder, baseConfig());

    for (int i = 0; i < 5; i++) {
        RegulatorOutputs out = step(regulator, false, 1000);
        EXPECT_EQ(out.command, ActuationCommand{});
        EXPECT_FALSE(out.faultLatched);
    }
    EXPECT_EQ(regulator.getStatus().state, SupervisorState::IDLE);
    EXPECT_EQ(regulator.getStatus().periods, 5u);
}

TEST_F(SpeedRegulatorTest, DrivesForwardTowardPositiveSetpoint) {
    SpeedRegulator regulator(decoder, baseConfig());

    RegulatorOutputs out = step(regulator, true, 300);
    EXPECT_EQ(regulator.getStatus().state, SupervisorState::RUNNING);
    EXPECT_EQ(out.command.magnitude, 300u);
    EXPECT_EQ(out.command.direction, MotorDirection::FORWARD);
    EXPECT_FALSE(out.command.brake);

    out = step(regulator, true, -300);
    EXPECT_EQ(out.command.magnitude, 300u);
    EXPECT_EQ(out.command.direction, MotorDirection::REVERSE);

    out = step(regulator, true, 30);
    EXPECT_EQ(out.command.magnitude, 0u);  // dead-zone
}

TEST_F(SpeedRegulatorTest, StallLatchesFaultUntilDisableEnable) {
    SpeedRegulator regulator(decoder, baseConfig());

    int faultPeriod = 0;
    RegulatorOutputs out;
    for (int period = 1; period <= 11; period++) {
        out = step(regulator, true, 1000);
        if (faultPeriod == 0 && out.faultLatched) {
            faultPeriod = period;
        }
    }
    ASSERT_GT(faultPeriod, 0);
    EXPECT_LE(faultPeriod, 11);
    EXPECT_EQ(out.command.magnitude, 0u);
    EXPECT_EQ(out.command.direction, MotorDirection::REVERSE);
    EXPECT_FALSE(out.command.brake);
    EXPECT_EQ(regulator.getStatus().faultReason, FaultReason::STALL);

    // The shaft starts turning afterwards: the fault stays latched.
    for (int period = 0; period < 40; period++) {
        signal.forward(5);
        out = step(regulator, true, 1000);
        EXPECT_TRUE(out.faultLatched);
        EXPECT_EQ(out.command, ActuationCommand{});
    }
    EXPECT_EQ(out.measuredSpeedRpm, 500);

    out = step(regulator, false, 1000);
    EXPECT_EQ(regulator.getStatus().state, SupervisorState::IDLE);
    EXPECT_TRUE(out.faultLatched);

    out = step(regulator, true, 1000);
    EXPECT_EQ(regulator.getStatus().state, SupervisorState::RUNNING);
    EXPECT_FALSE(out.faultLatched);
    EXPECT_EQ(out.command.magnitude, 1000u);
}

TEST_F(SpeedRegulatorTest, ShaftDitheringOnAnEdgeStillStalls) {
    SpeedRegulator regulator(decoder, baseConfig());

    int faultPeriod = 0;
    RegulatorOutputs out;
    for (int period = 1; period <= 11; period++) {
        if (period % 2 == 1) {
            signal.forward(1);
        } else {
            signal.reverse(1);
        }
        out = step(regulator, true, 1000);
        if (faultPeriod == 0 && out.faultLatched) {
            faultPeriod = period;
        }
    }
    ASSERT_GT(faultPeriod, 0);
    EXPECT_LE(faultPeriod, 11);
    EXPECT_EQ(out.measuredSpeedRpm, 0);
    EXPECT_EQ(out.command, ActuationCommand{});
    EXPECT_EQ(regulator.getStatus().state, SupervisorState::FAULT);
    EXPECT_EQ(regulator.getStatus().faultReason, FaultReason::STALL);
}

TEST_F(SpeedRegulatorTest, EdgesEachPeriodPreventStall) {
    SpeedRegulator regulator(decoder, baseConfig());

    for (int period = 0; period < 100; period++) {
        signal.forward(1);
        RegulatorOutputs out = step(regulator, true, 1000);
        EXPECT_FALSE(out.faultLatched);
    }
    EXPECT_EQ(regulator.getStatus().state, SupervisorState::RUNNING);
    EXPECT_EQ(regulator.getStatus().measuredSpeedRpm, 100);
}

TEST_F(SpeedRegulatorTest, DisableWhileMovingBrakesToStandstill) {
    SpeedRegulator regulator(decoder, baseConfig());

    RegulatorOutputs out;
    for (int period = 0; period < 30; period++) {
        signal.forward(5);
        out = step(regulator, true, 800);
    }
    ASSERT_EQ(out.measuredSpeedRpm, 500);
    EXPECT_EQ(out.command.magnitude, 300u);

    out = step(regulator, false, 800);
    EXPECT_EQ(regulator.getStatus().state, SupervisorState::BRAKING);
    EXPECT_TRUE(out.command.brake);
    EXPECT_EQ(out.command.magnitude, 0u);

    int period = 0;
    while (regulator.getStatus().state == SupervisorState::BRAKING && period < 100) {
        EXPECT_TRUE(out.command.brake);
        EXPECT_GE(out.measuredSpeedRpm, 5);
        out = step(regulator, false, 800);
        period++;
    }
    EXPECT_EQ(regulator.getStatus().state, SupervisorState::IDLE);
    EXPECT_LT(out.measuredSpeedRpm, 5);
    EXPECT_EQ(out.command, ActuationCommand{});
}

TEST_F(SpeedRegulatorTest, PositionModeRegulatesStepsSinceEnable) {
    RegulatorConfig cfg = baseConfig();
    cfg.mode = ControlMode::POSITION;
    signal.forward(1234);
    SpeedRegulator regulator(decoder, cfg);

    RegulatorOutputs out = step(regulator, true, 200);
    EXPECT_EQ(out.command.magnitude, 200u);
    EXPECT_EQ(out.command.direction, MotorDirection::FORWARD);

    signal.forward(120);
    step(regulator, true, 200);
    EXPECT_EQ(regulator.getStatus().error, 80);

    signal.forward(100);
    out = step(regulator, true, 200);
    EXPECT_EQ(regulator.getStatus().error, -20);
    EXPECT_EQ(out.command.magnitude, 0u);
    EXPECT_EQ(out.encoderCount, 1454);
}

TEST_F(SpeedRegulatorTest, StatusReportsDecoderAndPidState) {
    SpeedRegulator regulator(decoder, baseConfig());

    decoder.onSample(true, true);  // 00 -> 11
    step(regulator, true, 400);

    RegulatorStatus status = regulator.getStatus();
    EXPECT_EQ(status.invalidTransitions, 1u);
    EXPECT_EQ(status.error, 400);
    EXPECT_EQ(status.effort, 400);
    EXPECT_FALSE(status.antiWindupActive);
    EXPECT_EQ(status.command.magnitude, 400u);
    EXPECT_EQ(status.stallCount, 1u);
}
