#include "FixedPoint.hpp"
#include "PID.hpp"
#include <gtest/gtest.h>

using namespace DC_Speed_Regulator_Firmware;
using PID::PIDController;
using PID::PidConfig;
using PID::PidPhase;

namespace {

PidConfig gains(double kp, double ki, double kd) {
    PidConfig cfg;
    cfg.fractionalBits = 8;
    cfg.kp = FixedPoint::toFixed(kp, 8);
    cfg.ki = FixedPoint::toFixed(ki, 8);
    cfg.kd = FixedPoint::toFixed(kd, 8);
    cfg.integralLimit = 100000;
    cfg.outputMin = -1000;
    cfg.outputMax = 1000;
    return cfg;
}

}  // namespace

TEST(PID, ZeroErrorHoldsZeroOutput) {
    PIDController pid(gains(2.0, 0.5, 1.0));

    for (int i = 0; i < 100; i++) {
        EXPECT_EQ(pid.compute(750, 750), 0);
    }
    EXPECT_EQ(pid.getIntegral(), 0);
    EXPECT_EQ(pid.getLastError(), 0);
    EXPECT_FALSE(pid.isSaturated());
}

TEST(PID, ZeroErrorHoldsAccumulatedState) {
    PIDController pid(gains(2.0, 0.5, 1.0));

    for (int i = 0; i < 3; i++) {
        pid.compute(100, 0);
    }
    ASSERT_EQ(pid.getIntegral(), 300);
    ASSERT_FALSE(pid.isSaturated());

    // First zero-error step: D sees the error drop from 100 to 0.
    EXPECT_EQ(pid.compute(750, 750), 50);

    for (int i = 0; i < 50; i++) {
        EXPECT_EQ(pid.compute(750, 750), 150);
        EXPECT_EQ(pid.getIntegral(), 300);
        EXPECT_EQ(pid.getOutput(), 150);
        EXPECT_EQ(pid.getState().dTerm, 0);
    }
}

TEST(PID, ProportionalTerm) {
    PIDController pid(gains(0.5, 0.0, 0.0));

    EXPECT_EQ(pid.compute(400, 0), 200);
    EXPECT_EQ(pid.compute(0, 400), -200);
    EXPECT_EQ(pid.getState().pTerm, -200);
}

TEST(PID, IntegralAccumulatesError) {
    PIDController pid(gains(0.0, 0.25, 0.0));

    pid.compute(100, 0);
    pid.compute(100, 0);
    EXPECT_EQ(pid.compute(100, 0), 75);  // integral 300 * 0.25
    EXPECT_EQ(pid.getIntegral(), 300);
}

TEST(PID, DerivativeActsOnErrorChange) {
    PIDController pid(gains(0.0, 0.0, 1.0));

    EXPECT_EQ(pid.compute(100, 0), 100);  // previous error starts at 0
    EXPECT_EQ(pid.compute(100, 0), 0);
    EXPECT_EQ(pid.compute(100, 40), -40);
    EXPECT_EQ(pid.getState().previousError, 60);
}

TEST(PID, OutputIsClampedAndFlagged) {
    PIDController pid(gains(10.0, 0.0, 0.0));

    EXPECT_EQ(pid.compute(1000, 0), 1000);
    EXPECT_TRUE(pid.isSaturated());
    EXPECT_EQ(pid.compute(-1000, 0), -1000);
    EXPECT_TRUE(pid.isSaturated());
    EXPECT_EQ(pid.compute(10, 0), 100);
    EXPECT_FALSE(pid.isSaturated());
}

TEST(PID, AntiWindupFreezesIntegralWhileSaturated) {
    PIDController pid(gains(0.0, 1.0, 0.0));

    EXPECT_EQ(pid.compute(600, 0), 600);
    EXPECT_FALSE(pid.isSaturated());

    EXPECT_EQ(pid.compute(600, 0), 1000);  // integral 1200 -> clamped output
    EXPECT_TRUE(pid.isSaturated());
    const int32_t frozen = pid.getIntegral();
    EXPECT_EQ(frozen, 1200);

    for (int i = 0; i < 50; i++) {
        pid.compute(600, 0);
        EXPECT_EQ(pid.getIntegral(), frozen);
        EXPECT_TRUE(pid.getState().antiWindupActive);
    }
}

TEST(PID, AntiWindupReleasesWhenOutputLeavesTheClamp) {
    PIDController pid(gains(1.0, 1.0, 0.0));

    pid.compute(600, 0);                   // P 600 + I 600 -> 1000, saturated
    ASSERT_TRUE(pid.isSaturated());
    ASSERT_EQ(pid.getIntegral(), 600);

    EXPECT_EQ(pid.compute(0, 100), 500);  // P -100, integral frozen at 600
    EXPECT_EQ(pid.getIntegral(), 600);
    EXPECT_FALSE(pid.isSaturated());

    pid.compute(0, 100);
    EXPECT_EQ(pid.getIntegral(), 500);
}

TEST(PID, IntegralNeverExceedsLimit) {
    PidConfig cfg = gains(0.0, 0.0, 0.0);
    cfg.ki = 1;
    cfg.integralLimit = 5000;
    PIDController pid(cfg);

    for (int i = 0; i < 20; i++) {
        pid.compute(1000, 0);
        EXPECT_LE(pid.getIntegral(), 5000);
    }
    EXPECT_EQ(pid.getIntegral(), 5000);

    for (int i = 0; i < 20; i++) {
        pid.compute(-1000, 0);
        EXPECT_GE(pid.getIntegral(), -5000);
    }
    EXPECT_EQ(pid.getIntegral(), -5000);
}

TEST(PID, OutputSignFollowsError) {
    PIDController pid(gains(0.3, 0.01, 0.0));

    for (int32_t error : {1000, 37, 4, -4, -37, -1000}) {
        pid.reset();
        int32_t out = pid.compute(error, 0);
        if (error > 0) {
            EXPECT_GT(out, 0) << error;
        } else {
            EXPECT_LT(out, 0) << error;
        }
    }
}

TEST(PID, UpdateSequencesIdleComputeHold) {
    PIDController pid(gains(1.0, 0.0, 0.0));
    EXPECT_EQ(pid.getPhase(), PidPhase::IDLE);

    EXPECT_EQ(pid.update(false, true, 500, 0), 0);
    EXPECT_EQ(pid.getPhase(), PidPhase::IDLE);

    EXPECT_EQ(pid.update(true, true, 500, 0), 500);
    EXPECT_EQ(pid.getPhase(), PidPhase::COMPUTE);

    // No period boundary: output and state are held.
    EXPECT_EQ(pid.update(true, false, 900, 0), 500);
    EXPECT_EQ(pid.getPhase(), PidPhase::HOLD);
    EXPECT_EQ(pid.getLastError(), 500);

    EXPECT_EQ(pid.update(true, true, 900, 0), 900);
    EXPECT_EQ(pid.getPhase(), PidPhase::COMPUTE);

    EXPECT_EQ(pid.update(false, true, 900, 0), 0);
    EXPECT_EQ(pid.getPhase(), PidPhase::IDLE);
    EXPECT_EQ(pid.getOutput(), 0);
}

TEST(PID, EnableClearsHistory) {
    PIDController pid(gains(0.0, 1.0, 0.0));

    pid.update(true, true, 300, 0);
    pid.update(true, true, 300, 0);
    ASSERT_EQ(pid.getIntegral(), 600);

    pid.update(false, true, 300, 0);
    pid.update(true, true, 100, 0);
    EXPECT_EQ(pid.getIntegral(), 100);
    EXPECT_EQ(pid.getState().previousError, 100);
}

TEST(PID, InterfaceReset) {
    PIDController pid(gains(1.0, 1.0, 1.0));
    IPIDController& controller = pid;

    controller.compute(50, 0);
    controller.reset();
    EXPECT_EQ(controller.getIntegral(), 0);
    EXPECT_EQ(controller.getOutput(), 0);
    EXPECT_EQ(controller.getLastError(), 0);
}
