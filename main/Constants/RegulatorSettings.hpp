/**
 * @file RegulatorSettings.hpp
 * @brief Board pinout and default regulator tuning.
 */

#pragma once

#include "ControlTask.hpp"
#include "Encoder.hpp"
#include "FixedPoint.hpp"
#include "HBridgeOutput.hpp"
#include "RegulatorConfig.hpp"
#include "driver/gpio.h"
#include "driver/ledc.h"

namespace DC_Speed_Regulator_Firmware::Settings {

// Pinout
static constexpr gpio_num_t ENCODER_A = GPIO_NUM_4;
static constexpr gpio_num_t ENCODER_B = GPIO_NUM_5;
static constexpr gpio_num_t PH_PIN = GPIO_NUM_6;
static constexpr gpio_num_t EN_PIN = GPIO_NUM_7;
static constexpr gpio_num_t NSLEEP_PIN = GPIO_NUM_15;

static constexpr uint8_t GAIN_FRACTIONAL_BITS = 8;
static constexpr uint32_t DUTY_MAX = 1000;

/// Setpoint applied at boot (RPM). Changed at run time through CommandInput.
static constexpr int32_t DEFAULT_SETPOINT_RPM = 600;
static constexpr bool ENABLE_AT_BOOT = false;

static constexpr uint32_t STATUS_LOG_PERIOD_MS = 1000;

inline Control::RegulatorConfig defaultRegulatorConfig() {
    Control::RegulatorConfig cfg;
    cfg.controlPeriodUs = 1000;
    cfg.speedWindowPeriods = 10;
    cfg.fractionalBits = GAIN_FRACTIONAL_BITS;
    cfg.kp = FixedPoint::toFixed(0.8, GAIN_FRACTIONAL_BITS);
    cfg.ki = FixedPoint::toFixed(0.05, GAIN_FRACTIONAL_BITS);
    cfg.kd = FixedPoint::toFixed(0.1, GAIN_FRACTIONAL_BITS);
    cfg.integralLimit = 20000;
    cfg.outputMin = -static_cast<int32_t>(DUTY_MAX);
    cfg.outputMax = static_cast<int32_t>(DUTY_MAX);
    cfg.dutyMax = DUTY_MAX;
    cfg.countsPerRevolution = 4 * 1024;  // 1024 PPR, x4 decoding
    cfg.encoderInverted = false;
    cfg.deadZone = 60;
    cfg.nearZeroSpeedRpm = 5;
    cfg.stallPeriods = 500;
    cfg.maxPlausibleDelta = 4 * 1024;  // one revolution per 10 ms window (6000 RPM)
    cfg.mode = Control::ControlMode::VELOCITY;
    return cfg;
}

inline Encoder::EncoderConfig encoderConfig() {
    Encoder::EncoderConfig cfg;
    cfg.pinA = ENCODER_A;
    cfg.pinB = ENCODER_B;
    cfg.openCollectorInputs = true;
    return cfg;
}

inline HBridge::HBridgeConfig hBridgeConfig() {
    HBridge::HBridgeConfig cfg;
    cfg.enPin = EN_PIN;
    cfg.phPin = PH_PIN;
    cfg.nSleepPin = NSLEEP_PIN;
    cfg.channel = LEDC_CHANNEL_0;
    cfg.timer = LEDC_TIMER_0;
    cfg.resolution = LEDC_TIMER_10_BIT;
    cfg.frequencyHz = 20000;
    cfg.dutyMax = DUTY_MAX;
    return cfg;
}

inline Control::ControlTaskConfig controlTaskConfig(uint32_t periodUs) {
    Control::ControlTaskConfig cfg;
    cfg.periodUs = periodUs;
    cfg.coreId = 1;
    cfg.priority = configMAX_PRIORITIES - 2;
    cfg.stackSize = 4096;
    return cfg;
}

}  // namespace DC_Speed_Regulator_Firmware::Settings
