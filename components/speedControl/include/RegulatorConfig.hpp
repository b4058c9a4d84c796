/**
 * @file RegulatorConfig.hpp
 * @brief Run-time configuration of the speed regulator and its sub-configs.
 */

#pragma once

#include "ActuationMapper.hpp"
#include "PID.hpp"
#include "SpeedEstimator.hpp"
#include "Supervisor.hpp"
#include <cstdint>

namespace DC_Speed_Regulator_Firmware::Control {

/**
 * @enum ControlMode
 * @brief What the setpoint and feedback represent.
 */
enum class ControlMode {
    VELOCITY,  ///< Setpoint and feedback in RPM
    POSITION   ///< Setpoint and feedback in encoder steps since enable
};

/**
 * @struct RegulatorConfig
 * @brief Immutable per-run configuration (loaded once at startup).
 *
 * Gains are raw integers scaled by 2^fractionalBits (see FixedPoint::toFixed).
 * Output, dead-zone and dutyMax share the same duty units.
 */
struct RegulatorConfig {
    uint32_t controlPeriodUs = 1000;      ///< Control period (us), 1 kHz default
    uint16_t speedWindowPeriods = 10;     ///< Speed window in control periods
    uint8_t fractionalBits = 8;           ///< Q format of the gains
    int32_t kp = 0;                       ///< Proportional gain (raw)
    int32_t ki = 0;                       ///< Integral gain (raw)
    int32_t kd = 0;                       ///< Derivative gain (raw)
    int32_t integralLimit = 100000;       ///< Anti-windup clamp on the integral
    int32_t outputMin = -1000;            ///< Lower effort clamp
    int32_t outputMax = 1000;             ///< Upper effort clamp
    uint32_t dutyMax = 1000;              ///< Full-scale duty magnitude
    uint32_t countsPerRevolution = 2048;  ///< Decoded steps per revolution (x4)
    bool encoderInverted = false;         ///< Flip count sign so forward counts up
    uint32_t deadZone = 50;               ///< Dead-zone magnitude (duty units)
    int32_t nearZeroSpeedRpm = 5;         ///< Stopped / stall speed threshold (RPM)
    uint32_t stallPeriods = 500;          ///< Stall duration in control periods
    int32_t maxPlausibleDelta = 0;        ///< Per-window |delta| sanity bound, 0 = off
    ControlMode mode = ControlMode::VELOCITY;  ///< Velocity or position loop
};

/**
 * @brief Range-clamp a raw configuration once at startup.
 *
 * Every field that had to change is reported with ESP_LOGW. The returned value is
 * the configuration the regulator runs with.
 *
 * @param raw Configuration as authored (board settings, NVS, ...)
 * @return Sanitized configuration
 */
RegulatorConfig loadRegulatorConfig(const RegulatorConfig& raw);

/**
 * @brief Log the effective configuration at INFO level.
 * @param cfg Configuration to print
 */
void logRegulatorConfig(const RegulatorConfig& cfg);

/** @brief Derive the speed estimator window parameters. */
Encoder::SpeedEstimatorConfig toSpeedEstimatorConfig(const RegulatorConfig& cfg);

/** @brief Derive the PID gains and limits. */
PID::PidConfig toPidConfig(const RegulatorConfig& cfg);

/** @brief Derive the dead-zone and duty range. */
ActuationMapperConfig toMapperConfig(const RegulatorConfig& cfg);

/** @brief Derive the supervisor thresholds. */
SupervisorConfig toSupervisorConfig(const RegulatorConfig& cfg);

}  // namespace DC_Speed_Regulator_Firmware::Control
