#include "RegulatorConfig.hpp"
#include "FixedPoint.hpp"
#include "esp_log.h"
#include <limits>

namespace DC_Speed_Regulator_Firmware::Control {

static constexpr const char* TAG = "RegulatorConfig";

static constexpr uint32_t MIN_CONTROL_PERIOD_US = 100;

RegulatorConfig loadRegulatorConfig(const RegulatorConfig& raw) {
    RegulatorConfig cfg = raw;

    auto clampSigned = [](const char* name, int32_t& field, int32_t low, int32_t high) {
        int32_t clamped = FixedPoint::clamp(field, low, high);
        if (clamped != field) {
            ESP_LOGW(TAG, "%s: %ld -> %ld", name, static_cast<long>(field), static_cast<long>(clamped));
            field = clamped;
        }
    };

    auto raiseUnsigned = [](const char* name, uint32_t& field, uint32_t minimum) {
        if (field < minimum) {
            ESP_LOGW(TAG, "%s: %lu -> %lu", name, static_cast<unsigned long>(field),
                     static_cast<unsigned long>(minimum));
            field = minimum;
        }
    };

    if (cfg.fractionalBits > FixedPoint::MAX_FRACTIONAL_BITS) {
        ESP_LOGW(TAG, "fractionalBits: %u -> %u", static_cast<unsigned>(cfg.fractionalBits),
                 static_cast<unsigned>(FixedPoint::MAX_FRACTIONAL_BITS));
        cfg.fractionalBits = FixedPoint::MAX_FRACTIONAL_BITS;
    }

    raiseUnsigned("controlPeriodUs", cfg.controlPeriodUs, MIN_CONTROL_PERIOD_US);

    if (cfg.speedWindowPeriods == 0) {
        ESP_LOGW(TAG, "speedWindowPeriods: 0 -> 1");
        cfg.speedWindowPeriods = 1;
    }

    raiseUnsigned("countsPerRevolution", cfg.countsPerRevolution, 1);
    raiseUnsigned("dutyMax", cfg.dutyMax, 1);
    raiseUnsigned("stallPeriods", cfg.stallPeriods, 1);

    constexpr int32_t int32Max = std::numeric_limits<int32_t>::max();
    constexpr int32_t int32Min = std::numeric_limits<int32_t>::min();

    clampSigned("kp", cfg.kp, 0, int32Max);
    clampSigned("ki", cfg.ki, 0, int32Max);
    clampSigned("kd", cfg.kd, 0, int32Max);
    clampSigned("integralLimit", cfg.integralLimit, 0, int32Max);
    clampSigned("outputMin", cfg.outputMin, int32Min, 0);
    clampSigned("outputMax", cfg.outputMax, 0, int32Max);
    clampSigned("nearZeroSpeedRpm", cfg.nearZeroSpeedRpm, 1, int32Max);
    clampSigned("maxPlausibleDelta", cfg.maxPlausibleDelta, 0, int32Max);

    if (cfg.deadZone > cfg.dutyMax) {
        ESP_LOGW(TAG, "deadZone: %lu -> %lu", static_cast<unsigned long>(cfg.deadZone),
                 static_cast<unsigned long>(cfg.dutyMax));
        cfg.deadZone = cfg.dutyMax;
    }

    return cfg;
}

void logRegulatorConfig(const RegulatorConfig& cfg) {
    ESP_LOGI(TAG, "mode=%s period=%lu us window=%u cpr=%lu inverted=%d",
             cfg.mode == ControlMode::VELOCITY ? "VELOCITY" : "POSITION",
             static_cast<unsigned long>(cfg.controlPeriodUs), static_cast<unsigned>(cfg.speedWindowPeriods),
             static_cast<unsigned long>(cfg.countsPerRevolution), cfg.encoderInverted ? 1 : 0);
    ESP_LOGI(TAG, "Q%u Kp=%ld Ki=%ld Kd=%ld iLimit=%ld out=[%ld, %ld]", static_cast<unsigned>(cfg.fractionalBits),
             static_cast<long>(cfg.kp), static_cast<long>(cfg.ki), static_cast<long>(cfg.kd),
             static_cast<long>(cfg.integralLimit), static_cast<long>(cfg.outputMin), static_cast<long>(cfg.outputMax));
    ESP_LOGI(TAG, "dutyMax=%lu deadZone=%lu nearZero=%ld rpm stall=%lu periods plausible=%ld",
             static_cast<unsigned long>(cfg.dutyMax), static_cast<unsigned long>(cfg.deadZone),
             static_cast<long>(cfg.nearZeroSpeedRpm), static_cast<unsigned long>(cfg.stallPeriods),
             static_cast<long>(cfg.maxPlausibleDelta));
}

Encoder::SpeedEstimatorConfig toSpeedEstimatorConfig(const RegulatorConfig& cfg) {
    Encoder::SpeedEstimatorConfig out;
    out.controlPeriodUs = cfg.controlPeriodUs;
    out.windowPeriods = cfg.speedWindowPeriods;
    out.countsPerRevolution = cfg.countsPerRevolution;
    out.maxPlausibleDelta = cfg.maxPlausibleDelta;
    return out;
}

PID::PidConfig toPidConfig(const RegulatorConfig& cfg) {
    PID::PidConfig out;
    out.kp = cfg.kp;
    out.ki = cfg.ki;
    out.kd = cfg.kd;
    out.fractionalBits = cfg.fractionalBits;
    out.integralLimit = cfg.integralLimit;
    out.outputMin = cfg.outputMin;
    out.outputMax = cfg.outputMax;
    return out;
}

ActuationMapperConfig toMapperConfig(const RegulatorConfig& cfg) {
    ActuationMapperConfig out;
    out.deadZone = cfg.deadZone;
    out.dutyMax = cfg.dutyMax;
    return out;
}

SupervisorConfig toSupervisorConfig(const RegulatorConfig& cfg) {
    SupervisorConfig out;
    out.nearZeroSpeedRpm = cfg.nearZeroSpeedRpm;
    out.deadZone = cfg.deadZone;
    out.stallPeriods = cfg.stallPeriods;
    return out;
}

}  // namespace DC_Speed_Regulator_Firmware::Control
