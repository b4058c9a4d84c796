#include "PID.hpp"

#include "FixedPoint.hpp"
#include "esp_log.h"

using namespace DC_Speed_Regulator_Firmware::PID;
namespace FixedPoint = DC_Speed_Regulator_Firmware::FixedPoint;

PIDController::PIDController(const PidConfig& cfg) : config(cfg) {
    if (config.fractionalBits > FixedPoint::MAX_FRACTIONAL_BITS) {
        config.fractionalBits = FixedPoint::MAX_FRACTIONAL_BITS;
    }
    if (config.integralLimit < 0) {
        config.integralLimit = 0;
    }
    if (config.outputMin > config.outputMax) {
        config.outputMin = config.outputMax;
    }
    reset();
}

void PIDController::reset() {
    state = PidState{};
}

int32_t PIDController::compute(int32_t setpoint, int32_t feedback) {
    const int32_t error = FixedPoint::subtract(setpoint, feedback);
    state.error = error;

    state.pTerm = FixedPoint::multiply(error, config.kp, config.fractionalBits);

    if (!state.antiWindupActive) {
        const int64_t accumulated = static_cast<int64_t>(state.integral) + error;
        state.integral = FixedPoint::clamp(accumulated, -config.integralLimit, config.integralLimit);
    }
    state.iTerm = FixedPoint::multiply(state.integral, config.ki, config.fractionalBits);

    const int32_t errorDelta = FixedPoint::subtract(error, state.previousError);
    state.dTerm = FixedPoint::multiply(errorDelta, config.kd, config.fractionalBits);

    const int64_t rawSum = static_cast<int64_t>(state.pTerm) + state.iTerm + state.dTerm;
    state.output = FixedPoint::clamp(rawSum, config.outputMin, config.outputMax);

    const bool clamped = (rawSum != state.output);
    if (clamped != state.antiWindupActive) {
        ESP_LOGD(TAG, "anti-windup %s (raw=%lld, out=%ld, integral=%ld)", clamped ? "ON" : "OFF",
                 static_cast<long long>(rawSum), static_cast<long>(state.output), static_cast<long>(state.integral));
    }
    state.antiWindupActive = clamped;

    state.previousError = error;
    return state.output;
}

int32_t PIDController::update(bool enable, bool periodBoundary, int32_t setpoint, int32_t feedback) {
    if (!enable) {
        if (phase != PidPhase::IDLE) {
            ESP_LOGI(TAG, "disabled");
        }
        phase = PidPhase::IDLE;
        state.output = 0;
        return 0;
    }

    if (phase == PidPhase::IDLE) {
        reset();
        ESP_LOGI(TAG, "enabled: Kp=%ld Ki=%ld Kd=%ld (Q%u)", static_cast<long>(config.kp),
                 static_cast<long>(config.ki), static_cast<long>(config.kd),
                 static_cast<unsigned>(config.fractionalBits));
    }

    if (!periodBoundary) {
        phase = PidPhase::HOLD;
        return state.output;
    }

    phase = PidPhase::COMPUTE;
    return compute(setpoint, feedback);
}

bool PIDController::isSaturated() const { return state.antiWindupActive; }

int32_t PIDController::getLastError() const { return state.error; }

int32_t PIDController::getIntegral() const { return state.integral; }

int32_t PIDController::getOutput() const { return state.output; }

PidPhase PIDController::getPhase() const { return phase; }

const PidState& PIDController::getState() const { return state; }

PidConfig PIDController::getConfig() const { return config; }
