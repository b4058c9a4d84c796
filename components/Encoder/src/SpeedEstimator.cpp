#include "SpeedEstimator.hpp"

#include "FixedPoint.hpp"
#include "QuadratureDecoder.hpp"
#include "esp_log.h"

namespace DC_Speed_Regulator_Firmware {
namespace Encoder {

SpeedEstimator::SpeedEstimator(const SpeedEstimatorConfig& cfg) : config(cfg) {
    if (config.windowPeriods == 0) {
        config.windowPeriods = 1;
    }
    if (config.countsPerRevolution == 0) {
        config.countsPerRevolution = 1;
    }
    if (config.controlPeriodUs == 0) {
        config.controlPeriodUs = 1;
    }

    const int64_t windowUs = static_cast<int64_t>(config.controlPeriodUs) * config.windowPeriods;
    rpmDivisor = static_cast<int64_t>(config.countsPerRevolution) * windowUs;

    ESP_LOGI(TAG, "window=%u x %u us, cpr=%u", static_cast<unsigned>(config.windowPeriods),
             static_cast<unsigned>(config.controlPeriodUs), static_cast<unsigned>(config.countsPerRevolution));
}

void SpeedEstimator::reset() noexcept {
    hasBaseline = false;
    baselineCount = 0;
    periodsInWindow = 0;
    lastSample = SpeedSample{};
    lastWindowPlausible = true;
}

SpeedSample SpeedEstimator::update(int32_t countNow) noexcept {
    lastSample.valid = false;

    periodsInWindow++;
    if (periodsInWindow < config.windowPeriods) {
        return lastSample;
    }
    periodsInWindow = 0;

    if (!hasBaseline) {
        baselineCount = countNow;
        hasBaseline = true;
        lastSample = SpeedSample{};
        return lastSample;
    }

    const int32_t delta = QuadratureDecoder::countDelta(countNow, baselineCount);
    baselineCount = countNow;

    bool plausible = true;
    if (config.maxPlausibleDelta > 0) {
        const uint32_t deltaAbs = FixedPoint::magnitude(delta);
        plausible = (deltaAbs <= static_cast<uint32_t>(config.maxPlausibleDelta));
    }

    if (!plausible) {
        implausibleWindows++;
        if (lastWindowPlausible) {
            ESP_LOGW(TAG, "implausible window delta %ld (limit %ld)", static_cast<long>(delta),
                     static_cast<long>(config.maxPlausibleDelta));
        }
    }
    lastWindowPlausible = plausible;

    lastSample.countDelta = delta;
    lastSample.speedRpm = deltaToRpm(delta);
    lastSample.valid = true;
    lastSample.plausible = plausible;
    return lastSample;
}

SpeedSample SpeedEstimator::getLastSample() const noexcept { return lastSample; }

uint32_t SpeedEstimator::getImplausibleWindows() const noexcept { return implausibleWindows; }

int32_t SpeedEstimator::deltaToRpm(int32_t delta) const noexcept {
    const int64_t numerator = static_cast<int64_t>(delta) * MICROSECONDS_PER_MINUTE;
    return FixedPoint::saturate(numerator / rpmDivisor);
}

SpeedEstimatorConfig SpeedEstimator::getConfig() const noexcept { return config; }

}  // namespace Encoder
}  // namespace DC_Speed_Regulator_Firmware
