/**
 * @file SpeedEstimator.hpp
 * @brief Fixed-window count-delta speed estimator (integer arithmetic only).
 *
 * Advanced once per control period by the control task. Every `windowPeriods`
 * periods it differentiates the decoder count and converts the delta to RPM:
 *
 *     rpm = delta * 60'000'000 / (countsPerRevolution * windowUs)
 *
 * The quotient truncates toward zero. The sample is flagged valid only in the
 * period in which it was computed; between windows the last speed is held.
 */

#pragma once

#include <cstdint>

namespace DC_Speed_Regulator_Firmware {
namespace Encoder {

/**
 * @struct SpeedEstimatorConfig
 * @brief Measurement window and scaling parameters.
 *
 * @details
 * - `countsPerRevolution` is in decoded steps (x4 of the per-channel PPR).
 * - `maxPlausibleDelta` bounds |delta| per window for the sanity check; 0 disables it.
 */
struct SpeedEstimatorConfig {
    uint32_t controlPeriodUs = 1000;       ///< Control period (us)
    uint16_t windowPeriods = 10;           ///< Window length in control periods
    uint32_t countsPerRevolution = 2048;   ///< Decoded steps per output revolution
    int32_t maxPlausibleDelta = 0;         ///< Sanity bound on |delta| per window
};

/**
 * @struct SpeedSample
 * @brief One speed measurement as seen by the control chain.
 */
struct SpeedSample {
    int32_t speedRpm = 0;    ///< Signed speed (RPM), held between windows
    int32_t countDelta = 0;  ///< Count delta the speed was derived from
    bool valid = false;      ///< True only in the period the sample was computed
    bool plausible = true;   ///< False if |countDelta| exceeded maxPlausibleDelta
};

/**
 * @class SpeedEstimator
 * @brief Differentiates the decoder count over a fixed window.
 */
class SpeedEstimator {
  public:
    /**
     * @brief Construct with a window configuration.
     * @param cfg Window and scaling parameters (already range-checked).
     */
    explicit SpeedEstimator(const SpeedEstimatorConfig& cfg);

    /**
     * @brief Drop the window baseline and the held speed.
     *
     * The first window that completes afterwards only captures a new baseline and
     * reports zero speed with validity suppressed.
     */
    void reset() noexcept;

    /**
     * @brief Advance one control period.
     * @param countNow Atomic snapshot of the decoder count.
     * @return Current sample (valid only at a window boundary).
     */
    SpeedSample update(int32_t countNow) noexcept;

    /**
     * @brief Last sample returned by @ref update.
     */
    SpeedSample getLastSample() const noexcept;

    /**
     * @brief Number of windows that failed the plausibility check.
     */
    uint32_t getImplausibleWindows() const noexcept;

    /**
     * @brief Convert a window count delta to RPM using this configuration.
     * @param delta Signed count delta over one window.
     * @return Speed in RPM, saturated to int32_t.
     */
    int32_t deltaToRpm(int32_t delta) const noexcept;

    /**
     * @brief Get the window configuration.
     */
    SpeedEstimatorConfig getConfig() const noexcept;

  private:
    SpeedEstimatorConfig config;      ///< Window configuration
    int64_t rpmDivisor;               ///< countsPerRevolution * windowUs
    int32_t baselineCount = 0;        ///< Count at the previous window boundary
    bool hasBaseline = false;         ///< False until the first window after reset
    uint16_t periodsInWindow = 0;     ///< Periods elapsed in the current window
    SpeedSample lastSample;           ///< Held output
    uint32_t implausibleWindows = 0;  ///< Sanity-check failures
    bool lastWindowPlausible = true;  ///< Log only on onset

    static constexpr int64_t MICROSECONDS_PER_MINUTE = 60LL * 1000LL * 1000LL;
    static constexpr const char* TAG = "SpeedEstimator";
};

}  // namespace Encoder
}  // namespace DC_Speed_Regulator_Firmware
