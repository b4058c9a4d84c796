/**
 * @file PID.hpp
 * @brief Fixed-point PID engine with freeze-on-saturation anti-windup.
 */

#pragma once

#include <cstdint>

#include "IPIDController.hpp"

namespace DC_Speed_Regulator_Firmware {
namespace PID {

/**
 * @struct PidConfig
 * @brief Gains and limits. Gains are scaled by 2^fractionalBits.
 */
struct PidConfig {
    int32_t kp = 0;                  ///< Proportional gain (raw)
    int32_t ki = 0;                  ///< Integral gain (raw)
    int32_t kd = 0;                  ///< Derivative gain (raw)
    uint8_t fractionalBits = 8;      ///< Q format of the gains
    int32_t integralLimit = 100000;  ///< |integral| clamp (error units)
    int32_t outputMin = -1000;       ///< Lower output clamp
    int32_t outputMax = 1000;        ///< Upper output clamp
};

/**
 * @enum PidPhase
 * @brief Engine sequencing state.
 */
enum class PidPhase {
    IDLE,     ///< Disabled, waiting for enable
    COMPUTE,  ///< Ran one control step this period
    HOLD      ///< Enabled, waiting for the next period boundary
};

/**
 * @struct PidState
 * @brief Controller state, mutated only by compute().
 */
struct PidState {
    int32_t error = 0;              ///< setpoint - feedback of the last step
    int32_t integral = 0;           ///< Accumulated error, |integral| <= integralLimit
    int32_t previousError = 0;      ///< Error of the step before
    int32_t output = 0;             ///< Last clamped effort
    bool antiWindupActive = false;  ///< Last output was clamped; freeze integration
    int32_t pTerm = 0;              ///< Last proportional contribution
    int32_t iTerm = 0;              ///< Last integral contribution
    int32_t dTerm = 0;              ///< Last derivative contribution
};

class PIDController : public IPIDController {
  public:
    explicit PIDController(const PidConfig& cfg);

    void reset() override;

    /**
     * @brief Run one Compute step unconditionally.
     *
     * error = setpoint - feedback; integral accumulates unless the previous output
     * was clamped; output = clamp(P + I + D).
     */
    int32_t compute(int32_t setpoint, int32_t feedback) override;

    /**
     * @brief Sequencer entry point, called on every scheduler wake-up.
     *
     * Disabled: IDLE, output forced to 0. Leaving IDLE resets the history.
     * Enabled with periodBoundary: COMPUTE (one compute() call). Otherwise HOLD.
     * HOLD is only reached by callers that wake more often than once per control
     * period; SpeedRegulator runs once per period and always passes a boundary.
     *
     * @return Current effort (0 while IDLE).
     */
    int32_t update(bool enable, bool periodBoundary, int32_t setpoint, int32_t feedback);

    bool isSaturated() const override;
    int32_t getLastError() const override;
    int32_t getIntegral() const override;
    int32_t getOutput() const override;

    PidPhase getPhase() const;
    const PidState& getState() const;
    PidConfig getConfig() const;

  private:
    PidConfig config;
    PidState state;
    PidPhase phase = PidPhase::IDLE;

    static constexpr const char* TAG = "PID";
};

}  // namespace PID
}  // namespace DC_Speed_Regulator_Firmware
