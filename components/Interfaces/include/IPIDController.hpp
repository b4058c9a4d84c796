/**
 * @file IPIDController.hpp
 * @brief Interface for the periodic feedback law used by the regulator.
 *
 * Signals are integers in engineering units (RPM in velocity mode, encoder steps in
 * position mode); gains are scaled integers. Implementations must be deterministic
 * and must saturate rather than overflow.
 */

#pragma once

#include <cstdint>

namespace DC_Speed_Regulator_Firmware {

/**
 * @class IPIDController
 * @brief Abstract interface for a fixed-point PID controller.
 */
class IPIDController {
  public:
    /**
     * @brief Virtual destructor.
     */
    virtual ~IPIDController() = default;

    /**
     * @brief Reset the controller internal state (integral sum, previous error, etc.).
     */
    virtual void reset() = 0;

    /**
     * @brief Compute one PID iteration.
     * @param setpoint Desired target value.
     * @param feedback Current measured value.
     * @return Clamped control effort.
     */
    virtual int32_t compute(int32_t setpoint, int32_t feedback) = 0;

    /**
     * @brief Check whether the last output was clamped (anti-windup active next cycle).
     */
    virtual bool isSaturated() const = 0;

    /**
     * @brief Get the error value from the most recent compute() call.
     */
    virtual int32_t getLastError() const = 0;

    /**
     * @brief Get the accumulated integral (error units, before Ki).
     */
    virtual int32_t getIntegral() const = 0;

    /**
     * @brief Get the output value from the most recent compute() call.
     */
    virtual int32_t getOutput() const = 0;
};

}  // namespace DC_Speed_Regulator_Firmware
