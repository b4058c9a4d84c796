/**
 * @file CommandInput.hpp
 * @brief Lock-free enable / setpoint holder sampled by the control task.
 */

#pragma once

#include "SpeedRegulator.hpp"
#include <atomic>
#include <cstdint>

namespace DC_Speed_Regulator_Firmware::Control {

/**
 * @class CommandInput
 * @brief Written by UI / communication code from any task, read once per period.
 *
 * Enable and setpoint are independent atomics, so a sample may pair a new enable
 * with the previous setpoint for one period.
 */
class CommandInput {
  public:
    void setEnable(bool enable) noexcept { enableFlag.store(enable, std::memory_order_relaxed); }

    void setSetpoint(int32_t setpoint) noexcept { setpointValue.store(setpoint, std::memory_order_relaxed); }

    /**
     * @brief Sample both inputs at a period boundary.
     * @return Inputs for SpeedRegulator::step()
     */
    RegulatorInputs sample() const noexcept {
        RegulatorInputs inputs;
        inputs.enable = enableFlag.load(std::memory_order_relaxed);
        inputs.setpoint = setpointValue.load(std::memory_order_relaxed);
        return inputs;
    }

  private:
    std::atomic<bool> enableFlag{false};
    std::atomic<int32_t> setpointValue{0};
};

}  // namespace DC_Speed_Regulator_Firmware::Control
