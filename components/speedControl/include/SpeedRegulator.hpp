/**
 * @file SpeedRegulator.hpp
 * @brief One control period of the regulator chain.
 *
 * Estimator -> PID -> Mapper -> Supervisor, advanced together once per period from
 * the control task. The decoder is the only object shared with interrupt context and
 * is read through atomic loads.
 */

#pragma once

#include "ActuationMapper.hpp"
#include "PID.hpp"
#include "QuadratureDecoder.hpp"
#include "RegulatorConfig.hpp"
#include "SpeedEstimator.hpp"
#include "Supervisor.hpp"
#include <cstdint>

namespace DC_Speed_Regulator_Firmware::Control {

/**
 * @struct RegulatorInputs
 * @brief External inputs sampled once at the period boundary.
 */
struct RegulatorInputs {
    bool enable = false;   ///< Run request
    int32_t setpoint = 0;  ///< RPM in velocity mode, steps in position mode
};

/**
 * @struct RegulatorOutputs
 * @brief Per-period result handed to the output stage.
 */
struct RegulatorOutputs {
    ActuationCommand command;      ///< Final (supervised) command
    int32_t measuredSpeedRpm = 0;  ///< Held speed measurement
    bool faultLatched = false;     ///< Supervisor fault latch
    int32_t encoderCount = 0;      ///< Raw decoder count (debug)
};

/**
 * @struct RegulatorStatus
 * @brief Diagnostics snapshot, refreshed every period.
 */
struct RegulatorStatus {
    SupervisorState state = SupervisorState::IDLE;  ///< Supervisor state
    FaultReason faultReason = FaultReason::NONE;    ///< Reason of the last fault
    bool faultLatched = false;                      ///< Fault latch
    int32_t measuredSpeedRpm = 0;                   ///< Held speed
    bool speedValid = false;                        ///< Speed computed this period
    int32_t encoderCount = 0;                       ///< Decoder count
    int32_t countDelta = 0;                         ///< Last window delta
    int32_t error = 0;                              ///< PID error
    int32_t integral = 0;                           ///< PID integral
    int32_t effort = 0;                             ///< PID output
    bool antiWindupActive = false;                  ///< PID output clamped
    ActuationCommand command;                       ///< Final command
    uint32_t stallCount = 0;                        ///< Consecutive stalled periods
    uint32_t invalidTransitions = 0;                ///< Discarded dual-phase jumps
    uint32_t implausibleWindows = 0;                ///< Windows over the delta bound
    uint32_t periods = 0;                           ///< Periods executed
};

/**
 * @class SpeedRegulator
 * @brief Owns the control chain and runs it one period at a time.
 */
class SpeedRegulator {
  public:
    /**
     * @brief Build the chain from a sanitized configuration.
     * @param decoder Decoder fed by the encoder ISR (must outlive the regulator)
     * @param cfg Configuration returned by loadRegulatorConfig()
     */
    SpeedRegulator(Encoder::QuadratureDecoder& decoder, const RegulatorConfig& cfg);

    SpeedRegulator(const SpeedRegulator&) = delete;
    SpeedRegulator& operator=(const SpeedRegulator&) = delete;

    /**
     * @brief Run one control period.
     *
     * Never blocks and never allocates. Must be called from a single task.
     *
     * @param inputs Enable and setpoint sampled at this boundary
     * @return Final command and diagnostics outputs
     */
    RegulatorOutputs step(const RegulatorInputs& inputs);

    /** @brief Snapshot of the last period. */
    RegulatorStatus getStatus() const;

    /** @brief Effective configuration. */
    const RegulatorConfig& getConfig() const;

  private:
    Encoder::QuadratureDecoder& decoder;  ///< Shared with the ISR
    RegulatorConfig config;               ///< Immutable per run
    Encoder::SpeedEstimator estimator;    ///< Windowed speed
    PID::PIDController pid;               ///< Fixed-point PID
    ActuationMapper mapper;               ///< Dead-zone and direction
    Supervisor supervisor;                ///< State machine and override

    int32_t positionBaseline = 0;  ///< Count at the last enable (position mode)
    RegulatorStatus status;        ///< Last period snapshot
};

}  // namespace DC_Speed_Regulator_Firmware::Control
