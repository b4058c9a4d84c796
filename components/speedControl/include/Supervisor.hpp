/**
 * @file Supervisor.hpp
 * @brief Supervisory state machine: Idle / Running / Braking / Fault.
 *
 * Sequences the regulator, detects stall (effort above the dead-zone while the shaft
 * makes no net progress) and has the final word over the actuation command. A fault is
 * latched: it leaves FAULT only on disable and the latch clears on the next enable.
 */

#pragma once

#include "IActuationOutput.hpp"
#include "esp_log.h"
#include <cstdint>

namespace DC_Speed_Regulator_Firmware::Control {

/**
 * @enum SupervisorState
 * @brief Top-level regulator state.
 */
enum class SupervisorState {
    IDLE,     ///< Disabled, outputs off
    RUNNING,  ///< Closed loop active
    BRAKING,  ///< Disabled while moving; brake until near-zero speed
    FAULT     ///< Latched fault, outputs off until disable
};

/**
 * @enum SupervisorEvent
 * @brief Transition emitted by one supervisor evaluation.
 */
enum class SupervisorEvent {
    NONE,          ///< No transition
    STARTED,       ///< IDLE -> RUNNING; caller must reset baselines
    BRAKING,       ///< RUNNING -> BRAKING
    STOPPED,       ///< BRAKING -> IDLE
    STALLED,       ///< RUNNING -> FAULT
    FAULT_CLEARED  ///< FAULT -> IDLE (disable observed)
};

/**
 * @enum FaultReason
 * @brief Why the last fault was latched.
 */
enum class FaultReason {
    NONE,  ///< No fault since the last enable
    STALL  ///< Effort present, no motion for stallPeriods
};

/**
 * @enum CommandAuthority
 * @brief Who decides the final actuation command this period.
 */
enum class CommandAuthority {
    MAPPER,      ///< Pass the mapper's command through
    FORCE_ZERO,  ///< (0, REVERSE, brake=false)
    FORCE_BRAKE  ///< (0, REVERSE, brake=true)
};

/**
 * @struct SupervisorConfig
 * @brief Thresholds for braking completion and stall detection.
 */
struct SupervisorConfig {
    int32_t nearZeroSpeedRpm = 5;   ///< |speed| below this counts as stopped
    uint32_t deadZone = 50;         ///< Effort must exceed this to count toward stall
    uint32_t stallPeriods = 500;    ///< Consecutive stalled periods before FAULT
    uint32_t stallDitherSteps = 1;  ///< Net steps since the stall run began still counted as stalled
};

/**
 * @class Supervisor
 * @brief Owns SupervisorState and the override of the actuation command.
 *
 * Evaluated in two phases every control period:
 * 1. @ref beginPeriod with the sampled enable and measured speed (enable and
 *    braking transitions).
 * 2. @ref checkStall with the mapper's command, only while RUNNING.
 * The final command is then produced by @ref resolve.
 */
class Supervisor {
  public:
    /** @brief Default constructor. */
    Supervisor() = default;

    /**
     * @brief Construct with thresholds.
     * @param cfg Supervisor configuration
     */
    explicit Supervisor(const SupervisorConfig& cfg);

    /**
     * @brief Apply enable / speed transitions for this period.
     * @param enable Sampled enable input
     * @param measuredSpeedRpm Measured speed (held between windows)
     * @return Transition taken, or NONE
     */
    SupervisorEvent beginPeriod(bool enable, int32_t measuredSpeedRpm);

    /**
     * @brief Evaluate the stall condition for this period (RUNNING only).
     * @param commandedMagnitude Mapper magnitude (after dead-zone)
     * @param measuredSpeedRpm Measured speed
     * @param motionObserved True if the decoder saw a valid edge this period
     * @param encoderCount Decoder count sampled this period
     * @return STALLED when the fault is latched, else NONE
     *
     * A period with edges still counts as stalled while the net displacement since
     * the stall run began stays within stallDitherSteps.
     */
    SupervisorEvent checkStall(uint32_t commandedMagnitude, int32_t measuredSpeedRpm, bool motionObserved,
                               int32_t encoderCount);

    /**
     * @brief Final command resolver, evaluated last each period.
     * @param mapped Command proposed by the ActuationMapper
     * @return The command to send to the output stage
     */
    ActuationCommand resolve(const ActuationCommand& mapped) const;

    /**
     * @brief Authority the current state grants over the command.
     */
    CommandAuthority getAuthority() const;

    /** @brief Current state. */
    SupervisorState getState() const;

    /** @brief True from the stall until the next enable after a disable. */
    bool isFaultLatched() const;

    /** @brief Reason of the latched (or last) fault. */
    FaultReason getFaultReason() const;

    /** @brief Consecutive stalled periods so far. */
    uint32_t getStallCount() const;

    /**
     * @brief Human-readable state name for logs.
     */
    static const char* stateName(SupervisorState s);

  private:
    /**
     * @brief Check |speed| against the near-zero threshold.
     */
    bool isNearZero(int32_t measuredSpeedRpm) const;

    /**
     * @brief Change state and log the transition once.
     */
    void transitionTo(SupervisorState next);

    SupervisorConfig config;                        ///< Thresholds
    SupervisorState state = SupervisorState::IDLE;  ///< Current state
    uint32_t stallCounter = 0;                      ///< Consecutive stalled periods
    int32_t stallStartCount = 0;                    ///< Decoder count when the stall run began
    bool faultLatched = false;                      ///< Fault latch
    FaultReason faultReason = FaultReason::NONE;    ///< Reason of the latch

    static constexpr const char* TAG = "Supervisor";
};

}  // namespace DC_Speed_Regulator_Firmware::Control
