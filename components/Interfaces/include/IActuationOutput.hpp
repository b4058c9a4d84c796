/**
 * @file IActuationOutput.hpp
 * @brief Hardware-agnostic sink for the regulator's actuation command.
 *
 * The regulator core produces one ActuationCommand per control period. The
 * physical output stage (H-bridge + PWM generator) implements this interface.
 */

#pragma once

#include <cstdint>
#include "esp_err.h"

namespace DC_Speed_Regulator_Firmware {

/**
 * @enum MotorDirection
 * @brief Logical motor rotation direction.
 */
enum class MotorDirection : bool {
    REVERSE = false,  ///< Negative effort (or no effort)
    FORWARD = true    ///< Positive effort; encoder counts up
};

/**
 * @struct ActuationCommand
 * @brief Duty-cycle magnitude, direction and brake request for one period.
 */
struct ActuationCommand {
    uint32_t magnitude = 0;                              ///< Duty in [0, dutyMax]
    MotorDirection direction = MotorDirection::REVERSE;  ///< Rotation direction
    bool brake = false;                                  ///< Short the windings

    bool operator==(const ActuationCommand& other) const {
        return magnitude == other.magnitude && direction == other.direction && brake == other.brake;
    }
    bool operator!=(const ActuationCommand& other) const { return !(*this == other); }
};

/**
 * @class IActuationOutput
 * @brief Abstract interface for applying an ActuationCommand to hardware.
 */
class IActuationOutput {
  public:
    /**
     * @brief Virtual destructor.
     */
    virtual ~IActuationOutput() = default;

    /**
     * @brief Initialize the output stage hardware.
     * @return esp_err_t ESP_OK on success, else error code.
     */
    virtual esp_err_t init() = 0;

    /**
     * @brief Apply one period's command.
     * @param command Resolved command (already clamped to dutyMax).
     * @return esp_err_t ESP_OK on success.
     */
    virtual esp_err_t apply(const ActuationCommand& command) = 0;

    /**
     * @brief Put the output stage in its safe state (outputs off, no drive).
     * @return esp_err_t ESP_OK on success.
     */
    virtual esp_err_t disable() = 0;
};

}  // namespace DC_Speed_Regulator_Firmware
