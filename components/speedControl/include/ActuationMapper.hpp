/**
 * @file ActuationMapper.hpp
 * @brief Converts signed control effort into duty magnitude + direction.
 */

#pragma once

#include "IActuationOutput.hpp"
#include <cstdint>

namespace DC_Speed_Regulator_Firmware::Control {

/**
 * @struct ActuationMapperConfig
 * @brief Dead-zone and duty range.
 */
struct ActuationMapperConfig {
    uint32_t deadZone = 50;   ///< Magnitudes below this are forced to 0
    uint32_t dutyMax = 1000;  ///< Full-scale duty (magnitude upper bound)
};

/**
 * @class ActuationMapper
 * @brief Splits effort into |effort| and sign, then applies dead-zone compensation.
 *
 * Magnitudes below the dead-zone become exactly 0. Anything at or above it passes
 * through unscaled, limited only by dutyMax. The brake flag is never set here; only
 * the supervisor may request braking.
 */
class ActuationMapper {
  public:
    /**
     * @brief Construct with dead-zone and duty range.
     * @param cfg Mapper configuration
     */
    explicit ActuationMapper(const ActuationMapperConfig& cfg = ActuationMapperConfig());

    /**
     * @brief Map one period's effort.
     * @param effort Signed PID output.
     * @return Command with brake=false.
     */
    ActuationCommand map(int32_t effort) const noexcept;

    /**
     * @brief Direction implied by an effort: FORWARD if effort > 0, else REVERSE.
     * @param effort Signed effort
     * @return Direction flag
     */
    static MotorDirection directionOf(int32_t effort) noexcept;

    /**
     * @brief Get current configuration.
     * @return Current ActuationMapperConfig
     */
    ActuationMapperConfig getConfig() const noexcept;

  private:
    ActuationMapperConfig config;  ///< Configuration
};

}  // namespace DC_Speed_Regulator_Firmware::Control
