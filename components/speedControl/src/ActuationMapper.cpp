#include "ActuationMapper.hpp"
#include "FixedPoint.hpp"

namespace DC_Speed_Regulator_Firmware::Control {

ActuationMapper::ActuationMapper(const ActuationMapperConfig& cfg) : config(cfg) {}

ActuationCommand ActuationMapper::map(int32_t effort) const noexcept {
    ActuationCommand command;
    command.direction = directionOf(effort);
    command.brake = false;

    uint32_t mag = FixedPoint::magnitude(effort);
    if (mag < config.deadZone) {
        mag = 0;
    }
    if (mag > config.dutyMax) {
        mag = config.dutyMax;
    }
    command.magnitude = mag;

    return command;
}

MotorDirection ActuationMapper::directionOf(int32_t effort) noexcept {
    return (effort > 0) ? MotorDirection::FORWARD : MotorDirection::REVERSE;
}

ActuationMapperConfig ActuationMapper::getConfig() const noexcept {
    return config;
}

}  // namespace DC_Speed_Regulator_Firmware::Control
