#include "Supervisor.hpp"
#include "FixedPoint.hpp"
#include "QuadratureDecoder.hpp"

using namespace DC_Speed_Regulator_Firmware;
using namespace DC_Speed_Regulator_Firmware::Control;

Supervisor::Supervisor(const SupervisorConfig& cfg) : config(cfg) {}

SupervisorEvent Supervisor::beginPeriod(bool enable, int32_t measuredSpeedRpm) {
    switch (state) {
        case SupervisorState::IDLE:
            if (enable) {
                faultLatched = false;
                faultReason = FaultReason::NONE;
                stallCounter = 0;
                transitionTo(SupervisorState::RUNNING);
                return SupervisorEvent::STARTED;
            }
            break;

        case SupervisorState::RUNNING:
            if (!enable) {
                stallCounter = 0;
                transitionTo(SupervisorState::BRAKING);
                return SupervisorEvent::BRAKING;
            }
            break;

        case SupervisorState::BRAKING:
            if (isNearZero(measuredSpeedRpm)) {
                transitionTo(SupervisorState::IDLE);
                return SupervisorEvent::STOPPED;
            }
            break;

        case SupervisorState::FAULT:
            if (!enable) {
                stallCounter = 0;
                transitionTo(SupervisorState::IDLE);
                return SupervisorEvent::FAULT_CLEARED;
            }
            break;
    }

    return SupervisorEvent::NONE;
}

SupervisorEvent Supervisor::checkStall(uint32_t commandedMagnitude, int32_t measuredSpeedRpm, bool motionObserved,
                                       int32_t encoderCount) {
    if (state != SupervisorState::RUNNING) {
        return SupervisorEvent::NONE;
    }

    bool effortPresent = commandedMagnitude > config.deadZone;
    if (!effortPresent || !isNearZero(measuredSpeedRpm)) {
        stallCounter = 0;
        return SupervisorEvent::NONE;
    }

    if (stallCounter == 0) {
        stallStartCount = encoderCount;
    }

    // Edges within stallDitherSteps of the run start are dither, not motion.
    const uint32_t displacement =
        FixedPoint::magnitude(Encoder::QuadratureDecoder::countDelta(encoderCount, stallStartCount));
    if (motionObserved && displacement > config.stallDitherSteps) {
        stallCounter = 0;
        return SupervisorEvent::NONE;
    }

    stallCounter++;

    if (stallCounter < config.stallPeriods) {
        return SupervisorEvent::NONE;
    }

    faultLatched = true;
    faultReason = FaultReason::STALL;
    ESP_LOGE(TAG, "stall: effort %lu for %lu periods, speed %ld rpm -> FAULT latched",
             static_cast<unsigned long>(commandedMagnitude), static_cast<unsigned long>(stallCounter),
             static_cast<long>(measuredSpeedRpm));
    transitionTo(SupervisorState::FAULT);
    return SupervisorEvent::STALLED;
}

ActuationCommand Supervisor::resolve(const ActuationCommand& mapped) const {
    ActuationCommand command;

    switch (getAuthority()) {
        case CommandAuthority::MAPPER:
            command = mapped;
            break;
        case CommandAuthority::FORCE_BRAKE:
            command.brake = true;
            break;
        case CommandAuthority::FORCE_ZERO:
            break;
    }

    return command;
}

CommandAuthority Supervisor::getAuthority() const {
    switch (state) {
        case SupervisorState::RUNNING:
            return CommandAuthority::MAPPER;
        case SupervisorState::BRAKING:
            return CommandAuthority::FORCE_BRAKE;
        case SupervisorState::IDLE:
        case SupervisorState::FAULT:
            break;
    }
    return CommandAuthority::FORCE_ZERO;
}

SupervisorState Supervisor::getState() const { return state; }

bool Supervisor::isFaultLatched() const { return faultLatched; }

FaultReason Supervisor::getFaultReason() const { return faultReason; }

uint32_t Supervisor::getStallCount() const { return stallCounter; }

const char* Supervisor::stateName(SupervisorState s) {
    switch (s) {
        case SupervisorState::IDLE:
            return "IDLE";
        case SupervisorState::RUNNING:
            return "RUNNING";
        case SupervisorState::BRAKING:
            return "BRAKING";
        case SupervisorState::FAULT:
            return "FAULT";
    }
    return "?";
}

bool Supervisor::isNearZero(int32_t measuredSpeedRpm) const {
    return FixedPoint::magnitude(measuredSpeedRpm) < static_cast<uint32_t>(config.nearZeroSpeedRpm);
}

void Supervisor::transitionTo(SupervisorState next) {
    if (next == state) {
        return;
    }
    ESP_LOGI(TAG, "%s -> %s", stateName(state), stateName(next));
    state = next;
}
