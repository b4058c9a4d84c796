#include "SpeedRegulator.hpp"
#include "esp_log.h"

namespace DC_Speed_Regulator_Firmware::Control {

static constexpr const char* TAG = "SpeedRegulator";

SpeedRegulator::SpeedRegulator(Encoder::QuadratureDecoder& decoder, const RegulatorConfig& cfg)
    : decoder(decoder),
      config(cfg),
      estimator(toSpeedEstimatorConfig(cfg)),
      pid(toPidConfig(cfg)),
      mapper(toMapperConfig(cfg)),
      supervisor(toSupervisorConfig(cfg)) {}

RegulatorOutputs SpeedRegulator::step(const RegulatorInputs& inputs) {
    const int32_t count = decoder.getCount();
    const bool motionObserved = decoder.consumeActivity();
    Encoder::SpeedSample sample = estimator.update(count);

    const SupervisorEvent event = supervisor.beginPeriod(inputs.enable, sample.speedRpm);
    if (event == SupervisorEvent::STARTED) {
        estimator.reset();
        sample = estimator.getLastSample();
        positionBaseline = count;
        ESP_LOGI(TAG, "enabled, setpoint %ld, count %ld", static_cast<long>(inputs.setpoint),
                 static_cast<long>(count));
    }

    const bool running = (supervisor.getState() == SupervisorState::RUNNING);

    int32_t feedback = sample.speedRpm;
    if (config.mode == ControlMode::POSITION) {
        feedback = Encoder::QuadratureDecoder::countDelta(count, positionBaseline);
    }

    // One call per control period, so every call is a period boundary.
    const int32_t effort = pid.update(running, true, inputs.setpoint, feedback);

    ActuationCommand mapped;
    if (running) {
        mapped = mapper.map(effort);
        supervisor.checkStall(mapped.magnitude, sample.speedRpm, motionObserved, count);
    }

    const ActuationCommand command = supervisor.resolve(mapped);

    const PID::PidState& pidState = pid.getState();
    status.state = supervisor.getState();
    status.faultReason = supervisor.getFaultReason();
    status.faultLatched = supervisor.isFaultLatched();
    status.measuredSpeedRpm = sample.speedRpm;
    status.speedValid = sample.valid;
    status.encoderCount = count;
    status.countDelta = sample.countDelta;
    status.error = pidState.error;
    status.integral = pidState.integral;
    status.effort = pidState.output;
    status.antiWindupActive = pidState.antiWindupActive;
    status.command = command;
    status.stallCount = supervisor.getStallCount();
    status.invalidTransitions = decoder.getInvalidTransitions();
    status.implausibleWindows = estimator.getImplausibleWindows();
    status.periods++;

    RegulatorOutputs outputs;
    outputs.command = command;
    outputs.measuredSpeedRpm = sample.speedRpm;
    outputs.faultLatched = status.faultLatched;
    outputs.encoderCount = count;
    return outputs;
}

RegulatorStatus SpeedRegulator::getStatus() const { return status; }

const RegulatorConfig& SpeedRegulator::getConfig() const { return config; }

}  // namespace DC_Speed_Regulator_Firmware::Control
