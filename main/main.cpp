/**
 * @file main.cpp
 * @brief Entry point for the DC speed regulator firmware.
 *
 * Wires the regulator chain to the hardware and starts the tasks:
 * - GPIO quadrature encoder input (ISR feeds the decoder)
 * - PH/EN H-bridge output
 * - Fixed-rate control task running SpeedRegulator::step()
 * - Low-rate status task logging the latest RegulatorStatus
 */

#include "CommandInput.hpp"
#include "ControlTask.hpp"
#include "Encoder.hpp"
#include "HBridgeOutput.hpp"
#include "QuadratureDecoder.hpp"
#include "RegulatorConfig.hpp"
#include "RegulatorSettings.hpp"
#include "SpeedRegulator.hpp"
#include "esp_log.h"
#include "freertos/FreeRTOS.h"
#include "freertos/semphr.h"
#include "freertos/task.h"
#include <atomic>

using namespace DC_Speed_Regulator_Firmware;
using namespace DC_Speed_Regulator_Firmware::Control;
using DC_Speed_Regulator_Firmware::HBridge::HBridgeOutput;

static constexpr const char* TAG = "MAIN APP";

static const RegulatorConfig regulatorConfig = loadRegulatorConfig(Settings::defaultRegulatorConfig());

static Encoder::QuadratureDecoder decoder(regulatorConfig.encoderInverted);
static Encoder::Encoder encoder(Settings::encoderConfig(), decoder);
static HBridgeOutput bridge(Settings::hBridgeConfig());
static SpeedRegulator regulator(decoder, regulatorConfig);
static CommandInput commandInput;
static ControlTask controlTask(Settings::controlTaskConfig(regulatorConfig.controlPeriodUs));

static SemaphoreHandle_t statusMutex = nullptr;
static RegulatorStatus statusMailbox;
static std::atomic<uint32_t> outputErrors{0};

static void controlUpdate() {
    const RegulatorOutputs outputs = regulator.step(commandInput.sample());

    if (bridge.apply(outputs.command) != ESP_OK) {
        outputErrors++;
    }

    if (xSemaphoreTake(statusMutex, 0) == pdTRUE) {
        statusMailbox = regulator.getStatus();
        xSemaphoreGive(statusMutex);
    }
}

static void statusTask(void*) {
    RegulatorStatus status;
    for (;;) {
        vTaskDelay(pdMS_TO_TICKS(Settings::STATUS_LOG_PERIOD_MS));

        if (xSemaphoreTake(statusMutex, pdMS_TO_TICKS(10)) != pdTRUE) {
            continue;
        }
        status = statusMailbox;
        xSemaphoreGive(statusMutex);

        ESP_LOGI(TAG, "%s | speed=%ld rpm count=%ld err=%ld int=%ld eff=%ld%s | duty=%lu %s%s",
                 Supervisor::stateName(status.state), static_cast<long>(status.measuredSpeedRpm),
                 static_cast<long>(status.encoderCount), static_cast<long>(status.error),
                 static_cast<long>(status.integral), static_cast<long>(status.effort),
                 status.antiWindupActive ? " (sat)" : "", static_cast<unsigned long>(status.command.magnitude),
                 status.command.direction == MotorDirection::FORWARD ? "FWD" : "REV",
                 status.command.brake ? " BRAKE" : "");

        if (status.faultLatched) {
            ESP_LOGW(TAG, "fault latched (%s), disable to clear",
                     status.faultReason == FaultReason::STALL ? "stall" : "none");
        }
        if (status.invalidTransitions > 0 || status.implausibleWindows > 0 || outputErrors.load() > 0) {
            ESP_LOGD(TAG, "invalid edges=%lu implausible windows=%lu output errors=%lu overruns=%lu",
                     static_cast<unsigned long>(status.invalidTransitions),
                     static_cast<unsigned long>(status.implausibleWindows),
                     static_cast<unsigned long>(outputErrors.load()),
                     static_cast<unsigned long>(controlTask.getOverrunCount()));
        }
    }
}

extern "C" void app_main() {
    logRegulatorConfig(regulatorConfig);

    statusMutex = xSemaphoreCreateMutex();
    if (statusMutex == nullptr) {
        ESP_LOGE(TAG, "Failed to create status mutex");
        return;
    }

    esp_err_t err = bridge.init();
    if (err != ESP_OK) {
        ESP_LOGE(TAG, "H-bridge init failed: %s", esp_err_to_name(err));
        return;
    }

    err = encoder.init();
    if (err != ESP_OK) {
        ESP_LOGE(TAG, "Encoder init failed: %s", esp_err_to_name(err));
        return;
    }

    commandInput.setSetpoint(Settings::DEFAULT_SETPOINT_RPM);
    commandInput.setEnable(Settings::ENABLE_AT_BOOT);

    controlTask.setUpdateCallback(controlUpdate);
    err = controlTask.start();
    if (err != ESP_OK) {
        ESP_LOGE(TAG, "Control task start failed: %s", esp_err_to_name(err));
        if (bridge.disable() != ESP_OK) {
            ESP_LOGE(TAG, "H-bridge disable failed");
        }
        return;
    }

    if (xTaskCreate(statusTask, "StatusTask", 3072, nullptr, 2, nullptr) != pdPASS) {
        ESP_LOGW(TAG, "Status task not started");
    }

    ESP_LOGI(TAG, "Regulator running");
}
