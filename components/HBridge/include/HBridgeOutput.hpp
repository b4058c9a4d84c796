/**
 * @file HBridgeOutput.hpp
 * @brief PH/EN H-bridge output stage (DRV8876 style) driven by LEDC PWM.
 *
 * EN carries the PWM, PH selects direction and nSLEEP gates the bridge:
 * - drive: nSLEEP high, PH = direction, EN duty = magnitude
 * - brake: nSLEEP high, EN low (low-side slow decay)
 * - coast: EN low, nSLEEP low (outputs Hi-Z)
 */

#pragma once

#include "IActuationOutput.hpp"
#include "driver/gpio.h"
#include "driver/ledc.h"
#include "esp_err.h"
#include <cstdint>

namespace DC_Speed_Regulator_Firmware {
namespace HBridge {

/**
 * @struct HBridgeConfig
 * @brief Pins and PWM parameters of the bridge.
 */
struct HBridgeConfig {
    gpio_num_t enPin = GPIO_NUM_NC;                   ///< EN / PWM pin
    gpio_num_t phPin = GPIO_NUM_NC;                   ///< PH / direction pin
    gpio_num_t nSleepPin = GPIO_NUM_NC;               ///< nSLEEP pin (NC = always awake)
    ledc_channel_t channel = LEDC_CHANNEL_0;          ///< LEDC channel
    ledc_timer_t timer = LEDC_TIMER_0;                ///< LEDC timer
    ledc_timer_bit_t resolution = LEDC_TIMER_10_BIT;  ///< PWM resolution
    uint32_t frequencyHz = 20000;                     ///< PWM frequency
    uint32_t dutyMax = 1000;                          ///< Command magnitude at 100 % duty
    bool invertDirection = false;                     ///< Swap PH polarity
};

/**
 * @class HBridgeOutput
 * @brief Applies ActuationCommand to a PH/EN H-bridge.
 *
 * apply() is called from the control task once per period and skips all peripheral
 * writes when the command did not change.
 */
class HBridgeOutput : public IActuationOutput {
  public:
    explicit HBridgeOutput(const HBridgeConfig& cfg);
    ~HBridgeOutput() override;

    HBridgeOutput(const HBridgeOutput&) = delete;
    HBridgeOutput& operator=(const HBridgeOutput&) = delete;

    /**
     * @brief Configure LEDC timer/channel and the PH / nSLEEP outputs.
     * @return ESP_OK, or the failing driver call's error.
     */
    esp_err_t init() override;

    /**
     * @brief Drive, brake or coast according to the command.
     * @return ESP_OK, ESP_ERR_INVALID_STATE before init(), or the driver error.
     */
    esp_err_t apply(const ActuationCommand& command) override;

    /**
     * @brief Coast: EN low and bridge asleep.
     */
    esp_err_t disable() override;

    /**
     * @brief Scale a command magnitude to LEDC ticks.
     * @param magnitude Duty in [0, dutyMax]
     * @return Ticks in [0, 2^resolution - 1]
     */
    uint32_t magnitudeToTicks(uint32_t magnitude) const;

    /** @brief Last command written to the hardware. */
    ActuationCommand getLastCommand() const;

    HBridgeConfig getConfig() const;

  private:
    esp_err_t setDutyTicks(uint32_t ticks);
    esp_err_t setAwake(bool awake);
    void reportFailure(const char* what, esp_err_t err);

    HBridgeConfig config;             ///< Pins and PWM parameters
    uint32_t maxTicks = 0;            ///< 2^resolution - 1
    ActuationCommand lastCommand;     ///< Last applied command
    bool hasLastCommand = false;      ///< lastCommand is valid
    bool initialized = false;         ///< init() succeeded
    esp_err_t lastError = ESP_OK;     ///< Last reported failure (log dedupe)

    static constexpr const char* TAG = "HBridgeOutput";
};

}  // namespace HBridge
}  // namespace DC_Speed_Regulator_Firmware
