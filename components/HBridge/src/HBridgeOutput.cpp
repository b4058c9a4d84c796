#include "HBridgeOutput.hpp"
#include "esp_log.h"
#include <inttypes.h>

namespace DC_Speed_Regulator_Firmware {
namespace HBridge {

HBridgeOutput::HBridgeOutput(const HBridgeConfig& cfg) : config(cfg) {
    if (config.dutyMax == 0) {
        config.dutyMax = 1;
    }
}

HBridgeOutput::~HBridgeOutput() {
    if (initialized) {
        disable();
    }
}

esp_err_t HBridgeOutput::init() {
    ledc_timer_config_t timer = {};
    timer.speed_mode = LEDC_LOW_SPEED_MODE;
    timer.duty_resolution = config.resolution;
    timer.timer_num = config.timer;
    timer.freq_hz = config.frequencyHz;
    timer.clk_cfg = LEDC_AUTO_CLK;
    esp_err_t ret = ledc_timer_config(&timer);
    if (ret != ESP_OK) {
        ESP_LOGE(TAG, "ledc_timer_config failed: %s", esp_err_to_name(ret));
        return ret;
    }

    ledc_channel_config_t channelConf = {};
    channelConf.gpio_num = config.enPin;
    channelConf.speed_mode = LEDC_LOW_SPEED_MODE;
    channelConf.channel = config.channel;
    channelConf.timer_sel = config.timer;
    channelConf.duty = 0;
    channelConf.hpoint = 0;
    channelConf.flags.output_invert = false;
    ret = ledc_channel_config(&channelConf);
    if (ret != ESP_OK) {
        ESP_LOGE(TAG, "ledc_channel_config failed: %s", esp_err_to_name(ret));
        return ret;
    }

    gpio_config_t ioConf = {};
    ioConf.intr_type = GPIO_INTR_DISABLE;
    ioConf.mode = GPIO_MODE_OUTPUT;
    ioConf.pin_bit_mask = (1ULL << config.phPin);
    ret = gpio_config(&ioConf);
    if (ret != ESP_OK) {
        ESP_LOGE(TAG, "gpio_config(PH) failed: %s", esp_err_to_name(ret));
        return ret;
    }

    if (config.nSleepPin != GPIO_NUM_NC) {
        ioConf.pin_bit_mask = (1ULL << config.nSleepPin);
        ret = gpio_config(&ioConf);
        if (ret != ESP_OK) {
            ESP_LOGE(TAG, "gpio_config(nSLEEP) failed: %s", esp_err_to_name(ret));
            return ret;
        }
    }

    maxTicks = (1u << config.resolution) - 1u;
    initialized = true;
    hasLastCommand = false;

    ESP_LOGI(TAG, "EN=%d PH=%d nSLEEP=%d, %" PRIu32 " Hz, %" PRIu32 " ticks", config.enPin, config.phPin,
             config.nSleepPin, config.frequencyHz, maxTicks);

    return disable();
}

esp_err_t HBridgeOutput::apply(const ActuationCommand& command) {
    if (!initialized) {
        return ESP_ERR_INVALID_STATE;
    }

    if (hasLastCommand && command == lastCommand) {
        return ESP_OK;
    }

    esp_err_t ret = ESP_OK;
    if (command.brake) {
        ret = setDutyTicks(0);
        if (ret == ESP_OK) {
            ret = setAwake(true);
        }
    } else if (command.magnitude == 0) {
        ret = setDutyTicks(0);
        if (ret == ESP_OK) {
            ret = setAwake(false);
        }
    } else {
        bool phLevel = (command.direction == MotorDirection::FORWARD);
        if (config.invertDirection) {
            phLevel = !phLevel;
        }
        ret = gpio_set_level(config.phPin, phLevel ? 1 : 0);
        if (ret == ESP_OK) {
            ret = setAwake(true);
        }
        if (ret == ESP_OK) {
            ret = setDutyTicks(magnitudeToTicks(command.magnitude));
        }
    }

    if (ret != ESP_OK) {
        reportFailure("apply", ret);
        hasLastCommand = false;
        return ret;
    }

    lastError = ESP_OK;
    lastCommand = command;
    hasLastCommand = true;
    return ESP_OK;
}

esp_err_t HBridgeOutput::disable() {
    if (!initialized) {
        return ESP_ERR_INVALID_STATE;
    }

    esp_err_t ret = setDutyTicks(0);
    if (ret == ESP_OK) {
        ret = setAwake(false);
    }
    if (ret != ESP_OK) {
        reportFailure("disable", ret);
        hasLastCommand = false;
        return ret;
    }

    lastCommand = ActuationCommand{};
    hasLastCommand = true;
    return ESP_OK;
}

uint32_t HBridgeOutput::magnitudeToTicks(uint32_t magnitude) const {
    if (magnitude >= config.dutyMax) {
        return maxTicks;
    }
    return static_cast<uint32_t>((static_cast<uint64_t>(magnitude) * maxTicks) / config.dutyMax);
}

ActuationCommand HBridgeOutput::getLastCommand() const { return lastCommand; }

HBridgeConfig HBridgeOutput::getConfig() const { return config; }

esp_err_t HBridgeOutput::setDutyTicks(uint32_t ticks) {
    if (ticks > maxTicks) {
        ticks = maxTicks;
    }

    esp_err_t ret = ledc_set_duty(LEDC_LOW_SPEED_MODE, config.channel, ticks);
    if (ret == ESP_OK) {
        ret = ledc_update_duty(LEDC_LOW_SPEED_MODE, config.channel);
    }
    return ret;
}

esp_err_t HBridgeOutput::setAwake(bool awake) {
    if (config.nSleepPin == GPIO_NUM_NC) {
        return ESP_OK;
    }
    return gpio_set_level(config.nSleepPin, awake ? 1 : 0);
}

void HBridgeOutput::reportFailure(const char* what, esp_err_t err) {
    if (err != lastError) {
        ESP_LOGE(TAG, "%s failed: %s", what, esp_err_to_name(err));
    }
    lastError = err;
}

}  // namespace HBridge
}  // namespace DC_Speed_Regulator_Firmware
