#include "Encoder.hpp"

#include "esp_log.h"

namespace DC_Speed_Regulator_Firmware {
namespace Encoder {

Encoder::Encoder(const EncoderConfig& config, QuadratureDecoder& decoder) : config(config), decoder(decoder) {}

Encoder::~Encoder() { releaseIsr(); }

esp_err_t Encoder::init() {
    esp_err_t returnValue = initGpio();

    if (returnValue != ESP_OK) {
        ESP_LOGW(TAG, "Encoder init - Error to configure phase GPIOs");
        return returnValue;
    }

    decoder.prime(gpio_get_level(config.pinA) != 0, gpio_get_level(config.pinB) != 0);

    returnValue = initIsr();

    if (returnValue != ESP_OK) {
        ESP_LOGW(TAG, "Encoder init - Error to attach edge ISR");
        return returnValue;
    }

    ESP_LOGI(TAG, "Encoder ready (A=%d, B=%d, sign=%ld)", config.pinA, config.pinB,
             static_cast<long>(decoder.getDirectionSign()));
    return ESP_OK;
}

const QuadratureDecoder& Encoder::getDecoder() const noexcept { return decoder; }

esp_err_t Encoder::initGpio() {
    gpio_config_t ioConf = {};
    ioConf.intr_type = GPIO_INTR_ANYEDGE;
    ioConf.mode = GPIO_MODE_INPUT;
    ioConf.pin_bit_mask = (1ULL << config.pinA) | (1ULL << config.pinB);
    ioConf.pull_up_en = config.openCollectorInputs ? GPIO_PULLUP_ENABLE : GPIO_PULLUP_DISABLE;
    ioConf.pull_down_en = GPIO_PULLDOWN_DISABLE;

    esp_err_t ret = gpio_config(&ioConf);
    if (ret != ESP_OK) {
        ESP_LOGE(TAG, "gpio_config(A/B) failed: %s", esp_err_to_name(ret));
        return ret;
    }

    return ESP_OK;
}

esp_err_t Encoder::initIsr() {
    esp_err_t ret = gpio_install_isr_service(0);
    if (ret == ESP_ERR_INVALID_STATE) {
        ESP_LOGW(TAG, "ISR service already installed");
        ret = ESP_OK;
    }
    if (ret != ESP_OK) {
        ESP_LOGE(TAG, "gpio_install_isr_service failed: %s", esp_err_to_name(ret));
        return ret;
    }

    ret = gpio_isr_handler_add(config.pinA, edgeIsr, this);
    if (ret != ESP_OK) {
        ESP_LOGE(TAG, "gpio_isr_handler_add(A) failed: %s", esp_err_to_name(ret));
        return ret;
    }

    ret = gpio_isr_handler_add(config.pinB, edgeIsr, this);
    if (ret != ESP_OK) {
        ESP_LOGE(TAG, "gpio_isr_handler_add(B) failed: %s", esp_err_to_name(ret));
        if (gpio_isr_handler_remove(config.pinA) != ESP_OK) {
            ESP_LOGW(TAG, "gpio_isr_handler_remove(A) failed");
        }
        return ret;
    }

    isrAttached = true;
    return ESP_OK;
}

void Encoder::releaseIsr() {
    if (!isrAttached) {
        return;
    }

    esp_err_t ret = gpio_isr_handler_remove(config.pinA);
    if (ret != ESP_OK) {
        ESP_LOGW(TAG, "gpio_isr_handler_remove(A) failed: %s", esp_err_to_name(ret));
    }
    ret = gpio_isr_handler_remove(config.pinB);
    if (ret != ESP_OK) {
        ESP_LOGW(TAG, "gpio_isr_handler_remove(B) failed: %s", esp_err_to_name(ret));
    }
    isrAttached = false;
}

void IRAM_ATTR Encoder::edgeIsr(void* arg) {
    auto* self = static_cast<Encoder*>(arg);
    const bool phaseA = gpio_get_level(self->config.pinA) != 0;
    const bool phaseB = gpio_get_level(self->config.pinB) != 0;
    self->decoder.onSample(phaseA, phaseB);
}

}  // namespace Encoder
}  // namespace DC_Speed_Regulator_Firmware
