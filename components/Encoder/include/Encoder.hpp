/**
 * @file Encoder.hpp
 * @brief GPIO edge-interrupt front end feeding the quadrature decoder on ESP32.
 *
 * Both phase pins are configured for any-edge interrupts. The ISR samples the two
 * levels and hands them to @ref QuadratureDecoder::onSample; all counting logic
 * lives in the decoder so it can be tested off target.
 */

#pragma once

#include "driver/gpio.h"
#include "esp_attr.h"
#include "esp_err.h"

#include "QuadratureDecoder.hpp"

namespace DC_Speed_Regulator_Firmware {
namespace Encoder {

/**
 * @struct EncoderConfig
 * @brief Pin assignment for the A/B channels.
 *
 * @details
 * The signals are expected to be debounced already (RC filter or encoder-side
 * Schmitt trigger). `openCollectorInputs` enables the internal pull-ups.
 */
struct EncoderConfig {
    gpio_num_t pinA;           ///< Quadrature channel A GPIO
    gpio_num_t pinB;           ///< Quadrature channel B GPIO
    bool openCollectorInputs;  ///< true if inputs require pull-ups
};

/**
 * @class Encoder
 * @brief Binds two GPIO interrupts to a QuadratureDecoder.
 *
 * Not copyable or movable: the ISR keeps a pointer to this instance.
 */
class Encoder {
  public:
    /**
     * @brief Construct an Encoder front end.
     * @param config Pin configuration.
     * @param decoder Decoder that receives every sampled edge.
     */
    Encoder(const EncoderConfig& config, QuadratureDecoder& decoder);

    /**
     * @brief Destructor. Detaches the ISR handlers if attached.
     */
    ~Encoder();

    Encoder(const Encoder&) = delete;
    Encoder& operator=(const Encoder&) = delete;
    Encoder(Encoder&&) = delete;
    Encoder& operator=(Encoder&&) = delete;

    /**
     * @brief Configure GPIOs, prime the decoder and attach the edge ISR.
     * @return ESP_OK on success or esp_err_t on failure.
     */
    esp_err_t init();

    /**
     * @brief Read-only access to the decoder (for diagnostics).
     */
    const QuadratureDecoder& getDecoder() const noexcept;

  private:
    /**
     * @brief Configure both pins as inputs with any-edge interrupts.
     */
    esp_err_t initGpio();

    /**
     * @brief Install the shared GPIO ISR service and add handlers for A and B.
     */
    esp_err_t initIsr();

    /**
     * @brief Remove the per-pin ISR handlers.
     */
    void releaseIsr();

    /**
     * @brief Edge ISR shared by both channels.
     * @param arg Encoder* instance.
     */
    static void IRAM_ATTR edgeIsr(void* arg);

    EncoderConfig config;        ///< Pin configuration
    QuadratureDecoder& decoder;  ///< Edge consumer
    bool isrAttached = false;    ///< True once handlers are added

    static constexpr const char* TAG = "Encoder";
};

}  // namespace Encoder
}  // namespace DC_Speed_Regulator_Firmware
