/**
 * @file QuadratureDecoder.hpp
 * @brief Edge-driven quadrature decoder with a lock-free position counter.
 *
 * The decoder is fed already-debounced A/B levels from the edge handler (ISR) and
 * keeps a signed running count. The count is a single std::atomic so the periodic
 * control task can snapshot it with one load while the ISR keeps counting.
 */

#pragma once

#include <atomic>
#include <cstdint>

namespace DC_Speed_Regulator_Firmware {
namespace Encoder {

/**
 * @enum EdgeResult
 * @brief Classification of one A/B sample against the previous one.
 */
enum class EdgeResult : uint8_t {
    NONE,     ///< No phase changed
    FORWARD,  ///< One step in the forward direction
    REVERSE,  ///< One step in the reverse direction
    INVALID   ///< Both phases changed at once; discarded as noise
};

/**
 * @class QuadratureDecoder
 * @brief Converts two-phase transitions into a signed step count.
 *
 * @details
 * - Forward sequence is 00 -> 10 -> 11 -> 01 -> 00 (A leads B).
 * - Each valid transition changes the count by exactly +/-1, multiplied by the
 *   configured direction sign so that "commanded forward" always counts up.
 * - The count wraps modulo 2^32. Consumers must take differences with
 *   @ref countDelta, never compare absolute values across a wrap.
 *
 * Ownership: @ref onSample is the only writer and must be called from a single
 * context (the encoder ISR). All getters are safe from any task.
 */
class QuadratureDecoder {
  public:
    /**
     * @brief Construct a decoder.
     * @param inverted true if the motor wiring makes forward rotation count down.
     */
    explicit QuadratureDecoder(bool inverted = false) noexcept;

    QuadratureDecoder(const QuadratureDecoder&) = delete;
    QuadratureDecoder& operator=(const QuadratureDecoder&) = delete;

    /**
     * @brief Seed the previous phase sample without counting.
     *
     * Call once after the phase GPIOs are configured and before interrupts are
     * enabled.
     *
     * @param phaseA Current level of channel A.
     * @param phaseB Current level of channel B.
     */
    void prime(bool phaseA, bool phaseB) noexcept;

    /**
     * @brief Process one A/B sample (edge handler entry point).
     * @param phaseA Level of channel A.
     * @param phaseB Level of channel B.
     * @return Classification of the transition.
     */
    EdgeResult onSample(bool phaseA, bool phaseB) noexcept;

    /**
     * @brief Atomic snapshot of the running count.
     * @return Signed step count (wraps modulo 2^32).
     */
    int32_t getCount() const noexcept;

    /**
     * @brief Read and clear the edge-activity flag.
     * @return true if at least one valid step was decoded since the last call.
     */
    bool consumeActivity() noexcept;

    /**
     * @brief Number of discarded dual-phase transitions since construction.
     */
    uint32_t getInvalidTransitions() const noexcept;

    /**
     * @brief Direction sign applied to every step.
     * @return +1 or -1.
     */
    int32_t getDirectionSign() const noexcept;

    /**
     * @brief Signed distance between two counts, correct across a wrap.
     * @param now Later count.
     * @param before Earlier count.
     * @return now - before computed modulo 2^32.
     */
    static int32_t countDelta(int32_t now, int32_t before) noexcept;

  private:
    /**
     * @brief Encode A/B levels as a 2-bit state (A is the high bit).
     */
    static inline uint8_t encodeState(bool phaseA, bool phaseB) noexcept {
        return static_cast<uint8_t>((phaseA ? 0x2u : 0x0u) | (phaseB ? 0x1u : 0x0u));
    }

    /// [previous][current] -> step; 0 for no change or a dual-phase jump.
    static const int8_t TRANSITION_TABLE[4][4];

    const int32_t directionSign;                  ///< +1 normal wiring, -1 inverted
    uint8_t previousState = 0;                    ///< Last A/B state, ISR-owned
    std::atomic<int32_t> count{0};                ///< Running signed step count
    std::atomic<bool> activity{false};            ///< Set on every valid step
    std::atomic<uint32_t> invalidTransitions{0};  ///< Discarded dual-phase samples
};

}  // namespace Encoder
}  // namespace DC_Speed_Regulator_Firmware
