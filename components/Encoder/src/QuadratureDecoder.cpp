#include "QuadratureDecoder.hpp"

namespace DC_Speed_Regulator_Firmware {
namespace Encoder {

// States: 0=00, 1=01, 2=10, 3=11 (A high bit). Diagonal = no change,
// anti-diagonal pairs (0<->3, 1<->2) = both phases moved.
const int8_t QuadratureDecoder::TRANSITION_TABLE[4][4] = {
    {0, -1, 1, 0},
    {1, 0, 0, -1},
    {-1, 0, 0, 1},
    {0, 1, -1, 0},
};

QuadratureDecoder::QuadratureDecoder(bool inverted) noexcept : directionSign(inverted ? -1 : 1) {}

void QuadratureDecoder::prime(bool phaseA, bool phaseB) noexcept {
    previousState = encodeState(phaseA, phaseB);
}

EdgeResult QuadratureDecoder::onSample(bool phaseA, bool phaseB) noexcept {
    const uint8_t currentState = encodeState(phaseA, phaseB);
    if (currentState == previousState) {
        return EdgeResult::NONE;
    }

    const int8_t step = TRANSITION_TABLE[previousState][currentState];
    previousState = currentState;

    if (step == 0) {
        invalidTransitions.fetch_add(1u, std::memory_order_relaxed);
        return EdgeResult::INVALID;
    }

    // Atomic signed arithmetic is two's complement; the count wraps, never traps.
    count.fetch_add(static_cast<int32_t>(step) * directionSign, std::memory_order_relaxed);
    activity.store(true, std::memory_order_relaxed);

    return (step > 0) ? EdgeResult::FORWARD : EdgeResult::REVERSE;
}

int32_t QuadratureDecoder::getCount() const noexcept {
    return count.load(std::memory_order_relaxed);
}

bool QuadratureDecoder::consumeActivity() noexcept {
    return activity.exchange(false, std::memory_order_relaxed);
}

uint32_t QuadratureDecoder::getInvalidTransitions() const noexcept {
    return invalidTransitions.load(std::memory_order_relaxed);
}

int32_t QuadratureDecoder::getDirectionSign() const noexcept {
    return directionSign;
}

int32_t QuadratureDecoder::countDelta(int32_t now, int32_t before) noexcept {
    const uint32_t diff = static_cast<uint32_t>(now) - static_cast<uint32_t>(before);
    return static_cast<int32_t>(diff);
}

}  // namespace Encoder
}  // namespace DC_Speed_Regulator_Firmware
