#include "FixedPoint.hpp"

namespace DC_Speed_Regulator_Firmware::FixedPoint {

int32_t multiply(int32_t value, int32_t gain, uint8_t fracBits) noexcept {
    if (fracBits > MAX_FRACTIONAL_BITS) {
        fracBits = MAX_FRACTIONAL_BITS;
    }

    const int64_t product = static_cast<int64_t>(value) * static_cast<int64_t>(gain);

    // Shift the magnitude so negative products truncate toward zero as well.
    int64_t scaled;
    if (product < 0) {
        scaled = -((-product) >> fracBits);
    } else {
        scaled = product >> fracBits;
    }

    return saturate(scaled);
}

int32_t add(int32_t a, int32_t b) noexcept {
    return saturate(static_cast<int64_t>(a) + static_cast<int64_t>(b));
}

int32_t subtract(int32_t a, int32_t b) noexcept {
    return saturate(static_cast<int64_t>(a) - static_cast<int64_t>(b));
}

uint32_t magnitude(int32_t value) noexcept {
    const int64_t wide = static_cast<int64_t>(value);
    const int64_t absValue = (wide < 0) ? -wide : wide;
    if (absValue > std::numeric_limits<int32_t>::max()) {
        return static_cast<uint32_t>(std::numeric_limits<int32_t>::max());
    }
    return static_cast<uint32_t>(absValue);
}

}  // namespace DC_Speed_Regulator_Firmware::FixedPoint
