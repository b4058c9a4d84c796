/**
 * @file FixedPoint.hpp
 * @brief Scaled-integer arithmetic used by the control law.
 *
 * Gains are stored as signed 32-bit integers scaled by 2^fracBits (Q format with a
 * run-time fractional width). Signals (speed, position, error, effort) are plain
 * integers in engineering units. Every operation widens to 64 bits, truncates toward
 * zero and saturates to the 32-bit range, so results never wrap and are reproducible
 * bit-for-bit on any target.
 */

#pragma once

#include <cstdint>
#include <limits>

namespace DC_Speed_Regulator_Firmware::FixedPoint {

/// Largest fractional width accepted by the helpers below.
static constexpr uint8_t MAX_FRACTIONAL_BITS = 30;

/**
 * @brief Saturate a 64-bit intermediate to the int32_t range.
 * @param value Wide intermediate result.
 * @return value clamped to [INT32_MIN, INT32_MAX].
 */
constexpr int32_t saturate(int64_t value) noexcept {
    if (value > std::numeric_limits<int32_t>::max()) {
        return std::numeric_limits<int32_t>::max();
    }
    if (value < std::numeric_limits<int32_t>::min()) {
        return std::numeric_limits<int32_t>::min();
    }
    return static_cast<int32_t>(value);
}

/**
 * @brief Clamp a 64-bit intermediate to an arbitrary [low, high] window.
 * @param value Wide intermediate result.
 * @param low Lower bound (inclusive).
 * @param high Upper bound (inclusive), must be >= low.
 * @return Clamped value.
 */
constexpr int32_t clamp(int64_t value, int32_t low, int32_t high) noexcept {
    if (value < low) {
        return low;
    }
    if (value > high) {
        return high;
    }
    return static_cast<int32_t>(value);
}

/**
 * @brief Convert a real-valued gain into its raw scaled representation.
 *
 * Intended for compile-time constants (board settings, tests). Rounds to nearest.
 *
 * @param gain Real gain, e.g. 0.25.
 * @param fracBits Fractional width (0..MAX_FRACTIONAL_BITS).
 * @return Raw scaled gain, saturated to int32_t.
 */
constexpr int32_t toFixed(double gain, uint8_t fracBits) noexcept {
    const double scaled = gain * static_cast<double>(int64_t{1} << fracBits);
    const double rounded = (scaled >= 0.0) ? (scaled + 0.5) : (scaled - 0.5);
    if (rounded >= static_cast<double>(std::numeric_limits<int32_t>::max())) {
        return std::numeric_limits<int32_t>::max();
    }
    if (rounded <= static_cast<double>(std::numeric_limits<int32_t>::min())) {
        return std::numeric_limits<int32_t>::min();
    }
    return static_cast<int32_t>(rounded);
}

/**
 * @brief Multiply a signal by a scaled gain.
 *
 * Computes (value * gain) / 2^fracBits with truncation toward zero, so
 * multiply(-x, g) == -multiply(x, g) for every x that is not INT32_MIN.
 *
 * @param value Signal in engineering units.
 * @param gain Raw scaled gain.
 * @param fracBits Fractional width of gain.
 * @return Saturated product.
 */
int32_t multiply(int32_t value, int32_t gain, uint8_t fracBits) noexcept;

/**
 * @brief Saturating addition of two signals.
 */
int32_t add(int32_t a, int32_t b) noexcept;

/**
 * @brief Saturating subtraction a - b.
 */
int32_t subtract(int32_t a, int32_t b) noexcept;

/**
 * @brief Saturating absolute value (|INT32_MIN| becomes INT32_MAX).
 */
uint32_t magnitude(int32_t value) noexcept;

}  // namespace DC_Speed_Regulator_Firmware::FixedPoint
