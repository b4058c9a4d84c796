#include "FixedPoint.hpp"
#include <gtest/gtest.h>
#include <limits>

using namespace DC_Speed_Regulator_Firmware;

static constexpr int32_t INT32_HI = std::numeric_limits<int32_t>::max();
static constexpr int32_t INT32_LO = std::numeric_limits<int32_t>::min();

TEST(FixedPoint, ToFixedScalesAndRounds) {
    EXPECT_EQ(FixedPoint::toFixed(1.0, 8), 256);
    EXPECT_EQ(FixedPoint::toFixed(0.5, 8), 128);
    EXPECT_EQ(FixedPoint::toFixed(-0.25, 8), -64);
    EXPECT_EQ(FixedPoint::toFixed(0.002, 8), 1);  // 0.512 rounds up
    EXPECT_EQ(FixedPoint::toFixed(1.0, 0), 1);
    static_assert(FixedPoint::toFixed(2.0, 4) == 32, "usable at compile time");
}

TEST(FixedPoint, ToFixedSaturates) {
    EXPECT_EQ(FixedPoint::toFixed(1e12, 8), INT32_HI);
    EXPECT_EQ(FixedPoint::toFixed(-1e12, 8), INT32_LO);
}

TEST(FixedPoint, MultiplyByUnityGainIsIdentity) {
    const int32_t one = FixedPoint::toFixed(1.0, 8);
    EXPECT_EQ(FixedPoint::multiply(1000, one, 8), 1000);
    EXPECT_EQ(FixedPoint::multiply(-1000, one, 8), -1000);
    EXPECT_EQ(FixedPoint::multiply(0, one, 8), 0);
}

TEST(FixedPoint, MultiplyTruncatesTowardZero) {
    // 3 * 0.5 = 1.5
    EXPECT_EQ(FixedPoint::multiply(3, 128, 8), 1);
    EXPECT_EQ(FixedPoint::multiply(-3, 128, 8), -1);
    // 1 * (1/256)
    EXPECT_EQ(FixedPoint::multiply(1, 1, 8), 0);
    EXPECT_EQ(FixedPoint::multiply(-1, 1, 8), 0);
}

TEST(FixedPoint, MultiplyIsOddSymmetric) {
    for (int32_t value : {1, 7, 255, 1000, 123456}) {
        for (int32_t gain : {1, 3, 100, 4097}) {
            EXPECT_EQ(FixedPoint::multiply(-value, gain, 8), -FixedPoint::multiply(value, gain, 8))
                << "value=" << value << " gain=" << gain;
        }
    }
}

TEST(FixedPoint, MultiplySaturatesInsteadOfWrapping) {
    EXPECT_EQ(FixedPoint::multiply(INT32_HI, INT32_HI, 0), INT32_HI);
    EXPECT_EQ(FixedPoint::multiply(INT32_HI, -INT32_HI, 0), INT32_LO);
    EXPECT_EQ(FixedPoint::multiply(INT32_LO, 2 << 8, 8), INT32_LO);
}

TEST(FixedPoint, FractionalBitsAreCapped) {
    // fracBits above the cap behave like MAX_FRACTIONAL_BITS
    EXPECT_EQ(FixedPoint::multiply(1 << 30, 1, 40), FixedPoint::multiply(1 << 30, 1, FixedPoint::MAX_FRACTIONAL_BITS));
    EXPECT_EQ(FixedPoint::multiply(1 << 30, 1, FixedPoint::MAX_FRACTIONAL_BITS), 1);
}

TEST(FixedPoint, AddAndSubtractSaturate) {
    EXPECT_EQ(FixedPoint::add(INT32_HI, 1), INT32_HI);
    EXPECT_EQ(FixedPoint::add(INT32_LO, -1), INT32_LO);
    EXPECT_EQ(FixedPoint::subtract(INT32_LO, 1), INT32_LO);
    EXPECT_EQ(FixedPoint::subtract(0, INT32_LO), INT32_HI);
    EXPECT_EQ(FixedPoint::add(-5, 3), -2);
    EXPECT_EQ(FixedPoint::subtract(1000, 0), 1000);
}

TEST(FixedPoint, Magnitude) {
    EXPECT_EQ(FixedPoint::magnitude(0), 0u);
    EXPECT_EQ(FixedPoint::magnitude(-42), 42u);
    EXPECT_EQ(FixedPoint::magnitude(42), 42u);
    EXPECT_EQ(FixedPoint::magnitude(INT32_LO), static_cast<uint32_t>(INT32_HI));
}

TEST(FixedPoint, Clamp) {
    EXPECT_EQ(FixedPoint::clamp(5000, -1000, 1000), 1000);
    EXPECT_EQ(FixedPoint::clamp(-5000, -1000, 1000), -1000);
    EXPECT_EQ(FixedPoint::clamp(12, -1000, 1000), 12);
    EXPECT_EQ(FixedPoint::saturate(int64_t{1} << 40), INT32_HI);
}
