#include <gtest/gtest.h>

#include <cstdint>
#include <limits>

#include "utils/checked_math.hpp"

namespace {
constexpr std::int64_t kMax = std::numeric_limits<std::int64_t>::max();
constexpr std::int64_t kMin = std::numeric_limits<std::int64_t>::min();
} // namespace

TEST(CheckedMath, AddDetectsOverflow) {
    std::int64_t out = 7;
    EXPECT_TRUE(utils::checked_add(2, 3, out));
    EXPECT_EQ(out, 5);

    out = 7;
    EXPECT_FALSE(utils::checked_add(kMax, 1, out));
    EXPECT_FALSE(utils::checked_add(kMax, kMax, out));
    EXPECT_FALSE(utils::checked_add(kMin, -1, out));
    EXPECT_EQ(out, 7); // untouched on failure

    EXPECT_TRUE(utils::checked_add(kMax, -1, out));
    EXPECT_EQ(out, kMax - 1);
}

TEST(CheckedMath, MulDetectsOverflow) {
    std::int64_t out = 0;
    EXPECT_TRUE(utils::checked_mul(100, 25, out));
    EXPECT_EQ(out, 2500);
    EXPECT_TRUE(utils::checked_mul(-4, 5, out));
    EXPECT_EQ(out, -20);
    EXPECT_TRUE(utils::checked_mul(0, kMax, out));
    EXPECT_EQ(out, 0);

    EXPECT_FALSE(utils::checked_mul(kMax, 2, out));
    EXPECT_FALSE(utils::checked_mul(kMin, -1, out));
    EXPECT_FALSE(utils::checked_mul(-3, kMax, out));
    EXPECT_FALSE(utils::checked_mul(std::int64_t{1} << 32, std::int64_t{1} << 31, out));
}

TEST(CheckedMath, SaturatingSumSticksAtLimit) {
    utils::SaturatingSum sum;
    sum.add(10);
    sum.add_product(100, 5);
    EXPECT_EQ(sum.value(), 510);
    EXPECT_FALSE(sum.saturated());

    sum.add(kMax);
    EXPECT_TRUE(sum.saturated());
    EXPECT_EQ(sum.value(), kMax);

    sum.add(-1000);
    EXPECT_EQ(sum.value(), kMax);

    utils::SaturatingSum notional;
    notional.add_product(kMax, 100);
    EXPECT_TRUE(notional.saturated());
    EXPECT_EQ(notional.value(), kMax);
}
