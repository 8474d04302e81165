#pragma once

#include <cstdint>
#include <limits>

namespace utils {

// int64 arithmetic that reports overflow instead of wrapping.
// On overflow `out` is left untouched and false is returned.

inline bool checked_add(std::int64_t a, std::int64_t b, std::int64_t& out) noexcept {
    constexpr auto max = std::numeric_limits<std::int64_t>::max();
    constexpr auto min = std::numeric_limits<std::int64_t>::min();

    if ((b > 0 && a > max - b) || (b < 0 && a < min - b)) {
        return false;
    }
    out = a + b;
    return true;
}

inline bool checked_mul(std::int64_t a, std::int64_t b, std::int64_t& out) noexcept {
    constexpr auto max = std::numeric_limits<std::int64_t>::max();
    constexpr auto min = std::numeric_limits<std::int64_t>::min();

    if (a > 0) {
        if (b > 0) {
            if (a > max / b) return false;
        } else {
            if (b < min / a) return false;
        }
    } else {
        if (b > 0) {
            if (a < min / b) return false;
        } else {
            if (a != 0 && b < max / a) return false;
        }
    }
    out = a * b;
    return true;
}

// Running total for statistics: saturates at the int64 limits and remembers
// that it did.
class SaturatingSum {
public:
    void add(std::int64_t v) noexcept {
        if (saturated_) {
            return;
        }
        if (!checked_add(value_, v, value_)) {
            value_     = v > 0 ? std::numeric_limits<std::int64_t>::max()
                               : std::numeric_limits<std::int64_t>::min();
            saturated_ = true;
        }
    }

    // adds a * b
    void add_product(std::int64_t a, std::int64_t b) noexcept {
        if (saturated_) {
            return;
        }
        std::int64_t p = 0;
        if (!checked_mul(a, b, p)) {
            value_     = ((a > 0) == (b > 0)) ? std::numeric_limits<std::int64_t>::max()
                                              : std::numeric_limits<std::int64_t>::min();
            saturated_ = true;
            return;
        }
        add(p);
    }

    std::int64_t value() const noexcept { return value_; }
    bool saturated() const noexcept { return saturated_; }

private:
    std::int64_t value_{0};
    bool         saturated_{false};
};

} // namespace utils
