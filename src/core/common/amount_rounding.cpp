#include "sec_subledger/core/amount_rounding.h"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>

namespace sec_subledger {
namespace {

constexpr int kMaxScale = 12;

std::int64_t Pow10(int scale) {
    std::int64_t value = 1;
    for (int i = 0; i < scale; ++i) {
        value *= 10;
    }
    return value;
}

std::int64_t ClampToInt64(long double value) {
    constexpr long double kMax = static_cast<long double>(std::numeric_limits<std::int64_t>::max());
    constexpr long double kMin = static_cast<long double>(std::numeric_limits<std::int64_t>::min());
    if (value >= kMax) {
        return std::numeric_limits<std::int64_t>::max();
    }
    if (value <= kMin) {
        return std::numeric_limits<std::int64_t>::min();
    }
    return static_cast<std::int64_t>(value);
}

std::int64_t RoundHalfUp(long double value) {
    if (value >= 0) {
        return ClampToInt64(std::floor(value + 0.5L));
    }
    return ClampToInt64(std::ceil(value - 0.5L));
}

int SafeScale(int scale) {
    return std::clamp(scale, 0, kMaxScale);
}

}  // namespace

double AmountRounding::Round(double value, int scale) {
    if (!std::isfinite(value)) {
        return value;
    }
    const auto factor = static_cast<long double>(Pow10(SafeScale(scale)));
    const std::int64_t scaled = RoundHalfUp(static_cast<long double>(value) * factor);
    const double rounded = static_cast<double>(static_cast<long double>(scaled) / factor);
    // Normalise -0.0 so reports never print a negative zero difference.
    return rounded == 0.0 ? 0.0 : rounded;
}

bool AmountRounding::IsBreak(double difference, double tolerance) {
    if (!std::isfinite(difference)) {
        return true;
    }
    return std::fabs(difference) > std::max(0.0, tolerance);
}

}  // namespace sec_subledger
