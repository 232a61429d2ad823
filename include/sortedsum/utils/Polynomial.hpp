#pragma once
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>
#include <sortedsum/defs.hpp>

// integer weights f(v) = round(v^alpha), at least 1 for v > 0
struct Polynomial {
    double alpha = 1;

public:
    using value_type = weight_t;

    Polynomial() : alpha(1) { }

    Polynomial(double alpha_) : alpha(alpha_) { }

    value_type operator() (uint64_t v) const {
        if (!v) return 0;
        const auto w = static_cast<value_type>(std::llround(std::pow(static_cast<double>(v), alpha)));
        return w > 0 ? w : 1;
    }

    // true if f(1) + ... + f(n) plus slack per entry is representable in value_type
    [[nodiscard]] bool sum_fits(uint64_t n, value_type slack = 0) const {
        constexpr auto limit = static_cast<long double>(std::numeric_limits<value_type>::max());
        long double bound = 0;
        for (uint64_t v = 1; v <= n; ++v) {
            // rounding adds at most one half, small values are raised to one
            bound += std::max(std::pow(static_cast<long double>(v), static_cast<long double>(alpha)), 1.0L) + 0.5L + static_cast<long double>(slack);
            if (!(bound < limit))
                return false;
        }
        return true;
    }

    static value_type dist_max(value_type weight) {
        return weight - 1;
    }
};
