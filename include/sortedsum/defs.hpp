#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>

using weight_t = int64_t;
using node_index_t = uint32_t;

template <typename T>
struct Scale {
    static constexpr T K = static_cast<T>(1000LLU);   ///< Kilo (base 10)
    static constexpr T M = K * K;                     ///< Mega (base 10)
    static constexpr T G = K * K * K;                 ///< Giga (base 10)

    static constexpr T Ki = static_cast<T>(1024LLU);  ///< Kilo (base 2)
    static constexpr T Mi = Ki* Ki;                   ///< Mega (base 2)
    static constexpr T Gi = Ki* Ki* Ki;               ///< Giga (base 2)
};
using UIntScale = Scale<uint64_t>;

namespace sortedsum {

// marks an absent root, parent or child
constexpr node_index_t NO_NODE = std::numeric_limits<node_index_t>::max();

}
