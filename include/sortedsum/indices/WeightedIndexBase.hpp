#pragma once

#include <optional>
#include <sortedsum/defs.hpp>

namespace sortedsum {

template <typename KeyType, typename WeightType>
class WeightedIndexBase {
public:
    using key_type = KeyType;
    using weight_type = WeightType;

    struct entry_type {
        weight_type weight;
        weight_type offset; ///< sum of the weights of all smaller keys
        bool operator== (const entry_type &o) const { return weight == o.weight && offset == o.offset; }
    };

    virtual ~WeightedIndexBase() = default;

    virtual bool put(const key_type &key, weight_type weight) = 0;

    [[nodiscard]] virtual std::optional<entry_type> get(const key_type &key) const = 0;

    virtual bool remove(const key_type &key) = 0;

    [[nodiscard]] virtual std::optional<key_type> find(weight_type point) const = 0;

    [[nodiscard]] virtual weight_type total() const = 0;

    [[nodiscard]] virtual size_t size() const = 0;

    [[nodiscard]] virtual bool empty() const = 0;

    virtual void clear() = 0;
};

}
