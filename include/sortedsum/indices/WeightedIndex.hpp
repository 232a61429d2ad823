#pragma once

#include <algorithm>
#include <array>
#include <cassert>
#include <iostream>
#include <optional>
#include <random>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>
#include <tlx/define/likely.hpp>
#include <sortedsum/defs.hpp>
#include <sortedsum/indices/WeightedIndexBase.hpp>

namespace sortedsum {

/**
 * Sorted sum tree: entries (key, weight) ordered by key, where each entry covers the
 * half-open range [offset, offset + weight) and offset is the sum of all weights of
 * smaller keys. Leaves carry the entries, branches cache the sum of their subtree.
 *
 * The tree is a plain (unbalanced) binary tree. Nodes are kept in an arena and refer
 * to their parent and children by index; released slots are reused.
 */
template <typename KeyType, typename WeightType = weight_t>
class WeightedIndex final : public WeightedIndexBase<KeyType, WeightType> {
public:
    static constexpr bool verbose = false;
    static constexpr bool assert_thoroughly = false;

    using base_type         = WeightedIndexBase<KeyType, WeightType>;
    using key_type          = typename base_type::key_type;
    using weight_type       = typename base_type::weight_type;
    using entry_type        = typename base_type::entry_type;
    using distribution_type = std::uniform_int_distribution<weight_type>;

    static_assert(std::is_integral_v<weight_type>);

    WeightedIndex() = default;
    WeightedIndex(const WeightedIndex &o) = default;
    WeightedIndex& operator= (const WeightedIndex &o) = default;

    WeightedIndex(WeightedIndex &&o) noexcept :
        nodes_(std::move(o.nodes_)),
        free_(std::move(o.free_)),
        root_(std::exchange(o.root_, NO_NODE)),
        size_(std::exchange(o.size_, 0))
    { }

    WeightedIndex& operator= (WeightedIndex &&o) noexcept {
        if (this == &o)
            return *this;
        nodes_ = std::move(o.nodes_);
        free_ = std::move(o.free_);
        root_ = std::exchange(o.root_, NO_NODE);
        size_ = std::exchange(o.size_, 0);
        return *this;
    }

    // returns true if the key was not present before
    bool put(const key_type &key, weight_type weight) override {
        if constexpr(verbose) std::cout << "put[key: " << key << ",\tweight: " << weight << "]" << std::endl;

        if (TLX_UNLIKELY(root_ == NO_NODE)) {
            root_ = allocate(NO_NODE, leaf_type{key, weight});
            size_ = 1;
            return true;
        }

        const auto i = descend(key);
        const auto parent = nodes_[i].parent;
        auto &leaf = std::get<leaf_type>(nodes_[i].data);

        if (leaf.key == key) {
            const weight_type delta = weight - leaf.weight;
            leaf.weight = weight;
            add_to_ancestors(parent, delta);
            if constexpr(assert_thoroughly) assert(is_consistent());
            return false;
        }

        // split the reached leaf: a new branch takes its slot and holds both leaves
        const bool new_is_left = key < leaf.key;
        branch_type branch{new_is_left ? leaf.key : key, static_cast<weight_type>(leaf.weight + weight), {NO_NODE, NO_NODE}};

        // allocations may move the arena, leaf is dangling from here on
        const auto fresh = allocate(NO_NODE, leaf_type{key, weight});
        branch.children = new_is_left ? children_type{fresh, i} : children_type{i, fresh};
        const auto b = allocate(parent, std::move(branch));
        nodes_[fresh].parent = b;
        nodes_[i].parent = b;

        replace_child(parent, i, b);
        add_to_ancestors(parent, weight);
        ++size_;

        if constexpr(assert_thoroughly) assert(is_consistent());
        return true;
    }

    [[nodiscard]] std::optional<entry_type> get(const key_type &key) const override {
        if (root_ == NO_NODE)
            return std::nullopt;

        weight_type offset = 0;
        node_index_t i = root_;
        while (const auto *branch = std::get_if<branch_type>(&nodes_[i].data)) {
            if (key < branch->split_key) {
                i = branch->children[0];
            } else {
                offset += value(branch->children[0]);
                i = branch->children[1];
            }
        }

        const auto &leaf = std::get<leaf_type>(nodes_[i].data);
        if (!(leaf.key == key))
            return std::nullopt;

        return entry_type{leaf.weight, offset};
    }

    // returns false without touching the tree if the key is not present
    bool remove(const key_type &key) override {
        if constexpr(verbose) std::cout << "remove[key: " << key << "]" << std::endl;

        if (root_ == NO_NODE)
            return false;

        const auto i = descend(key);
        const auto &leaf = std::get<leaf_type>(nodes_[i].data);
        if (!(leaf.key == key))
            return false;

        const auto parent = nodes_[i].parent;
        if (parent == NO_NODE) {
            assert(size_ == 1);
            clear();
            return true;
        }

        // splice: the sibling takes over the slot of the parent
        const weight_type weight = leaf.weight;
        const auto &siblings = std::get<branch_type>(nodes_[parent].data).children;
        const auto sibling = siblings[siblings[0] == i ? 1 : 0];
        const auto grandparent = nodes_[parent].parent;

        replace_child(grandparent, parent, sibling);
        nodes_[sibling].parent = grandparent;
        add_to_ancestors(grandparent, -weight);

        release(i);
        release(parent);
        --size_;

        if constexpr(assert_thoroughly) assert(is_consistent());
        return true;
    }

    // key whose range [offset, offset + weight) contains point
    [[nodiscard]] std::optional<key_type> find(weight_type point) const override {
        if (root_ == NO_NODE)
            return std::nullopt;

        if constexpr(std::is_signed_v<weight_type>) {
            if (point < 0)
                return std::nullopt;
        }

        weight_type offset = 0;
        node_index_t i = root_;
        while (const auto *branch = std::get_if<branch_type>(&nodes_[i].data)) {
            // point outside the total range
            if (TLX_UNLIKELY(point > offset + branch->value))
                return std::nullopt;

            const weight_type mid = offset + value(branch->children[0]);
            if (point < mid) {
                i = branch->children[0];
            } else {
                offset = mid;
                i = branch->children[1];
            }
        }

        const auto &leaf = std::get<leaf_type>(nodes_[i].data);
        if (point >= offset + leaf.weight)
            return std::nullopt;

        return leaf.key;
    }

    [[nodiscard]] weight_type total() const override {
        return root_ == NO_NODE ? weight_type{0} : value(root_);
    }

    [[nodiscard]] size_t size() const override {
        return size_;
    }

    [[nodiscard]] bool empty() const override {
        return size_ == 0;
    }

    void clear() override {
        nodes_.clear();
        free_.clear();
        root_ = NO_NODE;
        size_ = 0;
    }

    template <typename Generator>
    std::optional<key_type> sample(Generator &&gen) const {
        const auto sum = total();
        if (sum <= 0)
            return std::nullopt;

        auto dist = distribution_type{0, sum - 1};
        return find(dist(gen));
    }

    /**
     * Draws up to k distinct keys proportional to their weights without replacement.
     * Every drawn entry is taken out for the remaining draws and put back with its
     * old weight before any callback runs, so the index holds the same entries on
     * return (the tree shape may differ). cb(key) is called once per drawn key.
     */
    template <typename Generator, typename Callback>
    size_t sample_distinct(Generator &&gen, size_t k, Callback &&cb) {
        std::vector<std::pair<key_type, weight_type>> drawn;
        drawn.reserve(std::min(k, size_));

        while (drawn.size() < k) {
            const auto key = sample(gen);
            if (!key)
                break;

            const auto entry = get(*key);
            if (TLX_UNLIKELY(!entry))
                break;

            drawn.emplace_back(*key, entry->weight);
            [[maybe_unused]] const bool removed = remove(*key);
            assert(removed);
        }

        // slots released by remove are reused, restoring does not grow the arena
        for (const auto &[key, weight] : drawn) {
            put(key, weight);
        }

        for (const auto &[key, weight] : drawn) {
            cb(key);
        }

        return drawn.size();
    }

    // in-order traversal, calls cb(key, weight, offset)
    template <typename Callback>
    void for_each(Callback &&cb) const {
        if (root_ == NO_NODE)
            return;

        weight_type offset = 0;
        std::vector<node_index_t> stack{root_};
        while (!stack.empty()) {
            const auto i = stack.back();
            stack.pop_back();

            if (const auto *branch = std::get_if<branch_type>(&nodes_[i].data)) {
                stack.push_back(branch->children[1]);
                stack.push_back(branch->children[0]);
            } else {
                const auto &leaf = std::get<leaf_type>(nodes_[i].data);
                cb(leaf.key, leaf.weight, offset);
                offset += leaf.weight;
            }
        }
    }

    [[nodiscard]] size_t height() const {
        if (root_ == NO_NODE)
            return 0;

        size_t max_depth = 0;
        std::vector<std::pair<node_index_t, size_t>> stack{{root_, 1}};
        while (!stack.empty()) {
            const auto [i, depth] = stack.back();
            stack.pop_back();
            max_depth = std::max(max_depth, depth);

            if (const auto *branch = std::get_if<branch_type>(&nodes_[i].data)) {
                stack.emplace_back(branch->children[0], depth + 1);
                stack.emplace_back(branch->children[1], depth + 1);
            }
        }

        return max_depth;
    }

    /**
     * Checks the structural invariants:
     *  - every branch caches the sum of its children, every leaf its weight
     *  - children point back to their parent, the root has none
     *  - keys left of a branch are < split_key, keys right of it are >= split_key
     *  - in-order keys are strictly increasing and their number is size()
     */
    [[nodiscard]] bool is_consistent() const {
        if (root_ == NO_NODE)
            return size_ == 0;

        if (nodes_[root_].parent != NO_NODE)
            return false;

        struct frame {
            node_index_t i;
            const key_type *lower; // inclusive
            const key_type *upper; // exclusive
        };

        const key_type *previous = nullptr;
        size_t leaves = 0;
        size_t visited = 0;
        std::vector<frame> stack{{root_, nullptr, nullptr}};
        while (!stack.empty()) {
            const auto [i, lower, upper] = stack.back();
            stack.pop_back();

            if (++visited > nodes_.size())
                return false; // cycle

            if (const auto *branch = std::get_if<branch_type>(&nodes_[i].data)) {
                const auto [left, right] = branch->children;
                if (left == NO_NODE || right == NO_NODE)
                    return false;
                if (nodes_[left].parent != i || nodes_[right].parent != i)
                    return false;
                if (branch->value != value(left) + value(right))
                    return false;

                stack.push_back({right, &branch->split_key, upper});
                stack.push_back({left, lower, &branch->split_key});
            } else {
                const auto &key = std::get<leaf_type>(nodes_[i].data).key;
                if (lower && key < *lower)
                    return false;
                if (upper && !(key < *upper))
                    return false;
                if (previous && !(*previous < key))
                    return false;

                previous = &key;
                ++leaves;
            }
        }

        return leaves == size_;
    }

    static std::string tree_name() {
        return "WeightedIndex";
    }

    // one line per node, branches as "+ 'split_key/value", leaves as "- 'key/weight"
    void print(const std::string &label, std::ostream &os = std::cout) const {
        os << label << std::endl;
        if (root_ == NO_NODE)
            return;

        std::vector<std::pair<node_index_t, size_t>> stack{{root_, 0}};
        while (!stack.empty()) {
            const auto [i, indent] = stack.back();
            stack.pop_back();

            os << std::string(indent, ' ');
            if (const auto *branch = std::get_if<branch_type>(&nodes_[i].data)) {
                os << "+ '" << branch->split_key << "/" << branch->value << std::endl;
                stack.emplace_back(branch->children[1], indent + 2);
                stack.emplace_back(branch->children[0], indent + 2);
            } else {
                const auto &leaf = std::get<leaf_type>(nodes_[i].data);
                os << "- '" << leaf.key << "/" << leaf.weight << std::endl;
            }
        }
    }

protected:
    using children_type = std::array<node_index_t, 2>;

    struct leaf_type {
        key_type key;
        weight_type weight;
    };

    struct branch_type {
        key_type split_key; ///< smallest key below children[1] at creation
        weight_type value;  ///< sum of all weights below
        children_type children;
    };

    struct node_type {
        node_index_t parent;
        std::variant<leaf_type, branch_type> data;
    };

    std::vector<node_type> nodes_;
    std::vector<node_index_t> free_;
    node_index_t root_ = NO_NODE;
    size_t size_ = 0;

    [[nodiscard]] weight_type value(node_index_t i) const {
        const auto &data = nodes_[i].data;
        if (const auto *leaf = std::get_if<leaf_type>(&data))
            return leaf->weight;
        return std::get<branch_type>(data).value;
    }

    // leaf reached by routing key from the root, requires a non-empty tree
    [[nodiscard]] node_index_t descend(const key_type &key) const {
        assert(root_ != NO_NODE);
        node_index_t i = root_;
        while (const auto *branch = std::get_if<branch_type>(&nodes_[i].data)) {
            i = branch->children[key < branch->split_key ? 0 : 1];
        }
        return i;
    }

    // adds delta to i and all of its ancestors, all of them are branches
    void add_to_ancestors(node_index_t i, weight_type delta) {
        for (; i != NO_NODE; i = nodes_[i].parent) {
            std::get<branch_type>(nodes_[i].data).value += delta;
        }
    }

    void replace_child(node_index_t parent, node_index_t old_child, node_index_t new_child) {
        if (parent == NO_NODE) {
            assert(root_ == old_child);
            root_ = new_child;
            return;
        }

        auto &children = std::get<branch_type>(nodes_[parent].data).children;
        assert(children[0] == old_child || children[1] == old_child);
        children[children[0] == old_child ? 0 : 1] = new_child;
    }

    template <typename NodeData>
    node_index_t allocate(node_index_t parent, NodeData &&data) {
        if (!free_.empty()) {
            const auto i = free_.back();
            free_.pop_back();
            nodes_[i] = node_type{parent, std::forward<NodeData>(data)};
            return i;
        }

        assert(nodes_.size() < NO_NODE);
        nodes_.push_back(node_type{parent, std::forward<NodeData>(data)});
        return static_cast<node_index_t>(nodes_.size() - 1);
    }

    void release(node_index_t i) {
        free_.push_back(i);
    }
};

}
