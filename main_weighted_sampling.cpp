#include <algorithm>
#include <numeric>
#include <string>
#include <random>
#include <vector>
#include <tlx/cmdline_parser.hpp>
#include <tlx/unused.hpp>

#include <sortedsum/defs.hpp>
#include <sortedsum/indices/WeightedIndex.hpp>
#include <sortedsum/utils/Polynomial.hpp>
#include <sortedsum/ScopedTimer.hpp>

using index_key_t = uint64_t;
using IndexType = sortedsum::WeightedIndex<index_key_t, Polynomial::value_type>;

static void report(const std::string &phase, size_t n, const IndexType &index, double seconds) {
    std::cout << IndexType::tree_name() << ", " << phase << ", " << n << ", " << index.height() << ", " << seconds << std::endl;
}

int main(int argc, const char** argv) {
    tlx::CmdlineParser cp;
    cp.set_description("Benchmark for weighted sampling on a sorted sum tree");

    size_t n = UIntScale::M;
    cp.add_size_t('n', "entries", n, "Number of keys in the index");

    size_t samples = UIntScale::M;
    cp.add_size_t('s', "samples", samples, "Number of draws and updates per phase");

    size_t distinct = 16;
    cp.add_size_t('k', "distinct", distinct, "Keys per draw without replacement");

    double alpha = 1.;
    cp.add_double('a', "alpha", alpha, "Polynomial exponent of the weights");

    size_t repeats = 3;
    cp.add_size_t('r', "repeats", repeats, "Repeats");

    size_t seed = 0;
    cp.add_size_t('e', "seed", seed, "Seed of the first repeat, 0 draws one from the random device");

    bool ordered = false;
    cp.add_flag('o', "ordered", ordered, "Insert keys in ascending order (the tree degenerates to a path)");

    if (!cp.process(argc, argv)) {
        return -1;
    }

    if (!n || !distinct) {
        std::cerr << "entries and distinct must be positive" << std::endl;
        return -1;
    }

    // updates raise a weight by at most this much
    constexpr weight_t max_update_slack = 6;
    const Polynomial f(alpha);
    if (!f.sum_fits(n, max_update_slack)) {
        std::cerr << "total weight of " << n << " entries with alpha " << alpha << " exceeds the weight type" << std::endl;
        return -1;
    }

    std::random_device rd;

    for (size_t j = 0; j < repeats; ++j) {
        const size_t run_seed = seed ? seed + j : rd();
        std::cout << run_seed << std::endl;
        std::mt19937_64 gen(run_seed);
        sortedsum::ScopedTimer repeat_timer("[n: " + std::to_string(n) + ", alpha: " + std::to_string(alpha) + ", ordered?: " + std::to_string(ordered) + "]");

        std::vector<index_key_t> keys(n);
        std::iota(keys.begin(), keys.end(), index_key_t{0});
        if (!ordered)
            std::shuffle(keys.begin(), keys.end(), gen);

        IndexType index;
        {
            sortedsum::ScopedTimer timer;
            for (const auto key : keys)
                index.put(key, f(key + 1));
            report("put", n, index, timer.elapsedSeconds());
        }

        std::cout << "Total weight: " << index.total() << std::endl;

        {
            sortedsum::ScopedTimer timer;
            size_t hits = 0;
            for (size_t s = 0; s < samples; ++s)
                hits += index.sample(gen).has_value();
            report("sample", n, index, timer.elapsedSeconds());
            std::cout << "Draws hit: " << hits << std::endl;
        }

        {
            sortedsum::ScopedTimer timer;
            size_t picked = 0;
            for (size_t s = 0; s < samples / distinct; ++s) {
                picked += index.sample_distinct(gen, distinct, [](const index_key_t &key) { tlx::unused(key); });
            }
            report("sample_distinct", n, index, timer.elapsedSeconds());
            std::cout << "Keys picked: " << picked << std::endl;
        }

        {
            auto pick = std::uniform_int_distribution<size_t>{0, n - 1};
            sortedsum::ScopedTimer timer;
            for (size_t s = 0; s < samples; ++s) {
                const auto key = keys[pick(gen)];
                index.put(key, f(key + 1) + static_cast<weight_t>(s % static_cast<size_t>(max_update_slack + 1)));
            }
            report("update", n, index, timer.elapsedSeconds());
        }

        {
            sortedsum::ScopedTimer timer;
            size_t removed = 0;
            for (const auto key : keys)
                removed += index.remove(key);
            report("remove", n, index, timer.elapsedSeconds());
            if (removed != n || !index.empty()) {
                std::cerr << "Removed " << removed << " of " << n << " keys" << std::endl;
                return -1;
            }
        }
    }

    return 0;
}
