#pragma once

#include <random>
#include <cstdint>
#include <vector>
#include <algorithm>

namespace scape {

    // Seedable random source. Owned by whoever needs reproducibility
    // (the engine, a decision maker) and passed by reference; never global.
    class Random {
    public:
        explicit Random(uint64_t seed = 0) : gen_(seed) {}

        // Reset for reproducibility
        void seed(uint64_t s) { gen_.seed(s); }

        std::mt19937_64& engine() { return gen_; }

        // Uniform distribution [min, max]
        double uniform(double min, double max) {
            std::uniform_real_distribution<double> dist(min, max);
            return dist(gen_);
        }

        // Uniform integer [min, max]
        int uniformInt(int min, int max) {
            std::uniform_int_distribution<int> dist(min, max);
            return dist(gen_);
        }

        // Bernoulli (coin flip with probability p)
        bool bernoulli(double p) {
            std::bernoulli_distribution dist(p);
            return dist(gen_);
        }

        // Uniform random permutation in place
        template<typename T>
        void shuffle(std::vector<T>& items) {
            std::shuffle(items.begin(), items.end(), gen_);
        }

    private:
        std::mt19937_64 gen_;
    };

} // namespace scape
