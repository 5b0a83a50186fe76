#pragma once

#include <vector>
#include <cmath>
#include <numeric>
#include <optional>

namespace scape {

    class Statistics {
    public:
        static double mean(const std::vector<double>& data) {
            if (data.empty()) return 0.0;
            return std::accumulate(data.begin(), data.end(), 0.0) / data.size();
        }

        // exp(mean(log x)); non-positive samples are skipped
        static std::optional<double> geometricMean(const std::vector<double>& data) {
            double logSum = 0.0;
            size_t n = 0;
            for (double x : data) {
                if (x <= 0) continue;
                logSum += std::log(x);
                ++n;
            }
            if (n == 0) return std::nullopt;
            return std::exp(logSum / n);
        }
    };

} // namespace scape
