#pragma once

#include <vector>
#include <optional>

class Indicators {
public:
    // Wilder-smoothed relative strength index, 0..100. Needs more than
    // `period` prices.
    static std::optional<double> rsi(const std::vector<double>& prices, int period);
    static double stddev(const std::vector<double>& values);
};
