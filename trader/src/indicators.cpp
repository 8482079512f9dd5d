#include "indicators.hpp"
#include <cmath>

std::optional<double> Indicators::rsi(const std::vector<double>& prices, int period) {
    if (period <= 1 || prices.size() <= static_cast<size_t>(period)) {
        return std::nullopt;
    }
    
    double gain = 0.0;
    double loss = 0.0;
    for (int i = 1; i <= period; i++) {
        double d = prices[i] - prices[i - 1];
        if (d >= 0) gain += d; else loss -= d;
    }
    gain /= period;
    loss /= period;
    
    for (size_t i = period + 1; i < prices.size(); i++) {
        double d = prices[i] - prices[i - 1];
        double g = d > 0 ? d : 0.0;
        double l = d < 0 ? -d : 0.0;
        gain = (gain * (period - 1) + g) / period;
        loss = (loss * (period - 1) + l) / period;
    }
    
    if (loss == 0.0) {
        return gain == 0.0 ? 50.0 : 100.0;
    }
    
    double rs = gain / loss;
    return 100.0 - 100.0 / (1.0 + rs);
}

double Indicators::stddev(const std::vector<double>& values) {
    if (values.empty()) return 0.0;
    
    double mean = 0.0;
    for (double v : values) mean += v;
    mean /= values.size();
    
    double sum_sq = 0.0;
    for (double v : values) sum_sq += (v - mean) * (v - mean);
    return std::sqrt(sum_sq / values.size());
}
