#pragma once

#include <string>
#include <vector>
#include <map>
#include <mutex>

enum class MarketState {
    Trending,
    Choppy,
    Unknown
};

inline std::string market_state_string(MarketState state) {
    switch (state) {
        case MarketState::Trending: return "trending";
        case MarketState::Choppy: return "choppy";
        case MarketState::Unknown: return "unknown";
    }
    return "unknown";
}

struct TrendFilterSettings {
    size_t min_samples = 3;
    size_t lookback = 10;
    double trending_threshold = 0.6;
    double choppy_reversal_ratio = 0.5;
    bool block_on_choppy = true;
};

class TrendFilter {
public:
    explicit TrendFilter(TrendFilterSettings settings = {});
    
    MarketState analyze_market(const std::string& mint, const std::vector<double>& prices);
    
    // Net directional move over total absolute move, in [0,1].
    static double calculate_trend_strength(const std::vector<double>& prices);
    // Share of consecutive deltas that flip sign, in [0,1].
    static double reversal_ratio(const std::vector<double>& prices);
    
    bool should_allow_trade(const std::string& mint) const;
    
    MarketState state_of(const std::string& mint) const;
    void forget(const std::string& mint);
    
private:
    struct TokenTrend {
        MarketState state = MarketState::Unknown;
        int consecutive_chop = 0;
    };
    
    TrendFilterSettings settings_;
    mutable std::mutex mutex_;
    std::map<std::string, TokenTrend> tokens_;
};
