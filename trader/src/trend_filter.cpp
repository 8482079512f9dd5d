#include "trend_filter.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <cmath>

TrendFilter::TrendFilter(TrendFilterSettings settings) : settings_(settings) {
    if (settings_.min_samples < 3) settings_.min_samples = 3;
    if (settings_.lookback < settings_.min_samples) settings_.lookback = settings_.min_samples;
}

MarketState TrendFilter::analyze_market(const std::string& mint, const std::vector<double>& prices) {
    MarketState state = MarketState::Unknown;
    double strength = 0.0;
    
    if (prices.size() >= settings_.min_samples) {
        size_t start = prices.size() > settings_.lookback ? prices.size() - settings_.lookback : 0;
        std::vector<double> window(prices.begin() + start, prices.end());
        
        strength = calculate_trend_strength(window);
        double reversals = reversal_ratio(window);
        
        // A flat window carries no direction either way
        if (window.front() != window.back() || reversals > 0.0) {
            if (strength >= settings_.trending_threshold) {
                state = MarketState::Trending;
            } else if (reversals >= settings_.choppy_reversal_ratio) {
                state = MarketState::Choppy;
            }
        }
        
        spdlog::debug("Trend {}: strength={:.3f} reversals={:.2f} -> {}",
                      util::short_mint(mint), strength, reversals,
                      market_state_string(state));
    }
    
    std::lock_guard<std::mutex> lock(mutex_);
    auto& token = tokens_[mint];
    token.state = state;
    
    if (state == MarketState::Choppy) {
        token.consecutive_chop++;
        if (token.consecutive_chop == 1) {
            spdlog::info("Choppy market on {} (strength {:.2f}), holding off entries",
                         util::short_mint(mint), strength);
        }
    } else if (state == MarketState::Trending) {
        token.consecutive_chop = 0;
    }
    
    return state;
}

double TrendFilter::calculate_trend_strength(const std::vector<double>& prices) {
    if (prices.size() < 2) return 0.0;
    
    double total_move = 0.0;
    for (size_t i = 1; i < prices.size(); i++) {
        total_move += std::abs(prices[i] - prices[i - 1]);
    }
    if (total_move <= 0.0) return 0.0;
    
    double net_move = std::abs(prices.back() - prices.front());
    return std::min(1.0, net_move / total_move);
}

double TrendFilter::reversal_ratio(const std::vector<double>& prices) {
    int last_sign = 0;
    int reversals = 0;
    int transitions = 0;
    
    for (size_t i = 1; i < prices.size(); i++) {
        double delta = prices[i] - prices[i - 1];
        int sign = delta > 0.0 ? 1 : (delta < 0.0 ? -1 : 0);
        if (sign == 0) continue;
        if (last_sign != 0) {
            transitions++;
            if (sign != last_sign) reversals++;
        }
        last_sign = sign;
    }
    
    return transitions > 0 ? static_cast<double>(reversals) / transitions : 0.0;
}

bool TrendFilter::should_allow_trade(const std::string& mint) const {
    if (!settings_.block_on_choppy) return true;
    
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tokens_.find(mint);
    return it == tokens_.end() || it->second.state != MarketState::Choppy;
}

MarketState TrendFilter::state_of(const std::string& mint) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tokens_.find(mint);
    return it == tokens_.end() ? MarketState::Unknown : it->second.state;
}

void TrendFilter::forget(const std::string& mint) {
    std::lock_guard<std::mutex> lock(mutex_);
    tokens_.erase(mint);
}
