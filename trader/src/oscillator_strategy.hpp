#pragma once

#include "strategy.hpp"

struct OscillatorSettings {
    int rsi_period = 14;
    size_t window = 0;                    // prices per RSI reading, 0 = twice the period
    double oversold = 30.0;
    double overbought = 70.0;
    double midpoint = 50.0;
    double divergence_price_pct = 0.01;   // price up at least this much...
    double divergence_rsi_drop = 2.0;     // ...while RSI falls more than this
    bool buy_on_discovery_without_history = true;
};

// RSI driven entries and exits. Decisions depend only on the price series,
// never on how long a position has been held.
class OscillatorStrategy : public TradingStrategy {
public:
    explicit OscillatorStrategy(OscillatorSettings settings = {});
    
    std::optional<TradeIntent> decide(const StrategyEvent& event,
                                      const TradingRuntime& runtime) override;
    std::string name() const override { return "oscillator"; }
    
private:
    OscillatorSettings settings_;
    
    // RSI over the `window` prices ending `offset` samples before the latest
    std::optional<double> rsi_at(const std::vector<double>& prices, size_t offset) const;
    std::optional<TradeIntent> entry(const StrategyEvent& event,
                                     const std::optional<double>& current) const;
    std::optional<TradeIntent> exit(const StrategyEvent& event,
                                    const std::optional<double>& current,
                                    const std::optional<double>& previous) const;
};
