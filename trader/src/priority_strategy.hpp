#pragma once

#include "strategy.hpp"
#include <set>

struct PrioritySettings {
    std::set<std::string> preferred_sources{"pump.fun"};
    bool preferred_only = false;
    bool require_whitelist = false;
    size_t max_concurrent = 10;
};

// Buys on discovery when capacity allows. Exits are left entirely to the
// protective layers.
class PriorityStrategy : public TradingStrategy {
public:
    explicit PriorityStrategy(PrioritySettings settings = {});
    
    std::optional<TradeIntent> decide(const StrategyEvent& event,
                                      const TradingRuntime& runtime) override;
    std::string name() const override { return "priority"; }
    
private:
    PrioritySettings settings_;
};
