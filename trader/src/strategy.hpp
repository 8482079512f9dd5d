#pragma once

#include "types.hpp"
#include <string>
#include <vector>
#include <optional>

enum class StrategyEventKind {
    Discovered,
    Tick
};

struct StrategyEvent {
    StrategyEventKind kind;
    TokenMeta meta;
    std::vector<double> prices;  // oldest first
};

// Read-only view of trading state handed to strategies. Strategies never
// mutate anything; the intent they return is executed by the caller.
class TradingRuntime {
public:
    virtual ~TradingRuntime() = default;
    virtual bool is_held(const std::string& mint) const = 0;
    virtual size_t open_positions() const = 0;
    virtual bool is_whitelisted(const std::string& mint) const = 0;
};

class TradingStrategy {
public:
    virtual ~TradingStrategy() = default;
    
    virtual std::optional<TradeIntent> decide(const StrategyEvent& event,
                                              const TradingRuntime& runtime) = 0;
    virtual std::string name() const = 0;
    
    // Whether discovery buys must pass the token validation gate first.
    virtual bool requires_validation() const { return true; }
    
    std::optional<TradeIntent> on_discovered(const TokenMeta& meta,
                                             const std::vector<double>& prices,
                                             const TradingRuntime& runtime) {
        return decide({StrategyEventKind::Discovered, meta, prices}, runtime);
    }
    
    std::optional<TradeIntent> on_tick(const TokenMeta& meta,
                                       const std::vector<double>& prices,
                                       const TradingRuntime& runtime) {
        return decide({StrategyEventKind::Tick, meta, prices}, runtime);
    }
};
