#pragma once

#include "types.hpp"
#include <string>
#include <cstdint>

struct TradeEvent {
    TradeIntent intent;
    SwapResult result;
    std::string strategy;
    int64_t timestamp_ms;
};

// Observers of executed trades and protective alerts. Implementations must
// not throw for delivery failures; the trading loop never waits on them.
class TradeListener {
public:
    virtual ~TradeListener() = default;
    virtual void on_trade(const TradeEvent& event) = 0;
    virtual void on_alert(const std::string& mint, const std::string& kind,
                          const std::string& message) = 0;
};
