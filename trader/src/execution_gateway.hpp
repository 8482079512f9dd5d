#pragma once

#include "types.hpp"
#include "market_data.hpp"
#include "signer.hpp"
#include <memory>
#include <string>

struct ExecutionSettings {
    std::string wallet_address;
    std::string base_mint;            // currency spent on buys and received on sells
    uint64_t buy_amount = 0;          // base mint smallest units per buy
    int max_attempts = 3;
    int retry_delay_ms = 500;         // grows linearly per attempt
};

// Turns an intent into a confirmed swap or a failed result. Expired quotes
// and missing quotes are retried with a fresh quote; signer rejections and
// network failures end the attempt.
class ExecutionGateway {
public:
    ExecutionGateway(std::shared_ptr<MarketDataPort> market,
                     std::shared_ptr<Signer> signer,
                     ExecutionSettings settings);
    
    SwapResult execute(const TradeIntent& intent);
    
    const ExecutionSettings& settings() const { return settings_; }
    
private:
    std::shared_ptr<MarketDataPort> market_;
    std::shared_ptr<Signer> signer_;
    ExecutionSettings settings_;
    
    SwapResult run(const TradeIntent& intent);
    std::optional<uint64_t> sell_amount(const std::string& mint);
    void backoff(int attempt) const;
};
