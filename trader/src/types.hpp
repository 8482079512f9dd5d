#pragma once

#include <string>
#include <cstdint>
#include <optional>
#include <nlohmann/json.hpp>

enum class TokenLifecycleState {
    Discovered,
    Held,
    Disposed
};

inline std::string lifecycle_string(TokenLifecycleState state) {
    switch (state) {
        case TokenLifecycleState::Discovered: return "discovered";
        case TokenLifecycleState::Held: return "held";
        case TokenLifecycleState::Disposed: return "disposed";
    }
    return "unknown";
}

struct TokenMeta {
    std::string mint;
    std::string source;        // discovery source tag, e.g. "pump.fun" or "whitelist"
    int64_t discovered_at_ms = 0;
};

enum class TradeAction {
    Buy,
    Sell
};

inline std::string action_string(TradeAction action) {
    return action == TradeAction::Buy ? "buy" : "sell";
}

struct TradeIntent {
    std::string mint;
    TradeAction action;
    bool forced = false;          // raised by a protective layer
    std::string reason;
    double reference_price = 0.0; // mark price when the intent was raised
};

struct SwapResult {
    std::string mint;
    bool success = false;
    double executed_price = 0.0;
    std::string signature;
    std::optional<std::string> failure_reason;
    uint64_t in_amount = 0;
    uint64_t out_amount = 0;
    int attempts = 0;
};

struct Tick {
    double price;
    double volume;
    int64_t timestamp_ms;
};

struct Quote {
    std::string input_mint;
    std::string output_mint;
    uint64_t in_amount = 0;
    uint64_t out_amount = 0;
    double price_impact_pct = 0.0;
    int64_t fetched_at_ms = 0;
    nlohmann::json raw;           // aggregator response, echoed back when building the swap
};

struct TokenHolding {
    std::string mint;
    uint64_t amount;
    uint8_t decimals;
};
