#pragma once

#include "types.hpp"
#include <string>
#include <vector>
#include <optional>

// Read side of the chain and the swap aggregator. A missing value means the
// lookup failed transiently; callers skip the token for this cycle.
class MarketDataPort {
public:
    virtual ~MarketDataPort() = default;
    
    virtual std::optional<double> balance(const std::string& address) = 0;
    virtual std::vector<TokenHolding> holdings(const std::string& address) = 0;
    virtual std::optional<Quote> quote(const std::string& input_mint,
                                       const std::string& output_mint,
                                       uint64_t amount) = 0;
    virtual std::optional<Tick> tick(const std::string& mint) = 0;
    
    // Unsigned, base64 encoded swap transaction for a quote.
    virtual std::optional<std::string> swap_transaction(const Quote& quote,
                                                        const std::string& wallet) = 0;
};
