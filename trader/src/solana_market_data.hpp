#pragma once

#include "market_data.hpp"
#include "rpc_solana.hpp"
#include "jupiter_client.hpp"
#include "dex_client.hpp"
#include <memory>

class SolanaMarketData : public MarketDataPort {
public:
    SolanaMarketData(std::shared_ptr<SolanaRPC> rpc,
                     std::shared_ptr<JupiterClient> jupiter,
                     std::shared_ptr<DexClient> dex);
    
    std::optional<double> balance(const std::string& address) override;
    std::vector<TokenHolding> holdings(const std::string& address) override;
    std::optional<Quote> quote(const std::string& input_mint, const std::string& output_mint,
                               uint64_t amount) override;
    std::optional<Tick> tick(const std::string& mint) override;
    std::optional<std::string> swap_transaction(const Quote& quote,
                                                const std::string& wallet) override;
    
private:
    std::shared_ptr<SolanaRPC> rpc_;
    std::shared_ptr<JupiterClient> jupiter_;
    std::shared_ptr<DexClient> dex_;
};
