#include "solana_market_data.hpp"

SolanaMarketData::SolanaMarketData(std::shared_ptr<SolanaRPC> rpc,
                                   std::shared_ptr<JupiterClient> jupiter,
                                   std::shared_ptr<DexClient> dex)
    : rpc_(std::move(rpc)), jupiter_(std::move(jupiter)), dex_(std::move(dex)) {}

std::optional<double> SolanaMarketData::balance(const std::string& address) {
    return rpc_->get_balance(address);
}

std::vector<TokenHolding> SolanaMarketData::holdings(const std::string& address) {
    return rpc_->get_token_accounts(address);
}

std::optional<Quote> SolanaMarketData::quote(const std::string& input_mint,
                                             const std::string& output_mint,
                                             uint64_t amount) {
    return jupiter_->get_quote(input_mint, output_mint, amount);
}

std::optional<Tick> SolanaMarketData::tick(const std::string& mint) {
    return dex_->get_tick(mint);
}

std::optional<std::string> SolanaMarketData::swap_transaction(const Quote& quote,
                                                              const std::string& wallet) {
    return jupiter_->get_swap_transaction(quote, wallet);
}
