#include "rpc_solana.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace {
constexpr const char* TOKEN_PROGRAM_ID = "TokenkegQfeZyiNwAJbNbGKPFXCWuBvf9Ss623VQ5DA";
constexpr double LAMPORTS_PER_SOL = 1e9;
}

SolanaRPC::SolanaRPC(const std::vector<std::string>& rpc_urls, std::shared_ptr<HttpClient> http)
    : rpc_urls_(rpc_urls)
    , http_(std::move(http))
    , current_rpc_index_(0)
{
    if (rpc_urls_.empty()) {
        throw std::invalid_argument("At least one RPC URL is required");
    }
}

std::string SolanaRPC::current_url() {
    std::lock_guard<std::mutex> lock(index_mutex_);
    return rpc_urls_[current_rpc_index_];
}

void SolanaRPC::rotate_rpc() {
    std::lock_guard<std::mutex> lock(index_mutex_);
    if (rpc_urls_.size() < 2) return;
    current_rpc_index_ = (current_rpc_index_ + 1) % rpc_urls_.size();
    spdlog::warn("Rotated to RPC endpoint: {}", rpc_urls_[current_rpc_index_]);
}

std::optional<nlohmann::json> SolanaRPC::make_request(const std::string& method,
                                                      const nlohmann::json& params) {
    nlohmann::json payload = {
        {"jsonrpc", "2.0"},
        {"id", 1},
        {"method", method}
    };
    if (!params.is_null()) {
        payload["params"] = params;
    }
    
    auto response = http_->post_json(current_url(), payload);
    if (!response) {
        rotate_rpc();
        return std::nullopt;
    }
    
    if (response->contains("error")) {
        spdlog::error("RPC {} error: {}", method, (*response)["error"].dump());
        return std::nullopt;
    }
    
    if (!response->contains("result")) {
        return std::nullopt;
    }
    
    return (*response)["result"];
}

std::optional<double> SolanaRPC::get_balance(const std::string& address) {
    auto result = make_request("getBalance", nlohmann::json::array({address}));
    if (!result || !result->contains("value")) {
        return std::nullopt;
    }
    
    try {
        return (*result)["value"].get<uint64_t>() / LAMPORTS_PER_SOL;
    } catch (const std::exception& e) {
        spdlog::warn("Failed to parse balance: {}", e.what());
        return std::nullopt;
    }
}

std::vector<TokenHolding> SolanaRPC::get_token_accounts(const std::string& wallet_address) {
    std::vector<TokenHolding> holdings;
    
    nlohmann::json params = {
        wallet_address,
        {{"programId", TOKEN_PROGRAM_ID}},
        {{"encoding", "jsonParsed"}}
    };
    
    auto result = make_request("getTokenAccountsByOwner", params);
    if (!result || !result->contains("value")) {
        return holdings;
    }
    
    for (const auto& account_info : (*result)["value"]) {
        try {
            const auto& parsed = account_info["account"]["data"]["parsed"]["info"];
            
            TokenHolding h;
            h.mint = parsed["mint"].get<std::string>();
            h.amount = std::stoull(parsed["tokenAmount"]["amount"].get<std::string>());
            h.decimals = parsed["tokenAmount"]["decimals"].get<uint8_t>();
            
            // Skip zero balances
            if (h.amount > 0) {
                holdings.push_back(h);
            }
        } catch (const std::exception& e) {
            spdlog::warn("Failed to parse token account: {}", e.what());
        }
    }
    
    spdlog::debug("Found {} token accounts for wallet {}", holdings.size(),
                  util::short_mint(wallet_address));
    return holdings;
}

bool SolanaRPC::is_healthy() {
    auto result = make_request("getHealth", nullptr);
    return result && result->is_string() && result->get<std::string>() == "ok";
}
