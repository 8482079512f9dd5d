#include "jupiter_client.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>

JupiterClient::JupiterClient(const std::string& base_url, std::shared_ptr<HttpClient> http,
                             int slippage_bps)
    : base_url_(base_url), http_(std::move(http)), slippage_bps_(slippage_bps) {}

std::optional<Quote> JupiterClient::get_quote(const std::string& input_mint,
                                              const std::string& output_mint,
                                              uint64_t amount) {
    std::string url = fmt::format("{}/quote?inputMint={}&outputMint={}&amount={}&slippageBps={}",
                                  base_url_, input_mint, output_mint, amount, slippage_bps_);
    
    auto response = http_->get_json(url);
    if (!response) {
        return std::nullopt;
    }
    
    auto quote = parse_quote(*response);
    if (!quote) {
        spdlog::warn("No route from {} to {}", util::short_mint(input_mint),
                     util::short_mint(output_mint));
    }
    return quote;
}

std::optional<Quote> JupiterClient::parse_quote(const nlohmann::json& response) {
    try {
        if (!response.contains("inAmount") || !response.contains("outAmount")) {
            return std::nullopt;
        }
        
        Quote q;
        q.input_mint = response.at("inputMint").get<std::string>();
        q.output_mint = response.at("outputMint").get<std::string>();
        q.in_amount = std::stoull(response.at("inAmount").get<std::string>());
        q.out_amount = std::stoull(response.at("outAmount").get<std::string>());
        q.price_impact_pct = util::safe_parse_double(response.value("priceImpactPct", "0"), 0.0);
        q.fetched_at_ms = util::current_timestamp_ms();
        q.raw = response;
        
        if (q.out_amount == 0) {
            return std::nullopt;
        }
        return q;
        
    } catch (const std::exception& e) {
        spdlog::warn("Failed to parse quote: {}", e.what());
        return std::nullopt;
    }
}

std::optional<std::string> JupiterClient::get_swap_transaction(const Quote& quote,
                                                               const std::string& wallet) {
    nlohmann::json body = {
        {"quoteResponse", quote.raw},
        {"userPublicKey", wallet},
        {"wrapAndUnwrapSol", true},
        {"dynamicComputeUnitLimit", true}
    };
    
    auto response = http_->post_json(base_url_ + "/swap", body);
    if (!response) {
        return std::nullopt;
    }
    
    if (!response->contains("swapTransaction") || !(*response)["swapTransaction"].is_string()) {
        spdlog::warn("Swap response without transaction: {}", response->dump().substr(0, 200));
        return std::nullopt;
    }
    
    return (*response)["swapTransaction"].get<std::string>();
}
