#include "dex_client.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>

DexClient::DexClient(const std::string& base_url, std::shared_ptr<HttpClient> http)
    : base_url_(base_url), http_(std::move(http)) {}

std::optional<Tick> DexClient::get_tick(const std::string& mint) {
    auto response = http_->get_json(base_url_ + "/latest/dex/tokens/" + mint);
    if (!response) {
        return std::nullopt;
    }
    
    auto tick = parse_pairs(*response, util::current_timestamp_ms());
    if (!tick) {
        spdlog::debug("No priced pair for {}", util::short_mint(mint));
    }
    return tick;
}

std::optional<Tick> DexClient::parse_pairs(const nlohmann::json& response, int64_t now_ms) {
    if (!response.contains("pairs") || !response["pairs"].is_array()) {
        return std::nullopt;
    }
    
    std::optional<Tick> best;
    double best_liquidity = -1.0;
    
    for (const auto& pair : response["pairs"]) {
        try {
            if (!pair.contains("priceUsd") || pair["priceUsd"].is_null()) continue;
            
            double price = util::safe_parse_double(pair["priceUsd"].get<std::string>(), 0.0);
            if (price <= 0.0) continue;
            
            double liquidity = 0.0;
            if (pair.contains("liquidity") && pair["liquidity"].contains("usd")) {
                liquidity = pair["liquidity"]["usd"].get<double>();
            }
            
            double volume = 0.0;
            if (pair.contains("volume") && pair["volume"].contains("m5")) {
                volume = pair["volume"]["m5"].get<double>();
            }
            
            if (liquidity > best_liquidity) {
                best_liquidity = liquidity;
                best = Tick{price, volume, now_ms};
            }
        } catch (const std::exception& e) {
            spdlog::debug("Skipping malformed pair: {}", e.what());
        }
    }
    
    return best;
}
