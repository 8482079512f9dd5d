#pragma once

#include "http_client.hpp"
#include "types.hpp"
#include <memory>
#include <optional>
#include <string>

// Live price and short-window volume for a token from DexScreener pairs.
class DexClient {
public:
    DexClient(const std::string& base_url, std::shared_ptr<HttpClient> http);
    
    std::optional<Tick> get_tick(const std::string& mint);
    
    // Picks the most liquid pair of a /tokens response.
    static std::optional<Tick> parse_pairs(const nlohmann::json& response, int64_t now_ms);
    
private:
    std::string base_url_;
    std::shared_ptr<HttpClient> http_;
};
