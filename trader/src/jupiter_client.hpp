#pragma once

#include "http_client.hpp"
#include "types.hpp"
#include <memory>
#include <optional>
#include <string>

class JupiterClient {
public:
    JupiterClient(const std::string& base_url, std::shared_ptr<HttpClient> http, int slippage_bps = 100);
    
    std::optional<Quote> get_quote(const std::string& input_mint, const std::string& output_mint,
                                   uint64_t amount);
    std::optional<std::string> get_swap_transaction(const Quote& quote, const std::string& wallet);
    
    static std::optional<Quote> parse_quote(const nlohmann::json& response);
    
private:
    std::string base_url_;
    std::shared_ptr<HttpClient> http_;
    int slippage_bps_;
};
