#pragma once

#include "http_client.hpp"
#include "types.hpp"
#include <string>
#include <vector>
#include <memory>
#include <mutex>
#include <optional>
#include <nlohmann/json.hpp>

class SolanaRPC {
public:
    SolanaRPC(const std::vector<std::string>& rpc_urls, std::shared_ptr<HttpClient> http);
    
    std::optional<double> get_balance(const std::string& address);
    std::vector<TokenHolding> get_token_accounts(const std::string& wallet_address);
    bool is_healthy();
    
private:
    std::vector<std::string> rpc_urls_;
    std::shared_ptr<HttpClient> http_;
    std::mutex index_mutex_;
    size_t current_rpc_index_;
    
    std::optional<nlohmann::json> make_request(const std::string& method, const nlohmann::json& params);
    std::string current_url();
    void rotate_rpc();
};
