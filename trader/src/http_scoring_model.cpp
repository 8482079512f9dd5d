#include "http_scoring_model.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>

HttpScoringModel::HttpScoringModel(const std::string& url, const std::string& api_key,
                                   std::shared_ptr<HttpClient> http)
    : url_(url), api_key_(api_key), http_(std::move(http)) {}

std::optional<ModelVerdict> HttpScoringModel::score(const ScoringRequest& request) {
    nlohmann::json body = {
        {"mint", request.mint},
        {"source", request.source},
        {"prices", request.prices},
        {"held", request.held}
    };
    
    std::vector<std::string> headers;
    if (!api_key_.empty()) {
        headers.push_back("Authorization: Bearer " + api_key_);
    }
    
    auto response = http_->post_json(url_, body, headers);
    if (!response) {
        spdlog::warn("Scoring model unavailable for {}", util::short_mint(request.mint));
        return std::nullopt;
    }
    return parse_verdict(*response);
}

std::optional<ModelVerdict> HttpScoringModel::parse_verdict(const nlohmann::json& response) {
    try {
        std::string action = response.at("action").get<std::string>();
        std::transform(action.begin(), action.end(), action.begin(),
                       [](unsigned char c) { return std::tolower(c); });
        
        ModelVerdict verdict;
        if (action == "buy") {
            verdict.action = ModelAction::Buy;
        } else if (action == "sell") {
            verdict.action = ModelAction::Sell;
        } else if (action == "hold") {
            verdict.action = ModelAction::Hold;
        } else {
            spdlog::warn("Unknown model action '{}'", action);
            return std::nullopt;
        }
        
        verdict.confidence = std::clamp(response.at("confidence").get<double>(), 0.0, 1.0);
        verdict.reasoning = response.value("reasoning", std::string());
        return verdict;
        
    } catch (const std::exception& e) {
        spdlog::warn("Malformed model verdict: {}", e.what());
        return std::nullopt;
    }
}
