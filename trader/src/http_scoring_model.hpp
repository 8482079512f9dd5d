#pragma once

#include "scoring_model.hpp"
#include "http_client.hpp"
#include <memory>
#include <string>

class HttpScoringModel : public ScoringModel {
public:
    HttpScoringModel(const std::string& url, const std::string& api_key,
                     std::shared_ptr<HttpClient> http);
    
    std::optional<ModelVerdict> score(const ScoringRequest& request) override;
    
    static std::optional<ModelVerdict> parse_verdict(const nlohmann::json& response);
    
private:
    std::string url_;
    std::string api_key_;
    std::shared_ptr<HttpClient> http_;
};
