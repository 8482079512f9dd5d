#include "remote_signer.hpp"
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>

namespace {

bool mentions_expiry(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return text.find("expired") != std::string::npos
        || text.find("blockhash not found") != std::string::npos
        || text.find("blockhashnotfound") != std::string::npos;
}

}

RemoteSigner::RemoteSigner(const std::string& url, const std::string& api_key,
                           std::shared_ptr<HttpClient> http)
    : url_(url), api_key_(api_key), http_(std::move(http)) {}

SubmitResult RemoteSigner::sign_and_submit(const std::string& unsigned_tx) {
    nlohmann::json body = {
        {"transaction", unsigned_tx},
        {"encoding", "base64"},
        {"commitment", "confirmed"}
    };
    
    // Not retried here: a resubmission must go through a fresh quote
    auto response = http_->post(url_ + "/sign-and-submit", body.dump(),
                                {"Authorization: Bearer " + api_key_});
    auto result = interpret(response);
    
    if (result.status != SubmitStatus::Confirmed) {
        spdlog::warn("Signer returned {}: {}", submit_status_string(result.status), result.message);
    }
    return result;
}

SubmitResult RemoteSigner::interpret(const HttpResponse& response) {
    if (!response.transport_ok()) {
        return {SubmitStatus::NetworkError, "", response.error};
    }
    
    nlohmann::json parsed;
    try {
        parsed = nlohmann::json::parse(response.body);
    } catch (const std::exception&) {
        parsed = nlohmann::json::object();
    }
    if (!parsed.is_object()) {
        parsed = nlohmann::json::object();
    }
    
    std::string message = parsed.value("error", std::string());
    if (message.empty()) {
        message = parsed.value("message", response.body.substr(0, 200));
    }
    
    if (response.ok()) {
        std::string signature = parsed.value("signature", std::string());
        if (!signature.empty()) {
            return {SubmitStatus::Confirmed, signature, "confirmed"};
        }
        if (mentions_expiry(message)) {
            return {SubmitStatus::QuoteExpired, "", message};
        }
        return {SubmitStatus::Rejected, "", message.empty() ? "No signature in reply" : message};
    }
    
    if (mentions_expiry(message)) {
        return {SubmitStatus::QuoteExpired, "", message};
    }
    if (response.status >= 500) {
        return {SubmitStatus::NetworkError, "", "HTTP " + std::to_string(response.status) + ": " + message};
    }
    return {SubmitStatus::Rejected, "", "HTTP " + std::to_string(response.status) + ": " + message};
}
