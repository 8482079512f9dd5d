#include "http_client.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <curl/curl.h>
#include <thread>
#include <chrono>

HttpClient::HttpClient(int timeout_ms) : timeout_ms_(timeout_ms) {}

void HttpClient::set_retry_backoff(int min_ms, int max_ms) {
    backoff_min_ms_ = min_ms;
    backoff_max_ms_ = max_ms;
}

void HttpClient::set_max_retries(int retries) {
    max_retries_ = retries < 0 ? 0 : retries;
}

size_t HttpClient::write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    ((std::string*)userp)->append((char*)contents, size * nmemb);
    return size * nmemb;
}

HttpResponse HttpClient::perform(const std::string& url, const std::string* body,
                                 const std::vector<std::string>& headers) {
    HttpResponse response;
    
    CURL* curl = curl_easy_init();
    if (!curl) {
        response.error = "Failed to initialize CURL";
        return response;
    }
    
    struct curl_slist* header_list = NULL;
    header_list = curl_slist_append(header_list, "Accept: application/json");
    if (body) {
        header_list = curl_slist_append(header_list, "Content-Type: application/json");
    }
    for (const auto& h : headers) {
        header_list = curl_slist_append(header_list, h.c_str());
    }
    
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms_));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);
    if (body) {
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body->c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body->size()));
    }
    
    CURLcode res = curl_easy_perform(curl);
    if (res != CURLE_OK) {
        response.error = curl_easy_strerror(res);
    } else {
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);
    }
    
    curl_slist_free_all(header_list);
    curl_easy_cleanup(curl);
    return response;
}

HttpResponse HttpClient::get(const std::string& url, const std::vector<std::string>& headers) {
    return perform(url, nullptr, headers);
}

HttpResponse HttpClient::post(const std::string& url, const std::string& body,
                              const std::vector<std::string>& headers) {
    return perform(url, &body, headers);
}

std::optional<nlohmann::json> HttpClient::with_retries(const std::string& url,
                                                       const std::function<HttpResponse()>& call) {
    for (int attempt = 0; attempt <= max_retries_; attempt++) {
        if (attempt > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(
                util::random_jitter(backoff_min_ms_, backoff_max_ms_) * attempt));
        }
        
        auto response = call();
        
        if (!response.transport_ok()) {
            spdlog::warn("HTTP request to {} failed: {}", url, response.error);
            continue;
        }
        if (response.status >= 500 || response.status == 429) {
            spdlog::warn("HTTP {} from {}", response.status, url);
            continue;
        }
        if (!response.ok()) {
            spdlog::error("HTTP {} from {}: {}", response.status, url, response.body.substr(0, 200));
            return std::nullopt;
        }
        
        try {
            return nlohmann::json::parse(response.body);
        } catch (const std::exception& e) {
            spdlog::error("Failed to parse response from {}: {}", url, e.what());
            return std::nullopt;
        }
    }
    
    return std::nullopt;
}

std::optional<nlohmann::json> HttpClient::get_json(const std::string& url,
                                                   const std::vector<std::string>& headers) {
    return with_retries(url, [&]() { return get(url, headers); });
}

std::optional<nlohmann::json> HttpClient::post_json(const std::string& url, const nlohmann::json& body,
                                                    const std::vector<std::string>& headers) {
    std::string payload = body.dump();
    return with_retries(url, [&]() { return post(url, payload, headers); });
}
