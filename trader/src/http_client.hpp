#pragma once

#include <string>
#include <vector>
#include <optional>
#include <functional>
#include <nlohmann/json.hpp>

struct HttpResponse {
    long status = 0;            // 0 when the transfer itself failed
    std::string body;
    std::string error;
    
    bool transport_ok() const { return error.empty(); }
    bool ok() const { return transport_ok() && status >= 200 && status < 300; }
};

// Thin libcurl wrapper. Every call uses its own easy handle, so one client
// can be shared across worker threads.
class HttpClient {
public:
    explicit HttpClient(int timeout_ms = 8000);
    
    void set_retry_backoff(int min_ms, int max_ms);
    void set_max_retries(int retries);
    
    HttpResponse get(const std::string& url, const std::vector<std::string>& headers = {});
    HttpResponse post(const std::string& url, const std::string& body,
                      const std::vector<std::string>& headers = {});
    
    // Parsed JSON of a 2xx reply; transport errors and 5xx are retried.
    std::optional<nlohmann::json> get_json(const std::string& url,
                                           const std::vector<std::string>& headers = {});
    std::optional<nlohmann::json> post_json(const std::string& url, const nlohmann::json& body,
                                            const std::vector<std::string>& headers = {});
    
private:
    int timeout_ms_;
    int backoff_min_ms_ = 200;
    int backoff_max_ms_ = 800;
    int max_retries_ = 2;
    
    HttpResponse perform(const std::string& url, const std::string* body,
                         const std::vector<std::string>& headers);
    std::optional<nlohmann::json> with_retries(const std::string& url,
                                               const std::function<HttpResponse()>& call);
    
    static size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp);
};
