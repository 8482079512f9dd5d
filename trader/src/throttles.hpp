#pragma once

#include <string>
#include <map>
#include <mutex>
#include <cstdint>

// Per-token timing guards: how soon a disposed token may be bought again,
// and how long to wait after a failed trade before retrying it.
class ThrottleManager {
public:
    ThrottleManager(int64_t reentry_guard_ms, int64_t retry_cooldown_ms);
    
    bool check_reentry_guard(const std::string& mint, int64_t now_ms) const;
    void record_exit(const std::string& mint, int64_t now_ms);
    
    bool check_retry_cooldown(const std::string& mint, int64_t now_ms) const;
    void record_failure(const std::string& mint, int64_t now_ms);
    void clear_failure(const std::string& mint);
    
    void cleanup_old_records(int64_t now_ms);
    
private:
    int64_t reentry_guard_ms_;
    int64_t retry_cooldown_ms_;
    
    mutable std::mutex mutex_;
    std::map<std::string, int64_t> exit_times_;
    std::map<std::string, int64_t> failure_times_;
};
