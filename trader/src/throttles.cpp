#include "throttles.hpp"
#include <iterator>

ThrottleManager::ThrottleManager(int64_t reentry_guard_ms, int64_t retry_cooldown_ms)
    : reentry_guard_ms_(reentry_guard_ms), retry_cooldown_ms_(retry_cooldown_ms) {}

bool ThrottleManager::check_reentry_guard(const std::string& mint, int64_t now_ms) const {
    std::lock_guard<std::mutex> lock(mutex_);
    
    auto it = exit_times_.find(mint);
    if (it == exit_times_.end()) return true;
    
    return now_ms - it->second >= reentry_guard_ms_;
}

void ThrottleManager::record_exit(const std::string& mint, int64_t now_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    exit_times_[mint] = now_ms;
}

bool ThrottleManager::check_retry_cooldown(const std::string& mint, int64_t now_ms) const {
    std::lock_guard<std::mutex> lock(mutex_);
    
    auto it = failure_times_.find(mint);
    if (it == failure_times_.end()) return true;
    
    return now_ms - it->second >= retry_cooldown_ms_;
}

void ThrottleManager::record_failure(const std::string& mint, int64_t now_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    failure_times_[mint] = now_ms;
}

void ThrottleManager::clear_failure(const std::string& mint) {
    std::lock_guard<std::mutex> lock(mutex_);
    failure_times_.erase(mint);
}

void ThrottleManager::cleanup_old_records(int64_t now_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    
    // Exit times stay until the guard has lapsed, failures until the cooldown has
    int64_t exit_cutoff = now_ms - reentry_guard_ms_;
    int64_t failure_cutoff = now_ms - retry_cooldown_ms_;
    
    for (auto it = exit_times_.begin(); it != exit_times_.end();) {
        it = it->second < exit_cutoff ? exit_times_.erase(it) : std::next(it);
    }
    for (auto it = failure_times_.begin(); it != failure_times_.end();) {
        it = it->second < failure_cutoff ? failure_times_.erase(it) : std::next(it);
    }
}
