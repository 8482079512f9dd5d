#include "rug_detector.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace {

// Maps how far a measured drop overshoots its threshold onto [floor, ceiling].
double scaled_severity(double drop, double threshold, double floor, double ceiling) {
    double headroom = 1.0 - threshold;
    double excess = headroom > 0.0 ? (drop - threshold) / headroom : 1.0;
    excess = std::clamp(excess, 0.0, 1.0);
    return floor + (ceiling - floor) * excess;
}

}

RugDetector::RugDetector(RugDetectorSettings settings) : settings_(settings) {}

RugAnalysis RugDetector::analyze_tick(const std::string& mint, double price, double volume) {
    return analyze_tick(mint, price, volume, util::current_timestamp_ms());
}

RugAnalysis RugDetector::analyze_tick(const std::string& mint, double price, double volume,
                                      int64_t timestamp_ms) {
    if (!(price > 0.0) || !std::isfinite(price)) {
        throw std::invalid_argument("Tick price must be positive");
    }
    if (volume < 0.0 || !std::isfinite(volume)) {
        volume = 0.0;
    }
    
    std::lock_guard<std::mutex> lock(mutex_);
    auto& window = windows_[mint];
    
    RugAnalysis result;
    double max_severity = 0.0;
    double total_severity = 0.0;
    
    auto apply = [&](const std::string& reason, double severity) {
        result.reasons.insert(reason);
        total_severity += severity;
        max_severity = std::max(max_severity, severity);
    };
    
    if (!window.empty()) {
        const auto& prev = window.back();
        
        // Extreme price drop vs the immediately preceding sample
        double drop = 1.0 - price / prev.price;
        if (drop >= settings_.extreme_drop_pct) {
            apply("extreme price drop",
                  scaled_severity(drop, settings_.extreme_drop_pct, settings_.urgent_severity, 1.0));
        }
        
        // Volume collapse vs the average of the most recent prior samples
        size_t n = std::min(settings_.volume_avg_samples, window.size());
        double avg_volume = 0.0;
        for (size_t i = window.size() - n; i < window.size(); i++) {
            avg_volume += window[i].volume;
        }
        avg_volume /= n;
        
        if (avg_volume > 0.0) {
            double collapse = 1.0 - volume / avg_volume;
            if (collapse >= settings_.volume_collapse_pct) {
                apply("volume collapse",
                      scaled_severity(collapse, settings_.volume_collapse_pct, 0.4, 0.6));
            }
        }
        
        // Sustained decline from the window high
        if (window.size() + 1 >= settings_.min_decline_samples) {
            double high = price;
            for (const auto& s : window) high = std::max(high, s.price);
            double decline = 1.0 - price / high;
            if (decline >= settings_.sustained_decline_pct) {
                apply("sustained decline",
                      scaled_severity(decline, settings_.sustained_decline_pct, 0.3, 0.6));
            }
        }
    }
    
    window.push_back({price, volume, timestamp_ms});
    while (window.size() > settings_.window_size) {
        window.pop_front();
    }
    
    if (!result.reasons.empty()) {
        result.is_rug_pull = true;
        result.confidence = std::min(1.0, total_severity);
        result.urgency = max_severity >= settings_.urgent_severity ? RugUrgency::High
                                                                   : RugUrgency::Medium;
        
        std::string joined;
        for (const auto& r : result.reasons) {
            if (!joined.empty()) joined += ", ";
            joined += r;
        }
        spdlog::warn("Rug signal on {}: {} (confidence {:.2f}, urgency {})",
                     util::short_mint(mint), joined, result.confidence,
                     urgency_string(result.urgency));
    }
    
    return result;
}

void RugDetector::cleanup() {
    cleanup(util::current_timestamp_ms());
}

void RugDetector::cleanup(int64_t now_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    
    int64_t cutoff_ms = now_ms - settings_.retention_ms;
    size_t evicted = 0;
    
    for (auto it = windows_.begin(); it != windows_.end();) {
        auto& window = it->second;
        while (!window.empty() && window.front().timestamp_ms < cutoff_ms) {
            window.pop_front();
            evicted++;
        }
        if (window.empty()) {
            it = windows_.erase(it);
        } else {
            ++it;
        }
    }
    
    if (evicted > 0) {
        spdlog::debug("Rug detector evicted {} stale samples, tracking {} tokens",
                      evicted, windows_.size());
    }
}

void RugDetector::forget(const std::string& mint) {
    std::lock_guard<std::mutex> lock(mutex_);
    windows_.erase(mint);
}

size_t RugDetector::tracked_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return windows_.size();
}

size_t RugDetector::window_size(const std::string& mint) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = windows_.find(mint);
    return it == windows_.end() ? 0 : it->second.size();
}
