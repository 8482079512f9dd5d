#pragma once

#include <string>
#include <set>
#include <map>
#include <deque>
#include <mutex>
#include <cstdint>

enum class RugUrgency {
    Low,
    Medium,
    High
};

inline std::string urgency_string(RugUrgency urgency) {
    switch (urgency) {
        case RugUrgency::Low: return "low";
        case RugUrgency::Medium: return "medium";
        case RugUrgency::High: return "high";
    }
    return "unknown";
}

struct RugAnalysis {
    bool is_rug_pull = false;
    double confidence = 0.0;
    RugUrgency urgency = RugUrgency::Low;
    std::set<std::string> reasons;
};

struct RugDetectorSettings {
    double extreme_drop_pct = 0.40;      // vs previous sample
    double volume_collapse_pct = 0.90;   // vs rolling average of prior volume
    double sustained_decline_pct = 0.25; // vs window maximum
    size_t volume_avg_samples = 3;
    size_t min_decline_samples = 3;
    size_t window_size = 10;
    int64_t retention_ms = 5 * 60 * 1000;
    double urgent_severity = 0.7;
};

// Per-token anomaly scorer over a bounded tick window. Each rule yields a
// severity in [0,1]; confidence is their sum clipped to 1.
class RugDetector {
public:
    explicit RugDetector(RugDetectorSettings settings = {});
    
    RugAnalysis analyze_tick(const std::string& mint, double price, double volume,
                             int64_t timestamp_ms);
    RugAnalysis analyze_tick(const std::string& mint, double price, double volume);
    
    // Drops samples older than the retention window; forgets idle tokens.
    void cleanup(int64_t now_ms);
    void cleanup();
    void forget(const std::string& mint);
    
    size_t tracked_count() const;
    size_t window_size(const std::string& mint) const;
    
private:
    struct Sample {
        double price;
        double volume;
        int64_t timestamp_ms;
    };
    
    RugDetectorSettings settings_;
    mutable std::mutex mutex_;
    std::map<std::string, std::deque<Sample>> windows_;
};
