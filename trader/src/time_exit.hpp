#pragma once

#include "position_book.hpp"
#include <string>
#include <cstdint>

struct ExitRecommendation {
    bool should_exit = false;
    std::string reason;
};

struct TimeExitSettings {
    int64_t min_hold_ms = 5 * 1000;
    int64_t max_hold_unprofitable_ms = 45 * 1000;
};

// Closes positions that stayed under water for too long. Profitable
// positions are never exited on age alone.
class TimeExitPolicy {
public:
    explicit TimeExitPolicy(TimeExitSettings settings = {});
    
    ExitRecommendation analyze_time_based_exit(const Position& position, int64_t now_ms) const;
    ExitRecommendation analyze_time_based_exit(const Position& position) const;
    
private:
    TimeExitSettings settings_;
};
