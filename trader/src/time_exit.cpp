#include "time_exit.hpp"
#include "util.hpp"
#include <fmt/format.h>

TimeExitPolicy::TimeExitPolicy(TimeExitSettings settings) : settings_(settings) {}

ExitRecommendation TimeExitPolicy::analyze_time_based_exit(const Position& position) const {
    return analyze_time_based_exit(position, util::current_timestamp_ms());
}

ExitRecommendation TimeExitPolicy::analyze_time_based_exit(const Position& position,
                                                          int64_t now_ms) const {
    ExitRecommendation rec;
    rec.reason = "No time-based exit needed";
    
    int64_t age_ms = now_ms - position.opened_at_ms;
    if (age_ms < settings_.min_hold_ms) {
        return rec;
    }
    
    if (age_ms > settings_.max_hold_unprofitable_ms && position.unrealized_pnl_pct < 0.0) {
        rec.should_exit = true;
        rec.reason = fmt::format("Position unprofitable ({:+.2f}%) after {}s, limit {}s",
                                 position.unrealized_pnl_pct * 100.0,
                                 age_ms / 1000,
                                 settings_.max_hold_unprofitable_ms / 1000);
    }
    
    return rec;
}
