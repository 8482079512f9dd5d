#include "trailing_stop.hpp"
#include <fmt/format.h>
#include <algorithm>

TrailingStop::TrailingStop(TrailingStopSettings settings) : settings_(settings) {}

double TrailingStop::stop_price(const Position& position) const {
    double hard_stop = position.entry_price * (1.0 - settings_.hard_stop_loss_pct);
    if (!position.trailing_stop_armed) {
        return hard_stop;
    }
    return std::max(hard_stop, position.peak_price * (1.0 - settings_.trail_pct));
}

ExitRecommendation TrailingStop::evaluate(const Position& position) const {
    ExitRecommendation rec;
    
    if (position.unrealized_pnl_pct <= -settings_.hard_stop_loss_pct) {
        rec.should_exit = true;
        rec.reason = fmt::format("Hard stop loss hit ({:+.2f}%)",
                                 position.unrealized_pnl_pct * 100.0);
        return rec;
    }
    
    if (position.trailing_stop_armed &&
        position.current_price <= position.peak_price * (1.0 - settings_.trail_pct)) {
        rec.should_exit = true;
        rec.reason = fmt::format("Trailing stop hit: {:.8f} is {:.2f}% below peak {:.8f}",
                                 position.current_price,
                                 (1.0 - position.current_price / position.peak_price) * 100.0,
                                 position.peak_price);
        return rec;
    }
    
    rec.reason = "Within stops";
    return rec;
}
