#pragma once

#include "position_book.hpp"
#include "time_exit.hpp"

struct TrailingStopSettings {
    double trail_pct = 0.03;
    double hard_stop_loss_pct = 0.15;
};

// Price-based exits: a fixed stop loss below entry and, once the position
// has armed its trailing stop, a stop that follows the peak.
class TrailingStop {
public:
    explicit TrailingStop(TrailingStopSettings settings = {});
    
    ExitRecommendation evaluate(const Position& position) const;
    double stop_price(const Position& position) const;
    
private:
    TrailingStopSettings settings_;
};
