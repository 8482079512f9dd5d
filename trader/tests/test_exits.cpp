#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "../src/time_exit.hpp"
#include "../src/trailing_stop.hpp"
#include "../src/position_book.hpp"

using Catch::Matchers::WithinAbs;
using Catch::Matchers::ContainsSubstring;

namespace {

Position make_position(double entry, double current, double peak, int64_t opened_at_ms,
                       bool armed = false) {
    Position pos;
    pos.mint = "mintA";
    pos.entry_price = entry;
    pos.notional_value = 0.5;
    pos.current_price = current;
    pos.peak_price = peak;
    pos.price_history = {entry, current};
    pos.trailing_stop_armed = armed;
    pos.opened_at_ms = opened_at_ms;
    pos.updated_at_ms = opened_at_ms;
    pos.unrealized_pnl_pct = current / entry - 1.0;
    pos.volatility = 0.0;
    return pos;
}

}

TEST_CASE("Time-based exit", "[time_exit]") {
    TimeExitPolicy policy;
    const int64_t opened = 1000000;
    
    SECTION("Young positions are never exited") {
        auto rec = policy.analyze_time_based_exit(make_position(1.0, 0.5, 1.0, opened), opened + 2000);
        REQUIRE_FALSE(rec.should_exit);
        REQUIRE(rec.reason == "No time-based exit needed");
    }
    
    SECTION("Losing position past the limit is exited") {
        auto rec = policy.analyze_time_based_exit(make_position(1.0, 0.95, 1.0, opened), opened + 50000);
        REQUIRE(rec.should_exit);
        REQUIRE_THAT(rec.reason, ContainsSubstring("unprofitable"));
        REQUIRE_THAT(rec.reason, ContainsSubstring("45s"));
    }
    
    SECTION("Losing position inside the limit is kept") {
        auto rec = policy.analyze_time_based_exit(make_position(1.0, 0.95, 1.0, opened), opened + 30000);
        REQUIRE_FALSE(rec.should_exit);
    }
    
    SECTION("Profitable positions are kept regardless of age") {
        auto rec = policy.analyze_time_based_exit(make_position(1.0, 1.2, 1.2, opened), opened + 3600000);
        REQUIRE_FALSE(rec.should_exit);
    }
    
    SECTION("Break-even is not a loss") {
        auto rec = policy.analyze_time_based_exit(make_position(1.0, 1.0, 1.0, opened), opened + 60000);
        REQUIRE_FALSE(rec.should_exit);
    }
}

TEST_CASE("Trailing and hard stops", "[trailing_stop]") {
    TrailingStop stop;
    
    SECTION("Hard stop fires below the loss limit") {
        auto rec = stop.evaluate(make_position(1.0, 0.80, 1.0, 0));
        REQUIRE(rec.should_exit);
        REQUIRE_THAT(rec.reason, ContainsSubstring("Hard stop"));
    }
    
    SECTION("Small loss stays within stops") {
        auto rec = stop.evaluate(make_position(1.0, 0.90, 1.0, 0));
        REQUIRE_FALSE(rec.should_exit);
        REQUIRE(rec.reason == "Within stops");
    }
    
    SECTION("Unarmed trailing stop ignores pullbacks") {
        auto rec = stop.evaluate(make_position(1.0, 1.02, 1.10, 0, false));
        REQUIRE_FALSE(rec.should_exit);
    }
    
    SECTION("Armed trailing stop fires on a pullback from peak") {
        auto rec = stop.evaluate(make_position(1.0, 1.06, 1.10, 0, true));
        REQUIRE(rec.should_exit);
        REQUIRE_THAT(rec.reason, ContainsSubstring("Trailing stop"));
    }
    
    SECTION("Armed trailing stop holds near the peak") {
        auto rec = stop.evaluate(make_position(1.0, 1.09, 1.10, 0, true));
        REQUIRE_FALSE(rec.should_exit);
    }
    
    SECTION("Stop price follows the peak once armed") {
        REQUIRE_THAT(stop.stop_price(make_position(1.0, 1.0, 1.0, 0)), WithinAbs(0.85, 1e-9));
        REQUIRE_THAT(stop.stop_price(make_position(1.0, 1.2, 1.2, 0, true)), WithinAbs(1.164, 1e-9));
    }
}
