#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "../src/position_book.hpp"
#include <deque>

using Catch::Matchers::WithinAbs;

TEST_CASE("Position book", "[position_book]") {
    PositionBook book;
    
    SECTION("Open records entry price and history") {
        auto pos = book.open("mintA", 2.0, 0.5, 1000);
        
        REQUIRE(pos.entry_price == 2.0);
        REQUIRE(pos.current_price == 2.0);
        REQUIRE(pos.peak_price == 2.0);
        REQUIRE(pos.price_history.size() == 1);
        REQUIRE(pos.price_history.front() == 2.0);
        REQUIRE_FALSE(pos.trailing_stop_armed);
        REQUIRE(pos.opened_at_ms == 1000);
        REQUIRE(book.contains("mintA"));
        REQUIRE(book.count() == 1);
    }
    
    SECTION("Opening a held token twice is a state conflict") {
        book.open("mintA", 1.0, 0.5);
        
        try {
            book.open("mintA", 1.5, 0.5);
            FAIL("expected PositionError");
        } catch (const PositionError& e) {
            REQUIRE(e.kind() == PositionErrorKind::AlreadyHeld);
        }
        REQUIRE(book.get("mintA")->entry_price == 1.0);
    }
    
    SECTION("Non-positive prices are rejected") {
        REQUIRE_THROWS_AS(book.open("mintA", 0.0, 0.5), std::invalid_argument);
        REQUIRE_THROWS_AS(book.open("mintA", -1.0, 0.5), std::invalid_argument);
        REQUIRE_FALSE(book.contains("mintA"));
        
        book.open("mintA", 1.0, 0.5);
        REQUIRE_THROWS_AS(book.update("mintA", 0.0), std::invalid_argument);
    }
    
    SECTION("Updating an unknown token fails") {
        try {
            book.update("missing", 1.0);
            FAIL("expected PositionError");
        } catch (const PositionError& e) {
            REQUIRE(e.kind() == PositionErrorKind::NotFound);
        }
    }
    
    SECTION("Update recomputes pnl and tracks the peak") {
        book.open("mintA", 1.0, 0.5);
        
        auto pos = book.update("mintA", 1.2);
        REQUIRE_THAT(pos.unrealized_pnl_pct, WithinAbs(0.2, 1e-9));
        REQUIRE(pos.peak_price == 1.2);
        
        pos = book.update("mintA", 0.9);
        REQUIRE_THAT(pos.unrealized_pnl_pct, WithinAbs(-0.1, 1e-9));
        REQUIRE(pos.peak_price == 1.2);
        REQUIRE(pos.price_history.size() == 3);
        REQUIRE(pos.volatility > 0.0);
    }
    
    SECTION("Trailing stop arms once profit passes activation and stays armed") {
        book.open("mintA", 1.0, 0.5);
        
        REQUIRE_FALSE(book.update("mintA", 1.04).trailing_stop_armed);
        REQUIRE(book.update("mintA", 1.06).trailing_stop_armed);
        REQUIRE(book.update("mintA", 0.95).trailing_stop_armed);
    }
    
    SECTION("Remove returns the closed position") {
        book.open("mintA", 1.0, 0.5);
        book.update("mintA", 1.1);
        
        auto closed = book.remove("mintA");
        REQUIRE(closed.has_value());
        REQUIRE(closed->current_price == 1.1);
        REQUIRE_FALSE(book.contains("mintA"));
        REQUIRE_FALSE(book.remove("mintA").has_value());
    }
}

TEST_CASE("Position history is bounded", "[position_book]") {
    PositionBookSettings settings;
    settings.history_capacity = 5;
    PositionBook book(settings);
    
    book.open("mintA", 1.0, 0.5);
    for (int i = 1; i <= 10; i++) {
        book.update("mintA", 1.0 + i * 0.01);
    }
    
    auto pos = book.get("mintA");
    REQUIRE(pos->price_history.size() == 5);
    REQUIRE_THAT(pos->price_history.back(), WithinAbs(1.10, 1e-9));
    REQUIRE(book.snapshot().size() == 1);
}

TEST_CASE("Volatility of a price series", "[position_book]") {
    SECTION("Flat prices have no volatility") {
        REQUIRE(PositionBook::compute_volatility({1.0, 1.0, 1.0}) == 0.0);
        REQUIRE(PositionBook::compute_volatility({1.0}) == 0.0);
    }
    
    SECTION("Alternating returns") {
        // returns +10%, -10%: mean 0, population stddev 0.1
        std::deque<double> prices{1.0, 1.1, 0.99};
        REQUIRE_THAT(PositionBook::compute_volatility(prices), WithinAbs(0.1, 1e-9));
    }
}
