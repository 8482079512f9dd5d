#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "../src/token_validator.hpp"
#include "test_stubs.hpp"

using Catch::Matchers::ContainsSubstring;

TEST_CASE("Token validation gate", "[token_validator]") {
    TokenValidatorSettings settings;
    settings.base_mint = kBaseMint;
    settings.max_token_age_ms = 600000;
    TokenValidator validator(settings);
    
    const int64_t now = 10000000;
    Tick tick{0.001, 500.0, now};
    
    SECTION("Fresh token with a price passes") {
        auto r = validator.validate({kMintA, "pump.fun", now - 1000}, tick, now);
        REQUIRE(r.ok);
    }
    
    SECTION("Malformed address fails") {
        auto r = validator.validate({"not-a-mint", "pump.fun", now}, tick, now);
        REQUIRE_FALSE(r.ok);
        REQUIRE_THAT(r.reason, ContainsSubstring("Invalid mint"));
    }
    
    SECTION("Base mint is not tradable") {
        auto r = validator.validate({kBaseMint, "pump.fun", now}, tick, now);
        REQUIRE_FALSE(r.ok);
        REQUIRE(r.terminal);
    }
    
    SECTION("Stale discovery fails") {
        auto r = validator.validate({kMintA, "pump.fun", now - 700000}, tick, now);
        REQUIRE_FALSE(r.ok);
        REQUIRE_THAT(r.reason, ContainsSubstring("stale"));
        REQUIRE(r.terminal);
    }
    
    SECTION("Entries without a discovery time skip the age check") {
        auto r = validator.validate({kMintA, "whitelist", 0}, tick, now);
        REQUIRE(r.ok);
    }
    
    SECTION("Missing or zero price fails") {
        REQUIRE_FALSE(validator.validate({kMintA, "pump.fun", now}, std::nullopt, now).ok);
        
        Tick dead{0.0, 0.0, now};
        auto r = validator.validate({kMintA, "pump.fun", now}, dead, now);
        REQUIRE_FALSE(r.ok);
        REQUIRE(r.reason == "No live price");
        // A price may show up on a later cycle
        REQUIRE_FALSE(r.terminal);
    }
}
