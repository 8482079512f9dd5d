#include <catch2/catch_test_macros.hpp>
#include "../src/throttles.hpp"

TEST_CASE("Throttle manager", "[throttles]") {
    ThrottleManager mgr(300000, 15000);
    
    SECTION("Re-entry guard blocks until it lapses") {
        REQUIRE(mgr.check_reentry_guard("SOL", 1000));
        
        mgr.record_exit("SOL", 1000);
        
        REQUIRE_FALSE(mgr.check_reentry_guard("SOL", 2000));
        REQUIRE(mgr.check_reentry_guard("SOL", 301000));
        REQUIRE(mgr.check_reentry_guard("BONK", 2000));
    }
    
    SECTION("Retry cooldown after a failed trade") {
        mgr.record_failure("SOL", 1000);
        
        REQUIRE_FALSE(mgr.check_retry_cooldown("SOL", 5000));
        REQUIRE(mgr.check_retry_cooldown("SOL", 16000));
    }
    
    SECTION("Success clears the cooldown") {
        mgr.record_failure("SOL", 1000);
        mgr.clear_failure("SOL");
        
        REQUIRE(mgr.check_retry_cooldown("SOL", 1001));
    }
    
    SECTION("Cleanup keeps live records") {
        mgr.record_exit("SOL", 1000);
        mgr.record_failure("BONK", 1000);
        
        mgr.cleanup_old_records(10000);
        REQUIRE_FALSE(mgr.check_reentry_guard("SOL", 10000));
        REQUIRE_FALSE(mgr.check_retry_cooldown("BONK", 10000));
        
        mgr.cleanup_old_records(400000);
        REQUIRE(mgr.check_reentry_guard("SOL", 2000));
        REQUIRE(mgr.check_retry_cooldown("BONK", 2000));
    }
}
