#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "../src/orchestrator.hpp"
#include "../src/oscillator_strategy.hpp"
#include "../src/priority_strategy.hpp"
#include "../src/model_strategy.hpp"
#include "test_stubs.hpp"
#include <thread>
#include <chrono>
#include <stdexcept>

using Catch::Matchers::ContainsSubstring;

namespace {

class RecordingListener : public TradeListener {
public:
    void on_trade(const TradeEvent& event) override {
        std::lock_guard<std::mutex> lock(mutex_);
        trades.push_back(event);
    }
    
    void on_alert(const std::string& mint, const std::string& kind, const std::string& message) override {
        std::lock_guard<std::mutex> lock(mutex_);
        alerts.push_back({mint, kind, message});
    }
    
    struct Alert {
        std::string mint;
        std::string kind;
        std::string message;
    };
    
    std::vector<TradeEvent> trades;
    std::vector<Alert> alerts;
    
private:
    std::mutex mutex_;
};

class ThrowingListener : public TradeListener {
public:
    void on_trade(const TradeEvent&) override { throw std::runtime_error("sink down"); }
    void on_alert(const std::string&, const std::string&, const std::string&) override {
        throw std::runtime_error("sink down");
    }
};

OrchestratorSettings test_settings() {
    OrchestratorSettings s;
    s.cycle_interval_ms = 60000;
    s.worker_threads = 2;
    s.wallet_address = kMintC;
    s.validator.base_mint = kBaseMint;
    return s;
}

std::unique_ptr<TradingStrategy> fast_oscillator() {
    OscillatorSettings settings;
    settings.rsi_period = 3;
    return std::make_unique<OscillatorStrategy>(settings);
}

struct Harness {
    std::shared_ptr<StubMarketData> market = std::make_shared<StubMarketData>();
    std::shared_ptr<StubSigner> signer = std::make_shared<StubSigner>();
    std::shared_ptr<StubFeed> feed = std::make_shared<StubFeed>();
    std::shared_ptr<RecordingListener> listener = std::make_shared<RecordingListener>();
    std::shared_ptr<ExecutionGateway> gateway;
    
    Harness() {
        ExecutionSettings exec;
        exec.wallet_address = kMintC;
        exec.base_mint = kBaseMint;
        exec.buy_amount = 1300000;
        exec.retry_delay_ms = 0;
        gateway = std::make_shared<ExecutionGateway>(market, signer, exec);
    }
    
    std::unique_ptr<Orchestrator> make(OrchestratorSettings settings,
                                       std::unique_ptr<TradingStrategy> strategy,
                                       bool with_feed = true) {
        auto o = std::make_unique<Orchestrator>(settings, market, with_feed ? feed : nullptr,
                                                gateway, std::move(strategy));
        o->add_listener(listener);
        return o;
    }
};

}

TEST_CASE("Token lifecycle end to end", "[orchestrator]") {
    Harness h;
    auto orchestrator = h.make(test_settings(), fast_oscillator());
    
    h.feed->push(kMintA);
    h.market->script_prices(kMintA, {1.0, 1.1, 1.2, 1.3});
    h.market->set_holding(kMintA, 5000);
    
    // Discovery buy without history
    orchestrator->run_cycle();
    REQUIRE(orchestrator->lifecycle(kMintA) == TokenLifecycleState::Held);
    REQUIRE(orchestrator->positions().contains(kMintA));
    REQUIRE(orchestrator->positions().get(kMintA)->entry_price == 1.0);
    
    // Not enough history for an exit signal yet
    orchestrator->run_cycle();
    orchestrator->run_cycle();
    REQUIRE(orchestrator->lifecycle(kMintA) == TokenLifecycleState::Held);
    REQUIRE(orchestrator->positions().get(kMintA)->trailing_stop_armed);
    
    // RSI reaches overbought on the fourth rising tick
    orchestrator->run_cycle();
    REQUIRE(orchestrator->lifecycle(kMintA) == TokenLifecycleState::Disposed);
    REQUIRE_FALSE(orchestrator->positions().contains(kMintA));
    
    auto status = orchestrator->status();
    REQUIRE(status.successful_trades == 2);
    REQUIRE(status.failed_trades == 0);
    REQUIRE(status.open_positions == 0);
    REQUIRE(status.active_tokens == 0);
    REQUIRE(status.cycles == 4);
    
    REQUIRE(h.listener->trades.size() == 2);
    REQUIRE(h.listener->trades[0].intent.action == TradeAction::Buy);
    REQUIRE(h.listener->trades[1].intent.action == TradeAction::Sell);
    REQUIRE(h.listener->trades[1].result.in_amount == 5000);
    REQUIRE(h.listener->trades[1].strategy == "oscillator");
    
    SECTION("Disposed discoveries are never bought again") {
        h.feed->push(kMintA);
        orchestrator->run_cycle();
        REQUIRE(orchestrator->lifecycle(kMintA) == TokenLifecycleState::Disposed);
        REQUIRE(h.signer->submissions == 2);
    }
}

TEST_CASE("Protective exits override the strategy", "[orchestrator]") {
    Harness h;
    h.market->set_holding(kMintA, 5000);
    h.feed->push(kMintA);
    
    SECTION("Rug pull forces a sell and raises an alert") {
        auto orchestrator = h.make(test_settings(), fast_oscillator());
        h.market->script_prices(kMintA, {1.0, 0.5});
        
        orchestrator->run_cycle();
        REQUIRE(orchestrator->lifecycle(kMintA) == TokenLifecycleState::Held);
        
        orchestrator->run_cycle();
        REQUIRE(orchestrator->lifecycle(kMintA) == TokenLifecycleState::Disposed);
        
        const auto& sell = h.listener->trades.back();
        REQUIRE(sell.intent.forced);
        REQUIRE(sell.intent.action == TradeAction::Sell);
        REQUIRE_THAT(sell.intent.reason, ContainsSubstring("Rug pull"));
        
        REQUIRE(h.listener->alerts.size() == 1);
        REQUIRE(h.listener->alerts[0].kind == "rug_pull");
    }
    
    SECTION("Trailing stop locks in gains") {
        auto orchestrator = h.make(test_settings(), fast_oscillator());
        h.market->script_prices(kMintA, {1.0, 1.1, 1.05});
        
        orchestrator->run_cycle();
        orchestrator->run_cycle();
        REQUIRE(orchestrator->lifecycle(kMintA) == TokenLifecycleState::Held);
        
        orchestrator->run_cycle();
        REQUIRE(orchestrator->lifecycle(kMintA) == TokenLifecycleState::Disposed);
        REQUIRE(h.listener->trades.back().intent.forced);
        REQUIRE_THAT(h.listener->trades.back().intent.reason, ContainsSubstring("Trailing stop"));
    }
    
    SECTION("Unprofitable positions are closed after the hold limit") {
        auto settings = test_settings();
        settings.time_exit.min_hold_ms = 0;
        settings.time_exit.max_hold_unprofitable_ms = 1;
        auto orchestrator = h.make(settings, fast_oscillator());
        h.market->script_prices(kMintA, {1.0, 0.95});
        
        orchestrator->run_cycle();
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        orchestrator->run_cycle();
        
        REQUIRE(orchestrator->lifecycle(kMintA) == TokenLifecycleState::Disposed);
        REQUIRE_THAT(h.listener->trades.back().intent.reason, ContainsSubstring("unprofitable"));
    }
}

TEST_CASE("Buy admission", "[orchestrator]") {
    Harness h;
    
    SECTION("Buying can be disabled") {
        auto settings = test_settings();
        settings.block_buy = true;
        auto orchestrator = h.make(settings, fast_oscillator());
        h.feed->push(kMintA);
        h.market->script_prices(kMintA, {1.0});
        
        orchestrator->run_cycle();
        REQUIRE(orchestrator->lifecycle(kMintA) == TokenLifecycleState::Discovered);
        REQUIRE(h.signer->submissions == 0);
    }
    
    SECTION("Position limit holds under parallel evaluation") {
        auto settings = test_settings();
        settings.max_concurrent_positions = 1;
        auto orchestrator = h.make(settings, fast_oscillator());
        h.feed->push(kMintA);
        h.feed->push(kMintB);
        h.market->script_prices(kMintA, {1.0});
        h.market->script_prices(kMintB, {2.0});
        
        orchestrator->run_cycle();
        REQUIRE(orchestrator->positions().count() == 1);
        REQUIRE(h.signer->submissions == 1);
    }
    
    SECTION("Discovery stops at the tracked token limit") {
        auto settings = test_settings();
        settings.max_known_tokens = 1;
        auto orchestrator = h.make(settings, fast_oscillator());
        h.feed->push(kMintA);
        h.feed->push(kMintB);
        
        orchestrator->run_cycle();
        REQUIRE(orchestrator->lifecycle(kMintA).has_value());
        REQUIRE_FALSE(orchestrator->lifecycle(kMintB).has_value());
    }
    
    SECTION("Invalid discoveries are dropped for good") {
        auto orchestrator = h.make(test_settings(), fast_oscillator());
        h.feed->push(kBaseMint);
        h.market->script_prices(kBaseMint, {1.0});
        
        orchestrator->run_cycle();
        REQUIRE_FALSE(orchestrator->lifecycle(kBaseMint).has_value());
        REQUIRE(h.signer->submissions == 0);
        
        h.feed->push(kBaseMint);
        orchestrator->run_cycle();
        REQUIRE_FALSE(orchestrator->lifecycle(kBaseMint).has_value());
    }
    
    SECTION("Discoveries survive a cycle without a price") {
        auto orchestrator = h.make(test_settings(), std::make_unique<PriorityStrategy>());
        h.feed->push(kMintA);
        h.market->script_prices(kMintA, {0.0, 1.0});
        
        orchestrator->run_cycle();
        REQUIRE(orchestrator->lifecycle(kMintA) == TokenLifecycleState::Discovered);
        REQUIRE(h.signer->submissions == 0);
        
        orchestrator->run_cycle();
        REQUIRE(orchestrator->lifecycle(kMintA) == TokenLifecycleState::Held);
    }
    
    SECTION("Tokens without a usable tick are skipped") {
        auto orchestrator = h.make(test_settings(), fast_oscillator());
        h.feed->push(kMintA);
        h.feed->push(kMintB);
        h.market->script_prices(kMintB, {-1.0});
        
        orchestrator->run_cycle();
        REQUIRE(orchestrator->lifecycle(kMintA) == TokenLifecycleState::Discovered);
        REQUIRE(orchestrator->lifecycle(kMintB) == TokenLifecycleState::Discovered);
        REQUIRE(h.signer->submissions == 0);
        REQUIRE(orchestrator->status().cycles == 1);
    }
}

TEST_CASE("Tracked token housekeeping", "[orchestrator]") {
    Harness h;
    
    SECTION("Unbought discoveries expire and free their slot") {
        auto settings = test_settings();
        settings.max_known_tokens = 1;
        settings.pending_ttl_ms = 50;
        auto orchestrator = h.make(settings, std::make_unique<PriorityStrategy>());
        
        h.feed->push(kMintA);
        h.market->script_prices(kMintA, {1.0});
        h.signer->script(SubmitStatus::Rejected, "slippage exceeded");
        
        orchestrator->run_cycle();
        REQUIRE(orchestrator->lifecycle(kMintA) == TokenLifecycleState::Discovered);
        REQUIRE(h.signer->submissions == 1);
        
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        h.feed->push(kMintB);
        h.market->script_prices(kMintB, {2.0});
        
        orchestrator->run_cycle();
        REQUIRE_FALSE(orchestrator->lifecycle(kMintA).has_value());
        REQUIRE(orchestrator->lifecycle(kMintB) == TokenLifecycleState::Held);
        REQUIRE(h.signer->submissions == 2);
        
        // The expired token is not picked up again from the feed
        h.feed->push(kMintA);
        orchestrator->run_cycle();
        REQUIRE_FALSE(orchestrator->lifecycle(kMintA).has_value());
    }
    
    SECTION("Whitelisted tokens never expire") {
        auto settings = test_settings();
        settings.pending_ttl_ms = 0;
        settings.whitelist = {kMintB};
        settings.block_buy = true;
        auto orchestrator = h.make(settings, std::make_unique<PriorityStrategy>(), false);
        h.market->script_prices(kMintB, {1.0});
        
        orchestrator->run_cycle();
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
        orchestrator->run_cycle();
        REQUIRE(orchestrator->lifecycle(kMintB) == TokenLifecycleState::Discovered);
    }
    
    SECTION("Disposed records are released after the re-entry guard") {
        auto settings = test_settings();
        settings.reentry_guard_ms = 0;
        auto model = std::make_shared<StubScoringModel>();
        auto orchestrator = h.make(settings,
                                   std::make_unique<ModelAssistedStrategy>(model, ModelStrategySettings{}));
        h.feed->push(kMintA);
        h.market->script_prices(kMintA, {1.0});
        h.market->set_holding(kMintA, 5000);
        
        model->verdict = ModelVerdict{ModelAction::Buy, 0.9, "inflow"};
        orchestrator->run_cycle();
        REQUIRE(orchestrator->lifecycle(kMintA) == TokenLifecycleState::Held);
        
        model->verdict = ModelVerdict{ModelAction::Sell, 0.9, "exit"};
        orchestrator->run_cycle();
        REQUIRE(orchestrator->lifecycle(kMintA) == TokenLifecycleState::Disposed);
        
        orchestrator->run_cycle();
        REQUIRE_FALSE(orchestrator->lifecycle(kMintA).has_value());
        
        // Rediscovery is still suppressed
        model->verdict = ModelVerdict{ModelAction::Buy, 0.9, "inflow"};
        h.feed->push(kMintA);
        orchestrator->run_cycle();
        REQUIRE_FALSE(orchestrator->lifecycle(kMintA).has_value());
        REQUIRE(h.signer->submissions == 2);
    }
    
    SECTION("Suppression memory is bounded") {
        auto settings = test_settings();
        settings.retired_memory = 1;
        settings.pending_ttl_ms = 50;
        settings.block_buy = true;
        auto orchestrator = h.make(settings, fast_oscillator());
        h.feed->push(kMintA);
        h.feed->push(kMintB);
        
        orchestrator->run_cycle();
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        orchestrator->run_cycle();
        REQUIRE_FALSE(orchestrator->lifecycle(kMintA).has_value());
        REQUIRE_FALSE(orchestrator->lifecycle(kMintB).has_value());
        
        // Only the most recently dropped mint is still remembered
        h.feed->push(kMintA);
        h.feed->push(kMintB);
        orchestrator->run_cycle();
        REQUIRE(orchestrator->lifecycle(kMintA) == TokenLifecycleState::Discovered);
        REQUIRE_FALSE(orchestrator->lifecycle(kMintB).has_value());
    }
}

TEST_CASE("Positions without a price feed", "[orchestrator]") {
    Harness h;
    h.feed->push(kMintA);
    h.market->set_holding(kMintA, 5000);
    
    SECTION("Sold after consecutive missed ticks") {
        auto settings = test_settings();
        settings.max_missed_ticks = 2;
        auto orchestrator = h.make(settings, fast_oscillator());
        h.market->script_prices(kMintA, {1.0});
        
        orchestrator->run_cycle();
        REQUIRE(orchestrator->lifecycle(kMintA) == TokenLifecycleState::Held);
        
        h.market->drop_ticks(kMintA);
        orchestrator->run_cycle();
        REQUIRE(orchestrator->lifecycle(kMintA) == TokenLifecycleState::Held);
        
        orchestrator->run_cycle();
        REQUIRE(orchestrator->lifecycle(kMintA) == TokenLifecycleState::Disposed);
        
        const auto& sell = h.listener->trades.back();
        REQUIRE(sell.intent.forced);
        REQUIRE(sell.intent.action == TradeAction::Sell);
        REQUIRE_THAT(sell.intent.reason, ContainsSubstring("No price"));
        REQUIRE(h.listener->alerts.back().kind == "price_lost");
    }
    
    SECTION("A returning price resets the miss count") {
        auto settings = test_settings();
        settings.max_missed_ticks = 2;
        auto orchestrator = h.make(settings, fast_oscillator());
        h.market->script_prices(kMintA, {1.0});
        orchestrator->run_cycle();
        
        h.market->drop_ticks(kMintA);
        orchestrator->run_cycle();
        h.market->script_prices(kMintA, {1.0});
        orchestrator->run_cycle();
        h.market->drop_ticks(kMintA);
        orchestrator->run_cycle();
        
        REQUIRE(orchestrator->lifecycle(kMintA) == TokenLifecycleState::Held);
    }
    
    SECTION("Time exit still applies to the last known position") {
        auto settings = test_settings();
        settings.max_missed_ticks = 100;
        settings.time_exit.min_hold_ms = 0;
        settings.time_exit.max_hold_unprofitable_ms = 200;
        auto orchestrator = h.make(settings, fast_oscillator());
        h.market->script_prices(kMintA, {1.0, 0.95});
        
        orchestrator->run_cycle();
        orchestrator->run_cycle();
        REQUIRE(orchestrator->lifecycle(kMintA) == TokenLifecycleState::Held);
        
        h.market->drop_ticks(kMintA);
        std::this_thread::sleep_for(std::chrono::milliseconds(300));
        orchestrator->run_cycle();
        
        REQUIRE(orchestrator->lifecycle(kMintA) == TokenLifecycleState::Disposed);
        REQUIRE(h.listener->trades.back().intent.forced);
        REQUIRE_THAT(h.listener->trades.back().intent.reason, ContainsSubstring("unprofitable"));
    }
}

TEST_CASE("Failed trades", "[orchestrator]") {
    Harness h;
    auto orchestrator = h.make(test_settings(), fast_oscillator());
    h.feed->push(kMintA);
    h.market->script_prices(kMintA, {1.0});
    h.signer->script(SubmitStatus::Rejected, "slippage exceeded");
    
    orchestrator->run_cycle();
    
    REQUIRE(orchestrator->lifecycle(kMintA) == TokenLifecycleState::Discovered);
    REQUIRE_FALSE(orchestrator->positions().contains(kMintA));
    REQUIRE(orchestrator->status().failed_trades == 1);
    
    REQUIRE(h.listener->trades.size() == 1);
    REQUIRE_FALSE(h.listener->trades[0].result.success);
    REQUIRE(h.listener->alerts.size() == 1);
    REQUIRE(h.listener->alerts[0].kind == "trade_failed");
    REQUIRE_THAT(h.listener->alerts[0].message, ContainsSubstring("slippage exceeded"));
}

TEST_CASE("Whitelist", "[orchestrator][whitelist]") {
    Harness h;
    h.market->script_prices(kMintB, {1.0});
    h.market->set_holding(kMintB, 100);
    
    SECTION("Whitelisted tokens are monitored and bought") {
        auto settings = test_settings();
        settings.whitelist = {kMintB};
        auto orchestrator = h.make(settings, std::make_unique<PriorityStrategy>(), false);
        
        orchestrator->run_cycle();
        REQUIRE(orchestrator->lifecycle(kMintB) == TokenLifecycleState::Held);
        REQUIRE(h.listener->trades[0].intent.reason == "Whitelisted token");
        
        // Held positions survive removal from the list
        orchestrator->remove_from_whitelist(kMintB);
        orchestrator->run_cycle();
        REQUIRE(orchestrator->lifecycle(kMintB) == TokenLifecycleState::Held);
        REQUIRE(orchestrator->whitelist().empty());
    }
    
    SECTION("Additions apply from the next cycle") {
        auto orchestrator = h.make(test_settings(), std::make_unique<PriorityStrategy>(), false);
        orchestrator->run_cycle();
        REQUIRE_FALSE(orchestrator->lifecycle(kMintB).has_value());
        
        orchestrator->add_to_whitelist(kMintB);
        REQUIRE(orchestrator->status().whitelist_size == 1);
        
        orchestrator->run_cycle();
        REQUIRE(orchestrator->lifecycle(kMintB) == TokenLifecycleState::Held);
    }
    
    SECTION("Idle entries are dropped when unlisted") {
        auto settings = test_settings();
        settings.whitelist = {kMintB};
        settings.block_buy = true;
        auto orchestrator = h.make(settings, std::make_unique<PriorityStrategy>(), false);
        
        orchestrator->run_cycle();
        REQUIRE(orchestrator->lifecycle(kMintB) == TokenLifecycleState::Discovered);
        
        orchestrator->remove_from_whitelist(kMintB);
        orchestrator->run_cycle();
        REQUIRE_FALSE(orchestrator->lifecycle(kMintB).has_value());
    }
    
    SECTION("Disposed whitelisted tokens re-arm after the re-entry guard") {
        auto settings = test_settings();
        settings.whitelist = {kMintB};
        settings.reentry_guard_ms = 0;
        auto model = std::make_shared<StubScoringModel>();
        auto orchestrator = h.make(settings,
                                   std::make_unique<ModelAssistedStrategy>(model, ModelStrategySettings{}),
                                   false);
        
        model->verdict = ModelVerdict{ModelAction::Buy, 0.9, "listed"};
        orchestrator->run_cycle();
        REQUIRE(orchestrator->lifecycle(kMintB) == TokenLifecycleState::Held);
        
        model->verdict = ModelVerdict{ModelAction::Sell, 0.9, "take profit"};
        orchestrator->run_cycle();
        REQUIRE(orchestrator->lifecycle(kMintB) == TokenLifecycleState::Disposed);
        
        model->verdict = ModelVerdict{ModelAction::Buy, 0.9, "listed"};
        orchestrator->run_cycle();
        REQUIRE(orchestrator->lifecycle(kMintB) == TokenLifecycleState::Held);
        REQUIRE(orchestrator->status().successful_trades == 3);
    }
}

TEST_CASE("Listener failures do not disturb trading", "[orchestrator]") {
    Harness h;
    auto orchestrator = h.make(test_settings(), fast_oscillator());
    orchestrator->add_listener(std::make_shared<ThrowingListener>());
    h.feed->push(kMintA);
    h.market->script_prices(kMintA, {1.0});
    
    orchestrator->run_cycle();
    REQUIRE(orchestrator->lifecycle(kMintA) == TokenLifecycleState::Held);
    REQUIRE(h.listener->trades.size() == 1);
}

TEST_CASE("Orchestrator status and scheduling", "[orchestrator]") {
    Harness h;
    auto orchestrator = h.make(test_settings(), fast_oscillator());
    
    SECTION("Status reflects the last cycle") {
        orchestrator->run_cycle();
        auto status = orchestrator->status();
        
        REQUIRE_FALSE(status.running);
        REQUIRE(status.balance.has_value());
        REQUIRE(*status.balance == 1.5);
        REQUIRE(status.strategy == "oscillator");
        
        auto j = status.to_json();
        REQUIRE(j["balance_sol"].get<double>() == 1.5);
        REQUIRE(j["open_positions"].get<size_t>() == 0);
        REQUIRE(j.contains("uptime_ms"));
    }
    
    SECTION("Unknown balance is reported as null") {
        h.market->sol_balance.reset();
        orchestrator->run_cycle();
        REQUIRE(orchestrator->status().to_json()["balance_sol"].is_null());
    }
    
    SECTION("Start runs cycles until stopped") {
        orchestrator->start();
        REQUIRE(orchestrator->status().running);
        
        for (int i = 0; i < 200 && orchestrator->status().cycles == 0; i++) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        REQUIRE(orchestrator->status().cycles >= 1);
        
        orchestrator->stop();
        REQUIRE_FALSE(orchestrator->status().running);
        
        // Second stop is a no-op
        orchestrator->stop();
    }
    
    SECTION("Collaborators are required") {
        REQUIRE_THROWS_AS(Orchestrator(test_settings(), nullptr, nullptr, h.gateway, fast_oscillator()),
                          std::invalid_argument);
    }
}
