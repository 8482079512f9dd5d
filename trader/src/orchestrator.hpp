#pragma once

#include "types.hpp"
#include "market_data.hpp"
#include "discovery.hpp"
#include "strategy.hpp"
#include "execution_gateway.hpp"
#include "position_book.hpp"
#include "rug_detector.hpp"
#include "trend_filter.hpp"
#include "time_exit.hpp"
#include "trailing_stop.hpp"
#include "token_validator.hpp"
#include "throttles.hpp"
#include "trade_listener.hpp"
#include "worker_pool.hpp"
#include "keyed_mutex.hpp"
#include <nlohmann/json.hpp>
#include <atomic>
#include <condition_variable>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>

struct OrchestratorSettings {
    int64_t cycle_interval_ms = 30 * 1000;
    size_t worker_threads = 4;
    size_t max_known_tokens = 10;
    size_t max_concurrent_positions = 10;
    size_t price_window = 50;
    size_t discovery_batch = 20;
    double notional_per_trade = 0.0013;   // base currency committed per buy
    double rug_exit_confidence = 0.7;
    bool block_buy = false;
    std::string wallet_address;
    std::vector<std::string> whitelist;
    
    PositionBookSettings positions;
    RugDetectorSettings rug;
    TrendFilterSettings trend;
    TimeExitSettings time_exit;
    TrailingStopSettings trailing;
    TokenValidatorSettings validator;
    int64_t reentry_guard_ms = 5 * 60 * 1000;
    int64_t retry_cooldown_ms = 15 * 1000;
    
    // Discoveries not bought within this time give up their slot
    int64_t pending_ttl_ms = 30 * 1000;
    // Held positions without a price for this many cycles are sold
    int max_missed_ticks = 5;
    // Dropped mints remembered so the feed cannot re-add them
    size_t retired_memory = 1000;
};

struct OrchestratorStatus {
    bool running;
    int64_t uptime_ms;
    size_t active_tokens;
    size_t open_positions;
    int successful_trades;
    int failed_trades;
    int64_t cycles;
    std::optional<double> balance;
    std::string strategy;
    size_t whitelist_size;
    
    nlohmann::json to_json() const;
};

class Orchestrator {
public:
    Orchestrator(OrchestratorSettings settings,
                 std::shared_ptr<MarketDataPort> market,
                 std::shared_ptr<DiscoveryFeed> discovery,
                 std::shared_ptr<ExecutionGateway> gateway,
                 std::unique_ptr<TradingStrategy> strategy);
    ~Orchestrator();
    
    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;
    
    void start();
    // Waits for the running cycle, including in-flight swaps, to finish.
    void stop();
    OrchestratorStatus status() const;
    
    // Whitelist changes apply from the next cycle on.
    void add_to_whitelist(const std::string& mint);
    void remove_from_whitelist(const std::string& mint);
    std::vector<std::string> whitelist() const;
    
    void add_listener(std::shared_ptr<TradeListener> listener);
    
    // One scheduling pass over every monitored token.
    void run_cycle();
    
    std::optional<TokenLifecycleState> lifecycle(const std::string& mint) const;
    const PositionBook& positions() const { return book_; }
    
private:
    struct TokenRecord {
        TokenMeta meta;
        TokenLifecycleState state = TokenLifecycleState::Discovered;
        bool discovery_pending = true;
        std::deque<double> prices;
        int64_t tracked_since_ms = 0;
        int64_t disposed_at_ms = 0;
        int missed_ticks = 0;
    };
    
    enum class Admission {
        Accept,
        Skip,
        Reject
    };
    
    class CycleRuntime;
    class BuySlot;
    
    OrchestratorSettings settings_;
    std::shared_ptr<MarketDataPort> market_;
    std::shared_ptr<DiscoveryFeed> discovery_;
    std::shared_ptr<ExecutionGateway> gateway_;
    std::unique_ptr<TradingStrategy> strategy_;
    
    PositionBook book_;
    RugDetector rug_;
    TrendFilter trend_;
    TimeExitPolicy time_exit_;
    TrailingStop trailing_;
    TokenValidator validator_;
    ThrottleManager throttles_;
    
    mutable std::mutex records_mutex_;
    std::map<std::string, TokenRecord> records_;
    std::set<std::string> retired_;
    std::deque<std::string> retired_order_;
    KeyedMutex token_locks_;
    
    mutable std::mutex whitelist_mutex_;
    std::set<std::string> whitelist_;
    
    mutable std::mutex listeners_mutex_;
    std::vector<std::shared_ptr<TradeListener>> listeners_;
    
    // Buys admitted but not yet committed to the book
    std::mutex capacity_mutex_;
    size_t reserved_buys_ = 0;
    
    mutable std::mutex balance_mutex_;
    std::optional<double> balance_;
    
    std::atomic<bool> running_{false};
    std::atomic<int64_t> started_at_ms_{0};
    std::atomic<int> successful_trades_{0};
    std::atomic<int> failed_trades_{0};
    std::atomic<int64_t> cycles_{0};
    
    std::mutex cycle_mutex_;
    std::mutex loop_mutex_;
    std::condition_variable loop_cv_;
    std::thread loop_thread_;
    
    WorkerPool pool_;
    
    void run_loop();
    std::set<std::string> whitelist_snapshot() const;
    void ingest_discoveries(int64_t now_ms);
    void sync_whitelist(const std::set<std::string>& whitelist, int64_t now_ms);
    void prune_records(const std::set<std::string>& whitelist, int64_t now_ms);
    void retire_locked(const std::string& mint);
    void retire(const std::string& mint);
    std::vector<std::string> monitored_tokens() const;
    
    void evaluate_token(const std::string& mint, const TradingRuntime& runtime);
    std::optional<TradeIntent> protective_exit(const std::string& mint, double price,
                                               const RugAnalysis& rug, int64_t now_ms);
    void missing_price(const std::string& mint, int64_t now_ms);
    Admission admit(const TradeIntent& intent, const TokenRecord& record, const Tick& tick,
                    const RugAnalysis& rug, int64_t now_ms) const;
    void execute_and_commit(const TradeIntent& intent, const Tick& tick, int64_t now_ms);
    
    std::optional<TokenRecord> find_record(const std::string& mint) const;
    std::vector<double> append_price(const std::string& mint, double price);
    void set_state(const std::string& mint, TokenLifecycleState state, int64_t now_ms);
    void clear_discovery_pending(const std::string& mint);
    
    void refresh_balance();
    void notify_trade(const TradeEvent& event);
    void notify_alert(const std::string& mint, const std::string& kind, const std::string& message);
};
