#include "orchestrator.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <chrono>
#include <cmath>
#include <future>
#include <iterator>

class Orchestrator::CycleRuntime : public TradingRuntime {
public:
    CycleRuntime(const PositionBook& book, const std::set<std::string>& whitelist)
        : book_(book), whitelist_(whitelist) {}
    
    bool is_held(const std::string& mint) const override { return book_.contains(mint); }
    size_t open_positions() const override { return book_.count(); }
    bool is_whitelisted(const std::string& mint) const override {
        return whitelist_.count(mint) > 0;
    }
    
private:
    const PositionBook& book_;
    const std::set<std::string>& whitelist_;
};

class Orchestrator::BuySlot {
public:
    explicit BuySlot(Orchestrator& owner) : owner_(owner) {
        std::lock_guard<std::mutex> lock(owner_.capacity_mutex_);
        if (owner_.book_.count() + owner_.reserved_buys_ < owner_.settings_.max_concurrent_positions) {
            owner_.reserved_buys_++;
            acquired_ = true;
        }
    }
    
    ~BuySlot() {
        if (!acquired_) return;
        std::lock_guard<std::mutex> lock(owner_.capacity_mutex_);
        owner_.reserved_buys_--;
    }
    
    BuySlot(const BuySlot&) = delete;
    BuySlot& operator=(const BuySlot&) = delete;
    
    bool acquired() const { return acquired_; }
    
private:
    Orchestrator& owner_;
    bool acquired_ = false;
};

namespace {

TradeIntent forced_sell(const std::string& mint, const std::string& reason, double price) {
    TradeIntent intent;
    intent.mint = mint;
    intent.action = TradeAction::Sell;
    intent.forced = true;
    intent.reason = reason;
    intent.reference_price = price;
    return intent;
}

}

nlohmann::json OrchestratorStatus::to_json() const {
    return {
        {"running", running},
        {"uptime_ms", uptime_ms},
        {"active_tokens", active_tokens},
        {"open_positions", open_positions},
        {"successful_trades", successful_trades},
        {"failed_trades", failed_trades},
        {"cycles", cycles},
        {"balance_sol", balance ? nlohmann::json(*balance) : nlohmann::json(nullptr)},
        {"strategy", strategy},
        {"whitelist_size", whitelist_size}
    };
}

Orchestrator::Orchestrator(OrchestratorSettings settings,
                           std::shared_ptr<MarketDataPort> market,
                           std::shared_ptr<DiscoveryFeed> discovery,
                           std::shared_ptr<ExecutionGateway> gateway,
                           std::unique_ptr<TradingStrategy> strategy)
    : settings_(std::move(settings))
    , market_(std::move(market))
    , discovery_(std::move(discovery))
    , gateway_(std::move(gateway))
    , strategy_(std::move(strategy))
    , book_(settings_.positions)
    , rug_(settings_.rug)
    , trend_(settings_.trend)
    , time_exit_(settings_.time_exit)
    , trailing_(settings_.trailing)
    , validator_(settings_.validator)
    , throttles_(settings_.reentry_guard_ms, settings_.retry_cooldown_ms)
    , whitelist_(settings_.whitelist.begin(), settings_.whitelist.end())
    , pool_(settings_.worker_threads)
{
    if (!market_ || !gateway_ || !strategy_) {
        throw std::invalid_argument("Orchestrator needs market data, a gateway and a strategy");
    }
}

Orchestrator::~Orchestrator() {
    stop();
    pool_.shutdown();
}

void Orchestrator::start() {
    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true)) {
        spdlog::warn("Orchestrator already running");
        return;
    }
    
    if (loop_thread_.joinable()) {
        loop_thread_.join();
    }
    
    started_at_ms_ = util::current_timestamp_ms();
    loop_thread_ = std::thread(&Orchestrator::run_loop, this);
    spdlog::info("Orchestrator started ({} strategy, cycle {}s, {} workers)",
                 strategy_->name(), settings_.cycle_interval_ms / 1000, pool_.size());
}

void Orchestrator::stop() {
    {
        std::lock_guard<std::mutex> lock(loop_mutex_);
        if (!running_) {
            return;
        }
        running_ = false;
    }
    loop_cv_.notify_all();
    
    if (loop_thread_.joinable()) {
        loop_thread_.join();
    }
    spdlog::info("Orchestrator stopped");
}

void Orchestrator::run_loop() {
    spdlog::info("Scheduling loop running");
    
    while (running_) {
        auto cycle_start = util::current_timestamp_ms();
        
        try {
            run_cycle();
        } catch (const std::exception& e) {
            spdlog::error("Cycle failed: {}", e.what());
        }
        
        auto elapsed = util::current_timestamp_ms() - cycle_start;
        auto sleep_ms = settings_.cycle_interval_ms - elapsed;
        if (sleep_ms <= 0) {
            continue;
        }
        
        std::unique_lock<std::mutex> lock(loop_mutex_);
        loop_cv_.wait_for(lock, std::chrono::milliseconds(sleep_ms), [this] { return !running_; });
    }
    
    spdlog::info("Scheduling loop exited");
}

void Orchestrator::run_cycle() {
    std::lock_guard<std::mutex> cycle_lock(cycle_mutex_);
    
    auto now = util::current_timestamp_ms();
    auto whitelist = whitelist_snapshot();
    
    prune_records(whitelist, now);
    ingest_discoveries(now);
    sync_whitelist(whitelist, now);
    
    auto monitored = monitored_tokens();
    CycleRuntime runtime(book_, whitelist);
    
    std::vector<std::future<void>> pending;
    pending.reserve(monitored.size());
    for (const auto& mint : monitored) {
        pending.push_back(pool_.submit([this, mint, &runtime]() {
            evaluate_token(mint, runtime);
        }));
    }
    
    for (auto& f : pending) {
        try {
            f.get();
        } catch (const std::exception& e) {
            spdlog::error("Token task failed: {}", e.what());
        }
    }
    
    auto done = util::current_timestamp_ms();
    rug_.cleanup(done);
    throttles_.cleanup_old_records(done);
    refresh_balance();
    cycles_++;
    
    spdlog::debug("Cycle complete: {} tokens in {}ms, {} positions open",
                  monitored.size(), done - now, book_.count());
}

std::set<std::string> Orchestrator::whitelist_snapshot() const {
    std::lock_guard<std::mutex> lock(whitelist_mutex_);
    return whitelist_;
}

void Orchestrator::ingest_discoveries(int64_t now_ms) {
    if (!discovery_) return;
    
    std::vector<TokenMeta> batch;
    try {
        batch = discovery_->poll(settings_.discovery_batch);
    } catch (const std::exception& e) {
        spdlog::error("Discovery poll failed: {}", e.what());
        return;
    }
    
    std::lock_guard<std::mutex> lock(records_mutex_);
    
    size_t active = 0;
    for (const auto& [_, rec] : records_) {
        if (rec.state != TokenLifecycleState::Disposed) active++;
    }
    
    for (auto meta : batch) {
        if (meta.mint.empty() || records_.count(meta.mint) || retired_.count(meta.mint)) {
            continue;
        }
        if (active >= settings_.max_known_tokens) {
            spdlog::debug("Ignoring {}: tracking {} tokens already",
                          util::short_mint(meta.mint), active);
            continue;
        }
        if (meta.discovered_at_ms == 0) {
            meta.discovered_at_ms = now_ms;
        }
        
        TokenRecord rec;
        rec.meta = meta;
        rec.tracked_since_ms = now_ms;
        records_.emplace(meta.mint, std::move(rec));
        active++;
        spdlog::info("Discovered {} via {}", util::short_mint(meta.mint), meta.source);
    }
}

void Orchestrator::sync_whitelist(const std::set<std::string>& whitelist, int64_t now_ms) {
    std::lock_guard<std::mutex> lock(records_mutex_);
    
    for (const auto& mint : whitelist) {
        auto it = records_.find(mint);
        if (it == records_.end()) {
            TokenRecord rec;
            rec.meta = {mint, "whitelist", 0};
            rec.tracked_since_ms = now_ms;
            records_.emplace(mint, std::move(rec));
            continue;
        }
        
        auto& rec = it->second;
        if (rec.state == TokenLifecycleState::Disposed && throttles_.check_reentry_guard(mint, now_ms)) {
            rec.state = TokenLifecycleState::Discovered;
            rec.discovery_pending = true;
            rec.meta.discovered_at_ms = 0;
            spdlog::info("Whitelisted {} re-armed for entry", util::short_mint(mint));
        }
    }
    
    // Drop idle whitelist entries that are no longer listed
    for (auto it = records_.begin(); it != records_.end();) {
        const auto& rec = it->second;
        bool stale = rec.meta.source == "whitelist"
            && rec.state != TokenLifecycleState::Held
            && !whitelist.count(it->first);
        it = stale ? records_.erase(it) : std::next(it);
    }
}

void Orchestrator::prune_records(const std::set<std::string>& whitelist, int64_t now_ms) {
    std::vector<std::string> dropped;
    {
        std::lock_guard<std::mutex> lock(records_mutex_);
        
        for (auto it = records_.begin(); it != records_.end();) {
            const auto& [mint, rec] = *it;
            bool expired = false;
            if (!whitelist.count(mint)) {
                if (rec.state == TokenLifecycleState::Disposed) {
                    expired = now_ms - rec.disposed_at_ms >= settings_.reentry_guard_ms;
                } else if (rec.state == TokenLifecycleState::Discovered) {
                    expired = now_ms - rec.tracked_since_ms > settings_.pending_ttl_ms;
                    if (expired) {
                        spdlog::info("Dropping {}: not bought within {}s", util::short_mint(mint),
                                     settings_.pending_ttl_ms / 1000);
                    }
                }
            }
            
            if (!expired) {
                ++it;
                continue;
            }
            dropped.push_back(mint);
            retire_locked(mint);
            it = records_.erase(it);
        }
    }
    
    for (const auto& mint : dropped) {
        rug_.forget(mint);
        trend_.forget(mint);
    }
}

void Orchestrator::retire_locked(const std::string& mint) {
    if (settings_.retired_memory == 0 || !retired_.insert(mint).second) {
        return;
    }
    retired_order_.push_back(mint);
    while (retired_order_.size() > settings_.retired_memory) {
        retired_.erase(retired_order_.front());
        retired_order_.pop_front();
    }
}

void Orchestrator::retire(const std::string& mint) {
    {
        std::lock_guard<std::mutex> lock(records_mutex_);
        records_.erase(mint);
        retire_locked(mint);
    }
    rug_.forget(mint);
    trend_.forget(mint);
}

std::vector<std::string> Orchestrator::monitored_tokens() const {
    std::lock_guard<std::mutex> lock(records_mutex_);
    std::vector<std::string> result;
    for (const auto& [mint, rec] : records_) {
        if (rec.state != TokenLifecycleState::Disposed) {
            result.push_back(mint);
        }
    }
    return result;
}

void Orchestrator::evaluate_token(const std::string& mint, const TradingRuntime& runtime) {
    auto token_lock = token_locks_.acquire(mint);
    
    try {
        auto record = find_record(mint);
        if (!record || record->state == TokenLifecycleState::Disposed) {
            return;
        }
        
        auto now = util::current_timestamp_ms();
        auto tick = market_->tick(mint);
        if (!tick) {
            spdlog::debug("No tick for {}, skipping this cycle", util::short_mint(mint));
        } else if (!(tick->price > 0.0) || !std::isfinite(tick->price) ||
                   tick->volume < 0.0 || !std::isfinite(tick->volume)) {
            spdlog::warn("Malformed tick for {} (price={}, volume={}), skipping",
                         util::short_mint(mint), tick->price, tick->volume);
            tick.reset();
        }
        if (!tick) {
            if (record->state == TokenLifecycleState::Held) {
                missing_price(mint, now);
            }
            return;
        }
        
        auto prices = append_price(mint, tick->price);
        auto tick_ts = tick->timestamp_ms > 0 ? tick->timestamp_ms : now;
        auto rug = rug_.analyze_tick(mint, tick->price, tick->volume, tick_ts);
        auto market_state = trend_.analyze_market(mint, prices);
        
        std::optional<TradeIntent> intent;
        if (record->state == TokenLifecycleState::Held) {
            intent = protective_exit(mint, tick->price, rug, now);
        }
        
        if (!intent) {
            auto kind = record->discovery_pending ? StrategyEventKind::Discovered
                                                  : StrategyEventKind::Tick;
            if (record->discovery_pending) {
                clear_discovery_pending(mint);
            }
            
            intent = strategy_->decide({kind, record->meta, prices}, runtime);
            if (intent) {
                auto admission = admit(*intent, *record, *tick, rug, now);
                if (admission == Admission::Reject && !runtime.is_whitelisted(mint)) {
                    spdlog::info("Dropping {}: cannot pass validation", util::short_mint(mint));
                    retire(mint);
                    return;
                }
                if (admission != Admission::Accept) {
                    intent.reset();
                }
            }
        }
        
        if (!intent) {
            spdlog::debug("{}: {} @ {:.8f}, {}, no action", util::short_mint(mint),
                          lifecycle_string(record->state), tick->price,
                          market_state_string(market_state));
            return;
        }
        
        if (intent->action == TradeAction::Buy) {
            // Parallel evaluations share the position limit
            BuySlot slot(*this);
            if (!slot.acquired()) {
                spdlog::info("buy {} skipped: position limit reached", util::short_mint(mint));
                return;
            }
            execute_and_commit(*intent, *tick, now);
            return;
        }
        
        execute_and_commit(*intent, *tick, now);
        
    } catch (const PositionError& e) {
        spdlog::warn("State conflict on {}: {}", util::short_mint(mint), e.what());
    } catch (const std::exception& e) {
        spdlog::error("Evaluation of {} failed: {}", util::short_mint(mint), e.what());
    }
}

std::optional<TradeIntent> Orchestrator::protective_exit(const std::string& mint, double price,
                                                         const RugAnalysis& rug, int64_t now_ms) {
    auto position = book_.update(mint, price);
    
    auto forced = [&](const std::string& reason) {
        return forced_sell(mint, reason, price);
    };
    
    if (rug.is_rug_pull &&
        (rug.urgency == RugUrgency::High || rug.confidence >= settings_.rug_exit_confidence)) {
        std::string reasons;
        for (const auto& r : rug.reasons) {
            if (!reasons.empty()) reasons += ", ";
            reasons += r;
        }
        auto message = fmt::format("Rug pull suspected ({}, confidence {:.2f})",
                                   reasons, rug.confidence);
        notify_alert(mint, "rug_pull", message);
        return forced(message);
    }
    
    auto stop = trailing_.evaluate(position);
    if (stop.should_exit) {
        return forced(stop.reason);
    }
    
    auto timed = time_exit_.analyze_time_based_exit(position, now_ms);
    if (timed.should_exit) {
        return forced(timed.reason);
    }
    
    return std::nullopt;
}

void Orchestrator::missing_price(const std::string& mint, int64_t now_ms) {
    int misses = 0;
    {
        std::lock_guard<std::mutex> lock(records_mutex_);
        auto it = records_.find(mint);
        if (it == records_.end()) return;
        misses = ++it->second.missed_ticks;
    }
    
    auto position = book_.get(mint);
    if (!position) return;
    
    // The last known position still ages while the feed is down
    std::optional<TradeIntent> intent;
    if (misses >= settings_.max_missed_ticks) {
        auto message = fmt::format("No price for {} consecutive cycles", misses);
        notify_alert(mint, "price_lost", message);
        intent = forced_sell(mint, message, position->current_price);
    } else {
        auto timed = time_exit_.analyze_time_based_exit(*position, now_ms);
        if (timed.should_exit) {
            intent = forced_sell(mint, timed.reason, position->current_price);
        }
    }
    
    if (!intent) {
        spdlog::debug("{}: no price ({} of {} misses)", util::short_mint(mint), misses,
                      settings_.max_missed_ticks);
        return;
    }
    
    Tick last{position->current_price, 0.0, now_ms};
    execute_and_commit(*intent, last, now_ms);
}

Orchestrator::Admission Orchestrator::admit(const TradeIntent& intent, const TokenRecord& record,
                                            const Tick& tick, const RugAnalysis& rug,
                                            int64_t now_ms) const {
    const auto& mint = intent.mint;
    auto skip = [&](const std::string& why) {
        spdlog::info("{} {} skipped: {}", action_string(intent.action), util::short_mint(mint), why);
        return Admission::Skip;
    };
    
    if (intent.action == TradeAction::Sell) {
        if (record.state != TokenLifecycleState::Held) {
            return skip("not held");
        }
        if (!throttles_.check_retry_cooldown(mint, now_ms)) {
            return skip("retry cooldown");
        }
        return Admission::Accept;
    }
    
    if (settings_.block_buy) {
        return skip("buying disabled");
    }
    if (record.state != TokenLifecycleState::Discovered || book_.contains(mint)) {
        return skip("already " + lifecycle_string(record.state));
    }
    if (book_.count() >= settings_.max_concurrent_positions) {
        return skip("position limit reached");
    }
    if (rug.is_rug_pull) {
        return skip("rug signal on latest tick");
    }
    if (!trend_.should_allow_trade(mint)) {
        return skip("choppy market");
    }
    if (!throttles_.check_retry_cooldown(mint, now_ms)) {
        return skip("retry cooldown");
    }
    if (strategy_->requires_validation()) {
        auto validation = validator_.validate(record.meta, tick, now_ms);
        if (!validation.ok) {
            skip("validation failed: " + validation.reason);
            return validation.terminal ? Admission::Reject : Admission::Skip;
        }
    }
    return Admission::Accept;
}

void Orchestrator::execute_and_commit(const TradeIntent& intent, const Tick& tick, int64_t now_ms) {
    const auto& mint = intent.mint;
    spdlog::info("{}{} {}: {}", intent.forced ? "FORCED " : "", action_string(intent.action),
                 util::short_mint(mint), intent.reason);
    
    auto result = gateway_->execute(intent);
    
    if (result.success) {
        if (intent.action == TradeAction::Buy) {
            double entry = result.executed_price > 0.0 ? result.executed_price : tick.price;
            try {
                book_.open(mint, entry, settings_.notional_per_trade, now_ms);
            } catch (const PositionError& e) {
                spdlog::warn("State conflict committing buy of {}: {}", util::short_mint(mint), e.what());
            }
            set_state(mint, TokenLifecycleState::Held, now_ms);
        } else {
            auto closed = book_.remove(mint);
            if (closed) {
                spdlog::info("Closed {}: entry {:.8f}, exit {:.8f}, pnl {:+.2f}%",
                             util::short_mint(mint), closed->entry_price, closed->current_price,
                             closed->unrealized_pnl_pct * 100.0);
            }
            set_state(mint, TokenLifecycleState::Disposed, now_ms);
            throttles_.record_exit(mint, now_ms);
            rug_.forget(mint);
            trend_.forget(mint);
        }
        throttles_.clear_failure(mint);
        successful_trades_++;
    } else {
        // Forced exits retry on the next tick regardless of the cooldown
        if (!intent.forced) {
            throttles_.record_failure(mint, now_ms);
        }
        failed_trades_++;
        notify_alert(mint, "trade_failed",
                     fmt::format("{} failed: {}", action_string(intent.action),
                                 result.failure_reason.value_or("unknown")));
    }
    
    notify_trade({intent, result, strategy_->name(), now_ms});
}

std::optional<Orchestrator::TokenRecord> Orchestrator::find_record(const std::string& mint) const {
    std::lock_guard<std::mutex> lock(records_mutex_);
    auto it = records_.find(mint);
    if (it == records_.end()) return std::nullopt;
    return it->second;
}

std::vector<double> Orchestrator::append_price(const std::string& mint, double price) {
    std::lock_guard<std::mutex> lock(records_mutex_);
    auto it = records_.find(mint);
    if (it == records_.end()) {
        return {price};
    }
    
    it->second.missed_ticks = 0;
    auto& prices = it->second.prices;
    prices.push_back(price);
    while (prices.size() > settings_.price_window) {
        prices.pop_front();
    }
    return std::vector<double>(prices.begin(), prices.end());
}

void Orchestrator::set_state(const std::string& mint, TokenLifecycleState state, int64_t now_ms) {
    std::lock_guard<std::mutex> lock(records_mutex_);
    auto it = records_.find(mint);
    if (it == records_.end()) return;
    
    auto& rec = it->second;
    spdlog::info("{}: {} -> {}", util::short_mint(mint), lifecycle_string(rec.state),
                 lifecycle_string(state));
    rec.state = state;
    if (state == TokenLifecycleState::Disposed) {
        rec.disposed_at_ms = now_ms;
        rec.discovery_pending = false;
        rec.prices.clear();
    }
}

void Orchestrator::clear_discovery_pending(const std::string& mint) {
    std::lock_guard<std::mutex> lock(records_mutex_);
    auto it = records_.find(mint);
    if (it != records_.end()) {
        it->second.discovery_pending = false;
    }
}

void Orchestrator::refresh_balance() {
    if (settings_.wallet_address.empty()) return;
    
    try {
        auto balance = market_->balance(settings_.wallet_address);
        if (balance) {
            std::lock_guard<std::mutex> lock(balance_mutex_);
            balance_ = balance;
        }
    } catch (const std::exception& e) {
        spdlog::warn("Balance refresh failed: {}", e.what());
    }
}

void Orchestrator::add_to_whitelist(const std::string& mint) {
    std::lock_guard<std::mutex> lock(whitelist_mutex_);
    if (whitelist_.insert(mint).second) {
        spdlog::info("Whitelist add: {}", util::short_mint(mint));
    }
}

void Orchestrator::remove_from_whitelist(const std::string& mint) {
    std::lock_guard<std::mutex> lock(whitelist_mutex_);
    if (whitelist_.erase(mint)) {
        spdlog::info("Whitelist remove: {}", util::short_mint(mint));
    }
}

std::vector<std::string> Orchestrator::whitelist() const {
    std::lock_guard<std::mutex> lock(whitelist_mutex_);
    return std::vector<std::string>(whitelist_.begin(), whitelist_.end());
}

void Orchestrator::add_listener(std::shared_ptr<TradeListener> listener) {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    listeners_.push_back(std::move(listener));
}

std::optional<TokenLifecycleState> Orchestrator::lifecycle(const std::string& mint) const {
    std::lock_guard<std::mutex> lock(records_mutex_);
    auto it = records_.find(mint);
    if (it == records_.end()) return std::nullopt;
    return it->second.state;
}

OrchestratorStatus Orchestrator::status() const {
    OrchestratorStatus s;
    s.running = running_;
    s.uptime_ms = running_ ? util::current_timestamp_ms() - started_at_ms_ : 0;
    s.open_positions = book_.count();
    s.successful_trades = successful_trades_;
    s.failed_trades = failed_trades_;
    s.cycles = cycles_;
    s.strategy = strategy_->name();
    
    {
        std::lock_guard<std::mutex> lock(records_mutex_);
        s.active_tokens = 0;
        for (const auto& [_, rec] : records_) {
            if (rec.state != TokenLifecycleState::Disposed) s.active_tokens++;
        }
    }
    {
        std::lock_guard<std::mutex> lock(balance_mutex_);
        s.balance = balance_;
    }
    {
        std::lock_guard<std::mutex> lock(whitelist_mutex_);
        s.whitelist_size = whitelist_.size();
    }
    return s;
}

void Orchestrator::notify_trade(const TradeEvent& event) {
    std::vector<std::shared_ptr<TradeListener>> listeners;
    {
        std::lock_guard<std::mutex> lock(listeners_mutex_);
        listeners = listeners_;
    }
    for (const auto& l : listeners) {
        try {
            l->on_trade(event);
        } catch (const std::exception& e) {
            spdlog::warn("Trade listener failed: {}", e.what());
        }
    }
}

void Orchestrator::notify_alert(const std::string& mint, const std::string& kind,
                                const std::string& message) {
    std::vector<std::shared_ptr<TradeListener>> listeners;
    {
        std::lock_guard<std::mutex> lock(listeners_mutex_);
        listeners = listeners_;
    }
    for (const auto& l : listeners) {
        try {
            l->on_alert(mint, kind, message);
        } catch (const std::exception& e) {
            spdlog::warn("Alert listener failed: {}", e.what());
        }
    }
}
