#include "config.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <algorithm>
#include <cctype>

std::string Config::get_env(const char* name, const std::string& default_val) {
    const char* val = std::getenv(name);
    return val ? std::string(val) : default_val;
}

int Config::get_env_int(const char* name, int default_val) {
    const char* val = std::getenv(name);
    if (!val) return default_val;
    try {
        return std::stoi(val);
    } catch (const std::exception&) {
        spdlog::warn("Invalid integer for {}, using default {}", name, default_val);
        return default_val;
    }
}

double Config::get_env_double(const char* name, double default_val) {
    const char* val = std::getenv(name);
    if (!val) return default_val;
    try {
        return std::stod(val);
    } catch (const std::exception&) {
        spdlog::warn("Invalid number for {}, using default {}", name, default_val);
        return default_val;
    }
}

bool Config::get_env_bool(const char* name, bool default_val) {
    const char* val = std::getenv(name);
    if (!val) return default_val;
    
    std::string s(val);
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
    if (s == "1" || s == "true" || s == "yes" || s == "on") return true;
    if (s == "0" || s == "false" || s == "no" || s == "off") return false;
    
    spdlog::warn("Invalid boolean for {}, using default {}", name, default_val);
    return default_val;
}

std::vector<std::string> Config::get_env_list(const char* name, const std::string& default_val) {
    return util::split(get_env(name, default_val), ',');
}

Config Config::from_env() {
    Config cfg;
    
    cfg.rpc_urls = get_env_list("RPC_URLS", "https://api.mainnet-beta.solana.com");
    cfg.jupiter_base_url = get_env("JUPITER_BASE_URL", "https://quote-api.jup.ag/v6");
    cfg.dex_base_url = get_env("DEX_BASE_URL", "https://api.dexscreener.com");
    cfg.request_timeout_ms = get_env_int("REQUEST_TIMEOUT_MS", 8000);
    cfg.slippage_bps = get_env_int("SLIPPAGE_BPS", 100);
    
    cfg.wallet_address = get_env("WALLET_ADDRESS");
    cfg.signer_url = get_env("SIGNER_URL");
    cfg.signer_api_key = get_env("SIGNER_API_KEY");
    cfg.base_mint = get_env("BASE_MINT", "So11111111111111111111111111111111111111112");
    cfg.trade_amount_lamports = get_env_int("TRADE_AMOUNT_LAMPORTS", 1300000);
    
    cfg.redis_url = get_env("REDIS_URL", "redis://localhost:6379");
    cfg.stream_discovery = get_env("STREAM_DISCOVERY", "solswap.discovery");
    cfg.stream_trades = get_env("STREAM_TRADES", "solswap.trades");
    cfg.stream_alerts = get_env("STREAM_ALERTS", "solswap.alerts");
    cfg.consumer_group = get_env("CONSUMER_GROUP", "trader_group");
    
    cfg.pg_dsn = get_env("PG_DSN");
    
    cfg.strategy = get_env("STRATEGY", "oscillator");
    cfg.cycle_interval_seconds = get_env_int("CYCLE_INTERVAL_SECONDS", 30);
    cfg.worker_threads = get_env_int("WORKER_THREADS", 4);
    cfg.max_known_tokens = get_env_int("MAX_KNOWN_TOKENS", 10);
    cfg.max_concurrent_positions = get_env_int("MAX_CONCURRENT_POSITIONS", 10);
    cfg.max_token_age_seconds = get_env_int("MAX_TOKEN_AGE_SECONDS", 600);
    cfg.reentry_guard_seconds = get_env_int("REENTRY_GUARD_SECONDS", 300);
    cfg.retry_cooldown_seconds = get_env_int("RETRY_COOLDOWN_SECONDS", 15);
    cfg.pending_token_ttl_seconds = get_env_int("PENDING_TOKEN_TTL_SECONDS", 30);
    cfg.max_missed_ticks = get_env_int("MAX_MISSED_TICKS", 5);
    cfg.block_buy = get_env_bool("BLOCK_BUY", false);
    cfg.whitelist = get_env_list("WHITELIST");
    cfg.preferred_sources = get_env_list("PREFERRED_SOURCES", "pump.fun");
    cfg.priority_preferred_only = get_env_bool("PRIORITY_PREFERRED_ONLY", false);
    
    cfg.rsi_period = get_env_int("RSI_PERIOD", 14);
    cfg.rsi_oversold = get_env_double("RSI_OVERSOLD", 30.0);
    cfg.rsi_overbought = get_env_double("RSI_OVERBOUGHT", 70.0);
    cfg.rsi_window = get_env_int("RSI_WINDOW", 0);
    
    cfg.rug_extreme_drop_pct = get_env_double("RUG_EXTREME_DROP_PCT", 40.0);
    cfg.rug_volume_collapse_pct = get_env_double("RUG_VOLUME_COLLAPSE_PCT", 90.0);
    cfg.rug_sustained_decline_pct = get_env_double("RUG_SUSTAINED_DECLINE_PCT", 25.0);
    cfg.rug_window = get_env_int("RUG_WINDOW", 10);
    cfg.rug_retention_seconds = get_env_int("RUG_RETENTION_SECONDS", 300);
    cfg.rug_exit_confidence = get_env_double("RUG_EXIT_CONFIDENCE", 0.7);
    
    cfg.trend_lookback = get_env_int("TREND_LOOKBACK", 10);
    cfg.trend_threshold = get_env_double("TREND_THRESHOLD", 0.6);
    cfg.trend_choppy_reversals = get_env_double("TREND_CHOPPY_REVERSALS", 0.5);
    cfg.block_on_choppy = get_env_bool("BLOCK_ON_CHOPPY", true);
    
    cfg.min_hold_seconds = get_env_int("MIN_HOLD_SECONDS", 5);
    cfg.max_hold_unprofitable_seconds = get_env_int("MAX_HOLD_UNPROFITABLE_SECONDS", 45);
    cfg.trailing_activation_pct = get_env_double("TRAILING_ACTIVATION_PCT", 5.0);
    cfg.trailing_stop_pct = get_env_double("TRAILING_STOP_PCT", 3.0);
    cfg.hard_stop_loss_pct = get_env_double("HARD_STOP_LOSS_PCT", 15.0);
    
    cfg.exec_max_attempts = get_env_int("EXEC_MAX_ATTEMPTS", 3);
    cfg.exec_retry_delay_ms = get_env_int("EXEC_RETRY_DELAY_MS", 500);
    
    cfg.model_url = get_env("MODEL_URL");
    cfg.model_api_key = get_env("MODEL_API_KEY");
    cfg.model_confidence_threshold = get_env_double("MODEL_CONFIDENCE_THRESHOLD", 0.7);
    cfg.model_bypass_validation = get_env_bool("MODEL_BYPASS_VALIDATION", true);
    
    cfg.listen_addr = get_env("LISTEN_ADDR", "0.0.0.0");
    cfg.listen_port = get_env_int("LISTEN_PORT", 8090);
    cfg.service_name = get_env("SERVICE_NAME", "trader");
    cfg.log_level = get_env("LOG_LEVEL", "info");
    
    return cfg;
}

void Config::validate() const {
    if (signer_url.empty() || signer_api_key.empty()) {
        throw std::runtime_error("SIGNER_URL and SIGNER_API_KEY are required");
    }
    if (!util::is_valid_solana_address(wallet_address)) {
        throw std::runtime_error("WALLET_ADDRESS is missing or not a valid address");
    }
    if (rpc_urls.empty()) {
        throw std::runtime_error("RPC_URLS must list at least one endpoint");
    }
    if (!StrategyFactory::is_known_type(strategy)) {
        throw std::runtime_error("Unknown STRATEGY: " + strategy);
    }
    if (strategy == "model" && model_url.empty()) {
        throw std::runtime_error("MODEL_URL is required for the model strategy");
    }
    if (rsi_period < 2 || rsi_oversold >= rsi_overbought || (rsi_window != 0 && rsi_window <= rsi_period)) {
        throw std::runtime_error("RSI settings are inconsistent");
    }
    if (min_hold_seconds > max_hold_unprofitable_seconds) {
        throw std::runtime_error("MIN_HOLD_SECONDS exceeds MAX_HOLD_UNPROFITABLE_SECONDS");
    }
    if (exec_max_attempts < 1 || worker_threads < 1 || cycle_interval_seconds < 1) {
        throw std::runtime_error("EXEC_MAX_ATTEMPTS, WORKER_THREADS and CYCLE_INTERVAL_SECONDS must be positive");
    }
    if (trade_amount_lamports <= 0) {
        throw std::runtime_error("TRADE_AMOUNT_LAMPORTS must be positive");
    }
    
    spdlog::info("Configuration validated successfully");
    spdlog::info("  Strategy: {} (cycle {}s, {} workers)", strategy, cycle_interval_seconds, worker_threads);
    spdlog::info("  Wallet: {}, trade size {} lamports", util::short_mint(wallet_address), trade_amount_lamports);
    spdlog::info("  RSI: period={}, oversold={}, overbought={}", rsi_period, rsi_oversold, rsi_overbought);
    spdlog::info("  Stops: hard={}%, trailing={}% after +{}%", hard_stop_loss_pct, trailing_stop_pct,
                 trailing_activation_pct);
    spdlog::info("  Whitelist: {} tokens", whitelist.size());
    if (pg_dsn.empty()) {
        spdlog::info("  Trade journal disabled (PG_DSN not set)");
    }
}

OrchestratorSettings Config::orchestrator_settings() const {
    OrchestratorSettings s;
    s.cycle_interval_ms = static_cast<int64_t>(cycle_interval_seconds) * 1000;
    s.worker_threads = static_cast<size_t>(std::max(1, worker_threads));
    s.max_known_tokens = static_cast<size_t>(std::max(0, max_known_tokens));
    s.max_concurrent_positions = static_cast<size_t>(std::max(0, max_concurrent_positions));
    s.notional_per_trade = trade_amount_lamports / 1e9;
    s.rug_exit_confidence = rug_exit_confidence;
    s.block_buy = block_buy;
    s.wallet_address = wallet_address;
    s.whitelist = whitelist;
    
    s.positions.trailing_activation_pct = trailing_activation_pct / 100.0;
    
    s.rug.extreme_drop_pct = rug_extreme_drop_pct / 100.0;
    s.rug.volume_collapse_pct = rug_volume_collapse_pct / 100.0;
    s.rug.sustained_decline_pct = rug_sustained_decline_pct / 100.0;
    s.rug.window_size = static_cast<size_t>(std::max(2, rug_window));
    s.rug.retention_ms = static_cast<int64_t>(rug_retention_seconds) * 1000;
    
    s.trend.lookback = static_cast<size_t>(std::max(3, trend_lookback));
    s.trend.trending_threshold = trend_threshold;
    s.trend.choppy_reversal_ratio = trend_choppy_reversals;
    s.trend.block_on_choppy = block_on_choppy;
    
    s.time_exit.min_hold_ms = static_cast<int64_t>(min_hold_seconds) * 1000;
    s.time_exit.max_hold_unprofitable_ms = static_cast<int64_t>(max_hold_unprofitable_seconds) * 1000;
    
    s.trailing.trail_pct = trailing_stop_pct / 100.0;
    s.trailing.hard_stop_loss_pct = hard_stop_loss_pct / 100.0;
    
    s.validator.base_mint = base_mint;
    s.validator.max_token_age_ms = static_cast<int64_t>(max_token_age_seconds) * 1000;
    
    s.reentry_guard_ms = static_cast<int64_t>(reentry_guard_seconds) * 1000;
    s.retry_cooldown_ms = static_cast<int64_t>(retry_cooldown_seconds) * 1000;
    s.pending_ttl_ms = static_cast<int64_t>(pending_token_ttl_seconds) * 1000;
    s.max_missed_ticks = std::max(1, max_missed_ticks);
    return s;
}

StrategySettings Config::strategy_settings() const {
    StrategySettings s;
    s.type = strategy;
    
    s.oscillator.rsi_period = rsi_period;
    s.oscillator.oversold = rsi_oversold;
    s.oscillator.overbought = rsi_overbought;
    s.oscillator.window = static_cast<size_t>(std::max(0, rsi_window));
    
    s.priority.preferred_sources = std::set<std::string>(preferred_sources.begin(), preferred_sources.end());
    s.priority.preferred_only = priority_preferred_only;
    s.priority.max_concurrent = static_cast<size_t>(std::max(0, max_concurrent_positions));
    
    s.model.confidence_threshold = model_confidence_threshold;
    s.model.bypass_validation = model_bypass_validation;
    s.model.max_concurrent = static_cast<size_t>(std::max(0, max_concurrent_positions));
    return s;
}

ExecutionSettings Config::execution_settings() const {
    ExecutionSettings s;
    s.wallet_address = wallet_address;
    s.base_mint = base_mint;
    s.buy_amount = static_cast<uint64_t>(trade_amount_lamports);
    s.max_attempts = exec_max_attempts;
    s.retry_delay_ms = exec_retry_delay_ms;
    return s;
}
