#pragma once

#include "orchestrator.hpp"
#include "strategy_factory.hpp"
#include "execution_gateway.hpp"
#include <string>
#include <vector>
#include <cstdint>
#include <cstdlib>

struct Config {
    // Chain and aggregator
    std::vector<std::string> rpc_urls;
    std::string jupiter_base_url;
    std::string dex_base_url;
    int request_timeout_ms;
    int slippage_bps;
    
    // Wallet and signer
    std::string wallet_address;
    std::string signer_url;
    std::string signer_api_key;
    std::string base_mint;
    int64_t trade_amount_lamports;
    
    // Redis
    std::string redis_url;
    std::string stream_discovery;
    std::string stream_trades;
    std::string stream_alerts;
    std::string consumer_group;
    
    // Optional trade journal
    std::string pg_dsn;
    
    // Scheduling
    std::string strategy;
    int cycle_interval_seconds;
    int worker_threads;
    int max_known_tokens;
    int max_concurrent_positions;
    int max_token_age_seconds;
    int reentry_guard_seconds;
    int retry_cooldown_seconds;
    int pending_token_ttl_seconds;
    int max_missed_ticks;
    bool block_buy;
    std::vector<std::string> whitelist;
    std::vector<std::string> preferred_sources;
    bool priority_preferred_only;
    
    // Oscillator
    int rsi_period;
    double rsi_oversold;
    double rsi_overbought;
    int rsi_window;
    
    // Rug detection (percent values)
    double rug_extreme_drop_pct;
    double rug_volume_collapse_pct;
    double rug_sustained_decline_pct;
    int rug_window;
    int rug_retention_seconds;
    double rug_exit_confidence;
    
    // Trend filter
    int trend_lookback;
    double trend_threshold;
    double trend_choppy_reversals;
    bool block_on_choppy;
    
    // Exits (percent values)
    int min_hold_seconds;
    int max_hold_unprofitable_seconds;
    double trailing_activation_pct;
    double trailing_stop_pct;
    double hard_stop_loss_pct;
    
    // Execution
    int exec_max_attempts;
    int exec_retry_delay_ms;
    
    // Model-assisted strategy
    std::string model_url;
    std::string model_api_key;
    double model_confidence_threshold;
    bool model_bypass_validation;
    
    // Service
    std::string listen_addr;
    int listen_port;
    std::string service_name;
    std::string log_level;
    
    static Config from_env();
    void validate() const;
    
    OrchestratorSettings orchestrator_settings() const;
    StrategySettings strategy_settings() const;
    ExecutionSettings execution_settings() const;
    
private:
    static std::string get_env(const char* name, const std::string& default_val = "");
    static int get_env_int(const char* name, int default_val);
    static double get_env_double(const char* name, double default_val);
    static bool get_env_bool(const char* name, bool default_val);
    static std::vector<std::string> get_env_list(const char* name, const std::string& default_val = "");
};
