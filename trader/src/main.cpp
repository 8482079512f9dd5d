#include "config.hpp"
#include "http_client.hpp"
#include "redis_bus.hpp"
#include "pg_store.hpp"
#include "rpc_solana.hpp"
#include "jupiter_client.hpp"
#include "dex_client.hpp"
#include "solana_market_data.hpp"
#include "remote_signer.hpp"
#include "http_scoring_model.hpp"
#include "redis_discovery_feed.hpp"
#include "trade_event_publisher.hpp"
#include "execution_gateway.hpp"
#include "strategy_factory.hpp"
#include "orchestrator.hpp"
#include "health.hpp"
#include "util.hpp"
#include <httplib.h>
#include <curl/curl.h>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <nlohmann/json.hpp>
#include <signal.h>
#include <atomic>
#include <thread>
#include <chrono>

std::atomic<bool> shutdown_requested{false};

void signal_handler(int signal) {
    spdlog::info("Received signal {}, initiating shutdown", signal);
    shutdown_requested = true;
}

void setup_logging(const std::string& log_level) {
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>("solswap", console_sink);
    
    if (log_level == "debug") {
        logger->set_level(spdlog::level::debug);
    } else if (log_level == "warn") {
        logger->set_level(spdlog::level::warn);
    } else if (log_level == "error") {
        logger->set_level(spdlog::level::err);
    } else {
        logger->set_level(spdlog::level::info);
    }
    
    spdlog::set_default_logger(logger);
    spdlog::info("Logging initialized at level: {}", log_level);
}

int main() {
    try {
        auto config = std::make_shared<Config>(Config::from_env());
        setup_logging(config->log_level);
        
        spdlog::info("==============================================");
        spdlog::info("SolSwap Trader v1.0");
        spdlog::info("==============================================");
        
        config->validate();
        
        signal(SIGINT, signal_handler);
        signal(SIGTERM, signal_handler);
        
        curl_global_init(CURL_GLOBAL_DEFAULT);
        
        // Chain access
        auto http = std::make_shared<HttpClient>(config->request_timeout_ms);
        auto rpc = std::make_shared<SolanaRPC>(config->rpc_urls, http);
        auto jupiter = std::make_shared<JupiterClient>(config->jupiter_base_url, http, config->slippage_bps);
        auto dex = std::make_shared<DexClient>(config->dex_base_url, http);
        auto market = std::make_shared<SolanaMarketData>(rpc, jupiter, dex);
        
        // Signer submissions are not retried by the transport
        auto signer_http = std::make_shared<HttpClient>(config->request_timeout_ms);
        signer_http->set_max_retries(0);
        auto signer = std::make_shared<RemoteSigner>(config->signer_url, config->signer_api_key, signer_http);
        
        // Event plumbing
        auto redis = std::make_shared<RedisBus>(config->redis_url);
        if (!redis->ping()) {
            spdlog::warn("Redis not reachable at startup, discovery and trade events will retry");
        }
        auto discovery = std::make_shared<RedisDiscoveryFeed>(
            redis, config->stream_discovery, config->consumer_group, config->service_name);
        auto publisher = std::make_shared<TradeEventPublisher>(
            redis, config->stream_trades, config->stream_alerts);
        
        std::shared_ptr<PostgresStore> pg;
        if (!config->pg_dsn.empty()) {
            spdlog::info("Trade journal: {}", util::redact_dsn(config->pg_dsn));
            pg = std::make_shared<PostgresStore>(config->pg_dsn);
            pg->init_schema();
        }
        
        std::shared_ptr<ScoringModel> model;
        if (!config->model_url.empty()) {
            model = std::make_shared<HttpScoringModel>(config->model_url, config->model_api_key, http);
        }
        
        auto gateway = std::make_shared<ExecutionGateway>(market, signer, config->execution_settings());
        auto strategy = StrategyFactory::create(config->strategy_settings(), model);
        
        auto orchestrator = std::make_shared<Orchestrator>(
            config->orchestrator_settings(), market, discovery, gateway, std::move(strategy));
        orchestrator->add_listener(publisher);
        if (pg) {
            orchestrator->add_listener(pg);
        }
        
        auto health = std::make_shared<HealthCheck>(redis, pg, rpc, orchestrator);
        
        // Start HTTP server
        httplib::Server server;
        
        server.Get("/health", [health](const httplib::Request&, httplib::Response& res) {
            auto status = health->get_status();
            res.set_content(status.dump(), "application/json");
            res.status = health->is_healthy() ? 200 : 503;
        });
        
        server.Get("/status", [orchestrator](const httplib::Request&, httplib::Response& res) {
            res.set_content(orchestrator->status().to_json().dump(), "application/json");
        });
        
        server.Get("/whitelist", [orchestrator](const httplib::Request&, httplib::Response& res) {
            nlohmann::json j = orchestrator->whitelist();
            res.set_content(j.dump(), "application/json");
        });
        
        server.Post(R"(/whitelist/([1-9A-HJ-NP-Za-km-z]+))",
                    [orchestrator](const httplib::Request& req, httplib::Response& res) {
            std::string mint = req.matches[1];
            if (!util::is_valid_solana_address(mint)) {
                res.status = 400;
                res.set_content(R"({"error":"invalid mint"})", "application/json");
                return;
            }
            orchestrator->add_to_whitelist(mint);
            res.set_content(nlohmann::json{{"added", mint}}.dump(), "application/json");
        });
        
        server.Delete(R"(/whitelist/([1-9A-HJ-NP-Za-km-z]+))",
                      [orchestrator](const httplib::Request& req, httplib::Response& res) {
            std::string mint = req.matches[1];
            orchestrator->remove_from_whitelist(mint);
            res.set_content(nlohmann::json{{"removed", mint}}.dump(), "application/json");
        });
        
        std::thread http_thread([&server, config]() {
            spdlog::info("Starting HTTP server on {}:{}", config->listen_addr, config->listen_port);
            server.listen(config->listen_addr.c_str(), config->listen_port);
        });
        
        orchestrator->start();
        spdlog::info("Trader started with strategy {}", config->strategy);
        
        while (!shutdown_requested) {
            std::this_thread::sleep_for(std::chrono::seconds(1));
        }
        
        // In-flight swaps finish before the status surface goes away
        spdlog::info("Stopping services...");
        orchestrator->stop();
        server.stop();
        
        if (http_thread.joinable()) http_thread.join();
        
        curl_global_cleanup();
        spdlog::info("Shutdown complete");
        return 0;
        
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
