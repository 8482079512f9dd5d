#include "pg_store.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>

PostgresStore::PostgresStore(const std::string& dsn) : dsn_(dsn) {
    spdlog::info("PostgresStore initialized: {}", util::redact_dsn(dsn));
}

pqxx::connection PostgresStore::make_connection() {
    return pqxx::connection(dsn_);
}

void PostgresStore::init_schema() {
    try {
        auto conn = make_connection();
        pqxx::work txn(conn);
        
        txn.exec(R"(
            CREATE TABLE IF NOT EXISTS trades (
                id BIGSERIAL PRIMARY KEY,
                ts TIMESTAMPTZ NOT NULL DEFAULT NOW(),
                mint TEXT NOT NULL,
                action TEXT NOT NULL,
                forced BOOLEAN NOT NULL,
                strategy TEXT NOT NULL,
                reason TEXT,
                success BOOLEAN NOT NULL,
                price NUMERIC,
                signature TEXT,
                failure_reason TEXT,
                in_amount NUMERIC,
                out_amount NUMERIC,
                attempts INT
            )
        )");
        
        txn.exec(R"(
            CREATE TABLE IF NOT EXISTS trade_alerts (
                id BIGSERIAL PRIMARY KEY,
                ts TIMESTAMPTZ NOT NULL DEFAULT NOW(),
                mint TEXT NOT NULL,
                kind TEXT NOT NULL,
                message TEXT
            )
        )");
        
        txn.exec("CREATE INDEX IF NOT EXISTS idx_trades_mint_ts ON trades(mint, ts DESC)");
        
        txn.commit();
        spdlog::info("Database schema initialized");
        
    } catch (const std::exception& e) {
        spdlog::error("Failed to initialize schema: {}", e.what());
        throw;
    }
}

void PostgresStore::on_trade(const TradeEvent& event) {
    const auto& r = event.result;
    try {
        auto conn = make_connection();
        pqxx::work txn(conn);
        
        txn.exec_params(
            "INSERT INTO trades (ts, mint, action, forced, strategy, reason, success, price, "
            "signature, failure_reason, in_amount, out_amount, attempts) "
            "VALUES (to_timestamp($1::double precision / 1000), $2, $3, $4, $5, $6, $7, $8, "
            "$9, $10, $11, $12, $13)",
            event.timestamp_ms,
            event.intent.mint,
            action_string(event.intent.action),
            event.intent.forced,
            event.strategy,
            event.intent.reason,
            r.success,
            r.executed_price,
            r.signature,
            r.failure_reason.value_or(""),
            std::to_string(r.in_amount),
            std::to_string(r.out_amount),
            r.attempts
        );
        
        txn.commit();
    } catch (const std::exception& e) {
        spdlog::error("Failed to journal trade for {}: {}", util::short_mint(event.intent.mint), e.what());
    }
}

void PostgresStore::on_alert(const std::string& mint, const std::string& kind,
                             const std::string& message) {
    try {
        auto conn = make_connection();
        pqxx::work txn(conn);
        txn.exec_params("INSERT INTO trade_alerts (mint, kind, message) VALUES ($1, $2, $3)",
                        mint, kind, message);
        txn.commit();
    } catch (const std::exception& e) {
        spdlog::error("Failed to journal alert for {}: {}", util::short_mint(mint), e.what());
    }
}

bool PostgresStore::ping() {
    try {
        auto conn = make_connection();
        pqxx::work txn(conn);
        txn.exec("SELECT 1");
        txn.commit();
        return true;
    } catch (const std::exception& e) {
        spdlog::debug("Postgres ping failed: {}", e.what());
        return false;
    }
}
