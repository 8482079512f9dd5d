#include "health.hpp"
#include "util.hpp"

HealthCheck::HealthCheck(std::shared_ptr<RedisBus> redis, std::shared_ptr<PostgresStore> pg,
                         std::shared_ptr<SolanaRPC> rpc, std::shared_ptr<Orchestrator> orchestrator)
    : redis_(redis), pg_(pg), rpc_(rpc), orchestrator_(orchestrator) {}

nlohmann::json HealthCheck::get_status() {
    bool redis_ok = redis_->ping();
    bool pg_ok = pg_ ? pg_->ping() : true;
    bool rpc_ok = rpc_->is_healthy();
    auto status = orchestrator_->status();
    
    return {
        {"ok", redis_ok && pg_ok && rpc_ok && status.running},
        {"redis", redis_ok},
        {"postgres", pg_ ? nlohmann::json(pg_ok) : nlohmann::json("disabled")},
        {"rpc", rpc_ok},
        {"loop", status.running ? "running" : "stopped"},
        {"cycles", status.cycles},
        {"ts", util::current_iso8601()}
    };
}

bool HealthCheck::is_healthy() {
    bool pg_ok = pg_ ? pg_->ping() : true;
    return redis_->ping() && pg_ok && rpc_->is_healthy() && orchestrator_->status().running;
}
