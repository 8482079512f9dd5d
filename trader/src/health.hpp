#pragma once
#include "redis_bus.hpp"
#include "pg_store.hpp"
#include "rpc_solana.hpp"
#include "orchestrator.hpp"
#include <nlohmann/json.hpp>
#include <memory>

class HealthCheck {
public:
    // pg may be null when the trade journal is disabled
    HealthCheck(std::shared_ptr<RedisBus> redis, std::shared_ptr<PostgresStore> pg,
                std::shared_ptr<SolanaRPC> rpc, std::shared_ptr<Orchestrator> orchestrator);
    nlohmann::json get_status();
    bool is_healthy();
    
private:
    std::shared_ptr<RedisBus> redis_;
    std::shared_ptr<PostgresStore> pg_;
    std::shared_ptr<SolanaRPC> rpc_;
    std::shared_ptr<Orchestrator> orchestrator_;
};
