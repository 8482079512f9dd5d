#include "redis_discovery_feed.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>

RedisDiscoveryFeed::RedisDiscoveryFeed(std::shared_ptr<RedisBus> bus, const std::string& stream,
                                       const std::string& group, const std::string& consumer)
    : bus_(std::move(bus)), stream_(stream), group_(group), consumer_(consumer)
{
    bus_->create_consumer_group(stream_, group_);
}

std::optional<TokenMeta> RedisDiscoveryFeed::parse_entry(const nlohmann::json& data) {
    if (!data.is_object() || !data.contains("mint") || !data["mint"].is_string()) {
        return std::nullopt;
    }
    
    TokenMeta meta;
    meta.mint = data["mint"].get<std::string>();
    meta.source = data.contains("source") && data["source"].is_string()
        ? data["source"].get<std::string>()
        : "unknown";
    meta.discovered_at_ms = data.contains("ts_ms") && data["ts_ms"].is_number_integer()
        ? data["ts_ms"].get<int64_t>()
        : util::current_timestamp_ms();
    
    if (!util::is_valid_solana_address(meta.mint)) {
        return std::nullopt;
    }
    return meta;
}

std::vector<TokenMeta> RedisDiscoveryFeed::poll(size_t max_items) {
    std::vector<TokenMeta> batch;
    
    auto entries = bus_->read_group(stream_, group_, consumer_, static_cast<int>(max_items), 100);
    for (const auto& [msg_id, data] : entries) {
        auto meta = parse_entry(data);
        if (meta) {
            batch.push_back(*meta);
        } else {
            spdlog::warn("Skipping malformed discovery entry {}", msg_id);
        }
        bus_->ack_message(stream_, group_, msg_id);
    }
    
    return batch;
}
