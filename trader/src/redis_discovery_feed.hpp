#pragma once

#include "discovery.hpp"
#include "redis_bus.hpp"
#include <memory>
#include <string>

// Consumer-group cursor over the discovery stream. The group remembers the
// read position, so a restarted process resumes where it left off.
class RedisDiscoveryFeed : public DiscoveryFeed {
public:
    RedisDiscoveryFeed(std::shared_ptr<RedisBus> bus, const std::string& stream,
                       const std::string& group, const std::string& consumer);
    
    std::vector<TokenMeta> poll(size_t max_items) override;
    
    static std::optional<TokenMeta> parse_entry(const nlohmann::json& data);
    
private:
    std::shared_ptr<RedisBus> bus_;
    std::string stream_;
    std::string group_;
    std::string consumer_;
};
