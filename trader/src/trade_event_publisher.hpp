#pragma once

#include "trade_listener.hpp"
#include "redis_bus.hpp"
#include <memory>
#include <string>

class TradeEventPublisher : public TradeListener {
public:
    TradeEventPublisher(std::shared_ptr<RedisBus> bus, const std::string& trades_stream,
                        const std::string& alerts_stream);
    
    void on_trade(const TradeEvent& event) override;
    void on_alert(const std::string& mint, const std::string& kind,
                  const std::string& message) override;
    
    static nlohmann::json to_json(const TradeEvent& event);
    
private:
    std::shared_ptr<RedisBus> bus_;
    std::string trades_stream_;
    std::string alerts_stream_;
};
