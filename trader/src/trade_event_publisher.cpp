#include "trade_event_publisher.hpp"
#include "util.hpp"

TradeEventPublisher::TradeEventPublisher(std::shared_ptr<RedisBus> bus,
                                         const std::string& trades_stream,
                                         const std::string& alerts_stream)
    : bus_(std::move(bus)), trades_stream_(trades_stream), alerts_stream_(alerts_stream) {}

nlohmann::json TradeEventPublisher::to_json(const TradeEvent& event) {
    const auto& r = event.result;
    return {
        {"mint", event.intent.mint},
        {"action", action_string(event.intent.action)},
        {"forced", event.intent.forced},
        {"reason", event.intent.reason},
        {"strategy", event.strategy},
        {"success", r.success},
        {"price", r.executed_price},
        {"signature", r.signature},
        {"failure_reason", r.failure_reason ? nlohmann::json(*r.failure_reason) : nlohmann::json(nullptr)},
        {"in_amount", r.in_amount},
        {"out_amount", r.out_amount},
        {"attempts", r.attempts},
        {"ts_ms", event.timestamp_ms}
    };
}

void TradeEventPublisher::on_trade(const TradeEvent& event) {
    bus_->publish(trades_stream_, to_json(event));
}

void TradeEventPublisher::on_alert(const std::string& mint, const std::string& kind,
                                   const std::string& message) {
    bus_->publish(alerts_stream_, {
        {"type", kind},
        {"mint", mint},
        {"message", message},
        {"ts", util::current_iso8601()}
    });
}
