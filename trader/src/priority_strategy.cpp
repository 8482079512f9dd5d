#include "priority_strategy.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>

PriorityStrategy::PriorityStrategy(PrioritySettings settings) : settings_(std::move(settings)) {}

std::optional<TradeIntent> PriorityStrategy::decide(const StrategyEvent& event,
                                                    const TradingRuntime& runtime) {
    if (event.kind != StrategyEventKind::Discovered) {
        return std::nullopt;
    }
    
    const auto& mint = event.meta.mint;
    if (runtime.is_held(mint)) {
        return std::nullopt;
    }
    
    if (runtime.open_positions() >= settings_.max_concurrent) {
        spdlog::info("Skipping {}: at capacity ({} positions)",
                     util::short_mint(mint), settings_.max_concurrent);
        return std::nullopt;
    }
    
    bool whitelisted = runtime.is_whitelisted(mint);
    if (settings_.require_whitelist && !whitelisted) {
        spdlog::debug("Skipping {}: not whitelisted", util::short_mint(mint));
        return std::nullopt;
    }
    
    bool preferred = settings_.preferred_sources.count(event.meta.source) > 0;
    if (!preferred && !whitelisted && settings_.preferred_only) {
        spdlog::debug("Skipping {}: source '{}' not preferred",
                      util::short_mint(mint), event.meta.source);
        return std::nullopt;
    }
    
    TradeIntent intent;
    intent.mint = mint;
    intent.action = TradeAction::Buy;
    intent.forced = false;
    intent.reference_price = event.prices.empty() ? 0.0 : event.prices.back();
    if (whitelisted) {
        intent.reason = "Whitelisted token";
    } else if (preferred) {
        intent.reason = "Priority source " + event.meta.source;
    } else {
        intent.reason = "Discovered via " + event.meta.source;
    }
    return intent;
}
