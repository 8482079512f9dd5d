#include "oscillator_strategy.hpp"
#include "indicators.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <algorithm>

namespace {

TradeIntent make_intent(const StrategyEvent& event, TradeAction action, const std::string& reason) {
    TradeIntent intent;
    intent.mint = event.meta.mint;
    intent.action = action;
    intent.forced = false;
    intent.reason = reason;
    intent.reference_price = event.prices.empty() ? 0.0 : event.prices.back();
    return intent;
}

}

OscillatorStrategy::OscillatorStrategy(OscillatorSettings settings) : settings_(settings) {
    auto min_window = static_cast<size_t>(std::max(settings_.rsi_period, 1)) + 1;
    if (settings_.window == 0) {
        settings_.window = static_cast<size_t>(std::max(settings_.rsi_period, 1)) * 2;
    }
    if (settings_.window < min_window) {
        settings_.window = min_window;
    }
}

std::optional<double> OscillatorStrategy::rsi_at(const std::vector<double>& prices, size_t offset) const {
    if (prices.size() <= offset) {
        return std::nullopt;
    }
    size_t end = prices.size() - offset;
    size_t begin = end > settings_.window ? end - settings_.window : 0;
    std::vector<double> window(prices.begin() + begin, prices.begin() + end);
    return Indicators::rsi(window, settings_.rsi_period);
}

std::optional<TradeIntent> OscillatorStrategy::decide(const StrategyEvent& event,
                                                      const TradingRuntime& runtime) {
    // Both readings slide over a fixed window so old moves age out
    auto current = rsi_at(event.prices, 0);
    auto previous = rsi_at(event.prices, 1);
    
    if (current) {
        spdlog::debug("RSI {} = {:.2f} (prev {})", util::short_mint(event.meta.mint), *current,
                      previous ? fmt::format("{:.2f}", *previous) : "n/a");
    }
    
    if (runtime.is_held(event.meta.mint)) {
        return exit(event, current, previous);
    }
    return entry(event, current);
}

std::optional<TradeIntent> OscillatorStrategy::entry(const StrategyEvent& event,
                                                     const std::optional<double>& current) const {
    if (current) {
        if (*current <= settings_.oversold) {
            return make_intent(event, TradeAction::Buy,
                               fmt::format("RSI {:.1f} at or below oversold {:.0f}",
                                           *current, settings_.oversold));
        }
        return std::nullopt;
    }
    
    if (event.kind == StrategyEventKind::Discovered && settings_.buy_on_discovery_without_history) {
        return make_intent(event, TradeAction::Buy, "New token, not enough history for RSI");
    }
    
    return std::nullopt;
}

std::optional<TradeIntent> OscillatorStrategy::exit(const StrategyEvent& event,
                                                    const std::optional<double>& current,
                                                    const std::optional<double>& previous) const {
    if (!current) {
        return std::nullopt;
    }
    
    if (*current >= settings_.overbought) {
        return make_intent(event, TradeAction::Sell,
                           fmt::format("RSI {:.1f} at or above overbought {:.0f}",
                                       *current, settings_.overbought));
    }
    
    if (!previous) {
        return std::nullopt;
    }
    
    const auto& prices = event.prices;
    double price_change = prices.back() / prices[prices.size() - 2] - 1.0;
    double rsi_change = *current - *previous;
    
    if (price_change > settings_.divergence_price_pct && rsi_change < -settings_.divergence_rsi_drop) {
        return make_intent(event, TradeAction::Sell,
                           fmt::format("Bearish divergence: price {:+.2f}%, RSI {:+.1f}",
                                       price_change * 100.0, rsi_change));
    }
    
    if (*previous <= settings_.midpoint && *current > settings_.midpoint) {
        return make_intent(event, TradeAction::Sell,
                           fmt::format("RSI crossed above {:.0f} ({:.1f} -> {:.1f})",
                                       settings_.midpoint, *previous, *current));
    }
    
    return std::nullopt;
}
