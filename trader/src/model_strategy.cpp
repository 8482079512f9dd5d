#include "model_strategy.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

ModelAssistedStrategy::ModelAssistedStrategy(std::shared_ptr<ScoringModel> model,
                                             ModelStrategySettings settings)
    : model_(std::move(model)), settings_(settings)
{
    if (!model_) {
        throw std::invalid_argument("Model-assisted strategy requires a scoring model");
    }
}

std::optional<TradeIntent> ModelAssistedStrategy::decide(const StrategyEvent& event,
                                                         const TradingRuntime& runtime) {
    const auto& mint = event.meta.mint;
    bool held = runtime.is_held(mint);
    
    ScoringRequest request{mint, event.meta.source, event.prices, held};
    auto verdict = model_->score(request);
    if (!verdict) {
        spdlog::debug("No model verdict for {}", util::short_mint(mint));
        return std::nullopt;
    }
    
    if (verdict->confidence < settings_.confidence_threshold) {
        spdlog::debug("Model confidence {:.2f} below {:.2f} for {}",
                      verdict->confidence, settings_.confidence_threshold, util::short_mint(mint));
        return std::nullopt;
    }
    
    TradeIntent intent;
    intent.mint = mint;
    intent.forced = false;
    intent.reason = "Model: " + verdict->reasoning;
    intent.reference_price = event.prices.empty() ? 0.0 : event.prices.back();
    
    switch (verdict->action) {
        case ModelAction::Buy:
            if (held || runtime.open_positions() >= settings_.max_concurrent) {
                return std::nullopt;
            }
            intent.action = TradeAction::Buy;
            return intent;
        case ModelAction::Sell:
            if (!held) {
                return std::nullopt;
            }
            intent.action = TradeAction::Sell;
            return intent;
        case ModelAction::Hold:
            break;
    }
    return std::nullopt;
}
