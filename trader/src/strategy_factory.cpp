#include "strategy_factory.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

bool StrategyFactory::is_known_type(const std::string& type) {
    return type == "oscillator" || type == "priority" || type == "model";
}

std::unique_ptr<TradingStrategy> StrategyFactory::create(const StrategySettings& settings,
                                                         std::shared_ptr<ScoringModel> model) {
    std::unique_ptr<TradingStrategy> strategy;
    
    if (settings.type == "oscillator") {
        strategy = std::make_unique<OscillatorStrategy>(settings.oscillator);
    } else if (settings.type == "priority") {
        strategy = std::make_unique<PriorityStrategy>(settings.priority);
    } else if (settings.type == "model") {
        strategy = std::make_unique<ModelAssistedStrategy>(std::move(model), settings.model);
    } else {
        throw std::invalid_argument("Unknown strategy type: " + settings.type);
    }
    
    spdlog::info("Using {} strategy (validation {})", strategy->name(),
                 strategy->requires_validation() ? "on" : "bypassed");
    return strategy;
}
