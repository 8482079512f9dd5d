#pragma once

#include "strategy.hpp"
#include "oscillator_strategy.hpp"
#include "priority_strategy.hpp"
#include "model_strategy.hpp"
#include <memory>

struct StrategySettings {
    std::string type = "oscillator";
    OscillatorSettings oscillator;
    PrioritySettings priority;
    ModelStrategySettings model;
};

class StrategyFactory {
public:
    static bool is_known_type(const std::string& type);
    
    // Throws std::invalid_argument for unknown types, or for the model
    // variant without a scoring model.
    static std::unique_ptr<TradingStrategy> create(const StrategySettings& settings,
                                                   std::shared_ptr<ScoringModel> model);
};
