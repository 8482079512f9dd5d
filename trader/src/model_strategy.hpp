#pragma once

#include "strategy.hpp"
#include "scoring_model.hpp"
#include <memory>

struct ModelStrategySettings {
    double confidence_threshold = 0.7;
    // The external model does its own due diligence on new tokens.
    bool bypass_validation = true;
    size_t max_concurrent = 10;
};

class ModelAssistedStrategy : public TradingStrategy {
public:
    ModelAssistedStrategy(std::shared_ptr<ScoringModel> model, ModelStrategySettings settings = {});
    
    std::optional<TradeIntent> decide(const StrategyEvent& event,
                                      const TradingRuntime& runtime) override;
    std::string name() const override { return "model"; }
    bool requires_validation() const override { return !settings_.bypass_validation; }
    
private:
    std::shared_ptr<ScoringModel> model_;
    ModelStrategySettings settings_;
};
