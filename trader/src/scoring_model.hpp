#pragma once

#include <string>
#include <vector>
#include <optional>

enum class ModelAction {
    Buy,
    Sell,
    Hold
};

struct ModelVerdict {
    ModelAction action;
    double confidence;    // 0..1
    std::string reasoning;
};

struct ScoringRequest {
    std::string mint;
    std::string source;
    std::vector<double> prices;
    bool held;
};

class ScoringModel {
public:
    virtual ~ScoringModel() = default;
    virtual std::optional<ModelVerdict> score(const ScoringRequest& request) = 0;
};
