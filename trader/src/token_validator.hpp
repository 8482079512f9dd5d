#pragma once

#include "types.hpp"
#include <string>
#include <optional>

struct ValidationResult {
    bool ok;
    std::string reason;
    bool terminal = false;   // retrying later cannot succeed
};

struct TokenValidatorSettings {
    std::string base_mint;
    int64_t max_token_age_ms = 10 * 60 * 1000;
};

class TokenValidator {
public:
    explicit TokenValidator(TokenValidatorSettings settings);
    
    ValidationResult validate(const TokenMeta& meta, const std::optional<Tick>& tick,
                              int64_t now_ms) const;
    
private:
    TokenValidatorSettings settings_;
};
