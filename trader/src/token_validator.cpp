#include "token_validator.hpp"
#include "util.hpp"
#include <fmt/format.h>
#include <cmath>

TokenValidator::TokenValidator(TokenValidatorSettings settings) : settings_(std::move(settings)) {}

ValidationResult TokenValidator::validate(const TokenMeta& meta, const std::optional<Tick>& tick,
                                          int64_t now_ms) const {
    if (!util::is_valid_solana_address(meta.mint)) {
        return {false, "Invalid mint address", true};
    }
    
    if (meta.mint == settings_.base_mint) {
        return {false, "Base mint is not tradable", true};
    }
    
    // Whitelisted entries carry no discovery time
    if (meta.discovered_at_ms > 0 && settings_.max_token_age_ms > 0) {
        int64_t age_ms = now_ms - meta.discovered_at_ms;
        if (age_ms > settings_.max_token_age_ms) {
            return {false, fmt::format("Discovery is stale ({}s old)", age_ms / 1000), true};
        }
    }
    
    if (!tick || !(tick->price > 0.0) || !std::isfinite(tick->price)) {
        return {false, "No live price"};
    }
    
    return {true, "ok"};
}
