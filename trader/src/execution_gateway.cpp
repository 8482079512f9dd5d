#include "execution_gateway.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <thread>
#include <chrono>
#include <stdexcept>

ExecutionGateway::ExecutionGateway(std::shared_ptr<MarketDataPort> market,
                                   std::shared_ptr<Signer> signer,
                                   ExecutionSettings settings)
    : market_(std::move(market))
    , signer_(std::move(signer))
    , settings_(std::move(settings))
{
    if (!market_ || !signer_) {
        throw std::invalid_argument("Execution gateway needs market data and a signer");
    }
    if (settings_.max_attempts < 1) {
        settings_.max_attempts = 1;
    }
}

std::optional<uint64_t> ExecutionGateway::sell_amount(const std::string& mint) {
    for (const auto& holding : market_->holdings(settings_.wallet_address)) {
        if (holding.mint == mint && holding.amount > 0) {
            return holding.amount;
        }
    }
    return std::nullopt;
}

void ExecutionGateway::backoff(int attempt) const {
    if (settings_.retry_delay_ms <= 0) return;
    std::this_thread::sleep_for(std::chrono::milliseconds(settings_.retry_delay_ms * attempt));
}

SwapResult ExecutionGateway::execute(const TradeIntent& intent) {
    try {
        return run(intent);
    } catch (const std::exception& e) {
        SwapResult result;
        result.mint = intent.mint;
        result.failure_reason = std::string("Execution error: ") + e.what();
        spdlog::error("{} {} failed: {}", action_string(intent.action),
                      util::short_mint(intent.mint), *result.failure_reason);
        return result;
    }
}

SwapResult ExecutionGateway::run(const TradeIntent& intent) {
    SwapResult result;
    result.mint = intent.mint;
    
    const bool buying = intent.action == TradeAction::Buy;
    const std::string& input_mint = buying ? settings_.base_mint : intent.mint;
    const std::string& output_mint = buying ? intent.mint : settings_.base_mint;
    
    uint64_t amount = settings_.buy_amount;
    if (!buying) {
        auto held = sell_amount(intent.mint);
        if (!held) {
            result.failure_reason = "No token balance to sell";
            spdlog::error("SELL {} failed: no token balance", util::short_mint(intent.mint));
            return result;
        }
        amount = *held;
    }
    
    std::string last_failure = "No attempt made";
    
    for (int attempt = 1; attempt <= settings_.max_attempts; attempt++) {
        result.attempts = attempt;
        if (attempt > 1) {
            backoff(attempt - 1);
        }
        
        auto quote = market_->quote(input_mint, output_mint, amount);
        if (!quote) {
            last_failure = "Quote unavailable";
            spdlog::warn("{} {}: no quote (attempt {}/{})", action_string(intent.action),
                         util::short_mint(intent.mint), attempt, settings_.max_attempts);
            continue;
        }
        
        auto tx = market_->swap_transaction(*quote, settings_.wallet_address);
        if (!tx) {
            last_failure = "Swap transaction unavailable";
            spdlog::warn("{} {}: no swap transaction (attempt {}/{})", action_string(intent.action),
                         util::short_mint(intent.mint), attempt, settings_.max_attempts);
            continue;
        }
        
        auto submit = signer_->sign_and_submit(*tx);
        
        switch (submit.status) {
            case SubmitStatus::Confirmed:
                result.success = true;
                result.signature = submit.signature;
                result.in_amount = quote->in_amount;
                result.out_amount = quote->out_amount;
                result.executed_price = intent.reference_price;
                result.failure_reason.reset();
                spdlog::info("{} {} confirmed: {} (attempt {})", action_string(intent.action),
                             util::short_mint(intent.mint), submit.signature, attempt);
                return result;
                
            case SubmitStatus::QuoteExpired:
                last_failure = "Quote expired: " + submit.message;
                spdlog::warn("{} {}: quote expired, refreshing (attempt {}/{})",
                             action_string(intent.action), util::short_mint(intent.mint),
                             attempt, settings_.max_attempts);
                continue;
                
            case SubmitStatus::Rejected:
            case SubmitStatus::NetworkError:
                result.failure_reason = submit_status_string(submit.status) + ": " + submit.message;
                spdlog::error("{} {} failed: {}", action_string(intent.action),
                              util::short_mint(intent.mint), *result.failure_reason);
                return result;
        }
    }
    
    result.failure_reason = last_failure + " after " + std::to_string(settings_.max_attempts) + " attempts";
    spdlog::error("{} {} failed: {}", action_string(intent.action),
                  util::short_mint(intent.mint), *result.failure_reason);
    return result;
}
