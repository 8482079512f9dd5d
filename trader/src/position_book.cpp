#include "position_book.hpp"
#include "util.hpp"
#include "indicators.hpp"
#include <spdlog/spdlog.h>
#include <cmath>

namespace {

std::string error_message(PositionErrorKind kind, const std::string& mint) {
    switch (kind) {
        case PositionErrorKind::AlreadyHeld: return "Position already held: " + mint;
        case PositionErrorKind::NotFound: return "No position for: " + mint;
    }
    return "Position error: " + mint;
}

}

PositionError::PositionError(PositionErrorKind kind, const std::string& mint)
    : std::runtime_error(error_message(kind, mint)), kind_(kind) {}

PositionBook::PositionBook(PositionBookSettings settings) : settings_(settings) {
    if (settings_.history_capacity < 2) {
        settings_.history_capacity = 2;
    }
}

Position PositionBook::open(const std::string& mint, double entry_price, double notional_value) {
    return open(mint, entry_price, notional_value, util::current_timestamp_ms());
}

Position PositionBook::open(const std::string& mint, double entry_price, double notional_value,
                            int64_t now_ms) {
    if (!(entry_price > 0.0) || !std::isfinite(entry_price)) {
        throw std::invalid_argument("Entry price must be positive");
    }
    if (!(notional_value > 0.0) || !std::isfinite(notional_value)) {
        throw std::invalid_argument("Notional value must be positive");
    }
    
    std::lock_guard<std::mutex> lock(mutex_);
    
    if (positions_.count(mint)) {
        throw PositionError(PositionErrorKind::AlreadyHeld, mint);
    }
    
    Position pos;
    pos.mint = mint;
    pos.entry_price = entry_price;
    pos.notional_value = notional_value;
    pos.current_price = entry_price;
    pos.peak_price = entry_price;
    pos.price_history.push_back(entry_price);
    pos.trailing_stop_armed = false;
    pos.opened_at_ms = now_ms;
    pos.updated_at_ms = now_ms;
    pos.unrealized_pnl_pct = 0.0;
    pos.volatility = 0.0;
    
    positions_.emplace(mint, pos);
    spdlog::info("Opened position {} at {:.8f} (notional {:.4f})",
                 util::short_mint(mint), entry_price, notional_value);
    return pos;
}

Position PositionBook::update(const std::string& mint, double price) {
    if (!(price > 0.0) || !std::isfinite(price)) {
        throw std::invalid_argument("Price must be positive");
    }
    
    std::lock_guard<std::mutex> lock(mutex_);
    
    auto it = positions_.find(mint);
    if (it == positions_.end()) {
        throw PositionError(PositionErrorKind::NotFound, mint);
    }
    
    auto& pos = it->second;
    pos.current_price = price;
    pos.updated_at_ms = util::current_timestamp_ms();
    
    pos.price_history.push_back(price);
    while (pos.price_history.size() > settings_.history_capacity) {
        pos.price_history.pop_front();
    }
    
    if (price > pos.peak_price) {
        pos.peak_price = price;
    }
    
    pos.unrealized_pnl_pct = pos.current_price / pos.entry_price - 1.0;
    pos.volatility = compute_volatility(pos.price_history);
    
    if (!pos.trailing_stop_armed && pos.unrealized_pnl_pct > settings_.trailing_activation_pct) {
        pos.trailing_stop_armed = true;
        spdlog::info("Trailing stop armed for {} at {:+.2f}%",
                     util::short_mint(mint), pos.unrealized_pnl_pct * 100.0);
    }
    
    return pos;
}

std::optional<Position> PositionBook::remove(const std::string& mint) {
    std::lock_guard<std::mutex> lock(mutex_);
    
    auto it = positions_.find(mint);
    if (it == positions_.end()) {
        return std::nullopt;
    }
    
    Position pos = std::move(it->second);
    positions_.erase(it);
    return pos;
}

std::optional<Position> PositionBook::get(const std::string& mint) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = positions_.find(mint);
    if (it == positions_.end()) return std::nullopt;
    return it->second;
}

bool PositionBook::contains(const std::string& mint) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return positions_.count(mint) > 0;
}

size_t PositionBook::count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return positions_.size();
}

std::vector<Position> PositionBook::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Position> result;
    result.reserve(positions_.size());
    for (const auto& [_, pos] : positions_) {
        result.push_back(pos);
    }
    return result;
}

double PositionBook::compute_volatility(const std::deque<double>& prices) {
    if (prices.size() < 2) return 0.0;
    
    std::vector<double> returns;
    returns.reserve(prices.size() - 1);
    for (size_t i = 1; i < prices.size(); i++) {
        returns.push_back(prices[i] / prices[i - 1] - 1.0);
    }
    
    return Indicators::stddev(returns);
}
