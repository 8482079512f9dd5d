#pragma once

#include <string>
#include <map>
#include <deque>
#include <vector>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <cstdint>

struct Position {
    std::string mint;
    double entry_price;
    double notional_value;     // quote currency committed at entry
    double current_price;
    double peak_price;
    std::deque<double> price_history;  // first element is entry_price until evicted
    bool trailing_stop_armed;
    int64_t opened_at_ms;
    int64_t updated_at_ms;
    
    // Derived, recomputed on every update
    double unrealized_pnl_pct;
    double volatility;
};

enum class PositionErrorKind {
    AlreadyHeld,
    NotFound
};

class PositionError : public std::runtime_error {
public:
    PositionError(PositionErrorKind kind, const std::string& mint);
    PositionErrorKind kind() const { return kind_; }
    
private:
    PositionErrorKind kind_;
};

struct PositionBookSettings {
    size_t history_capacity = 40;
    double trailing_activation_pct = 0.05;
};

class PositionBook {
public:
    explicit PositionBook(PositionBookSettings settings = {});
    
    Position open(const std::string& mint, double entry_price, double notional_value,
                  int64_t now_ms);
    Position open(const std::string& mint, double entry_price, double notional_value);
    Position update(const std::string& mint, double price);
    std::optional<Position> remove(const std::string& mint);
    
    std::optional<Position> get(const std::string& mint) const;
    bool contains(const std::string& mint) const;
    size_t count() const;
    std::vector<Position> snapshot() const;
    
    static double compute_volatility(const std::deque<double>& prices);
    
private:
    PositionBookSettings settings_;
    mutable std::mutex mutex_;
    std::map<std::string, Position> positions_;
};
