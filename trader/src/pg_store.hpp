#pragma once
#include "trade_listener.hpp"
#include <string>
#include <pqxx/pqxx>

// Trade journal. Writes are best effort; failures are logged and dropped.
class PostgresStore : public TradeListener {
public:
    explicit PostgresStore(const std::string& dsn);
    void init_schema();
    bool ping();
    
    void on_trade(const TradeEvent& event) override;
    void on_alert(const std::string& mint, const std::string& kind,
                  const std::string& message) override;
    
private:
    std::string dsn_;
    pqxx::connection make_connection();
};
