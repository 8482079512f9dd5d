#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <cstdint>

namespace util {
    std::string current_iso8601();
    int64_t current_timestamp_ms();
    std::vector<std::string> split(const std::string& str, char delim);
    int random_jitter(int min_ms, int max_ms);
    bool is_valid_solana_address(const std::string& address);
    std::string redact_dsn(const std::string& dsn);
    std::string short_mint(const std::string& mint);
    double safe_parse_double(const std::string& str, double default_value);
}
