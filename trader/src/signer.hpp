#pragma once

#include <string>

enum class SubmitStatus {
    Confirmed,
    QuoteExpired,
    Rejected,
    NetworkError
};

inline std::string submit_status_string(SubmitStatus status) {
    switch (status) {
        case SubmitStatus::Confirmed: return "confirmed";
        case SubmitStatus::QuoteExpired: return "quote_expired";
        case SubmitStatus::Rejected: return "rejected";
        case SubmitStatus::NetworkError: return "network_error";
    }
    return "unknown";
}

struct SubmitResult {
    SubmitStatus status;
    std::string signature;
    std::string message;
};

class Signer {
public:
    virtual ~Signer() = default;
    virtual SubmitResult sign_and_submit(const std::string& unsigned_tx) = 0;
};
