#pragma once

#include "signer.hpp"
#include "http_client.hpp"
#include <memory>
#include <string>

// Hands unsigned transactions to an external signing service that holds
// the wallet key, submits to the chain and waits for confirmation.
class RemoteSigner : public Signer {
public:
    RemoteSigner(const std::string& url, const std::string& api_key,
                 std::shared_ptr<HttpClient> http);
    
    SubmitResult sign_and_submit(const std::string& unsigned_tx) override;
    
    static SubmitResult interpret(const HttpResponse& response);
    
private:
    std::string url_;
    std::string api_key_;
    std::shared_ptr<HttpClient> http_;
};
