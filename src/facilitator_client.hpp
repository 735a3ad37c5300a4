#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <mw/error.hpp>
#include <mw/http_client.hpp>
#include <nlohmann/json.hpp>

#include "types.hpp"

// Body of POST /x402/settle.
struct SettlementRequest
{
    std::string delegation_token;
    std::string merchant_id;
    std::string merchant_name;
    std::string cart_id;
    Cents amount = 0;
    std::string currency = "USD";
    std::vector<CartLine> items;
    std::string merchant_signature;

    nlohmann::json toJSON() const;
};

class FacilitatorInterface
{
public:
    virtual ~FacilitatorInterface() = default;

    // Errors: 402 when the facilitator refuses, with its response body
    // in the message. 503 when it cannot be reached in time or answers
    // with something that is not a receipt.
    virtual mw::E<SettlementReceipt> settle(const SettlementRequest& req) = 0;
};

class FacilitatorClient : public FacilitatorInterface
{
public:
    FacilitatorClient(const std::string& base_url,
                      std::chrono::milliseconds timeout,
                      std::unique_ptr<mw::HTTPSessionInterface> http_client);

    mw::E<SettlementReceipt> settle(const SettlementRequest& req) override;

private:
    struct Reply
    {
        int status = 0;
        std::string body;
    };

    mw::E<Reply> postWithTimeout(const mw::HTTPRequest& req);

    std::string base_url;
    std::chrono::milliseconds timeout;
    // Shared with in-flight requests, which may outlive a timed out
    // call.
    std::shared_ptr<mw::HTTPSessionInterface> http_client;
    std::shared_ptr<std::mutex> http_lock;
};
