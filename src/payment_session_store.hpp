#pragma once

#include <chrono>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include <mw/error.hpp>
#include <mw/utils.hpp>

#include "pricing.hpp"
#include "types.hpp"

// What the client sends to finalize a cart.
struct FinalizeRequest
{
    CustomerInfo customer;
    Address shipping_address;
    // Defaults to the shipping address.
    std::optional<Address> billing_address;
    std::string coupon_code;

    static mw::E<FinalizeRequest> fromJSON(const nlohmann::json& j);
};

class PaymentSessionStoreInterface
{
public:
    virtual ~PaymentSessionStoreInterface() = default;

    // Price the cart and open a payment session for it.
    virtual mw::E<PaymentSession> create(const Cart& cart,
                                         const FinalizeRequest& req) = 0;
    // Remove and return the session. A session can be consumed at most
    // once. Expired sessions are 404 just like unknown ones.
    virtual mw::E<PaymentSession> consume(const std::string& session_id) = 0;
};

class PaymentSessionStore : public PaymentSessionStoreInterface
{
public:
    using ClockFunc = std::function<mw::Time()>;

    PaymentSessionStore(const PricingPolicy& pricing,
                        std::chrono::seconds ttl,
                        ClockFunc clock = [] { return mw::Clock::now(); });

    mw::E<PaymentSession> create(const Cart& cart,
                                 const FinalizeRequest& req) override;
    mw::E<PaymentSession> consume(const std::string& session_id) override;

    // Drop expired sessions. Returns how many were dropped.
    size_t purgeExpired();
    size_t size() const;

private:
    PricingPolicy pricing;
    std::chrono::seconds ttl;
    ClockFunc clock;

    mutable std::mutex lock;
    std::unordered_map<std::string, PaymentSession> sessions;
};
