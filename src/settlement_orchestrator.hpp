#pragma once

#include <string>

#include <mw/error.hpp>
#include <mw/utils.hpp>
#include <nlohmann/json.hpp>

#include "config.hpp"
#include "database.hpp"
#include "facilitator_client.hpp"
#include "payment_processor.hpp"
#include "payment_session_store.hpp"
#include "pricing.hpp"
#include "types.hpp"

struct Fulfillment
{
    std::string tracking_number;
    std::string carrier = "Standard Shipping";
    std::string estimated_delivery = "5-7 business days";

    nlohmann::json toJSON() const;
};

struct FulfillResult
{
    Order order;
    CardCharge charge;
    Fulfillment fulfillment;

    nlohmann::json toJSON() const;
};

// Body of an x402 checkout.
struct DelegatedCheckout
{
    std::string delegation_token;
    std::string agent_id;

    static mw::E<DelegatedCheckout> fromJSON(const nlohmann::json& j);
};

struct DelegatedResult
{
    Order order;
    SettlementReceipt receipt;
    std::string agent_id;
    Fulfillment fulfillment;

    nlohmann::json toJSON() const;
};

// Hex HMAC-SHA256 over “merchant_id:cart_session:total”, with the total
// in dollars to two decimals.
std::string merchantSignature(const MerchantConfig& merchant,
                              const std::string& cart_session, Cents total);
// ORD-<yyyymmddHHMMSS>-<8 hex upper>
mw::E<std::string> generateOrderNumber(mw::Time now);
// TRK<10 hex upper>
mw::E<std::string> generateTrackingNumber();

// Turns carts into orders. Orders are only written after payment has
// succeeded, together with emptying the cart.
class SettlementOrchestrator
{
public:
    SettlementOrchestrator(DatabaseInterface& db,
                           PaymentSessionStoreInterface& sessions,
                           CardProcessorInterface& cards,
                           FacilitatorInterface& facilitator,
                           const MerchantConfig& merchant,
                           const PricingPolicy& pricing);

    mw::E<PaymentSession> finalize(const std::string& cart_session,
                                   const FinalizeRequest& req);
    mw::E<FulfillResult> fulfill(const std::string& cart_session,
                                 const CardFields& card);
    mw::E<DelegatedResult> checkoutDelegated(const std::string& cart_session,
                                             const DelegatedCheckout& req);

private:
    mw::E<Cart> loadCart(const std::string& cart_session);

    DatabaseInterface& db;
    PaymentSessionStoreInterface& sessions;
    CardProcessorInterface& cards;
    FacilitatorInterface& facilitator;
    MerchantConfig merchant;
    PricingPolicy pricing;
};
