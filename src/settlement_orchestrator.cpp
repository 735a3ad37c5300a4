#include "settlement_orchestrator.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <format>

#include <spdlog/spdlog.h>

#include "crypto.hpp"

namespace {

constexpr char PAYMENT_METHOD_CARD[] = "credit_card";
constexpr char PAYMENT_METHOD_DELEGATION[] = "x402_delegation";

mw::E<std::string> randomHexUpper(size_t bytes)
{
    ASSIGN_OR_RETURN(std::string hex, randomHex(bytes));
    std::transform(hex.begin(), hex.end(), hex.begin(),
                   [](unsigned char c) { return std::toupper(c); });
    return hex;
}

std::vector<OrderItem> itemsFromLines(const std::vector<CartLine>& lines)
{
    std::vector<OrderItem> items;
    for(const CartLine& line : lines)
    {
        OrderItem item;
        item.product_id = line.product_id;
        item.product_name = line.name;
        item.quantity = line.quantity;
        item.unit_price = line.unit_price;
        items.push_back(std::move(item));
    }
    return items;
}

mw::E<std::string> requiredString(const nlohmann::json& j, const char* key)
{
    if(!j.contains(key) || !j[key].is_string() ||
       j[key].get_ref<const std::string&>().empty())
    {
        return std::unexpected(mw::httpError(
            400, "delegation_token and agent_id are required for x402 checkout"));
    }
    return j[key].get<std::string>();
}

} // namespace

nlohmann::json Fulfillment::toJSON() const
{
    return {{"tracking_number", tracking_number},
            {"estimated_delivery", estimated_delivery},
            {"shipping_carrier", carrier}};
}

nlohmann::json FulfillResult::toJSON() const
{
    return {{"status", "fulfilled"},
            {"message", "Order completed successfully"},
            {"order", order.toJSON()},
            {"payment",
             {{"transaction_id", charge.transaction_id},
              {"provider_reference", charge.provider_reference},
              {"status", "completed"}}},
            {"fulfillment", fulfillment.toJSON()}};
}

mw::E<DelegatedCheckout> DelegatedCheckout::fromJSON(const nlohmann::json& j)
{
    if(!j.is_object())
    {
        return std::unexpected(mw::httpError(400, "Invalid request body"));
    }
    DelegatedCheckout req;
    ASSIGN_OR_RETURN(req.delegation_token, requiredString(j, "delegation_token"));
    ASSIGN_OR_RETURN(req.agent_id, requiredString(j, "agent_id"));
    return req;
}

nlohmann::json DelegatedResult::toJSON() const
{
    nlohmann::json payment = receipt.toJSON();
    payment["method"] = PAYMENT_METHOD_DELEGATION;
    payment["status"] = "completed";

    nlohmann::json shipping = fulfillment.toJSON();
    shipping["status"] = "processing";

    return {{"status", "success"},
            {"message", "x402 checkout completed successfully"},
            {"order", order.toJSON()},
            {"payment", payment},
            {"delegation",
             {{"remaining_limit",
               centsToDouble(receipt.remaining_delegation_limit)},
              {"agent_id", agent_id}}},
            {"fulfillment", shipping}};
}

std::string merchantSignature(const MerchantConfig& merchant,
                              const std::string& cart_session, Cents total)
{
    return hmacSHA256Hex(
        merchant.secret,
        std::format("{}:{}:{}", merchant.id, cart_session, formatCents(total)));
}

mw::E<std::string> generateOrderNumber(mw::Time now)
{
    ASSIGN_OR_RETURN(std::string suffix, randomHexUpper(4));
    return std::format("ORD-{:%Y%m%d%H%M%S}-{}",
                       std::chrono::floor<std::chrono::seconds>(now), suffix);
}

mw::E<std::string> generateTrackingNumber()
{
    // 10 hex digits.
    ASSIGN_OR_RETURN(std::string hex, randomHexUpper(5));
    return "TRK" + hex;
}

SettlementOrchestrator::SettlementOrchestrator(
    DatabaseInterface& db, PaymentSessionStoreInterface& sessions,
    CardProcessorInterface& cards, FacilitatorInterface& facilitator,
    const MerchantConfig& merchant, const PricingPolicy& pricing)
    : db(db), sessions(sessions), cards(cards), facilitator(facilitator),
      merchant(merchant), pricing(pricing)
{
}

mw::E<Cart> SettlementOrchestrator::loadCart(const std::string& cart_session)
{
    ASSIGN_OR_RETURN(std::optional<Cart> cart, db.getCart(cart_session));
    if(!cart.has_value())
    {
        return std::unexpected(mw::httpError(404, "Cart not found"));
    }
    if(cart->items.empty())
    {
        return std::unexpected(mw::httpError(400, "Cart is empty"));
    }
    return *std::move(cart);
}

mw::E<PaymentSession>
SettlementOrchestrator::finalize(const std::string& cart_session,
                                 const FinalizeRequest& req)
{
    ASSIGN_OR_RETURN(Cart cart, loadCart(cart_session));
    return sessions.create(cart, req);
}

mw::E<FulfillResult>
SettlementOrchestrator::fulfill(const std::string& cart_session,
                                const CardFields& card)
{
    ASSIGN_OR_RETURN(PaymentSession session,
                     sessions.consume(card.payment_session_id));
    if(session.cart_session != cart_session)
    {
        spdlog::warn("Payment session {} belongs to cart {}, not {}",
                     session.id, session.cart_session, cart_session);
        return std::unexpected(
            mw::httpError(404, "Payment session not found or expired"));
    }
    ASSIGN_OR_RETURN(std::optional<Cart> cart, db.getCart(cart_session));
    if(!cart.has_value())
    {
        return std::unexpected(mw::httpError(404, "Cart not found"));
    }

    DO_OR_RETURN(card::validate(card, mw::Clock::now()));

    FulfillResult result;
    ASSIGN_OR_RETURN(result.charge, cards.processCard(card, session.amount.total));

    Order& order = result.order;
    order.created_at = mw::Clock::now();
    ASSIGN_OR_RETURN(order.order_number, generateOrderNumber(order.created_at));
    order.customer = session.customer;
    order.shipping_address = session.shipping_address;
    order.billing_address = session.billing_address;
    order.amount = session.amount;
    order.payment_method = PAYMENT_METHOD_CARD;
    order.card_brand = result.charge.card_brand;
    order.card_last_four = result.charge.last_four;
    order.transaction_id = result.charge.transaction_id;
    order.items = itemsFromLines(session.items);

    ASSIGN_OR_RETURN(order.id, db.placeOrder(order, cart_session));
    ASSIGN_OR_RETURN(result.fulfillment.tracking_number,
                     generateTrackingNumber());
    spdlog::info("Order {} placed for cart {} by card, total {}",
                 order.order_number, cart_session,
                 formatCents(order.amount.total));
    return result;
}

mw::E<DelegatedResult>
SettlementOrchestrator::checkoutDelegated(const std::string& cart_session,
                                          const DelegatedCheckout& req)
{
    ASSIGN_OR_RETURN(Cart cart, loadCart(cart_session));
    Quote quote = quoteForDelegated(pricing, cart.items);

    SettlementRequest settle;
    settle.delegation_token = req.delegation_token;
    settle.merchant_id = merchant.id;
    settle.merchant_name = merchant.name;
    settle.cart_id = cart_session;
    settle.amount = quote.total;
    settle.currency = quote.currency;
    settle.items = cart.items;
    settle.merchant_signature =
        merchantSignature(merchant, cart_session, quote.total);

    DelegatedResult result;
    ASSIGN_OR_RETURN(result.receipt, facilitator.settle(settle));
    result.agent_id = req.agent_id;

    Order& order = result.order;
    order.created_at = mw::Clock::now();
    ASSIGN_OR_RETURN(order.order_number, generateOrderNumber(order.created_at));
    order.customer.name = std::format("Agent {}", req.agent_id);
    order.customer.email = std::format("agent_{}@system.local", req.agent_id);
    order.amount = quote;
    order.payment_method = PAYMENT_METHOD_DELEGATION;
    order.card_brand = "x402_token";
    order.transaction_id = result.receipt.transaction_id;
    order.receipt = result.receipt;
    order.items = itemsFromLines(cart.items);

    auto order_id = db.placeOrder(order, cart_session);
    if(!order_id.has_value())
    {
        // The money has moved but we have no order. Keep the receipt
        // in the log so it can be reconciled.
        spdlog::error("Settled cart {} (receipt {}) but failed to store "
                      "the order: {}",
                      cart_session, result.receipt.receipt_id,
                      mw::errorMsg(order_id.error()));
        return std::unexpected(order_id.error());
    }
    order.id = *order_id;
    ASSIGN_OR_RETURN(result.fulfillment.tracking_number,
                     generateTrackingNumber());
    spdlog::info("Order {} placed for cart {} by agent {}, total {}",
                 order.order_number, cart_session, req.agent_id,
                 formatCents(order.amount.total));
    return result;
}
