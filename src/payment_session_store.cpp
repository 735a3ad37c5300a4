#include "payment_session_store.hpp"

#include <spdlog/spdlog.h>

#include "crypto.hpp"

mw::E<FinalizeRequest> FinalizeRequest::fromJSON(const nlohmann::json& j)
{
    if(!j.is_object())
    {
        return std::unexpected(mw::httpError(400, "Invalid request body"));
    }
    if(!j.contains("customer_info"))
    {
        return std::unexpected(
            mw::httpError(400, "Missing or invalid field: customer_info"));
    }
    if(!j.contains("shipping_address"))
    {
        return std::unexpected(
            mw::httpError(400, "Missing or invalid field: shipping_address"));
    }

    FinalizeRequest req;
    ASSIGN_OR_RETURN(req.customer, CustomerInfo::fromJSON(j["customer_info"]));
    ASSIGN_OR_RETURN(req.shipping_address,
                     Address::fromJSON(j["shipping_address"]));
    if(j.contains("billing_address") && !j["billing_address"].is_null())
    {
        ASSIGN_OR_RETURN(req.billing_address,
                         Address::fromJSON(j["billing_address"]));
    }
    if(j.contains("coupon_code") && j["coupon_code"].is_string())
    {
        req.coupon_code = j["coupon_code"].get<std::string>();
    }
    return req;
}

PaymentSessionStore::PaymentSessionStore(const PricingPolicy& pricing,
                                         std::chrono::seconds ttl,
                                         ClockFunc clock)
    : pricing(pricing), ttl(ttl), clock(std::move(clock))
{
}

mw::E<PaymentSession> PaymentSessionStore::create(const Cart& cart,
                                                  const FinalizeRequest& req)
{
    if(cart.items.empty())
    {
        return std::unexpected(mw::httpError(400, "Cart is empty"));
    }

    PaymentSession session;
    ASSIGN_OR_RETURN(session.id, uuid4());
    session.cart_session = cart.session_id;
    session.items = cart.items;
    session.amount = quoteForFinalize(pricing, cart.items,
                                      req.shipping_address, req.coupon_code);
    session.shipping_address = req.shipping_address;
    session.billing_address =
        req.billing_address.value_or(req.shipping_address);
    session.customer = req.customer;
    session.coupon_code = req.coupon_code;
    session.created_at = clock();
    session.expires_at = session.created_at + ttl;

    {
        std::lock_guard<std::mutex> guard(lock);
        sessions[session.id] = session;
    }
    spdlog::info("Opened payment session {} for cart {}, total {}",
                 session.id, session.cart_session,
                 formatCents(session.amount.total));
    return session;
}

mw::E<PaymentSession> PaymentSessionStore::consume(const std::string& session_id)
{
    mw::Time now = clock();
    std::lock_guard<std::mutex> guard(lock);
    auto it = sessions.find(session_id);
    if(it == sessions.end())
    {
        return std::unexpected(
            mw::httpError(404, "Payment session not found or expired"));
    }
    PaymentSession session = std::move(it->second);
    sessions.erase(it);
    if(now > session.expires_at)
    {
        spdlog::info("Payment session {} expired", session_id);
        return std::unexpected(
            mw::httpError(404, "Payment session not found or expired"));
    }
    return session;
}

size_t PaymentSessionStore::purgeExpired()
{
    mw::Time now = clock();
    std::lock_guard<std::mutex> guard(lock);
    size_t count = std::erase_if(sessions, [now](const auto& item)
    {
        return now > item.second.expires_at;
    });
    if(count > 0)
    {
        spdlog::debug("Purged {} expired payment sessions", count);
    }
    return count;
}

size_t PaymentSessionStore::size() const
{
    std::lock_guard<std::mutex> guard(lock);
    return sessions.size();
}
