#include "pricing.hpp"

#include <algorithm>
#include <cctype>
#include <string>

namespace {

enum class CouponKind { PERCENT_OFF, FREE_SHIPPING };

struct Coupon
{
    const char* code;
    CouponKind kind;
    double rate;
};

constexpr Coupon COUPONS[] = {
    {"SAVE10", CouponKind::PERCENT_OFF, 0.10},
    {"FREESHIP", CouponKind::FREE_SHIPPING, 0.0},
};

std::string upper(std::string_view s)
{
    std::string result(s);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::toupper(c); });
    return result;
}

const Coupon* findCoupon(std::string_view code)
{
    const std::string key = upper(code);
    for(const Coupon& c : COUPONS)
    {
        if(key == c.code)
        {
            return &c;
        }
    }
    return nullptr;
}

void computeTotal(Quote& q)
{
    q.total = std::max<Cents>(0, q.subtotal + q.shipping + q.tax - q.discount);
}

} // namespace

Cents subtotalOf(const std::vector<CartLine>& items)
{
    Cents sum = 0;
    for(const CartLine& line : items)
    {
        sum += line.lineTotal();
    }
    return sum;
}

Quote quoteForFinalize(const PricingPolicy& policy,
                       const std::vector<CartLine>& items,
                       const Address& shipping_address,
                       std::string_view coupon_code)
{
    Quote q;
    q.currency = policy.currency;
    q.subtotal = subtotalOf(items);

    const bool domestic =
        upper(shipping_address.country) == upper(policy.domestic_country);
    if(domestic)
    {
        q.shipping = q.subtotal < policy.free_shipping_threshold
                         ? policy.domestic_shipping
                         : 0;
        q.tax = applyRate(q.subtotal, policy.tax_rate);
    }
    else
    {
        q.shipping = policy.international_shipping;
        q.tax = 0;
    }

    if(const Coupon* c = findCoupon(coupon_code); c != nullptr)
    {
        switch(c->kind)
        {
        case CouponKind::PERCENT_OFF:
            q.discount = applyRate(q.subtotal, c->rate);
            break;
        case CouponKind::FREE_SHIPPING:
            q.shipping = 0;
            break;
        }
    }
    computeTotal(q);
    return q;
}

Quote quoteForDelegated(const PricingPolicy& policy,
                        const std::vector<CartLine>& items)
{
    Quote q;
    q.currency = policy.currency;
    q.subtotal = subtotalOf(items);
    q.shipping = policy.x402_shipping;
    q.tax = applyRate(q.subtotal, policy.x402_tax_rate);
    computeTotal(q);
    return q;
}
