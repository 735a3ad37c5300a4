#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "types.hpp"

struct PricingPolicy
{
    std::string currency = "USD";
    // Orders shipped here pay domestic shipping and tax.
    std::string domestic_country = "US";
    Cents domestic_shipping = 999;
    // Domestic shipping is waived at or above this subtotal.
    Cents free_shipping_threshold = 5000;
    Cents international_shipping = 1999;
    double tax_rate = 0.08;
    // Tariff for delegated (x402) checkouts, which have no address.
    Cents x402_shipping = 1500;
    double x402_tax_rate = 0.0875;
};

Cents subtotalOf(const std::vector<CartLine>& items);

// Quote for cart finalize: destination dependent shipping and tax,
// plus an optional coupon.
Quote quoteForFinalize(const PricingPolicy& policy,
                       const std::vector<CartLine>& items,
                       const Address& shipping_address,
                       std::string_view coupon_code);

// Quote for a delegated checkout.
Quote quoteForDelegated(const PricingPolicy& policy,
                        const std::vector<CartLine>& items);
