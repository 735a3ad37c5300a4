#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <mw/error.hpp>
#include <mw/utils.hpp>
#include <nlohmann/json.hpp>

// Amounts of money are always integer cents.
using Cents = int64_t;

// Format cents as a decimal string with two digits after the point,
// e.g. 5319 -> “53.19”.
std::string formatCents(Cents c);
double centsToDouble(Cents c);
Cents dollarsToCents(double dollars);
// Multiply by a rate and round half away from zero to the cent.
Cents applyRate(Cents amount, double rate);

enum class SignatureAlgorithm { RSA_PSS_SHA256, ED25519 };

// Names as they appear in the “alg” signature parameter.
std::optional<SignatureAlgorithm> algorithmFromStr(std::string_view s);
std::string_view algorithmName(SignatureAlgorithm alg);

struct TrustedAgentKey
{
    // The value of the Signature-Agent header, e.g.
    // “https://directory.example.com”.
    std::string agent_id;
    SignatureAlgorithm algorithm = SignatureAlgorithm::RSA_PSS_SHA256;
    // PEM for RSA keys. Ed25519 keys are either PEM or the base64 of
    // the 32 raw bytes.
    std::string public_key;
    std::string display_name;
    // If not empty, the “keyId” signature parameter must match.
    std::string key_id;
};

struct Address
{
    std::string street;
    std::string city;
    std::string state;
    std::string postal_code;
    std::string country;

    nlohmann::json toJSON() const;
    static mw::E<Address> fromJSON(const nlohmann::json& j);
};

struct CustomerInfo
{
    std::string name;
    std::string email;
    std::string phone;

    nlohmann::json toJSON() const;
    static mw::E<CustomerInfo> fromJSON(const nlohmann::json& j);
};

struct Product
{
    int64_t id = 0;
    std::string name;
    std::string description;
    Cents price = 0;
};

struct CartLine
{
    int64_t product_id = 0;
    std::string name;
    int quantity = 0;
    Cents unit_price = 0;

    Cents lineTotal() const { return unit_price * quantity; }
    nlohmann::json toJSON() const;
};

struct Cart
{
    int64_t id = 0;
    // The opaque ID the client addresses the cart with.
    std::string session_id;
    std::vector<CartLine> items;

    nlohmann::json toJSON() const;
};

struct Quote
{
    Cents subtotal = 0;
    Cents shipping = 0;
    Cents tax = 0;
    Cents discount = 0;
    Cents total = 0;
    std::string currency = "USD";

    nlohmann::json toJSON() const;
};

// A finalized cart waiting for payment. Never mutated after creation.
struct PaymentSession
{
    std::string id;
    std::string cart_session;
    std::vector<CartLine> items;
    Quote amount;
    Address shipping_address;
    Address billing_address;
    CustomerInfo customer;
    std::string coupon_code;
    mw::Time created_at;
    mw::Time expires_at;
};

// Issued by the payment facilitator. Copied verbatim into the order.
struct SettlementReceipt
{
    std::string receipt_id;
    std::string transaction_id;
    std::string payment_rail_used;
    Cents amount = 0;
    Cents processing_fee = 0;
    Cents net_amount = 0;
    Cents remaining_delegation_limit = 0;

    nlohmann::json toJSON() const;
    // Parse the body of a successful /x402/settle response.
    static mw::E<SettlementReceipt> fromSettleResponse(const nlohmann::json& j);
};

struct OrderItem
{
    int64_t product_id = 0;
    std::string product_name;
    int quantity = 0;
    Cents unit_price = 0;

    nlohmann::json toJSON() const;
};

struct Order
{
    int64_t id = 0;
    std::string order_number;
    CustomerInfo customer;
    Address shipping_address;
    Address billing_address;
    Quote amount;
    std::string status = "confirmed";
    std::string payment_method;
    std::string payment_status = "processed";
    std::string card_brand;
    std::string card_last_four;
    std::string transaction_id;
    std::optional<SettlementReceipt> receipt;
    // Items are held by value so later catalog changes do not alter
    // the order.
    std::vector<OrderItem> items;
    mw::Time created_at;

    nlohmann::json toJSON() const;
};

std::string timeToISO8601(const mw::Time& t);
