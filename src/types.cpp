#include "types.hpp"

#include <chrono>
#include <cmath>
#include <cstdlib>
#include <expected>
#include <format>
#include <string>
#include <string_view>

#include <mw/error.hpp>
#include <nlohmann/json.hpp>

namespace {

mw::E<std::string> requiredString(const nlohmann::json& j, const char* key)
{
    if(!j.contains(key) || !j[key].is_string() ||
       j[key].get_ref<const std::string&>().empty())
    {
        return std::unexpected(mw::httpError(
            400, std::format("Missing or invalid field: {}", key)));
    }
    return j[key].get<std::string>();
}

Cents centsField(const nlohmann::json& j, const char* key)
{
    return dollarsToCents(j.at(key).get<double>());
}

} // namespace

std::string formatCents(Cents c)
{
    const char* sign = c < 0 ? "-" : "";
    Cents abs_c = std::llabs(c);
    return std::format("{}{}.{:02}", sign, abs_c / 100, abs_c % 100);
}

double centsToDouble(Cents c)
{
    return static_cast<double>(c) / 100.0;
}

Cents dollarsToCents(double dollars)
{
    return std::llround(dollars * 100.0);
}

Cents applyRate(Cents amount, double rate)
{
    return std::llround(static_cast<double>(amount) * rate);
}

std::optional<SignatureAlgorithm> algorithmFromStr(std::string_view s)
{
    if(s == "rsa-pss-sha256")
    {
        return SignatureAlgorithm::RSA_PSS_SHA256;
    }
    if(s == "ed25519")
    {
        return SignatureAlgorithm::ED25519;
    }
    return std::nullopt;
}

std::string_view algorithmName(SignatureAlgorithm alg)
{
    switch(alg)
    {
    case SignatureAlgorithm::RSA_PSS_SHA256:
        return "rsa-pss-sha256";
    case SignatureAlgorithm::ED25519:
        return "ed25519";
    }
    return "";
}

nlohmann::json Address::toJSON() const
{
    return {{"street", street},
            {"city", city},
            {"state", state},
            {"postal_code", postal_code},
            {"country", country}};
}

mw::E<Address> Address::fromJSON(const nlohmann::json& j)
{
    if(!j.is_object())
    {
        return std::unexpected(mw::httpError(400, "Address must be an object"));
    }
    Address a;
    ASSIGN_OR_RETURN(a.street, requiredString(j, "street"));
    ASSIGN_OR_RETURN(a.city, requiredString(j, "city"));
    ASSIGN_OR_RETURN(a.state, requiredString(j, "state"));
    ASSIGN_OR_RETURN(a.postal_code, requiredString(j, "postal_code"));
    ASSIGN_OR_RETURN(a.country, requiredString(j, "country"));
    return a;
}

nlohmann::json CustomerInfo::toJSON() const
{
    nlohmann::json j = {{"name", name}, {"email", email}};
    if(!phone.empty())
    {
        j["phone"] = phone;
    }
    return j;
}

mw::E<CustomerInfo> CustomerInfo::fromJSON(const nlohmann::json& j)
{
    if(!j.is_object())
    {
        return std::unexpected(
            mw::httpError(400, "Customer info must be an object"));
    }
    CustomerInfo c;
    ASSIGN_OR_RETURN(c.name, requiredString(j, "name"));
    ASSIGN_OR_RETURN(c.email, requiredString(j, "email"));
    if(c.email.find('@') == std::string::npos)
    {
        return std::unexpected(mw::httpError(400, "Invalid email address"));
    }
    if(j.contains("phone") && j["phone"].is_string())
    {
        c.phone = j["phone"].get<std::string>();
    }
    return c;
}

nlohmann::json CartLine::toJSON() const
{
    return {{"product_id", product_id},
            {"product_name", name},
            {"quantity", quantity},
            {"unit_price", centsToDouble(unit_price)},
            {"total_price", centsToDouble(lineTotal())}};
}

nlohmann::json Cart::toJSON() const
{
    nlohmann::json lines = nlohmann::json::array();
    for(const CartLine& line : items)
    {
        lines.push_back(line.toJSON());
    }
    return {{"id", id}, {"session_id", session_id}, {"items", lines}};
}

nlohmann::json Quote::toJSON() const
{
    return {{"subtotal", centsToDouble(subtotal)},
            {"shipping", centsToDouble(shipping)},
            {"tax", centsToDouble(tax)},
            {"discount", centsToDouble(discount)},
            {"total", centsToDouble(total)},
            {"currency", currency}};
}

nlohmann::json SettlementReceipt::toJSON() const
{
    return {{"receipt_id", receipt_id},
            {"transaction_id", transaction_id},
            {"payment_rail", payment_rail_used},
            {"amount_charged", centsToDouble(amount)},
            {"processing_fee", centsToDouble(processing_fee)},
            {"net_amount", centsToDouble(net_amount)}};
}

mw::E<SettlementReceipt>
SettlementReceipt::fromSettleResponse(const nlohmann::json& j)
{
    try
    {
        const nlohmann::json& r = j.at("transaction_receipt");
        SettlementReceipt receipt;
        receipt.receipt_id = r.at("receipt_id").get<std::string>();
        receipt.transaction_id = r.at("transaction_id").get<std::string>();
        receipt.payment_rail_used =
            r.at("payment_rail_used").get<std::string>();
        receipt.amount = centsField(r, "amount");
        receipt.processing_fee = centsField(r, "processing_fee");
        receipt.net_amount = centsField(r, "net_amount");
        receipt.remaining_delegation_limit =
            centsField(j, "remaining_delegation_limit");
        return receipt;
    }
    catch(const nlohmann::json::exception& e)
    {
        return std::unexpected(mw::runtimeError(
            std::format("Malformed settlement receipt: {}", e.what())));
    }
}

nlohmann::json OrderItem::toJSON() const
{
    return {{"product_id", product_id},
            {"product_name", product_name},
            {"quantity", quantity},
            {"unit_price", centsToDouble(unit_price)},
            {"total_price", centsToDouble(unit_price * quantity)}};
}

nlohmann::json Order::toJSON() const
{
    nlohmann::json item_list = nlohmann::json::array();
    for(const OrderItem& item : items)
    {
        item_list.push_back(item.toJSON());
    }
    nlohmann::json j = {
        {"id", id},
        {"order_number", order_number},
        {"customer_name", customer.name},
        {"customer_email", customer.email},
        {"total_amount", centsToDouble(amount.total)},
        {"subtotal", centsToDouble(amount.subtotal)},
        {"tax_amount", centsToDouble(amount.tax)},
        {"shipping_cost", centsToDouble(amount.shipping)},
        {"discount_amount", centsToDouble(amount.discount)},
        {"currency", amount.currency},
        {"status", status},
        {"payment_method", payment_method},
        {"payment_status", payment_status},
        {"created_at", timeToISO8601(created_at)},
        {"items", item_list},
    };
    if(!card_brand.empty())
    {
        j["card_brand"] = card_brand;
    }
    if(!card_last_four.empty())
    {
        j["card_last_four"] = card_last_four;
    }
    if(receipt.has_value())
    {
        j["receipt"] = receipt->toJSON();
    }
    return j;
}

std::string timeToISO8601(const mw::Time& t)
{
    return std::format("{:%FT%TZ}",
                       std::chrono::floor<std::chrono::seconds>(t));
}
