#include "payment_processor.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <charconv>
#include <format>
#include <optional>

#include <spdlog/spdlog.h>

#include "crypto.hpp"

namespace {

mw::E<std::string> requiredField(const nlohmann::json& j, const char* key)
{
    if(!j.contains(key) || !j[key].is_string())
    {
        return std::unexpected(mw::httpError(
            400, std::format("Missing or invalid field: {}", key)));
    }
    return j[key].get<std::string>();
}

bool allDigits(std::string_view s)
{
    return !s.empty() && std::all_of(s.begin(), s.end(), [](char c)
    {
        return std::isdigit(static_cast<unsigned char>(c)) != 0;
    });
}

std::optional<int> toInt(std::string_view s)
{
    if(!allDigits(s))
    {
        return std::nullopt;
    }
    int value = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if(ec != std::errc() || ptr != s.data() + s.size())
    {
        return std::nullopt;
    }
    return value;
}

} // namespace

mw::E<CardFields> CardFields::fromJSON(const nlohmann::json& j)
{
    if(!j.is_object())
    {
        return std::unexpected(mw::httpError(400, "Invalid request body"));
    }
    CardFields fields;
    ASSIGN_OR_RETURN(fields.payment_session_id,
                     requiredField(j, "payment_session_id"));
    ASSIGN_OR_RETURN(fields.card_number, requiredField(j, "card_number"));
    ASSIGN_OR_RETURN(fields.expiry_date, requiredField(j, "expiry_date"));
    ASSIGN_OR_RETURN(fields.cvv, requiredField(j, "cvv"));
    ASSIGN_OR_RETURN(fields.cardholder_name,
                     requiredField(j, "cardholder_name"));
    return fields;
}

namespace card
{

std::string digitsOf(std::string_view card_number)
{
    std::string digits;
    for(char c : card_number)
    {
        if(std::isdigit(static_cast<unsigned char>(c)))
        {
            digits += c;
        }
    }
    return digits;
}

bool luhnValid(std::string_view digits)
{
    if(digits.size() < 13 || digits.size() > 19 || !allDigits(digits))
    {
        return false;
    }
    int sum = 0;
    bool double_it = false;
    for(auto it = digits.rbegin(); it != digits.rend(); it++)
    {
        int d = *it - '0';
        if(double_it)
        {
            d *= 2;
            if(d > 9)
            {
                d -= 9;
            }
        }
        sum += d;
        double_it = !double_it;
    }
    return sum % 10 == 0;
}

bool expiryValid(std::string_view expiry, mw::Time now)
{
    size_t slash = expiry.find('/');
    if(slash == std::string_view::npos)
    {
        return false;
    }
    std::string_view month_str = expiry.substr(0, slash);
    std::string_view year_str = expiry.substr(slash + 1);
    if(month_str.empty() || month_str.size() > 2 ||
       (year_str.size() != 2 && year_str.size() != 4))
    {
        return false;
    }
    auto month = toInt(month_str);
    auto year = toInt(year_str);
    if(!month.has_value() || !year.has_value() || *month < 1 || *month > 12)
    {
        return false;
    }
    if(*year < 100)
    {
        *year += 2000;
    }

    std::chrono::year_month_day today{
        std::chrono::floor<std::chrono::days>(now)};
    int this_year = static_cast<int>(today.year());
    int this_month = static_cast<int>(static_cast<unsigned>(today.month()));
    return *year > this_year || (*year == this_year && *month >= this_month);
}

bool cvvValid(std::string_view cvv)
{
    return (cvv.size() == 3 || cvv.size() == 4) && allDigits(cvv);
}

std::string brandOf(std::string_view digits)
{
    if(digits.starts_with('4'))
    {
        return "Visa";
    }
    if(digits.size() >= 2 && digits[0] == '5' && digits[1] >= '1' &&
       digits[1] <= '5')
    {
        return "Mastercard";
    }
    if(digits.starts_with('2'))
    {
        return "Mastercard";
    }
    if(digits.starts_with("34") || digits.starts_with("37"))
    {
        return "American Express";
    }
    if(digits.starts_with('6'))
    {
        return "Discover";
    }
    return "Unknown";
}

mw::E<void> validate(const CardFields& fields, mw::Time now)
{
    if(!luhnValid(digitsOf(fields.card_number)))
    {
        return std::unexpected(
            mw::httpError(400, "Payment failed: Invalid card number"));
    }
    if(!expiryValid(fields.expiry_date, now))
    {
        return std::unexpected(
            mw::httpError(400, "Payment failed: Invalid or expired card"));
    }
    if(!cvvValid(fields.cvv))
    {
        return std::unexpected(
            mw::httpError(400, "Payment failed: Invalid CVV"));
    }
    if(fields.cardholder_name.empty())
    {
        return std::unexpected(
            mw::httpError(400, "Payment failed: Missing cardholder name"));
    }
    return {};
}

} // namespace card

mw::E<CardCharge> MockCardProcessor::processCard(const CardFields& fields,
                                                 Cents amount)
{
    std::string digits = card::digitsOf(fields.card_number);
    if(digits.size() < 4)
    {
        return std::unexpected(
            mw::httpError(400, "Payment failed: Invalid card number"));
    }

    CardCharge charge;
    ASSIGN_OR_RETURN(std::string txn, randomHex(6));
    ASSIGN_OR_RETURN(std::string ref, randomHex(4));
    charge.transaction_id = "txn_" + txn;
    charge.provider_reference = "ref_" + ref;
    charge.card_brand = card::brandOf(digits);
    charge.last_four = digits.substr(digits.size() - 4);
    spdlog::info("Charged {} to {} card ending {}", formatCents(amount),
                 charge.card_brand, charge.last_four);
    return charge;
}
