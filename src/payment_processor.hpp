#pragma once

#include <string>
#include <string_view>

#include <mw/error.hpp>
#include <mw/utils.hpp>
#include <nlohmann/json.hpp>

#include "types.hpp"

// Card details from a fulfill request.
struct CardFields
{
    std::string payment_session_id;
    std::string card_number;
    std::string expiry_date;
    std::string cvv;
    std::string cardholder_name;

    static mw::E<CardFields> fromJSON(const nlohmann::json& j);
};

struct CardCharge
{
    std::string transaction_id;
    std::string provider_reference;
    std::string card_brand;
    std::string last_four;
};

namespace card
{

// Remove everything but digits.
std::string digitsOf(std::string_view card_number);
bool luhnValid(std::string_view digits);
// MM/YY or MM/YYYY, not before the month of “now”.
bool expiryValid(std::string_view expiry, mw::Time now);
bool cvvValid(std::string_view cvv);
std::string brandOf(std::string_view digits);

// Check every field. Errors are 400 with a reason.
mw::E<void> validate(const CardFields& fields, mw::Time now);

} // namespace card

class CardProcessorInterface
{
public:
    virtual ~CardProcessorInterface() = default;
    // Fields have already passed card::validate().
    virtual mw::E<CardCharge> processCard(const CardFields& fields,
                                          Cents amount) = 0;
};

// Approves every card.
class MockCardProcessor : public CardProcessorInterface
{
public:
    mw::E<CardCharge> processCard(const CardFields& fields,
                                  Cents amount) override;
};
