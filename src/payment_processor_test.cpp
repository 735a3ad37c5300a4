#include <gtest/gtest.h>
#include <mw/utils.hpp>

#include "payment_processor.hpp"

namespace {

// 2026-03-15
mw::Time march2026()
{
    return mw::secondsToTime(1773532800);
}

CardFields validCard()
{
    CardFields card;
    card.payment_session_id = "session";
    card.card_number = "4111 1111 1111 1111";
    card.expiry_date = "12/99";
    card.cvv = "123";
    card.cardholder_name = "Alice";
    return card;
}

} // namespace

TEST(CardTest, Luhn)
{
    EXPECT_TRUE(card::luhnValid("4111111111111111"));
    EXPECT_TRUE(card::luhnValid("5555555555554444"));
    EXPECT_TRUE(card::luhnValid("378282246310005"));
    EXPECT_FALSE(card::luhnValid("4111111111111112"));
    // Too short even though the checksum works.
    EXPECT_FALSE(card::luhnValid("18"));
    EXPECT_FALSE(card::luhnValid("41111111111111111111"));
    EXPECT_EQ(card::digitsOf("4111-1111 1111-1111"), "4111111111111111");
}

TEST(CardTest, Expiry)
{
    EXPECT_TRUE(card::expiryValid("03/26", march2026()));
    EXPECT_TRUE(card::expiryValid("3/2026", march2026()));
    EXPECT_TRUE(card::expiryValid("01/27", march2026()));
    EXPECT_FALSE(card::expiryValid("02/26", march2026()));
    EXPECT_FALSE(card::expiryValid("12/2025", march2026()));
    EXPECT_FALSE(card::expiryValid("13/30", march2026()));
    EXPECT_FALSE(card::expiryValid("00/30", march2026()));
    EXPECT_FALSE(card::expiryValid("0330", march2026()));
    EXPECT_FALSE(card::expiryValid("03/202", march2026()));
    EXPECT_FALSE(card::expiryValid("ab/30", march2026()));
    EXPECT_FALSE(card::expiryValid("", march2026()));
}

TEST(CardTest, CVV)
{
    EXPECT_TRUE(card::cvvValid("123"));
    EXPECT_TRUE(card::cvvValid("1234"));
    EXPECT_FALSE(card::cvvValid("12"));
    EXPECT_FALSE(card::cvvValid("12345"));
    EXPECT_FALSE(card::cvvValid("12a"));
}

TEST(CardTest, Brand)
{
    EXPECT_EQ(card::brandOf("4111111111111111"), "Visa");
    EXPECT_EQ(card::brandOf("5555555555554444"), "Mastercard");
    EXPECT_EQ(card::brandOf("2221000000000009"), "Mastercard");
    EXPECT_EQ(card::brandOf("378282246310005"), "American Express");
    EXPECT_EQ(card::brandOf("6011111111111117"), "Discover");
    EXPECT_EQ(card::brandOf("5011111111111111"), "Unknown");
}

TEST(CardTest, Validate)
{
    EXPECT_TRUE(card::validate(validCard(), march2026()).has_value());

    CardFields bad = validCard();
    bad.card_number = "4111111111111112";
    auto res = card::validate(bad, march2026());
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(std::get<mw::HTTPError>(res.error()).code, 400);
    EXPECT_EQ(mw::errorMsg(res.error()), "Payment failed: Invalid card number");

    bad = validCard();
    bad.cardholder_name.clear();
    EXPECT_FALSE(card::validate(bad, march2026()).has_value());
}

TEST(MockCardProcessorTest, Charge)
{
    MockCardProcessor processor;
    auto charge = processor.processCard(validCard(), 5319);
    ASSERT_TRUE(charge.has_value()) << mw::errorMsg(charge.error());
    EXPECT_EQ(charge->card_brand, "Visa");
    EXPECT_EQ(charge->last_four, "1111");
    EXPECT_TRUE(charge->transaction_id.starts_with("txn_"));
    EXPECT_EQ(charge->transaction_id.size(), 16);
    EXPECT_TRUE(charge->provider_reference.starts_with("ref_"));

    CardFields short_number = validCard();
    short_number.card_number = "42";
    EXPECT_FALSE(processor.processCard(short_number, 5319).has_value());
}

TEST(CardFieldsTest, FromJSON)
{
    auto fields = CardFields::fromJSON(nlohmann::json::parse(R"({
        "payment_session_id": "s", "card_number": "4111111111111111",
        "expiry_date": "12/30", "cvv": "123", "cardholder_name": "Alice"
    })"));
    ASSERT_TRUE(fields.has_value());
    EXPECT_EQ(fields->cardholder_name, "Alice");

    auto missing = CardFields::fromJSON(
        nlohmann::json::parse(R"({"payment_session_id": "s"})"));
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(std::get<mw::HTTPError>(missing.error()).code, 400);
}
