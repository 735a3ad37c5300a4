#include <regex>
#include <string>
#include <vector>

#include <gtest/gtest.h>
#include <mw/utils.hpp>

#include "crypto.hpp"

TEST(CryptoTest, SignAndVerifyRSA)
{
    Crypto crypto;
    auto keys = crypto.generateKeyPair(SignatureAlgorithm::RSA_PSS_SHA256);
    ASSERT_TRUE(keys.has_value()) << mw::errorMsg(keys.error());
    EXPECT_NE(keys->public_key.find("BEGIN PUBLIC KEY"), std::string::npos);

    auto sig = crypto.sign(SignatureAlgorithm::RSA_PSS_SHA256,
                           keys->private_key, "hello");
    ASSERT_TRUE(sig.has_value()) << mw::errorMsg(sig.error());
    EXPECT_EQ(sig->size(), 256);

    auto ok = crypto.verifySignature(SignatureAlgorithm::RSA_PSS_SHA256,
                                     keys->public_key, *sig, "hello");
    ASSERT_TRUE(ok.has_value());
    EXPECT_TRUE(*ok);

    auto bad = crypto.verifySignature(SignatureAlgorithm::RSA_PSS_SHA256,
                                      keys->public_key, *sig, "hellO");
    ASSERT_TRUE(bad.has_value());
    EXPECT_FALSE(*bad);
}

TEST(CryptoTest, SignAndVerifyEd25519)
{
    Crypto crypto;
    auto keys = crypto.generateKeyPair(SignatureAlgorithm::ED25519);
    ASSERT_TRUE(keys.has_value()) << mw::errorMsg(keys.error());

    auto sig = crypto.sign(SignatureAlgorithm::ED25519, keys->private_key,
                           "hello");
    ASSERT_TRUE(sig.has_value()) << mw::errorMsg(sig.error());
    EXPECT_EQ(sig->size(), 64);

    auto ok = crypto.verifySignature(SignatureAlgorithm::ED25519,
                                     keys->public_key, *sig, "hello");
    ASSERT_TRUE(ok.has_value());
    EXPECT_TRUE(*ok);
}

TEST(CryptoTest, KeyOfWrongTypeIsAnError)
{
    Crypto crypto;
    auto ed = crypto.generateKeyPair(SignatureAlgorithm::ED25519);
    ASSERT_TRUE(ed.has_value());
    EXPECT_FALSE(crypto.checkPublicKey(SignatureAlgorithm::RSA_PSS_SHA256,
                                       ed->public_key)
                     .has_value());
    EXPECT_TRUE(crypto.checkPublicKey(SignatureAlgorithm::ED25519,
                                      ed->public_key)
                    .has_value());
    EXPECT_FALSE(crypto.checkPublicKey(SignatureAlgorithm::ED25519,
                                       "not a key")
                     .has_value());
}

TEST(CryptoTest, HMACIsDeterministic)
{
    // RFC 4231 test case 2.
    EXPECT_EQ(hmacSHA256Hex("Jefe", "what do ya want for nothing?"),
              "5bdcc146bf60754e6a042426089575c75a003f089d2739839dec58b964ec3843");
    EXPECT_EQ(hmacSHA256Hex("k", "m"), hmacSHA256Hex("k", "m"));
    EXPECT_NE(hmacSHA256Hex("k", "m"), hmacSHA256Hex("k", "n"));
}

TEST(CryptoTest, RandomValues)
{
    auto hex = randomHex(5);
    ASSERT_TRUE(hex.has_value());
    EXPECT_EQ(hex->size(), 10);

    auto id = uuid4();
    ASSERT_TRUE(id.has_value());
    EXPECT_TRUE(std::regex_match(
        *id, std::regex("[0-9a-f]{8}-[0-9a-f]{4}-4[0-9a-f]{3}-[89ab][0-9a-f]{3}-"
                        "[0-9a-f]{12}")));
    auto other = uuid4();
    ASSERT_TRUE(other.has_value());
    EXPECT_NE(*id, *other);
}
