#include <filesystem>
#include <fstream>
#include <stdexcept>

#include <gtest/gtest.h>

#include "config.hpp"

class ConfigTest : public ::testing::Test
{
protected:
    void TearDown() override
    {
        Config::get() = Config();
        std::filesystem::remove(test_file);
    }

    void write(const std::string& content)
    {
        std::ofstream f(test_file);
        f << content;
    }

    std::string test_file = "test_config_test.yaml";
};

TEST_F(ConfigTest, Load)
{
    write("listen_address: 0.0.0.0\n"
          "port: 8080\n"
          "db_path: /tmp/shop.db\n"
          "facilitator_url: http://facilitator:8001\n"
          "facilitator_timeout_seconds: 3\n"
          "payment_session_ttl_seconds: 60\n"
          "max_signature_window_seconds: 120\n"
          "require_agent_signature: true\n"
          "merchant:\n"
          "  id: merchant_9\n"
          "  name: Corner Shop\n"
          "  secret: s3cret\n"
          "pricing:\n"
          "  domestic_shipping: 4.5\n"
          "  free_shipping_threshold: 25\n"
          "  tax_rate: 0.1\n"
          "  x402_tax_rate: 0.05\n"
          "trusted_agents:\n"
          "  - id: agent-1\n"
          "    name: Shopping Agent\n"
          "    algorithm: ed25519\n"
          "    key_id: primary\n"
          "    public_key: |\n"
          "      -----BEGIN PUBLIC KEY-----\n"
          "      MCowBQYDK2VwAyEAGb9ECWmEzf6FQbrBZ9w7lshQhqowtrbLDFw4rXAxZuE=\n"
          "      -----END PUBLIC KEY-----\n"
          "  - id: agent-2\n"
          "    algorithm: rsa-pss-sha256\n"
          "    public_key: AAAA\n"
          "catalog:\n"
          "  - name: Widget\n"
          "    description: A widget\n"
          "    price: 19.99\n"
          "  - name: Gadget\n"
          "    price: 5\n");

    Config::get().load(test_file);
    const Config& c = Config::get();
    EXPECT_EQ(c.listen_address, "0.0.0.0");
    EXPECT_EQ(c.port, 8080);
    EXPECT_EQ(c.db_path, "/tmp/shop.db");
    EXPECT_EQ(c.facilitator_url, "http://facilitator:8001");
    EXPECT_EQ(c.facilitator_timeout_seconds, 3);
    EXPECT_EQ(c.payment_session_ttl_seconds, 60);
    EXPECT_EQ(c.max_signature_window_seconds, 120);
    EXPECT_TRUE(c.require_agent_signature);

    EXPECT_EQ(c.merchant.id, "merchant_9");
    EXPECT_EQ(c.merchant.name, "Corner Shop");
    EXPECT_EQ(c.merchant.secret, "s3cret");

    EXPECT_EQ(c.pricing.domestic_shipping, 450);
    EXPECT_EQ(c.pricing.free_shipping_threshold, 2500);
    EXPECT_DOUBLE_EQ(c.pricing.tax_rate, 0.1);
    EXPECT_DOUBLE_EQ(c.pricing.x402_tax_rate, 0.05);
    // Untouched keys keep their defaults.
    EXPECT_EQ(c.pricing.international_shipping, 1999);
    EXPECT_EQ(c.pricing.x402_shipping, 1500);

    ASSERT_EQ(c.trusted_agents.size(), 2);
    EXPECT_EQ(c.trusted_agents[0].agent_id, "agent-1");
    EXPECT_EQ(c.trusted_agents[0].display_name, "Shopping Agent");
    EXPECT_EQ(c.trusted_agents[0].algorithm, SignatureAlgorithm::ED25519);
    EXPECT_EQ(c.trusted_agents[0].key_id, "primary");
    EXPECT_TRUE(c.trusted_agents[0].public_key.starts_with(
        "-----BEGIN PUBLIC KEY-----\n"));
    EXPECT_EQ(c.trusted_agents[1].display_name, "agent-2");
    EXPECT_EQ(c.trusted_agents[1].algorithm,
              SignatureAlgorithm::RSA_PSS_SHA256);

    ASSERT_EQ(c.catalog.size(), 2);
    EXPECT_EQ(c.catalog[0].name, "Widget");
    EXPECT_EQ(c.catalog[0].price, 1999);
    EXPECT_EQ(c.catalog[1].description, "");
    EXPECT_EQ(c.catalog[1].price, 500);
}

TEST_F(ConfigTest, Defaults)
{
    write("port: 9000\n");
    Config::get().load(test_file);
    const Config& c = Config::get();
    EXPECT_EQ(c.port, 9000);
    EXPECT_EQ(c.db_path, "agentpay.db");
    EXPECT_EQ(c.merchant.id, "merchant_123");
    EXPECT_EQ(c.max_signature_window_seconds, 480);
    EXPECT_FALSE(c.require_agent_signature);
    EXPECT_TRUE(c.trusted_agents.empty());
}

TEST_F(ConfigTest, UnsupportedAlgorithm)
{
    write("trusted_agents:\n"
          "  - id: agent-1\n"
          "    algorithm: hmac-sha256\n"
          "    public_key: AAAA\n");
    EXPECT_THROW(Config::get().load(test_file), std::runtime_error);
}

TEST_F(ConfigTest, MissingFile)
{
    EXPECT_THROW(Config().load("no_such_config.yaml"), std::runtime_error);
}
