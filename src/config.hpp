#pragma once
#include <string>
#include <vector>

#include "pricing.hpp"
#include "types.hpp"

struct MerchantConfig
{
    std::string id = "merchant_123";
    std::string name = "Reference Merchant";
    std::string secret = "merchant_merchant_123_secret";
};

struct Config
{
    std::string listen_address = "127.0.0.1";
    int port = 8000;
    std::string db_path = "agentpay.db";
    MerchantConfig merchant;
    std::string facilitator_url = "http://localhost:8001";
    int facilitator_timeout_seconds = 10;
    int payment_session_ttl_seconds = 900;
    // Zero disables the cap.
    int max_signature_window_seconds = 480;
    // Off by default: x402 checkout then accepts unsigned requests, and
    // verification is left to a proxy in front of the server.
    bool require_agent_signature = false;
    PricingPolicy pricing;
    std::vector<TrustedAgentKey> trusted_agents;
    // Inserted into an empty product table at startup.
    std::vector<Product> catalog;

    static Config& get();
    void load(const std::string& path);
};
