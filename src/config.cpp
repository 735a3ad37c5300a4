#include "config.hpp"
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <ryml.hpp>
#include <ryml_std.hpp> // For std::string support

namespace {

std::string readFile(const std::string& path) {
    std::ifstream f(path, std::ios::in | std::ios::binary);
    if (!f) throw std::runtime_error("Cannot open config file: " + path);
    std::stringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

// Money is written in dollars in the config file.
void readMoney(ryml::NodeRef node, const char* key, Cents& out) {
    if (!node.has_child(ryml::to_csubstr(key))) return;
    double dollars = 0.0;
    node[ryml::to_csubstr(key)] >> dollars;
    out = dollarsToCents(dollars);
}

TrustedAgentKey readAgent(ryml::NodeRef node) {
    TrustedAgentKey key;
    std::string alg;
    if (node.has_child("id")) node["id"] >> key.agent_id;
    if (node.has_child("name")) node["name"] >> key.display_name;
    if (node.has_child("algorithm")) node["algorithm"] >> alg;
    if (node.has_child("public_key")) node["public_key"] >> key.public_key;
    if (node.has_child("key_id")) node["key_id"] >> key.key_id;

    if (key.agent_id.empty() || key.public_key.empty()) {
        throw std::runtime_error(
            "Trusted agent entry needs an id and a public_key");
    }
    auto parsed = algorithmFromStr(alg);
    if (!parsed) {
        throw std::runtime_error("Unsupported algorithm for trusted agent " +
                                 key.agent_id + ": " + alg);
    }
    key.algorithm = *parsed;
    if (key.display_name.empty()) key.display_name = key.agent_id;
    return key;
}

Product readProduct(ryml::NodeRef node) {
    Product p;
    if (node.has_child("name")) node["name"] >> p.name;
    if (node.has_child("description")) node["description"] >> p.description;
    readMoney(node, "price", p.price);
    if (p.name.empty()) throw std::runtime_error("Catalog entry needs a name");
    return p;
}

} // namespace

Config& Config::get() {
    static Config instance;
    return instance;
}

void Config::load(const std::string& path) {
    std::string content = readFile(path);
    // parse_in_arena copies the buffer, and values are copied out
    // immediately.
    ryml::Tree tree = ryml::parse_in_arena(ryml::to_csubstr(content));
    ryml::NodeRef root = tree.rootref();

    if (root.has_child("listen_address")) root["listen_address"] >> listen_address;
    if (root.has_child("port")) root["port"] >> port;
    if (root.has_child("db_path")) root["db_path"] >> db_path;
    if (root.has_child("facilitator_url")) root["facilitator_url"] >> facilitator_url;
    if (root.has_child("facilitator_timeout_seconds"))
        root["facilitator_timeout_seconds"] >> facilitator_timeout_seconds;
    if (root.has_child("payment_session_ttl_seconds"))
        root["payment_session_ttl_seconds"] >> payment_session_ttl_seconds;
    if (root.has_child("max_signature_window_seconds"))
        root["max_signature_window_seconds"] >> max_signature_window_seconds;
    if (root.has_child("require_agent_signature"))
        root["require_agent_signature"] >> require_agent_signature;

    if (root.has_child("merchant")) {
        auto node = root["merchant"];
        if (node.has_child("id")) node["id"] >> merchant.id;
        if (node.has_child("name")) node["name"] >> merchant.name;
        if (node.has_child("secret")) node["secret"] >> merchant.secret;
    }

    if (root.has_child("pricing")) {
        auto node = root["pricing"];
        if (node.has_child("currency")) node["currency"] >> pricing.currency;
        if (node.has_child("domestic_country"))
            node["domestic_country"] >> pricing.domestic_country;
        readMoney(node, "domestic_shipping", pricing.domestic_shipping);
        readMoney(node, "free_shipping_threshold",
                  pricing.free_shipping_threshold);
        readMoney(node, "international_shipping",
                  pricing.international_shipping);
        if (node.has_child("tax_rate")) node["tax_rate"] >> pricing.tax_rate;
        readMoney(node, "x402_shipping", pricing.x402_shipping);
        if (node.has_child("x402_tax_rate"))
            node["x402_tax_rate"] >> pricing.x402_tax_rate;
    }

    if (root.has_child("trusted_agents")) {
        trusted_agents.clear();
        for (ryml::NodeRef agent : root["trusted_agents"].children()) {
            trusted_agents.push_back(readAgent(agent));
        }
    }

    if (root.has_child("catalog")) {
        catalog.clear();
        for (ryml::NodeRef product : root["catalog"].children()) {
            catalog.push_back(readProduct(product));
        }
    }
}
