#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <mw/error.hpp>

#include "crypto.hpp"
#include "types.hpp"

constexpr char SIGNATURE_LABEL[] = "sig2";
constexpr char TAG_BROWSER_AUTH[] = "agent-browser-auth";
constexpr char TAG_PAYER_AUTH[] = "agent-payer-auth";

// Names of the signature parameters, in the order they are written
// unless a parsed header says otherwise.
std::vector<std::string> defaultParamOrder();

struct SignatureContext
{
    std::string agent_id;
    std::vector<std::string> components = {"@authority", "@path"};
    std::string nonce;
    int64_t created = 0;
    int64_t expires = 0;
    std::string key_id;
    // As declared in the “alg” parameter. It may name an algorithm we
    // do not support.
    std::string alg;
    std::string tag;
    std::vector<std::string> param_order = defaultParamOrder();

    std::optional<SignatureAlgorithm> algorithm() const
    {
        return algorithmFromStr(alg);
    }
};

struct SignatureHeaders
{
    std::string signature_agent;
    std::string signature_input;
    std::string signature;
};

struct ParsedSignature
{
    SignatureContext context;
    std::vector<unsigned char> signature;
};

// The verifier’s own view of the request being signed or verified.
struct RequestContext
{
    std::string authority;
    std::string path;
    // Values of covered components other than @authority and @path,
    // keyed by lower case component name.
    std::unordered_map<std::string, std::string> components;
    // If not empty, the signature’s tag must equal this.
    std::string expected_tag;
};

namespace signature_codec
{

bool isValidComponentName(std::string_view name);

// The inner list and parameters, i.e. Signature-Input without the
// label.
std::string serializeParams(const SignatureContext& ctx);
std::string signatureInputHeader(const SignatureContext& ctx);
std::string signatureAgentHeader(std::string_view agent_id);
std::string signatureHeader(const std::vector<unsigned char>& signature);

// Build the text that is signed. Fails if the request lacks a
// covered component.
mw::E<std::string> signatureBase(const SignatureContext& ctx,
                                 const RequestContext& req);

// Agent side: sign the request and produce the three headers.
mw::E<SignatureHeaders> sign(const SignatureContext& ctx,
                             const RequestContext& req,
                             const std::string& private_key,
                             const CryptoInterface& crypto);

// Merchant side: strict parse of the three headers. Any deviation
// from the grammar is a 400.
mw::E<ParsedSignature> parse(const SignatureHeaders& headers);

} // namespace signature_codec
