#include "signature_verifier.hpp"

#include <format>
#include <variant>

#include <spdlog/spdlog.h>

namespace {

constexpr char MSG_INVALID_FORMAT[] = "invalid signature format";
constexpr char MSG_UNKNOWN_AGENT[] = "unknown agent";
constexpr char MSG_NOT_YET_VALID[] = "not yet valid";
constexpr char MSG_EXPIRED[] = "expired";
constexpr char MSG_WINDOW_TOO_LONG[] = "signature window too long";
constexpr char MSG_UNEXPECTED_TAG[] = "unexpected tag";
constexpr char MSG_UNSUPPORTED_ALG[] = "unsupported algorithm";
constexpr char MSG_INVALID_SIGNATURE[] = "invalid signature";

auto untrusted(int code, const char* reason)
{
    return std::unexpected(mw::httpError(code, reason));
}

} // namespace

SignatureVerifier::SignatureVerifier(const KeyStore& keys,
                                     std::unique_ptr<CryptoInterface> crypto,
                                     int64_t max_window_seconds)
    : keys(keys), crypto(std::move(crypto)),
      max_window_seconds(max_window_seconds)
{
}

mw::E<std::string> SignatureVerifier::verify(const SignatureHeaders& headers,
                                             const RequestContext& req) const
{
    return verify(headers, req, mw::Clock::now());
}

mw::E<std::string> SignatureVerifier::verify(const SignatureHeaders& headers,
                                             const RequestContext& req,
                                             mw::Time now) const
{
    auto parsed = signature_codec::parse(headers);
    if(!parsed.has_value())
    {
        spdlog::info("Rejecting signature: {}", mw::errorMsg(parsed.error()));
        return untrusted(400, MSG_INVALID_FORMAT);
    }
    const SignatureContext& ctx = parsed->context;

    std::optional<TrustedAgentKey> key = keys.lookup(ctx.agent_id);
    if(!key.has_value())
    {
        spdlog::info("Rejecting signature from unknown agent {}",
                     ctx.agent_id);
        return untrusted(403, MSG_UNKNOWN_AGENT);
    }
    if(!key->key_id.empty() && key->key_id != ctx.key_id)
    {
        spdlog::info("Agent {} signed with key {}, expecting {}",
                     ctx.agent_id, ctx.key_id, key->key_id);
        return untrusted(403, MSG_UNKNOWN_AGENT);
    }

    int64_t now_seconds = mw::timeToSeconds(now);
    if(now_seconds < ctx.created)
    {
        spdlog::info("Signature from {} not valid until {}", ctx.agent_id,
                     ctx.created);
        return untrusted(401, MSG_NOT_YET_VALID);
    }
    if(now_seconds > ctx.expires)
    {
        spdlog::info("Signature from {} expired at {}", ctx.agent_id,
                     ctx.expires);
        return untrusted(401, MSG_EXPIRED);
    }
    if(max_window_seconds > 0 && ctx.expires - ctx.created > max_window_seconds)
    {
        spdlog::info("Signature from {} has a {}s window", ctx.agent_id,
                     ctx.expires - ctx.created);
        return untrusted(401, MSG_WINDOW_TOO_LONG);
    }

    if(!req.expected_tag.empty() && ctx.tag != req.expected_tag)
    {
        spdlog::info("Signature from {} has tag {}, expecting {}",
                     ctx.agent_id, ctx.tag, req.expected_tag);
        return untrusted(401, MSG_UNEXPECTED_TAG);
    }

    auto base = signature_codec::signatureBase(ctx, req);
    if(!base.has_value())
    {
        spdlog::info("Cannot rebuild signature base for {}: {}",
                     ctx.agent_id, mw::errorMsg(base.error()));
        return untrusted(400, MSG_INVALID_FORMAT);
    }

    if(!ctx.algorithm().has_value())
    {
        spdlog::info("Agent {} uses unsupported algorithm {}", ctx.agent_id,
                     ctx.alg);
        return untrusted(400, MSG_UNSUPPORTED_ALG);
    }

    auto valid = verifyBytes(*parsed, *key, *base);
    if(!valid.has_value())
    {
        spdlog::error("Cannot verify signature from {}: {}", ctx.agent_id,
                      mw::errorMsg(valid.error()));
        return untrusted(401, MSG_INVALID_SIGNATURE);
    }
    if(!*valid)
    {
        spdlog::warn("Invalid signature from agent {}", ctx.agent_id);
        return untrusted(401, MSG_INVALID_SIGNATURE);
    }

    spdlog::debug("Verified signature from {}", ctx.agent_id);
    return key->display_name;
}

mw::E<bool> SignatureVerifier::verifyBytes(const ParsedSignature& sig,
                                           const TrustedAgentKey& key,
                                           const std::string& base) const
{
    SignatureAlgorithm alg = *sig.context.algorithm();
    // A signature must use the algorithm the agent registered.
    if(alg != key.algorithm)
    {
        return false;
    }
    switch(alg)
    {
    case SignatureAlgorithm::RSA_PSS_SHA256:
        return crypto->verifySignature(SignatureAlgorithm::RSA_PSS_SHA256,
                                       key.public_key, sig.signature, base);
    case SignatureAlgorithm::ED25519:
        return crypto->verifySignature(SignatureAlgorithm::ED25519,
                                       key.public_key, sig.signature, base);
    }
    return std::unexpected(mw::runtimeError("Unreachable algorithm"));
}

TrustDecision SignatureVerifier::decide(const SignatureHeaders& headers,
                                        const RequestContext& req) const
{
    TrustDecision decision;
    auto result = verify(headers, req);
    if(result.has_value())
    {
        decision.trusted = true;
        decision.message = std::format("Verified agent: {}", *result);
        decision.agent_name = *std::move(result);
    }
    else
    {
        decision.message = mw::errorMsg(result.error());
    }
    return decision;
}
