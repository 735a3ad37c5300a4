#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include <mw/error.hpp>
#include <mw/utils.hpp>

#include "crypto.hpp"
#include "key_store.hpp"
#include "signature_codec.hpp"

// Result of a verification, in the shape the verification API
// reports it.
struct TrustDecision
{
    bool trusted = false;
    std::string message;
    std::optional<std::string> agent_name;
};

class SignatureVerifier
{
public:
    // A max_window_seconds of zero or less disables the window cap.
    SignatureVerifier(const KeyStore& keys,
                      std::unique_ptr<CryptoInterface> crypto,
                      int64_t max_window_seconds);

    // Verifies the agent signature of a request. Returns the display
    // name of the trusted agent on success. Failures are HTTP errors
    // whose message is the untrusted reason.
    mw::E<std::string> verify(const SignatureHeaders& headers,
                              const RequestContext& req) const;
    mw::E<std::string> verify(const SignatureHeaders& headers,
                              const RequestContext& req, mw::Time now) const;

    TrustDecision decide(const SignatureHeaders& headers,
                         const RequestContext& req) const;

private:
    mw::E<bool> verifyBytes(const ParsedSignature& sig,
                            const TrustedAgentKey& key,
                            const std::string& base) const;

    const KeyStore& keys;
    std::unique_ptr<CryptoInterface> crypto;
    int64_t max_window_seconds;
};
