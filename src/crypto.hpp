#pragma once

#include <string>
#include <string_view>
#include <vector>

#include <mw/error.hpp>

#include "types.hpp"

// PEM encoded key pair.
struct KeyPair
{
    std::string public_key;
    std::string private_key;
};

class CryptoInterface
{
public:
    virtual ~CryptoInterface() = default;

    virtual mw::E<KeyPair> generateKeyPair(SignatureAlgorithm alg) const = 0;
    virtual mw::E<std::vector<unsigned char>>
    sign(SignatureAlgorithm alg, const std::string& private_key,
         std::string_view msg) const = 0;
    // Returns false on a signature mismatch. Errors are reserved for
    // unusable keys.
    virtual mw::E<bool>
    verifySignature(SignatureAlgorithm alg, const std::string& public_key,
                    const std::vector<unsigned char>& signature,
                    std::string_view msg) const = 0;
};

// OpenSSL implementation. RSA uses PSS with SHA-256, MGF1(SHA-256) and
// maximum salt length when signing; verification accepts any salt
// length. Ed25519 keys may also be given as base64 of the raw 32
// bytes.
class Crypto : public CryptoInterface
{
public:
    mw::E<KeyPair> generateKeyPair(SignatureAlgorithm alg) const override;
    mw::E<std::vector<unsigned char>>
    sign(SignatureAlgorithm alg, const std::string& private_key,
         std::string_view msg) const override;
    mw::E<bool>
    verifySignature(SignatureAlgorithm alg, const std::string& public_key,
                    const std::vector<unsigned char>& signature,
                    std::string_view msg) const override;

    // Check that a public key can be loaded for the algorithm.
    mw::E<void> checkPublicKey(SignatureAlgorithm alg,
                               const std::string& public_key) const;
};

// Lower case hex of HMAC-SHA256(key, msg).
std::string hmacSHA256Hex(std::string_view key, std::string_view msg);
mw::E<std::string> randomHex(size_t bytes);
// A random version 4 UUID in canonical form.
mw::E<std::string> uuid4();
