#include "crypto.hpp"

#include <array>
#include <format>
#include <memory>

#include <mw/utils.hpp>
#include <openssl/bio.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/pem.h>
#include <openssl/rand.h>
#include <openssl/rsa.h>

namespace {

constexpr size_t ED25519_KEY_SIZE = 32;
constexpr size_t RSA_KEY_BITS = 2048;

struct PKeyDeleter
{
    void operator()(EVP_PKEY* p) const { EVP_PKEY_free(p); }
};
struct MDCtxDeleter
{
    void operator()(EVP_MD_CTX* p) const { EVP_MD_CTX_free(p); }
};
struct BIODeleter
{
    void operator()(BIO* p) const { BIO_free(p); }
};

using PKeyPtr = std::unique_ptr<EVP_PKEY, PKeyDeleter>;
using MDCtxPtr = std::unique_ptr<EVP_MD_CTX, MDCtxDeleter>;
using BIOPtr = std::unique_ptr<BIO, BIODeleter>;

std::string opensslError(std::string_view what)
{
    unsigned long code = ERR_get_error();
    ERR_clear_error();
    if(code == 0)
    {
        return std::string(what);
    }
    char buffer[256];
    ERR_error_string_n(code, buffer, sizeof(buffer));
    return std::format("{}: {}", what, buffer);
}

bool isPEM(const std::string& key)
{
    return key.find("-----BEGIN") != std::string::npos;
}

int expectedKeyType(SignatureAlgorithm alg)
{
    switch(alg)
    {
    case SignatureAlgorithm::RSA_PSS_SHA256:
        return EVP_PKEY_RSA;
    case SignatureAlgorithm::ED25519:
        return EVP_PKEY_ED25519;
    }
    return EVP_PKEY_NONE;
}

mw::E<PKeyPtr> checkType(PKeyPtr key, SignatureAlgorithm alg)
{
    if(EVP_PKEY_get_base_id(key.get()) != expectedKeyType(alg))
    {
        return std::unexpected(mw::runtimeError(std::format(
            "Key is not usable with {}", algorithmName(alg))));
    }
    return key;
}

mw::E<PKeyPtr> loadPublicKey(SignatureAlgorithm alg, const std::string& key)
{
    if(!isPEM(key) && alg == SignatureAlgorithm::ED25519)
    {
        ASSIGN_OR_RETURN(std::vector<unsigned char> raw,
                         mw::base64Decode(key));
        if(raw.size() != ED25519_KEY_SIZE)
        {
            return std::unexpected(mw::runtimeError(std::format(
                "Ed25519 public key must be 32 bytes, got {}", raw.size())));
        }
        PKeyPtr pkey(EVP_PKEY_new_raw_public_key(EVP_PKEY_ED25519, nullptr,
                                                 raw.data(), raw.size()));
        if(pkey == nullptr)
        {
            return std::unexpected(mw::runtimeError(
                opensslError("Failed to load Ed25519 public key")));
        }
        return pkey;
    }

    BIOPtr bio(BIO_new_mem_buf(key.data(), static_cast<int>(key.size())));
    if(bio == nullptr)
    {
        return std::unexpected(mw::runtimeError(opensslError("BIO failed")));
    }
    PKeyPtr pkey(PEM_read_bio_PUBKEY(bio.get(), nullptr, nullptr, nullptr));
    if(pkey == nullptr)
    {
        return std::unexpected(
            mw::runtimeError(opensslError("Failed to load public key")));
    }
    return checkType(std::move(pkey), alg);
}

mw::E<PKeyPtr> loadPrivateKey(SignatureAlgorithm alg, const std::string& key)
{
    if(!isPEM(key) && alg == SignatureAlgorithm::ED25519)
    {
        ASSIGN_OR_RETURN(std::vector<unsigned char> raw,
                         mw::base64Decode(key));
        if(raw.size() != ED25519_KEY_SIZE)
        {
            return std::unexpected(mw::runtimeError(std::format(
                "Ed25519 private key must be 32 bytes, got {}", raw.size())));
        }
        PKeyPtr pkey(EVP_PKEY_new_raw_private_key(EVP_PKEY_ED25519, nullptr,
                                                  raw.data(), raw.size()));
        if(pkey == nullptr)
        {
            return std::unexpected(mw::runtimeError(
                opensslError("Failed to load Ed25519 private key")));
        }
        return pkey;
    }

    BIOPtr bio(BIO_new_mem_buf(key.data(), static_cast<int>(key.size())));
    if(bio == nullptr)
    {
        return std::unexpected(mw::runtimeError(opensslError("BIO failed")));
    }
    PKeyPtr pkey(
        PEM_read_bio_PrivateKey(bio.get(), nullptr, nullptr, nullptr));
    if(pkey == nullptr)
    {
        return std::unexpected(
            mw::runtimeError(opensslError("Failed to load private key")));
    }
    return checkType(std::move(pkey), alg);
}

mw::E<std::string> bioToString(BIO* bio)
{
    char* data = nullptr;
    long size = BIO_get_mem_data(bio, &data);
    if(size <= 0 || data == nullptr)
    {
        return std::unexpected(mw::runtimeError("Empty PEM output"));
    }
    return std::string(data, static_cast<size_t>(size));
}

mw::E<void> configurePSS(EVP_PKEY_CTX* pctx, int salt_length)
{
    if(EVP_PKEY_CTX_set_rsa_padding(pctx, RSA_PKCS1_PSS_PADDING) <= 0 ||
       EVP_PKEY_CTX_set_rsa_mgf1_md(pctx, EVP_sha256()) <= 0 ||
       EVP_PKEY_CTX_set_rsa_pss_saltlen(pctx, salt_length) <= 0)
    {
        return std::unexpected(
            mw::runtimeError(opensslError("Failed to set up RSA-PSS")));
    }
    return {};
}

} // namespace

mw::E<KeyPair> Crypto::generateKeyPair(SignatureAlgorithm alg) const
{
    PKeyPtr pkey;
    switch(alg)
    {
    case SignatureAlgorithm::RSA_PSS_SHA256:
        pkey.reset(EVP_PKEY_Q_keygen(nullptr, nullptr, "RSA", RSA_KEY_BITS));
        break;
    case SignatureAlgorithm::ED25519:
        pkey.reset(EVP_PKEY_Q_keygen(nullptr, nullptr, "ED25519"));
        break;
    }
    if(pkey == nullptr)
    {
        return std::unexpected(
            mw::runtimeError(opensslError("Key generation failed")));
    }

    KeyPair keys;
    {
        BIOPtr bio(BIO_new(BIO_s_mem()));
        if(bio == nullptr || PEM_write_bio_PUBKEY(bio.get(), pkey.get()) != 1)
        {
            return std::unexpected(
                mw::runtimeError(opensslError("Failed to write public key")));
        }
        ASSIGN_OR_RETURN(keys.public_key, bioToString(bio.get()));
    }
    {
        BIOPtr bio(BIO_new(BIO_s_mem()));
        if(bio == nullptr ||
           PEM_write_bio_PrivateKey(bio.get(), pkey.get(), nullptr, nullptr,
                                    0, nullptr, nullptr) != 1)
        {
            return std::unexpected(
                mw::runtimeError(opensslError("Failed to write private key")));
        }
        ASSIGN_OR_RETURN(keys.private_key, bioToString(bio.get()));
    }
    return keys;
}

mw::E<std::vector<unsigned char>>
Crypto::sign(SignatureAlgorithm alg, const std::string& private_key,
             std::string_view msg) const
{
    ASSIGN_OR_RETURN(PKeyPtr pkey, loadPrivateKey(alg, private_key));
    MDCtxPtr ctx(EVP_MD_CTX_new());
    if(ctx == nullptr)
    {
        return std::unexpected(mw::runtimeError(opensslError("MD ctx")));
    }

    EVP_PKEY_CTX* pctx = nullptr;
    const EVP_MD* md =
        alg == SignatureAlgorithm::RSA_PSS_SHA256 ? EVP_sha256() : nullptr;
    if(EVP_DigestSignInit(ctx.get(), &pctx, md, nullptr, pkey.get()) != 1)
    {
        return std::unexpected(
            mw::runtimeError(opensslError("Failed to initialize signer")));
    }
    if(alg == SignatureAlgorithm::RSA_PSS_SHA256)
    {
        DO_OR_RETURN(configurePSS(pctx, RSA_PSS_SALTLEN_MAX));
    }

    const auto* data = reinterpret_cast<const unsigned char*>(msg.data());
    size_t sig_len = 0;
    if(EVP_DigestSign(ctx.get(), nullptr, &sig_len, data, msg.size()) != 1)
    {
        return std::unexpected(
            mw::runtimeError(opensslError("Failed to size signature")));
    }
    std::vector<unsigned char> signature(sig_len);
    if(EVP_DigestSign(ctx.get(), signature.data(), &sig_len, data,
                      msg.size()) != 1)
    {
        return std::unexpected(
            mw::runtimeError(opensslError("Signing failed")));
    }
    signature.resize(sig_len);
    return signature;
}

mw::E<bool>
Crypto::verifySignature(SignatureAlgorithm alg, const std::string& public_key,
                        const std::vector<unsigned char>& signature,
                        std::string_view msg) const
{
    ASSIGN_OR_RETURN(PKeyPtr pkey, loadPublicKey(alg, public_key));
    MDCtxPtr ctx(EVP_MD_CTX_new());
    if(ctx == nullptr)
    {
        return std::unexpected(mw::runtimeError(opensslError("MD ctx")));
    }

    EVP_PKEY_CTX* pctx = nullptr;
    switch(alg)
    {
    case SignatureAlgorithm::RSA_PSS_SHA256:
        if(EVP_DigestVerifyInit(ctx.get(), &pctx, EVP_sha256(), nullptr,
                                pkey.get()) != 1)
        {
            return std::unexpected(mw::runtimeError(
                opensslError("Failed to initialize verifier")));
        }
        DO_OR_RETURN(configurePSS(pctx, RSA_PSS_SALTLEN_AUTO));
        break;
    case SignatureAlgorithm::ED25519:
        if(EVP_DigestVerifyInit(ctx.get(), nullptr, nullptr, nullptr,
                                pkey.get()) != 1)
        {
            return std::unexpected(mw::runtimeError(
                opensslError("Failed to initialize verifier")));
        }
        break;
    }

    int rc = EVP_DigestVerify(
        ctx.get(), signature.data(), signature.size(),
        reinterpret_cast<const unsigned char*>(msg.data()), msg.size());
    // Anything but 1 is a mismatch, including a malformed signature
    // blob.
    ERR_clear_error();
    return rc == 1;
}

mw::E<void> Crypto::checkPublicKey(SignatureAlgorithm alg,
                                   const std::string& public_key) const
{
    ASSIGN_OR_RETURN(PKeyPtr pkey, loadPublicKey(alg, public_key));
    return {};
}

std::string hmacSHA256Hex(std::string_view key, std::string_view msg)
{
    std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
    unsigned int digest_len = 0;
    HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
         reinterpret_cast<const unsigned char*>(msg.data()), msg.size(),
         digest.data(), &digest_len);

    std::string hex;
    hex.reserve(digest_len * 2);
    for(unsigned int i = 0; i < digest_len; i++)
    {
        hex += std::format("{:02x}", digest[i]);
    }
    return hex;
}

mw::E<std::string> randomHex(size_t bytes)
{
    std::vector<unsigned char> buffer(bytes);
    if(RAND_bytes(buffer.data(), static_cast<int>(buffer.size())) != 1)
    {
        return std::unexpected(
            mw::runtimeError(opensslError("RAND_bytes failed")));
    }
    std::string hex;
    for(unsigned char b : buffer)
    {
        hex += std::format("{:02x}", b);
    }
    return hex;
}

mw::E<std::string> uuid4()
{
    std::array<unsigned char, 16> b{};
    if(RAND_bytes(b.data(), static_cast<int>(b.size())) != 1)
    {
        return std::unexpected(
            mw::runtimeError(opensslError("RAND_bytes failed")));
    }
    b[6] = (b[6] & 0x0f) | 0x40;
    b[8] = (b[8] & 0x3f) | 0x80;
    return std::format(
        "{:02x}{:02x}{:02x}{:02x}-{:02x}{:02x}-{:02x}{:02x}-{:02x}{:02x}-"
        "{:02x}{:02x}{:02x}{:02x}{:02x}{:02x}",
        b[0], b[1], b[2], b[3], b[4], b[5], b[6], b[7], b[8], b[9], b[10],
        b[11], b[12], b[13], b[14], b[15]);
}
