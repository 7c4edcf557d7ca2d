/**
 * @file crypto.cpp
 * @brief Ed25519 signing, SHA-256 and encodings for the device identity
 * @note libsodium is REQUIRED - no fallback implementations
 */

#include "clawchat_crypto.hpp"
#include <stdexcept>
#include <cstring>
#include <sstream>
#include <iomanip>

#ifndef HAVE_SODIUM
#error "libsodium is required for cryptographic operations. Please install libsodium and rebuild"
#endif

#include <sodium.h>

namespace clawchat {

static_assert(Crypto::kPublicKeyBytes == crypto_sign_PUBLICKEYBYTES, "ed25519 public key size");
static_assert(Crypto::kSecretKeyBytes == crypto_sign_SECRETKEYBYTES, "ed25519 secret key size");
static_assert(Crypto::kSignatureBytes == crypto_sign_BYTES, "ed25519 signature size");

Crypto::Crypto() {
    init_libsodium();
}

void Crypto::init_libsodium() {
    // sodium_init() returns 1 when already initialised
    if (sodium_init() < 0) {
        throw std::runtime_error("Failed to initialize libsodium");
    }
}

Crypto::KeyPair Crypto::generate_keypair() {
    KeyPair kp;
    kp.public_key.resize(crypto_sign_PUBLICKEYBYTES);
    kp.secret_key = SecureMemory(crypto_sign_SECRETKEYBYTES);
    kp.secret_key.lock();

    if (crypto_sign_keypair(kp.public_key.data(), kp.secret_key.data()) != 0) {
        throw std::runtime_error("Failed to generate Ed25519 keypair");
    }

    return kp;
}

std::vector<uint8_t> Crypto::sign_ed25519(
    const std::string& message,
    const SecureMemory& secret_key
) {
    if (secret_key.size() != crypto_sign_SECRETKEYBYTES) {
        throw std::runtime_error("Invalid Ed25519 secret key size");
    }

    std::vector<uint8_t> signature(crypto_sign_BYTES);

    if (crypto_sign_detached(signature.data(), nullptr,
                             reinterpret_cast<const unsigned char*>(message.data()),
                             message.size(),
                             secret_key.data()) != 0) {
        throw std::runtime_error("Ed25519 signing failed");
    }

    return signature;
}

bool Crypto::verify_ed25519(
    const std::string& message,
    const std::vector<uint8_t>& signature,
    const std::vector<uint8_t>& public_key
) {
    if (signature.size() != crypto_sign_BYTES) {
        return false;
    }

    if (public_key.size() != crypto_sign_PUBLICKEYBYTES) {
        return false;
    }

    return crypto_sign_verify_detached(
        signature.data(),
        reinterpret_cast<const unsigned char*>(message.data()), message.size(),
        public_key.data()) == 0;
}

bool Crypto::keypair_matches(
    const std::vector<uint8_t>& public_key,
    const SecureMemory& secret_key
) {
    if (public_key.size() != crypto_sign_PUBLICKEYBYTES ||
        secret_key.size() != crypto_sign_SECRETKEYBYTES) {
        return false;
    }

    SecureMemory seed(crypto_sign_SEEDBYTES);
    crypto_sign_ed25519_sk_to_seed(seed.data(), secret_key.data());

    std::vector<uint8_t> derived(crypto_sign_PUBLICKEYBYTES);
    SecureMemory derived_secret(crypto_sign_SECRETKEYBYTES);
    if (crypto_sign_seed_keypair(derived.data(), derived_secret.data(), seed.data()) != 0) {
        return false;
    }

    // The signer reads the public half stored after the seed
    return sodium_memcmp(derived.data(), public_key.data(), crypto_sign_PUBLICKEYBYTES) == 0 &&
           sodium_memcmp(secret_key.data() + crypto_sign_SEEDBYTES, public_key.data(),
                         crypto_sign_PUBLICKEYBYTES) == 0;
}

std::vector<uint8_t> Crypto::hash_sha256(const std::vector<uint8_t>& data) {
    std::vector<uint8_t> hash(crypto_hash_sha256_BYTES);
    crypto_hash_sha256(hash.data(), data.data(), data.size());
    return hash;
}

std::string Crypto::bytes_to_hex(const uint8_t* data, size_t len) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (size_t i = 0; i < len; ++i) {
        oss << std::setw(2) << static_cast<int>(data[i]);
    }
    return oss.str();
}

std::string Crypto::to_base64url(const uint8_t* data, size_t len) {
    const int variant = sodium_base64_VARIANT_URLSAFE_NO_PADDING;
    std::string out(sodium_base64_ENCODED_LEN(len, variant), '\0');
    sodium_bin2base64(&out[0], out.size(), data, len, variant);
    // ENCODED_LEN counts the terminating NUL
    out.resize(std::strlen(out.c_str()));
    return out;
}

std::optional<std::vector<uint8_t>> Crypto::from_base64url(const std::string& text) {
    std::vector<uint8_t> out(text.size() * 3 / 4 + 1);
    size_t decoded = 0;
    const char* end = nullptr;
    if (sodium_base642bin(out.data(), out.size(),
                          text.data(), text.size(),
                          nullptr, &decoded, &end,
                          sodium_base64_VARIANT_URLSAFE_NO_PADDING) != 0) {
        return std::nullopt;
    }
    if (end != text.data() + text.size()) {
        return std::nullopt;
    }
    out.resize(decoded);
    return out;
}

} // namespace clawchat
