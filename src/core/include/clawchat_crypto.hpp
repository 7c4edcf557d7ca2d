#ifndef CLAWCHAT_CRYPTO_HPP
#define CLAWCHAT_CRYPTO_HPP

#include "clawchat_secure_memory.hpp"
#include <vector>
#include <string>
#include <cstdint>
#include <optional>

namespace clawchat {

/**
 * @brief libsodium-backed primitives used by the device identity
 * @note Constructing a Crypto initialises libsodium; throws std::runtime_error on failure.
 */
class Crypto {
public:
    struct KeyPair {
        std::vector<uint8_t> public_key;   // crypto_sign_PUBLICKEYBYTES
        SecureMemory secret_key;           // crypto_sign_SECRETKEYBYTES
    };

    Crypto();
    ~Crypto() noexcept = default;

    // Ed25519
    KeyPair generate_keypair();

    std::vector<uint8_t> sign_ed25519(
        const std::string& message,
        const SecureMemory& secret_key
    );

    bool verify_ed25519(
        const std::string& message,
        const std::vector<uint8_t>& signature,
        const std::vector<uint8_t>& public_key
    );

    /// True when @p secret_key's seed derives @p public_key and embeds it
    bool keypair_matches(
        const std::vector<uint8_t>& public_key,
        const SecureMemory& secret_key
    );

    std::vector<uint8_t> hash_sha256(const std::vector<uint8_t>& data);

    static std::string bytes_to_hex(const uint8_t* data, size_t len);
    static std::string bytes_to_hex(const std::vector<uint8_t>& bytes) {
        return bytes_to_hex(bytes.data(), bytes.size());
    }

    // URL-safe base64 without padding (RFC 4648 §5)
    static std::string to_base64url(const uint8_t* data, size_t len);
    static std::string to_base64url(const std::vector<uint8_t>& bytes) {
        return to_base64url(bytes.data(), bytes.size());
    }
    static std::optional<std::vector<uint8_t>> from_base64url(const std::string& text);

    static constexpr size_t kPublicKeyBytes = 32;
    static constexpr size_t kSecretKeyBytes = 64;
    static constexpr size_t kSignatureBytes = 64;

private:
    void init_libsodium();
};

} // namespace clawchat

#endif // CLAWCHAT_CRYPTO_HPP
