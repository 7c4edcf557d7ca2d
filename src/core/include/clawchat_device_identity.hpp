#pragma once

/**
 * @file clawchat_device_identity.hpp
 * @brief Persistent ed25519 device identity used to answer gateway challenges
 *
 * One identity per installation, stored as JSON under the user's config
 * directory. The device id is the hex SHA-256 of the raw public key and is
 * re-verified every time the file is loaded.
 */

#include "clawchat_secure_memory.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace clawchat {

/**
 * @brief Detached signature over a challenge payload
 */
struct SignedChallenge {
    std::string signature;      ///< base64url, unpadded
    int64_t     signed_at_ms;   ///< epoch milliseconds embedded in the payload
};

/**
 * @brief Immutable device keypair
 */
class DeviceIdentity {
public:
    static constexpr int kFormatVersion = 1;

    /// Signature payload version tag
    static constexpr const char* kPayloadVersion = "v2";
    /// Client id and mode as they appear in the signed payload
    static constexpr const char* kSignedClientId = "cli";
    static constexpr const char* kSignedClientMode = "cli";

    DeviceIdentity(std::string device_id,
                   std::vector<uint8_t> public_key,
                   SecureMemory private_key,
                   int64_t created_at_ms);

    DeviceIdentity(const DeviceIdentity&) = delete;
    DeviceIdentity& operator=(const DeviceIdentity&) = delete;

    /// Generate a fresh keypair (not persisted)
    static std::shared_ptr<DeviceIdentity> generate();

    /// Hex SHA-256 of a raw public key
    static std::string device_id_for(const std::vector<uint8_t>& public_key);

    /**
     * @brief Build the exact pipe-delimited string that gets signed
     *
     * v2|deviceId|cli|cli|role|scope1,scope2|signedAtMs|token|nonce
     */
    static std::string build_payload(const std::string& device_id,
                                     const std::string& role,
                                     const std::vector<std::string>& scopes,
                                     int64_t signed_at_ms,
                                     const std::string& token,
                                     const std::string& nonce);

    /**
     * @brief Sign a challenge nonce, stamping the current time
     * @throws std::runtime_error if libsodium fails
     */
    SignedChallenge sign(const std::string& nonce,
                         const std::string& token,
                         const std::string& role,
                         const std::vector<std::string>& scopes) const;

    /// Check a base64url signature over @p payload with this identity's public key
    bool verify(const std::string& payload, const std::string& signature) const;

    /// true when device_id() == sha256hex(public_key()) and the private key belongs to it
    bool is_consistent() const;

    const std::string& device_id() const { return device_id_; }
    const std::vector<uint8_t>& public_key() const { return public_key_; }
    const SecureMemory& private_key() const { return private_key_; }
    int64_t created_at_ms() const { return created_at_ms_; }

    std::string public_key_base64url() const;

    /// JSON document {version, deviceId, publicKey, privateKey, createdAtMs}
    std::string to_json() const;

    /// Parse and validate a stored document; nullptr when anything is off
    static std::shared_ptr<DeviceIdentity> from_json(const std::string& text);

private:
    std::string          device_id_;
    std::vector<uint8_t> public_key_;
    SecureMemory         private_key_;
    int64_t              created_at_ms_;
};

/**
 * @brief Result of DeviceIdentityStore::load_or_create
 */
struct IdentityLoadResult {
    std::shared_ptr<DeviceIdentity> identity;
    bool        created = false;   ///< a new keypair was generated
    bool        persisted = true;  ///< the file on disk matches @ref identity
    std::string warning;           ///< non-empty when persisting failed
};

/**
 * @brief Loads, verifies and persists the device identity file
 */
class DeviceIdentityStore {
public:
    /// Empty path selects default_path()
    explicit DeviceIdentityStore(std::string path = "");

    /// ~/.config/clawchat-cli/device.json
    static std::string default_path();

    const std::string& path() const { return path_; }

    /**
     * @brief Return the stored identity or generate and persist a new one
     *
     * Missing, unreadable, malformed or inconsistent files are replaced.
     * A failed write is reported through IdentityLoadResult::warning and
     * never throws; the identity remains usable in memory.
     */
    IdentityLoadResult load_or_create() const;

private:
    bool persist(const DeviceIdentity& identity, std::string& error) const;

    std::string path_;
};

} // namespace clawchat
