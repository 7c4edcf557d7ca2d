/**
 * @file device_identity.cpp
 * @brief Device identity generation, persistence and challenge signing
 */

#include "clawchat_device_identity.hpp"
#include "clawchat_crypto.hpp"
#include "clawchat_logger.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <mutex>
#include <sstream>

#include <fcntl.h>
#include <pwd.h>
#include <sys/stat.h>
#include <unistd.h>

namespace clawchat {

namespace fs = std::filesystem;

namespace {

int64_t now_epoch_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

std::string home_directory() {
    const char* home = std::getenv("HOME");
    if (home && *home) return home;
    if (const passwd* pw = getpwuid(getuid())) {
        if (pw->pw_dir) return pw->pw_dir;
    }
    return ".";
}

// One writer per process: directory creation and file write happen as a unit
std::mutex g_persist_mutex;

} // namespace

// ─── DeviceIdentity ───────────────────────────────────────────────────────────

DeviceIdentity::DeviceIdentity(std::string device_id,
                               std::vector<uint8_t> public_key,
                               SecureMemory private_key,
                               int64_t created_at_ms)
    : device_id_(std::move(device_id))
    , public_key_(std::move(public_key))
    , private_key_(std::move(private_key))
    , created_at_ms_(created_at_ms)
{}

std::shared_ptr<DeviceIdentity> DeviceIdentity::generate() {
    Crypto crypto;
    Crypto::KeyPair kp = crypto.generate_keypair();
    std::string id = device_id_for(kp.public_key);
    return std::make_shared<DeviceIdentity>(std::move(id),
                                            std::move(kp.public_key),
                                            std::move(kp.secret_key),
                                            now_epoch_ms());
}

std::string DeviceIdentity::device_id_for(const std::vector<uint8_t>& public_key) {
    Crypto crypto;
    return Crypto::bytes_to_hex(crypto.hash_sha256(public_key));
}

std::string DeviceIdentity::build_payload(const std::string& device_id,
                                          const std::string& role,
                                          const std::vector<std::string>& scopes,
                                          int64_t signed_at_ms,
                                          const std::string& token,
                                          const std::string& nonce) {
    std::string joined_scopes;
    for (size_t i = 0; i < scopes.size(); ++i) {
        if (i > 0) joined_scopes += ',';
        joined_scopes += scopes[i];
    }

    std::ostringstream oss;
    oss << kPayloadVersion << '|'
        << device_id << '|'
        << kSignedClientId << '|'
        << kSignedClientMode << '|'
        << role << '|'
        << joined_scopes << '|'
        << signed_at_ms << '|'
        << token << '|'
        << nonce;
    return oss.str();
}

SignedChallenge DeviceIdentity::sign(const std::string& nonce,
                                     const std::string& token,
                                     const std::string& role,
                                     const std::vector<std::string>& scopes) const {
    SignedChallenge out;
    out.signed_at_ms = now_epoch_ms();

    const std::string payload =
        build_payload(device_id_, role, scopes, out.signed_at_ms, token, nonce);

    Crypto crypto;
    out.signature = Crypto::to_base64url(crypto.sign_ed25519(payload, private_key_));
    return out;
}

bool DeviceIdentity::verify(const std::string& payload, const std::string& signature) const {
    auto raw = Crypto::from_base64url(signature);
    if (!raw) return false;
    Crypto crypto;
    return crypto.verify_ed25519(payload, *raw, public_key_);
}

bool DeviceIdentity::is_consistent() const {
    if (public_key_.size() != Crypto::kPublicKeyBytes ||
        private_key_.size() != Crypto::kSecretKeyBytes ||
        device_id_for(public_key_) != device_id_) {
        return false;
    }
    Crypto crypto;
    return crypto.keypair_matches(public_key_, private_key_);
}

std::string DeviceIdentity::public_key_base64url() const {
    return Crypto::to_base64url(public_key_);
}

std::string DeviceIdentity::to_json() const {
    nlohmann::json doc = {
        {"version",     kFormatVersion},
        {"deviceId",    device_id_},
        {"publicKey",   Crypto::to_base64url(public_key_)},
        {"privateKey",  Crypto::to_base64url(private_key_.data(), private_key_.size())},
        {"createdAtMs", created_at_ms_},
    };
    return doc.dump();
}

std::shared_ptr<DeviceIdentity> DeviceIdentity::from_json(const std::string& text) {
    nlohmann::json doc = nlohmann::json::parse(text, nullptr, /*allow_exceptions=*/false);
    if (doc.is_discarded() || !doc.is_object()) return nullptr;

    auto version = doc.find("version");
    if (version == doc.end() || !version->is_number_integer() ||
        version->get<int>() != kFormatVersion) {
        return nullptr;
    }

    auto text_field = [&doc](const char* key) {
        auto it = doc.find(key);
        return (it != doc.end() && it->is_string()) ? it->get<std::string>() : std::string();
    };
    const std::string device_id = text_field("deviceId");
    const std::string public_b64 = text_field("publicKey");
    const std::string private_b64 = text_field("privateKey");
    if (device_id.empty() || public_b64.empty() || private_b64.empty()) return nullptr;

    auto public_key = Crypto::from_base64url(public_b64);
    auto private_raw = Crypto::from_base64url(private_b64);
    if (!public_key || !private_raw) return nullptr;

    SecureMemory private_key(private_raw->data(), private_raw->size());
    std::fill(private_raw->begin(), private_raw->end(), 0);
    private_key.lock();

    int64_t created_at = 0;
    auto created = doc.find("createdAtMs");
    if (created != doc.end() && created->is_number_integer()) {
        created_at = created->get<int64_t>();
    }

    auto identity = std::make_shared<DeviceIdentity>(device_id, std::move(*public_key),
                                                     std::move(private_key), created_at);
    if (!identity->is_consistent()) return nullptr;
    return identity;
}

// ─── DeviceIdentityStore ──────────────────────────────────────────────────────

DeviceIdentityStore::DeviceIdentityStore(std::string path)
    : path_(path.empty() ? default_path() : std::move(path))
{}

std::string DeviceIdentityStore::default_path() {
    return (fs::path(home_directory()) / ".config" / "clawchat-cli" / "device.json").string();
}

IdentityLoadResult DeviceIdentityStore::load_or_create() const {
    IdentityLoadResult result;

    {
        std::ifstream in(path_, std::ios::binary);
        if (in.is_open()) {
            std::string text((std::istreambuf_iterator<char>(in)),
                             std::istreambuf_iterator<char>());
            result.identity = DeviceIdentity::from_json(text);
            if (result.identity) {
                CLAWCHAT_LOG_DEBUG("Loaded device identity " + result.identity->device_id());
                return result;
            }
            CLAWCHAT_LOG_INFO("Stored device identity at " + path_ +
                              " is invalid, generating a new one");
        }
    }

    result.identity = DeviceIdentity::generate();
    result.created = true;

    std::string error;
    if (!persist(*result.identity, error)) {
        result.persisted = false;
        result.warning = "could not save device identity to " + path_ + ": " + error;
        CLAWCHAT_LOG_WARN(result.warning);
    } else {
        CLAWCHAT_LOG_INFO("Created device identity " + result.identity->device_id());
    }
    return result;
}

bool DeviceIdentityStore::persist(const DeviceIdentity& identity, std::string& error) const {
    std::lock_guard<std::mutex> lock(g_persist_mutex);

    const fs::path file(path_);
    const fs::path dir = file.parent_path();

    std::error_code ec;
    if (!dir.empty() && !fs::exists(dir, ec)) {
        if (!fs::create_directories(dir, ec)) {
            error = "creating " + dir.string() + ": " + ec.message();
            return false;
        }
        fs::permissions(dir, fs::perms::owner_all, fs::perm_options::replace, ec);
    }

    int fd = ::open(path_.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0600);
    if (fd < 0) {
        error = std::strerror(errno);
        return false;
    }
    // O_CREAT's mode does not apply to a file that already existed
    if (::fchmod(fd, 0600) != 0) {
        error = std::strerror(errno);
        ::close(fd);
        return false;
    }

    const std::string data = identity.to_json();
    size_t written = 0;
    while (written < data.size()) {
        ssize_t n = ::write(fd, data.data() + written, data.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            error = std::strerror(errno);
            ::close(fd);
            return false;
        }
        written += static_cast<size_t>(n);
    }

    if (::close(fd) != 0) {
        error = std::strerror(errno);
        return false;
    }
    return true;
}

} // namespace clawchat
