#include "clawchat_config.hpp"

#include <cstdlib>
#include <filesystem>
#include <initializer_list>

#include <pwd.h>
#include <unistd.h>

namespace clawchat {

namespace {

std::string env_first(std::initializer_list<const char*> names) {
    for (const char* name : names) {
        const char* v = std::getenv(name);
        if (v && *v) return v;
    }
    return {};
}

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), ::tolower);
    return s;
}

} // namespace

const char* backend_kind_name(BackendKind kind) noexcept {
    switch (kind) {
        case BackendKind::Gateway:  return "gateway";
        case BackendKind::Headless: return "headless";
        default:                    return "unknown";
    }
}

bool backend_kind_from_string(const std::string& s, BackendKind& out) {
    const std::string v = lower(s);
    // openclaw/zeroclaw are the server products' own names for the two protocols
    if (v.empty() || v == "gateway" || v == "openclaw") {
        out = BackendKind::Gateway;
        return true;
    }
    if (v == "headless" || v == "zeroclaw") {
        out = BackendKind::Headless;
        return true;
    }
    return false;
}

std::string Config::defaultPath() {
    if (const char* p = std::getenv("CLAWCHAT_CONFIG")) {
        if (*p) return p;
    }
    std::string home;
    if (const char* h = std::getenv("HOME")) home = h;
    if (home.empty()) {
        if (const passwd* pw = getpwuid(getuid())) {
            if (pw->pw_dir) home = pw->pw_dir;
        }
    }
    if (home.empty()) home = ".";
    return (std::filesystem::path(home) / ".config" / "clawchat-cli" / "config").string();
}

void Config::applyEnvironment() {
    const std::string url = env_first({"OPENCLAW_GATEWAY_URL", "CLAWCHAT_GATEWAY"});
    if (!url.empty()) set("gateway.url", url);

    const std::string token = env_first({"OPENCLAW_TOKEN"});
    if (!token.empty()) set("gateway.token", token);

    const std::string session = env_first({"CLAWCHAT_SESSION"});
    if (!session.empty()) set("gateway.session", session);

    const std::string backend = env_first({"CLAWCHAT_BACKEND"});
    if (!backend.empty()) set("gateway.backend", backend);

    const std::string ssh_host = env_first({"CLAWCHAT_SSH_HOST"});
    if (!ssh_host.empty()) set("ssh.host", ssh_host);
}

GatewaySettings Config::gatewaySettings() const {
    GatewaySettings s;

    BackendKind kind = BackendKind::Gateway;
    if (backend_kind_from_string(get("gateway.backend"), kind)) {
        s.backend = kind;
    }

    s.url = get("gateway.url");
    if (s.backend == BackendKind::Headless &&
        (s.url.empty() || s.url == kDefaultGatewayUrl)) {
        s.url = kDefaultHeadlessUrl;
    }
    s.token = get("gateway.token");
    s.session = get("gateway.session");
    s.request_timeout = std::chrono::milliseconds(getInt("gateway.request_timeout_ms", 30000));
    if (s.request_timeout <= std::chrono::milliseconds::zero()) {
        s.request_timeout = std::chrono::milliseconds(30000);
    }
    s.max_retries = getInt("gateway.max_retries", 10);

    // Tunnels only front the handshake backend
    if (s.backend == BackendKind::Gateway && has("ssh.host")) {
        SshTunnelConfig ssh;
        ssh.host = get("ssh.host");
        ssh.port = getInt("ssh.port", 22);
        ssh.user = get("ssh.user");
        ssh.key_path = get("ssh.key_path");
        ssh.remote_port = getInt("ssh.remote_port", 18789);
        const int ready_ms = getInt("ssh.ready_timeout_ms", 15000);
        if (ready_ms > 0) ssh.ready_timeout = std::chrono::milliseconds(ready_ms);
        s.ssh = ssh;
    }
    return s;
}

std::string Config::validate() const {
    if (!has("gateway.url")) {
        return "gateway URL is required (--gateway or OPENCLAW_GATEWAY_URL)";
    }
    if (!has("gateway.token")) {
        return "auth token is required (--token or OPENCLAW_TOKEN)";
    }

    BackendKind kind = BackendKind::Gateway;
    const std::string backend = get("gateway.backend");
    if (!backend_kind_from_string(backend, kind)) {
        return "unknown backend '" + backend + "': must be 'gateway' or 'headless'";
    }

    if (kind == BackendKind::Gateway && has("ssh.host") && !has("ssh.user")) {
        return "ssh user is required when using an SSH tunnel (--ssh-user)";
    }

    const int port = getInt("ssh.port", 22);
    const int remote = getInt("ssh.remote_port", 18789);
    if (port <= 0 || port > 65535 || remote <= 0 || remote > 65535) {
        return "ssh ports must be between 1 and 65535";
    }
    return {};
}

} // namespace clawchat
