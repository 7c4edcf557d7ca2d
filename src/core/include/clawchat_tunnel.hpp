#pragma once

/**
 * @file clawchat_tunnel.hpp
 * @brief SSH local port forward supervision and endpoint resolution
 */

#include "clawchat_errors.hpp"
#include "clawchat_settings.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <sys/types.h>

namespace clawchat {

/**
 * @brief An `ssh -N -L` child process forwarding a free loopback port
 *
 * The tunnel owns the child: stop() and the destructor terminate and reap
 * it. stderr of the child is kept (bounded) for error messages.
 */
class SshTunnel {
public:
    static constexpr size_t kMaxDiagnosticBytes = 8192;

    explicit SshTunnel(SshTunnelConfig config);
    ~SshTunnel();

    SshTunnel(const SshTunnel&) = delete;
    SshTunnel& operator=(const SshTunnel&) = delete;

    /**
     * @brief Spawn ssh and wait until the local port accepts connections
     * @throws TunnelError on spawn failure, premature exit or timeout;
     *         the child is gone when this throws
     */
    void start();

    /// SIGTERM the child's process group and reap it; idempotent
    void stop();

    bool running() const;
    int local_port() const { return local_port_; }

    /// ws://127.0.0.1:<local_port>
    std::string gateway_url() const;

    /// Captured stderr of the child so far
    std::string diagnostics() const;

    /// Argument vector (argv[0] included) for the given local port
    static std::vector<std::string> build_ssh_args(const SshTunnelConfig& config, int local_port);

    /// Ask the kernel for an unused loopback port
    static int free_port();

    /// true when something accepts TCP connections on 127.0.0.1:port
    static bool port_accepts(int port);

    /// "~/x" → "$HOME/x"; anything else unchanged
    static std::string expand_home(const std::string& path);

private:
    void spawn(const std::vector<std::string>& args);
    void drain_stderr(int fd);
    bool reap(bool block, int& wait_status);
    void join_drain();
    std::string failure_message(const std::string& what) const;

    SshTunnelConfig config_;
    int local_port_ = 0;
    pid_t pid_ = -1;

    std::thread drain_thread_;
    std::atomic<bool> draining_{false};
    mutable std::mutex diag_mutex_;
    std::string diagnostics_;
};

/**
 * @brief Endpoint to dial, plus the tunnel that keeps it reachable
 *
 * The tunnel (if any) must outlive the connection using @c url.
 */
struct ResolvedEndpoint {
    std::string url;
    std::unique_ptr<SshTunnel> tunnel;
};

/**
 * @brief Pick the socket endpoint for a gateway connection
 */
class EndpointResolver {
public:
    /**
     * @brief Direct URL, or a started SSH tunnel when settings.ssh is set
     * @throws TunnelError when the tunnel cannot be brought up
     */
    static ResolvedEndpoint resolve(const GatewaySettings& settings);
};

} // namespace clawchat
