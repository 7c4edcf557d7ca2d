/**
 * @file tunnel.cpp
 * @brief ssh child process supervision for tunnelled gateway access
 */

#include "clawchat_tunnel.hpp"
#include "clawchat_logger.hpp"

#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <cstring>

#include <arpa/inet.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/wait.h>
#include <unistd.h>

namespace clawchat {

namespace {

constexpr auto kStopGrace = std::chrono::milliseconds(2000);
constexpr auto kStopPoll = std::chrono::milliseconds(20);

std::string trim(std::string s) {
    s.erase(0, s.find_first_not_of(" \t\r\n"));
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
    return s;
}

} // namespace

SshTunnel::SshTunnel(SshTunnelConfig config)
    : config_(std::move(config))
{}

SshTunnel::~SshTunnel() {
    stop();
}

// ==================== Helpers ====================

std::string SshTunnel::expand_home(const std::string& path) {
    if (path.rfind("~/", 0) != 0) return path;
    const char* home = std::getenv("HOME");
    if (!home || !*home) return path;
    return std::string(home) + path.substr(1);
}

std::vector<std::string> SshTunnel::build_ssh_args(const SshTunnelConfig& config, int local_port) {
    std::vector<std::string> args = {
        config.ssh_binary.empty() ? std::string("ssh") : config.ssh_binary,
        "-N",
        "-o", "StrictHostKeyChecking=accept-new",
        "-o", "ExitOnForwardFailure=yes",
        "-o", "ServerAliveInterval=30",
        "-o", "BatchMode=yes",
        "-L", std::to_string(local_port) + ":127.0.0.1:" + std::to_string(config.remote_port),
        "-p", std::to_string(config.port),
    };
    if (!config.key_path.empty()) {
        args.push_back("-i");
        args.push_back(expand_home(config.key_path));
    }
    args.push_back(config.user.empty() ? config.host : config.user + "@" + config.host);
    return args;
}

int SshTunnel::free_port() {
    int fd = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        throw TunnelError(std::string("allocating local port: ") + std::strerror(errno));
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;

    socklen_t len = sizeof(addr);
    if (::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0 ||
        ::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len) != 0) {
        const int err = errno;
        ::close(fd);
        throw TunnelError(std::string("allocating local port: ") + std::strerror(err));
    }
    ::close(fd);
    return ntohs(addr.sin_port);
}

bool SshTunnel::port_accepts(int port) {
    int fd = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) return false;

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = htons(static_cast<uint16_t>(port));

    const bool ok = ::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0;
    ::close(fd);
    return ok;
}

std::string SshTunnel::gateway_url() const {
    return "ws://127.0.0.1:" + std::to_string(local_port_);
}

std::string SshTunnel::diagnostics() const {
    std::lock_guard<std::mutex> lock(diag_mutex_);
    return diagnostics_;
}

bool SshTunnel::running() const {
    return pid_ > 0;
}

std::string SshTunnel::failure_message(const std::string& what) const {
    std::string target = config_.user.empty() ? config_.host : config_.user + "@" + config_.host;
    std::string msg = what + " (" + target + ")";
    const std::string diag = trim(diagnostics());
    if (!diag.empty()) msg += ": " + diag;
    return msg;
}

// ==================== Process control ====================

void SshTunnel::spawn(const std::vector<std::string>& args) {
    int err_pipe[2];
    if (::pipe2(err_pipe, O_CLOEXEC) != 0) {
        throw TunnelError(std::string("creating stderr pipe: ") + std::strerror(errno));
    }

    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (const auto& a : args) argv.push_back(const_cast<char*>(a.c_str()));
    argv.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0) {
        const int err = errno;
        ::close(err_pipe[0]);
        ::close(err_pipe[1]);
        throw TunnelError(std::string("fork: ") + std::strerror(err));
    }

    if (pid == 0) {
        // Child: own process group so stop() reaches anything ssh spawns
        ::setpgid(0, 0);
        int devnull = ::open("/dev/null", O_RDWR);
        if (devnull >= 0) {
            ::dup2(devnull, STDIN_FILENO);
            ::dup2(devnull, STDOUT_FILENO);
            ::close(devnull);
        }
        ::dup2(err_pipe[1], STDERR_FILENO);
        ::execvp(argv[0], argv.data());

        // No allocation between fork and _exit
        const char* reason = std::strerror(errno);
        for (const char* part : {"exec ", static_cast<const char*>(argv[0]), ": ", reason, "\n"}) {
            ssize_t ignored = ::write(STDERR_FILENO, part, std::strlen(part));
            (void)ignored;
        }
        _exit(127);
    }

    ::setpgid(pid, pid);
    ::close(err_pipe[1]);
    pid_ = pid;

    draining_ = true;
    drain_thread_ = std::thread(&SshTunnel::drain_stderr, this, err_pipe[0]);
}

void SshTunnel::drain_stderr(int fd) {
    char buf[512];
    for (;;) {
        pollfd pfd{fd, POLLIN, 0};
        int rc = ::poll(&pfd, 1, 100);
        if (rc < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (rc == 0) {
            if (!draining_.load()) break;
            continue;
        }
        ssize_t n = ::read(fd, buf, sizeof(buf));
        if (n < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (n == 0) break;

        std::string chunk(buf, static_cast<size_t>(n));
        CLAWCHAT_LOG_DEBUG("ssh: " + trim(chunk));
        std::lock_guard<std::mutex> lock(diag_mutex_);
        if (diagnostics_.size() < kMaxDiagnosticBytes) {
            diagnostics_ += chunk.substr(0, kMaxDiagnosticBytes - diagnostics_.size());
        }
    }
    ::close(fd);
}

void SshTunnel::join_drain() {
    draining_ = false;
    if (drain_thread_.joinable()) drain_thread_.join();
}

bool SshTunnel::reap(bool block, int& wait_status) {
    if (pid_ <= 0) return true;
    for (;;) {
        pid_t r = ::waitpid(pid_, &wait_status, block ? 0 : WNOHANG);
        if (r == pid_) break;
        if (r == 0) return false;
        if (errno == EINTR) continue;
        // ECHILD: somebody else reaped it
        wait_status = 0;
        break;
    }
    pid_ = -1;
    return true;
}

void SshTunnel::start() {
    if (pid_ > 0) {
        throw TunnelError("ssh tunnel already started");
    }
    if (config_.host.empty()) {
        throw TunnelError("ssh tunnel requires a host");
    }

    local_port_ = free_port();
    spawn(build_ssh_args(config_, local_port_));
    CLAWCHAT_LOG_INFO("Starting ssh tunnel 127.0.0.1:" + std::to_string(local_port_) +
                      " -> " + config_.host + ":" + std::to_string(config_.remote_port));

    const auto deadline = std::chrono::steady_clock::now() + config_.ready_timeout;
    for (;;) {
        int wait_status = 0;
        if (reap(false, wait_status)) {
            join_drain();
            std::string why;
            if (WIFEXITED(wait_status)) {
                why = "ssh exited with status " + std::to_string(WEXITSTATUS(wait_status));
            } else if (WIFSIGNALED(wait_status)) {
                why = "ssh killed by signal " + std::to_string(WTERMSIG(wait_status));
            } else {
                why = "ssh exited";
            }
            const std::string msg = failure_message(why);
            CLAWCHAT_LOG_ERROR(msg);
            throw TunnelError(msg);
        }

        if (port_accepts(local_port_)) {
            CLAWCHAT_LOG_INFO("ssh tunnel ready on " + gateway_url());
            return;
        }

        if (std::chrono::steady_clock::now() >= deadline) {
            stop();
            const std::string msg = failure_message(
                "ssh tunnel not ready after " +
                std::to_string(config_.ready_timeout.count()) + " ms");
            CLAWCHAT_LOG_ERROR(msg);
            throw TunnelError(msg);
        }
        std::this_thread::sleep_for(config_.poll_interval);
    }
}

void SshTunnel::stop() {
    if (pid_ > 0) {
        if (::kill(-pid_, SIGTERM) != 0) {
            ::kill(pid_, SIGTERM);
        }

        int wait_status = 0;
        const auto deadline = std::chrono::steady_clock::now() + kStopGrace;
        while (!reap(false, wait_status)) {
            if (std::chrono::steady_clock::now() >= deadline) {
                CLAWCHAT_LOG_WARN("ssh did not exit on SIGTERM, killing");
                if (::kill(-pid_, SIGKILL) != 0) {
                    ::kill(pid_, SIGKILL);
                }
                reap(true, wait_status);
                break;
            }
            std::this_thread::sleep_for(kStopPoll);
        }
        CLAWCHAT_LOG_INFO("ssh tunnel stopped");
    }
    join_drain();
}

// ==================== EndpointResolver ====================

ResolvedEndpoint EndpointResolver::resolve(const GatewaySettings& settings) {
    ResolvedEndpoint endpoint;
    if (!settings.ssh) {
        endpoint.url = settings.url;
        return endpoint;
    }

    auto tunnel = std::make_unique<SshTunnel>(*settings.ssh);
    tunnel->start();
    endpoint.url = tunnel->gateway_url();
    endpoint.tunnel = std::move(tunnel);
    return endpoint;
}

} // namespace clawchat
