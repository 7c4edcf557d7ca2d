#include <gtest/gtest.h>
#include "clawchat_tunnel.hpp"

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/stat.h>
#include <unistd.h>

using namespace clawchat;
namespace fs = std::filesystem;

class SshTunnelTest : public ::testing::Test {
protected:
    void SetUp() override {
        char tmpl[] = "/tmp/clawchat_tunnel_XXXXXX";
        char* dir = mkdtemp(tmpl);
        ASSERT_NE(dir, nullptr);
        root = dir;

        config.host = "gateway.example";
        config.user = "deploy";
        config.port = 2222;
        config.remote_port = 18789;
        config.ready_timeout = std::chrono::milliseconds(1000);
        config.poll_interval = std::chrono::milliseconds(50);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(root, ec);
    }

    /// Executable stand-in for ssh that ignores its arguments
    std::string fake_ssh(const std::string& name, const std::string& body) {
        const std::string path = (fs::path(root) / name).string();
        std::ofstream out(path);
        out << "#!/bin/sh\n" << body << "\n";
        out.close();
        ::chmod(path.c_str(), 0755);
        return path;
    }

    std::string root;
    SshTunnelConfig config;
};

TEST_F(SshTunnelTest, BuildArgs) {
    config.key_path = "/keys/id_ed25519";
    auto args = SshTunnel::build_ssh_args(config, 40123);

    ASSERT_FALSE(args.empty());
    EXPECT_EQ(args.front(), "ssh");
    EXPECT_EQ(args.back(), "deploy@gateway.example");

    auto has_pair = [&args](const std::string& flag, const std::string& value) {
        for (size_t i = 0; i + 1 < args.size(); ++i) {
            if (args[i] == flag && args[i + 1] == value) return true;
        }
        return false;
    };
    EXPECT_TRUE(has_pair("-L", "40123:127.0.0.1:18789"));
    EXPECT_TRUE(has_pair("-p", "2222"));
    EXPECT_TRUE(has_pair("-i", "/keys/id_ed25519"));
    EXPECT_TRUE(has_pair("-o", "ExitOnForwardFailure=yes"));
    EXPECT_TRUE(has_pair("-o", "BatchMode=yes"));
    EXPECT_NE(std::find(args.begin(), args.end(), "-N"), args.end());
}

TEST_F(SshTunnelTest, BuildArgsWithoutKeyOrUser) {
    config.user.clear();
    auto args = SshTunnel::build_ssh_args(config, 1);
    EXPECT_EQ(std::find(args.begin(), args.end(), "-i"), args.end());
    EXPECT_EQ(args.back(), "gateway.example");
}

TEST_F(SshTunnelTest, ExpandHome) {
    const char* home = std::getenv("HOME");
    ASSERT_NE(home, nullptr);
    EXPECT_EQ(SshTunnel::expand_home("~/.ssh/id"), std::string(home) + "/.ssh/id");
    EXPECT_EQ(SshTunnel::expand_home("/abs/path"), "/abs/path");
    EXPECT_EQ(SshTunnel::expand_home("~other/x"), "~other/x");
}

TEST_F(SshTunnelTest, FreePortIsUnused) {
    int port = SshTunnel::free_port();
    EXPECT_GT(port, 0);
    EXPECT_LE(port, 65535);
    EXPECT_FALSE(SshTunnel::port_accepts(port));
}

TEST_F(SshTunnelTest, PortAcceptsListener) {
    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    ASSERT_GE(fd, 0);
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    socklen_t len = sizeof(addr);
    ASSERT_EQ(::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)), 0);
    ASSERT_EQ(::listen(fd, 4), 0);
    ASSERT_EQ(::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len), 0);

    EXPECT_TRUE(SshTunnel::port_accepts(ntohs(addr.sin_port)));
    ::close(fd);
}

TEST_F(SshTunnelTest, MissingBinaryReported) {
    config.ssh_binary = (fs::path(root) / "no-such-ssh").string();
    SshTunnel tunnel(config);

    try {
        tunnel.start();
        FAIL() << "start() should throw";
    } catch (const TunnelError& e) {
        const std::string msg = e.what();
        EXPECT_NE(msg.find("status 127"), std::string::npos);
        EXPECT_NE(msg.find("exec"), std::string::npos);
        EXPECT_NE(msg.find("deploy@gateway.example"), std::string::npos);
    }
    EXPECT_FALSE(tunnel.running());
}

TEST_F(SshTunnelTest, EarlyExitCarriesStderr) {
    config.ssh_binary = fake_ssh("ssh-denied",
        "echo 'Permission denied (publickey).' >&2\nexit 255");
    SshTunnel tunnel(config);

    try {
        tunnel.start();
        FAIL() << "start() should throw";
    } catch (const TunnelError& e) {
        const std::string msg = e.what();
        EXPECT_NE(msg.find("ssh exited with status 255"), std::string::npos);
        EXPECT_NE(msg.find("Permission denied (publickey)."), std::string::npos);
    }
    EXPECT_FALSE(tunnel.running());
}

TEST_F(SshTunnelTest, NeverReadyTimesOutAndKillsChild) {
    config.ssh_binary = fake_ssh("ssh-hang", "exec sleep 30");
    config.ready_timeout = std::chrono::milliseconds(300);
    SshTunnel tunnel(config);

    auto start = std::chrono::steady_clock::now();
    try {
        tunnel.start();
        FAIL() << "start() should throw";
    } catch (const TunnelError& e) {
        EXPECT_NE(std::string(e.what()).find("not ready after 300 ms"), std::string::npos);
    }
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(5));
    EXPECT_FALSE(tunnel.running());
}

TEST_F(SshTunnelTest, StartRequiresHost) {
    config.host.clear();
    SshTunnel tunnel(config);
    EXPECT_THROW(tunnel.start(), TunnelError);
}

TEST(EndpointResolverTest, DirectWithoutSsh) {
    GatewaySettings settings;
    settings.url = "ws://gateway.local:18789";

    ResolvedEndpoint endpoint = EndpointResolver::resolve(settings);
    EXPECT_EQ(endpoint.url, "ws://gateway.local:18789");
    EXPECT_FALSE(endpoint.tunnel);
}

TEST(EndpointResolverTest, TunnelFailurePropagates) {
    GatewaySettings settings;
    settings.url = "ws://ignored:18789";
    SshTunnelConfig ssh;
    ssh.host = "gateway.example";
    ssh.ssh_binary = "/nonexistent/clawchat-ssh";
    ssh.ready_timeout = std::chrono::milliseconds(1000);
    settings.ssh = ssh;

    EXPECT_THROW(EndpointResolver::resolve(settings), TunnelError);
}
