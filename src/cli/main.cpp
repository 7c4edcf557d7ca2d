#include "clawchat_config.hpp"
#include "clawchat_device_identity.hpp"
#include "clawchat_gateway.hpp"
#include "clawchat_logger.hpp"
#include "clawchat_tunnel.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <csignal>
#include <ctime>
#include <functional>
#include <iomanip>
#include <iostream>
#include <map>
#include <sstream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace clawchat;

// ============================================================================
// Globals
// ============================================================================

std::atomic<bool> g_running(true);
int g_exit_code = 0;

// ============================================================================
// Signal handler
// ============================================================================

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_running = false;  // Only set flag, handlers poll it and close the gateway
    }
}

static void install_signal_handlers() {
    // No SA_RESTART: a blocked read on stdin must return on Ctrl+C
    struct sigaction sa {};
    sa.sa_handler = signal_handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
}

// ============================================================================
// ArgumentParser
// ============================================================================

class ArgumentParser {
public:
    struct Command {
        std::string name;
        std::string description;
        std::function<void(const std::vector<std::string>&)> handler;
        std::vector<std::string> args_help;
    };

    ArgumentParser(const std::string& prog_name, const std::string& version)
        : prog_name_(prog_name), version_(version) {}

    void add_command(
        const std::string& name,
        const std::string& description,
        std::function<void(const std::vector<std::string>&)> handler,
        const std::vector<std::string>& args_help = {}
    ) {
        commands_[name] = {name, description, handler, args_help};
    }

    void parse_and_execute(int argc, char* argv[]) {
        if (argc < 2) {
            print_usage();
            return;
        }

        std::string cmd = argv[1];
        if (cmd == "help" || cmd == "--help" || cmd == "-h") {
            print_usage();
            return;
        }
        if (cmd == "version" || cmd == "--version" || cmd == "-v") {
            std::cout << prog_name_ << " " << version_ << std::endl;
            return;
        }

        auto it = commands_.find(cmd);
        if (it == commands_.end()) {
            std::cerr << "Unknown command: " << cmd << "\n";
            print_usage();
            g_exit_code = 2;
            return;
        }

        std::vector<std::string> args(argv + 2, argv + argc);
        it->second.handler(args);
    }

private:
    void print_usage() const {
        std::cout << prog_name_ << " " << version_ << " - terminal client for Gateway Protocol v3\n";
        std::cout << "\nUsage: " << prog_name_ << " <command> [options]\n\n";
        std::cout << "Commands:\n";
        for (const auto& [name, cmd] : commands_) {
            std::cout << "  " << cmd.name;
            for (const auto& arg : cmd.args_help)
                std::cout << " " << arg;
            std::cout << "\n    " << cmd.description << "\n\n";
        }
        std::cout << "  help\n    Show this help message\n\n";
        std::cout << "  version\n    Show version information\n\n";
        std::cout << "Options:\n"
                  << "  --config <path>          Config file (default ~/.config/clawchat-cli/config)\n"
                  << "  --gateway <url>          Gateway WebSocket URL (ws:// or wss://)\n"
                  << "  --token <token>          Gateway auth token\n"
                  << "  --session <key>          Session key (default: first available)\n"
                  << "  --backend <name>         gateway (default) or headless\n"
                  << "  --ssh-host <host>        Reach the gateway through an SSH tunnel\n"
                  << "  --ssh-port <port>        SSH port (22)\n"
                  << "  --ssh-user <user>        SSH user\n"
                  << "  --ssh-key <path>         SSH private key\n"
                  << "  --ssh-remote-port <port> Remote gateway port to forward (18789)\n"
                  << "  --log-level <level>      trace, debug, info, warn, error, none\n";
    }

    std::string prog_name_;
    std::string version_;
    std::map<std::string, Command> commands_;
};

// ============================================================================
// Utility functions
// ============================================================================

// Options that consume the following argument
static const std::vector<std::string> kValueOptions = {
    "--config", "--gateway", "--token", "--session", "--backend",
    "--ssh-host", "--ssh-port", "--ssh-user", "--ssh-key", "--ssh-remote-port",
    "--log-level", "--limit",
};

static std::string get_option(const std::vector<std::string>& args, const std::string& option, const std::string& default_val = "") {
    auto it = std::find(args.begin(), args.end(), option);
    if (it != args.end() && ++it != args.end()) return *it;
    return default_val;
}

static int get_option_int(const std::vector<std::string>& args, const std::string& option, int default_val = 0) {
    std::string val = get_option(args, option);
    if (val.empty()) return default_val;
    try {
        return std::stoi(val);
    } catch (const std::exception&) {
        return default_val;
    }
}

/// Arguments with options and their values removed
static std::vector<std::string> positional(const std::vector<std::string>& args) {
    std::vector<std::string> out;
    for (size_t i = 0; i < args.size(); ++i) {
        if (std::find(kValueOptions.begin(), kValueOptions.end(), args[i]) != kValueOptions.end()) {
            ++i;
            continue;
        }
        out.push_back(args[i]);
    }
    return out;
}

static std::string format_time(std::chrono::system_clock::time_point tp) {
    if (tp.time_since_epoch().count() == 0) return "--:--";
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    localtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%H:%M");
    return oss.str();
}

static std::string next_idempotency_key() {
    static std::atomic<uint64_t> seq{0};
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    return "cli-" + std::to_string(ms) + "-" + std::to_string(++seq);
}

/**
 * @brief Merge defaults, config file, environment and flags into Config
 * @throws std::runtime_error when the result is not usable
 */
static GatewaySettings load_settings(const std::vector<std::string>& args) {
    Config& cfg = Config::instance();

    std::string path = get_option(args, "--config");
    const bool explicit_path = !path.empty();
    if (!explicit_path) path = Config::defaultPath();
    if (!cfg.loadFromFile(path) && explicit_path) {
        throw std::runtime_error("cannot read config file " + path);
    }
    cfg.applyEnvironment();

    static const std::vector<std::pair<std::string, std::string>> kFlagKeys = {
        {"--gateway", "gateway.url"},
        {"--token", "gateway.token"},
        {"--session", "gateway.session"},
        {"--backend", "gateway.backend"},
        {"--ssh-host", "ssh.host"},
        {"--ssh-port", "ssh.port"},
        {"--ssh-user", "ssh.user"},
        {"--ssh-key", "ssh.key_path"},
        {"--ssh-remote-port", "ssh.remote_port"},
        {"--log-level", "log.level"},
    };
    for (const auto& [flag, key] : kFlagKeys) {
        std::string v = get_option(args, flag);
        if (!v.empty()) cfg.set(key, v);
    }

    Logger& log = Logger::instance();
    log.setLevel(Logger::levelFromString(cfg.get("log.level", "warn")));
    log.setConsoleOutput(cfg.getBool("log.console", true));
    if (!log.setFileOutput(cfg.get("log.file"))) {
        std::cerr << "[!] Cannot open log file " << cfg.get("log.file") << "\n";
    }

    std::string problem = cfg.validate();
    if (!problem.empty()) {
        throw std::runtime_error(problem);
    }
    return cfg.gatewaySettings();
}

// ============================================================================
// Streaming output
// ============================================================================

/**
 * @brief Prints cumulative chat events as a growing reply
 *
 * Only the part not yet shown is printed; a rewrite (tool indicator, new
 * run) starts a fresh line.
 */
class ReplyPrinter {
public:
    void set_session(const std::string& key) {
        std::lock_guard<std::mutex> lock(mtx_);
        session_ = key;
    }

    void begin() {
        std::lock_guard<std::mutex> lock(mtx_);
        shown_.clear();
        done_ = false;
        failed_ = false;
    }

    void on_event(const std::string& event, const nlohmann::json& payload) {
        if (event != "chat") return;
        ChatEvent ev = parse_chat_event(payload);

        std::lock_guard<std::mutex> lock(mtx_);
        if (!session_.empty() && !ev.session_key.empty() && ev.session_key != session_) return;

        switch (ev.state) {
            case ChatState::Delta:
                show(ev.content);
                break;
            case ChatState::Final:
                show(ev.content);
                std::cout << "\n" << std::flush;
                shown_.clear();
                done_ = true;
                cv_.notify_all();
                break;
            case ChatState::Error:
                if (!shown_.empty()) std::cout << "\n";
                std::cerr << "[!] " << (ev.error_message.empty() ? "run failed" : ev.error_message) << "\n";
                shown_.clear();
                done_ = true;
                failed_ = true;
                cv_.notify_all();
                break;
            default:
                break;
        }
    }

    /// Wait for the final or error event; false on interrupt or disconnect
    bool wait(Gateway& gw) {
        std::unique_lock<std::mutex> lock(mtx_);
        while (!done_) {
            if (!g_running.load()) return false;
            if (gw.status() != ConnectionStatus::Connected) return false;
            cv_.wait_for(lock, std::chrono::milliseconds(100));
        }
        return !failed_;
    }

private:
    void show(const std::string& content) {
        if (content.compare(0, shown_.size(), shown_) == 0) {
            std::cout << content.substr(shown_.size());
        } else {
            std::cout << "\n" << content;
        }
        std::cout << std::flush;
        shown_ = content;
    }

    std::mutex mtx_;
    std::condition_variable cv_;
    std::string session_;
    std::string shown_;
    bool done_ = false;
    bool failed_ = false;
};

/**
 * @brief Resolved endpoint plus the connected gateway using it
 *
 * Member order matters: the gateway closes before the tunnel stops.
 */
struct Connection {
    ResolvedEndpoint endpoint;
    std::unique_ptr<Gateway> gateway;
};

static Connection open_connection(const GatewaySettings& settings, ReplyPrinter* printer) {
    Connection conn;

    std::shared_ptr<DeviceIdentity> identity;
    if (settings.backend == BackendKind::Gateway) {
        IdentityLoadResult loaded = DeviceIdentityStore().load_or_create();
        if (!loaded.warning.empty()) {
            std::cerr << "[!] " << loaded.warning << "\n";
        }
        identity = loaded.identity;
    }

    if (settings.ssh) {
        std::cerr << "[*] Establishing SSH tunnel to " << settings.ssh->host << "...\n";
    }
    conn.endpoint = EndpointResolver::resolve(settings);

    EventHandler on_event;
    if (printer) {
        on_event = [printer](const std::string& ev, const nlohmann::json& payload) {
            printer->on_event(ev, payload);
        };
    }
    conn.gateway = std::make_unique<Gateway>(
        Gateway::create(settings, conn.endpoint.url, identity, on_event));
    conn.gateway->connect();
    return conn;
}

static std::string choose_session(Gateway& gw, const std::string& wanted) {
    std::vector<Session> sessions = gw.list_sessions();
    if (sessions.empty()) {
        throw std::runtime_error("the gateway reported no sessions");
    }
    if (wanted.empty()) return sessions.front().key;
    for (const auto& s : sessions) {
        if (s.key == wanted) return s.key;
    }
    throw std::runtime_error("session '" + wanted + "' not found");
}

static void print_history(const std::vector<Message>& messages) {
    for (const auto& m : messages) {
        std::cout << "[" << format_time(m.timestamp) << "] " << m.role << ": " << m.content << "\n";
    }
}

// ============================================================================
// Forward declarations
// ============================================================================

void handle_chat(const std::vector<std::string>& args);
void handle_sessions(const std::vector<std::string>& args);
void handle_history(const std::vector<std::string>& args);
void handle_send(const std::vector<std::string>& args);
void handle_identity(const std::vector<std::string>& args);

// ============================================================================
// main()
// ============================================================================

int main(int argc, char* argv[]) {
    install_signal_handlers();

    ArgumentParser parser("clawchat", kClientVersion);

    parser.add_command("chat", "Interactive chat in a session", handle_chat, {"[--session <key>]"});
    parser.add_command("sessions", "List sessions known to the gateway", handle_sessions);
    parser.add_command("history", "Show recent messages of a session", handle_history, {"<session>", "[--limit N]"});
    parser.add_command("send", "Send one message and print the reply", handle_send, {"<session>", "<text>"});
    parser.add_command("identity", "Show this device's identity", handle_identity);

    parser.parse_and_execute(argc, argv);

    return g_exit_code;
}

// ============================================================================
// Handler implementations
// ============================================================================

void handle_chat(const std::vector<std::string>& args) {
    try {
        GatewaySettings settings = load_settings(args);
        ReplyPrinter printer;
        Connection conn = open_connection(settings, &printer);
        Gateway& gw = *conn.gateway;

        const std::string session = choose_session(gw, settings.session);
        printer.set_session(session);
        std::cerr << "[+] Connected (" << backend_kind_name(gw.kind()) << "), session " << session << "\n";

        print_history(gw.get_history(session, 0));

        std::string line;
        while (g_running.load()) {
            std::cout << "> " << std::flush;
            if (!std::getline(std::cin, line)) break;
            if (line.empty()) continue;
            if (line == "/quit" || line == "/exit") break;
            if (line == "/history") {
                print_history(gw.get_history(session, 0));
                continue;
            }

            printer.begin();
            gw.send_message(session, line, next_idempotency_key());
            if (!printer.wait(gw) && gw.status() != ConnectionStatus::Connected) {
                std::cerr << "[!] Connection lost\n";
                g_exit_code = 1;
                break;
            }
        }

        gw.close();
    } catch (const std::exception& e) {
        std::cerr << "[!] Error: " << e.what() << "\n";
        g_exit_code = 1;
    }
}

void handle_sessions(const std::vector<std::string>& args) {
    try {
        GatewaySettings settings = load_settings(args);
        Connection conn = open_connection(settings, nullptr);

        std::vector<Session> sessions = conn.gateway->list_sessions();
        if (sessions.empty()) {
            std::cout << "No sessions\n";
        }
        for (const auto& s : sessions) {
            std::cout << std::left << std::setw(32) << s.key << " "
                      << std::setw(24) << s.label << " "
                      << std::setw(12) << s.channel << " "
                      << s.model << "\n";
        }
        conn.gateway->close();
    } catch (const std::exception& e) {
        std::cerr << "[!] Error: " << e.what() << "\n";
        g_exit_code = 1;
    }
}

void handle_history(const std::vector<std::string>& args) {
    try {
        std::vector<std::string> pos = positional(args);
        if (pos.empty()) {
            std::cerr << "Usage: clawchat history <session> [--limit N]\n";
            g_exit_code = 2;
            return;
        }
        GatewaySettings settings = load_settings(args);
        Connection conn = open_connection(settings, nullptr);

        print_history(conn.gateway->get_history(pos[0], get_option_int(args, "--limit", 0)));
        conn.gateway->close();
    } catch (const std::exception& e) {
        std::cerr << "[!] Error: " << e.what() << "\n";
        g_exit_code = 1;
    }
}

void handle_send(const std::vector<std::string>& args) {
    try {
        std::vector<std::string> pos = positional(args);
        if (pos.size() < 2) {
            std::cerr << "Usage: clawchat send <session> <text>\n";
            g_exit_code = 2;
            return;
        }
        std::string text = pos[1];
        for (size_t i = 2; i < pos.size(); ++i) text += " " + pos[i];

        GatewaySettings settings = load_settings(args);
        ReplyPrinter printer;
        printer.set_session(pos[0]);
        Connection conn = open_connection(settings, &printer);

        printer.begin();
        std::string run_id = conn.gateway->send_message(pos[0], text, next_idempotency_key());
        CLAWCHAT_LOG_DEBUG("chat.send accepted, run " + run_id);
        if (!printer.wait(*conn.gateway)) {
            g_exit_code = 1;
        }
        conn.gateway->close();
    } catch (const std::exception& e) {
        std::cerr << "[!] Error: " << e.what() << "\n";
        g_exit_code = 1;
    }
}

void handle_identity(const std::vector<std::string>& args) {
    try {
        const std::string level = get_option(args, "--log-level");
        if (!level.empty()) Logger::instance().setLevel(Logger::levelFromString(level));

        DeviceIdentityStore store;
        IdentityLoadResult loaded = store.load_or_create();
        if (!loaded.warning.empty()) {
            std::cerr << "[!] " << loaded.warning << "\n";
        }

        std::cout << "Device ID:  " << loaded.identity->device_id() << "\n";
        std::cout << "Public key: " << loaded.identity->public_key_base64url() << "\n";
        std::cout << "File:       " << store.path() << (loaded.persisted ? "" : " (not saved)") << "\n";
        if (loaded.created) {
            std::cout << "Status:     newly created\n";
        }
    } catch (const std::exception& e) {
        std::cerr << "[!] Error: " << e.what() << "\n";
        g_exit_code = 1;
    }
}
