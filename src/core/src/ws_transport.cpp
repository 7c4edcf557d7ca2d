#include "clawchat_transport.hpp"
#include "clawchat_logger.hpp"

#ifndef HAVE_LIBWEBSOCKETS
#error "libwebsockets is required for the gateway transport. Please install libwebsockets and rebuild"
#endif

#include <libwebsockets.h>

#include <atomic>
#include <cctype>
#include <condition_variable>
#include <cstring>
#include <deque>
#include <mutex>
#include <sstream>
#include <iomanip>
#include <thread>
#include <vector>

namespace clawchat {

// ---------------------------------------------------------------------------
// URL helpers
// ---------------------------------------------------------------------------
std::string append_token_query(const std::string& url, const std::string& token)
{
    std::ostringstream encoded;
    encoded << std::hex << std::uppercase << std::setfill('0');
    for (unsigned char c : token) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            encoded << c;
        } else {
            encoded << '%' << std::setw(2) << static_cast<int>(c);
        }
    }

    std::string base = url;
    std::string fragment;
    auto hash = base.find('#');
    if (hash != std::string::npos) {
        fragment = base.substr(hash);
        base.erase(hash);
    }

    char sep = '?';
    auto q = base.find('?');
    if (q != std::string::npos) {
        sep = (q + 1 == base.size() || base.back() == '&') ? '\0' : '&';
    }

    std::string out = base;
    if (sep) out += sep;
    out += "token=" + encoded.str();
    return out + fragment;
}

namespace {

void lws_log_to_logger(int level, const char* line)
{
    std::string msg = line ? line : "";
    while (!msg.empty() && (msg.back() == '\n' || msg.back() == '\r'))
        msg.pop_back();
    if (level & LLL_ERR)
        CLAWCHAT_LOG_ERROR("lws: " + msg);
    else if (level & LLL_WARN)
        CLAWCHAT_LOG_WARN("lws: " + msg);
    else
        CLAWCHAT_LOG_DEBUG("lws: " + msg);
}

std::once_flag g_lws_log_once;

// ---------------------------------------------------------------------------
// WebSocketTransport: libwebsockets client, one connection per instance
// ---------------------------------------------------------------------------
class WebSocketTransport : public Transport {
public:
    WebSocketTransport();
    ~WebSocketTransport() override;

    WebSocketTransport(const WebSocketTransport&) = delete;
    WebSocketTransport& operator=(const WebSocketTransport&) = delete;

    bool open(const std::string& url, const HttpHeaders& headers,
              std::chrono::milliseconds timeout, std::string& error) override;
    bool send_text(const std::string& text) override;
    bool receive(std::string& text) override;
    void close() override;
    bool is_open() const override;
    std::string last_error() const override;

private:
    enum class Phase { Idle, Connecting, Open, Closed };

    struct ParsedURL {
        std::string host;
        int port = 443;
        std::string path;
        bool use_ssl = true;
    };

    static ParsedURL parse_url(const std::string& url);

    static int ws_callback(struct lws* wsi, enum lws_callback_reasons reason,
                           void* user, void* in, size_t len);

    void service_loop();
    void mark_closed(const std::string& reason);

    static const struct lws_protocols protocols_[];

    // Serializes context setup in open() against close()
    std::mutex lifecycle_mutex_;
    std::thread service_thread_;
    std::atomic<bool> running_{false};

    mutable std::mutex mutex_;
    struct lws_context* context_ = nullptr;  // guarded by mutex_
    struct lws* wsi_ = nullptr;
    std::condition_variable cv_;
    Phase phase_ = Phase::Idle;
    std::string error_;

    HttpHeaders headers_;
    std::string partial_;
    std::deque<std::string> inbox_;
    std::deque<std::string> outbox_;
};

// ---------------------------------------------------------------------------
// Protocol table
// ---------------------------------------------------------------------------
const struct lws_protocols WebSocketTransport::protocols_[] = {
    { "clawchat-gateway", WebSocketTransport::ws_callback, 0, 65536, 0, nullptr, 0 },
    LWS_PROTOCOL_LIST_TERM
};

WebSocketTransport::WebSocketTransport()
{
    std::call_once(g_lws_log_once, [] {
        lws_set_log_level(LLL_ERR | LLL_WARN, lws_log_to_logger);
    });
}

WebSocketTransport::~WebSocketTransport() { close(); }

// ---------------------------------------------------------------------------
// URL parser (minimal); the query string stays part of the request path
// ---------------------------------------------------------------------------
WebSocketTransport::ParsedURL
WebSocketTransport::parse_url(const std::string& url)
{
    ParsedURL parsed;
    std::string u = url;

    if (u.rfind("wss://", 0) == 0) {
        parsed.use_ssl = true;
        parsed.port = 443;
        u = u.substr(6);
    } else if (u.rfind("ws://", 0) == 0) {
        parsed.use_ssl = false;
        parsed.port = 80;
        u = u.substr(5);
    }

    auto split = u.find_first_of("/?");
    std::string host_port = (split != std::string::npos) ? u.substr(0, split) : u;
    if (split == std::string::npos) {
        parsed.path = "/";
    } else if (u[split] == '?') {
        parsed.path = "/" + u.substr(split);
    } else {
        parsed.path = u.substr(split);
    }

    auto colon = host_port.rfind(':');
    auto bracket = host_port.rfind(']');
    if (colon != std::string::npos && (bracket == std::string::npos || colon > bracket)) {
        parsed.host = host_port.substr(0, colon);
        parsed.port = std::stoi(host_port.substr(colon + 1));
    } else {
        parsed.host = host_port;
    }
    if (parsed.host.size() > 1 && parsed.host.front() == '[' && parsed.host.back() == ']')
        parsed.host = parsed.host.substr(1, parsed.host.size() - 2);

    return parsed;
}

// ---------------------------------------------------------------------------
// lws callback
// ---------------------------------------------------------------------------
int WebSocketTransport::ws_callback(struct lws* wsi,
    enum lws_callback_reasons reason, void* /*user*/, void* in, size_t len)
{
    struct lws_context* ctx = lws_get_context(wsi);
    if (!ctx) return 0;
    auto* self = static_cast<WebSocketTransport*>(lws_context_user(ctx));
    if (!self) return 0;

    switch (reason) {
    case LWS_CALLBACK_CLIENT_APPEND_HANDSHAKE_HEADER: {
        auto** p = static_cast<unsigned char**>(in);
        unsigned char* end = (*p) + len;
        for (const auto& [name, value] : self->headers_) {
            // lws wants the lower-case name including the colon
            std::string key;
            for (char c : name) key += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
            key += ':';
            if (lws_add_http_header_by_name(wsi,
                    reinterpret_cast<const unsigned char*>(key.c_str()),
                    reinterpret_cast<const unsigned char*>(value.data()),
                    static_cast<int>(value.size()), p, end)) {
                return -1;
            }
        }
        break;
    }

    case LWS_CALLBACK_CLIENT_ESTABLISHED: {
        std::lock_guard<std::mutex> lock(self->mutex_);
        self->wsi_ = wsi;
        self->phase_ = Phase::Open;
        if (!self->outbox_.empty())
            lws_callback_on_writable(wsi);
        self->cv_.notify_all();
        break;
    }

    case LWS_CALLBACK_CLIENT_RECEIVE: {
        std::lock_guard<std::mutex> lock(self->mutex_);
        if (in && len > 0)
            self->partial_.append(static_cast<const char*>(in), len);
        // Reassemble fragmented and buffer-split frames
        if (lws_is_final_fragment(wsi) && lws_remaining_packet_payload(wsi) == 0) {
            self->inbox_.push_back(std::move(self->partial_));
            self->partial_.clear();
            self->cv_.notify_all();
        }
        break;
    }

    case LWS_CALLBACK_CLIENT_WRITEABLE: {
        std::string frame;
        bool more = false;
        {
            std::lock_guard<std::mutex> lock(self->mutex_);
            if (self->outbox_.empty()) break;
            frame = std::move(self->outbox_.front());
            self->outbox_.pop_front();
            more = !self->outbox_.empty();
        }
        // LWS_PRE padding required by libwebsockets before payload
        std::vector<unsigned char> buf(LWS_PRE + frame.size());
        std::memcpy(buf.data() + LWS_PRE, frame.data(), frame.size());
        int written = lws_write(wsi, buf.data() + LWS_PRE, frame.size(), LWS_WRITE_TEXT);
        if (written < static_cast<int>(frame.size())) {
            self->mark_closed("websocket write failed");
            return -1;
        }
        if (more)
            lws_callback_on_writable(wsi);
        break;
    }

    case LWS_CALLBACK_EVENT_WAIT_CANCELLED: {
        // send_text() from another thread woke the service loop
        std::lock_guard<std::mutex> lock(self->mutex_);
        if (self->wsi_ && self->phase_ == Phase::Open && !self->outbox_.empty())
            lws_callback_on_writable(self->wsi_);
        break;
    }

    case LWS_CALLBACK_CLIENT_CONNECTION_ERROR:
        self->mark_closed(in ? std::string(static_cast<const char*>(in), len)
                             : std::string("connection error"));
        break;

    case LWS_CALLBACK_CLIENT_CLOSED:
        self->mark_closed(self->running_.load() ? "connection closed by peer" : "");
        break;

    default:
        break;
    }
    return 0;
}

void WebSocketTransport::mark_closed(const std::string& reason)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (phase_ == Phase::Closed) return;
    phase_ = Phase::Closed;
    wsi_ = nullptr;
    if (error_.empty() && !reason.empty())
        error_ = reason;
    cv_.notify_all();
}

// ---------------------------------------------------------------------------
// Service loop (runs in its own thread)
// ---------------------------------------------------------------------------
void WebSocketTransport::service_loop()
{
    struct lws_context* ctx = nullptr;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ctx = context_;
    }
    while (ctx && running_.load()) {
        if (lws_service(ctx, 50) < 0)
            break;
        std::lock_guard<std::mutex> lock(mutex_);
        if (phase_ == Phase::Closed)
            break;
    }
}

// ---------------------------------------------------------------------------
// Transport API
// ---------------------------------------------------------------------------
bool WebSocketTransport::open(const std::string& url, const HttpHeaders& headers,
                              std::chrono::milliseconds timeout, std::string& error)
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (phase_ != Phase::Idle) {
            error = "transport already used";
            return false;
        }
        phase_ = Phase::Connecting;
        headers_ = headers;
    }

    ParsedURL parsed;
    try {
        parsed = parse_url(url);
    } catch (const std::exception&) {
        error = "invalid gateway URL: " + url;
        mark_closed(error);
        return false;
    }
    if (parsed.host.empty()) {
        error = "invalid gateway URL: " + url;
        mark_closed(error);
        return false;
    }

    struct lws_context_creation_info info;
    std::memset(&info, 0, sizeof(info));
    info.port = CONTEXT_PORT_NO_LISTEN;  // client-only
    info.protocols = protocols_;
    info.user = this;                    // retrieved in ws_callback
    info.options = LWS_SERVER_OPTION_DO_SSL_GLOBAL_INIT;

    {
        std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (phase_ != Phase::Connecting) {
                error = "transport closed during open";
                return false;
            }
        }
        struct lws_context* ctx = lws_create_context(&info);
        if (!ctx) {
            error = "failed to create websocket context";
            mark_closed(error);
            return false;
        }

        struct lws_client_connect_info cci;
        std::memset(&cci, 0, sizeof(cci));
        cci.context = ctx;
        cci.address = parsed.host.c_str();
        cci.port    = parsed.port;
        cci.path    = parsed.path.c_str();
        cci.host    = parsed.host.c_str();
        cci.origin  = parsed.host.c_str();
        cci.protocol = nullptr;
        if (parsed.use_ssl)
            cci.ssl_connection = LCCSCF_USE_SSL;

        {
            std::lock_guard<std::mutex> lock(mutex_);
            context_ = ctx;
        }
        running_ = true;
        if (!lws_client_connect_via_info(&cci)) {
            running_ = false;
            mark_closed("websocket dial failed");
            error = last_error();
            {
                std::lock_guard<std::mutex> lock(mutex_);
                context_ = nullptr;
            }
            lws_context_destroy(ctx);
            return false;
        }

        service_thread_ = std::thread(&WebSocketTransport::service_loop, this);
    }

    std::unique_lock<std::mutex> lock(mutex_);
    bool settled = cv_.wait_for(lock, timeout, [this] { return phase_ != Phase::Connecting; });
    if (phase_ == Phase::Open)
        return true;

    error = !settled ? "websocket connect timed out"
                     : (error_.empty() ? "websocket dial failed" : error_);
    lock.unlock();
    close();
    return false;
}

bool WebSocketTransport::send_text(const std::string& text)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (phase_ != Phase::Open || !context_)
        return false;
    outbox_.push_back(text);
    // Wakes the service thread, which requests the writable callback.
    // close() clears context_ under this lock before destroying it.
    lws_cancel_service(context_);
    return true;
}

bool WebSocketTransport::receive(std::string& text)
{
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return !inbox_.empty() || phase_ == Phase::Closed; });
    if (inbox_.empty())
        return false;
    text = std::move(inbox_.front());
    inbox_.pop_front();
    return true;
}

void WebSocketTransport::close()
{
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    running_ = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        phase_ = Phase::Closed;
        wsi_ = nullptr;
        outbox_.clear();
        if (context_)
            lws_cancel_service(context_);
        cv_.notify_all();
    }

    // Only API callers reach close(); the service thread never does
    if (service_thread_.joinable())
        service_thread_.join();

    struct lws_context* ctx = nullptr;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ctx = context_;
        context_ = nullptr;
    }
    // Destroy outside mutex_: teardown fires callbacks that take it
    if (ctx)
        lws_context_destroy(ctx);
}

bool WebSocketTransport::is_open() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return phase_ == Phase::Open;
}

std::string WebSocketTransport::last_error() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return error_;
}

} // namespace

std::unique_ptr<Transport> make_websocket_transport()
{
    return std::make_unique<WebSocketTransport>();
}

} // namespace clawchat
