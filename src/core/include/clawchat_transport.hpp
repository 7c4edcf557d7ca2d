#ifndef CLAWCHAT_TRANSPORT_HPP
#define CLAWCHAT_TRANSPORT_HPP

#include <chrono>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace clawchat {

using HttpHeaders = std::vector<std::pair<std::string, std::string>>;

/**
 * @brief Abstract WebSocket text-frame transport
 *
 * One instance carries one connection. open() is called at most once;
 * receive() is called from a single reader thread; send_text() and close()
 * may be called from any thread.
 */
class Transport {
public:
    virtual ~Transport() = default;

    /**
     * @brief Dial @p url and block until the upgrade completes or fails
     * @param headers Extra handshake headers (e.g. Authorization)
     * @param error   Set to a human readable reason on failure
     */
    virtual bool open(const std::string& url,
                      const HttpHeaders& headers,
                      std::chrono::milliseconds timeout,
                      std::string& error) = 0;

    /// Queue one text frame; false when the connection is not open
    virtual bool send_text(const std::string& text) = 0;

    /**
     * @brief Block until the next complete text frame arrives
     * @return false once the connection is closed and nothing is left to read
     */
    virtual bool receive(std::string& text) = 0;

    /// Close the connection and wake receive(); safe to call repeatedly
    virtual void close() = 0;

    virtual bool is_open() const = 0;

    /// Reason for the last closure or failure, empty if none
    virtual std::string last_error() const = 0;
};

/// libwebsockets-backed transport (ws:// and wss://)
std::unique_ptr<Transport> make_websocket_transport();

/// Append token=<urlencoded value> to a URL's query string
std::string append_token_query(const std::string& url, const std::string& token);

} // namespace clawchat

#endif // CLAWCHAT_TRANSPORT_HPP
