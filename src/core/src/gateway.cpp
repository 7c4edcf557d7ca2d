#include "clawchat_gateway.hpp"

namespace clawchat {

Gateway::Gateway(std::unique_ptr<GatewayClient> client)
    : backend_(std::move(client))
{}

Gateway::Gateway(std::unique_ptr<HeadlessClient> client)
    : backend_(std::move(client))
{}

Gateway Gateway::create(const GatewaySettings& settings,
                        const std::string& url,
                        std::shared_ptr<DeviceIdentity> identity,
                        EventHandler on_event,
                        StatusHandler on_status,
                        std::unique_ptr<Transport> transport) {
    if (settings.backend == BackendKind::Headless) {
        HeadlessClientOptions opts;
        opts.url = url;
        opts.token = settings.token;
        opts.connect_timeout = settings.request_timeout;
        opts.event_handler = std::move(on_event);
        opts.status_handler = std::move(on_status);
        return Gateway(std::make_unique<HeadlessClient>(std::move(opts), std::move(transport)));
    }

    GatewayClientOptions opts;
    opts.url = url;
    opts.token = settings.token;
    opts.identity = std::move(identity);
    opts.request_timeout = settings.request_timeout;
    opts.max_retries = settings.max_retries;
    opts.event_handler = std::move(on_event);
    opts.status_handler = std::move(on_status);
    return Gateway(std::make_unique<GatewayClient>(std::move(opts), std::move(transport)));
}

void Gateway::connect() {
    std::visit([](auto& client) { client->connect(); }, backend_);
}

void Gateway::close() {
    std::visit([](auto& client) { client->close(); }, backend_);
}

ConnectionStatus Gateway::status() const {
    return std::visit([](const auto& client) { return client->status(); }, backend_);
}

std::vector<Session> Gateway::list_sessions() {
    return std::visit([](auto& client) { return client->list_sessions(); }, backend_);
}

std::vector<Message> Gateway::get_history(const std::string& session_key, int limit) {
    return std::visit([&](auto& client) { return client->get_history(session_key, limit); },
                      backend_);
}

std::string Gateway::send_message(const std::string& session_key,
                                  const std::string& text,
                                  const std::string& idempotency_key) {
    return std::visit([&](auto& client) {
        return client->send_message(session_key, text, idempotency_key);
    }, backend_);
}

BackendKind Gateway::kind() const {
    return std::holds_alternative<std::unique_ptr<HeadlessClient>>(backend_)
        ? BackendKind::Headless
        : BackendKind::Gateway;
}

} // namespace clawchat
