#pragma once

#include "transport.h"
#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace neurax {

// Offer/answer body naming the relay-tunnelled transport
constexpr const char* RELAY_TUNNEL_TAG = "relay-tunnel/1";

struct RelayEndpoint {
    std::string host;
    int port = 0;
};

// Accepts host:port, tcp://host:port, http(s)://host:port[/path] and
// ws(s)://host:port[/path]. Missing port falls back to DEFAULT_RELAY_PORT.
bool parse_relay_endpoint(const std::string& url, RelayEndpoint& out);

// Relay connection over TCP with newline-delimited JSON events.
// A reader thread decodes inbound lines and invokes the event handler.
class TcpRelayConnection : public RelayConnection {
public:
    explicit TcpRelayConnection(const RelayEndpoint& endpoint);
    ~TcpRelayConnection() override;

    bool connect() override;
    void disconnect() override;
    bool connected() const override { return connected_.load(); }
    bool emit(const RelayEvent& event) override;
    void set_event_handler(EventHandler handler) override;
    void set_disconnect_handler(DisconnectHandler handler) override;
    std::string endpoint() const override;

private:
    void read_loop(int fd);
    void join_reader();

    RelayEndpoint endpoint_;
    std::atomic<bool> connected_{false};
    std::atomic<bool> closing_{false};

    mutable std::mutex handler_mutex_;
    EventHandler event_handler_;
    DisconnectHandler disconnect_handler_;

    std::mutex write_mutex_;
    std::mutex socket_mutex_;
    int fd_ = -1;
    std::thread reader_;
};

// Transport channel whose messages travel through the relay as
// channel_message/channel_close events for one session.
class RelayTunnelChannel : public TransportChannel {
public:
    RelayTunnelChannel(std::string session_id, std::shared_ptr<RelayConnection> relay);

    bool send(const std::string& message) override;
    void close() override;
    bool is_open() const override;

private:
    const std::string session_id_;
    std::shared_ptr<RelayConnection> relay_;
    std::atomic<bool> open_{true};
};

} // namespace neurax
