#pragma once

#include "protocol.h"
#include <functional>
#include <string>

namespace neurax {

// Ordered, reliable, message-based channel between one client and one
// compute node. Negotiating it (ICE, DTLS, relaying) is the implementation's
// business; the session only sends text messages and closes it.
class TransportChannel {
public:
    virtual ~TransportChannel() = default;

    // false when the channel is closed or the write failed
    virtual bool send(const std::string& message) = 0;

    // Idempotent
    virtual void close() = 0;

    virtual bool is_open() const = 0;

    // Remote connectivity candidate relayed by signaling. Transports that
    // do not negotiate candidates ignore it.
    virtual void add_remote_candidate(const IceCandidate& candidate) { (void)candidate; }
};

// Out-of-band signaling connection to the rendezvous relay
class RelayConnection {
public:
    using EventHandler = std::function<void(const RelayEvent&)>;
    using DisconnectHandler = std::function<void()>;

    virtual ~RelayConnection() = default;

    // Blocking connect; false when the relay cannot be reached
    virtual bool connect() = 0;
    virtual void disconnect() = 0;
    virtual bool connected() const = 0;

    // false when not connected or the write failed
    virtual bool emit(const RelayEvent& event) = 0;

    // Handlers run on the connection's reader context, one event at a time
    virtual void set_event_handler(EventHandler handler) = 0;
    virtual void set_disconnect_handler(DisconnectHandler handler) = 0;

    // Human-readable target for logs
    virtual std::string endpoint() const = 0;
};

} // namespace neurax
