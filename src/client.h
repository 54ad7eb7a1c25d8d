#pragma once

#include "constants.h"
#include "protocol.h"
#include "session.h"
#include "task.h"
#include "transport.h"
#include <chrono>
#include <memory>
#include <mutex>
#include <string>

namespace neurax {

struct ClientConfig {
    std::string relay_url;
    std::chrono::milliseconds connect_timeout = std::chrono::seconds(READY_TIMEOUT_SECONDS);
    std::chrono::milliseconds result_timeout = std::chrono::seconds(RESULT_TIMEOUT_SECONDS);
    std::chrono::milliseconds poll_interval = std::chrono::milliseconds(READY_POLL_INTERVAL_MS);
    std::string session_id;     // empty: random
};

// Initiator side: opens a session through the relay, completes the key
// exchange, sends one sealed task and waits for the sealed result.
class Client {
public:
    Client(std::shared_ptr<RelayConnection> relay, const ClientConfig& config = ClientConfig{});
    ~Client();

    Client(const Client&) = delete;
    Client& operator=(const Client&) = delete;

    // Throws ConnectionError, ConnectionTimeoutError, or the session's
    // typed failure (KeyExchangeError, IntegrityError, ...).
    ExecutionResult submit(const Task& task);

    // Relay event dispatch
    void handle_event(const RelayEvent& event);

    static std::string generate_session_id();

private:
    std::shared_ptr<Session> current() const;

    std::shared_ptr<RelayConnection> relay_;
    ClientConfig config_;

    mutable std::mutex mutex_;
    std::shared_ptr<Session> session_;
};

} // namespace neurax
