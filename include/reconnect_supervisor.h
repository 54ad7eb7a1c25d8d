#pragma once

#include "constants.h"
#include "transport.h"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>

namespace neurax {

// Exponential backoff: base, 2*base, 4*base ... capped
struct BackoffPolicy {
    std::chrono::milliseconds base = std::chrono::seconds(BACKOFF_BASE_SECONDS);
    std::chrono::milliseconds cap = std::chrono::seconds(BACKOFF_CAP_SECONDS);
    int initial_attempts = INITIAL_CONNECT_ATTEMPTS;

    // Delay after the given failed attempt (1-based)
    std::chrono::milliseconds delay_after(int attempt) const;
};

// Owns the relay connection's lifecycle. The first connect is bounded by
// policy.initial_attempts; after that every loss triggers reconnects until
// stop(). Reconnecting never restores sessions: on_disconnected is where the
// owner drops them.
class ReconnectSupervisor {
public:
    using Callback = std::function<void()>;

    ReconnectSupervisor(std::shared_ptr<RelayConnection> relay,
                        const BackoffPolicy& policy = BackoffPolicy{});
    ~ReconnectSupervisor();

    ReconnectSupervisor(const ReconnectSupervisor&) = delete;
    ReconnectSupervisor& operator=(const ReconnectSupervisor&) = delete;

    // Runs after every successful connect (initial and reconnects)
    void set_on_connected(Callback callback);
    // Runs on the relay's context whenever the connection is lost
    void set_on_disconnected(Callback callback);

    // Bounded initial connect, then starts the reconnect worker. Throws
    // ConnectionError when every attempt fails or stop() interrupts it.
    void start();

    // Cancels pending waits and the reconnect worker, disconnects the relay.
    // Idempotent.
    void stop();

    // Blocks until stop()
    void wait();

    bool stopped() const { return stopped_.load(); }
    int reconnects() const { return reconnects_.load(); }
    RelayConnection& relay() { return *relay_; }

private:
    bool attempt(int number);
    void handle_disconnect();
    void worker();
    // false when stopped during the wait
    bool sleep_for(std::chrono::milliseconds delay);

    std::shared_ptr<RelayConnection> relay_;
    BackoffPolicy policy_;

    std::mutex mutex_;
    std::condition_variable wake_;
    bool connection_lost_ = false;
    std::atomic<bool> stopped_{false};
    std::atomic<int> reconnects_{0};
    std::thread worker_;

    Callback on_connected_;
    Callback on_disconnected_;
};

} // namespace neurax
