#include "reconnect_supervisor.h"
#include "errors.h"
#include "logger.h"
#include <algorithm>

namespace neurax {

std::chrono::milliseconds BackoffPolicy::delay_after(int attempt) const {
    std::chrono::milliseconds delay = base;
    for (int i = 1; i < attempt && delay < cap; ++i) {
        delay *= 2;
    }
    return std::min(delay, cap);
}

ReconnectSupervisor::ReconnectSupervisor(std::shared_ptr<RelayConnection> relay,
                                         const BackoffPolicy& policy)
    : relay_(std::move(relay)), policy_(policy) {
    relay_->set_disconnect_handler([this]() { handle_disconnect(); });
}

ReconnectSupervisor::~ReconnectSupervisor() {
    stop();
    relay_->set_disconnect_handler(nullptr);
}

void ReconnectSupervisor::set_on_connected(Callback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    on_connected_ = std::move(callback);
}

void ReconnectSupervisor::set_on_disconnected(Callback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    on_disconnected_ = std::move(callback);
}

bool ReconnectSupervisor::attempt(int number) {
    LOG_INFO("Supervisor") << "connecting to relay " << relay_->endpoint()
                           << " (attempt " << number << ")";
    {
        // A loss reported while connect() runs must survive this attempt
        std::lock_guard<std::mutex> lock(mutex_);
        connection_lost_ = false;
    }
    if (!relay_->connect()) {
        return false;
    }

    LOG_INFO("Supervisor") << "connected to relay " << relay_->endpoint();
    Callback on_connected;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        on_connected = on_connected_;
    }
    if (on_connected) {
        on_connected();
    }
    return true;
}

void ReconnectSupervisor::start() {
    for (int number = 1; number <= policy_.initial_attempts; ++number) {
        if (stopped_) {
            throw ConnectionError("relay connection cancelled");
        }
        if (attempt(number)) {
            worker_ = std::thread(&ReconnectSupervisor::worker, this);
            return;
        }
        if (number == policy_.initial_attempts) {
            break;
        }
        auto delay = policy_.delay_after(number);
        LOG_WARN("Supervisor") << "relay unreachable, retrying in " << delay.count() << " ms";
        if (!sleep_for(delay)) {
            throw ConnectionError("relay connection cancelled");
        }
    }
    throw ConnectionError("relay " + relay_->endpoint() + " unreachable after " +
                          std::to_string(policy_.initial_attempts) + " attempts");
}

void ReconnectSupervisor::handle_disconnect() {
    if (stopped_) {
        return;
    }
    LOG_WARN("Supervisor") << "lost connection to relay " << relay_->endpoint();

    Callback on_disconnected;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        on_disconnected = on_disconnected_;
    }
    if (on_disconnected) {
        on_disconnected();
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        connection_lost_ = true;
    }
    wake_.notify_all();
}

void ReconnectSupervisor::worker() {
    while (!stopped_) {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            wake_.wait(lock, [this]() { return connection_lost_ || stopped_.load(); });
        }
        if (stopped_) {
            break;
        }

        // Unbounded after the first success
        int number = 1;
        while (!stopped_ && !attempt(number)) {
            auto delay = policy_.delay_after(number);
            LOG_WARN("Supervisor") << "reconnect failed, retrying in " << delay.count() << " ms";
            if (!sleep_for(delay)) {
                break;
            }
            ++number;
        }
        if (!stopped_) {
            ++reconnects_;
        }
    }
    LOG_DEBUG("Supervisor") << "reconnect worker exiting";
}

bool ReconnectSupervisor::sleep_for(std::chrono::milliseconds delay) {
    std::unique_lock<std::mutex> lock(mutex_);
    return !wake_.wait_for(lock, delay, [this]() { return stopped_.load(); });
}

void ReconnectSupervisor::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopped_.exchange(true)) {
            return;
        }
    }
    wake_.notify_all();
    LOG_INFO("Supervisor") << "stopping";

    if (worker_.joinable()) {
        worker_.join();
    }
    relay_->disconnect();
}

void ReconnectSupervisor::wait() {
    std::unique_lock<std::mutex> lock(mutex_);
    wake_.wait(lock, [this]() { return stopped_.load(); });
}

} // namespace neurax
