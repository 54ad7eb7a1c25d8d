#pragma once

#include "protocol.h"
#include "transport.h"
#include <atomic>
#include <condition_variable>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace neurax {
namespace testing {

class InProcessRelayConnection;

// Rendezvous relay living inside the test process. Routes events between
// connections the same way the signaling server does: offers go to a
// registered compute node, everything else for a session goes to the other
// party of that session.
class InProcessRelay {
public:
    void route(InProcessRelayConnection* from, const RelayEvent& event);
    void detach(InProcessRelayConnection* connection);

    void refuse_connections(bool refuse) { refuse_.store(refuse); }
    bool refusing() const { return refuse_.load(); }

    size_t count(const std::string& event_name) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = counts_.find(event_name);
        return it == counts_.end() ? 0 : it->second;
    }

private:
    struct Room {
        InProcessRelayConnection* client = nullptr;
        InProcessRelayConnection* node = nullptr;
    };

    mutable std::mutex mutex_;
    std::vector<InProcessRelayConnection*> nodes_;
    std::map<std::string, Room> rooms_;
    std::map<std::string, size_t> counts_;
    std::atomic<bool> refuse_{false};
};

// One party's connection. Inbound events are delivered on a dedicated
// thread in arrival order, like a socket reader.
class InProcessRelayConnection : public RelayConnection {
public:
    InProcessRelayConnection(std::shared_ptr<InProcessRelay> relay, std::string name)
        : relay_(std::move(relay)), name_(std::move(name)) {}

    ~InProcessRelayConnection() override {
        disconnect();
        relay_->detach(this);
    }

    bool connect() override {
        std::unique_lock<std::mutex> lock(mutex_);
        ++connect_attempts_;
        if (connected_) {
            return true;
        }
        if (relay_->refusing()) {
            return false;
        }
        lock.unlock();
        join_reader();
        lock.lock();
        queue_.clear();
        stop_reader_ = false;
        sever_ = false;
        connected_ = true;
        reader_ = std::thread(&InProcessRelayConnection::deliver_loop, this);
        return true;
    }

    void disconnect() override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            connected_ = false;
            stop_reader_ = true;
        }
        wake_.notify_all();
        join_reader();
    }

    bool connected() const override { return connected_.load(); }

    bool emit(const RelayEvent& event) override {
        if (!connected_) {
            return false;
        }
        {
            std::lock_guard<std::mutex> lock(mutex_);
            emitted_.push_back(event);
        }
        relay_->route(this, event);
        return true;
    }

    void set_event_handler(EventHandler handler) override {
        std::lock_guard<std::mutex> lock(mutex_);
        event_handler_ = std::move(handler);
    }

    void set_disconnect_handler(DisconnectHandler handler) override {
        std::lock_guard<std::mutex> lock(mutex_);
        disconnect_handler_ = std::move(handler);
    }

    std::string endpoint() const override { return "in-process:" + name_; }

    // Called by the relay
    void deliver(const RelayEvent& event) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!connected_) {
                return;
            }
            queue_.push_back(event);
        }
        wake_.notify_all();
    }

    // Simulated network loss: the reader reports a disconnect
    void sever() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            connected_ = false;
            sever_ = true;
        }
        wake_.notify_all();
    }

    int connect_attempts() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return connect_attempts_;
    }

    std::vector<RelayEvent> emitted() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return emitted_;
    }

private:
    void deliver_loop() {
        while (true) {
            RelayEvent event;
            EventHandler handler;
            DisconnectHandler on_disconnect;
            {
                std::unique_lock<std::mutex> lock(mutex_);
                wake_.wait(lock, [this]() { return stop_reader_ || sever_ || !queue_.empty(); });
                if (stop_reader_) {
                    return;
                }
                if (sever_ && queue_.empty()) {
                    sever_ = false;
                    on_disconnect = disconnect_handler_;
                } else {
                    event = queue_.front();
                    queue_.pop_front();
                    handler = event_handler_;
                }
            }
            if (on_disconnect) {
                on_disconnect();
                return;
            }
            if (handler) {
                handler(event);
            }
        }
    }

    void join_reader() {
        if (reader_.joinable() && reader_.get_id() != std::this_thread::get_id()) {
            reader_.join();
        }
    }

    std::shared_ptr<InProcessRelay> relay_;
    std::string name_;

    mutable std::mutex mutex_;
    std::condition_variable wake_;
    std::atomic<bool> connected_{false};
    bool stop_reader_ = false;
    bool sever_ = false;
    int connect_attempts_ = 0;
    std::deque<RelayEvent> queue_;
    std::vector<RelayEvent> emitted_;
    EventHandler event_handler_;
    DisconnectHandler disconnect_handler_;
    std::thread reader_;
};

inline void InProcessRelay::route(InProcessRelayConnection* from, const RelayEvent& event) {
    InProcessRelayConnection* target = nullptr;
    RelayEvent reply;
    std::string session_id = event.session_id();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++counts_[event.name];

        if (event.name == relay_events::REGISTER_COMPUTE_NODE) {
            nodes_.push_back(from);
            reply.name = relay_events::REGISTERED;
            reply.data["status"] = "success";
            target = from;
        } else if (event.name == relay_events::CREATE_SESSION) {
            rooms_[session_id].client = from;
            reply.name = relay_events::SESSION_CREATED;
            reply.data["session_id"] = session_id;
            target = from;
        } else if (event.name == relay_events::OFFER) {
            Room& room = rooms_[session_id];
            room.client = from;
            for (auto* node : nodes_) {
                if (node->connected()) {
                    room.node = node;
                    break;
                }
            }
            if (room.node) {
                reply = event;
                target = room.node;
            } else {
                reply.name = relay_events::ERROR;
                reply.data["session_id"] = session_id;
                reply.data["message"] = "no compute node available";
                target = from;
            }
        } else if (event.name == relay_events::ANSWER ||
                   event.name == relay_events::ICE_CANDIDATE ||
                   event.name == relay_events::CHANNEL_MESSAGE ||
                   event.name == relay_events::CHANNEL_CLOSE) {
            auto it = rooms_.find(session_id);
            if (it != rooms_.end()) {
                target = it->second.client == from ? it->second.node : it->second.client;
                reply = event;
            }
        }
    }
    if (target) {
        target->deliver(reply);
    }
}

inline void InProcessRelay::detach(InProcessRelayConnection* connection) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = nodes_.begin(); it != nodes_.end();) {
        it = *it == connection ? nodes_.erase(it) : it + 1;
    }
    for (auto& entry : rooms_) {
        if (entry.second.client == connection) entry.second.client = nullptr;
        if (entry.second.node == connection) entry.second.node = nullptr;
    }
}

} // namespace testing
} // namespace neurax
