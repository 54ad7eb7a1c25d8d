#pragma once

#include "protocol.h"
#include "reconnect_supervisor.h"
#include "sandbox.h"
#include "session_registry.h"
#include "transport.h"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace neurax {

struct ComputeNodeConfig {
    std::string relay_url;
    std::string device = "cpu";
    SandboxConfig sandbox;
    BackoffPolicy backoff;
    // Sessions that have not reached their task within this long are failed
    std::chrono::milliseconds session_idle_timeout = std::chrono::seconds(NODE_SESSION_IDLE_SECONDS);
};

// Responder side: accepts offers relayed by the signaling server, runs one
// session per offer and executes decrypted tasks off the event thread.
class ComputeNode {
public:
    ComputeNode(std::shared_ptr<RelayConnection> relay,
                std::shared_ptr<SandboxExecutor> executor,
                const ComputeNodeConfig& config = ComputeNodeConfig{});
    ~ComputeNode();

    ComputeNode(const ComputeNode&) = delete;
    ComputeNode& operator=(const ComputeNode&) = delete;

    // Probes the runtime and connects. Throws ConnectionError when the
    // relay stays unreachable.
    void start();

    // Tears down sessions, kills running tasks, joins workers. Idempotent.
    void stop();

    // Blocks until stop()
    void wait();

    // Relay event dispatch
    void handle_event(const RelayEvent& event);

    // Fails sessions that sat idle past session_idle_timeout outside a
    // running task. Returns how many were expired.
    size_t expire_idle_sessions();

    SessionRegistry& registry() { return registry_; }
    size_t running_tasks() const;

private:
    struct Worker {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    void on_connected();
    void on_disconnected();
    void on_offer(const RelayEvent& event);
    void on_ice_candidate(const RelayEvent& event);
    void on_channel_message(const RelayEvent& event);
    void on_channel_close(const RelayEvent& event);
    void run_task(const std::shared_ptr<Session>& session, const Task& task);
    void reap_workers(bool wait_all);
    void sweep_loop();

    std::shared_ptr<RelayConnection> relay_;
    std::shared_ptr<SandboxExecutor> executor_;
    ComputeNodeConfig config_;
    ReconnectSupervisor supervisor_;
    SessionRegistry registry_;

    std::vector<std::string> installed_tools_;
    std::atomic<bool> stopping_{false};

    std::mutex sweep_mutex_;
    std::condition_variable sweep_wake_;
    std::thread sweeper_;

    mutable std::mutex workers_mutex_;
    std::list<Worker> workers_;
};

} // namespace neurax
