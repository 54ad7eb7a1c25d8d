#pragma once

#include "crypto_session.h"
#include "errors.h"
#include "protocol.h"
#include "task.h"
#include "transport.h"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace neurax {

enum class SessionRole {
    CLIENT,         // initiator: generates the session key, sends the task
    COMPUTE_NODE    // responder: unseals the key, executes the task
};

enum class SessionState {
    INIT,
    SIGNALING,
    CHANNEL_OPEN,
    AWAITING_PEER_KEY,
    KEY_ESTABLISHED,
    TASK_IN_FLIGHT,
    RESULT_SENT,
    CLOSED,
    FAILED
};

std::string session_state_name(SessionState state);
std::string session_role_name(SessionRole role);

struct SessionFailure {
    ErrorKind kind;
    std::string message;
};

// One client-task-to-compute-node exchange, from signaling to teardown.
//
// Every inbound channel message goes through on_channel_message(), which
// decodes it and applies the transition for (role, state, type). Crypto and
// protocol errors move the session to FAILED and tear it down without a
// reply; they never escape to the caller. Outbound messages and callbacks
// run after the session lock is released.
class Session : public std::enable_shared_from_this<Session> {
public:
    using TaskHandler = std::function<void(const std::shared_ptr<Session>&, const Task&)>;
    using ResultHandler = std::function<void(const ExecutionResult&)>;
    using ClosedHandler = std::function<void(const Session&)>;

    static std::shared_ptr<Session> create(const std::string& session_id, SessionRole role);

    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    const std::string& id() const { return id_; }
    SessionRole role() const { return role_; }

    SessionState state() const;
    std::vector<SessionState> history() const;
    std::optional<SessionFailure> failure() const;
    bool is_terminal() const;

    std::chrono::steady_clock::time_point created_at() const { return created_at_; }
    std::chrono::steady_clock::time_point last_activity() const;

    // Callbacks (set before signaling starts)
    void set_task_handler(TaskHandler handler);
    void set_result_handler(ResultHandler handler);
    void set_closed_handler(ClosedHandler handler);

    // INIT -> SIGNALING
    void begin_signaling();

    // Channel handle owned by the session from here on
    void attach_channel(std::shared_ptr<TransportChannel> channel);

    // SIGNALING -> CHANNEL_OPEN -> AWAITING_PEER_KEY (sends own public key),
    // then replays any peer message that arrived early
    void on_channel_open();

    // Single dispatch point for inbound channel messages
    void on_channel_message(const std::string& raw);

    // Peer or transport closed the channel
    void on_channel_closed();

    // Signaling candidate for this session's transport
    void on_remote_candidate(const IceCandidate& candidate);

    // Client: KEY_ESTABLISHED -> TASK_IN_FLIGHT. Throws NotReadyError before
    // the handshake completes, ProtocolError if a task was already sent,
    // ConnectionError if the channel rejects the message.
    void send_task(const Task& task);

    // Compute node: TASK_IN_FLIGHT -> RESULT_SENT -> CLOSED. Returns false if
    // the session was torn down while the task ran.
    bool deliver_result(const ExecutionResult& result);

    // Channel open and session key confirmed
    bool ready() const;

    // Block until ready(), polling at poll_interval. Throws
    // ConnectionTimeoutError after timeout, or the session's failure if it
    // dies first. The session stays closeable either way.
    void wait_until_ready(std::chrono::milliseconds timeout,
                          std::chrono::milliseconds poll_interval);

    // Client: block for the decrypted result. Throws ConnectionTimeoutError
    // after timeout, ConnectionError if the session ends without a result.
    ExecutionResult wait_for_result(std::chrono::milliseconds timeout);

    // Local failure (e.g. signaling gave up). No-op on a terminal session.
    void fail(ErrorKind kind, const std::string& message);

    // Teardown: close channel, discard keys, flag outstanding execution for
    // termination. Idempotent.
    void close();

    // Set once the session is torn down; executors poll it
    const std::atomic<bool>& cancelled() const { return cancelled_; }

    // Number of distinct signaling candidates handed to the transport
    size_t remote_candidate_count() const;

private:
    struct Actions;

    Session(const std::string& session_id, SessionRole role);

    void transition_locked(SessionState next);
    void open_locked(Actions& actions);
    void handle_locked(const std::string& raw, Actions& actions);
    void handle_public_key_locked(const ChannelMessage& message, Actions& actions);
    void handle_session_key_locked(const ChannelMessage& message, Actions& actions);
    void handle_session_key_ack_locked(Actions& actions);
    void handle_encrypted_task_locked(const ChannelMessage& message, Actions& actions);
    void handle_encrypted_result_locked(const ChannelMessage& message, Actions& actions);
    void fail_locked(ErrorKind kind, const std::string& message, Actions& actions);
    void teardown_locked(SessionState terminal, Actions& actions);
    void flush(Actions& actions);
    [[noreturn]] void throw_failure_locked() const;

    const std::string id_;
    const SessionRole role_;
    const std::chrono::steady_clock::time_point created_at_;

    mutable std::mutex mutex_;
    std::condition_variable state_changed_;
    SessionState state_ = SessionState::INIT;
    std::vector<SessionState> history_;
    std::optional<SessionFailure> failure_;
    std::chrono::steady_clock::time_point last_activity_;

    CryptoSession crypto_;
    std::shared_ptr<TransportChannel> channel_;
    std::vector<std::string> pending_;      // peer messages received before local open
    bool public_key_sent_ = false;
    bool session_key_sent_ = false;
    std::optional<ExecutionResult> result_;
    std::set<std::string> remote_candidates_;
    bool closed_notified_ = false;
    std::atomic<bool> cancelled_{false};

    TaskHandler task_handler_;
    ResultHandler result_handler_;
    ClosedHandler closed_handler_;
};

} // namespace neurax
