#include "session.h"
#include "logger.h"
#include <thread>

namespace neurax {

struct Session::Actions {
    std::shared_ptr<TransportChannel> channel;
    std::vector<std::string> outbound;
    bool close_channel = false;
    bool notify_closed = false;
    std::optional<Task> task;
    std::optional<ExecutionResult> result;
};

std::string session_state_name(SessionState state) {
    switch (state) {
        case SessionState::INIT: return "Init";
        case SessionState::SIGNALING: return "Signaling";
        case SessionState::CHANNEL_OPEN: return "ChannelOpen";
        case SessionState::AWAITING_PEER_KEY: return "AwaitingPeerKey";
        case SessionState::KEY_ESTABLISHED: return "KeyEstablished";
        case SessionState::TASK_IN_FLIGHT: return "TaskInFlight";
        case SessionState::RESULT_SENT: return "ResultSent";
        case SessionState::CLOSED: return "Closed";
        case SessionState::FAILED: return "Failed";
    }
    return "Unknown";
}

std::string session_role_name(SessionRole role) {
    return role == SessionRole::CLIENT ? "client" : "compute-node";
}

std::shared_ptr<Session> Session::create(const std::string& session_id, SessionRole role) {
    return std::shared_ptr<Session>(new Session(session_id, role));
}

Session::Session(const std::string& session_id, SessionRole role)
    : id_(session_id),
      role_(role),
      created_at_(std::chrono::steady_clock::now()),
      last_activity_(created_at_) {
    history_.push_back(SessionState::INIT);
    LOG_DEBUG("Session") << id_ << ": created as " << session_role_name(role_);
}

Session::~Session() {
    // Handlers may capture owners that are already gone; do not call them here
    std::lock_guard<std::mutex> lock(mutex_);
    if (channel_) {
        channel_->close();
    }
    cancelled_ = true;
}

SessionState Session::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

std::vector<SessionState> Session::history() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return history_;
}

std::optional<SessionFailure> Session::failure() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return failure_;
}

bool Session::is_terminal() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_ == SessionState::CLOSED || state_ == SessionState::FAILED;
}

std::chrono::steady_clock::time_point Session::last_activity() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_activity_;
}

void Session::set_task_handler(TaskHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    task_handler_ = std::move(handler);
}

void Session::set_result_handler(ResultHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    result_handler_ = std::move(handler);
}

void Session::set_closed_handler(ClosedHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_handler_ = std::move(handler);
}

void Session::transition_locked(SessionState next) {
    LOG_DEBUG("Session") << id_ << ": " << session_state_name(state_)
                         << " -> " << session_state_name(next);
    state_ = next;
    history_.push_back(next);
    state_changed_.notify_all();
}

void Session::begin_signaling() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != SessionState::INIT) {
        throw ProtocolError("signaling already started for session " + id_);
    }
    transition_locked(SessionState::SIGNALING);
}

void Session::attach_channel(std::shared_ptr<TransportChannel> channel) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != SessionState::INIT && state_ != SessionState::SIGNALING) {
        throw ProtocolError("channel attached after signaling for session " + id_);
    }
    channel_ = std::move(channel);
}

void Session::on_channel_open() {
    Actions actions;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == SessionState::CLOSED || state_ == SessionState::FAILED) {
            return;
        }
        if (state_ == SessionState::INIT) {
            transition_locked(SessionState::SIGNALING);
        }
        if (state_ != SessionState::SIGNALING) {
            LOG_WARN("Session") << id_ << ": duplicate channel open ignored";
            return;
        }
        open_locked(actions);
    }
    flush(actions);
}

void Session::open_locked(Actions& actions) {
    if (!channel_) {
        fail_locked(ErrorKind::CONNECTION, "channel opened without a transport handle", actions);
        return;
    }

    transition_locked(SessionState::CHANNEL_OPEN);
    LOG_INFO("Session") << id_ << ": channel open";

    actions.outbound.push_back(
        MessageCodec::encode(ChannelMessage::make_public_key(crypto_.export_public_key())));
    public_key_sent_ = true;
    transition_locked(SessionState::AWAITING_PEER_KEY);

    // Peer messages that raced ahead of our own open
    std::vector<std::string> early;
    early.swap(pending_);
    for (const auto& raw : early) {
        if (state_ == SessionState::FAILED || state_ == SessionState::CLOSED) {
            break;
        }
        handle_locked(raw, actions);
    }
}

void Session::on_channel_message(const std::string& raw) {
    Actions actions;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        last_activity_ = std::chrono::steady_clock::now();

        if (state_ == SessionState::CLOSED || state_ == SessionState::FAILED) {
            LOG_DEBUG("Session") << id_ << ": message after teardown dropped";
            return;
        }
        if (state_ == SessionState::INIT || state_ == SessionState::SIGNALING) {
            pending_.push_back(raw);
            return;
        }
        handle_locked(raw, actions);
    }
    flush(actions);
}

void Session::handle_locked(const std::string& raw, Actions& actions) {
    try {
        ChannelMessage message = MessageCodec::decode_channel_message(raw);
        switch (message.type) {
            case MessageType::PUBLIC_KEY:
                handle_public_key_locked(message, actions);
                break;
            case MessageType::SESSION_KEY:
                handle_session_key_locked(message, actions);
                break;
            case MessageType::SESSION_KEY_ACK:
                handle_session_key_ack_locked(actions);
                break;
            case MessageType::ENCRYPTED_TASK:
                handle_encrypted_task_locked(message, actions);
                break;
            case MessageType::ENCRYPTED_RESULT:
                handle_encrypted_result_locked(message, actions);
                break;
        }
    } catch (const Error& e) {
        fail_locked(e.kind(), e.what(), actions);
    }
}

void Session::handle_public_key_locked(const ChannelMessage& message, Actions& actions) {
    if (crypto_.has_peer_public_key() && crypto_.peer_public_key() == message.public_key) {
        LOG_DEBUG("Session") << id_ << ": duplicate peer public key ignored";
        return;
    }
    if (state_ != SessionState::AWAITING_PEER_KEY) {
        throw ProtocolError("public key received in state " + session_state_name(state_));
    }

    crypto_.set_peer_public_key(message.public_key);
    LOG_INFO("Session") << id_ << ": received peer public key";

    if (role_ == SessionRole::COMPUTE_NODE) {
        if (!public_key_sent_) {
            actions.outbound.push_back(
                MessageCodec::encode(ChannelMessage::make_public_key(crypto_.export_public_key())));
            public_key_sent_ = true;
        }
        return;
    }

    // Client drives key generation
    std::string sealed_key = crypto_.seal_session_key(message.public_key);
    actions.outbound.push_back(
        MessageCodec::encode(ChannelMessage::make_session_key(sealed_key)));
    session_key_sent_ = true;
    LOG_INFO("Session") << id_ << ": sent sealed session key";
}

void Session::handle_session_key_locked(const ChannelMessage& message, Actions& actions) {
    if (role_ != SessionRole::COMPUTE_NODE) {
        throw ProtocolError("client received a session key");
    }
    if (state_ != SessionState::AWAITING_PEER_KEY) {
        throw ProtocolError("session key received in state " + session_state_name(state_));
    }

    crypto_.unseal_session_key(message.encrypted_aes_key);
    actions.outbound.push_back(MessageCodec::encode(ChannelMessage::make_session_key_ack()));
    transition_locked(SessionState::KEY_ESTABLISHED);
    LOG_INFO("Session") << id_ << ": key exchange complete";
}

void Session::handle_session_key_ack_locked(Actions& actions) {
    (void)actions;
    if (role_ != SessionRole::CLIENT) {
        throw ProtocolError("compute node received a session key acknowledgement");
    }
    if (state_ != SessionState::AWAITING_PEER_KEY || !session_key_sent_) {
        throw ProtocolError("unexpected session key acknowledgement in state " +
                            session_state_name(state_));
    }

    transition_locked(SessionState::KEY_ESTABLISHED);
    LOG_INFO("Session") << id_ << ": key exchange complete, ready for task";
}

void Session::handle_encrypted_task_locked(const ChannelMessage& message, Actions& actions) {
    if (role_ != SessionRole::COMPUTE_NODE) {
        throw ProtocolError("client received an encrypted task");
    }
    if (state_ != SessionState::KEY_ESTABLISHED) {
        throw ProtocolError("encrypted task received in state " + session_state_name(state_));
    }

    std::string plaintext = crypto_.unseal(message.encrypted_data);
    Task task = MessageCodec::decode_task(plaintext);

    transition_locked(SessionState::TASK_IN_FLIGHT);
    LOG_INFO("Session") << id_ << ": decrypted task, " << task.code.size()
                        << " bytes of " << task.kind;
    actions.task = std::move(task);
}

void Session::handle_encrypted_result_locked(const ChannelMessage& message, Actions& actions) {
    if (role_ != SessionRole::CLIENT) {
        throw ProtocolError("compute node received an encrypted result");
    }
    if (state_ != SessionState::TASK_IN_FLIGHT) {
        throw ProtocolError("encrypted result received in state " + session_state_name(state_));
    }

    std::string plaintext = crypto_.unseal(message.encrypted_data);
    ExecutionResult result = MessageCodec::decode_result(plaintext);

    result_ = result;
    transition_locked(SessionState::RESULT_SENT);
    LOG_INFO("Session") << id_ << ": received result, exit code " << result.exit_code;
    actions.result = std::move(result);

    teardown_locked(SessionState::CLOSED, actions);
}

void Session::on_channel_closed() {
    LOG_DEBUG("Session") << id_ << ": channel closed by transport";
    close();
}

void Session::on_remote_candidate(const IceCandidate& candidate) {
    std::shared_ptr<TransportChannel> channel;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == SessionState::CLOSED || state_ == SessionState::FAILED) {
            return;
        }
        std::string key = candidate.sdp_mid + "|" + std::to_string(candidate.sdp_mline_index) +
                          "|" + candidate.candidate;
        if (!remote_candidates_.insert(key).second) {
            return;
        }
        last_activity_ = std::chrono::steady_clock::now();
        channel = channel_;
    }
    if (channel) {
        channel->add_remote_candidate(candidate);
    }
}

size_t Session::remote_candidate_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return remote_candidates_.size();
}

void Session::send_task(const Task& task) {
    Actions actions;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (role_ != SessionRole::CLIENT) {
            throw ProtocolError("only the client sends tasks");
        }
        if (state_ == SessionState::CLOSED || state_ == SessionState::FAILED) {
            throw ConnectionError("session " + id_ + " is already torn down");
        }
        if (state_ == SessionState::TASK_IN_FLIGHT || state_ == SessionState::RESULT_SENT) {
            throw ProtocolError("session " + id_ + " already carries a task");
        }
        if (state_ != SessionState::KEY_ESTABLISHED) {
            throw NotReadyError("handshake not complete for session " + id_);
        }

        std::string sealed = crypto_.seal(MessageCodec::encode_task(task));
        actions.outbound.push_back(
            MessageCodec::encode(ChannelMessage::make_encrypted_task(sealed)));
        transition_locked(SessionState::TASK_IN_FLIGHT);
        LOG_INFO("Session") << id_ << ": sent encrypted task (" << task.code.size() << " bytes)";
    }
    flush(actions);

    std::optional<SessionFailure> why;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!result_.has_value()) {
            why = failure_;
        }
    }
    if (why && why->kind == ErrorKind::CONNECTION) {
        throw ConnectionError(why->message);
    }
}

bool Session::deliver_result(const ExecutionResult& result) {
    Actions actions;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != SessionState::TASK_IN_FLIGHT) {
            LOG_WARN("Session") << id_ << ": result dropped, session is "
                                << session_state_name(state_);
            return false;
        }

        std::string sealed;
        try {
            sealed = crypto_.seal(MessageCodec::encode_result(result));
        } catch (const Error& e) {
            fail_locked(e.kind(), e.what(), actions);
        }

        if (state_ == SessionState::TASK_IN_FLIGHT) {
            actions.outbound.push_back(
                MessageCodec::encode(ChannelMessage::make_encrypted_result(sealed)));
            transition_locked(SessionState::RESULT_SENT);
            LOG_INFO("Session") << id_ << ": sent encrypted result, exit code " << result.exit_code;
            teardown_locked(SessionState::CLOSED, actions);
        }
    }
    flush(actions);
    return state() == SessionState::CLOSED;
}

bool Session::ready() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_ == SessionState::KEY_ESTABLISHED && channel_ && channel_->is_open() &&
           crypto_.has_session_key();
}

void Session::wait_until_ready(std::chrono::milliseconds timeout,
                               std::chrono::milliseconds poll_interval) {
    auto deadline = std::chrono::steady_clock::now() + timeout;

    std::unique_lock<std::mutex> lock(mutex_);
    while (true) {
        if (state_ == SessionState::KEY_ESTABLISHED && channel_ && channel_->is_open() &&
            crypto_.has_session_key()) {
            return;
        }
        if (state_ == SessionState::CLOSED || state_ == SessionState::FAILED) {
            throw_failure_locked();
        }
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            throw ConnectionTimeoutError("compute node not ready after " +
                                         std::to_string(timeout.count()) + " ms");
        }
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        state_changed_.wait_for(lock, std::min(poll_interval, remaining));
    }
}

ExecutionResult Session::wait_for_result(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    bool finished = state_changed_.wait_for(lock, timeout, [this]() {
        return result_.has_value() || state_ == SessionState::CLOSED ||
               state_ == SessionState::FAILED;
    });

    if (result_) {
        return *result_;
    }
    if (!finished) {
        throw ConnectionTimeoutError("no result after " + std::to_string(timeout.count()) + " ms");
    }
    throw_failure_locked();
}

void Session::throw_failure_locked() const {
    if (!failure_) {
        throw ConnectionError("session " + id_ + " closed before completion");
    }
    const std::string& message = failure_->message;
    switch (failure_->kind) {
        case ErrorKind::CONNECTION_TIMEOUT: throw ConnectionTimeoutError(message);
        case ErrorKind::KEY_EXCHANGE: throw KeyExchangeError(message);
        case ErrorKind::INTEGRITY: throw IntegrityError(message);
        case ErrorKind::DECODE: throw DecodeError(message);
        case ErrorKind::NOT_READY: throw NotReadyError(message);
        case ErrorKind::PROTOCOL: throw ProtocolError(message);
        default: throw ConnectionError(message);
    }
}

void Session::fail(ErrorKind kind, const std::string& message) {
    Actions actions;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == SessionState::CLOSED || state_ == SessionState::FAILED) {
            return;
        }
        fail_locked(kind, message, actions);
    }
    flush(actions);
}

void Session::fail_locked(ErrorKind kind, const std::string& message, Actions& actions) {
    LOG_WARN("Session") << id_ << ": " << error_kind_name(kind) << " in state "
                        << session_state_name(state_) << ": " << message;
    failure_ = SessionFailure{kind, message};

    // No reply of any kind once the session has failed
    actions.outbound.clear();
    actions.task.reset();
    teardown_locked(SessionState::FAILED, actions);
}

void Session::close() {
    Actions actions;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == SessionState::CLOSED || state_ == SessionState::FAILED) {
            return;
        }
        teardown_locked(SessionState::CLOSED, actions);
    }
    flush(actions);
}

void Session::teardown_locked(SessionState terminal, Actions& actions) {
    transition_locked(terminal);
    cancelled_ = true;
    crypto_.discard();
    pending_.clear();

    if (channel_) {
        actions.channel = channel_;
        actions.close_channel = true;
    }
    if (!closed_notified_) {
        closed_notified_ = true;
        actions.notify_closed = true;
    }

    auto age = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - created_at_);
    LOG_INFO("Session") << id_ << ": torn down as " << session_state_name(terminal)
                        << " after " << age.count() << " ms";
}

void Session::flush(Actions& actions) {
    std::shared_ptr<TransportChannel> channel = actions.channel;
    TaskHandler task_handler;
    ResultHandler result_handler;
    ClosedHandler closed_handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!channel) {
            channel = channel_;
        }
        task_handler = task_handler_;
        result_handler = result_handler_;
        closed_handler = closed_handler_;
    }

    bool send_failed = false;
    for (const auto& message : actions.outbound) {
        if (!channel || !channel->send(message)) {
            send_failed = true;
            break;
        }
    }

    if (actions.close_channel && channel) {
        channel->close();
    }

    if (send_failed) {
        fail(ErrorKind::CONNECTION, "transport channel rejected an outbound message");
    }

    if (actions.result && result_handler) {
        result_handler(*actions.result);
    }
    if (actions.task && !send_failed) {
        if (task_handler) {
            task_handler(shared_from_this(), *actions.task);
        } else {
            LOG_ERROR("Session") << id_ << ": task decrypted but no executor attached";
            fail(ErrorKind::PROTOCOL, "no task handler on compute node");
        }
    }
    if (actions.notify_closed && closed_handler) {
        closed_handler(*this);
    }
}

} // namespace neurax
