#include "client.h"
#include "errors.h"
#include "logger.h"
#include "relay_client.h"
#include <iomanip>
#include <random>
#include <sstream>

namespace neurax {

Client::Client(std::shared_ptr<RelayConnection> relay, const ClientConfig& config)
    : relay_(std::move(relay)), config_(config) {
    relay_->set_event_handler([this](const RelayEvent& event) { handle_event(event); });
    relay_->set_disconnect_handler([this]() {
        auto session = current();
        if (session) {
            session->fail(ErrorKind::CONNECTION, "relay connection lost");
        }
    });
}

Client::~Client() {
    auto session = current();
    if (session) {
        session->close();
    }
    relay_->set_event_handler(nullptr);
    relay_->set_disconnect_handler(nullptr);
}

std::string Client::generate_session_id() {
    std::random_device rd;
    std::ostringstream id;
    id << std::hex << std::setfill('0');
    for (int i = 0; i < 4; ++i) {
        id << std::setw(8) << rd();
    }
    return id.str();
}

std::shared_ptr<Session> Client::current() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return session_;
}

ExecutionResult Client::submit(const Task& task) {
    if (!relay_->connected() && !relay_->connect()) {
        throw ConnectionError("relay " + relay_->endpoint() + " unreachable");
    }

    std::string session_id = config_.session_id.empty() ? generate_session_id() : config_.session_id;
    auto session = Session::create(session_id, SessionRole::CLIENT);
    session->attach_channel(std::make_shared<RelayTunnelChannel>(session_id, relay_));
    {
        std::lock_guard<std::mutex> lock(mutex_);
        session_ = session;
    }

    try {
        session->begin_signaling();
        LOG_INFO("Client") << session_id << ": requesting compute node via " << relay_->endpoint();
        if (!relay_->emit(MessageCodec::create_session(session_id)) ||
            !relay_->emit(MessageCodec::offer(session_id, RELAY_TUNNEL_TAG))) {
            throw ConnectionError("signaling for session " + session_id + " could not be sent");
        }

        session->wait_until_ready(config_.connect_timeout, config_.poll_interval);
        LOG_INFO("Client") << session_id << ": secure channel ready";

        session->send_task(task);
        ExecutionResult result = session->wait_for_result(config_.result_timeout);
        LOG_INFO("Client") << session_id << ": result received, exit code " << result.exit_code;

        session->close();
        std::lock_guard<std::mutex> lock(mutex_);
        session_.reset();
        return result;
    } catch (const Error& e) {
        LOG_ERROR("Client") << session_id << ": " << e.what();
        session->close();
        std::lock_guard<std::mutex> lock(mutex_);
        session_.reset();
        throw;
    }
}

void Client::handle_event(const RelayEvent& event) {
    auto session = current();
    if (!session || event.session_id() != session->id()) {
        if (event.name == relay_events::ERROR) {
            LOG_WARN("Client") << "relay error: " << MessageCodec::write(event.data);
        } else {
            LOG_DEBUG("Client") << "ignoring '" << event.name << "' for " << event.session_id();
        }
        return;
    }

    if (event.name == relay_events::SESSION_CREATED) {
        LOG_DEBUG("Client") << session->id() << ": session created on relay";
    } else if (event.name == relay_events::ANSWER) {
        const Json::Value& answer = event.data["answer"];
        if (!answer.isString() || answer.asString() != RELAY_TUNNEL_TAG) {
            session->fail(ErrorKind::PROTOCOL, "compute node answered with an unsupported transport");
            return;
        }
        session->on_channel_open();
    } else if (event.name == relay_events::ICE_CANDIDATE) {
        try {
            session->on_remote_candidate(MessageCodec::decode_ice_candidate(event));
        } catch (const DecodeError& e) {
            LOG_WARN("Client") << session->id() << ": bad candidate: " << e.what();
        }
    } else if (event.name == relay_events::CHANNEL_MESSAGE) {
        const Json::Value& payload = event.data["payload"];
        if (!payload.isString()) {
            session->fail(ErrorKind::DECODE, "channel_message without payload");
            return;
        }
        session->on_channel_message(payload.asString());
    } else if (event.name == relay_events::CHANNEL_CLOSE) {
        session->on_channel_closed();
    } else if (event.name == relay_events::ERROR) {
        std::string message = event.data["message"].isString()
            ? event.data["message"].asString()
            : MessageCodec::write(event.data);
        session->fail(ErrorKind::CONNECTION, "relay: " + message);
    }
}

} // namespace neurax
