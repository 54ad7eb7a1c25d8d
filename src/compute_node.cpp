#include "compute_node.h"
#include "errors.h"
#include "logger.h"
#include "relay_client.h"
#include <algorithm>

namespace neurax {

ComputeNode::ComputeNode(std::shared_ptr<RelayConnection> relay,
                         std::shared_ptr<SandboxExecutor> executor,
                         const ComputeNodeConfig& config)
    : relay_(relay),
      executor_(std::move(executor)),
      config_(config),
      supervisor_(relay, config.backoff) {
    relay_->set_event_handler([this](const RelayEvent& event) { handle_event(event); });
    supervisor_.set_on_connected([this]() { on_connected(); });
    supervisor_.set_on_disconnected([this]() { on_disconnected(); });
}

ComputeNode::~ComputeNode() {
    stop();
    relay_->set_event_handler(nullptr);
}

void ComputeNode::start() {
    installed_tools_.clear();
    if (executor_->probe_runtime()) {
        installed_tools_.push_back(executor_->runtime().name());
    } else if (executor_->config().allow_unisolated) {
        installed_tools_.push_back("host-unisolated");
    }
    installed_tools_.push_back(TASK_KIND_PYTHON);
    installed_tools_.push_back(TASK_KIND_SHELL);

    LOG_INFO("ComputeNode") << "starting on device '" << config_.device << "', relay "
                            << relay_->endpoint();
    supervisor_.start();
    sweeper_ = std::thread(&ComputeNode::sweep_loop, this);
}

void ComputeNode::stop() {
    if (stopping_.exchange(true)) {
        return;
    }
    LOG_INFO("ComputeNode") << "shutting down";
    {
        std::lock_guard<std::mutex> lock(sweep_mutex_);
        sweep_wake_.notify_all();
    }
    if (sweeper_.joinable()) {
        sweeper_.join();
    }
    supervisor_.stop();
    registry_.clear();
    reap_workers(true);
}

void ComputeNode::wait() {
    supervisor_.wait();
}

void ComputeNode::on_connected() {
    RelayEvent event;
    event.name = relay_events::REGISTER_COMPUTE_NODE;
    event.data["device"] = config_.device;
    event.data["status"] = "available";
    Json::Value tools(Json::arrayValue);
    for (const auto& tool : installed_tools_) {
        tools.append(tool);
    }
    event.data["installed_tools"] = tools;

    if (!relay_->emit(event)) {
        LOG_WARN("ComputeNode") << "registration could not be sent";
    }
}

void ComputeNode::on_disconnected() {
    // Sessions never survive a relay loss
    registry_.clear();
}

void ComputeNode::handle_event(const RelayEvent& event) {
    if (event.name == relay_events::OFFER) {
        on_offer(event);
    } else if (event.name == relay_events::ICE_CANDIDATE) {
        on_ice_candidate(event);
    } else if (event.name == relay_events::CHANNEL_MESSAGE) {
        on_channel_message(event);
    } else if (event.name == relay_events::CHANNEL_CLOSE) {
        on_channel_close(event);
    } else if (event.name == relay_events::REGISTERED) {
        LOG_INFO("ComputeNode") << "registered with relay";
    } else if (event.name == relay_events::ERROR) {
        LOG_WARN("ComputeNode") << "relay error: " << MessageCodec::write(event.data);
    } else {
        LOG_DEBUG("ComputeNode") << "ignoring relay event '" << event.name << "'";
    }
}

void ComputeNode::on_offer(const RelayEvent& event) {
    std::string session_id = event.session_id();
    if (session_id.empty()) {
        LOG_WARN("ComputeNode") << "offer without session id";
        return;
    }
    if (stopping_) {
        return;
    }
    if (registry_.lookup(session_id)) {
        LOG_WARN("ComputeNode") << session_id << ": duplicate offer ignored";
        return;
    }

    const Json::Value& offer = event.data["offer"];
    if (!offer.isString() || offer.asString() != RELAY_TUNNEL_TAG) {
        LOG_WARN("ComputeNode") << session_id << ": unsupported transport offer";
        if (!relay_->emit(MessageCodec::channel_close(session_id))) {
            LOG_DEBUG("ComputeNode") << session_id << ": rejection not delivered";
        }
        return;
    }

    auto session = Session::create(session_id, SessionRole::COMPUTE_NODE);
    session->attach_channel(std::make_shared<RelayTunnelChannel>(session_id, relay_));
    session->set_task_handler([this](const std::shared_ptr<Session>& owner, const Task& task) {
        run_task(owner, task);
    });
    session->set_closed_handler([this](const Session& closed) {
        auto age = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - closed.created_at());
        LOG_INFO("ComputeNode") << closed.id() << ": session ended after " << age.count() << " ms";
        registry_.remove(closed.id());
    });

    if (!registry_.insert(session)) {
        return;
    }
    session->begin_signaling();

    LOG_INFO("ComputeNode") << session_id << ": accepting offer";
    if (!relay_->emit(MessageCodec::answer(session_id, RELAY_TUNNEL_TAG))) {
        session->fail(ErrorKind::CONNECTION, "answer could not be sent");
        return;
    }
    // Tunnel is usable as soon as the answer is out
    session->on_channel_open();
}

void ComputeNode::on_ice_candidate(const RelayEvent& event) {
    auto session = registry_.lookup(event.session_id());
    if (!session) {
        LOG_DEBUG("ComputeNode") << event.session_id() << ": candidate for unknown session ignored";
        return;
    }
    try {
        session->on_remote_candidate(MessageCodec::decode_ice_candidate(event));
    } catch (const DecodeError& e) {
        LOG_WARN("ComputeNode") << event.session_id() << ": bad candidate: " << e.what();
    }
}

void ComputeNode::on_channel_message(const RelayEvent& event) {
    auto session = registry_.lookup(event.session_id());
    if (!session) {
        LOG_DEBUG("ComputeNode") << event.session_id() << ": message for unknown session dropped";
        return;
    }
    const Json::Value& payload = event.data["payload"];
    if (!payload.isString()) {
        session->fail(ErrorKind::DECODE, "channel_message without payload");
        return;
    }
    session->on_channel_message(payload.asString());
}

void ComputeNode::on_channel_close(const RelayEvent& event) {
    auto session = registry_.lookup(event.session_id());
    if (session) {
        session->on_channel_closed();
    }
}

size_t ComputeNode::expire_idle_sessions() {
    auto now = std::chrono::steady_clock::now();
    size_t expired = 0;
    for (const auto& id : registry_.ids()) {
        auto session = registry_.lookup(id);
        if (!session || session->is_terminal()) {
            continue;
        }
        SessionState state = session->state();
        if (state == SessionState::TASK_IN_FLIGHT || state == SessionState::RESULT_SENT) {
            continue;
        }
        auto idle = std::chrono::duration_cast<std::chrono::milliseconds>(now - session->last_activity());
        if (idle < config_.session_idle_timeout) {
            continue;
        }
        LOG_WARN("ComputeNode") << id << ": no progress for " << idle.count() << " ms in state "
                                << session_state_name(state) << ", dropping";
        session->fail(ErrorKind::CONNECTION_TIMEOUT,
                      "peer idle for " + std::to_string(idle.count()) + " ms");
        ++expired;
    }
    return expired;
}

void ComputeNode::sweep_loop() {
    auto interval = std::min(config_.session_idle_timeout / 4,
                             std::chrono::milliseconds(SESSION_SWEEP_INTERVAL_MS));
    interval = std::max(interval, std::chrono::milliseconds(10));

    std::unique_lock<std::mutex> lock(sweep_mutex_);
    while (!stopping_) {
        sweep_wake_.wait_for(lock, interval, [this]() { return stopping_.load(); });
        if (stopping_) {
            break;
        }
        lock.unlock();
        expire_idle_sessions();
        lock.lock();
    }
}

void ComputeNode::run_task(const std::shared_ptr<Session>& session, const Task& task) {
    {
        std::lock_guard<std::mutex> lock(workers_mutex_);
        if (stopping_) {
            session->close();
            return;
        }

        auto done = std::make_shared<std::atomic<bool>>(false);
        std::shared_ptr<SandboxExecutor> executor = executor_;
        Worker worker;
        worker.done = done;
        worker.thread = std::thread([session, task, executor, done]() {
            ExecutionResult result = executor->execute(task, &session->cancelled());
            if (!session->deliver_result(result)) {
                LOG_WARN("ComputeNode") << session->id() << ": result not delivered";
            }
            done->store(true);
        });
        workers_.push_back(std::move(worker));
    }
    reap_workers(false);
}

void ComputeNode::reap_workers(bool wait_all) {
    std::list<Worker> finished;
    {
        std::lock_guard<std::mutex> lock(workers_mutex_);
        for (auto it = workers_.begin(); it != workers_.end();) {
            if (wait_all || it->done->load()) {
                finished.push_back(std::move(*it));
                it = workers_.erase(it);
            } else {
                ++it;
            }
        }
    }
    for (auto& worker : finished) {
        if (worker.thread.joinable()) {
            worker.thread.join();
        }
    }
}

size_t ComputeNode::running_tasks() const {
    std::lock_guard<std::mutex> lock(workers_mutex_);
    size_t count = 0;
    for (const auto& worker : workers_) {
        if (!worker.done->load()) {
            ++count;
        }
    }
    return count;
}

} // namespace neurax
