#include "session_registry.h"
#include "logger.h"

namespace neurax {

bool SessionRegistry::insert(const std::shared_ptr<Session>& session) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto inserted = sessions_.emplace(session->id(), session);
    if (!inserted.second) {
        LOG_WARN("Registry") << "session " << session->id() << " already registered";
        return false;
    }
    LOG_DEBUG("Registry") << "registered session " << session->id()
                          << " (" << sessions_.size() << " active)";
    return true;
}

std::shared_ptr<Session> SessionRegistry::lookup(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        return nullptr;
    }
    return it->second;
}

void SessionRegistry::remove(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (sessions_.erase(session_id) > 0) {
        LOG_DEBUG("Registry") << "removed session " << session_id
                              << " (" << sessions_.size() << " active)";
    }
}

void SessionRegistry::clear() {
    std::map<std::string, std::shared_ptr<Session>> doomed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        doomed.swap(sessions_);
    }

    // Closed handlers call remove(); run them without holding the lock
    if (!doomed.empty()) {
        LOG_INFO("Registry") << "tearing down " << doomed.size() << " session(s)";
    }
    for (auto& entry : doomed) {
        entry.second->close();
    }
}

size_t SessionRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

std::vector<std::string> SessionRegistry::ids() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> result;
    result.reserve(sessions_.size());
    for (const auto& entry : sessions_) {
        result.push_back(entry.first);
    }
    return result;
}

} // namespace neurax
