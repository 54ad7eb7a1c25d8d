#pragma once

#include "session.h"
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace neurax {

// Live sessions on one compute node, keyed by session id. Absent ids are
// normal (late signaling for a finished session) and never an error.
class SessionRegistry {
public:
    // false if the id is already taken
    bool insert(const std::shared_ptr<Session>& session);

    std::shared_ptr<Session> lookup(const std::string& session_id) const;

    // No-op for absent ids
    void remove(const std::string& session_id);

    // Tear down every session; used when the relay connection drops
    void clear();

    size_t size() const;
    std::vector<std::string> ids() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<Session>> sessions_;
};

} // namespace neurax
