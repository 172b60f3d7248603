#include "SessionRegistry.h"

#include "Exceptions.h"
#include "Logger.h"
#include "LoggerMacros.h"

namespace GlobalSend {

SessionRegistry::~SessionRegistry() {
    closeAll();
}

TransferEngine& SessionRegistry::open(const std::string& sessionId, IChannel& channel,
                                      const std::vector<uint8_t>& sharedSecret, SessionRole role,
                                      const EngineOptions& options) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (sessions_.count(sessionId) != 0) {
        throw GlobalSendError(ErrorCode::INVALID_ARGUMENT, "Session " + sessionId + " is already open");
    }

    // Session id doubles as the HKDF salt.
    const std::vector<uint8_t> salt(sessionId.begin(), sessionId.end());
    auto engine = std::make_unique<TransferEngine>(channel, sharedSecret, role, options, salt);
    TransferEngine& ref = *engine;
    sessions_.emplace(sessionId, std::move(engine));

    LOG_DEBUG_COMP_IF("Opened session " + sessionId, "SessionRegistry");
    return ref;
}

TransferEngine* SessionRegistry::find(const std::string& sessionId) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(sessionId);
    return it == sessions_.end() ? nullptr : it->second.get();
}

bool SessionRegistry::close(const std::string& sessionId) {
    std::unique_ptr<TransferEngine> engine;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(sessionId);
        if (it == sessions_.end()) {
            return false;
        }
        engine = std::move(it->second);
        sessions_.erase(it);
    }
    engine->close();
    LOG_DEBUG_COMP_IF("Closed session " + sessionId, "SessionRegistry");
    return true;
}

void SessionRegistry::closeAll() {
    std::map<std::string, std::unique_ptr<TransferEngine>> sessions;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        sessions.swap(sessions_);
    }
    for (auto& entry : sessions) {
        entry.second->close();
    }
}

bool SessionRegistry::contains(const std::string& sessionId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.count(sessionId) != 0;
}

size_t SessionRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

std::vector<std::string> SessionRegistry::sessionIds() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    for (const auto& entry : sessions_) {
        ids.push_back(entry.first);
    }
    return ids;
}

} // namespace GlobalSend
