#pragma once

#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "TransferEngine.h"

namespace GlobalSend {

/**
 * @brief Owns the TransferEngine of every open session.
 *
 * Each session gets its own engine and therefore its own keys and
 * counters. Closing a session wipes its keys and destroys the engine.
 */
class SessionRegistry {
public:
    SessionRegistry() = default;
    ~SessionRegistry();

    SessionRegistry(const SessionRegistry&) = delete;
    SessionRegistry& operator=(const SessionRegistry&) = delete;

    /**
     * @brief Create the engine for a new session.
     * @throws GlobalSendError (INVALID_ARGUMENT) if sessionId is already open
     */
    TransferEngine& open(const std::string& sessionId, IChannel& channel,
                         const std::vector<uint8_t>& sharedSecret, SessionRole role,
                         const EngineOptions& options = {});

    /// Engine of an open session, or nullptr.
    TransferEngine* find(const std::string& sessionId);

    /// @return false if no such session was open
    bool close(const std::string& sessionId);

    void closeAll();

    bool contains(const std::string& sessionId) const;
    size_t size() const;
    std::vector<std::string> sessionIds() const;

private:
    std::map<std::string, std::unique_ptr<TransferEngine>> sessions_;
    mutable std::mutex mutex_;
};

} // namespace GlobalSend
