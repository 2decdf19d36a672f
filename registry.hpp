#ifndef REGISTRY_HPP
#define REGISTRY_HPP

#include "stage.hpp"

#include <map>
#include <mutex>
#include <string>
#include <vector>

/*
 * SessionRegistry - every live Stage by id. Created once in main and handed
 * to the Lobby and the directory endpoint; there is no global table.
 * Lock order is Registry -> Stage: the registry lock is never taken from
 * inside a stage.
 */
class SessionRegistry {
public:
    void add(const StagePtr& stage);

    // nullptr when unknown.
    StagePtr find(const std::string& sessionId) const;

    // Throws NotFound when unknown.
    StagePtr require(const std::string& sessionId) const;

    bool remove(const std::string& sessionId);

    // Public stages only, oldest first.
    std::vector<SessionSummary> publicSessions() const;

    size_t size() const;

    void closeAll(const std::string& reason);

private:
    mutable std::mutex mutex_;
    std::map<std::string, StagePtr> stages_;
};

#endif // REGISTRY_HPP
