#include "registry.hpp"
#include "errors.hpp"

#include <algorithm>

void SessionRegistry::add(const StagePtr& stage) {
    std::lock_guard<std::mutex> lock(mutex_);
    stages_[stage->id()] = stage;
}

StagePtr SessionRegistry::find(const std::string& sessionId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = stages_.find(sessionId);
    return it == stages_.end() ? StagePtr() : it->second;
}

StagePtr SessionRegistry::require(const std::string& sessionId) const {
    StagePtr stage = find(sessionId);
    if (!stage) {
        throw StageError(ErrorKind::NotFound, "Session not found");
    }
    return stage;
}

bool SessionRegistry::remove(const std::string& sessionId) {
    std::lock_guard<std::mutex> lock(mutex_);
    return stages_.erase(sessionId) > 0;
}

std::vector<SessionSummary> SessionRegistry::publicSessions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<SessionSummary> list;
    for (const auto& entry : stages_) {
        SessionSummary summary = entry.second->summary();
        if (summary.isPublic) {
            list.push_back(summary);
        }
    }
    std::sort(list.begin(), list.end(), [](const SessionSummary& a, const SessionSummary& b) {
        return a.createdAt < b.createdAt;
    });
    return list;
}

size_t SessionRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stages_.size();
}

void SessionRegistry::closeAll(const std::string& reason) {
    std::map<std::string, StagePtr> stages;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stages.swap(stages_);
    }
    for (auto& entry : stages) {
        entry.second->close(reason);
    }
}
