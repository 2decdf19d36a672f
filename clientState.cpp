#include "clientState.hpp"
#include "clockSync.hpp"

#include <algorithm>

void ClientState::apply(const Event& event) {
    std::visit([this](const auto& e) { on(e); }, event);
}

void ClientState::resetSession() {
    session_.reset();
    ownedSession_.reset();
    members_.clear();
    chatLog_.clear();
    needsAudioReload_ = false;
}

bool ClientState::isHost() const {
    return session_ && session_->summary.hostId == memberId_;
}

bool ClientState::isVisiting() const {
    return session_ && !isHost() && ownedSession_.has_value();
}

std::optional<Suggestion> ClientState::pendingSuggestion() const {
    if (!session_) {
        return std::nullopt;
    }
    for (const auto& suggestion : session_->suggestions) {
        if (suggestion.proposerMemberId == memberId_ && suggestion.status == SuggestionStatus::Pending) {
            return suggestion;
        }
    }
    return std::nullopt;
}

// ============================================================================
// LOBBY LEVEL
// ============================================================================

void ClientState::on(const evt::Connected& e) {
    memberId_ = e.memberId;
    publicSessions_ = e.publicSessions;
}

void ClientState::on(const evt::DisplayNameSet& e) {
    displayName_ = e.name;
}

void ClientState::on(const evt::PublicSessions& e) {
    publicSessions_ = e.list;
}

void ClientState::on(const evt::Error& e) {
    lastError_ = e;
}

// ============================================================================
// ENTERING AND LEAVING
// ============================================================================

void ClientState::on(const evt::SessionCreated& e) {
    enterSession(e.session, e.members, std::vector<ChatMessage>());
    ownedSession_ = e.session.summary;
    lastClosedReason_.reset();
}

void ClientState::on(const evt::SessionJoined& e) {
    enterSession(e.session, e.members, e.chatLog);
    ownedSession_ = e.ownedSessionSummary;
    lastClosedReason_.reset();
}

void ClientState::on(const evt::ReturnedToSession& e) {
    enterSession(e.session, e.members, e.chatLog);
    ownedSession_ = e.session.summary;
    needsAudioReload_ = e.needsAudioReload;
}

void ClientState::on(const evt::WentToMenu& e) {
    session_.reset();
    members_.clear();
    chatLog_.clear();
    ownedSession_ = e.ownedSessionSummary;
}

void ClientState::on(const evt::LeftSession&) {
    session_.reset();
    members_.clear();
    chatLog_.clear();
}

void ClientState::on(const evt::SessionClosed& e) {
    if (session_ && session_->summary.id == e.sessionId) {
        session_.reset();
        members_.clear();
        chatLog_.clear();
        needsAudioReload_ = false;
    }
    if (ownedSession_ && ownedSession_->id == e.sessionId) {
        ownedSession_.reset();
    }
    lastClosedReason_ = e.reason;
}

// ============================================================================
// SESSION CONTENTS
// ============================================================================

void ClientState::on(const evt::SessionUpdated& e) {
    if (session_ && session_->summary.id == e.session.id) {
        session_->summary = e.session;
    }
    if (ownedSession_ && ownedSession_->id == e.session.id) {
        ownedSession_ = e.session;
    }
}

void ClientState::on(const evt::MemberJoined& e) {
    members_ = e.members;
    pushChat(e.systemMessage);
    recountAudience();
}

void ClientState::on(const evt::MemberLeft& e) {
    members_ = e.members;
    pushChat(e.systemMessage);
    recountAudience();
}

void ClientState::on(const evt::MemberRenamed& e) {
    members_ = e.members;
    if (e.memberId == memberId_) {
        displayName_ = e.newName;
    }
    if (session_ && session_->summary.hostId == e.memberId) {
        session_->summary.hostName = e.newName;
    }
}

void ClientState::on(const evt::Chat& e) {
    pushChat(e.message);
}

void ClientState::on(const evt::AudioSourceChanged& e) {
    if (!session_) {
        return;
    }
    session_->audioSource = e.audioSource;
    session_->analysisResult = e.analysisResult;
    // Same reset the stage applied: new track, paused at zero.
    session_->playback.positionSeconds = 0.0;
    session_->playback.isPlaying = false;
    session_->playback.capturedAt = wallClockMillis();
}

void ClientState::on(const evt::SyncSnapshot& e) {
    if (session_) {
        session_->playback = e.snapshot;
    }
}

// Transport kinds are followed by a sync_snapshot, which carries the result.
void ClientState::on(const evt::HostAction& e) {
    if (session_ && !isTransportAction(e.kind)) {
        applyVisualizerAction(e.kind, e.payload, session_->visualizer);
    }
}

void ClientState::on(const evt::QueueUpdated& e) {
    if (!session_) {
        return;
    }
    session_->queue = e.queue;
    session_->suggestions = e.suggestions;
    session_->history = e.history;
}

void ClientState::on(const evt::QueuePlayNext& e) {
    lastPlayNext_ = e.item;
}

void ClientState::on(const evt::SuggestionCreated& e) {
    upsertSuggestion(e.suggestion);
}

void ClientState::on(const evt::SuggestionSent& e) {
    upsertSuggestion(e.suggestion);
}

void ClientState::on(const evt::SuggestionResolved& e) {
    lastResolution_ = std::make_pair(e.suggestionId, e.decision);
    if (!session_) {
        return;
    }
    auto& suggestions = session_->suggestions;
    suggestions.erase(std::remove_if(suggestions.begin(), suggestions.end(),
                                     [&](const Suggestion& s) { return s.id == e.suggestionId; }),
                      suggestions.end());
}

// ============================================================================
// HELPERS
// ============================================================================

void ClientState::enterSession(const StageSnapshot& session, const std::vector<MemberInfo>& members,
                               const std::vector<ChatMessage>& chatLog) {
    session_ = session;
    members_ = members;
    chatLog_ = chatLog;
    if (chatLog_.size() > chatLimit) {
        chatLog_.erase(chatLog_.begin(), chatLog_.end() - static_cast<std::ptrdiff_t>(chatLimit));
    }
    needsAudioReload_ = false;
}

void ClientState::pushChat(const ChatMessage& message) {
    if (!session_) {
        return;
    }
    chatLog_.push_back(message);
    if (chatLog_.size() > chatLimit) {
        chatLog_.erase(chatLog_.begin());
    }
}

void ClientState::upsertSuggestion(const Suggestion& suggestion) {
    if (!session_) {
        return;
    }
    for (auto& existing : session_->suggestions) {
        if (existing.id == suggestion.id) {
            existing = suggestion;
            return;
        }
    }
    session_->suggestions.push_back(suggestion);
}

void ClientState::recountAudience() {
    if (!session_) {
        return;
    }
    session_->summary.audienceCount = static_cast<size_t>(
        std::count_if(members_.begin(), members_.end(),
                      [](const MemberInfo& member) { return member.role == Role::Audience; }));
}
