#ifndef CLIENTSTATE_HPP
#define CLIENTSTATE_HPP

#include "protocol.hpp"

#include <optional>
#include <string>
#include <utility>
#include <vector>

/*
 * ============================================================================
 * CLIENT STATE - What the Client Last Heard From the Server
 * ============================================================================
 *
 * The client never edits its copy of a session by hand. Every field here is
 * either replaced wholesale by an authoritative event (session_joined,
 * queue_updated, sync_snapshot, ...) or derived from one. apply() is the
 * only way in:
 *
 *   Event --apply()--> ClientState --read by--> UI / drift corrector
 *
 * No sockets, no timers, no locks: StageClient owns one of these and feeds
 * it in arrival order.
 * ============================================================================
 */

class ClientState {
public:
    static const size_t chatLimit = 100;

    void apply(const Event& event);

    // Drops everything tied to a session (used when a resume is refused).
    void resetSession();

    const std::string& memberId() const { return memberId_; }
    const std::string& displayName() const { return displayName_; }

    bool inSession() const { return session_.has_value(); }
    bool isHost() const;
    bool isVisiting() const;

    const std::optional<StageSnapshot>& session() const { return session_; }
    const std::optional<SessionSummary>& ownedSession() const { return ownedSession_; }
    const std::vector<MemberInfo>& members() const { return members_; }
    const std::vector<ChatMessage>& chatLog() const { return chatLog_; }
    const std::vector<SessionSummary>& publicSessions() const { return publicSessions_; }

    // The proposer's own pending suggestion, if any.
    std::optional<Suggestion> pendingSuggestion() const;

    bool needsAudioReload() const { return needsAudioReload_; }
    void clearAudioReload() { needsAudioReload_ = false; }

    const std::optional<evt::Error>& lastError() const { return lastError_; }
    const std::optional<QueueItem>& lastPlayNext() const { return lastPlayNext_; }
    const std::optional<std::pair<std::string, Decision>>& lastResolution() const { return lastResolution_; }
    const std::optional<std::string>& lastClosedReason() const { return lastClosedReason_; }

private:
    void on(const evt::Connected& e);
    void on(const evt::DisplayNameSet& e);
    void on(const evt::SessionCreated& e);
    void on(const evt::SessionJoined& e);
    void on(const evt::SessionUpdated& e);
    void on(const evt::MemberJoined& e);
    void on(const evt::MemberLeft& e);
    void on(const evt::MemberRenamed& e);
    void on(const evt::Chat& e);
    void on(const evt::SessionClosed& e);
    void on(const evt::LeftSession& e);
    void on(const evt::PublicSessions& e);
    void on(const evt::AudioSourceChanged& e);
    void on(const evt::SyncSnapshot& e);
    void on(const evt::HostAction& e);
    void on(const evt::QueueUpdated& e);
    void on(const evt::QueuePlayNext& e);
    void on(const evt::SuggestionCreated& e);
    void on(const evt::SuggestionSent& e);
    void on(const evt::SuggestionResolved& e);
    void on(const evt::WentToMenu& e);
    void on(const evt::ReturnedToSession& e);
    void on(const evt::Error& e);

    void enterSession(const StageSnapshot& session, const std::vector<MemberInfo>& members,
                      const std::vector<ChatMessage>& chatLog);
    void pushChat(const ChatMessage& message);
    void upsertSuggestion(const Suggestion& suggestion);
    void recountAudience();

    std::string memberId_;
    std::string displayName_;
    std::vector<SessionSummary> publicSessions_;

    std::optional<StageSnapshot> session_;
    std::optional<SessionSummary> ownedSession_;
    std::vector<MemberInfo> members_;
    std::vector<ChatMessage> chatLog_;
    bool needsAudioReload_ = false;

    std::optional<evt::Error> lastError_;
    std::optional<QueueItem> lastPlayNext_;
    std::optional<std::pair<std::string, Decision>> lastResolution_;
    std::optional<std::string> lastClosedReason_;
};

#endif // CLIENTSTATE_HPP
