#ifndef STAGE_HPP
#define STAGE_HPP

#include "clockSync.hpp"
#include "model.hpp"
#include "participant.hpp"
#include "playQueue.hpp"
#include "protocol.hpp"

#include <boost/asio.hpp>

#include <chrono>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

/*
 * ============================================================================
 * STAGE - The Authoritative State of One Session
 * ============================================================================
 *
 * A Stage is the only writer of its session. Every public method takes the
 * stage mutex for its whole duration, validates first, mutates second, and
 * fans the resulting events out before releasing:
 *
 *   command --> [lock] validate --throw--> (nothing changed)
 *                        |
 *                        v
 *                      mutate --> deliver() to each member --> [unlock]
 *
 * Role checks do not live here: the SessionView in front of the Stage only
 * forwards what the member's role allows.
 *
 * While the host is away (visiting, on the menu, or disconnected) the stage
 * keeps its audience ticking with a fallback heartbeat: every interval it
 * re-captures the stored snapshot at the current wall clock and broadcasts it.
 * ============================================================================
 */

struct StageOptions {
    size_t lockedHeadSize = PlayQueue::defaultLockedHeadSize;
    std::chrono::milliseconds heartbeatInterval{2000};
    size_t chatHistoryLimit = 200;
    size_t chatTrimTo = 100;
    size_t joinChatReplay = 50;
};

class Stage : public std::enable_shared_from_this<Stage> {
public:
    static const size_t maxNameLength = 50;
    static const size_t maxChatLength = 500;

    Stage(boost::asio::io_context& io, const std::string& name, const MemberInfo& host,
          ParticipantPtr hostParticipant, StageOptions options = StageOptions());

    const std::string& id() const { return id_; }
    const std::string& hostMemberId() const { return hostMemberId_; }

    // ========================================================================
    // MEMBERSHIP
    // ========================================================================

    evt::SessionCreated createdEvent() const;

    // Adds an audience member; sends session_joined to them and member_joined
    // to everyone else. Throws Forbidden for private stages.
    void join(const MemberInfo& member, ParticipantPtr participant,
              const std::optional<SessionSummary>& ownedSummary);

    evt::SessionJoined joinedEvent(const std::string& memberId,
                                   const std::optional<SessionSummary>& ownedSummary) const;

    // Removes an audience member; returns the number of members left.
    size_t leave(const std::string& memberId);

    // Connection bookkeeping for a member that dropped or came back.
    void detach(const std::string& memberId);
    void attach(const std::string& memberId, ParticipantPtr participant);

    void renameMember(const std::string& memberId, const std::string& newName);

    // Host left the stage screen without ending it; starts the fallback heartbeat.
    void hostStepAway();

    // Host is back; stops the fallback heartbeat and returns the full state.
    evt::ReturnedToSession hostReturn(ParticipantPtr participant, bool needsAudioReload);

    // Sends session_closed to every member and stops all timers.
    void close(const std::string& reason);

    // ========================================================================
    // HOST COMMANDS
    // ========================================================================

    void rename(const std::string& name);
    void togglePublic();
    void updateNowPlaying(const json& track);
    void setAudioSource(const AudioSource& source, const json& analysisResult);
    void heartbeat(const cmd::SyncHeartbeat& heartbeat);
    void hostAction(const cmd::HostAction& action);

    void queueAdd(const std::string& memberId, const TrackRequest& track);
    void queueRemove(const std::string& itemId);
    void queueReorder(const std::vector<std::string>& tailOrder);
    void queueAdvance();
    void queueUpdateItem(const std::string& itemId, QueueStatus status, const json& analysisResult);
    void respondSuggestion(const std::string& suggestionId, Decision decision);

    // ========================================================================
    // AUDIENCE / SHARED COMMANDS
    // ========================================================================

    void suggest(const std::string& memberId, const TrackRequest& track);
    void chat(const std::string& memberId, const std::string& text);

    // ========================================================================
    // READ ACCESS
    // ========================================================================

    SessionSummary summary() const;
    StageSnapshot snapshot() const;
    std::vector<MemberInfo> members() const;
    std::vector<ChatMessage> chatLog() const;
    PlaybackSnapshot playback() const;
    bool isPublic() const;
    bool isClosed() const;
    bool isHostPresent() const;
    bool hasMember(const std::string& memberId) const;

private:
    struct MemberEntry {
        MemberInfo info;
        ParticipantPtr participant;
    };

    // Everything below expects mutex_ to be held.
    void ensureOpen() const;
    MemberEntry* findMember(const std::string& memberId);
    const MemberEntry* findMember(const std::string& memberId) const;
    SessionSummary summaryLocked() const;
    StageSnapshot snapshotLocked() const;
    std::vector<MemberInfo> membersLocked() const;
    std::vector<ChatMessage> recentChatLocked() const;
    std::optional<double> durationLocked() const;
    PlaybackSnapshot currentPlaybackLocked() const;
    ChatMessage appendChatLocked(const std::string& memberId, const std::string& displayName,
                                 const std::string& text, bool isSystem);
    void broadcastLocked(const Event& event, const std::string& excludeId = std::string());
    void sendToLocked(const std::string& memberId, const Event& event);
    void broadcastQueueLocked();
    void broadcastPlayNextLocked(const QueueItem& item);
    void scheduleFallbackLocked();
    void onFallbackTick(const boost::system::error_code& ec);

    mutable std::mutex mutex_;
    boost::asio::steady_timer heartbeatTimer_;
    StageOptions options_;

    std::string id_;
    std::string name_;
    std::string hostMemberId_;
    bool isPublic_;
    std::int64_t createdAt_;
    bool hostPresent_;
    bool closed_;

    PlaybackSnapshot playback_;
    VisualizerSnapshot visualizer_;
    std::optional<AudioSource> audioSource_;
    json analysisResult_;
    json nowPlaying_;

    PlayQueue queue_;
    std::deque<ChatMessage> chatLog_;
    std::vector<MemberEntry> members_;
};

typedef std::shared_ptr<Stage> StagePtr;

#endif // STAGE_HPP
