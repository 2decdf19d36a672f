#ifndef LOBBY_HPP
#define LOBBY_HPP

#include "participant.hpp"
#include "protocol.hpp"
#include "registry.hpp"
#include "sessionView.hpp"

#include <boost/asio.hpp>

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

/*
 * ============================================================================
 * LOBBY - Members, Roles and the Moves Between Them
 * ============================================================================
 *
 * A connection first lands in the Lobby as a member with no session, and the
 * Lobby moves it between stages:
 *
 *                 create_session                 join_session (other)
 *   NoSession ------------------> Hosting -------------------------> Visiting
 *       ^  |                        |  ^                                 |
 *       |  | join_session           |  |     return_to_session           |
 *       |  v                        |  +---------------------------------+
 *     Audience        go_to_menu    |
 *                <------------------+  (stage kept alive, host-away)
 *
 * A member on the menu is NoSession with an owned stage still recorded.
 *
 * Locking: the Lobby mutex guards the member table and every transition.
 * Order is Lobby -> Registry -> Stage. Commands that only touch one stage
 * (heartbeat, host actions, chat, queue) pick up the member's SessionView
 * under the Lobby lock, drop it, and then lock just that stage.
 *
 * Disconnects are not goodbyes. A member whose connection drops keeps its
 * place for the grace window; "resume" with the old id picks everything up
 * again. Only when the window runs out does a hosted stage close.
 * ============================================================================
 */

enum class Presence { NoSession, Hosting, Audience, Visiting };

const char* toString(Presence presence);

struct LobbyOptions {
    std::chrono::milliseconds memberGrace{60000};
    StageOptions stage;
};

class Lobby {
public:
    static const size_t maxDisplayNameLength = 30;

    Lobby(boost::asio::io_context& io, SessionRegistry& registry, LobbyOptions options = LobbyOptions());

    // Registers a new member and sends it "connected". Returns the member id.
    std::string connect(ParticipantPtr participant);

    // Applies one command. Rejections go back to the sender as "error".
    // Returns the member id the connection speaks for from now on, which only
    // changes after a successful resume.
    std::string handle(const std::string& memberId, const Command& command);

    // A frame arrived that did not decode into a command.
    void reportMalformed(const std::string& memberId, const std::string& message);

    // Connection closed; starts the grace window.
    void disconnect(const std::string& memberId);

    // Closes every stage and forgets every member.
    void shutdown();

    // ========================================================================
    // INSPECTION
    // ========================================================================

    Presence presenceOf(const std::string& memberId) const;
    std::string hostedSessionOf(const std::string& memberId) const;
    std::string currentSessionOf(const std::string& memberId) const;
    bool isConnected(const std::string& memberId) const;
    size_t memberCount() const;

private:
    struct MemberRecord {
        explicit MemberRecord(boost::asio::io_context& io) : graceTimer(io) {}

        std::string id;
        std::string displayName = "Anon";
        ParticipantPtr participant;
        Presence presence = Presence::NoSession;
        std::shared_ptr<SessionView> view;
        StagePtr hostedStage;
        boost::asio::steady_timer graceTimer;
        std::uint64_t generation = 0;
    };

    typedef std::shared_ptr<MemberRecord> MemberPtr;

    template <typename C>
    void on(const std::string& memberId, const C& command);

    void on(const std::string& memberId, const cmd::CreateSession& command);
    void on(const std::string& memberId, const cmd::JoinSession& command);
    void on(const std::string& memberId, const cmd::LeaveSession& command);
    void on(const std::string& memberId, const cmd::SetDisplayName& command);
    void on(const std::string& memberId, const cmd::GoToMenu& command);
    void on(const std::string& memberId, const cmd::ReturnToSession& command);
    void on(const std::string& memberId, const cmd::EndSession& command);
    std::string resume(const std::string& memberId, const cmd::Resume& command);

    // Everything below expects mutex_ to be held.
    MemberPtr requireLocked(const std::string& memberId) const;
    std::optional<SessionSummary> ownedSummaryLocked(const MemberRecord& member) const;
    void leaveVisitedLocked(MemberRecord& member);
    void toMenuLocked(MemberRecord& member);
    void returnHomeLocked(MemberRecord& member);
    void closeStageLocked(const StagePtr& stage, const std::string& reason);
    void broadcastPublicLocked();
    void sendLocked(const MemberRecord& member, const Event& event) const;
    void expireMember(const std::string& memberId, std::uint64_t generation);

    boost::asio::io_context& io_;
    SessionRegistry& registry_;
    LobbyOptions options_;

    mutable std::mutex mutex_;
    std::map<std::string, MemberPtr> members_;
};

#endif // LOBBY_HPP
