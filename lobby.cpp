#include "lobby.hpp"
#include "errors.hpp"

#include <iostream>
#include <type_traits>

namespace {

// Commands that only need the member's view of its current stage.
void applyView(SessionView& view, const cmd::RenameSession& command) { view.rename(command.name); }
void applyView(SessionView& view, const cmd::TogglePublic&) { view.togglePublic(); }
void applyView(SessionView& view, const cmd::UpdateNowPlaying& command) { view.updateNowPlaying(command.track); }
void applyView(SessionView& view, const cmd::Chat& command) { view.chat(command.text); }

void applyView(SessionView& view, const cmd::SetAudioSource& command) {
    view.setAudioSource(command.audioSource, command.analysisResult);
}

void applyView(SessionView& view, const cmd::SyncHeartbeat& command) { view.heartbeat(command); }
void applyView(SessionView& view, const cmd::HostAction& command) { view.hostAction(command); }
void applyView(SessionView& view, const cmd::QueueAdd& command) { view.queueAdd(command.track); }
void applyView(SessionView& view, const cmd::QueueRemove& command) { view.queueRemove(command.itemId); }
void applyView(SessionView& view, const cmd::QueueReorder& command) { view.queueReorder(command.tailOrder); }
void applyView(SessionView& view, const cmd::QueueAdvance&) { view.queueAdvance(); }

void applyView(SessionView& view, const cmd::QueueUpdateItem& command) {
    view.queueUpdateItem(command.itemId, command.status, command.analysisResult);
}

void applyView(SessionView& view, const cmd::SuggestSong& command) { view.suggestSong(command.track); }

void applyView(SessionView& view, const cmd::RespondSuggestion& command) {
    view.respondSuggestion(command.suggestionId, command.decision);
}

// Rows of the public directory depend on these.
template <typename C>
bool changesDirectory(const C&) { return false; }
bool changesDirectory(const cmd::RenameSession&) { return true; }
bool changesDirectory(const cmd::TogglePublic&) { return true; }
bool changesDirectory(const cmd::UpdateNowPlaying&) { return true; }

}  // namespace

const char* toString(Presence presence) {
    switch (presence) {
    case Presence::NoSession:
        return "no_session";
    case Presence::Hosting:
        return "hosting";
    case Presence::Audience:
        return "audience";
    case Presence::Visiting:
        return "visiting";
    }
    return "no_session";
}

Lobby::Lobby(boost::asio::io_context& io, SessionRegistry& registry, LobbyOptions options)
    : io_(io), registry_(registry), options_(options) {}

// ============================================================================
// CONNECTION LIFECYCLE
// ============================================================================

std::string Lobby::connect(ParticipantPtr participant) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto member = std::make_shared<MemberRecord>(io_);
    member->id = newId();
    member->participant = participant;
    members_[member->id] = member;

    sendLocked(*member, evt::Connected{member->id, registry_.publicSessions()});
    std::cout << "Member " << member->id << " connected" << std::endl;
    return member->id;
}

std::string Lobby::handle(const std::string& memberId, const Command& command) {
    std::string speaker = memberId;
    try {
        std::visit([&](const auto& c) {
            using T = std::decay_t<decltype(c)>;
            if constexpr (std::is_same<T, cmd::Resume>::value) {
                speaker = resume(memberId, c);
            } else {
                on(memberId, c);
            }
        }, command);
    } catch (const StageError& e) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = members_.find(memberId);
        if (it != members_.end()) {
            sendLocked(*it->second, evt::Error{errorCode(e.kind()), e.what()});
        }
    }
    return speaker;
}

void Lobby::reportMalformed(const std::string& memberId, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = members_.find(memberId);
    if (it != members_.end()) {
        sendLocked(*it->second, evt::Error{errorCode(ErrorKind::InvalidArgument), message});
    }
}

void Lobby::disconnect(const std::string& memberId) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = members_.find(memberId);
    if (it == members_.end() || !it->second->participant) {
        return;
    }
    MemberPtr member = it->second;
    member->participant.reset();

    if (!member->view && !member->hostedStage) {
        members_.erase(it);
        std::cout << "Member " << memberId << " disconnected" << std::endl;
        return;
    }

    if (member->presence == Presence::Hosting) {
        member->hostedStage->hostStepAway();
    } else if (member->view) {
        member->view->stage()->detach(member->id);
    }

    std::uint64_t generation = ++member->generation;
    member->graceTimer.expires_after(options_.memberGrace);
    member->graceTimer.async_wait([this, memberId, generation](const boost::system::error_code& ec) {
        if (ec == boost::asio::error::operation_aborted) {
            return;
        }
        expireMember(memberId, generation);
    });
    std::cout << "Member " << memberId << " dropped, holding their place for "
              << options_.memberGrace.count() << " ms" << std::endl;
}

void Lobby::expireMember(const std::string& memberId, std::uint64_t generation) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = members_.find(memberId);
    if (it == members_.end()) {
        return;
    }
    MemberPtr member = it->second;
    if (member->generation != generation || member->participant) {
        return;
    }

    if (member->view && member->presence != Presence::Hosting) {
        member->view->stage()->leave(member->id);
    }
    if (member->hostedStage) {
        closeStageLocked(member->hostedStage, "Host disconnected");
    }
    members_.erase(memberId);
    std::cout << "Member " << memberId << " did not come back, removed" << std::endl;
    broadcastPublicLocked();
}

void Lobby::shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& entry : members_) {
        entry.second->graceTimer.cancel();
    }
    members_.clear();
    registry_.closeAll("Server shutting down");
}

// ============================================================================
// COMMANDS ON THE CURRENT STAGE
// ============================================================================

template <typename C>
void Lobby::on(const std::string& memberId, const C& command) {
    std::shared_ptr<SessionView> view;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        view = requireLocked(memberId)->view;
    }
    if (!view) {
        throw StageError(ErrorKind::NotFound, "Not in a session");
    }

    // Lobby lock released: only the stage is locked from here on.
    applyView(*view, command);

    if (changesDirectory(command)) {
        std::lock_guard<std::mutex> lock(mutex_);
        broadcastPublicLocked();
    }
}

// ============================================================================
// TRANSITIONS
// ============================================================================

void Lobby::on(const std::string& memberId, const cmd::CreateSession& command) {
    std::lock_guard<std::mutex> lock(mutex_);
    MemberPtr member = requireLocked(memberId);

    std::string name = trimText(command.name, Stage::maxNameLength);
    if (name.empty()) {
        name = trimText(member->displayName + "'s Stage", Stage::maxNameLength);
    }

    leaveVisitedLocked(*member);
    if (member->hostedStage) {
        closeStageLocked(member->hostedStage, "Host started a new session");
    }

    MemberInfo host;
    host.id = member->id;
    host.displayName = member->displayName;
    host.role = Role::Host;
    auto stage = std::make_shared<Stage>(io_, name, host, member->participant, options_.stage);
    registry_.add(stage);

    member->hostedStage = stage;
    member->view = std::make_shared<HostSessionView>(stage, member->id);
    member->presence = Presence::Hosting;

    sendLocked(*member, stage->createdEvent());
    std::cout << member->displayName << " (" << member->id << ") opened stage "
              << stage->id() << " \"" << name << "\"" << std::endl;
    broadcastPublicLocked();
}

void Lobby::on(const std::string& memberId, const cmd::JoinSession& command) {
    std::lock_guard<std::mutex> lock(mutex_);
    MemberPtr member = requireLocked(memberId);
    StagePtr stage = registry_.require(command.sessionId);

    if (stage == member->hostedStage) {
        returnHomeLocked(*member);
        return;
    }
    if (member->view && member->view->stage() == stage) {
        sendLocked(*member, stage->joinedEvent(member->id, ownedSummaryLocked(*member)));
        return;
    }
    if (!stage->isPublic()) {
        throw StageError(ErrorKind::Forbidden, "Session is private");
    }

    leaveVisitedLocked(*member);
    if (member->presence == Presence::Hosting) {
        member->hostedStage->hostStepAway();
        member->view.reset();
    }

    MemberInfo info;
    info.id = member->id;
    info.displayName = member->displayName;
    info.role = Role::Audience;
    stage->join(info, member->participant, ownedSummaryLocked(*member));

    member->view = std::make_shared<AudienceSessionView>(stage, member->id);
    member->presence = member->hostedStage ? Presence::Visiting : Presence::Audience;
    std::cout << member->displayName << " (" << member->id << ") joined stage " << stage->id()
              << " as " << toString(member->presence) << std::endl;
    broadcastPublicLocked();
}

void Lobby::on(const std::string& memberId, const cmd::LeaveSession&) {
    std::lock_guard<std::mutex> lock(mutex_);
    MemberPtr member = requireLocked(memberId);

    switch (member->presence) {
    case Presence::Audience:
        leaveVisitedLocked(*member);
        sendLocked(*member, evt::LeftSession{});
        broadcastPublicLocked();
        break;
    case Presence::Hosting:
    case Presence::Visiting:
        toMenuLocked(*member);
        break;
    case Presence::NoSession:
        if (!member->hostedStage) {
            throw StageError(ErrorKind::NotFound, "Not in a session");
        }
        toMenuLocked(*member);
        break;
    }
}

void Lobby::on(const std::string& memberId, const cmd::SetDisplayName& command) {
    std::lock_guard<std::mutex> lock(mutex_);
    MemberPtr member = requireLocked(memberId);

    std::string name = trimText(command.name, maxDisplayNameLength);
    if (name.empty()) {
        name = "Anon";
    }
    member->displayName = name;
    sendLocked(*member, evt::DisplayNameSet{name});

    if (member->view) {
        member->view->stage()->renameMember(member->id, name);
    }
    if (member->hostedStage && (!member->view || member->view->stage() != member->hostedStage)) {
        member->hostedStage->renameMember(member->id, name);
    }
    if (member->hostedStage) {
        broadcastPublicLocked();
    }
}

void Lobby::on(const std::string& memberId, const cmd::GoToMenu&) {
    std::lock_guard<std::mutex> lock(mutex_);
    MemberPtr member = requireLocked(memberId);

    if (member->presence == Presence::Audience) {
        leaveVisitedLocked(*member);
        sendLocked(*member, evt::LeftSession{});
        broadcastPublicLocked();
        return;
    }
    toMenuLocked(*member);
}

void Lobby::on(const std::string& memberId, const cmd::ReturnToSession&) {
    std::lock_guard<std::mutex> lock(mutex_);
    MemberPtr member = requireLocked(memberId);
    returnHomeLocked(*member);
}

void Lobby::on(const std::string& memberId, const cmd::EndSession&) {
    std::lock_guard<std::mutex> lock(mutex_);
    MemberPtr member = requireLocked(memberId);

    if (!member->hostedStage) {
        if (member->presence == Presence::Audience) {
            throw StageError(ErrorKind::Forbidden, "Only the host can end the session");
        }
        throw StageError(ErrorKind::NotFound, "No session to end");
    }
    StagePtr stage = member->hostedStage;
    closeStageLocked(stage, "Host ended the session");
    std::cout << member->displayName << " (" << member->id << ") ended stage " << stage->id() << std::endl;
    broadcastPublicLocked();
}

std::string Lobby::resume(const std::string& memberId, const cmd::Resume& command) {
    std::lock_guard<std::mutex> lock(mutex_);
    MemberPtr current = requireLocked(memberId);

    if (command.memberId == memberId) {
        throw StageError(ErrorKind::InvalidArgument, "Already connected as that member");
    }
    auto it = members_.find(command.memberId);
    if (it == members_.end()) {
        throw StageError(ErrorKind::NotFound, "Member is unknown or has expired");
    }
    MemberPtr previous = it->second;
    if (previous->participant) {
        throw StageError(ErrorKind::Forbidden, "Member is still connected");
    }
    if (current->view || current->hostedStage) {
        throw StageError(ErrorKind::InvalidArgument, "Resume must come before any session command");
    }

    // The connection now speaks for the old identity; its fresh one goes away.
    previous->participant = current->participant;
    ++previous->generation;
    previous->graceTimer.cancel();
    current->graceTimer.cancel();
    members_.erase(memberId);

    if (current->displayName != "Anon" && current->displayName != previous->displayName) {
        previous->displayName = current->displayName;
        if (previous->view) {
            previous->view->stage()->renameMember(previous->id, previous->displayName);
        }
        if (previous->hostedStage && (!previous->view || previous->view->stage() != previous->hostedStage)) {
            previous->hostedStage->renameMember(previous->id, previous->displayName);
        }
    }

    sendLocked(*previous, evt::Connected{previous->id, registry_.publicSessions()});

    switch (previous->presence) {
    case Presence::Hosting:
        sendLocked(*previous, previous->hostedStage->hostReturn(previous->participant, true));
        break;
    case Presence::Audience:
    case Presence::Visiting: {
        const StagePtr& stage = previous->view->stage();
        stage->attach(previous->id, previous->participant);
        sendLocked(*previous, stage->joinedEvent(previous->id, ownedSummaryLocked(*previous)));
        break;
    }
    case Presence::NoSession:
        if (previous->hostedStage) {
            sendLocked(*previous, evt::WentToMenu{ownedSummaryLocked(*previous)});
        }
        break;
    }

    std::cout << "Member " << previous->id << " resumed as " << toString(previous->presence) << std::endl;
    return previous->id;
}

// ============================================================================
// INSPECTION
// ============================================================================

Presence Lobby::presenceOf(const std::string& memberId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return requireLocked(memberId)->presence;
}

std::string Lobby::hostedSessionOf(const std::string& memberId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    MemberPtr member = requireLocked(memberId);
    return member->hostedStage ? member->hostedStage->id() : std::string();
}

std::string Lobby::currentSessionOf(const std::string& memberId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    MemberPtr member = requireLocked(memberId);
    return member->view ? member->view->stage()->id() : std::string();
}

bool Lobby::isConnected(const std::string& memberId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = members_.find(memberId);
    return it != members_.end() && it->second->participant != nullptr;
}

size_t Lobby::memberCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return members_.size();
}

// ============================================================================
// INTERNALS (mutex_ held)
// ============================================================================

Lobby::MemberPtr Lobby::requireLocked(const std::string& memberId) const {
    auto it = members_.find(memberId);
    if (it == members_.end()) {
        throw StageError(ErrorKind::NotFound, "Unknown member");
    }
    return it->second;
}

std::optional<SessionSummary> Lobby::ownedSummaryLocked(const MemberRecord& member) const {
    if (member.hostedStage) {
        return member.hostedStage->summary();
    }
    return std::nullopt;
}

// Drops the member from the stage it sits in as audience, if any.
void Lobby::leaveVisitedLocked(MemberRecord& member) {
    if (member.presence != Presence::Audience && member.presence != Presence::Visiting) {
        return;
    }
    if (member.view) {
        member.view->stage()->leave(member.id);
        member.view.reset();
    }
    member.presence = Presence::NoSession;
}

void Lobby::toMenuLocked(MemberRecord& member) {
    if (member.presence == Presence::Hosting) {
        member.hostedStage->hostStepAway();
        member.view.reset();
    } else if (member.presence == Presence::Visiting) {
        leaveVisitedLocked(member);
    }
    member.presence = Presence::NoSession;
    sendLocked(member, evt::WentToMenu{ownedSummaryLocked(member)});
    broadcastPublicLocked();
}

void Lobby::returnHomeLocked(MemberRecord& member) {
    if (!member.hostedStage) {
        throw StageError(ErrorKind::NotFound, "No session to return to");
    }
    bool wasAway = member.presence != Presence::Hosting;
    leaveVisitedLocked(member);

    evt::ReturnedToSession event = member.hostedStage->hostReturn(member.participant, wasAway);
    member.view = std::make_shared<HostSessionView>(member.hostedStage, member.id);
    member.presence = Presence::Hosting;
    sendLocked(member, event);
    broadcastPublicLocked();
}

void Lobby::closeStageLocked(const StagePtr& stage, const std::string& reason) {
    registry_.remove(stage->id());

    for (auto& entry : members_) {
        MemberRecord& member = *entry.second;
        if (member.hostedStage == stage) {
            bool attached = member.presence == Presence::Hosting;
            member.hostedStage.reset();
            if (member.presence == Presence::Hosting) {
                member.view.reset();
                member.presence = Presence::NoSession;
            } else if (member.presence == Presence::Visiting) {
                member.presence = Presence::Audience;
            }
            // A host that is not on the stage will not hear the broadcast.
            if (!attached) {
                sendLocked(member, evt::SessionClosed{stage->id(), reason});
            }
        } else if (member.view && member.view->stage() == stage) {
            member.view.reset();
            member.presence = Presence::NoSession;
        }
    }

    stage->close(reason);
}

void Lobby::broadcastPublicLocked() {
    evt::PublicSessions event{registry_.publicSessions()};
    for (const auto& entry : members_) {
        sendLocked(*entry.second, event);
    }
}

void Lobby::sendLocked(const MemberRecord& member, const Event& event) const {
    if (member.participant) {
        member.participant->deliver(event);
    }
}
