#include "stage.hpp"
#include "errors.hpp"

#include <algorithm>
#include <iostream>

Stage::Stage(boost::asio::io_context& io, const std::string& name, const MemberInfo& host,
             ParticipantPtr hostParticipant, StageOptions options)
    : heartbeatTimer_(io),
      options_(options),
      id_(newId()),
      name_(name),
      hostMemberId_(host.id),
      isPublic_(false),
      createdAt_(wallClockMillis()),
      hostPresent_(true),
      closed_(false),
      queue_(options.lockedHeadSize) {
    playback_.capturedAt = createdAt_;

    MemberEntry entry;
    entry.info = host;
    entry.info.role = Role::Host;
    entry.info.connected = hostParticipant != nullptr;
    entry.participant = hostParticipant;
    members_.push_back(entry);
}

// ============================================================================
// MEMBERSHIP
// ============================================================================

evt::SessionCreated Stage::createdEvent() const {
    std::lock_guard<std::mutex> lock(mutex_);
    evt::SessionCreated event;
    event.session = snapshotLocked();
    event.members = membersLocked();
    return event;
}

void Stage::join(const MemberInfo& member, ParticipantPtr participant,
                 const std::optional<SessionSummary>& ownedSummary) {
    std::lock_guard<std::mutex> lock(mutex_);
    ensureOpen();
    if (member.id == hostMemberId_) {
        throw StageError(ErrorKind::InvalidArgument, "The host returns with return_to_session");
    }
    if (!isPublic_) {
        throw StageError(ErrorKind::Forbidden, "Session is private");
    }

    if (MemberEntry* existing = findMember(member.id)) {
        existing->participant = participant;
        existing->info.connected = true;
    } else {
        MemberEntry entry;
        entry.info = member;
        entry.info.role = Role::Audience;
        entry.info.connected = true;
        entry.participant = participant;
        members_.push_back(entry);
    }

    ChatMessage notice = appendChatLocked("system", "System",
                                          member.displayName + " joined the stage", true);

    evt::SessionJoined joined;
    joined.session = snapshotLocked();
    joined.members = membersLocked();
    joined.chatLog = recentChatLocked();
    joined.ownedSessionSummary = ownedSummary;
    sendToLocked(member.id, joined);

    evt::MemberJoined announce;
    announce.members = joined.members;
    announce.systemMessage = notice;
    broadcastLocked(announce, member.id);
}

evt::SessionJoined Stage::joinedEvent(const std::string& memberId,
                                      const std::optional<SessionSummary>& ownedSummary) const {
    std::lock_guard<std::mutex> lock(mutex_);
    ensureOpen();
    if (!findMember(memberId)) {
        throw StageError(ErrorKind::NotFound, "Not a member of this session");
    }
    evt::SessionJoined joined;
    joined.session = snapshotLocked();
    joined.members = membersLocked();
    joined.chatLog = recentChatLocked();
    joined.ownedSessionSummary = ownedSummary;
    return joined;
}

size_t Stage::leave(const std::string& memberId) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(members_.begin(), members_.end(),
                           [&](const MemberEntry& entry) { return entry.info.id == memberId; });
    if (it == members_.end()) {
        return members_.size();
    }
    std::string displayName = it->info.displayName;
    members_.erase(it);

    if (!closed_ && !members_.empty()) {
        evt::MemberLeft announce;
        announce.systemMessage = appendChatLocked("system", "System",
                                                  displayName + " left the stage", true);
        announce.members = membersLocked();
        broadcastLocked(announce);
    }
    return members_.size();
}

void Stage::detach(const std::string& memberId) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (MemberEntry* entry = findMember(memberId)) {
        entry->participant.reset();
        entry->info.connected = false;
    }
}

void Stage::attach(const std::string& memberId, ParticipantPtr participant) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (MemberEntry* entry = findMember(memberId)) {
        entry->participant = participant;
        entry->info.connected = true;
    }
}

void Stage::renameMember(const std::string& memberId, const std::string& newName) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
        return;
    }
    MemberEntry* entry = findMember(memberId);
    if (!entry || entry->info.displayName == newName) {
        return;
    }
    evt::MemberRenamed renamed;
    renamed.memberId = memberId;
    renamed.oldName = entry->info.displayName;
    renamed.newName = newName;
    entry->info.displayName = newName;
    renamed.members = membersLocked();
    broadcastLocked(renamed);
}

void Stage::hostStepAway() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_ || !hostPresent_) {
        return;
    }
    // Freeze the host's last word as of now, then keep it moving ourselves.
    playback_ = currentPlaybackLocked();
    hostPresent_ = false;
    if (MemberEntry* host = findMember(hostMemberId_)) {
        host->participant.reset();
        host->info.connected = false;
    }
    scheduleFallbackLocked();
}

evt::ReturnedToSession Stage::hostReturn(ParticipantPtr participant, bool needsAudioReload) {
    std::lock_guard<std::mutex> lock(mutex_);
    ensureOpen();
    heartbeatTimer_.cancel();
    if (!hostPresent_) {
        playback_ = currentPlaybackLocked();
        hostPresent_ = true;
    }
    if (MemberEntry* host = findMember(hostMemberId_)) {
        host->participant = participant;
        host->info.connected = true;
    }

    evt::ReturnedToSession event;
    event.session = snapshotLocked();
    event.members = membersLocked();
    event.chatLog = recentChatLocked();
    event.needsAudioReload = needsAudioReload;
    return event;
}

void Stage::close(const std::string& reason) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
        return;
    }
    closed_ = true;
    heartbeatTimer_.cancel();

    evt::SessionClosed event;
    event.sessionId = id_;
    event.reason = reason;
    broadcastLocked(event);
    std::cout << "Stage " << id_ << " closed: " << reason << std::endl;
}

// ============================================================================
// HOST COMMANDS
// ============================================================================

void Stage::rename(const std::string& name) {
    std::string clean = trimText(name, maxNameLength);
    std::lock_guard<std::mutex> lock(mutex_);
    ensureOpen();
    if (clean.empty()) {
        throw StageError(ErrorKind::InvalidArgument, "Session name cannot be empty");
    }
    name_ = clean;
    broadcastLocked(evt::SessionUpdated{summaryLocked()});
}

void Stage::togglePublic() {
    std::lock_guard<std::mutex> lock(mutex_);
    ensureOpen();
    isPublic_ = !isPublic_;
    broadcastLocked(evt::SessionUpdated{summaryLocked()});
}

void Stage::updateNowPlaying(const json& track) {
    std::lock_guard<std::mutex> lock(mutex_);
    ensureOpen();
    nowPlaying_ = track;
    broadcastLocked(evt::SessionUpdated{summaryLocked()});
}

void Stage::setAudioSource(const AudioSource& source, const json& analysisResult) {
    if (source.url.empty()) {
        throw StageError(ErrorKind::InvalidArgument, "Audio source url is required");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    ensureOpen();
    audioSource_ = source;
    analysisResult_ = analysisResult;

    // A new track starts paused at zero; the host's next heartbeat says otherwise.
    playback_.positionSeconds = 0.0;
    playback_.isPlaying = false;
    playback_.capturedAt = wallClockMillis();

    evt::AudioSourceChanged event;
    event.audioSource = source;
    event.analysisResult = analysisResult;
    broadcastLocked(event, hostMemberId_);
}

void Stage::heartbeat(const cmd::SyncHeartbeat& heartbeat) {
    if (!(heartbeat.speedMultiplier > 0.0)) {
        throw StageError(ErrorKind::InvalidArgument, "speedMultiplier must be positive");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    ensureOpen();
    playback_.positionSeconds = clampPosition(heartbeat.positionSeconds, durationLocked());
    playback_.isPlaying = heartbeat.isPlaying;
    playback_.speedMultiplier = heartbeat.speedMultiplier;
    playback_.capturedAt = wallClockMillis();
    broadcastLocked(evt::SyncSnapshot{playback_}, hostMemberId_);
}

void Stage::hostAction(const cmd::HostAction& action) {
    const json& payload = action.payload;
    auto number = [&](const char* key) -> std::optional<double> {
        if (payload.is_object() && payload.contains(key) && payload.at(key).is_number()) {
            return payload.at(key).get<double>();
        }
        return std::nullopt;
    };

    std::lock_guard<std::mutex> lock(mutex_);
    ensureOpen();

    bool transport = isTransportAction(action.kind);
    if (transport) {
        PlaybackSnapshot next = recapture(playback_, wallClockMillis(), durationLocked());
        switch (action.kind) {
        case HostActionKind::Play:
        case HostActionKind::Pause:
            next.isPlaying = action.kind == HostActionKind::Play;
            if (auto position = number("positionSeconds")) {
                next.positionSeconds = *position;
            }
            break;
        case HostActionKind::Seek: {
            auto position = number("positionSeconds");
            if (!position) {
                throw StageError(ErrorKind::InvalidArgument, "seek needs 'positionSeconds'");
            }
            next.positionSeconds = *position;
            break;
        }
        case HostActionKind::SpeedChange: {
            auto speed = number("speedMultiplier");
            if (!speed || !(*speed > 0.0)) {
                throw StageError(ErrorKind::InvalidArgument, "speed_change needs a positive 'speedMultiplier'");
            }
            next.speedMultiplier = *speed;
            break;
        }
        default:
            break;
        }
        next.positionSeconds = clampPosition(next.positionSeconds, durationLocked());
        next.capturedAt = wallClockMillis();
        playback_ = next;
    } else {
        applyVisualizerAction(action.kind, payload, visualizer_);
    }

    broadcastLocked(evt::HostAction{action.kind, action.payload}, hostMemberId_);
    if (transport) {
        broadcastLocked(evt::SyncSnapshot{playback_}, hostMemberId_);
    }
}

void Stage::queueAdd(const std::string& memberId, const TrackRequest& track) {
    std::lock_guard<std::mutex> lock(mutex_);
    ensureOpen();
    const MemberEntry* member = findMember(memberId);
    queue_.enqueue(track, memberId, member ? member->info.displayName : std::string());
    broadcastQueueLocked();
}

void Stage::queueRemove(const std::string& itemId) {
    std::lock_guard<std::mutex> lock(mutex_);
    ensureOpen();
    std::optional<QueueItem> next = queue_.remove(itemId);
    broadcastQueueLocked();
    if (next) {
        broadcastPlayNextLocked(*next);
    }
}

void Stage::queueReorder(const std::vector<std::string>& tailOrder) {
    std::lock_guard<std::mutex> lock(mutex_);
    ensureOpen();
    queue_.reorder(tailOrder);
    broadcastQueueLocked();
}

void Stage::queueAdvance() {
    std::lock_guard<std::mutex> lock(mutex_);
    ensureOpen();
    std::optional<QueueItem> next = queue_.advance();
    broadcastQueueLocked();
    if (next) {
        broadcastPlayNextLocked(*next);
    }
}

void Stage::queueUpdateItem(const std::string& itemId, QueueStatus status, const json& analysisResult) {
    std::lock_guard<std::mutex> lock(mutex_);
    ensureOpen();
    queue_.updateItem(itemId, status, analysisResult);
    broadcastQueueLocked();
}

void Stage::respondSuggestion(const std::string& suggestionId, Decision decision) {
    std::lock_guard<std::mutex> lock(mutex_);
    ensureOpen();
    Suggestion resolved = queue_.respond(suggestionId, decision == Decision::Approve);
    broadcastQueueLocked();
    sendToLocked(resolved.proposerMemberId, evt::SuggestionResolved{resolved.id, decision});
}

// ============================================================================
// AUDIENCE / SHARED COMMANDS
// ============================================================================

void Stage::suggest(const std::string& memberId, const TrackRequest& track) {
    std::lock_guard<std::mutex> lock(mutex_);
    ensureOpen();
    const MemberEntry* member = findMember(memberId);
    if (!member) {
        throw StageError(ErrorKind::NotFound, "Not a member of this session");
    }
    Suggestion suggestion = queue_.suggest(track, memberId, member->info.displayName);
    sendToLocked(memberId, evt::SuggestionSent{suggestion});
    sendToLocked(hostMemberId_, evt::SuggestionCreated{suggestion});
    broadcastQueueLocked();
}

void Stage::chat(const std::string& memberId, const std::string& text) {
    std::string clean = trimText(text, maxChatLength);
    std::lock_guard<std::mutex> lock(mutex_);
    ensureOpen();
    if (clean.empty()) {
        throw StageError(ErrorKind::InvalidArgument, "Chat message is empty");
    }
    const MemberEntry* member = findMember(memberId);
    if (!member) {
        throw StageError(ErrorKind::NotFound, "Not a member of this session");
    }
    ChatMessage message = appendChatLocked(memberId, member->info.displayName, clean, false);
    broadcastLocked(evt::Chat{message});
}

// ============================================================================
// READ ACCESS
// ============================================================================

SessionSummary Stage::summary() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return summaryLocked();
}

StageSnapshot Stage::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return snapshotLocked();
}

std::vector<MemberInfo> Stage::members() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return membersLocked();
}

std::vector<ChatMessage> Stage::chatLog() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::vector<ChatMessage>(chatLog_.begin(), chatLog_.end());
}

PlaybackSnapshot Stage::playback() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return playback_;
}

bool Stage::isPublic() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return isPublic_;
}

bool Stage::isClosed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

bool Stage::isHostPresent() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return hostPresent_;
}

bool Stage::hasMember(const std::string& memberId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return findMember(memberId) != nullptr;
}

// ============================================================================
// INTERNALS (mutex_ held)
// ============================================================================

void Stage::ensureOpen() const {
    if (closed_) {
        throw StageError(ErrorKind::NotFound, "Session has ended");
    }
}

Stage::MemberEntry* Stage::findMember(const std::string& memberId) {
    for (auto& entry : members_) {
        if (entry.info.id == memberId) {
            return &entry;
        }
    }
    return nullptr;
}

const Stage::MemberEntry* Stage::findMember(const std::string& memberId) const {
    for (const auto& entry : members_) {
        if (entry.info.id == memberId) {
            return &entry;
        }
    }
    return nullptr;
}

SessionSummary Stage::summaryLocked() const {
    SessionSummary summary;
    summary.id = id_;
    summary.name = name_;
    summary.hostId = hostMemberId_;
    if (const MemberEntry* host = findMember(hostMemberId_)) {
        summary.hostName = host->info.displayName;
    }
    summary.isPublic = isPublic_;
    summary.nowPlaying = nowPlaying_;
    summary.audienceCount = static_cast<size_t>(
        std::count_if(members_.begin(), members_.end(),
                      [](const MemberEntry& entry) { return entry.info.role == Role::Audience; }));
    summary.createdAt = createdAt_;
    return summary;
}

StageSnapshot Stage::snapshotLocked() const {
    StageSnapshot snapshot;
    snapshot.summary = summaryLocked();
    snapshot.playback = currentPlaybackLocked();
    snapshot.visualizer = visualizer_;
    snapshot.audioSource = audioSource_;
    snapshot.analysisResult = analysisResult_;
    snapshot.queue = queue_.items();
    snapshot.history = queue_.history();
    snapshot.suggestions = queue_.suggestions();
    return snapshot;
}

std::vector<MemberInfo> Stage::membersLocked() const {
    std::vector<MemberInfo> list;
    list.reserve(members_.size());
    for (const auto& entry : members_) {
        list.push_back(entry.info);
    }
    return list;
}

std::vector<ChatMessage> Stage::recentChatLocked() const {
    size_t count = std::min(options_.joinChatReplay, chatLog_.size());
    return std::vector<ChatMessage>(chatLog_.end() - static_cast<std::ptrdiff_t>(count), chatLog_.end());
}

std::optional<double> Stage::durationLocked() const {
    if (audioSource_) {
        return audioSource_->durationSeconds;
    }
    return std::nullopt;
}

// While the host is away the stored snapshot is extrapolated on read; while
// present, the host's own last heartbeat is the truth and is returned as is.
PlaybackSnapshot Stage::currentPlaybackLocked() const {
    if (hostPresent_) {
        return playback_;
    }
    return recapture(playback_, wallClockMillis(), durationLocked());
}

ChatMessage Stage::appendChatLocked(const std::string& memberId, const std::string& displayName,
                                    const std::string& text, bool isSystem) {
    ChatMessage message;
    message.id = newId();
    message.memberId = memberId;
    message.displayName = displayName;
    message.text = text;
    message.timestamp = wallClockMillis();
    message.isHost = !isSystem && memberId == hostMemberId_;
    message.isSystem = isSystem;

    chatLog_.push_back(message);
    if (chatLog_.size() > options_.chatHistoryLimit) {
        while (chatLog_.size() > options_.chatTrimTo) {
            chatLog_.pop_front();
        }
    }
    return message;
}

void Stage::broadcastLocked(const Event& event, const std::string& excludeId) {
    for (const auto& entry : members_) {
        if (entry.participant && entry.info.id != excludeId) {
            entry.participant->deliver(event);
        }
    }
}

void Stage::sendToLocked(const std::string& memberId, const Event& event) {
    const MemberEntry* entry = findMember(memberId);
    if (entry && entry->participant) {
        entry->participant->deliver(event);
    }
}

void Stage::broadcastQueueLocked() {
    evt::QueueUpdated event;
    event.queue = queue_.items();
    event.suggestions = queue_.suggestions();
    event.history = queue_.history();
    broadcastLocked(event);
}

void Stage::broadcastPlayNextLocked(const QueueItem& item) {
    broadcastLocked(evt::QueuePlayNext{item});
}

void Stage::scheduleFallbackLocked() {
    heartbeatTimer_.expires_after(options_.heartbeatInterval);
    std::weak_ptr<Stage> weak = weak_from_this();
    heartbeatTimer_.async_wait([weak](const boost::system::error_code& ec) {
        if (auto self = weak.lock()) {
            self->onFallbackTick(ec);
        }
    });
}

void Stage::onFallbackTick(const boost::system::error_code& ec) {
    if (ec == boost::asio::error::operation_aborted) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_ || hostPresent_) {
        return;
    }
    PlaybackSnapshot current = currentPlaybackLocked();
    if (current.isPlaying) {
        broadcastLocked(evt::SyncSnapshot{current}, hostMemberId_);
    }
    scheduleFallbackLocked();
}
