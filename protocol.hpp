#ifndef PROTOCOL_HPP
#define PROTOCOL_HPP

#include "model.hpp"
#include "playQueue.hpp"

#include <optional>
#include <string>
#include <variant>
#include <vector>

/*
 * ============================================================================
 * PROTOCOL - Closed Command and Event Sets
 * ============================================================================
 *
 * Client -> server traffic is a Command, server -> client traffic is an
 * Event. Both are std::variant over one struct per message, and each struct
 * names its wire "type". The codec walks the variant's alternatives, so a
 * new message is one struct plus its two field functions; a missing field
 * function is a compile error, not a silently ignored message.
 *
 *   frame body  --decodeCommand-->  Command  --std::visit-->  Lobby
 *   Stage  --Event-->  Participant::deliver  --encodeEvent-->  frame body
 * ============================================================================
 */

enum class HostActionKind {
    Play,
    Pause,
    Seek,
    SpeedChange,
    ShapeChange,
    EnvironmentChange,
    EqChange,
    Reset
};

enum class Decision { Approve, Reject };

const char* toString(HostActionKind kind);
HostActionKind hostActionKindFromString(const std::string& name);

// play, pause, seek and speed_change move the playback clock; the rest only
// touch the visualizer.
bool isTransportAction(HostActionKind kind);

// Applies a visualizer action (shape, environment, eq, reset) to visual.
// Transport kinds leave it untouched. Throws InvalidArgument on a bad payload,
// before visual is modified.
void applyVisualizerAction(HostActionKind kind, const json& payload, VisualizerSnapshot& visual);

// ============================================================================
// COMMANDS (client -> server)
// ============================================================================

namespace cmd {

struct CreateSession {
    static constexpr const char* type = "create_session";
    std::string name;
};

struct JoinSession {
    static constexpr const char* type = "join_session";
    std::string sessionId;
};

struct LeaveSession {
    static constexpr const char* type = "leave_session";
};

struct SetDisplayName {
    static constexpr const char* type = "set_display_name";
    std::string name;
};

struct RenameSession {
    static constexpr const char* type = "rename_session";
    std::string name;
};

struct TogglePublic {
    static constexpr const char* type = "toggle_public";
};

struct UpdateNowPlaying {
    static constexpr const char* type = "update_now_playing";
    json track;
};

struct Chat {
    static constexpr const char* type = "chat_message";
    std::string text;
};

struct SetAudioSource {
    static constexpr const char* type = "set_audio_source";
    AudioSource audioSource;
    json analysisResult;
};

struct SyncHeartbeat {
    static constexpr const char* type = "sync_heartbeat";
    double positionSeconds = 0.0;
    bool isPlaying = false;
    double speedMultiplier = 1.0;
};

struct HostAction {
    static constexpr const char* type = "host_action";
    HostActionKind kind = HostActionKind::Play;
    json payload;
};

struct QueueAdd {
    static constexpr const char* type = "queue_add";
    TrackRequest track;
};

struct QueueRemove {
    static constexpr const char* type = "queue_remove";
    std::string itemId;
};

struct QueueReorder {
    static constexpr const char* type = "queue_reorder";
    std::vector<std::string> tailOrder;
};

struct QueueAdvance {
    static constexpr const char* type = "queue_advance";
};

struct QueueUpdateItem {
    static constexpr const char* type = "queue_update_item";
    std::string itemId;
    QueueStatus status = QueueStatus::Pending;
    json analysisResult;
};

struct SuggestSong {
    static constexpr const char* type = "suggest_song";
    TrackRequest track;
};

struct RespondSuggestion {
    static constexpr const char* type = "respond_suggestion";
    std::string suggestionId;
    Decision decision = Decision::Reject;
};

struct GoToMenu {
    static constexpr const char* type = "go_to_menu";
};

struct ReturnToSession {
    static constexpr const char* type = "return_to_session";
};

struct EndSession {
    static constexpr const char* type = "end_session";
};

// Sent right after reconnecting to reclaim a previous member identity.
struct Resume {
    static constexpr const char* type = "resume";
    std::string memberId;
};

}  // namespace cmd

using Command = std::variant<cmd::CreateSession, cmd::JoinSession, cmd::LeaveSession,
                             cmd::SetDisplayName, cmd::RenameSession, cmd::TogglePublic,
                             cmd::UpdateNowPlaying, cmd::Chat, cmd::SetAudioSource,
                             cmd::SyncHeartbeat, cmd::HostAction, cmd::QueueAdd,
                             cmd::QueueRemove, cmd::QueueReorder, cmd::QueueAdvance,
                             cmd::QueueUpdateItem, cmd::SuggestSong, cmd::RespondSuggestion,
                             cmd::GoToMenu, cmd::ReturnToSession, cmd::EndSession,
                             cmd::Resume>;

// ============================================================================
// EVENTS (server -> client)
// ============================================================================

namespace evt {

struct Connected {
    static constexpr const char* type = "connected";
    std::string memberId;
    std::vector<SessionSummary> publicSessions;
};

struct DisplayNameSet {
    static constexpr const char* type = "display_name_set";
    std::string name;
};

struct SessionCreated {
    static constexpr const char* type = "session_created";
    StageSnapshot session;
    std::vector<MemberInfo> members;
};

struct SessionJoined {
    static constexpr const char* type = "session_joined";
    StageSnapshot session;
    std::vector<MemberInfo> members;
    std::vector<ChatMessage> chatLog;
    std::optional<SessionSummary> ownedSessionSummary;
};

struct SessionUpdated {
    static constexpr const char* type = "session_updated";
    SessionSummary session;
};

struct MemberJoined {
    static constexpr const char* type = "member_joined";
    std::vector<MemberInfo> members;
    ChatMessage systemMessage;
};

struct MemberLeft {
    static constexpr const char* type = "member_left";
    std::vector<MemberInfo> members;
    ChatMessage systemMessage;
};

struct MemberRenamed {
    static constexpr const char* type = "member_renamed";
    std::string memberId;
    std::string oldName;
    std::string newName;
    std::vector<MemberInfo> members;
};

struct Chat {
    static constexpr const char* type = "chat_message";
    ChatMessage message;
};

struct SessionClosed {
    static constexpr const char* type = "session_closed";
    std::string sessionId;
    std::string reason;
};

struct LeftSession {
    static constexpr const char* type = "left_session";
};

struct PublicSessions {
    static constexpr const char* type = "public_sessions";
    std::vector<SessionSummary> list;
};

struct AudioSourceChanged {
    static constexpr const char* type = "audio_source";
    AudioSource audioSource;
    json analysisResult;
};

struct SyncSnapshot {
    static constexpr const char* type = "sync_snapshot";
    PlaybackSnapshot snapshot;
};

struct HostAction {
    static constexpr const char* type = "host_action";
    HostActionKind kind = HostActionKind::Play;
    json payload;
};

struct QueueUpdated {
    static constexpr const char* type = "queue_updated";
    std::vector<QueueItem> queue;
    std::vector<Suggestion> suggestions;
    std::vector<QueueItem> history;
};

struct QueuePlayNext {
    static constexpr const char* type = "queue_play_next";
    QueueItem item;
};

struct SuggestionCreated {
    static constexpr const char* type = "suggestion_created";
    Suggestion suggestion;
};

struct SuggestionSent {
    static constexpr const char* type = "suggestion_sent";
    Suggestion suggestion;
};

struct SuggestionResolved {
    static constexpr const char* type = "suggestion_resolved";
    std::string suggestionId;
    Decision decision = Decision::Reject;
};

struct WentToMenu {
    static constexpr const char* type = "went_to_menu";
    std::optional<SessionSummary> ownedSessionSummary;
};

struct ReturnedToSession {
    static constexpr const char* type = "returned_to_session";
    StageSnapshot session;
    std::vector<MemberInfo> members;
    std::vector<ChatMessage> chatLog;
    bool needsAudioReload = false;
};

struct Error {
    static constexpr const char* type = "error";
    std::string code;
    std::string message;
};

}  // namespace evt

using Event = std::variant<evt::Connected, evt::DisplayNameSet, evt::SessionCreated,
                           evt::SessionJoined, evt::SessionUpdated, evt::MemberJoined,
                           evt::MemberLeft, evt::MemberRenamed, evt::Chat, evt::SessionClosed,
                           evt::LeftSession, evt::PublicSessions, evt::AudioSourceChanged,
                           evt::SyncSnapshot, evt::HostAction, evt::QueueUpdated,
                           evt::QueuePlayNext, evt::SuggestionCreated, evt::SuggestionSent,
                           evt::SuggestionResolved, evt::WentToMenu, evt::ReturnedToSession,
                           evt::Error>;

// ============================================================================
// CODEC
// ============================================================================

// Both decoders throw ProtocolError on malformed JSON, unknown type or bad fields.
Command decodeCommand(const std::string& body);
Event decodeEvent(const std::string& body);

std::string encodeCommand(const Command& command);
std::string encodeEvent(const Event& event);

const char* typeOf(const Command& command);
const char* typeOf(const Event& event);

#endif // PROTOCOL_HPP
