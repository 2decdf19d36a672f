#include "protocol.hpp"
#include "errors.hpp"

#include <type_traits>
#include <utility>

const char* toString(HostActionKind kind) {
    switch (kind) {
    case HostActionKind::Play:
        return "play";
    case HostActionKind::Pause:
        return "pause";
    case HostActionKind::Seek:
        return "seek";
    case HostActionKind::SpeedChange:
        return "speed_change";
    case HostActionKind::ShapeChange:
        return "shape_change";
    case HostActionKind::EnvironmentChange:
        return "environment_change";
    case HostActionKind::EqChange:
        return "eq_change";
    case HostActionKind::Reset:
        return "reset";
    }
    return "play";
}

HostActionKind hostActionKindFromString(const std::string& name) {
    if (name == "play") return HostActionKind::Play;
    if (name == "pause") return HostActionKind::Pause;
    if (name == "seek") return HostActionKind::Seek;
    if (name == "speed_change") return HostActionKind::SpeedChange;
    if (name == "shape_change") return HostActionKind::ShapeChange;
    if (name == "environment_change") return HostActionKind::EnvironmentChange;
    if (name == "eq_change") return HostActionKind::EqChange;
    if (name == "reset") return HostActionKind::Reset;
    throw ProtocolError("unknown host action: " + name);
}

bool isTransportAction(HostActionKind kind) {
    return kind == HostActionKind::Play || kind == HostActionKind::Pause ||
           kind == HostActionKind::Seek || kind == HostActionKind::SpeedChange;
}

void applyVisualizerAction(HostActionKind kind, const json& payload, VisualizerSnapshot& visual) {
    auto text = [&](const char* key) -> std::string {
        if (payload.is_object() && payload.contains(key) && payload.at(key).is_string()) {
            return payload.at(key).get<std::string>();
        }
        throw StageError(ErrorKind::InvalidArgument,
                         std::string(toString(kind)) + " needs a '" + key + "' string");
    };

    VisualizerSnapshot next = visual;
    switch (kind) {
    case HostActionKind::ShapeChange:
        next.shape = text("shape");
        break;
    case HostActionKind::EnvironmentChange:
        next.environment = text("environment");
        break;
    case HostActionKind::EqChange:
        if (!payload.is_object()) {
            throw StageError(ErrorKind::InvalidArgument, "eq_change needs an object payload");
        }
        try {
            if (payload.contains("audioTuning") || payload.contains("playbackTuning")) {
                from_json(payload, next);
            } else {
                from_json(payload, next.audioTuning);
            }
        } catch (const json::exception& e) {
            throw StageError(ErrorKind::InvalidArgument, std::string("eq_change: ") + e.what());
        }
        break;
    case HostActionKind::Reset:
        next = VisualizerSnapshot();
        break;
    default:
        return;
    }
    visual = next;
}

namespace {

json objectOrNull(const json& body, const char* key) {
    if (!body.contains(key)) {
        return json();
    }
    return body.at(key);
}

TrackRequest readTrack(const json& body) {
    TrackRequest track;
    track.title = body.value("title", std::string());
    track.source = body.value("source", std::string());
    track.url = body.at("url").get<std::string>();
    return track;
}

void writeTrack(json& body, const TrackRequest& track) {
    body["title"] = track.title;
    body["source"] = track.source;
    body["url"] = track.url;
}

// Commands say "approve"/"reject"; resolutions report "approved"/"rejected".
Decision decisionFromCommand(const std::string& name) {
    if (name == "approve") return Decision::Approve;
    if (name == "reject") return Decision::Reject;
    throw ProtocolError("decision must be approve or reject");
}

Decision decisionFromResolution(const std::string& name) {
    if (name == "approved") return Decision::Approve;
    if (name == "rejected") return Decision::Reject;
    throw ProtocolError("decision must be approved or rejected");
}

}  // namespace

// ============================================================================
// COMMAND FIELDS
// ============================================================================

namespace cmd {

void readFields(const json& b, CreateSession& c) { c.name = b.value("name", std::string()); }
void writeFields(json& b, const CreateSession& c) { b["name"] = c.name; }

void readFields(const json& b, JoinSession& c) { b.at("sessionId").get_to(c.sessionId); }
void writeFields(json& b, const JoinSession& c) { b["sessionId"] = c.sessionId; }

void readFields(const json&, LeaveSession&) {}
void writeFields(json&, const LeaveSession&) {}

void readFields(const json& b, SetDisplayName& c) { c.name = b.value("name", std::string()); }
void writeFields(json& b, const SetDisplayName& c) { b["name"] = c.name; }

void readFields(const json& b, RenameSession& c) { b.at("name").get_to(c.name); }
void writeFields(json& b, const RenameSession& c) { b["name"] = c.name; }

void readFields(const json&, TogglePublic&) {}
void writeFields(json&, const TogglePublic&) {}

void readFields(const json& b, UpdateNowPlaying& c) { c.track = objectOrNull(b, "track"); }
void writeFields(json& b, const UpdateNowPlaying& c) { b["track"] = c.track; }

void readFields(const json& b, Chat& c) { b.at("text").get_to(c.text); }
void writeFields(json& b, const Chat& c) { b["text"] = c.text; }

void readFields(const json& b, SetAudioSource& c) {
    b.at("audioSource").get_to(c.audioSource);
    c.analysisResult = objectOrNull(b, "analysisResult");
}
void writeFields(json& b, const SetAudioSource& c) {
    b["audioSource"] = c.audioSource;
    b["analysisResult"] = c.analysisResult;
}

void readFields(const json& b, SyncHeartbeat& c) {
    b.at("positionSeconds").get_to(c.positionSeconds);
    b.at("isPlaying").get_to(c.isPlaying);
    c.speedMultiplier = b.value("speedMultiplier", 1.0);
}
void writeFields(json& b, const SyncHeartbeat& c) {
    b["positionSeconds"] = c.positionSeconds;
    b["isPlaying"] = c.isPlaying;
    b["speedMultiplier"] = c.speedMultiplier;
}

void readFields(const json& b, HostAction& c) {
    c.kind = hostActionKindFromString(b.at("kind").get<std::string>());
    c.payload = b.contains("payload") ? b.at("payload") : json::object();
}
void writeFields(json& b, const HostAction& c) {
    b["kind"] = toString(c.kind);
    b["payload"] = c.payload;
}

void readFields(const json& b, QueueAdd& c) { c.track = readTrack(b); }
void writeFields(json& b, const QueueAdd& c) { writeTrack(b, c.track); }

void readFields(const json& b, QueueRemove& c) { b.at("itemId").get_to(c.itemId); }
void writeFields(json& b, const QueueRemove& c) { b["itemId"] = c.itemId; }

void readFields(const json& b, QueueReorder& c) { b.at("tailOrder").get_to(c.tailOrder); }
void writeFields(json& b, const QueueReorder& c) { b["tailOrder"] = c.tailOrder; }

void readFields(const json&, QueueAdvance&) {}
void writeFields(json&, const QueueAdvance&) {}

void readFields(const json& b, QueueUpdateItem& c) {
    b.at("itemId").get_to(c.itemId);
    c.status = queueStatusFromString(b.at("status").get<std::string>());
    c.analysisResult = objectOrNull(b, "analysisResult");
}
void writeFields(json& b, const QueueUpdateItem& c) {
    b["itemId"] = c.itemId;
    b["status"] = toString(c.status);
    b["analysisResult"] = c.analysisResult;
}

void readFields(const json& b, SuggestSong& c) { c.track = readTrack(b); }
void writeFields(json& b, const SuggestSong& c) { writeTrack(b, c.track); }

void readFields(const json& b, RespondSuggestion& c) {
    b.at("suggestionId").get_to(c.suggestionId);
    c.decision = decisionFromCommand(b.at("decision").get<std::string>());
}
void writeFields(json& b, const RespondSuggestion& c) {
    b["suggestionId"] = c.suggestionId;
    b["decision"] = c.decision == Decision::Approve ? "approve" : "reject";
}

void readFields(const json&, GoToMenu&) {}
void writeFields(json&, const GoToMenu&) {}

void readFields(const json&, ReturnToSession&) {}
void writeFields(json&, const ReturnToSession&) {}

void readFields(const json&, EndSession&) {}
void writeFields(json&, const EndSession&) {}

void readFields(const json& b, Resume& c) { b.at("memberId").get_to(c.memberId); }
void writeFields(json& b, const Resume& c) { b["memberId"] = c.memberId; }

}  // namespace cmd

// ============================================================================
// EVENT FIELDS
// ============================================================================

namespace evt {

void readFields(const json& b, Connected& e) {
    b.at("memberId").get_to(e.memberId);
    e.publicSessions = b.value("publicSessions", std::vector<SessionSummary>());
}
void writeFields(json& b, const Connected& e) {
    b["memberId"] = e.memberId;
    b["publicSessions"] = e.publicSessions;
}

void readFields(const json& b, DisplayNameSet& e) { b.at("name").get_to(e.name); }
void writeFields(json& b, const DisplayNameSet& e) { b["name"] = e.name; }

void readFields(const json& b, SessionCreated& e) {
    b.at("session").get_to(e.session);
    b.at("members").get_to(e.members);
}
void writeFields(json& b, const SessionCreated& e) {
    b["session"] = e.session;
    b["members"] = e.members;
}

void readFields(const json& b, SessionJoined& e) {
    b.at("session").get_to(e.session);
    b.at("members").get_to(e.members);
    e.chatLog = b.value("chatLog", std::vector<ChatMessage>());
    if (b.contains("ownedSessionSummary") && !b.at("ownedSessionSummary").is_null()) {
        e.ownedSessionSummary = b.at("ownedSessionSummary").get<SessionSummary>();
    }
}
void writeFields(json& b, const SessionJoined& e) {
    b["session"] = e.session;
    b["members"] = e.members;
    b["chatLog"] = e.chatLog;
    b["ownedSessionSummary"] = e.ownedSessionSummary ? json(*e.ownedSessionSummary) : json();
}

void readFields(const json& b, SessionUpdated& e) { b.at("session").get_to(e.session); }
void writeFields(json& b, const SessionUpdated& e) { b["session"] = e.session; }

void readFields(const json& b, MemberJoined& e) {
    b.at("members").get_to(e.members);
    b.at("systemMessage").get_to(e.systemMessage);
}
void writeFields(json& b, const MemberJoined& e) {
    b["members"] = e.members;
    b["systemMessage"] = e.systemMessage;
}

void readFields(const json& b, MemberLeft& e) {
    b.at("members").get_to(e.members);
    b.at("systemMessage").get_to(e.systemMessage);
}
void writeFields(json& b, const MemberLeft& e) {
    b["members"] = e.members;
    b["systemMessage"] = e.systemMessage;
}

void readFields(const json& b, MemberRenamed& e) {
    b.at("memberId").get_to(e.memberId);
    e.oldName = b.value("oldName", std::string());
    b.at("newName").get_to(e.newName);
    b.at("members").get_to(e.members);
}
void writeFields(json& b, const MemberRenamed& e) {
    b["memberId"] = e.memberId;
    b["oldName"] = e.oldName;
    b["newName"] = e.newName;
    b["members"] = e.members;
}

void readFields(const json& b, Chat& e) { b.at("message").get_to(e.message); }
void writeFields(json& b, const Chat& e) { b["message"] = e.message; }

void readFields(const json& b, SessionClosed& e) {
    e.sessionId = b.value("sessionId", std::string());
    e.reason = b.value("reason", std::string());
}
void writeFields(json& b, const SessionClosed& e) {
    b["sessionId"] = e.sessionId;
    b["reason"] = e.reason;
}

void readFields(const json&, LeftSession&) {}
void writeFields(json&, const LeftSession&) {}

void readFields(const json& b, PublicSessions& e) { b.at("list").get_to(e.list); }
void writeFields(json& b, const PublicSessions& e) { b["list"] = e.list; }

void readFields(const json& b, AudioSourceChanged& e) {
    b.at("audioSource").get_to(e.audioSource);
    e.analysisResult = objectOrNull(b, "analysisResult");
}
void writeFields(json& b, const AudioSourceChanged& e) {
    b["audioSource"] = e.audioSource;
    b["analysisResult"] = e.analysisResult;
}

// The snapshot fields sit at the top level of the event, not nested.
void readFields(const json& b, SyncSnapshot& e) { from_json(b, e.snapshot); }
void writeFields(json& b, const SyncSnapshot& e) {
    b["positionSeconds"] = e.snapshot.positionSeconds;
    b["isPlaying"] = e.snapshot.isPlaying;
    b["speedMultiplier"] = e.snapshot.speedMultiplier;
    b["capturedAt"] = e.snapshot.capturedAt;
}

void readFields(const json& b, HostAction& e) {
    e.kind = hostActionKindFromString(b.at("kind").get<std::string>());
    e.payload = b.contains("payload") ? b.at("payload") : json::object();
}
void writeFields(json& b, const HostAction& e) {
    b["kind"] = toString(e.kind);
    b["payload"] = e.payload;
}

void readFields(const json& b, QueueUpdated& e) {
    b.at("queue").get_to(e.queue);
    e.suggestions = b.value("suggestions", std::vector<Suggestion>());
    e.history = b.value("history", std::vector<QueueItem>());
}
void writeFields(json& b, const QueueUpdated& e) {
    b["queue"] = e.queue;
    b["suggestions"] = e.suggestions;
    b["history"] = e.history;
}

void readFields(const json& b, QueuePlayNext& e) { b.at("item").get_to(e.item); }
void writeFields(json& b, const QueuePlayNext& e) { b["item"] = e.item; }

void readFields(const json& b, SuggestionCreated& e) { b.at("suggestion").get_to(e.suggestion); }
void writeFields(json& b, const SuggestionCreated& e) { b["suggestion"] = e.suggestion; }

void readFields(const json& b, SuggestionSent& e) { b.at("suggestion").get_to(e.suggestion); }
void writeFields(json& b, const SuggestionSent& e) { b["suggestion"] = e.suggestion; }

void readFields(const json& b, SuggestionResolved& e) {
    b.at("suggestionId").get_to(e.suggestionId);
    e.decision = decisionFromResolution(b.at("decision").get<std::string>());
}
void writeFields(json& b, const SuggestionResolved& e) {
    b["suggestionId"] = e.suggestionId;
    b["decision"] = e.decision == Decision::Approve ? "approved" : "rejected";
}

void readFields(const json& b, WentToMenu& e) {
    if (b.contains("ownedSessionSummary") && !b.at("ownedSessionSummary").is_null()) {
        e.ownedSessionSummary = b.at("ownedSessionSummary").get<SessionSummary>();
    }
}
void writeFields(json& b, const WentToMenu& e) {
    b["ownedSessionSummary"] = e.ownedSessionSummary ? json(*e.ownedSessionSummary) : json();
}

void readFields(const json& b, ReturnedToSession& e) {
    b.at("session").get_to(e.session);
    e.members = b.value("members", std::vector<MemberInfo>());
    e.chatLog = b.value("chatLog", std::vector<ChatMessage>());
    e.needsAudioReload = b.value("needsAudioReload", false);
}
void writeFields(json& b, const ReturnedToSession& e) {
    b["session"] = e.session;
    b["members"] = e.members;
    b["chatLog"] = e.chatLog;
    b["needsAudioReload"] = e.needsAudioReload;
}

void readFields(const json& b, Error& e) {
    e.code = b.value("code", std::string());
    b.at("message").get_to(e.message);
}
void writeFields(json& b, const Error& e) {
    b["code"] = e.code;
    b["message"] = e.message;
}

}  // namespace evt

// ============================================================================
// VARIANT WALK
// ============================================================================

namespace {

template <typename Variant, typename Alternative>
void decodeIfType(const std::string& type, const json& body, std::optional<Variant>& out) {
    if (out || type != Alternative::type) {
        return;
    }
    Alternative value;
    readFields(body, value);
    out = std::move(value);
}

template <typename Variant, size_t... I>
std::optional<Variant> decodeByType(const std::string& type, const json& body,
                                    std::index_sequence<I...>) {
    std::optional<Variant> out;
    (decodeIfType<Variant, std::variant_alternative_t<I, Variant>>(type, body, out), ...);
    return out;
}

template <typename Variant>
Variant decodeBody(const std::string& text, const char* what) {
    try {
        json body = json::parse(text);
        if (!body.is_object()) {
            throw ProtocolError(std::string(what) + " must be a JSON object");
        }
        std::string type = body.at("type").get<std::string>();
        auto decoded = decodeByType<Variant>(
            type, body, std::make_index_sequence<std::variant_size_v<Variant>>());
        if (!decoded) {
            throw ProtocolError(std::string("unknown ") + what + " type: " + type);
        }
        return std::move(*decoded);
    } catch (const json::exception& e) {
        throw ProtocolError(std::string("malformed ") + what + ": " + e.what());
    }
}

template <typename Variant>
std::string encodeBody(const Variant& message) {
    return std::visit(
        [](const auto& value) {
            using Alternative = std::decay_t<decltype(value)>;
            json body = json::object();
            body["type"] = Alternative::type;
            writeFields(body, value);
            return body.dump();
        },
        message);
}

}  // namespace

Command decodeCommand(const std::string& body) {
    return decodeBody<Command>(body, "command");
}

Event decodeEvent(const std::string& body) {
    return decodeBody<Event>(body, "event");
}

std::string encodeCommand(const Command& command) {
    return encodeBody(command);
}

std::string encodeEvent(const Event& event) {
    return encodeBody(event);
}

const char* typeOf(const Command& command) {
    return std::visit([](const auto& value) { return std::decay_t<decltype(value)>::type; }, command);
}

const char* typeOf(const Event& event) {
    return std::visit([](const auto& value) { return std::decay_t<decltype(value)>::type; }, event);
}
