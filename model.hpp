#ifndef MODEL_HPP
#define MODEL_HPP

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

/*
 * ============================================================================
 * MODEL - Value Types Shared by Server and Client
 * ============================================================================
 *
 * Everything here is a plain copyable value. The Stage aggregate owns the
 * authoritative copies; events carry snapshots of them, and the client
 * mirrors only what it last received. Field names match the JSON keys on the
 * wire, so to_json/from_json are one line per field.
 * ============================================================================
 */

using nlohmann::json;

enum class Role { Host, Audience };

enum class QueueStatus { Pending, Analyzing, Ready, Playing, Played };

enum class SuggestionStatus { Pending, Approved, Rejected };

// Authoritative "as-of" playback state; capturedAt is wall clock milliseconds.
struct PlaybackSnapshot {
    double positionSeconds = 0.0;
    bool isPlaying = false;
    double speedMultiplier = 1.0;
    std::int64_t capturedAt = 0;
};

struct Tuning {
    double bass = 1.0;
    double mid = 1.0;
    double treble = 1.0;
    double sensitivity = 1.0;
};

struct VisualizerSnapshot {
    std::string shape = "sphere";
    std::string environment = "none";
    Tuning audioTuning;
    Tuning playbackTuning;
};

struct AudioSource {
    std::string url;
    std::string title;
    std::string source;
    std::optional<double> durationSeconds;
};

struct QueueItem {
    std::string id;
    std::string title;
    std::string source;
    std::string url;
    QueueStatus status = QueueStatus::Pending;
    std::string addedByMemberId;
    std::string addedByName;
    size_t position = 0;
    json analysisResult;
};

struct Suggestion {
    std::string id;
    std::string title;
    std::string source;
    std::string url;
    std::string proposerMemberId;
    std::string proposerName;
    SuggestionStatus status = SuggestionStatus::Pending;
};

struct ChatMessage {
    std::string id;
    std::string memberId;
    std::string displayName;
    std::string text;
    std::int64_t timestamp = 0;
    bool isHost = false;
    bool isSystem = false;
};

struct MemberInfo {
    std::string id;
    std::string displayName;
    Role role = Role::Audience;
    bool connected = true;
};

// One row of the public directory.
struct SessionSummary {
    std::string id;
    std::string name;
    std::string hostName;
    std::string hostId;
    bool isPublic = false;
    json nowPlaying;
    size_t audienceCount = 0;
    std::int64_t createdAt = 0;
};

// Everything a late joiner needs to reproduce the host's committed state.
struct StageSnapshot {
    SessionSummary summary;
    PlaybackSnapshot playback;
    VisualizerSnapshot visualizer;
    std::optional<AudioSource> audioSource;
    json analysisResult;
    std::vector<QueueItem> queue;
    std::vector<QueueItem> history;
    std::vector<Suggestion> suggestions;
};

// First 12 hex characters of a random UUID.
std::string newId();

// Strips surrounding whitespace, then cuts to maxLength characters.
std::string trimText(const std::string& text, size_t maxLength);

const char* toString(Role role);
const char* toString(QueueStatus status);
const char* toString(SuggestionStatus status);

// Throw ProtocolError on unknown names.
Role roleFromString(const std::string& name);
QueueStatus queueStatusFromString(const std::string& name);
SuggestionStatus suggestionStatusFromString(const std::string& name);

void to_json(json& j, const PlaybackSnapshot& value);
void from_json(const json& j, PlaybackSnapshot& value);
void to_json(json& j, const Tuning& value);
void from_json(const json& j, Tuning& value);
void to_json(json& j, const VisualizerSnapshot& value);
void from_json(const json& j, VisualizerSnapshot& value);
void to_json(json& j, const AudioSource& value);
void from_json(const json& j, AudioSource& value);
void to_json(json& j, const QueueItem& value);
void from_json(const json& j, QueueItem& value);
void to_json(json& j, const Suggestion& value);
void from_json(const json& j, Suggestion& value);
void to_json(json& j, const ChatMessage& value);
void from_json(const json& j, ChatMessage& value);
void to_json(json& j, const MemberInfo& value);
void from_json(const json& j, MemberInfo& value);
void to_json(json& j, const SessionSummary& value);
void from_json(const json& j, SessionSummary& value);
void to_json(json& j, const StageSnapshot& value);
void from_json(const json& j, StageSnapshot& value);

#endif // MODEL_HPP
