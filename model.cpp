#include "model.hpp"
#include "errors.hpp"

#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid_io.hpp>

#include <algorithm>
#include <mutex>

// ============================================================================
// IDENTIFIERS
// ============================================================================

std::string newId() {
    static std::mutex generatorMutex;
    static boost::uuids::random_generator generator;

    std::lock_guard<std::mutex> lock(generatorMutex);
    std::string text = boost::uuids::to_string(generator());
    text.erase(std::remove(text.begin(), text.end(), '-'), text.end());
    return text.substr(0, 12);
}

std::string trimText(const std::string& text, size_t maxLength) {
    const char* whitespace = " \t\r\n";
    size_t begin = text.find_first_not_of(whitespace);
    if (begin == std::string::npos) {
        return std::string();
    }
    size_t end = text.find_last_not_of(whitespace);
    std::string result = text.substr(begin, end - begin + 1);
    if (result.size() > maxLength) {
        result.resize(maxLength);
    }
    return result;
}

// ============================================================================
// ENUM NAMES
// ============================================================================

const char* toString(Role role) {
    switch (role) {
    case Role::Host:
        return "host";
    case Role::Audience:
        return "audience";
    }
    return "audience";
}

const char* toString(QueueStatus status) {
    switch (status) {
    case QueueStatus::Pending:
        return "pending";
    case QueueStatus::Analyzing:
        return "analyzing";
    case QueueStatus::Ready:
        return "ready";
    case QueueStatus::Playing:
        return "playing";
    case QueueStatus::Played:
        return "played";
    }
    return "pending";
}

const char* toString(SuggestionStatus status) {
    switch (status) {
    case SuggestionStatus::Pending:
        return "pending";
    case SuggestionStatus::Approved:
        return "approved";
    case SuggestionStatus::Rejected:
        return "rejected";
    }
    return "pending";
}

Role roleFromString(const std::string& name) {
    if (name == "host") return Role::Host;
    if (name == "audience") return Role::Audience;
    throw ProtocolError("unknown role: " + name);
}

QueueStatus queueStatusFromString(const std::string& name) {
    if (name == "pending") return QueueStatus::Pending;
    if (name == "analyzing") return QueueStatus::Analyzing;
    if (name == "ready") return QueueStatus::Ready;
    if (name == "playing") return QueueStatus::Playing;
    if (name == "played") return QueueStatus::Played;
    throw ProtocolError("unknown queue status: " + name);
}

SuggestionStatus suggestionStatusFromString(const std::string& name) {
    if (name == "pending") return SuggestionStatus::Pending;
    if (name == "approved") return SuggestionStatus::Approved;
    if (name == "rejected") return SuggestionStatus::Rejected;
    throw ProtocolError("unknown suggestion status: " + name);
}

// ============================================================================
// JSON CONVERSION
// ============================================================================

void to_json(json& j, const PlaybackSnapshot& value) {
    j = json{{"positionSeconds", value.positionSeconds},
             {"isPlaying", value.isPlaying},
             {"speedMultiplier", value.speedMultiplier},
             {"capturedAt", value.capturedAt}};
}

void from_json(const json& j, PlaybackSnapshot& value) {
    j.at("positionSeconds").get_to(value.positionSeconds);
    j.at("isPlaying").get_to(value.isPlaying);
    j.at("speedMultiplier").get_to(value.speedMultiplier);
    value.capturedAt = j.value("capturedAt", static_cast<std::int64_t>(0));
}

void to_json(json& j, const Tuning& value) {
    j = json{{"bass", value.bass},
             {"mid", value.mid},
             {"treble", value.treble},
             {"sensitivity", value.sensitivity}};
}

// Partial documents are allowed: missing bands keep their current value.
void from_json(const json& j, Tuning& value) {
    value.bass = j.value("bass", value.bass);
    value.mid = j.value("mid", value.mid);
    value.treble = j.value("treble", value.treble);
    value.sensitivity = j.value("sensitivity", value.sensitivity);
}

void to_json(json& j, const VisualizerSnapshot& value) {
    j = json{{"shape", value.shape},
             {"environment", value.environment},
             {"audioTuning", value.audioTuning},
             {"playbackTuning", value.playbackTuning}};
}

void from_json(const json& j, VisualizerSnapshot& value) {
    value.shape = j.value("shape", value.shape);
    value.environment = j.value("environment", value.environment);
    if (j.contains("audioTuning")) {
        from_json(j.at("audioTuning"), value.audioTuning);
    }
    if (j.contains("playbackTuning")) {
        from_json(j.at("playbackTuning"), value.playbackTuning);
    }
}

void to_json(json& j, const AudioSource& value) {
    j = json{{"url", value.url}, {"title", value.title}, {"source", value.source}};
    if (value.durationSeconds) {
        j["durationSeconds"] = *value.durationSeconds;
    }
}

void from_json(const json& j, AudioSource& value) {
    j.at("url").get_to(value.url);
    value.title = j.value("title", std::string());
    value.source = j.value("source", std::string());
    if (j.contains("durationSeconds") && j.at("durationSeconds").is_number()) {
        value.durationSeconds = j.at("durationSeconds").get<double>();
    } else {
        value.durationSeconds.reset();
    }
}

void to_json(json& j, const QueueItem& value) {
    j = json{{"id", value.id},
             {"title", value.title},
             {"source", value.source},
             {"url", value.url},
             {"status", toString(value.status)},
             {"addedByMemberId", value.addedByMemberId},
             {"addedByName", value.addedByName},
             {"position", value.position},
             {"analysisResult", value.analysisResult}};
}

void from_json(const json& j, QueueItem& value) {
    j.at("id").get_to(value.id);
    j.at("title").get_to(value.title);
    value.source = j.value("source", std::string());
    value.url = j.value("url", std::string());
    value.status = queueStatusFromString(j.at("status").get<std::string>());
    value.addedByMemberId = j.value("addedByMemberId", std::string());
    value.addedByName = j.value("addedByName", std::string());
    value.position = j.value("position", static_cast<size_t>(0));
    value.analysisResult = j.value("analysisResult", json());
}

void to_json(json& j, const Suggestion& value) {
    j = json{{"id", value.id},
             {"title", value.title},
             {"source", value.source},
             {"url", value.url},
             {"proposerMemberId", value.proposerMemberId},
             {"proposerName", value.proposerName},
             {"status", toString(value.status)}};
}

void from_json(const json& j, Suggestion& value) {
    j.at("id").get_to(value.id);
    j.at("title").get_to(value.title);
    value.source = j.value("source", std::string());
    value.url = j.value("url", std::string());
    j.at("proposerMemberId").get_to(value.proposerMemberId);
    value.proposerName = j.value("proposerName", std::string());
    value.status = suggestionStatusFromString(j.at("status").get<std::string>());
}

void to_json(json& j, const ChatMessage& value) {
    j = json{{"id", value.id},
             {"memberId", value.memberId},
             {"displayName", value.displayName},
             {"text", value.text},
             {"timestamp", value.timestamp},
             {"isHost", value.isHost},
             {"isSystem", value.isSystem}};
}

void from_json(const json& j, ChatMessage& value) {
    j.at("id").get_to(value.id);
    value.memberId = j.value("memberId", std::string());
    value.displayName = j.value("displayName", std::string());
    j.at("text").get_to(value.text);
    value.timestamp = j.value("timestamp", static_cast<std::int64_t>(0));
    value.isHost = j.value("isHost", false);
    value.isSystem = j.value("isSystem", false);
}

void to_json(json& j, const MemberInfo& value) {
    j = json{{"id", value.id},
             {"displayName", value.displayName},
             {"role", toString(value.role)},
             {"isHost", value.role == Role::Host},
             {"connected", value.connected}};
}

void from_json(const json& j, MemberInfo& value) {
    j.at("id").get_to(value.id);
    value.displayName = j.value("displayName", std::string());
    value.role = roleFromString(j.value("role", std::string("audience")));
    value.connected = j.value("connected", true);
}

void to_json(json& j, const SessionSummary& value) {
    j = json{{"id", value.id},
             {"name", value.name},
             {"hostName", value.hostName},
             {"hostId", value.hostId},
             {"isPublic", value.isPublic},
             {"nowPlaying", value.nowPlaying},
             {"audienceCount", value.audienceCount},
             {"createdAt", value.createdAt}};
}

void from_json(const json& j, SessionSummary& value) {
    j.at("id").get_to(value.id);
    j.at("name").get_to(value.name);
    value.hostName = j.value("hostName", std::string());
    value.hostId = j.value("hostId", std::string());
    value.isPublic = j.value("isPublic", false);
    value.nowPlaying = j.value("nowPlaying", json());
    value.audienceCount = j.value("audienceCount", static_cast<size_t>(0));
    value.createdAt = j.value("createdAt", static_cast<std::int64_t>(0));
}

void to_json(json& j, const StageSnapshot& value) {
    to_json(j, value.summary);
    j["playback"] = value.playback;
    j["visualizer"] = value.visualizer;
    j["audioSource"] = value.audioSource ? json(*value.audioSource) : json();
    j["analysisResult"] = value.analysisResult;
    j["queue"] = value.queue;
    j["history"] = value.history;
    j["suggestions"] = value.suggestions;
}

void from_json(const json& j, StageSnapshot& value) {
    from_json(j, value.summary);
    if (j.contains("playback") && !j.at("playback").is_null()) {
        j.at("playback").get_to(value.playback);
    }
    if (j.contains("visualizer") && !j.at("visualizer").is_null()) {
        j.at("visualizer").get_to(value.visualizer);
    }
    if (j.contains("audioSource") && !j.at("audioSource").is_null()) {
        value.audioSource = j.at("audioSource").get<AudioSource>();
    } else {
        value.audioSource.reset();
    }
    value.analysisResult = j.value("analysisResult", json());
    value.queue = j.value("queue", std::vector<QueueItem>());
    value.history = j.value("history", std::vector<QueueItem>());
    value.suggestions = j.value("suggestions", std::vector<Suggestion>());
}
