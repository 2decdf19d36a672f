#include "sessionView.hpp"
#include "errors.hpp"

namespace {

void hostOnly(const char* what) {
    throw StageError(ErrorKind::Forbidden, std::string("Only the host can ") + what);
}

}  // namespace

SessionView::SessionView(StagePtr stage, const std::string& memberId)
    : stage_(std::move(stage)), memberId_(memberId) {}

void SessionView::chat(const std::string& text) {
    stage_->chat(memberId_, text);
}

void SessionView::rename(const std::string&) { hostOnly("rename the session"); }
void SessionView::togglePublic() { hostOnly("change visibility"); }
void SessionView::updateNowPlaying(const json&) { hostOnly("update now playing"); }
void SessionView::setAudioSource(const AudioSource&, const json&) { hostOnly("set the audio source"); }
void SessionView::heartbeat(const cmd::SyncHeartbeat&) { hostOnly("send sync heartbeats"); }
void SessionView::hostAction(const cmd::HostAction&) { hostOnly("control playback"); }
void SessionView::queueAdd(const TrackRequest&) { hostOnly("add to the queue"); }
void SessionView::queueRemove(const std::string&) { hostOnly("remove from the queue"); }
void SessionView::queueReorder(const std::vector<std::string>&) { hostOnly("reorder the queue"); }
void SessionView::queueAdvance() { hostOnly("advance the queue"); }
void SessionView::queueUpdateItem(const std::string&, QueueStatus, const json&) { hostOnly("update queue items"); }
void SessionView::respondSuggestion(const std::string&, Decision) { hostOnly("answer suggestions"); }

void SessionView::suggestSong(const TrackRequest&) {
    throw StageError(ErrorKind::Forbidden, "The host adds songs directly");
}

// ============================================================================
// HOST
// ============================================================================

void HostSessionView::rename(const std::string& name) { stage_->rename(name); }
void HostSessionView::togglePublic() { stage_->togglePublic(); }
void HostSessionView::updateNowPlaying(const json& track) { stage_->updateNowPlaying(track); }

void HostSessionView::setAudioSource(const AudioSource& source, const json& analysisResult) {
    stage_->setAudioSource(source, analysisResult);
}

void HostSessionView::heartbeat(const cmd::SyncHeartbeat& heartbeat) { stage_->heartbeat(heartbeat); }
void HostSessionView::hostAction(const cmd::HostAction& action) { stage_->hostAction(action); }
void HostSessionView::queueAdd(const TrackRequest& track) { stage_->queueAdd(memberId_, track); }
void HostSessionView::queueRemove(const std::string& itemId) { stage_->queueRemove(itemId); }

void HostSessionView::queueReorder(const std::vector<std::string>& tailOrder) {
    stage_->queueReorder(tailOrder);
}

void HostSessionView::queueAdvance() { stage_->queueAdvance(); }

void HostSessionView::queueUpdateItem(const std::string& itemId, QueueStatus status,
                                      const json& analysisResult) {
    stage_->queueUpdateItem(itemId, status, analysisResult);
}

void HostSessionView::respondSuggestion(const std::string& suggestionId, Decision decision) {
    stage_->respondSuggestion(suggestionId, decision);
}

// ============================================================================
// AUDIENCE
// ============================================================================

void AudienceSessionView::suggestSong(const TrackRequest& track) {
    stage_->suggest(memberId_, track);
}
