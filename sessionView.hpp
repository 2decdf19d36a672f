#ifndef SESSIONVIEW_HPP
#define SESSIONVIEW_HPP

#include "stage.hpp"

#include <string>
#include <vector>

/*
 * ============================================================================
 * SESSION VIEW - A Member's Handle on the Stage It Is In
 * ============================================================================
 *
 * The Lobby picks the view once, when the member creates, joins or returns,
 * and from then on forwards commands to it without asking about roles again.
 *
 *                    SessionView   (chat; everything else -> Forbidden)
 *                     /        \
 *     HostSessionView            AudienceSessionView
 *     (playback, queue,          (suggestSong)
 *      suggestion replies)
 * ============================================================================
 */

class SessionView {
public:
    SessionView(StagePtr stage, const std::string& memberId);
    virtual ~SessionView() = default;

    const StagePtr& stage() const { return stage_; }
    const std::string& memberId() const { return memberId_; }
    virtual bool isHost() const = 0;

    void chat(const std::string& text);

    virtual void rename(const std::string& name);
    virtual void togglePublic();
    virtual void updateNowPlaying(const json& track);
    virtual void setAudioSource(const AudioSource& source, const json& analysisResult);
    virtual void heartbeat(const cmd::SyncHeartbeat& heartbeat);
    virtual void hostAction(const cmd::HostAction& action);
    virtual void queueAdd(const TrackRequest& track);
    virtual void queueRemove(const std::string& itemId);
    virtual void queueReorder(const std::vector<std::string>& tailOrder);
    virtual void queueAdvance();
    virtual void queueUpdateItem(const std::string& itemId, QueueStatus status, const json& analysisResult);
    virtual void respondSuggestion(const std::string& suggestionId, Decision decision);

    virtual void suggestSong(const TrackRequest& track);

protected:
    StagePtr stage_;
    std::string memberId_;
};

class HostSessionView : public SessionView {
public:
    using SessionView::SessionView;

    bool isHost() const override { return true; }

    void rename(const std::string& name) override;
    void togglePublic() override;
    void updateNowPlaying(const json& track) override;
    void setAudioSource(const AudioSource& source, const json& analysisResult) override;
    void heartbeat(const cmd::SyncHeartbeat& heartbeat) override;
    void hostAction(const cmd::HostAction& action) override;
    void queueAdd(const TrackRequest& track) override;
    void queueRemove(const std::string& itemId) override;
    void queueReorder(const std::vector<std::string>& tailOrder) override;
    void queueAdvance() override;
    void queueUpdateItem(const std::string& itemId, QueueStatus status, const json& analysisResult) override;
    void respondSuggestion(const std::string& suggestionId, Decision decision) override;
};

class AudienceSessionView : public SessionView {
public:
    using SessionView::SessionView;

    bool isHost() const override { return false; }

    void suggestSong(const TrackRequest& track) override;
};

#endif // SESSIONVIEW_HPP
