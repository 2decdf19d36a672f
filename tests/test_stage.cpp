// Tests for the Stage aggregate: membership, fan-out and host commands.
#include "errors.hpp"
#include "recordingParticipant.hpp"
#include "stage.hpp"

#include <gtest/gtest.h>

#include <boost/asio.hpp>

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace {

// The io_context is never run: fallback heartbeats stay queued and never fire.
class StageTest : public ::testing::Test {
protected:
  void SetUp() override {
    host = makeRecorder();
    MemberInfo info;
    info.id = "host-1";
    info.displayName = "Hana";
    info.role = Role::Host;
    stage = std::make_shared<Stage>(io, "Test", info, host);
  }

  RecorderPtr addListener(const std::string& id, const std::string& name) {
    if (!stage->isPublic()) {
      stage->togglePublic();
    }
    RecorderPtr recorder = makeRecorder();
    MemberInfo info;
    info.id = id;
    info.displayName = name;
    stage->join(info, recorder, std::nullopt);
    return recorder;
  }

  cmd::SyncHeartbeat beat(double position, bool playing, double speed = 1.0) {
    cmd::SyncHeartbeat heartbeat;
    heartbeat.positionSeconds = position;
    heartbeat.isPlaying = playing;
    heartbeat.speedMultiplier = speed;
    return heartbeat;
  }

  ErrorKind kindOf(const std::function<void()>& action) {
    try {
      action();
    } catch (const StageError& e) {
      return e.kind();
    }
    ADD_FAILURE() << "expected a StageError";
    return ErrorKind::ConnectionLost;
  }

  boost::asio::io_context io;
  RecorderPtr host;
  StagePtr stage;
};

TrackRequest track(const std::string& name) {
  TrackRequest request;
  request.title = name;
  request.source = "url";
  request.url = "https://example.com/" + name + ".mp3";
  return request;
}

}  // namespace

TEST_F(StageTest, StartsPrivateWithOnlyTheHost) {
  SessionSummary summary = stage->summary();
  EXPECT_EQ(summary.name, "Test");
  EXPECT_EQ(summary.hostName, "Hana");
  EXPECT_EQ(summary.hostId, "host-1");
  EXPECT_FALSE(summary.isPublic);
  EXPECT_EQ(summary.audienceCount, 0u);
  EXPECT_TRUE(stage->isHostPresent());

  evt::SessionCreated created = stage->createdEvent();
  ASSERT_EQ(created.members.size(), 1u);
  EXPECT_EQ(created.members[0].role, Role::Host);
}

TEST_F(StageTest, PrivateStageRefusesListeners) {
  MemberInfo info;
  info.id = "m1";
  info.displayName = "Ana";
  EXPECT_EQ(kindOf([&] { stage->join(info, makeRecorder(), std::nullopt); }), ErrorKind::Forbidden);
  EXPECT_FALSE(stage->hasMember("m1"));
}

TEST_F(StageTest, HostCannotJoinAsAudience) {
  stage->togglePublic();
  MemberInfo info;
  info.id = "host-1";
  info.displayName = "Hana";
  EXPECT_EQ(kindOf([&] { stage->join(info, host, std::nullopt); }), ErrorKind::InvalidArgument);
}

TEST_F(StageTest, JoinerReceivesHostsCommittedState) {
  stage->heartbeat(beat(42.0, true, 1.5));
  cmd::HostAction shape{HostActionKind::ShapeChange, json{{"shape", "torus"}}};
  stage->hostAction(shape);
  stage->queueAdd("host-1", track("opener"));
  PlaybackSnapshot committed = stage->playback();

  RecorderPtr listener = addListener("m1", "Ana");

  ASSERT_TRUE(listener->has<evt::SessionJoined>());
  evt::SessionJoined joined = listener->last<evt::SessionJoined>();
  EXPECT_DOUBLE_EQ(joined.session.playback.positionSeconds, committed.positionSeconds);
  EXPECT_EQ(joined.session.playback.capturedAt, committed.capturedAt);
  EXPECT_TRUE(joined.session.playback.isPlaying);
  EXPECT_DOUBLE_EQ(joined.session.playback.speedMultiplier, 1.5);
  EXPECT_EQ(joined.session.visualizer.shape, "torus");
  ASSERT_EQ(joined.session.queue.size(), 1u);
  EXPECT_EQ(joined.session.queue[0].title, "opener");
  EXPECT_EQ(joined.session.summary.audienceCount, 1u);
  EXPECT_EQ(joined.members.size(), 2u);
  ASSERT_FALSE(joined.chatLog.empty());
  EXPECT_TRUE(joined.chatLog.back().isSystem);
}

TEST_F(StageTest, JoinAnnouncesToEveryoneElse) {
  RecorderPtr first = addListener("m1", "Ana");
  RecorderPtr second = addListener("m2", "Ben");

  EXPECT_EQ(host->count("member_joined"), 2u);
  EXPECT_EQ(first->count("member_joined"), 1u);
  EXPECT_FALSE(second->received("member_joined"));
  EXPECT_EQ(host->last<evt::MemberJoined>().members.size(), 3u);
}

TEST_F(StageTest, LeaveAnnouncesAndShrinksAudience) {
  RecorderPtr listener = addListener("m1", "Ana");
  addListener("m2", "Ben");

  size_t left = stage->leave("m2");

  EXPECT_EQ(left, 2u);
  EXPECT_EQ(listener->count("member_left"), 1u);
  EXPECT_EQ(stage->summary().audienceCount, 1u);
  EXPECT_FALSE(stage->hasMember("m2"));
}

TEST_F(StageTest, HeartbeatReachesAudienceButNotHost) {
  RecorderPtr listener = addListener("m1", "Ana");

  stage->heartbeat(beat(10.0, true));

  EXPECT_FALSE(host->received("sync_snapshot"));
  ASSERT_TRUE(listener->has<evt::SyncSnapshot>());
  evt::SyncSnapshot sync = listener->last<evt::SyncSnapshot>();
  EXPECT_DOUBLE_EQ(sync.snapshot.positionSeconds, 10.0);
  EXPECT_TRUE(sync.snapshot.isPlaying);
  EXPECT_GT(sync.snapshot.capturedAt, 0);
}

TEST_F(StageTest, HeartbeatRejectsNonPositiveSpeed) {
  stage->heartbeat(beat(10.0, true));
  PlaybackSnapshot before = stage->playback();

  EXPECT_EQ(kindOf([&] { stage->heartbeat(beat(20.0, true, 0.0)); }), ErrorKind::InvalidArgument);
  EXPECT_EQ(kindOf([&] { stage->heartbeat(beat(20.0, true, -1.0)); }), ErrorKind::InvalidArgument);
  EXPECT_DOUBLE_EQ(stage->playback().positionSeconds, before.positionSeconds);
}

TEST_F(StageTest, HeartbeatClampsToTrackLength) {
  AudioSource source;
  source.url = "https://example.com/song.mp3";
  source.durationSeconds = 180.0;
  stage->setAudioSource(source, json());

  stage->heartbeat(beat(500.0, true));
  EXPECT_DOUBLE_EQ(stage->playback().positionSeconds, 180.0);

  stage->heartbeat(beat(-4.0, true));
  EXPECT_DOUBLE_EQ(stage->playback().positionSeconds, 0.0);
}

TEST_F(StageTest, AudioSourceResetsPlaybackForAudienceOnly) {
  RecorderPtr listener = addListener("m1", "Ana");
  stage->heartbeat(beat(64.0, true));

  AudioSource source;
  source.url = "https://example.com/next.mp3";
  source.title = "Next";
  stage->setAudioSource(source, json{{"bpm", 120}});

  EXPECT_FALSE(host->received("audio_source"));
  ASSERT_TRUE(listener->has<evt::AudioSourceChanged>());
  EXPECT_EQ(listener->last<evt::AudioSourceChanged>().audioSource.title, "Next");
  EXPECT_DOUBLE_EQ(stage->playback().positionSeconds, 0.0);
  EXPECT_FALSE(stage->playback().isPlaying);
  ASSERT_TRUE(stage->snapshot().audioSource.has_value());

  AudioSource empty;
  EXPECT_EQ(kindOf([&] { stage->setAudioSource(empty, json()); }), ErrorKind::InvalidArgument);
}

TEST_F(StageTest, SeekIsRelayedWithFreshSnapshot) {
  RecorderPtr listener = addListener("m1", "Ana");
  stage->heartbeat(beat(100.0, true));
  listener->clear();

  stage->hostAction(cmd::HostAction{HostActionKind::Seek, json{{"positionSeconds", 120.0}}});

  EXPECT_FALSE(host->received("host_action"));
  EXPECT_EQ(listener->count("host_action"), 1u);
  ASSERT_EQ(listener->count("sync_snapshot"), 1u);
  EXPECT_DOUBLE_EQ(listener->last<evt::SyncSnapshot>().snapshot.positionSeconds, 120.0);
  EXPECT_TRUE(stage->playback().isPlaying);
}

TEST_F(StageTest, TransportActionsValidatePayload) {
  EXPECT_EQ(kindOf([&] { stage->hostAction(cmd::HostAction{HostActionKind::Seek, json::object()}); }),
            ErrorKind::InvalidArgument);
  EXPECT_EQ(kindOf([&] {
              stage->hostAction(cmd::HostAction{HostActionKind::SpeedChange, json{{"speedMultiplier", 0}}});
            }),
            ErrorKind::InvalidArgument);

  stage->hostAction(cmd::HostAction{HostActionKind::SpeedChange, json{{"speedMultiplier", 2.0}}});
  EXPECT_DOUBLE_EQ(stage->playback().speedMultiplier, 2.0);

  stage->hostAction(cmd::HostAction{HostActionKind::Pause, json{{"positionSeconds", 30.0}}});
  EXPECT_FALSE(stage->playback().isPlaying);
  EXPECT_DOUBLE_EQ(stage->playback().positionSeconds, 30.0);
}

TEST_F(StageTest, VisualizerActionsUpdateSnapshot) {
  RecorderPtr listener = addListener("m1", "Ana");

  stage->hostAction(cmd::HostAction{HostActionKind::EnvironmentChange, json{{"environment", "forest"}}});
  stage->hostAction(cmd::HostAction{HostActionKind::EqChange, json{{"bass", 1.6}}});

  VisualizerSnapshot visual = stage->snapshot().visualizer;
  EXPECT_EQ(visual.environment, "forest");
  EXPECT_DOUBLE_EQ(visual.audioTuning.bass, 1.6);
  EXPECT_EQ(listener->count("host_action"), 2u);
  EXPECT_FALSE(listener->received("sync_snapshot"));

  EXPECT_EQ(kindOf([&] { stage->hostAction(cmd::HostAction{HostActionKind::ShapeChange, json::object()}); }),
            ErrorKind::InvalidArgument);
}

TEST_F(StageTest, ChatIsTrimmedAndBroadcast) {
  RecorderPtr listener = addListener("m1", "Ana");

  stage->chat("m1", "  hello there  ");
  stage->chat("host-1", std::string(600, 'a'));

  ASSERT_EQ(host->count("chat_message"), 2u);
  EXPECT_EQ(listener->count("chat_message"), 2u);
  evt::Chat last = listener->last<evt::Chat>();
  size_t maxLength = Stage::maxChatLength;
  EXPECT_EQ(last.message.text.size(), maxLength);
  EXPECT_TRUE(last.message.isHost);

  EXPECT_EQ(kindOf([&] { stage->chat("m1", "   "); }), ErrorKind::InvalidArgument);
  EXPECT_EQ(kindOf([&] { stage->chat("stranger", "hi"); }), ErrorKind::NotFound);
}

TEST_F(StageTest, ChatLogIsBounded) {
  for (int i = 0; i < 201; ++i) {
    stage->chat("host-1", "line " + std::to_string(i));
  }
  std::vector<ChatMessage> log = stage->chatLog();
  EXPECT_EQ(log.size(), 100u);
  EXPECT_EQ(log.back().text, "line 200");
}

TEST_F(StageTest, RenameValidatesAndTrims) {
  EXPECT_EQ(kindOf([&] { stage->rename("   "); }), ErrorKind::InvalidArgument);
  stage->rename(std::string(80, 'n'));
  size_t maxLength = Stage::maxNameLength;
  EXPECT_EQ(stage->summary().name.size(), maxLength);
  EXPECT_TRUE(host->received("session_updated"));
}

TEST_F(StageTest, SuggestionFlowNotifiesProposerAndHost) {
  RecorderPtr listener = addListener("m1", "Ana");

  stage->suggest("m1", track("wish"));

  ASSERT_TRUE(listener->has<evt::SuggestionSent>());
  ASSERT_TRUE(host->has<evt::SuggestionCreated>());
  EXPECT_FALSE(listener->received("suggestion_created"));
  std::string id = host->last<evt::SuggestionCreated>().suggestion.id;
  EXPECT_EQ(host->last<evt::SuggestionCreated>().suggestion.proposerName, "Ana");

  EXPECT_EQ(kindOf([&] { stage->suggest("m1", track("again")); }), ErrorKind::DuplicatePending);

  stage->respondSuggestion(id, Decision::Approve);

  ASSERT_TRUE(listener->has<evt::SuggestionResolved>());
  EXPECT_EQ(listener->last<evt::SuggestionResolved>().decision, Decision::Approve);
  evt::QueueUpdated queue = listener->last<evt::QueueUpdated>();
  ASSERT_EQ(queue.queue.size(), 1u);
  EXPECT_EQ(queue.queue[0].addedByName, "Ana");
  EXPECT_TRUE(queue.suggestions.empty());
}

TEST_F(StageTest, RemovingPlayingItemAnnouncesNext) {
  RecorderPtr listener = addListener("m1", "Ana");
  stage->queueAdd("host-1", track("one"));
  stage->queueAdd("host-1", track("two"));
  stage->queueAdvance();
  std::string playing = stage->snapshot().queue[0].id;
  listener->clear();

  stage->queueRemove(playing);

  ASSERT_TRUE(listener->has<evt::QueuePlayNext>());
  EXPECT_EQ(listener->last<evt::QueuePlayNext>().item.title, "two");
  evt::QueueUpdated updated = listener->last<evt::QueueUpdated>();
  ASSERT_EQ(updated.queue.size(), 1u);
  EXPECT_TRUE(updated.history.empty());
}

TEST_F(StageTest, HostAwayStopsDeliveryAndReturnReportsReload) {
  RecorderPtr listener = addListener("m1", "Ana");
  stage->heartbeat(beat(10.0, true));
  host->clear();

  stage->hostStepAway();
  EXPECT_FALSE(stage->isHostPresent());
  stage->chat("m1", "anyone there?");
  EXPECT_FALSE(host->received("chat_message"));
  EXPECT_EQ(listener->count("chat_message"), 1u);

  RecorderPtr back = makeRecorder();
  evt::ReturnedToSession returned = stage->hostReturn(back, true);

  EXPECT_TRUE(stage->isHostPresent());
  EXPECT_TRUE(returned.needsAudioReload);
  EXPECT_TRUE(returned.session.playback.isPlaying);
  EXPECT_GE(returned.session.playback.positionSeconds, 10.0);
  ASSERT_FALSE(returned.chatLog.empty());
  EXPECT_EQ(returned.chatLog.back().text, "anyone there?");

  stage->chat("m1", "welcome back");
  EXPECT_EQ(back->count("chat_message"), 1u);
}

TEST_F(StageTest, DetachedMemberMissesEventsUntilAttached) {
  RecorderPtr listener = addListener("m1", "Ana");
  stage->detach("m1");
  EXPECT_FALSE(stage->members()[1].connected);

  stage->chat("host-1", "while you were out");
  EXPECT_FALSE(listener->received("chat_message"));

  RecorderPtr again = makeRecorder();
  stage->attach("m1", again);
  stage->chat("host-1", "welcome back");
  EXPECT_EQ(again->count("chat_message"), 1u);
  EXPECT_TRUE(stage->members()[1].connected);
}

TEST_F(StageTest, RenamedMemberIsAnnounced) {
  RecorderPtr listener = addListener("m1", "Ana");
  stage->renameMember("m1", "Anna");

  ASSERT_TRUE(host->has<evt::MemberRenamed>());
  evt::MemberRenamed renamed = host->last<evt::MemberRenamed>();
  EXPECT_EQ(renamed.oldName, "Ana");
  EXPECT_EQ(renamed.newName, "Anna");
  EXPECT_EQ(listener->count("member_renamed"), 1u);
}

TEST_F(StageTest, CloseNotifiesEveryoneAndRejectsFurtherCommands) {
  RecorderPtr listener = addListener("m1", "Ana");

  stage->close("Host ended the session");

  EXPECT_TRUE(stage->isClosed());
  ASSERT_TRUE(listener->has<evt::SessionClosed>());
  EXPECT_EQ(listener->last<evt::SessionClosed>().reason, "Host ended the session");
  EXPECT_EQ(listener->last<evt::SessionClosed>().sessionId, stage->id());
  EXPECT_TRUE(host->received("session_closed"));

  EXPECT_EQ(kindOf([&] { stage->chat("m1", "hello?"); }), ErrorKind::NotFound);
  EXPECT_EQ(kindOf([&] { stage->heartbeat(beat(1.0, true)); }), ErrorKind::NotFound);

  stage->close("again");
  EXPECT_EQ(listener->count("session_closed"), 1u);
}
