// Tests for the client's mirror of server state.
#include "clientState.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

namespace {

MemberInfo member(const std::string& id, const std::string& name, Role role) {
  MemberInfo info;
  info.id = id;
  info.displayName = name;
  info.role = role;
  return info;
}

StageSnapshot stage(const std::string& id, const std::string& hostId) {
  StageSnapshot snapshot;
  snapshot.summary.id = id;
  snapshot.summary.name = "Test";
  snapshot.summary.hostId = hostId;
  snapshot.summary.hostName = "Hana";
  snapshot.summary.isPublic = true;
  return snapshot;
}

evt::SessionJoined joinedAsAudience(const std::string& sessionId) {
  evt::SessionJoined joined;
  joined.session = stage(sessionId, "host-1");
  joined.session.summary.audienceCount = 1;
  joined.members = {member("host-1", "Hana", Role::Host), member("me", "Ana", Role::Audience)};
  return joined;
}

}  // namespace

TEST(ClientStateTest, ConnectedSetsIdentityAndDirectory) {
  ClientState state;
  SessionSummary listed = stage("s1", "host-1").summary;
  state.apply(evt::Connected{"me", {listed}});

  EXPECT_EQ(state.memberId(), "me");
  ASSERT_EQ(state.publicSessions().size(), 1u);
  EXPECT_FALSE(state.inSession());
}

TEST(ClientStateTest, JoiningAsAudienceIsNotHosting) {
  ClientState state;
  state.apply(evt::Connected{"me", {}});
  state.apply(joinedAsAudience("s1"));

  EXPECT_TRUE(state.inSession());
  EXPECT_FALSE(state.isHost());
  EXPECT_FALSE(state.isVisiting());
  EXPECT_EQ(state.members().size(), 2u);
}

TEST(ClientStateTest, CreatingMakesUsHost) {
  ClientState state;
  state.apply(evt::Connected{"me", {}});
  evt::SessionCreated created;
  created.session = stage("mine", "me");
  state.apply(created);

  EXPECT_TRUE(state.isHost());
  ASSERT_TRUE(state.ownedSession().has_value());
  EXPECT_EQ(state.ownedSession()->id, "mine");
}

TEST(ClientStateTest, SyncSnapshotReplacesPlayback) {
  ClientState state;
  state.apply(evt::Connected{"me", {}});
  state.apply(joinedAsAudience("s1"));

  PlaybackSnapshot snapshot;
  snapshot.positionSeconds = 12.0;
  snapshot.isPlaying = true;
  snapshot.speedMultiplier = 1.25;
  snapshot.capturedAt = 1700000000000;
  state.apply(evt::SyncSnapshot{snapshot});

  const PlaybackSnapshot& playback = state.session()->playback;
  EXPECT_TRUE(playback.isPlaying);
  EXPECT_DOUBLE_EQ(playback.speedMultiplier, 1.25);
  EXPECT_DOUBLE_EQ(playback.positionSeconds, 12.0);
  EXPECT_EQ(playback.capturedAt, 1700000000000);
}

TEST(ClientStateTest, AudioSourceResetsPlayback) {
  ClientState state;
  state.apply(evt::Connected{"me", {}});
  state.apply(joinedAsAudience("s1"));
  PlaybackSnapshot playing;
  playing.positionSeconds = 80.0;
  playing.isPlaying = true;
  state.apply(evt::SyncSnapshot{playing});

  AudioSource source;
  source.url = "https://example.com/next.mp3";
  state.apply(evt::AudioSourceChanged{source, json()});

  ASSERT_TRUE(state.session()->audioSource.has_value());
  EXPECT_EQ(state.session()->audioSource->url, source.url);
  EXPECT_DOUBLE_EQ(state.session()->playback.positionSeconds, 0.0);
  EXPECT_FALSE(state.session()->playback.isPlaying);
}

TEST(ClientStateTest, QueueUpdateReplacesWholesale) {
  ClientState state;
  state.apply(evt::Connected{"me", {}});
  state.apply(joinedAsAudience("s1"));

  QueueItem first;
  first.id = "q1";
  first.title = "One";
  QueueItem second;
  second.id = "q2";
  second.title = "Two";
  state.apply(evt::QueueUpdated{{first, second}, {}, {}});
  ASSERT_EQ(state.session()->queue.size(), 2u);

  state.apply(evt::QueueUpdated{{second}, {}, {first}});
  ASSERT_EQ(state.session()->queue.size(), 1u);
  EXPECT_EQ(state.session()->queue[0].id, "q2");
  ASSERT_EQ(state.session()->history.size(), 1u);
  EXPECT_EQ(state.session()->history[0].id, "q1");
}

TEST(ClientStateTest, TracksOwnPendingSuggestion) {
  ClientState state;
  state.apply(evt::Connected{"me", {}});
  state.apply(joinedAsAudience("s1"));

  Suggestion suggestion;
  suggestion.id = "sg1";
  suggestion.title = "Wish";
  suggestion.proposerMemberId = "me";
  state.apply(evt::SuggestionSent{suggestion});

  ASSERT_TRUE(state.pendingSuggestion().has_value());
  EXPECT_EQ(state.pendingSuggestion()->id, "sg1");

  state.apply(evt::SuggestionResolved{"sg1", Decision::Reject});
  EXPECT_FALSE(state.pendingSuggestion().has_value());
  ASSERT_TRUE(state.lastResolution().has_value());
  EXPECT_EQ(state.lastResolution()->second, Decision::Reject);
}

TEST(ClientStateTest, VisualizerFollowsHostActions) {
  ClientState state;
  state.apply(evt::Connected{"me", {}});
  state.apply(joinedAsAudience("s1"));

  state.apply(evt::HostAction{HostActionKind::ShapeChange, json{{"shape", "torus"}}});
  EXPECT_EQ(state.session()->visualizer.shape, "torus");

  // Transport actions are carried by the snapshot that follows them.
  state.apply(evt::HostAction{HostActionKind::Seek, json{{"positionSeconds", 99.0}}});
  EXPECT_DOUBLE_EQ(state.session()->playback.positionSeconds, 0.0);
}

TEST(ClientStateTest, MembershipChangesRecountAudience) {
  ClientState state;
  state.apply(evt::Connected{"me", {}});
  state.apply(joinedAsAudience("s1"));

  evt::MemberJoined joined;
  joined.members = {member("host-1", "Hana", Role::Host), member("me", "Ana", Role::Audience),
                    member("m2", "Ben", Role::Audience)};
  joined.systemMessage.text = "Ben joined the stage";
  joined.systemMessage.isSystem = true;
  state.apply(joined);

  EXPECT_EQ(state.session()->summary.audienceCount, 2u);
  ASSERT_FALSE(state.chatLog().empty());
  EXPECT_EQ(state.chatLog().back().text, "Ben joined the stage");
}

TEST(ClientStateTest, ChatLogIsBounded) {
  ClientState state;
  state.apply(evt::Connected{"me", {}});
  state.apply(joinedAsAudience("s1"));

  for (int i = 0; i < 150; ++i) {
    ChatMessage message;
    message.id = std::to_string(i);
    message.text = "line " + std::to_string(i);
    state.apply(evt::Chat{message});
  }
  size_t limit = ClientState::chatLimit;
  EXPECT_EQ(state.chatLog().size(), limit);
  EXPECT_EQ(state.chatLog().back().text, "line 149");
}

TEST(ClientStateTest, ClosingOurSessionClearsIt) {
  ClientState state;
  state.apply(evt::Connected{"me", {}});
  state.apply(joinedAsAudience("s1"));

  state.apply(evt::SessionClosed{"other", "unrelated"});
  EXPECT_TRUE(state.inSession());

  state.apply(evt::SessionClosed{"s1", "Host ended the session"});
  EXPECT_FALSE(state.inSession());
  EXPECT_TRUE(state.members().empty());
  ASSERT_TRUE(state.lastClosedReason().has_value());
  EXPECT_EQ(*state.lastClosedReason(), "Host ended the session");
}

TEST(ClientStateTest, VisitingKeepsOwnedSessionAcrossMenu) {
  ClientState state;
  state.apply(evt::Connected{"me", {}});
  evt::SessionCreated created;
  created.session = stage("mine", "me");
  state.apply(created);

  evt::SessionJoined visit = joinedAsAudience("theirs");
  visit.ownedSessionSummary = created.session.summary;
  state.apply(visit);
  EXPECT_TRUE(state.isVisiting());
  EXPECT_FALSE(state.isHost());

  state.apply(evt::WentToMenu{created.session.summary});
  EXPECT_FALSE(state.inSession());
  ASSERT_TRUE(state.ownedSession().has_value());

  evt::ReturnedToSession returned;
  returned.session = created.session;
  returned.needsAudioReload = true;
  state.apply(returned);
  EXPECT_TRUE(state.isHost());
  EXPECT_TRUE(state.needsAudioReload());
  state.clearAudioReload();
  EXPECT_FALSE(state.needsAudioReload());
}

TEST(ClientStateTest, ResetDropsSessionButKeepsIdentity) {
  ClientState state;
  state.apply(evt::Connected{"me", {}});
  state.apply(joinedAsAudience("s1"));

  state.resetSession();

  EXPECT_FALSE(state.inSession());
  EXPECT_FALSE(state.ownedSession().has_value());
  EXPECT_EQ(state.memberId(), "me");
}

TEST(ClientStateTest, KeepsLastError) {
  ClientState state;
  state.apply(evt::Error{"duplicate_pending", "You already have a pending suggestion"});
  ASSERT_TRUE(state.lastError().has_value());
  EXPECT_EQ(state.lastError()->code, "duplicate_pending");
}
