// Tests for the client connection loop: reconnect, resume, heartbeats and drift.
#include "stageClient.hpp"

#include <gtest/gtest.h>

#include <boost/asio.hpp>

#include <chrono>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace {

using namespace std::chrono_literals;

// Player shared between the client's io thread and the test thread.
class LockedPlayer : public LocalPlayer {
public:
  void load(const AudioSource& source) override {
    std::lock_guard<std::mutex> lock(mutex_);
    loaded_ = source.url;
    current_ = 0.0;
    playing_ = false;
  }
  double position() const override {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_;
  }
  bool isPlaying() const override {
    std::lock_guard<std::mutex> lock(mutex_);
    return playing_;
  }
  double speed() const override {
    std::lock_guard<std::mutex> lock(mutex_);
    return rate_;
  }
  void seek(double positionSeconds) override {
    std::lock_guard<std::mutex> lock(mutex_);
    current_ = positionSeconds;
  }
  void play() override {
    std::lock_guard<std::mutex> lock(mutex_);
    playing_ = true;
  }
  void pause() override {
    std::lock_guard<std::mutex> lock(mutex_);
    playing_ = false;
  }
  void setSpeed(double speedMultiplier) override {
    std::lock_guard<std::mutex> lock(mutex_);
    rate_ = speedMultiplier;
  }

private:
  mutable std::mutex mutex_;
  std::string loaded_;
  double current_ = 0.0;
  bool playing_ = false;
  double rate_ = 1.0;
};

// Stands in for the server: one accepted socket at a time, driven from the
// test thread with a deadline on every wait.
class FakeServer {
public:
  FakeServer() : acceptor_(io_, tcp::endpoint(boost::asio::ip::address_v4::loopback(), 0)) {}

  int port() const { return acceptor_.local_endpoint().port(); }

  bool accept(std::chrono::milliseconds timeout = 2000ms) {
    socket_ = std::make_unique<tcp::socket>(io_);
    bool done = false;
    boost::system::error_code result;
    acceptor_.async_accept(*socket_, [&](const boost::system::error_code& ec) {
      result = ec;
      done = true;
    });
    return wait(done, timeout, [this]() {
      boost::system::error_code ec;
      acceptor_.cancel(ec);
    }) && !result;
  }

  std::optional<Command> receive(std::chrono::milliseconds timeout = 2000ms) {
    if (!socket_) {
      return std::nullopt;
    }
    Message frame;
    bool done = false;
    boost::system::error_code result;
    boost::asio::async_read(*socket_, boost::asio::buffer(frame.data.data(), Message::header),
        [&](const boost::system::error_code& ec, std::size_t) {
          if (ec || !frame.decodeHeader()) {
            result = ec ? ec : make_error_code(boost::asio::error::invalid_argument);
            done = true;
            return;
          }
          boost::asio::async_read(*socket_,
              boost::asio::buffer(frame.data.data() + Message::header, frame.getBodyLength()),
              [&](const boost::system::error_code& bodyEc, std::size_t) {
                result = bodyEc;
                done = true;
              });
        });
    bool completed = wait(done, timeout, [this]() {
      boost::system::error_code ec;
      socket_->cancel(ec);
    });
    if (!completed || result) {
      return std::nullopt;
    }
    return decodeCommand(frame.getBody());
  }

  // Next frame, if it is a T.
  template <typename T>
  std::optional<T> receiveAs(std::chrono::milliseconds timeout = 2000ms) {
    std::optional<Command> command = receive(timeout);
    if (!command || !std::holds_alternative<T>(*command)) {
      return std::nullopt;
    }
    return std::get<T>(*command);
  }

  // First T among the next few frames; periodic heartbeats may come first.
  template <typename T>
  std::optional<T> receiveSkipping(int maxFrames = 10) {
    for (int i = 0; i < maxFrames; ++i) {
      std::optional<Command> command = receive();
      if (!command) {
        return std::nullopt;
      }
      if (std::holds_alternative<T>(*command)) {
        return std::get<T>(*command);
      }
    }
    return std::nullopt;
  }

  void send(const Event& event) {
    Message frame(encodeEvent(event));
    boost::asio::write(*socket_, boost::asio::buffer(frame.data.data(), frame.size()));
  }

  void drop() {
    boost::system::error_code ec;
    socket_->shutdown(tcp::socket::shutdown_both, ec);
    socket_->close(ec);
  }

private:
  template <typename Cancel>
  bool wait(bool& done, std::chrono::milliseconds timeout, Cancel cancel) {
    io_.restart();
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!done && std::chrono::steady_clock::now() < deadline) {
      io_.run_one_until(deadline);
    }
    if (done) {
      return true;
    }
    cancel();
    io_.restart();
    io_.run();
    return false;
  }

  boost::asio::io_context io_;
  tcp::acceptor acceptor_;
  std::unique_ptr<tcp::socket> socket_;
};

StageSnapshot stageHostedBy(const std::string& hostId) {
  StageSnapshot snapshot;
  snapshot.summary.id = "s1";
  snapshot.summary.name = "Test";
  snapshot.summary.hostId = hostId;
  snapshot.summary.isPublic = true;
  snapshot.playback.capturedAt = wallClockMillis();
  return snapshot;
}

class StageClientTest : public ::testing::Test {
protected:
  StageClientTest() : work(boost::asio::make_work_guard(io)) {
    config.host = "127.0.0.1";
    config.port = server.port();
    config.name = "Ana";
    config.reconnectMs = 50;
    config.heartbeatMs = 60;
    client = std::make_unique<StageClient>(io, config, player);
    runner = std::thread([this]() { io.run(); });
    client->start();
  }

  ~StageClientTest() override {
    client->stop();
    std::promise<void> stopped;
    boost::asio::post(io, [&stopped]() { stopped.set_value(); });
    stopped.get_future().wait();
    work.reset();
    io.stop();
    runner.join();
  }

  template <typename Predicate>
  bool waitFor(Predicate predicate, std::chrono::milliseconds timeout = 2000ms) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
      if (predicate()) {
        return true;
      }
      std::this_thread::sleep_for(5ms);
    }
    return predicate();
  }

  // Accepts the next connection and hands it the given member id.
  void handshake(const std::string& memberId) {
    ASSERT_TRUE(server.accept());
    auto name = server.receiveAs<cmd::SetDisplayName>();
    ASSERT_TRUE(name.has_value());
    server.send(evt::Connected{memberId, {}});
    ASSERT_TRUE(waitFor([&]() { return client->state().memberId() == memberId; }));
  }

  // Accepts the reconnection and returns the id it tries to resume.
  std::string acceptResume() {
    if (!server.accept()) {
      return "<no reconnect>";
    }
    auto name = server.receiveAs<cmd::SetDisplayName>();
    if (!name) {
      return "<no display name>";
    }
    auto resume = server.receiveAs<cmd::Resume>();
    return resume ? resume->memberId : "<no resume>";
  }

  void becomeHost(const std::string& memberId) {
    handshake(memberId);
    evt::SessionCreated created;
    created.session = stageHostedBy(memberId);
    server.send(created);
    ASSERT_TRUE(waitFor([&]() { return client->state().isHost(); }));
  }

  FakeServer server;
  boost::asio::io_context io;
  boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work;
  ClientConfig config;
  LockedPlayer player;
  std::unique_ptr<StageClient> client;
  std::thread runner;
};

}  // namespace

TEST_F(StageClientTest, OpensWithDisplayNameOnly) {
  ASSERT_TRUE(server.accept());
  auto name = server.receiveAs<cmd::SetDisplayName>();
  ASSERT_TRUE(name.has_value());
  EXPECT_EQ(name->name, "Ana");
  EXPECT_FALSE(server.receive(150ms).has_value());
}

TEST_F(StageClientTest, ResumesPreviousIdentityAfterDrop) {
  handshake("m1");
  server.drop();
  EXPECT_EQ(acceptResume(), "m1");
}

TEST_F(StageClientTest, ReconnectsAgainAfterEveryDrop) {
  handshake("m1");
  for (int i = 0; i < 3; ++i) {
    server.drop();
    EXPECT_EQ(acceptResume(), "m1");
    server.send(evt::Connected{"m1", {}});
  }
}

TEST_F(StageClientTest, KeepsIdentityWhenDroppedBeforeResumeIsAnswered) {
  handshake("m1");
  server.drop();
  ASSERT_EQ(acceptResume(), "m1");

  // The server registers a fresh member first; then the link goes again.
  server.send(evt::Connected{"m2", {}});
  ASSERT_TRUE(waitFor([&]() { return client->state().memberId() == "m2"; }));
  server.drop();

  EXPECT_EQ(acceptResume(), "m1");
}

TEST_F(StageClientTest, RefusedResumeContinuesAsFreshMember) {
  handshake("m1");
  evt::SessionJoined joined;
  joined.session = stageHostedBy("host-1");
  server.send(joined);
  ASSERT_TRUE(waitFor([&]() { return client->state().inSession(); }));

  server.drop();
  ASSERT_EQ(acceptResume(), "m1");
  server.send(evt::Connected{"m2", {}});
  server.send(evt::Error{"not_found", "Member is unknown or has expired"});
  ASSERT_TRUE(waitFor([&]() {
    ClientState state = client->state();
    return !state.inSession() && state.memberId() == "m2";
  }));

  server.drop();
  EXPECT_EQ(acceptResume(), "m2");
}

TEST_F(StageClientTest, StopEndsTheReconnectLoop) {
  handshake("m1");
  client->stop();

  EXPECT_FALSE(server.receive(500ms).has_value());
  EXPECT_FALSE(server.accept(300ms));
  EXPECT_FALSE(client->isConnected());
}

TEST_F(StageClientTest, HostTransportSendsActionThenHeartbeat) {
  becomeHost("me");

  client->play();
  auto action = server.receiveAs<cmd::HostAction>();
  ASSERT_TRUE(action.has_value());
  EXPECT_EQ(action->kind, HostActionKind::Play);
  auto beat = server.receiveAs<cmd::SyncHeartbeat>();
  ASSERT_TRUE(beat.has_value());
  EXPECT_TRUE(beat->isPlaying);

  client->setSpeed(1.5);
  auto speed = server.receiveSkipping<cmd::HostAction>();
  ASSERT_TRUE(speed.has_value());
  EXPECT_EQ(speed->kind, HostActionKind::SpeedChange);
  auto speedBeat = server.receiveAs<cmd::SyncHeartbeat>();
  ASSERT_TRUE(speedBeat.has_value());
  EXPECT_DOUBLE_EQ(speedBeat->speedMultiplier, 1.5);
}

TEST_F(StageClientTest, HeartbeatRunsOnlyWhilePlaying) {
  becomeHost("me");
  EXPECT_FALSE(server.receive(200ms).has_value());

  client->play();
  ASSERT_TRUE(server.receiveAs<cmd::HostAction>().has_value());
  ASSERT_TRUE(server.receiveAs<cmd::SyncHeartbeat>().has_value());
  auto periodic = server.receiveAs<cmd::SyncHeartbeat>();
  ASSERT_TRUE(periodic.has_value());
  EXPECT_TRUE(periodic->isPlaying);

  client->pause();
  auto paused = server.receiveSkipping<cmd::HostAction>();
  ASSERT_TRUE(paused.has_value());
  EXPECT_EQ(paused->kind, HostActionKind::Pause);
  auto last = server.receiveAs<cmd::SyncHeartbeat>();
  ASSERT_TRUE(last.has_value());
  EXPECT_FALSE(last->isPlaying);

  EXPECT_FALSE(server.receive(250ms).has_value());
}

TEST_F(StageClientTest, HeartbeatStopsOnDropAndResumesWhenHostingIsRestored) {
  becomeHost("me");
  client->play();
  ASSERT_TRUE(server.receiveAs<cmd::HostAction>().has_value());
  ASSERT_TRUE(server.receiveAs<cmd::SyncHeartbeat>().has_value());

  server.drop();
  ASSERT_EQ(acceptResume(), "me");
  EXPECT_FALSE(server.receive(250ms).has_value());

  server.send(evt::Connected{"me", {}});
  evt::ReturnedToSession returned;
  returned.session = stageHostedBy("me");
  returned.session.playback.positionSeconds = 12.0;
  returned.session.playback.isPlaying = true;
  returned.needsAudioReload = true;
  server.send(returned);

  // The first beat may still predate the restored snapshot.
  bool caughtUp = false;
  for (int i = 0; i < 5 && !caughtUp; ++i) {
    auto beat = server.receiveAs<cmd::SyncHeartbeat>();
    ASSERT_TRUE(beat.has_value());
    caughtUp = beat->isPlaying && beat->positionSeconds >= 12.0;
  }
  EXPECT_TRUE(caughtUp);
}

TEST_F(StageClientTest, AudienceCannotDriveTransport) {
  handshake("m1");
  evt::SessionJoined joined;
  joined.session = stageHostedBy("host-1");
  server.send(joined);
  ASSERT_TRUE(waitFor([&]() { return client->state().inSession(); }));

  client->play();
  EXPECT_FALSE(server.receive(150ms).has_value());
  EXPECT_FALSE(player.isPlaying());
}

TEST_F(StageClientTest, AudienceFollowsJoinSnapshotAndLaterHeartbeats) {
  handshake("m1");
  evt::SessionJoined joined;
  joined.session = stageHostedBy("host-1");
  joined.session.playback.positionSeconds = 30.0;
  joined.session.playback.isPlaying = true;
  joined.session.playback.capturedAt = wallClockMillis();
  server.send(joined);

  ASSERT_TRUE(waitFor([&]() { return player.isPlaying() && player.position() >= 30.0; }));

  PlaybackSnapshot later;
  later.positionSeconds = 45.0;
  later.isPlaying = true;
  later.speedMultiplier = 1.25;
  later.capturedAt = wallClockMillis();
  server.send(evt::SyncSnapshot{later});

  EXPECT_TRUE(waitFor([&]() { return player.position() >= 45.0 && player.speed() == 1.25; }));
}
