#ifndef STAGECLIENT_HPP
#define STAGECLIENT_HPP

#include "clientState.hpp"
#include "clockSync.hpp"
#include "config.hpp"
#include "message.hpp"
#include "protocol.hpp"

#include <boost/asio.hpp>

#include <atomic>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <string>

/*
 * ============================================================================
 * STAGE CLIENT - The Client End of the Wire
 * ============================================================================
 *
 * The server holds a member's place for a while after a drop, and the host's
 * audience depends on its heartbeats, so the socket lives inside a loop:
 *
 *   start() --> resolve/connect --ok--> send set_display_name
 *                  ^                    send resume{previous id} (if any)
 *                  |                    read frames --> ClientState::apply
 *                  |                          |
 *                  |                     error/eof
 *                  |                          v
 *                  +----- reconnect timer (3s) <--- cancel heartbeat
 *
 * stop() breaks the loop: every timer is cancelled and the socket closed.
 *
 * Everything runs on the io_context thread. The public command methods post
 * onto it, so they may be called from anywhere (the stdin loop, tests).
 * state() hands out a copy under a mutex.
 *
 * Host side: each transport change is sent as host_action immediately
 * followed by sync_heartbeat, and while the player is playing a heartbeat
 * goes out every interval whether anything changed or not.
 *
 * Audience side: tick() compares the local player against the last snapshot
 * extrapolated to now and corrects it. Call it once per render tick.
 * ============================================================================
 */

using boost::asio::ip::tcp;

class StageClient {
public:
    typedef std::function<void(const Event&)> EventHandler;

    StageClient(boost::asio::io_context& io, const ClientConfig& config, LocalPlayer& player);

    void start();
    void stop();

    // Fires after each event has been applied to the state (io thread).
    void setEventHandler(EventHandler handler);

    // Fire and forget; dropped with a log line while disconnected.
    void send(const Command& command);

    void setDisplayName(const std::string& name);
    void setAudioSource(const AudioSource& source, const json& analysisResult);

    // Host transport controls.
    void play();
    void pause();
    void seek(double positionSeconds);
    void setSpeed(double speedMultiplier);

    // Drift correction against the latest snapshot; io thread only.
    void tick();

    ClientState state() const;
    bool isConnected() const;

private:
    void connect();
    void onOpen();
    void readHeader();
    void readBody();
    void onEvent(const Event& event);
    void write(const Command& command);
    void writeNext();
    void onDisconnect(const std::string& why);
    void scheduleReconnect();
    bool canControl(const char* what) const;
    void hostTransport(HostActionKind kind, const json& payload);
    void sendHeartbeat();
    void updateHeartbeat();
    void scheduleHeartbeat();
    void correctDrift(bool force);

    boost::asio::io_context& io;
    ClientConfig config_;
    LocalPlayer& player_;
    DriftCorrector corrector_;

    tcp::resolver resolver_;
    tcp::socket socket_;
    boost::asio::steady_timer reconnectTimer_;
    boost::asio::steady_timer heartbeatTimer_;

    Message readMessage;
    std::deque<Message> outgoingMessages;

    std::atomic<bool> connected_;
    bool stopped_;
    bool heartbeatRunning_;
    std::uint64_t heartbeatGeneration_;
    bool resumePending_;
    std::string lastName_;
    std::string previousMemberId_;
    // Last id the server confirmed as ours; a fresh id seen while a resume
    // is pending is not ours yet.
    std::string confirmedMemberId_;
    EventHandler handler_;

    mutable std::mutex stateMutex_;
    ClientState state_;
};

#endif // STAGECLIENT_HPP
