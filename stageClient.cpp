#include "stageClient.hpp"
#include "errors.hpp"

#include <chrono>
#include <iostream>

StageClient::StageClient(boost::asio::io_context& io, const ClientConfig& config, LocalPlayer& player)
    : io(io),
      config_(config),
      player_(player),
      corrector_(config.thresholds()),
      resolver_(io),
      socket_(io),
      reconnectTimer_(io),
      heartbeatTimer_(io),
      connected_(false),
      stopped_(false),
      heartbeatRunning_(false),
      heartbeatGeneration_(0),
      resumePending_(false),
      lastName_(config.name) {
}

void StageClient::start() {
    boost::asio::post(io, [this]() {
        stopped_ = false;
        connect();
    });
}

void StageClient::stop() {
    boost::asio::post(io, [this]() {
        stopped_ = true;
        connected_ = false;
        reconnectTimer_.cancel();
        heartbeatRunning_ = false;
        heartbeatTimer_.cancel();
        resolver_.cancel();
        outgoingMessages.clear();

        boost::system::error_code ec;
        socket_.close(ec);
        if (ec) {
            std::cerr << "Close error: " << ec.message() << std::endl;
        }
    });
}

void StageClient::setEventHandler(EventHandler handler) {
    handler_ = std::move(handler);
}

ClientState StageClient::state() const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    return state_;
}

bool StageClient::isConnected() const {
    return connected_;
}

// ============================================================================
// CONNECTION LOOP
// ============================================================================

void StageClient::connect() {
    resolver_.async_resolve(config_.host, std::to_string(config_.port),
        [this](const boost::system::error_code& ec, tcp::resolver::results_type results) {
            if (stopped_) {
                return;
            }
            if (ec) {
                std::cerr << "Resolve failed: " << ec.message() << std::endl;
                scheduleReconnect();
                return;
            }
            boost::asio::async_connect(socket_, results,
                [this](const boost::system::error_code& ec, const tcp::endpoint& /*endpoint*/) {
                    if (stopped_) {
                        return;
                    }
                    if (ec) {
                        std::cerr << "Connect failed: " << ec.message() << std::endl;
                        scheduleReconnect();
                        return;
                    }
                    onOpen();
                });
        });
}

/*
 * onOpen() - First thing on every (re)connection: say who we are.
 *
 * The server has already registered a brand new member for this socket.
 * set_display_name keeps the name stable across drops, and resume asks the
 * server to hand us back the member we were before, with its session.
 */
void StageClient::onOpen() {
    connected_ = true;
    std::cout << "Connected to " << config_.host << ":" << config_.port << std::endl;

    write(cmd::SetDisplayName{lastName_});
    if (!previousMemberId_.empty()) {
        resumePending_ = true;
        write(cmd::Resume{previousMemberId_});
    }
    readHeader();
}

void StageClient::readHeader() {
    boost::asio::async_read(socket_,
        boost::asio::buffer(readMessage.data.data(), Message::header),
        [this](boost::system::error_code ec, std::size_t /*bytes_transferred*/) {
            if (ec) {
                if (ec != boost::asio::error::operation_aborted) {
                    onDisconnect(ec.message());
                }
                return;
            }
            if (!readMessage.decodeHeader()) {
                onDisconnect("invalid frame header");
                return;
            }
            readBody();
        });
}

void StageClient::readBody() {
    boost::asio::async_read(socket_,
        boost::asio::buffer(readMessage.data.data() + Message::header, readMessage.getBodyLength()),
        [this](boost::system::error_code ec, std::size_t /*bytes_transferred*/) {
            if (ec) {
                if (ec != boost::asio::error::operation_aborted) {
                    onDisconnect(ec.message());
                }
                return;
            }
            try {
                onEvent(decodeEvent(readMessage.getBody()));
            } catch (const ProtocolError& e) {
                std::cerr << "Ignoring undecodable event: " << e.what() << std::endl;
            } catch (const StageError& e) {
                std::cerr << "Could not apply event: " << e.what() << std::endl;
            }
            readHeader();
        });
}

void StageClient::onDisconnect(const std::string& why) {
    if (!connected_) {
        return;
    }
    connected_ = false;
    std::cerr << "Connection lost: " << why << std::endl;

    boost::system::error_code ec;
    socket_.close(ec);
    if (ec) {
        std::cerr << "Close error: " << ec.message() << std::endl;
    }
    outgoingMessages.clear();

    heartbeatRunning_ = false;
    heartbeatTimer_.cancel();

    previousMemberId_ = confirmedMemberId_;
    resumePending_ = false;
    scheduleReconnect();
}

void StageClient::scheduleReconnect() {
    if (stopped_) {
        return;
    }
    reconnectTimer_.expires_after(std::chrono::milliseconds(config_.reconnectMs));
    reconnectTimer_.async_wait([this](const boost::system::error_code& ec) {
        if (ec || stopped_) {
            return;
        }
        std::cout << "Reconnecting..." << std::endl;
        connect();
    });
}

// ============================================================================
// INBOUND
// ============================================================================

void StageClient::onEvent(const Event& event) {
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        if (resumePending_) {
            const auto* error = std::get_if<evt::Error>(&event);
            if (error && error->code != errorCode(ErrorKind::FrameTooLarge)) {
                // Resume refused (expired or unknown): carry on as the fresh member.
                resumePending_ = false;
                state_.resetSession();
                confirmedMemberId_ = state_.memberId();
            } else if (const auto* connected = std::get_if<evt::Connected>(&event)) {
                if (connected->memberId == previousMemberId_) {
                    resumePending_ = false;
                }
            }
        } else if (const auto* connected = std::get_if<evt::Connected>(&event)) {
            confirmedMemberId_ = connected->memberId;
        }
        state_.apply(event);
    }

    if (const auto* named = std::get_if<evt::DisplayNameSet>(&event)) {
        lastName_ = named->name;
    } else if (const auto* joined = std::get_if<evt::SessionJoined>(&event)) {
        if (joined->session.audioSource) {
            player_.load(*joined->session.audioSource);
        }
        correctDrift(false);
    } else if (const auto* source = std::get_if<evt::AudioSourceChanged>(&event)) {
        if (!state_.isHost()) {
            player_.load(source->audioSource);
        }
    } else if (std::holds_alternative<evt::SyncSnapshot>(event)) {
        if (!state_.isHost()) {
            correctDrift(false);
        }
    } else if (const auto* returned = std::get_if<evt::ReturnedToSession>(&event)) {
        if (returned->needsAudioReload) {
            if (returned->session.audioSource) {
                player_.load(*returned->session.audioSource);
            }
            correctDrift(true);
            std::lock_guard<std::mutex> lock(stateMutex_);
            state_.clearAudioReload();
        }
    } else if (std::holds_alternative<evt::SessionClosed>(event) ||
               std::holds_alternative<evt::LeftSession>(event) ||
               std::holds_alternative<evt::WentToMenu>(event)) {
        if (!state_.inSession() && player_.isPlaying()) {
            player_.pause();
        }
    }

    updateHeartbeat();
    if (handler_) {
        handler_(event);
    }
}

void StageClient::tick() {
    if (state_.inSession() && !state_.isHost()) {
        correctDrift(false);
    }
}

void StageClient::correctDrift(bool force) {
    if (!state_.session()) {
        return;
    }
    Correction correction =
        corrector_.evaluate(state_.session()->playback, wallClockMillis(), player_.position());
    if (force && correction.action == CorrectionAction::None) {
        correction.action = CorrectionAction::Snap;
    }
    corrector_.apply(correction, player_);
    if (correction.action == CorrectionAction::Snap && correction.driftSeconds > corrector_.thresholds().hardSeconds) {
        std::cout << "Snapped to " << correction.targetSeconds << "s (drift "
                  << correction.driftSeconds << "s)" << std::endl;
    }
}

// ============================================================================
// OUTBOUND
// ============================================================================

void StageClient::send(const Command& command) {
    boost::asio::post(io, [this, command]() {
        if (!connected_) {
            std::cout << "Not connected, dropped " << typeOf(command) << std::endl;
            return;
        }
        write(command);
    });
}

void StageClient::setDisplayName(const std::string& name) {
    boost::asio::post(io, [this, name]() {
        lastName_ = name;
        if (connected_) {
            write(cmd::SetDisplayName{name});
        }
    });
}

void StageClient::setAudioSource(const AudioSource& source, const json& analysisResult) {
    boost::asio::post(io, [this, source, analysisResult]() {
        if (!canControl("set the audio source")) {
            return;
        }
        player_.load(source);
        write(cmd::SetAudioSource{source, analysisResult});
        updateHeartbeat();
    });
}

void StageClient::play() {
    boost::asio::post(io, [this]() {
        if (!canControl("play")) {
            return;
        }
        player_.play();
        hostTransport(HostActionKind::Play, json{{"positionSeconds", player_.position()}});
    });
}

void StageClient::pause() {
    boost::asio::post(io, [this]() {
        if (!canControl("pause")) {
            return;
        }
        player_.pause();
        hostTransport(HostActionKind::Pause, json{{"positionSeconds", player_.position()}});
    });
}

void StageClient::seek(double positionSeconds) {
    boost::asio::post(io, [this, positionSeconds]() {
        if (!canControl("seek")) {
            return;
        }
        player_.seek(positionSeconds);
        hostTransport(HostActionKind::Seek, json{{"positionSeconds", player_.position()}});
    });
}

void StageClient::setSpeed(double speedMultiplier) {
    boost::asio::post(io, [this, speedMultiplier]() {
        if (!canControl("change speed")) {
            return;
        }
        if (!(speedMultiplier > 0.0)) {
            std::cout << "Speed must be positive" << std::endl;
            return;
        }
        player_.setSpeed(speedMultiplier);
        hostTransport(HostActionKind::SpeedChange, json{{"speedMultiplier", speedMultiplier}});
    });
}

bool StageClient::canControl(const char* what) const {
    if (!connected_) {
        std::cout << "Not connected, cannot " << what << std::endl;
        return false;
    }
    if (!state_.isHost()) {
        std::cout << "Only the host can " << what << std::endl;
        return false;
    }
    return true;
}

void StageClient::hostTransport(HostActionKind kind, const json& payload) {
    write(cmd::HostAction{kind, payload});
    sendHeartbeat();
    updateHeartbeat();
}

void StageClient::write(const Command& command) {
    try {
        outgoingMessages.emplace_back(encodeCommand(command));
    } catch (const std::length_error& e) {
        std::cerr << "Dropping " << typeOf(command) << ": " << e.what() << std::endl;
        std::lock_guard<std::mutex> lock(stateMutex_);
        state_.apply(evt::Error{errorCode(ErrorKind::FrameTooLarge),
                                std::string("Could not send ") + typeOf(command)});
        return;
    }
    if (outgoingMessages.size() == 1) {
        writeNext();
    }
}

void StageClient::writeNext() {
    if (outgoingMessages.empty()) {
        return;
    }
    const Message& msg = outgoingMessages.front();
    boost::asio::async_write(socket_,
        boost::asio::buffer(msg.data.data(), msg.size()),
        [this](boost::system::error_code ec, std::size_t /*bytes_transferred*/) {
            if (ec) {
                if (ec != boost::asio::error::operation_aborted) {
                    onDisconnect(ec.message());
                }
                return;
            }
            outgoingMessages.pop_front();
            writeNext();
        });
}

// ============================================================================
// HOST HEARTBEAT
// ============================================================================

void StageClient::sendHeartbeat() {
    if (!connected_ || !state_.isHost()) {
        return;
    }
    cmd::SyncHeartbeat heartbeat;
    heartbeat.positionSeconds = player_.position();
    heartbeat.isPlaying = player_.isPlaying();
    heartbeat.speedMultiplier = player_.speed();
    write(heartbeat);
}

// Runs the periodic heartbeat exactly while we host, are connected and play.
void StageClient::updateHeartbeat() {
    bool wanted = connected_ && state_.isHost() && player_.isPlaying();
    if (wanted && !heartbeatRunning_) {
        heartbeatRunning_ = true;
        scheduleHeartbeat();
    } else if (!wanted && heartbeatRunning_) {
        heartbeatRunning_ = false;
        heartbeatTimer_.cancel();
    }
}

void StageClient::scheduleHeartbeat() {
    std::uint64_t generation = ++heartbeatGeneration_;
    heartbeatTimer_.expires_after(std::chrono::milliseconds(config_.heartbeatMs));
    heartbeatTimer_.async_wait([this, generation](const boost::system::error_code& ec) {
        if (ec || generation != heartbeatGeneration_ || !heartbeatRunning_) {
            return;
        }
        sendHeartbeat();
        heartbeatRunning_ = false;
        updateHeartbeat();
    });
}
