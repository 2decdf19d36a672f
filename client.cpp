#include "config.hpp"
#include "errors.hpp"
#include "stageClient.hpp"

#include <boost/asio.hpp>

#include <chrono>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

/*
 * ============================================================================
 * STAGE CLIENT CLI
 * ============================================================================
 *
 * Terminal front end for StageClient. The io_context runs on its own thread
 * (network, reconnect, heartbeats, render tick); the main thread only reads
 * stdin and turns lines into commands, so the blocking getline() stays away
 * from the event loop.
 *
 * There is no audio here. SimulatedPlayer is a clock that advances while
 * "playing", which is all the sync code needs to see drift and correct it.
 * ============================================================================
 */

namespace {

class SimulatedPlayer : public LocalPlayer {
public:
    void load(const AudioSource& source) override {
        title_ = source.title.empty() ? source.url : source.title;
        duration_ = source.durationSeconds;
        base_ = 0.0;
        playing_ = false;
        std::cout << "[player] loaded " << title_ << std::endl;
    }

    double position() const override {
        double position = base_;
        if (playing_) {
            std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - since_;
            position += elapsed.count() * speed_;
        }
        return clampPosition(position, duration_);
    }

    bool isPlaying() const override { return playing_; }
    double speed() const override { return speed_; }

    void seek(double positionSeconds) override {
        base_ = clampPosition(positionSeconds, duration_);
        since_ = std::chrono::steady_clock::now();
    }

    void play() override {
        if (!playing_) {
            since_ = std::chrono::steady_clock::now();
            playing_ = true;
        }
    }

    void pause() override {
        if (playing_) {
            base_ = position();
            playing_ = false;
        }
    }

    void setSpeed(double speedMultiplier) override {
        base_ = position();
        since_ = std::chrono::steady_clock::now();
        speed_ = speedMultiplier;
    }

    const std::string& title() const { return title_; }

private:
    std::string title_;
    std::optional<double> duration_;
    double base_ = 0.0;
    double speed_ = 1.0;
    bool playing_ = false;
    std::chrono::steady_clock::time_point since_ = std::chrono::steady_clock::now();
};

void printHelp() {
    std::cout <<
        "Lobby:    create [name] | join <id> | leave | menu | return | end | name <n> | sessions\n"
        "Host:     rename <n> | public | nowplaying <title> | source <url> [seconds] [title]\n"
        "          play | pause | seek <s> | speed <x>\n"
        "          shape <s> | env <e> | eq <bass> <mid> <treble> | reset\n"
        "Queue:    add <url> [title] | remove <id> | reorder <id>... | next\n"
        "          status <id> <pending|analyzing|ready> | approve <id> | reject <id>\n"
        "Audience: suggest <url> [title]\n"
        "Anyone:   chat <text> | state | help | quit\n";
}

std::string restOf(std::istringstream& in) {
    std::string rest;
    std::getline(in, rest);
    size_t start = rest.find_first_not_of(' ');
    return start == std::string::npos ? std::string() : rest.substr(start);
}

TrackRequest trackFrom(std::istringstream& in) {
    TrackRequest track;
    in >> track.url;
    track.title = restOf(in);
    track.source = "url";
    return track;
}

void printEvent(const Event& event) {
    if (const auto* chat = std::get_if<evt::Chat>(&event)) {
        std::cout << "[" << chat->message.displayName << "] " << chat->message.text << std::endl;
    } else if (const auto* error = std::get_if<evt::Error>(&event)) {
        std::cout << "! " << error->code << ": " << error->message << std::endl;
    } else if (std::holds_alternative<evt::SyncSnapshot>(event)) {
        return;  // every two seconds; too chatty to print
    } else {
        std::cout << "<< " << encodeEvent(event) << std::endl;
    }
}

void printState(const ClientState& state, const SimulatedPlayer& player) {
    std::cout << "member " << state.memberId() << " (" << state.displayName() << ")" << std::endl;
    if (state.session()) {
        const StageSnapshot& session = *state.session();
        std::cout << "in " << session.summary.name << " [" << session.summary.id << "] as "
                  << (state.isHost() ? "host" : state.isVisiting() ? "visitor" : "audience")
                  << ", " << state.members().size() << " members" << std::endl;
        std::cout << "player " << player.title() << " at " << player.position() << "s "
                  << (player.isPlaying() ? "playing" : "paused") << " x" << player.speed() << std::endl;
        for (const auto& item : session.queue) {
            std::cout << "  " << item.position << ". " << item.title << " [" << item.id << "] "
                      << toString(item.status) << std::endl;
        }
        for (const auto& suggestion : session.suggestions) {
            std::cout << "  ? " << suggestion.title << " from " << suggestion.proposerName
                      << " [" << suggestion.id << "]" << std::endl;
        }
    } else {
        std::cout << "on the menu" << std::endl;
    }
    if (state.ownedSession() && (!state.session() || !state.isHost())) {
        std::cout << "still hosting " << state.ownedSession()->name << " [" << state.ownedSession()->id
                  << "]" << std::endl;
    }
}

void startTick(boost::asio::steady_timer& timer, StageClient& client) {
    timer.expires_after(std::chrono::milliseconds(100));
    timer.async_wait([&timer, &client](const boost::system::error_code& ec) {
        if (ec) {
            return;
        }
        client.tick();
        startTick(timer, client);
    });
}

}  // namespace

int main(int argc, char* argv[]) {
    ClientConfig config;
    std::string error;
    if (!parseClientArgs(argc, argv, &config, &error) || !config.Validate(&error)) {
        std::cerr << error << "\n" << clientUsage(argv[0]);
        std::cerr << "Example: " << argv[0] << " localhost 9000 --name Alice" << std::endl;
        return 1;
    }

    try {
        boost::asio::io_context io;
        SimulatedPlayer player;
        StageClient client(io, config, player);
        client.setEventHandler(printEvent);

        boost::asio::steady_timer tickTimer(io);
        auto work = boost::asio::make_work_guard(io);
        client.start();
        startTick(tickTimer, client);

        std::thread ioThread([&io]() {
            io.run();
        });

        printHelp();
        std::string line;
        while (std::getline(std::cin, line)) {
            std::istringstream in(line);
            std::string word;
            if (!(in >> word)) {
                continue;
            }

            if (word == "quit" || word == "exit") {
                break;
            } else if (word == "help") {
                printHelp();
            } else if (word == "state") {
                boost::asio::post(io, [&client, &player]() { printState(client.state(), player); });
            } else if (word == "sessions") {
                ClientState state = client.state();
                for (const auto& row : state.publicSessions()) {
                    std::cout << row.id << "  " << row.name << " by " << row.hostName << " ("
                              << row.audienceCount << " listening)" << std::endl;
                }
            } else if (word == "create") {
                client.send(cmd::CreateSession{restOf(in)});
            } else if (word == "join") {
                std::string id;
                in >> id;
                client.send(cmd::JoinSession{id});
            } else if (word == "leave") {
                client.send(cmd::LeaveSession{});
            } else if (word == "menu") {
                client.send(cmd::GoToMenu{});
            } else if (word == "return") {
                client.send(cmd::ReturnToSession{});
            } else if (word == "end") {
                client.send(cmd::EndSession{});
            } else if (word == "name") {
                client.setDisplayName(restOf(in));
            } else if (word == "rename") {
                client.send(cmd::RenameSession{restOf(in)});
            } else if (word == "public") {
                client.send(cmd::TogglePublic{});
            } else if (word == "nowplaying") {
                client.send(cmd::UpdateNowPlaying{json{{"title", restOf(in)}}});
            } else if (word == "chat") {
                client.send(cmd::Chat{restOf(in)});
            } else if (word == "source") {
                AudioSource source;
                double seconds = 0.0;
                in >> source.url;
                if (in >> seconds) {
                    source.durationSeconds = seconds;
                } else {
                    in.clear();
                }
                source.title = restOf(in);
                source.source = "url";
                client.setAudioSource(source, json::object());
            } else if (word == "play") {
                client.play();
            } else if (word == "pause") {
                client.pause();
            } else if (word == "seek") {
                double seconds = 0.0;
                in >> seconds;
                client.seek(seconds);
            } else if (word == "speed") {
                double speed = 1.0;
                in >> speed;
                client.setSpeed(speed);
            } else if (word == "shape") {
                client.send(cmd::HostAction{HostActionKind::ShapeChange, json{{"shape", restOf(in)}}});
            } else if (word == "env") {
                client.send(cmd::HostAction{HostActionKind::EnvironmentChange, json{{"environment", restOf(in)}}});
            } else if (word == "eq") {
                double bass = 1.0, mid = 1.0, treble = 1.0;
                in >> bass >> mid >> treble;
                client.send(cmd::HostAction{HostActionKind::EqChange,
                                            json{{"bass", bass}, {"mid", mid}, {"treble", treble}}});
            } else if (word == "reset") {
                client.send(cmd::HostAction{HostActionKind::Reset, json::object()});
            } else if (word == "add") {
                client.send(cmd::QueueAdd{trackFrom(in)});
            } else if (word == "remove") {
                std::string id;
                in >> id;
                client.send(cmd::QueueRemove{id});
            } else if (word == "reorder") {
                std::vector<std::string> ids;
                std::string id;
                while (in >> id) {
                    ids.push_back(id);
                }
                client.send(cmd::QueueReorder{ids});
            } else if (word == "next") {
                client.send(cmd::QueueAdvance{});
            } else if (word == "status") {
                std::string id, status;
                in >> id >> status;
                try {
                    client.send(cmd::QueueUpdateItem{id, queueStatusFromString(status), json()});
                } catch (const ProtocolError& e) {
                    std::cout << e.what() << std::endl;
                }
            } else if (word == "approve" || word == "reject") {
                std::string id;
                in >> id;
                client.send(cmd::RespondSuggestion{id, word == "approve" ? Decision::Approve : Decision::Reject});
            } else if (word == "suggest") {
                client.send(cmd::SuggestSong{trackFrom(in)});
            } else {
                std::cout << "Unknown command, try 'help'" << std::endl;
            }
        }

        std::cout << "Disconnecting..." << std::endl;
        client.stop();
        boost::asio::post(io, [&tickTimer, &work]() {
            tickTimer.cancel();
            work.reset();
        });
        ioThread.join();
    } catch (std::exception& e) {
        std::cerr << "Client error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
